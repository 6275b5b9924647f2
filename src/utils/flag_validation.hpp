// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

/// @file
///
/// Convenience macros which wrap defining a command line flag with a
/// validation function. The defined macros can only be used in tandem with
/// gflags.
///
/// @code
/// DEFINE_VALIDATED_string(my_flag, "", "My flag, which can't be empty",
/// {
///   if (!value.empty()) return true;
///   std::cout << "Invalid value for --" << flagname << std::endl;
///   return false;
/// });
/// @endcode
///
/// Note that the `value` is implicitly bound to the new value of the flag. Name
/// of the flag as a string is implicitly bound to the `flagname` variable.

#include <cstdint>
#include <iostream>
#include <string>

#include "gflags/gflags.h"

/// Macro which defines a flag of given type and registers a validator function.
/// The function is generated from the `validation_body` and `cpp_type` is used
/// as the type of the implicitly bound `value`.
#define DEFINE_VALIDATED_FLAG(flag_type, flag_name, default_value, description, cpp_type, validation_body) \
  DEFINE_##flag_type(flag_name, default_value, description);                                               \
  namespace {                                                                                              \
  bool validate_##flag_name(const char *flagname, cpp_type value) validation_body                          \
  }                                                                                                        \
  DEFINE_validator(flag_name, &validate_##flag_name)

/// Define a character string command line flag with validation.
#define DEFINE_VALIDATED_string(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(string, flag_name, default_value, description, const std::string &, validation_body)
