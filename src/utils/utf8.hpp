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

#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace wirepack::utils {

class Utf8Exception : public BasicException {
 public:
  using BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(Utf8Exception)
};

/// True for every code point except surrogates and values above U+10FFFF.
constexpr bool IsScalarValue(char32_t c) { return c <= 0x10FFFF && (c < 0xD800 || c > 0xDFFF); }

/**
 * Decodes a UTF-8 string into code points.
 *
 * Overlong forms, surrogates and truncated sequences are rejected.
 *
 * @throw Utf8Exception naming the offset of the offending sequence.
 */
std::u32string DecodeUtf8(std::string_view str);

/// @throw Utf8Exception if `c` is not a Unicode scalar value.
std::string EncodeUtf8(char32_t c);

}  // namespace wirepack::utils
