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

/**
 * @file
 * @brief This file stores the base exception used across wirepack.
 */
#pragma once

#include <exception>
#include <string>
#include <string_view>

#include <fmt/core.h>  // https://github.com/fmtlib/fmt/issues/2419
#include <fmt/format.h>

namespace wirepack::utils {

#define SPECIALIZE_GET_EXCEPTION_NAME(exep) \
  std::string name() const override { return #exep; }

/**
 * @brief Base class for all regular exceptions.
 *
 * All custom exceptions should inherit from this class. It stores the message
 * with which it was constructed. To retrieve the message, use
 * @c BasicException::what method.
 */
class BasicException : public std::exception {
 public:
  /**
   * @brief Constructor (C++ STL strings_view).
   *
   * @param message The error message.
   */
  explicit BasicException(std::string_view message) noexcept : msg_(message) {}

  /**
   * @brief Constructor (string literal).
   *
   * @param message The error message.
   */
  explicit BasicException(const char *message) noexcept : msg_(message) {}

  /**
   * @brief Constructor (C++ STL strings).
   *
   * @param message The error message.
   */
  explicit BasicException(std::string message) noexcept : msg_(std::move(message)) {}

  /**
   * @brief Constructor with format string (C++ STL strings).
   *
   * @param format The error format message.
   * @param args Arguments for format string.
   */
  template <class... Args>
  explicit BasicException(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : msg_(fmt::format(fmt, std::forward<Args>(args)...)) {}

  ~BasicException() override = default;

  /**
   * @brief Returns a pointer to the (constant) error description.
   *
   * @return A pointer to a `const char*`. The underlying memory
   *         is in possession of the @c BasicException object. Callers must
   *         not attempt to free the memory.
   */
  const char *what() const noexcept override { return msg_.c_str(); }

  virtual std::string name() const { return "BasicException"; }

 protected:
  std::string msg_;
};

}  // namespace wirepack::utils
