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

#include <cstdint>
#include <string_view>

#include "utils/exceptions.hpp"

namespace wirepack::codec {

/// Kind of a codec failure. The shape-mismatch kinds carry a message naming
/// the tag that was actually observed.
enum class ErrorKind : uint8_t {
  UnexpectedEnd,
  TrailingCharacters,
  ExpectedBoolean,
  ExpectedUInteger,
  ExpectedInteger,
  ExpectedFloat,
  ExpectedString,
  ExpectedChar,
  ExpectedBytes,
  ExpectedNull,
  ExpectedArray,
  ExpectedMap,
  ExpectedExt,
  ExpectedEnum,
  Message,
};

constexpr std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UnexpectedEnd:
      return "UnexpectedEnd";
    case ErrorKind::TrailingCharacters:
      return "TrailingCharacters";
    case ErrorKind::ExpectedBoolean:
      return "ExpectedBoolean";
    case ErrorKind::ExpectedUInteger:
      return "ExpectedUInteger";
    case ErrorKind::ExpectedInteger:
      return "ExpectedInteger";
    case ErrorKind::ExpectedFloat:
      return "ExpectedFloat";
    case ErrorKind::ExpectedString:
      return "ExpectedString";
    case ErrorKind::ExpectedChar:
      return "ExpectedChar";
    case ErrorKind::ExpectedBytes:
      return "ExpectedBytes";
    case ErrorKind::ExpectedNull:
      return "ExpectedNull";
    case ErrorKind::ExpectedArray:
      return "ExpectedArray";
    case ErrorKind::ExpectedMap:
      return "ExpectedMap";
    case ErrorKind::ExpectedExt:
      return "ExpectedExt";
    case ErrorKind::ExpectedEnum:
      return "ExpectedEnum";
    case ErrorKind::Message:
      return "Message";
  }
  return "Unknown";
}

/// Exception thrown by every codec operation that fails. Nothing is retried;
/// a decoder that threw must be discarded.
class CodecException : public utils::BasicException {
 public:
  CodecException(ErrorKind kind, std::string_view message) : utils::BasicException(message), kind_(kind) {}

  template <class... Args>
  CodecException(ErrorKind kind, fmt::format_string<Args...> fmt, Args &&...args)
      : utils::BasicException(fmt, std::forward<Args>(args)...), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

  SPECIALIZE_GET_EXCEPTION_NAME(CodecException)

 private:
  ErrorKind kind_;
};

}  // namespace wirepack::codec
