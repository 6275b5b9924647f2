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

#include "utils/utf8.hpp"

#include <cstdint>

namespace wirepack::utils {

namespace {

constexpr bool IsContinuation(uint8_t byte) { return (byte & 0xC0) == 0x80; }

}  // namespace

std::u32string DecodeUtf8(std::string_view str) {
  std::u32string ret;
  ret.reserve(str.size());
  size_t i = 0;
  while (i < str.size()) {
    const auto lead = static_cast<uint8_t>(str[i]);
    if (lead < 0x80) {
      ret.push_back(lead);
      ++i;
      continue;
    }

    size_t length = 0;
    char32_t c = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      c = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      c = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      c = lead & 0x07;
    } else {
      throw Utf8Exception("invalid utf-8 sequence of 1 bytes from index {}", i);
    }

    if (str.size() - i < length) {
      throw Utf8Exception("incomplete utf-8 byte sequence from index {}", i);
    }
    for (size_t k = 1; k < length; ++k) {
      const auto next = static_cast<uint8_t>(str[i + k]);
      if (!IsContinuation(next)) {
        throw Utf8Exception("invalid utf-8 sequence of {} bytes from index {}", k, i);
      }
      c = (c << 6) | (next & 0x3F);
    }

    // Overlong forms.
    constexpr char32_t kMinValue[] = {0, 0, 0x80, 0x800, 0x10000};
    if (c < kMinValue[length] || !IsScalarValue(c)) {
      throw Utf8Exception("invalid utf-8 sequence of {} bytes from index {}", length, i);
    }
    ret.push_back(c);
    i += length;
  }
  return ret;
}

std::string EncodeUtf8(char32_t c) {
  if (!IsScalarValue(c)) {
    throw Utf8Exception("invalid Unicode scalar value: {:#x}", static_cast<uint32_t>(c));
  }
  std::string ret;
  if (c < 0x80) {
    ret.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    ret.push_back(static_cast<char>(0xC0 | (c >> 6)));
    ret.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    ret.push_back(static_cast<char>(0xE0 | (c >> 12)));
    ret.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    ret.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    ret.push_back(static_cast<char>(0xF0 | (c >> 18)));
    ret.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    ret.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    ret.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
  return ret;
}

}  // namespace wirepack::utils
