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

#include "codec/wrappers.hpp"

#include <stdexcept>
#include <string>

#include "codec/exceptions.hpp"

namespace wirepack::codec {

namespace {

bool IsDecimal(const std::string &str) {
  size_t i = (!str.empty() && str[0] == '-') ? 1 : 0;
  if (i == str.size()) return false;
  for (; i < str.size(); ++i) {
    if (str[i] < '0' || str[i] > '9') return false;
  }
  return true;
}

}  // namespace

void SaveBigInt(const boost::multiprecision::cpp_int &value, Encoder *encoder) { encoder->WriteString(value.str()); }

void LoadBigInt(boost::multiprecision::cpp_int *value, Decoder *decoder) {
  const auto str = decoder->ReadString();
  // cpp_int also accepts hex and octal literals, only decimal is written.
  if (!IsDecimal(str)) {
    throw CodecException(ErrorKind::Message, "Error parsing BigInt: invalid digit found in string '{}'", str);
  }
  try {
    *value = boost::multiprecision::cpp_int(str);
  } catch (const std::runtime_error &e) {
    throw CodecException(ErrorKind::Message, "Error parsing BigInt: {}", e.what());
  }
}

void SaveJson(const nlohmann::json &value, Encoder *encoder) { encoder->WriteString(value.dump()); }

void LoadJson(nlohmann::json *value, Decoder *decoder) {
  const auto str = decoder->ReadString();
  try {
    *value = nlohmann::json::parse(str);
  } catch (const nlohmann::json::parse_error &e) {
    throw CodecException(ErrorKind::Message, "Error parsing JSON: {}", e.what());
  }
}

}  // namespace wirepack::codec
