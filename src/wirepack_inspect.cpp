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

#include <gflags/gflags.h>

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "codec/exceptions.hpp"
#include "codec/serialization.hpp"
#include "codec/value.hpp"
#include "flags/log_level.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

namespace {

bool IsHexDigitOrSpace(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c));
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string &text) {
  std::string digits;
  for (const auto c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    digits.push_back(c);
  }
  if (digits.size() % 2 != 0) return std::nullopt;
  std::vector<uint8_t> ret;
  ret.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    ret.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
  }
  return ret;
}

std::optional<std::vector<uint8_t>> ReadFile(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return std::nullopt;
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

constexpr int kExitDecodeError = 1;
constexpr int kExitUsageError = 2;

}  // namespace

DEFINE_string(input, "", "Path to a file holding exactly one encoded value.");
DEFINE_VALIDATED_string(hex, "", "One encoded value given as hex digits. Whitespace is ignored.", {
  for (const auto c : value) {
    if (!IsHexDigitOrSpace(c)) {
      std::cout << "Expected --" << flagname << " to hold only hex digits and whitespace" << std::endl;
      return false;
    }
  }
  return true;
});
DEFINE_bool(strict_strings, false, "Reject array prefixes in place of string and binary lengths.");

int main(int argc, char *argv[]) {
  gflags::SetUsageMessage("Decode one wirepack value and print it.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  wirepack::flags::InitializeLogger();

  if (FLAGS_input.empty() == FLAGS_hex.empty()) {
    std::cerr << "Exactly one of --input and --hex has to be given." << std::endl;
    gflags::ShowUsageWithFlags(argv[0]);
    return kExitUsageError;
  }

  std::optional<std::vector<uint8_t>> data;
  if (!FLAGS_input.empty()) {
    spdlog::info("Reading {}", FLAGS_input);
    data = ReadFile(FLAGS_input);
    if (!data) {
      spdlog::error("Couldn't open {}", FLAGS_input);
      std::cerr << "Couldn't open " << FLAGS_input << std::endl;
      return kExitUsageError;
    }
  } else {
    data = ParseHex(FLAGS_hex);
    if (!data) {
      std::cerr << "--hex has to hold an even number of hex digits." << std::endl;
      return kExitUsageError;
    }
  }

  wirepack::codec::DecoderOptions options;
  options.accept_array_as_string_length = !FLAGS_strict_strings;

  try {
    const auto value = wirepack::codec::Decode<wirepack::codec::Value>(*data, options);
    spdlog::info("Decoded {} bytes", data->size());
    std::cout << value << std::endl;
  } catch (const wirepack::codec::CodecException &e) {
    spdlog::error("{}: {}", wirepack::codec::ErrorKindName(e.kind()), e.what());
    std::cerr << wirepack::codec::ErrorKindName(e.kind()) << ": " << e.what() << std::endl;
    return kExitDecodeError;
  }
  return 0;
}
