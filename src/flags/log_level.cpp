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

#include "flags/log_level.hpp"

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

#include "gflags/gflags.h"
#include "spdlog/common.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <array>
#include <iostream>
#include <string_view>
#include <utility>

using namespace std::string_view_literals;

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string log_level_help_string = fmt::format("Minimum log level. Allowed values: {}",
                                                      wirepack::utils::GetAllowedEnumValuesString(log_level_mappings));

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "WARNING", log_level_help_string.c_str(),
                        { return wirepack::flags::ValidLogLevel(value); });

bool wirepack::flags::ValidLogLevel(std::string_view value) {
  if (const auto result = wirepack::utils::IsValidEnumValueString(value, log_level_mappings); !result) {
    switch (result.error()) {
      case wirepack::utils::ValidationError::EmptyValue: {
        std::cout << "Log level cannot be empty." << std::endl;
        break;
      }
      case wirepack::utils::ValidationError::InvalidValue: {
        std::cout << "Invalid value for log level. Allowed values: "
                  << wirepack::utils::GetAllowedEnumValuesString(log_level_mappings) << std::endl;
        break;
      }
    }
    return false;
  }

  return true;
}

std::optional<spdlog::level::level_enum> wirepack::flags::LogLevelToEnum(std::string_view value) {
  return wirepack::utils::StringToEnum<spdlog::level::level_enum>(value, log_level_mappings);
}

namespace {

spdlog::level::level_enum ParseLogLevel() {
  const auto log_level = wirepack::flags::LogLevelToEnum(FLAGS_log_level);
  WP_ASSERT(log_level, "Invalid log level");
  return *log_level;
}

}  // namespace

void wirepack::flags::InitializeLogger() {
  auto logger = spdlog::stderr_color_mt("wirepack");
  logger->set_level(ParseLogLevel());
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));
}
