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

#include <gtest/gtest.h>

#include "flags/log_level.hpp"

TEST(FlagsLogLevel, ValidLevels) {
  for (const auto *level : {"TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"}) {
    ASSERT_TRUE(wirepack::flags::ValidLogLevel(level)) << level;
  }
}

TEST(FlagsLogLevel, InvalidLevels) {
  ASSERT_FALSE(wirepack::flags::ValidLogLevel(""));
  ASSERT_FALSE(wirepack::flags::ValidLogLevel("info"));
  ASSERT_FALSE(wirepack::flags::ValidLogLevel("VERBOSE"));
}

TEST(FlagsLogLevel, ToEnum) {
  ASSERT_EQ(wirepack::flags::LogLevelToEnum("TRACE"), spdlog::level::trace);
  ASSERT_EQ(wirepack::flags::LogLevelToEnum("WARNING"), spdlog::level::warn);
  ASSERT_EQ(wirepack::flags::LogLevelToEnum("ERROR"), spdlog::level::err);
  ASSERT_FALSE(wirepack::flags::LogLevelToEnum("warn").has_value());
}

TEST(FlagsLogLevel, DefaultFlagValue) { ASSERT_EQ(FLAGS_log_level, "WARNING"); }
