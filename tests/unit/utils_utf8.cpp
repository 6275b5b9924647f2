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

#include "utils/utf8.hpp"

using wirepack::utils::DecodeUtf8;
using wirepack::utils::EncodeUtf8;
using wirepack::utils::Utf8Exception;

TEST(Utf8, DecodeAscii) { ASSERT_EQ(DecodeUtf8("Hello"), U"Hello"); }

TEST(Utf8, DecodeMultibyte) {
  // U+00E9, U+20AC, U+1F600
  ASSERT_EQ(DecodeUtf8("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"), U"é€\U0001F600");
}

TEST(Utf8, DecodeEmpty) { ASSERT_TRUE(DecodeUtf8("").empty()); }

TEST(Utf8, RejectsStrayContinuation) { ASSERT_THROW(DecodeUtf8("a\x80"), Utf8Exception); }

TEST(Utf8, RejectsTruncatedSequence) { ASSERT_THROW(DecodeUtf8("\xE2\x82"), Utf8Exception); }

TEST(Utf8, RejectsOverlong) { ASSERT_THROW(DecodeUtf8("\xC0\xAF"), Utf8Exception); }

TEST(Utf8, RejectsSurrogate) { ASSERT_THROW(DecodeUtf8("\xED\xA0\x80"), Utf8Exception); }

TEST(Utf8, RejectsAboveMaxCodePoint) { ASSERT_THROW(DecodeUtf8("\xF4\x90\x80\x80"), Utf8Exception); }

TEST(Utf8, ErrorNamesOffset) {
  try {
    DecodeUtf8("ab\xFF");
    FAIL() << "Expected Utf8Exception";
  } catch (const Utf8Exception &e) {
    ASSERT_STREQ(e.what(), "invalid utf-8 sequence of 1 bytes from index 2");
  }
}

TEST(Utf8, EncodeWidths) {
  ASSERT_EQ(EncodeUtf8(U'A'), "A");
  ASSERT_EQ(EncodeUtf8(U'é'), "\xC3\xA9");
  ASSERT_EQ(EncodeUtf8(U'€'), "\xE2\x82\xAC");
  ASSERT_EQ(EncodeUtf8(U'\U0001F600'), "\xF0\x9F\x98\x80");
}

TEST(Utf8, EncodeRejectsSurrogate) { ASSERT_THROW(EncodeUtf8(0xD800), Utf8Exception); }
