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

#include <cmath>
#include <limits>
#include <string>

#include "codec/encoder.hpp"

#include "codec_common.hpp"

using wirepack::codec::Encoder;
using wirepack::codec::ErrorKind;

TEST(CodecEncoder, NilAndBool) {
  Encoder encoder;
  encoder.WriteNil();
  encoder.WriteBool(true);
  encoder.WriteBool(false);
  encoder.WriteUnit();
  encoder.WriteNone();
  CheckOutput(encoder, Raw({0xc0, 0xc3, 0xc2, 0xc0, 0xc0}));
}

TEST(CodecEncoder, UnsignedShortestForm) {
  Encoder encoder;
  encoder.WriteUInt(0);
  CheckOutput(encoder, Raw({0x00}));
  encoder.WriteUInt(127);
  CheckOutput(encoder, Raw({0x7f}));
  encoder.WriteUInt(128);
  CheckOutput(encoder, Raw({0xcc, 0x80}));
  encoder.WriteUInt(255);
  CheckOutput(encoder, Raw({0xcc, 0xff}));
  encoder.WriteUInt(256);
  CheckOutput(encoder, Raw({0xcd, 0x01, 0x00}));
  encoder.WriteUInt(65535);
  CheckOutput(encoder, Raw({0xcd, 0xff, 0xff}));
  encoder.WriteUInt(65536);
  CheckOutput(encoder, Raw({0xce, 0x00, 0x01, 0x00, 0x00}));
  encoder.WriteUInt(0xffffffff);
  CheckOutput(encoder, Raw({0xce, 0xff, 0xff, 0xff, 0xff}));
  encoder.WriteUInt(0x100000000);
  CheckOutput(encoder, Raw({0xcf, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00}));
  encoder.WriteUInt64(std::numeric_limits<uint64_t>::max());
  CheckOutput(encoder, Raw({0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
}

TEST(CodecEncoder, UnsignedWidthDoesNotMatter) {
  Encoder encoder;
  encoder.WriteUInt8(5);
  encoder.WriteUInt16(5);
  encoder.WriteUInt32(5);
  encoder.WriteUInt64(5);
  CheckOutput(encoder, Raw({0x05, 0x05, 0x05, 0x05}));
}

TEST(CodecEncoder, SignedShortestForm) {
  Encoder encoder;
  encoder.WriteInt(200);
  CheckOutput(encoder, Raw({0xcc, 0xc8}));
  encoder.WriteInt(-1);
  CheckOutput(encoder, Raw({0xff}));
  encoder.WriteInt(-32);
  CheckOutput(encoder, Raw({0xe0}));
  encoder.WriteInt(-33);
  CheckOutput(encoder, Raw({0xd0, 0xdf}));
  encoder.WriteInt(-128);
  CheckOutput(encoder, Raw({0xd0, 0x80}));
  encoder.WriteInt(-129);
  CheckOutput(encoder, Raw({0xd1, 0xff, 0x7f}));
  encoder.WriteInt(-32768);
  CheckOutput(encoder, Raw({0xd1, 0x80, 0x00}));
  encoder.WriteInt(-32769);
  CheckOutput(encoder, Raw({0xd2, 0xff, 0xff, 0x7f, 0xff}));
  encoder.WriteInt32(std::numeric_limits<int32_t>::min());
  CheckOutput(encoder, Raw({0xd2, 0x80, 0x00, 0x00, 0x00}));
  encoder.WriteInt(static_cast<int64_t>(std::numeric_limits<int32_t>::min()) - 1);
  CheckOutput(encoder, Raw({0xd3, 0xff, 0xff, 0xff, 0xff, 0x7f, 0xff, 0xff, 0xff}));
  encoder.WriteInt64(std::numeric_limits<int64_t>::min());
  CheckOutput(encoder, Raw({0xd3, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
}

TEST(CodecEncoder, FloatNarrowing) {
  Encoder encoder;
  encoder.WriteFloat64(1.5);
  CheckOutput(encoder, Raw({0xca, 0x3f, 0xc0, 0x00, 0x00}));
  encoder.WriteFloat64(0.1);
  CheckOutput(encoder, Raw({0xcb, 0x3f, 0xb9, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a}));
  encoder.WriteFloat32(0.1F);
  CheckOutput(encoder, Raw({0xca, 0x3d, 0xcc, 0xcc, 0xcd}));
  encoder.WriteFloat64(std::numeric_limits<double>::infinity());
  CheckOutput(encoder, Raw({0xca, 0x7f, 0x80, 0x00, 0x00}));

  encoder.WriteFloat64(std::nan(""));
  const auto nan = encoder.Release();
  ASSERT_EQ(nan.size(), 9U);
  ASSERT_EQ(nan[0], 0xcb);
}

TEST(CodecEncoder, StringLengthTiers) {
  Encoder encoder;
  encoder.WriteString("Hello");
  CheckOutput(encoder, Raw({0xa5, 0x48, 0x65, 0x6c, 0x6c, 0x6f}));
  encoder.WriteString("");
  CheckOutput(encoder, Raw({0xa0}));

  const std::pair<size_t, std::vector<uint8_t>> tiers[] = {
      {31, Raw({0xbf})},
      {32, Raw({0xd9, 0x20})},
      {255, Raw({0xd9, 0xff})},
      {256, Raw({0xda, 0x01, 0x00})},
      {65535, Raw({0xda, 0xff, 0xff})},
      {65536, Raw({0xdb, 0x00, 0x01, 0x00, 0x00})},
  };
  for (const auto &[length, header] : tiers) {
    encoder.WriteString(std::string(length, 'x'));
    const auto output = encoder.Release();
    ASSERT_EQ(output.size(), header.size() + length);
    ASSERT_EQ(std::vector<uint8_t>(output.begin(), output.begin() + header.size()), header) << "length " << length;
  }
}

TEST(CodecEncoder, Char) {
  Encoder encoder;
  encoder.WriteChar(U'a');
  CheckOutput(encoder, Raw({0xa1, 0x61}));
  encoder.WriteChar(U'é');
  CheckOutput(encoder, Raw({0xa2, 0xc3, 0xa9}));
  ASSERT_CODEC_ERROR(ErrorKind::Message, encoder.WriteChar(0xD800));
  ASSERT_EQ(encoder.size(), 0U);
}

TEST(CodecEncoder, Bytes) {
  Encoder encoder;
  encoder.WriteBytes(std::vector<uint8_t>{});
  CheckOutput(encoder, Raw({0xc0}));
  encoder.WriteBytes(Raw({0xab}));
  CheckOutput(encoder, Raw({0xc4, 0x01, 0xab}));

  encoder.WriteBytes(std::vector<uint8_t>(256, 0x00));
  const auto output = encoder.Release();
  ASSERT_EQ(output.size(), 259U);
  ASSERT_EQ(std::vector<uint8_t>(output.begin(), output.begin() + 3), Raw({0xc5, 0x01, 0x00}));

  encoder.WriteBytes(std::vector<uint8_t>(65536, 0x00));
  ASSERT_EQ(std::vector<uint8_t>(encoder.data().begin(), encoder.data().begin() + 5),
            Raw({0xc6, 0x00, 0x01, 0x00, 0x00}));
}

TEST(CodecEncoder, BufferedArray) {
  Encoder encoder;
  auto seq = encoder.BeginSeq();
  seq.NextElement()->WriteInt(1);
  seq.NextElement()->WriteInt(2);
  seq.NextElement()->WriteInt(545345);
  ASSERT_EQ(encoder.size(), 0U);
  seq.End();
  CheckOutput(encoder, Raw({0x93, 0x01, 0x02, 0xce, 0x00, 0x08, 0x52, 0x41}));
}

TEST(CodecEncoder, DeclaredArrayStreamsIntoParent) {
  Encoder encoder;
  auto seq = encoder.BeginSeq(2);
  ASSERT_EQ(encoder.data(), Raw({0x92}));
  seq.NextElement()->WriteBool(true);
  seq.NextElement()->WriteNil();
  seq.End();
  CheckOutput(encoder, Raw({0x92, 0xc3, 0xc0}));
}

TEST(CodecEncoder, DeclaredCountMismatch) {
  Encoder encoder;
  auto seq = encoder.BeginSeq(3);
  seq.NextElement()->WriteNil();
  ASSERT_CODEC_ERROR(ErrorKind::Message, seq.End());

  auto record = encoder.BeginStruct(1);
  record.Field("a")->WriteNil();
  record.Field("b")->WriteNil();
  ASSERT_CODEC_ERROR(ErrorKind::Message, record.End());
}

TEST(CodecEncoder, ArrayLengthTiers) {
  Encoder encoder;
  const std::pair<uint32_t, std::vector<uint8_t>> tiers[] = {
      {0, Raw({0x90})},
      {15, Raw({0x9f})},
      {16, Raw({0xdc, 0x00, 0x10})},
      {65535, Raw({0xdc, 0xff, 0xff})},
      {65536, Raw({0xdd, 0x00, 0x01, 0x00, 0x00})},
  };
  for (const auto &[length, header] : tiers) {
    {
      auto seq = encoder.BeginSeq();
      for (uint32_t i = 0; i < length; ++i) seq.NextElement()->WriteNil();
      seq.End();
    }
    const auto output = encoder.Release();
    ASSERT_EQ(output.size(), header.size() + length);
    ASSERT_EQ(std::vector<uint8_t>(output.begin(), output.begin() + header.size()), header) << "length " << length;
  }
}

TEST(CodecEncoder, CollectionLengthMustFit) {
  ASSERT_EQ(wirepack::codec::CheckLength(5, "array"), 5U);
  ASSERT_EQ(wirepack::codec::CheckLength(std::numeric_limits<uint32_t>::max(), "array"),
            std::numeric_limits<uint32_t>::max());
  ASSERT_CODEC_ERROR(ErrorKind::Message, wirepack::codec::CheckLength(uint64_t{1} << 32, "array"));

  Encoder encoder;
  ASSERT_CODEC_ERROR(ErrorKind::Message, encoder.WriteArrayLength(uint64_t{1} << 32));
  ASSERT_EQ(encoder.size(), 0U);
}

TEST(CodecEncoder, AbandonedSubEncoderWritesNothing) {
  Encoder encoder;
  {
    auto seq = encoder.BeginSeq();
    seq.NextElement()->WriteInt(1);
  }
  {
    auto map = encoder.BeginMap();
    map.NextEntry()->WriteInt(1);
  }
  ASSERT_EQ(encoder.size(), 0U);
}

TEST(CodecEncoder, StructIsBareMap) {
  Encoder encoder;
  auto record = encoder.BeginStruct();
  record.Field("a")->WriteInt(1);
  record.Field("b")->WriteInt(2);
  record.End();
  CheckOutput(encoder, Raw({0x82, 0xa1, 'a', 0x01, 0xa1, 'b', 0x02}));
}

TEST(CodecEncoder, NestedStructs) {
  Encoder encoder;
  auto outer = encoder.BeginStruct(1);
  auto foo = outer.Field("foo")->BeginSeq();
  for (const int bar : {2, 4}) {
    auto inner = foo.NextElement()->BeginStruct();
    inner.Field("bar")->WriteInt(bar);
    inner.End();
  }
  foo.End();
  outer.End();
  CheckOutput(encoder, Raw({0x81, 0xa3, 'f', 'o', 'o', 0x92, 0x81, 0xa3, 'b', 'a', 'r', 0x02, 0x81, 0xa3, 'b', 'a',
                            'r', 0x04}));
}

TEST(CodecEncoder, GenericMapEnvelope) {
  Encoder encoder;
  auto map = encoder.BeginMap();
  for (const auto &[key, values] : {std::pair{1, std::vector{3, 5, 9}}, std::pair{2, std::vector{1, 4, 7}}}) {
    auto *entry = map.NextEntry();
    entry->WriteInt(key);
    auto seq = entry->BeginSeq(3);
    for (const auto value : values) seq.NextElement()->WriteInt(value);
    seq.End();
  }
  map.End();
  CheckOutput(encoder, Raw({0xc7, 0x0b, 0x01, 0x82, 0x01, 0x93, 0x03, 0x05, 0x09, 0x02, 0x93, 0x01, 0x04, 0x07}));
}

TEST(CodecEncoder, EmptyGenericMap) {
  Encoder encoder;
  auto map = encoder.BeginMap();
  map.End();
  CheckOutput(encoder, Raw({0xc7, 0x01, 0x01, 0x80}));
}

TEST(CodecEncoder, LargeGenericMapUsesExt16) {
  Encoder encoder;
  auto map = encoder.BeginMap();
  for (int i = 0; i < 16; ++i) {
    auto *entry = map.NextEntry();
    entry->WriteString(std::string(19, 'k') + static_cast<char>('a' + i));
    entry->WriteInt(1);
  }
  map.End();
  const auto output = encoder.Release();
  // Map16 header plus 16 entries of a 21 byte key and a 1 byte value.
  ASSERT_EQ(output.size(), 4U + 355U);
  ASSERT_EQ(std::vector<uint8_t>(output.begin(), output.begin() + 7), Raw({0xc8, 0x01, 0x63, 0x01, 0xde, 0x00, 0x10}));
}

TEST(CodecEncoder, EnumVariants) {
  Encoder encoder;
  encoder.WriteUnitVariant(2);
  CheckOutput(encoder, Raw({0x02}));

  encoder.BeginNewtypeVariant("Some");
  encoder.WriteInt(5);
  CheckOutput(encoder, Raw({0x81, 0xa4, 'S', 'o', 'm', 'e', 0x05}));

  auto tuple = encoder.BeginTupleVariant("T", 2);
  tuple.NextElement()->WriteInt(1);
  tuple.NextElement()->WriteInt(2);
  tuple.End();
  CheckOutput(encoder, Raw({0x81, 0xa1, 'T', 0x92, 0x01, 0x02}));

  auto record = encoder.BeginStructVariant("S");
  record.Field("x")->WriteInt(1);
  record.End();
  CheckOutput(encoder, Raw({0x81, 0xa1, 'S', 0x81, 0xa1, 'x', 0x01}));
}
