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

#include <limits>
#include <sstream>
#include <string>

#include "codec/decoder.hpp"
#include "codec/serialization.hpp"
#include "codec/value.hpp"

#include "codec_common.hpp"

using wirepack::codec::Decode;
using wirepack::codec::Decoder;
using wirepack::codec::Encode;
using wirepack::codec::ErrorKind;
using wirepack::codec::Value;
using wirepack::codec::ValueException;

namespace {

std::string Print(const Value &value) {
  std::ostringstream os;
  os << value;
  return os.str();
}

/// Visitor that opens aggregates without draining them.
class LazyVisitor : public wirepack::codec::Visitor {
 public:
  void VisitNil() override {}
  void VisitBool(bool) override {}
  void VisitInt(int64_t) override {}
  void VisitUInt(uint64_t) override {}
  void VisitFloat32(float) override {}
  void VisitFloat64(double) override {}
  void VisitString(std::string) override {}
  void VisitBytes(std::vector<uint8_t>) override {}
  void VisitSeq(wirepack::codec::SeqAccess &) override {}
  void VisitMap(wirepack::codec::MapAccess &) override {}
  void VisitStruct(wirepack::codec::MapAccess &) override {}
};

}  // namespace

TEST(CodecValue, Primitives) {
  ASSERT_TRUE(Decode<Value>(Raw({0xc0})).IsNull());
  ASSERT_EQ(Decode<Value>(Raw({0xc3})), Value(true));

  const auto small = Decode<Value>(Raw({0x05}));
  ASSERT_EQ(small.type(), Value::Type::Int);
  ASSERT_EQ(small.ValueInt(), 5);

  const auto negative = Decode<Value>(Raw({0xd1, 0xfe, 0xd4}));
  ASSERT_EQ(negative.type(), Value::Type::Int);
  ASSERT_EQ(negative.ValueInt(), -300);

  const auto unsigned_value = Decode<Value>(Raw({0xcc, 0xc8}));
  ASSERT_EQ(unsigned_value.type(), Value::Type::UInt);
  ASSERT_EQ(unsigned_value.ValueUInt(), 200U);

  const auto huge = Decode<Value>(Raw({0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
  ASSERT_EQ(huge.ValueUInt(), std::numeric_limits<uint64_t>::max());

  ASSERT_EQ(Decode<Value>(Raw({0xca, 0x3f, 0xc0, 0x00, 0x00})).ValueDouble(), 1.5);
  ASSERT_EQ(Decode<Value>(Raw({0xcb, 0x3f, 0xb9, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a})).ValueDouble(), 0.1);
  ASSERT_EQ(Decode<Value>(Raw({0xa2, 'h', 'i'})).ValueString(), "hi");
  ASSERT_EQ(Decode<Value>(Raw({0xc4, 0x02, 0x01, 0x02})).ValueBytes(), Raw({0x01, 0x02}));
}

TEST(CodecValue, Aggregates) {
  const auto list = Decode<Value>(Raw({0x93, 0x01, 0xc2, 0xa1, 'x'}));
  ASSERT_EQ(list.type(), Value::Type::List);
  ASSERT_EQ(list.ValueList().size(), 3U);
  ASSERT_EQ(list.ValueList()[1], Value(false));

  const auto map =
      Decode<Value>(Raw({0xc7, 0x0b, 0x01, 0x82, 0x01, 0x93, 0x03, 0x05, 0x09, 0x02, 0x93, 0x01, 0x04, 0x07}));
  ASSERT_EQ(map.type(), Value::Type::Map);
  ASSERT_EQ(map.ValueMap().size(), 2U);
  ASSERT_EQ(map.ValueMap()[0].first, Value(1));
  ASSERT_EQ(map.ValueMap()[1].second, Value(Value::List{Value(1), Value(4), Value(7)}));

  const auto record = Decode<Value>(Raw({0x82, 0xa1, 'a', 0x01, 0xa1, 'b', 0xc0}));
  ASSERT_EQ(record.type(), Value::Type::Record);
  ASSERT_EQ(record.ValueRecord()[0].first, "a");
  ASSERT_TRUE(record.ValueRecord()[1].second.IsNull());
}

TEST(CodecValue, RecordKeysMustBeStrings) {
  ASSERT_CODEC_ERROR(ErrorKind::ExpectedString, Decode<Value>(Raw({0x81, 0x01, 0x02})));
}

TEST(CodecValue, Reserved) {
  try {
    Decode<Value>(Raw({0xc1}));
    FAIL() << "Expected CodecException";
  } catch (const wirepack::codec::CodecException &e) {
    ASSERT_EQ(e.kind(), ErrorKind::Message);
    ASSERT_STREQ(e.what(), "Found 'reserved'.");
  }
}

TEST(CodecValue, UnknownExtension) {
  ASSERT_CODEC_ERROR(ErrorKind::ExpectedExt, Decode<Value>(Raw({0xd4, 0x07, 0x00})));
}

TEST(CodecValue, VisitorMustDrainAggregates) {
  const auto data = Raw({0x92, 0x01, 0x02});
  Decoder decoder(data);
  LazyVisitor visitor;
  ASSERT_CODEC_ERROR(ErrorKind::Message, decoder.ReadAny(visitor));
}

TEST(CodecValue, Equality) {
  ASSERT_EQ(Value(int64_t{5}), Value(uint64_t{5}));
  ASSERT_EQ(Value(uint64_t{5}), Value(int64_t{5}));
  ASSERT_NE(Value(int64_t{-1}), Value(std::numeric_limits<uint64_t>::max()));
  ASSERT_NE(Value(1), Value(1.0));
  ASSERT_NE(Value("1"), Value(1));
  ASSERT_EQ(Value::MakeRecord({{"a", Value(1)}}), Value::MakeRecord({{"a", Value(uint64_t{1})}}));
  ASSERT_NE(Value::MakeRecord({{"a", Value(1)}}), Value::MakeMap({{Value("a"), Value(1)}}));
}

TEST(CodecValue, RoundTrip) {
  const auto value = Value::MakeRecord({
      {"name", Value("wirepack")},
      {"ratio", Value(1.5)},
      {"offset", Value(int64_t{-70000})},
      {"tags", Value(Value::List{Value(true), Value(), Value(300)})},
      {"index", Value::MakeMap({{Value(1), Value::MakeBytes({0xde, 0xad})}, {Value("k"), Value(0.1)}})},
  });
  ASSERT_EQ(Decode<Value>(Encode(value)), value);
}

TEST(CodecValue, SaveUsesCanonicalForms) {
  ASSERT_EQ(Encode(Value(-1)), Raw({0xff}));
  ASSERT_EQ(Encode(Value(uint64_t{200})), Raw({0xcc, 0xc8}));
  ASSERT_EQ(Encode(Value::MakeRecord({{"a", Value(1)}})), Raw({0x81, 0xa1, 'a', 0x01}));
  ASSERT_EQ(Encode(Value::MakeMap({})), Raw({0xc7, 0x01, 0x01, 0x80}));
  ASSERT_EQ(Encode(Value::MakeBytes({})), Raw({0xc0}));
}

TEST(CodecValue, Accessors) {
  try {
    Value(true).ValueInt();
    FAIL() << "Expected ValueException";
  } catch (const ValueException &e) {
    ASSERT_STREQ(e.what(), "Incompatible value type: expected int, found bool");
  }
  ASSERT_THROW(Value(1).ValueUInt(), ValueException);
  ASSERT_THROW(Value().ValueList(), ValueException);
}

TEST(CodecValue, Print) {
  ASSERT_EQ(Print(Value()), "null");
  ASSERT_EQ(Print(Value(false)), "false");
  ASSERT_EQ(Print(Value(-3)), "-3");
  ASSERT_EQ(Print(Value(1.5)), "1.5");
  ASSERT_EQ(Print(Value("say \"hi\"")), "\"say \\\"hi\\\"\"");
  ASSERT_EQ(Print(Value::MakeBytes({0x01, 0xab})), "bytes(01ab)");
  ASSERT_EQ(Print(Value(Value::List{Value(1), Value(true)})), "[1, true]");
  ASSERT_EQ(Print(Value::MakeMap({{Value(1), Value("x")}})), "{1: \"x\"}");
  ASSERT_EQ(Print(Value::MakeRecord({{"foo", Value(Value::List{})}})), "Record{foo: []}");
}

TEST(CodecValue, OversizedAggregateHeaders) {
  ASSERT_CODEC_ERROR(ErrorKind::UnexpectedEnd, Decode<Value>(Raw({0xdd, 0xff, 0xff, 0xff, 0xff})));
  ASSERT_CODEC_ERROR(ErrorKind::UnexpectedEnd, Decode<Value>(Raw({0xdf, 0xff, 0xff, 0xff, 0xff})));
  ASSERT_CODEC_ERROR(ErrorKind::UnexpectedEnd,
                     Decode<Value>(Raw({0xc7, 0x05, 0x01, 0xdf, 0xff, 0xff, 0xff, 0xff})));
}

TEST(CodecValue, NestingLimit) {
  std::vector<uint8_t> nested(Decoder::kMaxNestingDepth, 0x91);
  nested.push_back(0xc0);
  const auto deepest = Decode<Value>(nested);
  ASSERT_EQ(deepest.type(), Value::Type::List);

  nested.insert(nested.begin(), 0x91);
  ASSERT_CODEC_ERROR(ErrorKind::Message, Decode<Value>(nested));

  std::vector<uint8_t> huge(2000000, 0x91);
  huge.push_back(0xc0);
  ASSERT_CODEC_ERROR(ErrorKind::Message, Decode<Value>(huge));
}

TEST(CodecValue, NestingLimitCountsRecords) {
  std::vector<uint8_t> nested;
  for (uint32_t i = 0; i <= Decoder::kMaxNestingDepth; ++i) {
    nested.insert(nested.end(), {0x81, 0xa1, 'a'});
  }
  nested.push_back(0xc0);
  ASSERT_CODEC_ERROR(ErrorKind::Message, Decode<Value>(nested));
}
