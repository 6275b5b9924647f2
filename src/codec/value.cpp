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

#include "codec/value.hpp"

#include <algorithm>
#include <ostream>
#include <span>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "codec/exceptions.hpp"

namespace wirepack::codec {

namespace {

bool IntEqualsUInt(int64_t a, uint64_t b) { return a >= 0 && static_cast<uint64_t>(a) == b; }

Value LoadValue(Decoder *decoder);

/// Builds a Value from the events of a self-describing decode.
class ValueBuilder : public Visitor {
 public:
  void VisitNil() override { value_ = Value(); }
  void VisitBool(bool value) override { value_ = Value(value); }
  void VisitInt(int64_t value) override { value_ = Value(value); }
  void VisitUInt(uint64_t value) override { value_ = Value(value); }
  void VisitFloat32(float value) override { value_ = Value(static_cast<double>(value)); }
  void VisitFloat64(double value) override { value_ = Value(value); }
  void VisitString(std::string value) override { value_ = Value(std::move(value)); }
  void VisitBytes(std::vector<uint8_t> value) override { value_ = Value::MakeBytes(std::move(value)); }

  void VisitSeq(SeqAccess &seq) override {
    Value::List list;
    list.reserve(std::min<size_t>(seq.size(), seq.decoder()->remaining()));
    while (seq.NextElement()) {
      list.push_back(LoadValue(seq.decoder()));
    }
    value_ = Value(std::move(list));
  }

  void VisitMap(MapAccess &map) override {
    Value::Map entries;
    // Every entry takes at least two bytes.
    entries.reserve(std::min<size_t>(map.size(), map.decoder()->remaining() / 2));
    while (map.NextEntry()) {
      auto key = LoadValue(map.decoder());
      auto value = LoadValue(map.decoder());
      entries.emplace_back(std::move(key), std::move(value));
    }
    value_ = Value::MakeMap(std::move(entries));
  }

  void VisitStruct(MapAccess &record) override {
    Value::Record fields;
    fields.reserve(std::min<size_t>(record.size(), record.decoder()->remaining() / 2));
    while (auto name = record.NextField()) {
      fields.emplace_back(std::move(*name), LoadValue(record.decoder()));
    }
    value_ = Value::MakeRecord(std::move(fields));
  }

  Value Take() { return std::move(value_); }

 private:
  Value value_;
};

Value LoadValue(Decoder *decoder) {
  ValueBuilder builder;
  decoder->ReadAny(builder);
  return builder.Take();
}

void PrintString(std::ostream &os, const std::string &str) {
  os << '"';
  for (const auto c : str) {
    if (c == '"' || c == '\\') os << '\\';
    os << c;
  }
  os << '"';
}

}  // namespace

template <typename T>
const T &Value::Get(Type expected) const {
  const auto *ptr = std::get_if<T>(&data_);
  if (!ptr) {
    throw ValueException("Incompatible value type: expected {}, found {}", fmt::streamed(expected),
                         fmt::streamed(type()));
  }
  return *ptr;
}

Value Value::MakeBytes(Bytes value) {
  Value ret;
  ret.data_ = std::move(value);
  return ret;
}

Value Value::MakeMap(Map value) {
  Value ret;
  ret.data_ = std::move(value);
  return ret;
}

Value Value::MakeRecord(Record value) {
  Value ret;
  ret.data_ = std::move(value);
  return ret;
}

bool Value::ValueBool() const { return Get<bool>(Type::Bool); }
int64_t Value::ValueInt() const { return Get<int64_t>(Type::Int); }
uint64_t Value::ValueUInt() const { return Get<uint64_t>(Type::UInt); }
double Value::ValueDouble() const { return Get<double>(Type::Double); }
const std::string &Value::ValueString() const { return Get<std::string>(Type::String); }
const Value::Bytes &Value::ValueBytes() const { return Get<Bytes>(Type::Bytes); }
const Value::List &Value::ValueList() const { return Get<List>(Type::List); }
const Value::Map &Value::ValueMap() const { return Get<Map>(Type::Map); }
const Value::Record &Value::ValueRecord() const { return Get<Record>(Type::Record); }

bool operator==(const Value &a, const Value &b) {
  if (a.type() == Value::Type::Int && b.type() == Value::Type::UInt) {
    return IntEqualsUInt(a.ValueInt(), b.ValueUInt());
  }
  if (a.type() == Value::Type::UInt && b.type() == Value::Type::Int) {
    return IntEqualsUInt(b.ValueInt(), a.ValueUInt());
  }
  return a.data_ == b.data_;
}

void Save(const Value &value, Encoder *encoder) {
  switch (value.type()) {
    case Value::Type::Null:
      encoder->WriteNil();
      return;
    case Value::Type::Bool:
      encoder->WriteBool(value.ValueBool());
      return;
    case Value::Type::Int:
      encoder->WriteInt(value.ValueInt());
      return;
    case Value::Type::UInt:
      encoder->WriteUInt(value.ValueUInt());
      return;
    case Value::Type::Double:
      encoder->WriteFloat64(value.ValueDouble());
      return;
    case Value::Type::String:
      encoder->WriteString(value.ValueString());
      return;
    case Value::Type::Bytes:
      encoder->WriteBytes(std::span<const uint8_t>(value.ValueBytes()));
      return;
    case Value::Type::List: {
      const auto &list = value.ValueList();
      auto seq = encoder->BeginSeq(CheckLength(list.size(), "array"));
      for (const auto &item : list) Save(item, seq.NextElement());
      seq.End();
      return;
    }
    case Value::Type::Map: {
      auto map = encoder->BeginMap();
      for (const auto &[key, item] : value.ValueMap()) {
        auto *entry = map.NextEntry();
        Save(key, entry);
        Save(item, entry);
      }
      map.End();
      return;
    }
    case Value::Type::Record: {
      const auto &record = value.ValueRecord();
      auto fields = encoder->BeginStruct(CheckLength(record.size(), "struct"));
      for (const auto &[name, item] : record) Save(item, fields.Field(name));
      fields.End();
      return;
    }
  }
}

void Load(Value *value, Decoder *decoder) { *value = LoadValue(decoder); }

std::ostream &operator<<(std::ostream &os, Value::Type type) {
  switch (type) {
    case Value::Type::Null:
      return os << "null";
    case Value::Type::Bool:
      return os << "bool";
    case Value::Type::Int:
      return os << "int";
    case Value::Type::UInt:
      return os << "uint";
    case Value::Type::Double:
      return os << "double";
    case Value::Type::String:
      return os << "string";
    case Value::Type::Bytes:
      return os << "bytes";
    case Value::Type::List:
      return os << "list";
    case Value::Type::Map:
      return os << "map";
    case Value::Type::Record:
      return os << "record";
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const Value &value) {
  switch (value.type()) {
    case Value::Type::Null:
      return os << "null";
    case Value::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case Value::Type::Int:
      return os << value.ValueInt();
    case Value::Type::UInt:
      return os << value.ValueUInt();
    case Value::Type::Double:
      return os << fmt::format("{}", value.ValueDouble());
    case Value::Type::String:
      PrintString(os, value.ValueString());
      return os;
    case Value::Type::Bytes:
      return os << fmt::format("bytes({:02x})", fmt::join(value.ValueBytes(), ""));
    case Value::Type::List: {
      os << "[";
      const auto &list = value.ValueList();
      for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) os << ", ";
        os << list[i];
      }
      return os << "]";
    }
    case Value::Type::Map: {
      os << "{";
      const auto &map = value.ValueMap();
      for (size_t i = 0; i < map.size(); ++i) {
        if (i > 0) os << ", ";
        os << map[i].first << ": " << map[i].second;
      }
      return os << "}";
    }
    case Value::Type::Record: {
      os << "Record{";
      const auto &record = value.ValueRecord();
      for (size_t i = 0; i < record.size(); ++i) {
        if (i > 0) os << ", ";
        os << record[i].first << ": " << record[i].second;
      }
      return os << "}";
    }
  }
  return os;
}

}  // namespace wirepack::codec
