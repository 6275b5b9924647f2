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
#include <iosfwd>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "utils/exceptions.hpp"

namespace wirepack::codec {

class Encoder;
class Decoder;

/**
 * Encapsulation of a decoded value and its type, for callers that have no
 * compile-time knowledge of the shape of the input.
 *
 * Values can be of a number of predefined types that are enumerated in
 * Value::Type. Each such type corresponds to exactly one C++ type. `Map` is a
 * generic map (written inside a `GenericMap` envelope) and keeps the wire
 * order of its entries; `Record` is a structure with string field names.
 */
class Value {
 public:
  enum class Type : uint8_t { Null, Bool, Int, UInt, Double, String, Bytes, List, Map, Record };

  using Bytes = std::vector<uint8_t>;
  using List = std::vector<Value>;
  using Map = std::vector<std::pair<Value, Value>>;
  using Record = std::vector<std::pair<std::string, Value>>;

  /** Makes Null */
  Value() = default;

  // constructors for primitive types
  explicit Value(bool value) : data_(value) {}
  explicit Value(int value) : data_(static_cast<int64_t>(value)) {}
  explicit Value(int64_t value) : data_(value) {}
  explicit Value(uint64_t value) : data_(value) {}
  explicit Value(double value) : data_(value) {}
  explicit Value(std::string value) : data_(std::move(value)) {}
  explicit Value(const char *value) : data_(std::string(value)) {}
  explicit Value(List value) : data_(std::move(value)) {}

  static Value MakeBytes(Bytes value);
  static Value MakeMap(Map value);
  static Value MakeRecord(Record value);

  Type type() const { return static_cast<Type>(data_.index()); }

  bool IsNull() const { return type() == Type::Null; }

  // value accessors, all of them throw ValueException on a type mismatch
  bool ValueBool() const;
  int64_t ValueInt() const;
  uint64_t ValueUInt() const;
  double ValueDouble() const;
  const std::string &ValueString() const;
  const Bytes &ValueBytes() const;
  const List &ValueList() const;
  const Map &ValueMap() const;
  const Record &ValueRecord() const;

  /// `Int` and `UInt` holding the same number compare equal.
  friend bool operator==(const Value &a, const Value &b);

 private:
  template <typename T>
  const T &Get(Type expected) const;

  // The alternatives are in the order of Type.
  std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, Bytes, List, Map, Record> data_;
};

class ValueException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(ValueException)
};

void Save(const Value &value, Encoder *encoder);

/// Decodes the next value self-describingly.
void Load(Value *value, Decoder *decoder);

std::ostream &operator<<(std::ostream &os, Value::Type type);
std::ostream &operator<<(std::ostream &os, const Value &value);

}  // namespace wirepack::codec
