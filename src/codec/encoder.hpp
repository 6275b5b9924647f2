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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "codec/streams.hpp"

namespace wirepack::codec {

class ArrayEncoder;
class MapEncoder;
class StructEncoder;

/// Returns `length` as a collection header count. Throws `Message` when it
/// doesn't fit into 32 bits.
uint32_t CheckLength(uint64_t length, std::string_view what);

/**
 * Encoder driver. Every `Write*` call appends exactly one value in its
 * shortest valid wire form.
 *
 * Aggregates are written through the sub-encoders returned by `BeginSeq`,
 * `BeginStruct` and `BeginMap`. Each element of an aggregate must be written
 * to the `Encoder` the sub-encoder hands out, and the aggregate is closed with
 * `End()`.
 */
class Encoder {
 public:
  Encoder() = default;

  void WriteNil();
  void WriteBool(bool value);

  void WriteUInt(uint64_t value);
  void WriteInt(int64_t value);

  void WriteUInt8(uint8_t value) { WriteUInt(value); }
  void WriteUInt16(uint16_t value) { WriteUInt(value); }
  void WriteUInt32(uint32_t value) { WriteUInt(value); }
  void WriteUInt64(uint64_t value) { WriteUInt(value); }
  void WriteInt8(int8_t value) { WriteInt(value); }
  void WriteInt16(int16_t value) { WriteInt(value); }
  void WriteInt32(int32_t value) { WriteInt(value); }
  void WriteInt64(int64_t value) { WriteInt(value); }

  /// Floats are widened and then narrowed back to `Float32` whenever that is
  /// lossless.
  void WriteFloat32(float value) { WriteFloat64(value); }
  void WriteFloat64(double value);

  void WriteString(std::string_view value);

  /// Writes a single Unicode scalar value as a UTF-8 string.
  void WriteChar(char32_t value);

  /// An empty blob is written as `Nil`.
  void WriteBytes(std::span<const std::byte> value);
  void WriteBytes(std::span<const uint8_t> value);

  void WriteUnit() { WriteNil(); }
  void WriteNone() { WriteNil(); }

  void WriteStringLength(uint64_t length);
  void WriteBytesLength(uint64_t length);
  void WriteArrayLength(uint64_t length);
  void WriteMapLength(uint64_t length);
  void WriteExtLength(uint64_t length);

  /// When `length` is given the header is written immediately and the
  /// elements go straight to this encoder. Otherwise they are buffered until
  /// `End()`.
  ArrayEncoder BeginSeq(std::optional<uint32_t> length = std::nullopt);

  /// Structure record: a bare map of (field name, value) pairs.
  StructEncoder BeginStruct(std::optional<uint32_t> fields = std::nullopt);

  /// Generic map: always buffered, wrapped in a `GenericMap` extension
  /// envelope by `End()`.
  MapEncoder BeginMap();

  /// Unit variants are written as their declared index.
  void WriteUnitVariant(uint32_t index) { WriteUInt(index); }

  /// Non-unit variants are written as a one-field record keyed by the variant
  /// name. The payload must follow on this encoder.
  void BeginNewtypeVariant(std::string_view variant);
  ArrayEncoder BeginTupleVariant(std::string_view variant, std::optional<uint32_t> length = std::nullopt);
  StructEncoder BeginStructVariant(std::string_view variant, std::optional<uint32_t> fields = std::nullopt);

  const std::vector<uint8_t> &data() const { return builder_.data(); }
  size_t size() const { return builder_.size(); }
  std::vector<uint8_t> Release() { return builder_.Release(); }

  Builder *builder() { return &builder_; }

 private:
  Builder builder_;
};

/// Cursor over an open array. Either streams elements straight into the
/// parent (declared length) or buffers them in a sub-encoder.
class ArrayEncoder {
 public:
  ArrayEncoder(Encoder *parent, std::optional<uint32_t> length);

  ArrayEncoder(const ArrayEncoder &) = delete;
  ArrayEncoder &operator=(const ArrayEncoder &) = delete;
  ArrayEncoder(ArrayEncoder &&) = delete;
  ArrayEncoder &operator=(ArrayEncoder &&) = delete;
  ~ArrayEncoder() = default;

  /// Returns the encoder the next element has to be written to.
  Encoder *NextElement();

  void End();

  uint32_t count() const { return count_; }

 private:
  Encoder *parent_;
  std::optional<uint32_t> declared_;
  uint32_t count_{0};
  Encoder body_;
  bool ended_{false};
};

class StructEncoder {
 public:
  StructEncoder(Encoder *parent, std::optional<uint32_t> fields);

  StructEncoder(const StructEncoder &) = delete;
  StructEncoder &operator=(const StructEncoder &) = delete;
  StructEncoder(StructEncoder &&) = delete;
  StructEncoder &operator=(StructEncoder &&) = delete;
  ~StructEncoder() = default;

  /// Writes the field name and returns the encoder the field value has to be
  /// written to.
  Encoder *Field(std::string_view name);

  void End();

  uint32_t count() const { return count_; }

 private:
  Encoder *parent_;
  std::optional<uint32_t> declared_;
  uint32_t count_{0};
  Encoder body_;
  bool ended_{false};
};

class MapEncoder {
 public:
  explicit MapEncoder(Encoder *parent) : parent_(parent) {}

  MapEncoder(const MapEncoder &) = delete;
  MapEncoder &operator=(const MapEncoder &) = delete;
  MapEncoder(MapEncoder &&) = delete;
  MapEncoder &operator=(MapEncoder &&) = delete;
  ~MapEncoder() = default;

  /// Opens a new entry. The key and then the value have to be written to the
  /// returned encoder.
  Encoder *NextEntry();

  void End();

  uint32_t count() const { return count_; }

 private:
  Encoder *parent_;
  uint32_t count_{0};
  Encoder body_;
  bool ended_{false};
};

}  // namespace wirepack::codec
