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

#include "codec/encoder.hpp"

#include <limits>

#include "codec/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/utf8.hpp"

namespace wirepack::codec {

namespace {

constexpr uint64_t kMaxLength = std::numeric_limits<uint32_t>::max();

}  // namespace

uint32_t CheckLength(uint64_t length, std::string_view what) {
  if (length > kMaxLength) {
    throw CodecException(ErrorKind::Message, "{} length {} doesn't fit into 32 bits", what, length);
  }
  return static_cast<uint32_t>(length);
}

void Encoder::WriteNil() { builder_.WriteFormat(Format::Of(FormatKind::Nil)); }

void Encoder::WriteBool(bool value) { builder_.WriteFormat(Format::Of(value ? FormatKind::True : FormatKind::False)); }

void Encoder::WriteUInt(uint64_t value) {
  if (value <= kFixIntMaxValue) {
    builder_.WriteFormat(Format::PositiveFixInt(static_cast<uint8_t>(value)));
  } else if (value <= std::numeric_limits<uint8_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Uint8));
    builder_.WriteUInt8(static_cast<uint8_t>(value));
  } else if (value <= std::numeric_limits<uint16_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Uint16));
    builder_.WriteUInt16(static_cast<uint16_t>(value));
  } else if (value <= std::numeric_limits<uint32_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Uint32));
    builder_.WriteUInt32(static_cast<uint32_t>(value));
  } else {
    builder_.WriteFormat(Format::Of(FormatKind::Uint64));
    builder_.WriteUInt64(value);
  }
}

void Encoder::WriteInt(int64_t value) {
  if (value >= 0) {
    WriteUInt(static_cast<uint64_t>(value));
  } else if (value >= kNegativeFixIntMinValue) {
    builder_.WriteFormat(Format::NegativeFixInt(static_cast<int8_t>(value)));
  } else if (value >= std::numeric_limits<int8_t>::min()) {
    builder_.WriteFormat(Format::Of(FormatKind::Int8));
    builder_.WriteInt8(static_cast<int8_t>(value));
  } else if (value >= std::numeric_limits<int16_t>::min()) {
    builder_.WriteFormat(Format::Of(FormatKind::Int16));
    builder_.WriteInt16(static_cast<int16_t>(value));
  } else if (value >= std::numeric_limits<int32_t>::min()) {
    builder_.WriteFormat(Format::Of(FormatKind::Int32));
    builder_.WriteInt32(static_cast<int32_t>(value));
  } else {
    builder_.WriteFormat(Format::Of(FormatKind::Int64));
    builder_.WriteInt64(value);
  }
}

void Encoder::WriteFloat64(double value) {
  const auto narrowed = static_cast<float>(value);
  if (static_cast<double>(narrowed) == value) {
    builder_.WriteFormat(Format::Of(FormatKind::Float32));
    builder_.WriteFloat32(narrowed);
  } else {
    // NaN never compares equal, so it always takes the wide form.
    builder_.WriteFormat(Format::Of(FormatKind::Float64));
    builder_.WriteFloat64(value);
  }
}

void Encoder::WriteStringLength(uint64_t length) {
  CheckLength(length, "string");
  if (length <= kFixStrMaxLength) {
    builder_.WriteFormat(Format::FixStr(static_cast<uint8_t>(length)));
  } else if (length <= std::numeric_limits<uint8_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Str8));
    builder_.WriteUInt8(static_cast<uint8_t>(length));
  } else if (length <= std::numeric_limits<uint16_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Str16));
    builder_.WriteUInt16(static_cast<uint16_t>(length));
  } else {
    builder_.WriteFormat(Format::Of(FormatKind::Str32));
    builder_.WriteUInt32(static_cast<uint32_t>(length));
  }
}

void Encoder::WriteBytesLength(uint64_t length) {
  CheckLength(length, "binary");
  if (length <= std::numeric_limits<uint8_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Bin8));
    builder_.WriteUInt8(static_cast<uint8_t>(length));
  } else if (length <= std::numeric_limits<uint16_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Bin16));
    builder_.WriteUInt16(static_cast<uint16_t>(length));
  } else {
    builder_.WriteFormat(Format::Of(FormatKind::Bin32));
    builder_.WriteUInt32(static_cast<uint32_t>(length));
  }
}

void Encoder::WriteArrayLength(uint64_t length) {
  CheckLength(length, "array");
  if (length <= kFixCollectionMaxLength) {
    builder_.WriteFormat(Format::FixArray(static_cast<uint8_t>(length)));
  } else if (length <= std::numeric_limits<uint16_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Array16));
    builder_.WriteUInt16(static_cast<uint16_t>(length));
  } else {
    builder_.WriteFormat(Format::Of(FormatKind::Array32));
    builder_.WriteUInt32(static_cast<uint32_t>(length));
  }
}

void Encoder::WriteMapLength(uint64_t length) {
  CheckLength(length, "map");
  if (length <= kFixCollectionMaxLength) {
    builder_.WriteFormat(Format::FixMap(static_cast<uint8_t>(length)));
  } else if (length <= std::numeric_limits<uint16_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Map16));
    builder_.WriteUInt16(static_cast<uint16_t>(length));
  } else {
    builder_.WriteFormat(Format::Of(FormatKind::Map32));
    builder_.WriteUInt32(static_cast<uint32_t>(length));
  }
}

void Encoder::WriteExtLength(uint64_t length) {
  CheckLength(length, "extension");
  if (length <= std::numeric_limits<uint8_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Ext8));
    builder_.WriteUInt8(static_cast<uint8_t>(length));
  } else if (length <= std::numeric_limits<uint16_t>::max()) {
    builder_.WriteFormat(Format::Of(FormatKind::Ext16));
    builder_.WriteUInt16(static_cast<uint16_t>(length));
  } else {
    builder_.WriteFormat(Format::Of(FormatKind::Ext32));
    builder_.WriteUInt32(static_cast<uint32_t>(length));
  }
}

void Encoder::WriteString(std::string_view value) {
  WriteStringLength(value.size());
  builder_.Save(reinterpret_cast<const uint8_t *>(value.data()), value.size());
}

void Encoder::WriteChar(char32_t value) {
  if (!utils::IsScalarValue(value)) {
    throw CodecException(ErrorKind::Message, "invalid Unicode scalar value: {:#x}", static_cast<uint32_t>(value));
  }
  WriteString(utils::EncodeUtf8(value));
}

void Encoder::WriteBytes(std::span<const std::byte> value) {
  WriteBytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(value.data()), value.size()));
}

void Encoder::WriteBytes(std::span<const uint8_t> value) {
  if (value.empty()) {
    WriteNil();
    return;
  }
  WriteBytesLength(value.size());
  builder_.Save(value);
}

ArrayEncoder Encoder::BeginSeq(std::optional<uint32_t> length) { return {this, length}; }

StructEncoder Encoder::BeginStruct(std::optional<uint32_t> fields) { return {this, fields}; }

MapEncoder Encoder::BeginMap() { return MapEncoder(this); }

void Encoder::BeginNewtypeVariant(std::string_view variant) {
  builder_.WriteFormat(Format::FixMap(1));
  WriteString(variant);
}

ArrayEncoder Encoder::BeginTupleVariant(std::string_view variant, std::optional<uint32_t> length) {
  BeginNewtypeVariant(variant);
  return {this, length};
}

StructEncoder Encoder::BeginStructVariant(std::string_view variant, std::optional<uint32_t> fields) {
  BeginNewtypeVariant(variant);
  return {this, fields};
}

ArrayEncoder::ArrayEncoder(Encoder *parent, std::optional<uint32_t> length) : parent_(parent), declared_(length) {
  if (declared_) parent_->WriteArrayLength(*declared_);
}

Encoder *ArrayEncoder::NextElement() {
  DWP_ASSERT(!ended_, "Array encoder used after End()");
  if (count_ == kMaxLength) {
    throw CodecException(ErrorKind::Message, "array length doesn't fit into 32 bits");
  }
  ++count_;
  return declared_ ? parent_ : &body_;
}

void ArrayEncoder::End() {
  DWP_ASSERT(!ended_, "Array encoder ended twice");
  ended_ = true;
  if (declared_) {
    if (*declared_ != count_) {
      throw CodecException(ErrorKind::Message, "array declared with {} elements, but {} were written", *declared_,
                           count_);
    }
    return;
  }
  parent_->WriteArrayLength(count_);
  parent_->builder()->Save(body_.data());
}

StructEncoder::StructEncoder(Encoder *parent, std::optional<uint32_t> fields) : parent_(parent), declared_(fields) {
  if (declared_) parent_->WriteMapLength(*declared_);
}

Encoder *StructEncoder::Field(std::string_view name) {
  DWP_ASSERT(!ended_, "Struct encoder used after End()");
  if (count_ == kMaxLength) {
    throw CodecException(ErrorKind::Message, "struct field count doesn't fit into 32 bits");
  }
  ++count_;
  auto *target = declared_ ? parent_ : &body_;
  target->WriteString(name);
  return target;
}

void StructEncoder::End() {
  DWP_ASSERT(!ended_, "Struct encoder ended twice");
  ended_ = true;
  if (declared_) {
    if (*declared_ != count_) {
      throw CodecException(ErrorKind::Message, "struct declared with {} fields, but {} were written", *declared_,
                           count_);
    }
    return;
  }
  parent_->WriteMapLength(count_);
  parent_->builder()->Save(body_.data());
}

Encoder *MapEncoder::NextEntry() {
  DWP_ASSERT(!ended_, "Map encoder used after End()");
  if (count_ == kMaxLength) {
    throw CodecException(ErrorKind::Message, "map length doesn't fit into 32 bits");
  }
  ++count_;
  return &body_;
}

void MapEncoder::End() {
  DWP_ASSERT(!ended_, "Map encoder ended twice");
  ended_ = true;
  Encoder inner;
  inner.WriteMapLength(count_);
  inner.builder()->Save(body_.data());

  auto *builder = parent_->builder();
  parent_->WriteExtLength(inner.size());
  builder->WriteUInt8(static_cast<uint8_t>(ExtensionType::GenericMap));
  builder->Save(inner.data());
}

}  // namespace wirepack::codec
