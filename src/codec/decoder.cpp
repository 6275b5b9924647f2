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

#include "codec/decoder.hpp"

#include <algorithm>
#include <limits>

#include "codec/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/utf8.hpp"

namespace wirepack::codec {

namespace {

[[noreturn]] void ThrowUnexpected(ErrorKind kind, std::string_view expected, Format found) {
  throw CodecException(kind, "Property must be of type '{}'. {}", expected, FoundMessage(found));
}

template <typename T>
T CheckSigned(int64_t value) {
  if (value < std::numeric_limits<T>::min() || value > std::numeric_limits<T>::max()) {
    throw CodecException(ErrorKind::Message, "integer overflow: value = {}; bits = {}", value, sizeof(T) * 8);
  }
  return static_cast<T>(value);
}

template <typename T>
T CheckUnsigned(uint64_t value) {
  if (value > std::numeric_limits<T>::max()) {
    throw CodecException(ErrorKind::Message, "unsigned integer overflow: value = {}; bits = {}", value, sizeof(T) * 8);
  }
  return static_cast<T>(value);
}

std::optional<uint32_t> FindVariant(std::span<const std::string_view> variants, std::string_view name) {
  auto it = std::find(variants.begin(), variants.end(), name);
  if (it == variants.end()) return std::nullopt;
  return static_cast<uint32_t>(it - variants.begin());
}

}  // namespace

/// Counts one level of aggregate nesting for the lifetime of a `ReadAny`
/// visit.
class NestingGuard {
 public:
  explicit NestingGuard(Decoder *decoder) : decoder_(decoder) {
    if (decoder_->depth_ >= Decoder::kMaxNestingDepth) {
      throw CodecException(ErrorKind::Message, "nesting depth exceeds the limit of {} at offset {}",
                           Decoder::kMaxNestingDepth, decoder_->GetPos());
    }
    ++decoder_->depth_;
  }

  NestingGuard(const NestingGuard &) = delete;
  NestingGuard &operator=(const NestingGuard &) = delete;
  NestingGuard(NestingGuard &&) = delete;
  NestingGuard &operator=(NestingGuard &&) = delete;

  ~NestingGuard() { --decoder_->depth_; }

 private:
  Decoder *decoder_;
};

bool SeqAccess::NextElement() {
  if (remaining_ == 0) return false;
  --remaining_;
  return true;
}

bool MapAccess::NextEntry() {
  if (remaining_ == 0) return false;
  --remaining_;
  return true;
}

std::optional<std::string> MapAccess::NextField() {
  if (!NextEntry()) return std::nullopt;
  return decoder_->ReadIdentifier();
}

int64_t Decoder::ParseSigned() {
  const auto format = reader_.TakeFormat();
  switch (format.kind()) {
    case FormatKind::PositiveFixInt:
      return format.param();
    case FormatKind::NegativeFixInt:
      return format.negative_value();
    case FormatKind::Int8:
      return reader_.ReadInt8();
    case FormatKind::Int16:
      return reader_.ReadInt16();
    case FormatKind::Int32:
      return reader_.ReadInt32();
    case FormatKind::Int64:
      return reader_.ReadInt64();
    case FormatKind::Uint8:
      return reader_.ReadUInt8();
    case FormatKind::Uint16:
      return reader_.ReadUInt16();
    case FormatKind::Uint32:
      return reader_.ReadUInt32();
    case FormatKind::Uint64: {
      const auto value = reader_.ReadUInt64();
      if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw CodecException(ErrorKind::Message, "integer overflow: value = {}; bits = 64", value);
      }
      return static_cast<int64_t>(value);
    }
    default:
      ThrowUnexpected(ErrorKind::ExpectedInteger, "int", format);
  }
}

uint64_t Decoder::ParseUnsigned() {
  const auto format = reader_.TakeFormat();
  int64_t value = 0;
  switch (format.kind()) {
    case FormatKind::PositiveFixInt:
      return format.param();
    case FormatKind::Uint8:
      return reader_.ReadUInt8();
    case FormatKind::Uint16:
      return reader_.ReadUInt16();
    case FormatKind::Uint32:
      return reader_.ReadUInt32();
    case FormatKind::Uint64:
      return reader_.ReadUInt64();
    case FormatKind::NegativeFixInt:
      value = format.negative_value();
      break;
    case FormatKind::Int8:
      value = reader_.ReadInt8();
      break;
    case FormatKind::Int16:
      value = reader_.ReadInt16();
      break;
    case FormatKind::Int32:
      value = reader_.ReadInt32();
      break;
    case FormatKind::Int64:
      value = reader_.ReadInt64();
      break;
    default:
      ThrowUnexpected(ErrorKind::ExpectedUInteger, "uint", format);
  }
  if (value < 0) {
    throw CodecException(ErrorKind::ExpectedUInteger, "unsigned integer cannot be negative. {}", FoundMessage(format));
  }
  return static_cast<uint64_t>(value);
}

bool Decoder::ReadBool() {
  const auto format = reader_.TakeFormat();
  switch (format.kind()) {
    case FormatKind::True:
      return true;
    case FormatKind::False:
      return false;
    default:
      ThrowUnexpected(ErrorKind::ExpectedBoolean, "bool", format);
  }
}

int8_t Decoder::ReadInt8() { return CheckSigned<int8_t>(ParseSigned()); }
int16_t Decoder::ReadInt16() { return CheckSigned<int16_t>(ParseSigned()); }
int32_t Decoder::ReadInt32() { return CheckSigned<int32_t>(ParseSigned()); }
int64_t Decoder::ReadInt64() { return ParseSigned(); }
uint8_t Decoder::ReadUInt8() { return CheckUnsigned<uint8_t>(ParseUnsigned()); }
uint16_t Decoder::ReadUInt16() { return CheckUnsigned<uint16_t>(ParseUnsigned()); }
uint32_t Decoder::ReadUInt32() { return CheckUnsigned<uint32_t>(ParseUnsigned()); }
uint64_t Decoder::ReadUInt64() { return ParseUnsigned(); }

float Decoder::ReadFloat32() {
  const auto format = reader_.TakeFormat();
  if (format.kind() != FormatKind::Float32) {
    ThrowUnexpected(ErrorKind::ExpectedFloat, "float32", format);
  }
  return reader_.ReadFloat32();
}

double Decoder::ReadFloat64() {
  const auto format = reader_.TakeFormat();
  switch (format.kind()) {
    case FormatKind::Float64:
      return reader_.ReadFloat64();
    case FormatKind::Float32:
      return reader_.ReadFloat32();
    default:
      ThrowUnexpected(ErrorKind::ExpectedFloat, "float64", format);
  }
}

uint32_t Decoder::ReadStringLength() {
  const auto format = reader_.TakeFormat();
  switch (format.kind()) {
    case FormatKind::Nil:
      return 0;
    case FormatKind::FixStr:
      return format.param();
    case FormatKind::Str8:
      return reader_.ReadLength8();
    case FormatKind::Str16:
      return reader_.ReadLength16();
    case FormatKind::Str32:
      return reader_.ReadLength32();
    case FormatKind::FixArray:
      if (options_.accept_array_as_string_length) return format.param();
      [[fallthrough]];
    default:
      ThrowUnexpected(ErrorKind::ExpectedString, "string", format);
  }
}

uint32_t Decoder::ReadBytesLength() {
  const auto format = reader_.TakeFormat();
  switch (format.kind()) {
    case FormatKind::Nil:
      return 0;
    case FormatKind::Bin8:
      return reader_.ReadLength8();
    case FormatKind::Bin16:
      return reader_.ReadLength16();
    case FormatKind::Bin32:
      return reader_.ReadLength32();
    case FormatKind::FixArray:
      if (options_.accept_array_as_string_length) return format.param();
      [[fallthrough]];
    default:
      ThrowUnexpected(ErrorKind::ExpectedBytes, "bytes", format);
  }
}

uint32_t Decoder::ReadArrayLength() {
  const auto format = reader_.TakeFormat();
  switch (format.kind()) {
    case FormatKind::Nil:
      return 0;
    case FormatKind::FixArray:
      return format.param();
    case FormatKind::Array16:
      return reader_.ReadLength16();
    case FormatKind::Array32:
      return reader_.ReadLength32();
    default:
      ThrowUnexpected(ErrorKind::ExpectedArray, "array", format);
  }
}

uint32_t Decoder::ReadMapLength() {
  const auto format = reader_.TakeFormat();
  switch (format.kind()) {
    case FormatKind::Nil:
      return 0;
    case FormatKind::FixMap:
      return format.param();
    case FormatKind::Map16:
      return reader_.ReadLength16();
    case FormatKind::Map32:
      return reader_.ReadLength32();
    default:
      ThrowUnexpected(ErrorKind::ExpectedMap, "map", format);
  }
}

uint32_t Decoder::ReadExtLength() {
  const auto format = reader_.TakeFormat();
  switch (format.kind()) {
    case FormatKind::FixExt1:
      return 1;
    case FormatKind::FixExt2:
      return 2;
    case FormatKind::FixExt4:
      return 4;
    case FormatKind::FixExt8:
      return 8;
    case FormatKind::FixExt16:
      return 16;
    case FormatKind::Ext8:
      return reader_.ReadLength8();
    case FormatKind::Ext16:
      return reader_.ReadLength16();
    case FormatKind::Ext32:
      return reader_.ReadLength32();
    default:
      ThrowUnexpected(ErrorKind::ExpectedExt, "ext generic map", format);
  }
}

std::string Decoder::ReadString() {
  const auto length = ReadStringLength();
  const auto bytes = reader_.TakeBytes(length);
  std::string ret(bytes.begin(), bytes.end());
  try {
    utils::DecodeUtf8(ret);
  } catch (const utils::Utf8Exception &e) {
    throw CodecException(ErrorKind::Message, e.what());
  }
  return ret;
}

char32_t Decoder::ReadChar() {
  const auto str = ReadString();
  const auto code_points = utils::DecodeUtf8(str);
  if (code_points.size() != 1) {
    throw CodecException(ErrorKind::ExpectedChar, "Expected char, found string: '{}'", str);
  }
  return code_points.front();
}

std::vector<uint8_t> Decoder::ReadBytes() {
  const auto length = ReadBytesLength();
  return reader_.TakeBytes(length);
}

bool Decoder::ReadNone() {
  if (reader_.PeekFormat().kind() != FormatKind::Nil) return false;
  reader_.TakeFormat();
  return true;
}

void Decoder::ReadUnit() {
  const auto format = reader_.TakeFormat();
  if (format.kind() != FormatKind::Nil) {
    ThrowUnexpected(ErrorKind::ExpectedNull, "nil", format);
  }
}

SeqAccess Decoder::ReadSeq() { return {this, ReadArrayLength()}; }

MapAccess Decoder::ReadStruct() { return {this, ReadMapLength()}; }

MapAccess Decoder::ReadMap() {
  ReadExtLength();
  const auto type_byte = reader_.ReadUInt8();
  const auto type = ToExtensionType(type_byte);
  if (!type || *type != ExtensionType::GenericMap) {
    throw CodecException(ErrorKind::ExpectedExt, "Extension must be of type 'ext generic map'. Found type {}.",
                         type_byte);
  }
  return {this, ReadMapLength()};
}

EnumAccess Decoder::ReadEnum(std::span<const std::string_view> variants) {
  const auto format = reader_.PeekFormat();

  if (format.IsInteger()) {
    const auto index = ParseUnsigned();
    if (index >= variants.size()) {
      throw CodecException(ErrorKind::ExpectedUInteger, "enum variant index {} out of range; expected less than {}",
                           index, variants.size());
    }
    return {static_cast<uint32_t>(index), std::string(variants[index]), false};
  }

  if (format.IsString()) {
    auto name = ReadString();
    const auto index = FindVariant(variants, name);
    if (!index) throw CodecException(ErrorKind::ExpectedEnum, "unknown enum variant '{}'", name);
    return {*index, std::move(name), false};
  }

  if (format.IsMap()) {
    const auto length = ReadMapLength();
    if (length != 1) {
      throw CodecException(ErrorKind::ExpectedEnum, "enum variant record must have exactly one entry. Found {}.",
                           length);
    }
    auto name = ReadString();
    const auto index = FindVariant(variants, name);
    if (!index) throw CodecException(ErrorKind::ExpectedEnum, "unknown enum variant '{}'", name);
    return {*index, std::move(name), true};
  }

  ThrowUnexpected(ErrorKind::Message, "enum", format);
}

void Decoder::ReadAny(Visitor &visitor) {
  const auto format = reader_.PeekFormat();
  switch (format.kind()) {
    case FormatKind::Nil:
      reader_.TakeFormat();
      visitor.VisitNil();
      return;
    case FormatKind::True:
    case FormatKind::False:
      visitor.VisitBool(ReadBool());
      return;
    case FormatKind::PositiveFixInt:
    case FormatKind::NegativeFixInt:
    case FormatKind::Int8:
      visitor.VisitInt(ReadInt8());
      return;
    case FormatKind::Int16:
      visitor.VisitInt(ReadInt16());
      return;
    case FormatKind::Int32:
      visitor.VisitInt(ReadInt32());
      return;
    case FormatKind::Int64:
      visitor.VisitInt(ReadInt64());
      return;
    case FormatKind::Uint8:
      visitor.VisitUInt(ReadUInt8());
      return;
    case FormatKind::Uint16:
      visitor.VisitUInt(ReadUInt16());
      return;
    case FormatKind::Uint32:
      visitor.VisitUInt(ReadUInt32());
      return;
    case FormatKind::Uint64:
      visitor.VisitUInt(ReadUInt64());
      return;
    case FormatKind::Float32:
      visitor.VisitFloat32(ReadFloat32());
      return;
    case FormatKind::Float64:
      visitor.VisitFloat64(ReadFloat64());
      return;
    case FormatKind::FixStr:
    case FormatKind::Str8:
    case FormatKind::Str16:
    case FormatKind::Str32:
      visitor.VisitString(ReadString());
      return;
    case FormatKind::Bin8:
    case FormatKind::Bin16:
    case FormatKind::Bin32:
      visitor.VisitBytes(ReadBytes());
      return;
    case FormatKind::FixArray:
    case FormatKind::Array16:
    case FormatKind::Array32: {
      const NestingGuard guard(this);
      auto seq = ReadSeq();
      visitor.VisitSeq(seq);
      if (seq.remaining() != 0) {
        throw CodecException(ErrorKind::Message, "array visitor left {} elements unread", seq.remaining());
      }
      return;
    }
    case FormatKind::FixExt1:
    case FormatKind::FixExt2:
    case FormatKind::FixExt4:
    case FormatKind::FixExt8:
    case FormatKind::FixExt16:
    case FormatKind::Ext8:
    case FormatKind::Ext16:
    case FormatKind::Ext32: {
      const NestingGuard guard(this);
      auto map = ReadMap();
      visitor.VisitMap(map);
      if (map.remaining() != 0) {
        throw CodecException(ErrorKind::Message, "map visitor left {} entries unread", map.remaining());
      }
      return;
    }
    case FormatKind::FixMap:
    case FormatKind::Map16:
    case FormatKind::Map32: {
      const NestingGuard guard(this);
      auto record = ReadStruct();
      visitor.VisitStruct(record);
      if (record.remaining() != 0) {
        throw CodecException(ErrorKind::Message, "struct visitor left {} fields unread", record.remaining());
      }
      return;
    }
    case FormatKind::Reserved:
      throw CodecException(ErrorKind::Message, FoundMessage(format));
  }
}

void Decoder::Finalize() {
  if (reader_.IsExhausted()) return;
  spdlog::debug("Rejecting input with {} trailing bytes at offset {}", reader_.remaining(), reader_.GetPos());
  throw CodecException(ErrorKind::TrailingCharacters, "trailing characters: {} bytes left at offset {}",
                       reader_.remaining(), reader_.GetPos());
}

}  // namespace wirepack::codec
