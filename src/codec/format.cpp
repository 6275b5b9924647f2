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

#include "codec/format.hpp"

#include <fmt/format.h>

#include "utils/logging.hpp"

namespace wirepack::codec {

Format Format::FromByte(uint8_t byte) {
  if (byte <= marker::kPositiveFixIntMax) return Format(FormatKind::PositiveFixInt, byte);
  if (byte >= marker::kNegativeFixIntMin) return Format(FormatKind::NegativeFixInt, byte);
  if (byte < marker::kFixArray) return Format(FormatKind::FixMap, byte & 0x0f);
  if (byte < marker::kFixStr) return Format(FormatKind::FixArray, byte & 0x0f);
  if (byte < marker::kNil) return Format(FormatKind::FixStr, byte & 0x1f);

  switch (byte) {
    case marker::kNil:
      return Of(FormatKind::Nil);
    case marker::kReserved:
      return Of(FormatKind::Reserved);
    case marker::kFalse:
      return Of(FormatKind::False);
    case marker::kTrue:
      return Of(FormatKind::True);
    case marker::kBin8:
      return Of(FormatKind::Bin8);
    case marker::kBin16:
      return Of(FormatKind::Bin16);
    case marker::kBin32:
      return Of(FormatKind::Bin32);
    case marker::kExt8:
      return Of(FormatKind::Ext8);
    case marker::kExt16:
      return Of(FormatKind::Ext16);
    case marker::kExt32:
      return Of(FormatKind::Ext32);
    case marker::kFloat32:
      return Of(FormatKind::Float32);
    case marker::kFloat64:
      return Of(FormatKind::Float64);
    case marker::kUint8:
      return Of(FormatKind::Uint8);
    case marker::kUint16:
      return Of(FormatKind::Uint16);
    case marker::kUint32:
      return Of(FormatKind::Uint32);
    case marker::kUint64:
      return Of(FormatKind::Uint64);
    case marker::kInt8:
      return Of(FormatKind::Int8);
    case marker::kInt16:
      return Of(FormatKind::Int16);
    case marker::kInt32:
      return Of(FormatKind::Int32);
    case marker::kInt64:
      return Of(FormatKind::Int64);
    case marker::kFixExt1:
      return Of(FormatKind::FixExt1);
    case marker::kFixExt2:
      return Of(FormatKind::FixExt2);
    case marker::kFixExt4:
      return Of(FormatKind::FixExt4);
    case marker::kFixExt8:
      return Of(FormatKind::FixExt8);
    case marker::kFixExt16:
      return Of(FormatKind::FixExt16);
    case marker::kStr8:
      return Of(FormatKind::Str8);
    case marker::kStr16:
      return Of(FormatKind::Str16);
    case marker::kStr32:
      return Of(FormatKind::Str32);
    case marker::kArray16:
      return Of(FormatKind::Array16);
    case marker::kArray32:
      return Of(FormatKind::Array32);
    case marker::kMap16:
      return Of(FormatKind::Map16);
    case marker::kMap32:
      return Of(FormatKind::Map32);
    default:
      break;
  }
  LOG_FATAL("Prefix byte {:#04x} is not covered by the format table", byte);
}

Format Format::Of(FormatKind kind) {
  DWP_ASSERT(kind != FormatKind::PositiveFixInt && kind != FormatKind::NegativeFixInt && kind != FormatKind::FixStr &&
                 kind != FormatKind::FixArray && kind != FormatKind::FixMap,
             "Format kind {} needs an embedded parameter", static_cast<int>(kind));
  return Format(kind, 0);
}

Format Format::PositiveFixInt(uint8_t value) {
  DWP_ASSERT(value <= kFixIntMaxValue, "Positive fix int out of range: {}", value);
  return Format(FormatKind::PositiveFixInt, value);
}

Format Format::NegativeFixInt(int8_t value) {
  DWP_ASSERT(value >= kNegativeFixIntMinValue && value < 0, "Negative fix int out of range: {}", value);
  return Format(FormatKind::NegativeFixInt, static_cast<uint8_t>(value));
}

Format Format::FixStr(uint8_t length) {
  DWP_ASSERT(length <= kFixStrMaxLength, "Fix string length out of range: {}", length);
  return Format(FormatKind::FixStr, length);
}

Format Format::FixArray(uint8_t length) {
  DWP_ASSERT(length <= kFixCollectionMaxLength, "Fix array length out of range: {}", length);
  return Format(FormatKind::FixArray, length);
}

Format Format::FixMap(uint8_t length) {
  DWP_ASSERT(length <= kFixCollectionMaxLength, "Fix map length out of range: {}", length);
  return Format(FormatKind::FixMap, length);
}

uint8_t Format::ToByte() const {
  switch (kind_) {
    case FormatKind::PositiveFixInt:
      return param_ & 0x7f;
    case FormatKind::NegativeFixInt:
      return param_;
    case FormatKind::FixMap:
      return marker::kFixMap | (param_ & 0x0f);
    case FormatKind::FixArray:
      return marker::kFixArray | (param_ & 0x0f);
    case FormatKind::FixStr:
      return marker::kFixStr | (param_ & 0x1f);
    case FormatKind::Nil:
      return marker::kNil;
    case FormatKind::Reserved:
      return marker::kReserved;
    case FormatKind::False:
      return marker::kFalse;
    case FormatKind::True:
      return marker::kTrue;
    case FormatKind::Bin8:
      return marker::kBin8;
    case FormatKind::Bin16:
      return marker::kBin16;
    case FormatKind::Bin32:
      return marker::kBin32;
    case FormatKind::Ext8:
      return marker::kExt8;
    case FormatKind::Ext16:
      return marker::kExt16;
    case FormatKind::Ext32:
      return marker::kExt32;
    case FormatKind::Float32:
      return marker::kFloat32;
    case FormatKind::Float64:
      return marker::kFloat64;
    case FormatKind::Uint8:
      return marker::kUint8;
    case FormatKind::Uint16:
      return marker::kUint16;
    case FormatKind::Uint32:
      return marker::kUint32;
    case FormatKind::Uint64:
      return marker::kUint64;
    case FormatKind::Int8:
      return marker::kInt8;
    case FormatKind::Int16:
      return marker::kInt16;
    case FormatKind::Int32:
      return marker::kInt32;
    case FormatKind::Int64:
      return marker::kInt64;
    case FormatKind::FixExt1:
      return marker::kFixExt1;
    case FormatKind::FixExt2:
      return marker::kFixExt2;
    case FormatKind::FixExt4:
      return marker::kFixExt4;
    case FormatKind::FixExt8:
      return marker::kFixExt8;
    case FormatKind::FixExt16:
      return marker::kFixExt16;
    case FormatKind::Str8:
      return marker::kStr8;
    case FormatKind::Str16:
      return marker::kStr16;
    case FormatKind::Str32:
      return marker::kStr32;
    case FormatKind::Array16:
      return marker::kArray16;
    case FormatKind::Array32:
      return marker::kArray32;
    case FormatKind::Map16:
      return marker::kMap16;
    case FormatKind::Map32:
      return marker::kMap32;
  }
  LOG_FATAL("Unknown format kind {}", static_cast<int>(kind_));
}

bool Format::IsInteger() const {
  switch (kind_) {
    case FormatKind::PositiveFixInt:
    case FormatKind::NegativeFixInt:
    case FormatKind::Uint8:
    case FormatKind::Uint16:
    case FormatKind::Uint32:
    case FormatKind::Uint64:
    case FormatKind::Int8:
    case FormatKind::Int16:
    case FormatKind::Int32:
    case FormatKind::Int64:
      return true;
    default:
      return false;
  }
}

bool Format::IsString() const {
  return kind_ == FormatKind::FixStr || kind_ == FormatKind::Str8 || kind_ == FormatKind::Str16 ||
         kind_ == FormatKind::Str32;
}

bool Format::IsArray() const {
  return kind_ == FormatKind::FixArray || kind_ == FormatKind::Array16 || kind_ == FormatKind::Array32;
}

bool Format::IsMap() const {
  return kind_ == FormatKind::FixMap || kind_ == FormatKind::Map16 || kind_ == FormatKind::Map32;
}

bool Format::IsExt() const {
  switch (kind_) {
    case FormatKind::FixExt1:
    case FormatKind::FixExt2:
    case FormatKind::FixExt4:
    case FormatKind::FixExt8:
    case FormatKind::FixExt16:
    case FormatKind::Ext8:
    case FormatKind::Ext16:
    case FormatKind::Ext32:
      return true;
    default:
      return false;
  }
}

std::optional<ExtensionType> ToExtensionType(uint8_t byte) {
  if (byte == static_cast<uint8_t>(ExtensionType::GenericMap)) return ExtensionType::GenericMap;
  return std::nullopt;
}

std::string_view FormatName(Format format) {
  switch (format.kind()) {
    case FormatKind::Nil:
      return "nil";
    case FormatKind::Reserved:
      return "reserved";
    case FormatKind::False:
    case FormatKind::True:
      return "bool";
    case FormatKind::Bin8:
      return "BIN8";
    case FormatKind::Bin16:
      return "BIN16";
    case FormatKind::Bin32:
      return "BIN32";
    case FormatKind::Ext8:
      return "EXT8";
    case FormatKind::Ext16:
      return "EXT16";
    case FormatKind::Ext32:
      return "EXT32";
    case FormatKind::Float32:
      return "float32";
    case FormatKind::Float64:
      return "float64";
    case FormatKind::PositiveFixInt:
    case FormatKind::NegativeFixInt:
      return "int";
    case FormatKind::Uint8:
      return "uint8";
    case FormatKind::Uint16:
      return "uint16";
    case FormatKind::Uint32:
      return "uint32";
    case FormatKind::Uint64:
      return "uint64";
    case FormatKind::Int8:
      return "int8";
    case FormatKind::Int16:
      return "int16";
    case FormatKind::Int32:
      return "int32";
    case FormatKind::Int64:
      return "int64";
    case FormatKind::FixExt1:
      return "FIXEXT1";
    case FormatKind::FixExt2:
      return "FIXEXT2";
    case FormatKind::FixExt4:
      return "FIXEXT4";
    case FormatKind::FixExt8:
      return "FIXEXT8";
    case FormatKind::FixExt16:
      return "FIXEXT16";
    case FormatKind::FixStr:
    case FormatKind::Str8:
    case FormatKind::Str16:
    case FormatKind::Str32:
      return "string";
    case FormatKind::FixArray:
    case FormatKind::Array16:
    case FormatKind::Array32:
      return "array";
    case FormatKind::FixMap:
    case FormatKind::Map16:
    case FormatKind::Map32:
      return "map";
  }
  return "unknown";
}

std::string FoundMessage(Format format) { return fmt::format("Found '{}'.", FormatName(format)); }

std::ostream &operator<<(std::ostream &os, FormatKind kind) {
  switch (kind) {
    case FormatKind::Nil:
      return os << "Nil";
    case FormatKind::Reserved:
      return os << "Reserved";
    case FormatKind::False:
      return os << "False";
    case FormatKind::True:
      return os << "True";
    case FormatKind::PositiveFixInt:
      return os << "PositiveFixInt";
    case FormatKind::NegativeFixInt:
      return os << "NegativeFixInt";
    case FormatKind::Uint8:
      return os << "Uint8";
    case FormatKind::Uint16:
      return os << "Uint16";
    case FormatKind::Uint32:
      return os << "Uint32";
    case FormatKind::Uint64:
      return os << "Uint64";
    case FormatKind::Int8:
      return os << "Int8";
    case FormatKind::Int16:
      return os << "Int16";
    case FormatKind::Int32:
      return os << "Int32";
    case FormatKind::Int64:
      return os << "Int64";
    case FormatKind::Float32:
      return os << "Float32";
    case FormatKind::Float64:
      return os << "Float64";
    case FormatKind::FixStr:
      return os << "FixStr";
    case FormatKind::Str8:
      return os << "Str8";
    case FormatKind::Str16:
      return os << "Str16";
    case FormatKind::Str32:
      return os << "Str32";
    case FormatKind::Bin8:
      return os << "Bin8";
    case FormatKind::Bin16:
      return os << "Bin16";
    case FormatKind::Bin32:
      return os << "Bin32";
    case FormatKind::FixArray:
      return os << "FixArray";
    case FormatKind::Array16:
      return os << "Array16";
    case FormatKind::Array32:
      return os << "Array32";
    case FormatKind::FixMap:
      return os << "FixMap";
    case FormatKind::Map16:
      return os << "Map16";
    case FormatKind::Map32:
      return os << "Map32";
    case FormatKind::FixExt1:
      return os << "FixExt1";
    case FormatKind::FixExt2:
      return os << "FixExt2";
    case FormatKind::FixExt4:
      return os << "FixExt4";
    case FormatKind::FixExt8:
      return os << "FixExt8";
    case FormatKind::FixExt16:
      return os << "FixExt16";
    case FormatKind::Ext8:
      return os << "Ext8";
    case FormatKind::Ext16:
      return os << "Ext16";
    case FormatKind::Ext32:
      return os << "Ext32";
  }
  return os << "Unknown";
}

std::ostream &operator<<(std::ostream &os, Format format) {
  switch (format.kind()) {
    case FormatKind::PositiveFixInt:
    case FormatKind::FixStr:
    case FormatKind::FixArray:
    case FormatKind::FixMap:
      return os << format.kind() << "(" << static_cast<int>(format.param()) << ")";
    case FormatKind::NegativeFixInt:
      return os << format.kind() << "(" << static_cast<int>(format.negative_value()) << ")";
    default:
      return os << format.kind();
  }
}

}  // namespace wirepack::codec
