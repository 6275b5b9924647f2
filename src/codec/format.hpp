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
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace wirepack::codec {

/// Every kind of one-byte prefix the wire format knows about. The `Fix*`
/// kinds carry an embedded parameter in the low bits of the prefix byte.
enum class FormatKind : uint8_t {
  Nil,
  Reserved,
  False,
  True,
  PositiveFixInt,
  NegativeFixInt,
  Uint8,
  Uint16,
  Uint32,
  Uint64,
  Int8,
  Int16,
  Int32,
  Int64,
  Float32,
  Float64,
  FixStr,
  Str8,
  Str16,
  Str32,
  Bin8,
  Bin16,
  Bin32,
  FixArray,
  Array16,
  Array32,
  FixMap,
  Map16,
  Map32,
  FixExt1,
  FixExt2,
  FixExt4,
  FixExt8,
  FixExt16,
  Ext8,
  Ext16,
  Ext32,
};

namespace marker {
inline constexpr uint8_t kPositiveFixIntMax = 0x7f;
inline constexpr uint8_t kFixMap = 0x80;
inline constexpr uint8_t kFixArray = 0x90;
inline constexpr uint8_t kFixStr = 0xa0;
inline constexpr uint8_t kNil = 0xc0;
inline constexpr uint8_t kReserved = 0xc1;
inline constexpr uint8_t kFalse = 0xc2;
inline constexpr uint8_t kTrue = 0xc3;
inline constexpr uint8_t kBin8 = 0xc4;
inline constexpr uint8_t kBin16 = 0xc5;
inline constexpr uint8_t kBin32 = 0xc6;
inline constexpr uint8_t kExt8 = 0xc7;
inline constexpr uint8_t kExt16 = 0xc8;
inline constexpr uint8_t kExt32 = 0xc9;
inline constexpr uint8_t kFloat32 = 0xca;
inline constexpr uint8_t kFloat64 = 0xcb;
inline constexpr uint8_t kUint8 = 0xcc;
inline constexpr uint8_t kUint16 = 0xcd;
inline constexpr uint8_t kUint32 = 0xce;
inline constexpr uint8_t kUint64 = 0xcf;
inline constexpr uint8_t kInt8 = 0xd0;
inline constexpr uint8_t kInt16 = 0xd1;
inline constexpr uint8_t kInt32 = 0xd2;
inline constexpr uint8_t kInt64 = 0xd3;
inline constexpr uint8_t kFixExt1 = 0xd4;
inline constexpr uint8_t kFixExt2 = 0xd5;
inline constexpr uint8_t kFixExt4 = 0xd6;
inline constexpr uint8_t kFixExt8 = 0xd7;
inline constexpr uint8_t kFixExt16 = 0xd8;
inline constexpr uint8_t kStr8 = 0xd9;
inline constexpr uint8_t kStr16 = 0xda;
inline constexpr uint8_t kStr32 = 0xdb;
inline constexpr uint8_t kArray16 = 0xdc;
inline constexpr uint8_t kArray32 = 0xdd;
inline constexpr uint8_t kMap16 = 0xde;
inline constexpr uint8_t kMap32 = 0xdf;
inline constexpr uint8_t kNegativeFixIntMin = 0xe0;
}  // namespace marker

inline constexpr uint8_t kFixIntMaxValue = 127;
inline constexpr int8_t kNegativeFixIntMinValue = -32;
inline constexpr uint8_t kFixStrMaxLength = 31;
inline constexpr uint8_t kFixCollectionMaxLength = 15;

/// A classified prefix byte. It describes the next region of the input and
/// owns nothing; `param` holds the embedded value or length of the `Fix*`
/// kinds and is zero for every other kind.
class Format {
 public:
  /// Classifies a prefix byte. Every byte value maps to exactly one format.
  static Format FromByte(uint8_t byte);

  static Format Of(FormatKind kind);
  static Format PositiveFixInt(uint8_t value);
  static Format NegativeFixInt(int8_t value);
  static Format FixStr(uint8_t length);
  static Format FixArray(uint8_t length);
  static Format FixMap(uint8_t length);

  /// The inverse of `FromByte`.
  uint8_t ToByte() const;

  FormatKind kind() const { return kind_; }

  /// Embedded value of `PositiveFixInt` and the embedded length of
  /// `FixStr`, `FixArray` and `FixMap`.
  uint8_t param() const { return param_; }

  /// Embedded value of `NegativeFixInt`.
  int8_t negative_value() const { return static_cast<int8_t>(param_); }

  bool IsInteger() const;
  bool IsString() const;
  bool IsArray() const;
  bool IsMap() const;
  bool IsExt() const;

  bool operator==(const Format &other) const = default;

 private:
  Format(FormatKind kind, uint8_t param) : kind_(kind), param_(param) {}

  FormatKind kind_;
  uint8_t param_;
};

/// Extension-type byte that follows an extension header.
enum class ExtensionType : uint8_t {
  GenericMap = 1,
};

std::optional<ExtensionType> ToExtensionType(uint8_t byte);

/// Short lowercase name of a format kind as used in error messages, e.g.
/// "uint8", "string", "map".
std::string_view FormatName(Format format);

/// "Found '<name>'." suffix attached to every shape-mismatch message.
std::string FoundMessage(Format format);

std::ostream &operator<<(std::ostream &os, FormatKind kind);
std::ostream &operator<<(std::ostream &os, Format format);

}  // namespace wirepack::codec
