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
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "codec/streams.hpp"

namespace wirepack::codec {

class Decoder;

struct DecoderOptions {
  /// Accept a `FixArray` prefix as the byte length of a string or blob. Older
  /// encoders produced such values.
  bool accept_array_as_string_length{true};
};

/// Element cursor of an open array. `NextElement()` returns false once every
/// element announced by the header has been claimed; otherwise exactly one
/// value has to be read from `decoder()` before the next call.
class SeqAccess {
 public:
  SeqAccess(Decoder *decoder, uint32_t length) : decoder_(decoder), length_(length), remaining_(length) {}

  bool NextElement();

  Decoder *decoder() { return decoder_; }
  uint32_t size() const { return length_; }
  uint32_t remaining() const { return remaining_; }

 private:
  Decoder *decoder_;
  uint32_t length_;
  uint32_t remaining_;
};

/// Entry cursor of an open map or structure. After `NextEntry()` returned
/// true, a key and then a value have to be read from `decoder()`.
class MapAccess {
 public:
  MapAccess(Decoder *decoder, uint32_t length) : decoder_(decoder), length_(length), remaining_(length) {}

  bool NextEntry();

  /// Structure helper: claims the next entry and reads its key as a field
  /// name. Returns std::nullopt once the record is exhausted.
  std::optional<std::string> NextField();

  Decoder *decoder() { return decoder_; }
  uint32_t size() const { return length_; }
  uint32_t remaining() const { return remaining_; }

 private:
  Decoder *decoder_;
  uint32_t length_;
  uint32_t remaining_;
};

/// Result of `Decoder::ReadEnum`. When `has_payload` is set the variant was
/// written as a one-field record and its payload is the next value.
struct EnumAccess {
  uint32_t index;
  std::string name;
  bool has_payload;
};

/// Receiver of a self-describing decode. Aggregates are handed over as open
/// cursors that the visitor has to drain.
class Visitor {
 public:
  virtual ~Visitor() = default;

  virtual void VisitNil() = 0;
  virtual void VisitBool(bool value) = 0;
  virtual void VisitInt(int64_t value) = 0;
  virtual void VisitUInt(uint64_t value) = 0;
  virtual void VisitFloat32(float value) = 0;
  virtual void VisitFloat64(double value) = 0;
  virtual void VisitString(std::string value) = 0;
  virtual void VisitBytes(std::vector<uint8_t> value) = 0;
  virtual void VisitSeq(SeqAccess &seq) = 0;
  /// Generic map taken out of a `GenericMap` extension envelope.
  virtual void VisitMap(MapAccess &map) = 0;
  /// Bare map, i.e. a structure record.
  virtual void VisitStruct(MapAccess &record) = 0;
};

/**
 * Decoder driver over one borrowed buffer.
 *
 * Every `Read*` call consumes exactly one value of the requested shape,
 * coercing between compatible wire forms, or throws `CodecException`. After a
 * failure the position is unspecified and the decoder has to be discarded.
 */
class Decoder {
 public:
  /// Deepest nesting of aggregates `ReadAny` descends into.
  static constexpr uint32_t kMaxNestingDepth = 1024;

  explicit Decoder(std::span<const uint8_t> data, DecoderOptions options = {}) : reader_(data), options_(options) {}
  Decoder(const uint8_t *data, size_t size, DecoderOptions options = {}) : reader_(data, size), options_(options) {}

  bool ReadBool();

  int8_t ReadInt8();
  int16_t ReadInt16();
  int32_t ReadInt32();
  int64_t ReadInt64();
  uint8_t ReadUInt8();
  uint16_t ReadUInt16();
  uint32_t ReadUInt32();
  uint64_t ReadUInt64();

  /// Accepts only `Float32`.
  float ReadFloat32();
  /// Accepts `Float64` and widens `Float32`.
  double ReadFloat64();

  /// `Nil` yields the empty string. Invalid UTF-8 is rejected.
  std::string ReadString();
  /// A string holding exactly one code point.
  char32_t ReadChar();
  std::string ReadIdentifier() { return ReadString(); }

  /// `Nil` yields the empty blob.
  std::vector<uint8_t> ReadBytes();

  /// Consumes a `Nil` and returns true if the optional is empty. Otherwise
  /// nothing is consumed and the contained value has to be read next.
  bool ReadNone();

  void ReadUnit();

  SeqAccess ReadSeq();
  MapAccess ReadStruct();
  MapAccess ReadMap();

  /// Resolves the next enum value against the declared variant names.
  EnumAccess ReadEnum(std::span<const std::string_view> variants);

  /// Decodes the next value guided only by its prefix byte. Fails with
  /// `Message` when aggregates are nested deeper than `kMaxNestingDepth`.
  void ReadAny(Visitor &visitor);

  /// Fails with `TrailingCharacters` unless the whole buffer was consumed.
  void Finalize();

  Format PeekFormat() { return reader_.PeekFormat(); }
  size_t GetPos() const { return reader_.GetPos(); }
  /// Number of input bytes not consumed yet.
  size_t remaining() const { return reader_.remaining(); }
  const DecoderOptions &options() const { return options_; }

 private:
  int64_t ParseSigned();
  uint64_t ParseUnsigned();
  uint32_t ReadStringLength();
  uint32_t ReadBytesLength();
  uint32_t ReadArrayLength();
  uint32_t ReadMapLength();
  uint32_t ReadExtLength();

  friend class NestingGuard;

  Reader reader_;
  DecoderOptions options_;
  uint32_t depth_{0};
};

}  // namespace wirepack::codec
