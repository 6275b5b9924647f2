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
#include <span>
#include <vector>

#include "codec/format.hpp"

namespace wirepack::codec {

/// Append-only output buffer. All multi-byte numbers are written big-endian.
class Builder {
 public:
  Builder() = default;

  void Save(const uint8_t *data, uint64_t size);
  void Save(std::span<const uint8_t> data) { Save(data.data(), data.size()); }

  void WriteFormat(Format format) { WriteUInt8(format.ToByte()); }

  void WriteUInt8(uint8_t value);
  void WriteUInt16(uint16_t value);
  void WriteUInt32(uint32_t value);
  void WriteUInt64(uint64_t value);
  void WriteInt8(int8_t value);
  void WriteInt16(int16_t value);
  void WriteInt32(int32_t value);
  void WriteInt64(int64_t value);
  void WriteFloat32(float value);
  void WriteFloat64(double value);

  size_t size() const { return data_.size(); }
  bool IsEmpty() const { return data_.empty(); }
  const std::vector<uint8_t> &data() const { return data_; }

  /// Moves the accumulated bytes out, leaving the builder empty.
  std::vector<uint8_t> Release();

 private:
  std::vector<uint8_t> data_;
};

/// Byte cursor over a borrowed input buffer. Reads advance the position
/// monotonically; a failed read throws `UnexpectedEnd`.
class Reader {
 public:
  Reader(const uint8_t *data, size_t size) : data_(data), size_(size) {}
  explicit Reader(std::span<const uint8_t> data) : Reader(data.data(), data.size()) {}

  /// Copies exactly `size` bytes into `data`.
  void Load(uint8_t *data, uint64_t size);

  uint8_t ReadUInt8();
  uint16_t ReadUInt16();
  uint32_t ReadUInt32();
  uint64_t ReadUInt64();
  int8_t ReadInt8();
  int16_t ReadInt16();
  int32_t ReadInt32();
  int64_t ReadInt64();
  float ReadFloat32();
  double ReadFloat64();

  /// Length prefixes of strings, blobs, arrays, maps and extensions.
  uint32_t ReadLength8() { return ReadUInt8(); }
  uint32_t ReadLength16() { return ReadUInt16(); }
  uint32_t ReadLength32() { return ReadUInt32(); }

  /// Classifies the next byte without consuming it.
  Format PeekFormat();

  /// Consumes and classifies the next byte.
  Format TakeFormat();

  /// Consumes exactly `n` bytes and returns them as an owned buffer.
  std::vector<uint8_t> TakeBytes(uint64_t n);

  size_t GetPos() const { return pos_; }
  size_t size() const { return size_; }
  size_t remaining() const { return size_ - pos_; }
  bool IsExhausted() const { return pos_ == size_; }

 private:
  void Require(uint64_t n) const;

  const uint8_t *data_;
  size_t size_;
  size_t pos_{0};
};

}  // namespace wirepack::codec
