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

#include "codec/streams.hpp"

#include <cstring>
#include <utility>

#include "codec/exceptions.hpp"
#include "utils/cast.hpp"
#include "utils/endian.hpp"

namespace wirepack::codec {

namespace {

template <typename T>
void SaveBigEndian(Builder *builder, T value) {
  T encoded = utils::HostToBigEndian(value);
  builder->Save(reinterpret_cast<const uint8_t *>(&encoded), sizeof(T));
}

template <typename T>
T LoadBigEndian(Reader *reader) {
  T encoded;
  reader->Load(reinterpret_cast<uint8_t *>(&encoded), sizeof(T));
  return utils::BigEndianToHost(encoded);
}

}  // namespace

void Builder::Save(const uint8_t *data, uint64_t size) {
  if (size == 0) return;
  data_.insert(data_.end(), data, data + size);
}

void Builder::WriteUInt8(uint8_t value) { data_.push_back(value); }
void Builder::WriteUInt16(uint16_t value) { SaveBigEndian(this, value); }
void Builder::WriteUInt32(uint32_t value) { SaveBigEndian(this, value); }
void Builder::WriteUInt64(uint64_t value) { SaveBigEndian(this, value); }
void Builder::WriteInt8(int8_t value) { data_.push_back(utils::MemcpyCast<uint8_t>(value)); }
void Builder::WriteInt16(int16_t value) { SaveBigEndian(this, value); }
void Builder::WriteInt32(int32_t value) { SaveBigEndian(this, value); }
void Builder::WriteInt64(int64_t value) { SaveBigEndian(this, value); }
void Builder::WriteFloat32(float value) { WriteUInt32(utils::MemcpyCast<uint32_t>(value)); }
void Builder::WriteFloat64(double value) { WriteUInt64(utils::MemcpyCast<uint64_t>(value)); }

std::vector<uint8_t> Builder::Release() { return std::exchange(data_, {}); }

void Reader::Require(uint64_t n) const {
  if (n > size_ - pos_) {
    throw CodecException(ErrorKind::UnexpectedEnd, "unexpected end of input: needed {} bytes at offset {}, have {}", n,
                         pos_, size_ - pos_);
  }
}

void Reader::Load(uint8_t *data, uint64_t size) {
  Require(size);
  if (size == 0) return;
  memcpy(data, data_ + pos_, size);
  pos_ += size;
}

uint8_t Reader::ReadUInt8() {
  Require(1);
  return data_[pos_++];
}

uint16_t Reader::ReadUInt16() { return LoadBigEndian<uint16_t>(this); }
uint32_t Reader::ReadUInt32() { return LoadBigEndian<uint32_t>(this); }
uint64_t Reader::ReadUInt64() { return LoadBigEndian<uint64_t>(this); }
int8_t Reader::ReadInt8() { return utils::MemcpyCast<int8_t>(ReadUInt8()); }
int16_t Reader::ReadInt16() { return LoadBigEndian<int16_t>(this); }
int32_t Reader::ReadInt32() { return LoadBigEndian<int32_t>(this); }
int64_t Reader::ReadInt64() { return LoadBigEndian<int64_t>(this); }
float Reader::ReadFloat32() { return utils::MemcpyCast<float>(ReadUInt32()); }
double Reader::ReadFloat64() { return utils::MemcpyCast<double>(ReadUInt64()); }

Format Reader::PeekFormat() {
  const auto position = pos_;
  auto format = TakeFormat();
  pos_ = position;
  return format;
}

Format Reader::TakeFormat() { return Format::FromByte(ReadUInt8()); }

std::vector<uint8_t> Reader::TakeBytes(uint64_t n) {
  Require(n);
  std::vector<uint8_t> ret(data_ + pos_, data_ + pos_ + n);
  pos_ += n;
  return ret;
}

}  // namespace wirepack::codec
