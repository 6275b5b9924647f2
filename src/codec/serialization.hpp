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

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "codec/exceptions.hpp"
#include "codec/value.hpp"
#include "utils/logging.hpp"

namespace wirepack::codec {

/// Byte-blob type. Written with the `Bin*` formats, unlike `std::vector<T>`
/// which is written as an array.
using Bytes = std::vector<std::byte>;

// Forward declarations for all recursive `Save` and `Load` functions must be
// here because C++ doesn't know how to resolve the function call if it isn't in
// the global namespace.

template <typename T>
void Save(const std::vector<T> &obj, Encoder *encoder);
template <typename T>
void Load(std::vector<T> *obj, Decoder *decoder);

template <typename K, typename V>
void Save(const std::map<K, V> &obj, Encoder *encoder);
template <typename K, typename V>
void Load(std::map<K, V> *obj, Decoder *decoder);

template <typename K, typename V>
void Save(const std::unordered_map<K, V> &obj, Encoder *encoder);
template <typename K, typename V>
void Load(std::unordered_map<K, V> *obj, Decoder *decoder);

template <typename T>
void Save(const std::optional<T> &obj, Encoder *encoder);
template <typename T>
void Load(std::optional<T> *obj, Decoder *decoder);

// Implementation of serialization for primitive types.

#define MAKE_PRIMITIVE_SAVE(primitive_type, method) \
  inline void Save(primitive_type obj, Encoder *encoder) { encoder->method(obj); }

MAKE_PRIMITIVE_SAVE(bool, WriteBool)
MAKE_PRIMITIVE_SAVE(int8_t, WriteInt8)
MAKE_PRIMITIVE_SAVE(uint8_t, WriteUInt8)
MAKE_PRIMITIVE_SAVE(int16_t, WriteInt16)
MAKE_PRIMITIVE_SAVE(uint16_t, WriteUInt16)
MAKE_PRIMITIVE_SAVE(int32_t, WriteInt32)
MAKE_PRIMITIVE_SAVE(uint32_t, WriteUInt32)
MAKE_PRIMITIVE_SAVE(int64_t, WriteInt64)
MAKE_PRIMITIVE_SAVE(uint64_t, WriteUInt64)
MAKE_PRIMITIVE_SAVE(float, WriteFloat32)
MAKE_PRIMITIVE_SAVE(double, WriteFloat64)
MAKE_PRIMITIVE_SAVE(char32_t, WriteChar)

#undef MAKE_PRIMITIVE_SAVE

#define MAKE_PRIMITIVE_LOAD(primitive_type, method) \
  inline void Load(primitive_type *obj, Decoder *decoder) { *obj = decoder->method(); }

MAKE_PRIMITIVE_LOAD(bool, ReadBool)
MAKE_PRIMITIVE_LOAD(int8_t, ReadInt8)
MAKE_PRIMITIVE_LOAD(uint8_t, ReadUInt8)
MAKE_PRIMITIVE_LOAD(int16_t, ReadInt16)
MAKE_PRIMITIVE_LOAD(uint16_t, ReadUInt16)
MAKE_PRIMITIVE_LOAD(int32_t, ReadInt32)
MAKE_PRIMITIVE_LOAD(uint32_t, ReadUInt32)
MAKE_PRIMITIVE_LOAD(int64_t, ReadInt64)
MAKE_PRIMITIVE_LOAD(uint64_t, ReadUInt64)
MAKE_PRIMITIVE_LOAD(float, ReadFloat32)
MAKE_PRIMITIVE_LOAD(double, ReadFloat64)
MAKE_PRIMITIVE_LOAD(char32_t, ReadChar)

#undef MAKE_PRIMITIVE_LOAD

// A `char` is a one-character string holding a code point up to U+00FF.
inline void Save(char obj, Encoder *encoder) { encoder->WriteChar(static_cast<unsigned char>(obj)); }

inline void Load(char *obj, Decoder *decoder) {
  const auto c = decoder->ReadChar();
  if (c > 0xFF) {
    throw CodecException(ErrorKind::ExpectedChar, "character U+{:04X} doesn't fit into a char",
                         static_cast<uint32_t>(c));
  }
  *obj = static_cast<char>(static_cast<unsigned char>(c));
}

// Implementation of serialization for complex types.

inline void Save(const std::string &obj, Encoder *encoder) { encoder->WriteString(obj); }
inline void Save(std::string_view obj, Encoder *encoder) { encoder->WriteString(obj); }
inline void Save(const char *obj, Encoder *encoder) { encoder->WriteString(obj); }

inline void Load(std::string *obj, Decoder *decoder) { *obj = decoder->ReadString(); }

inline void Save(const Bytes &obj, Encoder *encoder) { encoder->WriteBytes(std::span<const std::byte>(obj)); }

inline void Load(Bytes *obj, Decoder *decoder) {
  const auto bytes = decoder->ReadBytes();
  obj->resize(bytes.size());
  for (size_t i = 0; i < bytes.size(); ++i) (*obj)[i] = static_cast<std::byte>(bytes[i]);
}

inline void Save(const std::monostate & /*obj*/, Encoder *encoder) { encoder->WriteUnit(); }
inline void Load(std::monostate * /*obj*/, Decoder *decoder) { decoder->ReadUnit(); }

template <typename T>
inline void Save(const std::vector<T> &obj, Encoder *encoder) {
  auto seq = encoder->BeginSeq(CheckLength(obj.size(), "array"));
  for (const auto &item : obj) {
    Save(item, seq.NextElement());
  }
  seq.End();
}

template <typename T>
inline void Load(std::vector<T> *obj, Decoder *decoder) {
  auto seq = decoder->ReadSeq();
  obj->clear();
  obj->reserve(std::min<size_t>(seq.size(), decoder->remaining()));
  while (seq.NextElement()) {
    T item;
    Load(&item, decoder);
    obj->emplace_back(std::move(item));
  }
}

template <typename TMap>
inline void SaveMap(const TMap &obj, Encoder *encoder) {
  auto map = encoder->BeginMap();
  for (const auto &[key, value] : obj) {
    auto *entry = map.NextEntry();
    Save(key, entry);
    Save(value, entry);
  }
  map.End();
}

template <typename TMap>
inline void LoadMap(TMap *obj, Decoder *decoder) {
  auto map = decoder->ReadMap();
  obj->clear();
  while (map.NextEntry()) {
    typename TMap::key_type key;
    Load(&key, decoder);
    typename TMap::mapped_type value;
    Load(&value, decoder);
    obj->insert_or_assign(std::move(key), std::move(value));
  }
}

template <typename K, typename V>
inline void Save(const std::map<K, V> &obj, Encoder *encoder) {
  SaveMap(obj, encoder);
}

template <typename K, typename V>
inline void Load(std::map<K, V> *obj, Decoder *decoder) {
  LoadMap(obj, decoder);
}

template <typename K, typename V>
inline void Save(const std::unordered_map<K, V> &obj, Encoder *encoder) {
  SaveMap(obj, encoder);
}

template <typename K, typename V>
inline void Load(std::unordered_map<K, V> *obj, Decoder *decoder) {
  LoadMap(obj, decoder);
}

template <typename T>
inline void Save(const std::optional<T> &obj, Encoder *encoder) {
  if (obj) {
    Save(*obj, encoder);
  } else {
    encoder->WriteNone();
  }
}

template <typename T>
inline void Load(std::optional<T> *obj, Decoder *decoder) {
  if (decoder->ReadNone()) {
    *obj = std::nullopt;
    return;
  }
  T item;
  Load(&item, decoder);
  obj->emplace(std::move(item));
}

/// Serializes one value into a fresh buffer.
template <typename T>
std::vector<uint8_t> Encode(const T &value) {
  Encoder encoder;
  Save(value, &encoder);
  spdlog::trace("Encoded a value into {} bytes", encoder.size());
  return encoder.Release();
}

/// Deserializes one value of type `T` that has to span the whole buffer.
template <typename T>
T Decode(std::span<const uint8_t> data, const DecoderOptions &options = {}) {
  Decoder decoder(data, options);
  T value;
  Load(&value, &decoder);
  decoder.Finalize();
  spdlog::trace("Decoded a value from {} bytes", data.size());
  return value;
}

}  // namespace wirepack::codec
