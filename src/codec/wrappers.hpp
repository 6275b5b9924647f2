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

#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json.hpp>

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"

namespace wirepack::codec {

/// Arbitrary precision integer, written as its decimal string.
struct BigInt {
  boost::multiprecision::cpp_int value;

  friend bool operator==(const BigInt &a, const BigInt &b) { return a.value == b.value; }
};

/// JSON document, written as its compact text.
struct Json {
  nlohmann::json value;

  friend bool operator==(const Json &a, const Json &b) { return a.value == b.value; }
};

// Field-level helpers for structures that hold the wrapped types directly.
void SaveBigInt(const boost::multiprecision::cpp_int &value, Encoder *encoder);
void LoadBigInt(boost::multiprecision::cpp_int *value, Decoder *decoder);
void SaveJson(const nlohmann::json &value, Encoder *encoder);
void LoadJson(nlohmann::json *value, Decoder *decoder);

inline void Save(const BigInt &obj, Encoder *encoder) { SaveBigInt(obj.value, encoder); }
inline void Load(BigInt *obj, Decoder *decoder) { LoadBigInt(&obj->value, decoder); }
inline void Save(const Json &obj, Encoder *encoder) { SaveJson(obj.value, encoder); }
inline void Load(Json *obj, Decoder *decoder) { LoadJson(&obj->value, decoder); }

}  // namespace wirepack::codec
