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

#ifdef __APPLE__
#include <libkern/OSByteOrder.h>
#else
#include <endian.h>
#endif

#include "utils/cast.hpp"

// The wire format is big-endian throughout, so only the host <-> big-endian
// conversions are provided.
namespace wirepack::utils {

#ifdef __APPLE__
inline uint8_t HostToBigEndian(uint8_t value) { return value; }
inline uint16_t HostToBigEndian(uint16_t value) { return OSSwapHostToBigInt16(value); }
inline uint32_t HostToBigEndian(uint32_t value) { return OSSwapHostToBigInt32(value); }
inline uint64_t HostToBigEndian(uint64_t value) { return OSSwapHostToBigInt64(value); }

inline uint8_t BigEndianToHost(uint8_t value) { return value; }
inline uint16_t BigEndianToHost(uint16_t value) { return OSSwapBigToHostInt16(value); }
inline uint32_t BigEndianToHost(uint32_t value) { return OSSwapBigToHostInt32(value); }
inline uint64_t BigEndianToHost(uint64_t value) { return OSSwapBigToHostInt64(value); }
#else
inline uint8_t HostToBigEndian(uint8_t value) { return value; }
inline uint16_t HostToBigEndian(uint16_t value) { return htobe16(value); }
inline uint32_t HostToBigEndian(uint32_t value) { return htobe32(value); }
inline uint64_t HostToBigEndian(uint64_t value) { return htobe64(value); }

inline uint8_t BigEndianToHost(uint8_t value) { return value; }
inline uint16_t BigEndianToHost(uint16_t value) { return be16toh(value); }
inline uint32_t BigEndianToHost(uint32_t value) { return be32toh(value); }
inline uint64_t BigEndianToHost(uint64_t value) { return be64toh(value); }
#endif

inline int8_t HostToBigEndian(int8_t value) { return value; }
inline int16_t HostToBigEndian(int16_t value) { return MemcpyCast<int16_t>(HostToBigEndian(MemcpyCast<uint16_t>(value))); }
inline int32_t HostToBigEndian(int32_t value) { return MemcpyCast<int32_t>(HostToBigEndian(MemcpyCast<uint32_t>(value))); }
inline int64_t HostToBigEndian(int64_t value) { return MemcpyCast<int64_t>(HostToBigEndian(MemcpyCast<uint64_t>(value))); }

inline int8_t BigEndianToHost(int8_t value) { return value; }
inline int16_t BigEndianToHost(int16_t value) { return MemcpyCast<int16_t>(BigEndianToHost(MemcpyCast<uint16_t>(value))); }
inline int32_t BigEndianToHost(int32_t value) { return MemcpyCast<int32_t>(BigEndianToHost(MemcpyCast<uint32_t>(value))); }
inline int64_t BigEndianToHost(int64_t value) { return MemcpyCast<int64_t>(BigEndianToHost(MemcpyCast<uint64_t>(value))); }

}  // namespace wirepack::utils
