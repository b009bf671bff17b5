// Copyright 2021-present StarRocks, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// This file is based on code available under the Apache license here:
//   https://github.com/apache/incubator-doris/blob/master/be/src/util/coding.h

// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#pragma once

#include <cstdint>
#include <cstring>

#include "util/faststring.h"
#include "util/slice.h"

namespace strata {

// All fixed width integers of the page format are little-endian. The
// supported platforms are little-endian, so these are plain copies.
static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__, "big-endian hosts are not supported");

inline void encode_fixed8(uint8_t* buf, uint8_t val) {
    *buf = val;
}

inline void encode_fixed32_le(uint8_t* buf, uint32_t val) {
    memcpy(buf, &val, sizeof(val));
}

inline void encode_fixed64_le(uint8_t* buf, uint64_t val) {
    memcpy(buf, &val, sizeof(val));
}

inline uint8_t decode_fixed8(const uint8_t* buf) {
    return *buf;
}

inline uint32_t decode_fixed32_le(const uint8_t* buf) {
    uint32_t res;
    memcpy(&res, buf, sizeof(res));
    return res;
}

inline uint64_t decode_fixed64_le(const uint8_t* buf) {
    uint64_t res;
    memcpy(&res, buf, sizeof(res));
    return res;
}

inline void put_fixed8(faststring* dst, uint8_t val) {
    dst->push_back(static_cast<char>(val));
}

inline void put_fixed32_le(faststring* dst, uint32_t val) {
    uint8_t buf[sizeof(val)];
    encode_fixed32_le(buf, val);
    dst->append(buf, sizeof(buf));
}

inline void put_fixed64_le(faststring* dst, uint64_t val) {
    uint8_t buf[sizeof(val)];
    encode_fixed64_le(buf, val);
    dst->append(buf, sizeof(buf));
}

extern uint8_t* encode_varint32(uint8_t* dst, uint32_t value);

extern const uint8_t* decode_varint32_ptr(const uint8_t* p, const uint8_t* limit, uint32_t* value);

inline void put_varint32(faststring* dst, uint32_t value) {
    uint8_t buf[5];
    uint8_t* ptr = encode_varint32(buf, value);
    dst->append(buf, static_cast<size_t>(ptr - buf));
}

// Read a fixed width little-endian integer from the front of `input` and
// advance it. Return false if there are not enough bytes.
inline bool get_fixed8(Slice* input, uint8_t* value) {
    if (input->size < sizeof(uint8_t)) {
        return false;
    }
    *value = decode_fixed8((const uint8_t*)input->data);
    input->remove_prefix(sizeof(uint8_t));
    return true;
}

inline bool get_fixed32_le(Slice* input, uint32_t* value) {
    if (input->size < sizeof(uint32_t)) {
        return false;
    }
    *value = decode_fixed32_le((const uint8_t*)input->data);
    input->remove_prefix(sizeof(uint32_t));
    return true;
}

inline bool get_fixed64_le(Slice* input, uint64_t* value) {
    if (input->size < sizeof(uint64_t)) {
        return false;
    }
    *value = decode_fixed64_le((const uint8_t*)input->data);
    input->remove_prefix(sizeof(uint64_t));
    return true;
}

inline bool get_varint32(Slice* input, uint32_t* value) {
    const auto* p = (const uint8_t*)input->data;
    const uint8_t* limit = p + input->size;
    const uint8_t* q = decode_varint32_ptr(p, limit, value);
    if (q == nullptr) {
        return false;
    }
    input->remove_prefix(q - p);
    return true;
}

} // namespace strata
