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
//   https://github.com/apache/incubator-doris/blob/master/be/src/util/coding.cpp

// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "util/coding.h"

namespace strata {

uint8_t* encode_varint32(uint8_t* dst, uint32_t v) {
    // Operate on characters as unsigneds
    static const int B = 128;
    if (v < (1 << 7)) {
        *(dst++) = v;
    } else if (v < (1 << 14)) {
        *(dst++) = v | B;
        *(dst++) = v >> 7;
    } else if (v < (1 << 21)) {
        *(dst++) = v | B;
        *(dst++) = (v >> 7) | B;
        *(dst++) = v >> 14;
    } else if (v < (1 << 28)) {
        *(dst++) = v | B;
        *(dst++) = (v >> 7) | B;
        *(dst++) = (v >> 14) | B;
        *(dst++) = v >> 21;
    } else {
        *(dst++) = v | B;
        *(dst++) = (v >> 7) | B;
        *(dst++) = (v >> 14) | B;
        *(dst++) = (v >> 21) | B;
        *(dst++) = v >> 28;
    }
    return dst;
}

const uint8_t* decode_varint32_ptr(const uint8_t* p, const uint8_t* limit, uint32_t* value) {
    uint32_t result = 0;
    for (uint32_t shift = 0; shift <= 28 && p < limit; shift += 7) {
        uint32_t byte = *p;
        p++;
        if (byte & 128) {
            // More bytes are present
            result |= ((byte & 127) << shift);
        } else {
            result |= (byte << shift);
            *value = result;
            return p;
        }
    }
    return nullptr;
}

} // namespace strata
