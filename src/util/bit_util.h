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
//   https://github.com/apache/incubator-doris/blob/master/be/src/util/bit_util.h

// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#include <cstdint>

namespace strata {

// Utility class to do standard bit tricks
class BitUtil {
public:
    // Returns the ceil of value/divisor
    static inline constexpr int64_t Ceil(int64_t value, int64_t divisor) {
        return value / divisor + (value % divisor != 0);
    }

    // Returns 'value' rounded up to the nearest multiple of 'factor'
    static inline int64_t RoundUp(int64_t value, int64_t factor) { return (value + (factor - 1)) / factor * factor; }

    // Returns the 'num_bits' least-significant bits of 'v'.
    static inline uint64_t TrailingBits(uint64_t v, int num_bits) {
        if (__builtin_expect(num_bits == 0, 0)) return 0;
        if (__builtin_expect(num_bits >= 64, 0)) return v;
        int n = 64 - num_bits;
        return (v << n) >> n;
    }

    static inline uint64_t ShiftLeftZeroOnOverflow(uint64_t v, int num_bits) {
        if (__builtin_expect(num_bits >= 64, 0)) return 0;
        return v << num_bits;
    }

    static inline uint64_t ShiftRightZeroOnOverflow(uint64_t v, int num_bits) {
        if (__builtin_expect(num_bits >= 64, 0)) return 0;
        return v >> num_bits;
    }

    // Returns the number of bits needed to represent 'max_value', 0 for 0.
    static inline int NumRequiredBits(uint64_t max_value) {
        if (max_value == 0) return 0;
        return 64 - __builtin_clzll(max_value);
    }

    // Returns the number of bytes needed to hold 'num_bits' bits.
    static inline int BytesForBits(int num_bits) { return static_cast<int>(Ceil(num_bits, 8)); }
};

} // namespace strata
