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

#pragma once

#include <cstdint>
#include <vector>

#include "column/vectorized_fwd.h"
#include "common/status.h"
#include "util/faststring.h"
#include "util/slice.h"

namespace strata {

using level_t = uint16_t;
using Levels = Buffer<level_t>;

// A level block stores a sequence of repetition or definition levels:
//
//   num_levels:u32 | bit_width:u8 | RLE/bit-packed hybrid payload
//
// bit_width is the number of bits needed for the largest level the type allows,
// so a block of a flat nullable column uses one bit per level.
class LevelEncoder {
public:
    // Append the level block of |levels| to |out| and return its length in bytes.
    static size_t encode(const level_t* levels, size_t num_levels, int max_level, faststring* out);

    static size_t encode(const Levels& levels, int max_level, faststring* out) {
        return encode(levels.data(), levels.size(), max_level, out);
    }
};

class LevelDecoder {
public:
    // Decode a whole level block. Returns Corruption if the block is malformed,
    // was written for another max level, or holds a level above |max_level|.
    static Status decode(const Slice& block, int max_level, Levels* levels);
};

// Validity of a flat column as definition levels: 1 for a present row and 0 for
// a null one.
class ValidityEncoder {
public:
    // |nulls| uses one byte per row, non zero is null. nullptr means no nulls.
    static size_t encode(const uint8_t* nulls, size_t num_rows, faststring* out);
};

class ValidityDecoder {
public:
    // Rebuild the null flags of |block| into |nulls| (1 = null) and count the
    // present rows, which is the number of values the values block must hold.
    static Status decode(const Slice& block, NullData* nulls, size_t* num_present);
};

} // namespace strata
