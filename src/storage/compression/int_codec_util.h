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
#include <cstring>

#include "util/faststring.h"

namespace strata {

// Helpers shared by the codecs that treat a page as a sequence of unsigned
// little-endian integers of 1, 2, 4 or 8 bytes.

inline uint64_t load_uint(const uint8_t* p, int width) {
    uint64_t v = 0;
    memcpy(&v, p, width);
    return v;
}

inline void store_uint(faststring* dst, uint64_t v, int width) {
    dst->append(&v, width);
}

inline uint64_t max_uint_of_width(int width) {
    return width >= 8 ? ~0ULL : (1ULL << (width * 8)) - 1;
}

} // namespace strata
