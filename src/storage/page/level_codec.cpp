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

#include "storage/page/level_codec.h"

#include <fmt/format.h>

#include <algorithm>
#include <limits>

#include "common/logging.h"
#include "util/bit_util.h"
#include "util/coding.h"
#include "util/rle_encoding.h"

namespace strata {

static constexpr size_t kLevelHeaderSize = sizeof(uint32_t) + sizeof(uint8_t);

size_t LevelEncoder::encode(const level_t* levels, size_t num_levels, int max_level, faststring* out) {
    DCHECK_LE(num_levels, std::numeric_limits<uint32_t>::max());
    const size_t start = out->size();
    const int bit_width = BitUtil::NumRequiredBits(max_level);
    put_fixed32_le(out, static_cast<uint32_t>(num_levels));
    put_fixed8(out, static_cast<uint8_t>(bit_width));

    RleEncoder<level_t> encoder(out, bit_width);
    size_t i = 0;
    while (i < num_levels) {
        DCHECK_LE(levels[i], max_level);
        size_t j = i + 1;
        while (j < num_levels && levels[j] == levels[i]) {
            ++j;
        }
        encoder.Put(levels[i], j - i);
        i = j;
    }
    encoder.Flush();
    return out->size() - start;
}

Status LevelDecoder::decode(const Slice& block, int max_level, Levels* levels) {
    levels->clear();
    if (block.size < kLevelHeaderSize) {
        return Status::Corruption(fmt::format("level block of {} bytes is shorter than its header", block.size));
    }
    const auto* data = reinterpret_cast<const uint8_t*>(block.data);
    const uint32_t num_levels = decode_fixed32_le(data);
    const int bit_width = decode_fixed8(data + sizeof(uint32_t));
    const int expected_width = BitUtil::NumRequiredBits(max_level);
    if (bit_width != expected_width) {
        return Status::Corruption(
                fmt::format("level block bit width {} does not match max level {}", bit_width, max_level));
    }
    if (num_levels == 0) {
        return Status::OK();
    }
    const size_t payload_size = block.size - kLevelHeaderSize;
    RleDecoder<level_t> decoder(data + kLevelHeaderSize, static_cast<int>(payload_size), bit_width);
    // grow in batches so a bogus count fails before it allocates
    static constexpr size_t kBatchSize = 4096;
    size_t read = 0;
    while (read < num_levels) {
        const size_t batch = std::min<size_t>(kBatchSize, num_levels - read);
        levels->resize(read + batch);
        const size_t n = decoder.GetBatch(levels->data() + read, batch);
        read += n;
        if (n != batch) {
            return Status::Corruption(fmt::format("level block declares {} levels, decoded {}", num_levels, read));
        }
    }
    for (size_t i = 0; i < num_levels; ++i) {
        if (UNLIKELY((*levels)[i] > max_level)) {
            return Status::Corruption(
                    fmt::format("level {} at slot {} exceeds the max level {}", (*levels)[i], i, max_level));
        }
    }
    return Status::OK();
}

size_t ValidityEncoder::encode(const uint8_t* nulls, size_t num_rows, faststring* out) {
    Levels levels(num_rows, 1);
    if (nulls != nullptr) {
        for (size_t i = 0; i < num_rows; ++i) {
            levels[i] = nulls[i] ? 0 : 1;
        }
    }
    return LevelEncoder::encode(levels, 1, out);
}

Status ValidityDecoder::decode(const Slice& block, NullData* nulls, size_t* num_present) {
    Levels levels;
    RETURN_IF_ERROR(LevelDecoder::decode(block, 1, &levels));
    nulls->resize(levels.size());
    size_t present = 0;
    for (size_t i = 0; i < levels.size(); ++i) {
        (*nulls)[i] = levels[i] == 0;
        present += levels[i];
    }
    *num_present = present;
    return Status::OK();
}

} // namespace strata
