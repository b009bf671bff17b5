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

#include "storage/compression/bit_packing_codec.h"

#include <fmt/format.h>

#include <algorithm>
#include <limits>

#include "storage/compression/int_codec_util.h"
#include "util/bit_stream_utils.inline.h"
#include "util/bit_util.h"
#include "util/coding.h"

namespace strata {

Status BitPackingPageCodec::compress(const Slice& raw, int value_width, faststring* out) const {
    const int width = effective_value_width(raw.size, value_width);
    const size_t n = raw.size / width;
    const auto* data = reinterpret_cast<const uint8_t*>(raw.data);

    uint64_t min_value = 0;
    uint64_t max_value = 0;
    if (n > 0) {
        min_value = max_value = load_uint(data, width);
        for (size_t i = 1; i < n; ++i) {
            uint64_t v = load_uint(data + i * width, width);
            min_value = std::min(min_value, v);
            max_value = std::max(max_value, v);
        }
    }
    const int bit_width = BitUtil::NumRequiredBits(max_value - min_value);

    put_fixed8(out, static_cast<uint8_t>(width));
    put_fixed8(out, static_cast<uint8_t>(bit_width));
    store_uint(out, min_value, width);
    if (bit_width > 0) {
        BitWriter writer(out);
        for (size_t i = 0; i < n; ++i) {
            writer.PutValue(load_uint(data + i * width, width) - min_value, bit_width);
        }
        writer.Flush();
    }
    return Status::OK();
}

Status BitPackingPageCodec::decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const {
    Slice in = encoded;
    uint8_t width = 0;
    uint8_t bit_width = 0;
    if (!get_fixed8(&in, &width) || !get_fixed8(&in, &bit_width)) {
        return Status::Corruption("bit packing header is truncated");
    }
    if (width != 1 && width != 2 && width != 4 && width != 8) {
        return Status::Corruption(fmt::format("bad bit packing value width {}", width));
    }
    if (bit_width > width * 8) {
        return Status::Corruption(fmt::format("bit width {} exceeds value width {}", bit_width, width));
    }
    if (uncompressed_size % width != 0) {
        return Status::Corruption(
                fmt::format("uncompressed size {} is not a multiple of value width {}", uncompressed_size, width));
    }
    if (in.size < width) {
        return Status::Corruption("bit packing frame of reference is truncated");
    }
    const uint64_t min_value = load_uint(reinterpret_cast<const uint8_t*>(in.data), width);
    in.remove_prefix(width);

    const size_t n = uncompressed_size / width;
    const int64_t expected = BitUtil::Ceil(static_cast<int64_t>(n) * bit_width, 8);
    if (static_cast<int64_t>(in.size) != expected) {
        return Status::Corruption(
                fmt::format("bit packing payload has {} bytes, expect {} for {} values", in.size, expected, n));
    }
    if (in.size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Status::Corruption("bit packing payload is too large");
    }

    out->reserve(out->size() + uncompressed_size);
    if (bit_width == 0) {
        for (size_t i = 0; i < n; ++i) {
            store_uint(out, min_value, width);
        }
        return Status::OK();
    }
    BitReader reader(reinterpret_cast<const uint8_t*>(in.data), static_cast<int>(in.size));
    for (size_t i = 0; i < n; ++i) {
        uint64_t delta = 0;
        if (!reader.GetValue(bit_width, &delta)) {
            return Status::Corruption(fmt::format("bit packing payload ends at value {} of {}", i, n));
        }
        store_uint(out, min_value + delta, width);
    }
    return Status::OK();
}

} // namespace strata
