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

#include "storage/compression/dict_codec.h"

#include <fmt/format.h>

#include <limits>
#include <unordered_map>
#include <vector>

#include "storage/compression/int_codec_util.h"
#include "util/bit_stream_utils.inline.h"
#include "util/bit_util.h"
#include "util/coding.h"

namespace strata {

Status DictPageCodec::compress(const Slice& raw, int value_width, faststring* out) const {
    const int width = effective_value_width(raw.size, value_width);
    const size_t n = raw.size / width;
    const auto* data = reinterpret_cast<const uint8_t*>(raw.data);

    std::unordered_map<uint64_t, uint32_t> index;
    std::vector<uint64_t> dict;
    std::vector<uint32_t> codes(n);
    for (size_t i = 0; i < n; ++i) {
        const uint64_t v = load_uint(data + i * width, width);
        auto [it, inserted] = index.emplace(v, static_cast<uint32_t>(dict.size()));
        if (inserted) {
            dict.push_back(v);
        }
        codes[i] = it->second;
    }
    const int bit_width = dict.empty() ? 0 : BitUtil::NumRequiredBits(dict.size() - 1);

    put_fixed8(out, static_cast<uint8_t>(width));
    put_fixed32_le(out, static_cast<uint32_t>(dict.size()));
    for (uint64_t v : dict) {
        store_uint(out, v, width);
    }
    put_fixed8(out, static_cast<uint8_t>(bit_width));
    if (bit_width > 0) {
        BitWriter writer(out);
        for (uint32_t code : codes) {
            writer.PutValue(code, bit_width);
        }
        writer.Flush();
    }
    return Status::OK();
}

Status DictPageCodec::decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const {
    Slice in = encoded;
    uint8_t width = 0;
    uint32_t num_distinct = 0;
    if (!get_fixed8(&in, &width) || !get_fixed32_le(&in, &num_distinct)) {
        return Status::Corruption("dict header is truncated");
    }
    if (width != 1 && width != 2 && width != 4 && width != 8) {
        return Status::Corruption(fmt::format("bad dict value width {}", width));
    }
    if (uncompressed_size % width != 0) {
        return Status::Corruption(
                fmt::format("uncompressed size {} is not a multiple of value width {}", uncompressed_size, width));
    }
    const size_t n = uncompressed_size / width;
    if (n > 0 && num_distinct == 0) {
        return Status::Corruption("dict is empty but the page has values");
    }
    if (in.size < static_cast<size_t>(num_distinct) * width) {
        return Status::Corruption(fmt::format("dict of {} values is truncated", num_distinct));
    }
    std::vector<uint64_t> dict(num_distinct);
    for (uint32_t i = 0; i < num_distinct; ++i) {
        dict[i] = load_uint(reinterpret_cast<const uint8_t*>(in.data), width);
        in.remove_prefix(width);
    }
    uint8_t bit_width = 0;
    if (!get_fixed8(&in, &bit_width) || bit_width > 32) {
        return Status::Corruption("bad dict index bit width");
    }
    const int64_t expected = BitUtil::Ceil(static_cast<int64_t>(n) * bit_width, 8);
    if (static_cast<int64_t>(in.size) != expected) {
        return Status::Corruption(
                fmt::format("dict indices have {} bytes, expect {} for {} values", in.size, expected, n));
    }
    if (in.size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Status::Corruption("dict indices are too large");
    }

    out->reserve(out->size() + uncompressed_size);
    BitReader reader(reinterpret_cast<const uint8_t*>(in.data), static_cast<int>(in.size));
    for (size_t i = 0; i < n; ++i) {
        uint32_t code = 0;
        if (bit_width > 0 && !reader.GetValue(bit_width, &code)) {
            return Status::Corruption(fmt::format("dict indices end at value {} of {}", i, n));
        }
        if (code >= num_distinct) {
            return Status::Corruption(fmt::format("dict index {} out of range {}", code, num_distinct));
        }
        store_uint(out, dict[code], width);
    }
    return Status::OK();
}

} // namespace strata
