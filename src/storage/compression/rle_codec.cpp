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

#include "storage/compression/rle_codec.h"

#include <fmt/format.h>

#include <limits>

#include "storage/compression/int_codec_util.h"
#include "util/coding.h"

namespace strata {

Status RlePageCodec::compress(const Slice& raw, int value_width, faststring* out) const {
    const int width = effective_value_width(raw.size, value_width);
    const size_t n = raw.size / width;
    const auto* data = reinterpret_cast<const uint8_t*>(raw.data);

    put_fixed8(out, static_cast<uint8_t>(width));
    size_t i = 0;
    while (i < n) {
        const uint64_t value = load_uint(data + i * width, width);
        size_t j = i + 1;
        while (j < n && j - i < std::numeric_limits<uint32_t>::max() && load_uint(data + j * width, width) == value) {
            ++j;
        }
        put_varint32(out, static_cast<uint32_t>(j - i));
        store_uint(out, value, width);
        i = j;
    }
    return Status::OK();
}

Status RlePageCodec::decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const {
    Slice in = encoded;
    uint8_t width = 0;
    if (!get_fixed8(&in, &width)) {
        return Status::Corruption("rle header is truncated");
    }
    if (width != 1 && width != 2 && width != 4 && width != 8) {
        return Status::Corruption(fmt::format("bad rle value width {}", width));
    }
    out->reserve(out->size() + uncompressed_size);
    size_t produced = 0;
    while (in.size > 0) {
        uint32_t run_length = 0;
        if (!get_varint32(&in, &run_length) || run_length == 0) {
            return Status::Corruption(fmt::format("bad rle run at decoded byte {}", produced));
        }
        if (in.size < width) {
            return Status::Corruption("rle run value is truncated");
        }
        if (produced + static_cast<size_t>(run_length) * width > uncompressed_size) {
            return Status::Corruption(
                    fmt::format("rle runs decode to more than the declared {} bytes", uncompressed_size));
        }
        const uint64_t value = load_uint(reinterpret_cast<const uint8_t*>(in.data), width);
        in.remove_prefix(width);
        for (uint32_t k = 0; k < run_length; ++k) {
            store_uint(out, value, width);
        }
        produced += static_cast<size_t>(run_length) * width;
    }
    return Status::OK();
}

} // namespace strata
