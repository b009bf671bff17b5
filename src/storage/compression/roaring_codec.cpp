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

#include "storage/compression/roaring_codec.h"

#include <fmt/format.h>

#include <cstring>
#include <exception>
#include <limits>
#include <roaring/roaring.hh>

#include "util/coding.h"

namespace strata {

Status RoaringPageCodec::compress(const Slice& raw, int value_width, faststring* out) const {
    if (raw.size > std::numeric_limits<uint32_t>::max() / 8) {
        return Status::InvalidArgument(fmt::format("roaring codec cannot address {} bytes", raw.size));
    }
    roaring::Roaring bitmap;
    const auto* data = reinterpret_cast<const uint8_t*>(raw.data);
    for (size_t j = 0; j < raw.size; ++j) {
        uint32_t bits = data[j];
        while (bits != 0) {
            bitmap.add(static_cast<uint32_t>(j * 8 + __builtin_ctz(bits)));
            bits &= bits - 1;
        }
    }
    bitmap.runOptimize();

    put_fixed32_le(out, static_cast<uint32_t>(raw.size));
    const size_t serialized_size = bitmap.getSizeInBytes(/* portable */ true);
    const size_t old_size = out->size();
    out->resize(old_size + serialized_size);
    bitmap.write(reinterpret_cast<char*>(out->data() + old_size), /* portable */ true);
    return Status::OK();
}

Status RoaringPageCodec::decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const {
    Slice in = encoded;
    uint32_t num_bytes = 0;
    if (!get_fixed32_le(&in, &num_bytes)) {
        return Status::Corruption("roaring header is truncated");
    }
    if (num_bytes != uncompressed_size) {
        return Status::Corruption(
                fmt::format("roaring block covers {} bytes, expect {}", num_bytes, uncompressed_size));
    }
    roaring::Roaring bitmap;
    try {
        bitmap = roaring::Roaring::readSafe(in.data, in.size);
    } catch (const std::exception& e) {
        return Status::Corruption(fmt::format("bad roaring bitmap: {}", e.what()));
    }
    if (bitmap.getSizeInBytes(/* portable */ true) != in.size) {
        return Status::Corruption("trailing bytes after roaring bitmap");
    }
    if (!bitmap.isEmpty() && bitmap.maximum() >= static_cast<uint64_t>(num_bytes) * 8) {
        return Status::Corruption(fmt::format("roaring bit {} is out of {} bytes", bitmap.maximum(), num_bytes));
    }

    const size_t old_size = out->size();
    out->resize(old_size + num_bytes);
    uint8_t* dst = out->data() + old_size;
    memset(dst, 0, num_bytes);
    for (uint32_t pos : bitmap) {
        dst[pos / 8] |= static_cast<uint8_t>(1U << (pos % 8));
    }
    return Status::OK();
}

} // namespace strata
