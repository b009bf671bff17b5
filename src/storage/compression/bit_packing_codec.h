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

#include "storage/compression/page_codec.h"

namespace strata {

// Frame of reference bit packing. Every value is stored as its distance to the
// page minimum, using the bit width of the largest distance.
//
// Format: width:u8 | bit_width:u8 | min:width bytes | packed distances
class BitPackingPageCodec final : public PageCodec {
public:
    static const BitPackingPageCodec* instance() {
        static BitPackingPageCodec s_instance;
        return &s_instance;
    }

    CodecTypePB type() const override { return CodecTypePB::BIT_PACKING; }

    Status compress(const Slice& raw, int value_width, faststring* out) const override;

    Status decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const override;
};

} // namespace strata
