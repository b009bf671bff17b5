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

// Dictionary encoding of fixed-width values. Distinct values are kept in the order
// they first appear and every value is replaced by its bit-packed index.
//
// Format: width:u8 | num_distinct:u32 | distinct values | bit_width:u8 | packed indices
class DictPageCodec final : public PageCodec {
public:
    static const DictPageCodec* instance() {
        static DictPageCodec s_instance;
        return &s_instance;
    }

    CodecTypePB type() const override { return CodecTypePB::DICT; }

    Status compress(const Slice& raw, int value_width, faststring* out) const override;

    Status decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const override;
};

} // namespace strata
