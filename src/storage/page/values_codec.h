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
#include "gen_cpp/column_meta.pb.h"
#include "storage/compression/compression_selector.h"
#include "types/logical_type.h"
#include "util/faststring.h"
#include "util/slice.h"

namespace strata {

// The uncompressed values sub-block of one leaf holds only the present values:
//
//  - fixed width numbers: the values, little endian
//  - boolean: num_values:u32 | bitmap, least significant bit first
//  - binary: num_values:u32 | (num_values + 1) offsets | bytes, offsets are u32
//    or u64 for the large variants and start at 0
//  - null: num_values:u32
class ValuesSerde {
public:
    // Append the values of |column| selected by |selection| to |out|. A null
    // |selection| takes every row. |column| must be a non nullable column of |type|.
    static void serialize(const Column& column, LogicalType type, const std::vector<uint32_t>* selection,
                          faststring* out);

    // Append every value of |raw| to |dst| and return the number appended in
    // |num_values|. Fails with Corruption if |raw| is not a well formed block.
    static Status deserialize(const Slice& raw, LogicalType type, Column* dst, size_t* num_values);

    // What the codec selector gets to know about a block of |type|.
    static PageSample make_sample(LogicalType type, const Slice& raw);
};

// A values block frames one compressed values sub-block:
//
//   codec_type:u8 | compressed_size:u32 | uncompressed_size:u32 | values
struct ValuesBlockHeader {
    uint8_t codec_id = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;

    static constexpr size_t kSize = sizeof(uint8_t) + 2 * sizeof(uint32_t);
};

// Compress |raw| with |codec| and append the framed block to |out|. The block
// is stored uncompressed when |codec| does not make it smaller. The codec that
// was actually used is returned in |used|.
Status append_values_block(CodecTypePB codec, const Slice& raw, int value_width, faststring* out, CodecTypePB* used);

// Parse the header of the values block at the front of |input|. Returns
// TruncatedPage if the header or the declared payload does not fit in |input|.
Status parse_values_block_header(const Slice& input, ValuesBlockHeader* header);

// Consume the values block at the front of |input| and return its uncompressed
// bytes in |raw|. |raw| points into |input| for uncompressed blocks and into
// |scratch| otherwise.
Status read_values_block(Slice* input, faststring* scratch, Slice* raw, ValuesBlockHeader* header = nullptr);

} // namespace strata
