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

#include <string>
#include <vector>

#include "common/status.h"
#include "gen_cpp/column_meta.pb.h"
#include "util/faststring.h"
#include "util/slice.h"

namespace strata {

// PageCodec compresses the values sub-block of a page. Implementations are
// stateless singletons and may be used from many threads at once.
class PageCodec {
public:
    virtual ~PageCodec() = default;

    virtual CodecTypePB type() const = 0;

    // Append the encoded form of |raw| to |out|.
    // |value_width| is the byte width of one value (1, 2, 4 or 8) for codecs that
    // work on integers. Callers pass 1 when the bytes are not a sequence of
    // fixed-width values.
    virtual Status compress(const Slice& raw, int value_width, faststring* out) const = 0;

    // Append the decoded bytes of |encoded| to |out|. |uncompressed_size| is the
    // declared size of the result; a codec must not produce more than that.
    virtual Status decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const = 0;
};

// Get a PageCodec through type. Return Status::UnsupportedCodec for ids this
// build does not know. Client doesn't have to release the codec.
Status get_page_codec(CodecTypePB type, const PageCodec** codec);

// Same as above for an id read from a page.
Status get_page_codec(uint8_t codec_id, const PageCodec** codec);

// Compress |raw| with |type| into |out|, which is cleared first.
Status compress_page_values(CodecTypePB type, const Slice& raw, int value_width, faststring* out);

// Decompress |encoded| into |out|, which is cleared first. Fails with Corruption
// when the result is not exactly |uncompressed_size| bytes.
Status decompress_page_values(uint8_t codec_id, const Slice& encoded, size_t uncompressed_size, faststring* out);

// |value_width| if |size| is a multiple of it, otherwise 1.
int effective_value_width(size_t size, int value_width);

// All codecs in id order.
const std::vector<CodecTypePB>& all_codec_types();

std::string codec_type_to_string(CodecTypePB type);

// Parse a codec name such as "LZ4" or "lz4".
Status parse_codec_type(const std::string& name, CodecTypePB* type);

} // namespace strata
