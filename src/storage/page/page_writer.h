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

#include <optional>
#include <vector>

#include "column/vectorized_fwd.h"
#include "common/status.h"
#include "gen_cpp/column_meta.pb.h"
#include "storage/compression/compression_selector.h"
#include "types/type_descriptor.h"
#include "util/faststring.h"

namespace strata {

// Page layout of a column type. The layout is never stored in the page, reader
// and writer derive it from the type.
PageLayoutPB page_layout_of(const TypeDescriptor& type);

struct PageWriterOptions {
    // Use this codec for every values block instead of asking the selector.
    std::optional<CodecTypePB> codec;
    // Picks the codec of each values block when |codec| is not set. The one
    // built from config is used when this is null.
    CompressionSelectorPtr selector;
};

// What went into one page.
struct PageWriteInfo {
    PageLayoutPB layout = PLAIN_PAGE;
    size_t num_rows = 0;
    // codec actually used by each values block, in page order
    std::vector<CodecTypePB> codecs;
};

// PageWriter encodes a run of top level rows into one page:
//
//   Plain:    values_block
//   Nullable: def_levels_len:u32 | def_levels | values_block
//   Nested:   offsets_len:u32 | rep_levels_len:u32 | def_levels_len:u32 | rep_levels | def_levels
//             | one values_block per leaf, depth first
//
// See values_codec.h for the values block and level_codec.h for level blocks.
class PageWriter {
public:
    // Append the page holding every row of |column| to |out|.
    static Status write(const Column& column, const TypeDescriptor& type, const PageWriterOptions& options,
                        faststring* out, PageWriteInfo* info = nullptr);

    // Append the page holding rows [from, from + count) of |column| to |out|.
    static Status write(const Column& column, size_t from, size_t count, const TypeDescriptor& type,
                        const PageWriterOptions& options, faststring* out, PageWriteInfo* info = nullptr);
};

} // namespace strata
