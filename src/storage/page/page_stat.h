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
#include "types/type_descriptor.h"
#include "util/slice.h"

namespace strata {

struct ValuesBlockInfo {
    uint8_t codec_id = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
};

// Layout of one page as read from its headers. Nothing is decompressed.
struct PageInfo {
    PageLayoutPB layout = PLAIN_PAGE;
    size_t page_size = 0;
    // nested pages only
    uint32_t offsets_len = 0;
    uint32_t rep_levels_len = 0;
    // nullable and nested pages
    uint32_t def_levels_len = 0;
    // slots of the level streams, the row count of a nullable page
    uint32_t num_levels = 0;
    std::vector<ValuesBlockInfo> blocks;

    size_t compressed_values_size() const;
    size_t uncompressed_values_size() const;

    std::string debug_string() const;
};

// Walk the headers of |page|. Fails like PageReader when a declared length does
// not fit, but accepts codec ids it cannot decode.
Status stat_page(const Slice& page, const TypeDescriptor& type, PageInfo* info);

} // namespace strata
