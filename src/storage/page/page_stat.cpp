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

#include "storage/page/page_stat.h"

#include <fmt/format.h>

#include "storage/page/nested_shredder.h"
#include "storage/page/page_writer.h"
#include "storage/page/values_codec.h"
#include "util/coding.h"

namespace strata {

static Status skip_block(Slice* input, const char* what, uint32_t len, uint32_t* num_levels) {
    if (len > input->size) {
        return Status::TruncatedPage(fmt::format("{} declare {} bytes, {} left", what, len, input->size));
    }
    if (num_levels != nullptr) {
        Slice header(input->data, len);
        if (!get_fixed32_le(&header, num_levels)) {
            return Status::Corruption(fmt::format("{} block of {} bytes has no level count", what, len));
        }
    }
    input->remove_prefix(len);
    return Status::OK();
}

static Status get_length(Slice* input, const char* what, uint32_t* len) {
    if (!get_fixed32_le(input, len)) {
        return Status::TruncatedPage(fmt::format("page ends before the {} length", what));
    }
    return Status::OK();
}

Status stat_page(const Slice& page, const TypeDescriptor& type, PageInfo* info) {
    *info = PageInfo();
    info->layout = page_layout_of(type);
    info->page_size = page.size;
    Slice input = page;
    size_t num_blocks = 1;
    switch (info->layout) {
    case PLAIN_PAGE:
        break;
    case NULLABLE_PAGE:
        RETURN_IF_ERROR(get_length(&input, "definition levels", &info->def_levels_len));
        RETURN_IF_ERROR(skip_block(&input, "definition levels", info->def_levels_len, &info->num_levels));
        break;
    case NESTED_PAGE:
        RETURN_IF_ERROR(get_length(&input, "offsets", &info->offsets_len));
        RETURN_IF_ERROR(get_length(&input, "repetition levels", &info->rep_levels_len));
        RETURN_IF_ERROR(get_length(&input, "definition levels", &info->def_levels_len));
        RETURN_IF_ERROR(skip_block(&input, "repetition levels", info->rep_levels_len, &info->num_levels));
        RETURN_IF_ERROR(skip_block(&input, "definition levels", info->def_levels_len, nullptr));
        num_blocks = NestedLevelInfo::from_type(type).leaves.size();
        break;
    }
    for (size_t i = 0; i < num_blocks; ++i) {
        ValuesBlockHeader header;
        RETURN_IF_ERROR(parse_values_block_header(input, &header));
        info->blocks.push_back({header.codec_id, header.compressed_size, header.uncompressed_size});
        input.remove_prefix(ValuesBlockHeader::kSize + header.compressed_size);
    }
    if (!input.empty()) {
        return Status::Corruption(fmt::format("{} trailing bytes after the last values block", input.size));
    }
    return Status::OK();
}

size_t PageInfo::compressed_values_size() const {
    size_t n = 0;
    for (const auto& block : blocks) {
        n += block.compressed_size;
    }
    return n;
}

size_t PageInfo::uncompressed_values_size() const {
    size_t n = 0;
    for (const auto& block : blocks) {
        n += block.uncompressed_size;
    }
    return n;
}

std::string PageInfo::debug_string() const {
    std::string res = fmt::format("{} page of {} bytes", PageLayoutPB_Name(layout), page_size);
    if (layout != PLAIN_PAGE) {
        res += fmt::format(", {} levels, def {} bytes", num_levels, def_levels_len);
    }
    if (layout == NESTED_PAGE) {
        res += fmt::format(", rep {} bytes, {} offsets", rep_levels_len, offsets_len);
    }
    for (const auto& block : blocks) {
        const auto codec = static_cast<CodecTypePB>(block.codec_id);
        res += fmt::format(", [{} {}/{}]",
                           CodecTypePB_IsValid(block.codec_id) ? CodecTypePB_Name(codec) : std::to_string(block.codec_id),
                           block.compressed_size, block.uncompressed_size);
    }
    return res;
}

} // namespace strata
