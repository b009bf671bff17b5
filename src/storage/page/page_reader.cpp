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

#include "storage/page/page_reader.h"

#include <fmt/format.h>

#include "column/column_helper.h"
#include "column/nullable_column.h"
#include "common/logging.h"
#include "storage/page/level_codec.h"
#include "storage/page/nested_shredder.h"
#include "storage/page/page_writer.h"
#include "storage/page/values_codec.h"
#include "util/coding.h"
#include "util/faststring.h"

namespace strata {

namespace {

Status read_block_length(Slice* input, const char* what, uint32_t* len) {
    if (!get_fixed32_le(input, len)) {
        return Status::TruncatedPage(fmt::format("page ends before the {} length", what));
    }
    return Status::OK();
}

Status take_block(Slice* input, uint32_t len, const char* what, Slice* block) {
    if (len > input->size) {
        return Status::TruncatedPage(fmt::format("{} declare {} bytes, {} left", what, len, input->size));
    }
    *block = Slice(input->data, len);
    input->remove_prefix(len);
    return Status::OK();
}

Status check_consumed(const Slice& input) {
    if (!input.empty()) {
        return Status::Corruption(fmt::format("{} trailing bytes after the last values block", input.size));
    }
    return Status::OK();
}

TypeDescriptor non_nullable(const TypeDescriptor& type) {
    TypeDescriptor res = type;
    if (res.type != TYPE_NULL) {
        res.nullable = false;
    }
    return res;
}

Status read_plain(Slice input, const TypeDescriptor& type, Column* dst, size_t* num_rows) {
    faststring scratch;
    Slice raw;
    RETURN_IF_ERROR(read_values_block(&input, &scratch, &raw));
    RETURN_IF_ERROR(check_consumed(input));
    return ValuesSerde::deserialize(raw, type.type, dst, num_rows);
}

Status read_nullable(Slice input, const TypeDescriptor& type, Column* dst, size_t* num_rows) {
    uint32_t def_len = 0;
    Slice def_block;
    RETURN_IF_ERROR(read_block_length(&input, "definition levels", &def_len));
    RETURN_IF_ERROR(take_block(&input, def_len, "definition levels", &def_block));

    NullData nulls;
    size_t num_present = 0;
    RETURN_IF_ERROR(ValidityDecoder::decode(def_block, &nulls, &num_present));

    faststring scratch;
    Slice raw;
    RETURN_IF_ERROR(read_values_block(&input, &scratch, &raw));
    RETURN_IF_ERROR(check_consumed(input));

    ColumnPtr dense = ColumnHelper::create_column(non_nullable(type));
    size_t num_values = 0;
    RETURN_IF_ERROR(ValuesSerde::deserialize(raw, type.type, dense.get(), &num_values));
    if (num_values != num_present) {
        return Status::Corruption(
                fmt::format("values block holds {} values, definition levels mark {} present", num_values,
                            num_present));
    }

    auto* nullable = static_cast<NullableColumn*>(dst);
    Column* data = nullable->mutable_data_column();
    size_t cursor = 0;
    size_t i = 0;
    const size_t n = nulls.size();
    while (i < n) {
        size_t j = i + 1;
        while (j < n && nulls[j] == nulls[i]) {
            ++j;
        }
        if (nulls[i]) {
            data->append_default(j - i);
        } else {
            data->append(*dense, cursor, j - i);
            cursor += j - i;
        }
        i = j;
    }
    auto& dst_nulls = nullable->null_column_data();
    dst_nulls.insert(dst_nulls.end(), nulls.begin(), nulls.end());
    nullable->set_has_null(num_present < n);
    *num_rows = n;
    return Status::OK();
}

Status read_nested(Slice input, const TypeDescriptor& type, Column* dst, size_t* num_rows) {
    uint32_t offsets_len = 0;
    uint32_t rep_len = 0;
    uint32_t def_len = 0;
    RETURN_IF_ERROR(read_block_length(&input, "offsets", &offsets_len));
    RETURN_IF_ERROR(read_block_length(&input, "repetition levels", &rep_len));
    RETURN_IF_ERROR(read_block_length(&input, "definition levels", &def_len));
    Slice rep_block;
    Slice def_block;
    RETURN_IF_ERROR(take_block(&input, rep_len, "repetition levels", &rep_block));
    RETURN_IF_ERROR(take_block(&input, def_len, "definition levels", &def_block));

    const NestedLevelInfo info = NestedLevelInfo::from_type(type);
    Levels rep_levels;
    Levels def_levels;
    RETURN_IF_ERROR(LevelDecoder::decode(rep_block, info.max_rep_level, &rep_levels));
    RETURN_IF_ERROR(LevelDecoder::decode(def_block, info.max_def_level, &def_levels));

    Columns leaves;
    leaves.reserve(info.leaves.size());
    faststring scratch;
    for (const TypeDescriptor* leaf_type : info.leaves) {
        Slice raw;
        RETURN_IF_ERROR(read_values_block(&input, &scratch, &raw));
        ColumnPtr leaf = ColumnHelper::create_column(non_nullable(*leaf_type));
        size_t num_values = 0;
        RETURN_IF_ERROR(ValuesSerde::deserialize(raw, leaf_type->type, leaf.get(), &num_values));
        leaves.emplace_back(std::move(leaf));
    }
    RETURN_IF_ERROR(check_consumed(input));

    NestedAssembler assembler(type, rep_levels, def_levels, leaves);
    return assembler.assemble(offsets_len, dst, num_rows);
}

} // namespace

StatusOr<PageData> PageReader::read(const Slice& page, const TypeDescriptor& type) {
    PageData data;
    data.column = ColumnHelper::create_column(type);
    RETURN_IF_ERROR(read(page, type, data.column.get(), &data.num_rows));
    return data;
}

Status PageReader::read(const Slice& page, const TypeDescriptor& type, Column* dst, size_t* num_rows) {
    RETURN_IF_ERROR(type.validate());
    RETURN_IF_ERROR(ColumnHelper::check_column_type(*dst, type, true));
    const PageLayoutPB layout = page_layout_of(type);
    *num_rows = 0;
    switch (layout) {
    case PLAIN_PAGE:
        return read_plain(page, type, dst, num_rows);
    case NULLABLE_PAGE:
        return read_nullable(page, type, dst, num_rows);
    case NESTED_PAGE:
        return read_nested(page, type, dst, num_rows);
    }
    return Status::InternalError(fmt::format("unknown page layout {}", layout));
}

} // namespace strata
