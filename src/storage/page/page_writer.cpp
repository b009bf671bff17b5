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

#include "storage/page/page_writer.h"

#include <fmt/format.h>

#include <limits>
#include <numeric>

#include "column/column_helper.h"
#include "column/nullable_column.h"
#include "common/logging.h"
#include "storage/compression/page_codec.h"
#include "storage/page/level_codec.h"
#include "storage/page/nested_shredder.h"
#include "storage/page/values_codec.h"
#include "util/coding.h"

namespace strata {

PageLayoutPB page_layout_of(const TypeDescriptor& type) {
    if (type.is_complex_type()) {
        return NESTED_PAGE;
    }
    if (type.nullable && type.type != TYPE_NULL) {
        return NULLABLE_PAGE;
    }
    return PLAIN_PAGE;
}

namespace {

class PageBuilder {
public:
    PageBuilder(const TypeDescriptor& type, const PageWriterOptions& options, faststring* out, PageWriteInfo* info)
            : _type(type), _options(options), _out(out), _info(info) {}

    Status build(const Column& column, size_t from, size_t count) {
        _info->layout = page_layout_of(_type);
        _info->num_rows = count;
        _info->codecs.clear();
        switch (_info->layout) {
        case PLAIN_PAGE:
            return _build_plain(column, from, count);
        case NULLABLE_PAGE:
            return _build_nullable(column, from, count);
        case NESTED_PAGE:
            return _build_nested(column, from, count);
        }
        return Status::InternalError(fmt::format("unknown page layout {}", _info->layout));
    }

private:
    Status _build_plain(const Column& column, size_t from, size_t count) {
        std::vector<uint32_t> selection(count);
        std::iota(selection.begin(), selection.end(), static_cast<uint32_t>(from));
        return _append_values(_type, column, selection);
    }

    Status _build_nullable(const Column& column, size_t from, size_t count) {
        const uint8_t* nulls = nullptr;
        if (column.is_nullable() && column.has_null()) {
            nulls = static_cast<const NullableColumn&>(column).immutable_null_column_data().data() + from;
        }
        faststring levels;
        ValidityEncoder::encode(nulls, count, &levels);
        _put_u32(levels.size(), "definition levels");
        _out->append(levels.data(), levels.size());

        std::vector<uint32_t> selection;
        selection.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            if (nulls == nullptr || !nulls[i]) {
                selection.push_back(static_cast<uint32_t>(from + i));
            }
        }
        return _append_values(_type, *ColumnHelper::get_data_column(&column), selection);
    }

    Status _build_nested(const Column& column, size_t from, size_t count) {
        NestedShredder shredder(_type);
        ShreddedColumn shredded;
        RETURN_IF_ERROR(shredder.shred(column, from, count, &shredded));
        const auto& levels = shredder.level_info();

        faststring rep;
        faststring def;
        LevelEncoder::encode(shredded.rep_levels, levels.max_rep_level, &rep);
        LevelEncoder::encode(shredded.def_levels, levels.max_def_level, &def);
        if (shredded.num_offsets > std::numeric_limits<uint32_t>::max()) {
            return Status::NotSupported(fmt::format("{} offsets do not fit in a page", shredded.num_offsets));
        }
        put_fixed32_le(_out, static_cast<uint32_t>(shredded.num_offsets));
        _put_u32(rep.size(), "repetition levels");
        _put_u32(def.size(), "definition levels");
        _out->append(rep.data(), rep.size());
        _out->append(def.data(), def.size());

        VLOG_PAGE << fmt::format("nested page of {} rows, {} slots, {} offsets, max rep {} max def {}", count,
                                 shredded.rep_levels.size(), shredded.num_offsets, levels.max_rep_level,
                                 levels.max_def_level);
        for (const auto& leaf : shredded.leaves) {
            RETURN_IF_ERROR(_append_values(*leaf.type, *leaf.column, leaf.selection));
        }
        return Status::OK();
    }

    Status _append_values(const TypeDescriptor& type, const Column& column, const std::vector<uint32_t>& selection) {
        faststring raw;
        ValuesSerde::serialize(column, type.type, &selection, &raw);
        const PageSample sample = ValuesSerde::make_sample(type.type, Slice(raw));
        const CodecTypePB codec = _choose_codec(sample);
        CodecTypePB used;
        RETURN_IF_ERROR(append_values_block(codec, sample.raw, sample.value_width, _out, &used));
        VLOG_CODEC << fmt::format("values block of {} {} values, {} bytes, codec {}", selection.size(),
                                  logical_type_to_string(type.type), raw.size(), codec_type_to_string(used));
        _info->codecs.push_back(used);
        return Status::OK();
    }

    CodecTypePB _choose_codec(const PageSample& sample) {
        if (_options.codec.has_value()) {
            return *_options.codec;
        }
        if (_options.selector == nullptr) {
            if (_default_selector == nullptr) {
                _default_selector = create_compression_selector_from_config();
            }
            return _default_selector->select(sample);
        }
        return _options.selector->select(sample);
    }

    void _put_u32(size_t v, const char* what) {
        DCHECK_LE(v, std::numeric_limits<uint32_t>::max()) << what;
        put_fixed32_le(_out, static_cast<uint32_t>(v));
    }

    const TypeDescriptor& _type;
    const PageWriterOptions& _options;
    faststring* _out;
    PageWriteInfo* _info;
    CompressionSelectorPtr _default_selector;
};

} // namespace

Status PageWriter::write(const Column& column, const TypeDescriptor& type, const PageWriterOptions& options,
                         faststring* out, PageWriteInfo* info) {
    return write(column, 0, column.size(), type, options, out, info);
}

Status PageWriter::write(const Column& column, size_t from, size_t count, const TypeDescriptor& type,
                         const PageWriterOptions& options, faststring* out, PageWriteInfo* info) {
    RETURN_IF_ERROR(type.validate());
    RETURN_IF_ERROR(ColumnHelper::check_column_type(column, type));
    if (from + count > column.size()) {
        return Status::InvalidArgument(
                fmt::format("rows [{}, {}) out of a column of {} rows", from, from + count, column.size()));
    }
    if (count > std::numeric_limits<uint32_t>::max()) {
        return Status::InvalidArgument(fmt::format("{} rows do not fit in one page", count));
    }
    PageWriteInfo local;
    PageBuilder builder(type, options, out, info != nullptr ? info : &local);
    const size_t start = out->size();
    Status st = builder.build(column, from, count);
    if (!st.ok()) {
        out->resize(start);
        return st;
    }
    return Status::OK();
}

} // namespace strata
