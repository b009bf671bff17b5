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

#include "storage/column_reader.h"

#include <fmt/format.h>

#include <utility>

#include "column/column_helper.h"
#include "common/logging.h"
#include "util/coding.h"

namespace strata {

ColumnReader::ColumnReader(TypeDescriptor type, Slice data, size_t rows_per_page, std::string column_name)
        : _type(std::move(type)), _data(data), _rows_per_page(rows_per_page), _column_name(std::move(column_name)) {}

Status ColumnReader::_with_context(const Status& st, uint64_t page_offset) const {
    return st.clone_and_append(
            fmt::format("column {} page {} at byte {}", _column_name, _page_index, page_offset));
}

Status ColumnReader::seek(uint64_t offset) {
    if (offset > _data.size) {
        return Status::InvalidArgument(fmt::format("seek to {} past the end of {} bytes", offset, _data.size));
    }
    _position = offset;
    return Status::OK();
}

Status ColumnReader::next_raw_page(Slice* page) {
    if (_position == _data.size) {
        return Status::EndOfFile(fmt::format("column {} has no page after {}", _column_name, _page_index));
    }
    const uint64_t remaining = _data.size - _position;
    if (remaining < kPagePrefixSize) {
        return _with_context(
                Status::TruncatedPage(fmt::format("{} bytes left, page length prefix needs 4", remaining)),
                _position);
    }
    const uint32_t page_len = decode_fixed32_le(reinterpret_cast<const uint8_t*>(_data.data + _position));
    if (page_len > remaining - kPagePrefixSize) {
        return _with_context(Status::TruncatedPage(fmt::format("page declares {} bytes, {} left", page_len,
                                                               remaining - kPagePrefixSize)),
                             _position);
    }
    *page = Slice(_data.data + _position + kPagePrefixSize, page_len);
    return Status::OK();
}

Status ColumnReader::_read_page(uint64_t page_offset, const Slice& page, bool last_page, Column* dst,
                                size_t* num_rows) {
    if (_rows_per_page == 0) {
        return Status::InvalidArgument("rows_per_page must be positive");
    }
    auto page_data = PageReader::read(page, _type);
    if (!page_data.ok()) {
        return _with_context(page_data.status(), page_offset);
    }
    const size_t rows = page_data->num_rows;
    if (rows > _rows_per_page || (!last_page && rows != _rows_per_page)) {
        return _with_context(Status::RowCountMismatch(fmt::format("{} page holds {} rows, rows_per_page is {}",
                                                                  last_page ? "last" : "inner", rows,
                                                                  _rows_per_page)),
                             page_offset);
    }
    dst->append(*page_data->column);
    *num_rows = page_data->num_rows;
    _position = page_offset + kPagePrefixSize + page.size;
    ++_page_index;
    return Status::OK();
}

Status ColumnReader::next_page(PageData* page) {
    Slice raw;
    RETURN_IF_ERROR(next_raw_page(&raw));
    const uint64_t page_offset = _position;
    page->column = ColumnHelper::create_column(_type);
    return _read_page(page_offset, raw, _is_last_page(page_offset, raw), page->column.get(), &page->num_rows);
}

Status ColumnReader::read_column(size_t expected_rows, Column* dst) {
    size_t total_rows = 0;
    while (true) {
        Slice raw;
        Status st = next_raw_page(&raw);
        if (st.is_end_of_file()) {
            break;
        }
        RETURN_IF_ERROR(st);
        size_t rows = 0;
        RETURN_IF_ERROR(_read_page(_position, raw, _is_last_page(_position, raw), dst, &rows));
        total_rows += rows;
    }
    if (total_rows != expected_rows) {
        return Status::RowCountMismatch(fmt::format("column {} pages hold {} rows, expected {}", _column_name,
                                                    total_rows, expected_rows));
    }
    return Status::OK();
}

StatusOr<ColumnPtr> ColumnReader::read_column(size_t expected_rows) {
    ColumnPtr column = ColumnHelper::create_column(_type);
    RETURN_IF_ERROR(read_column(expected_rows, column.get()));
    return column;
}

Status ColumnReader::read_pages(const ColumnMeta& meta, Column* dst) {
    if (meta.pb().has_rows_per_page() && meta.pb().rows_per_page() != _rows_per_page) {
        return Status::InvalidArgument(fmt::format("column {} was written with {} rows per page, reader expects {}",
                                                   _column_name, meta.pb().rows_per_page(), _rows_per_page));
    }
    RETURN_IF_ERROR(seek(meta.offset()));
    size_t total_rows = 0;
    for (size_t i = 0; i < meta.num_pages(); ++i) {
        const PageMetaPB& page_meta = meta.page(i);
        Slice raw;
        Status st = next_raw_page(&raw);
        if (st.is_end_of_file()) {
            return _with_context(
                    Status::TruncatedPage(fmt::format("data ends before page {} of {}", i, meta.num_pages())),
                    _position);
        }
        RETURN_IF_ERROR(st);
        if (raw.size != page_meta.length()) {
            return _with_context(Status::Corruption(fmt::format("page is {} bytes, column meta says {}", raw.size,
                                                                page_meta.length())),
                                 _position);
        }
        const uint64_t page_offset = _position;
        size_t rows = 0;
        RETURN_IF_ERROR(_read_page(page_offset, raw, i + 1 == meta.num_pages(), dst, &rows));
        if (rows != page_meta.num_values()) {
            --_page_index;
            return _with_context(Status::RowCountMismatch(fmt::format("page holds {} rows, column meta says {}",
                                                                      rows, page_meta.num_values())),
                                 page_offset);
        }
        total_rows += rows;
    }
    if (meta.pb().has_num_rows() && total_rows != meta.pb().num_rows()) {
        return Status::RowCountMismatch(fmt::format("column {} pages hold {} rows, column meta says {}",
                                                    _column_name, total_rows, meta.pb().num_rows()));
    }
    return Status::OK();
}

StatusOr<ColumnPtr> ColumnReader::read_pages(const ColumnMeta& meta) {
    ColumnPtr column = ColumnHelper::create_column(_type);
    RETURN_IF_ERROR(read_pages(meta, column.get()));
    return column;
}

Status ColumnReader::stat_pages(std::vector<PageInfo>* infos) {
    while (true) {
        Slice raw;
        Status st = next_raw_page(&raw);
        if (st.is_end_of_file()) {
            return Status::OK();
        }
        RETURN_IF_ERROR(st);
        PageInfo info;
        st = stat_page(raw, _type, &info);
        if (!st.ok()) {
            return _with_context(st, _position);
        }
        infos->push_back(std::move(info));
        _position += kPagePrefixSize + raw.size;
        ++_page_index;
    }
}

} // namespace strata
