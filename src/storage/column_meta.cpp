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

#include "storage/column_meta.h"

#include <fmt/format.h>

namespace strata {

StatusOr<ColumnMeta> ColumnMeta::slice(size_t start, size_t end) const {
    if (start > end || end > num_pages()) {
        return Status::InvalidArgument(
                fmt::format("page range [{}, {}) out of a column of {} pages", start, end, num_pages()));
    }
    ColumnMetaPB res;
    uint64_t offset = _meta_pb.offset();
    for (size_t i = 0; i < start; ++i) {
        offset += kPagePrefixSize + page(i).length();
    }
    res.set_offset(offset);
    if (_meta_pb.has_column_name()) {
        res.set_column_name(_meta_pb.column_name());
    }
    if (_meta_pb.has_rows_per_page()) {
        res.set_rows_per_page(_meta_pb.rows_per_page());
    }
    uint64_t rows = 0;
    for (size_t i = start; i < end; ++i) {
        *res.add_pages() = page(i);
        rows += page(i).num_values();
    }
    res.set_num_rows(rows);
    return ColumnMeta(std::move(res));
}

Status ColumnMeta::skip_one_page() {
    if (_meta_pb.pages_size() == 0) {
        return Status::EndOfFile("no page left to skip");
    }
    const PageMetaPB& first = _meta_pb.pages(0);
    _meta_pb.set_offset(_meta_pb.offset() + kPagePrefixSize + first.length());
    if (_meta_pb.has_num_rows()) {
        _meta_pb.set_num_rows(_meta_pb.num_rows() - first.num_values());
    }
    _meta_pb.mutable_pages()->erase(_meta_pb.mutable_pages()->begin());
    return Status::OK();
}

uint64_t ColumnMeta::total_len() const {
    uint64_t len = 0;
    for (const auto& p : _meta_pb.pages()) {
        len += kPagePrefixSize + p.length();
    }
    return len;
}

uint64_t ColumnMeta::num_rows() const {
    uint64_t rows = 0;
    for (const auto& p : _meta_pb.pages()) {
        rows += p.num_values();
    }
    return rows;
}

std::string ColumnMeta::debug_string() const {
    return fmt::format("column {} at {}: {} pages, {} rows, {} bytes", column_name(), offset(), num_pages(),
                       num_rows(), total_len());
}

} // namespace strata
