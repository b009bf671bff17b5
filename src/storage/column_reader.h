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

#include "column/vectorized_fwd.h"
#include "common/statusor.h"
#include "storage/column_meta.h"
#include "storage/page/page_reader.h"
#include "storage/page/page_stat.h"
#include "types/type_descriptor.h"
#include "util/slice.h"

namespace strata {

// ColumnReader decodes a length prefixed page stream written by ColumnWriter.
// |data| is the buffer the stream lives in; offsets in a ColumnMeta index into
// it. Pages are read in order and appended to the caller's column, so the rows
// of the pages before a failing one stay with the caller.
//
// |rows_per_page| is the value the stream was written with. A page that is not
// the last one of the stream must hold exactly that many rows and the last one
// at most that many, RowCountMismatch otherwise.
//
// Errors carry the column name, the page index and the byte offset of the page.
class ColumnReader {
public:
    ColumnReader(TypeDescriptor type, Slice data, size_t rows_per_page, std::string column_name = "");

    // Move to the page prefix at |offset|.
    Status seek(uint64_t offset);

    // Bytes of the next page without decoding it. EndOfFile at the end of data.
    Status next_raw_page(Slice* page);

    // Decode the next page. EndOfFile at the end of data. The page is the last
    // one when no byte follows it.
    Status next_page(PageData* page);

    // Decode every page up to the end of data and append the rows to |dst|.
    // Fails with RowCountMismatch when the pages hold other than |expected_rows|.
    Status read_column(size_t expected_rows, Column* dst);

    StatusOr<ColumnPtr> read_column(size_t expected_rows);

    // Decode exactly the pages of |meta|, checking each page's length and row
    // count against it. The last page of |meta| may be short.
    Status read_pages(const ColumnMeta& meta, Column* dst);

    StatusOr<ColumnPtr> read_pages(const ColumnMeta& meta);

    // Headers of every page up to the end of data.
    Status stat_pages(std::vector<PageInfo>* infos);

    uint64_t position() const { return _position; }

    size_t page_index() const { return _page_index; }

    const TypeDescriptor& type() const { return _type; }

private:
    Status _read_page(uint64_t page_offset, const Slice& page, bool last_page, Column* dst, size_t* num_rows);

    bool _is_last_page(uint64_t page_offset, const Slice& page) const {
        return page_offset + kPagePrefixSize + page.size == _data.size;
    }

    Status _with_context(const Status& st, uint64_t page_offset) const;

    const TypeDescriptor _type;
    const Slice _data;
    const size_t _rows_per_page;
    const std::string _column_name;
    uint64_t _position = 0;
    size_t _page_index = 0;
};

} // namespace strata
