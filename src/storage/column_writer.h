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

#include <memory>
#include <string>

#include "column/column.h"
#include "common/status.h"
#include "io/output_stream.h"
#include "storage/column_meta.h"
#include "storage/page/page_writer.h"
#include "types/type_descriptor.h"

namespace strata {

class PriorityThreadPool;

struct ColumnWriterOptions {
    // top level rows per page, the last page holds the rest
    size_t rows_per_page = 8192;
    PageWriterOptions page_options;
    std::string column_name;

    // rows_per_page from config, codec selection from config
    static ColumnWriterOptions from_config();
};

// ColumnWriter splits a column into pages of rows_per_page top level rows and
// writes them to a sink as a length prefixed stream:
//
//   page_len:u32 | page | page_len:u32 | page ...
//
// Pages never split a top level row. The position and row count of every page
// is recorded in the column meta. Every page holds exactly rows_per_page rows
// except the last one: rows that do not fill a page are kept until the next
// write() fills it or finish() writes them as the last page.
class ColumnWriter {
public:
    // |sink| must outlive the writer. The first page lands at |sink|'s position.
    ColumnWriter(TypeDescriptor type, ColumnWriterOptions options, io::OutputStream* sink);

    // Check the options and the type.
    Status init();

    // Encode the rows of |column| after the rows of earlier writes. Only full
    // pages reach the sink.
    Status write(const Column& column);

    // Same as write() but pages are encoded on |pool|. They are still written in
    // row order, and nothing is written or kept when any page fails.
    Status write_parallel(const Column& column, PriorityThreadPool* pool);

    // Write the kept rows as the last page. No write is accepted afterwards.
    Status finish();

    const ColumnMeta& meta() const { return _meta; }

    // Rows in the sink, kept rows excluded.
    uint64_t num_rows() const { return _num_rows; }

    size_t num_pending_rows() const { return _pending == nullptr ? 0 : _pending->size(); }

    const TypeDescriptor& type() const { return _type; }

private:
    Status _check_writable(const Column& column) const;

    Status _append_page(const faststring& page, size_t num_rows);

    Status _encode_page(const Column& column, size_t from, size_t count, faststring* page) const;

    const TypeDescriptor _type;
    const ColumnWriterOptions _options;
    io::OutputStream* _sink;
    ColumnMeta _meta;
    uint64_t _num_rows = 0;
    // rows of an unfilled page, fewer than rows_per_page
    ColumnPtr _pending;
    bool _inited = false;
    bool _finished = false;
};

// Pool for ColumnWriter::write_parallel with page_codec_thread_num threads,
// one per core when it is 0.
std::unique_ptr<PriorityThreadPool> create_page_codec_pool_from_config();

} // namespace strata
