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

#include "storage/column_writer.h"

#include <fmt/format.h>

#include <algorithm>
#include <limits>
#include <thread>
#include <utility>
#include <vector>

#include "column/column_helper.h"
#include "common/config.h"
#include "common/logging.h"
#include "util/coding.h"
#include "util/countdown_latch.h"
#include "util/faststring.h"
#include "util/priority_thread_pool.hpp"

namespace strata {

ColumnWriterOptions ColumnWriterOptions::from_config() {
    ColumnWriterOptions options;
    options.rows_per_page = config::page_rows <= 0 ? 0 : static_cast<size_t>(config::page_rows);
    options.page_options.selector = create_compression_selector_from_config();
    return options;
}

ColumnWriter::ColumnWriter(TypeDescriptor type, ColumnWriterOptions options, io::OutputStream* sink)
        : _type(std::move(type)), _options(std::move(options)), _sink(sink) {}

Status ColumnWriter::init() {
    if (_options.rows_per_page == 0) {
        return Status::InvalidArgument("rows_per_page must be positive");
    }
    if (_options.rows_per_page > std::numeric_limits<uint32_t>::max()) {
        return Status::InvalidArgument(fmt::format("rows_per_page {} is too large", _options.rows_per_page));
    }
    RETURN_IF_ERROR(_type.validate());
    auto* meta = _meta.mutable_pb();
    meta->set_offset(_sink->position());
    meta->set_num_rows(0);
    meta->set_rows_per_page(_options.rows_per_page);
    if (!_options.column_name.empty()) {
        meta->set_column_name(_options.column_name);
    }
    _pending = ColumnHelper::create_column(_type);
    _inited = true;
    return Status::OK();
}

Status ColumnWriter::_append_page(const faststring& page, size_t num_rows) {
    if (page.size() > std::numeric_limits<uint32_t>::max()) {
        return Status::NotSupported(fmt::format("page of {} bytes exceeds the u32 length prefix", page.size()));
    }
    uint8_t prefix[kPagePrefixSize];
    encode_fixed32_le(prefix, static_cast<uint32_t>(page.size()));
    RETURN_IF_ERROR(_sink->write(prefix, sizeof(prefix)));
    RETURN_IF_ERROR(_sink->write(page.data(), static_cast<int64_t>(page.size())));

    auto* meta = _meta.mutable_pb();
    auto* page_meta = meta->add_pages();
    page_meta->set_length(page.size());
    page_meta->set_num_values(num_rows);
    _num_rows += num_rows;
    meta->set_num_rows(_num_rows);
    return Status::OK();
}

Status ColumnWriter::_check_writable(const Column& column) const {
    if (!_inited) {
        return Status::InternalError("ColumnWriter is not initialized");
    }
    if (_finished) {
        return Status::InternalError(fmt::format("column {} is finished", _options.column_name));
    }
    return ColumnHelper::check_column_type(column, _type);
}

Status ColumnWriter::_encode_page(const Column& column, size_t from, size_t count, faststring* page) const {
    page->clear();
    Status st = PageWriter::write(column, from, count, _type, _options.page_options, page);
    if (!st.ok()) {
        return st.clone_and_append(fmt::format("column {} page {} rows [{}, {})", _options.column_name,
                                               _meta.num_pages(), _num_rows, _num_rows + count));
    }
    return Status::OK();
}

Status ColumnWriter::write(const Column& column) {
    RETURN_IF_ERROR(_check_writable(column));
    const size_t rows_per_page = _options.rows_per_page;
    faststring page;
    size_t from = 0;
    if (!_pending->empty()) {
        from = std::min(rows_per_page - _pending->size(), column.size());
        _pending->append(column, 0, from);
        if (_pending->size() < rows_per_page) {
            return Status::OK();
        }
        RETURN_IF_ERROR(_encode_page(*_pending, 0, rows_per_page, &page));
        RETURN_IF_ERROR(_append_page(page, rows_per_page));
        _pending = ColumnHelper::create_column(_type);
    }
    for (; column.size() - from >= rows_per_page; from += rows_per_page) {
        RETURN_IF_ERROR(_encode_page(column, from, rows_per_page, &page));
        RETURN_IF_ERROR(_append_page(page, rows_per_page));
    }
    _pending->append(column, from, column.size() - from);
    VLOG_PAGE << _meta.debug_string() << ", " << _pending->size() << " rows pending";
    return Status::OK();
}

Status ColumnWriter::write_parallel(const Column& column, PriorityThreadPool* pool) {
    RETURN_IF_ERROR(_check_writable(column));
    const size_t rows_per_page = _options.rows_per_page;
    if (_pending->size() + column.size() < rows_per_page) {
        _pending->append(column);
        return Status::OK();
    }

    struct PageRange {
        const Column* column;
        size_t from;
    };
    std::vector<PageRange> ranges;
    // the kept rows and the head of |column| make the first page
    ColumnPtr head;
    size_t from = 0;
    if (!_pending->empty()) {
        from = rows_per_page - _pending->size();
        head = ColumnHelper::create_column(_type);
        head->append(*_pending);
        head->append(column, 0, from);
        ranges.push_back({head.get(), 0});
    }
    for (; column.size() - from >= rows_per_page; from += rows_per_page) {
        ranges.push_back({&column, from});
    }

    const size_t num_pages = ranges.size();
    std::vector<faststring> pages(num_pages);
    std::vector<Status> statuses(num_pages);
    CountDownLatch latch(static_cast<int>(num_pages));
    for (size_t i = 0; i < num_pages; ++i) {
        // earlier pages first, they are written first
        PriorityThreadPool::Task task;
        task.priority = -static_cast<int64_t>(i);
        task.work_function = [&, i]() {
            CountDownOnScopeExit count_down(&latch);
            statuses[i] = PageWriter::write(*ranges[i].column, ranges[i].from, rows_per_page, _type,
                                            _options.page_options, &pages[i]);
        };
        if (!pool->offer(std::move(task))) {
            statuses[i] = Status::Cancelled(fmt::format("thread pool {} is shut down", pool->name()));
            latch.count_down();
        }
    }
    latch.wait();

    for (size_t i = 0; i < num_pages; ++i) {
        if (!statuses[i].ok()) {
            const uint64_t first_row = _num_rows + i * rows_per_page;
            return statuses[i].clone_and_append(fmt::format("column {} page {} rows [{}, {})", _options.column_name,
                                                            _meta.num_pages() + i, first_row,
                                                            first_row + rows_per_page));
        }
    }
    for (size_t i = 0; i < num_pages; ++i) {
        RETURN_IF_ERROR(_append_page(pages[i], rows_per_page));
    }
    _pending = ColumnHelper::create_column(_type);
    _pending->append(column, from, column.size() - from);
    VLOG_PAGE << _meta.debug_string() << ", " << _pending->size() << " rows pending";
    return Status::OK();
}

Status ColumnWriter::finish() {
    if (!_inited) {
        return Status::InternalError("ColumnWriter is not initialized");
    }
    if (_finished) {
        return Status::InternalError(fmt::format("column {} is finished", _options.column_name));
    }
    _finished = true;
    if (!_pending->empty()) {
        faststring page;
        RETURN_IF_ERROR(_encode_page(*_pending, 0, _pending->size(), &page));
        RETURN_IF_ERROR(_append_page(page, _pending->size()));
        _pending = ColumnHelper::create_column(_type);
    }
    VLOG_PAGE << _meta.debug_string();
    return Status::OK();
}

std::unique_ptr<PriorityThreadPool> create_page_codec_pool_from_config() {
    uint32_t num_threads = config::page_codec_thread_num > 0 ? config::page_codec_thread_num
                                                             : std::max(1u, std::thread::hardware_concurrency());
    uint32_t queue_size = std::max(1, config::page_codec_queue_size_per_thread) * num_threads;
    return std::make_unique<PriorityThreadPool>("page_codec", num_threads, queue_size);
}

} // namespace strata
