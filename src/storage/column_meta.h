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

#include <cstdint>
#include <string>

#include "common/statusor.h"
#include "gen_cpp/column_meta.pb.h"

namespace strata {

// Bytes of the u32 length prefix in front of every page of a stream.
static constexpr size_t kPagePrefixSize = sizeof(uint32_t);

// ColumnMeta describes where the pages of one column live in a page stream and
// how many rows each holds. It can be narrowed to a range of pages so that a
// reader decodes only those.
class ColumnMeta {
public:
    ColumnMeta() = default;

    explicit ColumnMeta(ColumnMetaPB meta_pb) : _meta_pb(std::move(meta_pb)) {}

    // Pages [start, end). The offset moves to the first kept page.
    StatusOr<ColumnMeta> slice(size_t start, size_t end) const;

    // Drop the first page.
    Status skip_one_page();

    // Bytes the pages take in the stream, prefixes included.
    uint64_t total_len() const;

    uint64_t num_rows() const;

    size_t num_pages() const { return _meta_pb.pages_size(); }

    uint64_t offset() const { return _meta_pb.offset(); }

    const PageMetaPB& page(size_t idx) const { return _meta_pb.pages(static_cast<int>(idx)); }

    const std::string& column_name() const { return _meta_pb.column_name(); }

    const ColumnMetaPB& pb() const { return _meta_pb; }

    ColumnMetaPB* mutable_pb() { return &_meta_pb; }

    std::string debug_string() const;

private:
    ColumnMetaPB _meta_pb;
};

} // namespace strata
