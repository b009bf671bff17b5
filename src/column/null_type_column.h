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

#include "column/column.h"

namespace strata {

// Column of the NULL type. Every row is null, so only the row count is kept.
class NullTypeColumn final : public ColumnFactory<Column, NullTypeColumn> {
public:
    NullTypeColumn() = default;

    explicit NullTypeColumn(size_t n) : _size(n) {}

    bool only_null() const override { return true; }

    bool has_null() const override { return _size > 0; }

    bool is_null(size_t idx) const override { return true; }

    size_t size() const override { return _size; }

    size_t byte_size() const override { return 0; }

    void reserve(size_t n) override {}

    using Column::append;

    void append(const Column& src, size_t offset, size_t count) override { _size += count; }

    bool append_nulls(size_t count) override {
        _size += count;
        return true;
    }

    void append_default() override { ++_size; }

    void append_default(size_t count) override { _size += count; }

    ColumnPtr clone_empty() const override { return create(); }

    bool equals(size_t left, const Column& rhs, size_t right) const override { return rhs.is_null(right); }

    std::string get_name() const override { return "null"; }

    std::string debug_item(size_t idx) const override { return "NULL"; }

private:
    size_t _size = 0;
};

} // namespace strata
