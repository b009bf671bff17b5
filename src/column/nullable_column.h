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
#include "column/fixed_length_column.h"
#include "common/logging.h"

namespace strata {

// A data column paired with a null flag per row, 1 means null. The data column
// keeps a default value at null positions so both columns always have the same size.
class NullableColumn final : public ColumnFactory<Column, NullableColumn> {
public:
    NullableColumn(ColumnPtr data_column, NullColumnPtr null_column);

    // Wraps |data_column| with an all-not-null flag column.
    static Ptr wrap(ColumnPtr data_column);

    bool is_nullable() const override { return true; }

    bool has_null() const override { return _has_null; }

    void set_has_null(bool has_null) { _has_null = _has_null | has_null; }

    // Recompute |_has_null| from the null flags.
    void update_has_null();

    bool is_null(size_t index) const override {
        DCHECK_EQ(_null_column->size(), _data_column->size());
        return _has_null && _null_column->get_data()[index];
    }

    size_t size() const override {
        DCHECK_EQ(_data_column->size(), _null_column->size());
        return _data_column->size();
    }

    size_t byte_size() const override { return _data_column->byte_size() + _null_column->byte_size(); }

    void reserve(size_t n) override {
        _data_column->reserve(n);
        _null_column->reserve(n);
    }

    using Column::append;

    void append(const Column& src, size_t offset, size_t count) override;

    bool append_nulls(size_t count) override;

    void append_default() override { append_nulls(1); }

    void append_default(size_t count) override { append_nulls(count); }

    ColumnPtr clone_empty() const override {
        return create(_data_column->clone_empty(), NullColumn::create());
    }

    bool equals(size_t left, const Column& rhs, size_t right) const override;

    std::string get_name() const override { return "nullable-" + _data_column->get_name(); }

    std::string debug_item(size_t idx) const override;

    NullData& null_column_data() { return _null_column->get_data(); }
    const NullData& immutable_null_column_data() const { return _null_column->get_data(); }

    Column* mutable_data_column() { return _data_column.get(); }

    const ColumnPtr& data_column() const { return _data_column; }

    const NullColumnPtr& null_column() const { return _null_column; }

    size_t null_count() const;

private:
    ColumnPtr _data_column;
    NullColumnPtr _null_column;
    bool _has_null = false;
};

} // namespace strata
