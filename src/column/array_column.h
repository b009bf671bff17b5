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

namespace strata {

// A list per row. Elements of all rows live in one column; row i covers
// elements [offsets[i], offsets[i + 1]).
class ArrayColumn final : public ColumnFactory<Column, ArrayColumn> {
public:
    using OffsetColumn = UInt32Column;
    using OffsetColumnPtr = std::shared_ptr<UInt32Column>;

    ArrayColumn(ColumnPtr elements, OffsetColumnPtr offsets);

    // An empty array column over an empty |elements| column.
    explicit ArrayColumn(ColumnPtr elements);

    bool is_array() const override { return true; }

    size_t size() const override { return _offsets->size() - 1; }

    size_t byte_size() const override { return _elements->byte_size() + _offsets->byte_size(); }

    void reserve(size_t n) override { _offsets->reserve(n + 1); }

    using Column::append;

    void append(const Column& src, size_t offset, size_t count) override;

    // Closes a row whose elements have already been appended to the elements column.
    void finish_row() { _offsets->append(static_cast<uint32_t>(_elements->size())); }

    void append_default() override { _offsets->append(_offsets->get_data().back()); }

    void append_default(size_t count) override {
        _offsets->append_value_multiple_times(_offsets->get_data().back(), count);
    }

    ColumnPtr clone_empty() const override { return create(_elements->clone_empty()); }

    bool equals(size_t left, const Column& rhs, size_t right) const override;

    std::string get_name() const override { return "array-" + _elements->get_name(); }

    std::string debug_item(size_t idx) const override;

    uint32_t get_element_offset(size_t idx) const { return _offsets->get_data()[idx]; }

    uint32_t get_element_size(size_t idx) const {
        const auto& offsets = _offsets->get_data();
        return offsets[idx + 1] - offsets[idx];
    }

    const ColumnPtr& elements_column() const { return _elements; }
    Column* mutable_elements_column() { return _elements.get(); }

    const OffsetColumnPtr& offsets_column() const { return _offsets; }

private:
    ColumnPtr _elements;
    OffsetColumnPtr _offsets;
};

} // namespace strata
