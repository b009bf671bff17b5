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

// A list of (key, value) entries per row. Keys and values of all rows live in two
// columns of equal size; row i covers entries [offsets[i], offsets[i + 1]).
class MapColumn final : public ColumnFactory<Column, MapColumn> {
public:
    using OffsetColumnPtr = std::shared_ptr<UInt32Column>;

    MapColumn(ColumnPtr keys, ColumnPtr values, OffsetColumnPtr offsets);

    // An empty map column over empty |keys| and |values| columns.
    MapColumn(ColumnPtr keys, ColumnPtr values);

    bool is_map() const override { return true; }

    size_t size() const override { return _offsets->size() - 1; }

    size_t byte_size() const override { return _keys->byte_size() + _values->byte_size() + _offsets->byte_size(); }

    void reserve(size_t n) override { _offsets->reserve(n + 1); }

    using Column::append;

    void append(const Column& src, size_t offset, size_t count) override;

    // Closes a row whose entries have already been appended to the keys and values columns.
    void finish_row() {
        DCHECK_EQ(_keys->size(), _values->size());
        _offsets->append(static_cast<uint32_t>(_keys->size()));
    }

    void append_default() override { _offsets->append(_offsets->get_data().back()); }

    void append_default(size_t count) override {
        _offsets->append_value_multiple_times(_offsets->get_data().back(), count);
    }

    ColumnPtr clone_empty() const override { return create(_keys->clone_empty(), _values->clone_empty()); }

    bool equals(size_t left, const Column& rhs, size_t right) const override;

    std::string get_name() const override { return "map-" + _keys->get_name() + "-" + _values->get_name(); }

    std::string debug_item(size_t idx) const override;

    uint32_t get_map_offset(size_t idx) const { return _offsets->get_data()[idx]; }

    uint32_t get_map_size(size_t idx) const {
        const auto& offsets = _offsets->get_data();
        return offsets[idx + 1] - offsets[idx];
    }

    const ColumnPtr& keys_column() const { return _keys; }
    const ColumnPtr& values_column() const { return _values; }
    const OffsetColumnPtr& offsets_column() const { return _offsets; }

private:
    ColumnPtr _keys;
    ColumnPtr _values;
    OffsetColumnPtr _offsets;
};

} // namespace strata
