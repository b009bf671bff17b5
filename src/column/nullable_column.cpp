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

#include "column/nullable_column.h"

#include <algorithm>

namespace strata {

NullableColumn::NullableColumn(ColumnPtr data_column, NullColumnPtr null_column)
        : _data_column(std::move(data_column)), _null_column(std::move(null_column)) {
    DCHECK(!_data_column->is_nullable()) << "nullable column cannot wrap another nullable column";
    DCHECK_EQ(_null_column->size(), _data_column->size());
    update_has_null();
}

NullableColumn::Ptr NullableColumn::wrap(ColumnPtr data_column) {
    auto nulls = NullColumn::create(data_column->size(), 0);
    return create(std::move(data_column), std::move(nulls));
}

void NullableColumn::update_has_null() {
    const auto& nulls = _null_column->get_data();
    _has_null = std::any_of(nulls.begin(), nulls.end(), [](uint8_t v) { return v != 0; });
}

size_t NullableColumn::null_count() const {
    if (!_has_null) {
        return 0;
    }
    const auto& nulls = _null_column->get_data();
    return std::count_if(nulls.begin(), nulls.end(), [](uint8_t v) { return v != 0; });
}

void NullableColumn::append(const Column& src, size_t offset, size_t count) {
    DCHECK_EQ(_null_column->size(), _data_column->size());
    if (src.is_nullable()) {
        const auto& c = static_cast<const NullableColumn&>(src);
        _null_column->append(*c._null_column, offset, count);
        _data_column->append(*c._data_column, offset, count);
        _has_null = _has_null || c.has_null();
    } else {
        _null_column->append_default(count);
        _data_column->append(src, offset, count);
    }
}

bool NullableColumn::append_nulls(size_t count) {
    DCHECK_EQ(_null_column->size(), _data_column->size());
    if (count == 0) {
        return true;
    }
    _data_column->append_default(count);
    _null_column->append_value_multiple_times(1, count);
    _has_null = true;
    return true;
}

bool NullableColumn::equals(size_t left, const Column& rhs, size_t right) const {
    const bool l_null = is_null(left);
    const bool r_null = rhs.is_null(right);
    if (l_null || r_null) {
        return l_null == r_null;
    }
    if (rhs.is_nullable()) {
        return _data_column->equals(left, *static_cast<const NullableColumn&>(rhs)._data_column, right);
    }
    return _data_column->equals(left, rhs, right);
}

std::string NullableColumn::debug_item(size_t idx) const {
    if (is_null(idx)) {
        return "NULL";
    }
    return _data_column->debug_item(idx);
}

} // namespace strata
