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
#include <type_traits>

#include "column/column.h"
#include "common/logging.h"

namespace strata {

template <typename T>
class FixedLengthColumn final : public ColumnFactory<Column, FixedLengthColumn<T>> {
    static_assert(std::is_arithmetic_v<T>, "FixedLengthColumn only stores arithmetic values");

public:
    using ValueType = T;
    using Container = Buffer<ValueType>;

    FixedLengthColumn() = default;

    explicit FixedLengthColumn(const size_t n) : _data(n) {}

    FixedLengthColumn(const size_t n, const ValueType x) : _data(n, x) {}

    explicit FixedLengthColumn(Container data) : _data(std::move(data)) {}

    const uint8_t* raw_data() const { return reinterpret_cast<const uint8_t*>(_data.data()); }

    size_t type_size() const { return sizeof(T); }

    size_t size() const override { return _data.size(); }

    size_t byte_size() const override { return _data.size() * sizeof(ValueType); }

    void reserve(size_t n) override { _data.reserve(n); }

    void resize(size_t n) { _data.resize(n); }

    void append(const T value) { _data.emplace_back(value); }

    using Column::append;

    void append(const Column& src, size_t offset, size_t count) override;

    // Append |count| values whose little-endian bytes start at |buff|.
    void append_numbers(const void* buff, size_t count);

    void append_value_multiple_times(const T value, size_t count) { _data.insert(_data.end(), count, value); }

    void append_default() override { _data.emplace_back(ValueType()); }

    void append_default(size_t count) override { _data.resize(_data.size() + count, ValueType()); }

    ColumnPtr clone_empty() const override { return FixedLengthColumn<T>::create(); }

    bool equals(size_t left, const Column& rhs, size_t right) const override;

    std::string get_name() const override;

    std::string debug_item(size_t idx) const override;

    Container& get_data() { return _data; }

    const Container& get_data() const { return _data; }

    const Container& immutable_data() const { return _data; }

    T get(size_t idx) const {
        DCHECK_LT(idx, _data.size());
        return _data[idx];
    }

protected:
    Container _data;
};

} // namespace strata
