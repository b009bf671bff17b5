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
#include "util/slice.h"

namespace strata {

// Variable length values: all bytes in one buffer and |size() + 1| offsets into it.
// T is the offset type, uint32_t for BinaryColumn and uint64_t for LargeBinaryColumn.
template <typename T>
class BinaryColumnBase final : public ColumnFactory<Column, BinaryColumnBase<T>> {
public:
    using Offset = T;
    using Offsets = Buffer<T>;
    using Bytes = Buffer<uint8_t>;

    BinaryColumnBase() { _offsets.emplace_back(0); }

    BinaryColumnBase(Bytes bytes, Offsets offsets) : _bytes(std::move(bytes)), _offsets(std::move(offsets)) {
        if (_offsets.empty()) {
            _offsets.emplace_back(0);
        }
    }

    bool is_binary() const override { return true; }

    bool is_large_binary() const override { return std::is_same_v<T, uint64_t>; }

    size_t size() const override { return _offsets.size() - 1; }

    size_t byte_size() const override { return _bytes.size() + _offsets.size() * sizeof(T); }

    void reserve(size_t n) override { _offsets.reserve(n + 1); }

    void append(const Slice& str) {
        const auto* p = reinterpret_cast<const uint8_t*>(str.data);
        _bytes.insert(_bytes.end(), p, p + str.size);
        _offsets.emplace_back(static_cast<T>(_bytes.size()));
    }

    void append_string(const std::string& str) { append(Slice(str)); }

    using Column::append;

    void append(const Column& src, size_t offset, size_t count) override;

    void append_default() override { _offsets.emplace_back(static_cast<T>(_bytes.size())); }

    void append_default(size_t count) override { _offsets.insert(_offsets.end(), count, static_cast<T>(_bytes.size())); }

    ColumnPtr clone_empty() const override { return BinaryColumnBase<T>::create(); }

    bool equals(size_t left, const Column& rhs, size_t right) const override;

    std::string get_name() const override { return std::is_same_v<T, uint64_t> ? "large-binary" : "binary"; }

    std::string debug_item(size_t idx) const override;

    Slice get_slice(size_t idx) const {
        DCHECK_LT(idx, size());
        return {_bytes.data() + _offsets[idx], static_cast<size_t>(_offsets[idx + 1] - _offsets[idx])};
    }

    Offsets& get_offset() { return _offsets; }
    const Offsets& get_offset() const { return _offsets; }

    Bytes& get_bytes() { return _bytes; }
    const Bytes& get_bytes() const { return _bytes; }

private:
    Bytes _bytes;
    Offsets _offsets;
};

} // namespace strata
