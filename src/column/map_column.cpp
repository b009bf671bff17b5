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

#include "column/map_column.h"

namespace strata {

MapColumn::MapColumn(ColumnPtr keys, ColumnPtr values, OffsetColumnPtr offsets)
        : _keys(std::move(keys)), _values(std::move(values)), _offsets(std::move(offsets)) {
    if (_offsets->empty()) {
        _offsets->append(0);
    }
    DCHECK_EQ(_keys->size(), _values->size());
    DCHECK_EQ(_offsets->get_data().back(), _keys->size());
}

MapColumn::MapColumn(ColumnPtr keys, ColumnPtr values)
        : MapColumn(std::move(keys), std::move(values), UInt32Column::create()) {}

void MapColumn::append(const Column& src, size_t offset, size_t count) {
    const auto& map = static_cast<const MapColumn&>(src);
    const auto& src_offsets = map._offsets->get_data();
    const uint32_t from = src_offsets[offset];
    const uint32_t to = src_offsets[offset + count];
    uint32_t base = static_cast<uint32_t>(_keys->size());
    _keys->append(*map._keys, from, to - from);
    _values->append(*map._values, from, to - from);
    auto& offsets = _offsets->get_data();
    for (size_t i = offset + 1; i <= offset + count; ++i) {
        offsets.emplace_back(base + (src_offsets[i] - from));
    }
}

bool MapColumn::equals(size_t left, const Column& rhs, size_t right) const {
    const auto& other = static_cast<const MapColumn&>(rhs);
    const uint32_t lsize = get_map_size(left);
    if (lsize != other.get_map_size(right)) {
        return false;
    }
    // entries are compared in order, a map keeps the order it was written in
    const uint32_t loff = get_map_offset(left);
    const uint32_t roff = other.get_map_offset(right);
    for (uint32_t i = 0; i < lsize; ++i) {
        if (!_keys->equals(loff + i, *other._keys, roff + i) ||
            !_values->equals(loff + i, *other._values, roff + i)) {
            return false;
        }
    }
    return true;
}

std::string MapColumn::debug_item(size_t idx) const {
    std::string res("{");
    const uint32_t off = get_map_offset(idx);
    const uint32_t sz = get_map_size(idx);
    for (uint32_t i = 0; i < sz; ++i) {
        if (i > 0) {
            res.append(",");
        }
        res.append(_keys->debug_item(off + i)).append(":").append(_values->debug_item(off + i));
    }
    res.append("}");
    return res;
}

} // namespace strata
