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

#include "column/array_column.h"

#include "common/logging.h"

namespace strata {

ArrayColumn::ArrayColumn(ColumnPtr elements, OffsetColumnPtr offsets)
        : _elements(std::move(elements)), _offsets(std::move(offsets)) {
    if (_offsets->empty()) {
        _offsets->append(0);
    }
    DCHECK_EQ(_offsets->get_data().back(), _elements->size());
}

ArrayColumn::ArrayColumn(ColumnPtr elements) : ArrayColumn(std::move(elements), OffsetColumn::create()) {}

void ArrayColumn::append(const Column& src, size_t offset, size_t count) {
    const auto& array = static_cast<const ArrayColumn&>(src);
    const auto& src_offsets = array._offsets->get_data();
    const uint32_t from = src_offsets[offset];
    const uint32_t to = src_offsets[offset + count];
    uint32_t base = static_cast<uint32_t>(_elements->size());
    _elements->append(*array._elements, from, to - from);
    auto& offsets = _offsets->get_data();
    for (size_t i = offset + 1; i <= offset + count; ++i) {
        offsets.emplace_back(base + (src_offsets[i] - from));
    }
}

bool ArrayColumn::equals(size_t left, const Column& rhs, size_t right) const {
    const auto& rhs_array = static_cast<const ArrayColumn&>(rhs);
    const uint32_t lsize = get_element_size(left);
    if (lsize != rhs_array.get_element_size(right)) {
        return false;
    }
    const uint32_t loff = get_element_offset(left);
    const uint32_t roff = rhs_array.get_element_offset(right);
    for (uint32_t i = 0; i < lsize; ++i) {
        if (!_elements->equals(loff + i, *rhs_array._elements, roff + i)) {
            return false;
        }
    }
    return true;
}

std::string ArrayColumn::debug_item(size_t idx) const {
    std::string res("[");
    const uint32_t off = get_element_offset(idx);
    const uint32_t sz = get_element_size(idx);
    for (uint32_t i = 0; i < sz; ++i) {
        if (i > 0) {
            res.append(",");
        }
        res.append(_elements->debug_item(off + i));
    }
    res.append("]");
    return res;
}

} // namespace strata
