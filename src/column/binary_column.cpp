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

#include "column/binary_column.h"

namespace strata {

template <typename T>
void BinaryColumnBase<T>::append(const Column& src, size_t offset, size_t count) {
    const auto& b = static_cast<const BinaryColumnBase<T>&>(src);
    DCHECK_LE(offset + count, b.size());
    const T from = b._offsets[offset];
    const T to = b._offsets[offset + count];
    const T base = static_cast<T>(_bytes.size());
    _bytes.insert(_bytes.end(), b._bytes.begin() + from, b._bytes.begin() + to);
    for (size_t i = offset + 1; i <= offset + count; ++i) {
        _offsets.emplace_back(base + (b._offsets[i] - from));
    }
}

template <typename T>
bool BinaryColumnBase<T>::equals(size_t left, const Column& rhs, size_t right) const {
    const auto& r = static_cast<const BinaryColumnBase<T>&>(rhs);
    return get_slice(left) == r.get_slice(right);
}

template <typename T>
std::string BinaryColumnBase<T>::debug_item(size_t idx) const {
    std::string s;
    auto slice = get_slice(idx);
    s.reserve(slice.size + 2);
    s.push_back('\'');
    s.append(slice.data, slice.size);
    s.push_back('\'');
    return s;
}

template class BinaryColumnBase<uint32_t>;
template class BinaryColumnBase<uint64_t>;

} // namespace strata
