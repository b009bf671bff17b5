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

#include "column/fixed_length_column.h"

#include <fmt/format.h>

#include <cstring>

namespace strata {

template <typename T>
void FixedLengthColumn<T>::append(const Column& src, size_t offset, size_t count) {
    const auto& src_data = static_cast<const FixedLengthColumn<T>&>(src)._data;
    DCHECK_LE(offset + count, src_data.size());
    _data.insert(_data.end(), src_data.begin() + offset, src_data.begin() + offset + count);
}

template <typename T>
void FixedLengthColumn<T>::append_numbers(const void* buff, size_t count) {
    const size_t old_size = _data.size();
    _data.resize(old_size + count);
    if (count > 0) {
        memcpy(_data.data() + old_size, buff, count * sizeof(T));
    }
}

template <typename T>
bool FixedLengthColumn<T>::equals(size_t left, const Column& rhs, size_t right) const {
    const auto& rhs_data = static_cast<const FixedLengthColumn<T>&>(rhs)._data;
    if constexpr (std::is_floating_point_v<T>) {
        // bitwise, so that NaN payloads survive a round trip check
        return memcmp(&_data[left], &rhs_data[right], sizeof(T)) == 0;
    } else {
        return _data[left] == rhs_data[right];
    }
}

template <typename T>
std::string FixedLengthColumn<T>::get_name() const {
    if constexpr (std::is_floating_point_v<T>) {
        return sizeof(T) == 4 ? "float" : "double";
    } else {
        return fmt::format("{}int{}", std::is_signed_v<T> ? "" : "u", sizeof(T) * 8);
    }
}

template <typename T>
std::string FixedLengthColumn<T>::debug_item(size_t idx) const {
    if constexpr (sizeof(T) == 1) {
        return std::to_string(static_cast<int>(_data[idx]));
    } else {
        return fmt::format("{}", _data[idx]);
    }
}

template class FixedLengthColumn<int8_t>;
template class FixedLengthColumn<uint8_t>;
template class FixedLengthColumn<int16_t>;
template class FixedLengthColumn<uint16_t>;
template class FixedLengthColumn<int32_t>;
template class FixedLengthColumn<uint32_t>;
template class FixedLengthColumn<int64_t>;
template class FixedLengthColumn<uint64_t>;
template class FixedLengthColumn<float>;
template class FixedLengthColumn<double>;

} // namespace strata
