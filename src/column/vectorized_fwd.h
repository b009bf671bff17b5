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

#include <cstdint>
#include <memory>
#include <vector>

namespace strata {

class Column;
class ArrayColumn;
class MapColumn;
class StructColumn;
class NullableColumn;
class NullTypeColumn;

template <typename T>
using Buffer = std::vector<T>;

template <typename T>
class FixedLengthColumn;

template <typename T>
class BinaryColumnBase;

using ColumnPtr = std::shared_ptr<Column>;
using Columns = std::vector<ColumnPtr>;

using Int8Column = FixedLengthColumn<int8_t>;
using UInt8Column = FixedLengthColumn<uint8_t>;
using BooleanColumn = UInt8Column;
using Int16Column = FixedLengthColumn<int16_t>;
using UInt16Column = FixedLengthColumn<uint16_t>;
using Int32Column = FixedLengthColumn<int32_t>;
using UInt32Column = FixedLengthColumn<uint32_t>;
using Int64Column = FixedLengthColumn<int64_t>;
using UInt64Column = FixedLengthColumn<uint64_t>;
using FloatColumn = FixedLengthColumn<float>;
using DoubleColumn = FixedLengthColumn<double>;
using BinaryColumn = BinaryColumnBase<uint32_t>;
using LargeBinaryColumn = BinaryColumnBase<uint64_t>;

using NullColumn = UInt8Column;
using NullColumnPtr = std::shared_ptr<NullColumn>;
using NullData = Buffer<uint8_t>;

using Offsets = Buffer<uint32_t>;

} // namespace strata
