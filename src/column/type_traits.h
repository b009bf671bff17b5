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

#include "column/binary_column.h"
#include "column/fixed_length_column.h"
#include "types/logical_type.h"

namespace strata {

template <LogicalType Type>
struct RunTimeTypeTraits {};

#define DEFINE_RUNTIME_TYPE_TRAITS(LTYPE, CPP_TYPE, COLUMN_TYPE) \
    template <>                                                 \
    struct RunTimeTypeTraits<LTYPE> {                           \
        using CppType = CPP_TYPE;                               \
        using ColumnType = COLUMN_TYPE;                         \
    };

DEFINE_RUNTIME_TYPE_TRAITS(TYPE_BOOLEAN, uint8_t, BooleanColumn)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_TINYINT, int8_t, Int8Column)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_UNSIGNED_TINYINT, uint8_t, UInt8Column)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_SMALLINT, int16_t, Int16Column)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_UNSIGNED_SMALLINT, uint16_t, UInt16Column)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_INT, int32_t, Int32Column)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_UNSIGNED_INT, uint32_t, UInt32Column)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_BIGINT, int64_t, Int64Column)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_UNSIGNED_BIGINT, uint64_t, UInt64Column)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_FLOAT, float, FloatColumn)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_DOUBLE, double, DoubleColumn)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_VARCHAR, Slice, BinaryColumn)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_VARBINARY, Slice, BinaryColumn)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_LARGE_VARCHAR, Slice, LargeBinaryColumn)
DEFINE_RUNTIME_TYPE_TRAITS(TYPE_LARGE_VARBINARY, Slice, LargeBinaryColumn)

#undef DEFINE_RUNTIME_TYPE_TRAITS

template <LogicalType Type>
using RunTimeCppType = typename RunTimeTypeTraits<Type>::CppType;

template <LogicalType Type>
using RunTimeColumnType = typename RunTimeTypeTraits<Type>::ColumnType;

} // namespace strata
