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

#include "common/logging.h"
#include "types/logical_type.h"

// Infra to build the type system:
// 1. Macro `APPLY_FOR*` to build generic codes
// 2. Function `type_dispatch*` to dynamic dispatch on a runtime LogicalType

namespace strata {

#define APPLY_FOR_ALL_INT_TYPE(M) \
    M(TYPE_TINYINT)               \
    M(TYPE_UNSIGNED_TINYINT)      \
    M(TYPE_SMALLINT)              \
    M(TYPE_UNSIGNED_SMALLINT)     \
    M(TYPE_INT)                   \
    M(TYPE_UNSIGNED_INT)          \
    M(TYPE_BIGINT)                \
    M(TYPE_UNSIGNED_BIGINT)

#define APPLY_FOR_ALL_NUMBER_TYPE(M) \
    APPLY_FOR_ALL_INT_TYPE(M)        \
    M(TYPE_FLOAT)                    \
    M(TYPE_DOUBLE)

#define APPLY_FOR_ALL_FIXED_LENGTH_TYPE(M) \
    APPLY_FOR_ALL_NUMBER_TYPE(M)           \
    M(TYPE_BOOLEAN)

#define APPLY_FOR_ALL_BINARY_TYPE(M) \
    M(TYPE_VARCHAR)                  \
    M(TYPE_VARBINARY)                \
    M(TYPE_LARGE_VARCHAR)            \
    M(TYPE_LARGE_VARBINARY)

#define _TYPE_DISPATCH_CASE(type) \
    case type:                    \
        return fun.template operator()<type>(args...);

// Types stored in a FixedLengthColumn
template <class Functor, class... Args>
auto type_dispatch_fixed_length(LogicalType ltype, Functor fun, Args... args) {
    switch (ltype) {
        APPLY_FOR_ALL_FIXED_LENGTH_TYPE(_TYPE_DISPATCH_CASE)
    default:
        CHECK(false) << "Unknown type: " << ltype;
        __builtin_unreachable();
    }
}

// Types stored in a FixedLengthColumn or a BinaryColumnBase
template <class Functor, class... Args>
auto type_dispatch_basic(LogicalType ltype, Functor fun, Args... args) {
    switch (ltype) {
        APPLY_FOR_ALL_FIXED_LENGTH_TYPE(_TYPE_DISPATCH_CASE)
        APPLY_FOR_ALL_BINARY_TYPE(_TYPE_DISPATCH_CASE)
    default:
        CHECK(false) << "Unknown type: " << ltype;
        __builtin_unreachable();
    }
}

} // namespace strata
