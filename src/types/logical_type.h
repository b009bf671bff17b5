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

#include <cstddef>
#include <string>

namespace strata {

// Ids are stable, new types get new numbers.
enum LogicalType {
    TYPE_UNKNOWN = 0,
    TYPE_TINYINT = 1,
    TYPE_UNSIGNED_TINYINT = 2,
    TYPE_SMALLINT = 3,
    TYPE_UNSIGNED_SMALLINT = 4,
    TYPE_INT = 5,
    TYPE_UNSIGNED_INT = 6,
    TYPE_BIGINT = 7,
    TYPE_UNSIGNED_BIGINT = 8,
    TYPE_FLOAT = 10,
    TYPE_DOUBLE = 11,
    TYPE_VARCHAR = 17,

    TYPE_STRUCT = 18,
    TYPE_ARRAY = 19,
    TYPE_MAP = 20,
    TYPE_BOOLEAN = 24,

    TYPE_NULL = 42,
    TYPE_VARBINARY = 46,

    // 64-bit offset variants
    TYPE_LARGE_VARCHAR = 60,
    TYPE_LARGE_VARBINARY = 61,
    TYPE_LARGE_ARRAY = 62,
};

constexpr inline bool is_integer_type(LogicalType type) {
    switch (type) {
    case TYPE_TINYINT:
    case TYPE_UNSIGNED_TINYINT:
    case TYPE_SMALLINT:
    case TYPE_UNSIGNED_SMALLINT:
    case TYPE_INT:
    case TYPE_UNSIGNED_INT:
    case TYPE_BIGINT:
    case TYPE_UNSIGNED_BIGINT:
        return true;
    default:
        return false;
    }
}

constexpr inline bool is_float_type(LogicalType type) {
    return type == TYPE_FLOAT || type == TYPE_DOUBLE;
}

constexpr inline bool is_binary_type(LogicalType type) {
    return type == TYPE_VARCHAR || type == TYPE_VARBINARY || type == TYPE_LARGE_VARCHAR ||
           type == TYPE_LARGE_VARBINARY;
}

constexpr inline bool is_large_binary_type(LogicalType type) {
    return type == TYPE_LARGE_VARCHAR || type == TYPE_LARGE_VARBINARY;
}

constexpr inline bool is_array_type(LogicalType type) {
    return type == TYPE_ARRAY || type == TYPE_LARGE_ARRAY;
}

constexpr inline bool is_complex_type(LogicalType type) {
    return is_array_type(type) || type == TYPE_STRUCT || type == TYPE_MAP;
}

constexpr inline bool is_scalar_type(LogicalType type) {
    return is_integer_type(type) || is_float_type(type) || is_binary_type(type) || type == TYPE_BOOLEAN ||
           type == TYPE_NULL;
}

// Byte width of a fixed length type as stored in a column, 0 for others.
size_t get_size_of_fixed_length_type(LogicalType type);

std::string logical_type_to_string(LogicalType type);

} // namespace strata
