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

#include "types/logical_type.h"

namespace strata {

size_t get_size_of_fixed_length_type(LogicalType type) {
    switch (type) {
    case TYPE_BOOLEAN:
    case TYPE_TINYINT:
    case TYPE_UNSIGNED_TINYINT:
        return 1;
    case TYPE_SMALLINT:
    case TYPE_UNSIGNED_SMALLINT:
        return 2;
    case TYPE_INT:
    case TYPE_UNSIGNED_INT:
    case TYPE_FLOAT:
        return 4;
    case TYPE_BIGINT:
    case TYPE_UNSIGNED_BIGINT:
    case TYPE_DOUBLE:
        return 8;
    default:
        return 0;
    }
}

std::string logical_type_to_string(LogicalType type) {
    switch (type) {
    case TYPE_TINYINT:
        return "TINYINT";
    case TYPE_UNSIGNED_TINYINT:
        return "UNSIGNED_TINYINT";
    case TYPE_SMALLINT:
        return "SMALLINT";
    case TYPE_UNSIGNED_SMALLINT:
        return "UNSIGNED_SMALLINT";
    case TYPE_INT:
        return "INT";
    case TYPE_UNSIGNED_INT:
        return "UNSIGNED_INT";
    case TYPE_BIGINT:
        return "BIGINT";
    case TYPE_UNSIGNED_BIGINT:
        return "UNSIGNED_BIGINT";
    case TYPE_FLOAT:
        return "FLOAT";
    case TYPE_DOUBLE:
        return "DOUBLE";
    case TYPE_BOOLEAN:
        return "BOOLEAN";
    case TYPE_VARCHAR:
        return "VARCHAR";
    case TYPE_VARBINARY:
        return "VARBINARY";
    case TYPE_LARGE_VARCHAR:
        return "LARGE_VARCHAR";
    case TYPE_LARGE_VARBINARY:
        return "LARGE_VARBINARY";
    case TYPE_ARRAY:
        return "ARRAY";
    case TYPE_LARGE_ARRAY:
        return "LARGE_ARRAY";
    case TYPE_STRUCT:
        return "STRUCT";
    case TYPE_MAP:
        return "MAP";
    case TYPE_NULL:
        return "NULL";
    case TYPE_UNKNOWN:
        break;
    }
    return "UNKNOWN";
}

} // namespace strata
