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

#include <iosfwd>
#include <string>
#include <vector>

#include "common/status.h"
#include "types/logical_type.h"

namespace strata {

// Describes a column type: the logical type, whether the node may hold nulls, and
// the children of nested types. Every node carries its own nullability.
struct TypeDescriptor {
    LogicalType type{TYPE_UNKNOWN};

    bool nullable{false};

    /// Empty for scalar types. One element for arrays, key and value for maps and
    /// one per field for structs.
    std::vector<TypeDescriptor> children;

    /// Only set if type == TYPE_STRUCT. The field name of each child.
    std::vector<std::string> field_names;

    TypeDescriptor() = default;

    explicit TypeDescriptor(LogicalType type, bool nullable = false) : type(type), nullable(nullable) {}

    static TypeDescriptor from_logical_type(LogicalType type, bool nullable = false) {
        // The null type only ever holds nulls.
        return TypeDescriptor(type, nullable || type == TYPE_NULL);
    }

    static TypeDescriptor create_array_type(const TypeDescriptor& element, bool nullable = false) {
        TypeDescriptor res(TYPE_ARRAY, nullable);
        res.children.push_back(element);
        return res;
    }

    static TypeDescriptor create_large_array_type(const TypeDescriptor& element, bool nullable = false) {
        TypeDescriptor res(TYPE_LARGE_ARRAY, nullable);
        res.children.push_back(element);
        return res;
    }

    static TypeDescriptor create_map_type(const TypeDescriptor& key, const TypeDescriptor& value,
                                          bool nullable = false) {
        TypeDescriptor res(TYPE_MAP, nullable);
        res.children.push_back(key);
        res.children.push_back(value);
        return res;
    }

    static TypeDescriptor create_struct_type(const std::vector<std::string>& field_names,
                                             const std::vector<TypeDescriptor>& field_types, bool nullable = false) {
        TypeDescriptor res(TYPE_STRUCT, nullable);
        res.field_names = field_names;
        res.children = field_types;
        return res;
    }

    bool is_complex_type() const { return strata::is_complex_type(type); }

    bool is_binary_type() const { return strata::is_binary_type(type); }

    // Checks the shape of the tree: child counts, field names, non-nullable map keys.
    Status validate() const;

    std::string debug_string() const;

    bool operator==(const TypeDescriptor& o) const {
        return type == o.type && nullable == o.nullable && children == o.children && field_names == o.field_names;
    }

    bool operator!=(const TypeDescriptor& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const TypeDescriptor& type);

} // namespace strata
