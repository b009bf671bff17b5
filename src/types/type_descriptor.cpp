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

#include "types/type_descriptor.h"

#include <fmt/format.h>

#include <ostream>

namespace strata {

Status TypeDescriptor::validate() const {
    switch (type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY:
        if (children.size() != 1) {
            return Status::InvalidArgument(fmt::format("{} needs one element type, got {}",
                                                       logical_type_to_string(type), children.size()));
        }
        break;
    case TYPE_MAP:
        if (children.size() != 2) {
            return Status::InvalidArgument(fmt::format("MAP needs key and value types, got {}", children.size()));
        }
        if (children[0].nullable) {
            return Status::InvalidArgument("MAP keys must not be nullable");
        }
        break;
    case TYPE_STRUCT:
        if (children.empty()) {
            return Status::NotSupported("STRUCT without fields");
        }
        if (children.size() != field_names.size()) {
            return Status::InvalidArgument(fmt::format("STRUCT has {} fields but {} names", children.size(),
                                                       field_names.size()));
        }
        break;
    case TYPE_NULL:
        if (!nullable) {
            return Status::InvalidArgument("NULL type must be nullable");
        }
        [[fallthrough]];
    default:
        if (!is_scalar_type(type)) {
            return Status::NotSupported(fmt::format("unsupported logical type {}", static_cast<int>(type)));
        }
        if (!children.empty()) {
            return Status::InvalidArgument(
                    fmt::format("scalar type {} must not have children", logical_type_to_string(type)));
        }
        return Status::OK();
    }
    for (const auto& child : children) {
        RETURN_IF_ERROR(child.validate());
    }
    return Status::OK();
}

std::string TypeDescriptor::debug_string() const {
    std::string res;
    switch (type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY:
        res = fmt::format("{}<{}>", logical_type_to_string(type), children[0].debug_string());
        break;
    case TYPE_MAP:
        res = fmt::format("MAP<{}, {}>", children[0].debug_string(), children[1].debug_string());
        break;
    case TYPE_STRUCT: {
        res = "STRUCT{";
        for (size_t i = 0; i < children.size(); ++i) {
            if (i > 0) res += ", ";
            res += fmt::format("{} {}", i < field_names.size() ? field_names[i] : "", children[i].debug_string());
        }
        res += "}";
        break;
    }
    default:
        res = logical_type_to_string(type);
        break;
    }
    if (nullable && type != TYPE_NULL) {
        res += " NULL";
    }
    return res;
}

std::ostream& operator<<(std::ostream& os, const TypeDescriptor& type) {
    os << type.debug_string();
    return os;
}

} // namespace strata
