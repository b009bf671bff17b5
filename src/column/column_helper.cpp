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

#include "column/column_helper.h"

#include <fmt/format.h>

#include "column/array_column.h"
#include "column/map_column.h"
#include "column/null_type_column.h"
#include "column/struct_column.h"
#include "column/type_traits.h"
#include "types/logical_type_infra.h"

namespace strata {

static ColumnPtr create_data_column(const TypeDescriptor& type) {
    switch (type.type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY:
        return ArrayColumn::create(ColumnHelper::create_column(type.children[0]));
    case TYPE_MAP:
        return MapColumn::create(ColumnHelper::create_column(type.children[0]),
                                 ColumnHelper::create_column(type.children[1]));
    case TYPE_STRUCT: {
        Columns fields;
        for (const auto& child : type.children) {
            fields.emplace_back(ColumnHelper::create_column(child));
        }
        return StructColumn::create(std::move(fields), type.field_names);
    }
    default:
        return type_dispatch_basic(type.type, []<LogicalType LT>() -> ColumnPtr {
            return RunTimeColumnType<LT>::create();
        });
    }
}

ColumnPtr ColumnHelper::create_column(const TypeDescriptor& type) {
    if (type.type == TYPE_NULL) {
        return NullTypeColumn::create();
    }
    auto data = create_data_column(type);
    if (type.nullable) {
        return NullableColumn::create(std::move(data), NullColumn::create());
    }
    return data;
}

template <LogicalType LT>
static bool is_column_of(const Column& column) {
    return dynamic_cast<const RunTimeColumnType<LT>*>(&column) != nullptr;
}

Status ColumnHelper::check_column_type(const Column& column, const TypeDescriptor& type, bool exact) {
    if (type.type == TYPE_NULL) {
        if (!column.only_null()) {
            return Status::InvalidArgument(fmt::format("expect null column, got {}", column.get_name()));
        }
        return Status::OK();
    }
    if (column.is_nullable() && !type.nullable) {
        return Status::InvalidArgument(
                fmt::format("column {} is nullable but {} is not", column.get_name(), type.debug_string()));
    }
    if (exact && type.nullable && !column.is_nullable()) {
        return Status::InvalidArgument(
                fmt::format("column {} is not nullable but {} is", column.get_name(), type.debug_string()));
    }
    const Column* data = get_data_column(&column);
    switch (type.type) {
    case TYPE_ARRAY:
    case TYPE_LARGE_ARRAY:
        if (!data->is_array()) break;
        return check_column_type(*as_column<ArrayColumn>(*data).elements_column(), type.children[0], exact);
    case TYPE_MAP: {
        if (!data->is_map()) break;
        const auto& map = as_column<MapColumn>(*data);
        RETURN_IF_ERROR(check_column_type(*map.keys_column(), type.children[0], exact));
        return check_column_type(*map.values_column(), type.children[1], exact);
    }
    case TYPE_STRUCT: {
        if (!data->is_struct()) break;
        const auto& st = as_column<StructColumn>(*data);
        if (st.fields().size() != type.children.size()) {
            return Status::InvalidArgument(fmt::format("struct column has {} fields, type {} has {}",
                                                       st.fields().size(), type.debug_string(),
                                                       type.children.size()));
        }
        for (size_t i = 0; i < type.children.size(); ++i) {
            RETURN_IF_ERROR(check_column_type(*st.fields()[i], type.children[i], exact));
        }
        return Status::OK();
    }
    default:
        if (!is_scalar_type(type.type)) break;
        if (type_dispatch_basic(type.type, [&]<LogicalType LT>() { return is_column_of<LT>(*data); })) {
            return Status::OK();
        }
        break;
    }
    return Status::InvalidArgument(
            fmt::format("column {} does not match type {}", column.get_name(), type.debug_string()));
}

} // namespace strata
