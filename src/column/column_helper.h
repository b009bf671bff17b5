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

#include "column/column.h"
#include "column/nullable_column.h"
#include "common/status.h"
#include "types/type_descriptor.h"

namespace strata {

class ColumnHelper {
public:
    // Create an empty column for |type|. Nullable types other than the NULL type are
    // wrapped in a NullableColumn.
    static ColumnPtr create_column(const TypeDescriptor& type);

    // Check that |column| has the shape |type| describes, recursively. A plain
    // column passes for a nullable type unless |exact| is set, then it must be
    // the column create_column(type) builds.
    static Status check_column_type(const Column& column, const TypeDescriptor& type, bool exact = false);

    template <typename T>
    static inline T* as_raw_column(const ColumnPtr& value) {
        return static_cast<T*>(value.get());
    }

    template <typename T>
    static inline const T& as_column(const Column& value) {
        return static_cast<const T&>(value);
    }

    // Strip the nullable wrapper, if any.
    static const Column* get_data_column(const Column* column) {
        if (column->is_nullable()) {
            return static_cast<const NullableColumn*>(column)->data_column().get();
        }
        return column;
    }

    static ColumnPtr get_data_column(const ColumnPtr& column) {
        if (column->is_nullable()) {
            return static_cast<const NullableColumn*>(column.get())->data_column();
        }
        return column;
    }
};

} // namespace strata
