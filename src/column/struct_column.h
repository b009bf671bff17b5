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

#include <string>
#include <vector>

#include "column/column.h"

namespace strata {

// One column per field, all of the same size.
class StructColumn final : public ColumnFactory<Column, StructColumn> {
public:
    StructColumn(Columns fields, std::vector<std::string> field_names);

    bool is_struct() const override { return true; }

    size_t size() const override { return _fields[0]->size(); }

    size_t byte_size() const override;

    void reserve(size_t n) override;

    using Column::append;

    void append(const Column& src, size_t offset, size_t count) override;

    void append_default() override;

    void append_default(size_t count) override;

    ColumnPtr clone_empty() const override;

    bool equals(size_t left, const Column& rhs, size_t right) const override;

    std::string get_name() const override { return "struct"; }

    std::string debug_item(size_t idx) const override;

    const Columns& fields() const { return _fields; }
    Columns& fields_column() { return _fields; }

    const ColumnPtr& field_column(size_t idx) const { return _fields[idx]; }

    const std::vector<std::string>& field_names() const { return _field_names; }

private:
    Columns _fields;
    std::vector<std::string> _field_names;
};

} // namespace strata
