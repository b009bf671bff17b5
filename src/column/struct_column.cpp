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

#include "column/struct_column.h"

#include "common/logging.h"

namespace strata {

StructColumn::StructColumn(Columns fields, std::vector<std::string> field_names)
        : _fields(std::move(fields)), _field_names(std::move(field_names)) {
    DCHECK(!_fields.empty());
    DCHECK_EQ(_fields.size(), _field_names.size());
#ifndef NDEBUG
    for (const auto& field : _fields) {
        DCHECK_EQ(field->size(), _fields[0]->size());
    }
#endif
}

size_t StructColumn::byte_size() const {
    size_t total = 0;
    for (const auto& field : _fields) {
        total += field->byte_size();
    }
    return total;
}

void StructColumn::reserve(size_t n) {
    for (const auto& field : _fields) {
        field->reserve(n);
    }
}

void StructColumn::append(const Column& src, size_t offset, size_t count) {
    const auto& other = static_cast<const StructColumn&>(src);
    DCHECK_EQ(_fields.size(), other._fields.size());
    for (size_t i = 0; i < _fields.size(); ++i) {
        _fields[i]->append(*other._fields[i], offset, count);
    }
}

void StructColumn::append_default() {
    for (const auto& field : _fields) {
        field->append_default();
    }
}

void StructColumn::append_default(size_t count) {
    for (const auto& field : _fields) {
        field->append_default(count);
    }
}

ColumnPtr StructColumn::clone_empty() const {
    Columns fields;
    fields.reserve(_fields.size());
    for (const auto& field : _fields) {
        fields.emplace_back(field->clone_empty());
    }
    return create(std::move(fields), _field_names);
}

bool StructColumn::equals(size_t left, const Column& rhs, size_t right) const {
    const auto& other = static_cast<const StructColumn&>(rhs);
    if (_fields.size() != other._fields.size()) {
        return false;
    }
    for (size_t i = 0; i < _fields.size(); ++i) {
        if (!_fields[i]->equals(left, *other._fields[i], right)) {
            return false;
        }
    }
    return true;
}

std::string StructColumn::debug_item(size_t idx) const {
    std::string res("{");
    for (size_t i = 0; i < _fields.size(); ++i) {
        if (i > 0) {
            res.append(",");
        }
        res.append(_field_names[i]).append(":").append(_fields[i]->debug_item(idx));
    }
    res.append("}");
    return res;
}

} // namespace strata
