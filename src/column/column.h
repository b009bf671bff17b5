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

#include <memory>
#include <string>

#include "column/vectorized_fwd.h"

namespace strata {

// Column is the in-memory representation of a sequence of values of one type.
// Concrete columns own their buffers; columns are shared through ColumnPtr.
class Column {
public:
    virtual ~Column() = default;

    // Only the null type column holds nothing but nulls.
    virtual bool only_null() const { return false; }

    virtual bool is_nullable() const { return false; }

    virtual bool has_null() const { return false; }

    virtual bool is_null(size_t idx) const { return false; }

    virtual bool is_binary() const { return false; }

    virtual bool is_large_binary() const { return false; }

    virtual bool is_array() const { return false; }

    virtual bool is_map() const { return false; }

    virtual bool is_struct() const { return false; }

    virtual size_t size() const = 0;

    bool empty() const { return size() == 0; }

    // Size of the column data in bytes, not counting unused capacity.
    virtual size_t byte_size() const = 0;

    virtual void reserve(size_t n) = 0;

    // Append |count| elements from |src|, started from the offset |offset|.
    // |src| must have the same concrete type as this column, except that a
    // nullable column also accepts its non-nullable data type.
    virtual void append(const Column& src, size_t offset, size_t count) = 0;

    void append(const Column& src) { append(src, 0, src.size()); }

    // Append multiple `null` values into this column.
    // Return false if this is a non-nullable column, i.e, if `is_nullable` return false.
    virtual bool append_nulls(size_t count) { return false; }

    // Append a default value into this column.
    // NOTE: The default value is `null` for nullable column, an empty array for
    // array column and a row of defaults for struct column.
    virtual void append_default() = 0;

    virtual void append_default(size_t count) = 0;

    virtual ColumnPtr clone_empty() const = 0;

    // Compare the value at |left| with the value at |right| of |rhs|. Data hidden
    // under a null is not compared.
    virtual bool equals(size_t left, const Column& rhs, size_t right) const = 0;

    virtual std::string get_name() const = 0;

    virtual std::string debug_item(size_t idx) const = 0;

    virtual std::string debug_string() const;
};

// ColumnFactory is a CRTP helper that provides a create() for every column class.
template <typename Base, typename Derived>
class ColumnFactory : public Base {
public:
    using Base::Base;
    using Ptr = std::shared_ptr<Derived>;

    template <typename... Args>
    static Ptr create(Args&&... args) {
        return std::make_shared<Derived>(std::forward<Args>(args)...);
    }
};

} // namespace strata
