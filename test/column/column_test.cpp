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

#include <gtest/gtest.h>

#include "column/column_helper.h"
#include "testutil/column_test_util.h"
#include "types/type_descriptor.h"

namespace strata {

using B = ColumnTestBuilder;

// NOLINTNEXTLINE
TEST(ColumnTest, test_fixed_length_column) {
    auto column = Int32Column::create();
    column->append(1);
    column->append(2);
    column->append_default();
    column->append_value_multiple_times(7, 3);
    ASSERT_EQ(6, column->size());
    ASSERT_EQ(24, column->byte_size());
    ASSERT_EQ("[1, 2, 0, 7, 7, 7]", column->debug_string());
    ASSERT_EQ("int32", column->get_name());

    auto other = Int32Column::create();
    other->append(*column, 1, 3);
    ASSERT_EQ("[2, 0, 7]", other->debug_string());
    ASSERT_TRUE(other->equals(0, *column, 1));
    ASSERT_FALSE(other->equals(0, *column, 0));
}

// NOLINTNEXTLINE
TEST(ColumnTest, test_binary_column) {
    auto column = BinaryColumn::create();
    column->append_string("abc");
    column->append_string("");
    column->append(Slice("de"));
    ASSERT_EQ(3, column->size());
    ASSERT_EQ(Slice("de"), column->get_slice(2));
    ASSERT_EQ(0, column->get_slice(1).size);
    ASSERT_FALSE(column->is_large_binary());

    auto large = LargeBinaryColumn::create();
    large->append(*B::large_strings({"x", "yy", "zzz"}), 1, 2);
    ASSERT_TRUE(large->is_large_binary());
    ASSERT_EQ(2, large->size());
    ASSERT_EQ(Slice("zzz"), large->get_slice(1));
    ASSERT_EQ(0, large->get_offset()[0]);
    ASSERT_EQ(5, large->get_offset()[2]);
}

// NOLINTNEXTLINE
TEST(ColumnTest, test_nullable_column) {
    auto column = NullableColumn::create(Int64Column::create(), NullColumn::create());
    ASSERT_FALSE(column->has_null());
    column->append(*B::fixed<int64_t>({10, 20}));
    column->append_nulls(2);
    column->append(*B::nullable(B::fixed<int64_t>({30, 0}), {0, 1}));
    ASSERT_EQ(6, column->size());
    ASSERT_TRUE(column->has_null());
    ASSERT_EQ(3, column->null_count());
    ASSERT_EQ("[10, 20, NULL, NULL, 30, NULL]", column->debug_string());
    ASSERT_TRUE(column->is_null(2));
    ASSERT_FALSE(column->is_null(4));

    // null rows compare equal whatever their data
    auto other = B::nullable(B::fixed<int64_t>({99}), {1});
    ASSERT_TRUE(column->equals(2, *other, 0));
    ASSERT_FALSE(column->equals(0, *other, 0));
}

// NOLINTNEXTLINE
TEST(ColumnTest, test_array_column) {
    // [[1, 2], [], [3]]
    auto column = B::array(B::fixed<int32_t>({1, 2, 3}), {0, 2, 2, 3});
    ASSERT_EQ(3, column->size());
    ASSERT_EQ("[[1,2], [], [3]]", column->debug_string());

    auto* array = ColumnHelper::as_raw_column<ArrayColumn>(column);
    ASSERT_EQ(2, array->get_element_size(0));
    ASSERT_EQ(0, array->get_element_size(1));

    auto copy = ArrayColumn::create(Int32Column::create());
    copy->append(*column, 1, 2);
    ASSERT_EQ("[[], [3]]", copy->debug_string());
    ASSERT_EQ(1, copy->elements_column()->size());
    copy->append_default();
    ASSERT_EQ(3, copy->size());
    ASSERT_EQ(0, copy->get_element_size(2));
}

// NOLINTNEXTLINE
TEST(ColumnTest, test_struct_and_map_column) {
    auto st = B::structs({B::fixed<int32_t>({1, 2}), B::strings({"a", "b"})}, {"id", "name"});
    ASSERT_EQ(2, st->size());
    ASSERT_EQ(2, ColumnHelper::as_raw_column<StructColumn>(st)->fields().size());
    st->append_default();
    ASSERT_EQ(3, st->size());

    // {1: "x", 2: "y"}, {}
    auto map = B::map(B::fixed<int32_t>({1, 2}), B::strings({"x", "y"}), {0, 2, 2});
    ASSERT_EQ(2, map->size());
    auto* m = ColumnHelper::as_raw_column<MapColumn>(map);
    ASSERT_EQ(2, m->get_map_size(0));
    ASSERT_EQ(0, m->get_map_size(1));
    ASSERT_TRUE(map->equals(0, *map, 0));
    ASSERT_FALSE(map->equals(0, *map, 1));
}

// NOLINTNEXTLINE
TEST(ColumnTest, test_null_type_column) {
    auto column = NullTypeColumn::create(3);
    ASSERT_EQ(3, column->size());
    ASSERT_TRUE(column->only_null());
    column->append_nulls(2);
    ASSERT_EQ(5, column->size());
    ASSERT_EQ(0, column->byte_size());
    ASSERT_EQ("NULL", column->debug_item(4));
}

// NOLINTNEXTLINE
TEST(ColumnTest, test_create_column) {
    auto int_type = TypeDescriptor::from_logical_type(TYPE_INT, true);
    auto list_type = TypeDescriptor::create_array_type(int_type, true);
    auto column = ColumnHelper::create_column(list_type);
    ASSERT_TRUE(column->is_nullable());
    const auto* data = ColumnHelper::get_data_column(column.get());
    ASSERT_TRUE(data->is_array());
    ASSERT_TRUE(static_cast<const ArrayColumn*>(data)->elements_column()->is_nullable());
    ASSERT_TRUE(ColumnHelper::check_column_type(*column, list_type).ok());

    auto null_column = ColumnHelper::create_column(TypeDescriptor::from_logical_type(TYPE_NULL));
    ASSERT_TRUE(null_column->only_null());
}

// NOLINTNEXTLINE
TEST(ColumnTest, test_check_column_type) {
    auto int_type = TypeDescriptor::from_logical_type(TYPE_INT);
    ASSERT_TRUE(ColumnHelper::check_column_type(*B::fixed<int32_t>({1}), int_type).ok());
    ASSERT_TRUE(ColumnHelper::check_column_type(*B::fixed<int64_t>({1}), int_type).is_invalid_argument());
    // a nullable column needs a nullable type
    ASSERT_TRUE(ColumnHelper::check_column_type(*B::nullable(B::fixed<int32_t>({1}), {0}), int_type)
                        .is_invalid_argument());
    // the other way around is fine
    ASSERT_TRUE(ColumnHelper::check_column_type(*B::fixed<int32_t>({1}), TypeDescriptor(TYPE_INT, true)).ok());

    auto st_type = TypeDescriptor::create_struct_type({"a", "b"}, {int_type, int_type});
    auto st = B::structs({B::fixed<int32_t>({1})}, {"a"});
    ASSERT_TRUE(ColumnHelper::check_column_type(*st, st_type).is_invalid_argument());
}

// NOLINTNEXTLINE
TEST(ColumnTest, test_validate_type) {
    auto int_type = TypeDescriptor::from_logical_type(TYPE_INT);
    ASSERT_TRUE(TypeDescriptor::create_array_type(int_type).validate().ok());
    ASSERT_TRUE(TypeDescriptor::create_map_type(int_type, int_type).validate().ok());
    // map keys are never null
    ASSERT_FALSE(TypeDescriptor::create_map_type(TypeDescriptor(TYPE_INT, true), int_type).validate().ok());
    // a struct needs fields
    ASSERT_FALSE(TypeDescriptor::create_struct_type({}, {}).validate().ok());
    // one name per field
    ASSERT_FALSE(TypeDescriptor::create_struct_type({"a"}, {int_type, int_type}).validate().ok());

    TypeDescriptor bad_array(TYPE_ARRAY);
    ASSERT_FALSE(bad_array.validate().ok());
}

} // namespace strata
