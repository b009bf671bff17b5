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

#include "storage/page/nested_shredder.h"

#include <gtest/gtest.h>

#include "column/column_helper.h"
#include "testutil/column_test_util.h"

namespace strata {

using B = ColumnTestBuilder;
using T = TypeDescriptor;

class NestedShredderTest : public testing::Test {
protected:
    // Copy the selected rows of every leaf into dense columns, as a page stores them.
    static Columns dense_leaves(const ShreddedColumn& shredded) {
        Columns leaves;
        for (const auto& leaf : shredded.leaves) {
            auto dense = leaf.column->clone_empty();
            for (uint32_t row : leaf.selection) {
                dense->append(*leaf.column, row, 1);
            }
            leaves.push_back(std::move(dense));
        }
        return leaves;
    }

    static void check_round_trip(const T& type, const ColumnPtr& column) {
        NestedShredder shredder(type);
        ShreddedColumn shredded;
        Status st = shredder.shred(*column, 0, column->size(), &shredded);
        ASSERT_TRUE(st.ok()) << st.to_string();
        ASSERT_EQ(column->size(), shredded.num_rows);
        ASSERT_EQ(count_offsets(*column), shredded.num_offsets);

        Columns leaves = dense_leaves(shredded);
        auto dst = ColumnHelper::create_column(type);
        size_t num_rows = 0;
        NestedAssembler assembler(type, shredded.rep_levels, shredded.def_levels, leaves);
        st = assembler.assemble(shredded.num_offsets, dst.get(), &num_rows);
        ASSERT_TRUE(st.ok()) << st.to_string();
        ASSERT_EQ(column->size(), num_rows);
        assert_column_equals(*column, *dst);
    }

    // [[1,2],[],null,[3]]
    static ColumnPtr nullable_int_lists() {
        return B::nullable(B::array(B::fixed<int32_t>({1, 2, 3}), {0, 2, 2, 2, 3}), {0, 0, 1, 0});
    }
};

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_level_info) {
    auto list = T::create_array_type(T::from_logical_type(TYPE_INT), true);
    auto info = NestedLevelInfo::from_type(list);
    ASSERT_EQ(1, info.max_rep_level);
    ASSERT_EQ(2, info.max_def_level);
    ASSERT_EQ(1, info.num_offsets_arrays);
    ASSERT_EQ(1, info.leaves.size());

    auto nested = T::create_map_type(
            T::from_logical_type(TYPE_VARCHAR),
            T::create_array_type(T::create_struct_type({"a", "b"}, {T::from_logical_type(TYPE_INT, true),
                                                                    T::from_logical_type(TYPE_DOUBLE)}),
                                 true));
    info = NestedLevelInfo::from_type(nested);
    ASSERT_EQ(2, info.max_rep_level);
    // map entry, present list, list element, nullable a
    ASSERT_EQ(4, info.max_def_level);
    ASSERT_EQ(2, info.num_offsets_arrays);
    ASSERT_EQ(3, info.leaves.size());
    ASSERT_EQ(TYPE_VARCHAR, info.leaves[0]->type);
    ASSERT_EQ(TYPE_INT, info.leaves[1]->type);
    ASSERT_EQ(TYPE_DOUBLE, info.leaves[2]->type);
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_nullable_list_levels) {
    auto type = T::create_array_type(T::from_logical_type(TYPE_INT), true);
    auto column = nullable_int_lists();

    NestedShredder shredder(type);
    ShreddedColumn shredded;
    ASSERT_TRUE(shredder.shred(*column, 0, column->size(), &shredded).ok());
    ASSERT_EQ(Levels({0, 1, 0, 0, 0}), shredded.rep_levels);
    ASSERT_EQ(Levels({2, 2, 1, 0, 2}), shredded.def_levels);
    ASSERT_EQ(1, shredded.leaves.size());
    ASSERT_EQ(std::vector<uint32_t>({0, 1, 2}), shredded.leaves[0].selection);
    ASSERT_EQ(5, shredded.num_offsets);

    check_round_trip(type, column);
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_map_levels) {
    auto type = T::create_map_type(T::from_logical_type(TYPE_INT), T::from_logical_type(TYPE_VARCHAR, true));
    // {1:"a", 2:null}, {}
    auto column = B::map(B::fixed<int32_t>({1, 2}), B::nullable(B::strings({"a", ""}), {0, 1}), {0, 2, 2});

    NestedShredder shredder(type);
    ASSERT_EQ(1, shredder.level_info().max_rep_level);
    ASSERT_EQ(2, shredder.level_info().max_def_level);

    ShreddedColumn shredded;
    ASSERT_TRUE(shredder.shred(*column, 0, column->size(), &shredded).ok());
    ASSERT_EQ(Levels({0, 1, 1, 1, 0}), shredded.rep_levels);
    ASSERT_EQ(Levels({1, 2, 1, 1, 0}), shredded.def_levels);
    ASSERT_EQ(2, shredded.leaves.size());
    ASSERT_EQ(std::vector<uint32_t>({0, 1}), shredded.leaves[0].selection);
    ASSERT_EQ(std::vector<uint32_t>({0}), shredded.leaves[1].selection);

    check_round_trip(type, column);
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_list_of_struct_levels) {
    auto type = T::create_array_type(
            T::create_struct_type({"a", "b"}, {T::from_logical_type(TYPE_INT), T::from_logical_type(TYPE_INT, true)}));
    // [{1,2},{3,null}]
    auto column = B::array(
            B::structs({B::fixed<int32_t>({1, 3}), B::nullable(B::fixed<int32_t>({2, 0}), {0, 1})}, {"a", "b"}),
            {0, 2});

    NestedShredder shredder(type);
    ShreddedColumn shredded;
    ASSERT_TRUE(shredder.shred(*column, 0, column->size(), &shredded).ok());
    // the second field repeats at the depth of the enclosing list
    ASSERT_EQ(Levels({0, 1, 1, 1}), shredded.rep_levels);
    ASSERT_EQ(Levels({1, 2, 1, 1}), shredded.def_levels);

    check_round_trip(type, column);
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_struct_with_null_field) {
    auto type = T::create_struct_type({"a", "b"},
                                      {T::from_logical_type(TYPE_BIGINT), T::from_logical_type(TYPE_BIGINT, true)});
    auto column = B::structs({B::fixed<int64_t>({1, 2, 3}), B::nullable(B::fixed<int64_t>({0, 0, 0}), {1, 1, 1})},
                             {"a", "b"});

    NestedShredder shredder(type);
    ShreddedColumn shredded;
    ASSERT_TRUE(shredder.shred(*column, 0, column->size(), &shredded).ok());
    ASSERT_EQ(Levels(6, 0), shredded.rep_levels);
    ASSERT_EQ(Levels(6, 0), shredded.def_levels);
    ASSERT_EQ(3, shredded.leaves[0].selection.size());
    ASSERT_TRUE(shredded.leaves[1].selection.empty());
    ASSERT_EQ(0, shredded.num_offsets);

    check_round_trip(type, column);
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_deep_nesting_round_trip) {
    // nullable list<nullable list<nullable string>>
    auto type = T::create_array_type(
            T::create_array_type(T::from_logical_type(TYPE_VARCHAR, true), true), true);
    auto strings = B::nullable(B::strings({"a", "", "bc", "d"}), {0, 1, 0, 0});
    auto inner = B::nullable(B::array(strings, {0, 2, 2, 2, 4}), {0, 0, 1, 0});
    // [["a",null],[]], null, [], [null list, ["bc","d"]]
    auto column = B::nullable(B::array(inner, {0, 2, 2, 2, 4}), {0, 1, 0, 0});
    check_round_trip(type, column);

    auto map_type = T::create_map_type(
            T::from_logical_type(TYPE_INT),
            T::create_struct_type({"x", "y"}, {T::create_array_type(T::from_logical_type(TYPE_DOUBLE), true),
                                               T::from_logical_type(TYPE_BOOLEAN, true)}),
            true);
    auto values = B::structs({B::nullable(B::array(B::fixed<double>({1.5, 2.5}), {0, 2, 2, 2}), {0, 1, 0}),
                              B::nullable(B::fixed<uint8_t>({1, 0, 0}), {0, 0, 1})},
                             {"x", "y"});
    auto map = B::nullable(B::map(B::fixed<int32_t>({7, 8, 9}), values, {0, 2, 2, 3, 3}), {0, 0, 0, 1});
    check_round_trip(map_type, map);
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_shred_range) {
    auto type = T::create_array_type(T::from_logical_type(TYPE_INT), true);
    auto column = nullable_int_lists();

    NestedShredder shredder(type);
    ShreddedColumn shredded;
    ASSERT_TRUE(shredder.shred(*column, 1, 3, &shredded).ok());
    ASSERT_EQ(Levels({0, 0, 0}), shredded.rep_levels);
    ASSERT_EQ(Levels({1, 0, 2}), shredded.def_levels);
    ASSERT_EQ(std::vector<uint32_t>({2}), shredded.leaves[0].selection);
    ASSERT_EQ(4, shredded.num_offsets);
    ASSERT_EQ(3, shredded.num_rows);

    Status st = shredder.shred(*column, 2, 3, &shredded);
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_shred_rejects_bad_input) {
    auto flat = T::from_logical_type(TYPE_INT);
    NestedShredder flat_shredder(flat);
    ShreddedColumn shredded;
    ASSERT_TRUE(flat_shredder.shred(*B::fixed<int32_t>({1}), 0, 1, &shredded).is_invalid_argument());

    auto type = T::create_array_type(T::from_logical_type(TYPE_INT));
    NestedShredder shredder(type);
    ASSERT_FALSE(shredder.shred(*B::fixed<int32_t>({1}), 0, 1, &shredded).ok());
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_assemble_corruption) {
    auto type = T::create_array_type(T::from_logical_type(TYPE_INT), true);
    Columns leaves{B::fixed<int32_t>({1, 2, 3})};
    const Levels rep{0, 1, 0, 0, 0};
    const Levels def{2, 2, 1, 0, 2};

    auto assemble = [&](const Levels& r, const Levels& d, const Columns& l, size_t offsets) {
        auto dst = ColumnHelper::create_column(type);
        size_t num_rows = 0;
        NestedAssembler assembler(type, r, d, l);
        return assembler.assemble(offsets, dst.get(), &num_rows);
    };

    ASSERT_TRUE(assemble(rep, def, leaves, 5).ok());
    // streams of different length
    ASSERT_TRUE(assemble(rep, Levels{2, 2, 1, 0}, leaves, 5).is_corruption());
    // a row that starts with a repeated slot
    ASSERT_TRUE(assemble(Levels{1, 1, 0, 0, 0}, def, leaves, 5).is_corruption());
    // a leaf above the max definition level
    ASSERT_TRUE(assemble(rep, Levels{2, 3, 1, 0, 2}, leaves, 5).is_corruption());
    // too few and too many values
    ASSERT_TRUE(assemble(rep, def, Columns{B::fixed<int32_t>({1, 2})}, 5).is_corruption());
    ASSERT_TRUE(assemble(rep, def, Columns{B::fixed<int32_t>({1, 2, 3, 4})}, 5).is_corruption());
    // wrong number of leaves
    ASSERT_TRUE(assemble(rep, def, Columns{}, 5).is_corruption());
    // offsets the page did not declare
    ASSERT_TRUE(assemble(rep, def, leaves, 6).is_corruption());
}

// NOLINTNEXTLINE
TEST_F(NestedShredderTest, test_count_offsets) {
    ASSERT_EQ(0, count_offsets(*B::fixed<int32_t>({1, 2})));
    ASSERT_EQ(5, count_offsets(*nullable_int_lists()));

    auto nested = B::array(B::array(B::fixed<int32_t>({1, 2, 3}), {0, 1, 3}), {0, 2, 2});
    // outer 2 rows, inner 2 rows
    ASSERT_EQ(6, count_offsets(*nested));

    auto map = B::map(B::fixed<int32_t>({1}), B::array(B::fixed<int32_t>({4}), {0, 1}), {0, 1});
    ASSERT_EQ(4, count_offsets(*map));
}

} // namespace strata
