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

#include "storage/column_meta.h"

#include <gtest/gtest.h>

namespace strata {

class ColumnMetaTest : public testing::Test {
protected:
    void SetUp() override {
        ColumnMetaPB pb;
        pb.set_offset(100);
        pb.set_column_name("c1");
        for (uint64_t len : {10, 20, 30}) {
            auto* page = pb.add_pages();
            page->set_length(len);
            page->set_num_values(len / 10);
        }
        pb.set_num_rows(6);
        _meta = ColumnMeta(std::move(pb));
    }

    ColumnMeta _meta;
};

// NOLINTNEXTLINE
TEST_F(ColumnMetaTest, test_basic) {
    ASSERT_EQ(3, _meta.num_pages());
    ASSERT_EQ(100, _meta.offset());
    ASSERT_EQ(6, _meta.num_rows());
    ASSERT_EQ(60 + 3 * kPagePrefixSize, _meta.total_len());
    ASSERT_EQ("c1", _meta.column_name());
    ASSERT_EQ("column c1 at 100: 3 pages, 6 rows, 72 bytes", _meta.debug_string());
}

// NOLINTNEXTLINE
TEST_F(ColumnMetaTest, test_slice) {
    auto res = _meta.slice(1, 3);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    const ColumnMeta& tail = res.value();
    ASSERT_EQ(2, tail.num_pages());
    ASSERT_EQ(100 + kPagePrefixSize + 10, tail.offset());
    ASSERT_EQ(5, tail.num_rows());
    ASSERT_EQ(5, tail.pb().num_rows());
    ASSERT_EQ(20, tail.page(0).length());
    ASSERT_EQ("c1", tail.column_name());

    auto empty = _meta.slice(2, 2);
    ASSERT_TRUE(empty.ok());
    ASSERT_EQ(0, empty.value().num_pages());
    ASSERT_EQ(0, empty.value().total_len());

    ASSERT_TRUE(_meta.slice(2, 1).status().is_invalid_argument());
    ASSERT_TRUE(_meta.slice(0, 4).status().is_invalid_argument());
}

// NOLINTNEXTLINE
TEST_F(ColumnMetaTest, test_skip_one_page) {
    ASSERT_TRUE(_meta.skip_one_page().ok());
    ASSERT_EQ(2, _meta.num_pages());
    ASSERT_EQ(114, _meta.offset());
    ASSERT_EQ(5, _meta.pb().num_rows());

    ASSERT_TRUE(_meta.skip_one_page().ok());
    ASSERT_TRUE(_meta.skip_one_page().ok());
    ASSERT_EQ(0, _meta.num_pages());
    ASSERT_EQ(100 + 60 + 3 * kPagePrefixSize, _meta.offset());
    ASSERT_EQ(0, _meta.pb().num_rows());
    ASSERT_TRUE(_meta.skip_one_page().is_end_of_file());
}

// NOLINTNEXTLINE
TEST_F(ColumnMetaTest, test_serialize) {
    std::string buf;
    ASSERT_TRUE(_meta.pb().SerializeToString(&buf));
    ColumnMetaPB pb;
    ASSERT_TRUE(pb.ParseFromString(buf));
    ColumnMeta parsed(std::move(pb));
    ASSERT_EQ(_meta.debug_string(), parsed.debug_string());
}

} // namespace strata
