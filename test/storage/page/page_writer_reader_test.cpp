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

#include <limits>

#include "column/column_helper.h"
#include "storage/compression/page_codec.h"
#include "storage/page/level_codec.h"
#include "storage/page/page_reader.h"
#include "storage/page/page_writer.h"
#include "storage/page/values_codec.h"
#include "testutil/column_test_util.h"
#include "util/coding.h"

namespace strata {

using B = ColumnTestBuilder;
using T = TypeDescriptor;

class PageWriterReaderTest : public testing::Test {
protected:
    static PageWriterOptions fixed_codec(CodecTypePB codec) {
        PageWriterOptions options;
        options.codec = codec;
        return options;
    }

    static void check_round_trip(const T& type, const ColumnPtr& column,
                                 const PageWriterOptions& options = PageWriterOptions()) {
        faststring page;
        PageWriteInfo info;
        Status st = PageWriter::write(*column, type, options, &page, &info);
        ASSERT_TRUE(st.ok()) << st.to_string();
        ASSERT_EQ(page_layout_of(type), info.layout);
        ASSERT_EQ(column->size(), info.num_rows);

        auto res = PageReader::read(Slice(page), type);
        ASSERT_TRUE(res.ok()) << res.status().to_string();
        ASSERT_EQ(column->size(), res.value().num_rows);
        assert_column_equals(*column, *res.value().column);
    }

    static ColumnPtr nested_column() {
        // nullable list<struct<k varchar, v nullable bigint>>
        auto fields = B::structs({B::strings({"a", "bb", "", "ccc"}),
                                  B::nullable(B::fixed<int64_t>({1, 0, 3, 4}), {0, 1, 0, 0})},
                                 {"k", "v"});
        return B::nullable(B::array(fields, {0, 2, 2, 2, 4, 4}), {0, 0, 1, 0, 0});
    }

    static T nested_type() {
        return T::create_array_type(T::create_struct_type({"k", "v"}, {T::from_logical_type(TYPE_VARCHAR),
                                                                       T::from_logical_type(TYPE_BIGINT, true)}),
                                    true);
    }
};

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_page_layout_of) {
    ASSERT_EQ(PLAIN_PAGE, page_layout_of(T::from_logical_type(TYPE_INT)));
    ASSERT_EQ(NULLABLE_PAGE, page_layout_of(T::from_logical_type(TYPE_VARCHAR, true)));
    ASSERT_EQ(PLAIN_PAGE, page_layout_of(T::from_logical_type(TYPE_NULL)));
    ASSERT_EQ(NESTED_PAGE, page_layout_of(T::create_array_type(T::from_logical_type(TYPE_INT))));
    ASSERT_EQ(NESTED_PAGE, page_layout_of(nested_type()));
    ASSERT_EQ(NESTED_PAGE,
              page_layout_of(T::create_struct_type({"a"}, {T::from_logical_type(TYPE_FLOAT)})));
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_plain_scalar_types) {
    check_round_trip(T::from_logical_type(TYPE_TINYINT), B::fixed<int8_t>({-128, 0, 127, 5}));
    check_round_trip(T::from_logical_type(TYPE_UNSIGNED_TINYINT), B::fixed<uint8_t>({0, 255, 7}));
    check_round_trip(T::from_logical_type(TYPE_SMALLINT), B::fixed<int16_t>({-32768, 32767, 1}));
    check_round_trip(T::from_logical_type(TYPE_UNSIGNED_SMALLINT), B::fixed<uint16_t>({0, 65535}));
    check_round_trip(T::from_logical_type(TYPE_INT),
                     B::fixed<int32_t>({std::numeric_limits<int32_t>::min(), -1, 0, 1,
                                        std::numeric_limits<int32_t>::max()}));
    check_round_trip(T::from_logical_type(TYPE_UNSIGNED_INT), B::fixed<uint32_t>({0, 4294967295u}));
    check_round_trip(T::from_logical_type(TYPE_BIGINT),
                     B::fixed<int64_t>({std::numeric_limits<int64_t>::min(), 42,
                                        std::numeric_limits<int64_t>::max()}));
    check_round_trip(T::from_logical_type(TYPE_UNSIGNED_BIGINT),
                     B::fixed<uint64_t>({0, std::numeric_limits<uint64_t>::max()}));
    check_round_trip(T::from_logical_type(TYPE_FLOAT), B::fixed<float>({-1.5f, 0.0f, 3.25f}));
    check_round_trip(T::from_logical_type(TYPE_DOUBLE), B::fixed<double>({-1e300, 0.0, 2.5, 1e-300}));
    check_round_trip(T::from_logical_type(TYPE_BOOLEAN), B::fixed<uint8_t>({1, 0, 0, 1, 1, 1, 0, 1, 1}));
    check_round_trip(T::from_logical_type(TYPE_VARCHAR), B::strings({"", "hello", std::string(1000, 'x'), "z"}));
    check_round_trip(T::from_logical_type(TYPE_VARBINARY), B::strings({std::string("\0\1\2", 3), ""}));
    check_round_trip(T::from_logical_type(TYPE_LARGE_VARCHAR), B::large_strings({"abc", "", "defg"}));
    check_round_trip(T::from_logical_type(TYPE_LARGE_VARBINARY), B::large_strings({std::string(3, '\0')}));
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_nullable_scalar_types) {
    check_round_trip(T::from_logical_type(TYPE_INT, true), B::nullable(B::fixed<int32_t>({1, 0, 3, 0}), {0, 1, 0, 1}));
    check_round_trip(T::from_logical_type(TYPE_DOUBLE, true), B::nullable(B::fixed<double>({0, 0}), {1, 1}));
    check_round_trip(T::from_logical_type(TYPE_BOOLEAN, true),
                     B::nullable(B::fixed<uint8_t>({1, 0, 1}), {0, 1, 0}));
    check_round_trip(T::from_logical_type(TYPE_VARCHAR, true),
                     B::nullable(B::strings({"a", "", "c", ""}), {0, 0, 0, 1}));
    check_round_trip(T::from_logical_type(TYPE_LARGE_VARBINARY, true),
                     B::nullable(B::large_strings({"", "xy"}), {1, 0}));
    // no nulls at all
    check_round_trip(T::from_logical_type(TYPE_SMALLINT, true), B::nullable(B::fixed<int16_t>({1, 2, 3}), {0, 0, 0}));
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_nullable_type_from_plain_column) {
    auto type = T::from_logical_type(TYPE_INT, true);
    faststring page;
    ASSERT_TRUE(PageWriter::write(*B::fixed<int32_t>({4, 5, 6}), type, PageWriterOptions(), &page).ok());

    auto res = PageReader::read(Slice(page), type);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    assert_column_equals(*B::nullable(B::fixed<int32_t>({4, 5, 6}), {0, 0, 0}), *res.value().column);
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_null_type) {
    auto type = T::from_logical_type(TYPE_NULL);
    ASSERT_TRUE(type.nullable);
    check_round_trip(type, NullTypeColumn::create(5));

    faststring page;
    PageWriteInfo info;
    ASSERT_TRUE(PageWriter::write(*NullTypeColumn::create(1000), type, PageWriterOptions(), &page, &info).ok());
    ASSERT_EQ(PLAIN_PAGE, info.layout);
    // header and a row count
    ASSERT_EQ(ValuesBlockHeader::kSize + 4, page.size());
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_nested_types) {
    // list<int>
    check_round_trip(T::create_array_type(T::from_logical_type(TYPE_INT)),
                     B::array(B::fixed<int32_t>({1, 2, 3, 4}), {0, 2, 2, 4}));
    // large list<nullable varchar>
    check_round_trip(T::create_large_array_type(T::from_logical_type(TYPE_VARCHAR, true)),
                     B::array(B::nullable(B::strings({"x", ""}), {0, 1}), {0, 0, 2}));
    // map<varchar, nullable double>
    check_round_trip(T::create_map_type(T::from_logical_type(TYPE_VARCHAR), T::from_logical_type(TYPE_DOUBLE, true)),
                     B::map(B::strings({"a", "b", "c"}), B::nullable(B::fixed<double>({1.0, 0, 3.0}), {0, 1, 0}),
                            {0, 1, 1, 3}));
    // struct<a int, b nullable list<bool>>
    check_round_trip(
            T::create_struct_type({"a", "b"}, {T::from_logical_type(TYPE_INT),
                                               T::create_array_type(T::from_logical_type(TYPE_BOOLEAN), true)}),
            B::structs({B::fixed<int32_t>({1, 2, 3}),
                        B::nullable(B::array(B::fixed<uint8_t>({1, 0, 1}), {0, 3, 3, 3}), {0, 1, 0})},
                       {"a", "b"}));
    check_round_trip(nested_type(), nested_column());
    // nullable struct of nulls
    check_round_trip(T::create_struct_type({"n"}, {T::from_logical_type(TYPE_NULL)}, true),
                     B::nullable(B::structs({NullTypeColumn::create(3)}, {"n"}), {0, 1, 0}));
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_empty_pages) {
    check_round_trip(T::from_logical_type(TYPE_BIGINT), B::fixed<int64_t>({}));
    check_round_trip(T::from_logical_type(TYPE_VARCHAR, true), B::nullable(B::strings({}), {}));
    check_round_trip(nested_type(), ColumnHelper::create_column(nested_type()));
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_every_codec) {
    std::vector<int32_t> ints;
    std::vector<uint8_t> nulls;
    for (int i = 0; i < 3000; ++i) {
        ints.push_back(i % 17 == 0 ? 0 : i / 50);
        nulls.push_back(i % 17 == 0);
    }
    auto int_column = B::nullable(B::fixed<int32_t>(ints), nulls);

    for (CodecTypePB codec : all_codec_types()) {
        SCOPED_TRACE(codec_type_to_string(codec));
        check_round_trip(T::from_logical_type(TYPE_INT, true), int_column, fixed_codec(codec));
        check_round_trip(nested_type(), nested_column(), fixed_codec(codec));

        faststring page;
        PageWriteInfo info;
        ASSERT_TRUE(PageWriter::write(*nested_column(), nested_type(), fixed_codec(codec), &page, &info).ok());
        ASSERT_EQ(2, info.codecs.size());
        for (CodecTypePB used : info.codecs) {
            ASSERT_TRUE(used == codec || used == CodecTypePB::NO_COMPRESSION);
        }
    }
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_adaptive_codec) {
    std::vector<int32_t> ints;
    for (int i = 0; i < 8192; ++i) {
        ints.push_back(i / 1000);
    }
    AdaptiveCompressionOptions adaptive;
    adaptive.forbidden_codecs = {CodecTypePB::LZ4, CodecTypePB::SNAPPY, CodecTypePB::ZSTD};
    PageWriterOptions options;
    options.selector = std::make_shared<AdaptiveCompressionSelector>(adaptive);

    faststring page;
    PageWriteInfo info;
    ASSERT_TRUE(PageWriter::write(*B::fixed<int32_t>(ints), T::from_logical_type(TYPE_INT), options, &page, &info).ok());
    ASSERT_EQ(std::vector<CodecTypePB>{CodecTypePB::RLE}, info.codecs);
    ASSERT_LT(page.size(), ints.size() * sizeof(int32_t) / 10);
    check_round_trip(T::from_logical_type(TYPE_INT), B::fixed<int32_t>(ints), options);
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_incompressible_block_is_stored_plain) {
    faststring page;
    PageWriteInfo info;
    ASSERT_TRUE(PageWriter::write(*B::fixed<int64_t>({1, -7, 123456789}), T::from_logical_type(TYPE_BIGINT),
                                  fixed_codec(CodecTypePB::ZSTD), &page, &info)
                        .ok());
    ASSERT_EQ(std::vector<CodecTypePB>{CodecTypePB::NO_COMPRESSION}, info.codecs);
    ASSERT_EQ(CodecTypePB::NO_COMPRESSION, page.data()[0]);
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_write_range) {
    auto column = nested_column();
    faststring page;
    PageWriteInfo info;
    ASSERT_TRUE(PageWriter::write(*column, 1, 3, nested_type(), PageWriterOptions(), &page, &info).ok());
    ASSERT_EQ(3, info.num_rows);

    auto res = PageReader::read(Slice(page), nested_type());
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    ASSERT_EQ(3, res.value().num_rows);
    for (size_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(res.value().column->equals(i, *column, i + 1)) << i;
    }

    Status st = PageWriter::write(*column, 4, 2, nested_type(), PageWriterOptions(), &page);
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_read_appends) {
    auto type = T::from_logical_type(TYPE_VARCHAR, true);
    faststring first;
    faststring second;
    ASSERT_TRUE(PageWriter::write(*B::nullable(B::strings({"a", ""}), {0, 1}), type, PageWriterOptions(), &first).ok());
    ASSERT_TRUE(PageWriter::write(*B::nullable(B::strings({"b"}), {0}), type, PageWriterOptions(), &second).ok());

    auto dst = ColumnHelper::create_column(type);
    size_t num_rows = 0;
    ASSERT_TRUE(PageReader::read(Slice(first), type, dst.get(), &num_rows).ok());
    ASSERT_EQ(2, num_rows);
    ASSERT_TRUE(PageReader::read(Slice(second), type, dst.get(), &num_rows).ok());
    ASSERT_EQ(1, num_rows);
    assert_column_equals(*B::nullable(B::strings({"a", "", "b"}), {0, 1, 0}), *dst);
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_read_into_wrong_column) {
    auto type = T::from_logical_type(TYPE_VARCHAR, true);
    faststring page;
    ASSERT_TRUE(PageWriter::write(*B::nullable(B::strings({"a", ""}), {0, 1}), type, PageWriterOptions(), &page).ok());

    size_t num_rows = 0;
    // a plain column cannot take the null flags of a nullable page
    auto plain = B::strings({});
    Status st = PageReader::read(Slice(page), type, plain.get(), &num_rows);
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
    ASSERT_EQ(0, plain->size());

    auto ints = ColumnHelper::create_column(T::from_logical_type(TYPE_INT, true));
    st = PageReader::read(Slice(page), type, ints.get(), &num_rows);
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
    ASSERT_EQ(0, ints->size());

    auto array_type = T::create_array_type(T::from_logical_type(TYPE_INT, true), true);
    faststring nested;
    ASSERT_TRUE(PageWriter::write(*ColumnHelper::create_column(array_type), array_type, PageWriterOptions(), &nested)
                        .ok());
    auto elements_plain = B::nullable(B::array(B::fixed<int32_t>({}), {0}), {});
    st = PageReader::read(Slice(nested), array_type, elements_plain.get(), &num_rows);
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_pages_are_independent) {
    auto type = T::from_logical_type(TYPE_BIGINT, true);
    auto column = B::nullable(B::fixed<int64_t>({1, 1, 1, 1, 0, 2, 2, 2}), {0, 0, 0, 0, 1, 0, 0, 0});
    faststring buf;
    ASSERT_TRUE(PageWriter::write(*column, 0, 4, type, fixed_codec(CodecTypePB::LZ4), &buf).ok());
    const size_t first_len = buf.size();
    ASSERT_TRUE(PageWriter::write(*column, 4, 4, type, fixed_codec(CodecTypePB::RLE), &buf).ok());

    auto second = PageReader::read(Slice(buf.data() + first_len, buf.size() - first_len), type);
    ASSERT_TRUE(second.ok()) << second.status().to_string();
    assert_column_equals(*B::nullable(B::fixed<int64_t>({0, 2, 2, 2}), {1, 0, 0, 0}), *second.value().column);

    auto first = PageReader::read(Slice(buf.data(), first_len), type);
    ASSERT_TRUE(first.ok()) << first.status().to_string();
    assert_column_equals(*B::fixed<int64_t>({1, 1, 1, 1}),
                         *ColumnHelper::get_data_column(first.value().column.get()));
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_type_mismatch) {
    faststring page;
    Status st = PageWriter::write(*B::fixed<int32_t>({1}), T::from_logical_type(TYPE_BIGINT), PageWriterOptions(), &page);
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
    ASSERT_EQ(0, page.size());

    st = PageWriter::write(*B::nullable(B::fixed<int32_t>({1}), {1}), T::from_logical_type(TYPE_INT),
                           PageWriterOptions(), &page);
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();

    // map keys may not be null
    auto bad_map = T::create_map_type(T::from_logical_type(TYPE_INT, true), T::from_logical_type(TYPE_INT));
    st = PageWriter::write(*B::map(B::nullable(B::fixed<int32_t>({1}), {0}), B::fixed<int32_t>({2}), {0, 1}), bad_map,
                           PageWriterOptions(), &page);
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
    ASSERT_TRUE(PageReader::read(Slice(page), bad_map).status().is_invalid_argument());
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_trailing_bytes) {
    for (const auto& [type, column] : std::vector<std::pair<T, ColumnPtr>>{
                 {T::from_logical_type(TYPE_INT), B::fixed<int32_t>({1, 2})},
                 {T::from_logical_type(TYPE_INT, true), B::nullable(B::fixed<int32_t>({1, 0}), {0, 1})},
                 {nested_type(), nested_column()}}) {
        faststring page;
        ASSERT_TRUE(PageWriter::write(*column, type, PageWriterOptions(), &page).ok());
        page.push_back('\0');
        Status st = PageReader::read(Slice(page), type).status();
        ASSERT_TRUE(st.is_corruption()) << st.to_string();
    }
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_truncated_page) {
    for (const auto& [type, column] : std::vector<std::pair<T, ColumnPtr>>{
                 {T::from_logical_type(TYPE_VARCHAR), B::strings({"abc", "de"})},
                 {T::from_logical_type(TYPE_INT, true), B::nullable(B::fixed<int32_t>({1, 0}), {0, 1})},
                 {nested_type(), nested_column()}}) {
        faststring page;
        ASSERT_TRUE(PageWriter::write(*column, type, fixed_codec(CodecTypePB::NO_COMPRESSION), &page).ok());
        // every proper prefix cuts a length prefixed block short
        for (size_t len = 0; len < page.size(); ++len) {
            Status st = PageReader::read(Slice(page.data(), len), type).status();
            ASSERT_TRUE(st.is_truncated_page()) << len << ": " << st.to_string();
        }
    }
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_unknown_codec_id) {
    auto type = T::from_logical_type(TYPE_INT);
    faststring page;
    ASSERT_TRUE(PageWriter::write(*B::fixed<int32_t>({1, 2, 3}), type, PageWriterOptions(), &page).ok());
    page.data()[0] = 200;
    Status st = PageReader::read(Slice(page), type).status();
    ASSERT_TRUE(st.is_unsupported_codec()) << st.to_string();

    auto nullable = T::from_logical_type(TYPE_INT, true);
    page.clear();
    ASSERT_TRUE(PageWriter::write(*B::nullable(B::fixed<int32_t>({1, 0}), {0, 1}), nullable, PageWriterOptions(), &page)
                        .ok());
    const uint32_t def_len = decode_fixed32_le(page.data());
    page.data()[4 + def_len] = 99;
    st = PageReader::read(Slice(page), nullable).status();
    ASSERT_TRUE(st.is_unsupported_codec()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_value_count_mismatch) {
    // three present rows but two values
    faststring page;
    faststring levels;
    ValidityEncoder::encode(nullptr, 3, &levels);
    put_fixed32_le(&page, levels.size());
    page.append(levels.data(), levels.size());
    const int32_t values[] = {1, 2};
    CodecTypePB used;
    ASSERT_TRUE(append_values_block(CodecTypePB::NO_COMPRESSION, Slice(reinterpret_cast<const char*>(values), 8), 4,
                                    &page, &used)
                        .ok());
    Status st = PageReader::read(Slice(page), T::from_logical_type(TYPE_INT, true)).status();
    ASSERT_TRUE(st.is_corruption()) << st.to_string();

    // values that are not a whole number of ints
    page.clear();
    ASSERT_TRUE(append_values_block(CodecTypePB::NO_COMPRESSION, Slice("abcde"), 1, &page, &used).ok());
    st = PageReader::read(Slice(page), T::from_logical_type(TYPE_INT)).status();
    ASSERT_TRUE(st.is_corruption()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(PageWriterReaderTest, test_corrupt_levels) {
    faststring page;
    ASSERT_TRUE(PageWriter::write(*nested_column(), nested_type(), PageWriterOptions(), &page).ok());
    // offsets count the page does not hold
    faststring bad;
    bad.append(page.data(), page.size());
    encode_fixed32_le(bad.data(), decode_fixed32_le(page.data()) + 1);
    Status st = PageReader::read(Slice(bad), nested_type()).status();
    ASSERT_TRUE(st.is_corruption()) << st.to_string();

    // bit width of the repetition levels
    bad.clear();
    bad.append(page.data(), page.size());
    bad.data()[12 + 4] = 7;
    st = PageReader::read(Slice(bad), nested_type()).status();
    ASSERT_TRUE(st.is_corruption()) << st.to_string();
}

} // namespace strata
