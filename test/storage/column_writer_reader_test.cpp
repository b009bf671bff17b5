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

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "column/column_helper.h"
#include "common/config.h"
#include "io/string_output_stream.h"
#include "storage/column_reader.h"
#include "storage/column_writer.h"
#include "storage/page/level_codec.h"
#include "testutil/column_test_util.h"
#include "util/coding.h"
#include "util/priority_thread_pool.hpp"

namespace strata {

using B = ColumnTestBuilder;
using T = TypeDescriptor;

class ColumnWriterReaderTest : public testing::Test {
protected:
    static ColumnWriterOptions options_with(size_t rows_per_page) {
        ColumnWriterOptions options;
        options.rows_per_page = rows_per_page;
        options.column_name = "c1";
        return options;
    }

    static ColumnPtr int_column(size_t n) {
        std::vector<int32_t> values;
        std::vector<uint8_t> nulls;
        for (size_t i = 0; i < n; ++i) {
            values.push_back(i % 7 == 0 ? 0 : static_cast<int32_t>(i / 10));
            nulls.push_back(i % 7 == 0);
        }
        return B::nullable(B::fixed<int32_t>(std::move(values)), std::move(nulls));
    }

    static ColumnPtr list_column(size_t n) {
        auto elements = B::strings({});
        std::vector<uint32_t> offsets{0};
        std::vector<uint8_t> nulls;
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < i % 4; ++j) {
                ColumnHelper::as_raw_column<BinaryColumn>(elements)->append_string(std::to_string(i * 10 + j));
            }
            offsets.push_back(static_cast<uint32_t>(elements->size()));
            nulls.push_back(i % 9 == 5 && i % 4 == 0);
        }
        return B::nullable(B::array(elements, std::move(offsets)), std::move(nulls));
    }

    static std::string write_column(const T& type, const Column& column, const ColumnWriterOptions& options,
                                    ColumnMeta* meta = nullptr) {
        io::StringOutputStream out;
        ColumnWriter writer(type, options, &out);
        Status st = writer.init();
        EXPECT_TRUE(st.ok()) << st.to_string();
        st = writer.write(column);
        EXPECT_TRUE(st.ok()) << st.to_string();
        st = writer.finish();
        EXPECT_TRUE(st.ok()) << st.to_string();
        EXPECT_EQ(column.size(), writer.num_rows());
        if (meta != nullptr) {
            *meta = writer.meta();
        }
        return out.release();
    }
};

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_all_null_column) {
    auto type = T::from_logical_type(TYPE_NULL);
    ColumnMeta meta;
    std::string data = write_column(type, *NullTypeColumn::create(1000), options_with(100), &meta);
    ASSERT_EQ(10, meta.num_pages());
    ASSERT_EQ(1000, meta.num_rows());
    ASSERT_EQ(data.size(), meta.total_len());
    for (size_t i = 0; i < meta.num_pages(); ++i) {
        ASSERT_EQ(100, meta.page(i).num_values());
    }

    ColumnReader reader(type, Slice(data), 100, "c1");
    auto res = reader.read_column(1000);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    ASSERT_EQ(1000, res.value()->size());
    ASSERT_TRUE(res.value()->only_null());
    ASSERT_EQ(10, reader.page_index());
    ASSERT_EQ(data.size(), reader.position());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_all_null_nullable_column) {
    auto type = T::from_logical_type(TYPE_INT, true);
    auto column = ColumnHelper::create_column(type);
    ASSERT_TRUE(column->append_nulls(1000));
    ColumnMeta meta;
    std::string data = write_column(type, *column, options_with(100), &meta);
    ASSERT_EQ(10, meta.num_pages());

    ColumnReader reader(type, Slice(data), 100, "c1");
    std::vector<PageInfo> infos;
    ASSERT_TRUE(reader.stat_pages(&infos).ok());
    ASSERT_EQ(10, infos.size());
    uint64_t page_offset = 0;
    for (size_t i = 0; i < infos.size(); ++i) {
        ASSERT_EQ(NULLABLE_PAGE, infos[i].layout);
        ASSERT_EQ(100, infos[i].num_levels);
        ASSERT_EQ(1, infos[i].blocks.size());
        // nothing is present, the values block is empty
        ASSERT_EQ(0, infos[i].blocks[0].uncompressed_size);

        const char* page = data.data() + page_offset + kPagePrefixSize;
        const uint32_t def_len = decode_fixed32_le(reinterpret_cast<const uint8_t*>(page));
        ASSERT_EQ(infos[i].def_levels_len, def_len);
        Levels levels;
        ASSERT_TRUE(LevelDecoder::decode(Slice(page + 4, def_len), 1, &levels).ok());
        ASSERT_EQ(100, levels.size());
        for (level_t level : levels) {
            ASSERT_EQ(0, level);
        }
        page_offset += kPagePrefixSize + meta.page(i).length();
    }

    ASSERT_TRUE(reader.seek(0).ok());
    auto res = reader.read_column(1000);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    ASSERT_EQ(1000, res.value()->size());
    for (size_t i = 0; i < 1000; ++i) {
        ASSERT_TRUE(res.value()->is_null(i)) << i;
    }
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_round_trip) {
    for (size_t rows_per_page : {1, 7, 100, 8192}) {
        SCOPED_TRACE(rows_per_page);
        auto column = int_column(1000);
        ColumnMeta meta;
        std::string data = write_column(T::from_logical_type(TYPE_INT, true), *column, options_with(rows_per_page),
                                        &meta);
        ASSERT_EQ((1000 + rows_per_page - 1) / rows_per_page, meta.num_pages());
        // the last page holds the rest
        ASSERT_EQ(1000 - (meta.num_pages() - 1) * rows_per_page, meta.page(meta.num_pages() - 1).num_values());

        ColumnReader reader(T::from_logical_type(TYPE_INT, true), Slice(data), rows_per_page);
        auto res = reader.read_column(1000);
        ASSERT_TRUE(res.ok()) << res.status().to_string();
        assert_column_equals(*column, *res.value());
    }
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_nested_round_trip) {
    auto type = T::create_array_type(T::from_logical_type(TYPE_VARCHAR), true);
    auto column = list_column(500);
    std::string data = write_column(type, *column, options_with(64));

    ColumnReader reader(type, Slice(data), 64);
    auto res = reader.read_column(500);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    assert_column_equals(*column, *res.value());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_multiple_writes) {
    auto type = T::from_logical_type(TYPE_INT, true);
    auto column = int_column(25);
    io::StringOutputStream out;
    ColumnWriter writer(type, options_with(10), &out);
    ASSERT_TRUE(writer.init().ok());
    ASSERT_TRUE(writer.write(*column).ok());
    ASSERT_EQ(2, writer.meta().num_pages());
    ASSERT_EQ(5, writer.num_pending_rows());
    ASSERT_TRUE(writer.write(*column).ok());
    // the 5 kept rows and the head of the second write share a page
    ASSERT_EQ(5, writer.meta().num_pages());
    ASSERT_EQ(0, writer.num_pending_rows());
    ASSERT_TRUE(writer.finish().ok());
    ASSERT_EQ(5, writer.meta().num_pages());
    for (size_t i = 0; i < 5; ++i) {
        ASSERT_EQ(10, writer.meta().page(i).num_values()) << i;
    }
    ASSERT_EQ(50, writer.num_rows());
    ASSERT_EQ(50, writer.meta().pb().num_rows());
    ASSERT_EQ(10, writer.meta().pb().rows_per_page());
    ASSERT_FALSE(writer.write(*column).ok());
    ASSERT_FALSE(writer.finish().ok());

    ColumnReader reader(type, Slice(out.contents()), 10);
    auto res = reader.read_column(50);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    auto expected = int_column(25);
    expected->append(*column);
    assert_column_equals(*expected, *res.value());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_small_writes) {
    auto type = T::create_array_type(T::from_logical_type(TYPE_VARCHAR), true);
    auto column = list_column(23);
    io::StringOutputStream out;
    ColumnWriter writer(type, options_with(10), &out);
    ASSERT_TRUE(writer.init().ok());
    for (size_t i = 0; i < column->size(); i += 3) {
        auto part = ColumnHelper::create_column(type);
        part->append(*column, i, std::min<size_t>(3, column->size() - i));
        ASSERT_TRUE(writer.write(*part).ok());
    }
    ASSERT_EQ(2, writer.meta().num_pages());
    ASSERT_EQ(3, writer.num_pending_rows());
    ASSERT_TRUE(writer.finish().ok());
    ASSERT_EQ(3, writer.meta().num_pages());
    ASSERT_EQ(3, writer.meta().page(2).num_values());

    ColumnReader reader(type, Slice(out.contents()), 10);
    auto res = reader.read_column(23);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    assert_column_equals(*column, *res.value());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_short_inner_page) {
    auto type = T::from_logical_type(TYPE_INT, true);
    ColumnMeta first_meta;
    ColumnMeta short_meta;
    ColumnMeta last_meta;
    std::string first = write_column(type, *int_column(10), options_with(10), &first_meta);
    std::string short_page = write_column(type, *int_column(5), options_with(10), &short_meta);
    std::string last = write_column(type, *int_column(10), options_with(10), &last_meta);
    // pages of 10, 5 and 10 rows
    std::string data = first + short_page + last;
    std::string tail = first + short_page;

    ColumnReader reader(type, Slice(data), 10, "c1");
    auto dst = ColumnHelper::create_column(type);
    Status st = reader.read_column(25, dst.get());
    ASSERT_TRUE(st.is_row_count_mismatch()) << st.to_string();
    ASSERT_NE(std::string::npos, st.to_string().find("column c1 page 1 at byte"));
    ASSERT_EQ(10, dst->size());

    ColumnMeta meta = first_meta;
    *meta.mutable_pb()->add_pages() = short_meta.page(0);
    *meta.mutable_pb()->add_pages() = last_meta.page(0);
    meta.mutable_pb()->set_num_rows(25);
    st = reader.read_pages(meta).status();
    ASSERT_TRUE(st.is_row_count_mismatch()) << st.to_string();

    // the short page is fine as the last one
    ColumnReader tail_reader(type, Slice(tail), 10);
    auto res = tail_reader.read_column(15);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_page_over_rows_per_page) {
    auto type = T::from_logical_type(TYPE_INT, true);
    ColumnMeta meta;
    std::string data = write_column(type, *int_column(40), options_with(20), &meta);

    ColumnReader reader(type, Slice(data), 10);
    auto dst = ColumnHelper::create_column(type);
    Status st = reader.read_column(40, dst.get());
    ASSERT_TRUE(st.is_row_count_mismatch()) << st.to_string();
    ASSERT_EQ(0, dst->size());

    // over-full as the last page too
    ColumnMeta last_page = meta.slice(1, 2).value();
    last_page.mutable_pb()->clear_rows_per_page();
    st = reader.read_pages(last_page).status();
    ASSERT_TRUE(st.is_row_count_mismatch()) << st.to_string();

    // the column meta names the rows per page it was written with
    st = reader.read_pages(meta).status();
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();

    ColumnReader zero(type, Slice(data), 0);
    st = zero.read_column(40, dst.get());
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_row_count_mismatch) {
    auto type = T::from_logical_type(TYPE_INT, true);
    std::string data = write_column(type, *int_column(30), options_with(10));

    ColumnReader reader(type, Slice(data), 10, "c1");
    auto dst = ColumnHelper::create_column(type);
    Status st = reader.read_column(31, dst.get());
    ASSERT_TRUE(st.is_row_count_mismatch()) << st.to_string();
    // the decoded rows stay with the caller
    ASSERT_EQ(30, dst->size());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_read_pages) {
    auto type = T::from_logical_type(TYPE_INT, true);
    auto column = int_column(95);
    io::StringOutputStream out;
    // the column does not start at the beginning of the stream
    ASSERT_TRUE(out.write(Slice("header")).ok());
    ColumnWriter writer(type, options_with(10), &out);
    ASSERT_TRUE(writer.init().ok());
    ASSERT_TRUE(writer.write(*column).ok());
    ASSERT_TRUE(writer.finish().ok());
    ASSERT_EQ(6, writer.meta().offset());

    ColumnReader reader(type, Slice(out.contents()), 10, "c1");
    auto all = reader.read_pages(writer.meta());
    ASSERT_TRUE(all.ok()) << all.status().to_string();
    assert_column_equals(*column, *all.value());

    auto sliced = writer.meta().slice(3, 6);
    ASSERT_TRUE(sliced.ok());
    auto part = reader.read_pages(sliced.value());
    ASSERT_TRUE(part.ok()) << part.status().to_string();
    ASSERT_EQ(30, part.value()->size());
    for (size_t i = 0; i < 30; ++i) {
        ASSERT_TRUE(part.value()->equals(i, *column, 30 + i)) << i;
    }

    ColumnMeta tail = writer.meta();
    ASSERT_TRUE(tail.skip_one_page().ok());
    auto rest = reader.read_pages(tail);
    ASSERT_TRUE(rest.ok()) << rest.status().to_string();
    ASSERT_EQ(85, rest.value()->size());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_read_pages_checks_meta) {
    auto type = T::from_logical_type(TYPE_INT, true);
    ColumnMeta meta;
    std::string data = write_column(type, *int_column(30), options_with(10), &meta);
    ColumnReader reader(type, Slice(data), 10, "c1");

    ColumnMeta bad_len = meta;
    bad_len.mutable_pb()->mutable_pages(1)->set_length(meta.page(1).length() + 1);
    Status st = reader.read_pages(bad_len).status();
    ASSERT_TRUE(st.is_corruption()) << st.to_string();

    ColumnMeta bad_rows = meta;
    bad_rows.mutable_pb()->mutable_pages(2)->set_num_values(11);
    st = reader.read_pages(bad_rows).status();
    ASSERT_TRUE(st.is_row_count_mismatch()) << st.to_string();

    ColumnMeta bad_total = meta;
    bad_total.mutable_pb()->set_num_rows(29);
    st = reader.read_pages(bad_total).status();
    ASSERT_TRUE(st.is_row_count_mismatch()) << st.to_string();

    ColumnMeta too_many = meta;
    *too_many.mutable_pb()->add_pages() = meta.page(0);
    st = reader.read_pages(too_many).status();
    ASSERT_TRUE(st.is_truncated_page()) << st.to_string();

    ColumnMeta bad_offset = meta;
    bad_offset.mutable_pb()->set_offset(data.size() + 1);
    st = reader.read_pages(bad_offset).status();
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_truncated_stream) {
    auto type = T::from_logical_type(TYPE_INT, true);
    std::string data = write_column(type, *int_column(30), options_with(10));
    const uint32_t first_len = decode_fixed32_le(reinterpret_cast<const uint8_t*>(data.data()));

    // cut inside the second page
    ColumnReader reader(type, Slice(data.data(), first_len + kPagePrefixSize + 6), 10, "c1");
    auto dst = ColumnHelper::create_column(type);
    Status st = reader.read_column(30, dst.get());
    ASSERT_TRUE(st.is_truncated_page()) << st.to_string();
    ASSERT_NE(std::string::npos, st.to_string().find("column c1 page 1 at byte"));
    ASSERT_EQ(10, dst->size());

    // cut inside the prefix
    ColumnReader short_reader(type, Slice(data.data(), 2), 10);
    st = short_reader.read_column(30, dst.get());
    ASSERT_TRUE(st.is_truncated_page()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_corrupt_page_has_context) {
    auto type = T::from_logical_type(TYPE_INT, true);
    std::string data = write_column(type, *int_column(30), options_with(10));
    const uint32_t first_len = decode_fixed32_le(reinterpret_cast<const uint8_t*>(data.data()));
    // the codec id of the values block of the second page
    const size_t second = kPagePrefixSize + first_len + kPagePrefixSize;
    const uint32_t def_len = decode_fixed32_le(reinterpret_cast<const uint8_t*>(data.data() + second));
    data[second + 4 + def_len] = static_cast<char>(123);

    ColumnReader reader(type, Slice(data), 10, "c1");
    PageData page;
    ASSERT_TRUE(reader.next_page(&page).ok());
    ASSERT_EQ(10, page.num_rows);
    Status st = reader.next_page(&page);
    ASSERT_TRUE(st.is_unsupported_codec()) << st.to_string();
    ASSERT_NE(std::string::npos, st.to_string().find(fmt::format("page 1 at byte {}", first_len + 4)));
    ASSERT_EQ(1, reader.page_index());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_next_page) {
    auto type = T::from_logical_type(TYPE_INT, true);
    auto column = int_column(25);
    std::string data = write_column(type, *column, options_with(10));

    ColumnReader reader(type, Slice(data), 10);
    std::vector<size_t> rows;
    PageData page;
    Status st;
    while ((st = reader.next_page(&page)).ok()) {
        rows.push_back(page.num_rows);
    }
    ASSERT_TRUE(st.is_end_of_file()) << st.to_string();
    ASSERT_EQ(std::vector<size_t>({10, 10, 5}), rows);

    ASSERT_TRUE(reader.seek(0).ok());
    Slice raw;
    ASSERT_TRUE(reader.next_raw_page(&raw).ok());
    ASSERT_EQ(decode_fixed32_le(reinterpret_cast<const uint8_t*>(data.data())), raw.size);
    ASSERT_TRUE(reader.seek(data.size() + 1).is_invalid_argument());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_stat_pages) {
    auto type = T::from_logical_type(TYPE_INT, true);
    ColumnMeta meta;
    std::string data = write_column(type, *int_column(25), options_with(10), &meta);

    ColumnReader reader(type, Slice(data), 10);
    std::vector<PageInfo> infos;
    ASSERT_TRUE(reader.stat_pages(&infos).ok());
    ASSERT_EQ(3, infos.size());
    for (size_t i = 0; i < infos.size(); ++i) {
        ASSERT_EQ(NULLABLE_PAGE, infos[i].layout);
        ASSERT_EQ(meta.page(i).length(), infos[i].page_size);
        ASSERT_EQ(meta.page(i).num_values(), infos[i].num_levels);
    }
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_invalid_options) {
    io::StringOutputStream out;
    ColumnWriter writer(T::from_logical_type(TYPE_INT), options_with(0), &out);
    ASSERT_TRUE(writer.init().is_invalid_argument());

    ColumnWriter uninited(T::from_logical_type(TYPE_INT), options_with(10), &out);
    ASSERT_FALSE(uninited.write(*B::fixed<int32_t>({1})).ok());

    ColumnWriter bad_type(T::create_struct_type({}, {}), options_with(10), &out);
    ASSERT_TRUE(bad_type.init().is_not_supported());

    ColumnWriter mismatch(T::from_logical_type(TYPE_BIGINT), options_with(10), &out);
    ASSERT_TRUE(mismatch.init().ok());
    Status st = mismatch.write(*B::fixed<int32_t>({1, 2}));
    ASSERT_TRUE(st.is_invalid_argument()) << st.to_string();
    ASSERT_EQ(0, out.position());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_write_parallel) {
    auto type = T::create_array_type(T::from_logical_type(TYPE_VARCHAR), true);
    auto column = list_column(1000);
    ColumnMeta serial_meta;
    std::string serial = write_column(type, *column, options_with(50), &serial_meta);

    PriorityThreadPool pool("page_codec_test", 4, 8);
    io::StringOutputStream out;
    ColumnWriter writer(type, options_with(50), &out);
    ASSERT_TRUE(writer.init().ok());
    Status st = writer.write_parallel(*column, &pool);
    ASSERT_TRUE(st.ok()) << st.to_string();
    ASSERT_TRUE(writer.finish().ok());
    ASSERT_EQ(serial, out.contents());
    ASSERT_EQ(serial_meta.debug_string(), writer.meta().debug_string());

    // rows kept between writes land in the same pages as a single write
    io::StringOutputStream pieces_out;
    ColumnWriter pieces(type, options_with(50), &pieces_out);
    ASSERT_TRUE(pieces.init().ok());
    for (size_t i = 0; i < column->size(); i += 37) {
        auto part = ColumnHelper::create_column(type);
        part->append(*column, i, std::min<size_t>(37, column->size() - i));
        st = pieces.write_parallel(*part, &pool);
        ASSERT_TRUE(st.ok()) << st.to_string();
        ASSERT_LT(pieces.num_pending_rows(), 50);
    }
    ASSERT_TRUE(pieces.finish().ok());
    ASSERT_EQ(serial, pieces_out.contents());
    ASSERT_EQ(serial_meta.debug_string(), pieces.meta().debug_string());

    // a failing write writes nothing
    io::StringOutputStream failed_out;
    ColumnWriter failed(T::from_logical_type(TYPE_INT), options_with(50), &failed_out);
    ASSERT_TRUE(failed.init().ok());
    ASSERT_FALSE(failed.write_parallel(*column, &pool).ok());
    ASSERT_EQ(0, failed_out.position());
    ASSERT_EQ(0, failed.meta().num_pages());
}

// NOLINTNEXTLINE
TEST_F(ColumnWriterReaderTest, test_pool_from_config) {
    auto pool = create_page_codec_pool_from_config();
    ASSERT_EQ("page_codec", pool->name());

    auto column = int_column(300);
    io::StringOutputStream out;
    ColumnWriter writer(T::from_logical_type(TYPE_INT, true), ColumnWriterOptions::from_config(), &out);
    ASSERT_TRUE(writer.init().ok());
    ASSERT_TRUE(writer.write_parallel(*column, pool.get()).ok());
    ASSERT_TRUE(writer.finish().ok());

    ColumnReader reader(T::from_logical_type(TYPE_INT, true), Slice(out.contents()), config::page_rows);
    auto res = reader.read_column(300);
    ASSERT_TRUE(res.ok()) << res.status().to_string();
    assert_column_equals(*column, *res.value());
}

} // namespace strata
