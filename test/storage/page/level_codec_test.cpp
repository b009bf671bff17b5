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

#include "storage/page/level_codec.h"

#include <gtest/gtest.h>

#include <random>

#include "util/coding.h"

namespace strata {

class LevelCodecTest : public testing::Test {
protected:
    static void check_round_trip(const Levels& levels, int max_level) {
        faststring buf;
        size_t len = LevelEncoder::encode(levels, max_level, &buf);
        ASSERT_EQ(buf.size(), len);

        Levels decoded;
        Status st = LevelDecoder::decode(Slice(buf), max_level, &decoded);
        ASSERT_TRUE(st.ok()) << st.to_string();
        ASSERT_EQ(levels, decoded);
    }
};

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_round_trip) {
    check_round_trip({}, 1);
    check_round_trip({0, 1, 0, 0, 0}, 1);
    check_round_trip({2, 2, 1, 0, 2}, 2);
    check_round_trip(Levels(10000, 3), 3);

    std::mt19937 rand(3);
    for (int max_level : {1, 2, 5, 9, 200}) {
        Levels levels;
        for (int i = 0; i < 5000; ++i) {
            // long runs mixed with literal stretches
            level_t v = rand() % (max_level + 1);
            levels.insert(levels.end(), (i % 7 == 0) ? 50 : 1, v);
        }
        check_round_trip(levels, max_level);
    }
}

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_zero_max_level) {
    faststring buf;
    LevelEncoder::encode(Levels(100, 0), 0, &buf);
    ASSERT_EQ(0, decode_fixed8(reinterpret_cast<const uint8_t*>(buf.data()) + 4));

    Levels decoded;
    ASSERT_TRUE(LevelDecoder::decode(Slice(buf), 0, &decoded).ok());
    ASSERT_EQ(Levels(100, 0), decoded);
}

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_header) {
    faststring buf;
    LevelEncoder::encode(Levels{1, 0, 1}, 1, &buf);
    const auto* data = reinterpret_cast<const uint8_t*>(buf.data());
    ASSERT_EQ(3, decode_fixed32_le(data));
    ASSERT_EQ(1, decode_fixed8(data + 4));
}

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_bit_width_mismatch) {
    faststring buf;
    LevelEncoder::encode(Levels{1, 0, 1}, 1, &buf);
    Levels decoded;
    Status st = LevelDecoder::decode(Slice(buf), 3, &decoded);
    ASSERT_TRUE(st.is_corruption()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_level_above_max) {
    faststring buf;
    // 3 fits in the 2 bits of max level 2
    LevelEncoder::encode(Levels{0, 1, 3, 2}, 3, &buf);
    Levels decoded;
    Status st = LevelDecoder::decode(Slice(buf), 2, &decoded);
    ASSERT_TRUE(st.is_corruption()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_truncated_block) {
    Levels decoded;
    Status st = LevelDecoder::decode(Slice("\x03\x00\x00", 3), 1, &decoded);
    ASSERT_TRUE(st.is_corruption()) << st.to_string();

    faststring buf;
    LevelEncoder::encode(Levels{0, 1, 0, 1, 1, 0, 1, 0, 0, 1, 1}, 1, &buf);
    st = LevelDecoder::decode(Slice(buf.data(), 5), 1, &decoded);
    ASSERT_TRUE(st.is_corruption()) << st.to_string();

    // a count far beyond the payload
    faststring bogus;
    put_fixed32_le(&bogus, 1u << 30);
    put_fixed8(&bogus, 1);
    bogus.push_back(0x03);
    st = LevelDecoder::decode(Slice(bogus), 1, &decoded);
    ASSERT_TRUE(st.is_corruption()) << st.to_string();
}

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_validity) {
    const uint8_t nulls[] = {0, 1, 1, 0, 0, 0, 1};
    faststring buf;
    ValidityEncoder::encode(nulls, 7, &buf);

    NullData decoded;
    size_t present = 0;
    ASSERT_TRUE(ValidityDecoder::decode(Slice(buf), &decoded, &present).ok());
    ASSERT_EQ(NullData(nulls, nulls + 7), decoded);
    ASSERT_EQ(4, present);
}

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_validity_without_nulls) {
    faststring buf;
    ValidityEncoder::encode(nullptr, 1000, &buf);
    // a single repeated run
    ASSERT_LT(buf.size(), 16);

    NullData decoded;
    size_t present = 0;
    ASSERT_TRUE(ValidityDecoder::decode(Slice(buf), &decoded, &present).ok());
    ASSERT_EQ(NullData(1000, 0), decoded);
    ASSERT_EQ(1000, present);

    buf.clear();
    ValidityEncoder::encode(nullptr, 0, &buf);
    ASSERT_TRUE(ValidityDecoder::decode(Slice(buf), &decoded, &present).ok());
    ASSERT_TRUE(decoded.empty());
    ASSERT_EQ(0, present);
}

// NOLINTNEXTLINE
TEST_F(LevelCodecTest, test_validity_rejects_wide_levels) {
    faststring buf;
    LevelEncoder::encode(Levels{0, 2}, 2, &buf);
    NullData decoded;
    size_t present = 0;
    Status st = ValidityDecoder::decode(Slice(buf), &decoded, &present);
    ASSERT_TRUE(st.is_corruption()) << st.to_string();
}

} // namespace strata
