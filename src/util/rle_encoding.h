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

// This file is based on code available under the Apache license here:
//   https://github.com/apache/incubator-doris/blob/master/be/src/util/rle_encoding.h

// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#include <algorithm>

#include "common/logging.h"
#include "util/bit_stream_utils.inline.h"
#include "util/bit_util.h"

namespace strata {

// Utility classes to do run length encoding (RLE) for fixed bit width values.  If runs
// are sufficiently long, RLE is used, otherwise, the values are just bit-packed
// (literal encoding).
// For both types of runs, there is a byte-aligned indicator which encodes the length
// of the run and the type of the run.
// This encoding has the benefit that when there aren't any long enough runs, values
// are always decoded at fixed (can be precomputed) bit offsets OR both the value and
// the run length are byte aligned. This allows for very efficient decoding
// implementations.
// The encoding is:
//    encoded-block := run*
//    run := literal-run | repeated-run
//    literal-run := literal-indicator < literal bytes >
//    repeated-run := repeated-indicator < repeated value. padded to byte boundary >
//    literal-indicator := varint_encode( number_of_groups << 1 | 1)
//    repeated-indicator := varint_encode( number_of_repetitions << 1 )
//
// Each run is preceded by a varint. The varint's least significant bit is
// used to indicate whether the run is a literal run or a repeated run. The rest
// of the varint is used to determine the length of the run (eg how many times the
// value repeats).
//
// In the case of literal runs, the run length is always a multiple of 8 (i.e. encode
// in groups of 8), so that no matter the bit-width of the value, the sequence will end
// on a byte boundary without padding.
// Given that we know it is a multiple of 8, we store the number of 8-groups rather than
// the actual number of encoded ints. Only the last literal group of a stream may carry
// padding, so the number of logical values has to be stored by the caller.
//
// Once a value has been placed in a literal group it stays there, so a literal group
// borrows its trailing values from whatever run follows it.
//
// A bit width of zero is legal: every value is 0 and the stream is a single repeated
// run with a zero-byte value.
template <typename T>
class RleEncoder {
public:
    // buffer: the encoded data is appended to it.
    // bit_width: the max number of bits allowed for values.
    RleEncoder(faststring* buffer, int bit_width) : bit_width_(bit_width), bit_writer_(buffer) {
        DCHECK_GE(bit_width_, 0);
        DCHECK_LE(bit_width_, 32);
    }

    // Encode value, 'run_length' times.
    void Put(T value, size_t run_length = 1);

    // Flushes any pending values to the underlying buffer.
    // Returns the total number of bytes written
    int Flush();

    // Repeated runs shorter than this are written as literals.
    static const int MIN_REPEATED_RUN_LENGTH = 8;

private:
    void FlushRepeatedRun();
    void FlushLiteralGroup();

    const int bit_width_;
    BitWriter bit_writer_;

    // Pending repeated run.
    T repeated_value_ = 0;
    size_t repeat_count_ = 0;

    // Pending literal group, always shorter than 8 values.
    T literals_[8];
    int num_literals_ = 0;
};

template <typename T>
inline void RleEncoder<T>::Put(T value, size_t run_length) {
    DCHECK(bit_width_ == 64 || static_cast<uint64_t>(value) < (1ULL << bit_width_));
    while (run_length > 0) {
        if (num_literals_ > 0) {
            // Committed to a literal group, fill it up first.
            literals_[num_literals_++] = value;
            --run_length;
            if (num_literals_ == 8) {
                FlushLiteralGroup();
            }
            continue;
        }
        if (repeat_count_ == 0 || repeated_value_ == value) {
            repeated_value_ = value;
            repeat_count_ += run_length;
            return;
        }
        if (repeat_count_ >= MIN_REPEATED_RUN_LENGTH) {
            FlushRepeatedRun();
            repeated_value_ = value;
            repeat_count_ = run_length;
            return;
        }
        // The pending run is too short, turn it into literals.
        for (size_t i = 0; i < repeat_count_; ++i) {
            literals_[num_literals_++] = repeated_value_;
        }
        repeat_count_ = 0;
    }
}

template <typename T>
inline void RleEncoder<T>::FlushRepeatedRun() {
    DCHECK_GT(repeat_count_, 0);
    bit_writer_.PutVlqInt(static_cast<uint32_t>(repeat_count_ << 1));
    bit_writer_.PutAligned(static_cast<uint64_t>(repeated_value_), BitUtil::BytesForBits(bit_width_));
    repeat_count_ = 0;
}

template <typename T>
inline void RleEncoder<T>::FlushLiteralGroup() {
    bit_writer_.PutVlqInt(1 << 1 | 1);
    for (int i = 0; i < 8; ++i) {
        T v = i < num_literals_ ? literals_[i] : 0;
        if (bit_width_ > 0) {
            bit_writer_.PutValue(static_cast<uint64_t>(v), bit_width_);
        }
    }
    bit_writer_.Flush(/* align */ true);
    num_literals_ = 0;
}

template <typename T>
inline int RleEncoder<T>::Flush() {
    if (num_literals_ > 0) {
        FlushLiteralGroup();
    } else if (repeat_count_ > 0) {
        FlushRepeatedRun();
    }
    bit_writer_.Flush(/* align */ true);
    return bit_writer_.bytes_written();
}

// Decoder class for RLE encoded data.
template <typename T>
class RleDecoder {
public:
    // Create a decoder object. buffer/buffer_len is the decoded data.
    // bit_width is the width of each value (before encoding).
    RleDecoder(const uint8_t* buffer, int buffer_len, int bit_width)
            : bit_reader_(buffer, buffer_len), bit_width_(bit_width) {
        DCHECK_GE(bit_width_, 0);
        DCHECK_LE(bit_width_, 32);
    }

    RleDecoder() = default;

    // Gets the next value.  Returns false if there are no more values or the
    // stream is malformed.
    bool Get(T* val);

    // Gets up to 'num_values' values. Returns the number of values actually read.
    size_t GetBatch(T* vals, size_t num_values);

private:
    bool ReadHeader();

    BitReader bit_reader_;
    int bit_width_ = 0;
    uint64_t current_value_ = 0;
    uint32_t repeat_count_ = 0;
    uint32_t literal_count_ = 0;
};

template <typename T>
inline bool RleDecoder<T>::ReadHeader() {
    uint32_t indicator_value = 0;
    if (!bit_reader_.GetVlqInt(&indicator_value)) return false;

    // lsb indicates if it is a literal run or repeated run
    bool is_literal = indicator_value & 1;
    if (is_literal) {
        uint32_t num_groups = indicator_value >> 1;
        if (UNLIKELY(num_groups == 0)) return false;
        // Literal groups have to be complete.
        if (UNLIKELY(static_cast<int64_t>(num_groups) * bit_width_ > bit_reader_.bytes_left())) return false;
        literal_count_ = num_groups * 8;
    } else {
        repeat_count_ = indicator_value >> 1;
        if (UNLIKELY(repeat_count_ == 0)) return false;
        current_value_ = 0;
        if (!bit_reader_.GetAligned<uint64_t>(BitUtil::BytesForBits(bit_width_), &current_value_)) return false;
        if (UNLIKELY(BitUtil::ShiftRightZeroOnOverflow(current_value_, bit_width_) != 0)) return false;
    }
    return true;
}

template <typename T>
inline bool RleDecoder<T>::Get(T* val) {
    return GetBatch(val, 1) == 1;
}

template <typename T>
inline size_t RleDecoder<T>::GetBatch(T* vals, size_t num_values) {
    DCHECK(bit_reader_.is_initialized());
    size_t read = 0;
    while (read < num_values) {
        if (repeat_count_ == 0 && literal_count_ == 0) {
            if (!ReadHeader()) break;
        }
        if (repeat_count_ > 0) {
            size_t n = std::min<size_t>(num_values - read, repeat_count_);
            std::fill(vals + read, vals + read + n, static_cast<T>(current_value_));
            repeat_count_ -= n;
            read += n;
        } else {
            uint64_t v = 0;
            if (bit_width_ > 0 && !bit_reader_.GetValue(bit_width_, &v)) break;
            vals[read++] = static_cast<T>(v);
            --literal_count_;
        }
    }
    return read;
}

} // namespace strata
