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
//   https://github.com/apache/incubator-doris/blob/master/be/src/util/block_compression.cpp

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

#include "util/block_compression.h"

#include <fmt/format.h>
#include <lz4.h>
#include <snappy.h>
#include <zlib.h>
#include <zstd.h>
#include <zstd_errors.h>

namespace strata {

class Lz4BlockCompression : public BlockCompressionCodec {
public:
    static const Lz4BlockCompression* instance() {
        static Lz4BlockCompression s_instance;
        return &s_instance;
    }

    ~Lz4BlockCompression() override = default;

    Status compress(const Slice& input, Slice* output) const override {
        if (input.size == 0) {
            output->size = 0;
            return Status::OK();
        }
        auto compressed_len = LZ4_compress_default(input.data, output->data, static_cast<int>(input.size),
                                                   static_cast<int>(output->size));
        if (compressed_len == 0) {
            return Status::InvalidArgument(fmt::format("Output buffer's capacity is not enough, size={}", output->size));
        }
        output->size = compressed_len;
        return Status::OK();
    }

    Status decompress(const Slice& input, Slice* output) const override {
        if (input.size == 0) {
            output->size = 0;
            return Status::OK();
        }
        auto decompressed_len = LZ4_decompress_safe(input.data, output->data, static_cast<int>(input.size),
                                                    static_cast<int>(output->size));
        if (decompressed_len < 0) {
            return Status::InvalidArgument(fmt::format("fail to do LZ4 decompress, error={}", decompressed_len));
        }
        output->size = decompressed_len;
        return Status::OK();
    }

    size_t max_compressed_len(size_t len) const override { return LZ4_compressBound(static_cast<int>(len)); }

    bool exceed_max_input_size(size_t len) const override { return len > LZ4_MAX_INPUT_SIZE; }

    size_t max_input_size() const override { return LZ4_MAX_INPUT_SIZE; }
};

class SnappyBlockCompression : public BlockCompressionCodec {
public:
    static const SnappyBlockCompression* instance() {
        static SnappyBlockCompression s_instance;
        return &s_instance;
    }

    ~SnappyBlockCompression() override = default;

    Status compress(const Slice& input, Slice* output) const override {
        snappy::RawCompress(input.data, input.size, output->data, &output->size);
        return Status::OK();
    }

    Status decompress(const Slice& input, Slice* output) const override {
        size_t uncompressed_len = 0;
        // NOTE: GetUncompressedLength only takes O(1) time
        if (!snappy::GetUncompressedLength(input.data, input.size, &uncompressed_len) ||
            uncompressed_len > output->size) {
            return Status::InvalidArgument("Fail to do Snappy decompress, bad uncompressed length");
        }
        if (!snappy::RawUncompress(input.data, input.size, output->data)) {
            return Status::InvalidArgument("Fail to do Snappy decompress");
        }
        output->size = uncompressed_len;
        return Status::OK();
    }

    size_t max_compressed_len(size_t len) const override { return snappy::MaxCompressedLength(len); }
};

class ZlibBlockCompression : public BlockCompressionCodec {
public:
    static const ZlibBlockCompression* instance() {
        static ZlibBlockCompression s_instance;
        return &s_instance;
    }

    ~ZlibBlockCompression() override = default;

    Status compress(const Slice& input, Slice* output) const override {
        uLongf out_len = output->size;
        auto zres = ::compress((Bytef*)output->data, &out_len, (const Bytef*)input.data, input.size);
        if (zres != Z_OK) {
            return Status::InvalidArgument(fmt::format("Fail to do ZLib compress, error={}", zError(zres)));
        }
        output->size = out_len;
        return Status::OK();
    }

    Status decompress(const Slice& input, Slice* output) const override {
        uLongf out_len = output->size;
        uLong input_size = input.size;
        auto zres = ::uncompress2((Bytef*)output->data, &out_len, (const Bytef*)input.data, &input_size);
        if (zres != Z_OK) {
            return Status::InvalidArgument(fmt::format("Fail to do ZLib decompress, error={}", zError(zres)));
        }
        if (input_size != input.size) {
            return Status::InvalidArgument(fmt::format(
                    "Fail to do ZLib decompress: trailing data left, read={} vs given={}", input_size, input.size));
        }
        output->size = out_len;
        return Status::OK();
    }

    size_t max_compressed_len(size_t len) const override {
        // one-time overhead of six bytes for the entire stream plus five bytes per 16 KB block
        return len + 6 + 5 * ((len >> 14) + 1);
    }
};

class ZstdBlockCompression final : public BlockCompressionCodec {
public:
    static const ZstdBlockCompression* instance() {
        static ZstdBlockCompression s_instance;
        return &s_instance;
    }

    ~ZstdBlockCompression() override = default;

    Status compress(const Slice& input, Slice* output) const override {
        size_t ret = ZSTD_compress(output->data, output->size, input.data, input.size, ZSTD_CLEVEL_DEFAULT);
        if (ZSTD_isError(ret)) {
            return Status::InvalidArgument(
                    fmt::format("ZSTD compress failed: {}", ZSTD_getErrorString(ZSTD_getErrorCode(ret))));
        }
        output->size = ret;
        return Status::OK();
    }

    Status decompress(const Slice& input, Slice* output) const override {
        if (output->data == nullptr) {
            // We may pass a NULL 0-byte output buffer but some zstd versions demand
            // a valid pointer: https://github.com/facebook/zstd/issues/1385
            static uint8_t empty_buffer;
            output->data = (char*)&empty_buffer;
            output->size = 0;
        }
        size_t ret = ZSTD_decompress(output->data, output->size, input.data, input.size);
        if (ZSTD_isError(ret)) {
            return Status::InvalidArgument(
                    fmt::format("ZSTD decompress failed: {}", ZSTD_getErrorString(ZSTD_getErrorCode(ret))));
        }
        output->size = ret;
        return Status::OK();
    }

    size_t max_compressed_len(size_t len) const override { return ZSTD_compressBound(len); }
};

Status get_block_compression_codec(CodecTypePB type, const BlockCompressionCodec** codec) {
    switch (type) {
    case CodecTypePB::NO_COMPRESSION:
        *codec = nullptr;
        break;
    case CodecTypePB::SNAPPY:
        *codec = SnappyBlockCompression::instance();
        break;
    case CodecTypePB::LZ4:
        *codec = Lz4BlockCompression::instance();
        break;
    case CodecTypePB::ZLIB:
        *codec = ZlibBlockCompression::instance();
        break;
    case CodecTypePB::ZSTD:
        *codec = ZstdBlockCompression::instance();
        break;
    default:
        return Status::NotFound(fmt::format("unknown compression type({})", static_cast<int>(type)));
    }
    return Status::OK();
}

} // namespace strata
