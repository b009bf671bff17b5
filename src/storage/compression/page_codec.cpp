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

#include "storage/compression/page_codec.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "common/logging.h"
#include "storage/compression/bit_packing_codec.h"
#include "storage/compression/dict_codec.h"
#include "storage/compression/rle_codec.h"
#include "storage/compression/roaring_codec.h"
#include "util/block_compression.h"

namespace strata {

namespace {

class PassthroughPageCodec final : public PageCodec {
public:
    static const PassthroughPageCodec* instance() {
        static PassthroughPageCodec s_instance;
        return &s_instance;
    }

    CodecTypePB type() const override { return CodecTypePB::NO_COMPRESSION; }

    Status compress(const Slice& raw, int value_width, faststring* out) const override {
        out->append(raw.data, raw.size);
        return Status::OK();
    }

    Status decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const override {
        if (encoded.size != uncompressed_size) {
            return Status::Corruption(fmt::format("passthrough block has {} bytes, expect {}", encoded.size,
                                                  uncompressed_size));
        }
        out->append(encoded.data, encoded.size);
        return Status::OK();
    }
};

// Adapts a general purpose BlockCompressionCodec to the PageCodec interface.
class BlockPageCodec final : public PageCodec {
public:
    BlockPageCodec(CodecTypePB type, const BlockCompressionCodec* codec) : _type(type), _codec(codec) {}

    CodecTypePB type() const override { return _type; }

    Status compress(const Slice& raw, int value_width, faststring* out) const override {
        if (_codec->exceed_max_input_size(raw.size)) {
            return Status::InvalidArgument(fmt::format("{} cannot compress {} bytes, max input size is {}",
                                                       codec_type_to_string(_type), raw.size,
                                                       _codec->max_input_size()));
        }
        const size_t old_size = out->size();
        out->resize(old_size + _codec->max_compressed_len(raw.size));
        Slice compressed(out->data() + old_size, out->size() - old_size);
        RETURN_IF_ERROR(_codec->compress(raw, &compressed));
        out->resize(old_size + compressed.size);
        return Status::OK();
    }

    Status decompress(const Slice& encoded, size_t uncompressed_size, faststring* out) const override {
        const size_t old_size = out->size();
        out->resize(old_size + uncompressed_size);
        Slice decompressed(out->data() + old_size, uncompressed_size);
        Status st = _codec->decompress(encoded, &decompressed);
        if (!st.ok()) {
            out->resize(old_size);
            return Status::Corruption(st.message());
        }
        out->resize(old_size + decompressed.size);
        return Status::OK();
    }

private:
    const CodecTypePB _type;
    const BlockCompressionCodec* _codec;
};

const PageCodec* block_page_codec(CodecTypePB type) {
    const BlockCompressionCodec* codec = nullptr;
    Status st = get_block_compression_codec(type, &codec);
    DCHECK(st.ok() && codec != nullptr) << codec_type_to_string(type);
    switch (type) {
    case CodecTypePB::LZ4: {
        static BlockPageCodec s_lz4(type, codec);
        return &s_lz4;
    }
    case CodecTypePB::ZSTD: {
        static BlockPageCodec s_zstd(type, codec);
        return &s_zstd;
    }
    case CodecTypePB::SNAPPY: {
        static BlockPageCodec s_snappy(type, codec);
        return &s_snappy;
    }
    case CodecTypePB::ZLIB: {
        static BlockPageCodec s_zlib(type, codec);
        return &s_zlib;
    }
    default:
        return nullptr;
    }
}

} // namespace

Status get_page_codec(CodecTypePB type, const PageCodec** codec) {
    switch (type) {
    case CodecTypePB::NO_COMPRESSION:
        *codec = PassthroughPageCodec::instance();
        break;
    case CodecTypePB::LZ4:
    case CodecTypePB::ZSTD:
    case CodecTypePB::SNAPPY:
    case CodecTypePB::ZLIB:
        *codec = block_page_codec(type);
        break;
    case CodecTypePB::BIT_PACKING:
        *codec = BitPackingPageCodec::instance();
        break;
    case CodecTypePB::ROARING:
        *codec = RoaringPageCodec::instance();
        break;
    case CodecTypePB::RLE:
        *codec = RlePageCodec::instance();
        break;
    case CodecTypePB::DICT:
        *codec = DictPageCodec::instance();
        break;
    default:
        return Status::UnsupportedCodec(fmt::format("unknown codec type({})", static_cast<int>(type)));
    }
    return Status::OK();
}

Status get_page_codec(uint8_t codec_id, const PageCodec** codec) {
    if (!CodecTypePB_IsValid(codec_id)) {
        return Status::UnsupportedCodec(fmt::format("unknown codec type({})", codec_id));
    }
    return get_page_codec(static_cast<CodecTypePB>(codec_id), codec);
}

int effective_value_width(size_t size, int value_width) {
    if (value_width != 1 && value_width != 2 && value_width != 4 && value_width != 8) {
        return 1;
    }
    return size % value_width == 0 ? value_width : 1;
}

Status compress_page_values(CodecTypePB type, const Slice& raw, int value_width, faststring* out) {
    const PageCodec* codec = nullptr;
    RETURN_IF_ERROR(get_page_codec(type, &codec));
    out->clear();
    return codec->compress(raw, effective_value_width(raw.size, value_width), out);
}

Status decompress_page_values(uint8_t codec_id, const Slice& encoded, size_t uncompressed_size, faststring* out) {
    const PageCodec* codec = nullptr;
    RETURN_IF_ERROR(get_page_codec(codec_id, &codec));
    out->clear();
    RETURN_IF_ERROR(codec->decompress(encoded, uncompressed_size, out));
    if (out->size() != uncompressed_size) {
        return Status::Corruption(fmt::format("{} decoded {} bytes, expect {}",
                                              codec_type_to_string(codec->type()), out->size(), uncompressed_size));
    }
    return Status::OK();
}

const std::vector<CodecTypePB>& all_codec_types() {
    static const std::vector<CodecTypePB> s_types = [] {
        std::vector<CodecTypePB> types;
        for (int i = CodecTypePB_MIN; i <= CodecTypePB_MAX; ++i) {
            if (CodecTypePB_IsValid(i)) {
                types.push_back(static_cast<CodecTypePB>(i));
            }
        }
        return types;
    }();
    return s_types;
}

std::string codec_type_to_string(CodecTypePB type) {
    if (!CodecTypePB_IsValid(type)) {
        return fmt::format("UNKNOWN({})", static_cast<int>(type));
    }
    return CodecTypePB_Name(type);
}

Status parse_codec_type(const std::string& name, CodecTypePB* type) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    if (!CodecTypePB_Parse(upper, type)) {
        return Status::UnsupportedCodec(fmt::format("unknown codec name '{}'", name));
    }
    return Status::OK();
}

} // namespace strata
