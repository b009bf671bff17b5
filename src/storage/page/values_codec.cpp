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

#include "storage/page/values_codec.h"

#include <fmt/format.h>

#include <cstring>
#include <limits>
#include <type_traits>

#include "column/binary_column.h"
#include "column/fixed_length_column.h"
#include "column/null_type_column.h"
#include "column/type_traits.h"
#include "common/logging.h"
#include "storage/compression/page_codec.h"
#include "types/logical_type_infra.h"
#include "util/bit_util.h"
#include "util/coding.h"

namespace strata {

namespace {

template <typename T>
class FixedLengthValuesSerde {
public:
    static void serialize(const FixedLengthColumn<T>& column, const std::vector<uint32_t>* selection,
                          faststring* out) {
        const auto& data = column.get_data();
        if (selection == nullptr) {
            out->append(data.data(), data.size() * sizeof(T));
            return;
        }
        const size_t start = out->size();
        out->resize(start + selection->size() * sizeof(T));
        auto* dst = reinterpret_cast<T*>(out->data() + start);
        for (size_t i = 0; i < selection->size(); ++i) {
            memcpy(dst + i, &data[(*selection)[i]], sizeof(T));
        }
    }

    static Status deserialize(const Slice& raw, FixedLengthColumn<T>* column, size_t* num_values) {
        if (raw.size % sizeof(T) != 0) {
            return Status::Corruption(
                    fmt::format("values block of {} bytes is not a multiple of value width {}", raw.size, sizeof(T)));
        }
        *num_values = raw.size / sizeof(T);
        column->append_numbers(raw.data, *num_values);
        return Status::OK();
    }
};

class BooleanValuesSerde {
public:
    static void serialize(const BooleanColumn& column, const std::vector<uint32_t>* selection, faststring* out) {
        const auto& data = column.get_data();
        const size_t n = selection == nullptr ? data.size() : selection->size();
        put_fixed32_le(out, static_cast<uint32_t>(n));
        const size_t start = out->size();
        out->resize(start + BitUtil::Ceil(n, 8));
        uint8_t* bitmap = out->data() + start;
        memset(bitmap, 0, out->size() - start);
        for (size_t i = 0; i < n; ++i) {
            const uint8_t v = data[selection == nullptr ? i : (*selection)[i]];
            if (v) {
                bitmap[i >> 3] |= 1 << (i & 7);
            }
        }
    }

    static Status deserialize(const Slice& raw, BooleanColumn* column, size_t* num_values) {
        Slice input = raw;
        uint32_t n = 0;
        if (!get_fixed32_le(&input, &n)) {
            return Status::Corruption("boolean values block has no count");
        }
        if (input.size != static_cast<size_t>(BitUtil::Ceil(n, 8))) {
            return Status::Corruption(
                    fmt::format("boolean values block holds {} bitmap bytes for {} values", input.size, n));
        }
        const auto* bitmap = reinterpret_cast<const uint8_t*>(input.data);
        auto& data = column->get_data();
        const size_t old_size = data.size();
        data.resize(old_size + n);
        for (size_t i = 0; i < n; ++i) {
            data[old_size + i] = (bitmap[i >> 3] >> (i & 7)) & 1;
        }
        *num_values = n;
        return Status::OK();
    }
};

class BinaryValuesSerde {
public:
    template <typename T>
    static void serialize(const BinaryColumnBase<T>& column, const std::vector<uint32_t>* selection,
                          faststring* out) {
        const auto& offsets = column.get_offset();
        const auto& bytes = column.get_bytes();
        const size_t n = selection == nullptr ? column.size() : selection->size();
        put_fixed32_le(out, static_cast<uint32_t>(n));

        size_t offsets_pos = out->size();
        out->resize(offsets_pos + (n + 1) * sizeof(T));
        T offset = 0;
        encode_offset(out->data() + offsets_pos, offset);
        for (size_t i = 0; i < n; ++i) {
            const size_t row = selection == nullptr ? i : (*selection)[i];
            offset += offsets[row + 1] - offsets[row];
            encode_offset(out->data() + offsets_pos + (i + 1) * sizeof(T), offset);
        }
        if (selection == nullptr) {
            out->append(bytes.data() + offsets[0], offsets[n] - offsets[0]);
            return;
        }
        for (size_t i = 0; i < n; ++i) {
            const size_t row = (*selection)[i];
            out->append(bytes.data() + offsets[row], offsets[row + 1] - offsets[row]);
        }
    }

    template <typename T>
    static Status deserialize(const Slice& raw, BinaryColumnBase<T>* column, size_t* num_values) {
        Slice input = raw;
        uint32_t n = 0;
        if (!get_fixed32_le(&input, &n)) {
            return Status::Corruption("binary values block has no count");
        }
        const size_t offsets_size = (static_cast<size_t>(n) + 1) * sizeof(T);
        if (input.size < offsets_size) {
            return Status::Corruption(fmt::format("binary values block of {} bytes is too small for {} offsets",
                                                  raw.size, static_cast<size_t>(n) + 1));
        }
        const auto* p = reinterpret_cast<const uint8_t*>(input.data);
        const size_t bytes_size = input.size - offsets_size;
        if (decode_offset<T>(p) != 0) {
            return Status::Corruption("binary values block offsets do not start at 0");
        }
        T prev = 0;
        for (size_t i = 1; i <= n; ++i) {
            const T cur = decode_offset<T>(p + i * sizeof(T));
            if (cur < prev || cur > bytes_size) {
                return Status::Corruption(fmt::format("binary values block offset {} is {}, previous {}, {} bytes",
                                                      i, cur, prev, bytes_size));
            }
            prev = cur;
        }
        if (prev != bytes_size) {
            return Status::Corruption(
                    fmt::format("binary values block offsets end at {}, block has {} bytes", prev, bytes_size));
        }

        auto& dst_bytes = column->get_bytes();
        auto& dst_offsets = column->get_offset();
        const T base = dst_offsets.back();
        if (static_cast<uint64_t>(base) + bytes_size > std::numeric_limits<T>::max()) {
            return Status::Corruption(fmt::format("{} exceeds the {} byte limit of its offsets",
                                                  static_cast<uint64_t>(base) + bytes_size,
                                                  std::numeric_limits<T>::max()));
        }
        dst_offsets.reserve(dst_offsets.size() + n);
        for (size_t i = 1; i <= n; ++i) {
            dst_offsets.emplace_back(base + decode_offset<T>(p + i * sizeof(T)));
        }
        dst_bytes.insert(dst_bytes.end(), p + offsets_size, p + offsets_size + bytes_size);
        *num_values = n;
        return Status::OK();
    }

private:
    template <typename T>
    static void encode_offset(uint8_t* buf, T v) {
        if constexpr (std::is_same_v<T, uint32_t>) {
            encode_fixed32_le(buf, v);
        } else {
            encode_fixed64_le(buf, v);
        }
    }

    template <typename T>
    static T decode_offset(const uint8_t* buf) {
        if constexpr (std::is_same_v<T, uint32_t>) {
            return decode_fixed32_le(buf);
        } else {
            return decode_fixed64_le(buf);
        }
    }
};

} // namespace

void ValuesSerde::serialize(const Column& column, LogicalType type, const std::vector<uint32_t>* selection,
                            faststring* out) {
    DCHECK(!column.is_nullable());
    if (type == TYPE_NULL) {
        put_fixed32_le(out, static_cast<uint32_t>(selection == nullptr ? column.size() : selection->size()));
        return;
    }
    if (type == TYPE_BOOLEAN) {
        BooleanValuesSerde::serialize(static_cast<const BooleanColumn&>(column), selection, out);
        return;
    }
    type_dispatch_basic(type, [&]<LogicalType LT>() {
        using ColumnType = RunTimeColumnType<LT>;
        if constexpr (is_binary_type(LT)) {
            BinaryValuesSerde::serialize(static_cast<const ColumnType&>(column), selection, out);
        } else {
            FixedLengthValuesSerde<typename ColumnType::ValueType>::serialize(
                    static_cast<const ColumnType&>(column), selection, out);
        }
    });
}

Status ValuesSerde::deserialize(const Slice& raw, LogicalType type, Column* dst, size_t* num_values) {
    DCHECK(!dst->is_nullable());
    *num_values = 0;
    if (type == TYPE_NULL) {
        Slice input = raw;
        uint32_t n = 0;
        if (!get_fixed32_le(&input, &n) || !input.empty()) {
            return Status::Corruption(fmt::format("null values block must be 4 bytes, got {}", raw.size));
        }
        dst->append_default(n);
        *num_values = n;
        return Status::OK();
    }
    if (type == TYPE_BOOLEAN) {
        return BooleanValuesSerde::deserialize(raw, static_cast<BooleanColumn*>(dst), num_values);
    }
    return type_dispatch_basic(type, [&]<LogicalType LT>() -> Status {
        using ColumnType = RunTimeColumnType<LT>;
        if constexpr (is_binary_type(LT)) {
            return BinaryValuesSerde::deserialize(raw, static_cast<ColumnType*>(dst), num_values);
        } else {
            return FixedLengthValuesSerde<typename ColumnType::ValueType>::deserialize(
                    raw, static_cast<ColumnType*>(dst), num_values);
        }
    });
}

PageSample ValuesSerde::make_sample(LogicalType type, const Slice& raw) {
    PageSample sample;
    sample.raw = raw;
    if (type != TYPE_BOOLEAN && (is_integer_type(type) || is_float_type(type))) {
        sample.value_width = static_cast<int>(get_size_of_fixed_length_type(type));
        sample.integral = is_integer_type(type);
    }
    return sample;
}

Status append_values_block(CodecTypePB codec, const Slice& raw, int value_width, faststring* out, CodecTypePB* used) {
    if (raw.size > std::numeric_limits<uint32_t>::max()) {
        return Status::NotSupported(fmt::format("values block of {} bytes exceeds the u32 size field", raw.size));
    }
    faststring compressed;
    if (codec != CodecTypePB::NO_COMPRESSION) {
        RETURN_IF_ERROR(compress_page_values(codec, raw, value_width, &compressed));
        if (compressed.size() >= raw.size) {
            VLOG_CODEC << codec_type_to_string(codec) << " does not shrink " << raw.size
                       << " bytes, store them uncompressed";
            codec = CodecTypePB::NO_COMPRESSION;
        }
    }
    const Slice payload = codec == CodecTypePB::NO_COMPRESSION ? raw : Slice(compressed);
    put_fixed8(out, static_cast<uint8_t>(codec));
    put_fixed32_le(out, static_cast<uint32_t>(payload.size));
    put_fixed32_le(out, static_cast<uint32_t>(raw.size));
    out->append(payload.data, payload.size);
    *used = codec;
    return Status::OK();
}

Status parse_values_block_header(const Slice& input, ValuesBlockHeader* header) {
    if (input.size < ValuesBlockHeader::kSize) {
        return Status::TruncatedPage(
                fmt::format("values block header needs {} bytes, {} left", ValuesBlockHeader::kSize, input.size));
    }
    const auto* p = reinterpret_cast<const uint8_t*>(input.data);
    header->codec_id = decode_fixed8(p);
    header->compressed_size = decode_fixed32_le(p + 1);
    header->uncompressed_size = decode_fixed32_le(p + 5);
    if (header->compressed_size > input.size - ValuesBlockHeader::kSize) {
        return Status::TruncatedPage(fmt::format("values block declares {} bytes, {} left", header->compressed_size,
                                                 input.size - ValuesBlockHeader::kSize));
    }
    return Status::OK();
}

Status read_values_block(Slice* input, faststring* scratch, Slice* raw, ValuesBlockHeader* header) {
    ValuesBlockHeader local;
    if (header == nullptr) {
        header = &local;
    }
    RETURN_IF_ERROR(parse_values_block_header(*input, header));
    const Slice payload(input->data + ValuesBlockHeader::kSize, header->compressed_size);
    if (header->codec_id == CodecTypePB::NO_COMPRESSION) {
        if (payload.size != header->uncompressed_size) {
            return Status::Corruption(fmt::format("uncompressed values block is {} bytes, declared {}", payload.size,
                                                  header->uncompressed_size));
        }
        *raw = payload;
    } else {
        RETURN_IF_ERROR(decompress_page_values(header->codec_id, payload, header->uncompressed_size, scratch));
        *raw = Slice(*scratch);
    }
    input->remove_prefix(ValuesBlockHeader::kSize + header->compressed_size);
    return Status::OK();
}

} // namespace strata
