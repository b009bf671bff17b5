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

#include "storage/compression/compression_selector.h"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <unordered_set>

#include "common/config.h"
#include "common/logging.h"
#include "storage/compression/int_codec_util.h"
#include "storage/compression/page_codec.h"
#include "util/bit_util.h"
#include "util/block_compression.h"
#include "util/faststring.h"

namespace strata {

namespace {

// cheaper to decode first
constexpr CodecTypePB kDecodeCostOrder[] = {
        CodecTypePB::NO_COMPRESSION, CodecTypePB::RLE,  CodecTypePB::BIT_PACKING, CodecTypePB::DICT,
        CodecTypePB::ROARING,        CodecTypePB::LZ4,  CodecTypePB::SNAPPY,      CodecTypePB::ZSTD,
        CodecTypePB::ZLIB,
};

int varint_length(uint64_t v) {
    int len = 1;
    while (v >= 0x80) {
        v >>= 7;
        ++len;
    }
    return len;
}

struct SampleStats {
    size_t num_values = 0;
    size_t num_runs = 0;
    size_t num_distinct = 0;
    uint64_t min_value = 0;
    uint64_t max_value = 0;
    size_t set_bits = 0;
    faststring bytes;
};

} // namespace

int codec_decode_cost_rank(CodecTypePB type) {
    for (size_t i = 0; i < std::size(kDecodeCostOrder); ++i) {
        if (kDecodeCostOrder[i] == type) {
            return static_cast<int>(i);
        }
    }
    return static_cast<int>(std::size(kDecodeCostOrder));
}

std::string FixedCompressionSelector::name() const {
    return "fixed-" + codec_type_to_string(_type);
}

AdaptiveCompressionOptions AdaptiveCompressionOptions::from_config() {
    AdaptiveCompressionOptions options;
    options.sample_size = std::max<int32_t>(1, config::adaptive_compression_sample_size);
    options.sample_block = std::max<int32_t>(1, config::adaptive_compression_sample_block);
    options.trial_bytes = std::max<int32_t>(0, config::adaptive_compression_trial_bytes);
    options.max_ratio = config::adaptive_compression_max_ratio;
    options.tie_tolerance = std::max(0.0, config::adaptive_compression_tie_tolerance);
    for (const auto& name : config::adaptive_compression_forbidden_codecs) {
        CodecTypePB type;
        Status st = parse_codec_type(name, &type);
        if (!st.ok()) {
            LOG(WARNING) << "ignore forbidden codec in config: " << st;
            continue;
        }
        options.forbidden_codecs.push_back(type);
    }
    return options;
}

AdaptiveCompressionSelector::AdaptiveCompressionSelector(AdaptiveCompressionOptions options)
        : _options(std::move(options)) {
    _options.sample_size = std::max<size_t>(1, _options.sample_size);
    _options.sample_block = std::clamp<size_t>(_options.sample_block, 1, _options.sample_size);
}

bool AdaptiveCompressionSelector::_is_forbidden(CodecTypePB type) const {
    return std::find(_options.forbidden_codecs.begin(), _options.forbidden_codecs.end(), type) !=
           _options.forbidden_codecs.end();
}

static SampleStats collect_sample(const PageSample& sample, int width, const AdaptiveCompressionOptions& options) {
    SampleStats stats;
    const size_t n = sample.raw.size / width;
    const auto* data = reinterpret_cast<const uint8_t*>(sample.raw.data);

    // evenly spaced blocks of consecutive values
    size_t num_blocks = 1;
    size_t block_len = n;
    if (n > options.sample_size) {
        block_len = options.sample_block;
        num_blocks = BitUtil::Ceil(options.sample_size, block_len);
    }
    const size_t stride = n / num_blocks;

    std::unordered_set<uint64_t> distinct;
    bool first = true;
    for (size_t b = 0; b < num_blocks; ++b) {
        const size_t start = b * stride;
        const size_t len = std::min(block_len, n - start);
        uint64_t prev = 0;
        for (size_t i = 0; i < len; ++i) {
            const uint8_t* p = data + (start + i) * width;
            const uint64_t v = load_uint(p, width);
            if (i == 0 || v != prev) {
                ++stats.num_runs;
            }
            prev = v;
            if (first) {
                stats.min_value = stats.max_value = v;
                first = false;
            } else {
                stats.min_value = std::min(stats.min_value, v);
                stats.max_value = std::max(stats.max_value, v);
            }
            distinct.insert(v);
            stats.set_bits += __builtin_popcountll(v);
            if (stats.bytes.size() < options.trial_bytes) {
                stats.bytes.append(p, width);
            }
        }
        stats.num_values += len;
    }
    stats.num_distinct = distinct.size();
    return stats;
}

static size_t trial_compress(CodecTypePB type, const SampleStats& stats, size_t raw_size) {
    const BlockCompressionCodec* codec = nullptr;
    Status st = get_block_compression_codec(type, &codec);
    if (!st.ok() || codec == nullptr || stats.bytes.size() == 0) {
        return raw_size;
    }
    faststring buf;
    buf.resize(codec->max_compressed_len(stats.bytes.size()));
    Slice input(stats.bytes.data(), stats.bytes.size());
    Slice output(buf.data(), buf.size());
    st = codec->compress(input, &output);
    if (!st.ok()) {
        VLOG_CODEC << "trial compression with " << codec_type_to_string(type) << " failed: " << st;
        return raw_size;
    }
    const double ratio = static_cast<double>(output.size) / static_cast<double>(stats.bytes.size());
    return static_cast<size_t>(ratio * static_cast<double>(raw_size));
}

std::vector<CodecEstimate> AdaptiveCompressionSelector::estimate(const PageSample& sample) const {
    std::vector<CodecEstimate> estimates;
    const size_t raw_size = sample.raw.size;
    const int width = effective_value_width(raw_size, sample.value_width);
    const size_t n = raw_size / width;
    if (n == 0) {
        return estimates;
    }
    const SampleStats stats = collect_sample(sample, width, _options);
    const double scale = static_cast<double>(n) / static_cast<double>(stats.num_values);

    for (CodecTypePB type : kDecodeCostOrder) {
        if (type == CodecTypePB::NO_COMPRESSION || _is_forbidden(type)) {
            continue;
        }
        size_t size = 0;
        switch (type) {
        case CodecTypePB::RLE: {
            const double avg_run = static_cast<double>(stats.num_values) / static_cast<double>(stats.num_runs);
            const double runs = static_cast<double>(n) / avg_run;
            size = 1 + static_cast<size_t>(runs * (varint_length(static_cast<uint64_t>(avg_run)) + width));
            break;
        }
        case CodecTypePB::BIT_PACKING: {
            if (!sample.integral) {
                continue;
            }
            const int bits = BitUtil::NumRequiredBits(stats.max_value - stats.min_value);
            size = 2 + width + BitUtil::Ceil(static_cast<int64_t>(n) * bits, 8);
            break;
        }
        case CodecTypePB::DICT: {
            // a small distinct count is taken as the whole dictionary, otherwise scale it
            size_t distinct = stats.num_distinct;
            if (stats.num_values < n && stats.num_distinct * 2 > stats.num_values) {
                distinct = std::min(n, static_cast<size_t>(static_cast<double>(distinct) * scale));
            }
            const int bits = BitUtil::NumRequiredBits(distinct > 0 ? distinct - 1 : 0);
            size = 1 + 4 + distinct * width + 1 + BitUtil::Ceil(static_cast<int64_t>(n) * bits, 8);
            break;
        }
        case CodecTypePB::ROARING: {
            // array containers cost 2 bytes per set bit, bitmap containers cap it at one bit per bit
            const double set_bits = static_cast<double>(stats.set_bits) * scale;
            size = 4 + 16 + std::min(static_cast<size_t>(2 * set_bits), raw_size);
            break;
        }
        case CodecTypePB::ZLIB:
            // only chosen explicitly
            continue;
        default:
            size = trial_compress(type, stats, raw_size);
            break;
        }
        estimates.push_back({type, size});
    }
    return estimates;
}

CodecTypePB AdaptiveCompressionSelector::select(const PageSample& sample) const {
    const auto estimates = estimate(sample);
    const double limit = static_cast<double>(sample.raw.size) * _options.max_ratio;

    size_t best = std::numeric_limits<size_t>::max();
    for (const auto& e : estimates) {
        if (static_cast<double>(e.estimated_size) <= limit) {
            best = std::min(best, e.estimated_size);
        }
    }
    if (best == std::numeric_limits<size_t>::max()) {
        return CodecTypePB::NO_COMPRESSION;
    }
    // estimates are in decode cost order, take the cheapest one close enough to the best
    const double tolerance = static_cast<double>(best) * (1.0 + _options.tie_tolerance);
    for (const auto& e : estimates) {
        if (static_cast<double>(e.estimated_size) <= limit && static_cast<double>(e.estimated_size) <= tolerance) {
            return e.type;
        }
    }
    return CodecTypePB::NO_COMPRESSION;
}

CompressionSelectorPtr create_compression_selector_from_config() {
    if (config::page_enable_adaptive_compression) {
        return std::make_shared<AdaptiveCompressionSelector>(AdaptiveCompressionOptions::from_config());
    }
    CodecTypePB type = CodecTypePB::LZ4;
    Status st = parse_codec_type(config::page_default_compression, &type);
    if (!st.ok()) {
        LOG(WARNING) << "bad page_default_compression, use LZ4: " << st;
        type = CodecTypePB::LZ4;
    }
    return std::make_shared<FixedCompressionSelector>(type);
}

} // namespace strata
