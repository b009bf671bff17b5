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

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "gen_cpp/column_meta.pb.h"
#include "util/slice.h"

namespace strata {

// What a selector gets to see of a page: the uncompressed values sub-block and
// how to interpret it.
struct PageSample {
    Slice raw;
    // byte width of one value, 1 for byte oriented blocks
    int value_width = 1;
    // whether raw is a sequence of integers of |value_width| bytes
    bool integral = false;
};

// CompressionSelector picks the codec of one values block. Implementations must be
// deterministic and thread safe.
class CompressionSelector {
public:
    virtual ~CompressionSelector() = default;

    virtual CodecTypePB select(const PageSample& sample) const = 0;

    virtual std::string name() const = 0;
};

using CompressionSelectorPtr = std::shared_ptr<const CompressionSelector>;

// Always returns the configured codec.
class FixedCompressionSelector final : public CompressionSelector {
public:
    explicit FixedCompressionSelector(CodecTypePB type) : _type(type) {}

    CodecTypePB select(const PageSample& sample) const override { return _type; }

    std::string name() const override;

private:
    const CodecTypePB _type;
};

struct AdaptiveCompressionOptions {
    // values looked at, at most
    size_t sample_size = 1024;
    // consecutive values per sampled block
    size_t sample_block = 64;
    // bytes fed to the general purpose compressors for a trial run
    size_t trial_bytes = 8192;
    // a codec is only chosen if its estimate is at most raw size * max_ratio
    double max_ratio = 0.9;
    // estimates within this fraction of the best are considered equal
    double tie_tolerance = 0.05;
    std::vector<CodecTypePB> forbidden_codecs;

    // Build options from the adaptive_compression_* config values.
    static AdaptiveCompressionOptions from_config();
};

struct CodecEstimate {
    CodecTypePB type;
    size_t estimated_size;
};

// Picks the codec with the smallest estimated size from a bounded sample of the
// page. The sample is |sample_size| values taken as evenly spaced blocks of
// |sample_block| consecutive values, so the cost does not grow with the page.
//
// Estimates:
//  - RLE from the average run length inside the sampled blocks
//  - DICT from the number of distinct sampled values
//  - BIT_PACKING from the bit width of max - min, integers only
//  - ROARING from the density of set bits
//  - LZ4, SNAPPY and ZSTD from a trial compression of the sampled bytes
//
// Ties are broken in favour of the codec that is cheaper to decode.
class AdaptiveCompressionSelector final : public CompressionSelector {
public:
    explicit AdaptiveCompressionSelector(AdaptiveCompressionOptions options);

    CodecTypePB select(const PageSample& sample) const override;

    std::string name() const override { return "adaptive"; }

    // Estimated encoded size of every allowed candidate, in decode cost order.
    std::vector<CodecEstimate> estimate(const PageSample& sample) const;

    const AdaptiveCompressionOptions& options() const { return _options; }

private:
    bool _is_forbidden(CodecTypePB type) const;

    AdaptiveCompressionOptions _options;
};

// Rank of |type| in decode cost, cheaper first.
int codec_decode_cost_rank(CodecTypePB type);

// The selector the config asks for: adaptive, or fixed to page_default_compression.
CompressionSelectorPtr create_compression_selector_from_config();

} // namespace strata
