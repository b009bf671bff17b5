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

#include <fmt/format.h>

#include <string>

#include "io/output_stream.h"

namespace strata::io {

// Keeps everything written in memory.
class StringOutputStream final : public OutputStream {
public:
    StringOutputStream() = default;

    Status write(const void* data, int64_t size) override {
        if (UNLIKELY(_closed)) {
            return Status::InternalError("write to a closed StringOutputStream");
        }
        if (UNLIKELY(size < 0)) {
            return Status::InvalidArgument(fmt::format("negative count: {}", size));
        }
        _contents.append(static_cast<const char*>(data), size);
        return Status::OK();
    }

    using OutputStream::write;

    Status close() override {
        _closed = true;
        return Status::OK();
    }

    int64_t position() const override { return static_cast<int64_t>(_contents.size()); }

    const std::string& contents() const { return _contents; }

    std::string release() { return std::move(_contents); }

private:
    std::string _contents;
    bool _closed = false;
};

} // namespace strata::io
