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

#include "io/writable.h"
#include "util/slice.h"

namespace strata::io {

// OutputStream is the superclass of all classes representing an output stream of
// bytes. An output stream accepts output bytes and sends them to some sink.
class OutputStream : public Writable {
public:
    ~OutputStream() override = default;

    Status write(const Slice& data) { return write(data.data, static_cast<int64_t>(data.size)); }

    using Writable::write;

    // Bytes accepted by write() so far.
    virtual int64_t position() const = 0;
};

} // namespace strata::io
