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

#include "common/statusor.h"
#include "io/output_stream.h"

namespace strata::io {

class FdOutputStream final : public OutputStream {
public:
    // The file descriptor |fd| will be closed on `close()` or destruction.
    explicit FdOutputStream(int fd);

    ~FdOutputStream() override;

    // Disallow copy and assignment
    FdOutputStream(const FdOutputStream&) = delete;
    void operator=(const FdOutputStream&) = delete;
    // Disallow move c'tor and move assignment
    FdOutputStream(FdOutputStream&&) = delete;
    void operator=(FdOutputStream&&) = delete;

    // Create or truncate |path| and open it for writing.
    static StatusOr<std::unique_ptr<FdOutputStream>> create(const std::string& path);

    int fd() const { return _fd; }

    Status write(const void* data, int64_t count) override;

    using OutputStream::write;

    int64_t position() const override { return _position; }

    Status close() override;

    // By default, all modified buffer cache pages for the file referred to by the file descriptor
    // will NOT be flushed to the disk device.
    //
    // Calling `set_fdatasync_on_close(true)` to change that.
    void set_fdatasync_on_close(bool value) { _sync_file_on_close = value; }

private:
    int _fd;
    int64_t _position = 0;
    bool _sync_file_on_close = false;
    bool _closed = false;
};

} // namespace strata::io
