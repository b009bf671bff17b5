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

#include "io/fd_output_stream.h"

#include <fcntl.h>
#include <fmt/format.h>
#include <unistd.h>

#include <type_traits>

#include "common/logging.h"
#include "io/io_error.h"

#define RETRY_ON_EINTR(err, expr)                                                              \
    do {                                                                                       \
        static_assert(std::is_signed<decltype(err)>::value, #err " must be a signed integer"); \
        (err) = (expr);                                                                        \
    } while ((err) == -1 && errno == EINTR)

namespace strata::io {

FdOutputStream::FdOutputStream(int fd) : _fd(fd) {}

FdOutputStream::~FdOutputStream() {
    auto st = FdOutputStream::close();
    LOG_IF(WARNING, !st.ok()) << st;
}

StatusOr<std::unique_ptr<FdOutputStream>> FdOutputStream::create(const std::string& path) {
    int fd;
    RETRY_ON_EINTR(fd, ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (fd < 0) {
        return io_error(fmt::format("open({})", path), errno);
    }
    return std::make_unique<FdOutputStream>(fd);
}

Status FdOutputStream::write(const void* data, int64_t count) {
    // According to the man(2) manual, if count is zero and fd refers to a file other than a regular file,
    // the results of ::write(2) are not specified, so here handle zero ourselves.
    if (UNLIKELY(count == 0)) {
        return Status::OK();
    }
    if (UNLIKELY(count < 0)) {
        return Status::InvalidArgument(fmt::format("negative count: {}", count));
    }
    if (UNLIKELY(_closed)) {
        return Status::InternalError("write to a closed FdOutputStream");
    }
    int64_t bytes_written = 0;
    while (bytes_written < count) {
        ssize_t r = ::write(_fd, static_cast<const char*>(data) + bytes_written, count - bytes_written);
        if (r > 0) {
            bytes_written += r;
        } else {
            if (errno == EINTR) {
                continue;
            } else {
                return io_error("write", errno);
            }
        }
    }
    _position += bytes_written;
    return Status::OK();
}

Status FdOutputStream::close() {
    if (_closed) {
        return Status::OK();
    }
    _closed = true;
    Status st;
    if (_sync_file_on_close && ::fdatasync(_fd) != 0) {
        st = io_error(fmt::format("fdatasync({})", _fd), errno);
    }
    int r;
    RETRY_ON_EINTR(r, ::close(_fd));
    if (st.ok() && r != 0) {
        st = io_error(fmt::format("close({})", _fd), errno);
    }
    _fd = -1;
    return st;
}

} // namespace strata::io
