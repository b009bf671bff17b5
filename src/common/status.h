// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "common/compiler_util.h"
#include "common/logging.h"

namespace strata {

class StatusPB;

template <typename T>
class StatusOr;

struct StatusCode {
    enum type : uint8_t {
        OK = 0,
        CANCELLED = 1,
        NOT_IMPLEMENTED_ERROR = 2,
        RUNTIME_ERROR = 3,
        INTERNAL_ERROR = 4,
        END_OF_FILE = 5,
        NOT_FOUND = 6,
        CORRUPTION = 7,
        INVALID_ARGUMENT = 8,
        IO_ERROR = 9,
        ALREADY_EXIST = 10,
        UNSUPPORTED_CODEC = 11,
        TRUNCATED_PAGE = 12,
        ROW_COUNT_MISMATCH = 13,
    };
};

class [[nodiscard]] Status {
public:
    Status() = default;

    ~Status() noexcept {
        if (!is_moved_from(_state)) {
            delete[] _state;
        }
    }

    // Copy c'tor makes copy of error detail so Status can be returned by value
    Status(const Status& s) : _state(s._state == nullptr ? nullptr : copy_state(s._state)) {}

    // Move c'tor
    Status(Status&& s) noexcept : _state(s._state) { s._state = moved_from_state(); }

    // Same as copy c'tor
    Status& operator=(const Status& s) {
        if (this != &s) {
            Status tmp(s);
            std::swap(this->_state, tmp._state);
        }
        return *this;
    }

    // Move assign.
    Status& operator=(Status&& s) noexcept {
        if (this != &s) {
            Status tmp(std::move(s));
            std::swap(this->_state, tmp._state);
        }
        return *this;
    }

    Status(const StatusPB& pstatus); // NOLINT

    // Updates the existing status with `new_status` provided that `this->ok()`.
    // If the existing status already contains a non-OK error, this update has no
    // effect and preserves the current data.
    //
    // Example:
    //   // Instead of "if (overall_status.ok()) overall_status = new_status"
    //   overall_status.update(new_status);
    //
    void update(const Status& new_status);
    void update(Status&& new_status);

    static Status OK() { return Status(); }

    static Status InvalidArgument(std::string_view msg) { return Status(StatusCode::INVALID_ARGUMENT, msg); }
    static Status Corruption(std::string_view msg) { return Status(StatusCode::CORRUPTION, msg); }
    static Status IOError(std::string_view msg) { return Status(StatusCode::IO_ERROR, msg); }
    static Status NotFound(std::string_view msg) { return Status(StatusCode::NOT_FOUND, msg); }
    static Status AlreadyExist(std::string_view msg) { return Status(StatusCode::ALREADY_EXIST, msg); }
    static Status NotSupported(std::string_view msg) { return Status(StatusCode::NOT_IMPLEMENTED_ERROR, msg); }
    static Status EndOfFile(std::string_view msg) { return Status(StatusCode::END_OF_FILE, msg); }
    static Status InternalError(std::string_view msg) { return Status(StatusCode::INTERNAL_ERROR, msg); }
    static Status RuntimeError(std::string_view msg) { return Status(StatusCode::RUNTIME_ERROR, msg); }
    static Status Cancelled(std::string_view msg) { return Status(StatusCode::CANCELLED, msg); }

    // A codec id this reader does not know. Fatal for the page, a newer reader is needed.
    static Status UnsupportedCodec(std::string_view msg) { return Status(StatusCode::UNSUPPORTED_CODEC, msg); }
    // Fewer bytes were supplied than a header declared.
    static Status TruncatedPage(std::string_view msg) { return Status(StatusCode::TRUNCATED_PAGE, msg); }
    // Decoded pages do not add up to the row count of the column.
    static Status RowCountMismatch(std::string_view msg) { return Status(StatusCode::ROW_COUNT_MISMATCH, msg); }

    bool ok() const { return _state == nullptr; }

    bool is_cancelled() const { return code() == StatusCode::CANCELLED; }

    bool is_end_of_file() const { return code() == StatusCode::END_OF_FILE; }

    bool is_ok_or_eof() const { return ok() || is_end_of_file(); }

    bool is_not_found() const { return code() == StatusCode::NOT_FOUND; }

    bool is_already_exist() const { return code() == StatusCode::ALREADY_EXIST; }

    bool is_io_error() const { return code() == StatusCode::IO_ERROR; }

    bool is_not_supported() const { return code() == StatusCode::NOT_IMPLEMENTED_ERROR; }

    bool is_corruption() const { return code() == StatusCode::CORRUPTION; }

    /// @return @c true if the status indicates an InvalidArgument error.
    bool is_invalid_argument() const { return code() == StatusCode::INVALID_ARGUMENT; }

    bool is_unsupported_codec() const { return code() == StatusCode::UNSUPPORTED_CODEC; }

    bool is_truncated_page() const { return code() == StatusCode::TRUNCATED_PAGE; }

    bool is_row_count_mismatch() const { return code() == StatusCode::ROW_COUNT_MISMATCH; }

    void to_protobuf(StatusPB* status) const;

    /// @return A string representation of this status suitable for printing.
    ///   Returns the string "OK" for success.
    std::string to_string(bool with_context_info = true) const;

    /// @return A string representation of the status code, without the message
    ///   text or sub code information.
    std::string code_as_string() const;

    // This is similar to to_string, except that it does not include
    // the context info.
    //
    // @note The returned std::string_view is only valid as long as this Status object
    //   remains live and unchanged.
    //
    // @return The message portion of the Status. For @c OK statuses,
    //   this returns an empty string.
    std::string_view message() const;

    // Error message with extra context info, like file name, line number.
    std::string_view detailed_message() const;

    StatusCode::type code() const {
        return _state == nullptr ? StatusCode::OK : static_cast<StatusCode::type>(_state[4]);
    }

    /// Clone this status and add the specified prefix to the message.
    ///
    /// If this status is OK, then an OK status will be returned.
    Status clone_and_prepend(std::string_view msg) const;

    /// Clone this status and add the specified suffix to the message.
    ///
    /// If this status is OK, then an OK status will be returned.
    Status clone_and_append(std::string_view msg) const;

    Status clone_and_append_context(const char* filename, int line, const char* expr) const;

private:
    static const char* copy_state(const char* state);
    static const char* copy_state_with_extra_ctx(const char* state, std::string_view ctx);

    // Indicates whether this Status was the rhs of a move operation.
    static bool is_moved_from(const char* state);
    static const char* moved_from_state();

    Status(StatusCode::type code, std::string_view msg) : Status(code, msg, {}) {}
    Status(StatusCode::type code, std::string_view msg, std::string_view ctx);

private:
    // OK status has a nullptr _state.  Otherwise, _state is a new[] array
    // of the following form:
    //    _state[0..1]                        == len1: length of message
    //    _state[2..3]                        == len2: length of context
    //    _state[4]                           == code
    //    _state[5.. 5 + len1]                == message
    //    _state[5 + len1 .. 5 + len1 + len2] == context
    const char* _state = nullptr;
};

inline void Status::update(const Status& new_status) {
    if (ok()) {
        *this = new_status;
    }
}

inline void Status::update(Status&& new_status) {
    if (ok()) {
        *this = std::move(new_status);
    }
}

inline std::ostream& operator<<(std::ostream& os, const Status& st) {
    return os << st.to_string();
}

inline const Status& to_status(const Status& st) {
    return st;
}

template <typename T>
inline const Status& to_status(const StatusOr<T>& st) {
    return st.status();
}

#ifndef AS_STRING
#define AS_STRING(x) AS_STRING_INTERNAL(x)
#define AS_STRING_INTERNAL(x) #x
#endif

#define RETURN_IF_ERROR(stmt)                                                                         \
    do {                                                                                              \
        auto&& status__ = (stmt);                                                                     \
        if (UNLIKELY(!status__.ok())) {                                                               \
            return to_status(status__).clone_and_append_context(__FILE__, __LINE__, AS_STRING(stmt)); \
        }                                                                                             \
    } while (false)

/// @brief Emit a warning if @c to_call returns a bad status.
#define WARN_IF_ERROR(to_call, warning_prefix)                \
    do {                                                      \
        auto&& st__ = (to_call);                              \
        if (UNLIKELY(!st__.ok())) {                           \
            LOG(WARNING) << (warning_prefix) << ": " << st__; \
        }                                                     \
    } while (0)

#define RETURN_IF_ERROR_WITH_WARN(stmt, warning_prefix)              \
    do {                                                             \
        auto&& st__ = (stmt);                                        \
        if (UNLIKELY(!st__.ok())) {                                  \
            LOG(WARNING) << (warning_prefix) << ", error: " << st__; \
            return std::move(st__);                                  \
        }                                                            \
    } while (0)

#define DCHECK_IF_ERROR(stmt)      \
    do {                           \
        auto&& st__ = (stmt);      \
        DCHECK(st__.ok()) << st__; \
    } while (0)

} // namespace strata

#define RETURN_IF(cond, ret) \
    do {                     \
        if (cond) {          \
            return ret;      \
        }                    \
    } while (0)

#define RETURN_IF_UNLIKELY(cond, ret) \
    do {                              \
        if (UNLIKELY(cond)) {         \
            return ret;               \
        }                             \
    } while (0)

#define RETURN_IF_EXCEPTION(stmt)                   \
    do {                                            \
        try {                                       \
            { stmt; }                               \
        } catch (const std::exception& e) {         \
            return Status::InternalError(e.what()); \
        }                                           \
    } while (0)
