// Copyright 2020 The Abseil Authors.
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

#include <exception>
#include <new>
#include <type_traits>
#include <utility>

#include "common/status.h"

namespace strata {

// Thrown by StatusOr<T>::value() when it holds an error.
class BadStatusOrAccess : public std::exception {
public:
    explicit BadStatusOrAccess(Status status);
    ~BadStatusOrAccess() override;

    const char* what() const noexcept override;

    const Status& status() const;

private:
    Status status_;
};

namespace internal_statusor {

class Helper {
public:
    static void HandleInvalidStatusCtorArg(Status*);
    [[noreturn]] static void Crash(const Status& status);
};

[[noreturn]] void ThrowBadStatusOrAccess(Status status);

} // namespace internal_statusor

// StatusOr<T> holds either a usable value of type T or the Status explaining why
// the value is absent. An OK status is not a valid error and is replaced by an
// internal error when passed to the constructor.
template <typename T>
class [[nodiscard]] StatusOr {
    template <typename U>
    friend class StatusOr;

public:
    using value_type = T;

    // Constructs a value-less StatusOr holding an unknown error.
    StatusOr() : status_(Status::InternalError("uninitialized StatusOr")) {}

    StatusOr(const Status& status) : status_(status) { EnsureNotOk(); } // NOLINT
    StatusOr(Status&& status) : status_(std::move(status)) { EnsureNotOk(); } // NOLINT

    StatusOr(const T& value) { MakeValue(value); } // NOLINT
    StatusOr(T&& value) { MakeValue(std::move(value)); } // NOLINT

    template <typename U, std::enable_if_t<std::is_convertible_v<U&&, T> && !std::is_same_v<std::decay_t<U>, T> &&
                                                   !std::is_same_v<std::decay_t<U>, Status> &&
                                                   !std::is_same_v<std::decay_t<U>, StatusOr<T>>,
                                           int> = 0>
    StatusOr(U&& value) { // NOLINT
        MakeValue(std::forward<U>(value));
    }

    template <typename U, std::enable_if_t<std::is_convertible_v<const U&, T> && !std::is_same_v<U, T>, int> = 0>
    StatusOr(const StatusOr<U>& other) : status_(other.status_) { // NOLINT
        if (other.ok()) MakeValue(other.data_);
    }

    template <typename U, std::enable_if_t<std::is_convertible_v<U&&, T> && !std::is_same_v<U, T>, int> = 0>
    StatusOr(StatusOr<U>&& other) : status_(std::move(other.status_)) { // NOLINT
        if (status_.ok()) MakeValue(std::move(other.data_));
    }

    template <typename... Args>
    explicit StatusOr(std::in_place_t, Args&&... args) {
        MakeValue(std::forward<Args>(args)...);
    }

    StatusOr(const StatusOr& other) : status_(other.status_) {
        if (other.ok()) MakeValue(other.data_);
    }

    StatusOr(StatusOr&& other) noexcept : status_(std::move(other.status_)) {
        if (status_.ok()) MakeValue(std::move(other.data_));
    }

    StatusOr& operator=(const StatusOr& other) {
        if (this == &other) return *this;
        if (other.ok()) {
            Assign(other.data_);
        } else {
            AssignStatus(other.status_);
        }
        return *this;
    }

    StatusOr& operator=(StatusOr&& other) noexcept {
        if (this == &other) return *this;
        if (other.ok()) {
            Assign(std::move(other.data_));
        } else {
            AssignStatus(std::move(other.status_));
        }
        return *this;
    }

    ~StatusOr() { Clear(); }

    bool ok() const { return status_.ok(); }

    const Status& status() const& { return status_; }
    Status status() && { return ok() ? Status::OK() : std::move(status_); }

    const T& value() const& {
        if (!ok()) internal_statusor::ThrowBadStatusOrAccess(status_);
        return data_;
    }
    T& value() & {
        if (!ok()) internal_statusor::ThrowBadStatusOrAccess(status_);
        return data_;
    }
    T&& value() && {
        if (!ok()) internal_statusor::ThrowBadStatusOrAccess(std::move(status_));
        return std::move(data_);
    }

    const T& operator*() const& {
        EnsureOk();
        return data_;
    }
    T& operator*() & {
        EnsureOk();
        return data_;
    }
    T&& operator*() && {
        EnsureOk();
        return std::move(data_);
    }

    const T* operator->() const {
        EnsureOk();
        return &data_;
    }
    T* operator->() {
        EnsureOk();
        return &data_;
    }

    template <typename U>
    T value_or(U&& default_value) const& {
        if (ok()) return data_;
        return std::forward<U>(default_value);
    }

private:
    template <typename... Args>
    void MakeValue(Args&&... args) {
        new (&data_) T(std::forward<Args>(args)...);
    }

    template <typename U>
    void Assign(U&& value) {
        if (ok()) {
            data_ = std::forward<U>(value);
        } else {
            MakeValue(std::forward<U>(value));
            status_ = Status::OK();
        }
    }

    template <typename U>
    void AssignStatus(U&& v) {
        Clear();
        status_ = std::forward<U>(v);
        EnsureNotOk();
    }

    void Clear() {
        if (ok()) data_.~T();
    }

    void EnsureOk() const {
        if (UNLIKELY(!ok())) internal_statusor::Helper::Crash(status_);
    }

    void EnsureNotOk() {
        if (UNLIKELY(ok())) internal_statusor::Helper::HandleInvalidStatusCtorArg(&status_);
    }

    Status status_;

    // 'data_' is active if 'status_.ok() == true'.
    struct Dummy {};
    union {
        Dummy dummy_;
        T data_;
    };
};

#define ASSIGN_OR_RETURN_IMPL(varname, lhs, rexpr)                                                \
    auto&& varname = (rexpr);                                                                     \
    if (UNLIKELY(!varname.ok())) {                                                                \
        return to_status(varname).clone_and_append_context(__FILE__, __LINE__, AS_STRING(rexpr)); \
    }                                                                                             \
    lhs = std::move(varname).value();

#define STATUS_MACROS_CONCAT_NAME_INNER(x, y) x##y
#define STATUS_MACROS_CONCAT_NAME(x, y) STATUS_MACROS_CONCAT_NAME_INNER(x, y)

#define ASSIGN_OR_RETURN(lhs, rexpr) \
    ASSIGN_OR_RETURN_IMPL(STATUS_MACROS_CONCAT_NAME(_status_or_value, __COUNTER__), lhs, rexpr)

} // namespace strata
