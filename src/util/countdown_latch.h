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

// This file is based on code available under the Apache license here:
//   https://github.com/apache/incubator-doris/blob/master/be/src/util/countdown_latch.h

// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "common/logging.h"

namespace strata {

// This is a C++ implementation of the Java CountDownLatch
// class.
// See http://docs.oracle.com/javase/6/docs/api/java/util/concurrent/CountDownLatch.html
class CountDownLatch {
public:
    // Initialize the latch with the given initial count.
    explicit CountDownLatch(int count) : count_(count) {}

    CountDownLatch(const CountDownLatch&) = delete;
    const CountDownLatch& operator=(const CountDownLatch&) = delete;

    // Decrement the count of this latch.
    // If the new count is zero, then all waiting threads are woken up.
    // If the count is already zero, this has no effect.
    void count_down() {
        std::lock_guard lock(lock_);
        if (count_ == 0) {
            return;
        }
        if (--count_ == 0) {
            // Latch has triggered.
            cond_.notify_all();
        }
    }

    // Wait until the count on the latch reaches zero.
    // If the count is already zero, this returns immediately.
    void wait() const {
        std::unique_lock lock(lock_);
        cond_.wait(lock, [this]() { return count_ <= 0; });
    }

    int64_t count() const {
        std::lock_guard lock(lock_);
        return count_;
    }

private:
    mutable std::mutex lock_;
    mutable std::condition_variable cond_;
    int64_t count_;
};

// Utility class which calls latch->count_down() in its destructor.
class CountDownOnScopeExit {
public:
    explicit CountDownOnScopeExit(CountDownLatch* latch) : latch_(latch) {}
    ~CountDownOnScopeExit() { latch_->count_down(); }

    CountDownOnScopeExit(const CountDownOnScopeExit&) = delete;
    const CountDownOnScopeExit& operator=(const CountDownOnScopeExit&) = delete;

private:
    CountDownLatch* latch_;
};

} // namespace strata
