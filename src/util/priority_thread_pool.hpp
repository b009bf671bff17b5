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
//   https://github.com/apache/incubator-doris/blob/master/be/src/util/priority_thread_pool.hpp

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

#include <boost/thread.hpp>
#include <functional>
#include <string>

#include "common/logging.h"
#include "util/blocking_priority_queue.hpp"

namespace strata {

// Simple threadpool which runs tasks in parallel which were placed on a blocking
// priority queue by offer(). Tasks with a higher priority are picked up first.
class PriorityThreadPool {
public:
    typedef std::function<void()> WorkFunction;

    struct Task {
        int64_t priority = 0;
        WorkFunction work_function;
        bool operator<(const Task& o) const { return priority < o.priority; }
    };

    // Creates a new thread pool and start num_threads threads.
    //  -- num_threads: how many threads are part of this pool
    //  -- queue_size: the maximum size of the queue on which work items are offered. If the
    //     queue exceeds this size, subsequent calls to offer will block until there is
    //     capacity available.
    PriorityThreadPool(std::string name, uint32_t num_threads, uint32_t queue_size)
            : _name(std::move(name)), _work_queue(queue_size) {
        for (uint32_t i = 0; i < num_threads; ++i) {
            _threads.create_thread([this]() { work_thread(); });
        }
        VLOG(1) << "started thread pool " << _name << " with " << num_threads << " threads";
    }

    PriorityThreadPool(const PriorityThreadPool&) = delete;
    PriorityThreadPool& operator=(const PriorityThreadPool&) = delete;

    // Destructor ensures that all threads are terminated before this object is freed
    // (otherwise they may continue to run and reference member variables)
    ~PriorityThreadPool() noexcept {
        shutdown();
        join();
    }

    // Blocking operation that puts a task on the queue. If the queue is full, blocks
    // until there is capacity available.
    //
    // The caller needs to ensure that any data referenced by the task remains valid
    // until it has been processed.
    //
    // Returns true if the task was successfully added to the queue, false otherwise
    // (which typically means that the thread pool has already been shut down).
    bool offer(Task task) { return _work_queue.blocking_put(std::move(task)); }

    bool offer(WorkFunction func) { return offer(Task{0, std::move(func)}); }

    // Shuts the thread pool down, causing the work queue to cease accepting offered work.
    // Worker threads terminate once the queued tasks have been processed.
    void shutdown() { _work_queue.shutdown(); }

    // Blocks until all threads are finished.
    void join() { _threads.join_all(); }

    size_t num_threads() const { return _threads.size(); }

    const std::string& name() const { return _name; }

private:
    // Driver method for each thread in the pool. Continues to read work from the queue
    // until the pool is shutdown and the queue is drained.
    void work_thread() {
        Task task;
        while (_work_queue.blocking_get(&task)) {
            task.work_function();
            task.work_function = nullptr;
        }
    }

    const std::string _name;

    BlockingPriorityQueue<Task> _work_queue;

    // Collection of worker threads that process work from the queue.
    boost::thread_group _threads;
};

} // namespace strata
