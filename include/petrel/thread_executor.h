// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "executor.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>


PETREL_NAMESPACE_START


//! Starts detached thread per task.
class PETREL_API thread_executor : public executor
{
public:
    ~thread_executor() override;

    void post(task_type&& task) override;

    static void use_for_this_thread();

};


//! Fixed set of worker threads sharing FIFO task queue.
//!
//! \note Blocking inside of tasks (e.g. \a promise::await()) takes worker
//!       away from the pool. Pool with fewer workers than nested blocking
//!       waits will deadlock.
class PETREL_API thread_pool_executor : public executor
{
    PETREL_DISABLE_COPY(thread_pool_executor);
    PETREL_DISABLE_MOVE(thread_pool_executor);

public:
    using queue_type = std::deque< task_type >;

    //! \param threads_count 0 means \a std::thread::hardware_concurrency().
    explicit
    thread_pool_executor(unsigned threads_count = 0);
    //! Runs queued tasks to completion and joins workers.
    ~thread_pool_executor() override;

    void post(task_type&& task) override;

    unsigned threads_count() const  { return static_cast<unsigned>(_threads.size()); }

    static void use_for_this_thread(unsigned threads_count = 0);

private:
    //! Outlives pool object if pool is destroyed by one of its workers.
    struct pool_data
    {
        queue_type              deferred_calls;
        std::condition_variable notifier;
        std::mutex              sync;
        bool                    exit = false;
    };

    std::shared_ptr<pool_data>  _data;
    std::vector<std::thread>    _threads;

    static void _work(std::shared_ptr<pool_data> d);

};


PETREL_NAMESPACE_END
