// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#include "petrel/executor.h"
#include "petrel/inline_executor.h"
#include "petrel/thread_executor.h"
#include "petrel/guts/debug.h"

#include <mutex>
#include <string>


PETREL_NAMESPACE_START


namespace
{
    std::mutex& _default_sync()
    {
        static std::mutex v;
        return v;
    }

    std::shared_ptr<executor>& _default_executor()
    {
        static std::shared_ptr<executor> v = std::make_shared<thread_executor>();
        return v;
    }
};


// =====  executor  =====

std::shared_ptr<executor> executor::for_this_thread()
{
    auto const h = _thread_executor();

    if(h)
        return h;

    return default_executor();
}


void executor::use_for_this_thread(std::shared_ptr<executor> ex)
{
    _thread_executor() = std::move(ex);
}


std::shared_ptr<executor> executor::default_executor()
{
    std::lock_guard<std::mutex> lock{ _default_sync() };

    return _default_executor();
}


void executor::set_default(std::shared_ptr<executor> ex)
{
    std::shared_ptr<executor> old;

    {
        std::lock_guard<std::mutex> lock{ _default_sync() };

        old = std::move(_default_executor());
        _default_executor() = ex ? std::move(ex) : std::make_shared<thread_executor>();
    };
}


std::shared_ptr<executor>& executor::_thread_executor()
{
    thread_local static std::shared_ptr<executor> h;

    return h;
}


// =====  inline_executor  =====

inline_executor::~inline_executor()
{
}

void inline_executor::post(task_type&& task)
{
    task();
}

void inline_executor::use_for_this_thread()
{
    executor::use_for_this_thread(std::make_shared<inline_executor>());
}


// =====  thread_executor  =====

thread_executor::~thread_executor()
{
}

void thread_executor::post(task_type&& task)
{
    std::thread{ std::move(task) }.detach();
}

void thread_executor::use_for_this_thread()
{
    executor::use_for_this_thread(std::make_shared<thread_executor>());
}


// =====  thread_pool_executor  =====

thread_pool_executor::thread_pool_executor(unsigned threads_count)
    : _data(std::make_shared<pool_data>())
{
    if(!threads_count)
        threads_count = std::thread::hardware_concurrency();
    if(!threads_count)
        threads_count = 1;

    _threads.reserve(threads_count);

    for(unsigned i = 0; i < threads_count; ++i)
    {
        _threads.emplace_back(&thread_pool_executor::_work, _data);

#if defined(PETREL_DEBUG_GUTS)
        guts::_debug_set_thread_name(_threads.back(), "petrel:pool:" + std::to_string(i));
#endif
    };
}

// local
thread_pool_executor::~thread_pool_executor()
{
    {
        std::lock_guard<std::mutex> lock{ _data->sync };
        _data->exit = true;
    };

    _data->notifier.notify_all();

    for(auto& thread : _threads)
    {
        // pool may be released by the last promise living in one of its tasks
        if(thread.get_id() != std::this_thread::get_id())
            thread.join();
        else
            thread.detach();
    };
}

// async
void thread_pool_executor::post(task_type&& task)
{
    {
        std::lock_guard<std::mutex> lock{ _data->sync };
        _data->deferred_calls.push_back(std::move(task));
    };

    _data->notifier.notify_one();
}

// thread
void thread_pool_executor::_work(std::shared_ptr<pool_data> d)
{
    for(;;)
    {
        task_type event;

        {
            std::unique_lock<std::mutex> lock{ d->sync };

            d->notifier.wait(lock, [&d]() { return d->exit || !d->deferred_calls.empty(); });

            // drain queue before exit
            if(d->deferred_calls.empty())
                return;

            event = std::move(d->deferred_calls.front());
            d->deferred_calls.pop_front();
        };

        event();
    };
}

void thread_pool_executor::use_for_this_thread(unsigned threads_count)
{
    executor::use_for_this_thread(std::make_shared<thread_pool_executor>(threads_count));
}


PETREL_NAMESPACE_END
