// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "../config.h"

#if defined(PETREL_DEBUG_GUTS)
#   include <atomic>
#   include <iostream>
#   include <mutex>
#   include <string>
#   include <thread>
#   include <unordered_set>
#endif


#if defined(PETREL_DEBUG_GUTS)
#   define PETREL_GUTS_LOG(message) \
        (::PETREL_NAMESPACE::guts::log() << message << '\n')
#else
#   define PETREL_GUTS_LOG(message) ((void)0)
#endif


#if defined(PETREL_DEBUG_GUTS)

PETREL_NAMESPACE_START
PETREL_GUTS_NAMESPACE_START


class promise_private;


//! Live \a promise_private instances count.
PETREL_API std::atomic_int& _debug_private_counter();
PETREL_API std::mutex& _debug_cout_mutex();
PETREL_API void _debug_set_thread_name(std::thread& thread, const std::string& name);


//! Registry of live \a promise_private instances.
class PETREL_API _debug_promise_list
{
public:
    static _debug_promise_list& instance();

    void add(promise_private* p);
    void remove(promise_private* p);
    size_t size() const;

private:
    std::unordered_set<promise_private*>*   _promises;
    std::mutex*                     _guard;

    _debug_promise_list(std::unordered_set<promise_private*>* promises, std::mutex* guard)
        : _promises(promises)
        , _guard(guard)
    { }

};


//! Line logger. Holds cout lock for its whole lifetime.
class log
{
    PETREL_DISABLE_COPY(log);
    PETREL_DISABLE_MOVE(log);

public:
    log()   { _debug_cout_mutex().lock(); }
    ~log()  { std::cout.flush(); _debug_cout_mutex().unlock(); }

    template< typename _T >
    log& operator<<(const _T& data)
    {
        std::cout << data;
        return *this;
    }

};


PETREL_GUTS_NAMESPACE_END
PETREL_NAMESPACE_END

#endif
