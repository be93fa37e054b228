// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#include "petrel/promise.h"

#include <stdexcept>

#if defined(PETREL_DEBUG_GUTS)
#   if defined(PETREL_OS_WIN)
#       define WIN32_LEAN_AND_MEAN
#       include <windows.h>
#   elif defined(PETREL_HAS_PTHREAD_SETNAME)
#       include <pthread.h>
#   endif
#endif


PETREL_NAMESPACE_START


// ====  private  ====


promise::promise(_chained_tag, std::shared_ptr<executor> ex)
    : _d(new guts::promise_private{ std::move(ex) })
{
    if(!_d->exec())
        throw std::invalid_argument("petrel::promise: executor is null");
}


void promise::_run(executor_fn& fn)
{
    promise self = *this;

    try
    {
        fn(
            [self](std::any value) mutable { self.resolve(std::move(value)); },
            [self](std::any error) mutable { self.reject(std::move(error)); }
        );
    }
    catch(...)
    {
        auto error = current_error();

        PETREL_GUTS_LOG("petrel::promise: executor function failed, rejecting -- " << error_message(error));

        _d->settle(std::move(error), rejected);
    };
}


void promise::_fulfill(std::any&& value, bool is_resolve)
{
    if(!is_resolve)
    {
        _d->settle(std::move(value), rejected);
        return;
    };

    if(const promise* inner = std::any_cast<promise>(&value))
    {
        _adopt(*inner);
        return;
    };

    _d->settle(std::move(value), resolved);
}


void promise::_adopt(const promise& inner)
{
    if(inner._d == _d)
    {
        PETREL_GUTS_LOG("petrel::promise: chaining cycle -- " << std::hex << _d.data() << std::dec);

        _d->settle(
            std::make_exception_ptr(std::logic_error{ "petrel::promise: chaining cycle detected" }),
            rejected
        );
        return;
    };

    if(!_d->begin_adoption())
        return;

    inner._d->subscribe(
        [self = _d](const std::any& value)
        {
            self->settle(std::any{ value }, resolved, true);
        },
        [self = _d](const std::any& error)
        {
            self->settle(std::any{ error }, rejected, true);
        }
    );
}



// ====  public  ====


promise::promise()
    : promise(_chained_tag{}, executor::for_this_thread())
{ }


promise::promise(executor_fn fn)
    : promise(std::move(fn), executor::for_this_thread())
{ }


promise::promise(executor_fn fn, std::shared_ptr<executor> ex)
    : promise(_chained_tag{}, std::move(ex))
{
    if(!fn)
        throw std::invalid_argument("petrel::promise: executor function is empty");

    _d->exec()->post(
        [self = *this, fn = std::move(fn)]() mutable
        {
            self._run(fn);
        }
    );
}


promise& promise::resolve(const std::any& value)
{
    _fulfill(std::any{ value }, true);

    return *this;
}


promise& promise::resolve(std::any&& value)
{
    _fulfill(std::move(value), true);

    return *this;
}


promise& promise::resolve()
{
    _fulfill(std::any{}, true);

    return *this;
}


promise& promise::reject(const std::any& error)
{
    _fulfill(std::any{ error }, false);

    return *this;
}


promise& promise::reject(std::any&& error)
{
    _fulfill(std::move(error), false);

    return *this;
}


promise& promise::reject()
{
    _fulfill(std::any{}, false);

    return *this;
}


std::tuple<std::any, std::any> promise::await() const
{
    auto [state, result] = _d->wait_result();

    if(state == resolved)
        return { std::move(result), std::any{} };

    return { std::any{}, std::move(result) };
}


void promise::wait() const
{
    _d->wait_result();
}


std::any promise::get() const
{
    auto [state, result] = _d->wait_result();

    if(state == rejected)
        rethrow_error(result);

    return result;
}


std::any promise::value() const
{
    return _d->result_copy();
}


fulfillment_state_t promise::fulfillment() const
{
    return _d->fulfillment();
}



// ====  debug guts  ====


#if defined(PETREL_DEBUG_GUTS)

PETREL_GUTS_NAMESPACE_START


std::atomic_int& _debug_private_counter()
{
    static std::atomic_int v{ 0 };

    return v;
}


std::mutex& _debug_cout_mutex()
{
    static std::mutex v;

    return v;
}


_debug_promise_list& _debug_promise_list::instance()
{
    // never destroyed: promises may outlive static destruction in detached threads
    static _debug_promise_list v{ new std::unordered_set<promise_private*>{}, new std::mutex{} };

    return v;
}


void _debug_promise_list::add(promise_private* p)
{
    std::unique_lock<std::mutex> lock{ *_guard };

    _promises->insert(p);
}


void _debug_promise_list::remove(promise_private* p)
{
    std::unique_lock<std::mutex> lock{ *_guard };

    _promises->erase(p);
}


size_t _debug_promise_list::size() const
{
    std::unique_lock<std::mutex> lock{ *_guard };

    return _promises->size();
}


#if defined(PETREL_OS_WIN)

void _debug_set_thread_name(std::thread& thread, const std::string& name)
{
#pragma pack(push,8)
    struct THREADNAME_INFO
    {
        DWORD  dwType; // Must be 0x1000.
        LPCSTR szName; // Pointer to name (in user addr space).
        DWORD  dwThreadID; // Thread ID (-1=caller thread).
        DWORD  dwFlags; // Reserved for future use, must be zero.
    };
#pragma pack(pop)

    const THREADNAME_INFO info =
        {
            0x1000,
            name.c_str(),
            ::GetThreadId(static_cast<HANDLE>(thread.native_handle())),
            0
        };

    __try
    {
        RaiseException(0x406D1388, 0, sizeof(info)/sizeof(ULONG_PTR), (ULONG_PTR*)&info);
    }
    __except(EXCEPTION_EXECUTE_HANDLER)
    { }
}

#elif defined(PETREL_HAS_PTHREAD_SETNAME)

void _debug_set_thread_name(std::thread& thread, const std::string& name)
{
    // linux limits names to 15 chars
    pthread_setname_np(thread.native_handle(), name.substr(0, 15).c_str());
}

#else

void _debug_set_thread_name(std::thread&, const std::string&)
{
}

#endif


PETREL_GUTS_NAMESPACE_END

#endif


PETREL_NAMESPACE_END
