// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "config.h"
#include "common.h"
#include "errors.h"
#include "executor.h"
#include "promise_private.h"
#include "guts/function_traits.h"

#include <any>
#include <chrono>
#include <memory>
#include <tuple>
#include <type_traits>


PETREL_NAMESPACE_START


PETREL_GUTS_NAMESPACE_START

//! Callback kind tagging
struct then_kind {};
struct rescue_kind {};

PETREL_GUTS_NAMESPACE_END


//! Handle to result that will be produced asynchronously.
//!
//! Copies share the same state. Promise moves from \a pending to \a resolved
//! or \a rejected exactly once, first settlement wins.
//!
//! Rejected promise always holds non-empty error: empty one is replaced by
//! \a std::exception_ptr to \a std::logic_error.
//!
//! \note All public functions in this class are thread-safe.
//! \note Callbacks chained to pending promise run recursively on settling
//!       thread. Very deep chains (tens of thousands of levels) built before
//!       settlement may exhaust the stack of that thread.
class PETREL_API promise
{
public:
    using private_type = guts::promise_private::type;


    //! Constructs pending promise without work. Settle it by \a resolve() or \a reject().
    promise();

    //! Posts \a fn to executor of current thread.
    //! Exception escaping \a fn rejects promise with it.
    explicit
    promise(executor_fn fn);
    promise(executor_fn fn, std::shared_ptr<executor> ex);


    //! Chains callback called with value when this promise resolves.
    //! Rejection skips callback and passes through.
    //!
    //! Callback may take nothing, \a std::any or any type stored in value.
    //! Returned promise resolves with callback's result, adopts returned promise,
    //! or rejects with exception thrown by callback.
    template<
        typename _Resolve,
        typename _ResolveFunctor = guts::functor_t<_Resolve>
    >
    promise then(_Resolve&& on_resolve) const;

    //! Chains callback called with error when this promise rejects.
    //! Resolution skips callback and passes through.
    //!
    //! Callback result decides the outcome of returned promise:
    //!  - \a void, empty \a std::any or null \a std::exception_ptr recovers,
    //!    returned promise resolves with empty value;
    //!  - non-empty \a std::any, non-null \a std::exception_ptr or any other
    //!    value is a new error, returned promise rejects with it;
    //!  - \a promise is adopted.
    template<
        typename _Reject,
        typename _RejectFunctor = guts::functor_t<_Reject>
    >
    promise rescue(_Reject&& on_reject) const;

    //! Chains callback without arguments called on either outcome.
    //! Returned promise repeats outcome of this one unless callback throws.
    template<
        typename _Callback,
        typename _CallbackFunctor = guts::functor_t<_Callback>
    >
    promise finally(_Callback&& on_settle) const;


    //! Promise value flattens: this promise adopts outcome of it.
    promise& resolve(const std::any& value);
    promise& resolve(std::any&& value);
    template<
        typename _T,
        typename = std::enable_if_t< !std::is_same_v< std::decay_t<_T>, std::any > >
    >
    promise& resolve(_T&& value);
    promise& resolve();

    promise& reject(const std::any& error);
    promise& reject(std::any&& error);
    template<
        typename _T,
        typename = std::enable_if_t< !std::is_same_v< std::decay_t<_T>, std::any > >
    >
    promise& reject(_T&& error);
    //! Rejects with \a std::logic_error as error.
    promise& reject();


    //! Blocks until settled.
    //! \return (value, {}) if resolved, ({}, error) if rejected.
    std::tuple<std::any, std::any> await() const;

    //! Blocks until settled.
    void wait() const;

    //! \return false if still pending after \a timeout.
    template< typename _Rep, typename _Period >
    bool wait_for(const std::chrono::duration<_Rep, _Period>& timeout) const
    {
        return _d->wait_for(timeout);
    }

    //! Blocks until settled.
    //! \return value if resolved.
    //! \throw rethrows error if rejected (see \a rethrow_error()).
    std::any get() const;
    template< typename _T >
    _T get() const              { return std::any_cast<_T>(get()); }

    //! \note Non-blocking. Empty while pending.
    std::any value() const;
    //! \note Non-blocking.
    template< typename _T >
    _T value() const            { return std::any_cast<_T>(value()); }

    fulfillment_state_t fulfillment() const;

    bool is_pending() const     { return fulfillment() == pending; }
    bool is_resolved() const    { return fulfillment() == resolved; }
    bool is_rejected() const    { return fulfillment() == rejected; }
    bool is_fulfilled() const   { return fulfillment() != pending; }

    const std::shared_ptr<executor>& get_executor() const  { return _d->exec(); }

    bool operator==(const promise& other) const { return _d == other._d; }
    bool operator!=(const promise& other) const { return _d != other._d; }


#if defined(PETREL_DEBUG_GUTS)
    private_type _private() const   { return _d; }
#endif

private:
    struct _chained_tag {};

    private_type _d;


    promise(_chained_tag, std::shared_ptr<executor> ex);

    //! Runs executor function with exception guard.
    void _run(executor_fn& fn);

    //! Settles this promise. Resolution with promise value is flattened.
    void _fulfill(std::any&& value, bool is_resolve);

    //! Locks this promise to outcome of \a inner.
    void _adopt(const promise& inner);


private:
    // ====  helpers  ====


    //! Exception catcher.
    template< typename _Callback, typename _Kind >
    void _wrap_rescue(_Callback& callback, const std::any& arg, _Kind kind);

    template< typename _Callback >
    void _wrap_finally(_Callback& callback, const std::any& outcome, fulfillment_state_t state);


    //! \note lambda [](...) -> void
    template< typename _Callback, typename _Kind >
    void _wrap_callback_return(_Callback& callback, const std::any& arg, _Kind, guts::return_void_tag);

    //! \note lambda [](...) -> std::any
    template< typename _Callback >
    void _wrap_callback_return(_Callback& callback, const std::any& arg, guts::then_kind, guts::return_any_tag);
    template< typename _Callback >
    void _wrap_callback_return(_Callback& callback, const std::any& arg, guts::rescue_kind, guts::return_any_tag);

    //! \note lambda [](...) -> std::exception_ptr
    template< typename _Callback >
    void _wrap_callback_return(_Callback& callback, const std::any& arg, guts::then_kind, guts::return_exception_ptr_tag);
    template< typename _Callback >
    void _wrap_callback_return(_Callback& callback, const std::any& arg, guts::rescue_kind, guts::return_exception_ptr_tag);

    //! \note lambda [](...) -> promise
    template< typename _Callback, typename _Kind >
    void _wrap_callback_return(_Callback& callback, const std::any& arg, _Kind, guts::return_promise_tag);

    //! \note lambda [](...) -> auto
    template< typename _Callback >
    void _wrap_callback_return(_Callback& callback, const std::any& arg, guts::then_kind, guts::return_auto_tag);
    template< typename _Callback >
    void _wrap_callback_return(_Callback& callback, const std::any& arg, guts::rescue_kind, guts::return_auto_tag);


    //! Wraps callback's arguments.
    template<
        typename _Callback,
        typename _CallbackTraits = guts::function_traits<_Callback>
    >
    static auto _wrap_callback_args(_Callback& callback, const std::any& arg)
        -> typename _CallbackTraits::result_type;

    //! \note lambda [](void) -> auto
    template<
        typename _Callback,
        typename _CallbackTraits = guts::function_traits<_Callback>
    >
    static auto _wrap_callback_args(_Callback& callback, const std::any& arg, guts::args_count_0)
        -> typename _CallbackTraits::result_type;

    //! \note lambda [](std::any) -> auto
    template<
        typename _Callback,
        typename _CallbackTraits = guts::function_traits<_Callback>
    >
    static auto _wrap_callback_args(_Callback& callback, const std::any& arg, guts::args_count_1_any)
        -> typename _CallbackTraits::result_type;

    //! \note lambda [](auto) -> auto
    template<
        typename _Callback,
        typename _CallbackTraits = guts::function_traits<_Callback>
    >
    static auto _wrap_callback_args(_Callback& callback, const std::any& arg, guts::args_count_1_auto)
        -> typename _CallbackTraits::result_type;

};


PETREL_GUTS_NAMESPACE_START

// template<> struct function_return_value_traits< promise >
template<>
struct function_return_value_traits< promise >
{ using tag = return_promise_tag; };

PETREL_GUTS_NAMESPACE_END


PETREL_NAMESPACE_END


#include "promise.hpp"
