// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#include <exception>
#include <utility>


PETREL_NAMESPACE_START


// ====  public  ====


template<
    typename _Resolve,
    typename _ResolveFunctor
> inline
promise promise::then(_Resolve&& on_resolve) const
{
    promise next{ _chained_tag{}, _d->exec() };

    _d->subscribe(
        [next, fn = _ResolveFunctor{ std::forward<_Resolve>(on_resolve) }](const std::any& value) mutable
        {
            next._wrap_rescue(fn, value, guts::then_kind{});
        },
        [next](const std::any& error) mutable
        {
            next._d->settle(std::any{ error }, rejected);
        }
    );

    return next;
}


template<
    typename _Reject,
    typename _RejectFunctor
> inline
promise promise::rescue(_Reject&& on_reject) const
{
    promise next{ _chained_tag{}, _d->exec() };

    _d->subscribe(
        [next](const std::any& value) mutable
        {
            next._d->settle(std::any{ value }, resolved);
        },
        [next, fn = _RejectFunctor{ std::forward<_Reject>(on_reject) }](const std::any& error) mutable
        {
            next._wrap_rescue(fn, error, guts::rescue_kind{});
        }
    );

    return next;
}


template<
    typename _Callback,
    typename _CallbackFunctor
> inline
promise promise::finally(_Callback&& on_settle) const
{
    static_assert(
        guts::function_traits<_Callback>::args_count == 0,
        "petrel::promise::finally() callback takes no arguments"
    );

    promise next{ _chained_tag{}, _d->exec() };
    _CallbackFunctor fn{ std::forward<_Callback>(on_settle) };

    _d->subscribe(
        [next, fn](const std::any& value) mutable
        {
            next._wrap_finally(fn, value, resolved);
        },
        [next, fn](const std::any& error) mutable
        {
            next._wrap_finally(fn, error, rejected);
        }
    );

    return next;
}


template< typename _T, typename > inline
promise& promise::resolve(_T&& value)
{
    _fulfill(std::make_any< std::decay_t<_T> >(std::forward<_T>(value)), true);

    return *this;
}


template< typename _T, typename > inline
promise& promise::reject(_T&& error)
{
    _fulfill(std::make_any< std::decay_t<_T> >(std::forward<_T>(error)), false);

    return *this;
}



// ====  helpers  ====


template< typename _Callback, typename _Kind > inline
void promise::_wrap_rescue(_Callback& callback, const std::any& arg, _Kind kind)
{
    try
    {
        _wrap_callback_return(callback, arg, kind, typename guts::function_traits<_Callback>::result_tag{});
    }
    catch(...)
    {
        auto error = current_error();

        PETREL_GUTS_LOG("petrel::promise: callback failed, rejecting -- " << error_message(error));

        _d->settle(std::move(error), rejected);
    };
}


template< typename _Callback > inline
void promise::_wrap_finally(_Callback& callback, const std::any& outcome, fulfillment_state_t state)
{
    try
    {
        callback();
    }
    catch(...)
    {
        auto error = current_error();

        PETREL_GUTS_LOG("petrel::promise: finally callback failed, rejecting -- " << error_message(error));

        _d->settle(std::move(error), rejected);

        return;
    };

    _d->settle(std::any{ outcome }, state);
}


//! \note lambda [](...) -> void
template< typename _Callback, typename _Kind > inline
void promise::_wrap_callback_return(_Callback& callback, const std::any& arg, _Kind, guts::return_void_tag)
{
    _wrap_callback_args(callback, arg);

    _d->settle(std::any{}, resolved);
}


//! \note lambda [](...) -> std::any
template< typename _Callback > inline
void promise::_wrap_callback_return(_Callback& callback, const std::any& arg, guts::then_kind, guts::return_any_tag)
{
    _fulfill(_wrap_callback_args(callback, arg), true);
}


//! \note lambda [](...) -> std::any
//! Empty result recovers.
template< typename _Callback > inline
void promise::_wrap_callback_return(_Callback& callback, const std::any& arg, guts::rescue_kind, guts::return_any_tag)
{
    std::any result = _wrap_callback_args(callback, arg);

    if(!result.has_value())
        _d->settle(std::any{}, resolved);
    else if(std::any_cast<promise>(&result))
        _fulfill(std::move(result), true);
    else
        _d->settle(std::move(result), rejected);
}


//! \note lambda [](...) -> std::exception_ptr
template< typename _Callback > inline
void promise::_wrap_callback_return(_Callback& callback, const std::any& arg, guts::then_kind, guts::return_exception_ptr_tag)
{
    _d->settle(std::any{ _wrap_callback_args(callback, arg) }, resolved);
}


//! \note lambda [](...) -> std::exception_ptr
//! Null result recovers.
template< typename _Callback > inline
void promise::_wrap_callback_return(_Callback& callback, const std::any& arg, guts::rescue_kind, guts::return_exception_ptr_tag)
{
    std::exception_ptr result = _wrap_callback_args(callback, arg);

    if(!result)
        _d->settle(std::any{}, resolved);
    else
        _d->settle(std::any{ std::move(result) }, rejected);
}


//! \note lambda [](...) -> promise
template< typename _Callback, typename _Kind > inline
void promise::_wrap_callback_return(_Callback& callback, const std::any& arg, _Kind, guts::return_promise_tag)
{
    promise inner = _wrap_callback_args(callback, arg);

    _adopt(inner);
}


//! \note lambda [](...) -> auto
template< typename _Callback > inline
void promise::_wrap_callback_return(_Callback& callback, const std::any& arg, guts::then_kind, guts::return_auto_tag)
{
    auto result = _wrap_callback_args(callback, arg);

    _d->settle(std::make_any<decltype(result)>(std::move(result)), resolved);
}


//! \note lambda [](...) -> auto
//! Any value returned from rescue callback is a new error.
template< typename _Callback > inline
void promise::_wrap_callback_return(_Callback& callback, const std::any& arg, guts::rescue_kind, guts::return_auto_tag)
{
    auto result = _wrap_callback_args(callback, arg);

    _d->settle(std::make_any<decltype(result)>(std::move(result)), rejected);
}


//! Wraps callback's arguments.
template<
    typename _Callback,
    typename _CallbackTraits
> inline
auto promise::_wrap_callback_args(_Callback& callback, const std::any& arg)
    -> typename _CallbackTraits::result_type
{
    return _wrap_callback_args(callback, arg, typename _CallbackTraits::args_tag{});
}


//! \note lambda [](void) -> auto
template<
    typename _Callback,
    typename _CallbackTraits
> inline
auto promise::_wrap_callback_args(_Callback& callback, const std::any&, guts::args_count_0)
    -> typename _CallbackTraits::result_type
{
    return callback();
}


//! \note lambda [](std::any) -> auto
template<
    typename _Callback,
    typename _CallbackTraits
> inline
auto promise::_wrap_callback_args(_Callback& callback, const std::any& arg, guts::args_count_1_any)
    -> typename _CallbackTraits::result_type
{
    return callback(arg);
}


//! \note lambda [](auto) -> auto
//! Mismatched value type throws \a std::bad_any_cast, that rejects chained promise.
template<
    typename _Callback,
    typename _CallbackTraits
> inline
auto promise::_wrap_callback_args(_Callback& callback, const std::any& arg, guts::args_count_1_auto)
    -> typename _CallbackTraits::result_type
{
    using arg_type = std::decay_t< typename _CallbackTraits::template arg<0>::type >;

    return callback(std::any_cast< arg_type >(arg));
}


PETREL_NAMESPACE_END
