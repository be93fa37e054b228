// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "promise.h"

#include <type_traits>
#include <utility>
#include <vector>


PETREL_NAMESPACE_START


using promise_list = std::vector<promise>;


PETREL_GUTS_NAMESPACE_START

template< typename ... _Promises >
using enable_if_promises_t =
    std::enable_if_t< std::conjunction_v< std::is_same< std::decay_t<_Promises>, promise > ... > >;

PETREL_GUTS_NAMESPACE_END


//! \return promise resolved with \a value. Promise value is adopted instead.
template< typename _T > inline
promise resolve(_T&& value)
{
    promise result;

    result.resolve(std::forward<_T>(value));

    return result;
}

//! \return promise resolved with empty value.
PETREL_API promise resolve();

//! \return promise rejected with \a error. No flattening.
template< typename _T > inline
promise reject(_T&& error)
{
    promise result;

    result.reject(std::forward<_T>(error));

    return result;
}


//! Resolves with \a any_list of values in input order when all inputs resolved.
//! Rejects with the first observed rejection. Empty input resolves at once.
PETREL_API promise all(const promise_list& promises);

//! Resolves with \a settled_list in input order when all inputs settled. Never rejects.
PETREL_API promise all_settled(const promise_list& promises);

//! Repeats the first observed outcome. Ties are not deterministic.
//! Empty input never settles.
PETREL_API promise race(const promise_list& promises);

//! Resolves with the first resolved value. Rejects with \a any_list of errors
//! in input order when all inputs rejected. Empty input rejects at once.
PETREL_API promise any(const promise_list& promises);


template< typename ... _Promises, typename = guts::enable_if_promises_t<_Promises...> > inline
promise all(_Promises&&... promises)
{
    return all(promise_list{ std::forward<_Promises>(promises)... });
}

template< typename ... _Promises, typename = guts::enable_if_promises_t<_Promises...> > inline
promise all_settled(_Promises&&... promises)
{
    return all_settled(promise_list{ std::forward<_Promises>(promises)... });
}

template< typename ... _Promises, typename = guts::enable_if_promises_t<_Promises...> > inline
promise race(_Promises&&... promises)
{
    return race(promise_list{ std::forward<_Promises>(promises)... });
}

template< typename ... _Promises, typename = guts::enable_if_promises_t<_Promises...> > inline
promise any(_Promises&&... promises)
{
    return any(promise_list{ std::forward<_Promises>(promises)... });
}


PETREL_NAMESPACE_END
