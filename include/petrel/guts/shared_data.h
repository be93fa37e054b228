// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "../config.h"

#include <atomic>
#include <utility>


PETREL_NAMESPACE_START
PETREL_GUTS_NAMESPACE_START


//! Slightly sugared version of \a atomic_int.
class ref_counted : public std::atomic<int>
{
    PETREL_DISABLE_COPY(ref_counted);

public:
    ref_counted() : std::atomic<int>(0) { }

    //! \return true while references remain.
    bool deref()    { return fetch_sub(1, std::memory_order_acq_rel) - 1; }
    bool ref()      { return fetch_add(1, std::memory_order_relaxed) + 1; }

};



//! Base class for pimpl implementation data shared between handles.
class shared_data
{
    PETREL_DISABLE_COPY(shared_data);

public:
    mutable ref_counted _ref;

    shared_data() {}

    int use_count() const   { return _ref.load(std::memory_order_acquire); }

};



//! Intrusive smart pointer for explicitly controlled shared data.
//! \note Copying and destroying pointers to the same object is thread-safe,
//!       the pointer object itself is not.
template<typename _T>
class shared_data_ptr
{
public:
    shared_data_ptr() {}
    explicit
        shared_data_ptr(_T* from) noexcept;
    shared_data_ptr(const shared_data_ptr<_T>& other) noexcept;
    shared_data_ptr(shared_data_ptr&& other) noexcept;
    ~shared_data_ptr();

    shared_data_ptr<_T>& operator=(const shared_data_ptr<_T>& other) noexcept;
    shared_data_ptr<_T>& operator=(shared_data_ptr<_T>&& other) noexcept;

    void reset() noexcept;
    void swap(shared_data_ptr &other) noexcept;

    _T*         data() const        { return d; }
    const _T*   cdata() const       { return d; }

    _T& operator*() const           { return *d; }
    _T* operator->() const          { return d; }

    explicit operator bool() const  { return d != nullptr; }

    bool operator==(const shared_data_ptr<_T>& other) const   { return d == other.d; }
    bool operator!=(const shared_data_ptr<_T>& other) const   { return d != other.d; }

    bool operator!() const { return !d; }

private:
    _T* d = nullptr;

    static void _release(_T* ptr) noexcept;

};


template<typename _T, typename ... _Args> inline
shared_data_ptr<_T> make_shared_data(_Args&&... args)
{
    return shared_data_ptr<_T>{ new _T(std::forward<_Args>(args)...) };
}


PETREL_GUTS_NAMESPACE_END
PETREL_NAMESPACE_END


PETREL_NAMESPACE_START
PETREL_GUTS_NAMESPACE_START


template<typename _T> inline
shared_data_ptr<_T>::shared_data_ptr(_T* from) noexcept
    : d(from)
{
    if(d)
        d->_ref.ref();
}

template<typename _T> inline
shared_data_ptr<_T>::shared_data_ptr(const shared_data_ptr<_T>& other) noexcept
    : d(other.d)
{
    if(d)
        d->_ref.ref();
}

template<typename _T> inline
shared_data_ptr<_T>::shared_data_ptr(shared_data_ptr&& other) noexcept
    : d(other.d)
{
    other.d = nullptr;
}

template<typename _T> inline
shared_data_ptr<_T>::~shared_data_ptr()
{
    _release(d);
}

template<typename _T> inline
shared_data_ptr<_T>& shared_data_ptr<_T>::operator=(const shared_data_ptr<_T>& other) noexcept
{
    if(other.d != d)
    {
        if(other.d)
            other.d->_ref.ref();

        _T* old = d;
        d = other.d;

        _release(old);
    }

    return *this;
}

template<typename _T> inline
shared_data_ptr<_T>& shared_data_ptr<_T>::operator=(shared_data_ptr<_T>&& other) noexcept
{
    std::swap(d, other.d);

    return *this;
}

template<typename _T> inline
void shared_data_ptr<_T>::reset() noexcept
{
    _T* old = d;
    d = nullptr;

    _release(old);
}

template<typename _T> inline
void shared_data_ptr<_T>::swap(shared_data_ptr &other) noexcept
{
    std::swap(d, other.d);
}

template<typename _T> inline
void shared_data_ptr<_T>::_release(_T* ptr) noexcept
{
    if(ptr && !ptr->_ref.deref())
        delete ptr;
}


PETREL_GUTS_NAMESPACE_END
PETREL_NAMESPACE_END
