// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "config.h"

#include <any>
#include <stdexcept>
#include <string>


PETREL_NAMESPACE_START


//! Thrown by \a promise::get() when promise was rejected with non-exception payload.
class PETREL_API rejected_error : public std::runtime_error
{
public:
    explicit
    rejected_error(std::any error);

    const std::any& error() const noexcept  { return _error; }

private:
    std::any _error;

};


//! Converts exception being handled into rejection payload.
//! Thrown \a std::any is returned as is, anything else is wrapped into \a std::exception_ptr.
//! \note Must be called from inside of catch block.
PETREL_API std::any current_error();

//! \return text representation of rejection payload.
PETREL_API std::string error_message(const std::any& error);

//! Rethrows \a std::exception_ptr payload, throws \a rejected_error for anything else.
[[noreturn]]
PETREL_API void rethrow_error(const std::any& error);


PETREL_NAMESPACE_END
