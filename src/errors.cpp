// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#include "petrel/errors.h"

#include <exception>
#include <typeinfo>
#include <utility>


PETREL_NAMESPACE_START


rejected_error::rejected_error(std::any error)
    : std::runtime_error(error_message(error))
    , _error(std::move(error))
{ }


std::any current_error()
{
    try
    {
        throw;
    }
    catch(std::any& e)
    {
        return std::move(e);
    }
    catch(...)
    {
        return std::current_exception();
    };
}


std::string error_message(const std::any& error)
{
    if(!error.has_value())
        return "<empty>";

    if(auto e = std::any_cast<std::exception_ptr>(&error))
    {
        if(!*e)
            return "<null exception>";

        try
        {
            std::rethrow_exception(*e);
        }
        catch(const std::exception& ex)
        {
            return ex.what();
        }
        catch(const char* ex)
        {
            return ex;
        }
        catch(const std::string& ex)
        {
            return ex;
        }
        catch(...)
        {
            return "<unknown exception>";
        };
    };

    if(auto e = std::any_cast<const char*>(&error))
        return *e ? *e : "<null>";

    if(auto e = std::any_cast<std::string>(&error))
        return *e;

    return std::string{ "<" } + error.type().name() + ">";
}


void rethrow_error(const std::any& error)
{
    if(auto e = std::any_cast<std::exception_ptr>(&error))
    {
        if(*e)
            std::rethrow_exception(*e);
    };

    throw rejected_error{ error };
}


PETREL_NAMESPACE_END
