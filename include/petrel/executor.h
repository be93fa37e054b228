// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "config.h"

#include <functional>
#include <memory>


PETREL_NAMESPACE_START


//! Runs promise work independently of the caller.
//!
//! Promise posts here its executor function and every callback registered
//! after settlement. Callbacks registered before settlement run on the thread
//! that settles the promise.
//!
//! \note Posted tasks never throw.
class PETREL_API executor
{
public:
    using task_type = std::function<void()>;

    virtual ~executor() = default;

    virtual void post(task_type&& task) = 0;

    //! \return executor installed for current thread or process default one.
    static std::shared_ptr<executor> for_this_thread();

    //! Installs \a ex for current thread. nullptr restores process default.
    static void use_for_this_thread(std::shared_ptr<executor> ex);

    //! \return process default executor (\a thread_executor unless replaced).
    static std::shared_ptr<executor> default_executor();
    static void set_default(std::shared_ptr<executor> ex);

protected:
    static std::shared_ptr<executor>& _thread_executor();

};


PETREL_NAMESPACE_END
