// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "executor.h"


PETREL_NAMESPACE_START


//! Runs tasks right inside \a post(). Makes promise chains fully synchronous.
class PETREL_API inline_executor : public executor
{
public:
    ~inline_executor() override;

    void post(task_type&& task) override;

    static void use_for_this_thread();

};


PETREL_NAMESPACE_END
