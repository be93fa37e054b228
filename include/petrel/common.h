// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "config.h"

#include <stdint.h>
#include <any>
#include <functional>
#include <vector>


PETREL_NAMESPACE_START


//! Represents promise fulfillment.
enum fulfillment_state_t : int8_t
{
    pending = 0,
    resolved,
    rejected,
};


using any_list = std::vector<std::any>;


//! Outcome of a single input of \a all_settled().
struct settled_result
{
    fulfillment_state_t state = pending;
    //! Set if resolved.
    std::any            value;
    //! Set if rejected.
    std::any            error;

    bool is_resolved() const { return state == resolved; }
    bool is_rejected() const { return state == rejected; }
};

using settled_list = std::vector<settled_result>;


//! Settles promise with value.
using resolver = std::function<void(std::any)>;
//! Settles promise with error.
using rejector = std::function<void(std::any)>;
//! User work passed to promise constructor.
using executor_fn = std::function<void(resolver, rejector)>;

//! Callback subscribed to promise settlement. Receives value or error.
using reaction_t = void(const std::any& result);
using reaction_type = std::function<reaction_t>;


PETREL_NAMESPACE_END
