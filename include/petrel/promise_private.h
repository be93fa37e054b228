// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "config.h"
#include "common.h"
#include "executor.h"
#include "guts/debug.h"
#include "guts/shared_data.h"

#include <any>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <tuple>
#include <vector>


PETREL_NAMESPACE_START
PETREL_GUTS_NAMESPACE_START


//! Shared state of promise.
//!
//! All fields below \a sync are guarded by it. \a result is immutable once
//! \a state left \a pending, so reactions read it without lock.
class PETREL_API promise_private : public shared_data
{
    PETREL_DISABLE_COPY(promise_private);
    PETREL_DISABLE_MOVE(promise_private);

public:
    using type = shared_data_ptr<promise_private>;
    using reaction_list = std::vector<reaction_type>;


    explicit
    promise_private(std::shared_ptr<executor> exec);
#if defined(PETREL_DEBUG_GUTS)
    ~promise_private();
#endif

    //! Moves promise out of \a pending and dispatches reactions of \a new_state kind.
    //! \param adopted Bypasses adoption lock. Used only by adoption reactions.
    //! \return false if promise was already settled or adopts another promise.
    bool settle(std::any&& value, fulfillment_state_t new_state, bool adopted = false);

    //! Locks promise to the outcome of inner one.
    //! \return false if promise was already settled or adopts another promise.
    bool begin_adoption();

    //! Registers reactions. If already settled, matching reaction is posted to \a exec.
    void subscribe(reaction_type&& on_resolve, reaction_type&& on_reject);

    //! Blocks until settled.
    std::tuple<fulfillment_state_t, std::any> wait_result() const;

    //! \return false on timeout.
    template< typename _Rep, typename _Period >
    bool wait_for(const std::chrono::duration<_Rep, _Period>& timeout) const;

    [[nodiscard]]
    fulfillment_state_t fulfillment() const;
    //! \return copy of value/error. Empty if pending.
    [[nodiscard]]
    std::any            result_copy() const;

    const std::shared_ptr<executor>& exec() const  { return _exec; }


private:
    const std::shared_ptr<executor> _exec;

    mutable std::mutex              sync;
    mutable std::condition_variable settled;

    fulfillment_state_t             state = pending;
    bool                            adopting = false;
    std::any                        result;

    reaction_list                   resolve_reactions;
    reaction_list                   reject_reactions;

};


PETREL_GUTS_NAMESPACE_END
PETREL_NAMESPACE_END


#include "promise_private.hpp"
