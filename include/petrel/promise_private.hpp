// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#include <exception>
#include <stdexcept>
#include <utility>


PETREL_NAMESPACE_START
PETREL_GUTS_NAMESPACE_START


inline
promise_private::promise_private(std::shared_ptr<executor> exec)
    : _exec(std::move(exec))
{
#if defined(PETREL_DEBUG_GUTS)
    _debug_promise_list::instance().add(this);

    PETREL_GUTS_LOG(
        "promise_private::_ctor() -- "
        << std::dec << (++_debug_private_counter())
        << " -- " << std::hex << this << std::dec
    );
#endif
}


#if defined(PETREL_DEBUG_GUTS)

inline
promise_private::~promise_private()
{
    PETREL_GUTS_LOG(
        "promise_private::_dtor() -- "
        << std::dec << (--_debug_private_counter())
        << " -- " << std::hex << this << std::dec
    );

    _debug_promise_list::instance().remove(this);
}

#endif


inline
bool promise_private::settle(std::any&& value, fulfillment_state_t new_state, bool adopted)
{
    reaction_list reactions;

    // rejection always carries error, empty one reads as success in await()
    if(new_state == rejected && !value.has_value())
        value = std::make_exception_ptr(std::logic_error{ "petrel::promise: rejected without error" });

    {
        std::lock_guard<std::mutex> lock{ sync };

        if(state != pending || (adopting && !adopted))
            return false;

        result = std::move(value);
        state = new_state;

        reactions = std::move(new_state == resolved ? resolve_reactions : reject_reactions);

        // drop captured downstream promises of the other kind
        reaction_list{}.swap(resolve_reactions);
        reaction_list{}.swap(reject_reactions);
    };

    settled.notify_all();

    for(auto& reaction : reactions)
        reaction(result);

    return true;
}


inline
bool promise_private::begin_adoption()
{
    std::lock_guard<std::mutex> lock{ sync };

    if(state != pending || adopting)
        return false;

    adopting = true;

    return true;
}


inline
void promise_private::subscribe(reaction_type&& on_resolve, reaction_type&& on_reject)
{
    fulfillment_state_t st;

    {
        std::lock_guard<std::mutex> lock{ sync };

        st = state;

        if(st == pending)
        {
            resolve_reactions.push_back(std::move(on_resolve));
            reject_reactions.push_back(std::move(on_reject));

            return;
        };
    };

    // Already settled: reaction goes to executor of this promise.
    _exec->post(
        [self = type{this}, reaction = (st == resolved ? std::move(on_resolve) : std::move(on_reject))]()
        {
            reaction(self->result);
        }
    );
}


inline
std::tuple<fulfillment_state_t, std::any> promise_private::wait_result() const
{
    std::unique_lock<std::mutex> lock{ sync };

    settled.wait(lock, [this]() { return state != pending; });

    return { state, result };
}


template< typename _Rep, typename _Period > inline
bool promise_private::wait_for(const std::chrono::duration<_Rep, _Period>& timeout) const
{
    std::unique_lock<std::mutex> lock{ sync };

    return settled.wait_for(lock, timeout, [this]() { return state != pending; });
}


inline
fulfillment_state_t promise_private::fulfillment() const
{
    std::lock_guard<std::mutex> lock{ sync };

    return state;
}


inline
std::any promise_private::result_copy() const
{
    std::lock_guard<std::mutex> lock{ sync };

    return result;
}


PETREL_GUTS_NAMESPACE_END
PETREL_NAMESPACE_END
