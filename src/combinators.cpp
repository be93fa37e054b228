// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#include "petrel/combinators.h"

#include <mutex>


PETREL_NAMESPACE_START


namespace
{
    //! Collects per-input results of aggregate promise.
    template< typename _List >
    class aggregate_context : public guts::shared_data
    {
    public:
        explicit
        aggregate_context(size_t count)
            : _results(count)
            , _remaining(count)
        { }

        //! \return true if \a i was the last missing result.
        bool set(size_t i, typename _List::value_type&& result)
        {
            std::lock_guard<std::mutex> lock{ _sync };

            _results[i] = std::move(result);

            return !--_remaining;
        }

        //! \note Call only after \a set() returned true.
        _List take()
        {
            std::lock_guard<std::mutex> lock{ _sync };

            return std::move(_results);
        }

    private:
        std::mutex  _sync;
        _List       _results;
        size_t      _remaining;

    };
};


promise resolve()
{
    promise result;

    result.resolve();

    return result;
}


promise all(const promise_list& promises)
{
    promise result;

    if(promises.empty())
        return result.resolve(any_list{});

    auto ctx = guts::make_shared_data< aggregate_context<any_list> >(promises.size());

    for(size_t i = 0, ie = promises.size(); i != ie; ++i)
    {
        promises[i].then(
            [result, ctx, i](const std::any& value) mutable
            {
                if(ctx->set(i, std::any{ value }))
                    result.resolve(ctx->take());
            }
        );

        promises[i].rescue(
            [result](const std::any& error) mutable
            {
                result.reject(error);
            }
        );
    };

    return result;
}


promise all_settled(const promise_list& promises)
{
    promise result;

    if(promises.empty())
        return result.resolve(settled_list{});

    auto ctx = guts::make_shared_data< aggregate_context<settled_list> >(promises.size());

    for(size_t i = 0, ie = promises.size(); i != ie; ++i)
    {
        promises[i].then(
            [result, ctx, i](const std::any& value) mutable
            {
                if(ctx->set(i, settled_result{ resolved, value, std::any{} }))
                    result.resolve(ctx->take());
            }
        );

        promises[i].rescue(
            [result, ctx, i](const std::any& error) mutable
            {
                if(ctx->set(i, settled_result{ rejected, std::any{}, error }))
                    result.resolve(ctx->take());
            }
        );
    };

    return result;
}


promise race(const promise_list& promises)
{
    promise result;

    for(const auto& p : promises)
    {
        p.then(
            [result](const std::any& value) mutable
            {
                result.resolve(value);
            }
        );

        p.rescue(
            [result](const std::any& error) mutable
            {
                result.reject(error);
            }
        );
    };

    return result;
}


promise any(const promise_list& promises)
{
    promise result;

    if(promises.empty())
        return result.reject(any_list{});

    auto ctx = guts::make_shared_data< aggregate_context<any_list> >(promises.size());

    for(size_t i = 0, ie = promises.size(); i != ie; ++i)
    {
        promises[i].then(
            [result](const std::any& value) mutable
            {
                result.resolve(value);
            }
        );

        promises[i].rescue(
            [result, ctx, i](const std::any& error) mutable
            {
                if(ctx->set(i, std::any{ error }))
                    result.reject(ctx->take());
            }
        );
    };

    return result;
}


PETREL_NAMESPACE_END
