// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "tests.h"


// Every test in this file runs callbacks synchronously on the calling thread.


TEST(promise, construct)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise p1;
        petrel::promise p2 = p1;
        petrel::promise p3 = std::move(p2);

        EXPECT_TRUE(p1 == p3);
        EXPECT_TRUE(p1.is_pending());
        EXPECT_FALSE(p1.is_fulfilled());
        EXPECT_FALSE(p1.value().has_value());

#if defined(PETREL_DEBUG_GUTS)
        EXPECT_EQ(1, petrel::guts::_debug_private_counter().load());
        EXPECT_TRUE(p1._private() == p3._private());
#endif

        petrel::promise p4;

        EXPECT_TRUE(p1 != p4);
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, construct__invalid)
{
    petrel::inline_executor::use_for_this_thread();

    {
        const auto noop = [](petrel::resolver, petrel::rejector) {};

        EXPECT_THROW((petrel::promise{ noop, nullptr }), std::invalid_argument);
        EXPECT_THROW((petrel::promise{ petrel::executor_fn{} }), std::invalid_argument);
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, resolve_await)
{
    petrel::inline_executor::use_for_this_thread();

    {
        const auto result = petrel::resolve(2316).await();

        EXPECT_EQ(2316, std::any_cast<int>(std::get<0>(result)));
        EXPECT_FALSE(std::get<1>(result).has_value());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, reject_await)
{
    petrel::inline_executor::use_for_this_thread();

    {
        const auto result = petrel::reject(std::string{ "err" }).await();

        EXPECT_FALSE(std::get<0>(result).has_value());
        EXPECT_EQ("err", std::any_cast<std::string>(std::get<1>(result)));
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, executor_fn)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise resolved_p{ [](petrel::resolver resolve, petrel::rejector) { resolve(5); } };
        petrel::promise rejected_p{ [](petrel::resolver, petrel::rejector reject) { reject(6); } };
        petrel::promise silent_p{ [](petrel::resolver, petrel::rejector) {} };

        EXPECT_EQ(5, resolved_p.value<int>());
        EXPECT_TRUE(resolved_p.is_resolved());

        EXPECT_EQ(6, rejected_p.value<int>());
        EXPECT_TRUE(rejected_p.is_rejected());

        EXPECT_TRUE(silent_p.is_pending());
        EXPECT_FALSE(silent_p.wait_for(std::chrono::milliseconds(10)));
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, executor_fn__panic)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise p{ [](petrel::resolver, petrel::rejector) { throw std::runtime_error("kaboom"); } };

        const auto result = p.await();
        const auto& error = std::get<1>(result);

        EXPECT_FALSE(std::get<0>(result).has_value());
        ASSERT_NE(nullptr, std::any_cast<std::exception_ptr>(&error));
        EXPECT_EQ("kaboom", petrel::error_message(error));
        EXPECT_THROW(std::rethrow_exception(std::any_cast<std::exception_ptr>(error)), std::runtime_error);
    }
    {
        petrel::promise p{ [](petrel::resolver, petrel::rejector) { throw std::any{ 17 }; } };

        EXPECT_TRUE(p.is_rejected());
        EXPECT_EQ(17, p.value<int>());
    }
    {
        petrel::promise p{ [](petrel::resolver, petrel::rejector) { throw 18; } };

        EXPECT_TRUE(p.is_rejected());
        EXPECT_THROW(std::rethrow_exception(p.value<std::exception_ptr>()), int);
    }
    {
        // settled before throw
        petrel::promise p{ [](petrel::resolver resolve, petrel::rejector) { resolve(1); throw 19; } };

        EXPECT_TRUE(p.is_resolved());
        EXPECT_EQ(1, p.value<int>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, first_settlement_wins)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise p;

        p.resolve(1);
        p.reject(2);
        p.resolve(3);

        EXPECT_TRUE(p.is_resolved());
        EXPECT_EQ(1, p.value<int>());

        petrel::promise q{ [](petrel::resolver resolve, petrel::rejector reject) { reject(4); resolve(5); } };

        EXPECT_TRUE(q.is_rejected());
        EXPECT_EQ(4, q.value<int>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, resolve__empty)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise p;
        p.resolve();

        EXPECT_TRUE(p.is_resolved());
        EXPECT_FALSE(p.value().has_value());

        petrel::promise q;
        q.reject();

        EXPECT_TRUE(q.is_rejected());
        ASSERT_TRUE(q.value().has_value());
        EXPECT_THROW(std::rethrow_exception(q.value<std::exception_ptr>()), std::logic_error);
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, reject__empty_error)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise p{ [](petrel::resolver, petrel::rejector reject) { reject({}); } };

        const auto result = p.await();

        EXPECT_TRUE(p.is_rejected());
        EXPECT_FALSE(std::get<0>(result).has_value());
        ASSERT_TRUE(std::get<1>(result).has_value());
        EXPECT_EQ("petrel::promise: rejected without error", petrel::error_message(std::get<1>(result)));
    }
    {
        petrel::promise p{ [](petrel::resolver, petrel::rejector) { throw std::any{}; } };

        EXPECT_TRUE(p.is_rejected());
        EXPECT_TRUE(std::get<1>(p.await()).has_value());
    }
    {
        int called = 0;

        petrel::promise p;

        auto last = p
            .rescue([](std::any e) { return e; })
            .then([&]() { ++called; });

        p.reject(std::any{});

        EXPECT_EQ(0, called);
        EXPECT_TRUE(last.is_rejected());
        EXPECT_THROW(std::rethrow_exception(last.value<std::exception_ptr>()), std::logic_error);
    }
    {
        auto p = petrel::resolve(1).then([](int) -> int { throw std::any{}; });

        EXPECT_TRUE(p.is_rejected());
        EXPECT_TRUE(p.value().has_value());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, then__order)
{
    petrel::inline_executor::use_for_this_thread();

    ChainTestHelper chain = { 1, 2, 3 };

    {
        petrel::promise p;

        p.then([&](int v) { CHAINV; });
        p.then([&](int v) { CHAINV + 1; });
        p.then([&](int v) { CHAINV + 2; });

        p.resolve(1);
        p.resolve(10);
    }

    EXPECT_EQ(0, chain.isFailed());

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, then__already_fulfilled)
{
    petrel::inline_executor::use_for_this_thread();

    ChainTestHelper chain = { 7 };

    {
        auto p = petrel::resolve(7);

        p.then([&](int v) { CHAINV; });
    }

    EXPECT_EQ(0, chain.isFailed());

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, then__chain)
{
    petrel::inline_executor::use_for_this_thread();

    ChainTestHelper chain = { 1, 2, 3, 4 };

    {
        petrel::promise p;

        auto last = p
            .then([&](int v) { CHAINV; return v + 1; })
            .then([&](const int& v) { CHAINV; return std::any{ v + 1 }; })
            .then([&](std::any a) { auto v = std::any_cast<int>(a); CHAINV; return v + 1; })
            .then([&](int v) { CHAINV; });

        EXPECT_TRUE(last.is_pending());

        p.resolve(1);

        EXPECT_TRUE(last.is_resolved());
        EXPECT_FALSE(last.value().has_value());
    }

    EXPECT_EQ(0, chain.isFailed());

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, then__skipped_on_rejection)
{
    petrel::inline_executor::use_for_this_thread();

    {
        int called = 0;

        auto p = petrel::reject(std::string{ "err" })
            .then([&](int) { ++called; return 1; })
            .then([&]() { ++called; });

        EXPECT_EQ(0, called);
        EXPECT_TRUE(p.is_rejected());
        EXPECT_EQ("err", p.value<std::string>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, then__callback_throws)
{
    petrel::inline_executor::use_for_this_thread();

    {
        auto p = petrel::resolve(1).then([](int) -> int { throw std::runtime_error("cb"); });

        EXPECT_TRUE(p.is_rejected());
        EXPECT_EQ("cb", petrel::error_message(p.value()));

        auto q = petrel::resolve(1).then([](int) -> int { throw std::any{ std::string{ "any" } }; });

        EXPECT_TRUE(q.is_rejected());
        EXPECT_EQ("any", q.value<std::string>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, then__argument_type_mismatch)
{
    petrel::inline_executor::use_for_this_thread();

    {
        int called = 0;

        auto p = petrel::resolve(std::string{ "x" }).then([&](int v) { ++called; return v; });

        EXPECT_EQ(0, called);
        EXPECT_TRUE(p.is_rejected());
        EXPECT_THROW(std::rethrow_exception(p.value<std::exception_ptr>()), std::bad_any_cast);
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, then__exception_ptr_is_value)
{
    petrel::inline_executor::use_for_this_thread();

    {
        auto p = petrel::resolve(1).then([](int) { return std::make_exception_ptr(std::runtime_error("v")); });

        EXPECT_TRUE(p.is_resolved());
        EXPECT_EQ("v", petrel::error_message(p.value()));
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, nested_resolution)
{
    petrel::inline_executor::use_for_this_thread();

    {
        auto p = petrel::resolve(petrel::resolve(petrel::resolve(5)));

        EXPECT_EQ(5, p.get<int>());
    }
    {
        petrel::promise inner3;
        auto inner2 = petrel::resolve(inner3);
        auto outer = petrel::resolve(inner2);

        EXPECT_TRUE(outer.is_pending());
        EXPECT_TRUE(inner2.is_pending());

        inner3.resolve(5);

        EXPECT_EQ(5, inner2.value<int>());
        EXPECT_EQ(5, outer.value<int>());
    }
    {
        petrel::promise inner;
        auto outer = petrel::resolve(inner);

        inner.reject(std::string{ "inner" });

        EXPECT_TRUE(outer.is_rejected());
        EXPECT_EQ("inner", outer.value<std::string>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, nested_resolution__executor_fn)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise inner;
        petrel::promise outer{ [inner](petrel::resolver resolve, petrel::rejector) { resolve(inner); } };

        EXPECT_TRUE(outer.is_pending());

        inner.resolve(std::string{ "deep" });

        EXPECT_EQ("deep", outer.value<std::string>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, nested_resolution__then_returns_promise)
{
    petrel::inline_executor::use_for_this_thread();

    {
        auto p = petrel::resolve(2)
            .then([](int v) { return petrel::resolve(v * 10); })
            .then([](int v) { return v + 1; });

        EXPECT_EQ(21, p.value<int>());

        auto q = petrel::resolve(2)
            .then([](int) { return petrel::reject(std::string{ "no" }); })
            .then([](int v) { return v + 1; });

        EXPECT_TRUE(q.is_rejected());
        EXPECT_EQ("no", q.value<std::string>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, adoption_locks_outcome)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise inner;
        petrel::promise outer;

        outer.resolve(inner);
        outer.reject(std::string{ "late" });
        outer.resolve(3);

        EXPECT_TRUE(outer.is_pending());

        inner.resolve(7);

        EXPECT_TRUE(outer.is_resolved());
        EXPECT_EQ(7, outer.value<int>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, reject_with_promise_is_not_flattened)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise inner;
        auto p = petrel::reject(inner);

        EXPECT_TRUE(p.is_rejected());
        EXPECT_TRUE(inner == p.value<petrel::promise>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, self_resolution)
{
    petrel::inline_executor::use_for_this_thread();

    {
        petrel::promise p;
        p.resolve(p);

        EXPECT_TRUE(p.is_rejected());
        EXPECT_THROW(std::rethrow_exception(p.value<std::exception_ptr>()), std::logic_error);
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, rescue__recovery)
{
    petrel::inline_executor::use_for_this_thread();

    {
        // void
        auto p = petrel::reject(std::string{ "e" }).rescue([](const std::string& e) { EXPECT_EQ("e", e); });

        EXPECT_TRUE(p.is_resolved());
        EXPECT_FALSE(p.value().has_value());
    }
    {
        // empty std::any
        auto p = petrel::reject(1).rescue([](std::any) { return std::any{}; });

        EXPECT_TRUE(p.is_resolved());
        EXPECT_FALSE(p.value().has_value());
    }
    {
        // null std::exception_ptr
        auto p = petrel::reject(1).rescue([](int) { return std::exception_ptr{}; });

        EXPECT_TRUE(p.is_resolved());
        EXPECT_FALSE(p.value().has_value());
    }
    {
        // adopted promise
        auto p = petrel::reject(1).rescue([](int e) { return petrel::resolve(e * 100); });

        EXPECT_TRUE(p.is_resolved());
        EXPECT_EQ(100, p.value<int>());
    }
    {
        int called = 0;

        auto p = petrel::reject(1)
            .rescue([](int) {})
            .then([&]() { ++called; });

        EXPECT_EQ(1, called);
        EXPECT_TRUE(p.is_resolved());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, rescue__new_error)
{
    petrel::inline_executor::use_for_this_thread();

    {
        auto p = petrel::reject(1).rescue([](int e) { return std::any{ e + 1 }; });

        EXPECT_TRUE(p.is_rejected());
        EXPECT_EQ(2, p.value<int>());
    }
    {
        auto p = petrel::reject(1).rescue([](int) { return std::make_exception_ptr(std::runtime_error("x")); });

        EXPECT_TRUE(p.is_rejected());
        EXPECT_EQ("x", petrel::error_message(p.value()));
    }
    {
        auto p = petrel::reject(1).rescue([](int) { return std::string{ "wrapped" }; });

        EXPECT_TRUE(p.is_rejected());
        EXPECT_EQ("wrapped", p.value<std::string>());
    }
    {
        auto p = petrel::reject(1).rescue([](int) -> int { throw std::runtime_error("rethrown"); });

        EXPECT_TRUE(p.is_rejected());
        EXPECT_EQ("rethrown", petrel::error_message(p.value()));
    }
    {
        ChainTestHelper chain = { 1, 2 };

        auto p = petrel::reject(1)
            .rescue([&](int v) { CHAINV; return v + 1; })
            .then([&](int v) { CHAINV + 100; })
            .rescue([&](int v) { CHAINV; });

        EXPECT_TRUE(p.is_resolved());
        EXPECT_EQ(0, chain.isFailed());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, rescue__skipped_on_resolution)
{
    petrel::inline_executor::use_for_this_thread();

    {
        int called = 0;

        auto p = petrel::resolve(3).rescue([&](std::any) { ++called; });

        EXPECT_EQ(0, called);
        EXPECT_TRUE(p.is_resolved());
        EXPECT_EQ(3, p.value<int>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, finally)
{
    petrel::inline_executor::use_for_this_thread();

    {
        int called = 0;

        auto p = petrel::resolve(5).finally([&]() { ++called; });
        auto q = petrel::reject(6).finally([&]() { ++called; });
        auto r = petrel::resolve(7).finally([]() { throw std::runtime_error("f"); });

        EXPECT_EQ(2, called);

        EXPECT_TRUE(p.is_resolved());
        EXPECT_EQ(5, p.value<int>());

        EXPECT_TRUE(q.is_rejected());
        EXPECT_EQ(6, q.value<int>());

        EXPECT_TRUE(r.is_rejected());
        EXPECT_EQ("f", petrel::error_message(r.value()));
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, get)
{
    petrel::inline_executor::use_for_this_thread();

    {
        EXPECT_EQ(3, petrel::resolve(3).get<int>());
        EXPECT_THROW(petrel::reject(std::make_exception_ptr(std::out_of_range("o"))).get(), std::out_of_range);

        try
        {
            petrel::reject(9).get();
            FAIL() << "get() returned for rejected promise";
        }
        catch(const petrel::rejected_error& e)
        {
            EXPECT_EQ(9, std::any_cast<int>(e.error()));
        };
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, deep_chain)
{
    petrel::inline_executor::use_for_this_thread();

    {
        constexpr int depth = 500;

        petrel::promise first;
        petrel::promise last = first;

        for(int i = 0; i < depth; ++i)
            last = last.then([](int v) { return v + 1; });

        EXPECT_TRUE(last.is_pending());

        first.resolve(0);

        EXPECT_EQ(depth, last.value<int>());
    }

    CHECK_PETREL_PROMISE_GUTS
}


TEST(promise, several_thens)
{
    petrel::inline_executor::use_for_this_thread();

    ChainTestHelper chain = { 1, 2, 3, 11, 12, 13 };

    {
        petrel::promise p;

        p.then([&](int v) { CHAINV; return v + 1; })
         .then([&](int v) { CHAINV; return v + 1; })
         .then([&](int v) { CHAINV; });

        p.then([&](int v) { CHAINV + 10; return v + 1; })
         .then([&](int v) { CHAINV + 10; return v + 1; })
         .then([&](int v) { CHAINV + 10; });

        p.resolve(1);
    }

    EXPECT_EQ(0, chain.isFailed());

    CHECK_PETREL_PROMISE_GUTS
}
