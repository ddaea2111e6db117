// Copyright (c) 2022 Mohammad Nejati
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include <vow.hpp>

#include <boost/asio.hpp>
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(promise)

namespace asio = boost::asio;

BOOST_AUTO_TEST_CASE(is_valid)
{
    auto ctx = asio::io_context{};

    auto promise = vow::promise<int>{ ctx };
    BOOST_CHECK(promise.is_valid());

    auto promise_2 = std::move(promise);
    BOOST_CHECK(!promise.is_valid());
    BOOST_CHECK(promise_2.is_valid());

    auto promise_3 = promise_2;
    BOOST_CHECK(promise_3.is_valid());
}

BOOST_AUTO_TEST_CASE(no_state)
{
    auto promise = vow::promise<int>{};
    auto is_no_state = [](const auto& e)
    { return e.code() == vow::errc::no_state; };

    BOOST_CHECK_EXCEPTION(
        boost::ignore_unused(promise.get_executor()),
        vow::promise_error,
        is_no_state);
    BOOST_CHECK_EXCEPTION(
        boost::ignore_unused(promise.is_resolved()),
        vow::promise_error,
        is_no_state);
    BOOST_CHECK_EXCEPTION(
        boost::ignore_unused(promise.value()), vow::promise_error, is_no_state);
    BOOST_CHECK_EXCEPTION(promise.ok(1), vow::promise_error, is_no_state);
    BOOST_CHECK_EXCEPTION(
        promise.then([](const auto&) {}), vow::promise_error, is_no_state);
    BOOST_CHECK_EXCEPTION(promise.sync_wait(), vow::promise_error, is_no_state);
}

BOOST_AUTO_TEST_CASE(get_excecutor)
{
    auto ctx = asio::io_context{};

    auto promise = vow::promise<int>{ ctx };
    BOOST_CHECK(promise.get_executor() == asio::any_io_executor{ ctx.get_executor() });
}

BOOST_AUTO_TEST_CASE(custom_executor)
{
    auto ctx         = asio::io_context{};
    using executor_t = asio::io_context::executor_type;

    auto promise = vow::promise<int, std::error_code, executor_t>{ ctx };
    auto mapped  = promise.map([](int v) { return v * 2; });
    promise.ok(21);
    BOOST_CHECK(mapped.get_executor() == ctx.get_executor());
    BOOST_CHECK_EQUAL(mapped.value()->value(), 42);
}

BOOST_AUTO_TEST_CASE(pending_value)
{
    auto ctx = asio::io_context{};

    auto promise = vow::promise<int>{ ctx };
    BOOST_CHECK(!promise.is_resolved());
    BOOST_CHECK(!promise.value());

    promise.ok(10);
    BOOST_CHECK(promise.is_resolved());
    BOOST_CHECK_EQUAL(promise.value()->value(), 10);
}

BOOST_AUTO_TEST_CASE(multiple_resolutions_are_ignored)
{
    auto ctx = asio::io_context{};

    auto holder  = -1;
    auto invoked = 0;
    auto promise = vow::promise<int>{ ctx };
    promise.on_success(
        [&](int v)
        {
            holder = v;
            invoked++;
        });

    promise.ok(1);
    promise.ok(2);
    promise.fail(vow::errc::timeout);
    promise.resolve(vow::ok(4));

    BOOST_CHECK_EQUAL(holder, 1);
    BOOST_CHECK_EQUAL(invoked, 1);
    BOOST_CHECK_EQUAL(promise.value()->value(), 1);
}

BOOST_AUTO_TEST_CASE(ready_promise_is_resolved)
{
    auto ctx = asio::io_context{};

    auto holder  = -1;
    auto promise = vow::promise<int>{ ctx, vow::ok(123) };
    BOOST_CHECK(promise.is_resolved());
    promise.on_success([&](int v) { holder = v; });
    BOOST_CHECK_EQUAL(holder, 123);

    auto error  = std::error_code{};
    auto failed = vow::promise<int>{ ctx, vow::fail(vow::errc::timeout) };
    failed.on_failure([&](const std::error_code& ec) { error = ec; });
    BOOST_CHECK(error == vow::errc::timeout);
}

BOOST_AUTO_TEST_CASE(continuations_run_on_resolution)
{
    auto ctx = asio::io_context{};

    auto holder  = -1;
    auto promise = vow::promise<int>{ ctx };
    promise.on_success([&](int v) { holder = v; });
    BOOST_CHECK_EQUAL(holder, -1);

    promise.ok(1);
    BOOST_CHECK_EQUAL(holder, 1);
}

BOOST_AUTO_TEST_CASE(continuations_added_after_resolution)
{
    auto ctx = asio::io_context{};

    auto holder  = -1;
    auto promise = vow::promise<int>{ ctx };
    promise.ok(1);
    promise.on_success([&](int v) { holder = v; });
    BOOST_CHECK_EQUAL(holder, 1);
}

BOOST_AUTO_TEST_CASE(success_and_failure_continuations)
{
    auto ctx = asio::io_context{};

    auto successes = 0;
    auto failures  = 0;

    auto promise = vow::promise<int>{ ctx };
    promise.on_success([&](int) { successes++; })
        .on_failure([&](const std::error_code&) { failures++; });
    promise.fail(vow::errc::timeout);

    BOOST_CHECK_EQUAL(successes, 0);
    BOOST_CHECK_EQUAL(failures, 1);
}

BOOST_AUTO_TEST_CASE(continuation_order)
{
    auto ctx = asio::io_context{};

    auto order   = std::vector<int>{};
    auto ids     = std::vector<std::thread::id>{};
    auto promise = vow::promise<int>{ ctx };
    for (auto i = 0; i < 5; i++)
        promise.then(
            [&, i](const auto&)
            {
                order.push_back(i);
                ids.push_back(std::this_thread::get_id());
            });

    auto resolver_id = std::thread::id{};
    auto resolver    = std::thread{ [&]
                                 {
                                     resolver_id = std::this_thread::get_id();
                                     promise.ok(1);
                                 } };
    resolver.join();

    BOOST_CHECK((order == std::vector<int>{ 0, 1, 2, 3, 4 }));
    BOOST_REQUIRE_EQUAL(ids.size(), 5U);
    for (auto id : ids)
        BOOST_CHECK(id == resolver_id);

    promise.then(
        [&](const auto&)
        {
            order.push_back(5);
            ids.push_back(std::this_thread::get_id());
        });
    BOOST_CHECK_EQUAL(order.back(), 5);
    BOOST_CHECK(ids.back() == std::this_thread::get_id());
}

BOOST_AUTO_TEST_CASE(concurrent_resolve_has_single_winner)
{
    auto ctx = asio::io_context{};

    for (auto round = 0; round < 50; round++)
    {
        auto promise = vow::promise<int>{ ctx };
        auto invoked = std::atomic<int>{ 0 };
        auto seen    = std::atomic<int>{ -1 };
        promise.on_success(
            [&](int v)
            {
                seen = v;
                invoked++;
            });

        auto go      = std::atomic<bool>{ false };
        auto threads = std::vector<std::thread>{};
        for (auto i = 0; i < 8; i++)
            threads.emplace_back(
                [&, i]
                {
                    while (!go)
                        std::this_thread::yield();
                    promise.ok(i);
                });

        go = true;
        for (auto& t : threads)
            t.join();

        BOOST_CHECK_EQUAL(invoked.load(), 1);
        BOOST_CHECK_EQUAL(promise.value()->value(), seen.load());
    }
}

BOOST_AUTO_TEST_CASE(concurrent_then_and_resolve)
{
    auto ctx = asio::io_context{};

    for (auto round = 0; round < 50; round++)
    {
        auto promise = vow::promise<int>{ ctx };
        auto invoked = std::atomic<int>{ 0 };
        auto go      = std::atomic<bool>{ false };

        auto threads = std::vector<std::thread>{};
        for (auto i = 0; i < 4; i++)
            threads.emplace_back(
                [&]
                {
                    while (!go)
                        std::this_thread::yield();
                    for (auto j = 0; j < 100; j++)
                        promise.then([&](const auto&) { invoked++; });
                });
        threads.emplace_back(
            [&]
            {
                while (!go)
                    std::this_thread::yield();
                promise.ok(round);
            });

        go = true;
        for (auto& t : threads)
            t.join();

        BOOST_CHECK_EQUAL(invoked.load(), 400);
    }
}

BOOST_AUTO_TEST_CASE(throwing_continuation)
{
    auto ctx = asio::io_context{};

    auto second  = false;
    auto promise = vow::promise<int>{ ctx };
    promise.then([](const auto&) { throw std::runtime_error{ "OPS" }; });
    promise.then([&](const auto&) { second = true; });

    BOOST_CHECK_EXCEPTION(
        promise.ok(1),
        std::runtime_error,
        [](const auto& e) { return std::string{ e.what() } == "OPS"; });
    BOOST_CHECK(second);
    BOOST_CHECK(promise.is_resolved());
    BOOST_CHECK_EQUAL(promise.value()->value(), 1);
}

BOOST_AUTO_TEST_CASE(pending_continuations_are_released)
{
    auto ctx = asio::io_context{};

    auto tracker = std::make_shared<int>(0);
    {
        auto promise = vow::promise<int>{ ctx };
        promise.then([tracker](const auto&) {});
        BOOST_CHECK_EQUAL(tracker.use_count(), 2);
    }
    BOOST_CHECK_EQUAL(tracker.use_count(), 1);
}

BOOST_AUTO_TEST_CASE(move_only_continuation)
{
    auto ctx = asio::io_context{};

    auto holder  = 0;
    auto promise = vow::promise<int>{ ctx };
    promise.on_success([&holder, p = std::make_unique<int>(5)](int v)
                       { holder = v + *p; });
    promise.ok(1);
    BOOST_CHECK_EQUAL(holder, 6);
}

BOOST_AUTO_TEST_CASE(map_transforms_value)
{
    auto ctx = asio::io_context{};

    auto holder  = std::string{};
    auto promise = vow::promise<int>{ ctx };
    promise.map([](int v) { return std::to_string(v); })
        .on_success([&](const std::string& s) { holder = s; });

    promise.ok(1234);
    BOOST_CHECK_EQUAL(holder, "1234");
}

BOOST_AUTO_TEST_CASE(map_preserves_failure)
{
    auto ctx = asio::io_context{};

    auto invoked = false;
    auto promise = vow::promise<int>{ ctx };
    auto mapped  = promise.map(
        [&](int v)
        {
            invoked = true;
            return v + 1;
        });

    promise.fail(vow::errc::timeout);
    BOOST_CHECK(!invoked);
    BOOST_REQUIRE(mapped.is_resolved());
    BOOST_CHECK(mapped.value()->error() == vow::errc::timeout);
}

BOOST_AUTO_TEST_CASE(throwing_transform_leaves_derived_pending)
{
    auto ctx = asio::io_context{};

    auto promise = vow::promise<int>{ ctx };
    auto mapped  = promise.map(
        [](int v) -> int
        {
            if (v > 0)
                throw std::runtime_error{ "transform" };
            return v;
        });
    auto chained = promise.chain_map(
        [](int) -> vow::promise<int> { throw std::runtime_error{ "bind" }; });

    BOOST_CHECK_THROW(promise.ok(1), std::runtime_error);
    BOOST_CHECK(promise.is_resolved());
    BOOST_CHECK(!mapped.is_resolved());
    BOOST_CHECK(!chained.is_resolved());
}

BOOST_AUTO_TEST_CASE(chain_map_resolves_to_success)
{
    auto ctx = asio::io_context{};

    auto holder  = -1;
    auto status  = std::string{};
    auto promise = vow::promise<int>{ ctx };
    promise.on_success([&](int) { holder = 1; })
        .on_failure([&](const std::error_code&) { holder = 2; });

    auto chain = promise.chain_map(
        [&](int v)
        { return vow::promise<std::string>{ ctx, vow::ok(std::to_string(v)) }; });
    chain.on_success([&](const std::string&) { status = "success"; })
        .on_failure([&](const std::error_code&) { status = "failure"; });

    promise.ok(123);
    BOOST_CHECK_EQUAL(holder, 1);
    BOOST_CHECK_EQUAL(status, "success");
    BOOST_CHECK_EQUAL(chain.value()->value(), "123");
}

BOOST_AUTO_TEST_CASE(chain_map_short_circuits_on_failure)
{
    auto ctx = asio::io_context{};

    auto invoked = false;
    auto status  = std::string{};
    auto promise = vow::promise<int>{ ctx };
    auto chain   = promise.chain_map(
        [&](int v)
        {
            invoked = true;
            return vow::promise<std::string>{ ctx, vow::ok(std::to_string(v)) };
        });
    chain.on_success([&](const std::string&) { status = "success"; })
        .on_failure([&](const std::error_code&) { status = "failure"; });

    promise.fail(vow::errc::timeout);
    BOOST_CHECK(!invoked);
    BOOST_CHECK_EQUAL(status, "failure");
    BOOST_CHECK(chain.value()->error() == vow::errc::timeout);
}

BOOST_AUTO_TEST_CASE(chain_map_forwards_inner_failure)
{
    auto ctx = asio::io_context{};

    auto inner   = vow::promise<std::string>{ ctx };
    auto promise = vow::promise<int>{ ctx };
    auto chain   = promise.chain_map([&](int) { return inner; });

    promise.ok(7);
    BOOST_CHECK(!chain.is_resolved());

    inner.fail(vow::errc::no_state);
    BOOST_REQUIRE(chain.is_resolved());
    BOOST_CHECK(chain.value()->error() == vow::errc::no_state);
}

BOOST_AUTO_TEST_CASE(custom_error_type)
{
    auto ctx = asio::io_context{};

    auto promise = vow::promise<int, std::string>{ ctx };
    auto mapped  = promise.map([](int v) { return v * 2; });
    promise.fail("not found");
    BOOST_CHECK_EQUAL(mapped.value()->error(), "not found");
}

BOOST_AUTO_TEST_SUITE_END()
