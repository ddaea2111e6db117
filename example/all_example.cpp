// Copyright (c) 2022 Mohammad Nejati
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include <vow.hpp>
#include <vow_format.hpp>

#include <boost/asio.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

#include <chrono>
#include <string>

namespace asio = boost::asio;
using namespace std::chrono_literals;

class slow_service
{
    asio::any_io_executor executor_;

  public:
    explicit slow_service(asio::any_io_executor executor)
        : executor_{ std::move(executor) }
    {
    }

    vow::promise<int> slow_retrieve_integer(int value)
    {
        return vow::promise<int>{ executor_ }.async(
            vow::timeout{ 100ms }, [value](auto& p) { p.ok(value); });
    }

    vow::promise<std::string> slow_retrieve_string(std::string value)
    {
        return vow::promise<std::string>{ executor_ }.async(
            vow::timeout{ 50ms },
            [value = std::move(value)](auto& p) { p.ok(value); });
    }

    vow::promise<std::string> slow_retrieve_uuid()
    {
        return vow::promise<std::string>{ executor_ }.async(
            vow::timeout{ 150ms },
            [](auto& p)
            { p.ok(boost::uuids::to_string(boost::uuids::random_generator{}())); });
    }
};

int main()
{
    auto pool    = asio::thread_pool{ 2 };
    auto service = slow_service{ pool.get_executor() };

    fmt::print("Waiting on a single value ...\n");
    service.slow_retrieve_integer(42)
        .on_success([](int v) { fmt::print("Value: {}\n", v); })
        .sync_wait();

    fmt::print("Waiting on a value with a timeout fallback ...\n");
    service.slow_retrieve_integer(4242)
        .when(vow::timeout{ 10s }, vow::fail(vow::errc::timeout))
        .then([](const auto& r) { fmt::print("Result: {}\n", r); })
        .sync_wait();

    fmt::print("Waiting on all values ...\n");
    auto combined = vow::all(
        service.slow_retrieve_integer(123),
        service.slow_retrieve_string("text 1"),
        service.slow_retrieve_uuid());
    combined.then([](const auto& r) { fmt::print("Result: {}\n", r); });

    if (combined.wait_for(vow::timeout{ 1s }) == vow::wait_status::timeout)
        fmt::print("Gave up after {}\n", vow::timeout{ 1s });

    // The fallback timer above is still armed.
    pool.stop();
    pool.join();
}
