// Copyright (c) 2022 Mohammad Nejati
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include <vow.hpp>
#include <vow_format.hpp>

#include <boost/asio.hpp>
#include <fmt/format.h>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace asio = boost::asio;
using namespace std::chrono_literals;

struct article
{
    int id;
    std::string title;
};

class article_service
{
    asio::any_io_executor executor_;
    std::map<std::string, std::vector<article>> articles_;
    std::chrono::milliseconds latency_;
    bool available_;

  public:
    article_service(
        asio::any_io_executor executor,
        std::chrono::milliseconds latency,
        bool available)
        : executor_{ std::move(executor) }
        , articles_{ { "alice", { { 1, "Futures" }, { 2, "Executors" } } },
                     { "bob", { { 3, "Timers" } } } }
        , latency_{ latency }
        , available_{ available }
    {
    }

    vow::promise<std::vector<article>> articles_by_user(const std::string& user)
    {
        return vow::promise<std::vector<article>>{ executor_ }.async(
            vow::timeout{ latency_ },
            [this, user](auto& p)
            {
                auto it = articles_.find(user);
                if (!available_)
                    p.fail(std::make_error_code(
                        std::errc::resource_unavailable_try_again));
                else if (it == articles_.end())
                    p.fail(std::make_error_code(
                        std::errc::no_such_file_or_directory));
                else
                    p.ok(it->second);
            });
    }
};

class comment_service
{
    asio::any_io_executor executor_;

  public:
    explicit comment_service(asio::any_io_executor executor)
        : executor_{ std::move(executor) }
    {
    }

    vow::promise<std::vector<std::string>> comments_by_article(const article& a)
    {
        return vow::promise<std::vector<std::string>>{ executor_ }.async(
            vow::timeout{ 20ms },
            [a](auto& p)
            {
                p.ok(std::vector<std::string>{ fmt::format("nice post on {}", a.title),
                                               fmt::format("more on {} please", a.title) });
            });
    }
};

int main()
{
    auto pool     = asio::thread_pool{ 2 };
    auto primary  = article_service{ pool.get_executor(), 10ms, false };
    auto replica  = article_service{ pool.get_executor(), 40ms, true };
    auto comments = comment_service{ pool.get_executor() };

    for (auto user : { "alice", "bob", "carol" })
    {
        auto articles = vow::any_success(
            primary.articles_by_user(user), replica.articles_by_user(user));

        auto first_comments = articles.chain_map(
            [&](const std::vector<article>& list)
            { return comments.comments_by_article(list.front()); });

        auto count = articles.map([](const std::vector<article>& list)
                                  { return list.size(); });

        vow::all(count, first_comments)
            .when(vow::timeout{ 1s }, vow::fail(vow::errc::timeout))
            .then([user](const auto& r)
                  { fmt::print("{}: {}\n", user, r); })
            .sync_wait();
    }

    pool.join();
}
