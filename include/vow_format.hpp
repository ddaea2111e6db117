// Copyright (c) 2022 Mohammad Nejati, Klemens D. Morgenstern, Ricahrd Hodges
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <vow.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <string_view>
#include <system_error>

namespace vow
{
namespace detail
{
inline std::string describe_error(const std::error_code& ec)
{
    return fmt::format("{}:{} {}", ec.category().name(), ec.value(), ec.message());
}

template<typename E>
std::string describe_error(const E& error)
{
    return fmt::format("{}", error);
}
} // namespace detail
} // namespace vow

namespace fmt
{
template<typename T, typename E>
struct formatter<vow::result<T, E>> : formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const vow::result<T, E>& r, FormatContext& ctx) const
    {
        if (r.is_success())
            return fmt::format_to(ctx.out(), "ok({})", r.value());

        return fmt::format_to(
            ctx.out(), "fail({})", vow::detail::describe_error(r.error()));
    }
};

template<typename T, typename E, typename Executor>
struct formatter<vow::promise<T, E, Executor>> : formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const vow::promise<T, E, Executor>& p, FormatContext& ctx) const
    {
        if (!p.is_valid())
            return fmt::format_to(ctx.out(), "promise(no state)");

        if (auto value = p.value())
            return fmt::format_to(ctx.out(), "promise({})", *value);

        return fmt::format_to(ctx.out(), "promise(pending)");
    }
};

template<>
struct formatter<vow::timeout> : formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const vow::timeout& t, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}ms", t.millis());
    }
};
} // namespace fmt

namespace vow
{
/// Renders a result as `ok(value)` or `fail(error)`.
template<typename T, typename E>
std::string to_string(const result<T, E>& r)
{
    return fmt::format("{}", r);
}

/// Renders a promise as `promise(pending)` or `promise(<result>)`.
template<typename T, typename E, typename Executor>
std::string to_string(const promise<T, E, Executor>& p)
{
    return fmt::format("{}", p);
}
} // namespace vow
