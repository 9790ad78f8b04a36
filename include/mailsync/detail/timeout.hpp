/*

timeout.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Bounding a whole coroutine by a deadline.

*/

#pragma once

#include <string>
#include <utility>
#include <variant>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::detail
{

/**
Race `op` against a timer.

The loser is cancelled through the parallel group. On expiry the result is
`code` with `message`; an outer cancellation that wakes the timer first is
reported as `net_cancelled`.
**/
template<typename T>
mailsync::asio::awaitable<result<T>> with_timeout(mailsync::asio::awaitable<result<T>> op,
    steady_clock::duration limit, errc code, std::string message)
{
    using namespace mailsync::asio::operators;

    mailsync::asio::steady_timer timer(co_await mailsync::asio::this_coro::executor);
    timer.expires_after(limit);

    auto outcome = co_await (std::move(op) || timer.async_wait(mailsync::asio::use_nothrow_awaitable));
    if (outcome.index() == 0)
        co_return std::move(std::get<0>(outcome));

    auto [ec] = std::get<1>(outcome);
    if (ec == mailsync::asio::error::operation_aborted)
        co_return fail<T>(errc::net_cancelled, "operation cancelled", {}, ec);
    co_return fail<T>(code, std::move(message));
}

} // namespace mailsync::detail
