/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Boost.Asio names used across mailsync, gathered under mailsync::asio.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 102400 // Boost.Asio 1.24.0
#error "Boost.Asio version 1.24.0 or higher is required (Boost 1.80+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "mailsync requires coroutine support (C++20) and Boost.Asio 1.24+ (Boost 1.80+)"
#endif

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/channel.hpp>

#include <chrono>

namespace mailsync::asio
{
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::streambuf;
    using boost::asio::post;
    using boost::asio::strand;
    using boost::asio::make_strand;
    using boost::asio::cancellation_signal;
    using boost::asio::cancellation_type;
    using boost::asio::bind_cancellation_slot;

    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    using boost::asio::async_write;
    using boost::asio::async_read;
    using boost::asio::async_read_until;
    using boost::asio::async_connect;
    using boost::asio::dynamic_buffer;
    using boost::asio::transfer_exactly;
    using boost::asio::get_lowest_layer;

    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;
    namespace this_coro = boost::asio::this_coro;

    /// Non-throwing awaitable for use with std::expected
    inline constexpr auto use_nothrow_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

    namespace operators = boost::asio::experimental::awaitable_operators;

    template<typename Signature>
    using channel = boost::asio::experimental::channel<Signature>;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace mailsync::asio

namespace mailsync
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
