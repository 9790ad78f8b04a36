/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Asio error codes onto mailsync::errc for network I/O.

*/

#pragma once

#include <string_view>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, const mailsync::asio::error_code& ec, bool timed_out) noexcept
{
    namespace error = mailsync::asio::error;

    if (timed_out || ec == error::timed_out)
        return errc::net_timeout;
    if (ec == error::operation_aborted)
        return errc::net_cancelled;
    if (ec == error::eof)
        return errc::net_eof;
    if (ec == error::connection_refused)
        return errc::net_connection_refused;
    if (ec == error::connection_reset || ec == error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == error::host_not_found || ec == error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read:
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline error_info make_net_error(io_stage stage, const mailsync::asio::error_code& ec,
    std::string_view host, std::string_view op,
    std::source_location where = std::source_location::current())
{
    detail::error_detail detail;
    detail.add("host", host).add("stage", stage_name(stage)).add("op", op);
    return error_info{map_net_error(stage, ec, false), std::string(op) + " failed: " + ec.message(),
        detail.str(), ec, where};
}

} // namespace mailsync::net
