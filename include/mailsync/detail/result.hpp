/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
No exceptions cross the mailsync API - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <mailsync/detail/error_detail.hpp>

namespace mailsync
{

/// Error codes for mailsync operations
enum class errc : std::uint16_t
{
    // Transport
    net_timeout = 100,
    net_cancelled,
    net_eof,
    net_connection_refused,
    net_connection_reset,
    net_resolve_failed,
    net_connect_failed,
    net_io_failed,

    // TLS
    tls_handshake_failed = 200,
    tls_verify_failed,
    tls_pinning_failed,

    // IMAP protocol
    imap_tagged_no = 300,
    imap_tagged_bad,
    imap_continuation_expected,
    imap_parse_error,
    imap_invalid_state,
    imap_bad_greeting,

    // Codec / input validation
    codec_invalid_input = 400,

    // Authentication and capabilities
    auth_failed = 500,
    auth_not_supported,
    capability_not_supported,

    // Lookups and bounded steps
    not_found = 600,
    connect_timeout,
    auth_timeout,

    // Storage collaborator
    storage_failed = 700,

    // Synchronization
    sync_cancelled = 800,

    // Background scheduler
    queue_full = 900,
    task_timeout,
    task_cancelled,
    task_not_found,
    task_failed
};

[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::net_timeout: return "net_timeout";
        case errc::net_cancelled: return "net_cancelled";
        case errc::net_eof: return "net_eof";
        case errc::net_connection_refused: return "net_connection_refused";
        case errc::net_connection_reset: return "net_connection_reset";
        case errc::net_resolve_failed: return "net_resolve_failed";
        case errc::net_connect_failed: return "net_connect_failed";
        case errc::net_io_failed: return "net_io_failed";
        case errc::tls_handshake_failed: return "tls_handshake_failed";
        case errc::tls_verify_failed: return "tls_verify_failed";
        case errc::tls_pinning_failed: return "tls_pinning_failed";
        case errc::imap_tagged_no: return "imap_tagged_no";
        case errc::imap_tagged_bad: return "imap_tagged_bad";
        case errc::imap_continuation_expected: return "imap_continuation_expected";
        case errc::imap_parse_error: return "imap_parse_error";
        case errc::imap_invalid_state: return "imap_invalid_state";
        case errc::imap_bad_greeting: return "imap_bad_greeting";
        case errc::codec_invalid_input: return "codec_invalid_input";
        case errc::auth_failed: return "auth_failed";
        case errc::auth_not_supported: return "auth_not_supported";
        case errc::capability_not_supported: return "capability_not_supported";
        case errc::not_found: return "not_found";
        case errc::connect_timeout: return "connect_timeout";
        case errc::auth_timeout: return "auth_timeout";
        case errc::storage_failed: return "storage_failed";
        case errc::sync_cancelled: return "sync_cancelled";
        case errc::queue_full: return "queue_full";
        case errc::task_timeout: return "task_timeout";
        case errc::task_cancelled: return "task_cancelled";
        case errc::task_not_found: return "task_not_found";
        case errc::task_failed: return "task_failed";
    }
    return "unknown";
}

/// Coarse failure classes used by callers to decide on retry or reconnect
enum class error_class
{
    connection,
    authentication,
    protocol,
    server_refusal,
    timeout,
    not_supported,
    not_found,
    invalid_state,
    cancelled,
    storage
};

[[nodiscard]] constexpr error_class classify(errc code) noexcept
{
    switch (code)
    {
        case errc::net_timeout:
        case errc::connect_timeout:
        case errc::auth_timeout:
        case errc::task_timeout:
            return error_class::timeout;
        case errc::net_eof:
        case errc::net_connection_refused:
        case errc::net_connection_reset:
        case errc::net_resolve_failed:
        case errc::net_connect_failed:
        case errc::net_io_failed:
        case errc::tls_handshake_failed:
        case errc::tls_verify_failed:
        case errc::tls_pinning_failed:
            return error_class::connection;
        case errc::net_cancelled:
        case errc::sync_cancelled:
        case errc::task_cancelled:
            return error_class::cancelled;
        case errc::imap_tagged_no:
            return error_class::server_refusal;
        case errc::imap_tagged_bad:
        case errc::imap_continuation_expected:
        case errc::imap_parse_error:
        case errc::imap_bad_greeting:
        case errc::codec_invalid_input:
        case errc::task_failed:
            return error_class::protocol;
        case errc::imap_invalid_state:
        case errc::queue_full:
            return error_class::invalid_state;
        case errc::auth_failed:
            return error_class::authentication;
        case errc::auth_not_supported:
        case errc::capability_not_supported:
            return error_class::not_supported;
        case errc::not_found:
        case errc::task_not_found:
            return error_class::not_found;
        case errc::storage_failed:
            return error_class::storage;
    }
    return error_class::protocol;
}

[[nodiscard]] constexpr std::string_view to_string(error_class cls) noexcept
{
    switch (cls)
    {
        case error_class::connection: return "connection";
        case error_class::authentication: return "authentication";
        case error_class::protocol: return "protocol";
        case error_class::server_refusal: return "server_refusal";
        case error_class::timeout: return "timeout";
        case error_class::not_supported: return "not_supported";
        case error_class::not_found: return "not_found";
        case error_class::invalid_state: return "invalid_state";
        case error_class::cancelled: return "cancelled";
        case error_class::storage: return "storage";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

inline std::ostream& operator<<(std::ostream& os, error_class cls)
{
    return os << to_string(cls);
}

/// Rich error carried by every failed result
struct error_info
{
    errc code{errc::imap_parse_error};
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    [[nodiscard]] error_class category() const noexcept
    {
        return classify(code);
    }

    /// Connection loss, timeouts, server refusals and state errors may succeed on retry
    [[nodiscard]] bool is_recoverable() const noexcept
    {
        switch (category())
        {
            case error_class::connection:
            case error_class::timeout:
            case error_class::server_refusal:
            case error_class::invalid_state:
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] bool is_connection_error() const noexcept
    {
        const auto cls = category();
        return cls == error_class::connection || cls == error_class::timeout;
    }

    [[nodiscard]] std::string to_string() const
    {
        if (detail.empty())
            return std::format("[{}] {}", mailsync::to_string(code), message);
        return std::format("[{}] {} ({})", mailsync::to_string(code), message, detail);
    }
};

template<typename T>
using result = std::expected<T, error_info>;

using result_void = std::expected<void, error_info>;

template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(error_info err)
{
    return std::unexpected(std::move(err));
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message,
    std::string detail = {}, std::error_code sys = {},
    std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), std::move(detail), sys, where});
}

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message,
    const detail::error_detail& detail,
    std::source_location where = std::source_location::current())
{
    return std::unexpected(error_info{code, std::move(message), detail.str(), {}, where});
}

// ==================== Plain Helpers ====================

/// Early-return the error of a result from a regular function
#define MAILSYNC_TRY_VOID(expr) \
    do { \
        auto&& _mailsync_res = (expr); \
        if (!_mailsync_res) [[unlikely]] \
            return std::unexpected(std::move(_mailsync_res).error()); \
    } while (0)

#define MAILSYNC_TRY_ASSIGN(var, expr) \
    do { \
        auto _mailsync_res = (expr); \
        if (!_mailsync_res) [[unlikely]] \
            return std::unexpected(std::move(_mailsync_res).error()); \
        var = std::move(*_mailsync_res); \
    } while (0)

// ==================== Coroutine Helpers ====================

/// Propagate the error of a synchronous result from inside a coroutine
#define MAILSYNC_CO_TRY_VOID(expr) \
    do { \
        auto&& _mailsync_res = (expr); \
        if (!_mailsync_res) [[unlikely]] \
            co_return std::unexpected(std::move(_mailsync_res).error()); \
    } while (0)

/// Assign the value of a result (expr may contain co_await) or propagate its error
#define MAILSYNC_CO_TRY_ASSIGN(var, expr) \
    do { \
        auto _mailsync_res = (expr); \
        if (!_mailsync_res) [[unlikely]] \
            co_return std::unexpected(std::move(_mailsync_res).error()); \
        var = std::move(*_mailsync_res); \
    } while (0)

/// Await a result-returning coroutine and propagate its error, discarding the value
#define MAILSYNC_TRY_CO_AWAIT(expr) \
    do { \
        auto _mailsync_res = co_await (expr); \
        if (!_mailsync_res) [[unlikely]] \
            co_return std::unexpected(std::move(_mailsync_res).error()); \
    } while (0)

} // namespace mailsync
