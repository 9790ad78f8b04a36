/*

token_source.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Hands out access tokens for token credentials. Fetching new tokens is the
caller's business (refresh callback); no HTTP happens here.

*/

#pragma once

#include <chrono>
#include <format>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::oauth2
{

/// Bearer token as issued by the provider
struct token
{
    std::string access_token;
    /// Opaque to mailsync, handed back to the refresh callback
    std::string refresh_token;
    std::chrono::system_clock::time_point expires_at{};

    /// Time left before expiry, zero once expired
    [[nodiscard]] std::chrono::seconds valid_for(std::chrono::system_clock::time_point now) const
    {
        if (expires_at <= now)
            return std::chrono::seconds{0};
        return std::chrono::duration_cast<std::chrono::seconds>(expires_at - now);
    }
};

/**
Thread-safe holder of the current token.

A token expiring within `skew` counts as expired and is refreshed through the
callback before it is handed out. Without a callback an expired token is an
`auth_failed` error.
**/
class token_source
{
public:
    using refresh_fn = std::function<mailsync::result<token>(const token& current)>;

    token_source(token initial, refresh_fn fn, std::chrono::seconds skew = std::chrono::seconds{30})
        : current_(std::move(initial)),
          refresh_(std::move(fn)),
          skew_(skew)
    {
    }

    mailsync::result<std::string> get_access_token()
    {
        return hand_out(false);
    }

    /// Refresh regardless of expiry; used after the server rejected the token
    mailsync::result<std::string> refresh_access_token()
    {
        return hand_out(true);
    }

    [[nodiscard]] unsigned refresh_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return refreshes_;
    }

private:
    mailsync::result<std::string> hand_out(bool forced)
    {
        token snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!forced && current_.valid_for(std::chrono::system_clock::now()) > skew_)
                return mailsync::ok(current_.access_token);
            snapshot = current_;
        }

        if (!refresh_)
            return mailsync::fail<std::string>(mailsync::errc::auth_failed,
                "access token expired and no refresh function configured");

        // The callback may block on HTTP; it runs without the lock held
        auto refreshed = refresh_(snapshot);
        if (!refreshed)
        {
            MAILSYNC_WARN(std::format("token refresh failed: {}", refreshed.error().to_string()));
            return mailsync::fail<std::string>(std::move(refreshed).error());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(refreshed).value();
        ++refreshes_;
        MAILSYNC_DEBUG(std::format("access token refreshed{}, valid for {}s", forced ? " on demand" : "",
            current_.valid_for(std::chrono::system_clock::now()).count()));
        return mailsync::ok(current_.access_token);
    }

    mutable std::mutex mutex_;
    token current_;
    refresh_fn refresh_;
    std::chrono::seconds skew_;
    unsigned refreshes_{0};
};

} // namespace mailsync::oauth2
