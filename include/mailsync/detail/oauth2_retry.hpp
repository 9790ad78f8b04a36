/*

oauth2_retry.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <format>
#include <string>
#include <type_traits>
#include <utility>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/oauth2/token_source.hpp>

namespace mailsync::detail
{

template<class>
struct attempt_result;

template<class T>
struct attempt_result<mailsync::asio::awaitable<result<T>>>
{
    using value_type = T;
};

/// Value type `T` of an attempt returning `awaitable<result<T>>`
template<class AuthFn>
using attempt_value_t = typename attempt_result<
    std::remove_cvref_t<std::invoke_result_t<AuthFn&, const std::string&>>>::value_type;

/**
Authenticate with the current access token, refreshing once on rejection.

`attempt(access_token)` runs the mechanism. When it fails with `retry_on` the
token is force-refreshed and the attempt repeated exactly once; any other
failure, and any failure of the second attempt, is returned as is.
**/
template<class AuthFn>
mailsync::asio::awaitable<result<attempt_value_t<AuthFn>>> authenticate_with_refresh(
    mailsync::oauth2::token_source& source, AuthFn attempt, errc retry_on = errc::auth_failed)
{
    using value_t = attempt_value_t<AuthFn>;

    std::string access_token;
    MAILSYNC_CO_TRY_ASSIGN(access_token, source.get_access_token());

    auto first = co_await attempt(access_token);
    if (first || first.error().code != retry_on)
        co_return first;

    MAILSYNC_INFO(std::format("token rejected ({}), refreshing and retrying once", first.error().message));
    auto refreshed = source.refresh_access_token();
    if (!refreshed)
        co_return fail<value_t>(std::move(refreshed).error());
    co_return co_await attempt(*refreshed);
}

} // namespace mailsync::detail
