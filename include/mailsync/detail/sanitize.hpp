/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <format>
#include <string_view>

#include <mailsync/detail/result.hpp>

namespace mailsync::detail
{

[[nodiscard]] inline bool contains_crlf_or_nul(std::string_view value) noexcept
{
    for (char ch : value)
    {
        if (ch == '\r' || ch == '\n' || ch == '\0')
            return true;
    }
    return false;
}

/// Command arguments must never smuggle a line break onto the wire
[[nodiscard]] inline result_void ensure_no_crlf_or_nul(std::string_view value, std::string_view field_name)
{
    if (!contains_crlf_or_nul(value))
        return ok();
    return fail(errc::codec_invalid_input,
        std::format("invalid {}: CR/LF or NUL not allowed", field_name.empty() ? "value" : field_name));
}

} // namespace mailsync::detail
