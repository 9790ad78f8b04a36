/*

append.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace mailsync::detail
{

inline void append_sv(std::string& out, std::string_view sv)
{
    out.append(sv.data(), sv.size());
}

inline void append_space(std::string& out)
{
    out.push_back(' ');
}

inline void append_crlf(std::string& out)
{
    out.append("\r\n", 2);
}

inline void append_uint(std::string& out, std::uint64_t value)
{
    char buffer[20];
    const auto res = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (res.ec != std::errc())
        return;
    out.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
}

/// Append an IMAP quoted string, escaping backslash and double quote
inline void append_quoted(std::string& out, std::string_view text)
{
    out.reserve(out.size() + text.size() + 2);
    out.push_back('"');
    for (char ch : text)
    {
        if (ch == '"' || ch == '\\')
            out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
}

} // namespace mailsync::detail
