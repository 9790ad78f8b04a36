/*

redact.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace mailsync::detail
{

[[nodiscard]] constexpr char ascii_upper(char ch) noexcept
{
    return ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - 'a' + 'A') : ch;
}

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(a, b, [](char x, char y) { return ascii_upper(x) == ascii_upper(y); });
}

[[nodiscard]] inline bool starts_with_ci(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && iequals_ascii(text.substr(0, prefix.size()), prefix);
}

/// Offset of the `index`-th space separated word of `text`, npos when there are fewer words
[[nodiscard]] inline std::size_t word_offset(std::string_view text, std::size_t index) noexcept
{
    std::size_t pos = text.find_first_not_of(' ');
    while (pos != std::string_view::npos && index-- > 0)
    {
        pos = text.find(' ', pos);
        if (pos != std::string_view::npos)
            pos = text.find_first_not_of(' ', pos);
    }
    return pos;
}

[[nodiscard]] inline std::string_view word_at(std::string_view text, std::size_t index) noexcept
{
    const std::size_t begin = word_offset(text, index);
    if (begin == std::string_view::npos)
        return {};
    return text.substr(begin, text.find(' ', begin) - begin);
}

/// SASL continuation payloads: base64 alphabet only, and either long or carrying a digit or padding
[[nodiscard]] inline bool looks_like_base64(std::string_view text) noexcept
{
    if (text.size() < 4)
        return false;
    const auto alnum = [](unsigned char ch)
    {
        return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9');
    };
    if (!std::ranges::all_of(text, [&](unsigned char ch) { return alnum(ch) || ch == '+' || ch == '/' || ch == '='; }))
        return false;
    return text.size() >= 12 ||
        std::ranges::any_of(text, [](unsigned char ch) { return ch == '+' || ch == '/' || ch == '=' || (ch >= '0' && ch <= '9'); });
}

/**
Hide credentials in an outgoing IMAP line.

Everything from the password of `LOGIN` or the initial response of `AUTHENTICATE` to
the end of the line becomes `<redacted>`; the tag, the user name and the mechanism
stay readable. A lone base64 continuation line is replaced whole. Line endings survive.
**/
[[nodiscard]] inline std::string redact_line(std::string_view line)
{
    const std::size_t end = line.find_last_not_of("\r\n");
    const std::string_view body = end == std::string_view::npos ? std::string_view{} : line.substr(0, end + 1);
    const std::string_view eol = line.substr(body.size());

    // The verb is the first word for untagged use, the second after a tag
    for (std::size_t verb = 0; verb < 2; ++verb)
    {
        const std::string_view word = word_at(body, verb);
        if (!iequals_ascii(word, "LOGIN") && !iequals_ascii(word, "AUTHENTICATE"))
            continue;
        const std::size_t secret = word_offset(body, verb + 2);
        if (secret == std::string_view::npos)
            return std::string(line);
        std::string out(body.substr(0, secret));
        out += "<redacted>";
        out += eol;
        return out;
    }

    if (word_offset(body, 1) == std::string_view::npos && looks_like_base64(word_at(body, 0)))
        return "<redacted>" + std::string(eol);
    return std::string(line);
}

} // namespace mailsync::detail
