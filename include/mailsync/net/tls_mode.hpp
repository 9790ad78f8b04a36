/*

tls_mode.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace mailsync::net
{

enum class tls_mode
{
    none,
    starttls,
    implicit
};

/// Well-known IMAPS port always means implicit TLS
inline constexpr std::uint16_t IMAPS_PORT = 993;
inline constexpr std::uint16_t IMAP_PORT = 143;

[[nodiscard]] constexpr tls_mode select_tls_mode(std::uint16_t port, bool use_tls, bool use_starttls) noexcept
{
    if (port == IMAPS_PORT || use_tls)
        return tls_mode::implicit;
    if (use_starttls)
        return tls_mode::starttls;
    return tls_mode::none;
}

[[nodiscard]] constexpr std::string_view to_string(tls_mode mode) noexcept
{
    switch (mode)
    {
        case tls_mode::none: return "none";
        case tls_mode::starttls: return "starttls";
        case tls_mode::implicit: return "implicit";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, tls_mode mode)
{
    return os << to_string(mode);
}

} // namespace mailsync::net
