/*

imap/error_mapping.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mapping between tagged IMAP completions and mailsync::errc.

*/

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <mailsync/detail/redact.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/types.hpp>

namespace mailsync::imap
{

enum class error_kind
{
    tagged_no,
    tagged_bad,
    continuation_expected,
    parse
};

[[nodiscard]] constexpr errc map_imap_error(error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::tagged_no: return errc::imap_tagged_no;
        case error_kind::tagged_bad: return errc::imap_tagged_bad;
        case error_kind::continuation_expected: return errc::imap_continuation_expected;
        case error_kind::parse: return errc::imap_parse_error;
    }
    return errc::imap_parse_error;
}

/// Completion status of a tagged line; `error_kind` only for failures
[[nodiscard]] constexpr std::optional<error_kind> error_kind_for(status st) noexcept
{
    switch (st)
    {
        case status::no: return error_kind::tagged_no;
        case status::bad: return error_kind::tagged_bad;
        case status::ok:
        case status::preauth: return std::nullopt;
        case status::bye:
        case status::unknown: return error_kind::parse;
    }
    return error_kind::parse;
}

/// Structured detail attached to every protocol failure; command and tagged line are redacted on request
[[nodiscard]] inline mailsync::detail::error_detail make_imap_detail(
    std::string_view tag,
    std::string_view command,
    std::string_view tagged_line,
    std::size_t untagged_count,
    bool redact = true)
{
    mailsync::detail::error_detail out;
    out.add("proto", "imap")
        .add_if_set("tag", tag)
        .add_line("command", command, redact);
    if (!tagged_line.empty())
        out.add_line("tagged.line", tagged_line, redact);
    out.add_int("untagged.count", untagged_count);
    return out;
}

} // namespace mailsync::imap
