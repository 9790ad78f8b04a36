/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/redact.hpp>

namespace mailsync::detail
{

/// Builds the `detail` text of an `error_info`, one `key=value` per line.
class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        std::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        return *this;
    }

    /// Skipped when `value` is empty, so optional context leaves no noise
    error_detail& add_if_set(std::string_view key, std::string_view value)
    {
        if (!value.empty())
            add(key, value);
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t value)
    {
        std::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        return *this;
    }

    /// Protocol line, with LOGIN / AUTHENTICATE arguments masked when `redact` is set
    error_detail& add_line(std::string_view key, std::string_view line, bool redact = true)
    {
        return add(key, redact ? redact_line(line) : std::string(line));
    }

    /// `prefix0=...`, `prefix1=...` for a batch of protocol lines
    error_detail& add_lines(std::string_view prefix, const std::vector<std::string>& lines, bool redact = false)
    {
        for (std::size_t i = 0; i < lines.size(); ++i)
            std::format_to(std::back_inserter(out_), "{}{}={}\n", prefix, i, redact ? redact_line(lines[i]) : lines[i]);
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept { return out_.empty(); }
    [[nodiscard]] std::string str() const { return out_; }

private:
    std::string out_;
};

} // namespace mailsync::detail
