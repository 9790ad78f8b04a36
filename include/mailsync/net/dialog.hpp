/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/net/error_mapping.hpp>

namespace mailsync::net
{

/// Default maximum line length; IMAP lines are short outside of literals
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Hard ceiling on a single line to bound allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Line oriented exchange over an Asio stream.

Every read and write can be bounded by a timeout. On expiry the timer cancels
the lowest layer and the pending operation reports `net_timeout`; the stream
stays usable, the caller decides whether to reconnect.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    explicit dialog(Stream stream,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)),
          max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
          timeout_(timeout)
    {
    }

    dialog(const dialog&) = delete;
    dialog& operator=(const dialog&) = delete;

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /// Send one line; CRLF is appended or normalised
    mailsync::asio::awaitable<result_void> write_line(std::string line)
    {
        std::string payload = normalize_line(line);
        trace(mailsync::log::direction::send, payload);
        auto [ec, n] = co_await with_timeout(timeout_, [&]
        {
            return mailsync::asio::async_write(stream_, mailsync::asio::buffer(payload),
                mailsync::asio::use_nothrow_awaitable);
        });
        (void)n;
        if (ec)
            co_return fail(errc_for(io_stage::write, ec), "write failed: " + ec.message(), {}, ec);
        co_return ok();
    }

    mailsync::asio::awaitable<result<std::string>> read_line()
    {
        co_return co_await read_line(timeout_);
    }

    /// Read one line (without CRLF) using `timeout` instead of the dialog default
    mailsync::asio::awaitable<result<std::string>> read_line(std::optional<duration> timeout)
    {
        if (auto line = take_buffered_line())
            co_return std::move(*line);

        const std::size_t max_size = std::max(max_line_length_ + 2, read_buffer_.size() + 1);
        auto [ec, n] = co_await with_timeout(timeout, [&]
        {
            return mailsync::asio::async_read_until(stream_,
                mailsync::asio::dynamic_buffer(read_buffer_, max_size), '\n',
                mailsync::asio::use_nothrow_awaitable);
        });
        (void)n;
        if (ec == mailsync::asio::error::not_found)
            co_return fail<std::string>(errc::net_io_failed, "line exceeds maximum length");
        if (ec)
            co_return fail<std::string>(errc_for(io_stage::read, ec), "read failed: " + ec.message(), {}, ec);

        if (auto line = take_buffered_line())
            co_return std::move(*line);
        co_return fail<std::string>(errc::net_io_failed, "line exceeds maximum length");
    }

    /// Read an exact byte count, as announced by a `{n}` literal marker
    mailsync::asio::awaitable<result<std::string>> read_exactly(std::size_t n)
    {
        if (read_buffer_.size() < n)
        {
            const std::size_t remaining = n - read_buffer_.size();
            auto [ec, got] = co_await with_timeout(timeout_, [&]
            {
                return mailsync::asio::async_read(stream_, mailsync::asio::dynamic_buffer(read_buffer_),
                    mailsync::asio::transfer_exactly(remaining), mailsync::asio::use_nothrow_awaitable);
            });
            (void)got;
            if (ec)
                co_return fail<std::string>(errc_for(io_stage::read, ec), "read failed: " + ec.message(), {}, ec);
            if (read_buffer_.size() < n)
                co_return fail<std::string>(errc::net_eof, "stream ended inside a literal");
        }

        std::string out(read_buffer_.data(), n);
        read_buffer_.erase(0, n);
        trace(mailsync::log::direction::receive, out);
        co_return out;
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

    void max_line_length(std::size_t value) noexcept { max_line_length_ = std::min(value, MAX_ALLOWED_LINE_LENGTH); }
    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }

    void timeout(std::optional<duration> value) noexcept { timeout_ = value; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

private:
    errc errc_for(io_stage stage, const mailsync::asio::error_code& ec) const noexcept
    {
        return map_net_error(stage, ec, last_timed_out_);
    }

    /// Run `op` racing a timer; a fired timer cancels the socket and reports timed_out
    template<typename Op>
    mailsync::asio::awaitable<std::tuple<mailsync::asio::error_code, std::size_t>>
    with_timeout(std::optional<duration> timeout, Op op)
    {
        last_timed_out_ = false;
        if (!timeout.has_value())
            co_return co_await op();

        auto fired = std::make_shared<std::atomic_bool>(false);
        mailsync::asio::steady_timer timer(stream_.get_executor());
        timer.expires_after(*timeout);
        timer.async_wait([this, fired](mailsync::asio::error_code timer_ec)
        {
            if (timer_ec)
                return;
            fired->store(true);
            mailsync::asio::error_code ignored;
            mailsync::asio::get_lowest_layer(stream_).cancel(ignored);
        });

        auto [ec, n] = co_await op();
        timer.cancel();
        if (fired->load())
        {
            last_timed_out_ = true;
            if (!ec || ec == mailsync::asio::error::operation_aborted)
                ec = mailsync::asio::error::timed_out;
        }
        co_return std::make_tuple(ec, n);
    }

    std::optional<std::string> take_buffered_line()
    {
        const auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
            return std::nullopt;
        const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        std::string line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        trace(mailsync::log::direction::receive, line);
        return line;
    }

    static std::string normalize_line(std::string_view line)
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            line.remove_suffix(1);
        std::string out(line);
        out += "\r\n";
        return out;
    }

    void trace(mailsync::log::direction dir, std::string_view data) const
    {
        auto& logger = mailsync::log::logger::instance();
        if (logger.is_wire_trace_enabled())
            logger.wire(dir, data, redact_secrets_in_trace_);
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;
    bool last_timed_out_{false};
    bool redact_secrets_in_trace_{true};
};

} // namespace mailsync::net
