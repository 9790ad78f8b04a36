/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Header-only logging for mailsync.
Levels, an optional sink callback and IMAP wire tracing with credential redaction.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <mailsync/detail/redact.hpp>

namespace mailsync::log
{

enum class level : std::uint8_t
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    off = 5
};

enum class direction : std::uint8_t
{
    send,
    receive
};

struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct wire_t
    {
        direction dir;
        std::string data;
    };
    std::optional<wire_t> wire;
};

using sink_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Process wide logger, writes to stderr unless a sink is installed
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    void set_sink(sink_t sink)
    {
        std::lock_guard lock(mutex_);
        sink_ = std::move(sink);
    }

    void clear_sink()
    {
        std::lock_guard lock(mutex_);
        sink_ = nullptr;
    }

    void set_wire_trace(bool enabled) noexcept
    {
        wire_trace_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_wire_trace_enabled() const noexcept
    {
        return wire_trace_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .wire = std::nullopt
        };
        dispatch(e);
    }

    /// Outgoing lines pass through redact_line before they reach any sink unless `redact` is off
    void wire(direction dir, std::string_view data, bool redact = true,
              std::source_location loc = std::source_location::current())
    {
        if (!is_wire_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .wire = entry::wire_t{
                .dir = dir,
                .data = dir == direction::send && redact ? mailsync::detail::redact_line(data) : std::string(data)
            }
        };
        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (sink_)
            sink_(e);
        else
            write_stderr(e);
    }

    static void write_stderr(const entry& e)
    {
        const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        if (e.wire)
        {
            const char* arrow = e.wire->dir == direction::send ? ">>>" : "<<<";
            std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] IMAP {} {}\n",
                tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
                arrow, printable(e.wire->data));
        }
        else
        {
            std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] [{}] {}\n",
                tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
                level_to_string(e.lvl), e.message);
        }
    }

    [[nodiscard]] static std::string printable(std::string_view data)
    {
        constexpr std::size_t max_len = 500;
        std::string out(data.substr(0, max_len));
        for (char& c : out)
        {
            if (static_cast<unsigned char>(c) < 32 && c != '\r' && c != '\n')
                c = '.';
        }
        while (!out.empty() && (out.back() == '\r' || out.back() == '\n'))
            out.pop_back();
        if (data.size() > max_len)
            out += "... [truncated]";
        return out;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> wire_trace_{false};
    std::mutex mutex_;
    sink_t sink_;
};

#define MAILSYNC_LOG(lvl, msg) \
    ::mailsync::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MAILSYNC_TRACE(msg) MAILSYNC_LOG(::mailsync::log::level::trace, msg)
#define MAILSYNC_DEBUG(msg) MAILSYNC_LOG(::mailsync::log::level::debug, msg)
#define MAILSYNC_INFO(msg)  MAILSYNC_LOG(::mailsync::log::level::info, msg)
#define MAILSYNC_WARN(msg)  MAILSYNC_LOG(::mailsync::log::level::warn, msg)
#define MAILSYNC_ERROR(msg) MAILSYNC_LOG(::mailsync::log::level::error, msg)

#define MAILSYNC_WIRE_SEND(data) \
    ::mailsync::log::logger::instance().wire(::mailsync::log::direction::send, data)

#define MAILSYNC_WIRE_RECV(data) \
    ::mailsync::log::logger::instance().wire(::mailsync::log::direction::receive, data)

} // namespace mailsync::log
