/*

imap/idle.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/async_mutex.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/client.hpp>
#include <mailsync/imap/codec.hpp>
#include <mailsync/imap/types.hpp>

namespace mailsync::imap
{

struct idle_config
{
    /// Longest silence tolerated before the session is considered dead; keep it under the 30 minute IDLE limit
    std::chrono::steady_clock::duration idle_timeout = std::chrono::minutes(29);
    std::chrono::steady_clock::duration heartbeat_interval = std::chrono::seconds(60);
    /// Bound of a single listener read; expiry is not an error
    std::chrono::steady_clock::duration read_timeout = std::chrono::seconds(30);
    std::chrono::steady_clock::duration restart_pause = std::chrono::milliseconds(100);
};

/// Change pushed by the server while idling, or a condition of the monitor itself
struct idle_event
{
    enum class kind
    {
        exists,
        recent,
        expunge,
        fetch,
        connection_lost,
        timeout,
        idle_error
    };

    kind type{kind::exists};
    /// Message count for exists / recent, sequence number for expunge / fetch
    std::uint32_t number = 0;
    std::optional<std::uint32_t> uid;
    std::optional<error_info> error;

    static idle_event connection_lost() { return {kind::connection_lost, 0, std::nullopt, std::nullopt}; }
    static idle_event timeout() { return {kind::timeout, 0, std::nullopt, std::nullopt}; }
    static idle_event failure(error_info err) { return {kind::idle_error, 0, std::nullopt, std::move(err)}; }

    bool operator==(const idle_event& other) const
    {
        return type == other.type && number == other.number && uid == other.uid;
    }
};

[[nodiscard]] constexpr std::string_view to_string(idle_event::kind k) noexcept
{
    switch (k)
    {
        case idle_event::kind::exists: return "exists";
        case idle_event::kind::recent: return "recent";
        case idle_event::kind::expunge: return "expunge";
        case idle_event::kind::fetch: return "fetch";
        case idle_event::kind::connection_lost: return "connection_lost";
        case idle_event::kind::timeout: return "timeout";
        case idle_event::kind::idle_error: return "idle_error";
    }
    return "unknown";
}

/// `* <n> EXISTS|RECENT|EXPUNGE|FETCH ...`; anything else is not a notification
[[nodiscard]] inline std::optional<idle_event> parse_idle_line(const response_line& line)
{
    auto [star, rest] = detail::split_token(line.text);
    auto [number, tail] = detail::split_token(rest);
    auto [keyword, ignored] = detail::split_token(tail);
    (void)ignored;

    std::uint32_t n = 0;
    if (star != "*" || !detail::parse_number(number, n))
        return std::nullopt;

    if (detail::iequals_ascii(keyword, "EXISTS"))
        return idle_event{idle_event::kind::exists, n, std::nullopt, std::nullopt};
    if (detail::iequals_ascii(keyword, "RECENT"))
        return idle_event{idle_event::kind::recent, n, std::nullopt, std::nullopt};
    if (detail::iequals_ascii(keyword, "EXPUNGE"))
        return idle_event{idle_event::kind::expunge, n, std::nullopt, std::nullopt};
    if (detail::iequals_ascii(keyword, "FETCH"))
    {
        idle_event ev{idle_event::kind::fetch, n, std::nullopt, std::nullopt};
        if (auto msg = parse_fetch(line); msg)
            ev.uid = msg->uid;
        return ev;
    }
    return std::nullopt;
}

/// Every notification in a block of server lines
[[nodiscard]] inline std::vector<idle_event> parse_idle_response(std::string_view text)
{
    std::vector<idle_event> events;
    while (!text.empty())
    {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
            line.remove_suffix(1);
        if (auto ev = parse_idle_line(response_line{std::string(detail::ltrim(line)), {}}))
            events.push_back(*ev);
    }
    return events;
}

/// Last time the listener heard from the server; shared by the listener and the heartbeat monitor
class heartbeat_clock
{
public:
    using clock = std::chrono::steady_clock;

    void touch()
    {
        std::lock_guard<std::mutex> guard(mutex_);
        last_ = clock::now();
    }

    [[nodiscard]] clock::duration elapsed() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return clock::now() - last_;
    }

private:
    mutable std::mutex mutex_;
    clock::time_point last_{clock::now()};
};

struct idle_stats
{
    bool active = false;
    std::optional<std::string> monitored_folder;
    std::size_t callback_count = 0;
    std::uint64_t restarts = 0;
    std::uint64_t notifications = 0;
};

/**
Push notification monitor on a dedicated connection.

`start(folder)` connects if needed, selects the folder, issues IDLE and runs
a listener and a heartbeat monitor side by side. Connection loss or a silent
server past `idle_timeout` triggers one stop-then-restart cycle; a failed
restart reaches the callbacks as an `idle_error` event and is not retried.

Callbacks run on the service executor in registration order. `stop()` must
complete before the service is destroyed.
**/
class idle_service
{
public:
    using callback_type = std::function<void(const idle_event&)>;

    idle_service(any_io_executor executor, account_config config, idle_config cfg = {}, options opts = {})
        : executor_(executor),
          config_(cfg),
          client_(std::make_unique<client>(executor, std::move(config), std::move(opts))),
          lifecycle_(executor),
          monitor_done_(executor, 1),
          heartbeat_(std::make_shared<heartbeat_clock>())
    {
    }

    idle_service(const idle_service&) = delete;
    idle_service& operator=(const idle_service&) = delete;

    ~idle_service()
    {
        *alive_ = false;
        if (monitor_running_ && monitor_signal_)
        {
            MAILSYNC_WARN("IDLE service destroyed while monitoring; call stop() first");
            monitor_signal_->emit(mailsync::asio::cancellation_type::terminal);
        }
    }

    void add_callback(callback_type cb)
    {
        callbacks_.push_back(std::move(cb));
    }

    /// Begin monitoring `folder`; one folder per service, a second start is `imap_invalid_state`
    awaitable<result_void> start(std::string folder)
    {
        mailsync::detail::async_mutex::scoped_lock guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await lifecycle_.lock());
        if (active_)
            co_return fail(errc::imap_invalid_state, std::format("IDLE already active on {}", *folder_));
        wanted_ = true;
        co_return co_await start_impl(std::move(folder));
    }

    /// Leave IDLE with DONE and stop both loops; a no-op when not monitoring
    awaitable<result_void> stop()
    {
        mailsync::detail::async_mutex::scoped_lock guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await lifecycle_.lock());
        wanted_ = false;
        auto res = co_await stop_impl();
        folder_.reset();
        co_return res;
    }

    /// Stop-then-restart on the same folder
    awaitable<result_void> refresh()
    {
        mailsync::detail::async_mutex::scoped_lock guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await lifecycle_.lock());
        if (!active_)
            co_return ok();
        co_return co_await restart_impl();
    }

    [[nodiscard]] bool is_active() const noexcept { return active_; }
    [[nodiscard]] std::optional<std::string> monitored_folder() const { return folder_; }

    [[nodiscard]] idle_stats stats() const
    {
        return idle_stats{active_, folder_, callbacks_.size(), restarts_, notifications_};
    }

    /// The dedicated client; tests and diagnostics only
    [[nodiscard]] client& connection_client() noexcept { return *client_; }

private:
    enum class monitor_exit
    {
        cancelled,
        connection_lost,
        heartbeat_timeout
    };

    awaitable<result_void> start_impl(std::string folder)
    {
        if (!client_->is_connected())
            MAILSYNC_TRY_CO_AWAIT(client_->connect());
        if (!client_->is_authenticated())
            MAILSYNC_TRY_CO_AWAIT(client_->authenticate());
        MAILSYNC_TRY_CO_AWAIT(client_->select(folder));

        client::idle_session session;
        MAILSYNC_CO_TRY_ASSIGN(session, co_await client_->idle_start());
        session_.emplace(std::move(session));
        folder_ = std::move(folder);
        active_ = true;
        heartbeat_->touch();
        spawn_monitor();
        MAILSYNC_INFO(std::format("IDLE started on {}", *folder_));
        co_return ok();
    }

    awaitable<result_void> stop_impl()
    {
        if (monitor_running_)
        {
            monitor_running_ = false;
            monitor_signal_->emit(mailsync::asio::cancellation_type::terminal);
            auto [ec] = co_await monitor_done_.async_receive(mailsync::asio::use_nothrow_awaitable);
            if (ec)
                MAILSYNC_DEBUG(std::format("IDLE monitor completion: {}", ec.message()));
        }
        active_ = false;
        if (!session_)
            co_return ok();

        client::idle_session session = std::move(*session_);
        session_.reset();
        auto res = co_await session.stop();
        if (!res)
        {
            MAILSYNC_WARN(std::format("IDLE DONE failed: {}", res.error().to_string()));
            if (res.error().is_connection_error())
                MAILSYNC_TRY_CO_AWAIT(client_->disconnect());
            co_return fail(std::move(res).error());
        }
        MAILSYNC_INFO("IDLE stopped");
        co_return ok();
    }

    awaitable<result_void> restart_impl()
    {
        if (!wanted_)
            co_return ok();
        if (!folder_)
            co_return fail(errc::imap_invalid_state, "no folder to restart IDLE on");
        std::string folder = *folder_;

        if (auto res = co_await stop_impl(); !res)
            MAILSYNC_DEBUG(std::format("IDLE restart continues after stop failure: {}", res.error().to_string()));

        mailsync::asio::steady_timer pause(executor_);
        pause.expires_after(config_.restart_pause);
        auto [ec] = co_await pause.async_wait(mailsync::asio::use_nothrow_awaitable);
        (void)ec;
        if (!wanted_)
            co_return ok();

        ++restarts_;
        auto res = co_await start_impl(folder);
        if (!res)
        {
            MAILSYNC_ERROR(std::format("IDLE restart on {} failed: {}", folder, res.error().to_string()));
            folder_.reset();
            dispatch(idle_event::failure(res.error()));
        }
        co_return res;
    }

    void spawn_monitor()
    {
        monitor_signal_ = std::make_unique<mailsync::asio::cancellation_signal>();
        monitor_running_ = true;
        mailsync::asio::co_spawn(executor_, run_monitor(heartbeat_),
            mailsync::asio::bind_cancellation_slot(monitor_signal_->slot(),
                [this, alive = alive_](std::exception_ptr ep, monitor_exit reason)
                {
                    if (!*alive)
                        return;
                    on_monitor_exit(ep, reason);
                }));
    }

    void on_monitor_exit(std::exception_ptr ep, monitor_exit reason)
    {
        if (ep)
        {
            try
            {
                std::rethrow_exception(ep);
            }
            catch (const std::exception& exc)
            {
                MAILSYNC_ERROR(std::format("IDLE monitor failed: {}", exc.what()));
                dispatch(idle_event::failure(error_info{errc::net_io_failed, exc.what(), {}, {}, {}}));
            }
            reason = monitor_exit::connection_lost;
        }

        if (!monitor_done_.try_send(mailsync::asio::error_code{}))
            MAILSYNC_WARN("IDLE monitor completion dropped");

        if (reason == monitor_exit::cancelled || !wanted_)
            return;

        mailsync::asio::co_spawn(executor_, auto_restart(),
            [alive = alive_](std::exception_ptr restart_ep)
            {
                if (!restart_ep || !*alive)
                    return;
                try
                {
                    std::rethrow_exception(restart_ep);
                }
                catch (const std::exception& exc)
                {
                    MAILSYNC_ERROR(std::format("IDLE restart aborted: {}", exc.what()));
                }
            });
    }

    awaitable<void> auto_restart()
    {
        auto guard = co_await lifecycle_.lock();
        if (!guard)
        {
            MAILSYNC_WARN(std::format("IDLE restart skipped: {}", guard.error().to_string()));
            co_return;
        }
        if (auto res = co_await restart_impl(); !res)
            MAILSYNC_DEBUG("IDLE restart reported to callbacks");
    }

    awaitable<monitor_exit> run_monitor(std::shared_ptr<heartbeat_clock> clock)
    {
        using namespace mailsync::asio::operators;
        co_await mailsync::asio::this_coro::throw_if_cancelled(false);
        auto outcome = co_await (listen(clock) || watch_heartbeat(clock));
        co_return std::visit([](monitor_exit exit) { return exit; }, outcome);
    }

    awaitable<monitor_exit> listen(std::shared_ptr<heartbeat_clock> clock)
    {
        co_await mailsync::asio::this_coro::throw_if_cancelled(false);
        while (true)
        {
            auto line = co_await session_->read(config_.read_timeout);
            if (!line)
            {
                if (line.error().code == errc::net_timeout)
                    continue;
                if (line.error().code == errc::net_cancelled)
                    co_return monitor_exit::cancelled;
                MAILSYNC_WARN(std::format("IDLE listener lost the connection: {}", line.error().to_string()));
                dispatch(idle_event::connection_lost());
                co_return monitor_exit::connection_lost;
            }

            clock->touch();
            if (detail::starts_with_ci(line->text, "* BYE") || client::idle_session::is_completion(*line, session_->tag()))
            {
                MAILSYNC_WARN(std::format("IDLE ended by server: {}", line->text));
                dispatch(idle_event::connection_lost());
                co_return monitor_exit::connection_lost;
            }
            if (auto ev = parse_idle_line(*line))
                dispatch(*ev);
        }
    }

    awaitable<monitor_exit> watch_heartbeat(std::shared_ptr<heartbeat_clock> clock)
    {
        co_await mailsync::asio::this_coro::throw_if_cancelled(false);
        mailsync::asio::steady_timer timer(executor_);
        while (true)
        {
            timer.expires_after(config_.heartbeat_interval);
            auto [ec] = co_await timer.async_wait(mailsync::asio::use_nothrow_awaitable);
            if (ec)
                co_return monitor_exit::cancelled;

            const auto elapsed = clock->elapsed();
            if (elapsed > config_.idle_timeout)
            {
                MAILSYNC_WARN(std::format("IDLE heartbeat silent for {} ms",
                    std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()));
                dispatch(idle_event::timeout());
                co_return monitor_exit::heartbeat_timeout;
            }
        }
    }

    void dispatch(const idle_event& ev)
    {
        ++notifications_;
        MAILSYNC_DEBUG(std::format("IDLE event {} {}", to_string(ev.type), ev.number));
        for (const auto& cb : callbacks_)
            cb(ev);
    }

    any_io_executor executor_;
    idle_config config_;
    std::unique_ptr<client> client_;
    mailsync::detail::async_mutex lifecycle_;
    mailsync::asio::channel<void(mailsync::asio::error_code)> monitor_done_;
    std::unique_ptr<mailsync::asio::cancellation_signal> monitor_signal_;
    std::shared_ptr<heartbeat_clock> heartbeat_;
    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
    std::vector<callback_type> callbacks_;
    std::optional<client::idle_session> session_;
    std::optional<std::string> folder_;
    bool active_{false};
    bool wanted_{false};
    bool monitor_running_{false};
    std::uint64_t restarts_{0};
    std::uint64_t notifications_{0};
};

} // namespace mailsync::imap
