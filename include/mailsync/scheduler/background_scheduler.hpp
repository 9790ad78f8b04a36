/*

scheduler/background_scheduler.hpp
----------------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <mailsync/accounts/account.hpp>
#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/scheduler/task.hpp>

namespace mailsync::scheduler
{

using mailsync::asio::awaitable;

struct scheduler_config
{
    std::size_t max_concurrent = 3;
    std::chrono::milliseconds task_timeout{std::chrono::minutes(5)};
    /// Queued tasks beyond this are refused with `queue_full`
    std::size_t max_queue = 100;
    /// Finished results kept for lookup by id, oldest dropped first
    std::size_t result_cache = 50;
    std::chrono::milliseconds tick_interval{100};
    std::size_t completion_capacity = 64;
};

struct scheduler_stats
{
    std::size_t queued = 0;
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t timed_out = 0;
    std::size_t cancelled = 0;
    std::size_t cached_results = 0;
};

/**
Priority queue feeding a capped set of concurrently running tasks.

Each tick starts at most one task, the oldest of the highest priority present,
when fewer than `max_concurrent` are running. A task races its deadline; the
loser is cancelled. Every terminal outcome lands in the result cache and on the
completion channel.

The scheduler must be driven from one thread (its executor, or a strand).
Destroying it stops it; tasks aborted by `stop()` or by the destructor may
still unwind on the executor afterwards, and they never touch the scheduler
once it is gone.
**/
class background_scheduler
{
public:
    using runner_type = std::function<awaitable<result<task_output>>(background_task)>;
    using completion_channel = mailsync::asio::channel<void(mailsync::asio::error_code, task_result)>;

    background_scheduler(mailsync::asio::any_io_executor executor, runner_type runner, scheduler_config config = {})
        : executor_(std::move(executor)),
          runner_(std::move(runner)),
          config_(std::move(config)),
          completions_(executor_, config_.completion_capacity),
          alive_(std::make_shared<bool>(true))
    {
    }

    background_scheduler(const background_scheduler&) = delete;
    background_scheduler& operator=(const background_scheduler&) = delete;

    ~background_scheduler()
    {
        *alive_ = false;
        if (loop_signal_)
            loop_signal_->emit(mailsync::asio::cancellation_type::terminal);
        for (auto& [id, entry] : running_)
            entry.signal->emit(mailsync::asio::cancellation_type::terminal);
    }

    [[nodiscard]] const scheduler_config& config() const noexcept { return config_; }

    /// Terminal results, in completion order; full channel drops new results (they stay in the cache)
    [[nodiscard]] completion_channel& completions() noexcept { return completions_; }

    /// Start the periodic tick
    void start()
    {
        if (loop_signal_)
            return;
        loop_signal_ = std::make_shared<mailsync::asio::cancellation_signal>();
        mailsync::asio::co_spawn(executor_, run_loop(alive_),
            mailsync::asio::bind_cancellation_slot(loop_signal_->slot(),
                [alive = alive_, keep = loop_signal_](std::exception_ptr ep)
                {
                    if (!ep || !*alive)
                        return;
                    try
                    {
                        std::rethrow_exception(ep);
                    }
                    catch (const std::exception& exc)
                    {
                        MAILSYNC_ERROR(std::format("scheduler loop stopped: {}", exc.what()));
                    }
                }));
        MAILSYNC_INFO("scheduler started");
    }

    /// Stop ticking and abort every running task; queued tasks stay queued
    void stop()
    {
        if (loop_signal_)
        {
            loop_signal_->emit(mailsync::asio::cancellation_type::terminal);
            loop_signal_.reset();
        }

        std::vector<task_id> running;
        {
            std::lock_guard lock(mutex_);
            for (const auto& [id, entry] : running_)
                running.push_back(id);
        }
        for (auto id : running)
            cancel_task(id);
        MAILSYNC_INFO("scheduler stopped");
    }

    /// Queue a task; its id is returned and is the only handle to it
    result<task_id> queue_task(background_task task)
    {
        std::lock_guard lock(mutex_);
        if (queued_count() >= config_.max_queue)
            return fail<task_id>(errc::queue_full,
                std::format("task queue is full ({} tasks)", config_.max_queue), task.name);

        task.id = ++last_id_;
        if (task.created_at == std::chrono::steady_clock::time_point{})
            task.created_at = std::chrono::steady_clock::now();
        const task_id id = task.id;
        MAILSYNC_DEBUG(std::format("task {} '{}' queued ({}, {})", id, task.name, to_string(task.priority),
            kind_name(task.kind)));
        queue_[task.priority].push_back(std::move(task));
        return id;
    }

    /**
    Cancel a queued or running task.

    A queued task is removed and never dispatched; a running one is aborted.
    Both publish a `cancelled` result. Finished or unknown ids return false.
    **/
    bool cancel_task(task_id id)
    {
        std::shared_ptr<mailsync::asio::cancellation_signal> signal;
        task_result out;
        {
            std::lock_guard lock(mutex_);
            bool found = false;
            for (auto& [priority, tasks] : queue_)
            {
                auto it = std::find_if(tasks.begin(), tasks.end(), [id](const background_task& t) { return t.id == id; });
                if (it != tasks.end())
                {
                    out = make_result(*it, std::chrono::steady_clock::now(), task_status::cancelled());
                    tasks.erase(it);
                    found = true;
                    break;
                }
            }

            if (!found)
            {
                auto it = running_.find(id);
                if (it == running_.end())
                    return false;
                out = make_result(it->second.task, it->second.started_at, task_status::cancelled());
                signal = it->second.signal;
                running_.erase(it);
            }
            out.completed_at = std::chrono::steady_clock::now();
            record(out);
        }

        if (signal)
            signal->emit(mailsync::asio::cancellation_type::terminal);
        MAILSYNC_INFO(std::format("task {} cancelled", id));
        publish(std::move(out));
        return true;
    }

    /**
    One scheduling step.

    Called by the loop every `tick_interval`; callable directly to drive the
    scheduler without the loop.
    **/
    void tick()
    {
        background_task task;
        std::shared_ptr<mailsync::asio::cancellation_signal> signal;
        std::chrono::steady_clock::time_point started;
        {
            std::lock_guard lock(mutex_);
            if (running_.size() >= config_.max_concurrent)
                return;
            auto next = pop_next();
            if (!next)
                return;
            task = std::move(*next);
            started = std::chrono::steady_clock::now();
            signal = std::make_shared<mailsync::asio::cancellation_signal>();
            running_.emplace(task.id, running_entry{task, signal, started});
        }

        MAILSYNC_DEBUG(std::format("task {} '{}' started", task.id, task.name));
        const task_id id = task.id;
        mailsync::asio::co_spawn(executor_, run_task(task, started, alive_),
            mailsync::asio::bind_cancellation_slot(signal->slot(),
                [this, alive = alive_, signal, id](std::exception_ptr ep)
                {
                    if (!ep || !*alive)
                        return;
                    on_task_exception(id, ep);
                }));
    }

    [[nodiscard]] std::optional<task_status> get_task_status(task_id id) const
    {
        std::lock_guard lock(mutex_);
        if (running_.contains(id))
            return task_status::running();
        if (auto it = results_.find(id); it != results_.end())
            return it->second.status;
        for (const auto& [priority, tasks] : queue_)
        {
            for (const auto& t : tasks)
            {
                if (t.id == id)
                    return task_status::queued();
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<task_result> get_task_result(task_id id) const
    {
        std::lock_guard lock(mutex_);
        auto it = results_.find(id);
        if (it == results_.end())
            return std::nullopt;
        return it->second;
    }

    /// Highest priority first, oldest first within a priority
    [[nodiscard]] std::vector<background_task> queued_tasks() const
    {
        std::lock_guard lock(mutex_);
        std::vector<background_task> out;
        for (const auto& [priority, tasks] : queue_)
            out.insert(out.end(), tasks.begin(), tasks.end());
        std::stable_sort(out.begin(), out.end(), [](const background_task& a, const background_task& b)
        {
            if (a.priority != b.priority)
                return a.priority > b.priority;
            if (a.created_at != b.created_at)
                return a.created_at < b.created_at;
            return a.id < b.id;
        });
        return out;
    }

    [[nodiscard]] std::vector<task_id> running_tasks() const
    {
        std::lock_guard lock(mutex_);
        std::vector<task_id> out;
        for (const auto& [id, entry] : running_)
            out.push_back(id);
        return out;
    }

    [[nodiscard]] scheduler_stats stats() const
    {
        std::lock_guard lock(mutex_);
        scheduler_stats out = counters_;
        out.queued = queued_count();
        out.running = running_.size();
        out.cached_results = results_.size();
        return out;
    }

    /**
    Queue the periodic work of one account.

    One high priority folder sync per priority folder, then a normal priority
    account sync. Stops at the first refusal and returns it.
    **/
    result<std::vector<task_id>> schedule_account_sync(const accounts::account& acct)
    {
        const sync::sync_strategy strategy = acct.settings.use_incremental_sync
            ? sync::sync_strategy{sync::incremental_sync{}}
            : sync::sync_strategy{sync::full_sync{}};

        std::vector<task_id> ids;
        for (const auto& folder : acct.settings.priority_folders)
        {
            background_task task;
            task.name = std::format("sync {} / {}", acct.id, folder);
            task.priority = task_priority::high;
            task.account_id = acct.id;
            task.folder = folder;
            task.kind = folder_sync_task{folder, strategy};
            task_id id = 0;
            MAILSYNC_TRY_ASSIGN(id, queue_task(std::move(task)));
            ids.push_back(id);
        }

        background_task account_task;
        account_task.name = std::format("sync {}", acct.id);
        account_task.priority = task_priority::normal;
        account_task.account_id = acct.id;
        account_task.kind = account_sync_task{strategy};
        task_id id = 0;
        MAILSYNC_TRY_ASSIGN(id, queue_task(std::move(account_task)));
        ids.push_back(id);
        return ids;
    }

private:
    struct running_entry
    {
        background_task task;
        std::shared_ptr<mailsync::asio::cancellation_signal> signal;
        std::chrono::steady_clock::time_point started_at;
    };

    static task_result make_result(const background_task& task, std::chrono::steady_clock::time_point started,
        task_status status)
    {
        task_result out;
        out.id = task.id;
        out.status = std::move(status);
        out.account_id = task.account_id;
        out.kind = task.kind;
        out.started_at = started;
        return out;
    }

    // Caller holds mutex_
    std::size_t queued_count() const
    {
        std::size_t n = 0;
        for (const auto& [priority, tasks] : queue_)
            n += tasks.size();
        return n;
    }

    // Caller holds mutex_
    std::optional<background_task> pop_next()
    {
        for (auto& [priority, tasks] : queue_)
        {
            if (tasks.empty())
                continue;
            background_task next = std::move(tasks.front());
            tasks.pop_front();
            return next;
        }
        return std::nullopt;
    }

    // Caller holds mutex_
    void record(const task_result& out)
    {
        switch (out.status.state)
        {
            case task_state::completed: ++counters_.completed; break;
            case task_state::failed:
                ++counters_.failed;
                if (out.status.reason == TIMEOUT_REASON)
                    ++counters_.timed_out;
                break;
            case task_state::cancelled: ++counters_.cancelled; break;
            case task_state::queued:
            case task_state::running: break;
        }

        if (config_.result_cache == 0)
            return;
        if (results_.insert_or_assign(out.id, out).second)
            result_order_.push_back(out.id);
        while (result_order_.size() > config_.result_cache)
        {
            results_.erase(result_order_.front());
            result_order_.pop_front();
        }
    }

    void publish(task_result out)
    {
        const task_id id = out.id;
        if (!completions_.try_send(mailsync::asio::error_code{}, std::move(out)))
            MAILSYNC_WARN(std::format("completion of task {} not delivered, channel full", id));
    }

    /// Store and announce an outcome unless the task was cancelled meanwhile
    void finish(task_result out)
    {
        {
            std::lock_guard lock(mutex_);
            if (running_.erase(out.id) == 0)
                return;
            out.completed_at = std::chrono::steady_clock::now();
            record(out);
        }
        MAILSYNC_DEBUG(std::format("task {} finished: {}{}", out.id, to_string(out.status.state),
            out.status.reason.empty() ? std::string{} : " (" + out.status.reason + ")"));
        publish(std::move(out));
    }

    void on_task_exception(task_id id, std::exception_ptr ep)
    {
        std::string what = "unknown exception";
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const std::exception& exc)
        {
            what = exc.what();
        }

        task_result out;
        {
            std::lock_guard lock(mutex_);
            auto it = running_.find(id);
            if (it == running_.end())
                return;
            out = make_result(it->second.task, it->second.started_at, task_status::failed(what));
        }
        MAILSYNC_ERROR(std::format("task {} threw: {}", id, what));
        out.error = error_info{errc::task_failed, what, {}, {}, {}};
        finish(std::move(out));
    }

    /// Everything the frame needs after its first suspension is owned by the frame; `alive` gates `this`
    awaitable<void> run_task(background_task task, std::chrono::steady_clock::time_point started,
        std::shared_ptr<bool> alive)
    {
        using namespace mailsync::asio::operators;

        runner_type runner = runner_;
        const auto timeout = config_.task_timeout;
        mailsync::asio::steady_timer deadline(executor_);
        deadline.expires_after(timeout);

        auto outcome = co_await (runner(task) || deadline.async_wait(mailsync::asio::use_nothrow_awaitable));
        if (!*alive)
            co_return;

        task_result out = make_result(task, started, task_status::completed());
        if (outcome.index() == 0)
        {
            auto& res = std::get<0>(outcome);
            if (res)
            {
                out.output = std::move(*res);
            }
            else
            {
                out.status = task_status::failed(res.error().message);
                out.error = std::move(res).error();
            }
        }
        else
        {
            auto [ec] = std::get<1>(outcome);
            if (ec)
            {
                out.status = task_status::cancelled();
            }
            else
            {
                MAILSYNC_WARN(std::format("task {} timed out after {} ms", task.id, timeout.count()));
                out.status = task_status::failed(std::string(TIMEOUT_REASON));
                out.error = error_info{errc::task_timeout, "task execution timed out", task.name, {}, {}};
            }
        }
        finish(std::move(out));
    }

    awaitable<void> run_loop(std::shared_ptr<bool> alive)
    {
        mailsync::asio::steady_timer timer(executor_);
        for (;;)
        {
            tick();
            timer.expires_after(config_.tick_interval);
            auto [ec] = co_await timer.async_wait(mailsync::asio::use_nothrow_awaitable);
            if (ec || !*alive)
                co_return;
        }
    }

    mailsync::asio::any_io_executor executor_;
    runner_type runner_;
    scheduler_config config_;
    completion_channel completions_;
    std::shared_ptr<bool> alive_;
    std::shared_ptr<mailsync::asio::cancellation_signal> loop_signal_;

    mutable std::mutex mutex_;
    std::map<task_priority, std::deque<background_task>, std::greater<>> queue_;
    std::unordered_map<task_id, running_entry> running_;
    std::unordered_map<task_id, task_result> results_;
    std::deque<task_id> result_order_;
    scheduler_stats counters_;
    task_id last_id_ = 0;
};

} // namespace mailsync::scheduler
