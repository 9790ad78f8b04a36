/*

sync/sync_engine.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <mailsync/accounts/account.hpp>
#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/async_mutex.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/client.hpp>
#include <mailsync/imap/codec.hpp>
#include <mailsync/imap/search.hpp>
#include <mailsync/sync/storage.hpp>
#include <mailsync/sync/types.hpp>

namespace mailsync::sync
{

using mailsync::asio::awaitable;

/**
Reconciles the store with the server, one folder at a time.

Work on one (account, folder) pair is serialised by a coroutine mutex keyed on
the pair. A second mutex, keyed on the client, holds the selected mailbox from
SELECT to the last FETCH, so folders sharing one session take turns while
folders on different sessions sync concurrently. `Client` is `imap::client` or
anything exposing the same select, uid_search, uid_fetch, list and
has_capability operations.
**/
template<typename Client>
class basic_sync_engine
{
public:
    using client_type = Client;
    using progress_callback = std::function<void(const sync_progress&)>;

    explicit basic_sync_engine(std::shared_ptr<storage> store, sync_config config = {})
        : store_(std::move(store)),
          config_(std::move(config))
    {
    }

    basic_sync_engine(const basic_sync_engine&) = delete;
    basic_sync_engine& operator=(const basic_sync_engine&) = delete;

    [[nodiscard]] const sync_config& config() const noexcept { return config_; }
    [[nodiscard]] storage& store() noexcept { return *store_; }

    void set_conflict_policy(conflict_policy policy)
    {
        std::lock_guard lock(state_mutex_);
        config_.conflicts = policy;
    }

    /// Every progress change, in order, to every subscriber
    void on_progress(progress_callback callback)
    {
        std::lock_guard lock(state_mutex_);
        callbacks_.push_back(std::move(callback));
    }

    /**
    Sync one folder.

    A UID-validity different from the checkpoint, or no checkpoint at all,
    turns any strategy into a full sync. The checkpoint is written back on
    success and on failure.
    **/
    awaitable<result<folder_sync_report>> sync_folder(Client& client, std::string account_id,
        std::string folder, sync_strategy strategy)
    {
        folder_slot slot;
        MAILSYNC_CO_TRY_ASSIGN(slot, co_await acquire_folder(account_id, folder));

        run_context ctx;
        ctx.key = make_key(account_id, folder);
        ctx.progress.account_id = account_id;
        ctx.progress.folder = folder;
        ctx.progress.started_at = std::chrono::system_clock::now();
        begin_run(ctx);

        MAILSYNC_INFO(std::format("sync {}:{} started ({})", account_id, folder, to_string(strategy)));

        folder_sync_state state;
        if (auto stored = store_->get_folder_sync_state(account_id, folder); !stored)
        {
            co_return finish_failed(ctx, state, std::move(stored).error(), false);
        }
        else if (*stored)
        {
            state = std::move(**stored);
            ctx.previous = state;
        }
        else
        {
            state.account_id = account_id;
            state.folder = folder;
        }

        auto outcome = co_await run_folder(client, ctx, state, strategy);
        if (!outcome)
            co_return finish_failed(ctx, state, std::move(outcome).error(), true);
        if (is_cancelled(ctx))
            co_return finish_failed(ctx, state, cancelled_error(ctx), true);

        state.status = sync_status::complete;
        state.error_message.clear();
        state.last_sync = std::chrono::system_clock::now();
        if (auto res = store_->update_folder_sync_state(state); !res)
            co_return finish_failed(ctx, state, std::move(res).error(), false);

        ctx.progress.phase = sync_phase::complete;
        ctx.progress.messages_processed = ctx.progress.total_messages;
        ctx.progress.estimated_completion.reset();
        publish(ctx);
        end_run(ctx);

        MAILSYNC_INFO(std::format("sync {}:{} complete, {} messages", account_id, folder,
            outcome->messages_processed));
        co_return outcome;
    }

    /**
    Sync every selectable folder of an account.

    Priority folders go first, excluded folders are skipped. A failing folder
    is recorded and the next one is attempted.
    **/
    awaitable<result<account_sync_report>> sync_account(Client& client, std::string account_id,
        sync_strategy strategy, accounts::sync_settings settings = {})
    {
        std::vector<imap::folder> folders;
        MAILSYNC_CO_TRY_ASSIGN(folders, co_await client.list("", "*"));
        MAILSYNC_INFO(std::format("account {}: {} folders listed", account_id, folders.size()));

        account_sync_report report;
        report.account_id = account_id;
        for (const auto& name : ordered_folders(folders, settings))
        {
            auto res = co_await sync_folder(client, account_id, name, strategy);
            if (res)
            {
                report.synced.push_back(std::move(*res));
            }
            else
            {
                MAILSYNC_ERROR(std::format("sync {}:{} failed: {}", account_id, name, res.error().to_string()));
                report.failed.emplace_back(name, std::move(res).error());
            }
        }
        co_return report;
    }

    /// Headers-only pass over the whole folder; returns the message count
    awaitable<result<std::uint32_t>> refresh_folder(Client& client, std::string account_id, std::string folder)
    {
        folder_slot slot;
        MAILSYNC_CO_TRY_ASSIGN(slot, co_await acquire_folder(account_id, folder));

        run_context ctx;
        ctx.key = make_key(account_id, folder);
        ctx.progress.account_id = account_id;
        ctx.progress.folder = folder;
        ctx.progress.started_at = std::chrono::system_clock::now();
        begin_run(ctx);

        auto outcome = co_await refresh_impl(client, ctx);
        if (outcome && is_cancelled(ctx))
            outcome = fail<std::uint32_t>(cancelled_error(ctx));
        if (!outcome)
        {
            fail_progress(ctx, outcome.error());
            end_run(ctx);
            co_return outcome;
        }

        ctx.progress.phase = sync_phase::complete;
        ctx.progress.messages_processed = ctx.progress.total_messages;
        publish(ctx);
        end_run(ctx);
        co_return outcome;
    }

    [[nodiscard]] std::optional<sync_progress> get_progress(std::string_view account_id, std::string_view folder) const
    {
        std::lock_guard lock(state_mutex_);
        auto it = progress_.find(make_key(account_id, folder));
        if (it == progress_.end())
            return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::vector<sync_progress> all_progress() const
    {
        std::lock_guard lock(state_mutex_);
        std::vector<sync_progress> out;
        out.reserve(progress_.size());
        for (const auto& [key, p] : progress_)
            out.push_back(p);
        return out;
    }

    /**
    Ask the running sync of a folder to stop.

    Subscribers see `error("Cancelled by user")` at once and nothing after it;
    the sync itself ends with `sync_cancelled` at its next batch boundary, or
    as soon as it would otherwise complete.
    **/
    result_void cancel_sync(std::string_view account_id, std::string_view folder)
    {
        sync_progress snapshot;
        std::vector<progress_callback> callbacks;
        {
            std::lock_guard lock(state_mutex_);
            const std::string key = make_key(account_id, folder);
            auto it = progress_.find(key);
            if (it == progress_.end() || it->second.finished() || !running_.contains(key))
                return fail(errc::not_found, std::format("no sync running for {}:{}", account_id, folder));
            cancelled_.insert(key);
            it->second.phase = sync_phase::error;
            it->second.error_message = CANCELLED_MESSAGE;
            snapshot = it->second;
            callbacks = callbacks_;
        }
        MAILSYNC_WARN(std::format("sync cancellation requested for {}:{}", account_id, folder));
        for (const auto& cb : callbacks)
            cb(snapshot);
        return ok();
    }

    /// Highest number of coroutines ever seen inside the same folder lock
    [[nodiscard]] std::size_t peak_folder_concurrency() const
    {
        std::lock_guard lock(state_mutex_);
        return peak_holders_;
    }

    static constexpr std::string_view CANCELLED_MESSAGE = "Cancelled by user";

private:
    struct run_context
    {
        std::string key;
        sync_progress progress;
        std::optional<folder_sync_state> previous;
    };

    /// Folder lock plus the holder count it feeds
    class folder_slot
    {
    public:
        folder_slot() = default;
        folder_slot(const folder_slot&) = delete;
        folder_slot& operator=(const folder_slot&) = delete;

        folder_slot(folder_slot&& other) noexcept
            : engine_(std::exchange(other.engine_, nullptr)),
              key_(std::move(other.key_)),
              lock_(std::move(other.lock_))
        {
        }

        folder_slot& operator=(folder_slot&& other) noexcept
        {
            if (this != &other)
            {
                release();
                engine_ = std::exchange(other.engine_, nullptr);
                key_ = std::move(other.key_);
                lock_ = std::move(other.lock_);
            }
            return *this;
        }

        ~folder_slot()
        {
            release();
        }

    private:
        friend class basic_sync_engine;

        folder_slot(basic_sync_engine* engine, std::string key, mailsync::detail::async_mutex::scoped_lock lock)
            : engine_(engine),
              key_(std::move(key)),
              lock_(std::move(lock))
        {
        }

        void release() noexcept
        {
            if (engine_ != nullptr)
            {
                engine_->leave_folder(key_);
                engine_ = nullptr;
            }
            lock_.unlock();
        }

        basic_sync_engine* engine_{nullptr};
        std::string key_;
        mailsync::detail::async_mutex::scoped_lock lock_;
    };

    /// Exclusive use of one client's selected mailbox
    class session_slot
    {
    public:
        session_slot() = default;
        session_slot(const session_slot&) = delete;
        session_slot& operator=(const session_slot&) = delete;

        session_slot(session_slot&& other) noexcept
            : engine_(std::exchange(other.engine_, nullptr)),
              client_(std::exchange(other.client_, nullptr)),
              mutex_(std::move(other.mutex_)),
              lock_(std::move(other.lock_))
        {
        }

        session_slot& operator=(session_slot&& other) noexcept
        {
            if (this != &other)
            {
                release();
                engine_ = std::exchange(other.engine_, nullptr);
                client_ = std::exchange(other.client_, nullptr);
                mutex_ = std::move(other.mutex_);
                lock_ = std::move(other.lock_);
            }
            return *this;
        }

        ~session_slot()
        {
            release();
        }

    private:
        friend class basic_sync_engine;

        session_slot(basic_sync_engine* engine, const Client* client,
            std::shared_ptr<mailsync::detail::async_mutex> mutex, mailsync::detail::async_mutex::scoped_lock lock)
            : engine_(engine),
              client_(client),
              mutex_(std::move(mutex)),
              lock_(std::move(lock))
        {
        }

        void release() noexcept
        {
            lock_.unlock();
            mutex_.reset();
            if (engine_ != nullptr)
            {
                engine_->forget_session(client_);
                engine_ = nullptr;
            }
        }

        basic_sync_engine* engine_{nullptr};
        const Client* client_{nullptr};
        std::shared_ptr<mailsync::detail::async_mutex> mutex_;
        mailsync::detail::async_mutex::scoped_lock lock_;
    };

    static std::string make_key(std::string_view account_id, std::string_view folder)
    {
        return std::format("{}:{}", account_id, folder);
    }

    awaitable<result<folder_slot>> acquire_folder(std::string_view account_id, std::string_view folder)
    {
        const std::string key = make_key(account_id, folder);
        std::shared_ptr<mailsync::detail::async_mutex> mutex;
        {
            auto executor = co_await mailsync::asio::this_coro::executor;
            std::lock_guard lock(state_mutex_);
            auto& slot = folder_locks_[key];
            if (!slot)
                slot = std::make_shared<mailsync::detail::async_mutex>(executor);
            mutex = slot;
        }

        mailsync::detail::async_mutex::scoped_lock guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex->lock());

        {
            std::lock_guard lock(state_mutex_);
            const std::size_t holders = ++holders_[key];
            peak_holders_ = std::max(peak_holders_, holders);
        }
        co_return folder_slot(this, key, std::move(guard));
    }

    awaitable<result<session_slot>> acquire_session(const Client& client)
    {
        std::shared_ptr<mailsync::detail::async_mutex> mutex;
        {
            auto executor = co_await mailsync::asio::this_coro::executor;
            std::lock_guard lock(state_mutex_);
            auto& slot = session_locks_[&client];
            if (!slot)
                slot = std::make_shared<mailsync::detail::async_mutex>(executor);
            mutex = slot;
        }

        mailsync::detail::async_mutex::scoped_lock guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex->lock());
        co_return session_slot(this, &client, std::move(mutex), std::move(guard));
    }

    /// The map entry goes once nobody holds or waits for the session
    void forget_session(const Client* client) noexcept
    {
        std::lock_guard lock(state_mutex_);
        auto it = session_locks_.find(client);
        if (it != session_locks_.end() && it->second.use_count() == 1 && !it->second->is_locked())
            session_locks_.erase(it);
    }

    void leave_folder(const std::string& key) noexcept
    {
        std::lock_guard lock(state_mutex_);
        auto it = holders_.find(key);
        if (it != holders_.end() && --it->second == 0)
            holders_.erase(it);
    }

    void begin_run(run_context& ctx)
    {
        {
            std::lock_guard lock(state_mutex_);
            cancelled_.erase(ctx.key);
            running_.insert(ctx.key);
        }
        publish(ctx);
    }

    void end_run(const run_context& ctx)
    {
        std::lock_guard lock(state_mutex_);
        running_.erase(ctx.key);
        cancelled_.erase(ctx.key);
    }

    [[nodiscard]] bool is_cancelled(const run_context& ctx) const
    {
        std::lock_guard lock(state_mutex_);
        return cancelled_.contains(ctx.key);
    }

    /// A cancelled run already published its final `error`; nothing follows it
    void publish(run_context& ctx)
    {
        std::vector<progress_callback> callbacks;
        {
            std::lock_guard lock(state_mutex_);
            if (cancelled_.contains(ctx.key))
                return;
            progress_[ctx.key] = ctx.progress;
            callbacks = callbacks_;
        }
        for (const auto& cb : callbacks)
            cb(ctx.progress);
    }

    void set_phase(run_context& ctx, sync_phase phase)
    {
        if (ctx.progress.phase == phase)
            return;
        ctx.progress.phase = phase;
        publish(ctx);
    }

    static error_info cancelled_error(const run_context& ctx)
    {
        return fail(errc::sync_cancelled, std::string(CANCELLED_MESSAGE), ctx.key).error();
    }

    void fail_progress(run_context& ctx, const error_info& err)
    {
        ctx.progress.phase = sync_phase::error;
        ctx.progress.error_message = err.code == errc::sync_cancelled ? std::string(CANCELLED_MESSAGE) : err.message;
        ctx.progress.estimated_completion.reset();
        publish(ctx);
    }

    /// Error path: checkpoint status `error`, progress `error`, the original error returned
    result<folder_sync_report> finish_failed(run_context& ctx, folder_sync_state& state, error_info err,
        bool write_checkpoint)
    {
        MAILSYNC_ERROR(std::format("sync {} failed: {}", ctx.key, err.to_string()));
        if (write_checkpoint)
        {
            state.status = sync_status::error;
            state.error_message = err.message;
            state.last_sync = std::chrono::system_clock::now();
            if (auto res = store_->update_folder_sync_state(state); !res)
                MAILSYNC_ERROR(std::format("checkpoint for {} not written: {}", ctx.key, res.error().to_string()));
        }
        fail_progress(ctx, err);
        end_run(ctx);
        return fail<folder_sync_report>(std::move(err));
    }

    awaitable<result<folder_sync_report>> run_folder(Client& client, run_context& ctx,
        folder_sync_state& state, const sync_strategy& requested)
    {
        session_slot session;
        MAILSYNC_CO_TRY_ASSIGN(session, co_await acquire_session(client));

        imap::mailbox_status status;
        MAILSYNC_CO_TRY_ASSIGN(status, co_await client.select(ctx.progress.folder));
        ctx.progress.total_messages = status.exists;

        folder_sync_report report;
        report.folder = ctx.progress.folder;

        const bool no_epoch = status.uid_validity == 0 || !ctx.previous;
        const bool epoch_changed = ctx.previous && ctx.previous->uid_validity != status.uid_validity;
        report.forced_full = (no_epoch || epoch_changed) && !std::holds_alternative<full_sync>(requested);
        if (epoch_changed)
        {
            MAILSYNC_WARN(std::format("UID validity of {} changed {} -> {}, forcing full sync", ctx.key,
                ctx.previous->uid_validity, status.uid_validity));
            state.uid_next = 1;
            state.highest_modseq.reset();
        }

        const sync_strategy effective = (no_epoch || epoch_changed) ? sync_strategy{full_sync{}} : requested;
        report.strategy = to_string(effective);

        state.uid_validity = status.uid_validity;
        state.status = sync_status::syncing;
        MAILSYNC_CO_TRY_VOID(store_->update_folder_sync_state(state));

        if (std::holds_alternative<full_sync>(effective))
        {
            MAILSYNC_TRY_CO_AWAIT(sync_everything(client, ctx, state, status, report, true));
        }
        else if (std::holds_alternative<headers_only_sync>(effective))
        {
            MAILSYNC_TRY_CO_AWAIT(sync_everything(client, ctx, state, status, report, false));
        }
        else if (std::holds_alternative<incremental_sync>(effective))
        {
            MAILSYNC_TRY_CO_AWAIT(sync_incremental(client, ctx, state, status, report));
        }
        else
        {
            MAILSYNC_TRY_CO_AWAIT(sync_recent(client, ctx, state, std::get<recent_sync>(effective).days, report));
        }

        state.uid_next = std::max(state.uid_next, status.uid_next);
        if (status.highest_modseq)
            state.highest_modseq = status.highest_modseq;
        co_return report;
    }

    /// Full and headers-only: enumerate every UID, fetch in batches
    awaitable<result_void> sync_everything(Client& client, run_context& ctx, folder_sync_state& state,
        const imap::mailbox_status& status, folder_sync_report& report, bool with_body)
    {
        set_phase(ctx, sync_phase::fetching_headers);
        if (status.exists == 0)
        {
            state.message_count = 0;
            state.unread_count = 0;
            co_return ok();
        }

        imap::search_result found;
        MAILSYNC_CO_TRY_ASSIGN(found, co_await client.uid_search(imap::search_criteria::all()));
        MAILSYNC_DEBUG(std::format("{}: {} messages on server", ctx.key, found.ids.size()));

        ctx.progress.total_messages = static_cast<std::uint32_t>(found.ids.size());
        publish(ctx);

        std::uint32_t unread = 0;
        MAILSYNC_TRY_CO_AWAIT(process_batches(client, ctx, found.ids,
            with_body ? config_.batch_size : config_.headers_batch_size, with_body, false, report, &unread));

        state.message_count = static_cast<std::uint32_t>(found.ids.size());
        state.unread_count = unread;
        co_return ok();
    }

    /**
    Changes since the checkpoint.

    With CONDSTORE and a stored HIGHESTMODSEQ, `UID SEARCH MODSEQ` returns the
    changed messages; otherwise new mail is found by a UID range starting at
    the stored UIDNEXT.
    **/
    awaitable<result_void> sync_incremental(Client& client, run_context& ctx, folder_sync_state& state,
        const imap::mailbox_status& status, folder_sync_report& report)
    {
        set_phase(ctx, sync_phase::checking_folders);

        std::vector<std::uint32_t> changed;
        if (client.has_capability(imap::capability::condstore) && state.highest_modseq)
        {
            if (status.highest_modseq && *status.highest_modseq <= *state.highest_modseq)
            {
                MAILSYNC_DEBUG(std::format("{}: nothing changed since modseq {}", ctx.key, *state.highest_modseq));
            }
            else
            {
                imap::search_result found;
                MAILSYNC_CO_TRY_ASSIGN(found, co_await client.uid_search(
                    imap::search_criteria::modseq(*state.highest_modseq + 1)));
                changed = std::move(found.ids);
            }
        }
        else
        {
            const std::uint32_t first = std::max<std::uint32_t>(state.uid_next, 1);
            if (status.uid_next == 0 || status.uid_next > first)
            {
                imap::search_result found;
                MAILSYNC_CO_TRY_ASSIGN(found, co_await client.uid_search(
                    imap::search_criteria::uid(std::format("{}:*", first))));
                // n:* always matches the highest UID, even below n
                for (auto uid : found.ids)
                {
                    if (uid >= first)
                        changed.push_back(uid);
                }
            }
        }

        ctx.progress.total_messages = static_cast<std::uint32_t>(changed.size());
        publish(ctx);
        if (!changed.empty())
        {
            MAILSYNC_INFO(std::format("{}: {} changed messages", ctx.key, changed.size()));
            MAILSYNC_TRY_CO_AWAIT(process_batches(client, ctx, changed, config_.batch_size, true, true, report, nullptr));
        }

        state.message_count = status.exists;
        co_return ok();
    }

    awaitable<result_void> sync_recent(Client& client, run_context& ctx, folder_sync_state& state,
        std::uint32_t days, folder_sync_report& report)
    {
        set_phase(ctx, sync_phase::fetching_headers);

        const auto cutoff = imap::days_before(std::chrono::system_clock::now(), days);
        imap::search_result found;
        MAILSYNC_CO_TRY_ASSIGN(found, co_await client.uid_search(imap::search_criteria::since(cutoff)));

        ctx.progress.total_messages = static_cast<std::uint32_t>(found.ids.size());
        publish(ctx);
        if (!found.ids.empty())
        {
            MAILSYNC_INFO(std::format("{}: {} messages in the last {} days", ctx.key, found.ids.size(), days));
            MAILSYNC_TRY_CO_AWAIT(process_batches(client, ctx, found.ids, config_.batch_size, true, false, report, nullptr));
        }

        state.message_count = static_cast<std::uint32_t>(found.ids.size());
        co_return ok();
    }

    awaitable<result<std::uint32_t>> refresh_impl(Client& client, run_context& ctx)
    {
        session_slot session;
        MAILSYNC_CO_TRY_ASSIGN(session, co_await acquire_session(client));

        imap::mailbox_status status;
        MAILSYNC_CO_TRY_ASSIGN(status, co_await client.select(ctx.progress.folder));
        ctx.progress.total_messages = status.exists;
        set_phase(ctx, sync_phase::fetching_headers);
        if (status.exists == 0)
            co_return std::uint32_t{0};

        imap::search_result found;
        MAILSYNC_CO_TRY_ASSIGN(found, co_await client.uid_search(imap::search_criteria::all()));
        ctx.progress.total_messages = static_cast<std::uint32_t>(found.ids.size());
        publish(ctx);

        folder_sync_report report;
        MAILSYNC_TRY_CO_AWAIT(process_batches(client, ctx, found.ids, config_.headers_batch_size, false, false,
            report, nullptr));
        co_return static_cast<std::uint32_t>(found.ids.size());
    }

    /**
    Fetch `uids` in chunks and hand every message to the store.

    Cancellation is honoured between chunks. A message that cannot be
    converted is skipped; store and protocol failures end the sync.
    **/
    awaitable<result_void> process_batches(Client& client, run_context& ctx, const std::vector<std::uint32_t>& uids,
        std::size_t batch_size, bool with_body, bool resolve_conflicts, folder_sync_report& report,
        std::uint32_t* unread)
    {
        if (batch_size == 0)
            batch_size = 1;

        const auto items = imap::sync_fetch_items(with_body);
        for (std::size_t begin = 0; begin < uids.size(); begin += batch_size)
        {
            if (is_cancelled(ctx))
                co_return fail(errc::sync_cancelled, std::string(CANCELLED_MESSAGE), ctx.key);

            if (begin > 0 && config_.batch_pause.count() > 0)
            {
                mailsync::asio::steady_timer pause(co_await mailsync::asio::this_coro::executor);
                pause.expires_after(config_.batch_pause);
                auto [ec] = co_await pause.async_wait(mailsync::asio::use_nothrow_awaitable);
                if (ec)
                    co_return fail(errc::net_cancelled, "sync pause interrupted", ctx.key, ec);
                if (is_cancelled(ctx))
                    co_return fail(errc::sync_cancelled, std::string(CANCELLED_MESSAGE), ctx.key);
            }

            const std::size_t end = std::min(uids.size(), begin + batch_size);
            const std::vector<std::uint32_t> chunk(uids.begin() + static_cast<std::ptrdiff_t>(begin),
                uids.begin() + static_cast<std::ptrdiff_t>(end));

            set_phase(ctx, with_body ? sync_phase::fetching_bodies : sync_phase::fetching_headers);
            std::vector<imap::fetched_message> messages;
            MAILSYNC_CO_TRY_ASSIGN(messages, co_await client.uid_fetch(imap::format_uid_set(chunk), items));

            set_phase(ctx, sync_phase::processing_changes);
            for (const auto& msg : messages)
            {
                auto converted = to_stored_message(msg, ctx.progress.account_id, ctx.progress.folder);
                if (!converted)
                {
                    MAILSYNC_WARN(std::format("{}: skipping message: {}", ctx.key, converted.error().message));
                    ++report.messages_skipped;
                    continue;
                }

                ctx.progress.bytes_downloaded += msg.body ? msg.body->size() : 0;
                if (unread != nullptr && !converted->is_seen())
                    ++*unread;

                if (resolve_conflicts)
                {
                    std::optional<stored_message> existing;
                    MAILSYNC_CO_TRY_ASSIGN(existing, store_->get_message_by_uid(
                        ctx.progress.account_id, ctx.progress.folder, converted->uid));
                    if (existing)
                    {
                        MAILSYNC_CO_TRY_VOID(resolve_conflict(*existing, std::move(*converted)));
                        ++report.conflicts_resolved;
                        ++report.messages_processed;
                        continue;
                    }
                }

                MAILSYNC_CO_TRY_VOID(store_->store_message(*converted));
                ++report.messages_processed;
            }

            ctx.progress.messages_processed = static_cast<std::uint32_t>(end);
            ctx.progress.update_estimate(std::chrono::system_clock::now());
            publish(ctx);
        }
        co_return ok();
    }

    result_void resolve_conflict(const stored_message& local, stored_message server)
    {
        conflict_policy policy;
        {
            std::lock_guard lock(state_mutex_);
            policy = config_.conflicts;
        }

        switch (policy)
        {
            case conflict_policy::local_wins:
                MAILSYNC_DEBUG(std::format("keeping local copy of UID {}", local.uid));
                return ok();

            case conflict_policy::merge:
            {
                stored_message merged = local;
                for (auto& flag : server.flags)
                {
                    if (!merged.has_flag(flag))
                        merged.flags.push_back(std::move(flag));
                }
                ++merged.sync_version;
                merged.last_synced = std::chrono::system_clock::now();
                return store_->store_message(merged);
            }

            case conflict_policy::ask_user:
                MAILSYNC_WARN(std::format("conflict on UID {}, keeping the server version", local.uid));
                [[fallthrough]];
            case conflict_policy::server_wins:
                server.sync_version = local.sync_version + 1;
                return store_->store_message(server);
        }
        return ok();
    }

    static std::vector<std::string> ordered_folders(const std::vector<imap::folder>& folders,
        const accounts::sync_settings& settings)
    {
        std::vector<std::string> eligible;
        for (const auto& f : folders)
        {
            if (f.is_selectable() && !settings.is_excluded(f.name))
                eligible.push_back(f.name);
        }

        std::vector<std::string> ordered;
        for (const auto& name : settings.priority_folders)
        {
            if (std::find(eligible.begin(), eligible.end(), name) != eligible.end())
                ordered.push_back(name);
        }
        for (const auto& name : eligible)
        {
            if (!settings.is_priority(name))
                ordered.push_back(name);
        }
        return ordered;
    }

    std::shared_ptr<storage> store_;
    sync_config config_;

    mutable std::mutex state_mutex_;
    std::vector<progress_callback> callbacks_;
    std::map<std::string, sync_progress> progress_;
    std::map<std::string, std::shared_ptr<mailsync::detail::async_mutex>> folder_locks_;
    std::map<const Client*, std::shared_ptr<mailsync::detail::async_mutex>> session_locks_;
    std::map<std::string, std::size_t> holders_;
    std::size_t peak_holders_ = 0;
    std::set<std::string> running_;
    std::set<std::string> cancelled_;
};

using sync_engine = basic_sync_engine<imap::client>;

} // namespace mailsync::sync
