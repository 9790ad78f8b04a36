/*

scheduler/sync_task_runner.hpp
------------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <mailsync/accounts/account_manager.hpp>
#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/async_mutex.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/search.hpp>
#include <mailsync/scheduler/background_scheduler.hpp>
#include <mailsync/scheduler/task.hpp>
#include <mailsync/sync/sync_engine.hpp>

namespace mailsync::scheduler
{

/**
Executes background tasks against the account manager and the sync engine.

Tasks of one account share one client and therefore its selected folder, so
they run one at a time per account; different accounts proceed concurrently.
**/
class sync_task_runner
{
public:
    sync_task_runner(std::shared_ptr<accounts::account_manager> manager, std::shared_ptr<sync::sync_engine> engine)
        : manager_(std::move(manager)),
          engine_(std::move(engine))
    {
    }

    sync_task_runner(const sync_task_runner&) = delete;
    sync_task_runner& operator=(const sync_task_runner&) = delete;

    /// Adapter for `background_scheduler`; the runner must outlive the scheduler
    [[nodiscard]] background_scheduler::runner_type as_runner()
    {
        return [this](background_task task) { return run(std::move(task)); };
    }

    awaitable<result<task_output>> run(background_task task)
    {
        mailsync::detail::async_mutex::scoped_lock gate;
        MAILSYNC_CO_TRY_ASSIGN(gate, co_await account_gate(task.account_id));

        if (const auto* t = std::get_if<cache_warm_task>(&task.kind))
            co_return warm_cache(task.account_id, *t);

        accounts::account_manager::client_ptr client;
        MAILSYNC_CO_TRY_ASSIGN(client, co_await manager_->get_client(task.account_id));

        if (const auto* t = std::get_if<account_sync_task>(&task.kind))
            co_return co_await sync_account(*client, task.account_id, *t);
        if (const auto* t = std::get_if<folder_sync_task>(&task.kind))
            co_return co_await sync_folder(*client, task.account_id, *t);
        if (const auto* t = std::get_if<folder_refresh_task>(&task.kind))
            co_return co_await refresh_folder(*client, task.account_id, *t);
        if (const auto* t = std::get_if<search_task>(&task.kind))
            co_return co_await search(*client, *t);
        if (const auto* t = std::get_if<indexing_task>(&task.kind))
            co_return co_await count_folder(*client, *t);
        co_return fail<task_output>(errc::task_failed, std::format("unhandled task kind {}", kind_name(task.kind)));
    }

private:
    awaitable<result<mailsync::detail::async_mutex::scoped_lock>> account_gate(const std::string& account_id)
    {
        std::shared_ptr<mailsync::detail::async_mutex> gate;
        {
            auto executor = co_await mailsync::asio::this_coro::executor;
            std::lock_guard lock(mutex_);
            auto& slot = gates_[account_id];
            if (!slot)
                slot = std::make_shared<mailsync::detail::async_mutex>(executor);
            gate = slot;
        }
        co_return co_await gate->lock();
    }

    awaitable<result<task_output>> sync_account(imap::client& client, const std::string& account_id,
        const account_sync_task& t)
    {
        accounts::sync_settings settings;
        if (auto acct = manager_->get_account(account_id))
            settings = acct->settings;

        sync::account_sync_report report;
        MAILSYNC_CO_TRY_ASSIGN(report, co_await engine_->sync_account(client, account_id, t.strategy, settings));
        if (auto res = manager_->mark_synced(account_id); !res)
            MAILSYNC_WARN(std::format("last sync of {} not recorded: {}", account_id, res.error().to_string()));
        co_return task_output{std::move(report)};
    }

    awaitable<result<task_output>> sync_folder(imap::client& client, const std::string& account_id,
        const folder_sync_task& t)
    {
        sync::folder_sync_report report;
        MAILSYNC_CO_TRY_ASSIGN(report, co_await engine_->sync_folder(client, account_id, t.folder, t.strategy));
        co_return task_output{std::move(report)};
    }

    awaitable<result<task_output>> refresh_folder(imap::client& client, const std::string& account_id,
        const folder_refresh_task& t)
    {
        std::uint32_t count = 0;
        MAILSYNC_CO_TRY_ASSIGN(count, co_await engine_->refresh_folder(client, account_id, t.folder));
        co_return task_output{message_count{count}};
    }

    /// UID SEARCH TEXT over the given folders, or every selectable one
    awaitable<result<task_output>> search(imap::client& client, const search_task& t)
    {
        std::vector<std::string> folders = t.folders;
        if (folders.empty())
        {
            std::vector<imap::folder> listed;
            MAILSYNC_CO_TRY_ASSIGN(listed, co_await client.list("", "*"));
            for (const auto& f : listed)
            {
                if (f.is_selectable())
                    folders.push_back(f.name);
            }
        }

        search_hits hits;
        for (const auto& folder : folders)
        {
            MAILSYNC_TRY_CO_AWAIT(client.examine(folder));
            imap::search_result found;
            MAILSYNC_CO_TRY_ASSIGN(found, co_await client.uid_search(imap::search_criteria::text(t.query)));
            for (auto uid : found.ids)
                hits.matches.push_back(std::format("{}:{}", folder, uid));
        }
        co_return task_output{std::move(hits)};
    }

    awaitable<result<task_output>> count_folder(imap::client& client, const indexing_task& t)
    {
        imap::mailbox_status status;
        MAILSYNC_CO_TRY_ASSIGN(status, co_await client.status(t.folder));
        co_return task_output{message_count{status.exists}};
    }

    /// Look up the newest UIDs of a folder in the store; no network traffic
    result<task_output> warm_cache(const std::string& account_id, const cache_warm_task& t)
    {
        std::optional<sync::folder_sync_state> state;
        MAILSYNC_TRY_ASSIGN(state, engine_->store().get_folder_sync_state(account_id, t.folder));
        if (!state || state->uid_next <= 1)
            return task_output{cache_stats{0}};

        cache_stats stats;
        std::size_t looked_up = 0;
        for (std::uint32_t uid = state->uid_next - 1; uid > 0 && looked_up < t.message_count; --uid, ++looked_up)
        {
            std::optional<sync::stored_message> msg;
            MAILSYNC_TRY_ASSIGN(msg, engine_->store().get_message_by_uid(account_id, t.folder, uid));
            if (msg)
                ++stats.cached;
        }
        return task_output{stats};
    }

    std::shared_ptr<accounts::account_manager> manager_;
    std::shared_ptr<sync::sync_engine> engine_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<mailsync::detail::async_mutex>> gates_;
};

} // namespace mailsync::scheduler
