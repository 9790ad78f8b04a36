/*

accounts/account_manager.hpp
----------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <format>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <mailsync/accounts/account.hpp>
#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/error_detail.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/detail/timeout.hpp>
#include <mailsync/imap/client.hpp>

namespace mailsync::accounts
{

using mailsync::asio::awaitable;

struct account_manager_config
{
    /// Live clients kept in the pool; the least recently used one is evicted beyond this
    std::size_t max_clients = 10;

    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds auth_timeout{std::chrono::seconds(30)};

    /// Handed to every client the manager creates
    imap::options client_options;
};

struct account_manager_stats
{
    std::size_t total_accounts = 0;
    std::size_t token_accounts = 0;
    std::size_t password_accounts = 0;
    std::size_t pooled_clients = 0;
    std::size_t connected_clients = 0;
    std::size_t max_clients = 0;
    std::optional<std::string> default_account;
};

/**
Registry of accounts plus a bounded pool of shared clients.

All callers asking for the same account get the same `imap::client`; the
client serialises its own commands. The registry and the pool are guarded by
one mutex that is never held across a suspension point.
**/
class account_manager
{
public:
    using client_ptr = std::shared_ptr<imap::client>;

    explicit account_manager(mailsync::asio::any_io_executor executor, account_manager_config config = {})
        : executor_(std::move(executor)),
          config_(std::move(config))
    {
    }

    account_manager(const account_manager&) = delete;
    account_manager& operator=(const account_manager&) = delete;

    [[nodiscard]] const account_manager_config& config() const noexcept { return config_; }

    /// Registers or replaces an account; the first account becomes the default
    result_void add_account(account acct)
    {
        if (acct.id.empty())
            return fail(errc::codec_invalid_input, "account id is empty");

        std::lock_guard lock(mutex_);
        const std::string id = acct.id;
        if (accounts_.empty() || !default_id_)
            default_id_ = id;
        acct.is_default = default_id_ == id;

        auto existing = accounts_.find(id);
        if (existing != accounts_.end())
        {
            // New configuration, so the pooled session is stale
            drop_pooled(id);
            existing->second = std::move(acct);
        }
        else
        {
            accounts_.emplace(id, std::move(acct));
        }
        MAILSYNC_DEBUG(std::format("account {} registered", id));
        return ok();
    }

    result_void remove_account(std::string_view account_id)
    {
        std::lock_guard lock(mutex_);
        auto it = accounts_.find(std::string(account_id));
        if (it == accounts_.end())
            return fail(errc::not_found, std::format("account {} not found", account_id));

        accounts_.erase(it);
        drop_pooled(std::string(account_id));

        if (default_id_ && *default_id_ == account_id)
        {
            default_id_.reset();
            if (!accounts_.empty())
            {
                default_id_ = accounts_.begin()->first;
                accounts_.begin()->second.is_default = true;
            }
        }
        return ok();
    }

    [[nodiscard]] std::optional<account> get_account(std::string_view account_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = accounts_.find(std::string(account_id));
        if (it == accounts_.end())
            return std::nullopt;
        return it->second;
    }

    /// All accounts ordered by id
    [[nodiscard]] std::vector<account> accounts() const
    {
        std::lock_guard lock(mutex_);
        std::vector<account> out;
        out.reserve(accounts_.size());
        for (const auto& [id, acct] : accounts_)
            out.push_back(acct);
        return out;
    }

    [[nodiscard]] std::optional<account> default_account() const
    {
        std::lock_guard lock(mutex_);
        if (!default_id_)
            return std::nullopt;
        auto it = accounts_.find(*default_id_);
        if (it == accounts_.end())
            return std::nullopt;
        return it->second;
    }

    result_void set_default_account(std::string_view account_id)
    {
        std::lock_guard lock(mutex_);
        auto target = accounts_.find(std::string(account_id));
        if (target == accounts_.end())
            return fail(errc::not_found, std::format("account {} not found", account_id));

        for (auto& [id, acct] : accounts_)
            acct.is_default = false;
        target->second.is_default = true;
        default_id_ = target->first;
        return ok();
    }

    result_void mark_synced(std::string_view account_id)
    {
        std::lock_guard lock(mutex_);
        auto it = accounts_.find(std::string(account_id));
        if (it == accounts_.end())
            return fail(errc::not_found, std::format("account {} not found", account_id));
        it->second.mark_synced();
        return ok();
    }

    /**
    Shared, connected and authenticated client for an account.

    Connecting and authenticating are bounded separately, failing with
    `connect_timeout` and `auth_timeout` so callers can pick their own backoff.
    A failed attempt leaves the client pooled; the next call retries it. A
    timeout also drops the session, whose command is still unanswered, so the
    retry starts from a fresh connection.
    **/
    awaitable<result<client_ptr>> get_client(std::string account_id)
    {
        client_ptr client;
        MAILSYNC_CO_TRY_ASSIGN(client, checkout(account_id));

        if (!client->is_connected())
        {
            MAILSYNC_INFO(std::format("connecting account {}", account_id));
            auto connected = co_await mailsync::detail::with_timeout(client->ensure_connected(),
                config_.connect_timeout, errc::connect_timeout,
                std::format("connecting account {} timed out", account_id));
            if (!connected)
            {
                co_await abort_on_timeout(client, connected.error());
                co_return fail<client_ptr>(std::move(connected).error());
            }
        }

        if (!client->is_authenticated())
        {
            MAILSYNC_INFO(std::format("authenticating account {}", account_id));
            auto auth = co_await mailsync::detail::with_timeout(client->authenticate(),
                config_.auth_timeout, errc::auth_timeout,
                std::format("authenticating account {} timed out", account_id));
            if (!auth)
            {
                MAILSYNC_ERROR(std::format("authentication failed for account {}: {}",
                    account_id, auth.error().to_string()));
                co_await abort_on_timeout(client, auth.error());
                co_return fail<client_ptr>(std::move(auth).error());
            }
        }

        co_return client;
    }

    /// Drop the pooled client of an account; holders keep their reference and LOGOUT is sent in the background
    void release_client(std::string_view account_id)
    {
        std::lock_guard lock(mutex_);
        drop_pooled(std::string(account_id));
    }

    /// Close every pooled client and empty the pool
    awaitable<void> disconnect_all()
    {
        std::vector<client_ptr> clients;
        {
            std::lock_guard lock(mutex_);
            for (auto& [id, entry] : pool_)
                clients.push_back(std::move(entry.client));
            pool_.clear();
            lru_.clear();
        }
        for (auto& client : clients)
            co_await close_quietly(client);
    }

    /**
    Probe an account on a throw-away client: connect, authenticate, LOGOUT.

    The pool is left untouched.
    **/
    awaitable<result_void> test_connection(std::string_view account_id)
    {
        auto acct = get_account(account_id);
        if (!acct)
            co_return fail(errc::not_found, std::format("account {} not found", account_id));

        auto probe = std::make_shared<imap::client>(executor_, acct->config, config_.client_options);
        auto outcome = co_await probe_session(probe);
        co_await close_quietly(probe);
        co_return outcome;
    }

    [[nodiscard]] account_manager_stats stats() const
    {
        std::lock_guard lock(mutex_);
        account_manager_stats out;
        out.total_accounts = accounts_.size();
        for (const auto& [id, acct] : accounts_)
        {
            if (acct.uses_token_auth())
                ++out.token_accounts;
            else
                ++out.password_accounts;
        }
        out.pooled_clients = pool_.size();
        for (const auto& [id, entry] : pool_)
        {
            if (entry.client->is_connected())
                ++out.connected_clients;
        }
        out.max_clients = config_.max_clients;
        out.default_account = default_id_;
        return out;
    }

    /// Ids of the pooled clients, most recently used first
    [[nodiscard]] std::vector<std::string> pooled_accounts() const
    {
        std::lock_guard lock(mutex_);
        return {lru_.begin(), lru_.end()};
    }

private:
    struct pool_entry
    {
        client_ptr client;
        std::list<std::string>::iterator position;
    };

    result<client_ptr> checkout(const std::string& account_id)
    {
        std::lock_guard lock(mutex_);
        auto acct = accounts_.find(account_id);
        if (acct == accounts_.end())
        {
            MAILSYNC_ERROR(std::format("account {} not found ({} registered)", account_id, accounts_.size()));
            return fail<client_ptr>(errc::not_found, std::format("account {} not found", account_id));
        }

        if (auto it = pool_.find(account_id); it != pool_.end())
        {
            lru_.splice(lru_.begin(), lru_, it->second.position);
            return it->second.client;
        }

        while (!pool_.empty() && pool_.size() >= std::max<std::size_t>(config_.max_clients, 1))
        {
            const std::string victim = lru_.back();
            MAILSYNC_DEBUG(std::format("client pool full, evicting {}", victim));
            drop_pooled(victim);
        }

        auto client = std::make_shared<imap::client>(executor_, acct->second.config, config_.client_options);
        lru_.push_front(account_id);
        pool_.emplace(account_id, pool_entry{client, lru_.begin()});
        return client;
    }

    // Caller holds mutex_
    void drop_pooled(const std::string& account_id)
    {
        auto it = pool_.find(account_id);
        if (it == pool_.end())
            return;
        client_ptr client = std::move(it->second.client);
        lru_.erase(it->second.position);
        pool_.erase(it);
        if (client->is_connected())
            mailsync::asio::co_spawn(executor_, close_quietly(std::move(client)), mailsync::asio::detached);
    }

    awaitable<result_void> probe_session(client_ptr probe)
    {
        auto connected = co_await mailsync::detail::with_timeout(probe->connect(),
            config_.connect_timeout, errc::connect_timeout, "connection test timed out while connecting");
        if (!connected)
        {
            co_await abort_on_timeout(probe, connected.error());
            co_return connected;
        }
        auto auth = co_await mailsync::detail::with_timeout(probe->authenticate(),
            config_.auth_timeout, errc::auth_timeout, "connection test timed out while authenticating");
        if (!auth)
            co_await abort_on_timeout(probe, auth.error());
        co_return auth;
    }

    static awaitable<void> abort_on_timeout(const client_ptr& client, const error_info& err)
    {
        if (err.code != errc::connect_timeout && err.code != errc::auth_timeout)
            co_return;
        if (auto res = co_await client->abort(); !res)
            MAILSYNC_WARN(std::format("dropping timed out session failed: {}", res.error().to_string()));
    }

    static awaitable<void> close_quietly(client_ptr client)
    {
        if (!client->is_connected())
            co_return;
        if (auto res = co_await client->disconnect(); !res)
            MAILSYNC_WARN(std::format("closing client failed: {}", res.error().to_string()));
    }

    mailsync::asio::any_io_executor executor_;
    account_manager_config config_;

    mutable std::mutex mutex_;
    std::map<std::string, account> accounts_;
    std::optional<std::string> default_id_;
    std::unordered_map<std::string, pool_entry> pool_;
    std::list<std::string> lru_;
};

} // namespace mailsync::accounts
