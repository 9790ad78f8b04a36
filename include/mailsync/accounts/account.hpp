/*

accounts/account.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <mailsync/imap/types.hpp>

namespace mailsync::accounts
{

/// Per account scheduling preferences
struct sync_settings
{
    /// Synced first, and individually scheduled by the background scheduler
    std::vector<std::string> priority_folders{"INBOX"};

    /// Period of the scheduler's re-check
    std::chrono::seconds sync_interval{300};

    std::vector<std::string> excluded_folders;
    bool use_incremental_sync = true;

    [[nodiscard]] bool is_priority(std::string_view folder) const
    {
        return std::find(priority_folders.begin(), priority_folders.end(), folder) != priority_folders.end();
    }

    [[nodiscard]] bool is_excluded(std::string_view folder) const
    {
        return std::find(excluded_folders.begin(), excluded_folders.end(), folder) != excluded_folders.end();
    }
};

struct account
{
    std::string id;
    std::string display_name;
    std::string email;
    imap::account_config config;
    bool is_default = false;
    std::optional<std::chrono::system_clock::time_point> last_sync;
    sync_settings settings;

    account() = default;

    account(std::string account_id, std::string name, std::string address, imap::account_config cfg)
        : id(std::move(account_id)),
          display_name(std::move(name)),
          email(std::move(address)),
          config(std::move(cfg))
    {
    }

    void mark_synced()
    {
        last_sync = std::chrono::system_clock::now();
    }

    [[nodiscard]] bool uses_token_auth() const noexcept
    {
        return std::holds_alternative<imap::token_credential>(config.cred);
    }
};

} // namespace mailsync::accounts
