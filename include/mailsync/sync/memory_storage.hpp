/*

sync/memory_storage.hpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <mailsync/sync/storage.hpp>

namespace mailsync::sync
{

/// Process local store, for tools that keep nothing on disk
class memory_storage : public storage
{
public:
    result_void store_message(const stored_message& message) override
    {
        std::lock_guard lock(mutex_);
        messages_[{message.account_id, message.folder, message.uid}] = message;
        ++writes_;
        return ok();
    }

    result<std::optional<stored_message>> get_message_by_uid(
        std::string_view account_id, std::string_view folder, std::uint32_t uid) override
    {
        std::lock_guard lock(mutex_);
        auto it = messages_.find({std::string(account_id), std::string(folder), uid});
        if (it == messages_.end())
            return std::optional<stored_message>{};
        return std::optional<stored_message>{it->second};
    }

    result<std::size_t> delete_messages_by_uids(
        std::string_view account_id, std::string_view folder, const std::vector<std::uint32_t>& uids) override
    {
        std::lock_guard lock(mutex_);
        std::size_t removed = 0;
        for (auto uid : uids)
            removed += messages_.erase({std::string(account_id), std::string(folder), uid});
        return removed;
    }

    result_void update_folder_sync_state(const folder_sync_state& state) override
    {
        std::lock_guard lock(mutex_);
        states_[{state.account_id, state.folder}] = state;
        return ok();
    }

    result<std::optional<folder_sync_state>> get_folder_sync_state(
        std::string_view account_id, std::string_view folder) override
    {
        std::lock_guard lock(mutex_);
        auto it = states_.find({std::string(account_id), std::string(folder)});
        if (it == states_.end())
            return std::optional<folder_sync_state>{};
        return std::optional<folder_sync_state>{it->second};
    }

    /// Messages of one folder in UID order
    [[nodiscard]] std::vector<stored_message> messages(std::string_view account_id, std::string_view folder) const
    {
        std::lock_guard lock(mutex_);
        std::vector<stored_message> out;
        for (const auto& [k, msg] : messages_)
        {
            if (std::get<0>(k) == account_id && std::get<1>(k) == folder)
                out.push_back(msg);
        }
        return out;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard lock(mutex_);
        return messages_.size();
    }

    /// Successful store_message calls, overwrites included
    [[nodiscard]] std::size_t writes() const
    {
        std::lock_guard lock(mutex_);
        return writes_;
    }

private:
    using message_key = std::tuple<std::string, std::string, std::uint32_t>;
    using folder_key = std::tuple<std::string, std::string>;

    mutable std::mutex mutex_;
    std::map<message_key, stored_message> messages_;
    std::map<folder_key, folder_sync_state> states_;
    std::size_t writes_ = 0;
};

} // namespace mailsync::sync
