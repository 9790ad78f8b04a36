/*

sync/storage.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Narrow interface to the message store the sync engine writes to.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/result.hpp>
#include <mailsync/imap/types.hpp>
#include <mailsync/sync/types.hpp>

namespace mailsync::sync
{

/// A message as the store keeps it
struct stored_message
{
    std::string account_id;
    std::string folder;
    std::uint32_t uid = 0;

    std::optional<std::string> message_id;
    std::optional<std::string> in_reply_to;
    std::optional<std::string> subject;
    std::optional<std::string> date;
    std::string from;
    std::vector<std::string> to;
    std::vector<std::string> cc;
    std::optional<std::string> internal_date;
    std::uint64_t size = 0;

    /// Wire spelling, e.g. `\Seen` or a keyword
    std::vector<std::string> flags;

    /// Absent for headers-only syncs
    std::optional<std::string> body;

    std::uint32_t sync_version = 1;
    std::chrono::system_clock::time_point last_synced{};

    [[nodiscard]] bool has_flag(std::string_view flag) const
    {
        return std::find(flags.begin(), flags.end(), flag) != flags.end();
    }

    [[nodiscard]] bool is_seen() const
    {
        return has_flag("\\Seen");
    }
};

/// Store collaborator; the engine never touches files or SQL itself
class storage
{
public:
    virtual ~storage() = default;

    virtual result_void store_message(const stored_message& message) = 0;

    virtual result<std::optional<stored_message>> get_message_by_uid(
        std::string_view account_id, std::string_view folder, std::uint32_t uid) = 0;

    /// Number of messages removed
    virtual result<std::size_t> delete_messages_by_uids(
        std::string_view account_id, std::string_view folder, const std::vector<std::uint32_t>& uids) = 0;

    virtual result_void update_folder_sync_state(const folder_sync_state& state) = 0;

    virtual result<std::optional<folder_sync_state>> get_folder_sync_state(
        std::string_view account_id, std::string_view folder) = 0;
};

/// Convert one FETCH result; a message without UID cannot be stored
[[nodiscard]] inline result<stored_message> to_stored_message(const imap::fetched_message& msg,
    std::string_view account_id, std::string_view folder)
{
    if (!msg.uid || *msg.uid == 0)
        return fail<stored_message>(errc::codec_invalid_input,
            std::format("message {} has no UID", msg.sequence));

    stored_message out;
    out.account_id = account_id;
    out.folder = folder;
    out.uid = *msg.uid;
    out.internal_date = msg.internal_date;
    out.size = msg.size.value_or(msg.body ? msg.body->size() : 0);
    out.body = msg.body;
    out.last_synced = std::chrono::system_clock::now();

    if (msg.flags)
    {
        for (const auto& flag : *msg.flags)
            out.flags.push_back(flag.to_imap());
    }

    if (msg.env)
    {
        const auto& env = *msg.env;
        out.message_id = env.message_id;
        out.in_reply_to = env.in_reply_to;
        out.subject = env.subject;
        out.date = env.date;
        if (!env.from.empty())
            out.from = env.from.front().display();
        for (const auto& a : env.to)
            out.to.push_back(a.email_address());
        for (const auto& a : env.cc)
            out.cc.push_back(a.email_address());
    }
    return out;
}

} // namespace mailsync::sync
