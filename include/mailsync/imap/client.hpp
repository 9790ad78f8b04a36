/*

imap/client.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/async_mutex.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/codec.hpp>
#include <mailsync/imap/connection.hpp>
#include <mailsync/imap/error_mapping.hpp>
#include <mailsync/imap/search.hpp>
#include <mailsync/imap/types.hpp>

namespace mailsync::imap
{

/**
Request level IMAP API over one connection.

Every public operation takes the client's coroutine mutex first, so callers
sharing a client never interleave commands on the socket. The selected folder
and the capability cache live in the connection and follow its state.
**/
class client
{
public:
    using executor_type = any_io_executor;
    using lock_type = mailsync::detail::async_mutex::scoped_lock;
    using duration = connection::duration;

    /**
    An active IDLE command.

    Holds the client lock for its whole life, so no other command can be
    issued until `stop()` ends the IDLE or the session is destroyed.
    **/
    class idle_session
    {
    public:
        idle_session() = default;
        idle_session(const idle_session&) = delete;
        idle_session& operator=(const idle_session&) = delete;

        idle_session(idle_session&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)),
              lock_(std::move(other.lock_)),
              tag_(std::move(other.tag_))
        {
        }

        idle_session& operator=(idle_session&& other) noexcept
        {
            if (this != &other)
            {
                owner_ = std::exchange(other.owner_, nullptr);
                lock_ = std::move(other.lock_);
                tag_ = std::move(other.tag_);
            }
            return *this;
        }

        [[nodiscard]] bool active() const noexcept { return owner_ != nullptr; }
        [[nodiscard]] const std::string& tag() const noexcept { return tag_; }

        /// The server finished the IDLE command on its own
        [[nodiscard]] static bool is_completion(const response_line& line, std::string_view tag) noexcept
        {
            return connection::is_tagged_line(line.text, tag);
        }

        /// Next pushed line, bounded by `timeout`
        awaitable<result<response_line>> read(std::optional<duration> timeout)
        {
            if (owner_ == nullptr)
                co_return fail<response_line>(errc::imap_invalid_state, "IDLE is not active",
                    make_imap_detail({}, "IDLE", {}, 0));
            co_return co_await owner_->conn_.read_idle_line(timeout);
        }

        /// Send DONE and wait for the IDLE completion; the lock is released either way
        awaitable<result<response>> stop()
        {
            if (owner_ == nullptr)
                co_return fail<response>(errc::imap_invalid_state, "IDLE is not active",
                    make_imap_detail({}, "IDLE", {}, 0));
            client* owner = std::exchange(owner_, nullptr);
            auto res = co_await owner->conn_.idle_end(tag_);
            lock_.unlock();
            co_return res;
        }

    private:
        friend class client;

        idle_session(client* owner, lock_type lock, std::string tag)
            : owner_(owner),
              lock_(std::move(lock)),
              tag_(std::move(tag))
        {
        }

        client* owner_{nullptr};
        lock_type lock_;
        std::string tag_;
    };

    client(executor_type executor, account_config config, options opts = {})
        : executor_(executor),
          conn_(executor, std::move(config), std::move(opts)),
          mutex_(executor)
    {
    }

    client(mailsync::asio::io_context& context, account_config config, options opts = {})
        : client(context.get_executor(), std::move(config), std::move(opts))
    {
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    [[nodiscard]] executor_type get_executor() const { return executor_; }
    [[nodiscard]] connection_state state() const noexcept { return conn_.state(); }
    [[nodiscard]] const account_config& config() const noexcept { return conn_.config(); }
    [[nodiscard]] bool is_connected() const noexcept { return conn_.state() != connection_state::disconnected; }
    [[nodiscard]] bool is_authenticated() const noexcept { return conn_.is_authenticated(); }
    [[nodiscard]] bool is_tls() const noexcept { return conn_.is_tls(); }
    [[nodiscard]] std::optional<std::string> selected_folder() const { return conn_.selected_folder(); }

    /// Cached capabilities, as of the last CAPABILITY or login
    [[nodiscard]] capability_set capabilities() const { return conn_.capabilities(); }
    [[nodiscard]] bool has_capability(capability cap) const { return conn_.capabilities().has(cap); }

    awaitable<result_void> connect()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await conn_.connect();
    }

    /// Connect unless a session is already open; safe to race from several callers
    awaitable<result_void> ensure_connected()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        if (conn_.state() != connection_state::disconnected)
            co_return ok();
        co_return co_await conn_.connect();
    }

    awaitable<result_void> authenticate()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await conn_.authenticate();
    }

    awaitable<result_void> disconnect()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await conn_.disconnect();
    }

    /// Drop the session without LOGOUT, e.g. after a timeout left a command unanswered
    awaitable<result_void> abort()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        conn_.abort();
        co_return ok();
    }

    /// Same as disconnect; LOGOUT is always attempted when a session exists
    awaitable<result_void> logout()
    {
        co_return co_await disconnect();
    }

    awaitable<result<capability_set>> capability()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        co_return co_await conn_.refresh_capabilities();
    }

    awaitable<result<response>> noop()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_connected("NOOP"));
        co_return co_await conn_.command(format_noop());
    }

    /// Raw command text, without tag or CRLF
    awaitable<result<response>> command(std::string_view cmd)
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_connected(cmd));
        co_return co_await conn_.command(cmd);
    }

    // ==================== Folders ====================

    /// SELECT, with CONDSTORE enabled when the server offers it
    awaitable<result<mailbox_status>> select(std::string_view folder)
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_authenticated("SELECT"));
        std::string cmd;
        if (conn_.capabilities().has(capability::condstore))
            MAILSYNC_CO_TRY_ASSIGN(cmd, format_select_condstore(folder));
        else
            MAILSYNC_CO_TRY_ASSIGN(cmd, format_select(folder));
        co_return co_await open_folder(cmd, folder);
    }

    awaitable<result<mailbox_status>> examine(std::string_view folder)
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_authenticated("EXAMINE"));
        std::string cmd;
        MAILSYNC_CO_TRY_ASSIGN(cmd, format_examine(folder));
        co_return co_await open_folder(cmd, folder);
    }

    /// STATUS without selecting; items default to the counters this library tracks
    awaitable<result<mailbox_status>> status(std::string_view folder, std::vector<std::string> items = {})
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_authenticated("STATUS"));
        if (items.empty())
            items = default_status_items(conn_.capabilities().has(capability::condstore));
        std::string cmd;
        MAILSYNC_CO_TRY_ASSIGN(cmd, format_status(folder, items));
        response resp;
        MAILSYNC_CO_TRY_ASSIGN(resp, co_await conn_.command(cmd));
        for (const auto& line : resp.untagged)
        {
            if (detail::starts_with_ci(line.text, "* STATUS "))
                co_return parse_status_line(line.text, line.literals);
        }
        co_return fail<mailbox_status>(errc::imap_parse_error, "STATUS response missing",
            make_imap_detail(resp.tag, cmd, resp.tagged_line, resp.untagged.size()));
    }

    awaitable<result<std::vector<folder>>> list(std::string_view reference = "", std::string_view pattern = "*")
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_authenticated("LIST"));
        std::string cmd;
        MAILSYNC_CO_TRY_ASSIGN(cmd, format_list(reference, pattern));
        response resp;
        MAILSYNC_CO_TRY_ASSIGN(resp, co_await conn_.command(cmd));
        co_return parse_folders(resp);
    }

    awaitable<result<std::vector<folder>>> lsub(std::string_view reference = "", std::string_view pattern = "*")
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_authenticated("LSUB"));
        std::string cmd;
        MAILSYNC_CO_TRY_ASSIGN(cmd, format_lsub(reference, pattern));
        response resp;
        MAILSYNC_CO_TRY_ASSIGN(resp, co_await conn_.command(cmd));
        co_return parse_folders(resp);
    }

    awaitable<result_void> create_folder(std::string_view folder)
    {
        co_return co_await folder_command(format_create(folder), "CREATE");
    }

    awaitable<result_void> delete_folder(std::string_view folder)
    {
        co_return co_await folder_command(format_delete(folder), "DELETE");
    }

    awaitable<result_void> rename_folder(std::string_view from, std::string_view to)
    {
        co_return co_await folder_command(format_rename(from, to), "RENAME");
    }

    awaitable<result_void> subscribe(std::string_view folder)
    {
        co_return co_await folder_command(format_subscribe(folder), "SUBSCRIBE");
    }

    awaitable<result_void> unsubscribe(std::string_view folder)
    {
        co_return co_await folder_command(format_unsubscribe(folder), "UNSUBSCRIBE");
    }

    // ==================== Messages ====================

    awaitable<result<std::vector<fetched_message>>> fetch(std::string_view set, std::vector<std::string> items)
    {
        co_return co_await fetch_impl(set, std::move(items), false, std::nullopt);
    }

    /// UID FETCH; `changed_since` adds the CONDSTORE CHANGEDSINCE modifier
    awaitable<result<std::vector<fetched_message>>> uid_fetch(std::string_view set, std::vector<std::string> items,
        std::optional<std::uint64_t> changed_since = std::nullopt)
    {
        co_return co_await fetch_impl(set, std::move(items), true, changed_since);
    }

    awaitable<result<search_result>> search(const search_criteria& criteria)
    {
        co_return co_await search_impl(criteria, false);
    }

    awaitable<result<search_result>> uid_search(const search_criteria& criteria)
    {
        co_return co_await search_impl(criteria, true);
    }

    /// STORE; returns the FETCH updates the server sent back (none with `silent`)
    awaitable<result<std::vector<fetched_message>>> store(std::string_view set, store_mode mode, flag_set flags,
        bool silent = false)
    {
        co_return co_await store_impl(set, mode, std::move(flags), silent, false);
    }

    awaitable<result<std::vector<fetched_message>>> uid_store(std::string_view set, store_mode mode, flag_set flags,
        bool silent = false)
    {
        co_return co_await store_impl(set, mode, std::move(flags), silent, true);
    }

    awaitable<result_void> copy(std::string_view set, std::string_view destination)
    {
        co_return co_await selected_command(format_copy(set, destination, false), "COPY");
    }

    awaitable<result_void> uid_copy(std::string_view set, std::string_view destination)
    {
        co_return co_await selected_command(format_copy(set, destination, true), "UID COPY");
    }

    /// MOVE needs the MOVE extension; without it the call fails with `capability_not_supported`
    awaitable<result_void> move(std::string_view set, std::string_view destination, bool uid = true)
    {
        if (!conn_.capabilities().has(capability::move))
            co_return fail(errc::capability_not_supported, "server does not advertise MOVE",
                make_imap_detail({}, "MOVE", {}, 0));
        co_return co_await selected_command(format_move(set, destination, uid), "MOVE");
    }

    /// EXPUNGE; returns the expunged sequence numbers in server order
    awaitable<result<std::vector<std::uint32_t>>> expunge()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_selected("EXPUNGE"));
        response resp;
        MAILSYNC_CO_TRY_ASSIGN(resp, co_await conn_.command(format_expunge()));
        std::vector<std::uint32_t> expunged;
        for (const auto& line : resp.untagged)
        {
            auto [star, rest] = detail::split_token(line.text);
            auto [number, keyword] = detail::split_token(rest);
            std::uint32_t seq = 0;
            if (star == "*" && detail::iequals_ascii(keyword, "EXPUNGE") && detail::parse_number(number, seq))
                expunged.push_back(seq);
        }
        co_return expunged;
    }

    /**
    Issue IDLE on the selected folder.

    The returned session keeps the client locked; other operations wait until
    it is stopped or destroyed.
    **/
    awaitable<result<idle_session>> idle_start()
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_selected("IDLE"));
        if (!conn_.capabilities().has(capability::idle))
            co_return fail<idle_session>(errc::capability_not_supported, "server does not advertise IDLE",
                make_imap_detail({}, "IDLE", {}, 0));
        std::string tag;
        MAILSYNC_CO_TRY_ASSIGN(tag, co_await conn_.idle_begin());
        co_return idle_session(this, std::move(guard), std::move(tag));
    }

private:
    result_void require_connected(std::string_view cmd) const
    {
        if (conn_.state() != connection_state::disconnected)
            return ok();
        return fail(errc::imap_invalid_state, "not connected",
            make_imap_detail({}, cmd, to_string(conn_.state()), 0));
    }

    result_void require_authenticated(std::string_view cmd) const
    {
        if (conn_.is_authenticated())
            return ok();
        return fail(errc::imap_invalid_state, "command requires an authenticated session",
            make_imap_detail({}, cmd, to_string(conn_.state()), 0));
    }

    result_void require_selected(std::string_view cmd) const
    {
        if (conn_.state() == connection_state::selected)
            return ok();
        return fail(errc::imap_invalid_state, "command requires a selected folder",
            make_imap_detail({}, cmd, to_string(conn_.state()), 0));
    }

    /// A failed SELECT leaves no folder selected on the server either
    awaitable<result<mailbox_status>> open_folder(const std::string& cmd, std::string_view folder)
    {
        auto res = co_await conn_.command(cmd);
        if (!res)
        {
            if (conn_.is_authenticated())
                conn_.clear_selected();
            co_return fail<mailbox_status>(std::move(res).error());
        }
        mailbox_status st = parse_mailbox_status(*res);
        conn_.set_selected(std::string(folder));
        MAILSYNC_DEBUG(std::format("IMAP selected {} exists={} uidvalidity={}", folder, st.exists, st.uid_validity));
        co_return st;
    }

    awaitable<result_void> folder_command(result<std::string> cmd, std::string_view name)
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_authenticated(name));
        if (!cmd)
            co_return fail(std::move(cmd).error());
        MAILSYNC_TRY_CO_AWAIT(conn_.command(*cmd));
        co_return ok();
    }

    awaitable<result_void> selected_command(result<std::string> cmd, std::string_view name)
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_selected(name));
        if (!cmd)
            co_return fail(std::move(cmd).error());
        MAILSYNC_TRY_CO_AWAIT(conn_.command(*cmd));
        co_return ok();
    }

    awaitable<result<std::vector<fetched_message>>> fetch_impl(std::string_view set, std::vector<std::string> items,
        bool uid, std::optional<std::uint64_t> changed_since)
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_selected(uid ? "UID FETCH" : "FETCH"));
        if (changed_since && !conn_.capabilities().has(capability::condstore))
            co_return fail<std::vector<fetched_message>>(errc::capability_not_supported,
                "CHANGEDSINCE requires CONDSTORE", make_imap_detail({}, "FETCH", {}, 0));
        std::string cmd;
        MAILSYNC_CO_TRY_ASSIGN(cmd, format_fetch(set, items, uid, changed_since));
        response resp;
        MAILSYNC_CO_TRY_ASSIGN(resp, co_await conn_.command(cmd));
        co_return parse_fetch_response(resp);
    }

    awaitable<result<search_result>> search_impl(const search_criteria& criteria, bool uid)
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_selected(uid ? "UID SEARCH" : "SEARCH"));
        std::string cmd;
        MAILSYNC_CO_TRY_ASSIGN(cmd, format_search(criteria, uid));
        response resp;
        MAILSYNC_CO_TRY_ASSIGN(resp, co_await conn_.command(cmd));
        co_return parse_search(resp);
    }

    awaitable<result<std::vector<fetched_message>>> store_impl(std::string_view set, store_mode mode, flag_set flags,
        bool silent, bool uid)
    {
        lock_type guard;
        MAILSYNC_CO_TRY_ASSIGN(guard, co_await mutex_.lock());
        MAILSYNC_CO_TRY_VOID(require_selected(uid ? "UID STORE" : "STORE"));
        std::string cmd;
        MAILSYNC_CO_TRY_ASSIGN(cmd, format_store(set, mode, flags, silent, uid));
        response resp;
        MAILSYNC_CO_TRY_ASSIGN(resp, co_await conn_.command(cmd));
        co_return parse_fetch_response(resp);
    }

    executor_type executor_;
    connection conn_;
    mailsync::detail::async_mutex mutex_;
};

} // namespace mailsync::imap
