/*

imap/connection.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/detail/oauth2_retry.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/detail/sanitize.hpp>
#include <mailsync/imap/codec.hpp>
#include <mailsync/imap/error_mapping.hpp>
#include <mailsync/imap/types.hpp>
#include <mailsync/net/dialog.hpp>
#include <mailsync/net/error_mapping.hpp>
#include <mailsync/net/tls_mode.hpp>
#include <mailsync/net/tls_options.hpp>
#include <mailsync/net/upgradable_stream.hpp>

namespace mailsync::imap
{

using mailsync::asio::any_io_executor;
using mailsync::asio::awaitable;
using mailsync::asio::tcp;
namespace ssl = mailsync::asio::ssl;

/**
One IMAP session over a plain or TLS socket.

Tracks the four state lifecycle, tags commands `A0001`, `A0002`, ... and
bounds every read by the account's timeout. Not safe for concurrent use; the
client serialises access.
**/
class connection
{
public:
    using dialog_type = mailsync::net::dialog<mailsync::net::upgradable_stream>;
    using duration = dialog_type::duration;

    connection(any_io_executor executor, account_config config, options opts = {})
        : executor_(std::move(executor)),
          config_(std::move(config)),
          options_(std::move(opts))
    {
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    [[nodiscard]] any_io_executor get_executor() const { return executor_; }
    [[nodiscard]] connection_state state() const noexcept { return state_; }
    [[nodiscard]] const account_config& config() const noexcept { return config_; }
    [[nodiscard]] const capability_set& capabilities() const noexcept { return capabilities_; }
    [[nodiscard]] bool capabilities_known() const noexcept { return capabilities_known_; }
    [[nodiscard]] const std::optional<std::string>& selected_folder() const noexcept { return selected_folder_; }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return dialog_.has_value() && dialog_->stream().is_tls();
    }

    [[nodiscard]] bool is_authenticated() const noexcept
    {
        return state_ == connection_state::authenticated || state_ == connection_state::selected;
    }

    void set_selected(std::string folder)
    {
        selected_folder_ = std::move(folder);
        state_ = connection_state::selected;
    }

    void clear_selected() noexcept
    {
        selected_folder_.reset();
        if (state_ == connection_state::selected)
            state_ = connection_state::authenticated;
    }

    /**
    Resolve, connect, optionally handshake, read the greeting and query capabilities.

    `* OK` moves to connected, `* PREAUTH` straight to authenticated; anything
    else is `imap_bad_greeting`. With STARTTLS configured the session is
    upgraded before this returns and the capabilities are asked again.
    **/
    awaitable<result_void> connect()
    {
        if (state_ != connection_state::disconnected)
            co_return fail(errc::imap_invalid_state, "connection is already established",
                make_imap_detail({}, "CONNECT", to_string(state_), 0));
        MAILSYNC_CO_TRY_VOID(mailsync::detail::ensure_no_crlf_or_nul(config_.host, "host"));

        const auto mode = config_.tls();
        MAILSYNC_DEBUG(std::format("IMAP connecting to {}:{} ({})", config_.host, config_.port,
            mailsync::net::to_string(mode)));

        tcp::socket socket(executor_);
        MAILSYNC_CO_TRY_ASSIGN(socket, co_await open_socket());

        mailsync::net::upgradable_stream stream(std::move(socket));
        if (mode == mailsync::net::tls_mode::implicit)
            MAILSYNC_TRY_CO_AWAIT(stream.start_tls(tls_context(), config_.host, tls_options()));

        dialog_.emplace(std::move(stream), options_.max_line_length, command_timeout());
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
        tag_counter_ = 0;
        reset_capabilities();

        response_line greeting;
        if (auto res = co_await read_response_line(); res)
        {
            greeting = std::move(*res);
        }
        else
        {
            drop_dialog();
            co_return fail(std::move(res).error());
        }

        if (detail::starts_with_ci(greeting.text, "* OK"))
        {
            state_ = connection_state::connected;
        }
        else if (detail::starts_with_ci(greeting.text, "* PREAUTH"))
        {
            state_ = connection_state::authenticated;
        }
        else
        {
            drop_dialog();
            co_return fail(errc::imap_bad_greeting, "unexpected server greeting",
                make_imap_detail({}, "GREETING", greeting.text, 0, options_.redact_secrets_in_trace));
        }

        if (auto res = co_await refresh_capabilities(); !res)
        {
            drop_dialog();
            co_return fail(std::move(res).error());
        }

        if (mode == mailsync::net::tls_mode::starttls)
        {
            if (auto res = co_await upgrade_to_tls(); !res)
            {
                drop_dialog();
                co_return fail(std::move(res).error());
            }
        }

        MAILSYNC_INFO(std::format("IMAP connected to {} ({})", config_.host, to_string(state_)));
        co_return ok();
    }

    /// Send a tagged command and collect everything up to its completion
    awaitable<result<response>> command(std::string_view cmd)
    {
        co_return co_await command_with_continuation(cmd, std::nullopt);
    }

    /**
    Like `command`, answering the first `+` continuation with `continuation`.

    Without a continuation from the server the tagged completion decides the
    outcome; an OK that never asked for data is `imap_continuation_expected`.
    **/
    awaitable<result<response>> command_with_continuation(std::string_view cmd,
        std::optional<std::string> continuation)
    {
        MAILSYNC_CO_TRY_VOID(mailsync::detail::ensure_no_crlf_or_nul(cmd, "command"));
        dialog_type* dlg = nullptr;
        MAILSYNC_CO_TRY_ASSIGN(dlg, dialog_ptr());

        const std::string tag = next_tag();
        std::string line = tag;
        mailsync::detail::append_space(line);
        mailsync::detail::append_sv(line, cmd);
        if (auto res = co_await dlg->write_line(std::move(line)); !res)
            co_return fail<response>(on_transport_error(std::move(res).error()));

        response resp;
        resp.tag = tag;
        bool continuation_sent = false;
        while (true)
        {
            response_line next;
            MAILSYNC_CO_TRY_ASSIGN(next, co_await read_response_line());

            if (is_tagged_line(next.text, tag))
            {
                apply_tagged(resp, next.text, tag);
                break;
            }
            if (!next.text.empty() && next.text.front() == '+')
            {
                resp.continuation.push_back(next.text);
                if (continuation && !continuation_sent)
                {
                    continuation_sent = true;
                    if (auto res = co_await dlg->write_line(*continuation); !res)
                        co_return fail<response>(on_transport_error(std::move(res).error()));
                }
                else if (!continuation)
                {
                    co_return fail<response>(errc::imap_continuation_expected, "unexpected continuation request",
                        make_imap_detail(tag, cmd, next.text, resp.untagged.size(), options_.redact_secrets_in_trace));
                }
                continue;
            }
            resp.untagged.push_back(std::move(next));
        }

        if (continuation && !continuation_sent && resp.st == status::ok)
        {
            co_return fail<response>(errc::imap_continuation_expected, "server completed without a continuation",
                make_imap_detail(tag, cmd, resp.tagged_line, resp.untagged.size(), options_.redact_secrets_in_trace));
        }
        co_return finalize(std::move(resp), cmd);
    }

    /// CAPABILITY; the cached set is replaced, never merged
    awaitable<result<capability_set>> refresh_capabilities()
    {
        response resp;
        MAILSYNC_CO_TRY_ASSIGN(resp, co_await command(format_capability()));
        capabilities_ = parse_capabilities(resp);
        capabilities_known_ = true;
        co_return capabilities_;
    }

    /**
    Log in with the configured credential.

    Passwords use AUTHENTICATE PLAIN when advertised (inline with SASL-IR,
    otherwise after the continuation) and LOGIN as the fallback. Tokens need
    AUTH=XOAUTH2 and fail fast with `auth_not_supported` when it is missing;
    a rejected token is refreshed once and tried again.
    **/
    awaitable<result_void> authenticate()
    {
        if (is_authenticated())
            co_return ok();
        if (state_ != connection_state::connected)
            co_return fail(errc::imap_invalid_state, "authentication requires a connected session",
                make_imap_detail({}, "AUTHENTICATE", to_string(state_), 0));
        MAILSYNC_CO_TRY_VOID(enforce_auth_tls_policy());
        MAILSYNC_CO_TRY_VOID(mailsync::detail::ensure_no_crlf_or_nul(config_.username, "username"));
        if (!capabilities_known_)
            MAILSYNC_TRY_CO_AWAIT(refresh_capabilities());

        response resp;
        if (const auto* password = std::get_if<password_credential>(&config_.cred))
        {
            MAILSYNC_CO_TRY_ASSIGN(resp, co_await authenticate_password(password->password));
        }
        else
        {
            const auto& token = std::get<token_credential>(config_.cred);
            MAILSYNC_CO_TRY_ASSIGN(resp, co_await authenticate_token(token));
        }

        state_ = connection_state::authenticated;
        // servers commonly announce the post-login capabilities in the tagged OK
        if (const capability_set announced = parse_capabilities(resp); !announced.empty())
        {
            capabilities_ = announced;
            capabilities_known_ = true;
        }
        MAILSYNC_INFO(std::format("IMAP authenticated as {}", config_.username));
        co_return ok();
    }

    /// LOGOUT best-effort, then close; always ends in `disconnected`
    awaitable<result_void> disconnect()
    {
        if (dialog_.has_value())
        {
            auto res = co_await command(format_logout());
            if (!res)
                MAILSYNC_DEBUG(std::format("IMAP logout ignored: {}", res.error().to_string()));
        }
        drop_dialog();
        co_return ok();
    }

    /// Close without LOGOUT; the session may be mid-command and cannot be trusted with another one
    void abort()
    {
        if (dialog_.has_value())
            MAILSYNC_WARN(std::format("IMAP session to {} aborted", config_.host));
        drop_dialog();
    }

    // ==================== IDLE primitives ====================

    /// Send IDLE and wait for the `+` acknowledgement; returns the command tag
    awaitable<result<std::string>> idle_begin()
    {
        dialog_type* dlg = nullptr;
        MAILSYNC_CO_TRY_ASSIGN(dlg, dialog_ptr());

        const std::string tag = next_tag();
        if (auto res = co_await dlg->write_line(tag + " " + format_idle()); !res)
            co_return fail<std::string>(on_transport_error(std::move(res).error()));

        response resp;
        resp.tag = tag;
        while (true)
        {
            response_line next;
            MAILSYNC_CO_TRY_ASSIGN(next, co_await read_response_line());
            if (!next.text.empty() && next.text.front() == '+')
                co_return tag;
            if (is_tagged_line(next.text, tag))
            {
                apply_tagged(resp, next.text, tag);
                auto finished = finalize(std::move(resp), format_idle());
                if (!finished)
                    co_return fail<std::string>(std::move(finished).error());
                co_return fail<std::string>(errc::imap_continuation_expected, "IDLE completed without a continuation",
                    make_imap_detail(tag, format_idle(), finished->tagged_line, finished->untagged.size()));
            }
            resp.untagged.push_back(std::move(next));
        }
    }

    /// Next server line while idling, bounded by `timeout` instead of the command timeout
    awaitable<result<response_line>> read_idle_line(std::optional<duration> timeout)
    {
        co_return co_await read_response_line_within(timeout);
    }

    /// DONE, then read through the completion of the IDLE command
    awaitable<result<response>> idle_end(const std::string& tag)
    {
        dialog_type* dlg = nullptr;
        MAILSYNC_CO_TRY_ASSIGN(dlg, dialog_ptr());
        if (auto res = co_await dlg->write_line(format_done()); !res)
            co_return fail<response>(on_transport_error(std::move(res).error()));

        response resp;
        resp.tag = tag;
        while (true)
        {
            response_line next;
            MAILSYNC_CO_TRY_ASSIGN(next, co_await read_response_line());
            if (is_tagged_line(next.text, tag))
            {
                apply_tagged(resp, next.text, tag);
                break;
            }
            resp.untagged.push_back(std::move(next));
        }
        co_return finalize(std::move(resp), format_done());
    }

    [[nodiscard]] static bool is_tagged_line(std::string_view line, std::string_view tag) noexcept
    {
        return !tag.empty() && line.size() > tag.size() && line.starts_with(tag) && line[tag.size()] == ' ';
    }

    /// Size announced by a trailing `{n}` or `{n+}`
    [[nodiscard]] static std::optional<std::size_t> literal_size(std::string_view line) noexcept
    {
        if (line.size() < 3 || line.back() != '}')
            return std::nullopt;
        const auto brace = line.rfind('{');
        if (brace == std::string_view::npos)
            return std::nullopt;
        std::string_view inner = line.substr(brace + 1, line.size() - brace - 2);
        if (!inner.empty() && inner.back() == '+')
            inner.remove_suffix(1);
        std::size_t size = 0;
        if (!detail::parse_number(inner, size))
            return std::nullopt;
        return size;
    }

private:
    [[nodiscard]] std::string next_tag()
    {
        return std::format("A{:04}", ++tag_counter_);
    }

    [[nodiscard]] std::optional<duration> command_timeout() const
    {
        if (config_.timeout_seconds == 0)
            return std::nullopt;
        return std::chrono::seconds(config_.timeout_seconds);
    }

    [[nodiscard]] mailsync::net::tls_options tls_options() const
    {
        if (options_.tls)
            return *options_.tls;
        return mailsync::net::tls_options::from_validation(config_.validate_certificates);
    }

    ssl::context& tls_context()
    {
        if (!tls_context_)
            tls_context_ = std::make_unique<ssl::context>(ssl::context::tls_client);
        return *tls_context_;
    }

    result<dialog_type*> dialog_ptr()
    {
        if (!dialog_.has_value())
            return fail<dialog_type*>(errc::imap_invalid_state, "connection is not established",
                make_imap_detail({}, "COMMAND", to_string(state_), 0));
        return &*dialog_;
    }

    void reset_capabilities() noexcept
    {
        capabilities_ = capability_set{};
        capabilities_known_ = false;
    }

    void drop_dialog()
    {
        if (dialog_.has_value())
        {
            mailsync::asio::error_code ignored;
            dialog_->stream().lowest_layer().close(ignored);
        }
        dialog_.reset();
        state_ = connection_state::disconnected;
        selected_folder_.reset();
        reset_capabilities();
    }

    /// A peer that went away leaves nothing to talk to; timeouts keep the session for the caller to judge
    error_info on_transport_error(error_info err)
    {
        if (err.code == errc::net_eof || err.code == errc::net_connection_reset || err.code == errc::net_io_failed)
        {
            MAILSYNC_WARN(std::format("IMAP connection to {} lost: {}", config_.host, err.to_string()));
            drop_dialog();
        }
        return err;
    }

    /// Resolve and connect under the connect timeout; the deadline handler owns everything it touches
    awaitable<result<tcp::socket>> open_socket()
    {
        struct attempt
        {
            explicit attempt(const any_io_executor& executor)
                : resolver(executor),
                  socket(executor)
            {
            }

            tcp::resolver resolver;
            tcp::socket socket;
            std::atomic_bool expired{false};
        };

        auto state = std::make_shared<attempt>(executor_);
        mailsync::asio::steady_timer deadline(executor_);
        deadline.expires_after(options_.connect_timeout);
        deadline.async_wait([state](mailsync::asio::error_code ec)
        {
            if (ec)
                return;
            state->expired.store(true);
            state->resolver.cancel();
            mailsync::asio::error_code ignored;
            state->socket.close(ignored);
        });

        auto [resolve_ec, endpoints] = co_await state->resolver.async_resolve(config_.host,
            std::to_string(config_.port), mailsync::asio::use_nothrow_awaitable);
        if (resolve_ec)
        {
            deadline.cancel();
            if (state->expired.load())
                co_return fail<tcp::socket>(errc::connect_timeout, "connect timed out while resolving", config_.host, resolve_ec);
            co_return fail<tcp::socket>(mailsync::net::make_net_error(mailsync::net::io_stage::resolve, resolve_ec,
                config_.host, "resolve"));
        }

        auto [connect_ec, endpoint] = co_await mailsync::asio::async_connect(state->socket, endpoints,
            mailsync::asio::use_nothrow_awaitable);
        (void)endpoint;
        deadline.cancel();
        if (state->expired.load())
            co_return fail<tcp::socket>(errc::connect_timeout, "connect timed out", config_.host, connect_ec);
        if (connect_ec)
            co_return fail<tcp::socket>(mailsync::net::make_net_error(mailsync::net::io_stage::connect, connect_ec,
                config_.host, "connect"));
        // a handler already queued by the deadline now closes an empty socket
        co_return std::move(state->socket);
    }

    awaitable<result_void> upgrade_to_tls()
    {
        if (!capabilities_.has(capability::starttls))
            co_return fail(errc::capability_not_supported, "server does not advertise STARTTLS",
                make_imap_detail({}, "STARTTLS", {}, 0));
        MAILSYNC_TRY_CO_AWAIT(command(format_starttls()));

        const std::size_t max_len = dialog_->max_line_length();
        const auto timeout = dialog_->timeout();
        mailsync::net::upgradable_stream stream = std::move(dialog_->stream());
        dialog_.reset();

        MAILSYNC_TRY_CO_AWAIT(stream.start_tls(tls_context(), config_.host, tls_options()));
        dialog_.emplace(std::move(stream), max_len, timeout);
        dialog_->set_trace_redaction(options_.redact_secrets_in_trace);
        reset_capabilities();
        MAILSYNC_TRY_CO_AWAIT(refresh_capabilities());
        co_return ok();
    }

    result_void enforce_auth_tls_policy() const
    {
        if (is_tls() || !options_.require_tls_for_auth)
            return ok();
        return fail(errc::imap_invalid_state, "TLS required for authentication",
            make_imap_detail({}, "AUTHENTICATE", "cleartext refused", 0));
    }

    awaitable<result<response>> authenticate_password(const std::string& password)
    {
        MAILSYNC_CO_TRY_VOID(mailsync::detail::ensure_no_crlf_or_nul(password, "password"));

        if (capabilities_.has(capability::auth_plain))
        {
            std::string blob = mailsync::sasl::encode_plain(config_.username, password);
            if (capabilities_.has(capability::sasl_ir))
                co_return map_auth_failure(co_await command("AUTHENTICATE PLAIN " + blob));
            co_return map_auth_failure(co_await command_with_continuation("AUTHENTICATE PLAIN", std::move(blob)));
        }
        if (capabilities_.has(capability::logindisabled))
            co_return fail<response>(errc::auth_not_supported, "server disabled LOGIN and offers no usable mechanism",
                make_imap_detail({}, "LOGIN", {}, 0));

        std::string cmd;
        MAILSYNC_CO_TRY_ASSIGN(cmd, format_login(config_.username, password));
        co_return map_auth_failure(co_await command(cmd));
    }

    awaitable<result<response>> authenticate_token(const token_credential& cred)
    {
        if (!capabilities_.has(capability::auth_xoauth2))
            co_return fail<response>(errc::auth_not_supported, "server does not advertise AUTH=XOAUTH2",
                make_imap_detail({}, "AUTHENTICATE", {}, 0));
        if (!cred.source)
            co_return fail<response>(errc::auth_failed, "no token source configured");

        auto attempt = [this, format = cred.format](const std::string& access_token) -> awaitable<result<response>>
        {
            MAILSYNC_CO_TRY_VOID(mailsync::detail::ensure_no_crlf_or_nul(access_token, "token"));
            co_return map_auth_failure(co_await command(
                format_authenticate_token(config_.username, access_token, format)));
        };
        co_return co_await mailsync::detail::authenticate_with_refresh(*cred.source, attempt);
    }

    /// A server refusing the credentials is an authentication failure, not a generic NO
    static result<response> map_auth_failure(result<response> res)
    {
        if (!res && res.error().code == errc::imap_tagged_no)
        {
            error_info err = std::move(res).error();
            err.code = errc::auth_failed;
            return fail<response>(std::move(err));
        }
        return res;
    }

    /// One logical line: `{n}` literals are read and the line continues after them
    awaitable<result<response_line>> read_response_line()
    {
        dialog_type* dlg = nullptr;
        MAILSYNC_CO_TRY_ASSIGN(dlg, dialog_ptr());
        co_return co_await read_response_line_within(dlg->timeout());
    }

    awaitable<result<response_line>> read_response_line_within(std::optional<duration> timeout)
    {
        dialog_type* dlg = nullptr;
        MAILSYNC_CO_TRY_ASSIGN(dlg, dialog_ptr());

        response_line out;
        auto first = co_await dlg->read_line(timeout);
        if (!first)
            co_return fail<response_line>(on_transport_error(std::move(first).error()));
        out.text = std::move(*first);

        while (auto size = literal_size(out.text))
        {
            auto literal = co_await dlg->read_exactly(*size);
            if (!literal)
                co_return fail<response_line>(on_transport_error(std::move(literal).error()));
            out.literals.push_back(std::move(*literal));

            auto rest = co_await dlg->read_line(timeout);
            if (!rest)
                co_return fail<response_line>(on_transport_error(std::move(rest).error()));
            out.text += *rest;
        }
        co_return out;
    }

    static void apply_tagged(response& resp, std::string_view line, std::string_view tag)
    {
        resp.tagged_line.assign(line);
        auto [word, text] = detail::split_token(line.substr(tag.size()));
        resp.text.assign(text);
        if (detail::iequals_ascii(word, "OK"))
            resp.st = status::ok;
        else if (detail::iequals_ascii(word, "NO"))
            resp.st = status::no;
        else if (detail::iequals_ascii(word, "BAD"))
            resp.st = status::bad;
        else
            resp.st = status::unknown;
    }

    result<response> finalize(response&& resp, std::string_view cmd) const
    {
        const auto kind = error_kind_for(resp.st);
        if (!kind)
            return std::move(resp);

        std::string message;
        switch (*kind)
        {
            case error_kind::tagged_no: message = "server refused: " + resp.text; break;
            case error_kind::tagged_bad: message = "server rejected command: " + resp.text; break;
            default: message = "unrecognised completion"; break;
        }
        return fail<response>(map_imap_error(*kind), std::move(message),
            make_imap_detail(resp.tag, cmd, resp.tagged_line, resp.untagged.size(), options_.redact_secrets_in_trace));
    }

    any_io_executor executor_;
    account_config config_;
    options options_;
    std::unique_ptr<ssl::context> tls_context_;
    std::optional<dialog_type> dialog_;
    connection_state state_{connection_state::disconnected};
    std::optional<std::string> selected_folder_;
    capability_set capabilities_;
    bool capabilities_known_{false};
    std::uint32_t tag_counter_{0};
};

} // namespace mailsync::imap
