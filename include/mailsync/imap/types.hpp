/*

imap/types.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <mailsync/net/dialog.hpp>
#include <mailsync/net/tls_mode.hpp>
#include <mailsync/net/tls_options.hpp>
#include <mailsync/oauth2/token_source.hpp>

namespace mailsync::imap
{

enum class status
{
    ok,
    no,
    bad,
    preauth,
    bye,
    unknown
};

/// Connection lifecycle; only an explicit disconnect moves backwards
enum class connection_state
{
    disconnected,
    connected,
    authenticated,
    selected
};

[[nodiscard]] constexpr std::string_view to_string(connection_state st) noexcept
{
    switch (st)
    {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connected: return "connected";
        case connection_state::authenticated: return "authenticated";
        case connection_state::selected: return "selected";
    }
    return "unknown";
}

enum class capability
{
    imap4rev1,
    starttls,
    logindisabled,
    sasl_ir,
    auth_plain,
    auth_login,
    auth_xoauth2,
    idle,
    namespace_,
    unselect,
    children,
    uidplus,
    condstore,
    qresync,
    move,
    special_use
};

struct capability_set
{
    std::set<capability> known;
    std::vector<std::string> custom;

    [[nodiscard]] bool has(capability cap) const
    {
        return known.contains(cap);
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return known.empty() && custom.empty();
    }

    bool operator==(const capability_set& other) const
    {
        return known == other.known &&
            std::set<std::string>(custom.begin(), custom.end()) == std::set<std::string>(other.custom.begin(), other.custom.end());
    }
};

enum class folder_attribute
{
    noinferiors,
    noselect,
    marked,
    unmarked,
    has_children,
    has_no_children,
    all,
    archive,
    drafts,
    flagged,
    junk,
    sent,
    trash
};

struct folder
{
    std::string name;
    std::optional<char> delimiter;
    std::set<folder_attribute> attributes;
    std::vector<std::string> custom_attributes;

    std::optional<std::uint32_t> total;
    std::optional<std::uint32_t> recent;
    std::optional<std::uint32_t> unseen;
    std::optional<std::uint32_t> uid_validity;
    std::optional<std::uint32_t> uid_next;

    [[nodiscard]] bool is_selectable() const
    {
        return !attributes.contains(folder_attribute::noselect);
    }

    [[nodiscard]] bool has_children() const
    {
        return attributes.contains(folder_attribute::has_children);
    }

    [[nodiscard]] bool is_inbox() const
    {
        if (name.size() != 5)
            return false;
        for (std::size_t i = 0; i < 5; ++i)
        {
            const char ch = name[i] >= 'a' && name[i] <= 'z' ? static_cast<char>(name[i] - ('a' - 'A')) : name[i];
            if (ch != "INBOX"[i])
                return false;
        }
        return true;
    }

    /// Last hierarchy component, the full name when there is no delimiter
    [[nodiscard]] std::string leaf_name() const
    {
        if (!delimiter)
            return name;
        const auto pos = name.rfind(*delimiter);
        return pos == std::string::npos ? name : name.substr(pos + 1);
    }
};

enum class flag_kind
{
    seen,
    answered,
    flagged,
    deleted,
    draft,
    recent,
    custom
};

struct message_flag
{
    flag_kind kind{flag_kind::custom};
    std::string keyword;

    auto operator<=>(const message_flag&) const = default;

    [[nodiscard]] std::string to_imap() const
    {
        switch (kind)
        {
            case flag_kind::seen: return "\\Seen";
            case flag_kind::answered: return "\\Answered";
            case flag_kind::flagged: return "\\Flagged";
            case flag_kind::deleted: return "\\Deleted";
            case flag_kind::draft: return "\\Draft";
            case flag_kind::recent: return "\\Recent";
            case flag_kind::custom: return keyword;
        }
        return keyword;
    }

    static message_flag seen() { return {flag_kind::seen, {}}; }
    static message_flag answered() { return {flag_kind::answered, {}}; }
    static message_flag flagged() { return {flag_kind::flagged, {}}; }
    static message_flag deleted() { return {flag_kind::deleted, {}}; }
    static message_flag draft() { return {flag_kind::draft, {}}; }
    static message_flag custom(std::string keyword) { return {flag_kind::custom, std::move(keyword)}; }
};

using flag_set = std::set<message_flag>;

struct address
{
    std::optional<std::string> name;
    std::optional<std::string> source_route;
    std::string mailbox;
    std::string host;

    [[nodiscard]] std::string email_address() const
    {
        return mailbox + "@" + host;
    }

    [[nodiscard]] std::string display() const
    {
        if (name && !name->empty())
            return *name + " <" + email_address() + ">";
        if (!mailbox.empty() && !host.empty())
            return email_address();
        return "Unknown";
    }

    bool operator==(const address&) const = default;
};

/// RFC 3501 ENVELOPE; absent (NIL) strings stay std::nullopt
struct envelope
{
    std::optional<std::string> date;
    std::optional<std::string> subject;
    std::vector<address> from;
    std::vector<address> sender;
    std::vector<address> reply_to;
    std::vector<address> to;
    std::vector<address> cc;
    std::vector<address> bcc;
    std::optional<std::string> in_reply_to;
    std::optional<std::string> message_id;
};

/// One message as reported by a FETCH response
struct fetched_message
{
    std::uint32_t sequence = 0;
    std::optional<std::uint32_t> uid;
    std::optional<flag_set> flags;
    std::optional<std::uint64_t> size;
    std::optional<std::string> internal_date;
    std::optional<envelope> env;
    std::optional<std::uint64_t> modseq;
    std::optional<std::string> body;
};

/// SELECT / EXAMINE / STATUS results
struct mailbox_status
{
    std::uint32_t exists = 0;
    std::uint32_t recent = 0;
    std::optional<std::uint32_t> unseen;
    std::uint32_t uid_next = 0;
    std::uint32_t uid_validity = 0;
    std::optional<std::uint64_t> highest_modseq;
    flag_set flags;
    flag_set permanent_flags;
    bool read_only = false;
};

/// A server line together with the literal payloads announced on it by `{n}`
struct response_line
{
    std::string text;
    std::vector<std::string> literals;
};

struct response
{
    std::string tag;
    status st = status::unknown;
    std::string text;
    std::vector<response_line> untagged;
    std::vector<std::string> continuation;
    std::string tagged_line;
};

struct password_credential
{
    std::string password;
};

/// How a token is packed into the AUTHENTICATE argument
enum class token_format
{
    nul_separated,
    xoauth2
};

struct token_credential
{
    std::shared_ptr<mailsync::oauth2::token_source> source;
    token_format format = token_format::nul_separated;
};

using credential = std::variant<password_credential, token_credential>;

/**
Everything needed to reach and log into one mailbox.

Port 993 always means implicit TLS; 143 with `use_starttls` upgrades after the
greeting.
**/
struct account_config
{
    std::string host;
    std::uint16_t port = mailsync::net::IMAPS_PORT;
    std::string username;
    credential cred = password_credential{};
    bool use_tls = true;
    bool use_starttls = false;
    unsigned timeout_seconds = 30;
    bool validate_certificates = true;

    [[nodiscard]] mailsync::net::tls_mode tls() const noexcept
    {
        return mailsync::net::select_tls_mode(port, use_tls, use_starttls);
    }

    static account_config gmail(std::string username, credential cred)
    {
        return {"imap.gmail.com", mailsync::net::IMAPS_PORT, std::move(username), std::move(cred), true, false, 30, true};
    }

    static account_config outlook(std::string username, credential cred)
    {
        return {"outlook.office365.com", mailsync::net::IMAPS_PORT, std::move(username), std::move(cred), true, false, 30, true};
    }

    static account_config yahoo(std::string username, credential cred)
    {
        return {"imap.mail.yahoo.com", mailsync::net::IMAPS_PORT, std::move(username), std::move(cred), true, false, 30, true};
    }

    static account_config plain(std::string host, std::uint16_t port, std::string username, credential cred)
    {
        return {std::move(host), port, std::move(username), std::move(cred), port == mailsync::net::IMAPS_PORT,
            port == mailsync::net::IMAP_PORT, 30, true};
    }
};

struct options
{
    std::size_t max_line_length = mailsync::net::DEFAULT_MAX_LINE_LENGTH;
    /// Refuse LOGIN / AUTHENTICATE PLAIN over a connection that is not encrypted
    bool require_tls_for_auth = false;
    bool redact_secrets_in_trace = true;
    std::chrono::seconds connect_timeout{30};
    /// Overrides the TLS settings derived from `account_config::validate_certificates`
    std::optional<mailsync::net::tls_options> tls;
};

} // namespace mailsync::imap
