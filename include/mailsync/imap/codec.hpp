/*

imap/codec.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Stateless IMAP command formatting and response parsing. Formatters return the
command text without tag or CRLF; parsers never look at the wire.

*/

#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/redact.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/detail/sanitize.hpp>
#include <mailsync/detail/sasl.hpp>
#include <mailsync/imap/search.hpp>
#include <mailsync/imap/types.hpp>

namespace mailsync::imap
{

namespace detail
{

using mailsync::detail::iequals_ascii;
using mailsync::detail::starts_with_ci;

[[nodiscard]] inline std::string_view ltrim(std::string_view text) noexcept
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    return text;
}

[[nodiscard]] inline std::pair<std::string_view, std::string_view> split_token(std::string_view text) noexcept
{
    text = ltrim(text);
    const auto pos = text.find(' ');
    if (pos == std::string_view::npos)
        return {text, std::string_view{}};
    return {text.substr(0, pos), ltrim(text.substr(pos + 1))};
}

template<typename T>
[[nodiscard]] bool parse_number(std::string_view token, T& out) noexcept
{
    if (token.empty())
        return false;
    T value{};
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size())
        return false;
    out = value;
    return true;
}

[[nodiscard]] inline std::string to_upper_ascii(std::string_view input)
{
    std::string out(input);
    for (char& ch : out)
    {
        if (ch >= 'a' && ch <= 'z')
            ch = static_cast<char>(ch - ('a' - 'A'));
    }
    return out;
}

/// Parsed IMAP data item: NIL, atom, string (quoted or literal) or parenthesized list
struct value
{
    enum class kind
    {
        nil,
        atom,
        string,
        list
    };

    kind type = kind::nil;
    std::string text;
    std::vector<value> items;
    std::string_view raw;

    [[nodiscard]] bool is_nil() const noexcept { return type == kind::nil; }
    [[nodiscard]] bool is_list() const noexcept { return type == kind::list; }

    [[nodiscard]] std::optional<std::string> nstring() const
    {
        if (is_nil())
            return std::nullopt;
        return text;
    }
};

/**
Cursor over the data part of a response line.

Quote state is tracked while matching parentheses, so `(` or `)` inside a quoted
string never changes nesting. A `{n}` marker takes the next payload from the
literals that came with the line.
**/
class value_reader
{
public:
    explicit value_reader(std::string_view text, const std::vector<std::string>* literals = nullptr) noexcept
        : text_(text), literals_(literals)
    {
    }

    [[nodiscard]] bool at_end() noexcept
    {
        skip_spaces();
        return pos_ >= text_.size();
    }

    [[nodiscard]] std::string_view rest() const noexcept
    {
        return text_.substr(std::min(pos_, text_.size()));
    }

    result<value> next()
    {
        skip_spaces();
        if (pos_ >= text_.size())
            return parse_error("unexpected end of data");

        const std::size_t start = pos_;
        result<value> out = read_any();
        if (out)
            out->raw = text_.substr(start, pos_ - start);
        return out;
    }

private:
    result<value> read_any()
    {
        const char ch = text_[pos_];
        if (ch == '(')
            return read_list();
        if (ch == ')')
            return parse_error("unbalanced ')'");
        if (ch == '"')
            return read_quoted();
        if (ch == '{')
            return read_literal();
        return read_atom();
    }

    result<value> read_list()
    {
        ++pos_;
        value out;
        out.type = value::kind::list;
        while (true)
        {
            skip_spaces();
            if (pos_ >= text_.size())
                return parse_error("unbalanced '('");
            if (text_[pos_] == ')')
            {
                ++pos_;
                return out;
            }
            auto item = next();
            if (!item)
                return item;
            out.items.push_back(std::move(*item));
        }
    }

    result<value> read_quoted()
    {
        ++pos_;
        value out;
        out.type = value::kind::string;
        while (pos_ < text_.size())
        {
            const char ch = text_[pos_++];
            if (ch == '"')
                return out;
            if (ch == '\\' && pos_ < text_.size())
            {
                out.text.push_back(text_[pos_++]);
                continue;
            }
            out.text.push_back(ch);
        }
        return parse_error("unterminated quoted string");
    }

    result<value> read_literal()
    {
        const auto close = text_.find('}', pos_);
        if (close == std::string_view::npos)
            return parse_error("unterminated literal marker");
        std::string_view digits = text_.substr(pos_ + 1, close - pos_ - 1);
        if (!digits.empty() && digits.back() == '+')
            digits.remove_suffix(1);
        std::size_t size = 0;
        if (!parse_number(digits, size))
            return parse_error("invalid literal size");
        pos_ = close + 1;

        if (literals_ == nullptr || next_literal_ >= literals_->size())
            return parse_error("literal payload missing");
        value out;
        out.type = value::kind::string;
        out.text = (*literals_)[next_literal_++];
        if (out.text.size() != size)
            return parse_error("literal size mismatch");
        return out;
    }

    // Atoms may carry bracketed sections such as BODY[HEADER.FIELDS (FROM)]
    result<value> read_atom()
    {
        const std::size_t start = pos_;
        int brackets = 0;
        while (pos_ < text_.size())
        {
            const char ch = text_[pos_];
            if (ch == '[')
                ++brackets;
            else if (ch == ']' && brackets > 0)
                --brackets;
            else if (brackets == 0 && (ch == ' ' || ch == '(' || ch == ')' || ch == '"'))
                break;
            ++pos_;
        }
        if (brackets != 0)
            return parse_error("unbalanced '['");

        value out;
        const std::string_view token = text_.substr(start, pos_ - start);
        if (iequals_ascii(token, "NIL"))
            return out;
        out.type = value::kind::atom;
        out.text.assign(token);
        return out;
    }

    void skip_spaces() noexcept
    {
        while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t'))
            ++pos_;
    }

    static result<value> parse_error(std::string message)
    {
        return fail<value>(errc::imap_parse_error, std::move(message));
    }

    std::string_view text_;
    const std::vector<std::string>* literals_;
    std::size_t pos_{0};
    std::size_t next_literal_{0};
};

[[nodiscard]] inline result<std::string> quote(std::string_view text, std::string_view field)
{
    MAILSYNC_TRY_VOID(mailsync::detail::ensure_no_crlf_or_nul(text, field));
    std::string out;
    mailsync::detail::append_quoted(out, text);
    return out;
}

[[nodiscard]] inline result_void check_sequence_set(std::string_view set)
{
    if (set.empty() || set.find_first_not_of("0123456789,:*") != std::string_view::npos)
        return fail(errc::codec_invalid_input, "invalid sequence set", std::string(set));
    return ok();
}

[[nodiscard]] inline result<std::string> unary_mailbox_command(std::string_view verb, std::string_view mailbox)
{
    std::string quoted;
    MAILSYNC_TRY_ASSIGN(quoted, quote(mailbox, "mailbox"));
    std::string cmd(verb);
    mailsync::detail::append_space(cmd);
    mailsync::detail::append_sv(cmd, quoted);
    return cmd;
}

} // namespace detail

// ==================== Formatting ====================

[[nodiscard]] inline result<std::string> format_login(std::string_view username, std::string_view password)
{
    std::string user;
    std::string pass;
    MAILSYNC_TRY_ASSIGN(user, detail::quote(username, "username"));
    MAILSYNC_TRY_ASSIGN(pass, detail::quote(password, "password"));
    return "LOGIN " + user + " " + pass;
}

/// `SELECT "INBOX"`
[[nodiscard]] inline result<std::string> format_select(std::string_view mailbox)
{
    return detail::unary_mailbox_command("SELECT", mailbox);
}

[[nodiscard]] inline result<std::string> format_select_condstore(std::string_view mailbox)
{
    std::string cmd;
    MAILSYNC_TRY_ASSIGN(cmd, detail::unary_mailbox_command("SELECT", mailbox));
    return cmd + " (CONDSTORE)";
}

[[nodiscard]] inline result<std::string> format_examine(std::string_view mailbox)
{
    return detail::unary_mailbox_command("EXAMINE", mailbox);
}

[[nodiscard]] inline result<std::string> format_create(std::string_view mailbox)
{
    return detail::unary_mailbox_command("CREATE", mailbox);
}

[[nodiscard]] inline result<std::string> format_delete(std::string_view mailbox)
{
    return detail::unary_mailbox_command("DELETE", mailbox);
}

[[nodiscard]] inline result<std::string> format_subscribe(std::string_view mailbox)
{
    return detail::unary_mailbox_command("SUBSCRIBE", mailbox);
}

[[nodiscard]] inline result<std::string> format_unsubscribe(std::string_view mailbox)
{
    return detail::unary_mailbox_command("UNSUBSCRIBE", mailbox);
}

[[nodiscard]] inline result<std::string> format_rename(std::string_view from, std::string_view to)
{
    std::string cmd;
    std::string target;
    MAILSYNC_TRY_ASSIGN(cmd, detail::unary_mailbox_command("RENAME", from));
    MAILSYNC_TRY_ASSIGN(target, detail::quote(to, "mailbox"));
    return cmd + " " + target;
}

[[nodiscard]] inline result<std::string> format_list(std::string_view reference, std::string_view pattern)
{
    std::string ref;
    std::string pat;
    MAILSYNC_TRY_ASSIGN(ref, detail::quote(reference, "reference"));
    MAILSYNC_TRY_ASSIGN(pat, detail::quote(pattern, "pattern"));
    return "LIST " + ref + " " + pat;
}

[[nodiscard]] inline result<std::string> format_lsub(std::string_view reference, std::string_view pattern)
{
    std::string ref;
    std::string pat;
    MAILSYNC_TRY_ASSIGN(ref, detail::quote(reference, "reference"));
    MAILSYNC_TRY_ASSIGN(pat, detail::quote(pattern, "pattern"));
    return "LSUB " + ref + " " + pat;
}

/// Items the synchronisation engine asks for; the body only when wanted
[[nodiscard]] inline std::vector<std::string> sync_fetch_items(bool with_body)
{
    std::vector<std::string> items{"UID", "FLAGS", "ENVELOPE", "INTERNALDATE", "RFC822.SIZE"};
    if (with_body)
        items.emplace_back("BODY.PEEK[]");
    return items;
}

/**
`[UID ]FETCH <set> (<items>)[ (CHANGEDSINCE <modseq>)]`
**/
[[nodiscard]] inline result<std::string> format_fetch(std::string_view set, const std::vector<std::string>& items,
    bool uid = false, std::optional<std::uint64_t> changed_since = std::nullopt)
{
    MAILSYNC_TRY_VOID(detail::check_sequence_set(set));
    if (items.empty())
        return fail<std::string>(errc::codec_invalid_input, "FETCH needs at least one item");

    std::string cmd = uid ? "UID FETCH " : "FETCH ";
    mailsync::detail::append_sv(cmd, set);
    cmd += " (";
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        MAILSYNC_TRY_VOID(mailsync::detail::ensure_no_crlf_or_nul(items[i], "fetch item"));
        if (i > 0)
            mailsync::detail::append_space(cmd);
        mailsync::detail::append_sv(cmd, items[i]);
    }
    cmd.push_back(')');
    if (changed_since)
    {
        cmd += " (CHANGEDSINCE ";
        mailsync::detail::append_uint(cmd, *changed_since);
        cmd.push_back(')');
    }
    return cmd;
}

[[nodiscard]] inline result<std::string> format_search(const search_criteria& criteria, bool uid = false)
{
    std::string keys;
    MAILSYNC_TRY_ASSIGN(keys, criteria.to_imap());
    return (uid ? "UID SEARCH " : "SEARCH ") + keys;
}

enum class store_mode
{
    replace,
    add,
    remove
};

[[nodiscard]] inline std::string format_flag_list(const flag_set& flags)
{
    std::string out = "(";
    bool first = true;
    for (const auto& flag : flags)
    {
        if (!first)
            mailsync::detail::append_space(out);
        first = false;
        mailsync::detail::append_sv(out, flag.to_imap());
    }
    out.push_back(')');
    return out;
}

/// `[UID ]STORE <set> [+|-]FLAGS[.SILENT] (<flags>)`
[[nodiscard]] inline result<std::string> format_store(std::string_view set, store_mode mode, const flag_set& flags,
    bool silent = false, bool uid = false)
{
    MAILSYNC_TRY_VOID(detail::check_sequence_set(set));
    for (const auto& flag : flags)
    {
        const std::string text = flag.to_imap();
        if (text.empty() || text.find_first_of(" ()\"\r\n") != std::string::npos)
            return fail<std::string>(errc::codec_invalid_input, "invalid flag", text);
    }

    std::string cmd = uid ? "UID STORE " : "STORE ";
    mailsync::detail::append_sv(cmd, set);
    mailsync::detail::append_space(cmd);
    if (mode == store_mode::add)
        cmd.push_back('+');
    else if (mode == store_mode::remove)
        cmd.push_back('-');
    cmd += silent ? "FLAGS.SILENT " : "FLAGS ";
    cmd += format_flag_list(flags);
    return cmd;
}

[[nodiscard]] inline result<std::string> format_copy(std::string_view set, std::string_view mailbox, bool uid = false)
{
    MAILSYNC_TRY_VOID(detail::check_sequence_set(set));
    std::string target;
    MAILSYNC_TRY_ASSIGN(target, detail::quote(mailbox, "mailbox"));
    return std::string(uid ? "UID COPY " : "COPY ") + std::string(set) + " " + target;
}

[[nodiscard]] inline result<std::string> format_move(std::string_view set, std::string_view mailbox, bool uid = false)
{
    MAILSYNC_TRY_VOID(detail::check_sequence_set(set));
    std::string target;
    MAILSYNC_TRY_ASSIGN(target, detail::quote(mailbox, "mailbox"));
    return std::string(uid ? "UID MOVE " : "MOVE ") + std::string(set) + " " + target;
}

/// Default STATUS items; HIGHESTMODSEQ only where CONDSTORE is available
[[nodiscard]] inline std::vector<std::string> default_status_items(bool condstore)
{
    std::vector<std::string> items{"MESSAGES", "RECENT", "UIDNEXT", "UIDVALIDITY", "UNSEEN"};
    if (condstore)
        items.emplace_back("HIGHESTMODSEQ");
    return items;
}

[[nodiscard]] inline result<std::string> format_status(std::string_view mailbox, const std::vector<std::string>& items)
{
    std::string cmd;
    MAILSYNC_TRY_ASSIGN(cmd, detail::unary_mailbox_command("STATUS", mailbox));
    cmd += " (";
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
            mailsync::detail::append_space(cmd);
        mailsync::detail::append_sv(cmd, items[i]);
    }
    cmd.push_back(')');
    return cmd;
}

[[nodiscard]] inline std::string format_expunge() { return "EXPUNGE"; }
[[nodiscard]] inline std::string format_idle() { return "IDLE"; }
[[nodiscard]] inline std::string format_done() { return "DONE"; }
[[nodiscard]] inline std::string format_capability() { return "CAPABILITY"; }
[[nodiscard]] inline std::string format_noop() { return "NOOP"; }
[[nodiscard]] inline std::string format_logout() { return "LOGOUT"; }
[[nodiscard]] inline std::string format_starttls() { return "STARTTLS"; }

/// `AUTHENTICATE PLAIN <base64(\0user\0pass)>`
[[nodiscard]] inline std::string format_authenticate_plain(std::string_view username, std::string_view password)
{
    return "AUTHENTICATE PLAIN " + mailsync::sasl::encode_plain(username, password);
}

/// Token blob packed per `format`, sent under the matching mechanism name
[[nodiscard]] inline std::string format_authenticate_token(std::string_view identity, std::string_view token,
    token_format format = token_format::nul_separated)
{
    if (format == token_format::xoauth2)
        return "AUTHENTICATE XOAUTH2 " + mailsync::sasl::encode_xoauth2(identity, token);
    return "AUTHENTICATE XOAUTH2 " + mailsync::sasl::encode_token(identity, token);
}

// ==================== Capabilities ====================

[[nodiscard]] inline std::optional<capability> capability_from_token(std::string_view token)
{
    const std::string upper = detail::to_upper_ascii(token);
    if (upper == "IMAP4REV1") return capability::imap4rev1;
    if (upper == "STARTTLS") return capability::starttls;
    if (upper == "LOGINDISABLED") return capability::logindisabled;
    if (upper == "SASL-IR") return capability::sasl_ir;
    if (upper == "AUTH=PLAIN") return capability::auth_plain;
    if (upper == "AUTH=LOGIN") return capability::auth_login;
    if (upper == "AUTH=XOAUTH2") return capability::auth_xoauth2;
    if (upper == "IDLE") return capability::idle;
    if (upper == "NAMESPACE") return capability::namespace_;
    if (upper == "UNSELECT") return capability::unselect;
    if (upper == "CHILDREN") return capability::children;
    if (upper == "UIDPLUS") return capability::uidplus;
    if (upper == "CONDSTORE") return capability::condstore;
    if (upper == "QRESYNC") return capability::qresync;
    if (upper == "MOVE") return capability::move;
    if (upper == "SPECIAL-USE") return capability::special_use;
    return std::nullopt;
}

[[nodiscard]] constexpr std::string_view to_string(capability cap) noexcept
{
    switch (cap)
    {
        case capability::imap4rev1: return "IMAP4rev1";
        case capability::starttls: return "STARTTLS";
        case capability::logindisabled: return "LOGINDISABLED";
        case capability::sasl_ir: return "SASL-IR";
        case capability::auth_plain: return "AUTH=PLAIN";
        case capability::auth_login: return "AUTH=LOGIN";
        case capability::auth_xoauth2: return "AUTH=XOAUTH2";
        case capability::idle: return "IDLE";
        case capability::namespace_: return "NAMESPACE";
        case capability::unselect: return "UNSELECT";
        case capability::children: return "CHILDREN";
        case capability::uidplus: return "UIDPLUS";
        case capability::condstore: return "CONDSTORE";
        case capability::qresync: return "QRESYNC";
        case capability::move: return "MOVE";
        case capability::special_use: return "SPECIAL-USE";
    }
    return "";
}

inline void add_capability_token(capability_set& caps, std::string_view token)
{
    if (token.empty())
        return;
    if (auto cap = capability_from_token(token))
    {
        caps.known.insert(*cap);
        return;
    }
    for (const auto& existing : caps.custom)
    {
        if (detail::iequals_ascii(existing, token))
            return;
    }
    caps.custom.emplace_back(token);
}

/**
Collect capabilities from `* CAPABILITY ...` lines and from `[CAPABILITY ...]`
response codes (greeting or tagged OK). Text may span several lines.
**/
[[nodiscard]] inline capability_set parse_capabilities(std::string_view text)
{
    capability_set caps;
    while (!text.empty())
    {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        std::string_view tokens;
        if (detail::starts_with_ci(line, "* CAPABILITY "))
        {
            tokens = line.substr(13);
        }
        else
        {
            const std::string upper = detail::to_upper_ascii(line);
            const auto open = upper.find("[CAPABILITY ");
            if (open == std::string::npos)
                continue;
            const auto close = line.find(']', open);
            if (close == std::string_view::npos)
                continue;
            tokens = line.substr(open + 12, close - open - 12);
        }

        while (!tokens.empty())
        {
            auto [token, rest] = detail::split_token(tokens);
            add_capability_token(caps, token);
            tokens = rest;
        }
    }
    return caps;
}

[[nodiscard]] inline capability_set parse_capabilities(const response& resp)
{
    capability_set caps;
    for (const auto& line : resp.untagged)
    {
        const capability_set part = parse_capabilities(line.text);
        caps.known.insert(part.known.begin(), part.known.end());
        for (const auto& custom : part.custom)
            add_capability_token(caps, custom);
    }
    const capability_set tagged = parse_capabilities(resp.tagged_line);
    caps.known.insert(tagged.known.begin(), tagged.known.end());
    for (const auto& custom : tagged.custom)
        add_capability_token(caps, custom);
    return caps;
}

/// Inverse of parse_capabilities: one `* CAPABILITY` line
[[nodiscard]] inline std::string format_capabilities(const capability_set& caps)
{
    std::string out = "* CAPABILITY";
    for (capability cap : caps.known)
    {
        mailsync::detail::append_space(out);
        mailsync::detail::append_sv(out, to_string(cap));
    }
    for (const auto& custom : caps.custom)
    {
        mailsync::detail::append_space(out);
        mailsync::detail::append_sv(out, custom);
    }
    return out;
}

// ==================== Flags and folders ====================

[[nodiscard]] inline message_flag parse_flag(std::string_view token)
{
    const std::string upper = detail::to_upper_ascii(token);
    if (upper == "\\SEEN") return message_flag::seen();
    if (upper == "\\ANSWERED") return message_flag::answered();
    if (upper == "\\FLAGGED") return message_flag::flagged();
    if (upper == "\\DELETED") return message_flag::deleted();
    if (upper == "\\DRAFT") return message_flag::draft();
    if (upper == "\\RECENT") return message_flag{flag_kind::recent, {}};
    return message_flag::custom(std::string(token));
}

[[nodiscard]] inline result<flag_set> parse_flag_list(const detail::value& list)
{
    if (!list.is_list())
        return fail<flag_set>(errc::imap_parse_error, "flag list expected", std::string(list.raw));
    flag_set flags;
    for (const auto& item : list.items)
        flags.insert(parse_flag(item.text));
    return flags;
}

[[nodiscard]] inline std::optional<folder_attribute> folder_attribute_from_token(std::string_view token)
{
    const std::string upper = detail::to_upper_ascii(token);
    if (upper == "\\NOINFERIORS") return folder_attribute::noinferiors;
    if (upper == "\\NOSELECT") return folder_attribute::noselect;
    if (upper == "\\MARKED") return folder_attribute::marked;
    if (upper == "\\UNMARKED") return folder_attribute::unmarked;
    if (upper == "\\HASCHILDREN") return folder_attribute::has_children;
    if (upper == "\\HASNOCHILDREN") return folder_attribute::has_no_children;
    if (upper == "\\ALL") return folder_attribute::all;
    if (upper == "\\ARCHIVE") return folder_attribute::archive;
    if (upper == "\\DRAFTS") return folder_attribute::drafts;
    if (upper == "\\FLAGGED") return folder_attribute::flagged;
    if (upper == "\\JUNK") return folder_attribute::junk;
    if (upper == "\\SENT") return folder_attribute::sent;
    if (upper == "\\TRASH") return folder_attribute::trash;
    return std::nullopt;
}

/// `* LIST (\HasNoChildren) "/" "INBOX"` (or LSUB)
[[nodiscard]] inline result<folder> parse_list_line(std::string_view line, const std::vector<std::string>& literals = {})
{
    auto [star, rest] = detail::split_token(line);
    auto [keyword, data] = detail::split_token(rest);
    if (star != "*" || !(detail::iequals_ascii(keyword, "LIST") || detail::iequals_ascii(keyword, "LSUB")))
        return fail<folder>(errc::imap_parse_error, "not a LIST response", std::string(line));

    detail::value_reader reader(data, &literals);
    detail::value attrs;
    detail::value delimiter;
    detail::value name;
    MAILSYNC_TRY_ASSIGN(attrs, reader.next());
    MAILSYNC_TRY_ASSIGN(delimiter, reader.next());
    MAILSYNC_TRY_ASSIGN(name, reader.next());
    if (!attrs.is_list() || name.is_nil() || name.is_list() || delimiter.is_list())
        return fail<folder>(errc::imap_parse_error, "malformed LIST response", std::string(line));

    folder out;
    out.name = name.text;
    if (!delimiter.is_nil() && !delimiter.text.empty())
        out.delimiter = delimiter.text.front();
    for (const auto& attr : attrs.items)
    {
        if (auto known = folder_attribute_from_token(attr.text))
            out.attributes.insert(*known);
        else
            out.custom_attributes.push_back(attr.text);
    }
    return out;
}

[[nodiscard]] inline result<std::vector<folder>> parse_folders(const response& resp)
{
    std::vector<folder> folders;
    for (const auto& line : resp.untagged)
    {
        if (!detail::starts_with_ci(line.text, "* LIST ") && !detail::starts_with_ci(line.text, "* LSUB "))
            continue;
        folder f;
        MAILSYNC_TRY_ASSIGN(f, parse_list_line(line.text, line.literals));
        folders.push_back(std::move(f));
    }
    return folders;
}

// ==================== Envelope ====================

/// Raw text of each item of one parenthesized list
[[nodiscard]] inline result<std::vector<std::string>> split_top_level(std::string_view text,
    const std::vector<std::string>& literals = {})
{
    detail::value_reader reader(text, &literals);
    detail::value list;
    MAILSYNC_TRY_ASSIGN(list, reader.next());
    if (!list.is_list())
        return fail<std::vector<std::string>>(errc::imap_parse_error, "parenthesized list expected", std::string(text));
    if (!reader.at_end())
        return fail<std::vector<std::string>>(errc::imap_parse_error, "trailing data after list", std::string(reader.rest()));

    std::vector<std::string> out;
    out.reserve(list.items.size());
    for (const auto& item : list.items)
        out.emplace_back(item.raw);
    return out;
}

namespace detail
{

[[nodiscard]] inline result<std::vector<address>> parse_address_list(const value& field)
{
    std::vector<address> out;
    if (field.is_nil())
        return out;
    if (!field.is_list())
        return fail<std::vector<address>>(errc::imap_parse_error, "address list expected", std::string(field.raw));

    for (const auto& entry : field.items)
    {
        if (!entry.is_list() || entry.items.size() != 4)
            return fail<std::vector<address>>(errc::imap_parse_error, "address must have four fields", std::string(entry.raw));
        // Group start / end markers carry a NIL host
        if (entry.items[2].is_nil() || entry.items[3].is_nil())
            continue;
        address addr;
        addr.name = entry.items[0].nstring();
        addr.source_route = entry.items[1].nstring();
        addr.mailbox = entry.items[2].text;
        addr.host = entry.items[3].text;
        out.push_back(std::move(addr));
    }
    return out;
}

[[nodiscard]] inline result<envelope> envelope_from_value(const value& list)
{
    if (!list.is_list() || list.items.size() != 10)
        return fail<envelope>(errc::imap_parse_error, "envelope must have ten fields", std::string(list.raw));
    for (std::size_t i : {0u, 1u, 8u, 9u})
    {
        if (list.items[i].is_list())
            return fail<envelope>(errc::imap_parse_error, "envelope string field is a list", std::string(list.items[i].raw));
    }

    envelope env;
    env.date = list.items[0].nstring();
    env.subject = list.items[1].nstring();
    MAILSYNC_TRY_ASSIGN(env.from, parse_address_list(list.items[2]));
    MAILSYNC_TRY_ASSIGN(env.sender, parse_address_list(list.items[3]));
    MAILSYNC_TRY_ASSIGN(env.reply_to, parse_address_list(list.items[4]));
    MAILSYNC_TRY_ASSIGN(env.to, parse_address_list(list.items[5]));
    MAILSYNC_TRY_ASSIGN(env.cc, parse_address_list(list.items[6]));
    MAILSYNC_TRY_ASSIGN(env.bcc, parse_address_list(list.items[7]));
    env.in_reply_to = list.items[8].nstring();
    env.message_id = list.items[9].nstring();
    return env;
}

} // namespace detail

/**
Parse an ENVELOPE structure `(date subject from sender reply-to to cc bcc
in-reply-to message-id)`. Unbalanced or otherwise malformed input is an error,
never a partially filled envelope.
**/
[[nodiscard]] inline result<envelope> parse_envelope(std::string_view text, const std::vector<std::string>& literals = {})
{
    detail::value_reader reader(text, &literals);
    detail::value list;
    MAILSYNC_TRY_ASSIGN(list, reader.next());
    if (!reader.at_end())
        return fail<envelope>(errc::imap_parse_error, "trailing data after envelope", std::string(reader.rest()));
    return detail::envelope_from_value(list);
}

// ==================== FETCH / SEARCH / SELECT ====================

[[nodiscard]] inline bool is_fetch_line(std::string_view line)
{
    auto [star, rest] = detail::split_token(line);
    auto [number, rest2] = detail::split_token(rest);
    auto [keyword, rest3] = detail::split_token(rest2);
    (void)rest3;
    std::uint32_t seq = 0;
    return star == "*" && detail::parse_number(number, seq) && detail::iequals_ascii(keyword, "FETCH");
}

/// `* <seq> FETCH (<item> <value> ...)` with literals already attached to the line
[[nodiscard]] inline result<fetched_message> parse_fetch(const response_line& line)
{
    auto [star, rest] = detail::split_token(line.text);
    auto [number, rest2] = detail::split_token(rest);
    auto [keyword, data] = detail::split_token(rest2);

    fetched_message msg;
    if (star != "*" || !detail::parse_number(number, msg.sequence) || !detail::iequals_ascii(keyword, "FETCH"))
        return fail<fetched_message>(errc::imap_parse_error, "not a FETCH response", line.text);

    detail::value_reader reader(data, &line.literals);
    detail::value list;
    MAILSYNC_TRY_ASSIGN(list, reader.next());
    if (!list.is_list() || list.items.size() % 2 != 0)
        return fail<fetched_message>(errc::imap_parse_error, "malformed FETCH item list", line.text);

    for (std::size_t i = 0; i < list.items.size(); i += 2)
    {
        const std::string name = detail::to_upper_ascii(list.items[i].text);
        const detail::value& val = list.items[i + 1];

        if (name == "UID")
        {
            std::uint32_t uid = 0;
            if (!detail::parse_number(val.text, uid))
                return fail<fetched_message>(errc::imap_parse_error, "invalid UID", line.text);
            msg.uid = uid;
        }
        else if (name == "FLAGS")
        {
            flag_set flags;
            MAILSYNC_TRY_ASSIGN(flags, parse_flag_list(val));
            msg.flags = std::move(flags);
        }
        else if (name == "RFC822.SIZE")
        {
            std::uint64_t size = 0;
            if (!detail::parse_number(val.text, size))
                return fail<fetched_message>(errc::imap_parse_error, "invalid RFC822.SIZE", line.text);
            msg.size = size;
        }
        else if (name == "INTERNALDATE")
        {
            msg.internal_date = val.nstring();
        }
        else if (name == "ENVELOPE")
        {
            envelope env;
            MAILSYNC_TRY_ASSIGN(env, detail::envelope_from_value(val));
            msg.env = std::move(env);
        }
        else if (name == "MODSEQ")
        {
            std::uint64_t modseq = 0;
            if (!val.is_list() || val.items.size() != 1 || !detail::parse_number(val.items.front().text, modseq))
                return fail<fetched_message>(errc::imap_parse_error, "invalid MODSEQ", line.text);
            msg.modseq = modseq;
        }
        else if (name == "BODY[]" || name == "RFC822" || name.starts_with("BODY[]<"))
        {
            msg.body = val.nstring();
        }
    }
    return msg;
}

/// Every FETCH line of a response; other untagged data is ignored
[[nodiscard]] inline result<std::vector<fetched_message>> parse_fetch_response(const response& resp)
{
    std::vector<fetched_message> out;
    for (const auto& line : resp.untagged)
    {
        if (!is_fetch_line(line.text))
            continue;
        fetched_message msg;
        MAILSYNC_TRY_ASSIGN(msg, parse_fetch(line));
        out.push_back(std::move(msg));
    }
    return out;
}

struct search_result
{
    std::vector<std::uint32_t> ids;
    std::optional<std::uint64_t> highest_modseq;
};

/// `* SEARCH 2 5 9 (MODSEQ 917)`
[[nodiscard]] inline search_result parse_search_line(std::string_view line)
{
    search_result out;
    auto [star, rest] = detail::split_token(line);
    auto [keyword, ids] = detail::split_token(rest);
    if (star != "*" || !detail::iequals_ascii(keyword, "SEARCH"))
        return out;

    while (!ids.empty())
    {
        if (ids.front() == '(')
        {
            const auto close = ids.find(')');
            auto [key, value] = detail::split_token(ids.substr(1, close == std::string_view::npos ? std::string_view::npos : close - 1));
            std::uint64_t modseq = 0;
            if (detail::iequals_ascii(key, "MODSEQ") && detail::parse_number(value, modseq))
                out.highest_modseq = modseq;
            break;
        }
        auto [token, remaining] = detail::split_token(ids);
        std::uint32_t id = 0;
        if (detail::parse_number(token, id))
            out.ids.push_back(id);
        ids = remaining;
    }
    return out;
}

[[nodiscard]] inline search_result parse_search(const response& resp)
{
    search_result out;
    for (const auto& line : resp.untagged)
    {
        search_result part = parse_search_line(line.text);
        out.ids.insert(out.ids.end(), part.ids.begin(), part.ids.end());
        if (part.highest_modseq)
            out.highest_modseq = part.highest_modseq;
    }
    return out;
}

namespace detail
{

/// Value of a bracketed response code such as `[UIDNEXT 42]` in an untagged OK
[[nodiscard]] inline std::optional<std::string_view> response_code_value(std::string_view line, std::string_view code)
{
    const auto open = line.find('[');
    if (open == std::string_view::npos)
        return std::nullopt;
    const auto close = line.find(']', open);
    if (close == std::string_view::npos)
        return std::nullopt;
    const std::string_view inner = line.substr(open + 1, close - open - 1);
    auto [key, value] = split_token(inner);
    if (!iequals_ascii(key, code))
        return std::nullopt;
    return value;
}

} // namespace detail

/// Apply one untagged SELECT / EXAMINE line to `st`
inline void apply_select_line(mailbox_status& st, std::string_view line)
{
    auto [star, rest] = detail::split_token(line);
    if (star != "*")
        return;
    auto [first, tail] = detail::split_token(rest);

    std::uint32_t count = 0;
    if (detail::parse_number(first, count))
    {
        auto [keyword, ignored] = detail::split_token(tail);
        (void)ignored;
        if (detail::iequals_ascii(keyword, "EXISTS"))
            st.exists = count;
        else if (detail::iequals_ascii(keyword, "RECENT"))
            st.recent = count;
        return;
    }

    if (detail::iequals_ascii(first, "FLAGS"))
    {
        detail::value_reader reader(tail);
        if (auto list = reader.next(); list)
        {
            if (auto flags = parse_flag_list(*list); flags)
                st.flags = std::move(*flags);
        }
        return;
    }

    if (!detail::iequals_ascii(first, "OK"))
        return;

    const auto number_of = [line](std::string_view code) -> std::optional<std::uint64_t>
    {
        std::uint64_t number = 0;
        auto v = detail::response_code_value(line, code);
        if (!v || !detail::parse_number(detail::split_token(*v).first, number))
            return std::nullopt;
        return number;
    };

    if (auto n = number_of("UNSEEN"))
        st.unseen = static_cast<std::uint32_t>(*n);
    if (auto n = number_of("UIDNEXT"))
        st.uid_next = static_cast<std::uint32_t>(*n);
    if (auto n = number_of("UIDVALIDITY"))
        st.uid_validity = static_cast<std::uint32_t>(*n);
    if (auto n = number_of("HIGHESTMODSEQ"))
        st.highest_modseq = *n;
    if (detail::response_code_value(line, "NOMODSEQ"))
        st.highest_modseq.reset();
    if (detail::response_code_value(line, "PERMANENTFLAGS"))
    {
        const auto open = line.find('(');
        const auto close = open == std::string_view::npos ? open : line.find(')', open);
        if (close != std::string_view::npos)
        {
            detail::value_reader reader(line.substr(open, close - open + 1));
            if (auto list = reader.next(); list)
            {
                if (auto flags = parse_flag_list(*list); flags)
                    st.permanent_flags = std::move(*flags);
            }
        }
    }
}

[[nodiscard]] inline mailbox_status parse_mailbox_status(const response& resp)
{
    mailbox_status st;
    for (const auto& line : resp.untagged)
        apply_select_line(st, line.text);
    const std::string upper = detail::to_upper_ascii(resp.tagged_line);
    st.read_only = upper.find("[READ-ONLY]") != std::string::npos;
    return st;
}

/// `* STATUS "INBOX" (MESSAGES 3 UIDNEXT 4 ...)`; MESSAGES lands in `exists`
[[nodiscard]] inline result<mailbox_status> parse_status_line(std::string_view line, const std::vector<std::string>& literals = {})
{
    auto [star, rest] = detail::split_token(line);
    auto [keyword, data] = detail::split_token(rest);
    if (star != "*" || !detail::iequals_ascii(keyword, "STATUS"))
        return fail<mailbox_status>(errc::imap_parse_error, "not a STATUS response", std::string(line));

    detail::value_reader reader(data, &literals);
    detail::value name;
    detail::value items;
    MAILSYNC_TRY_ASSIGN(name, reader.next());
    MAILSYNC_TRY_ASSIGN(items, reader.next());
    if (!items.is_list() || items.items.size() % 2 != 0)
        return fail<mailbox_status>(errc::imap_parse_error, "malformed STATUS item list", std::string(line));

    mailbox_status st;
    for (std::size_t i = 0; i < items.items.size(); i += 2)
    {
        const std::string key = detail::to_upper_ascii(items.items[i].text);
        std::uint64_t number = 0;
        if (!detail::parse_number(items.items[i + 1].text, number))
            return fail<mailbox_status>(errc::imap_parse_error, "non-numeric STATUS value", std::string(line));
        if (key == "MESSAGES")
            st.exists = static_cast<std::uint32_t>(number);
        else if (key == "RECENT")
            st.recent = static_cast<std::uint32_t>(number);
        else if (key == "UNSEEN")
            st.unseen = static_cast<std::uint32_t>(number);
        else if (key == "UIDNEXT")
            st.uid_next = static_cast<std::uint32_t>(number);
        else if (key == "UIDVALIDITY")
            st.uid_validity = static_cast<std::uint32_t>(number);
        else if (key == "HIGHESTMODSEQ")
            st.highest_modseq = number;
    }
    return st;
}

/// Compress ascending UIDs into a sequence set: {1,2,3,7} gives "1:3,7"
[[nodiscard]] inline std::string format_uid_set(const std::vector<std::uint32_t>& uids)
{
    std::string out;
    std::size_t i = 0;
    while (i < uids.size())
    {
        std::size_t j = i;
        while (j + 1 < uids.size() && std::uint64_t{uids[j + 1]} == std::uint64_t{uids[j]} + 1)
            ++j;
        if (!out.empty())
            out.push_back(',');
        mailsync::detail::append_uint(out, uids[i]);
        if (j > i)
        {
            out.push_back(':');
            mailsync::detail::append_uint(out, uids[j]);
        }
        i = j + 1;
    }
    return out;
}

} // namespace mailsync::imap
