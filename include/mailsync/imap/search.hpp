/*

imap/search.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mailsync/detail/append.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/detail/sanitize.hpp>

namespace mailsync::imap
{

/// dd-Mon-yyyy as used by SEARCH date keys
[[nodiscard]] inline std::string format_search_date(std::chrono::year_month_day date)
{
    static constexpr const char* months[] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    const unsigned m = static_cast<unsigned>(date.month());
    return std::format("{:02}-{}-{:04}", static_cast<unsigned>(date.day()),
        months[(m >= 1 && m <= 12) ? m - 1 : 0], static_cast<int>(date.year()));
}

/// Calendar day `days` before `now`, in UTC
[[nodiscard]] inline std::chrono::year_month_day days_before(std::chrono::system_clock::time_point now, unsigned days)
{
    const auto day = std::chrono::floor<std::chrono::days>(now) - std::chrono::days{days};
    return std::chrono::year_month_day{day};
}

/**
SEARCH key tree.

Leaves carry at most two string arguments or one number; NOT, OR and AND hold
children. AND is plain juxtaposition on the wire.
**/
class search_criteria
{
public:
    enum class key
    {
        all, answered, deleted, draft, flagged, new_, old, recent, seen,
        unanswered, undeleted, unflagged, unseen,
        bcc, body, cc, from, subject, text, to,
        header, keyword, unkeyword,
        larger, smaller,
        before, on, since,
        uid, modseq,
        negate, either, all_of
    };

    static search_criteria all() { return search_criteria(key::all); }
    static search_criteria answered() { return search_criteria(key::answered); }
    static search_criteria deleted() { return search_criteria(key::deleted); }
    static search_criteria draft() { return search_criteria(key::draft); }
    static search_criteria flagged() { return search_criteria(key::flagged); }
    static search_criteria new_messages() { return search_criteria(key::new_); }
    static search_criteria old() { return search_criteria(key::old); }
    static search_criteria recent() { return search_criteria(key::recent); }
    static search_criteria seen() { return search_criteria(key::seen); }
    static search_criteria unanswered() { return search_criteria(key::unanswered); }
    static search_criteria undeleted() { return search_criteria(key::undeleted); }
    static search_criteria unflagged() { return search_criteria(key::unflagged); }
    static search_criteria unseen() { return search_criteria(key::unseen); }

    static search_criteria bcc(std::string v) { return search_criteria(key::bcc, std::move(v)); }
    static search_criteria body(std::string v) { return search_criteria(key::body, std::move(v)); }
    static search_criteria cc(std::string v) { return search_criteria(key::cc, std::move(v)); }
    static search_criteria from(std::string v) { return search_criteria(key::from, std::move(v)); }
    static search_criteria subject(std::string v) { return search_criteria(key::subject, std::move(v)); }
    static search_criteria text(std::string v) { return search_criteria(key::text, std::move(v)); }
    static search_criteria to(std::string v) { return search_criteria(key::to, std::move(v)); }
    static search_criteria keyword(std::string v) { return search_criteria(key::keyword, std::move(v)); }
    static search_criteria unkeyword(std::string v) { return search_criteria(key::unkeyword, std::move(v)); }

    static search_criteria header(std::string field, std::string value)
    {
        search_criteria c(key::header, std::move(field));
        c.arg2_ = std::move(value);
        return c;
    }

    static search_criteria larger(std::uint64_t n) { return numeric(key::larger, n); }
    static search_criteria smaller(std::uint64_t n) { return numeric(key::smaller, n); }
    static search_criteria modseq(std::uint64_t n) { return numeric(key::modseq, n); }

    static search_criteria before(std::chrono::year_month_day d) { return search_criteria(key::before, format_search_date(d)); }
    static search_criteria on(std::chrono::year_month_day d) { return search_criteria(key::on, format_search_date(d)); }
    static search_criteria since(std::chrono::year_month_day d) { return search_criteria(key::since, format_search_date(d)); }

    /// `set` is a sequence set such as "5:*" or "1,3:7"
    static search_criteria uid(std::string set) { return search_criteria(key::uid, std::move(set)); }

    static search_criteria negate(search_criteria c)
    {
        search_criteria n(key::negate);
        n.children_.push_back(std::move(c));
        return n;
    }

    static search_criteria either(search_criteria a, search_criteria b)
    {
        search_criteria n(key::either);
        n.children_.push_back(std::move(a));
        n.children_.push_back(std::move(b));
        return n;
    }

    static search_criteria all_of(std::vector<search_criteria> items)
    {
        search_criteria n(key::all_of);
        n.children_ = std::move(items);
        return n;
    }

    [[nodiscard]] key kind() const noexcept { return key_; }

    [[nodiscard]] result<std::string> to_imap() const
    {
        std::string out;
        if (auto res = append_to(out); !res)
            return fail<std::string>(std::move(res).error());
        return out;
    }

private:
    explicit search_criteria(key k, std::string arg = {})
        : key_(k), arg_(std::move(arg))
    {
    }

    static search_criteria numeric(key k, std::uint64_t n)
    {
        search_criteria c(k);
        c.number_ = n;
        return c;
    }

    static std::string_view keyword_of(key k) noexcept
    {
        switch (k)
        {
            case key::all: return "ALL";
            case key::answered: return "ANSWERED";
            case key::deleted: return "DELETED";
            case key::draft: return "DRAFT";
            case key::flagged: return "FLAGGED";
            case key::new_: return "NEW";
            case key::old: return "OLD";
            case key::recent: return "RECENT";
            case key::seen: return "SEEN";
            case key::unanswered: return "UNANSWERED";
            case key::undeleted: return "UNDELETED";
            case key::unflagged: return "UNFLAGGED";
            case key::unseen: return "UNSEEN";
            case key::bcc: return "BCC";
            case key::body: return "BODY";
            case key::cc: return "CC";
            case key::from: return "FROM";
            case key::subject: return "SUBJECT";
            case key::text: return "TEXT";
            case key::to: return "TO";
            case key::header: return "HEADER";
            case key::keyword: return "KEYWORD";
            case key::unkeyword: return "UNKEYWORD";
            case key::larger: return "LARGER";
            case key::smaller: return "SMALLER";
            case key::before: return "BEFORE";
            case key::on: return "ON";
            case key::since: return "SINCE";
            case key::uid: return "UID";
            case key::modseq: return "MODSEQ";
            case key::negate: return "NOT";
            case key::either: return "OR";
            case key::all_of: return "";
        }
        return "";
    }

    result_void append_quoted_arg(std::string& out, std::string_view value) const
    {
        if (auto res = mailsync::detail::ensure_no_crlf_or_nul(value, "search argument"); !res)
            return res;
        mailsync::detail::append_space(out);
        mailsync::detail::append_quoted(out, value);
        return ok();
    }

    result_void append_to(std::string& out) const
    {
        switch (key_)
        {
            case key::bcc: case key::body: case key::cc: case key::from:
            case key::subject: case key::text: case key::to:
            case key::keyword: case key::unkeyword:
                mailsync::detail::append_sv(out, keyword_of(key_));
                return append_quoted_arg(out, arg_);

            case key::header:
                mailsync::detail::append_sv(out, "HEADER");
                if (auto res = append_quoted_arg(out, arg_); !res)
                    return res;
                return append_quoted_arg(out, arg2_);

            case key::larger: case key::smaller: case key::modseq:
                mailsync::detail::append_sv(out, keyword_of(key_));
                mailsync::detail::append_space(out);
                mailsync::detail::append_uint(out, number_);
                return ok();

            case key::before: case key::on: case key::since:
                mailsync::detail::append_sv(out, keyword_of(key_));
                mailsync::detail::append_space(out);
                mailsync::detail::append_sv(out, arg_);
                return ok();

            case key::uid:
                if (arg_.empty() || arg_.find_first_not_of("0123456789,:*") != std::string::npos)
                    return fail(errc::codec_invalid_input, "invalid UID set in search", arg_);
                mailsync::detail::append_sv(out, "UID ");
                mailsync::detail::append_sv(out, arg_);
                return ok();

            case key::negate:
            case key::either:
                mailsync::detail::append_sv(out, keyword_of(key_));
                for (const auto& child : children_)
                {
                    mailsync::detail::append_space(out);
                    if (auto res = child.append_nested(out); !res)
                        return res;
                }
                return ok();

            case key::all_of:
                if (children_.empty())
                    return fail(errc::codec_invalid_input, "empty AND search");
                for (std::size_t i = 0; i < children_.size(); ++i)
                {
                    if (i > 0)
                        mailsync::detail::append_space(out);
                    if (auto res = children_[i].append_to(out); !res)
                        return res;
                }
                return ok();

            default:
                mailsync::detail::append_sv(out, keyword_of(key_));
                return ok();
        }
    }

    /// Operands of NOT / OR that are conjunctions need parentheses
    result_void append_nested(std::string& out) const
    {
        if (key_ != key::all_of || children_.size() < 2)
            return append_to(out);
        out.push_back('(');
        if (auto res = append_to(out); !res)
            return res;
        out.push_back(')');
        return ok();
    }

    key key_;
    std::string arg_;
    std::string arg2_;
    std::uint64_t number_{0};
    std::vector<search_criteria> children_;
};

} // namespace mailsync::imap
