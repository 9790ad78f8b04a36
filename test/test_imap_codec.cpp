/*

test_imap_codec.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_codec_test

#include <chrono>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mailsync/imap/codec.hpp>
#include <mailsync/imap/search.hpp>

namespace imap = mailsync::imap;
using mailsync::errc;


BOOST_AUTO_TEST_CASE(format_select_quotes_mailbox)
{
    auto cmd = imap::format_select("INBOX");
    BOOST_REQUIRE(cmd);
    BOOST_TEST(*cmd == "SELECT \"INBOX\"");

    auto condstore = imap::format_select_condstore("Sent Items");
    BOOST_REQUIRE(condstore);
    BOOST_TEST(*condstore == "SELECT \"Sent Items\" (CONDSTORE)");
}

BOOST_AUTO_TEST_CASE(format_rejects_crlf_injection)
{
    auto cmd = imap::format_select("INBOX\r\nA1 LOGOUT");
    BOOST_REQUIRE(!cmd);
    BOOST_TEST(cmd.error().code == errc::codec_invalid_input);

    auto login = imap::format_login("user", std::string("pa\0ss", 5));
    BOOST_TEST(!login);
}

BOOST_AUTO_TEST_CASE(format_login_escapes_quotes)
{
    auto cmd = imap::format_login("user@example.com", "se\"cret");
    BOOST_REQUIRE(cmd);
    BOOST_TEST(*cmd == "LOGIN \"user@example.com\" \"se\\\"cret\"");
}

BOOST_AUTO_TEST_CASE(format_fetch_and_store)
{
    auto fetch = imap::format_fetch("1:3,7", imap::sync_fetch_items(false), true);
    BOOST_REQUIRE(fetch);
    BOOST_TEST(*fetch == "UID FETCH 1:3,7 (UID FLAGS ENVELOPE INTERNALDATE RFC822.SIZE)");

    auto changed = imap::format_fetch("1:*", {"FLAGS"}, true, 42);
    BOOST_REQUIRE(changed);
    BOOST_TEST(*changed == "UID FETCH 1:* (FLAGS) (CHANGEDSINCE 42)");

    BOOST_TEST(!imap::format_fetch("1 2", {"FLAGS"}));
    BOOST_TEST(!imap::format_fetch("1", {}));

    auto store = imap::format_store("5", imap::store_mode::add, {imap::message_flag::seen()}, true, true);
    BOOST_REQUIRE(store);
    BOOST_TEST(*store == "UID STORE 5 +FLAGS.SILENT (\\Seen)");
}

BOOST_AUTO_TEST_CASE(format_uid_set_compresses_runs)
{
    BOOST_TEST(imap::format_uid_set({1, 2, 3, 7}) == "1:3,7");
    BOOST_TEST(imap::format_uid_set({4}) == "4");
    BOOST_TEST(imap::format_uid_set({1, 3, 4, 5, 9, 10}) == "1,3:5,9:10");
    BOOST_TEST(imap::format_uid_set({}).empty());
    // the largest UID does not run on into 0
    BOOST_TEST(imap::format_uid_set({4294967294u, 4294967295u, 0u}) == "4294967294:4294967295,0");
}

BOOST_AUTO_TEST_CASE(search_criteria_rendering)
{
    auto all = imap::format_search(imap::search_criteria::all(), true);
    BOOST_REQUIRE(all);
    BOOST_TEST(*all == "UID SEARCH ALL");

    auto combined = imap::search_criteria::all_of({
        imap::search_criteria::unseen(),
        imap::search_criteria::from("alice@example.com"),
        imap::search_criteria::since(std::chrono::year_month_day{std::chrono::year{2024}, std::chrono::month{3}, std::chrono::day{5}})});
    auto text = combined.to_imap();
    BOOST_REQUIRE(text);
    BOOST_TEST(*text == "UNSEEN FROM \"alice@example.com\" SINCE 05-Mar-2024");

    auto either = imap::search_criteria::either(imap::search_criteria::seen(),
        imap::search_criteria::negate(imap::search_criteria::flagged()));
    auto either_text = either.to_imap();
    BOOST_REQUIRE(either_text);
    BOOST_TEST(*either_text == "OR SEEN NOT FLAGGED");

    auto modseq = imap::search_criteria::modseq(918).to_imap();
    BOOST_REQUIRE(modseq);
    BOOST_TEST(*modseq == "MODSEQ 918");

    BOOST_TEST(!imap::search_criteria::uid("1:* OR").to_imap());
}

BOOST_AUTO_TEST_CASE(days_before_crosses_month)
{
    using namespace std::chrono;
    const auto now = sys_days{year{2024} / March / 3} + hours{12};
    const auto cutoff = imap::days_before(now, 7);
    BOOST_TEST(imap::format_search_date(cutoff) == "25-Feb-2024");
}

BOOST_AUTO_TEST_CASE(parse_list_line_inbox)
{
    auto f = imap::parse_list_line("* LIST (\\HasNoChildren) \"/\" \"INBOX\"");
    BOOST_REQUIRE(f);
    BOOST_TEST(f->name == "INBOX");
    BOOST_REQUIRE(f->delimiter.has_value());
    BOOST_TEST(*f->delimiter == '/');
    BOOST_TEST(f->attributes.size() == 1u);
    BOOST_TEST(f->attributes.contains(imap::folder_attribute::has_no_children));
    BOOST_TEST(f->is_selectable());
    BOOST_TEST(f->is_inbox());
}

BOOST_AUTO_TEST_CASE(parse_list_line_variants)
{
    auto noselect = imap::parse_list_line("* LIST (\\Noselect \\HasChildren \\X-Custom) \".\" \"[Gmail]\"");
    BOOST_REQUIRE(noselect);
    BOOST_TEST(!noselect->is_selectable());
    BOOST_TEST(noselect->has_children());
    BOOST_REQUIRE(noselect->custom_attributes.size() == 1u);
    BOOST_TEST(noselect->custom_attributes.front() == "\\X-Custom");

    auto flat = imap::parse_list_line("* LSUB () NIL Archive");
    BOOST_REQUIRE(flat);
    BOOST_TEST(flat->name == "Archive");
    BOOST_TEST(!flat->delimiter.has_value());
    BOOST_TEST(flat->leaf_name() == "Archive");

    auto nested = imap::parse_list_line("* LIST () \"/\" \"Work/Projects/2024\"");
    BOOST_REQUIRE(nested);
    BOOST_TEST(nested->leaf_name() == "2024");

    auto literal = imap::parse_list_line("* LIST () \"/\" {7}", {"Entwurf"});
    BOOST_REQUIRE(literal);
    BOOST_TEST(literal->name == "Entwurf");

    BOOST_TEST(!imap::parse_list_line("* FLAGS (\\Seen)"));
    BOOST_TEST(!imap::parse_list_line("* LIST (\\HasNoChildren \"/\" \"INBOX\""));
}

BOOST_AUTO_TEST_CASE(parse_envelope_full)
{
    const std::string text =
        "(\"Mon, 7 Feb 1994 21:52:25 -0800\" \"Meeting\" "
        "((\"Terry Gray\" NIL \"gray\" \"cac.washington.edu\")) "
        "((\"Terry Gray\" NIL \"gray\" \"cac.washington.edu\")) "
        "((\"Terry Gray\" NIL \"gray\" \"cac.washington.edu\")) "
        "((NIL NIL \"imap\" \"cac.washington.edu\")) "
        "((NIL NIL \"minutes\" \"CNRI.Reston.VA.US\")(\"John Klensin\" NIL \"KLENSIN\" \"MIT.EDU\")) "
        "NIL NIL \"<B27397-0100000@cac.washington.edu>\")";

    auto env = imap::parse_envelope(text);
    BOOST_REQUIRE(env);
    BOOST_TEST(*env->date == "Mon, 7 Feb 1994 21:52:25 -0800");
    BOOST_TEST(*env->subject == "Meeting");
    BOOST_REQUIRE(env->from.size() == 1u);
    BOOST_TEST(env->from.front().display() == "Terry Gray <gray@cac.washington.edu>");
    BOOST_REQUIRE(env->to.size() == 1u);
    BOOST_TEST(env->to.front().email_address() == "imap@cac.washington.edu");
    BOOST_TEST(env->to.front().display() == "imap@cac.washington.edu");
    BOOST_TEST(env->cc.size() == 2u);
    BOOST_TEST(env->bcc.empty());
    BOOST_TEST(!env->in_reply_to.has_value());
    BOOST_TEST(*env->message_id == "<B27397-0100000@cac.washington.edu>");
}

BOOST_AUTO_TEST_CASE(parse_envelope_rejects_malformed)
{
    BOOST_TEST(!imap::parse_envelope("(\"date\" \"subject\" NIL NIL NIL NIL NIL NIL NIL)"));
    BOOST_TEST(!imap::parse_envelope("(\"date\" \"subject\" NIL NIL NIL NIL NIL NIL NIL NIL"));
    BOOST_TEST(!imap::parse_envelope("(NIL NIL ((NIL \"gray\" \"host\")) NIL NIL NIL NIL NIL NIL NIL)"));
    auto err = imap::parse_envelope("(\"unterminated NIL NIL NIL NIL NIL NIL NIL NIL NIL)");
    BOOST_REQUIRE(!err);
    BOOST_TEST(err.error().code == errc::imap_parse_error);
}

BOOST_AUTO_TEST_CASE(split_top_level_keeps_nesting)
{
    auto items = imap::split_top_level("(a (b c) \"d e\" NIL)");
    BOOST_REQUIRE(items);
    BOOST_REQUIRE(items->size() == 4u);
    BOOST_TEST((*items)[1] == "(b c)");
    BOOST_TEST((*items)[2] == "\"d e\"");

    BOOST_TEST(!imap::split_top_level("(a (b c)"));
    BOOST_TEST(!imap::split_top_level("(a) trailing"));
}

BOOST_AUTO_TEST_CASE(capability_round_trip)
{
    const auto caps = imap::parse_capabilities("* CAPABILITY IMAP4rev1 IDLE CONDSTORE AUTH=XOAUTH2 X-GM-EXT-1");
    BOOST_TEST(caps.has(imap::capability::imap4rev1));
    BOOST_TEST(caps.has(imap::capability::idle));
    BOOST_TEST(caps.has(imap::capability::condstore));
    BOOST_TEST(caps.has(imap::capability::auth_xoauth2));
    BOOST_TEST(!caps.has(imap::capability::move));
    BOOST_REQUIRE(caps.custom.size() == 1u);
    BOOST_TEST(caps.custom.front() == "X-GM-EXT-1");

    const auto again = imap::parse_capabilities(imap::format_capabilities(caps));
    BOOST_TEST((again == caps));
}

BOOST_AUTO_TEST_CASE(capability_from_greeting_code)
{
    const auto caps = imap::parse_capabilities("* OK [CAPABILITY IMAP4rev1 SASL-IR AUTH=PLAIN] ready");
    BOOST_TEST(caps.has(imap::capability::sasl_ir));
    BOOST_TEST(caps.has(imap::capability::auth_plain));
    BOOST_TEST(caps.custom.empty());
}

BOOST_AUTO_TEST_CASE(parse_fetch_with_literal_body)
{
    imap::response_line line;
    line.text = "* 12 FETCH (UID 4827 FLAGS (\\Seen $Label) RFC822.SIZE 44 MODSEQ (917) "
                "INTERNALDATE \"17-Jul-1996 02:44:25 -0700\" BODY[] {5})";
    line.literals.push_back("hello");

    auto msg = imap::parse_fetch(line);
    BOOST_REQUIRE(msg);
    BOOST_TEST(msg->sequence == 12u);
    BOOST_TEST(*msg->uid == 4827u);
    BOOST_TEST(msg->flags->size() == 2u);
    BOOST_TEST(msg->flags->contains(imap::message_flag::seen()));
    BOOST_TEST(msg->flags->contains(imap::message_flag::custom("$Label")));
    BOOST_TEST(*msg->size == 44u);
    BOOST_TEST(*msg->modseq == 917u);
    BOOST_TEST(*msg->internal_date == "17-Jul-1996 02:44:25 -0700");
    BOOST_TEST(*msg->body == "hello");

    imap::response_line bad;
    bad.text = "* 3 FETCH (UID)";
    BOOST_TEST(!imap::parse_fetch(bad));
}

BOOST_AUTO_TEST_CASE(parse_search_with_modseq)
{
    auto found = imap::parse_search_line("* SEARCH 2 5 9 (MODSEQ 917)");
    BOOST_REQUIRE(found.ids.size() == 3u);
    BOOST_TEST(found.ids[2] == 9u);
    BOOST_TEST(*found.highest_modseq == 917u);

    BOOST_TEST(imap::parse_search_line("* SEARCH").ids.empty());
    BOOST_TEST(imap::parse_search_line("* OK [UIDVALIDITY 1]").ids.empty());
}

BOOST_AUTO_TEST_CASE(parse_select_response)
{
    imap::response resp;
    resp.untagged = {
        {"* 172 EXISTS", {}},
        {"* 1 RECENT", {}},
        {"* OK [UNSEEN 12] Message 12 is first unseen", {}},
        {"* OK [UIDVALIDITY 3857529045] UIDs valid", {}},
        {"* OK [UIDNEXT 4392] Predicted next UID", {}},
        {"* OK [HIGHESTMODSEQ 715194045007] Highest", {}},
        {"* FLAGS (\\Answered \\Flagged \\Deleted \\Seen \\Draft)", {}},
        {"* OK [PERMANENTFLAGS (\\Deleted \\Seen \\*)] Limited", {}}};
    resp.tagged_line = "A0003 OK [READ-WRITE] SELECT completed";

    const auto st = imap::parse_mailbox_status(resp);
    BOOST_TEST(st.exists == 172u);
    BOOST_TEST(st.recent == 1u);
    BOOST_TEST(*st.unseen == 12u);
    BOOST_TEST(st.uid_validity == 3857529045u);
    BOOST_TEST(st.uid_next == 4392u);
    BOOST_TEST(*st.highest_modseq == 715194045007u);
    BOOST_TEST(st.flags.size() == 5u);
    BOOST_TEST(st.permanent_flags.contains(imap::message_flag::deleted()));
    BOOST_TEST(!st.read_only);
}

BOOST_AUTO_TEST_CASE(parse_status_line_items)
{
    auto st = imap::parse_status_line("* STATUS \"INBOX\" (MESSAGES 231 UIDNEXT 44292 UIDVALIDITY 7 UNSEEN 3)");
    BOOST_REQUIRE(st);
    BOOST_TEST(st->exists == 231u);
    BOOST_TEST(st->uid_next == 44292u);
    BOOST_TEST(st->uid_validity == 7u);
    BOOST_TEST(*st->unseen == 3u);

    BOOST_TEST(!imap::parse_status_line("* STATUS INBOX (MESSAGES many)"));
}
