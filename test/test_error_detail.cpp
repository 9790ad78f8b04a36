/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <mailsync/detail/error_detail.hpp>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/error_mapping.hpp>


BOOST_AUTO_TEST_CASE(error_detail_add_lines)
{
    mailsync::detail::error_detail out;
    std::vector<std::string> lines = {"alpha", "beta"};
    out.add_lines("line", lines);
    BOOST_TEST(out.str() == "line0=alpha\nline1=beta\n");
}

BOOST_AUTO_TEST_CASE(error_detail_add_lines_redact)
{
    mailsync::detail::error_detail out;
    std::vector<std::string> lines = {"A0002 LOGIN user secret", "A0003 AUTHENTICATE PLAIN dGVzdA=="};
    out.add_lines("line", lines, true);
    BOOST_TEST(out.str() == "line0=A0002 LOGIN user <redacted>\nline1=A0003 AUTHENTICATE PLAIN <redacted>\n");
}

BOOST_AUTO_TEST_CASE(imap_detail_redacts_command)
{
    const auto out = mailsync::imap::make_imap_detail("A0002", "A0002 LOGIN bob hunter2", "A0002 NO denied", 0);
    BOOST_TEST(out.str().find("hunter2") == std::string::npos);
    BOOST_TEST(out.str().find("tag=A0002\n") != std::string::npos);
    BOOST_TEST(out.str().find("untagged.count=0\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(imap_detail_skips_missing_context)
{
    const auto out = mailsync::imap::make_imap_detail("", "A0004 NOOP", "", 2);
    BOOST_TEST(out.str() == "proto=imap\ncommand=A0004 NOOP\nuntagged.count=2\n");
}

BOOST_AUTO_TEST_CASE(error_detail_add_if_set)
{
    mailsync::detail::error_detail out;
    BOOST_TEST(out.empty());
    out.add_if_set("host", "").add_if_set("user", "bob");
    BOOST_TEST(out.str() == "user=bob\n");
}

BOOST_AUTO_TEST_CASE(fail_carries_detail)
{
    mailsync::detail::error_detail extra;
    extra.add("host", "imap.example.com").add_int("port", 993);
    auto res = mailsync::fail<int>(mailsync::errc::net_connect_failed, "connect failed", extra);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().detail == "host=imap.example.com\nport=993\n");
    BOOST_TEST(res.error().to_string().starts_with("[net_connect_failed] connect failed ("));
    BOOST_TEST(res.error().is_connection_error());
    BOOST_TEST(res.error().is_recoverable());
}
