/*

test_imap_auth_sasl.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE imap_auth_sasl_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <mailsync/detail/sasl.hpp>
#include <mailsync/imap/codec.hpp>


static std::string decode(const std::string& encoded)
{
    auto res = mailsync::detail::base64_decode(encoded);
    BOOST_REQUIRE(res);
    return *res;
}


BOOST_AUTO_TEST_CASE(sasl_plain_encoding)
{
    const std::string decoded = decode(mailsync::sasl::encode_plain("user", "pass"));
    std::string expected;
    expected.push_back('\0');
    expected += "user";
    expected.push_back('\0');
    expected += "pass";
    BOOST_TEST(decoded == expected);
}

BOOST_AUTO_TEST_CASE(sasl_token_blob_is_nul_separated)
{
    const std::string decoded = decode(mailsync::sasl::encode_token("user@example.com", "ya29.token"));
    BOOST_TEST(decoded == std::string("\0user@example.com\0ya29.token", 28));
}

BOOST_AUTO_TEST_CASE(sasl_xoauth2_encoding)
{
    const std::string decoded = decode(mailsync::sasl::encode_xoauth2("user@example.com", "token"));
    std::string expected;
    expected += "user=user@example.com";
    expected.push_back('\x01');
    expected += "auth=Bearer token";
    expected.push_back('\x01');
    expected.push_back('\x01');
    BOOST_TEST(decoded == expected);
}

BOOST_AUTO_TEST_CASE(authenticate_command_text)
{
    namespace imap = mailsync::imap;
    BOOST_TEST(imap::format_authenticate_plain("user", "pass") == "AUTHENTICATE PLAIN AHVzZXIAcGFzcw==");
    const std::string xoauth2 = imap::format_authenticate_token("u", "t", imap::token_format::xoauth2);
    BOOST_TEST(xoauth2.starts_with("AUTHENTICATE XOAUTH2 "));
    BOOST_TEST(decode(xoauth2.substr(21)) == "user=u\x01" "auth=Bearer t\x01\x01");
}

BOOST_AUTO_TEST_CASE(base64_decode_rejects_garbage)
{
    BOOST_TEST(!mailsync::detail::base64_decode("abc"));
    BOOST_TEST(!mailsync::detail::base64_decode("@@@@"));
    BOOST_TEST(decode("").empty());
}
