/*

test_error_mapping.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_mapping_test

#include <boost/test/unit_test.hpp>

#include <mailsync/imap/error_mapping.hpp>
#include <mailsync/net/error_mapping.hpp>


BOOST_AUTO_TEST_CASE(net_error_mapping)
{
    BOOST_TEST(mailsync::net::map_net_error(
        mailsync::net::io_stage::read,
        mailsync::asio::error::operation_aborted,
        true) == mailsync::errc::net_timeout);

    BOOST_TEST(mailsync::net::map_net_error(
        mailsync::net::io_stage::read,
        mailsync::asio::error::operation_aborted,
        false) == mailsync::errc::net_cancelled);

    BOOST_TEST(mailsync::net::map_net_error(
        mailsync::net::io_stage::read,
        mailsync::asio::error::eof,
        false) == mailsync::errc::net_eof);

    BOOST_TEST(mailsync::net::map_net_error(
        mailsync::net::io_stage::connect,
        mailsync::asio::error::connection_refused,
        false) == mailsync::errc::net_connection_refused);

    BOOST_TEST(mailsync::net::map_net_error(
        mailsync::net::io_stage::resolve,
        mailsync::asio::error::host_not_found,
        false) == mailsync::errc::net_resolve_failed);
}

BOOST_AUTO_TEST_CASE(imap_error_mapping)
{
    using mailsync::imap::error_kind;
    using mailsync::imap::status;

    BOOST_TEST(mailsync::imap::map_imap_error(error_kind::tagged_no) == mailsync::errc::imap_tagged_no);
    BOOST_TEST(mailsync::imap::map_imap_error(error_kind::tagged_bad) == mailsync::errc::imap_tagged_bad);
    BOOST_TEST(mailsync::imap::map_imap_error(error_kind::continuation_expected) ==
        mailsync::errc::imap_continuation_expected);

    BOOST_TEST(!mailsync::imap::error_kind_for(status::ok).has_value());
    BOOST_TEST((*mailsync::imap::error_kind_for(status::no) == error_kind::tagged_no));
    BOOST_TEST((*mailsync::imap::error_kind_for(status::bad) == error_kind::tagged_bad));
    BOOST_TEST((*mailsync::imap::error_kind_for(status::unknown) == error_kind::parse));
}

BOOST_AUTO_TEST_CASE(error_classes)
{
    using mailsync::errc;
    using mailsync::error_class;

    BOOST_TEST((mailsync::classify(errc::connect_timeout) == error_class::timeout));
    BOOST_TEST((mailsync::classify(errc::auth_failed) == error_class::authentication));
    BOOST_TEST((mailsync::classify(errc::imap_tagged_no) == error_class::server_refusal));
    BOOST_TEST((mailsync::classify(errc::sync_cancelled) == error_class::cancelled));
    BOOST_TEST((mailsync::classify(errc::queue_full) == error_class::invalid_state));

    const mailsync::error_info auth{errc::auth_failed, "denied", {}, {}, {}};
    BOOST_TEST(!auth.is_recoverable());
    BOOST_TEST(!auth.is_connection_error());

    const mailsync::error_info lost{errc::net_eof, "closed", {}, {}, {}};
    BOOST_TEST(lost.is_recoverable());
    BOOST_TEST(lost.is_connection_error());
    BOOST_TEST(mailsync::to_string(errc::storage_failed) == "storage_failed");
}
