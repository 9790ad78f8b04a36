/*

test_account_manager.cpp
------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE account_manager_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <mailsync/accounts/account_manager.hpp>
#include <mailsync/detail/asio_decl.hpp>

#include "scripted_server.hpp"

using mailsync::errc;
using mailsync::accounts::account;
using mailsync::accounts::account_manager;
using mailsync::accounts::account_manager_config;
using mailsync::test::scripted_server;
using namespace std::chrono_literals;

namespace
{

account password_account(std::string id, std::uint16_t port = 1143)
{
    auto cfg = mailsync::imap::account_config::plain("127.0.0.1", port, id + "@example.com",
        mailsync::imap::password_credential{"secret"});
    return account(id, "Account " + id, id + "@example.com", cfg);
}

account token_account(std::string id)
{
    auto source = std::make_shared<mailsync::oauth2::token_source>(
        mailsync::oauth2::token{"tok", "", std::chrono::system_clock::now() + std::chrono::hours{1}}, nullptr);
    auto cfg = mailsync::imap::account_config::gmail(id + "@gmail.com", mailsync::imap::token_credential{source});
    return account(id, "Account " + id, id + "@gmail.com", cfg);
}

template<typename Body>
void run_manager(mailsync::asio::io_context& ctx, Body body)
{
    bool finished = false;
    mailsync::asio::co_spawn(ctx,
        [&]() -> mailsync::asio::awaitable<void>
        {
            co_await body();
            finished = true;
        },
        mailsync::asio::detached);
    ctx.run();
    BOOST_TEST(finished);
}

} // namespace


BOOST_AUTO_TEST_CASE(first_account_becomes_default)
{
    mailsync::asio::io_context ctx;
    account_manager manager(ctx.get_executor());

    BOOST_TEST(!manager.default_account().has_value());
    BOOST_REQUIRE(manager.add_account(password_account("work")).has_value());
    BOOST_REQUIRE(manager.add_account(password_account("home")).has_value());

    auto def = manager.default_account();
    BOOST_REQUIRE(def.has_value());
    BOOST_TEST(def->id == "work");
    BOOST_TEST(def->is_default);
    BOOST_TEST(!manager.get_account("home")->is_default);

    const auto all = manager.accounts();
    BOOST_REQUIRE(all.size() == 2u);
    BOOST_TEST(all[0].id == "home");
    BOOST_TEST(all[1].id == "work");

    auto empty_id = manager.add_account(account{});
    BOOST_REQUIRE(!empty_id.has_value());
    BOOST_TEST(empty_id.error().code == errc::codec_invalid_input);
}

BOOST_AUTO_TEST_CASE(default_follows_set_and_remove)
{
    mailsync::asio::io_context ctx;
    account_manager manager(ctx.get_executor());
    BOOST_REQUIRE(manager.add_account(password_account("a")).has_value());
    BOOST_REQUIRE(manager.add_account(password_account("b")).has_value());
    BOOST_REQUIRE(manager.add_account(password_account("c")).has_value());

    BOOST_REQUIRE(manager.set_default_account("c").has_value());
    BOOST_TEST(manager.default_account()->id == "c");
    BOOST_TEST(!manager.get_account("a")->is_default);

    auto unknown = manager.set_default_account("zzz");
    BOOST_REQUIRE(!unknown.has_value());
    BOOST_TEST(unknown.error().code == errc::not_found);
    BOOST_TEST(manager.default_account()->id == "c");

    // removing the default hands it to the first remaining account
    BOOST_REQUIRE(manager.remove_account("c").has_value());
    BOOST_TEST(manager.default_account()->id == "a");
    BOOST_TEST(manager.get_account("a")->is_default);
    BOOST_TEST(!manager.get_account("c").has_value());

    auto gone = manager.remove_account("c");
    BOOST_REQUIRE(!gone.has_value());
    BOOST_TEST(gone.error().code == errc::not_found);

    BOOST_REQUIRE(manager.remove_account("a").has_value());
    BOOST_REQUIRE(manager.remove_account("b").has_value());
    BOOST_TEST(!manager.default_account().has_value());
}

BOOST_AUTO_TEST_CASE(replace_keeps_default_and_stats_count_auth)
{
    mailsync::asio::io_context ctx;
    account_manager_config cfg;
    cfg.max_clients = 4;
    account_manager manager(ctx.get_executor(), cfg);

    BOOST_REQUIRE(manager.add_account(password_account("a")).has_value());
    BOOST_REQUIRE(manager.add_account(token_account("g")).has_value());

    auto replaced = password_account("a");
    replaced.display_name = "Renamed";
    BOOST_REQUIRE(manager.add_account(replaced).has_value());
    BOOST_TEST(manager.get_account("a")->display_name == "Renamed");
    BOOST_TEST(manager.get_account("a")->is_default);

    BOOST_TEST(!manager.get_account("a")->last_sync.has_value());
    BOOST_REQUIRE(manager.mark_synced("a").has_value());
    BOOST_TEST(manager.get_account("a")->last_sync.has_value());
    BOOST_TEST(manager.mark_synced("nope").error().code == errc::not_found);

    const auto st = manager.stats();
    BOOST_TEST(st.total_accounts == 2u);
    BOOST_TEST(st.token_accounts == 1u);
    BOOST_TEST(st.password_accounts == 1u);
    BOOST_TEST(st.pooled_clients == 0u);
    BOOST_TEST(st.max_clients == 4u);
    BOOST_TEST(st.default_account.value_or("") == "a");
}

BOOST_AUTO_TEST_CASE(clients_are_shared_per_account)
{
    scripted_server server;
    mailsync::asio::io_context ctx;
    account_manager manager(ctx.get_executor());
    BOOST_REQUIRE(manager.add_account(password_account("a", server.port())).has_value());

    run_manager(ctx, [&]() -> mailsync::asio::awaitable<void>
    {
        auto first = co_await manager.get_client("a");
        BOOST_REQUIRE(first.has_value());
        auto second = co_await manager.get_client("a");
        BOOST_REQUIRE(second.has_value());
        BOOST_TEST(first->get() == second->get());
        BOOST_TEST((*first)->is_authenticated());

        auto st = manager.stats();
        BOOST_TEST(st.pooled_clients == 1u);
        BOOST_TEST(st.connected_clients == 1u);

        auto missing = co_await manager.get_client("nobody");
        BOOST_REQUIRE(!missing.has_value());
        BOOST_TEST(missing.error().code == errc::not_found);

        co_await manager.disconnect_all();
        BOOST_TEST(manager.stats().pooled_clients == 0u);
        BOOST_TEST(!(*first)->is_connected());
    });

    BOOST_TEST(server.connections() == 1u);
    BOOST_TEST(server.received_command("LOGOUT"));
}

BOOST_AUTO_TEST_CASE(least_recently_used_client_is_evicted)
{
    scripted_server server_a;
    scripted_server server_b;
    mailsync::asio::io_context ctx;
    account_manager_config cfg;
    cfg.max_clients = 1;
    account_manager manager(ctx.get_executor(), cfg);
    BOOST_REQUIRE(manager.add_account(password_account("a", server_a.port())).has_value());
    BOOST_REQUIRE(manager.add_account(password_account("b", server_b.port())).has_value());

    run_manager(ctx, [&]() -> mailsync::asio::awaitable<void>
    {
        auto a = co_await manager.get_client("a");
        BOOST_REQUIRE(a.has_value());
        auto b = co_await manager.get_client("b");
        BOOST_REQUIRE(b.has_value());

        BOOST_TEST((manager.pooled_accounts() == std::vector<std::string>{"b"}));

        manager.release_client("b");
        BOOST_TEST(manager.pooled_accounts().empty());
    });

    // eviction and release both log out in the background
    BOOST_TEST(server_a.received_command("LOGOUT"));
    BOOST_TEST(server_b.received_command("LOGOUT"));
}

BOOST_AUTO_TEST_CASE(failed_login_keeps_client_pooled)
{
    scripted_server server("* OK ready", "IMAP4rev1");
    server.on_once("LOGIN", {"{tag} NO [AUTHENTICATIONFAILED] nope"});
    mailsync::asio::io_context ctx;
    account_manager manager(ctx.get_executor());
    BOOST_REQUIRE(manager.add_account(password_account("a", server.port())).has_value());

    run_manager(ctx, [&]() -> mailsync::asio::awaitable<void>
    {
        auto res = co_await manager.get_client("a");
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::auth_failed);
        BOOST_TEST(manager.stats().pooled_clients == 1u);

        // the next call reuses the connected client and logs in again
        auto retry = co_await manager.get_client("a");
        BOOST_REQUIRE(retry.has_value());
        BOOST_TEST((*retry)->is_authenticated());
        co_await manager.disconnect_all();
    });
    BOOST_TEST(server.connections() == 1u);
}

BOOST_AUTO_TEST_CASE(silent_server_hits_connect_timeout)
{
    scripted_server server("");
    mailsync::asio::io_context ctx;
    account_manager_config cfg;
    cfg.connect_timeout = 200ms;
    account_manager manager(ctx.get_executor(), cfg);
    BOOST_REQUIRE(manager.add_account(password_account("a", server.port())).has_value());

    run_manager(ctx, [&]() -> mailsync::asio::awaitable<void>
    {
        const auto started = std::chrono::steady_clock::now();
        auto res = co_await manager.get_client("a");
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::connect_timeout);
        BOOST_TEST((std::chrono::steady_clock::now() - started < 5s));
        co_await manager.disconnect_all();
    });
}

BOOST_AUTO_TEST_CASE(login_timeout_drops_session_before_retry)
{
    scripted_server server("* OK ready", "IMAP4rev1");
    server.on_once_after("LOGIN", 500ms, {"{tag} OK late login"});
    mailsync::asio::io_context ctx;
    account_manager_config cfg;
    cfg.auth_timeout = 200ms;
    account_manager manager(ctx.get_executor(), cfg);
    BOOST_REQUIRE(manager.add_account(password_account("a", server.port())).has_value());

    run_manager(ctx, [&]() -> mailsync::asio::awaitable<void>
    {
        auto res = co_await manager.get_client("a");
        BOOST_REQUIRE(!res.has_value());
        BOOST_TEST(res.error().code == errc::auth_timeout);
        BOOST_TEST(manager.stats().pooled_clients == 1u);
        BOOST_TEST(manager.stats().connected_clients == 0u);

        // the unanswered LOGIN is gone with its session, so the retry logs in cleanly
        auto retry = co_await manager.get_client("a");
        BOOST_REQUIRE(retry.has_value());
        BOOST_TEST((*retry)->is_authenticated());
        co_await manager.disconnect_all();
    });
    BOOST_TEST(server.connections() == 2u);
}

BOOST_AUTO_TEST_CASE(connection_test_uses_throwaway_client)
{
    scripted_server server;
    mailsync::asio::io_context ctx;
    account_manager manager(ctx.get_executor());
    BOOST_REQUIRE(manager.add_account(password_account("a", server.port())).has_value());

    run_manager(ctx, [&]() -> mailsync::asio::awaitable<void>
    {
        auto res = co_await manager.test_connection("a");
        BOOST_TEST(res.has_value());
        BOOST_TEST(manager.stats().pooled_clients == 0u);

        auto unknown = co_await manager.test_connection("b");
        BOOST_REQUIRE(!unknown.has_value());
        BOOST_TEST(unknown.error().code == errc::not_found);
    });

    BOOST_TEST(server.received_command("LOGIN"));
    BOOST_TEST(server.received_command("LOGOUT"));
}
