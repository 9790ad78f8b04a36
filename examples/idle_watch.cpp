/*

idle_watch.cpp
--------------

Watches the INBOX of a Gmail account with IDLE for a few minutes, printing
every push notification.

Usage: idle_watch <user> <access token>

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include "example_util.hpp"
#include <mailsync/imap/idle.hpp>


using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    if (argc != 3)
    {
        std::cerr << "usage: " << argv[0] << " <user> <access token>" << endl;
        return EXIT_FAILURE;
    }

    // No refresh callback: an expired token ends the watch with auth_failed
    auto tokens = std::make_shared<mailsync::oauth2::token_source>(
        mailsync::oauth2::token{argv[2], "", std::chrono::system_clock::now() + std::chrono::minutes(50)}, nullptr);
    auto cfg = mailsync::imap::account_config::gmail(argv[1], mailsync::imap::token_credential{tokens});

    mailsync::asio::io_context io_ctx;
    mailsync::imap::idle_service watcher(io_ctx.get_executor(), cfg);
    watcher.add_callback([](const mailsync::imap::idle_event& ev)
    {
        cout << mailsync::imap::to_string(ev.type) << " " << ev.number;
        if (ev.uid)
            cout << " uid=" << *ev.uid;
        cout << endl;
        if (ev.error)
            print_error(*ev.error);
    });

    mailsync::asio::co_spawn(io_ctx,
        [&]() -> mailsync::asio::awaitable<void>
        {
            auto started = co_await watcher.start("INBOX");
            if (!started)
            {
                print_error(started.error());
                co_return;
            }

            mailsync::asio::steady_timer timer(io_ctx);
            timer.expires_after(std::chrono::minutes(5));
            co_await timer.async_wait(mailsync::asio::use_nothrow_awaitable);

            const auto st = watcher.stats();
            cout << st.notifications << " notifications, " << st.restarts << " restarts" << endl;
            if (auto stopped = co_await watcher.stop(); !stopped)
                print_error(stopped.error());
        },
        mailsync::asio::detached);

    io_ctx.run();
    return EXIT_SUCCESS;
}
