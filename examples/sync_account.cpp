/*

sync_account.cpp
----------------

Syncs every folder of one password account into a process local store,
driven by the background scheduler.

Usage: sync_account <host> <port> <user> <password>

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include "example_util.hpp"
#include <mailsync/mailsync.hpp>


using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    if (argc != 5)
    {
        std::cerr << "usage: " << argv[0] << " <host> <port> <user> <password>" << endl;
        return EXIT_FAILURE;
    }

    mailsync::log::logger::instance().set_level(mailsync::log::level::debug);

    mailsync::asio::io_context io_ctx;
    auto manager = std::make_shared<mailsync::accounts::account_manager>(io_ctx.get_executor());
    auto store = std::make_shared<mailsync::sync::memory_storage>();
    auto engine = std::make_shared<mailsync::sync::sync_engine>(store);
    mailsync::scheduler::sync_task_runner runner(manager, engine);

    const auto port = static_cast<std::uint16_t>(std::stoul(argv[2]));
    auto cfg = mailsync::imap::account_config::plain(argv[1], port, argv[3],
        mailsync::imap::password_credential{argv[4]});
    mailsync::accounts::account acct("main", "Main", argv[3], cfg);
    acct.settings.use_incremental_sync = false;
    if (auto res = manager->add_account(acct); !res)
    {
        print_error(res.error());
        return EXIT_FAILURE;
    }

    engine->on_progress([](const mailsync::sync::sync_progress& p)
    {
        if (p.finished())
            cout << p.folder << ": " << p.messages_processed << "/" << p.total_messages
                 << (p.error_message.empty() ? "" : " - " + p.error_message) << endl;
    });

    mailsync::scheduler::background_scheduler scheduler(io_ctx.get_executor(), runner.as_runner());
    auto ids = scheduler.schedule_account_sync(acct);
    if (!ids)
    {
        print_error(ids.error());
        return EXIT_FAILURE;
    }
    scheduler.start();

    mailsync::asio::co_spawn(io_ctx,
        [&]() -> mailsync::asio::awaitable<void>
        {
            for (std::size_t done = 0; done < ids->size(); ++done)
            {
                auto [ec, result] = co_await scheduler.completions().async_receive(mailsync::asio::use_nothrow_awaitable);
                if (ec)
                    break;
                cout << "task " << result.id << " " << mailsync::scheduler::to_string(result.status.state) << endl;
                if (result.error)
                    print_error(*result.error);
                if (const auto* report = std::get_if<mailsync::sync::account_sync_report>(&result.output))
                    cout << "account synced, " << report->messages_processed() << " messages, "
                         << report->failed.size() << " folders failed" << endl;
            }
            scheduler.stop();
            co_await manager->disconnect_all();
        },
        mailsync::asio::detached);

    io_ctx.run();
    cout << store->size() << " messages stored" << endl;
    return EXIT_SUCCESS;
}
