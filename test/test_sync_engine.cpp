/*

test_sync_engine.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE sync_engine_test

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/sync/memory_storage.hpp>
#include <mailsync/sync/sync_engine.hpp>

using mailsync::errc;
using mailsync::imap::capability;
using mailsync::imap::fetched_message;
using mailsync::imap::message_flag;
namespace sync = mailsync::sync;
using namespace std::chrono_literals;

namespace
{

/// In-process stand-in for an IMAP session, one mailbox per folder name
class fake_client
{
public:
    struct mailbox
    {
        std::uint32_t uid_validity = 1;
        std::uint32_t uid_next = 1;
        std::optional<std::uint64_t> highest_modseq;
        std::map<std::uint32_t, fetched_message> messages;
        bool selectable = true;
    };

    std::map<std::string, mailbox> folders;
    std::set<capability> capabilities;

    std::size_t selects = 0;
    std::size_t searches = 0;
    std::size_t fetches = 0;
    std::vector<std::string> search_log;
    std::vector<std::string> fetch_sets;
    std::vector<std::vector<std::string>> fetch_items;

    /// Delay inside every fetch so concurrent syncs interleave
    std::chrono::milliseconds fetch_delay{0};
    std::function<void()> after_fetch;

    mailbox& add_folder(const std::string& name, std::uint32_t uid_validity = 1)
    {
        auto& box = folders[name];
        box.uid_validity = uid_validity;
        return box;
    }

    static fetched_message make_message(std::uint32_t uid, std::string subject, bool seen = false,
        std::uint64_t modseq = 1)
    {
        fetched_message msg;
        msg.sequence = uid;
        msg.uid = uid;
        msg.flags = mailsync::imap::flag_set{};
        if (seen)
            msg.flags->insert(message_flag::seen());
        msg.size = 100 + uid;
        msg.internal_date = "17-Jul-1996 02:44:25 -0700";
        msg.modseq = modseq;
        mailsync::imap::envelope env;
        env.subject = std::move(subject);
        env.message_id = "<" + std::to_string(uid) + "@example.com>";
        env.from.push_back(mailsync::imap::address{"Alice", std::nullopt, "alice", "example.com"});
        env.to.push_back(mailsync::imap::address{std::nullopt, std::nullopt, "bob", "example.com"});
        msg.env = std::move(env);
        msg.body = "Subject: " + *msg.env->subject + "\r\n\r\nbody " + std::to_string(uid) + "\r\n";
        return msg;
    }

    void deliver(const std::string& folder, fetched_message msg)
    {
        auto& box = folders[folder];
        const std::uint32_t uid = *msg.uid;
        box.messages[uid] = std::move(msg);
        box.uid_next = std::max(box.uid_next, uid + 1);
    }

    bool has_capability(capability cap) const
    {
        return capabilities.contains(cap);
    }

    mailsync::asio::awaitable<mailsync::result<mailsync::imap::mailbox_status>> select(std::string_view folder)
    {
        ++selects;
        auto it = folders.find(std::string(folder));
        if (it == folders.end() || !it->second.selectable)
            co_return mailsync::fail<mailsync::imap::mailbox_status>(errc::imap_tagged_no, "no such mailbox");
        selected_ = it->first;
        mailsync::imap::mailbox_status st;
        st.exists = static_cast<std::uint32_t>(it->second.messages.size());
        st.uid_next = it->second.uid_next;
        st.uid_validity = it->second.uid_validity;
        st.highest_modseq = it->second.highest_modseq;
        co_return st;
    }

    mailsync::asio::awaitable<mailsync::result<mailsync::imap::search_result>> uid_search(
        const mailsync::imap::search_criteria& criteria)
    {
        ++searches;
        std::string text;
        MAILSYNC_CO_TRY_ASSIGN(text, criteria.to_imap());
        search_log.push_back(text);

        const auto& box = folders.at(selected_);
        mailsync::imap::search_result out;
        if (text.starts_with("UID "))
        {
            const std::uint32_t first = static_cast<std::uint32_t>(std::stoul(text.substr(4)));
            for (const auto& [uid, msg] : box.messages)
            {
                if (uid >= first)
                    out.ids.push_back(uid);
            }
            // `n:*` always includes the highest UID
            if (out.ids.empty() && !box.messages.empty())
                out.ids.push_back(box.messages.rbegin()->first);
        }
        else if (text.starts_with("MODSEQ "))
        {
            const std::uint64_t since = std::stoull(text.substr(7));
            for (const auto& [uid, msg] : box.messages)
            {
                if (msg.modseq.value_or(0) >= since)
                    out.ids.push_back(uid);
            }
        }
        else
        {
            for (const auto& [uid, msg] : box.messages)
                out.ids.push_back(uid);
        }
        co_return out;
    }

    mailsync::asio::awaitable<mailsync::result<std::vector<fetched_message>>> uid_fetch(std::string_view set,
        std::vector<std::string> items)
    {
        ++fetches;
        fetch_sets.emplace_back(set);
        fetch_items.push_back(items);
        if (fetch_delay.count() > 0)
        {
            mailsync::asio::steady_timer timer(co_await mailsync::asio::this_coro::executor);
            timer.expires_after(fetch_delay);
            co_await timer.async_wait(mailsync::asio::use_nothrow_awaitable);
        }

        bool with_body = false;
        for (const auto& item : items)
            with_body = with_body || item == "BODY.PEEK[]";

        const auto& box = folders.at(selected_);
        std::vector<fetched_message> out;
        for (auto uid : expand(set))
        {
            auto it = box.messages.find(uid);
            if (it == box.messages.end())
                continue;
            fetched_message msg = it->second;
            if (!with_body)
                msg.body.reset();
            out.push_back(std::move(msg));
        }
        if (after_fetch)
            after_fetch();
        co_return out;
    }

    mailsync::asio::awaitable<mailsync::result<std::vector<mailsync::imap::folder>>> list(std::string_view,
        std::string_view)
    {
        std::vector<mailsync::imap::folder> out;
        for (const auto& [name, box] : folders)
        {
            mailsync::imap::folder f;
            f.name = name;
            f.delimiter = '/';
            if (!box.selectable)
                f.attributes.insert(mailsync::imap::folder_attribute::noselect);
            out.push_back(std::move(f));
        }
        co_return out;
    }

private:
    static std::vector<std::uint32_t> expand(std::string_view set)
    {
        std::vector<std::uint32_t> out;
        while (!set.empty())
        {
            const auto comma = set.find(',');
            const std::string part(set.substr(0, comma));
            set = comma == std::string_view::npos ? std::string_view{} : set.substr(comma + 1);
            const auto colon = part.find(':');
            const auto low = static_cast<std::uint32_t>(std::stoul(part.substr(0, colon)));
            const auto high = colon == std::string::npos ? low : static_cast<std::uint32_t>(std::stoul(part.substr(colon + 1)));
            for (auto uid = low; uid <= high; ++uid)
                out.push_back(uid);
        }
        return out;
    }

    std::string selected_;
};

using engine_type = sync::basic_sync_engine<fake_client>;

sync::sync_config quick_config(std::size_t batch_size = 50)
{
    sync::sync_config cfg;
    cfg.batch_size = batch_size;
    cfg.headers_batch_size = batch_size;
    cfg.batch_pause = 0ms;
    return cfg;
}

template<typename Body>
void run_sync(Body body)
{
    mailsync::asio::io_context ctx;
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

void fill_inbox(fake_client& server, std::uint32_t count)
{
    server.add_folder("INBOX", 42);
    for (std::uint32_t uid = 1; uid <= count; ++uid)
        server.deliver("INBOX", fake_client::make_message(uid, "message " + std::to_string(uid), uid == 1));
}

} // namespace


BOOST_AUTO_TEST_CASE(full_sync_stores_every_message)
{
    fake_client server;
    fill_inbox(server, 3);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    std::vector<sync::sync_progress> seen;
    engine.on_progress([&](const sync::sync_progress& p) { seen.push_back(p); });

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(report->messages_processed == 3u);
        BOOST_TEST(report->strategy == "full");
        BOOST_TEST(!report->forced_full);
    });

    BOOST_TEST(server.searches == 1u);
    BOOST_TEST(server.fetches == 1u);
    BOOST_TEST(server.search_log.front() == "ALL");
    BOOST_TEST(server.fetch_sets.front() == "1:3");

    const auto stored = store->messages("acct", "INBOX");
    BOOST_REQUIRE(stored.size() == 3u);
    BOOST_TEST(stored[0].uid == 1u);
    BOOST_TEST(stored[0].is_seen());
    BOOST_TEST(stored[0].from == "Alice <alice@example.com>");
    BOOST_TEST(stored[0].to.front() == "bob@example.com");
    BOOST_TEST(stored[1].subject.value_or("") == "message 2");
    BOOST_TEST(stored[2].body.has_value());

    auto state = store->get_folder_sync_state("acct", "INBOX");
    BOOST_REQUIRE(state.has_value());
    BOOST_REQUIRE(state->has_value());
    BOOST_TEST(((*state)->status == sync::sync_status::complete));
    BOOST_TEST((*state)->uid_validity == 42u);
    BOOST_TEST((*state)->uid_next == 4u);
    BOOST_TEST((*state)->message_count == 3u);
    BOOST_TEST((*state)->unread_count == 2u);

    BOOST_REQUIRE(!seen.empty());
    BOOST_TEST((seen.front().phase == sync::sync_phase::initializing));
    BOOST_TEST((seen.back().phase == sync::sync_phase::complete));
    BOOST_TEST(seen.back().messages_processed == 3u);
    BOOST_TEST(seen.back().total_messages == 3u);

    auto progress = engine.get_progress("acct", "INBOX");
    BOOST_REQUIRE(progress.has_value());
    BOOST_TEST(progress->finished());
    BOOST_TEST(engine.all_progress().size() == 1u);
}

BOOST_AUTO_TEST_CASE(batches_follow_batch_size)
{
    fake_client server;
    fill_inbox(server, 5);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config(2));

    std::vector<std::uint32_t> processed;
    engine.on_progress([&](const sync::sync_progress& p)
    {
        if (p.phase == sync::sync_phase::processing_changes &&
            (processed.empty() || processed.back() != p.messages_processed))
            processed.push_back(p.messages_processed);
    });

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(report->messages_processed == 5u);
    });

    BOOST_TEST(server.fetches == 3u);
    BOOST_TEST((server.fetch_sets == std::vector<std::string>{"1:2", "3:4", "5"}));
    BOOST_TEST((processed == std::vector<std::uint32_t>{0, 2, 4, 5}));
    BOOST_TEST(store->size() == 5u);
}

BOOST_AUTO_TEST_CASE(headers_only_skips_bodies)
{
    fake_client server;
    fill_inbox(server, 2);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        // seed a checkpoint so the strategy is honoured
        auto first = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(first.has_value());
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::headers_only_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(report->strategy == "headers_only");
    });

    BOOST_REQUIRE(server.fetch_items.size() == 2u);
    const auto& items = server.fetch_items.back();
    BOOST_TEST((std::find(items.begin(), items.end(), "BODY.PEEK[]") == items.end()));
    for (const auto& msg : store->messages("acct", "INBOX"))
        BOOST_TEST(!msg.body.has_value());
}

BOOST_AUTO_TEST_CASE(empty_folder_needs_no_search)
{
    fake_client server;
    server.add_folder("INBOX", 9);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(report->messages_processed == 0u);
    });
    BOOST_TEST(server.searches == 0u);
    BOOST_TEST(server.fetches == 0u);
}

BOOST_AUTO_TEST_CASE(missing_checkpoint_forces_full)
{
    fake_client server;
    fill_inbox(server, 2);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::incremental_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(report->forced_full);
        BOOST_TEST(report->strategy == "full");
        BOOST_TEST(report->messages_processed == 2u);
    });
}

BOOST_AUTO_TEST_CASE(uid_validity_change_forces_full)
{
    fake_client server;
    fill_inbox(server, 3);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto first = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(first.has_value());

        server.folders["INBOX"].uid_validity = 43;
        auto second = co_await engine.sync_folder(server, "acct", "INBOX", sync::incremental_sync{});
        BOOST_REQUIRE(second.has_value());
        BOOST_TEST(second->forced_full);
        BOOST_TEST(second->strategy == "full");
        BOOST_TEST(second->messages_processed == 3u);
    });

    BOOST_TEST(server.search_log.back() == "ALL");
    auto state = store->get_folder_sync_state("acct", "INBOX");
    BOOST_REQUIRE(state.has_value());
    BOOST_REQUIRE(state->has_value());
    BOOST_TEST((*state)->uid_validity == 43u);
}

BOOST_AUTO_TEST_CASE(incremental_by_uid_range)
{
    fake_client server;
    fill_inbox(server, 3);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto first = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(first.has_value());

        // nothing new: UIDNEXT unchanged
        const std::size_t searches_before = server.searches;
        auto idle = co_await engine.sync_folder(server, "acct", "INBOX", sync::incremental_sync{});
        BOOST_REQUIRE(idle.has_value());
        BOOST_TEST(idle->messages_processed == 0u);
        BOOST_TEST(server.searches == searches_before);

        server.deliver("INBOX", fake_client::make_message(4, "new 4"));
        server.deliver("INBOX", fake_client::make_message(5, "new 5"));
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::incremental_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(!report->forced_full);
        BOOST_TEST(report->strategy == "incremental");
        BOOST_TEST(report->messages_processed == 2u);
    });

    BOOST_TEST(server.search_log.back() == "UID 4:*");
    BOOST_TEST(server.fetch_sets.back() == "4:5");
    BOOST_TEST(store->size() == 5u);
}

BOOST_AUTO_TEST_CASE(incremental_ignores_highest_uid_below_range)
{
    fake_client server;
    fill_inbox(server, 3);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto first = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(first.has_value());

        // UID 4 arrived and was expunged again before this sync
        server.folders["INBOX"].uid_next = 5;
        const std::size_t fetches_before = server.fetches;
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::incremental_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(report->messages_processed == 0u);
        BOOST_TEST(server.fetches == fetches_before);
    });

    auto state = store->get_folder_sync_state("acct", "INBOX");
    BOOST_REQUIRE(state.has_value());
    BOOST_REQUIRE(state->has_value());
    BOOST_TEST((*state)->uid_next == 5u);
}

BOOST_AUTO_TEST_CASE(incremental_by_modseq_resolves_conflicts)
{
    fake_client server;
    server.capabilities.insert(capability::condstore);
    fill_inbox(server, 3);
    server.folders["INBOX"].highest_modseq = 100;
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto first = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(first.has_value());

        auto& box = server.folders["INBOX"];
        box.messages[2].flags->insert(message_flag::flagged());
        box.messages[2].modseq = 105;
        box.highest_modseq = 105;

        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::incremental_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(report->messages_processed == 1u);
        BOOST_TEST(report->conflicts_resolved == 1u);

        // unchanged HIGHESTMODSEQ means no search at all
        const std::size_t searches_before = server.searches;
        auto quiet = co_await engine.sync_folder(server, "acct", "INBOX", sync::incremental_sync{});
        BOOST_REQUIRE(quiet.has_value());
        BOOST_TEST(server.searches == searches_before);
    });

    BOOST_TEST(server.search_log.back() == "MODSEQ 101");
    BOOST_TEST(server.fetch_sets.back() == "2");

    auto updated = store->get_message_by_uid("acct", "INBOX", 2);
    BOOST_REQUIRE(updated.has_value());
    BOOST_REQUIRE(updated->has_value());
    BOOST_TEST((*updated)->has_flag("\\Flagged"));
    BOOST_TEST((*updated)->sync_version == 2u);

    auto state = store->get_folder_sync_state("acct", "INBOX");
    BOOST_REQUIRE(state.has_value());
    BOOST_REQUIRE(state->has_value());
    BOOST_TEST((*state)->highest_modseq.value_or(0) == 105u);
}

BOOST_AUTO_TEST_CASE(conflict_resolution_by_policy)
{
    struct outcome
    {
        std::vector<std::string> flags;
        std::uint32_t version;
    };

    auto resolve = [](sync::conflict_policy policy) -> outcome
    {
        fake_client server;
        server.capabilities.insert(capability::condstore);
        fill_inbox(server, 1);
        server.folders["INBOX"].highest_modseq = 10;
        auto store = std::make_shared<sync::memory_storage>();
        engine_type engine(store, quick_config());
        engine.set_conflict_policy(policy);

        run_sync([&]() -> mailsync::asio::awaitable<void>
        {
            auto first = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
            BOOST_REQUIRE(first.has_value());

            auto local = store->get_message_by_uid("acct", "INBOX", 1);
            BOOST_REQUIRE(local.has_value());
            BOOST_REQUIRE(local->has_value());
            sync::stored_message edited = **local;
            edited.flags = {"$Local"};
            BOOST_REQUIRE(store->store_message(edited).has_value());

            auto& box = server.folders["INBOX"];
            box.messages[1].flags = mailsync::imap::flag_set{message_flag::answered()};
            box.messages[1].modseq = 11;
            box.highest_modseq = 11;

            auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::incremental_sync{});
            BOOST_REQUIRE(report.has_value());
            BOOST_TEST(report->conflicts_resolved == 1u);
        });

        auto stored = store->get_message_by_uid("acct", "INBOX", 1);
        BOOST_REQUIRE(stored.has_value());
        BOOST_REQUIRE(stored->has_value());
        return outcome{(*stored)->flags, (*stored)->sync_version};
    };

    const auto server_wins = resolve(sync::conflict_policy::server_wins);
    BOOST_TEST((server_wins.flags == std::vector<std::string>{"\\Answered"}));
    BOOST_TEST(server_wins.version == 2u);

    const auto local_wins = resolve(sync::conflict_policy::local_wins);
    BOOST_TEST((local_wins.flags == std::vector<std::string>{"$Local"}));
    BOOST_TEST(local_wins.version == 1u);

    const auto merged = resolve(sync::conflict_policy::merge);
    BOOST_TEST((merged.flags == std::vector<std::string>{"$Local", "\\Answered"}));
    BOOST_TEST(merged.version == 2u);

    const auto asked = resolve(sync::conflict_policy::ask_user);
    BOOST_TEST((asked.flags == std::vector<std::string>{"\\Answered"}));
    BOOST_TEST(asked.version == 2u);
}

BOOST_AUTO_TEST_CASE(cancel_without_running_sync)
{
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());
    auto res = engine.cancel_sync("acct", "INBOX");
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::not_found);
}

BOOST_AUTO_TEST_CASE(cancel_stops_at_batch_boundary)
{
    fake_client server;
    fill_inbox(server, 3);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config(1));

    std::vector<sync::sync_progress> seen;
    engine.on_progress([&](const sync::sync_progress& p) { seen.push_back(p); });

    bool cancel_ok = false;
    server.after_fetch = [&]
    {
        if (server.fetches == 1)
            cancel_ok = engine.cancel_sync("acct", "INBOX").has_value();
    };

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(!report.has_value());
        BOOST_TEST(report.error().code == errc::sync_cancelled);
    });

    BOOST_TEST(cancel_ok);
    BOOST_TEST(server.fetches == 1u);
    // the batch already fetched is still stored
    BOOST_TEST(store->size() == 1u);

    auto progress = engine.get_progress("acct", "INBOX");
    BOOST_REQUIRE(progress.has_value());
    BOOST_TEST((progress->phase == sync::sync_phase::error));
    BOOST_TEST(progress->error_message == engine_type::CANCELLED_MESSAGE);

    auto state = store->get_folder_sync_state("acct", "INBOX");
    BOOST_REQUIRE(state.has_value());
    BOOST_REQUIRE(state->has_value());
    BOOST_TEST(((*state)->status == sync::sync_status::error));

    BOOST_REQUIRE(!seen.empty());
    BOOST_TEST((seen.back().phase == sync::sync_phase::error));

    // finished runs cannot be cancelled
    BOOST_TEST(engine.cancel_sync("acct", "INBOX").error().code == errc::not_found);
}

BOOST_AUTO_TEST_CASE(same_folder_syncs_never_overlap)
{
    // one session per folder, so only the two INBOX runs contend
    fake_client inbox_server;
    fill_inbox(inbox_server, 4);
    inbox_server.fetch_delay = 20ms;
    fake_client archive_server;
    archive_server.add_folder("Archive", 5);
    archive_server.deliver("Archive", fake_client::make_message(1, "old"));
    archive_server.fetch_delay = 20ms;

    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config(1));

    mailsync::asio::io_context ctx;
    int done = 0;
    auto launch = [&](fake_client& server, std::string folder)
    {
        mailsync::asio::co_spawn(ctx,
            [&, folder]() -> mailsync::asio::awaitable<void>
            {
                auto report = co_await engine.sync_folder(server, "acct", folder, sync::full_sync{});
                BOOST_TEST(report.has_value());
                ++done;
            },
            mailsync::asio::detached);
    };
    launch(inbox_server, "INBOX");
    launch(inbox_server, "INBOX");
    launch(archive_server, "Archive");
    ctx.run();

    BOOST_TEST(done == 3);
    BOOST_TEST(engine.peak_folder_concurrency() == 1u);
    BOOST_TEST(inbox_server.fetches == 8u);
    BOOST_TEST(store->size() == 5u);
}

BOOST_AUTO_TEST_CASE(folders_sharing_a_session_take_turns)
{
    fake_client server;
    fill_inbox(server, 3);
    server.add_folder("Archive", 5);
    server.deliver("Archive", fake_client::make_message(1, "old"));
    server.deliver("Archive", fake_client::make_message(2, "older"));
    server.fetch_delay = 20ms;

    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config(1));

    mailsync::asio::io_context ctx;
    int done = 0;
    for (std::string folder : {"INBOX", "Archive"})
    {
        mailsync::asio::co_spawn(ctx,
            [&, folder]() -> mailsync::asio::awaitable<void>
            {
                auto report = co_await engine.sync_folder(server, "acct", folder, sync::full_sync{});
                BOOST_TEST(report.has_value());
                ++done;
            },
            mailsync::asio::detached);
    }
    ctx.run();

    BOOST_TEST(done == 2);
    BOOST_TEST(server.selects == 2u);
    BOOST_TEST(store->size() == 5u);

    for (std::uint32_t uid = 1; uid <= 3; ++uid)
    {
        auto msg = store->get_message_by_uid("acct", "INBOX", uid);
        BOOST_REQUIRE(msg.has_value());
        BOOST_REQUIRE(msg->has_value());
        BOOST_TEST((*msg)->subject.value_or("") == "message " + std::to_string(uid));
    }
    auto old = store->get_message_by_uid("acct", "Archive", 1);
    BOOST_REQUIRE(old.has_value());
    BOOST_REQUIRE(old->has_value());
    BOOST_TEST((*old)->subject.value_or("") == "old");
    auto stray = store->get_message_by_uid("acct", "Archive", 3);
    BOOST_REQUIRE(stray.has_value());
    BOOST_TEST(!stray->has_value());
}

BOOST_AUTO_TEST_CASE(cancel_during_last_batch_is_final)
{
    fake_client server;
    fill_inbox(server, 2);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config(50));

    std::vector<sync::sync_progress> seen;
    engine.on_progress([&](const sync::sync_progress& p) { seen.push_back(p); });

    bool cancel_ok = false;
    server.after_fetch = [&] { cancel_ok = engine.cancel_sync("acct", "INBOX").has_value(); };

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(!report.has_value());
        BOOST_TEST(report.error().code == errc::sync_cancelled);
    });

    BOOST_TEST(cancel_ok);
    BOOST_TEST(server.fetches == 1u);

    // the cancellation event is the last one anybody sees
    BOOST_REQUIRE(!seen.empty());
    BOOST_TEST((seen.back().phase == sync::sync_phase::error));
    BOOST_TEST(seen.back().error_message == engine_type::CANCELLED_MESSAGE);
    std::size_t terminal = 0;
    for (const auto& p : seen)
    {
        if (p.finished())
            ++terminal;
    }
    BOOST_TEST(terminal == 1u);

    auto progress = engine.get_progress("acct", "INBOX");
    BOOST_REQUIRE(progress.has_value());
    BOOST_TEST((progress->phase == sync::sync_phase::error));

    auto state = store->get_folder_sync_state("acct", "INBOX");
    BOOST_REQUIRE(state.has_value());
    BOOST_REQUIRE(state->has_value());
    BOOST_TEST(((*state)->status == sync::sync_status::error));
}

BOOST_AUTO_TEST_CASE(account_sync_orders_and_excludes)
{
    fake_client server;
    fill_inbox(server, 1);
    server.add_folder("Archive");
    server.add_folder("Drafts");
    server.add_folder("Spam");
    server.add_folder("[Gmail]").selectable = false;
    server.add_folder("Trash");

    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    mailsync::accounts::sync_settings settings;
    settings.priority_folders = {"Drafts", "INBOX"};
    settings.excluded_folders = {"Spam"};

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto report = co_await engine.sync_account(server, "acct", sync::full_sync{}, settings);
        BOOST_REQUIRE(report.has_value());
        BOOST_REQUIRE(report->synced.size() == 4u);
        BOOST_TEST(report->synced[0].folder == "Drafts");
        BOOST_TEST(report->synced[1].folder == "INBOX");
        BOOST_TEST(report->synced[2].folder == "Archive");
        BOOST_TEST(report->synced[3].folder == "Trash");
        BOOST_TEST(report->failed.empty());
        BOOST_TEST(report->messages_processed() == 1u);
    });
    BOOST_TEST(server.selects == 4u);
}

BOOST_AUTO_TEST_CASE(account_sync_continues_after_failure)
{
    fake_client server;
    fill_inbox(server, 2);
    server.add_folder("Archive");

    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        // INBOX goes first, Archive is made unselectable after LIST ran
        server.after_fetch = [&] { server.folders["Archive"].selectable = false; };
        auto report = co_await engine.sync_account(server, "acct", sync::full_sync{});
        BOOST_REQUIRE(report.has_value());
        BOOST_REQUIRE(report->synced.size() == 1u);
        BOOST_TEST(report->synced[0].folder == "INBOX");
        BOOST_REQUIRE(report->failed.size() == 1u);
        BOOST_TEST(report->failed[0].first == "Archive");
        BOOST_TEST(report->failed[0].second.code == errc::imap_tagged_no);
    });

    auto archive = engine.get_progress("acct", "Archive");
    BOOST_REQUIRE(archive.has_value());
    BOOST_TEST((archive->phase == sync::sync_phase::error));
}

BOOST_AUTO_TEST_CASE(recent_sync_searches_by_date)
{
    fake_client server;
    fill_inbox(server, 2);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto first = co_await engine.sync_folder(server, "acct", "INBOX", sync::full_sync{});
        BOOST_REQUIRE(first.has_value());
        auto report = co_await engine.sync_folder(server, "acct", "INBOX", sync::recent_sync{3});
        BOOST_REQUIRE(report.has_value());
        BOOST_TEST(report->strategy == "recent(3d)");
    });
    BOOST_TEST(server.search_log.back().starts_with("SINCE "));
}

BOOST_AUTO_TEST_CASE(refresh_counts_messages)
{
    fake_client server;
    fill_inbox(server, 4);
    auto store = std::make_shared<sync::memory_storage>();
    engine_type engine(store, quick_config());

    run_sync([&]() -> mailsync::asio::awaitable<void>
    {
        auto count = co_await engine.refresh_folder(server, "acct", "INBOX");
        BOOST_REQUIRE(count.has_value());
        BOOST_TEST(*count == 4u);
    });
    BOOST_TEST(store->size() == 4u);
    for (const auto& msg : store->messages("acct", "INBOX"))
        BOOST_TEST(!msg.body.has_value());
}

BOOST_AUTO_TEST_CASE(conversion_requires_uid)
{
    fetched_message msg;
    msg.sequence = 7;
    auto res = sync::to_stored_message(msg, "acct", "INBOX");
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == errc::codec_invalid_input);

    auto ok = sync::to_stored_message(fake_client::make_message(9, "hello", true), "acct", "INBOX");
    BOOST_REQUIRE(ok.has_value());
    BOOST_TEST(ok->uid == 9u);
    BOOST_TEST(ok->message_id.value_or("") == "<9@example.com>");
    BOOST_TEST(ok->size == 109u);
    BOOST_TEST(ok->is_seen());
}
