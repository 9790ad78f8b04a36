/*

sync/types.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <mailsync/detail/result.hpp>

namespace mailsync::sync
{

using namespace std::literals::chrono_literals;

// ==================== Strategies ====================

/// Every message, headers and body
struct full_sync
{
    bool operator==(const full_sync&) const = default;
};

/// Only what changed since the stored checkpoint
struct incremental_sync
{
    bool operator==(const incremental_sync&) const = default;
};

/// Envelope, flags and size of every message, never the body
struct headers_only_sync
{
    bool operator==(const headers_only_sync&) const = default;
};

/// Messages delivered during the last `days` days
struct recent_sync
{
    std::uint32_t days = 7;

    bool operator==(const recent_sync&) const = default;
};

using sync_strategy = std::variant<full_sync, incremental_sync, headers_only_sync, recent_sync>;

[[nodiscard]] inline std::string to_string(const sync_strategy& strategy)
{
    return std::visit([](const auto& s) -> std::string
    {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, full_sync>)
            return "full";
        else if constexpr (std::is_same_v<S, incremental_sync>)
            return "incremental";
        else if constexpr (std::is_same_v<S, headers_only_sync>)
            return "headers_only";
        else
            return std::format("recent({}d)", s.days);
    }, strategy);
}

[[nodiscard]] inline bool fetches_bodies(const sync_strategy& strategy) noexcept
{
    return !std::holds_alternative<headers_only_sync>(strategy);
}

enum class conflict_policy
{
    server_wins,
    local_wins,
    /// Union of both flag sets and a bumped local version; other fields stay local
    merge,
    /// Resolved as server_wins here; interactive resolution belongs to the caller
    ask_user
};

[[nodiscard]] constexpr std::string_view to_string(conflict_policy policy) noexcept
{
    switch (policy)
    {
        case conflict_policy::server_wins: return "server_wins";
        case conflict_policy::local_wins: return "local_wins";
        case conflict_policy::merge: return "merge";
        case conflict_policy::ask_user: return "ask_user";
    }
    return "unknown";
}

// ==================== Checkpoint ====================

enum class sync_status
{
    idle,
    syncing,
    error,
    complete
};

[[nodiscard]] constexpr std::string_view to_string(sync_status st) noexcept
{
    switch (st)
    {
        case sync_status::idle: return "idle";
        case sync_status::syncing: return "syncing";
        case sync_status::error: return "error";
        case sync_status::complete: return "complete";
    }
    return "unknown";
}

/**
Durable per folder checkpoint.

Read before every sync to pick the algorithm and rewritten after every
attempt, so `status` always describes the last one.
**/
struct folder_sync_state
{
    std::string account_id;
    std::string folder;
    std::uint32_t uid_validity = 0;
    std::uint32_t uid_next = 1;
    std::optional<std::uint64_t> highest_modseq;
    std::chrono::system_clock::time_point last_sync{};
    std::uint32_t message_count = 0;
    std::uint32_t unread_count = 0;
    sync_status status = sync_status::idle;
    std::string error_message;

    bool operator==(const folder_sync_state&) const = default;
};

// ==================== Progress ====================

enum class sync_phase
{
    initializing,
    checking_folders,
    fetching_headers,
    fetching_bodies,
    processing_changes,
    complete,
    error
};

[[nodiscard]] constexpr std::string_view to_string(sync_phase phase) noexcept
{
    switch (phase)
    {
        case sync_phase::initializing: return "initializing";
        case sync_phase::checking_folders: return "checking_folders";
        case sync_phase::fetching_headers: return "fetching_headers";
        case sync_phase::fetching_bodies: return "fetching_bodies";
        case sync_phase::processing_changes: return "processing_changes";
        case sync_phase::complete: return "complete";
        case sync_phase::error: return "error";
    }
    return "unknown";
}

struct sync_progress
{
    std::string account_id;
    std::string folder;
    sync_phase phase = sync_phase::initializing;
    /// Set with `sync_phase::error`
    std::string error_message;
    std::uint32_t messages_processed = 0;
    std::uint32_t total_messages = 0;
    std::uint64_t bytes_downloaded = 0;
    std::chrono::system_clock::time_point started_at{};
    std::optional<std::chrono::system_clock::time_point> estimated_completion;

    [[nodiscard]] bool finished() const noexcept
    {
        return phase == sync_phase::complete || phase == sync_phase::error;
    }

    /// Linear extrapolation of the observed per message rate
    void update_estimate(std::chrono::system_clock::time_point now)
    {
        if (messages_processed == 0 || now <= started_at)
            return;
        const std::chrono::duration<double> elapsed = now - started_at;
        const double rate = messages_processed / elapsed.count();
        if (rate <= 0.0)
            return;
        const std::uint32_t remaining = total_messages > messages_processed ? total_messages - messages_processed : 0;
        const std::chrono::duration<double> left(remaining / rate);
        estimated_completion = now + std::chrono::duration_cast<std::chrono::system_clock::duration>(left);
    }
};

// ==================== Configuration ====================

struct sync_config
{
    /// Messages per UID FETCH for strategies that download bodies
    std::size_t batch_size = 50;

    /// Messages per UID FETCH for the headers-only strategy
    std::size_t headers_batch_size = 100;

    /// Pause between two batches to bound server load
    std::chrono::milliseconds batch_pause{100};

    conflict_policy conflicts = conflict_policy::server_wins;
};

/// Outcome of one folder sync
struct folder_sync_report
{
    std::string folder;
    std::string strategy;
    bool forced_full = false;
    std::uint32_t messages_processed = 0;
    std::uint32_t messages_skipped = 0;
    std::uint32_t conflicts_resolved = 0;
};

/// Outcome of a whole account sync; one failing folder never stops the rest
struct account_sync_report
{
    std::string account_id;
    std::vector<folder_sync_report> synced;
    std::vector<std::pair<std::string, error_info>> failed;

    [[nodiscard]] std::uint32_t messages_processed() const noexcept
    {
        std::uint32_t total = 0;
        for (const auto& f : synced)
            total += f.messages_processed;
        return total;
    }
};

} // namespace mailsync::sync
