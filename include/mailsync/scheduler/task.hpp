/*

scheduler/task.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <mailsync/detail/result.hpp>
#include <mailsync/sync/types.hpp>

namespace mailsync::scheduler
{

using task_id = std::uint64_t;

enum class task_priority : std::uint8_t
{
    low = 0,
    normal = 1,
    high = 2,
    critical = 3
};

[[nodiscard]] constexpr std::string_view to_string(task_priority p) noexcept
{
    switch (p)
    {
        case task_priority::low: return "low";
        case task_priority::normal: return "normal";
        case task_priority::high: return "high";
        case task_priority::critical: return "critical";
    }
    return "unknown";
}

// ==================== Task kinds ====================

struct account_sync_task
{
    sync::sync_strategy strategy{sync::incremental_sync{}};
};

struct folder_sync_task
{
    std::string folder;
    sync::sync_strategy strategy{sync::incremental_sync{}};
};

struct folder_refresh_task
{
    std::string folder;
};

/// Server side text search; an empty folder list means every selectable folder
struct search_task
{
    std::string query;
    std::vector<std::string> folders;
};

struct indexing_task
{
    std::string folder;
};

/// Load the newest `message_count` messages of a folder from the store
struct cache_warm_task
{
    std::string folder;
    std::size_t message_count = 50;
};

using task_kind = std::variant<account_sync_task, folder_sync_task, folder_refresh_task, search_task,
    indexing_task, cache_warm_task>;

[[nodiscard]] inline std::string_view kind_name(const task_kind& kind) noexcept
{
    switch (kind.index())
    {
        case 0: return "account_sync";
        case 1: return "folder_sync";
        case 2: return "folder_refresh";
        case 3: return "search";
        case 4: return "indexing";
        case 5: return "cache_warm";
    }
    return "unknown";
}

struct background_task
{
    /// Assigned by the scheduler when queued
    task_id id = 0;
    std::string name;
    task_priority priority = task_priority::normal;
    std::string account_id;
    std::optional<std::string> folder;
    task_kind kind;
    std::chrono::steady_clock::time_point created_at{};
    std::optional<std::chrono::steady_clock::duration> estimated_duration;
};

// ==================== Outcomes ====================

enum class task_state
{
    queued,
    running,
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr std::string_view to_string(task_state st) noexcept
{
    switch (st)
    {
        case task_state::queued: return "queued";
        case task_state::running: return "running";
        case task_state::completed: return "completed";
        case task_state::failed: return "failed";
        case task_state::cancelled: return "cancelled";
    }
    return "unknown";
}

struct task_status
{
    task_state state = task_state::queued;
    /// Failure reason; `"timeout"` when the task ran past its deadline
    std::string reason;

    static task_status queued() { return {task_state::queued, {}}; }
    static task_status running() { return {task_state::running, {}}; }
    static task_status completed() { return {task_state::completed, {}}; }
    static task_status failed(std::string why) { return {task_state::failed, std::move(why)}; }
    static task_status cancelled() { return {task_state::cancelled, {}}; }

    [[nodiscard]] bool is_terminal() const noexcept
    {
        return state == task_state::completed || state == task_state::failed || state == task_state::cancelled;
    }

    bool operator==(const task_status&) const = default;
};

inline constexpr std::string_view TIMEOUT_REASON = "timeout";

struct message_count
{
    std::size_t count = 0;
};

/// Matches as `folder:uid`
struct search_hits
{
    std::vector<std::string> matches;
};

struct cache_stats
{
    std::size_t cached = 0;
};

using task_output = std::variant<std::monostate, sync::folder_sync_report, sync::account_sync_report,
    message_count, search_hits, cache_stats>;

struct task_result
{
    task_id id = 0;
    task_status status;
    std::string account_id;
    task_kind kind;
    std::chrono::steady_clock::time_point started_at{};
    std::optional<std::chrono::steady_clock::time_point> completed_at;
    std::optional<error_info> error;
    task_output output;
};

} // namespace mailsync::scheduler
