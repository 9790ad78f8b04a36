/*

async_mutex.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include <mailsync/detail/asio_decl.hpp>
#include <mailsync/detail/result.hpp>

namespace mailsync::detail
{

/**
Coroutine mutex with FIFO hand-off.

A waiter parks on a timer that never expires on its own; `unlock()` marks the
front waiter ready and cancels its timer. Cancelling the awaiting coroutine
without a hand-off yields `net_cancelled`.
**/
class async_mutex
{
public:
    class scoped_lock
    {
    public:
        scoped_lock() noexcept = default;

        scoped_lock(const scoped_lock&) = delete;
        scoped_lock& operator=(const scoped_lock&) = delete;

        scoped_lock(scoped_lock&& other) noexcept
            : mutex_(std::exchange(other.mutex_, nullptr))
        {
        }

        scoped_lock& operator=(scoped_lock&& other) noexcept
        {
            if (this != &other)
            {
                unlock();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        ~scoped_lock()
        {
            unlock();
        }

        [[nodiscard]] bool owns_lock() const noexcept
        {
            return mutex_ != nullptr;
        }

        void unlock() noexcept
        {
            if (mutex_ != nullptr)
            {
                mutex_->unlock();
                mutex_ = nullptr;
            }
        }

    private:
        friend class async_mutex;

        explicit scoped_lock(async_mutex& mutex) noexcept
            : mutex_(&mutex)
        {
        }

        async_mutex* mutex_{nullptr};
    };

    explicit async_mutex(mailsync::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    async_mutex(const async_mutex&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;

    mailsync::asio::awaitable<result<scoped_lock>> lock()
    {
        bool expected = false;
        if (locked_.compare_exchange_strong(expected, true, std::memory_order_acquire))
            co_return scoped_lock(*this);

        auto waiter = std::make_shared<waiter_t>(executor_);
        waiter->timer.expires_at(mailsync::asio::steady_timer::time_point::max());
        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            // unlock() may have run between the failed exchange and this point
            expected = false;
            if (locked_.compare_exchange_strong(expected, true, std::memory_order_acquire))
                co_return scoped_lock(*this);
            waiters_.push_back(waiter);
        }

        auto [ec] = co_await waiter->timer.async_wait(mailsync::asio::use_nothrow_awaitable);

        if (!waiter->ready.load(std::memory_order_acquire))
        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
            if (it != waiters_.end())
                waiters_.erase(it);
            co_return fail<scoped_lock>(errc::net_cancelled, "async_mutex lock cancelled", {}, ec);
        }

        co_return scoped_lock(*this);
    }

    [[nodiscard]] bool is_locked() const noexcept
    {
        return locked_.load(std::memory_order_acquire);
    }

private:
    struct waiter_t
    {
        explicit waiter_t(mailsync::asio::any_io_executor executor)
            : timer(std::move(executor))
        {
        }

        mailsync::asio::steady_timer timer;
        std::atomic<bool> ready{false};
    };

    // Ownership passes straight to the front waiter; locked_ stays true.
    void unlock() noexcept
    {
        std::shared_ptr<waiter_t> waiter;
        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            if (waiters_.empty())
            {
                locked_.store(false, std::memory_order_release);
                return;
            }
            waiter = waiters_.front();
            waiters_.pop_front();
            waiter->ready.store(true, std::memory_order_release);
        }
        waiter->timer.cancel();
    }

    mailsync::asio::any_io_executor executor_;
    std::atomic<bool> locked_{false};
    mutable std::mutex waiters_mutex_;
    std::deque<std::shared_ptr<waiter_t>> waiters_;
};

} // namespace mailsync::detail
