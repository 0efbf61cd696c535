#pragma once

#include "mpmc/bounded_circular_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <utility>

/*
Blocking facade over BoundedCircularQueue.

The fast path stays lock-free; the mutex only guards the condition variables.
After Close() every push fails, while pops keep draining what is already
queued and fail once the queue is empty.
*/
template <typename T>
class BlockingQueueAdapter {
public:
    explicit BlockingQueueAdapter(std::size_t capacity)
        : queue_(capacity) {}

    BlockingQueueAdapter(const BlockingQueueAdapter&) = delete;
    BlockingQueueAdapter& operator=(const BlockingQueueAdapter&) = delete;

    std::size_t Capacity() const noexcept { return queue_.Capacity(); }
    std::size_t ApproxSize() const noexcept { return queue_.ApproxSize(); }
    bool Empty() const noexcept { return queue_.Empty(); }
    bool Full() const noexcept { return queue_.Full(); }
    bool Closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    std::size_t DiscardCount() const noexcept {
        return discarded_.load(std::memory_order_relaxed);
    }
    void ResetDiscardCounter() noexcept {
        discarded_.store(0, std::memory_order_relaxed);
    }

    // Non-blocking API

    bool TryPush(const T& item) { return TryEmplace(item); }
    bool TryPush(T&& item) { return TryEmplace(std::move(item)); }

    template <typename... Args>
    bool TryEmplace(Args&&... args) {
        if (Closed()) {
            return false;
        }
        if (!queue_.TryEmplace(std::forward<Args>(args)...)) {
            discarded_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        Notify(not_empty_);
        return true;
    }

    bool TryPop(T& out) {
        if (!queue_.TryPop(out)) {
            return false;
        }
        Notify(not_full_);
        return true;
    }

    // Blocking API

    bool WaitPush(const T& item) { return WaitEmplace(item); }
    bool WaitPush(T&& item) { return WaitEmplace(std::move(item)); }

    template <typename... Args>
    bool WaitEmplace(Args&&... args) {
        for (;;) {
            if (Closed()) {
                return false;
            }
            if (queue_.TryEmplace(std::forward<Args>(args)...)) {
                Notify(not_empty_);
                return true;
            }
            std::unique_lock<std::mutex> lk(mutex_);
            not_full_.wait(lk, [this] { return Closed() || !queue_.Full(); });
        }
    }

    bool WaitPop(T& out) {
        for (;;) {
            if (queue_.TryPop(out)) {
                Notify(not_full_);
                return true;
            }
            if (Closed() && queue_.Empty()) {
                return false;
            }
            std::unique_lock<std::mutex> lk(mutex_);
            not_empty_.wait(lk, [this] { return Closed() || !queue_.Empty(); });
        }
    }

    template <typename Rep, typename Period>
    bool WaitPushFor(const T& item, const std::chrono::duration<Rep, Period>& timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            if (Closed()) {
                return false;
            }
            if (queue_.TryPush(item)) {
                Notify(not_empty_);
                return true;
            }
            std::unique_lock<std::mutex> lk(mutex_);
            if (!not_full_.wait_until(lk, deadline, [this] { return Closed() || !queue_.Full(); })) {
                return false;
            }
        }
    }

    template <typename Rep, typename Period>
    bool WaitPopFor(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            if (queue_.TryPop(out)) {
                Notify(not_full_);
                return true;
            }
            if (Closed() && queue_.Empty()) {
                return false;
            }
            std::unique_lock<std::mutex> lk(mutex_);
            if (!not_empty_.wait_until(lk, deadline, [this] { return Closed() || !queue_.Empty(); })) {
                return false;
            }
        }
    }

    // Lifecycle

    void Close() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            closed_.store(true, std::memory_order_release);
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Drops every queued item; returns how many were dropped.
    std::size_t Clear() {
        std::size_t dropped = 0;
        T item;
        while (queue_.TryPop(item)) {
            ++dropped;
        }
        {
            std::lock_guard<std::mutex> lk(mutex_);
        }
        not_full_.notify_all();
        return dropped;
    }

private:
    void Notify(std::condition_variable& cv) {
        {
            // Pairs with the predicate check of a waiter about to sleep.
            std::lock_guard<std::mutex> lk(mutex_);
        }
        cv.notify_one();
    }

    BoundedCircularQueue<T> queue_;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::atomic<bool> closed_{false};
    std::atomic<std::size_t> discarded_{0};
};
