#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

/*
Zero-capacity channel: Send() returns only once a receiver has taken the value.

One hand-off slot is shared by all senders; tickets order the senders so each
one knows when its own value was consumed. Close() wakes everyone; a sender
whose value is still in the slot takes it back and fails.
*/
template <typename T>
class RendezvousChannel {
public:
    RendezvousChannel() = default;

    RendezvousChannel(const RendezvousChannel&) = delete;
    RendezvousChannel& operator=(const RendezvousChannel&) = delete;

    bool Send(T value) {
        std::unique_lock<std::mutex> lk(mutex_);
        slot_free_.wait(lk, [this] { return closed_ || !slot_.has_value(); });
        if (closed_) {
            return false;
        }
        if (waiting_receivers_ == 0) {
            blocked_sends_.fetch_add(1, std::memory_order_relaxed);
        }
        slot_.emplace(std::move(value));
        const std::uint64_t ticket = ++offered_;
        slot_full_.notify_one();

        taken_cv_.wait(lk, [this, ticket] { return closed_ || taken_ >= ticket; });
        if (taken_ >= ticket) {
            return true;
        }
        // Closed before anyone took it.
        slot_.reset();
        slot_free_.notify_one();
        return false;
    }

    bool Receive(T& out) {
        std::unique_lock<std::mutex> lk(mutex_);
        ++waiting_receivers_;
        slot_full_.wait(lk, [this] { return closed_ || slot_.has_value(); });
        --waiting_receivers_;
        if (!slot_.has_value()) {
            return false;
        }
        out = std::move(*slot_);
        slot_.reset();
        ++taken_;
        taken_cv_.notify_all();
        slot_free_.notify_one();
        return true;
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            closed_ = true;
        }
        slot_full_.notify_all();
        slot_free_.notify_all();
        taken_cv_.notify_all();
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return closed_;
    }

    // Sends that found no receiver already waiting.
    std::size_t BlockedSends() const noexcept {
        return blocked_sends_.load(std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable slot_free_;
    std::condition_variable slot_full_;
    std::condition_variable taken_cv_;
    std::optional<T> slot_;
    std::uint64_t offered_ = 0;
    std::uint64_t taken_ = 0;
    std::size_t waiting_receivers_ = 0;
    bool closed_ = false;
    std::atomic<std::size_t> blocked_sends_{0};
};
