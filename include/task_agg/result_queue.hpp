#pragma once

#include "task_agg/fwd.hpp"
#include "mpmc/blocking_queue_adapter.hpp"
#include "mpmc/rendezvous_channel.hpp"

#include <atomic>
#include <cstddef>

namespace task_agg {

/*
Transport from many producers to one draining consumer.

Put() blocks while there is no room (always, for the rendezvous variant,
until a reader takes the value) and fails once the queue is closed.
Get() blocks until a value arrives and fails once the queue is closed and
nothing is left to read.
*/
class ResultQueue {
public:
    virtual ~ResultQueue() = default;

    virtual bool Put(Result value) = 0;
    virtual bool Get(Result& out) = 0;
    virtual void Close() = 0;
    virtual bool Closed() const = 0;

    virtual std::size_t Capacity() const noexcept = 0;
    // Number of Put() calls that had to wait for a reader or for room.
    virtual std::size_t Suspensions() const noexcept = 0;
};

class BufferedResultQueue final : public ResultQueue {
public:
    explicit BufferedResultQueue(std::size_t capacity);

    bool Put(Result value) override;
    bool Get(Result& out) override;
    void Close() override;
    bool Closed() const override;

    // The requested capacity; the ring underneath may round small values up.
    std::size_t Capacity() const noexcept override { return capacity_; }
    std::size_t Suspensions() const noexcept override {
        return suspensions_.load(std::memory_order_relaxed);
    }

private:
    std::size_t capacity_;
    BlockingQueueAdapter<Result> queue_;
    std::atomic<std::size_t> suspensions_{0};
};

class RendezvousResultQueue final : public ResultQueue {
public:
    RendezvousResultQueue() = default;

    bool Put(Result value) override;
    bool Get(Result& out) override;
    void Close() override;
    bool Closed() const override;

    std::size_t Capacity() const noexcept override { return 0; }
    std::size_t Suspensions() const noexcept override { return channel_.BlockedSends(); }

private:
    RendezvousChannel<Result> channel_;
};

// Reads until the queue is closed and empty.
Sum DrainSum(ResultQueue& queue);

// Reads at most `reads` values; stops early only if the queue closes.
Sum DrainSum(ResultQueue& queue, std::size_t reads, std::size_t* received = nullptr);

}
