#pragma once

#include "task_agg/fwd.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace task_agg {

/*
A nullary producer of one Result per call.

Contract: Invoke() must be safe to call concurrently from any number of
threads without external locking. Every strategy relies on this; the
implementations below keep all mutable state atomic or thread-local.
*/
class TaskSource {
public:
    virtual ~TaskSource() = default;

    virtual Result Invoke() = 0;
};

// Rolls a `faces`-sided die after sleeping for `latency`.
class DiceSource final : public TaskSource {
public:
    // seed == 0 draws a seed from std::random_device.
    explicit DiceSource(int faces = 6,
                        std::chrono::milliseconds latency = std::chrono::milliseconds(100),
                        std::uint64_t seed = 0);

    Result Invoke() override;

    int Faces() const noexcept { return faces_; }
    std::chrono::milliseconds Latency() const noexcept { return latency_; }

private:
    int faces_;
    std::chrono::milliseconds latency_;
    std::uint64_t seed_;
    std::uint64_t id_;  // unique per instance; keys the per-thread engines
};

// Yields first, first + 1, ... in invocation order.
class SequenceSource final : public TaskSource {
public:
    explicit SequenceSource(Result first = 1,
                            std::chrono::microseconds latency = std::chrono::microseconds(0));

    Result Invoke() override;

private:
    std::atomic<Result> next_;
    std::chrono::microseconds latency_;
};

// Counts calls and tracks how many are running at once.
class InstrumentedSource final : public TaskSource {
public:
    explicit InstrumentedSource(TaskSource& inner);

    Result Invoke() override;

    std::size_t Invocations() const noexcept { return invocations_.load(std::memory_order_acquire); }
    std::size_t InFlight() const noexcept { return in_flight_.load(std::memory_order_acquire); }
    std::size_t PeakInFlight() const noexcept { return peak_in_flight_.load(std::memory_order_acquire); }

    void Reset() noexcept;

private:
    TaskSource& inner_;
    std::atomic<std::size_t> invocations_{0};
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::size_t> peak_in_flight_{0};
};

// Throws TaskInvocationError on every `fail_every`-th call (0 = never).
class FailingSource final : public TaskSource {
public:
    FailingSource(TaskSource& inner, std::size_t fail_every);

    Result Invoke() override;

private:
    TaskSource& inner_;
    std::size_t fail_every_;
    std::atomic<std::size_t> calls_{0};
};

}
