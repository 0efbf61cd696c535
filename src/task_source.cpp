#include "task_agg/task_source.hpp"
#include "task_agg/errors.hpp"

#include <fmt/format.h>

#include <atomic>
#include <functional>
#include <random>
#include <stdexcept>
#include <thread>
#include <unordered_map>

namespace task_agg {

namespace {

std::atomic<std::uint64_t> next_dice_id{1};

}

DiceSource::DiceSource(int faces, std::chrono::milliseconds latency, std::uint64_t seed)
    : faces_(faces),
      latency_(latency),
      seed_(seed != 0 ? seed : std::random_device{}()),
      id_(next_dice_id.fetch_add(1, std::memory_order_relaxed)) {
    if (faces_ < 1) {
        throw std::invalid_argument(fmt::format("dice needs at least one face, got {}", faces_));
    }
}

Result DiceSource::Invoke() {
    // One engine per (source, thread), seeded on first use and never reseeded.
    thread_local std::unordered_map<std::uint64_t, std::mt19937_64> engines;
    auto it = engines.find(id_);
    if (it == engines.end()) {
        const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        it = engines.emplace(id_, std::mt19937_64(seed_ ^ (static_cast<std::uint64_t>(tid) * 0x9E3779B97F4A7C15ULL)))
                 .first;
    }

    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }
    std::uniform_int_distribution<int> face(1, faces_);
    return face(it->second);
}

SequenceSource::SequenceSource(Result first, std::chrono::microseconds latency)
    : next_(first), latency_(latency) {}

Result SequenceSource::Invoke() {
    const Result value = next_.fetch_add(1, std::memory_order_relaxed);
    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }
    return value;
}

InstrumentedSource::InstrumentedSource(TaskSource& inner)
    : inner_(inner) {}

Result InstrumentedSource::Invoke() {
    invocations_.fetch_add(1, std::memory_order_acq_rel);
    const std::size_t now = in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1;
    std::size_t peak = peak_in_flight_.load(std::memory_order_relaxed);
    while (now > peak &&
           !peak_in_flight_.compare_exchange_weak(peak, now, std::memory_order_acq_rel)) {
    }

    struct Leave {
        std::atomic<std::size_t>& counter;
        ~Leave() { counter.fetch_sub(1, std::memory_order_acq_rel); }
    } leave{in_flight_};

    return inner_.Invoke();
}

void InstrumentedSource::Reset() noexcept {
    invocations_.store(0, std::memory_order_release);
    peak_in_flight_.store(in_flight_.load(std::memory_order_acquire), std::memory_order_release);
}

FailingSource::FailingSource(TaskSource& inner, std::size_t fail_every)
    : inner_(inner), fail_every_(fail_every) {}

Result FailingSource::Invoke() {
    const std::size_t call = calls_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (fail_every_ != 0 && call % fail_every_ == 0) {
        throw TaskInvocationError(fmt::format("task invocation #{} failed", call));
    }
    return inner_.Invoke();
}

}
