#include "task_agg/join_counter.hpp"

#include <stdexcept>

namespace task_agg {

JoinCounter::JoinCounter(std::size_t count)
    : count_(count) {}

void JoinCounter::Add(std::size_t n) {
    std::lock_guard<std::mutex> lk(mutex_);
    count_ += n;
}

void JoinCounter::Done(std::size_t n) {
    // Notify under the lock: a waiter may destroy the counter as soon as it sees zero.
    std::lock_guard<std::mutex> lk(mutex_);
    if (n > count_) {
        throw std::logic_error("JoinCounter::Done called more times than Add");
    }
    count_ -= n;
    if (count_ == 0) {
        zero_.notify_all();
    }
}

void JoinCounter::Wait() {
    std::unique_lock<std::mutex> lk(mutex_);
    zero_.wait(lk, [this] { return count_ == 0; });
}

bool JoinCounter::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    return zero_.wait_for(lk, timeout, [this] { return count_ == 0; });
}

std::size_t JoinCounter::Count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return count_;
}

}
