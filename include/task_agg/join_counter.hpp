#pragma once

#include "task_agg/fwd.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace task_agg {

/*
Counts outstanding units of work; Wait() blocks until the count reaches zero.
Dropping below zero is a logic error.
*/
class JoinCounter {
public:
    explicit JoinCounter(std::size_t count = 0);

    JoinCounter(const JoinCounter&) = delete;
    JoinCounter& operator=(const JoinCounter&) = delete;

    void Add(std::size_t n = 1);
    void Done(std::size_t n = 1);

    void Wait();
    bool WaitFor(std::chrono::milliseconds timeout);

    std::size_t Count() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable zero_;
    std::size_t count_;
};

}
