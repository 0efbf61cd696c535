#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace task_agg {

class TaskAggError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One or more task invocations threw; the aggregation is abandoned.
class TaskInvocationError : public TaskAggError {
public:
    TaskInvocationError(const std::string& what, std::size_t failed = 1)
        : TaskAggError(what), failed_(failed) {}

    std::size_t Failed() const noexcept { return failed_; }

private:
    std::size_t failed_;
};

class PoolShutdownError : public TaskAggError {
public:
    using TaskAggError::TaskAggError;
};

class QueueFullError : public TaskAggError {
public:
    using TaskAggError::TaskAggError;
};

}
