#pragma once

#include <cstdint>
#include <memory>

namespace spdlog {
class logger;
}

namespace task_agg {

using Result = std::int64_t;
using Sum = std::int64_t;

using LoggerPtr = std::shared_ptr<spdlog::logger>;

enum class StopMode {
    Graceful, // finish everything that was submitted
    Force,    // drop queued tasks, finish in-flight ones
};

enum class PoolState {
    CREATED,
    RUNNING,
    STOPPING,
    STOPPED,
};

enum class QueueFullPolicy {
    Block,
    Reject,
};

enum class StrategyKind {
    Sequential,
    FanOut,
    Buffered,
    Unbuffered,
    Pooled,
};

class TaskSource;
class ResultQueue;
class JoinCounter;
class ThreadGroup;
class WorkerPool;
class ConfigLoader;
struct WorkerPoolConfig;
struct AggregationConfig;
struct AppConfig;
struct ExecutionReport;

}
