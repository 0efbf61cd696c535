#include "task_agg/strategies.hpp"

#include "task_agg/errors.hpp"
#include "task_agg/join_counter.hpp"
#include "task_agg/result_queue.hpp"
#include "task_agg/thread_group.hpp"
#include "task_agg/worker_pool.hpp"
#include "logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <mutex>
#include <new>
#include <string>
#include <system_error>

namespace task_agg {

namespace {

// Keeps the first failure of a run; later ones are only counted.
class FailureSlot {
public:
    void Record(std::exception_ptr error, std::size_t units = 1) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!first_) {
            first_ = std::move(error);
        }
        count_ += units;
    }

    void ThrowIfAny(StrategyKind kind, std::size_t tasks) const {
        std::lock_guard<std::mutex> lk(mutex_);
        if (count_ == 0) {
            return;
        }
        std::string cause = "non-standard exception";
        try {
            std::rethrow_exception(first_);
        } catch (const std::exception& e) {
            cause = e.what();
        }
        TA_LOG_ERROR("{}: {} of {} task invocations failed, first: {}", ToString(kind), count_, tasks, cause);
        throw TaskInvocationError(
            fmt::format("{} aggregation aborted: {} of {} tasks failed ({})", ToString(kind), count_, tasks, cause),
            count_);
    }

private:
    mutable std::mutex mutex_;
    std::exception_ptr first_;
    std::size_t count_ = 0;
};

// A failed invocation contributes 0 so the number of deposits stays N.
Result InvokeGuarded(TaskSource& source, FailureSlot& failures) noexcept {
    try {
        return source.Invoke();
    } catch (...) {
        failures.Record(std::current_exception());
        return 0;
    }
}

// Units that never got a thread count as failed invocations.
void RecordUnstarted(FailureSlot& failures, std::exception_ptr error, StrategyKind kind,
                     std::size_t started, std::size_t tasks) {
    if (!error) {
        return;
    }
    TA_LOG_WARN("{}: started {} of {} threads before spawning failed", ToString(kind), started, tasks);
    failures.Record(std::move(error), tasks - started);
}

void Deposit(ResultQueue& results, Result value) {
    if (!results.Put(value)) {
        TA_LOG_WARN("result {} dropped, result queue already closed", value);
    }
}

}

Sum SumSequential(TaskSource& source, const AggregationConfig& cfg) {
    FailureSlot failures;
    Sum sum = 0;
    for (std::size_t i = 0; i < cfg.tasks; ++i) {
        sum += InvokeGuarded(source, failures);
    }
    failures.ThrowIfAny(StrategyKind::Sequential, cfg.tasks);
    return sum;
}

void FanOut(TaskSource& source, const AggregationConfig& cfg) {
    FailureSlot failures;
    JoinCounter pending(cfg.tasks);
    {
        ThreadGroup units(cfg.max_threads);
        std::exception_ptr spawn_error;
        const std::size_t started = SpawnJoined(units, pending, cfg.tasks, [&source, &failures] {
            static_cast<void>(InvokeGuarded(source, failures));
        }, spawn_error);
        RecordUnstarted(failures, spawn_error, StrategyKind::FanOut, started, cfg.tasks);
        pending.Wait();
    }
    failures.ThrowIfAny(StrategyKind::FanOut, cfg.tasks);
}

Sum SumBuffered(TaskSource& source, const AggregationConfig& cfg) {
    FailureSlot failures;
    // Room for every result, so no producer ever waits on a deposit.
    BufferedResultQueue results(cfg.tasks);
    JoinCounter pending(cfg.tasks);
    Sum sum = 0;
    {
        ThreadGroup producers(cfg.max_threads);
        std::exception_ptr spawn_error;
        const std::size_t started = SpawnJoined(producers, pending, cfg.tasks, [&source, &failures, &results] {
            Deposit(results, InvokeGuarded(source, failures));
        }, spawn_error);
        RecordUnstarted(failures, spawn_error, StrategyKind::Buffered, started, cfg.tasks);
        pending.Wait();
        results.Close();
        sum = DrainSum(results);
    }
    TA_LOG_DEBUG("buffered: capacity {}, {} suspended deposits", results.Capacity(), results.Suspensions());
    failures.ThrowIfAny(StrategyKind::Buffered, cfg.tasks);
    return sum;
}

Sum SumUnbuffered(TaskSource& source, const AggregationConfig& cfg) {
    FailureSlot failures;
    RendezvousResultQueue results;
    Sum sum = 0;
    std::size_t received = 0;
    {
        ThreadGroup supervisor;
        try {
            supervisor.Spawn([&source, &failures, &results, &cfg] {
                // Joins every producer before the supervisor itself finishes.
                ThreadGroup producers(cfg.max_threads);
                std::size_t started = 0;
                try {
                    producers.Reserve(cfg.tasks);
                    for (; started < cfg.tasks; ++started) {
                        producers.Spawn([&source, &failures, &results] {
                            Deposit(results, InvokeGuarded(source, failures));
                        });
                    }
                } catch (const std::system_error&) {
                    RecordUnstarted(failures, std::current_exception(), StrategyKind::Unbuffered, started, cfg.tasks);
                    // The reader would wait for deposits that never come.
                    results.Close();
                } catch (const std::bad_alloc&) {
                    RecordUnstarted(failures, std::current_exception(), StrategyKind::Unbuffered, started, cfg.tasks);
                    results.Close();
                }
            });
        } catch (const std::system_error&) {
            RecordUnstarted(failures, std::current_exception(), StrategyKind::Unbuffered, 0, cfg.tasks);
            results.Close();
        }
        sum = DrainSum(results, cfg.tasks, &received);
        results.Close();
    }
    TA_LOG_DEBUG("unbuffered: received {} of {} results", received, cfg.tasks);
    failures.ThrowIfAny(StrategyKind::Unbuffered, cfg.tasks);
    return sum;
}

Sum SumPooled(TaskSource& source, const AggregationConfig& cfg) {
    FailureSlot failures;
    RendezvousResultQueue results;

    // The queue holds every submission, so Post() never waits on a worker.
    WorkerPoolConfig pool_cfg;
    pool_cfg.workers = cfg.workers;
    pool_cfg.queue_cap = std::max<std::size_t>(cfg.tasks, 2);
    pool_cfg.queue_policy = QueueFullPolicy::Block;
    WorkerPool pool(pool_cfg);
    try {
        pool.Start();
    } catch (const std::system_error& e) {
        TA_LOG_ERROR("pooled: worker pool failed to start: {}", e.what());
        throw TaskInvocationError(
            fmt::format("pooled aggregation aborted: worker pool failed to start ({})", e.what()), cfg.tasks);
    }

    Sum sum = 0;
    {
        ThreadGroup supervisor;
        try {
            for (std::size_t i = 0; i < cfg.tasks; ++i) {
                pool.Post([&source, &failures, &results] {
                    Deposit(results, InvokeGuarded(source, failures));
                });
            }
        } catch (...) {
            // Workers parked on the rendezvous must be released before the pool drains.
            results.Close();
            throw;
        }

        bool supervised = true;
        try {
            supervisor.Spawn([&pool, &results] {
                pool.Stop(StopMode::Graceful);
                results.Close();
            });
        } catch (const std::system_error& e) {
            TA_LOG_WARN("pooled: no supervisor thread ({}), draining on the caller", e.what());
            supervised = false;
        }

        if (supervised) {
            sum = DrainSum(results);
        } else {
            // Every posted task deposits exactly once.
            sum = DrainSum(results, cfg.tasks);
            pool.Stop(StopMode::Graceful);
            results.Close();
        }
    }

    const auto stats = pool.GetStatistics();
    TA_LOG_DEBUG("pooled: {} workers, {} completed, peak {} active, avg {} ns per task",
                 stats.statistic_workers, stats.statistic_total_completed,
                 stats.statistic_peak_active, stats.statistic_avg_exec_time.count());
    failures.ThrowIfAny(StrategyKind::Pooled, cfg.tasks);
    return sum;
}

ExecutionReport Run(StrategyKind kind, TaskSource& source, const AggregationConfig& cfg) {
    ExecutionReport report;
    report.strategy = kind;
    report.tasks = cfg.tasks;
    report.workers = kind == StrategyKind::Pooled ? cfg.workers : 0;

    TA_LOG_DEBUG("running {} over {} tasks", ToString(kind), cfg.tasks);
    {
        TA_PERF_SCOPE_HOOK(std::string(ToString(kind)),
                           [&report](std::chrono::nanoseconds elapsed) { report.elapsed = elapsed; });
        switch (kind) {
        case StrategyKind::Sequential:
            report.sum = SumSequential(source, cfg);
            break;
        case StrategyKind::FanOut:
            FanOut(source, cfg);
            break;
        case StrategyKind::Buffered:
            report.sum = SumBuffered(source, cfg);
            break;
        case StrategyKind::Unbuffered:
            report.sum = SumUnbuffered(source, cfg);
            break;
        case StrategyKind::Pooled:
            report.sum = SumPooled(source, cfg);
            break;
        }
    }
    return report;
}

std::string_view ToString(StrategyKind kind) noexcept {
    switch (kind) {
    case StrategyKind::Sequential: return "sequential";
    case StrategyKind::FanOut:     return "fan_out";
    case StrategyKind::Buffered:   return "buffered";
    case StrategyKind::Unbuffered: return "unbuffered";
    case StrategyKind::Pooled:     return "pooled";
    }
    return "unknown";
}

std::optional<StrategyKind> ParseStrategy(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    for (auto kind : {StrategyKind::Sequential, StrategyKind::FanOut, StrategyKind::Buffered,
                      StrategyKind::Unbuffered, StrategyKind::Pooled}) {
        if (key == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

}
