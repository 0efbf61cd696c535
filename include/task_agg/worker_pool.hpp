#pragma once

#include "task_agg/config.hpp"
#include "task_agg/errors.hpp"
#include "task_agg/fwd.hpp"
#include "mpmc/blocking_queue_adapter.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace task_agg {

/*
Fixed set of persistent workers pulling from a bounded MPMC queue.

Submission only enqueues; it never waits for a worker. When the queue is full
the QueueFullPolicy decides between waiting for room (Block) and throwing
QueueFullError (Reject). Stop(Graceful) stops accepting work and returns once
every accepted task has finished executing; Stop(Force) drops whatever is
still queued and waits only for the tasks already running.
*/
class WorkerPool {
public:
    struct Statistics {
        std::size_t statistic_total_submitted = 0;
        std::size_t statistic_total_completed = 0;
        std::size_t statistic_total_failed = 0;
        std::size_t statistic_total_rejected = 0;
        std::size_t statistic_total_cancelled = 0;
        std::size_t statistic_peak_active = 0;
        std::size_t statistic_pending_tasks = 0;
        std::size_t statistic_workers = 0;
        std::chrono::nanoseconds statistic_total_exec_time{0};
        std::chrono::nanoseconds statistic_avg_exec_time{0};
    };

    explicit WorkerPool(std::size_t workers, std::size_t queue_cap = 1024);
    explicit WorkerPool(const WorkerPoolConfig& cfg);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void Start();
    void Stop(StopMode mode = StopMode::Graceful);

    // Returns a future that carries the result or the exception of f.
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>> {
        using R = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;
        auto task = std::make_shared<std::packaged_task<R()>>(
            [fn = std::forward<F>(f), params = std::make_tuple(std::forward<Args>(args)...)]() mutable {
                return std::apply(std::move(fn), std::move(params));
            });
        auto fut = task->get_future();
        Enqueue([task] { (*task)(); });
        return fut;
    }

    // Fire and forget; an exception thrown by f is logged and counted as failed.
    template <typename F>
    void Post(F&& f) {
        Enqueue(Task(std::forward<F>(f)));
    }

    void SetQueueFullPolicy(QueueFullPolicy policy) noexcept {
        policy_.store(policy, std::memory_order_relaxed);
    }

    PoolState State() const noexcept { return state_.load(std::memory_order_acquire); }
    std::size_t Workers() const noexcept { return worker_count_; }
    std::size_t ActiveTasks() const noexcept { return active_.load(std::memory_order_acquire); }
    std::size_t Pending() const noexcept { return queue_.ApproxSize(); }
    std::size_t QueueCapacity() const noexcept { return queue_.Capacity(); }

    Statistics GetStatistics() const;

private:
    using Task = std::function<void()>;

    void Enqueue(Task task);
    void WorkerLoop(std::size_t index);
    void RunTask(Task& task, std::size_t index);

    const std::size_t worker_count_;
    BlockingQueueAdapter<Task> queue_;
    std::vector<std::thread> workers_;
    std::mutex lifecycle_mutex_;

    std::atomic<PoolState> state_{PoolState::CREATED};
    std::atomic<QueueFullPolicy> policy_{QueueFullPolicy::Block};
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> enqueuing_{0};  // Enqueue calls past the admission check

    std::atomic<std::size_t> submitted_{0};
    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> rejected_{0};
    std::atomic<std::size_t> cancelled_{0};
    std::atomic<std::size_t> peak_active_{0};
    std::atomic<std::int64_t> exec_time_ns_{0};
};

}
