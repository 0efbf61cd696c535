#include "task_agg/worker_pool.hpp"

#include "logger.hpp"

#include <stdexcept>
#include <system_error>
#include <thread>

namespace task_agg {

WorkerPool::WorkerPool(std::size_t workers, std::size_t queue_cap)
    : worker_count_(workers),
      queue_(queue_cap) {
    if (worker_count_ == 0) {
        throw std::invalid_argument("WorkerPool needs at least one worker");
    }
}

WorkerPool::WorkerPool(const WorkerPoolConfig& cfg)
    : WorkerPool(cfg.workers, cfg.queue_cap) {
    policy_.store(cfg.queue_policy, std::memory_order_relaxed);
}

WorkerPool::~WorkerPool() {
    Stop(StopMode::Graceful);
}

void WorkerPool::Start() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (State() != PoolState::CREATED) {
        TA_LOG_WARN("WorkerPool::Start ignored, pool already started");
        return;
    }

    workers_.reserve(worker_count_);
    try {
        for (std::size_t i = 0; i < worker_count_; ++i) {
            workers_.emplace_back(&WorkerPool::WorkerLoop, this, i);
        }
    } catch (const std::system_error& e) {
        TA_LOG_ERROR("WorkerPool failed to spawn worker {} of {}: {}", workers_.size(), worker_count_, e.what());
        queue_.Close();
        for (auto& w : workers_) {
            w.join();
        }
        workers_.clear();
        cancelled_.fetch_add(queue_.Clear(), std::memory_order_relaxed);
        state_.store(PoolState::STOPPED, std::memory_order_release);
        throw;
    }

    state_.store(PoolState::RUNNING, std::memory_order_release);
    TA_LOG_DEBUG("WorkerPool started with {} workers, queue capacity {}", worker_count_, queue_.Capacity());
}

void WorkerPool::Stop(StopMode mode) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    const PoolState state = State();
    if (state == PoolState::STOPPED) {
        return;
    }

    state_.store(PoolState::STOPPING, std::memory_order_seq_cst);
    queue_.Close();
    // A submitter that saw RUNNING may still be pushing; let it land or fail first.
    while (enqueuing_.load(std::memory_order_seq_cst) != 0) {
        std::this_thread::yield();
    }

    // A pool that never started has nobody to drain its queue.
    const bool discard = mode == StopMode::Force || state == PoolState::CREATED;
    if (discard) {
        const std::size_t dropped = queue_.Clear();
        cancelled_.fetch_add(dropped, std::memory_order_relaxed);
        if (dropped > 0) {
            TA_LOG_DEBUG("WorkerPool dropped {} queued tasks", dropped);
        }
    }

    for (auto& w : workers_) {
        if (w.joinable()) {
            w.join();
        }
    }
    workers_.clear();

    // Workers may exit on an empty closed queue just before a late push lands.
    Task task;
    std::size_t stranded = 0;
    while (queue_.TryPop(task)) {
        ++stranded;
        if (discard) {
            task = nullptr;
            cancelled_.fetch_add(1, std::memory_order_relaxed);
        } else {
            RunTask(task, worker_count_);
        }
    }
    if (stranded > 0) {
        TA_LOG_DEBUG("WorkerPool {} {} tasks left after the workers exited",
                     discard ? "cancelled" : "ran", stranded);
    }

    state_.store(PoolState::STOPPED, std::memory_order_release);
    TA_LOG_DEBUG("WorkerPool stopped ({}), completed {} tasks",
                 mode == StopMode::Graceful ? "graceful" : "force",
                 completed_.load(std::memory_order_relaxed));
}

void WorkerPool::Enqueue(Task task) {
    enqueuing_.fetch_add(1, std::memory_order_seq_cst);
    struct Leave {
        std::atomic<std::size_t>& counter;
        ~Leave() { counter.fetch_sub(1, std::memory_order_seq_cst); }
    } leave{enqueuing_};

    const PoolState state = state_.load(std::memory_order_seq_cst);
    if (state == PoolState::STOPPING || state == PoolState::STOPPED) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        throw PoolShutdownError("WorkerPool is stopped, submission rejected");
    }

    submitted_.fetch_add(1, std::memory_order_relaxed);
    if (queue_.TryPush(std::move(task))) {
        return;
    }

    if (!queue_.Closed() && policy_.load(std::memory_order_relaxed) == QueueFullPolicy::Reject) {
        submitted_.fetch_sub(1, std::memory_order_relaxed);
        rejected_.fetch_add(1, std::memory_order_relaxed);
        throw QueueFullError("WorkerPool queue is full, submission rejected");
    }
    if (!queue_.WaitPush(std::move(task))) {
        submitted_.fetch_sub(1, std::memory_order_relaxed);
        rejected_.fetch_add(1, std::memory_order_relaxed);
        throw PoolShutdownError("WorkerPool stopped while waiting for queue space");
    }
}

void WorkerPool::WorkerLoop(std::size_t index) {
    TA_LOG_TRACE("worker {} running", index);
    Task task;
    while (queue_.WaitPop(task)) {
        RunTask(task, index);
    }
    TA_LOG_TRACE("worker {} exiting", index);
}

void WorkerPool::RunTask(Task& task, std::size_t index) {
    const std::size_t now = active_.fetch_add(1, std::memory_order_acq_rel) + 1;
    std::size_t peak = peak_active_.load(std::memory_order_relaxed);
    while (now > peak &&
           !peak_active_.compare_exchange_weak(peak, now, std::memory_order_relaxed)) {
    }

    const auto begin = std::chrono::steady_clock::now();
    bool ok = true;
    try {
        task();
    } catch (const std::exception& e) {
        ok = false;
        TA_LOG_ERROR("worker {} task failed: {}", index, e.what());
    } catch (...) {
        ok = false;
        TA_LOG_ERROR("worker {} task failed with a non-standard exception", index);
    }
    const auto spent = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - begin);
    exec_time_ns_.fetch_add(spent.count(), std::memory_order_relaxed);

    task = nullptr;
    (ok ? completed_ : failed_).fetch_add(1, std::memory_order_relaxed);
    active_.fetch_sub(1, std::memory_order_acq_rel);
}

WorkerPool::Statistics WorkerPool::GetStatistics() const {
    Statistics stats;
    stats.statistic_total_submitted = submitted_.load(std::memory_order_relaxed);
    stats.statistic_total_completed = completed_.load(std::memory_order_relaxed);
    stats.statistic_total_failed = failed_.load(std::memory_order_relaxed);
    stats.statistic_total_rejected = rejected_.load(std::memory_order_relaxed);
    stats.statistic_total_cancelled = cancelled_.load(std::memory_order_relaxed);
    stats.statistic_peak_active = peak_active_.load(std::memory_order_relaxed);
    stats.statistic_pending_tasks = queue_.ApproxSize();
    stats.statistic_workers = worker_count_;
    stats.statistic_total_exec_time = std::chrono::nanoseconds(exec_time_ns_.load(std::memory_order_relaxed));
    const std::size_t finished = stats.statistic_total_completed + stats.statistic_total_failed;
    if (finished > 0) {
        stats.statistic_avg_exec_time = stats.statistic_total_exec_time / static_cast<std::int64_t>(finished);
    }
    return stats;
}

}
