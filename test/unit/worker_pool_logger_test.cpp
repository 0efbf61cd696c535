#include "task_agg/fwd.hpp"
#include "task_agg/strategies.hpp"
#include "task_agg/task_source.hpp"
#include "task_agg/worker_pool.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/base_sink.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {
class CapturingSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    std::vector<std::string> Messages() {
        std::lock_guard<std::mutex> lk(mutex_);
        return messages_;
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t buf;
        formatter_->format(msg, buf);
        messages_.emplace_back(fmt::to_string(buf));
    }

    void flush_() override {}

private:
    std::vector<std::string> messages_;
};

class LoggerScope {
public:
    explicit LoggerScope(task_agg::LoggerPtr replacement)
        : previous_(task_agg::log::LoadLogger()) {
        task_agg::log::SetLogger(std::move(replacement));
    }
    ~LoggerScope() noexcept {
        if (previous_) {
            task_agg::log::SetLogger(std::move(previous_));
        }
    }
    LoggerScope(const LoggerScope&) = delete;
    LoggerScope& operator=(const LoggerScope&) = delete;
private:
    task_agg::LoggerPtr previous_;
};

bool Contains(const std::vector<std::string>& messages, const std::string& needle) {
    for (const auto& m : messages) {
        if (m.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}
}

TEST(LoggerIntegration, MySink) {
    auto sink = std::make_shared<CapturingSink>();
    auto logger = std::make_shared<spdlog::logger>("logger-test", sink);
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::trace);

    LoggerScope guard(logger);

    TA_LOG_INFO("logger integration {}", 42);

    const auto messages = sink->Messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_NE(messages.front().find("logger integration 42"), std::string::npos);
}

TEST(LoggerIntegration, LevelFilters) {
    auto sink = std::make_shared<CapturingSink>();
    auto logger = std::make_shared<spdlog::logger>("logger-level", sink);
    logger->set_level(spdlog::level::warn);

    LoggerScope guard(logger);

    TA_LOG_DEBUG("hidden {}", 1);
    TA_LOG_WARN("shown {}", 2);

    const auto messages = sink->Messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_NE(messages.front().find("shown 2"), std::string::npos);
}

TEST(LoggerIntegration, Hook) {
    auto sink = std::make_shared<CapturingSink>();
    auto logger = std::make_shared<spdlog::logger>("logger-scope", sink);
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::debug);

    LoggerScope guard(logger);

    std::atomic<bool> hook_called{false};
    {
        TA_PERF_SCOPE_HOOK("sample-scope", [&](std::chrono::nanoseconds) {
            hook_called.store(true, std::memory_order_relaxed);
        });
    }

    EXPECT_TRUE(hook_called.load(std::memory_order_relaxed));
    const auto messages = sink->Messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_NE(messages.front().find("[perf] sample-scope took"), std::string::npos);
}

TEST(LoggerIntegration, PerfScopeSilentAboveDebug) {
    auto sink = std::make_shared<CapturingSink>();
    auto logger = std::make_shared<spdlog::logger>("logger-quiet", sink);
    logger->set_level(spdlog::level::info);

    LoggerScope guard(logger);
    {
        TA_PERF_SCOPE("quiet-scope");
    }
    EXPECT_TRUE(sink->Messages().empty());
}

// A failing run names the strategy and the failure count in the log
TEST(LoggerIntegration, FailedRunIsLogged) {
    auto sink = std::make_shared<CapturingSink>();
    auto logger = std::make_shared<spdlog::logger>("logger-failure", sink);
    logger->set_level(spdlog::level::err);

    LoggerScope guard(logger);

    task_agg::SequenceSource seq;
    task_agg::FailingSource failing(seq, 5);
    task_agg::AggregationConfig cfg;
    cfg.tasks = 10;
    EXPECT_THROW(task_agg::SumSequential(failing, cfg), task_agg::TaskInvocationError);

    EXPECT_TRUE(Contains(sink->Messages(), "sequential: 2 of 10 task invocations failed"));
}

TEST(WorkerPoolLogger, Statistics_Normal) {
    task_agg::WorkerPool pool(2, 16);
    pool.Start();

    constexpr int task_nums = 100;
    std::vector<std::future<void>> futures;
    futures.reserve(task_nums);
    for (int i = 0; i < task_nums; ++i) {
        futures.emplace_back(pool.Submit([]{}));
    }
    for (auto& fut : futures) {
        fut.get();
    }

    pool.Stop(task_agg::StopMode::Graceful);

    auto stats = pool.GetStatistics();
    EXPECT_EQ(stats.statistic_total_submitted, static_cast<std::size_t>(task_nums));
    EXPECT_EQ(stats.statistic_total_completed, static_cast<std::size_t>(task_nums));
    EXPECT_EQ(stats.statistic_total_failed, 0U);
    EXPECT_EQ(stats.statistic_workers, 2U);
    EXPECT_LE(stats.statistic_peak_active, 2U);
    EXPECT_GT(stats.statistic_total_exec_time.count(), 0);
}

TEST(WorkerPoolMetrics, Statistics_Cancel) {
    task_agg::WorkerPool pool(1, 2);
    pool.Start();

    std::promise<void> started;
    auto slow = pool.Submit([&started]{
        started.set_value();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    });
    started.get_future().wait();
    auto queued = pool.Submit([]{});

    pool.Stop(task_agg::StopMode::Force);
    auto stats = pool.GetStatistics();
    EXPECT_EQ(stats.statistic_total_cancelled, 1U);
    EXPECT_EQ(stats.statistic_total_completed, 1U);
    EXPECT_EQ(stats.statistic_pending_tasks, 0U);
}
