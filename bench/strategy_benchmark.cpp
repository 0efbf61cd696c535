#include "strategy_benchmark.hpp"

#include "task_agg/strategies.hpp"
#include "task_agg/task_source.hpp"
#include "logger.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>

namespace bench_ta {

StrategyBenchmark::StrategyBenchmark(const task_agg::AppConfig& cfg)
    : cfg_(cfg) {}

std::vector<task_agg::ExecutionReport> StrategyBenchmark::RunAll() {
    task_agg::DiceSource dice(cfg_.dice_faces, cfg_.task_latency, cfg_.seed);

    std::cout << "=== Strategy comparison start ===\n"
              << "Tasks: " << cfg_.aggregation.tasks
              << ", Workers (pooled): " << cfg_.aggregation.workers
              << ", Latency per task: " << cfg_.task_latency.count() << " ms"
              << ", Dice faces: " << cfg_.dice_faces << std::endl;

    std::vector<task_agg::ExecutionReport> reports;
    reports.reserve(cfg_.strategies.size());
    for (auto kind : cfg_.strategies) {
        TA_LOG_INFO("starting {}", task_agg::ToString(kind));
        reports.push_back(task_agg::Run(kind, dice, cfg_.aggregation));
        PrintResult(reports.back());
    }
    return reports;
}

void StrategyBenchmark::PrintResult(const task_agg::ExecutionReport& report) const {
    std::cout << task_agg::FormatReport(report) << std::endl;
}

void StrategyBenchmark::PrintSummary(const std::vector<task_agg::ExecutionReport>& reports) const {
    if (reports.empty()) {
        return;
    }
    // Expected lower bound for the pool: ceil(N / P) rounds of one latency each.
    const auto rounds = (cfg_.aggregation.tasks + cfg_.aggregation.workers - 1) / cfg_.aggregation.workers;
    std::cout << "\n=== Summary ===\n"
              << "Ideal pooled time: " << rounds * static_cast<std::size_t>(cfg_.task_latency.count())
              << " ms (" << rounds << " rounds)" << std::endl;
    for (const auto& r : reports) {
        std::cout << std::left << std::setw(12) << task_agg::ToString(r.strategy)
                  << std::right << std::fixed << std::setprecision(2)
                  << std::chrono::duration<double, std::milli>(r.elapsed).count() << " ms" << std::endl;
    }
}

}
