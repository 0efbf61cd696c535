#pragma once

#include "task_agg/config.hpp"
#include "task_agg/report.hpp"

#include <vector>

namespace bench_ta {

// Runs the configured strategy sequence against a dice source and prints one line per run.
class StrategyBenchmark {
public:
    explicit StrategyBenchmark(const task_agg::AppConfig& cfg);

    std::vector<task_agg::ExecutionReport> RunAll();
    void PrintResult(const task_agg::ExecutionReport& report) const;
    void PrintSummary(const std::vector<task_agg::ExecutionReport>& reports) const;

private:
    task_agg::AppConfig cfg_;
};

}
