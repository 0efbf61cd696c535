#pragma once

#include "task_agg/fwd.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace task_agg {

struct ExecutionReport {
    StrategyKind strategy = StrategyKind::Sequential;
    std::chrono::nanoseconds elapsed{0};
    std::size_t tasks = 0;
    std::size_t workers = 0;  // pooled strategy only
    std::optional<Sum> sum;   // empty for FanOut
};

// e.g. "Took 1.003s to sum 100 tasks using a worker pool of 10. Sum is 352"
std::string FormatReport(const ExecutionReport& report);

}
