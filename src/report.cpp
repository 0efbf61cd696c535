#include "task_agg/report.hpp"
#include "task_agg/strategies.hpp"

#include <fmt/format.h>

namespace task_agg {

namespace {

std::string FormatDuration(std::chrono::nanoseconds d) {
    const auto ns = static_cast<double>(d.count());
    if (ns >= 1e9) {
        return fmt::format("{:.3f}s", ns / 1e9);
    }
    if (ns >= 1e6) {
        return fmt::format("{:.3f}ms", ns / 1e6);
    }
    if (ns >= 1e3) {
        return fmt::format("{:.3f}us", ns / 1e3);
    }
    return fmt::format("{}ns", d.count());
}

std::string_view Mechanism(StrategyKind kind) {
    switch (kind) {
    case StrategyKind::Sequential: return "a sequential loop";
    case StrategyKind::FanOut:     return "one thread per task and a join counter";
    case StrategyKind::Buffered:   return "a buffered result queue";
    case StrategyKind::Unbuffered: return "an unbuffered result queue";
    case StrategyKind::Pooled:     return "an unbuffered result queue and a worker pool";
    }
    return "an unknown strategy";
}

}

std::string FormatReport(const ExecutionReport& report) {
    std::string line = fmt::format("[{}] Took {} to {} {} tasks using {}",
                                   ToString(report.strategy),
                                   FormatDuration(report.elapsed),
                                   report.sum ? "sum" : "run",
                                   report.tasks,
                                   Mechanism(report.strategy));
    if (report.strategy == StrategyKind::Pooled) {
        line += fmt::format(" of {} workers", report.workers);
    }
    if (report.sum) {
        line += fmt::format(". Sum is {}", *report.sum);
    }
    return line;
}

}
