#pragma once

#include "task_agg/config.hpp"
#include "task_agg/fwd.hpp"
#include "task_agg/report.hpp"
#include "task_agg/task_source.hpp"

#include <optional>
#include <string_view>

namespace task_agg {

/*
Five ways of running cfg.tasks invocations of a TaskSource.

Every strategy invokes the source exactly cfg.tasks times and counts each
result exactly once. If any invocation throws, the strategy still lets every
unit finish and joins it, then throws TaskInvocationError.

FanOut, SumBuffered and SumUnbuffered start one OS thread per task. That
cost grows with N without bound and is kept on purpose as the baseline the
pooled strategy is compared against. cfg.max_threads caps it; units that
cannot get a thread count as failed invocations.
*/

// Runs every task on the calling thread.
Sum SumSequential(TaskSource& source, const AggregationConfig& cfg);

// One thread per task, joined through a JoinCounter; results are discarded.
void FanOut(TaskSource& source, const AggregationConfig& cfg);

// One thread per task depositing into a queue of capacity N; drained after all deposits.
Sum SumBuffered(TaskSource& source, const AggregationConfig& cfg);

// One thread per task handing results through a zero-capacity queue to the caller.
Sum SumUnbuffered(TaskSource& source, const AggregationConfig& cfg);

// cfg.workers persistent workers; at most that many invocations run at once.
Sum SumPooled(TaskSource& source, const AggregationConfig& cfg);

// Runs one strategy and times it.
ExecutionReport Run(StrategyKind kind, TaskSource& source, const AggregationConfig& cfg);

std::string_view ToString(StrategyKind kind) noexcept;
std::optional<StrategyKind> ParseStrategy(std::string_view name);

}
