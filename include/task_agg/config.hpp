#pragma once

#include "task_agg/fwd.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace task_agg {

struct WorkerPoolConfig {
    std::size_t workers = 10;
    std::size_t queue_cap = 1024;
    QueueFullPolicy queue_policy = QueueFullPolicy::Block;
};

// Per-run parameters handed to every strategy.
struct AggregationConfig {
    std::size_t tasks = 100;   // N
    std::size_t workers = 10;  // P, pooled strategy only
    // Thread cap for the thread-per-task strategies; 0 = one thread per task, unbounded.
    std::size_t max_threads = 0;
};

std::vector<StrategyKind> DefaultStrategies();

struct AppConfig {
    AggregationConfig aggregation;
    std::chrono::milliseconds task_latency{100};
    int dice_faces = 6;
    std::uint64_t seed = 0; // 0 = random
    std::vector<StrategyKind> strategies = DefaultStrategies();
    std::string log_level = "info";
};

/*
Loads AppConfig from JSON. Keys are flat:
  tasks, workers, max_threads, task_latency_ms,
  dice_faces, seed, strategies, log_level
Missing keys keep their defaults; invalid values make the factory return
std::nullopt after logging the reason.
*/
class ConfigLoader {
public:
    static std::optional<ConfigLoader> FromString(const std::string& text);
    static std::optional<ConfigLoader> FromJson(const nlohmann::json& j);
    static std::optional<ConfigLoader> FromFile(const std::string& path);

    bool Ready() const noexcept { return ready_; }
    const AppConfig& GetConfig() const noexcept { return cfg_; }
    std::string Dump(int indent = 2) const;

private:
    explicit ConfigLoader(AppConfig cfg)
        : cfg_(std::move(cfg)), ready_(true) {}

    AppConfig cfg_;
    bool ready_ = false;
};

}
