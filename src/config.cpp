#include "task_agg/config.hpp"
#include "task_agg/strategies.hpp"
#include "logger.hpp"

#include <fmt/format.h>

#include <fstream>
#include <limits>
#include <stdexcept>

namespace task_agg {

namespace {

template <typename T>
T ReadUnsigned(const nlohmann::json& j, const char* key, T fallback) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    const bool non_negative = it->is_number_unsigned() ||
                              (it->is_number_integer() && it->get<std::int64_t>() >= 0);
    if (!non_negative) {
        throw std::invalid_argument(fmt::format("'{}' must be a non-negative integer", key));
    }
    const auto raw = it->get<std::uint64_t>();
    if (raw > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        throw std::invalid_argument(fmt::format("'{}' is out of range: {}", key, raw));
    }
    return static_cast<T>(raw);
}

}

std::vector<StrategyKind> DefaultStrategies() {
    return {StrategyKind::Sequential, StrategyKind::FanOut, StrategyKind::Buffered,
            StrategyKind::Unbuffered, StrategyKind::Pooled};
}

std::optional<ConfigLoader> ConfigLoader::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        TA_LOG_ERROR("config root must be a JSON object");
        return std::nullopt;
    }

    AppConfig cfg;
    try {
        cfg.aggregation.tasks = ReadUnsigned<std::size_t>(j, "tasks", cfg.aggregation.tasks);
        cfg.aggregation.workers = ReadUnsigned<std::size_t>(j, "workers", cfg.aggregation.workers);
        cfg.aggregation.max_threads = ReadUnsigned<std::size_t>(j, "max_threads", cfg.aggregation.max_threads);
        cfg.task_latency = std::chrono::milliseconds(
            ReadUnsigned<std::uint64_t>(j, "task_latency_ms", static_cast<std::uint64_t>(cfg.task_latency.count())));
        cfg.dice_faces = ReadUnsigned<int>(j, "dice_faces", cfg.dice_faces);
        cfg.seed = ReadUnsigned<std::uint64_t>(j, "seed", cfg.seed);
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (j.contains("strategies")) {
            const auto& names = j.at("strategies");
            if (!names.is_array() || names.empty()) {
                throw std::invalid_argument("'strategies' must be a non-empty array of names");
            }
            cfg.strategies.clear();
            for (const auto& name : names) {
                const auto text = name.get<std::string>();
                const auto kind = ParseStrategy(text);
                if (!kind) {
                    throw std::invalid_argument(fmt::format("unknown strategy '{}'", text));
                }
                cfg.strategies.push_back(*kind);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        TA_LOG_ERROR("invalid config: {}", e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        TA_LOG_ERROR("invalid config: {}", e.what());
        return std::nullopt;
    }

    if (cfg.aggregation.workers == 0) {
        TA_LOG_ERROR("invalid config: 'workers' must be at least 1");
        return std::nullopt;
    }
    if (cfg.dice_faces < 1) {
        TA_LOG_ERROR("invalid config: 'dice_faces' must be at least 1");
        return std::nullopt;
    }
    return ConfigLoader(std::move(cfg));
}

std::optional<ConfigLoader> ConfigLoader::FromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        TA_LOG_ERROR("config is not valid JSON: {}", e.what());
        return std::nullopt;
    }
    return FromJson(j);
}

std::optional<ConfigLoader> ConfigLoader::FromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        TA_LOG_ERROR("cannot open config file {}", path);
        return std::nullopt;
    }
    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        TA_LOG_ERROR("config file {} is not valid JSON: {}", path, e.what());
        return std::nullopt;
    }
    return FromJson(j);
}

std::string ConfigLoader::Dump(int indent) const {
    nlohmann::json j;
    j["tasks"] = cfg_.aggregation.tasks;
    j["workers"] = cfg_.aggregation.workers;
    j["max_threads"] = cfg_.aggregation.max_threads;
    j["task_latency_ms"] = cfg_.task_latency.count();
    j["dice_faces"] = cfg_.dice_faces;
    j["seed"] = cfg_.seed;
    j["log_level"] = cfg_.log_level;
    auto names = nlohmann::json::array();
    for (auto kind : cfg_.strategies) {
        names.push_back(std::string(ToString(kind)));
    }
    j["strategies"] = std::move(names);
    return j.dump(indent);
}

}
