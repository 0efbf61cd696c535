#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fstream>
#include <memory>

namespace task_agg::log {

namespace {

constexpr const char* kLoggerName = "task_agg";
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";

LoggerPtr MakeConsoleLogger() {
    auto logger = std::make_shared<spdlog::logger>(
        kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger->set_pattern(kDefaultPattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

LoggerPtr& Slot() {
    static LoggerPtr logger = MakeConsoleLogger();
    return logger;
}

}

LoggerPtr LoadLogger() {
    return std::atomic_load(&Slot());
}

void SetLogger(LoggerPtr logger) {
    std::atomic_store(&Slot(), std::move(logger));
}

void SetLevel(std::string_view level) {
    auto logger = LoadLogger();
    if (!logger) {
        return;
    }
    logger->set_level(spdlog::level::from_str(std::string(level)));
}

bool InitializeLogger(const std::string& config_path) {
    std::ifstream ifs(config_path);
    if (!ifs.is_open()) {
        SetLogger(MakeConsoleLogger());
        TA_LOG_WARN("logger config {} not found, using console defaults", config_path);
        return false;
    }

    try {
        nlohmann::json j;
        ifs >> j;

        const auto sink_kind = j.value("sink", std::string("console"));
        LoggerPtr logger;
        if (sink_kind == "file") {
            const auto file = j.value("file", std::string("logs/task_agg.log"));
            logger = std::make_shared<spdlog::logger>(
                kLoggerName, std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
        } else {
            logger = std::make_shared<spdlog::logger>(
                kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        logger->set_pattern(j.value("pattern", std::string(kDefaultPattern)));
        logger->set_level(spdlog::level::from_str(j.value("level", std::string("info"))));
        logger->flush_on(spdlog::level::warn);
        SetLogger(std::move(logger));
        return true;
    } catch (const std::exception& e) {
        // spdlog_ex (bad file sink path) and json errors both land here.
        SetLogger(MakeConsoleLogger());
        TA_LOG_WARN("failed to load logger config {}: {}, using console defaults", config_path, e.what());
        return false;
    }
}

PerfScope::PerfScope(std::string name, Hook hook)
    : name_(std::move(name)),
      hook_(std::move(hook)),
      start_(std::chrono::steady_clock::now()) {}

PerfScope::~PerfScope() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_);
    TA_LOG_DEBUG("[perf] {} took {:.3f} ms", name_, static_cast<double>(elapsed.count()) / 1e6);
    if (hook_) {
        hook_(elapsed);
    }
}

}
