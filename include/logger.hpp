#pragma once

#include "task_agg/fwd.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace task_agg::log {

// Reads {"level", "pattern", "sink": "console"|"file", "file"} from a JSON file.
// Falls back to a colored console logger when the file is missing or malformed.
bool InitializeLogger(const std::string& config_path);

void SetLevel(std::string_view level);

LoggerPtr LoadLogger();
void SetLogger(LoggerPtr logger);

template <typename... Args>
void Write(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto logger = LoadLogger();
    if (logger && logger->should_log(level)) {
        logger->log(level, fmt, std::forward<Args>(args)...);
    }
}

// Times the enclosing scope; logs at debug level and hands the duration to the hook.
class PerfScope {
public:
    using Hook = std::function<void(std::chrono::nanoseconds)>;

    explicit PerfScope(std::string name, Hook hook = {});
    ~PerfScope();

    PerfScope(const PerfScope&) = delete;
    PerfScope& operator=(const PerfScope&) = delete;

private:
    std::string name_;
    Hook hook_;
    std::chrono::steady_clock::time_point start_;
};

}

#define TA_LOG_TRACE(...) ::task_agg::log::Write(::spdlog::level::trace, __VA_ARGS__)
#define TA_LOG_DEBUG(...) ::task_agg::log::Write(::spdlog::level::debug, __VA_ARGS__)
#define TA_LOG_INFO(...)  ::task_agg::log::Write(::spdlog::level::info, __VA_ARGS__)
#define TA_LOG_WARN(...)  ::task_agg::log::Write(::spdlog::level::warn, __VA_ARGS__)
#define TA_LOG_ERROR(...) ::task_agg::log::Write(::spdlog::level::err, __VA_ARGS__)

#define TA_CONCAT_IMPL(a, b) a##b
#define TA_CONCAT(a, b) TA_CONCAT_IMPL(a, b)

#define TA_PERF_SCOPE(name) \
    ::task_agg::log::PerfScope TA_CONCAT(ta_perf_scope_, __LINE__)(name)
#define TA_PERF_SCOPE_HOOK(name, hook) \
    ::task_agg::log::PerfScope TA_CONCAT(ta_perf_scope_, __LINE__)(name, hook)
