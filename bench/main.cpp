#include "strategy_benchmark.hpp"

#include "task_agg/config.hpp"
#include "task_agg/errors.hpp"
#include "logger.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

struct Cli {
    std::string config_path{"config/agg_config.json"};
    std::optional<std::size_t> tasks;
    std::optional<std::size_t> workers;
    std::optional<std::size_t> latency_ms;
};

// task_agg_bench [--config path] [tasks] [workers] [latency_ms]
static Cli parse_cli(int argc, char** argv) {
    Cli cli{};
    int idx = 1;
    if (idx < argc && std::string(argv[idx]) == "--config") {
        if (idx + 1 < argc) cli.config_path = argv[idx + 1];
        idx += 2;
    }
    if (idx < argc) { cli.tasks = static_cast<std::size_t>(std::stoul(argv[idx++])); }
    if (idx < argc) { cli.workers = static_cast<std::size_t>(std::stoul(argv[idx++])); }
    if (idx < argc) { cli.latency_ms = static_cast<std::size_t>(std::stoul(argv[idx++])); }
    return cli;
}

int main(int argc, char** argv) {
    task_agg::log::InitializeLogger("config/logger_config.json");

    Cli cli;
    try {
        cli = parse_cli(argc, argv);
    } catch (const std::logic_error& e) {
        // std::stoul throws invalid_argument / out_of_range
        std::cerr << "Invalid argument: " << e.what() << "\n"
                  << "Usage: " << argv[0] << " [--config path] [tasks] [workers] [latency_ms]" << std::endl;
        return 1;
    }

    auto loader = task_agg::ConfigLoader::FromFile(cli.config_path);
    if (!loader) {
        std::cerr << "Failed to load config " << cli.config_path << std::endl;
        return 1;
    }

    auto cfg = loader->GetConfig();
    if (cli.tasks) cfg.aggregation.tasks = *cli.tasks;
    if (cli.workers) cfg.aggregation.workers = *cli.workers;
    if (cli.latency_ms) cfg.task_latency = std::chrono::milliseconds(*cli.latency_ms);
    if (cfg.aggregation.workers == 0) {
        std::cerr << "workers must be at least 1" << std::endl;
        return 1;
    }
    task_agg::log::SetLevel(cfg.log_level);

    std::cout << "Running every strategy over the same dice source; "
                 "each line reports elapsed time and the aggregated sum." << std::endl;

    try {
        bench_ta::StrategyBenchmark bench(cfg);
        auto reports = bench.RunAll();
        bench.PrintSummary(reports);
    } catch (const task_agg::TaskAggError& e) {
        TA_LOG_ERROR("strategy run failed: {}", e.what());
        return 1;
    } catch (const std::system_error& e) {
        TA_LOG_ERROR("strategy run failed, out of system resources: {}", e.what());
        return 1;
    }
    return 0;
}
