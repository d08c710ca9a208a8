/**
 * @file main.cpp
 * @brief EditOrchestrator daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a complete job pipeline:
 *   Config → Logger → Store → Monitor → Governor → Scheduler → Workers → Actuator
 */

#include "actuator/simulated_actuator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"
#include "resource_monitor/monitor.hpp"
#include "store/job_repository.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/generator.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

using namespace edit_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         EditOrchestrator v1.0.0           ║
  ║   Priority Job Engine for Photo Edits     ║
  ║   with Resource-Aware Admission           ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<std::filesystem::path> db_path;
    std::string log_dir;
    uint32_t workers = 0;
    size_t demo_jobs = 0;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: edit_orchestrator [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --db <path>        Job database (empty string = in-memory)\n"
              << "  --log-dir <path>   Log output directory\n"
              << "  --workers <n>      Override engine.max_workers\n"
              << "  --demo <n>         Submit n synthetic jobs, run until idle, then exit\n"
              << "  --help, -h         Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--db" && i + 1 < argc) {
                args.db_path = std::filesystem::path{argv[++i]};
            } else if (arg == "--log-dir" && i + 1 < argc) {
                args.log_dir = argv[++i];
            } else if (arg == "--workers" && i + 1 < argc) {
                args.workers = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--demo" && i + 1 < argc) {
                args.demo_mode = true;
                args.demo_jobs = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                std::exit(0);
            } else {
                return Error{ErrorCode::InvalidArgument, "unknown or incomplete option: " + arg};
            }
        } catch (const std::logic_error&) {
            return Error{ErrorCode::InvalidArgument, "invalid number for " + arg};
        }
    }
    return args;
}

void log_status(Logger& logger, const QueueStats& stats) {
    logger.info("Status: pending " + std::to_string(stats.by_status.at(JobStatus::Pending))
                + ", processing " + std::to_string(stats.by_status.at(JobStatus::Processing))
                + ", completed " + std::to_string(stats.by_status.at(JobStatus::Completed))
                + ", dead_letter " + std::to_string(stats.by_status.at(JobStatus::DeadLetter))
                + ", active workers " + std::to_string(stats.active_workers)
                + ", parked " + std::to_string(stats.parked_jobs)
                + (stats.governor.thermal_paused ? ", thermal pause" : "")
                + (stats.governor.cpu_throttled ? ", cpu throttled" : ""));
}

/**
 * @brief Run the engine until a signal arrives, or in demo mode until idle.
 */
template <ResourceMonitorLike MonitorT>
int run_engine(const Config& config, const CLIArgs& args,
               std::shared_ptr<IJobRepository> repository) {
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "edit_orchestrator",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    SimulatedActuator actuator(SimulatedActuator::Options{
        .dispatch_latency = Millis{args.demo_mode ? 50 : 500},
        .failure_rate = args.demo_mode ? 0.1 : 0.0,
        .seed = std::nullopt});

    typename Orchestrator<MonitorT>::Options opts;
    opts.config = config;
    opts.repository = std::move(repository);
    opts.log_sink = std::move(log_sink);
    opts.log_level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    opts.metrics_sink = std::move(metrics_sink);

    Orchestrator<MonitorT> orchestrator(std::move(opts), actuator);
    auto& logger = orchestrator.logger();

    if (auto started = orchestrator.start(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    if (args.demo_mode) {
        std::mt19937 rng(std::random_device{}());
        auto batch = JobBatchGenerator::random_batch(args.demo_jobs, BatchProfile{}, rng);
        size_t accepted = 0;
        for (const auto& request : batch) {
            auto outcome = orchestrator.submit(request);
            if (outcome.accepted) {
                ++accepted;
            } else {
                logger.warn("Demo job " + request.id + " rejected: " + outcome.reason);
            }
        }
        logger.info("=== Demo Mode: submitted " + std::to_string(accepted) + " jobs ===");
    }

    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    const auto sample_every = Millis{config.governor.sampling_interval_ms};
    const auto status_every = std::chrono::seconds(30);
    auto next_sample = std::chrono::steady_clock::now();
    auto next_status = std::chrono::steady_clock::now() + status_every;

    while (!g_shutdown_requested) {
        auto now = std::chrono::steady_clock::now();

        // The mock monitor has no sampling thread of its own.
        if constexpr (std::is_same_v<MonitorT, MockMonitor>) {
            if (now >= next_sample) {
                if (auto sample = orchestrator.monitor().publish(); !sample) {
                    logger.warn("Mock sample failed: " + sample.error().message);
                }
                next_sample = now + sample_every;
            }
        }

        if (now >= next_status) {
            log_status(logger, orchestrator.stats());
            next_status = now + status_every;
        }

        if (args.demo_mode && orchestrator.wait_idle(Millis{0})) {
            logger.info("=== Demo Complete ===");
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    auto stats = orchestrator.stats();
    log_status(logger, stats);
    if (args.demo_mode) {
        std::cout << "completed=" << stats.by_status.at(JobStatus::Completed)
                  << " dead_letter=" << stats.by_status.at(JobStatus::DeadLetter)
                  << " checkpoints=" << stats.failsafe.checkpoints_taken
                  << " rollbacks=" << stats.failsafe.rollbacks_succeeded << std::endl;
    }

    logger.info("Shutdown requested. Cleaning up...");
    orchestrator.stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << std::endl;
        print_usage();
        return 2;
    }
    const auto& args = *args_result;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.db_path) config.store.path = *args.db_path;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.workers != 0) config.engine.max_workers = args.workers;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 2;
    }

    auto repository = open_repository(config.store);
    if (!repository) {
        std::cerr << "Failed to open job store: " << repository.error().message << std::endl;
        return 1;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (config.governor.mock) {
        return run_engine<MockMonitor>(config, args, std::move(*repository));
    }
    return run_engine<LinuxMonitor>(config, args, std::move(*repository));
}
