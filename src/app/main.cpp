/**
 * @file main.cpp
 * @brief AnalyzerOrchestrator daemon entry point.
 * @author AnalyzerOrchestrator Team
 *
 * Wires the modules together:
 *   Config → Logger → Stores → EndpointPool → TaskOrchestrator → JobScheduler → MaintenanceSweep
 *
 * With --pipeline the daemon runs the given definitions to completion and
 * exits; otherwise it serves until SIGINT/SIGTERM, picking up definition
 * files dropped into the inbox directory.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "generation/generation_worker.hpp"
#include "maintenance/maintenance_sweep.hpp"
#include "network/worker_client.hpp"
#include "orchestrator/task_orchestrator.hpp"
#include "pool/endpoint_pool.hpp"
#include "scheduler/job_scheduler.hpp"
#include "scheduler/pipeline.hpp"
#include "store/reservation_store.hpp"
#include "store/task_store.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <json/json.h>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace analyzer_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::string log_dir;
    std::vector<std::filesystem::path> pipelines;
    bool sweep_once = false;
};

void print_usage() {
    std::cout << "Usage: analyzer_orchestrator [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  --pipeline <file>    Run a pipeline definition and exit (repeatable)\n"
              << "  --sweep-once         Run one maintenance sweep and exit\n"
              << "  --help, -h           Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> Result<std::string> {
            if (i + 1 >= argc) return Error{arg + " needs a value", ErrorKind::InvalidArgument};
            return std::string{argv[++i]};
        };

        if (arg == "--config") {
            auto v = value();
            if (!v) return v.error();
            args.config_path = *v;
            args.config_given = true;
        } else if (arg == "--log-dir") {
            auto v = value();
            if (!v) return v.error();
            args.log_dir = *v;
        } else if (arg == "--pipeline") {
            auto v = value();
            if (!v) return v.error();
            args.pipelines.emplace_back(*v);
        } else if (arg == "--sweep-once") {
            args.sweep_once = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{"Unknown option " + arg, ErrorKind::InvalidArgument};
        }
    }
    return args;
}

std::string to_json_text(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

/**
 * @brief Move a processed inbox file into a sibling subdirectory.
 *
 * Name collisions get a random suffix so nothing already there is overwritten.
 */
void move_inbox_file(const std::filesystem::path& file, const std::string& subdir,
                     Logger& logger) {
    std::error_code ec;
    auto dir = file.parent_path() / subdir;
    std::filesystem::create_directories(dir, ec);

    auto target = dir / file.filename();
    if (std::filesystem::exists(target, ec)) {
        target = dir / (file.stem().string() + "." + make_id("dup") + file.extension().string());
    }
    std::filesystem::rename(file, target, ec);
    if (ec) {
        logger.error("MAIN", "Cannot move " + file.string() + " to " + target.string() + ": "
                                 + ec.message());
    }
}

/// Submit every *.json definition waiting in the inbox.
void scan_inbox(const std::filesystem::path& inbox, uint32_t default_max_concurrent,
                JobScheduler& scheduler, Logger& logger) {
    std::error_code ec;
    if (!std::filesystem::is_directory(inbox, ec)) return;

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(inbox, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        auto definition = load_pipeline_file(file, default_max_concurrent);
        if (!definition) {
            logger.warn("MAIN", "Rejected " + file.filename().string() + ": "
                                    + definition.error().message);
            move_inbox_file(file, "rejected", logger);
            continue;
        }
        auto run_id = scheduler.submit(std::move(definition).value());
        if (!run_id) {
            logger.warn("MAIN", "Rejected " + file.filename().string() + ": "
                                    + run_id.error().message);
            move_inbox_file(file, "rejected", logger);
            continue;
        }
        logger.info("MAIN", file.filename().string() + " submitted as " + *run_id);
        move_inbox_file(file, "processed", logger);
    }
}

int run_sweep_once(const Config& config, TaskStore& tasks, ReservationStore& reservations,
                   Logger& logger, MetricsCollector* metrics) {
    MaintenanceSweep sweep(config.maintenance, tasks, reservations, logger, metrics);
    auto report = sweep.run_once();

    Json::Value out(Json::objectValue);
    out["reclaimedRunning"] = static_cast<Json::UInt64>(report.reclaimed_running);
    out["reclaimedPending"] = static_cast<Json::UInt64>(report.reclaimed_pending);
    out["reclaimedOrphans"] = static_cast<Json::UInt64>(report.reclaimed_orphans);
    Json::Value ids(Json::arrayValue);
    for (const auto& id : report.reclaimed) ids.append(id);
    out["reclaimed"] = ids;
    Json::Value errors(Json::arrayValue);
    for (const auto& e : report.errors) errors.append(e);
    out["errors"] = errors;
    std::cout << to_json_text(out) << std::endl;
    return report.errors.empty() ? 0 : 1;
}

/**
 * @brief Run pipeline files to completion.
 *
 * Returns non-zero if a definition is invalid or any run ends failed or cancelled.
 */
int run_pipelines(const CLIArgs& args, const Config& config, JobScheduler& scheduler,
                  Logger& logger) {
    std::vector<RunId> runs;
    bool ok = true;
    for (const auto& file : args.pipelines) {
        auto definition = load_pipeline_file(file, config.scheduler.default_max_concurrent);
        if (!definition) {
            std::cerr << definition.error().message << std::endl;
            ok = false;
            continue;
        }
        auto run_id = scheduler.submit(std::move(definition).value());
        if (!run_id) {
            std::cerr << file.string() << ": " << run_id.error().message << std::endl;
            ok = false;
            continue;
        }
        logger.info("MAIN", file.string() + " submitted as " + *run_id);
        runs.push_back(*run_id);
    }

    scheduler.start();

    Json::Value summary(Json::arrayValue);
    for (const auto& id : runs) {
        std::optional<PipelineRun> run;
        while (true) {
            run = scheduler.wait(id, Duration{250});
            if (!run || is_terminal(run->status)) break;
            if (g_shutdown_requested) {
                logger.warn("MAIN", "Interrupted, cancelling " + id);
                if (auto r = scheduler.cancel(id); !r) {
                    logger.warn("MAIN", r.error().message);
                }
            }
        }
        if (!run) continue;

        Json::Value entry(Json::objectValue);
        entry["id"] = run->id;
        entry["name"] = run->definition.name;
        entry["status"] = std::string{to_string(run->status)};
        entry["generation"] = run->generation.to_json();
        entry["analysis"] = run->analysis.to_json();
        summary.append(entry);

        if (run->status == PipelineStatus::Failed || run->status == PipelineStatus::Cancelled) {
            ok = false;
        }
    }
    std::cout << to_json_text(summary) << std::endl;
    return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << "\n";
        print_usage();
        return 2;
    }
    const auto args = *parsed;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        if (args.config_given) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 2;
        }
        std::cerr << "Using default configuration (" << config_result.error().message << ")"
                  << std::endl;
    }
    auto config = config_result ? *config_result : default_config();
    apply_env_overrides(config);
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (auto valid = validate(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "analyzer_orchestrator",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    logger.info("MAIN", "AnalyzerOrchestrator starting...");

    std::unique_ptr<MetricsCollector> metrics;
    if (config.telemetry.metrics_enabled && !config.telemetry.log_dir.empty()) {
        metrics = std::make_unique<MetricsCollector>(std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, "metrics", config.telemetry.max_file_size_mb,
            config.telemetry.rotate_count));
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ── Stores ───────────────────────────────
    auto reservations = ReservationStore::open(config.store, logger);
    if (!reservations) {
        logger.error("MAIN", "Cannot open reservation store: " + reservations.error().message);
        std::cerr << reservations.error().message << std::endl;
        return 1;
    }
    auto tasks = TaskStore::open(config.store, logger);
    if (!tasks) {
        logger.error("MAIN", "Cannot open task store: " + tasks.error().message);
        std::cerr << tasks.error().message << std::endl;
        return 1;
    }
    logger.info("MAIN", "Database: " + config.store.database_path.string());

    if (args.sweep_once) {
        return run_sweep_once(config, **tasks, **reservations, logger, metrics.get());
    }

    // ── Endpoint Pool ────────────────────────
    WsWorkerClient client(logger, config.services);
    EndpointPool pool(config.pool, client, logger, metrics.get());
    if (auto r = pool.initialize(config.services); !r) {
        logger.error("MAIN", "Cannot initialise endpoint pool: " + r.error().message);
        std::cerr << r.error().message << std::endl;
        return 1;
    }
    pool.start_health_checks();
    logger.info("MAIN", "Endpoint pool ready (strategy " + std::string{pool.strategy_name()}
                            + ")");

    // ── Orchestration ────────────────────────
    TaskOrchestrator orchestrator(config.orchestrator, config.services, **tasks, pool, client,
                                  logger, metrics.get());
    RemoteGenerationWorker generator(pool, client, logger,
                                     std::chrono::seconds(config.services.dispatch_timeout_s));
    JobScheduler scheduler(config.scheduler, **reservations, generator, orchestrator, logger,
                           metrics.get());

    MaintenanceSweep sweep(config.maintenance, **tasks, **reservations, logger, metrics.get());

    int exit_code = 0;
    if (!args.pipelines.empty()) {
        exit_code = run_pipelines(args, config, scheduler, logger);
    } else {
        if (config.maintenance.enabled) sweep.start();
        scheduler.start();

        const auto& inbox = config.scheduler.inbox_dir;
        if (!inbox.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(inbox, ec);
            logger.info("MAIN", "Watching inbox " + inbox.string());
        }

        // ── Main Loop ────────────────────────
        logger.info("MAIN", "Entering main loop. Press Ctrl+C to shutdown.");
        const auto scan_interval = std::chrono::milliseconds(config.scheduler.poll_interval_ms);
        auto next_scan = std::chrono::steady_clock::now();
        while (!g_shutdown_requested) {
            if (!inbox.empty() && std::chrono::steady_clock::now() >= next_scan) {
                scan_inbox(inbox, config.scheduler.default_max_concurrent, scheduler, logger);
                next_scan = std::chrono::steady_clock::now() + scan_interval;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("MAIN", "Shutdown requested. Cleaning up...");
    scheduler.stop();
    sweep.stop();
    orchestrator.shutdown();
    pool.shutdown();
    if (metrics) metrics->flush();

    logger.info("MAIN", "AnalyzerOrchestrator stopped.");
    logger.flush();
    return exit_code;
}
