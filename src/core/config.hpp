/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author AnalyzerOrchestrator Team
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace analyzer_orchestrator {

struct SchedulerConfig {
    uint32_t generation_workers = 2;        ///< Global generation pool size
    uint32_t analysis_workers = 2;          ///< Global analysis pool size
    uint32_t default_max_concurrent = 2;    ///< Per-pipeline limit when the definition omits one
    uint32_t poll_interval_ms = 1000;
    uint32_t shutdown_timeout_ms = 30000;
    uint32_t event_log_limit = 200;
    uint32_t retained_runs = 100;           ///< Finished runs kept for get()/list(); 0 keeps all
    std::filesystem::path inbox_dir;        ///< Empty disables the inbox watcher
};

struct PoolConfig {
    std::string strategy = "round_robin";   ///< "round_robin", "least_in_flight", "random"
    uint32_t cooldown_s = 60;
    uint32_t probe_timeout_ms = 2000;
    uint32_t health_check_interval_s = 30;  ///< 0 disables background probing
    uint32_t max_consecutive_failures = 3;
    uint64_t random_seed = 0;               ///< 0 = seed from std::random_device
};

struct ServicesConfig {
    std::map<ServiceType, std::vector<std::string>> endpoints;
    uint32_t dispatch_timeout_s = 600;
    uint32_t connect_timeout_ms = 5000;
    uint64_t max_message_size_bytes = 100ULL * 1024 * 1024;

    [[nodiscard]] const std::vector<std::string>& urls(ServiceType type) const;
};

struct OrchestratorConfig {
    uint32_t subtask_workers = 4;
    uint32_t max_retries = 3;
    bool collapse_single_service = false;
    std::filesystem::path results_dir = "./results";
};

struct StoreConfig {
    std::filesystem::path database_path = "./data/orchestrator.db";
    std::filesystem::path lock_dir = "./data/locks";
    uint32_t lock_timeout_ms = 10000;
    uint32_t busy_timeout_ms = 5000;
    uint32_t allocation_max_attempts = 8;
};

struct MaintenanceConfig {
    bool enabled = true;
    bool run_on_startup = true;
    uint32_t interval_s = 3600;
    uint32_t running_timeout_s = 7200;
    uint32_t pending_timeout_s = 14400;
    uint32_t grace_period_s = 300;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool metrics_enabled = true;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    SchedulerConfig scheduler;
    PoolConfig pool;
    ServicesConfig services;
    OrchestratorConfig orchestrator;
    StoreConfig store;
    MaintenanceConfig maintenance;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Keys absent from the file keep their defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 *
 * Includes three local replicas per analyzer service and one generation
 * endpoint.
 */
Config default_config();

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the process environment.
EnvLookup process_env();

/**
 * @brief Replace endpoint lists from *_URLS (comma separated) or *_URL.
 *
 * Variables: STATIC_ANALYZER, DYNAMIC_ANALYZER, PERF_TESTER, AI_ANALYZER, GENERATION.
 */
void apply_env_overrides(Config& config, const EnvLookup& env = process_env());

/// Reject values the daemon cannot run with.
Result<void> validate(const Config& config);

}  // namespace analyzer_orchestrator
