/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author AnalyzerOrchestrator Team
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <cstdlib>
#include <sstream>

#include <toml++/toml.hpp>

namespace analyzer_orchestrator {

namespace {

std::vector<std::string> local_replicas(int first_port, int count) {
    std::vector<std::string> urls;
    for (int i = 0; i < count; ++i) {
        urls.push_back("ws://localhost:" + std::to_string(first_port + i));
    }
    return urls;
}

std::vector<std::string> split_urls(const std::string& csv) {
    std::vector<std::string> urls;
    std::istringstream iss(csv);
    std::string item;
    while (std::getline(iss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (begin == std::string::npos) continue;
        urls.push_back(item.substr(begin, end - begin + 1));
    }
    return urls;
}

std::string_view env_prefix(ServiceType type) {
    switch (type) {
        case ServiceType::StaticAnalyzer:    return "STATIC_ANALYZER";
        case ServiceType::DynamicAnalyzer:   return "DYNAMIC_ANALYZER";
        case ServiceType::PerformanceTester: return "PERF_TESTER";
        case ServiceType::AiAnalyzer:        return "AI_ANALYZER";
        case ServiceType::Generation:        return "GENERATION";
    }
    return "";
}

template <typename T>
T read_uint(const toml::node_view<toml::node>& node, T fallback) {
    auto v = node.value<int64_t>();
    if (!v || *v < 0) return fallback;
    return static_cast<T>(*v);
}

}  // namespace

const std::vector<std::string>& ServicesConfig::urls(ServiceType type) const {
    static const std::vector<std::string> kEmpty;
    auto it = endpoints.find(type);
    return it == endpoints.end() ? kEmpty : it->second;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorKind::NotFound};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config = default_config();

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto& s = config.scheduler;
            s.generation_workers = read_uint(scheduler["generation_workers"], s.generation_workers);
            s.analysis_workers = read_uint(scheduler["analysis_workers"], s.analysis_workers);
            s.default_max_concurrent =
                read_uint(scheduler["default_max_concurrent"], s.default_max_concurrent);
            s.poll_interval_ms = read_uint(scheduler["poll_interval_ms"], s.poll_interval_ms);
            s.shutdown_timeout_ms =
                read_uint(scheduler["shutdown_timeout_ms"], s.shutdown_timeout_ms);
            s.event_log_limit = read_uint(scheduler["event_log_limit"], s.event_log_limit);
            s.retained_runs = read_uint(scheduler["retained_runs"], s.retained_runs);
            s.inbox_dir = scheduler["inbox_dir"].value_or(s.inbox_dir.string());
        }

        // [pool]
        if (auto pool = tbl["pool"]; pool.is_table()) {
            auto& p = config.pool;
            p.strategy = pool["strategy"].value_or(p.strategy);
            p.cooldown_s = read_uint(pool["cooldown_s"], p.cooldown_s);
            p.probe_timeout_ms = read_uint(pool["probe_timeout_ms"], p.probe_timeout_ms);
            p.health_check_interval_s =
                read_uint(pool["health_check_interval_s"], p.health_check_interval_s);
            p.max_consecutive_failures =
                read_uint(pool["max_consecutive_failures"], p.max_consecutive_failures);
            p.random_seed = read_uint(pool["random_seed"], p.random_seed);
        }

        // [services]
        if (auto services = tbl["services"]; services.is_table()) {
            auto& s = config.services;
            s.dispatch_timeout_s = read_uint(services["dispatch_timeout_s"], s.dispatch_timeout_s);
            s.connect_timeout_ms = read_uint(services["connect_timeout_ms"], s.connect_timeout_ms);
            s.max_message_size_bytes =
                read_uint(services["max_message_size_bytes"], s.max_message_size_bytes);

            // [services.endpoints]
            if (auto* endpoints = services["endpoints"].as_table()) {
                for (auto&& [key, node] : *endpoints) {
                    auto type = parse_service_type(key.str());
                    if (!type) {
                        return Error{"Unknown service in [services.endpoints]: "
                                     + std::string{key.str()}, ErrorKind::InvalidArgument};
                    }
                    std::vector<std::string> urls;
                    if (auto* arr = node.as_array()) {
                        for (auto&& item : *arr) {
                            if (auto url = item.value<std::string>()) urls.push_back(*url);
                        }
                    } else if (auto url = node.value<std::string>()) {
                        urls.push_back(*url);
                    }
                    s.endpoints[*type] = std::move(urls);
                }
            }
        }

        // [orchestrator]
        if (auto orch = tbl["orchestrator"]; orch.is_table()) {
            auto& o = config.orchestrator;
            o.subtask_workers = read_uint(orch["subtask_workers"], o.subtask_workers);
            o.max_retries = read_uint(orch["max_retries"], o.max_retries);
            o.collapse_single_service =
                orch["collapse_single_service"].value_or(o.collapse_single_service);
            o.results_dir = orch["results_dir"].value_or(o.results_dir.string());
        }

        // [store]
        if (auto store = tbl["store"]; store.is_table()) {
            auto& s = config.store;
            s.database_path = store["database_path"].value_or(s.database_path.string());
            s.lock_dir = store["lock_dir"].value_or(s.lock_dir.string());
            s.lock_timeout_ms = read_uint(store["lock_timeout_ms"], s.lock_timeout_ms);
            s.busy_timeout_ms = read_uint(store["busy_timeout_ms"], s.busy_timeout_ms);
            s.allocation_max_attempts =
                read_uint(store["allocation_max_attempts"], s.allocation_max_attempts);
        }

        // [maintenance]
        if (auto maint = tbl["maintenance"]; maint.is_table()) {
            auto& m = config.maintenance;
            m.enabled = maint["enabled"].value_or(m.enabled);
            m.run_on_startup = maint["run_on_startup"].value_or(m.run_on_startup);
            m.interval_s = read_uint(maint["interval_s"], m.interval_s);
            m.running_timeout_s = read_uint(maint["running_timeout_s"], m.running_timeout_s);
            m.pending_timeout_s = read_uint(maint["pending_timeout_s"], m.pending_timeout_s);
            m.grace_period_s = read_uint(maint["grace_period_s"], m.grace_period_s);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            t.log_dir = telemetry["log_dir"].value_or(t.log_dir.string());
            t.max_file_size_mb = read_uint(telemetry["max_file_size_mb"], t.max_file_size_mb);
            t.rotate_count = read_uint(telemetry["rotate_count"], t.rotate_count);
            t.log_level = telemetry["log_level"].value_or(t.log_level);
            t.metrics_enabled = telemetry["metrics_enabled"].value_or(t.metrics_enabled);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorKind::InvalidArgument};
    }
}

Config default_config() {
    Config config;
    config.services.endpoints[ServiceType::StaticAnalyzer] = local_replicas(2001, 3);
    config.services.endpoints[ServiceType::DynamicAnalyzer] = local_replicas(2011, 3);
    config.services.endpoints[ServiceType::PerformanceTester] = local_replicas(2021, 3);
    config.services.endpoints[ServiceType::AiAnalyzer] = local_replicas(2031, 3);
    config.services.endpoints[ServiceType::Generation] = local_replicas(2041, 1);
    return config;
}

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string{value};
    };
}

void apply_env_overrides(Config& config, const EnvLookup& env) {
    for (auto type : kAllServices) {
        std::string prefix{env_prefix(type)};
        if (auto multi = env(prefix + "_URLS")) {
            auto urls = split_urls(*multi);
            if (!urls.empty()) {
                config.services.endpoints[type] = std::move(urls);
                continue;
            }
        }
        if (auto single = env(prefix + "_URL")) {
            config.services.endpoints[type] = {*single};
        }
    }
}

Result<void> validate(const Config& config) {
    if (config.scheduler.generation_workers == 0 || config.scheduler.analysis_workers == 0) {
        return Error{"scheduler worker counts must be positive", ErrorKind::InvalidArgument};
    }
    if (config.scheduler.default_max_concurrent == 0) {
        return Error{"scheduler.default_max_concurrent must be positive",
                     ErrorKind::InvalidArgument};
    }
    if (config.orchestrator.subtask_workers == 0) {
        return Error{"orchestrator.subtask_workers must be positive", ErrorKind::InvalidArgument};
    }
    if (config.pool.strategy.empty()) {
        return Error{"pool.strategy must not be empty", ErrorKind::InvalidArgument};
    }
    if (!parse_selection_strategy(config.pool.strategy)) {
        return Error{"Unknown pool.strategy: " + config.pool.strategy,
                     ErrorKind::InvalidArgument};
    }
    if (config.pool.max_consecutive_failures == 0) {
        return Error{"pool.max_consecutive_failures must be positive",
                     ErrorKind::InvalidArgument};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{"Unknown telemetry.log_level: " + config.telemetry.log_level,
                     ErrorKind::InvalidArgument};
    }
    for (const auto& [type, urls] : config.services.endpoints) {
        for (const auto& url : urls) {
            if (url.rfind("ws://", 0) != 0 && url.rfind("wss://", 0) != 0) {
                return Error{"Endpoint for " + std::string{to_string(type)}
                             + " is not a ws:// or wss:// URL: " + url,
                             ErrorKind::InvalidArgument};
            }
        }
    }
    return {};
}

}  // namespace analyzer_orchestrator
