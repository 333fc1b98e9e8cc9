/**
 * @file types.cpp
 * @brief Enum parsing, identifiers, timestamps and the tool registry.
 * @author AnalyzerOrchestrator Team
 */

#include "core/types.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace analyzer_orchestrator {

namespace {

struct ToolEntry {
    std::string_view tool;
    ServiceType service;
};

constexpr std::array kToolRegistry{
    // Static analysis
    ToolEntry{"bandit", ServiceType::StaticAnalyzer},
    ToolEntry{"semgrep", ServiceType::StaticAnalyzer},
    ToolEntry{"pylint", ServiceType::StaticAnalyzer},
    ToolEntry{"ruff", ServiceType::StaticAnalyzer},
    ToolEntry{"mypy", ServiceType::StaticAnalyzer},
    ToolEntry{"vulture", ServiceType::StaticAnalyzer},
    ToolEntry{"radon", ServiceType::StaticAnalyzer},
    ToolEntry{"flake8", ServiceType::StaticAnalyzer},
    ToolEntry{"safety", ServiceType::StaticAnalyzer},
    ToolEntry{"pip-audit", ServiceType::StaticAnalyzer},
    ToolEntry{"detect-secrets", ServiceType::StaticAnalyzer},
    ToolEntry{"eslint", ServiceType::StaticAnalyzer},
    ToolEntry{"jshint", ServiceType::StaticAnalyzer},
    ToolEntry{"npm-audit", ServiceType::StaticAnalyzer},
    ToolEntry{"stylelint", ServiceType::StaticAnalyzer},
    // Dynamic analysis
    ToolEntry{"zap", ServiceType::DynamicAnalyzer},
    ToolEntry{"owasp-zap", ServiceType::DynamicAnalyzer},
    ToolEntry{"nmap", ServiceType::DynamicAnalyzer},
    ToolEntry{"curl", ServiceType::DynamicAnalyzer},
    ToolEntry{"curl-endpoint-tester", ServiceType::DynamicAnalyzer},
    ToolEntry{"connectivity", ServiceType::DynamicAnalyzer},
    ToolEntry{"port-scan", ServiceType::DynamicAnalyzer},
    // Performance
    ToolEntry{"ab", ServiceType::PerformanceTester},
    ToolEntry{"locust", ServiceType::PerformanceTester},
    ToolEntry{"artillery", ServiceType::PerformanceTester},
    ToolEntry{"aiohttp", ServiceType::PerformanceTester},
    // AI review
    ToolEntry{"requirements-scanner", ServiceType::AiAnalyzer},
    ToolEntry{"code-quality-analyzer", ServiceType::AiAnalyzer},
};

const ToolEntry* find_tool(std::string_view tool) noexcept {
    for (const auto& entry : kToolRegistry) {
        if (entry.tool == tool) return &entry;
    }
    return nullptr;
}

}  // namespace

std::string format_timestamp(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds{1000};

    std::tm tm_utc{};
    gmtime_r(&time_t_ts, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string make_id(std::string_view prefix) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << prefix << '_' << std::hex << std::setfill('0')
        << std::setw(16) << rng();
    return oss.str();
}

std::optional<ServiceType> parse_service_type(std::string_view name) noexcept {
    for (auto type : kAllServices) {
        if (to_string(type) == name) return type;
    }
    // Underscore spellings appear in older configuration files.
    if (name == "static_analyzer") return ServiceType::StaticAnalyzer;
    if (name == "dynamic_analyzer") return ServiceType::DynamicAnalyzer;
    if (name == "performance_tester") return ServiceType::PerformanceTester;
    if (name == "ai_analyzer") return ServiceType::AiAnalyzer;
    return std::nullopt;
}

ServiceType tool_to_service(std::string_view tool) noexcept {
    if (const auto* entry = find_tool(tool)) return entry->service;
    return ServiceType::StaticAnalyzer;
}

bool is_known_tool(std::string_view tool) noexcept {
    return find_tool(tool) != nullptr;
}

std::optional<TaskStatus> parse_task_status(std::string_view name) noexcept {
    for (auto status : {TaskStatus::Pending, TaskStatus::Running, TaskStatus::Completed,
                        TaskStatus::PartialSuccess, TaskStatus::Failed, TaskStatus::Cancelled}) {
        if (to_string(status) == name) return status;
    }
    return std::nullopt;
}

std::optional<SelectionStrategy> parse_selection_strategy(std::string_view name) noexcept {
    for (auto strategy : {SelectionStrategy::RoundRobin, SelectionStrategy::LeastInFlight,
                          SelectionStrategy::Random}) {
        if (to_string(strategy) == name) return strategy;
    }
    return std::nullopt;
}

}  // namespace analyzer_orchestrator
