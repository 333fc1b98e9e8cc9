/**
 * @file types.hpp
 * @brief Fundamental types used throughout AnalyzerOrchestrator.
 * @author AnalyzerOrchestrator Team
 *
 * Identity aliases, the closed service-type and status enums, and the static
 * tool → service mapping. All enums round-trip through their wire names.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace analyzer_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using RunId = std::string;
using ModelSlug = std::string;
using ToolName = std::string;
using SlotId = int64_t;
using EndpointId = size_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

/// Milliseconds since the Unix epoch, the persisted time representation.
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_epoch_ms(int64_t ms) noexcept {
    return Timestamp{std::chrono::milliseconds{ms}};
}

/// ISO 8601 UTC rendering, e.g. 2026-01-31T12:00:00.250Z
std::string format_timestamp(Timestamp ts);

/// Random hexadecimal identifier with the given prefix (e.g. "task_3fa9c2...").
std::string make_id(std::string_view prefix);

// ─────────────────────────────────────────────
// Service Type
// ─────────────────────────────────────────────

enum class ServiceType : uint8_t {
    StaticAnalyzer,
    DynamicAnalyzer,
    PerformanceTester,
    AiAnalyzer,
    Generation
};

inline constexpr std::array<ServiceType, 4> kAnalysisServices{
    ServiceType::StaticAnalyzer,
    ServiceType::DynamicAnalyzer,
    ServiceType::PerformanceTester,
    ServiceType::AiAnalyzer
};

inline constexpr std::array<ServiceType, 5> kAllServices{
    ServiceType::StaticAnalyzer,
    ServiceType::DynamicAnalyzer,
    ServiceType::PerformanceTester,
    ServiceType::AiAnalyzer,
    ServiceType::Generation
};

[[nodiscard]] constexpr std::string_view to_string(ServiceType type) noexcept {
    switch (type) {
        case ServiceType::StaticAnalyzer:    return "static-analyzer";
        case ServiceType::DynamicAnalyzer:   return "dynamic-analyzer";
        case ServiceType::PerformanceTester: return "performance-tester";
        case ServiceType::AiAnalyzer:        return "ai-analyzer";
        case ServiceType::Generation:        return "generation";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ServiceType> parse_service_type(std::string_view name) noexcept;

/**
 * @brief Map an analysis tool to the worker service that runs it.
 *
 * Unknown tools are routed to the static analyzer.
 */
[[nodiscard]] ServiceType tool_to_service(std::string_view tool) noexcept;

/// True if the tool appears in the static registry.
[[nodiscard]] bool is_known_tool(std::string_view tool) noexcept;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,
    Running,
    Completed,
    PartialSuccess,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:        return "pending";
        case TaskStatus::Running:        return "running";
        case TaskStatus::Completed:      return "completed";
        case TaskStatus::PartialSuccess: return "partial_success";
        case TaskStatus::Failed:         return "failed";
        case TaskStatus::Cancelled:      return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view name) noexcept;

[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status != TaskStatus::Pending && status != TaskStatus::Running;
}

// ─────────────────────────────────────────────
// Pipeline Status
// ─────────────────────────────────────────────

enum class PipelineStatus : uint8_t {
    Pending,
    Running,
    Completed,
    PartialSuccess,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(PipelineStatus status) noexcept {
    switch (status) {
        case PipelineStatus::Pending:        return "pending";
        case PipelineStatus::Running:        return "running";
        case PipelineStatus::Completed:      return "completed";
        case PipelineStatus::PartialSuccess: return "partial_success";
        case PipelineStatus::Failed:         return "failed";
        case PipelineStatus::Cancelled:      return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(PipelineStatus status) noexcept {
    return status != PipelineStatus::Pending && status != PipelineStatus::Running;
}

// ─────────────────────────────────────────────
// Endpoint Selection Strategy
// ─────────────────────────────────────────────

enum class SelectionStrategy : uint8_t {
    RoundRobin,
    LeastInFlight,
    Random
};

[[nodiscard]] constexpr std::string_view to_string(SelectionStrategy strategy) noexcept {
    switch (strategy) {
        case SelectionStrategy::RoundRobin:    return "round_robin";
        case SelectionStrategy::LeastInFlight: return "least_in_flight";
        case SelectionStrategy::Random:        return "random";
    }
    return "unknown";
}

[[nodiscard]] std::optional<SelectionStrategy> parse_selection_strategy(std::string_view name) noexcept;

}  // namespace analyzer_orchestrator
