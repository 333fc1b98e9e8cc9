/**
 * @file worker_protocol.hpp
 * @brief JSON messages exchanged with analysis and generation workers.
 * @author AnalyzerOrchestrator Team
 *
 * Requests carry tools by name only. Responses are decoded leniently: the
 * result body may sit under "analysis" or "result", and both camelCase and
 * snake_case field names are accepted. Only the status vocabulary is strict.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <json/json.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace analyzer_orchestrator {

enum class WorkerStatus : uint8_t {
    Success,
    Error,
    Partial,
    Timeout
};

[[nodiscard]] constexpr std::string_view to_string(WorkerStatus status) noexcept {
    switch (status) {
        case WorkerStatus::Success: return "success";
        case WorkerStatus::Error:   return "error";
        case WorkerStatus::Partial: return "partial";
        case WorkerStatus::Timeout: return "timeout";
    }
    return "unknown";
}

[[nodiscard]] std::optional<WorkerStatus> parse_worker_status(std::string_view name) noexcept;

// ─────────────────────────────────────────────
// Analysis
// ─────────────────────────────────────────────

struct AnalysisRequest {
    TaskId task_id;
    ServiceType service = ServiceType::StaticAnalyzer;
    ModelSlug target_model;
    int64_t target_app_number = 0;
    std::vector<ToolName> tools;
};

/// Decoded analysis response. findings and tool_status stay opaque JSON.
struct WorkerResponse {
    WorkerStatus status = WorkerStatus::Error;
    Json::Value findings{Json::arrayValue};
    std::vector<ToolName> tools_used;
    std::map<std::string, int64_t> severity_breakdown;
    bool has_severity_breakdown = false;
    Json::Value tool_status{Json::objectValue};
    std::optional<std::string> error;

    [[nodiscard]] bool succeeded() const noexcept {
        return status == WorkerStatus::Success || status == WorkerStatus::Partial;
    }
};

Json::Value encode_analysis_request(const AnalysisRequest& request);
Result<WorkerResponse> decode_analysis_response(const Json::Value& message);

// ─────────────────────────────────────────────
// Generation
// ─────────────────────────────────────────────

struct GenerationRequest {
    ModelSlug model;
    std::string template_name;
    int64_t app_number = 0;
    int64_t version = 1;
    std::optional<std::string> batch_id;
};

struct GenerationResponse {
    WorkerStatus status = WorkerStatus::Error;
    std::optional<std::string> app_dir;
    std::optional<std::string> error;
};

Json::Value encode_generation_request(const GenerationRequest& request);
Result<GenerationResponse> decode_generation_response(const Json::Value& message);

// ─────────────────────────────────────────────
// Message plumbing
// ─────────────────────────────────────────────

Json::Value make_health_check();

/// True for a message that ends an exchange (a result, an error, or anything with a status).
[[nodiscard]] bool is_terminal_message(const Json::Value& message);

/// Compact single-line serialisation.
std::string to_json_string(const Json::Value& value);

/// Indented serialisation for documents written to disk.
std::string to_pretty_json(const Json::Value& value);

Result<Json::Value> parse_json(std::string_view text);

}  // namespace analyzer_orchestrator
