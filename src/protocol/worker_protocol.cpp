/**
 * @file worker_protocol.cpp
 * @brief Worker message encoding and decoding with jsoncpp.
 * @author AnalyzerOrchestrator Team
 */

#include "protocol/worker_protocol.hpp"

#include <cmath>
#include <initializer_list>
#include <memory>

namespace analyzer_orchestrator {

namespace {

constexpr double kMaxCount = 9.0e18;

/// First present member among the given names, or null.
const Json::Value& member(const Json::Value& obj, std::initializer_list<const char*> names) {
    static const Json::Value kNull;
    if (!obj.isObject()) return kNull;
    for (const char* name : names) {
        if (obj.isMember(name)) return obj[name];
    }
    return kNull;
}

std::optional<std::string> optional_string(const Json::Value& value) {
    if (value.isString()) return value.asString();
    if (value.isObject() && value.isMember("message") && value["message"].isString()) {
        return value["message"].asString();
    }
    return std::nullopt;
}

Result<WorkerStatus> read_status(const Json::Value& message) {
    const auto& status = message["status"];
    if (!status.isString()) {
        // Worker error frames may omit status.
        const auto& type = message["type"];
        if (type.isString() && type.asString() == "error") {
            return WorkerStatus::Error;
        }
        return Error{"Worker response has no status", ErrorKind::Protocol};
    }
    auto parsed = parse_worker_status(status.asString());
    if (!parsed) {
        return Error{"Unknown worker status '" + status.asString() + "'", ErrorKind::Protocol};
    }
    return *parsed;
}

}  // namespace

std::optional<WorkerStatus> parse_worker_status(std::string_view name) noexcept {
    if (name == "success" || name == "completed") return WorkerStatus::Success;
    if (name == "error" || name == "failed") return WorkerStatus::Error;
    if (name == "partial") return WorkerStatus::Partial;
    if (name == "timeout") return WorkerStatus::Timeout;
    return std::nullopt;
}

// ── Analysis ─────────────────────────────────

Json::Value encode_analysis_request(const AnalysisRequest& request) {
    Json::Value msg(Json::objectValue);
    msg["type"] = "analysis_request";
    msg["taskId"] = request.task_id;
    msg["service"] = std::string{to_string(request.service)};
    msg["targetModel"] = request.target_model;
    msg["targetAppNumber"] = static_cast<Json::Int64>(request.target_app_number);
    // Field names existing workers already read.
    msg["model_slug"] = request.target_model;
    msg["app_number"] = static_cast<Json::Int64>(request.target_app_number);

    Json::Value tools(Json::arrayValue);
    for (const auto& tool : request.tools) tools.append(tool);
    msg["tools"] = tools;
    return msg;
}

Result<WorkerResponse> decode_analysis_response(const Json::Value& message) {
    if (!message.isObject()) {
        return Error{"Worker response is not a JSON object", ErrorKind::Protocol};
    }
    auto status = read_status(message);
    if (!status) return status.error();

    WorkerResponse response;
    response.status = *status;
    response.error = optional_string(message["error"]);
    if (!response.succeeded() && !response.error) {
        response.error = optional_string(message["message"]);
    }

    const Json::Value& body = member(message, {"analysis", "result", "results"});
    const Json::Value& source = body.isObject() ? body : message;

    const auto& findings = member(source, {"findings", "issues"});
    if (findings.isArray()) response.findings = findings;

    for (const auto& tool : member(source, {"toolsUsed", "tools_used"})) {
        if (tool.isString()) response.tools_used.push_back(tool.asString());
    }

    const auto& breakdown = member(source, {"severityBreakdown", "severity_breakdown"});
    if (breakdown.isObject()) {
        response.has_severity_breakdown = true;
        for (const auto& key : breakdown.getMemberNames()) {
            const auto& count = breakdown[key];
            if (count.isInt64()) {
                response.severity_breakdown[key] = count.asInt64();
            } else if (count.isDouble() && std::fabs(count.asDouble()) < kMaxCount) {
                response.severity_breakdown[key] = static_cast<int64_t>(count.asDouble());
            }
        }
    }

    const auto& tool_status = member(source, {"toolStatus", "tool_status"});
    if (tool_status.isObject()) response.tool_status = tool_status;

    if (!response.succeeded() && !response.error) {
        response.error = "Worker reported " + std::string{to_string(response.status)};
    }
    return response;
}

// ── Generation ───────────────────────────────

Json::Value encode_generation_request(const GenerationRequest& request) {
    Json::Value msg(Json::objectValue);
    msg["type"] = "generation_request";
    msg["model"] = request.model;
    msg["template"] = request.template_name;
    msg["appNumber"] = static_cast<Json::Int64>(request.app_number);
    msg["version"] = static_cast<Json::Int64>(request.version);
    if (request.batch_id) msg["batchId"] = *request.batch_id;
    return msg;
}

Result<GenerationResponse> decode_generation_response(const Json::Value& message) {
    if (!message.isObject()) {
        return Error{"Generation response is not a JSON object", ErrorKind::Protocol};
    }
    auto status = read_status(message);
    if (!status) return status.error();

    GenerationResponse response;
    response.status = *status;
    response.app_dir = optional_string(member(message, {"appDir", "app_dir"}));
    response.error = optional_string(message["error"]);
    if (response.status != WorkerStatus::Success && response.status != WorkerStatus::Partial
        && !response.error) {
        response.error = "Generation worker reported " + std::string{to_string(response.status)};
    }
    return response;
}

// ── Plumbing ─────────────────────────────────

Json::Value make_health_check() {
    Json::Value msg(Json::objectValue);
    msg["type"] = "health_check";
    return msg;
}

bool is_terminal_message(const Json::Value& message) {
    if (!message.isObject()) return false;
    if (message.isMember("type") && message["type"].isString()) {
        const auto type = message["type"].asString();
        if (type == "analysis_result" || type == "generation_result" || type == "error") {
            return true;
        }
        if (type == "request_queued" || type == "progress_update") return false;
    }
    return message.isMember("status");
}

std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string to_pretty_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

Result<Json::Value> parse_json(std::string_view text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Error{"Invalid JSON: " + errors, ErrorKind::Protocol};
    }
    return root;
}

}  // namespace analyzer_orchestrator
