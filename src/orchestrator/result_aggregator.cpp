/**
 * @file result_aggregator.cpp
 * @brief ResultAggregator implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "orchestrator/result_aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <set>

namespace analyzer_orchestrator {

namespace {

std::string string_field(const Json::Value& obj, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (!obj.isMember(name)) continue;
        const auto& v = obj[name];
        if (v.isString()) return v.asString();
        // SARIF-style {"text": "..."} messages
        if (v.isObject() && v.isMember("text") && v["text"].isString()) {
            return v["text"].asString();
        }
    }
    return {};
}

std::string finding_id(const Json::Value& finding) {
    const auto& id = finding["id"];
    if (id.isString()) return id.asString();
    if (id.isIntegral()) return std::to_string(id.asLargestInt());
    return {};
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Json::Value service_list(const std::vector<ServiceType>& services) {
    Json::Value arr(Json::arrayValue);
    for (auto s : services) arr.append(std::string{to_string(s)});
    return arr;
}

}  // namespace

ServiceSnapshot make_snapshot(ServiceType service, const WorkerResponse& response) {
    ServiceSnapshot snap;
    snap.service = service;
    snap.status = response.status;
    snap.findings = response.findings;
    snap.tools_used = response.tools_used;
    snap.severity_breakdown = response.severity_breakdown;
    snap.has_severity_breakdown = response.has_severity_breakdown;
    snap.tool_status = response.tool_status;
    return snap;
}

Json::Value snapshot_to_json(const ServiceSnapshot& snapshot) {
    Json::Value doc(Json::objectValue);
    doc["serviceName"] = std::string{to_string(snapshot.service)};
    doc["status"] = std::string{to_string(snapshot.status)};
    doc["findings"] = snapshot.findings;
    Json::Value tools(Json::arrayValue);
    for (const auto& t : snapshot.tools_used) tools.append(t);
    doc["toolsUsed"] = tools;
    if (snapshot.has_severity_breakdown) {
        Json::Value breakdown(Json::objectValue);
        for (const auto& [severity, count] : snapshot.severity_breakdown) {
            breakdown[severity] = static_cast<Json::Int64>(count);
        }
        doc["severityBreakdown"] = breakdown;
    }
    doc["toolStatus"] = snapshot.tool_status;
    return doc;
}

Result<ServiceSnapshot> snapshot_from_json(const Json::Value& doc) {
    if (!doc.isObject() || !doc["serviceName"].isString()) {
        return Error{"Snapshot lacks serviceName", ErrorKind::Protocol};
    }
    auto service = parse_service_type(doc["serviceName"].asString());
    if (!service) {
        return Error{"Unknown service '" + doc["serviceName"].asString() + "'",
                     ErrorKind::Protocol};
    }
    auto response = decode_analysis_response(doc);
    if (!response) return response.error();
    return make_snapshot(*service, *response);
}

Json::Value AggregatedResult::to_json() const {
    Json::Value doc(Json::objectValue);
    doc["status"] = std::string{to_string(status)};
    doc["servicesRequested"] = service_list(services_requested);
    doc["servicesExecuted"] = service_list(services_executed);
    doc["servicesFailed"] = service_list(services_failed);
    doc["findings"] = findings;
    doc["totalFindings"] = static_cast<Json::UInt64>(total_findings());
    Json::Value breakdown(Json::objectValue);
    for (const auto& [severity, count] : severity_breakdown) {
        breakdown[severity] = static_cast<Json::Int64>(count);
    }
    doc["severityBreakdown"] = breakdown;
    doc["toolsExecuted"] = static_cast<Json::UInt64>(tools_executed);
    doc["toolStatus"] = tool_status;
    return doc;
}

AggregatedResult ResultAggregator::aggregate(const std::vector<ServiceType>& requested,
                                             const std::vector<ServiceSnapshot>& snapshots) const {
    AggregatedResult out;
    out.services_requested = requested;

    std::set<std::string> seen_ids;
    std::set<ToolName> tools;

    for (const auto& snap : snapshots) {
        if (snap.status != WorkerStatus::Success && snap.status != WorkerStatus::Partial) continue;
        if (std::find(out.services_executed.begin(), out.services_executed.end(), snap.service)
            != out.services_executed.end()) {
            continue;
        }
        out.services_executed.push_back(snap.service);
        const std::string service_name{to_string(snap.service)};

        std::map<std::string, int64_t> counted;
        for (const auto& finding : snap.findings) {
            if (!finding.isObject()) continue;
            // Only an explicit id identifies a finding; the same rule can fire at many locations.
            auto id = finding_id(finding);
            if (!id.empty() && !seen_ids.insert(id).second) continue;

            Json::Value tagged = finding;
            tagged["service"] = service_name;
            out.findings.append(tagged);

            auto severity = lower(string_field(finding, {"severity", "level"}));
            ++counted[severity.empty() ? "unknown" : severity];
        }

        const auto& breakdown = snap.has_severity_breakdown ? snap.severity_breakdown : counted;
        for (const auto& [severity, count] : breakdown) {
            out.severity_breakdown[lower(severity)] += count;
        }

        for (const auto& tool : snap.tools_used) tools.insert(tool);
        for (const auto& tool : snap.tool_status.getMemberNames()) tools.insert(tool);
        out.tool_status[service_name] = snap.tool_status;
    }

    for (auto service : requested) {
        if (std::find(out.services_executed.begin(), out.services_executed.end(), service)
            == out.services_executed.end()) {
            out.services_failed.push_back(service);
        }
    }

    out.tools_executed = tools.size();
    if (out.services_executed.empty()) {
        out.status = TaskStatus::Failed;
    } else if (out.services_failed.empty()) {
        out.status = TaskStatus::Completed;
    } else {
        out.status = TaskStatus::PartialSuccess;
    }
    return out;
}

}  // namespace analyzer_orchestrator
