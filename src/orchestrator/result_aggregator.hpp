/**
 * @file result_aggregator.hpp
 * @brief Merges per-service analysis snapshots into one consolidated document.
 * @author AnalyzerOrchestrator Team
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/worker_protocol.hpp"

#include <json/json.h>

#include <map>
#include <string>
#include <vector>

namespace analyzer_orchestrator {

/// What one service contributed to a task.
struct ServiceSnapshot {
    ServiceType service = ServiceType::StaticAnalyzer;
    WorkerStatus status = WorkerStatus::Success;
    Json::Value findings{Json::arrayValue};
    std::vector<ToolName> tools_used;
    std::map<std::string, int64_t> severity_breakdown;
    bool has_severity_breakdown = false;
    Json::Value tool_status{Json::objectValue};
};

ServiceSnapshot make_snapshot(ServiceType service, const WorkerResponse& response);

/// Persisted form, stored as a subtask's result summary.
Json::Value snapshot_to_json(const ServiceSnapshot& snapshot);
Result<ServiceSnapshot> snapshot_from_json(const Json::Value& doc);

struct AggregatedResult {
    TaskStatus status = TaskStatus::Failed;
    std::vector<ServiceType> services_requested;
    std::vector<ServiceType> services_executed;
    std::vector<ServiceType> services_failed;
    Json::Value findings{Json::arrayValue};
    std::map<std::string, int64_t> severity_breakdown;
    Json::Value tool_status{Json::objectValue};   ///< Keyed by service name
    size_t tools_executed = 0;

    [[nodiscard]] size_t total_findings() const { return findings.size(); }
    [[nodiscard]] Json::Value to_json() const;
};

/**
 * @brief Union of service snapshots, tolerant of missing services.
 *
 * A requested service with no successful snapshot counts as failed. The
 * result is always a well-formed document: with nothing executed it has
 * zero findings and status failed.
 */
class ResultAggregator {
public:
    [[nodiscard]] AggregatedResult aggregate(const std::vector<ServiceType>& requested,
                                             const std::vector<ServiceSnapshot>& snapshots) const;
};

}  // namespace analyzer_orchestrator
