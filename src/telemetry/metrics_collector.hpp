/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author AnalyzerOrchestrator Team
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace analyzer_orchestrator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Components hold a nullable pointer to a collector; a null collector
 * means telemetry is disabled.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_endpoint_event(ServiceType service, std::string_view url,
                               std::string_view event_type);
    void record_job(const RunId& run, std::string_view job_key, bool success,
                    Duration duration);
    void record_task(const TaskId& id, TaskStatus status, Duration duration);
    void record_pipeline(const RunId& run, PipelineStatus status);
    void record_sweep(size_t reclaimed_running, size_t reclaimed_pending,
                      size_t reclaimed_orphans, Duration duration);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace analyzer_orchestrator
