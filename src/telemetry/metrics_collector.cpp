/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace analyzer_orchestrator {

namespace {

std::string ts_field() {
    return R"(,"ts":")" + format_timestamp(std::chrono::system_clock::now()) + "\"";
}

}  // namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_endpoint_event(ServiceType service, std::string_view url,
                                             std::string_view event_type) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event_type) << "\""
        << ts_field()
        << R"(,"service":")" << to_string(service) << "\""
        << R"(,"url":")" << json_escape(url) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job(const RunId& run, std::string_view job_key, bool success,
                                  Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"job")"
        << ts_field()
        << R"(,"run":")" << json_escape(run) << "\""
        << R"(,"job":")" << json_escape(job_key) << "\""
        << R"(,"outcome":")" << (success ? "success" : "failure") << "\""
        << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_task(const TaskId& id, TaskStatus status, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"task")"
        << ts_field()
        << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"status":")" << to_string(status) << "\""
        << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_pipeline(const RunId& run, PipelineStatus status) {
    std::ostringstream oss;
    oss << R"({"event":"pipeline")"
        << ts_field()
        << R"(,"run":")" << json_escape(run) << "\""
        << R"(,"status":")" << to_string(status) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_sweep(size_t reclaimed_running, size_t reclaimed_pending,
                                    size_t reclaimed_orphans, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"sweep")"
        << ts_field()
        << R"(,"running":)" << reclaimed_running
        << R"(,"pending":)" << reclaimed_pending
        << R"(,"orphans":)" << reclaimed_orphans
        << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << ts_field()
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace analyzer_orchestrator
