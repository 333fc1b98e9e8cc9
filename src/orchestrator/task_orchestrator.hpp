/**
 * @file task_orchestrator.hpp
 * @brief Analysis request lifecycle: main task, per-service subtasks, rollup.
 * @author AnalyzerOrchestrator Team
 *
 * One analysis request becomes a main task plus one subtask per worker
 * service its tools belong to. Subtasks are dispatched concurrently on a
 * bounded pool; whenever they are all terminal the main task's status and
 * progress are recomputed from theirs and the consolidated result document
 * is stored.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "network/worker_client.hpp"
#include "orchestrator/result_aggregator.hpp"
#include "pool/endpoint_pool.hpp"
#include "store/task_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace analyzer_orchestrator {

struct AnalysisTarget {
    ModelSlug model;
    int64_t app_number = 0;
};

/**
 * @brief Main-task status as a function of its subtasks' statuses.
 *
 * Any non-terminal subtask keeps the main task running. Otherwise: all
 * completed -> completed; some succeeded and some failed or were cancelled
 * -> partial_success; all cancelled -> cancelled; anything else -> failed.
 * An empty list yields pending.
 */
[[nodiscard]] TaskStatus rollup_status(const std::vector<TaskStatus>& subtasks) noexcept;

/// Terminal subtasks / total * 100 (0 for an empty list).
[[nodiscard]] double rollup_progress(const std::vector<TaskStatus>& subtasks) noexcept;

/// <results_dir>/<model>/app<N>/<task_id>.json, with '/' in the model slug replaced.
[[nodiscard]] std::filesystem::path result_file_path(const std::filesystem::path& results_dir,
                                                     const ModelSlug& model, int64_t app_number,
                                                     const TaskId& task_id);

class TaskOrchestrator {
public:
    TaskOrchestrator(const OrchestratorConfig& config, const ServicesConfig& services,
                     TaskStore& store, EndpointPool& pool, IWorkerClient& client,
                     Logger& logger, MetricsCollector* metrics = nullptr,
                     ClockFn clock = system_clock_fn());
    ~TaskOrchestrator();

    TaskOrchestrator(const TaskOrchestrator&) = delete;
    TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

    /// Persist a main task and its subtasks. Nothing is dispatched yet.
    Result<AnalysisTask> create_task(const AnalysisTarget& target,
                                     const std::vector<ToolName>& tools);

    /// Dispatch pending work of a main task and block until it settles.
    Result<AnalysisTask> execute(const TaskId& task_id);

    Result<AnalysisTask> run_analysis(const AnalysisTarget& target,
                                      const std::vector<ToolName>& tools);

    /**
     * @brief Re-dispatch the failed subtasks of a failed or partially successful task.
     *
     * Completed subtasks keep their results. Refused once the task's
     * retry budget is spent.
     */
    Result<AnalysisTask> retry(const TaskId& task_id);

    /// Cancel pending subtasks and the main task. Running subtasks finish on their own.
    Result<AnalysisTask> cancel(const TaskId& task_id);

    /// Stop accepting subtask work and drain what is queued.
    void shutdown();

private:
    Result<AnalysisTask> run(const AnalysisTask& main);
    void dispatch(const AnalysisTask& task);
    /// Refresh a main task's status and progress while some of its subtasks are still open.
    void refresh_rollup(const TaskId& main_id);
    Result<AnalysisTask> finalize(const AnalysisTask& main, const std::vector<AnalysisTask>& subs);
    void write_result_file(const AnalysisTask& main, const Json::Value& doc);

    OrchestratorConfig config_;
    Duration dispatch_timeout_;
    TaskStore& store_;
    EndpointPool& pool_;
    IWorkerClient& client_;
    Logger& logger_;
    MetricsCollector* metrics_;
    ClockFn clock_;
    ResultAggregator aggregator_;
    std::mutex rollup_mutex_;
    ThreadPool subtask_pool_;
};

}  // namespace analyzer_orchestrator
