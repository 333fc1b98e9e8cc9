/**
 * @file task_store.hpp
 * @brief Persisted analysis tasks (main tasks and their subtasks).
 * @author AnalyzerOrchestrator Team
 *
 * Every status change is a conditional UPDATE on the expected current
 * status, so two writers (or two overlapping sweeps) can never both apply
 * the same transition. Each transition reports whether a row changed.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "store/database.hpp"
#include "store/named_lock.hpp"

#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace analyzer_orchestrator {

struct AnalysisTask {
    TaskId task_id;
    std::optional<TaskId> parent_task_id;
    bool is_main = true;
    TaskStatus status = TaskStatus::Pending;
    std::optional<ServiceType> service;     ///< Unset for a main task spanning several services
    ModelSlug target_model;
    int64_t target_app_number = 0;
    std::vector<ToolName> tools;
    double progress = 0.0;
    uint32_t retry_count = 0;
    uint32_t max_retries = 3;
    std::optional<std::string> result_summary;  ///< JSON document
    std::optional<std::string> error_message;
    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    [[nodiscard]] bool is_subtask() const noexcept { return parent_task_id.has_value(); }
};

class TaskStore {
public:
    static Result<std::unique_ptr<TaskStore>> open(const StoreConfig& config, Logger& logger,
                                                   ClockFn clock = system_clock_fn());

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    /// Insert a main task with all of its subtasks in one transaction.
    Result<void> insert_task_tree(const AnalysisTask& main,
                                  const std::vector<AnalysisTask>& subtasks);

    Result<AnalysisTask> get(const TaskId& task_id);
    Result<std::vector<AnalysisTask>> subtasks_of(const TaskId& main_id);
    Result<std::vector<AnalysisTask>> with_status(TaskStatus status);

    /// Tasks in `status` whose reference time is before the cutoff.
    /// Running tasks are aged by started_at (created_at if never started), pending by created_at.
    Result<std::vector<AnalysisTask>> stuck_since(TaskStatus status, Timestamp cutoff);

    /// Non-terminal tasks created before the cutoff.
    Result<std::vector<AnalysisTask>> active_created_before(Timestamp cutoff);

    // ── Conditional transitions ──────────────

    /// pending -> running, stamps started_at.
    Result<bool> mark_running(const TaskId& task_id);

    /// pending|running -> terminal status with result and/or error.
    Result<bool> finish(const TaskId& task_id, TaskStatus status,
                        const std::optional<std::string>& result_summary,
                        const std::optional<std::string>& error_message);

    /**
     * @brief Store the rolled-up state of a main task.
     *
     * Never overrides a cancelled task. completed_at is stamped when the
     * status is terminal.
     */
    Result<bool> update_rollup(const TaskId& task_id, TaskStatus status, double progress,
                               const std::optional<std::string>& result_summary,
                               const std::optional<std::string>& error_message);

    /// Any of `from` -> cancelled with the given explanation.
    Result<bool> cancel(const TaskId& task_id, std::initializer_list<TaskStatus> from,
                        const std::string& reason);

    /// failed|cancelled subtask -> pending, clearing outcome fields.
    Result<bool> reset_for_retry(const TaskId& task_id);

    /**
     * @brief failed|partial_success main task -> running with retry_count + 1.
     *
     * No change once retry_count has reached max_retries.
     */
    Result<bool> begin_retry(const TaskId& task_id);

private:
    TaskStore(Database db, const StoreConfig& config, Logger& logger, ClockFn clock);

    Result<void> create_schema();
    Result<std::vector<AnalysisTask>> query(const std::string& where,
                                            const std::function<void(Statement&)>& binder);

    Database db_;
    StoreConfig config_;
    Logger& logger_;
    ClockFn clock_;
    NamedLock write_lock_;
    std::mutex mutex_;
};

}  // namespace analyzer_orchestrator
