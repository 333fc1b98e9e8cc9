/**
 * @file job_scheduler.hpp
 * @brief Fans pipelines out into bounded generation and analysis jobs.
 * @author AnalyzerOrchestrator Team
 *
 * Each pipeline run moves pending -> running -> terminal. A run owns a queue
 * of generation jobs (one per model x template) and, when analysis is
 * enabled, receives one analysis job per successful generation. Jobs run on
 * two global pools; per-run admission is limited by maxConcurrentTasks.
 *
 * Counters change only in the completion continuation of each job, so
 * every job is counted exactly once. A job key enters the in-flight set when
 * it is submitted and leaves it in that continuation; a key in the set is
 * never submitted again.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "generation/generation_worker.hpp"
#include "orchestrator/task_orchestrator.hpp"
#include "scheduler/pipeline.hpp"
#include "store/reservation_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace analyzer_orchestrator {

struct StageProgress {
    uint32_t total = 0;
    uint32_t completed = 0;
    uint32_t failed = 0;
    uint32_t in_flight = 0;
    uint32_t skipped = 0;    ///< Analysis jobs whose generation failed
    uint32_t partial = 0;    ///< Analysis jobs that ended partial_success (also in completed)

    [[nodiscard]] uint32_t pending() const noexcept {
        const uint32_t settled = completed + failed + in_flight + skipped;
        return settled >= total ? 0 : total - settled;
    }
    [[nodiscard]] Json::Value to_json() const;
};

enum class JobStage : uint8_t { Generation, Analysis };

struct JobOutcome {
    std::string key;
    JobStage stage = JobStage::Generation;
    ModelSlug model;
    std::string template_name;
    bool success = false;
    bool partial = false;
    bool counted = true;                 ///< False when the run was cancelled first
    std::optional<SlotId> slot_id;
    std::optional<int64_t> app_number;
    std::optional<TaskId> task_id;
    std::optional<std::string> error;
    Duration duration{0};
};

struct PipelineEvent {
    Timestamp ts{};
    std::string message;
};

struct PipelineRun {
    RunId id;
    PipelineDefinition definition;
    PipelineStatus status = PipelineStatus::Pending;
    StageProgress generation;
    StageProgress analysis;
    std::vector<JobOutcome> jobs;
    std::deque<PipelineEvent> events;
    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;

    [[nodiscard]] Json::Value to_json() const;
};

class JobScheduler {
public:
    JobScheduler(const SchedulerConfig& config, ReservationStore& reservations,
                 IGenerationWorker& generator, TaskOrchestrator& orchestrator, Logger& logger,
                 MetricsCollector* metrics = nullptr, ClockFn clock = system_clock_fn());
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /// Validate and enqueue a pipeline. Work starts on the next tick.
    Result<RunId> submit(PipelineDefinition definition);

    /// One scheduling pass: start pending runs, admit queued jobs, settle finished runs.
    /// Finished runs beyond the retention limit are dropped, oldest first.
    void tick();

    /// Run tick() every poll interval on a background thread.
    void start();

    /// Stop the loop and wait for in-flight jobs up to the shutdown timeout.
    void stop();

    /// Stop new submissions for a run. In-flight jobs finish but are not counted.
    Result<void> cancel(const RunId& id);

    [[nodiscard]] std::optional<PipelineRun> get(const RunId& id) const;
    [[nodiscard]] std::vector<PipelineRun> list() const;

    /// Block until the run is terminal or the timeout expires; returns the latest snapshot.
    std::optional<PipelineRun> wait(const RunId& id, Duration timeout);

    [[nodiscard]] size_t in_flight_jobs() const;

private:
    struct AnalysisJob {
        size_t index = 0;
        ApplicationSlot slot;
    };

    struct RunState {
        PipelineRun run;
        std::deque<size_t> generation_queue;
        std::deque<AnalysisJob> analysis_queue;
    };

    struct JobResult {
        bool success = false;
        bool partial = false;
        std::optional<ApplicationSlot> slot;
        std::optional<TaskId> task_id;
        std::optional<std::string> error;
        Duration duration{0};
    };

    void admit_locked(RunState& state);
    void submit_generation_locked(RunState& state, size_t index);
    void submit_analysis_locked(RunState& state, AnalysisJob job);
    void settle_locked(RunState& state);
    void event_locked(RunState& state, const char* ctx, std::string message);
    void evict_finished_locked();

    JobResult run_generation(const RunId& run_id, const ModelSlug& model,
                             const std::string& template_name);
    JobResult run_analysis(const ApplicationSlot& slot, const std::vector<ToolName>& tools);

    void on_generation_done(const RunId& run_id, size_t index, const JobResult& result);
    void on_analysis_done(const RunId& run_id, size_t index, const JobResult& result);

    void loop(std::stop_token stop);

    [[nodiscard]] static std::string job_key(JobStage stage, size_t index, const ModelSlug& model,
                                             const std::string& template_name);

    SchedulerConfig config_;
    ReservationStore& reservations_;
    IGenerationWorker& generator_;
    TaskOrchestrator& orchestrator_;
    Logger& logger_;
    MetricsCollector* metrics_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::map<RunId, RunState> runs_;
    std::vector<RunId> order_;
    std::set<std::pair<RunId, std::string>> in_flight_;
    bool accepting_ = true;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool wake_requested_ = false;
    std::jthread loop_thread_;

    // Declared last so their workers join before the state above is destroyed.
    ThreadPool generation_pool_;
    ThreadPool analysis_pool_;
};

}  // namespace analyzer_orchestrator
