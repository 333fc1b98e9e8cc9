/**
 * @file job_scheduler.cpp
 * @brief JobScheduler implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "scheduler/job_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace analyzer_orchestrator {

namespace {

constexpr const char* kGen = "GEN";
constexpr const char* kAnal = "ANAL";
constexpr const char* kMain = "MAIN";

Json::Value optional_ts(const std::optional<Timestamp>& ts) {
    return ts ? Json::Value(format_timestamp(*ts)) : Json::Value(Json::nullValue);
}

}  // namespace

// ─────────────────────────────────────────────
// Snapshots
// ─────────────────────────────────────────────

Json::Value StageProgress::to_json() const {
    Json::Value v(Json::objectValue);
    v["total"] = total;
    v["completed"] = completed;
    v["failed"] = failed;
    v["inFlight"] = in_flight;
    v["pending"] = pending();
    v["skipped"] = skipped;
    v["partial"] = partial;
    return v;
}

Json::Value PipelineRun::to_json() const {
    Json::Value v(Json::objectValue);
    v["id"] = id;
    v["name"] = definition.name;
    v["status"] = std::string{analyzer_orchestrator::to_string(status)};
    v["generation"] = generation.to_json();
    v["analysis"] = analysis.to_json();
    v["createdAt"] = format_timestamp(created_at);
    v["startedAt"] = optional_ts(started_at);
    v["completedAt"] = optional_ts(completed_at);

    Json::Value jobs_json(Json::arrayValue);
    for (const auto& job : jobs) {
        Json::Value j(Json::objectValue);
        j["key"] = job.key;
        j["success"] = job.success;
        if (job.partial) j["partial"] = true;
        if (!job.counted) j["counted"] = false;
        if (job.app_number) j["appNumber"] = static_cast<Json::Int64>(*job.app_number);
        if (job.task_id) j["taskId"] = *job.task_id;
        if (job.error) j["error"] = *job.error;
        j["durationMs"] = static_cast<Json::Int64>(job.duration.count());
        jobs_json.append(j);
    }
    v["jobs"] = jobs_json;

    Json::Value events_json(Json::arrayValue);
    for (const auto& e : events) {
        Json::Value j(Json::objectValue);
        j["ts"] = format_timestamp(e.ts);
        j["message"] = e.message;
        events_json.append(j);
    }
    v["events"] = events_json;
    return v;
}

// ─────────────────────────────────────────────
// Construction / Lifecycle
// ─────────────────────────────────────────────

JobScheduler::JobScheduler(const SchedulerConfig& config, ReservationStore& reservations,
                           IGenerationWorker& generator, TaskOrchestrator& orchestrator,
                           Logger& logger, MetricsCollector* metrics, ClockFn clock)
    : config_(config),
      reservations_(reservations),
      generator_(generator),
      orchestrator_(orchestrator),
      logger_(logger),
      metrics_(metrics),
      clock_(std::move(clock)),
      generation_pool_(std::max<uint32_t>(config.generation_workers, 1), "generation"),
      analysis_pool_(std::max<uint32_t>(config.analysis_workers, 1), "analysis") {}

JobScheduler::~JobScheduler() {
    stop();
}

void JobScheduler::start() {
    if (loop_thread_.joinable()) return;
    loop_thread_ = std::jthread([this](std::stop_token stop) { loop(stop); });
    logger_.info(kMain, "Scheduler polling every " + std::to_string(config_.poll_interval_ms)
                            + "ms");
}

void JobScheduler::loop(std::stop_token stop) {
    const auto interval = std::chrono::milliseconds(config_.poll_interval_ms);
    while (!stop.stop_requested()) {
        tick();
        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, interval, [this] { return wake_requested_; });
        wake_requested_ = false;
    }
}

void JobScheduler::stop() {
    {
        std::lock_guard lock(mutex_);
        accepting_ = false;
    }
    if (loop_thread_.joinable()) {
        loop_thread_.request_stop();
        wake_cv_.notify_all();
        loop_thread_.join();
    }

    const auto deadline = std::chrono::steady_clock::now()
                          + std::chrono::milliseconds(config_.shutdown_timeout_ms);
    auto left = [&] {
        return std::max(std::chrono::duration_cast<std::chrono::milliseconds>(
                            deadline - std::chrono::steady_clock::now()),
                        std::chrono::milliseconds{0});
    };
    // Generation continuations may still queue analysis work, so drain it first.
    bool idle = generation_pool_.wait_idle(left());
    idle = analysis_pool_.wait_idle(left()) && idle;
    if (!idle) {
        logger_.warn(kMain, "Shutdown timeout reached with " + std::to_string(in_flight_jobs())
                                + " job(s) still in flight");
    }
    generation_pool_.shutdown();
    analysis_pool_.shutdown();
}

// ─────────────────────────────────────────────
// Submission
// ─────────────────────────────────────────────

std::string JobScheduler::job_key(JobStage stage, size_t index, const ModelSlug& model,
                                  const std::string& template_name) {
    return std::string{stage == JobStage::Generation ? "gen:" : "ana:"} + std::to_string(index)
           + ":" + model + ":" + template_name;
}

Result<RunId> JobScheduler::submit(PipelineDefinition definition) {
    if (auto r = validate(definition); !r) return r.error();

    RunId id = make_id("run");
    {
        std::lock_guard lock(mutex_);
        if (!accepting_) {
            return Error{"Scheduler is shutting down", ErrorKind::Cancelled};
        }

        RunState state;
        state.run.id = id;
        state.run.created_at = clock_();
        const auto jobs = static_cast<uint32_t>(definition.job_count());
        state.run.generation.total = jobs;
        state.run.analysis.total = definition.analysis_enabled ? jobs : 0;
        for (size_t i = 0; i < jobs; ++i) state.generation_queue.push_back(i);
        state.run.definition = std::move(definition);

        auto& stored = runs_.emplace(id, std::move(state)).first->second;
        order_.push_back(id);
        event_locked(stored, kMain,
                     "Submitted: " + std::to_string(stored.run.definition.models.size())
                         + " model(s) x " + std::to_string(stored.run.definition.templates.size())
                         + " template(s), analysis "
                         + (stored.run.definition.analysis_enabled ? "enabled" : "disabled"));
    }

    {
        std::lock_guard lock(wake_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_all();
    return id;
}

void JobScheduler::tick() {
    std::lock_guard lock(mutex_);
    for (const auto& id : order_) {
        auto& state = runs_.at(id);
        if (is_terminal(state.run.status)) continue;

        if (state.run.status == PipelineStatus::Pending) {
            if (!accepting_) continue;
            state.run.status = PipelineStatus::Running;
            state.run.started_at = clock_();
            event_locked(state, kMain, "Running");
            if (metrics_ != nullptr) metrics_->record_pipeline(id, PipelineStatus::Running);
        }
        admit_locked(state);
        settle_locked(state);
    }
    evict_finished_locked();
    state_cv_.notify_all();
}

void JobScheduler::evict_finished_locked() {
    if (config_.retained_runs == 0) return;

    size_t finished = 0;
    for (const auto& id : order_) {
        if (is_terminal(runs_.at(id).run.status)) ++finished;
    }
    if (finished <= config_.retained_runs) return;

    size_t excess = finished - config_.retained_runs;
    for (auto it = order_.begin(); it != order_.end() && excess > 0;) {
        const auto& run = runs_.at(*it).run;
        // A cancelled run may still have jobs in flight; keep it until they report back.
        if (!is_terminal(run.status) || run.generation.in_flight > 0
            || run.analysis.in_flight > 0) {
            ++it;
            continue;
        }
        logger_.debug(kMain, "Dropping finished pipeline run " + *it);
        runs_.erase(*it);
        it = order_.erase(it);
        --excess;
    }
}

void JobScheduler::admit_locked(RunState& state) {
    if (!accepting_ || state.run.status != PipelineStatus::Running) return;
    const auto& def = state.run.definition;

    while (!state.generation_queue.empty()
           && state.run.generation.in_flight < def.generation.max_concurrent_tasks) {
        size_t index = state.generation_queue.front();
        state.generation_queue.pop_front();
        submit_generation_locked(state, index);
    }
    while (!state.analysis_queue.empty()
           && state.run.analysis.in_flight < def.analysis.max_concurrent_tasks) {
        AnalysisJob job = std::move(state.analysis_queue.front());
        state.analysis_queue.pop_front();
        submit_analysis_locked(state, std::move(job));
    }
}

void JobScheduler::submit_generation_locked(RunState& state, size_t index) {
    const auto& def = state.run.definition;
    const ModelSlug model = def.models[index / def.templates.size()];
    const std::string template_name = def.templates[index % def.templates.size()];
    const auto key = job_key(JobStage::Generation, index, model, template_name);
    const RunId run_id = state.run.id;

    if (!in_flight_.insert({run_id, key}).second) {
        logger_.warn(kGen, "Job " + key + " of " + run_id + " is already in flight, not resubmitted");
        return;
    }
    ++state.run.generation.in_flight;

    try {
        generation_pool_.submit(
            [this, run_id, model, template_name] {
                return run_generation(run_id, model, template_name);
            },
            [this, run_id, index](JobResult& result) {
                on_generation_done(run_id, index, result);
            });
    } catch (const std::runtime_error& e) {
        in_flight_.erase({run_id, key});
        --state.run.generation.in_flight;
        ++state.run.generation.failed;
        if (state.run.definition.analysis_enabled) ++state.run.analysis.skipped;
        event_locked(state, kGen, "Could not submit " + key + ": " + e.what());
    }
}

void JobScheduler::submit_analysis_locked(RunState& state, AnalysisJob job) {
    const auto key = job_key(JobStage::Analysis, job.index, job.slot.model,
                             job.slot.template_name);
    const RunId run_id = state.run.id;

    if (!in_flight_.insert({run_id, key}).second) {
        logger_.warn(kAnal, "Job " + key + " of " + run_id + " is already in flight, not resubmitted");
        return;
    }
    ++state.run.analysis.in_flight;

    const auto tools = state.run.definition.tools;
    const size_t index = job.index;
    try {
        analysis_pool_.submit(
            [this, slot = std::move(job.slot), tools] { return run_analysis(slot, tools); },
            [this, run_id, index](JobResult& result) {
                on_analysis_done(run_id, index, result);
            });
    } catch (const std::runtime_error& e) {
        in_flight_.erase({run_id, key});
        --state.run.analysis.in_flight;
        ++state.run.analysis.failed;
        event_locked(state, kAnal, "Could not submit " + key + ": " + e.what());
    }
}

// ─────────────────────────────────────────────
// Job bodies (worker threads, no scheduler lock)
// ─────────────────────────────────────────────

JobScheduler::JobResult JobScheduler::run_generation(const RunId& run_id, const ModelSlug& model,
                                                     const std::string& template_name) {
    JobResult result;
    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    };

    try {
        AllocationRequest request;
        request.model = model;
        request.template_name = template_name;
        request.batch_id = run_id;
        auto slot = reservations_.allocate(request);
        if (!slot) {
            result.error = "Slot allocation failed: " + slot.error().message;
            result.duration = elapsed();
            return result;
        }
        result.slot = *slot;

        GenerationRequest gen;
        gen.model = model;
        gen.template_name = template_name;
        gen.app_number = slot->app_number;
        gen.version = slot->version;
        gen.batch_id = run_id;
        auto output = generator_.generate(gen);

        result.success = output.has_value();
        if (!output) result.error = output.error().message;

        auto marked = reservations_.mark_generated(slot->id, result.success, result.error);
        if (!marked) {
            logger_.error(kGen, "Cannot record generation outcome for slot "
                                    + std::to_string(slot->id) + ": " + marked.error().message);
        }
    } catch (const std::exception& e) {
        result.success = false;
        result.error = std::string{"Generation job aborted: "} + e.what();
    }
    result.duration = elapsed();
    return result;
}

JobScheduler::JobResult JobScheduler::run_analysis(const ApplicationSlot& slot,
                                                   const std::vector<ToolName>& tools) {
    JobResult result;
    result.slot = slot;
    const auto started = std::chrono::steady_clock::now();

    try {
        auto task = orchestrator_.run_analysis(AnalysisTarget{slot.model, slot.app_number}, tools);
        if (!task) {
            result.error = task.error().message;
        } else {
            result.task_id = task->task_id;
            result.success = task->status == TaskStatus::Completed
                             || task->status == TaskStatus::PartialSuccess;
            result.partial = task->status == TaskStatus::PartialSuccess;
            if (!result.success) {
                result.error = task->error_message.value_or(
                    "Analysis ended " + std::string{to_string(task->status)});
            }
        }
    } catch (const std::exception& e) {
        result.success = false;
        result.error = std::string{"Analysis job aborted: "} + e.what();
    }
    result.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);
    return result;
}

// ─────────────────────────────────────────────
// Completion continuations
// ─────────────────────────────────────────────

void JobScheduler::on_generation_done(const RunId& run_id, size_t index, const JobResult& result) {
    std::lock_guard lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return;
    auto& state = it->second;
    auto& run = state.run;
    const auto& def = run.definition;

    const ModelSlug& model = def.models[index / def.templates.size()];
    const std::string& template_name = def.templates[index % def.templates.size()];
    const auto key = job_key(JobStage::Generation, index, model, template_name);
    in_flight_.erase({run_id, key});
    --run.generation.in_flight;

    JobOutcome outcome;
    outcome.key = key;
    outcome.stage = JobStage::Generation;
    outcome.model = model;
    outcome.template_name = template_name;
    outcome.success = result.success;
    outcome.error = result.error;
    outcome.duration = result.duration;
    if (result.slot) {
        outcome.slot_id = result.slot->id;
        outcome.app_number = result.slot->app_number;
    }

    if (run.status == PipelineStatus::Cancelled) {
        outcome.counted = false;
    } else if (result.success) {
        ++run.generation.completed;
        if (def.analysis_enabled && result.slot) {
            state.analysis_queue.push_back(AnalysisJob{index, *result.slot});
        }
        logger_.info(kGen, run_id + " " + key + " -> app" + std::to_string(result.slot->app_number));
    } else {
        ++run.generation.failed;
        if (def.analysis_enabled) ++run.analysis.skipped;
        event_locked(state, kGen, key + " failed: " + result.error.value_or("unknown error"));
    }
    run.jobs.push_back(std::move(outcome));

    if (metrics_ != nullptr) metrics_->record_job(run_id, key, result.success, result.duration);

    admit_locked(state);
    settle_locked(state);
    state_cv_.notify_all();
}

void JobScheduler::on_analysis_done(const RunId& run_id, size_t index, const JobResult& result) {
    std::lock_guard lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return;
    auto& state = it->second;
    auto& run = state.run;

    const auto& slot = *result.slot;
    const auto key = job_key(JobStage::Analysis, index, slot.model, slot.template_name);
    in_flight_.erase({run_id, key});
    --run.analysis.in_flight;

    JobOutcome outcome;
    outcome.key = key;
    outcome.stage = JobStage::Analysis;
    outcome.model = slot.model;
    outcome.template_name = slot.template_name;
    outcome.success = result.success;
    outcome.partial = result.partial;
    outcome.slot_id = slot.id;
    outcome.app_number = slot.app_number;
    outcome.task_id = result.task_id;
    outcome.error = result.error;
    outcome.duration = result.duration;

    if (run.status == PipelineStatus::Cancelled) {
        outcome.counted = false;
    } else if (result.success) {
        ++run.analysis.completed;
        if (result.partial) ++run.analysis.partial;
        logger_.info(kAnal, run_id + " " + key + " -> " + result.task_id.value_or("?")
                                + (result.partial ? " (partial)" : ""));
    } else {
        ++run.analysis.failed;
        event_locked(state, kAnal, key + " failed: " + result.error.value_or("unknown error"));
    }
    run.jobs.push_back(std::move(outcome));

    if (metrics_ != nullptr) metrics_->record_job(run_id, key, result.success, result.duration);

    admit_locked(state);
    settle_locked(state);
    state_cv_.notify_all();
}

void JobScheduler::settle_locked(RunState& state) {
    auto& run = state.run;
    if (run.status != PipelineStatus::Running) return;
    if (!state.generation_queue.empty() || !state.analysis_queue.empty()) return;
    if (run.generation.in_flight > 0 || run.analysis.in_flight > 0) return;

    PipelineStatus final_status;
    if (run.generation.completed == 0) {
        final_status = PipelineStatus::Failed;
    } else if (run.generation.failed == 0 && run.analysis.failed == 0
               && run.analysis.skipped == 0) {
        final_status = PipelineStatus::Completed;
    } else {
        final_status = PipelineStatus::PartialSuccess;
    }

    run.status = final_status;
    run.completed_at = clock_();
    event_locked(state, kMain,
                 "Finished " + std::string{to_string(final_status)} + " (generation "
                     + std::to_string(run.generation.completed) + "/"
                     + std::to_string(run.generation.total) + ", analysis "
                     + std::to_string(run.analysis.completed) + "/"
                     + std::to_string(run.analysis.total) + ")");
    if (metrics_ != nullptr) metrics_->record_pipeline(run.id, final_status);
}

void JobScheduler::event_locked(RunState& state, const char* ctx, std::string message) {
    logger_.info(ctx, state.run.id + ": " + message);
    state.run.events.push_back(PipelineEvent{clock_(), std::move(message)});
    while (state.run.events.size() > std::max<uint32_t>(config_.event_log_limit, 1)) {
        state.run.events.pop_front();
    }
}

// ─────────────────────────────────────────────
// Control / Queries
// ─────────────────────────────────────────────

Result<void> JobScheduler::cancel(const RunId& id) {
    std::lock_guard lock(mutex_);
    auto it = runs_.find(id);
    if (it == runs_.end()) {
        return Error{"No pipeline run " + id, ErrorKind::NotFound};
    }
    auto& state = it->second;
    if (is_terminal(state.run.status)) {
        return Error{"Pipeline run " + id + " is already "
                         + std::string{to_string(state.run.status)},
                     ErrorKind::InvalidArgument};
    }
    state.generation_queue.clear();
    state.analysis_queue.clear();
    state.run.status = PipelineStatus::Cancelled;
    state.run.completed_at = clock_();
    event_locked(state, kMain, "Cancelled with "
                                   + std::to_string(state.run.generation.in_flight
                                                    + state.run.analysis.in_flight)
                                   + " job(s) still in flight");
    if (metrics_ != nullptr) metrics_->record_pipeline(id, PipelineStatus::Cancelled);
    state_cv_.notify_all();
    return {};
}

std::optional<PipelineRun> JobScheduler::get(const RunId& id) const {
    std::lock_guard lock(mutex_);
    auto it = runs_.find(id);
    if (it == runs_.end()) return std::nullopt;
    return it->second.run;
}

std::vector<PipelineRun> JobScheduler::list() const {
    std::lock_guard lock(mutex_);
    std::vector<PipelineRun> out;
    out.reserve(order_.size());
    for (const auto& id : order_) out.push_back(runs_.at(id).run);
    return out;
}

std::optional<PipelineRun> JobScheduler::wait(const RunId& id, Duration timeout) {
    std::unique_lock lock(mutex_);
    state_cv_.wait_for(lock, timeout, [&] {
        auto it = runs_.find(id);
        return it == runs_.end() || is_terminal(it->second.run.status);
    });
    auto it = runs_.find(id);
    if (it == runs_.end()) return std::nullopt;
    return it->second.run;
}

size_t JobScheduler::in_flight_jobs() const {
    std::lock_guard lock(mutex_);
    return in_flight_.size();
}

}  // namespace analyzer_orchestrator
