/**
 * @file task_orchestrator.cpp
 * @brief TaskOrchestrator implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "orchestrator/task_orchestrator.hpp"

#include "protocol/worker_protocol.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <map>
#include <set>

namespace analyzer_orchestrator {

namespace {

constexpr const char* kCtx = "TASK";

}  // namespace

// ─────────────────────────────────────────────
// Rollup
// ─────────────────────────────────────────────

TaskStatus rollup_status(const std::vector<TaskStatus>& subtasks) noexcept {
    if (subtasks.empty()) return TaskStatus::Pending;

    size_t succeeded = 0;
    size_t completed = 0;
    size_t cancelled = 0;
    for (auto status : subtasks) {
        if (!is_terminal(status)) return TaskStatus::Running;
        if (status == TaskStatus::Completed) ++completed;
        if (status == TaskStatus::Completed || status == TaskStatus::PartialSuccess) ++succeeded;
        if (status == TaskStatus::Cancelled) ++cancelled;
    }

    if (completed == subtasks.size()) return TaskStatus::Completed;
    if (succeeded > 0) return TaskStatus::PartialSuccess;
    if (cancelled == subtasks.size()) return TaskStatus::Cancelled;
    return TaskStatus::Failed;
}

double rollup_progress(const std::vector<TaskStatus>& subtasks) noexcept {
    if (subtasks.empty()) return 0.0;
    auto done = std::count_if(subtasks.begin(), subtasks.end(),
                              [](TaskStatus s) { return is_terminal(s); });
    return static_cast<double>(done) / static_cast<double>(subtasks.size()) * 100.0;
}

std::filesystem::path result_file_path(const std::filesystem::path& results_dir,
                                       const ModelSlug& model, int64_t app_number,
                                       const TaskId& task_id) {
    std::string safe_model = model;
    std::replace(safe_model.begin(), safe_model.end(), '/', '_');
    return results_dir / safe_model / ("app" + std::to_string(app_number)) / (task_id + ".json");
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

TaskOrchestrator::TaskOrchestrator(const OrchestratorConfig& config,
                                   const ServicesConfig& services, TaskStore& store,
                                   EndpointPool& pool, IWorkerClient& client, Logger& logger,
                                   MetricsCollector* metrics, ClockFn clock)
    : config_(config),
      dispatch_timeout_(std::chrono::seconds(services.dispatch_timeout_s)),
      store_(store),
      pool_(pool),
      client_(client),
      logger_(logger),
      metrics_(metrics),
      clock_(std::move(clock)),
      subtask_pool_(std::max<uint32_t>(config.subtask_workers, 1), "subtasks") {}

TaskOrchestrator::~TaskOrchestrator() {
    shutdown();
}

void TaskOrchestrator::shutdown() {
    subtask_pool_.shutdown();
}

// ─────────────────────────────────────────────
// Task creation
// ─────────────────────────────────────────────

Result<AnalysisTask> TaskOrchestrator::create_task(const AnalysisTarget& target,
                                                   const std::vector<ToolName>& tools) {
    if (tools.empty()) {
        return Error{"An analysis needs at least one tool", ErrorKind::InvalidArgument};
    }
    if (target.model.empty() || target.app_number <= 0) {
        return Error{"Analysis target needs a model and a positive app number",
                     ErrorKind::InvalidArgument};
    }

    std::vector<ToolName> unique_tools;
    std::set<ToolName> seen;
    std::map<ServiceType, std::vector<ToolName>> partitions;
    for (const auto& tool : tools) {
        if (tool.empty() || !seen.insert(tool).second) continue;
        unique_tools.push_back(tool);
        partitions[tool_to_service(tool)].push_back(tool);
    }
    if (unique_tools.empty()) {
        return Error{"An analysis needs at least one tool", ErrorKind::InvalidArgument};
    }

    const auto now = clock_();
    AnalysisTask main;
    main.task_id = make_id("task");
    main.is_main = true;
    main.target_model = target.model;
    main.target_app_number = target.app_number;
    main.tools = unique_tools;
    main.max_retries = config_.max_retries;
    main.created_at = now;
    if (partitions.size() == 1) main.service = partitions.begin()->first;

    std::vector<AnalysisTask> subtasks;
    if (partitions.size() > 1 || !config_.collapse_single_service) {
        for (ServiceType service : kAnalysisServices) {
            auto it = partitions.find(service);
            if (it == partitions.end()) continue;
            AnalysisTask sub;
            sub.task_id = make_id("task");
            sub.parent_task_id = main.task_id;
            sub.is_main = false;
            sub.service = service;
            sub.target_model = target.model;
            sub.target_app_number = target.app_number;
            sub.tools = it->second;
            sub.max_retries = config_.max_retries;
            sub.created_at = now;
            subtasks.push_back(std::move(sub));
        }
    }

    if (auto r = store_.insert_task_tree(main, subtasks); !r) return r.error();

    logger_.info(kCtx, "Created task " + main.task_id + " for " + target.model + "/app"
                           + std::to_string(target.app_number) + " with "
                           + std::to_string(subtasks.size()) + " subtask(s)");
    return main;
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

Result<AnalysisTask> TaskOrchestrator::execute(const TaskId& task_id) {
    auto main = store_.get(task_id);
    if (!main) return main.error();
    if (main->is_subtask()) {
        return Error{"Task " + task_id + " is a subtask", ErrorKind::InvalidArgument};
    }
    if (is_terminal(main->status)) return main;

    auto claimed = store_.mark_running(task_id);
    if (!claimed) return claimed.error();
    if (!*claimed) {
        return Error{"Task " + task_id + " is already executing", ErrorKind::InvalidArgument};
    }
    main->status = TaskStatus::Running;
    return run(*main);
}

Result<AnalysisTask> TaskOrchestrator::run_analysis(const AnalysisTarget& target,
                                                    const std::vector<ToolName>& tools) {
    auto task = create_task(target, tools);
    if (!task) return task.error();
    return execute(task->task_id);
}

Result<AnalysisTask> TaskOrchestrator::run(const AnalysisTask& main) {
    auto subs = store_.subtasks_of(main.task_id);
    if (!subs) return subs.error();

    if (subs->empty()) {
        dispatch(main);
        return finalize(main, *subs);
    }

    std::vector<std::future<void>> pending;
    try {
        for (const auto& sub : *subs) {
            if (sub.status != TaskStatus::Pending) continue;
            pending.push_back(subtask_pool_.submit([this, sub] { dispatch(sub); }));
        }
    } catch (const std::runtime_error& e) {
        for (auto& f : pending) f.wait();
        return Error{std::string{"Subtask pool unavailable: "} + e.what(), ErrorKind::Cancelled};
    }
    for (auto& f : pending) f.get();

    subs = store_.subtasks_of(main.task_id);
    if (!subs) return subs.error();
    return finalize(main, *subs);
}

void TaskOrchestrator::dispatch(const AnalysisTask& task) {
    if (task.is_subtask()) {
        auto claimed = store_.mark_running(task.task_id);
        if (!claimed) {
            logger_.error(kCtx, "Cannot start " + task.task_id + ": " + claimed.error().message);
            return;
        }
        if (!*claimed) {
            logger_.debug(kCtx, "Subtask " + task.task_id + " no longer pending, skipped");
            return;
        }
    }

    const ServiceType service = task.service.value_or(tool_to_service(task.tools.front()));
    const std::string service_name{to_string(service)};

    auto record = [&](TaskStatus status, const std::optional<std::string>& summary,
                      const std::optional<std::string>& error) {
        auto r = store_.finish(task.task_id, status, summary, error);
        if (!r) {
            logger_.error(kCtx, "Cannot record outcome of " + task.task_id + ": "
                                    + r.error().message);
        } else if (!*r) {
            logger_.info(kCtx, "Outcome of " + task.task_id + " dropped, task was cancelled");
        }
        if (error) logger_.warn(kCtx, task.task_id + " (" + service_name + "): " + *error);
        if (task.parent_task_id) refresh_rollup(*task.parent_task_id);
    };

    auto lease = pool_.lease(service);
    if (!lease) {
        record(TaskStatus::Failed, std::nullopt,
               "No healthy " + service_name + " endpoint available (capacity exhausted)");
        return;
    }
    const auto& url = lease->endpoint().url;

    AnalysisRequest request;
    request.task_id = task.task_id;
    request.service = service;
    request.target_model = task.target_model;
    request.target_app_number = task.target_app_number;
    request.tools = task.tools;

    logger_.debug(kCtx, "Dispatching " + task.task_id + " to " + url);
    const auto started = std::chrono::steady_clock::now();
    auto reply = client_.send(service, url, encode_analysis_request(request), dispatch_timeout_);
    const auto latency = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);

    if (!reply) {
        lease->report_failure();
        record(TaskStatus::Failed, std::nullopt,
               "Dispatch to " + url + " failed: " + reply.error().message);
        return;
    }

    auto response = decode_analysis_response(*reply);
    if (!response) {
        record(TaskStatus::Failed, std::nullopt,
               "Malformed reply from " + url + ": " + response.error().message);
        return;
    }

    switch (response->status) {
        case WorkerStatus::Timeout:
            lease->report_failure();
            record(TaskStatus::Failed, std::nullopt,
                   "Worker timed out: " + response->error.value_or("no detail"));
            break;
        case WorkerStatus::Error:
            lease->report_success(latency);
            record(TaskStatus::Failed, std::nullopt,
                   "Worker error: " + response->error.value_or("no detail"));
            break;
        case WorkerStatus::Success:
        case WorkerStatus::Partial:
            lease->report_success(latency);
            record(TaskStatus::Completed,
                   to_json_string(snapshot_to_json(make_snapshot(service, *response))),
                   std::nullopt);
            break;
    }
}

void TaskOrchestrator::refresh_rollup(const TaskId& main_id) {
    std::lock_guard lock(rollup_mutex_);
    auto subs = store_.subtasks_of(main_id);
    if (!subs) {
        logger_.error(kCtx, "Cannot read subtasks of " + main_id + ": " + subs.error().message);
        return;
    }
    std::vector<TaskStatus> statuses;
    statuses.reserve(subs->size());
    for (const auto& sub : *subs) statuses.push_back(sub.status);

    // The terminal rollup, with its result document, belongs to finalize().
    const auto status = rollup_status(statuses);
    if (is_terminal(status)) return;

    auto updated = store_.update_rollup(main_id, status, rollup_progress(statuses),
                                        std::nullopt, std::nullopt);
    if (!updated) {
        logger_.error(kCtx, "Cannot update progress of " + main_id + ": "
                                + updated.error().message);
    }
}

Result<AnalysisTask> TaskOrchestrator::finalize(const AnalysisTask& main,
                                                const std::vector<AnalysisTask>& subs) {
    std::vector<ServiceType> requested;
    std::vector<ServiceSnapshot> snapshots;
    std::vector<TaskStatus> statuses;
    std::string errors;

    auto collect = [&](const AnalysisTask& task) {
        if (task.service) requested.push_back(*task.service);
        statuses.push_back(task.status);
        if (task.status == TaskStatus::Completed && task.result_summary) {
            auto doc = parse_json(*task.result_summary);
            auto snap = doc ? snapshot_from_json(*doc) : Result<ServiceSnapshot>{doc.error()};
            if (snap) {
                snapshots.push_back(std::move(snap).value());
            } else {
                logger_.warn(kCtx, "Unreadable result of " + task.task_id + ": "
                                       + snap.error().message);
            }
        } else if (task.error_message) {
            if (!errors.empty()) errors += "; ";
            errors += (task.service ? std::string{to_string(*task.service)} : task.task_id)
                      + ": " + *task.error_message;
        }
    };

    TaskStatus status;
    double progress;
    if (subs.empty()) {
        auto current = store_.get(main.task_id);
        if (!current) return current.error();
        collect(*current);
        status = current->status;
        progress = is_terminal(status) ? 100.0 : 0.0;
    } else {
        for (const auto& sub : subs) collect(sub);
        status = rollup_status(statuses);
        progress = rollup_progress(statuses);
    }

    auto aggregated = aggregator_.aggregate(requested, snapshots);
    Json::Value doc = aggregated.to_json();
    doc["taskId"] = main.task_id;
    doc["targetModel"] = main.target_model;
    doc["targetAppNumber"] = static_cast<Json::Int64>(main.target_app_number);
    doc["status"] = std::string{to_string(status)};

    auto updated = store_.update_rollup(main.task_id, status, progress, to_json_string(doc),
                                        errors.empty() ? std::nullopt
                                                       : std::optional<std::string>{errors});
    if (!updated) return updated.error();
    if (!*updated) {
        logger_.info(kCtx, "Task " + main.task_id + " was cancelled, rollup not applied");
    } else if (is_terminal(status)) {
        write_result_file(main, doc);
        logger_.info(kCtx, "Task " + main.task_id + " " + std::string{to_string(status)} + " ("
                               + std::to_string(aggregated.total_findings()) + " findings)");
        if (metrics_ != nullptr) {
            const auto since = main.started_at.value_or(main.created_at);
            metrics_->record_task(main.task_id, status,
                                  std::chrono::duration_cast<Duration>(clock_() - since));
        }
    }
    return store_.get(main.task_id);
}

void TaskOrchestrator::write_result_file(const AnalysisTask& main, const Json::Value& doc) {
    const auto path = result_file_path(config_.results_dir, main.target_model,
                                       main.target_app_number, main.task_id);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        logger_.error(kCtx, "Cannot create " + path.parent_path().string() + ": " + ec.message());
        return;
    }
    std::ofstream out(path, std::ios::trunc);
    out << to_pretty_json(doc) << '\n';
    if (!out) {
        logger_.error(kCtx, "Cannot write " + path.string());
    }
}

// ─────────────────────────────────────────────
// Retry / Cancel
// ─────────────────────────────────────────────

Result<AnalysisTask> TaskOrchestrator::retry(const TaskId& task_id) {
    auto main = store_.get(task_id);
    if (!main) return main.error();
    if (main->is_subtask()) {
        return Error{"Task " + task_id + " is a subtask", ErrorKind::InvalidArgument};
    }
    if (main->status != TaskStatus::Failed && main->status != TaskStatus::PartialSuccess) {
        return Error{"Task " + task_id + " is " + std::string{to_string(main->status)}
                         + ", only failed or partially successful tasks can be retried",
                     ErrorKind::InvalidArgument};
    }
    if (main->retry_count >= main->max_retries) {
        return Error{"Task " + task_id + " has used all " + std::to_string(main->max_retries)
                         + " retries", ErrorKind::InvalidArgument};
    }

    auto begun = store_.begin_retry(task_id);
    if (!begun) return begun.error();
    if (!*begun) {
        return Error{"Task " + task_id + " changed state before the retry started",
                     ErrorKind::InvalidArgument};
    }

    auto subs = store_.subtasks_of(task_id);
    if (!subs) return subs.error();
    for (const auto& sub : *subs) {
        if (sub.status != TaskStatus::Failed && sub.status != TaskStatus::Cancelled) continue;
        if (auto r = store_.reset_for_retry(sub.task_id); !r) return r.error();
    }

    auto refreshed = store_.get(task_id);
    if (!refreshed) return refreshed.error();
    logger_.info(kCtx, "Retrying task " + task_id + " (attempt "
                           + std::to_string(refreshed->retry_count) + "/"
                           + std::to_string(refreshed->max_retries) + ")");
    return run(*refreshed);
}

Result<AnalysisTask> TaskOrchestrator::cancel(const TaskId& task_id) {
    auto main = store_.get(task_id);
    if (!main) return main.error();
    if (main->is_subtask()) {
        return Error{"Task " + task_id + " is a subtask", ErrorKind::InvalidArgument};
    }
    if (is_terminal(main->status)) return main;

    auto subs = store_.subtasks_of(task_id);
    if (!subs) return subs.error();
    for (const auto& sub : *subs) {
        auto r = store_.cancel(sub.task_id, {TaskStatus::Pending}, "Parent task cancelled");
        if (!r) return r.error();
    }
    auto r = store_.cancel(task_id, {TaskStatus::Pending, TaskStatus::Running},
                           "Cancelled by request");
    if (!r) return r.error();
    if (*r && metrics_ != nullptr) {
        metrics_->record_task(task_id, TaskStatus::Cancelled,
                              std::chrono::duration_cast<Duration>(clock_() - main->created_at));
    }
    return store_.get(task_id);
}

}  // namespace analyzer_orchestrator
