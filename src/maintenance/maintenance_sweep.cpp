/**
 * @file maintenance_sweep.cpp
 * @brief MaintenanceSweep implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "maintenance/maintenance_sweep.hpp"

#include <algorithm>

namespace analyzer_orchestrator {

namespace {

constexpr const char* kCtx = "SWEEP";

std::string age_text(Duration d) {
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(d).count();
    if (minutes >= 120) return std::to_string(minutes / 60) + "h";
    return std::to_string(minutes) + "m";
}

}  // namespace

MaintenanceSweep::MaintenanceSweep(const MaintenanceConfig& config, TaskStore& tasks,
                                   ReservationStore& reservations, Logger& logger,
                                   MetricsCollector* metrics, ClockFn clock)
    : config_(config),
      tasks_(tasks),
      reservations_(reservations),
      logger_(logger),
      metrics_(metrics),
      clock_(std::move(clock)) {}

MaintenanceSweep::~MaintenanceSweep() {
    stop();
}

// ─────────────────────────────────────────────
// Single pass
// ─────────────────────────────────────────────

SweepReport MaintenanceSweep::run_once() {
    SweepReport report;
    const auto started = std::chrono::steady_clock::now();
    const Timestamp now = clock_();
    report.started_at = now;

    reclaim_stuck(TaskStatus::Running, std::chrono::seconds(config_.running_timeout_s), now,
                  report);
    reclaim_stuck(TaskStatus::Pending, std::chrono::seconds(config_.pending_timeout_s), now,
                  report);
    reclaim_orphans(now, report);

    report.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);

    {
        std::lock_guard lock(stats_mutex_);
        ++stats_.runs;
        stats_.reclaimed_running += report.reclaimed_running;
        stats_.reclaimed_pending += report.reclaimed_pending;
        stats_.reclaimed_orphans += report.reclaimed_orphans;
        stats_.errors += report.errors.size();
        stats_.last_run = now;
    }

    if (report.total() > 0 || !report.errors.empty()) {
        logger_.info(kCtx, "Reclaimed " + std::to_string(report.reclaimed_running) + " running, "
                               + std::to_string(report.reclaimed_pending) + " pending, "
                               + std::to_string(report.reclaimed_orphans) + " orphaned task(s); "
                               + std::to_string(report.errors.size()) + " error(s)");
    } else {
        logger_.debug(kCtx, "Nothing to reclaim");
    }
    if (metrics_ != nullptr) {
        metrics_->record_sweep(report.reclaimed_running, report.reclaimed_pending,
                               report.reclaimed_orphans, report.duration);
    }
    return report;
}

void MaintenanceSweep::reclaim_stuck(TaskStatus status, Duration timeout, Timestamp now,
                                     SweepReport& report) {
    const Duration grace = std::chrono::seconds(config_.grace_period_s);
    // Both thresholds must have passed; the larger one decides.
    const Timestamp cutoff = now - std::max(timeout, grace);

    auto stuck = tasks_.stuck_since(status, cutoff);
    if (!stuck) {
        report.errors.push_back(stuck.error().message);
        logger_.error(kCtx, "Cannot list " + std::string{to_string(status)}
                                + " tasks: " + stuck.error().message);
        return;
    }

    for (const auto& task : *stuck) {
        const Timestamp since = (status == TaskStatus::Running && task.started_at)
                                    ? *task.started_at
                                    : task.created_at;
        const std::string reason = "Reclaimed by maintenance: " + std::string{to_string(status)}
                                   + " for " + age_text(std::chrono::duration_cast<Duration>(
                                                   now - since))
                                   + ", limit " + age_text(timeout);

        auto changed = tasks_.cancel(task.task_id, {status}, reason);
        if (!changed) {
            report.errors.push_back(changed.error().message);
            logger_.error(kCtx, "Cannot reclaim " + task.task_id + ": " + changed.error().message);
            continue;
        }
        // Another sweep or the task itself moved it first.
        if (!*changed) continue;

        if (status == TaskStatus::Running) {
            ++report.reclaimed_running;
        } else {
            ++report.reclaimed_pending;
        }
        report.reclaimed.push_back(task.task_id);
        logger_.warn(kCtx, task.task_id + ": " + reason);
    }
}

void MaintenanceSweep::reclaim_orphans(Timestamp now, SweepReport& report) {
    const Timestamp cutoff = now - std::chrono::seconds(config_.grace_period_s);
    auto active = tasks_.active_created_before(cutoff);
    if (!active) {
        report.errors.push_back(active.error().message);
        logger_.error(kCtx, "Cannot list active tasks: " + active.error().message);
        return;
    }

    for (const auto& task : *active) {
        auto present = reservations_.exists(task.target_model, task.target_app_number);
        if (!present) {
            report.errors.push_back(present.error().message);
            continue;
        }
        if (*present) continue;

        const std::string reason = "Reclaimed by maintenance: application "
                                   + task.target_model + "/app"
                                   + std::to_string(task.target_app_number) + " does not exist";
        auto changed = tasks_.cancel(task.task_id, {TaskStatus::Pending, TaskStatus::Running},
                                     reason);
        if (!changed) {
            report.errors.push_back(changed.error().message);
            logger_.error(kCtx, "Cannot reclaim " + task.task_id + ": " + changed.error().message);
            continue;
        }
        if (!*changed) continue;

        ++report.reclaimed_orphans;
        report.reclaimed.push_back(task.task_id);
        logger_.warn(kCtx, task.task_id + ": " + reason);
    }
}

// ─────────────────────────────────────────────
// Schedule
// ─────────────────────────────────────────────

void MaintenanceSweep::start() {
    if (sweep_thread_.joinable()) return;
    sweep_thread_ = std::jthread([this](std::stop_token stop) { sweep_loop(stop); });
    logger_.info(kCtx, "Sweeping every " + std::to_string(config_.interval_s) + "s (running "
                           + std::to_string(config_.running_timeout_s) + "s, pending "
                           + std::to_string(config_.pending_timeout_s) + "s, grace "
                           + std::to_string(config_.grace_period_s) + "s)");
}

void MaintenanceSweep::stop() {
    if (sweep_thread_.joinable()) {
        sweep_thread_.request_stop();
        wake_cv_.notify_all();
        sweep_thread_.join();
    }
}

void MaintenanceSweep::sweep_loop(std::stop_token stop) {
    if (config_.run_on_startup) run_once();

    const auto interval = std::chrono::seconds(std::max<uint32_t>(config_.interval_s, 1));
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;
        run_once();
    }
}

SweepStats MaintenanceSweep::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

}  // namespace analyzer_orchestrator
