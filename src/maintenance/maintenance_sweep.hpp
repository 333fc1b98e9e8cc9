/**
 * @file maintenance_sweep.hpp
 * @brief Periodic reclamation of stuck and orphaned analysis tasks.
 * @author AnalyzerOrchestrator Team
 *
 * A task is reclaimed only when it is older than both its status timeout
 * and the grace period, so work created shortly before a restart survives
 * the startup sweep. Reclaimed tasks are cancelled with an explanation;
 * rows and result files are never deleted.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "store/reservation_store.hpp"
#include "store/task_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace analyzer_orchestrator {

struct SweepReport {
    size_t reclaimed_running = 0;
    size_t reclaimed_pending = 0;
    size_t reclaimed_orphans = 0;
    std::vector<TaskId> reclaimed;
    std::vector<std::string> errors;
    Timestamp started_at{};
    Duration duration{0};

    [[nodiscard]] size_t total() const noexcept {
        return reclaimed_running + reclaimed_pending + reclaimed_orphans;
    }
};

struct SweepStats {
    uint64_t runs = 0;
    uint64_t reclaimed_running = 0;
    uint64_t reclaimed_pending = 0;
    uint64_t reclaimed_orphans = 0;
    uint64_t errors = 0;
    std::optional<Timestamp> last_run;
};

class MaintenanceSweep {
public:
    MaintenanceSweep(const MaintenanceConfig& config, TaskStore& tasks,
                     ReservationStore& reservations, Logger& logger,
                     MetricsCollector* metrics = nullptr, ClockFn clock = system_clock_fn());
    ~MaintenanceSweep();

    MaintenanceSweep(const MaintenanceSweep&) = delete;
    MaintenanceSweep& operator=(const MaintenanceSweep&) = delete;

    /// One reconciliation pass. Safe to call while another pass is running.
    SweepReport run_once();

    /// Sweep on startup if configured, then every interval until stop().
    void start();
    void stop();

    [[nodiscard]] SweepStats stats() const;

private:
    void sweep_loop(std::stop_token stop);
    void reclaim_stuck(TaskStatus status, Duration timeout, Timestamp now, SweepReport& report);
    void reclaim_orphans(Timestamp now, SweepReport& report);

    MaintenanceConfig config_;
    TaskStore& tasks_;
    ReservationStore& reservations_;
    Logger& logger_;
    MetricsCollector* metrics_;
    ClockFn clock_;

    mutable std::mutex stats_mutex_;
    SweepStats stats_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    std::jthread sweep_thread_;
};

}  // namespace analyzer_orchestrator
