/**
 * @file endpoint_pool.hpp
 * @brief Per-service worker endpoints with health tracking and resurrection.
 * @author AnalyzerOrchestrator Team
 *
 * Selection rules for one service:
 *  - a healthy endpoint is a candidate;
 *  - an unhealthy endpoint whose last health check is older than the
 *    cooldown is probed synchronously (outside the pool lock) and becomes a
 *    candidate if the probe succeeds;
 *  - any other endpoint is skipped.
 * With no candidate, select() returns nothing. Endpoints are never removed.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/worker_client.hpp"
#include "pool/selection_strategy.hpp"
#include "telemetry/metrics_collector.hpp"

#include <condition_variable>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace analyzer_orchestrator {

struct Endpoint {
    EndpointId id = 0;          ///< Pool-wide registration index
    ServiceType service = ServiceType::StaticAnalyzer;
    std::string url;
    size_t index = 0;           ///< Registration index within the service
    bool is_healthy = true;
    std::optional<Timestamp> last_health_check;
    uint32_t in_flight = 0;
    uint64_t total_requests = 0;
    uint64_t total_failures = 0;
    uint32_t consecutive_failures = 0;
    double avg_latency_ms = 0.0;
};

struct ServiceStats {
    ServiceType service = ServiceType::StaticAnalyzer;
    size_t endpoints = 0;
    size_t healthy = 0;
    uint32_t in_flight = 0;
};

class EndpointPool;

/**
 * @brief Holds one in-flight slot on an endpoint for the duration of a dispatch.
 */
class EndpointLease {
public:
    EndpointLease(EndpointPool* pool, Endpoint endpoint) noexcept
        : pool_(pool), endpoint_(std::move(endpoint)) {}
    ~EndpointLease();

    EndpointLease(EndpointLease&& other) noexcept;
    EndpointLease& operator=(EndpointLease&&) = delete;
    EndpointLease(const EndpointLease&) = delete;
    EndpointLease& operator=(const EndpointLease&) = delete;

    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }

    void report_success(Duration latency);
    void report_failure();

private:
    EndpointPool* pool_;
    Endpoint endpoint_;
};

class EndpointPool {
public:
    EndpointPool(const PoolConfig& config, IWorkerClient& client, Logger& logger,
                 MetricsCollector* metrics = nullptr, ClockFn clock = system_clock_fn());
    ~EndpointPool();

    EndpointPool(const EndpointPool&) = delete;
    EndpointPool& operator=(const EndpointPool&) = delete;

    /// Register endpoints in configuration order. May be called once.
    Result<void> initialize(const ServicesConfig& services);

    /// Launch the background probe loop (no-op when the interval is 0).
    void start_health_checks();

    /// Stop background probing. Endpoint state is kept.
    void shutdown();

    /// Pick an endpoint for the service, or nothing if none is available.
    std::optional<Endpoint> select(ServiceType service);

    /// select() plus an in-flight reservation released when the lease dies.
    std::optional<EndpointLease> lease(ServiceType service);

    /// Passive failure reported after a dispatch error.
    void report_failure(EndpointId id);
    void report_success(EndpointId id, Duration latency);

    /// One round of active probes over every endpoint.
    void run_health_checks();

    [[nodiscard]] std::vector<Endpoint> endpoints(ServiceType service) const;
    [[nodiscard]] std::optional<Endpoint> endpoint(EndpointId id) const;
    [[nodiscard]] std::vector<ServiceStats> stats() const;
    [[nodiscard]] std::string_view strategy_name() const noexcept;

private:
    friend class EndpointLease;

    struct Slot {
        Endpoint info;
        bool probing = false;
    };

    std::optional<EndpointId> choose(ServiceType service, bool reserve);
    void release(EndpointId id);
    void mark_unhealthy(Slot& slot, Timestamp now);
    void mark_healthy(Slot& slot, Timestamp now);
    void health_loop(std::stop_token stop);

    PoolConfig config_;
    IWorkerClient& client_;
    Logger& logger_;
    MetricsCollector* metrics_;
    ClockFn clock_;
    std::unique_ptr<ISelectionStrategy> strategy_;

    mutable std::shared_mutex mutex_;
    std::vector<Slot> slots_;
    std::map<ServiceType, std::vector<EndpointId>> by_service_;
    bool initialized_ = false;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    std::jthread health_thread_;
};

}  // namespace analyzer_orchestrator
