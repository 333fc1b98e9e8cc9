/**
 * @file endpoint_pool.cpp
 * @brief EndpointPool implementation.
 * @author AnalyzerOrchestrator Team
 */

#include "pool/endpoint_pool.hpp"

#include "network/ws_connection.hpp"

#include <mutex>
#include <utility>

namespace analyzer_orchestrator {

namespace {

constexpr const char* kCtx = "POOL";

}  // namespace

// ─────────────────────────────────────────────
// EndpointLease
// ─────────────────────────────────────────────

EndpointLease::~EndpointLease() {
    if (pool_ != nullptr) pool_->release(endpoint_.id);
}

EndpointLease::EndpointLease(EndpointLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)), endpoint_(std::move(other.endpoint_)) {}

void EndpointLease::report_success(Duration latency) {
    if (pool_ != nullptr) pool_->report_success(endpoint_.id, latency);
}

void EndpointLease::report_failure() {
    if (pool_ != nullptr) pool_->report_failure(endpoint_.id);
}

// ─────────────────────────────────────────────
// Construction / Lifecycle
// ─────────────────────────────────────────────

EndpointPool::EndpointPool(const PoolConfig& config, IWorkerClient& client, Logger& logger,
                           MetricsCollector* metrics, ClockFn clock)
    : config_(config),
      client_(client),
      logger_(logger),
      metrics_(metrics),
      clock_(std::move(clock)) {
    auto strategy = parse_selection_strategy(config_.strategy);
    if (!strategy) {
        logger_.warn(kCtx, "Unknown selection strategy '" + config_.strategy
                               + "', using round_robin");
    }
    strategy_ = make_selection_strategy(strategy.value_or(SelectionStrategy::RoundRobin),
                                        config_.random_seed);
}

EndpointPool::~EndpointPool() {
    shutdown();
}

Result<void> EndpointPool::initialize(const ServicesConfig& services) {
    std::unique_lock lock(mutex_);
    if (initialized_) {
        return Error{"Endpoint pool already initialized", ErrorKind::InvalidArgument};
    }

    for (ServiceType service : kAllServices) {
        auto& ids = by_service_[service];
        for (const auto& url : services.urls(service)) {
            if (auto parsed = parse_ws_url(url); !parsed) return parsed.error();
            Slot slot;
            slot.info.id = slots_.size();
            slot.info.service = service;
            slot.info.url = url;
            slot.info.index = ids.size();
            ids.push_back(slot.info.id);
            slots_.push_back(std::move(slot));
        }
    }
    initialized_ = true;

    for (ServiceType service : kAllServices) {
        logger_.info(kCtx, std::string{to_string(service)} + ": "
                               + std::to_string(by_service_[service].size()) + " endpoint(s)");
    }
    return {};
}

void EndpointPool::start_health_checks() {
    if (config_.health_check_interval_s == 0 || health_thread_.joinable()) return;
    health_thread_ = std::jthread([this](std::stop_token stop) { health_loop(stop); });
    logger_.info(kCtx, "Health checks every " + std::to_string(config_.health_check_interval_s)
                           + "s");
}

void EndpointPool::shutdown() {
    if (health_thread_.joinable()) {
        health_thread_.request_stop();
        wake_cv_.notify_all();
        health_thread_.join();
    }
}

void EndpointPool::health_loop(std::stop_token stop) {
    const auto interval = std::chrono::seconds(config_.health_check_interval_s);
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;
        run_health_checks();
    }
}

// ─────────────────────────────────────────────
// Selection
// ─────────────────────────────────────────────

std::optional<Endpoint> EndpointPool::select(ServiceType service) {
    auto id = choose(service, false);
    if (!id) return std::nullopt;
    std::shared_lock lock(mutex_);
    return slots_[*id].info;
}

std::optional<EndpointLease> EndpointPool::lease(ServiceType service) {
    auto id = choose(service, true);
    if (!id) return std::nullopt;
    Endpoint snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot = slots_[*id].info;
    }
    return std::optional<EndpointLease>{std::in_place, this, std::move(snapshot)};
}

std::optional<EndpointId> EndpointPool::choose(ServiceType service, bool reserve) {
    const auto cooldown = std::chrono::seconds(config_.cooldown_s);
    std::vector<EndpointId> stale;
    {
        std::unique_lock lock(mutex_);
        auto it = by_service_.find(service);
        if (it == by_service_.end() || it->second.empty()) return std::nullopt;

        const auto now = clock_();
        for (EndpointId id : it->second) {
            auto& slot = slots_[id];
            if (slot.info.is_healthy || slot.probing) continue;
            const bool cooled = !slot.info.last_health_check
                                || now - *slot.info.last_health_check > cooldown;
            if (cooled) {
                slot.probing = true;
                stale.push_back(id);
            }
        }
    }

    // Resurrection probes happen without holding the lock.
    std::vector<std::pair<EndpointId, bool>> outcomes;
    outcomes.reserve(stale.size());
    for (EndpointId id : stale) {
        std::string url;
        {
            std::shared_lock lock(mutex_);
            url = slots_[id].info.url;
        }
        bool ok = client_.probe(service, url, Duration{config_.probe_timeout_ms});
        outcomes.emplace_back(id, ok);
    }

    std::unique_lock lock(mutex_);
    const auto now = clock_();
    for (auto [id, ok] : outcomes) {
        auto& slot = slots_[id];
        slot.probing = false;
        if (ok) {
            mark_healthy(slot, now);
        } else {
            slot.info.last_health_check = now;
            logger_.debug(kCtx, "Resurrection probe failed for " + slot.info.url);
        }
    }

    std::vector<Candidate> candidates;
    std::vector<EndpointId> candidate_ids;
    for (EndpointId id : by_service_[service]) {
        const auto& info = slots_[id].info;
        if (!info.is_healthy) continue;
        candidates.push_back(Candidate{info.index, info.in_flight});
        candidate_ids.push_back(id);
    }
    if (candidates.empty()) {
        logger_.debug(kCtx, "No available endpoint for " + std::string{to_string(service)});
        return std::nullopt;
    }

    EndpointId chosen = candidate_ids[strategy_->choose(service, candidates)];
    if (reserve) {
        auto& info = slots_[chosen].info;
        ++info.in_flight;
        ++info.total_requests;
    }
    return chosen;
}

void EndpointPool::release(EndpointId id) {
    std::unique_lock lock(mutex_);
    if (id >= slots_.size()) return;
    auto& info = slots_[id].info;
    if (info.in_flight > 0) --info.in_flight;
}

// ─────────────────────────────────────────────
// Outcome reporting
// ─────────────────────────────────────────────

void EndpointPool::report_failure(EndpointId id) {
    std::unique_lock lock(mutex_);
    if (id >= slots_.size()) return;
    auto& slot = slots_[id];
    ++slot.info.total_failures;
    ++slot.info.consecutive_failures;
    if (slot.info.is_healthy) {
        mark_unhealthy(slot, clock_());
    }
}

void EndpointPool::report_success(EndpointId id, Duration latency) {
    std::unique_lock lock(mutex_);
    if (id >= slots_.size()) return;
    auto& slot = slots_[id];
    slot.info.consecutive_failures = 0;

    const double sample = static_cast<double>(latency.count());
    slot.info.avg_latency_ms = slot.info.avg_latency_ms == 0.0
                                   ? sample
                                   : 0.8 * slot.info.avg_latency_ms + 0.2 * sample;
    if (!slot.info.is_healthy) mark_healthy(slot, clock_());
}

void EndpointPool::mark_unhealthy(Slot& slot, Timestamp now) {
    slot.info.is_healthy = false;
    slot.info.last_health_check = now;
    logger_.warn(kCtx, "Endpoint " + slot.info.url + " marked unhealthy");
    if (metrics_ != nullptr) {
        metrics_->record_endpoint_event(slot.info.service, slot.info.url, "endpoint_unhealthy");
    }
}

void EndpointPool::mark_healthy(Slot& slot, Timestamp now) {
    const bool was_unhealthy = !slot.info.is_healthy;
    slot.info.is_healthy = true;
    slot.info.consecutive_failures = 0;
    slot.info.last_health_check = now;
    if (was_unhealthy) {
        logger_.info(kCtx, "Endpoint " + slot.info.url + " resurrected");
        if (metrics_ != nullptr) {
            metrics_->record_endpoint_event(slot.info.service, slot.info.url,
                                            "endpoint_resurrected");
        }
    }
}

void EndpointPool::run_health_checks() {
    std::vector<std::pair<EndpointId, Endpoint>> targets;
    {
        std::unique_lock lock(mutex_);
        for (auto& slot : slots_) {
            if (slot.probing) continue;
            slot.probing = true;
            targets.emplace_back(slot.info.id, slot.info);
        }
    }

    for (const auto& [id, snapshot] : targets) {
        bool ok = client_.probe(snapshot.service, snapshot.url,
                                Duration{config_.probe_timeout_ms});

        std::unique_lock lock(mutex_);
        auto& slot = slots_[id];
        slot.probing = false;
        const auto now = clock_();
        if (ok) {
            mark_healthy(slot, now);
            continue;
        }
        ++slot.info.consecutive_failures;
        slot.info.last_health_check = now;
        if (slot.info.is_healthy
            && slot.info.consecutive_failures >= config_.max_consecutive_failures) {
            mark_unhealthy(slot, now);
        }
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<Endpoint> EndpointPool::endpoints(ServiceType service) const {
    std::shared_lock lock(mutex_);
    std::vector<Endpoint> out;
    auto it = by_service_.find(service);
    if (it == by_service_.end()) return out;
    for (EndpointId id : it->second) out.push_back(slots_[id].info);
    return out;
}

std::optional<Endpoint> EndpointPool::endpoint(EndpointId id) const {
    std::shared_lock lock(mutex_);
    if (id >= slots_.size()) return std::nullopt;
    return slots_[id].info;
}

std::vector<ServiceStats> EndpointPool::stats() const {
    std::shared_lock lock(mutex_);
    std::vector<ServiceStats> out;
    for (const auto& [service, ids] : by_service_) {
        ServiceStats s;
        s.service = service;
        s.endpoints = ids.size();
        for (EndpointId id : ids) {
            const auto& info = slots_[id].info;
            if (info.is_healthy) ++s.healthy;
            s.in_flight += info.in_flight;
        }
        out.push_back(s);
    }
    return out;
}

std::string_view EndpointPool::strategy_name() const noexcept {
    return strategy_->name();
}

}  // namespace analyzer_orchestrator
