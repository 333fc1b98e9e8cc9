/**
 * @file test_endpoint_pool.cpp
 * @brief Unit tests for selection strategies and EndpointPool health tracking.
 * @author AnalyzerOrchestrator Team
 */

#include "core/clock.hpp"
#include "pool/endpoint_pool.hpp"
#include "pool/selection_strategy.hpp"

#include "support/fake_worker_client.hpp"
#include "support/test_env.hpp"

#include <gtest/gtest.h>

#include <map>
#include <set>

using namespace analyzer_orchestrator;
using analyzer_orchestrator::testing::CapturedLogger;
using analyzer_orchestrator::testing::FakeWorkerClient;

namespace {

const std::vector<std::string> kUrls{"ws://sa-1:2001", "ws://sa-2:2001", "ws://sa-3:2001"};

ServicesConfig three_static_endpoints() {
    ServicesConfig services;
    services.endpoints[ServiceType::StaticAnalyzer] = kUrls;
    return services;
}

}  // namespace

// ═══════════════════════════════════════════════
// Selection strategies
// ═══════════════════════════════════════════════

TEST(SelectionStrategyTest, RoundRobinSkipsMissingCandidates) {
    RoundRobinStrategy rr;
    std::vector<Candidate> all{{0, 0}, {1, 0}, {2, 0}};
    EXPECT_EQ(rr.choose(ServiceType::StaticAnalyzer, all), 0u);
    EXPECT_EQ(rr.choose(ServiceType::StaticAnalyzer, all), 1u);

    // Endpoint 2 is gone; rotation wraps to the first candidate.
    std::vector<Candidate> without_last{{0, 0}, {1, 0}};
    EXPECT_EQ(rr.choose(ServiceType::StaticAnalyzer, without_last), 0u);
    EXPECT_EQ(rr.choose(ServiceType::StaticAnalyzer, all), 1u);
}

TEST(SelectionStrategyTest, RoundRobinTracksServicesSeparately) {
    RoundRobinStrategy rr;
    std::vector<Candidate> two{{0, 0}, {1, 0}};
    EXPECT_EQ(rr.choose(ServiceType::StaticAnalyzer, two), 0u);
    EXPECT_EQ(rr.choose(ServiceType::AiAnalyzer, two), 0u);
    EXPECT_EQ(rr.choose(ServiceType::StaticAnalyzer, two), 1u);
}

TEST(SelectionStrategyTest, LeastInFlightPrefersLowestIndexOnTie) {
    LeastInFlightStrategy lif;
    EXPECT_EQ(lif.choose(ServiceType::StaticAnalyzer, {{0, 2}, {1, 1}, {2, 1}}), 1u);
    EXPECT_EQ(lif.choose(ServiceType::StaticAnalyzer, {{0, 0}, {1, 0}}), 0u);
}

TEST(SelectionStrategyTest, RandomIsSeededAndInRange) {
    RandomStrategy a(42);
    RandomStrategy b(42);
    std::vector<Candidate> three{{0, 0}, {1, 0}, {2, 0}};
    for (int i = 0; i < 50; ++i) {
        auto pick = a.choose(ServiceType::StaticAnalyzer, three);
        EXPECT_LT(pick, 3u);
        EXPECT_EQ(pick, b.choose(ServiceType::StaticAnalyzer, three));
    }
    EXPECT_EQ(make_selection_strategy(SelectionStrategy::Random, 1)->name(), "random");
}

// ═══════════════════════════════════════════════
// EndpointPool
// ═══════════════════════════════════════════════

class EndpointPoolTest : public ::testing::Test {
protected:
    CapturedLogger log_;
    FakeWorkerClient client_;
    ManualClock clock_;
    PoolConfig config_;
    std::unique_ptr<EndpointPool> pool_;

    void SetUp() override {
        config_.cooldown_s = 60;
        config_.max_consecutive_failures = 3;
        config_.health_check_interval_s = 0;
    }

    void make_pool(const std::string& strategy = "round_robin") {
        config_.strategy = strategy;
        pool_ = std::make_unique<EndpointPool>(config_, client_, log_.logger, nullptr,
                                               clock_.fn());
        ASSERT_TRUE(pool_->initialize(three_static_endpoints()).has_value());
    }
};

TEST_F(EndpointPoolTest, RoundRobinAcrossHealthyEndpoints) {
    make_pool();
    std::vector<std::string> picked;
    for (int i = 0; i < 6; ++i) picked.push_back(pool_->select(ServiceType::StaticAnalyzer)->url);
    EXPECT_EQ(picked, (std::vector<std::string>{kUrls[0], kUrls[1], kUrls[2],
                                                kUrls[0], kUrls[1], kUrls[2]}));
}

TEST_F(EndpointPoolTest, ServiceWithoutEndpointsHasNoSelection) {
    make_pool();
    EXPECT_FALSE(pool_->select(ServiceType::AiAnalyzer).has_value());
    EXPECT_FALSE(pool_->lease(ServiceType::Generation).has_value());
}

TEST_F(EndpointPoolTest, FailedEndpointIsSkippedDuringCooldown) {
    make_pool();
    auto first = pool_->select(ServiceType::StaticAnalyzer);
    ASSERT_TRUE(first.has_value());
    pool_->report_failure(first->id);

    auto state = pool_->endpoint(first->id);
    EXPECT_FALSE(state->is_healthy);
    EXPECT_EQ(state->total_failures, 1u);

    clock_.advance(std::chrono::seconds(30));
    for (int i = 0; i < 6; ++i) {
        EXPECT_NE(pool_->select(ServiceType::StaticAnalyzer)->url, first->url);
    }
    EXPECT_EQ(client_.probes(first->url), 0);
}

TEST_F(EndpointPoolTest, ResurrectsAfterCooldownWhenProbeSucceeds) {
    make_pool();
    for (const auto& ep : pool_->endpoints(ServiceType::StaticAnalyzer)) {
        pool_->report_failure(ep.id);
    }
    EXPECT_FALSE(pool_->select(ServiceType::StaticAnalyzer).has_value());

    client_.set_probe_result(kUrls[0], false);
    clock_.advance(std::chrono::seconds(61));

    auto chosen = pool_->select(ServiceType::StaticAnalyzer);
    ASSERT_TRUE(chosen.has_value());
    EXPECT_NE(chosen->url, kUrls[0]);
    EXPECT_EQ(client_.probes(kUrls[0]), 1);
    EXPECT_EQ(client_.probes(kUrls[1]), 1);
    EXPECT_TRUE(log_.contains("resurrected"));

    // The failed probe restarted the cooldown for endpoint 0.
    auto first = pool_->endpoints(ServiceType::StaticAnalyzer).front();
    EXPECT_FALSE(first.is_healthy);
    EXPECT_EQ(first.last_health_check, clock_.now());
    (void)pool_->select(ServiceType::StaticAnalyzer);
    EXPECT_EQ(client_.probes(kUrls[0]), 1);
}

TEST_F(EndpointPoolTest, AllUnhealthyWithinCooldownYieldsNothing) {
    make_pool();
    for (const auto& ep : pool_->endpoints(ServiceType::StaticAnalyzer)) {
        pool_->report_failure(ep.id);
    }
    clock_.advance(std::chrono::seconds(59));
    EXPECT_FALSE(pool_->select(ServiceType::StaticAnalyzer).has_value());
    for (const auto& url : kUrls) EXPECT_EQ(client_.probes(url), 0);
}

TEST_F(EndpointPoolTest, SuccessReportRestoresHealth) {
    make_pool();
    pool_->report_failure(0);
    pool_->report_success(0, Duration{100});
    auto ep = pool_->endpoint(0);
    EXPECT_TRUE(ep->is_healthy);
    EXPECT_EQ(ep->consecutive_failures, 0u);
    EXPECT_DOUBLE_EQ(ep->avg_latency_ms, 100.0);
}

TEST_F(EndpointPoolTest, LeaseTracksInFlight) {
    make_pool("least_in_flight");
    {
        auto a = pool_->lease(ServiceType::StaticAnalyzer);
        auto b = pool_->lease(ServiceType::StaticAnalyzer);
        ASSERT_TRUE(a && b);
        EXPECT_NE(a->endpoint().id, b->endpoint().id);
        EXPECT_EQ(pool_->endpoint(a->endpoint().id)->in_flight, 1u);

        auto c = pool_->lease(ServiceType::StaticAnalyzer);
        EXPECT_EQ(c->endpoint().url, kUrls[2]);
        auto stats = pool_->stats();
        for (const auto& s : stats) {
            if (s.service == ServiceType::StaticAnalyzer) EXPECT_EQ(s.in_flight, 3u);
        }
    }
    for (const auto& ep : pool_->endpoints(ServiceType::StaticAnalyzer)) {
        EXPECT_EQ(ep.in_flight, 0u);
        EXPECT_EQ(ep.total_requests, 1u);
    }
}

TEST_F(EndpointPoolTest, BackgroundProbesNeedConsecutiveFailures) {
    make_pool();
    client_.set_probe_result(kUrls[1], false);

    pool_->run_health_checks();
    pool_->run_health_checks();
    EXPECT_TRUE(pool_->endpoint(1)->is_healthy);
    EXPECT_EQ(pool_->endpoint(1)->consecutive_failures, 2u);

    pool_->run_health_checks();
    EXPECT_FALSE(pool_->endpoint(1)->is_healthy);

    client_.set_probe_result(kUrls[1], true);
    pool_->run_health_checks();
    EXPECT_TRUE(pool_->endpoint(1)->is_healthy);
}

TEST_F(EndpointPoolTest, InitializeRejectsBadUrlsAndSecondCall) {
    EndpointPool pool(config_, client_, log_.logger, nullptr, clock_.fn());
    ServicesConfig bad;
    bad.endpoints[ServiceType::AiAnalyzer] = {"http://not-a-websocket"};
    EXPECT_FALSE(pool.initialize(bad).has_value());

    EndpointPool ok(config_, client_, log_.logger, nullptr, clock_.fn());
    ASSERT_TRUE(ok.initialize(three_static_endpoints()).has_value());
    EXPECT_EQ(ok.initialize(three_static_endpoints()).error().kind, ErrorKind::InvalidArgument);
}
