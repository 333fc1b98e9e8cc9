/**
 * @file test_pipeline_e2e.cpp
 * @brief End-to-end pipelines over loopback WebSocket workers.
 * @author AnalyzerOrchestrator Team
 *
 * Generation and analysis requests travel through the real client, pool,
 * orchestrator and scheduler to in-process FakeWsServer workers.
 */

#include "core/config.hpp"
#include "generation/generation_worker.hpp"
#include "maintenance/maintenance_sweep.hpp"
#include "network/worker_client.hpp"
#include "orchestrator/task_orchestrator.hpp"
#include "pool/endpoint_pool.hpp"
#include "protocol/worker_protocol.hpp"
#include "scheduler/job_scheduler.hpp"
#include "store/reservation_store.hpp"
#include "store/task_store.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include "support/fake_worker_client.hpp"
#include "support/fake_ws_server.hpp"
#include "support/test_env.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>

using namespace analyzer_orchestrator;
using analyzer_orchestrator::testing::CapturedLogger;
using analyzer_orchestrator::testing::FakeWorkerClient;
using analyzer_orchestrator::testing::FakeWsServer;
using analyzer_orchestrator::testing::ScratchDirTest;

namespace {

std::vector<std::string> generation_reply(const Json::Value& request) {
    Json::Value progress(Json::objectValue);
    progress["type"] = "progress_update";
    progress["message"] = "rendering " + request["template"].asString();

    Json::Value reply(Json::objectValue);
    reply["type"] = "generation_result";
    reply["status"] = "success";
    reply["appDir"] = "generated/" + request["model"].asString() + "/app"
                      + std::to_string(request["appNumber"].asInt64());
    return {to_json_string(progress), to_json_string(reply)};
}

}  // namespace

class PipelineEndToEndTest : public ScratchDirTest {
protected:
    CapturedLogger log_;
    std::shared_ptr<MemorySink::Buffer> metrics_lines_ = std::make_shared<MemorySink::Buffer>();
    std::unique_ptr<MetricsCollector> metrics_;

    std::unique_ptr<FakeWsServer> generation_;
    std::unique_ptr<FakeWsServer> static_a_;
    std::unique_ptr<FakeWsServer> static_b_;
    std::unique_ptr<FakeWsServer> ai_;

    /// (model, app number) whose static analysis answers "error".
    std::pair<std::string, int64_t> failing_target_{"", 0};
    std::mutex failing_mutex_;

    Config config_;
    std::unique_ptr<ReservationStore> reservations_;
    std::unique_ptr<TaskStore> tasks_;
    std::unique_ptr<WsWorkerClient> client_;
    std::unique_ptr<EndpointPool> pool_;
    std::unique_ptr<TaskOrchestrator> orchestrator_;
    std::unique_ptr<RemoteGenerationWorker> generator_;
    std::unique_ptr<JobScheduler> scheduler_;

    void SetUp() override {
        ScratchDirTest::SetUp();
        metrics_ = std::make_unique<MetricsCollector>(std::make_unique<MemorySink>(metrics_lines_));

        generation_ = std::make_unique<FakeWsServer>(
            [](const std::string&, const Json::Value& request) {
                return generation_reply(request);
            });
        auto analyzer = [this](const std::string&, const Json::Value& request) {
            bool fail = false;
            {
                std::lock_guard lock(failing_mutex_);
                fail = request["targetModel"].asString() == failing_target_.first
                       && request["targetAppNumber"].asInt64() == failing_target_.second;
            }
            auto reply = FakeWorkerClient::analysis_reply(fail ? "error" : "success", request,
                                                          "medium");
            return std::vector<std::string>{to_json_string(reply)};
        };
        static_a_ = std::make_unique<FakeWsServer>(analyzer);
        static_b_ = std::make_unique<FakeWsServer>(analyzer);
        ai_ = std::make_unique<FakeWsServer>(
            FakeWsServer::reply_with(FakeWorkerClient::analysis_reply(
                "success", parse_json(R"({"tools":["requirements-scanner"]})").value(), "low")));

        config_ = default_config();
        config_.services.endpoints.clear();
        config_.services.endpoints[ServiceType::Generation] = {generation_->url()};
        config_.services.endpoints[ServiceType::StaticAnalyzer] = {static_a_->url(),
                                                                   static_b_->url()};
        config_.services.endpoints[ServiceType::AiAnalyzer] = {ai_->url()};
        config_.services.dispatch_timeout_s = 10;
        config_.services.connect_timeout_ms = 2000;
        config_.pool.health_check_interval_s = 0;
        config_.pool.probe_timeout_ms = 2000;
        config_.orchestrator.results_dir = dir_ / "results";
        config_.scheduler.poll_interval_ms = 20;
        config_.scheduler.generation_workers = 3;
        config_.scheduler.analysis_workers = 3;
        config_.store = store_config();

        auto reservations = ReservationStore::open(config_.store, log_.logger);
        ASSERT_TRUE(reservations.has_value()) << reservations.error().message;
        reservations_ = std::move(reservations).value();
        auto tasks = TaskStore::open(config_.store, log_.logger);
        ASSERT_TRUE(tasks.has_value()) << tasks.error().message;
        tasks_ = std::move(tasks).value();

        client_ = std::make_unique<WsWorkerClient>(log_.logger, config_.services);
        pool_ = std::make_unique<EndpointPool>(config_.pool, *client_, log_.logger, metrics_.get());
        ASSERT_TRUE(pool_->initialize(config_.services).has_value());
        orchestrator_ = std::make_unique<TaskOrchestrator>(config_.orchestrator, config_.services,
                                                           *tasks_, *pool_, *client_, log_.logger,
                                                           metrics_.get());
        generator_ = std::make_unique<RemoteGenerationWorker>(
            *pool_, *client_, log_.logger, std::chrono::seconds(config_.services.dispatch_timeout_s));
        scheduler_ = std::make_unique<JobScheduler>(config_.scheduler, *reservations_, *generator_,
                                                    *orchestrator_, log_.logger, metrics_.get());
    }

    void TearDown() override {
        scheduler_.reset();
        generator_.reset();
        orchestrator_.reset();
        pool_.reset();
        client_.reset();
        tasks_.reset();
        reservations_.reset();
        static_a_.reset();
        static_b_.reset();
        ai_.reset();
        generation_.reset();
        ScratchDirTest::TearDown();
    }

    PipelineRun run(const std::string& text) {
        auto def = parse_pipeline_text(text);
        EXPECT_TRUE(def.has_value());
        auto id = scheduler_->submit(std::move(def).value());
        EXPECT_TRUE(id.has_value());
        scheduler_->start();
        auto result = scheduler_->wait(*id, Duration{60000});
        EXPECT_TRUE(result.has_value());
        return result.value_or(PipelineRun{});
    }

    size_t metric_lines_with(const std::string& needle) const {
        std::lock_guard lock(metrics_lines_->mutex);
        return static_cast<size_t>(std::count_if(
            metrics_lines_->lines.begin(), metrics_lines_->lines.end(),
            [&](const std::string& line) { return line.find(needle) != std::string::npos; }));
    }
};

namespace {

constexpr const char* kTwoByTwo = R"({
    "name": "e2e",
    "generation": {"models": ["openai_gpt-4", "anthropic_claude"],
                   "templates": ["crud_todo", "auth_flow"],
                   "options": {"maxConcurrentTasks": 2}},
    "analysis": {"enabled": true, "tools": ["bandit", "requirements-scanner"],
                 "options": {"maxConcurrentTasks": 2}}
})";

}  // namespace

TEST_F(PipelineEndToEndTest, TwoModelsTwoTemplatesComplete) {
    auto result = run(kTwoByTwo);
    ASSERT_EQ(result.status, PipelineStatus::Completed) << to_pretty_json(result.to_json());
    EXPECT_EQ(result.generation.completed, 4u);
    EXPECT_EQ(result.analysis.completed, 4u);
    EXPECT_EQ(result.analysis.partial, 0u);

    EXPECT_EQ(generation_->requests(), 4);
    EXPECT_EQ(static_a_->requests() + static_b_->requests(), 4);
    EXPECT_GT(static_a_->requests(), 0);
    EXPECT_GT(static_b_->requests(), 0);
    EXPECT_EQ(ai_->requests(), 4);
    for (const auto& path : generation_->paths()) EXPECT_EQ(path, "/generation");
    for (const auto& path : ai_->paths()) EXPECT_EQ(path, "/ai-analyzer");

    size_t files = 0;
    for (const auto& job : result.jobs) {
        if (job.stage != JobStage::Analysis) continue;
        ASSERT_TRUE(job.task_id && job.app_number);
        auto task = tasks_->get(*job.task_id);
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->status, TaskStatus::Completed);
        auto doc = parse_json(*task->result_summary).value();
        EXPECT_EQ(doc["totalFindings"].asUInt64(), 2u);
        EXPECT_EQ(doc["servicesExecuted"].size(), 2u);
        if (std::filesystem::exists(result_file_path(config_.orchestrator.results_dir, job.model,
                                                     *job.app_number, *job.task_id))) {
            ++files;
        }
    }
    EXPECT_EQ(files, 4u);

    for (const char* model : {"openai_gpt-4", "anthropic_claude"}) {
        for (int64_t app = 1; app <= 2; ++app) {
            auto slot = reservations_->latest(model, app);
            ASSERT_TRUE(slot.has_value());
            EXPECT_EQ(slot->generation_status, GenerationStatus::Generated);
        }
    }

    EXPECT_EQ(metric_lines_with(R"("event":"job")"), 8u);
    EXPECT_EQ(metric_lines_with(R"("outcome":"failure")"), 0u);
}

TEST_F(PipelineEndToEndTest, OneFailedAnalysisYieldsPartialSuccess) {
    {
        std::lock_guard lock(failing_mutex_);
        failing_target_ = {"anthropic_claude", 2};
    }
    auto result = run(kTwoByTwo);
    EXPECT_EQ(result.status, PipelineStatus::PartialSuccess);
    EXPECT_EQ(result.generation.completed, 4u);
    EXPECT_EQ(result.analysis.completed, 4u);
    EXPECT_EQ(result.analysis.partial, 1u);
    EXPECT_EQ(result.analysis.failed, 0u);

    auto partial = std::find_if(result.jobs.begin(), result.jobs.end(),
                                [](const JobOutcome& j) { return j.partial; });
    ASSERT_NE(partial, result.jobs.end());
    EXPECT_EQ(partial->model, "anthropic_claude");
    EXPECT_EQ(partial->app_number, 2);

    auto task = tasks_->get(*partial->task_id).value();
    EXPECT_EQ(task.status, TaskStatus::PartialSuccess);
    auto doc = parse_json(*task.result_summary).value();
    EXPECT_EQ(doc["servicesFailed"][0].asString(), "static-analyzer");
}

TEST_F(PipelineEndToEndTest, DeadAnalyzerIsSkippedAfterFirstFailure) {
    const std::string dead_url = static_b_->url();
    static_b_.reset();

    auto first = orchestrator_->run_analysis({"openai_gpt-4", 1}, {"bandit"});
    auto second = orchestrator_->run_analysis({"openai_gpt-4", 1}, {"bandit"});
    ASSERT_TRUE(first.has_value() && second.has_value());

    // Round robin hits a then b; b's failure removes it until the cooldown passes.
    EXPECT_EQ(first->status, TaskStatus::Completed);
    EXPECT_EQ(second->status, TaskStatus::Failed);
    auto third = orchestrator_->run_analysis({"openai_gpt-4", 1}, {"bandit"});
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->status, TaskStatus::Completed);
    EXPECT_EQ(static_a_->requests(), 2);

    bool b_unhealthy = false;
    for (const auto& ep : pool_->endpoints(ServiceType::StaticAnalyzer)) {
        if (ep.url == dead_url) b_unhealthy = !ep.is_healthy;
    }
    EXPECT_TRUE(b_unhealthy);
    EXPECT_EQ(metric_lines_with("endpoint_unhealthy"), 1u);
}

TEST_F(PipelineEndToEndTest, HealthChecksReachLiveWorkers) {
    pool_->run_health_checks();
    EXPECT_EQ(generation_->health_checks(), 1);
    EXPECT_EQ(static_a_->health_checks(), 1);
    for (const auto& stats : pool_->stats()) {
        EXPECT_EQ(stats.healthy, stats.endpoints);
    }
}

TEST_F(PipelineEndToEndTest, StartupSweepLeavesFreshWorkAlone) {
    auto created = orchestrator_->create_task({"openai_gpt-4", 9}, {"bandit"});
    ASSERT_TRUE(created.has_value());

    MaintenanceSweep sweep(config_.maintenance, *tasks_, *reservations_, log_.logger,
                           metrics_.get());
    auto report = sweep.run_once();
    EXPECT_EQ(report.total(), 0u);
    EXPECT_EQ(tasks_->get(created->task_id).value().status, TaskStatus::Pending);
    EXPECT_EQ(metric_lines_with(R"("event":"sweep")"), 1u);
}
