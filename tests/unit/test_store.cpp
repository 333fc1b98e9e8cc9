/**
 * @file test_store.cpp
 * @brief Unit tests for the SQLite wrappers, NamedLock, ReservationStore and TaskStore.
 * @author AnalyzerOrchestrator Team
 */

#include "core/clock.hpp"
#include "store/database.hpp"
#include "store/named_lock.hpp"
#include "store/reservation_store.hpp"
#include "store/task_store.hpp"

#include "support/test_env.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace analyzer_orchestrator;
using analyzer_orchestrator::testing::CapturedLogger;
using analyzer_orchestrator::testing::ScratchDirTest;

// ═══════════════════════════════════════════════
// Database / NamedLock
// ═══════════════════════════════════════════════

class DatabaseTest : public ScratchDirTest {};

TEST_F(DatabaseTest, ConstraintViolationMapsToAllocationConflict) {
    auto db = Database::open(dir_ / "t.db", 1000);
    ASSERT_TRUE(db.has_value()) << db.error().message;
    ASSERT_TRUE(db->execute("CREATE TABLE t (k TEXT PRIMARY KEY)").has_value());
    ASSERT_TRUE(db->execute("INSERT INTO t VALUES ('a')").has_value());

    auto dup = db->execute("INSERT INTO t VALUES ('a')");
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().kind, ErrorKind::AllocationConflict);
}

TEST_F(DatabaseTest, TransactionRollsBackUnlessCommitted) {
    auto db = Database::open(dir_ / "t.db", 1000);
    ASSERT_TRUE(db.has_value());
    ASSERT_TRUE(db->execute("CREATE TABLE t (v INTEGER)").has_value());
    {
        auto tx = Transaction::begin(*db);
        ASSERT_TRUE(tx.has_value());
        ASSERT_TRUE(db->execute("INSERT INTO t VALUES (1)").has_value());
    }
    auto stmt = db->prepare("SELECT COUNT(*) FROM t");
    ASSERT_TRUE(stmt.has_value());
    ASSERT_TRUE(stmt->step().value());
    EXPECT_EQ(stmt->column_int(0), 0);
}

TEST_F(DatabaseTest, NamedLockExcludesSecondHolder) {
    NamedLock a(dir_ / "locks", "slots");
    NamedLock b(dir_ / "locks", "slots");

    auto held = a.acquire(std::chrono::milliseconds(100));
    ASSERT_TRUE(held.has_value()) << held.error().message;

    auto blocked = b.acquire(std::chrono::milliseconds(50));
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().kind, ErrorKind::LockTimeout);

    held->release();
    EXPECT_TRUE(b.try_acquire().has_value());
}

// ═══════════════════════════════════════════════
// ReservationStore
// ═══════════════════════════════════════════════

class ReservationStoreTest : public ScratchDirTest {
protected:
    CapturedLogger log_;

    std::unique_ptr<ReservationStore> open_store() {
        auto store = ReservationStore::open(store_config(), log_.logger);
        EXPECT_TRUE(store.has_value()) << store.error().message;
        return std::move(store).value();
    }
};

TEST_F(ReservationStoreTest, AllocatesSequentialNumbersPerModel) {
    auto store = open_store();
    auto a1 = store->allocate("openai_gpt-4");
    auto a2 = store->allocate("openai_gpt-4");
    auto b1 = store->allocate("anthropic_claude");
    ASSERT_TRUE(a1 && a2 && b1);
    EXPECT_EQ(a1->app_number, 1);
    EXPECT_EQ(a2->app_number, 2);
    EXPECT_EQ(b1->app_number, 1);
    EXPECT_EQ(a1->version, 1);
    EXPECT_EQ(a1->generation_status, GenerationStatus::Pending);
}

TEST_F(ReservationStoreTest, RequestedNumberConflicts) {
    auto store = open_store();
    ASSERT_TRUE(store->allocate("m", 7).has_value());
    auto again = store->allocate("m", 7);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind, ErrorKind::AllocationConflict);

    // The next automatic number continues after the highest one taken.
    auto next = store->allocate("m");
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->app_number, 8);
}

TEST_F(ReservationStoreTest, RejectsInvalidRequests) {
    auto store = open_store();
    EXPECT_EQ(store->allocate("").error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(store->allocate("m", 0).error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ReservationStoreTest, ConcurrentAllocationsAcrossConnectionsAreUnique) {
    constexpr int kWorkers = 8;
    constexpr int kPerWorker = 10;
    std::vector<std::unique_ptr<ReservationStore>> stores;
    for (int i = 0; i < kWorkers; ++i) stores.push_back(open_store());

    std::mutex mutex;
    std::vector<int64_t> numbers;
    std::atomic<int> failures{0};
    {
        std::vector<std::jthread> workers;
        for (int w = 0; w < kWorkers; ++w) {
            workers.emplace_back([&, w] {
                for (int i = 0; i < kPerWorker; ++i) {
                    auto slot = stores[w]->allocate("shared_model");
                    if (!slot) {
                        ++failures;
                        continue;
                    }
                    std::lock_guard lock(mutex);
                    numbers.push_back(slot->app_number);
                }
            });
        }
    }

    EXPECT_EQ(failures.load(), 0);
    ASSERT_EQ(numbers.size(), static_cast<size_t>(kWorkers * kPerWorker));
    std::sort(numbers.begin(), numbers.end());
    for (size_t i = 0; i < numbers.size(); ++i) {
        EXPECT_EQ(numbers[i], static_cast<int64_t>(i + 1));
    }
}

TEST_F(ReservationStoreTest, VersionsFormLinearLineage) {
    auto store = open_store();
    auto v1 = store->allocate(AllocationRequest{"m", std::nullopt, "crud_app", "run_1"});
    ASSERT_TRUE(v1.has_value());
    auto v2 = store->create_version(v1->id);
    ASSERT_TRUE(v2.has_value()) << v2.error().message;
    EXPECT_EQ(v2->version, 2);
    EXPECT_EQ(v2->parent_slot_id, v1->id);
    EXPECT_EQ(v2->app_number, v1->app_number);
    EXPECT_EQ(v2->template_name, "crud_app");

    auto stale = store->create_version(v1->id);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().kind, ErrorKind::StaleVersion);

    auto lineage = store->lineage("m", v1->app_number);
    ASSERT_TRUE(lineage.has_value());
    ASSERT_EQ(lineage->size(), 2u);
    EXPECT_EQ(lineage->back().version, 2);
    EXPECT_EQ(store->latest("m", v1->app_number)->id, v2->id);
}

TEST_F(ReservationStoreTest, ConcurrentBranchingFromSameParentYieldsOneVersion) {
    auto seed = open_store();
    auto v1 = seed->allocate("m");
    ASSERT_TRUE(v1.has_value());

    constexpr int kWorkers = 6;
    std::vector<std::unique_ptr<ReservationStore>> stores;
    for (int i = 0; i < kWorkers; ++i) stores.push_back(open_store());

    std::atomic<int> created{0};
    std::atomic<int> stale{0};
    {
        std::vector<std::jthread> workers;
        for (int w = 0; w < kWorkers; ++w) {
            workers.emplace_back([&, w] {
                auto r = stores[w]->create_version(v1->id);
                if (r) {
                    ++created;
                } else if (r.error().kind == ErrorKind::StaleVersion) {
                    ++stale;
                }
            });
        }
    }
    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(stale.load(), kWorkers - 1);
    EXPECT_EQ(seed->lineage("m", v1->app_number)->size(), 2u);
}

TEST_F(ReservationStoreTest, MarkGeneratedAndExists) {
    auto store = open_store();
    auto slot = store->allocate("m");
    ASSERT_TRUE(slot.has_value());

    ASSERT_TRUE(store->mark_generated(slot->id, false, "template missing").has_value());
    auto reread = store->get(slot->id);
    ASSERT_TRUE(reread.has_value());
    EXPECT_EQ(reread->generation_status, GenerationStatus::Failed);
    EXPECT_EQ(reread->error_message, "template missing");

    EXPECT_EQ(store->mark_generated(9999, true).error().kind, ErrorKind::NotFound);
    EXPECT_TRUE(store->exists("m", slot->app_number).value());
    EXPECT_FALSE(store->exists("m", 42).value());
}

// ═══════════════════════════════════════════════
// TaskStore
// ═══════════════════════════════════════════════

class TaskStoreTest : public ScratchDirTest {
protected:
    CapturedLogger log_;
    ManualClock clock_;

    void SetUp() override {
        ScratchDirTest::SetUp();
        auto store = TaskStore::open(store_config(), log_.logger, clock_.fn());
        ASSERT_TRUE(store.has_value()) << store.error().message;
        store_ = std::move(store).value();
    }

    AnalysisTask make_task(const TaskId& id, std::optional<TaskId> parent = std::nullopt) {
        AnalysisTask t;
        t.task_id = id;
        t.parent_task_id = std::move(parent);
        t.is_main = !t.parent_task_id.has_value();
        t.target_model = "m";
        t.target_app_number = 1;
        t.tools = {"bandit", "zap"};
        t.created_at = clock_.now();
        if (!t.is_main) t.service = ServiceType::StaticAnalyzer;
        return t;
    }

    std::unique_ptr<TaskStore> store_;
};

TEST_F(TaskStoreTest, InsertTreeAndReadBack) {
    ASSERT_TRUE(store_->insert_task_tree(make_task("main"),
                                         {make_task("s1", "main"), make_task("s2", "main")})
                    .has_value());
    auto main = store_->get("main");
    ASSERT_TRUE(main.has_value());
    EXPECT_TRUE(main->is_main);
    EXPECT_EQ(main->tools, (std::vector<ToolName>{"bandit", "zap"}));
    EXPECT_FALSE(main->service.has_value());

    auto subs = store_->subtasks_of("main");
    ASSERT_TRUE(subs.has_value());
    ASSERT_EQ(subs->size(), 2u);
    EXPECT_EQ(subs->front().service, ServiceType::StaticAnalyzer);
    EXPECT_EQ(store_->get("nope").error().kind, ErrorKind::NotFound);
}

TEST_F(TaskStoreTest, TransitionsAreConditional) {
    ASSERT_TRUE(store_->insert_task_tree(make_task("t"), {}).has_value());
    EXPECT_TRUE(store_->mark_running("t").value());
    EXPECT_FALSE(store_->mark_running("t").value());

    EXPECT_TRUE(store_->finish("t", TaskStatus::Completed, R"({"ok":true})", std::nullopt).value());
    EXPECT_FALSE(store_->finish("t", TaskStatus::Failed, std::nullopt, "late").value());
    EXPECT_FALSE(store_->cancel("t", {TaskStatus::Pending, TaskStatus::Running}, "x").value());

    auto t = store_->get("t");
    EXPECT_EQ(t->status, TaskStatus::Completed);
    EXPECT_DOUBLE_EQ(t->progress, 100.0);
    EXPECT_TRUE(t->completed_at.has_value());
    EXPECT_EQ(store_->finish("t", TaskStatus::Running, std::nullopt, std::nullopt).error().kind,
              ErrorKind::InvalidArgument);
}

TEST_F(TaskStoreTest, RollupNeverOverridesCancellation) {
    ASSERT_TRUE(store_->insert_task_tree(make_task("t"), {}).has_value());
    EXPECT_TRUE(store_->cancel("t", {TaskStatus::Pending}, "user request").value());
    EXPECT_FALSE(store_->update_rollup("t", TaskStatus::Completed, 100.0, std::nullopt,
                                       std::nullopt).value());
    EXPECT_EQ(store_->get("t")->status, TaskStatus::Cancelled);
    EXPECT_EQ(store_->get("t")->error_message, "user request");
}

TEST_F(TaskStoreTest, RetryBudget) {
    auto main = make_task("t");
    main.max_retries = 1;
    ASSERT_TRUE(store_->insert_task_tree(main, {make_task("s", "t")}).has_value());

    ASSERT_TRUE(store_->finish("s", TaskStatus::Failed, std::nullopt, "boom").value());
    ASSERT_TRUE(store_->update_rollup("t", TaskStatus::Failed, 100.0, std::nullopt, "boom").value());

    EXPECT_TRUE(store_->begin_retry("t").value());
    EXPECT_TRUE(store_->reset_for_retry("s").value());
    EXPECT_EQ(store_->get("s")->status, TaskStatus::Pending);
    EXPECT_FALSE(store_->get("s")->error_message.has_value());

    ASSERT_TRUE(store_->update_rollup("t", TaskStatus::Failed, 100.0, std::nullopt, "boom").value());
    EXPECT_FALSE(store_->begin_retry("t").value());
    EXPECT_EQ(store_->get("t")->retry_count, 1u);
}

TEST_F(TaskStoreTest, StuckQueriesUseStatusSpecificAge) {
    ASSERT_TRUE(store_->insert_task_tree(make_task("old_pending"), {}).has_value());
    ASSERT_TRUE(store_->insert_task_tree(make_task("old_running"), {}).has_value());
    clock_.advance(std::chrono::hours(2));
    ASSERT_TRUE(store_->mark_running("old_running").value());
    clock_.advance(std::chrono::minutes(1));
    ASSERT_TRUE(store_->insert_task_tree(make_task("fresh"), {}).has_value());

    const auto cutoff = clock_.now() - std::chrono::minutes(30);
    auto pending = store_->stuck_since(TaskStatus::Pending, cutoff);
    ASSERT_TRUE(pending.has_value());
    ASSERT_EQ(pending->size(), 1u);
    EXPECT_EQ(pending->front().task_id, "old_pending");

    // Running age counts from started_at, which is only a minute old.
    EXPECT_TRUE(store_->stuck_since(TaskStatus::Running, cutoff)->empty());

    auto active = store_->active_created_before(cutoff);
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->size(), 2u);
}
