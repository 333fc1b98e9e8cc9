/**
 * @file reservation_store.cpp
 * @brief ReservationStore implementation over SQLite.
 * @author AnalyzerOrchestrator Team
 */

#include "store/reservation_store.hpp"

#include <algorithm>
#include <random>
#include <thread>

namespace analyzer_orchestrator {

namespace {

constexpr const char* kCtx = "STORE";

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS application_slots (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    model             TEXT    NOT NULL,
    app_number        INTEGER NOT NULL,
    version           INTEGER NOT NULL DEFAULT 1,
    parent_slot_id    INTEGER REFERENCES application_slots(id),
    template          TEXT    NOT NULL DEFAULT '',
    batch_id          TEXT,
    generation_status TEXT    NOT NULL DEFAULT 'pending',
    error_message     TEXT,
    created_at        INTEGER NOT NULL,
    UNIQUE (model, app_number, version)
);
CREATE INDEX IF NOT EXISTS idx_slots_model ON application_slots(model, app_number);
)sql";

constexpr const char* kSelectColumns =
    "SELECT id, model, app_number, version, parent_slot_id, template, batch_id, "
    "generation_status, error_message, created_at FROM application_slots ";

GenerationStatus parse_generation_status(std::string_view text) {
    if (text == "generated") return GenerationStatus::Generated;
    if (text == "failed") return GenerationStatus::Failed;
    return GenerationStatus::Pending;
}

ApplicationSlot read_slot(const Statement& stmt) {
    ApplicationSlot slot;
    slot.id = stmt.column_int(0);
    slot.model = stmt.column_text(1);
    slot.app_number = stmt.column_int(2);
    slot.version = stmt.column_int(3);
    slot.parent_slot_id = stmt.column_optional_int(4);
    slot.template_name = stmt.column_text(5);
    slot.batch_id = stmt.column_optional_text(6);
    slot.generation_status = parse_generation_status(stmt.column_text(7));
    slot.error_message = stmt.column_optional_text(8);
    slot.created_at = from_epoch_ms(stmt.column_int(9));
    return slot;
}

/// Exponential backoff with full jitter, capped at 200 ms.
std::chrono::milliseconds backoff(uint32_t attempt) {
    thread_local std::mt19937 rng{std::random_device{}()};
    int64_t ceiling = std::min<int64_t>(200, int64_t{5} << std::min<uint32_t>(attempt, 6));
    std::uniform_int_distribution<int64_t> dist(1, ceiling);
    return std::chrono::milliseconds{dist(rng)};
}

}  // namespace

Result<std::unique_ptr<ReservationStore>> ReservationStore::open(const StoreConfig& config,
                                                                 Logger& logger,
                                                                 ClockFn clock) {
    auto db = Database::open(config.database_path, config.busy_timeout_ms);
    if (!db) return db.error();

    std::unique_ptr<ReservationStore> store{
        new ReservationStore(std::move(db).value(), config, logger, std::move(clock))};
    if (auto r = store->create_schema(); !r) return r.error();
    return store;
}

ReservationStore::ReservationStore(Database db, const StoreConfig& config, Logger& logger,
                                   ClockFn clock)
    : db_(std::move(db))
    , config_(config)
    , logger_(logger)
    , clock_(std::move(clock))
    , write_lock_(config.lock_dir, "application_slots") {}

Result<void> ReservationStore::create_schema() {
    std::lock_guard lock(mutex_);
    return db_.execute(kSchema);
}

Result<ApplicationSlot> ReservationStore::allocate(const ModelSlug& model,
                                                   std::optional<int64_t> requested_app_number) {
    return allocate(AllocationRequest{model, requested_app_number, {}, std::nullopt});
}

Result<ApplicationSlot> ReservationStore::allocate(const AllocationRequest& request) {
    if (request.model.empty()) {
        return Error{"model must not be empty", ErrorKind::InvalidArgument};
    }
    if (request.requested_app_number && *request.requested_app_number <= 0) {
        return Error{"app number must be positive", ErrorKind::InvalidArgument};
    }

    const uint32_t attempts = std::max<uint32_t>(1, config_.allocation_max_attempts);
    for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
        auto slot = request.requested_app_number ? insert_requested(request)
                                                 : insert_next(request);
        if (slot) {
            logger_.debug(kCtx, "Allocated " + slot->model + " app"
                          + std::to_string(slot->app_number) + " (slot "
                          + std::to_string(slot->id) + ")");
            return slot;
        }

        const auto kind = slot.error().kind;
        if (request.requested_app_number && kind == ErrorKind::AllocationConflict) {
            return Error{"app" + std::to_string(*request.requested_app_number) + " of "
                         + request.model + " is already allocated",
                         ErrorKind::AllocationConflict};
        }
        if (kind != ErrorKind::AllocationConflict && kind != ErrorKind::Timeout) {
            return slot.error();
        }

        logger_.debug(kCtx, "Allocation for " + request.model + " retrying after: "
                      + slot.error().message);
        std::this_thread::sleep_for(backoff(attempt));
    }

    logger_.warn(kCtx, "Allocation for " + request.model + " gave up after "
                 + std::to_string(attempts) + " attempts");
    return Error{"Could not allocate an app number for " + request.model + " after "
                 + std::to_string(attempts) + " attempts", ErrorKind::AllocationConflict};
}

Result<ApplicationSlot> ReservationStore::insert_next(const AllocationRequest& request) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO application_slots "
        "(model, app_number, version, template, batch_id, generation_status, created_at) "
        "SELECT ?1, COALESCE(MAX(app_number), 0) + 1, 1, ?2, ?3, 'pending', ?4 "
        "FROM application_slots WHERE model = ?1");
    if (!stmt) return stmt.error();
    stmt->bind(1, request.model)
        .bind(2, request.template_name)
        .bind(3, request.batch_id)
        .bind(4, to_epoch_ms(clock_()));
    if (auto r = stmt->exec(); !r) return r.error();
    return get_locked(db_.last_insert_id());
}

Result<ApplicationSlot> ReservationStore::insert_requested(const AllocationRequest& request) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO application_slots "
        "(model, app_number, version, template, batch_id, generation_status, created_at) "
        "VALUES (?1, ?2, 1, ?3, ?4, 'pending', ?5)");
    if (!stmt) return stmt.error();
    stmt->bind(1, request.model)
        .bind(2, *request.requested_app_number)
        .bind(3, request.template_name)
        .bind(4, request.batch_id)
        .bind(5, to_epoch_ms(clock_()));
    if (auto r = stmt->exec(); !r) return r.error();
    return get_locked(db_.last_insert_id());
}

Result<ApplicationSlot> ReservationStore::create_version(SlotId parent_slot_id) {
    auto guard = write_lock_.acquire(std::chrono::milliseconds{config_.lock_timeout_ms});
    if (!guard) return guard.error();

    std::lock_guard lock(mutex_);
    auto tx = Transaction::begin(db_);
    if (!tx) return tx.error();

    auto parent = get_locked(parent_slot_id);
    if (!parent) return parent.error();

    auto head = latest_locked(parent->model, parent->app_number);
    if (!head) return head.error();
    if (head->id != parent->id) {
        return Error{"Slot " + std::to_string(parent_slot_id) + " is version "
                     + std::to_string(parent->version) + " but the latest version of "
                     + parent->model + " app" + std::to_string(parent->app_number) + " is "
                     + std::to_string(head->version), ErrorKind::StaleVersion};
    }

    auto stmt = db_.prepare(
        "INSERT INTO application_slots "
        "(model, app_number, version, parent_slot_id, template, batch_id, "
        " generation_status, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, 'pending', ?7)");
    if (!stmt) return stmt.error();
    stmt->bind(1, parent->model)
        .bind(2, parent->app_number)
        .bind(3, parent->version + 1)
        .bind(4, parent->id)
        .bind(5, parent->template_name)
        .bind(6, parent->batch_id)
        .bind(7, to_epoch_ms(clock_()));
    if (auto r = stmt->exec(); !r) return r.error();

    auto created = get_locked(db_.last_insert_id());
    if (!created) return created.error();
    if (auto r = tx->commit(); !r) return r.error();

    logger_.info(kCtx, "Created " + created->model + " app" + std::to_string(created->app_number)
                 + " v" + std::to_string(created->version) + " from slot "
                 + std::to_string(parent_slot_id));
    return created;
}

Result<void> ReservationStore::mark_generated(SlotId slot_id, bool success,
                                              const std::optional<std::string>& error) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE application_slots SET generation_status = ?1, error_message = ?2 WHERE id = ?3");
    if (!stmt) return stmt.error();
    stmt->bind(1, to_string(success ? GenerationStatus::Generated : GenerationStatus::Failed))
        .bind(2, error)
        .bind(3, slot_id);
    if (auto r = stmt->exec(); !r) return r.error();
    if (db_.changes() == 0) {
        return Error{"No slot with id " + std::to_string(slot_id), ErrorKind::NotFound};
    }
    return {};
}

Result<ApplicationSlot> ReservationStore::get(SlotId slot_id) {
    std::lock_guard lock(mutex_);
    return get_locked(slot_id);
}

Result<ApplicationSlot> ReservationStore::latest(const ModelSlug& model, int64_t app_number) {
    std::lock_guard lock(mutex_);
    return latest_locked(model, app_number);
}

Result<std::vector<ApplicationSlot>> ReservationStore::lineage(const ModelSlug& model,
                                                               int64_t app_number) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(std::string{kSelectColumns}
                            + "WHERE model = ?1 AND app_number = ?2 ORDER BY version");
    if (!stmt) return stmt.error();
    stmt->bind(1, model).bind(2, app_number);

    std::vector<ApplicationSlot> slots;
    while (true) {
        auto row = stmt->step();
        if (!row) return row.error();
        if (!*row) break;
        slots.push_back(read_slot(*stmt));
    }
    return slots;
}

Result<bool> ReservationStore::exists(const ModelSlug& model, int64_t app_number) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "SELECT 1 FROM application_slots WHERE model = ?1 AND app_number = ?2 LIMIT 1");
    if (!stmt) return stmt.error();
    stmt->bind(1, model).bind(2, app_number);
    return stmt->step();
}

Result<ApplicationSlot> ReservationStore::get_locked(SlotId slot_id) {
    auto stmt = db_.prepare(std::string{kSelectColumns} + "WHERE id = ?1");
    if (!stmt) return stmt.error();
    stmt->bind(1, slot_id);
    auto row = stmt->step();
    if (!row) return row.error();
    if (!*row) {
        return Error{"No slot with id " + std::to_string(slot_id), ErrorKind::NotFound};
    }
    return read_slot(*stmt);
}

Result<ApplicationSlot> ReservationStore::latest_locked(const ModelSlug& model,
                                                        int64_t app_number) {
    auto stmt = db_.prepare(std::string{kSelectColumns}
                            + "WHERE model = ?1 AND app_number = ?2 "
                              "ORDER BY version DESC LIMIT 1");
    if (!stmt) return stmt.error();
    stmt->bind(1, model).bind(2, app_number);
    auto row = stmt->step();
    if (!row) return row.error();
    if (!*row) {
        return Error{"No slot for " + model + " app" + std::to_string(app_number),
                     ErrorKind::NotFound};
    }
    return read_slot(*stmt);
}

}  // namespace analyzer_orchestrator
