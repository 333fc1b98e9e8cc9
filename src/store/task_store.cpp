/**
 * @file task_store.cpp
 * @brief TaskStore implementation over SQLite.
 * @author AnalyzerOrchestrator Team
 */

#include "store/task_store.hpp"

#include <json/json.h>

#include <sstream>

namespace analyzer_orchestrator {

namespace {

constexpr const char* kCtx = "STORE";

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS analysis_tasks (
    task_id           TEXT    PRIMARY KEY,
    parent_task_id    TEXT    REFERENCES analysis_tasks(task_id),
    is_main           INTEGER NOT NULL DEFAULT 1,
    status            TEXT    NOT NULL DEFAULT 'pending',
    service_name      TEXT,
    target_model      TEXT    NOT NULL,
    target_app_number INTEGER NOT NULL,
    tools             TEXT    NOT NULL DEFAULT '[]',
    progress          REAL    NOT NULL DEFAULT 0,
    retry_count       INTEGER NOT NULL DEFAULT 0,
    max_retries       INTEGER NOT NULL DEFAULT 3,
    result_summary    TEXT,
    error_message     TEXT,
    created_at        INTEGER NOT NULL,
    started_at        INTEGER,
    completed_at      INTEGER
);
CREATE INDEX IF NOT EXISTS idx_tasks_status ON analysis_tasks(status);
CREATE INDEX IF NOT EXISTS idx_tasks_parent ON analysis_tasks(parent_task_id);
)sql";

constexpr const char* kSelectColumns =
    "SELECT task_id, parent_task_id, is_main, status, service_name, target_model, "
    "target_app_number, tools, progress, retry_count, max_retries, result_summary, "
    "error_message, created_at, started_at, completed_at FROM analysis_tasks ";

std::string encode_tools(const std::vector<ToolName>& tools) {
    Json::Value arr(Json::arrayValue);
    for (const auto& tool : tools) arr.append(tool);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, arr);
}

std::vector<ToolName> decode_tools(const std::string& text) {
    std::vector<ToolName> tools;
    Json::Value arr;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &arr, &errors) || !arr.isArray()) {
        return tools;
    }
    for (const auto& item : arr) {
        if (item.isString()) tools.push_back(item.asString());
    }
    return tools;
}

AnalysisTask read_task(const Statement& stmt) {
    AnalysisTask task;
    task.task_id = stmt.column_text(0);
    task.parent_task_id = stmt.column_optional_text(1);
    task.is_main = stmt.column_int(2) != 0;
    task.status = parse_task_status(stmt.column_text(3)).value_or(TaskStatus::Pending);
    if (auto service = stmt.column_optional_text(4)) {
        task.service = parse_service_type(*service);
    }
    task.target_model = stmt.column_text(5);
    task.target_app_number = stmt.column_int(6);
    task.tools = decode_tools(stmt.column_text(7));
    task.progress = stmt.column_double(8);
    task.retry_count = static_cast<uint32_t>(stmt.column_int(9));
    task.max_retries = static_cast<uint32_t>(stmt.column_int(10));
    task.result_summary = stmt.column_optional_text(11);
    task.error_message = stmt.column_optional_text(12);
    task.created_at = from_epoch_ms(stmt.column_int(13));
    if (auto v = stmt.column_optional_int(14)) task.started_at = from_epoch_ms(*v);
    if (auto v = stmt.column_optional_int(15)) task.completed_at = from_epoch_ms(*v);
    return task;
}

std::string status_list(std::initializer_list<TaskStatus> statuses) {
    std::string out;
    for (auto status : statuses) {
        if (!out.empty()) out += ", ";
        out += '\'';
        out += to_string(status);
        out += '\'';
    }
    return out;
}

}  // namespace

Result<std::unique_ptr<TaskStore>> TaskStore::open(const StoreConfig& config, Logger& logger,
                                                   ClockFn clock) {
    auto db = Database::open(config.database_path, config.busy_timeout_ms);
    if (!db) return db.error();

    std::unique_ptr<TaskStore> store{
        new TaskStore(std::move(db).value(), config, logger, std::move(clock))};
    if (auto r = store->create_schema(); !r) return r.error();
    return store;
}

TaskStore::TaskStore(Database db, const StoreConfig& config, Logger& logger, ClockFn clock)
    : db_(std::move(db))
    , config_(config)
    , logger_(logger)
    , clock_(std::move(clock))
    , write_lock_(config.lock_dir, "analysis_tasks") {}

Result<void> TaskStore::create_schema() {
    std::lock_guard lock(mutex_);
    return db_.execute(kSchema);
}

Result<void> TaskStore::insert_task_tree(const AnalysisTask& main,
                                         const std::vector<AnalysisTask>& subtasks) {
    auto guard = write_lock_.acquire(std::chrono::milliseconds{config_.lock_timeout_ms});
    if (!guard) return guard.error();

    std::lock_guard lock(mutex_);
    auto tx = Transaction::begin(db_);
    if (!tx) return tx.error();

    auto stmt = db_.prepare(
        "INSERT INTO analysis_tasks (task_id, parent_task_id, is_main, status, service_name, "
        "target_model, target_app_number, tools, progress, retry_count, max_retries, "
        "created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, 0, 0, ?9, ?10)");
    if (!stmt) return stmt.error();

    auto insert = [&](const AnalysisTask& task) -> Result<void> {
        stmt->reset();
        stmt->bind(1, task.task_id)
            .bind(2, task.parent_task_id)
            .bind(3, int64_t{task.is_main ? 1 : 0})
            .bind(4, to_string(task.status))
            .bind(5, task.service ? std::optional<std::string>{std::string{to_string(*task.service)}}
                                  : std::nullopt)
            .bind(6, task.target_model)
            .bind(7, task.target_app_number)
            .bind(8, encode_tools(task.tools))
            .bind(9, int64_t{task.max_retries})
            .bind(10, to_epoch_ms(task.created_at));
        return stmt->exec();
    };

    if (auto r = insert(main); !r) return r.error();
    for (const auto& sub : subtasks) {
        if (auto r = insert(sub); !r) return r.error();
    }
    if (auto r = tx->commit(); !r) return r.error();

    logger_.debug(kCtx, "Inserted task " + main.task_id + " with "
                  + std::to_string(subtasks.size()) + " subtasks");
    return {};
}

Result<std::vector<AnalysisTask>> TaskStore::query(
        const std::string& where, const std::function<void(Statement&)>& binder) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(std::string{kSelectColumns} + where);
    if (!stmt) return stmt.error();
    binder(*stmt);

    std::vector<AnalysisTask> tasks;
    while (true) {
        auto row = stmt->step();
        if (!row) return row.error();
        if (!*row) break;
        tasks.push_back(read_task(*stmt));
    }
    return tasks;
}

Result<AnalysisTask> TaskStore::get(const TaskId& task_id) {
    auto rows = query("WHERE task_id = ?1", [&](Statement& s) { s.bind(1, task_id); });
    if (!rows) return rows.error();
    if (rows->empty()) {
        return Error{"No task with id " + task_id, ErrorKind::NotFound};
    }
    return std::move(rows->front());
}

Result<std::vector<AnalysisTask>> TaskStore::subtasks_of(const TaskId& main_id) {
    return query("WHERE parent_task_id = ?1 ORDER BY created_at, task_id",
                 [&](Statement& s) { s.bind(1, main_id); });
}

Result<std::vector<AnalysisTask>> TaskStore::with_status(TaskStatus status) {
    return query("WHERE status = ?1 ORDER BY created_at",
                 [&](Statement& s) { s.bind(1, to_string(status)); });
}

Result<std::vector<AnalysisTask>> TaskStore::stuck_since(TaskStatus status, Timestamp cutoff) {
    const char* where = status == TaskStatus::Running
        ? "WHERE status = ?1 AND COALESCE(started_at, created_at) < ?2 ORDER BY created_at"
        : "WHERE status = ?1 AND created_at < ?2 ORDER BY created_at";
    return query(where, [&](Statement& s) {
        s.bind(1, to_string(status)).bind(2, to_epoch_ms(cutoff));
    });
}

Result<std::vector<AnalysisTask>> TaskStore::active_created_before(Timestamp cutoff) {
    return query("WHERE status IN ('pending', 'running') AND created_at < ?1 ORDER BY created_at",
                 [&](Statement& s) { s.bind(1, to_epoch_ms(cutoff)); });
}

Result<bool> TaskStore::mark_running(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE analysis_tasks SET status = 'running', started_at = ?1 "
        "WHERE task_id = ?2 AND status = 'pending'");
    if (!stmt) return stmt.error();
    stmt->bind(1, to_epoch_ms(clock_())).bind(2, task_id);
    if (auto r = stmt->exec(); !r) return r.error();
    return db_.changes() > 0;
}

Result<bool> TaskStore::finish(const TaskId& task_id, TaskStatus status,
                               const std::optional<std::string>& result_summary,
                               const std::optional<std::string>& error_message) {
    if (!is_terminal(status)) {
        return Error{"finish() needs a terminal status", ErrorKind::InvalidArgument};
    }
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE analysis_tasks SET status = ?1, result_summary = ?2, error_message = ?3, "
        "progress = 100, completed_at = ?4 "
        "WHERE task_id = ?5 AND status IN ('pending', 'running')");
    if (!stmt) return stmt.error();
    stmt->bind(1, to_string(status))
        .bind(2, result_summary)
        .bind(3, error_message)
        .bind(4, to_epoch_ms(clock_()))
        .bind(5, task_id);
    if (auto r = stmt->exec(); !r) return r.error();
    return db_.changes() > 0;
}

Result<bool> TaskStore::update_rollup(const TaskId& task_id, TaskStatus status, double progress,
                                      const std::optional<std::string>& result_summary,
                                      const std::optional<std::string>& error_message) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE analysis_tasks SET status = ?1, progress = ?2, "
        "result_summary = COALESCE(?3, result_summary), error_message = ?4, "
        "started_at = COALESCE(started_at, ?5), "
        "completed_at = CASE WHEN ?6 THEN ?5 ELSE NULL END "
        "WHERE task_id = ?7 AND status != 'cancelled'");
    if (!stmt) return stmt.error();
    const auto now = to_epoch_ms(clock_());
    stmt->bind(1, to_string(status))
        .bind_double(2, progress)
        .bind(3, result_summary)
        .bind(4, error_message)
        .bind(5, now)
        .bind(6, int64_t{is_terminal(status) ? 1 : 0})
        .bind(7, task_id);
    if (auto r = stmt->exec(); !r) return r.error();
    return db_.changes() > 0;
}

Result<bool> TaskStore::cancel(const TaskId& task_id, std::initializer_list<TaskStatus> from,
                               const std::string& reason) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE analysis_tasks SET status = 'cancelled', error_message = ?1, completed_at = ?2 "
        "WHERE task_id = ?3 AND status IN (" + status_list(from) + ")");
    if (!stmt) return stmt.error();
    stmt->bind(1, reason).bind(2, to_epoch_ms(clock_())).bind(3, task_id);
    if (auto r = stmt->exec(); !r) return r.error();
    const bool changed = db_.changes() > 0;
    if (changed) logger_.info(kCtx, "Cancelled task " + task_id + ": " + reason);
    return changed;
}

Result<bool> TaskStore::reset_for_retry(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE analysis_tasks SET status = 'pending', error_message = NULL, "
        "result_summary = NULL, progress = 0, started_at = NULL, completed_at = NULL, "
        "retry_count = retry_count + 1 "
        "WHERE task_id = ?1 AND status IN ('failed', 'cancelled')");
    if (!stmt) return stmt.error();
    stmt->bind(1, task_id);
    if (auto r = stmt->exec(); !r) return r.error();
    return db_.changes() > 0;
}

Result<bool> TaskStore::begin_retry(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE analysis_tasks SET status = 'running', retry_count = retry_count + 1, "
        "error_message = NULL, completed_at = NULL "
        "WHERE task_id = ?1 AND status IN ('failed', 'partial_success') "
        "AND retry_count < max_retries");
    if (!stmt) return stmt.error();
    stmt->bind(1, task_id);
    if (auto r = stmt->exec(); !r) return r.error();
    return db_.changes() > 0;
}

}  // namespace analyzer_orchestrator
