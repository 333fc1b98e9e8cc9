/**
 * @file database.cpp
 * @brief SQLite connection, statement and transaction wrappers.
 * @author AnalyzerOrchestrator Team
 */

#include "store/database.hpp"

#include <sqlite3.h>

#include <utility>

namespace analyzer_orchestrator {

Error sqlite_error(int code, std::string_view context, sqlite3* db) {
    std::string message{context};
    message += ": ";
    message += (db != nullptr) ? sqlite3_errmsg(db) : sqlite3_errstr(code);

    switch (code & 0xFF) {
        case SQLITE_CONSTRAINT:
            return Error{std::move(message), ErrorKind::AllocationConflict};
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Error{std::move(message), ErrorKind::Timeout};
        default:
            return Error{std::move(message), ErrorKind::Storage};
    }
}

// ── Statement ────────────────────────────────

Statement::~Statement() {
    if (stmt_ != nullptr) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
    return *this;
}

Statement& Statement::bind(int index, std::string_view value) {
    sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int index, std::optional<int64_t> value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, std::string_view{*value}) : bind_null(index);
}

Statement& Statement::bind_double(int index, double value) {
    sqlite3_bind_double(stmt_, index, value);
    return *this;
}

Statement& Statement::bind_null(int index) {
    sqlite3_bind_null(stmt_, index);
    return *this;
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    auto err = sqlite_error(rc, "step", db_);
    sqlite3_reset(stmt_);
    return err;
}

Result<void> Statement::exec() {
    while (true) {
        auto row = step();
        if (!row) return row.error();
        if (!*row) return {};
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const auto* text = sqlite3_column_text(stmt_, col);
    if (text == nullptr) return {};
    return std::string{reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col))};
}

std::optional<int64_t> Statement::column_optional_int(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return column_int(col);
}

std::optional<std::string> Statement::column_optional_text(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return column_text(col);
}

// ── Database ─────────────────────────────────

Result<Database> Database::open(const std::filesystem::path& path, uint32_t busy_timeout_ms) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{"Cannot create database directory " + path.parent_path().string()
                         + ": " + ec.message(), ErrorKind::Storage};
        }
    }

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    Database db{raw};
    if (rc != SQLITE_OK) {
        return sqlite_error(rc, "open " + path.string(), raw);
    }

    sqlite3_busy_timeout(raw, static_cast<int>(busy_timeout_ms));
    if (auto r = db.execute("PRAGMA journal_mode=WAL"); !r) return r.error();
    if (auto r = db.execute("PRAGMA foreign_keys=ON"); !r) return r.error();
    return db;
}

Database::~Database() {
    if (db_ != nullptr) sqlite3_close_v2(db_);
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (db_ != nullptr) sqlite3_close_v2(db_);
        db_ = std::exchange(other.db_, nullptr);
    }
    return *this;
}

Result<void> Database::execute(std::string_view sql) {
    char* errmsg = nullptr;
    std::string owned{sql};
    int rc = sqlite3_exec(db_, owned.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        auto err = sqlite_error(rc, errmsg != nullptr ? errmsg : "exec");
        sqlite3_free(errmsg);
        return err;
    }
    return {};
}

Result<Statement> Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt != nullptr) sqlite3_finalize(stmt);
        return sqlite_error(rc, "prepare", db_);
    }
    return Statement{db_, stmt};
}

int Database::changes() const noexcept {
    return sqlite3_changes(db_);
}

int64_t Database::last_insert_id() const noexcept {
    return sqlite3_last_insert_rowid(db_);
}

// ── Transaction ──────────────────────────────

Result<Transaction> Transaction::begin(Database& db) {
    if (auto r = db.execute("BEGIN IMMEDIATE"); !r) return r.error();
    return Transaction{&db};
}

Transaction::Transaction(Transaction&& other) noexcept
    : db_(other.db_), done_(std::exchange(other.done_, true)) {}

Transaction::~Transaction() {
    if (!done_ && db_ != nullptr) {
        // Nothing useful to do with a failed rollback in a destructor.
        (void)db_->execute("ROLLBACK");
    }
}

Result<void> Transaction::commit() {
    auto r = db_->execute("COMMIT");
    if (r) done_ = true;
    return r;
}

}  // namespace analyzer_orchestrator
