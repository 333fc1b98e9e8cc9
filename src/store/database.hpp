/**
 * @file database.hpp
 * @brief RAII wrappers over the SQLite C API.
 * @author AnalyzerOrchestrator Team
 *
 * One Database per store instance; a connection is not shared between
 * threads without the owner's mutex. Result codes are mapped onto ErrorKind:
 * constraint violations become AllocationConflict, busy/locked becomes
 * Timeout, anything else Storage.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace analyzer_orchestrator {

/// Map a SQLite result code to an Error with context.
Error sqlite_error(int code, std::string_view context, sqlite3* db = nullptr);

/**
 * @brief Prepared statement with typed binds and columns.
 *
 * Bind indices are 1-based, column indices 0-based, as in SQLite.
 */
class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, std::string_view value);
    Statement& bind(int index, const std::string& value) { return bind(index, std::string_view{value}); }
    Statement& bind(int index, const char* value) { return bind(index, std::string_view{value}); }
    Statement& bind(int index, std::optional<int64_t> value);
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind_double(int index, double value);
    Statement& bind_null(int index);

    /// Advance one row. true = row available, false = done.
    Result<bool> step();

    /// Run to completion, discarding rows.
    Result<void> exec();

    void reset();

    [[nodiscard]] int64_t column_int(int col) const;
    [[nodiscard]] double column_double(int col) const;
    [[nodiscard]] std::string column_text(int col) const;
    [[nodiscard]] std::optional<int64_t> column_optional_int(int col) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int col) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/**
 * @brief Owned SQLite connection in WAL mode with a busy timeout.
 */
class Database {
public:
    static Result<Database> open(const std::filesystem::path& path, uint32_t busy_timeout_ms);

    ~Database();
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> execute(std::string_view sql);
    Result<Statement> prepare(std::string_view sql);

    /// Rows touched by the last INSERT/UPDATE/DELETE.
    [[nodiscard]] int changes() const noexcept;
    [[nodiscard]] int64_t last_insert_id() const noexcept;

    [[nodiscard]] sqlite3* handle() const noexcept { return db_; }

private:
    explicit Database(sqlite3* db) noexcept : db_(db) {}

    sqlite3* db_ = nullptr;
};

/**
 * @brief BEGIN IMMEDIATE ... COMMIT guard; rolls back unless committed.
 */
class Transaction {
public:
    static Result<Transaction> begin(Database& db);

    ~Transaction();
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&&) = delete;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result<void> commit();

private:
    explicit Transaction(Database* db) noexcept : db_(db) {}

    Database* db_;
    bool done_ = false;
};

}  // namespace analyzer_orchestrator
