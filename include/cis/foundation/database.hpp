#pragma once

/// @file database.hpp
/// @brief Database adapter wrapping kcenon database_system with a small
///        connection pool, named-parameter statements and RAII transactions.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "cis/foundation/service_result.hpp"

namespace cis::foundation {

// ── Values ──────────────────────────────────────────────────────────────────

/// Sentinel type representing SQL NULL.
struct DbNull {};

/// A single column value in a query result row.
using DbValue = std::variant<DbNull, std::string, std::int64_t, double, bool>;

/// A single row: column name → value.
using DbRow = std::unordered_map<std::string, DbValue>;

/// Complete result set from a SELECT (or RETURNING) query.
using QueryResult = std::vector<DbRow>;

// ── Configuration ───────────────────────────────────────────────────────────

enum class DatabaseType : uint8_t {
    PostgreSQL,
    SQLite
};

struct DatabaseConfig {
    std::string connectionString;
    DatabaseType dbType = DatabaseType::SQLite;
    uint32_t minConnections = 1;
    uint32_t maxConnections = 4;
    std::chrono::seconds connectionTimeout{10};
};

// ── PreparedStatement ───────────────────────────────────────────────────────

/// A parameterized SQL statement with $name placeholders.
///
/// String parameters are quoted with single quotes doubled, so bound values
/// never alter the statement structure.
///
/// Example:
/// @code
///   PreparedStatement stmt("SELECT * FROM accounts WHERE email = $email");
///   stmt.bindString("email", "a@example.com");
///   auto rows = db.query(stmt);
/// @endcode
class PreparedStatement {
public:
    explicit PreparedStatement(std::string sql);

    PreparedStatement& bindString(std::string_view name, std::string value);
    PreparedStatement& bindInt(std::string_view name, std::int64_t value);
    PreparedStatement& bindBool(std::string_view name, bool value);
    PreparedStatement& bindNull(std::string_view name);

    /// Bind a string, or NULL when @p value is empty.
    PreparedStatement& bindOptional(std::string_view name, const std::optional<std::string>& value);

    /// Bind an integer, or NULL when @p value is empty.
    PreparedStatement& bindOptional(std::string_view name, const std::optional<int>& value);

    [[nodiscard]] std::string_view sql() const noexcept;

    /// Resolve the SQL template with all bound parameters substituted.
    [[nodiscard]] std::string resolve() const;

private:
    std::string sql_;
    std::unordered_map<std::string, DbValue> params_;
};

// ── Transaction ─────────────────────────────────────────────────────────────

/// RAII transaction guard.
///
/// Rolls back on destruction unless commit() or rollback() was called.
/// Every statement runs on the transaction's dedicated connection.
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) noexcept;
    Transaction& operator=(Transaction&&) noexcept;

    [[nodiscard]] ServiceResult<void> commit();
    [[nodiscard]] ServiceResult<void> rollback();

    [[nodiscard]] ServiceResult<QueryResult> query(std::string_view sql);
    [[nodiscard]] ServiceResult<QueryResult> query(const PreparedStatement& stmt);

    [[nodiscard]] ServiceResult<void> execute(std::string_view sql);
    [[nodiscard]] ServiceResult<void> execute(const PreparedStatement& stmt);

    [[nodiscard]] bool isActive() const noexcept;

private:
    friend class Database;
    struct Impl;
    explicit Transaction(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

// ── Database ────────────────────────────────────────────────────────────────

/// Database adapter over kcenon's database_system.
///
/// Uses PIMPL to hide all kcenon implementation details.
///
/// Example:
/// @code
///   Database db;
///   DatabaseConfig config;
///   config.connectionString = "/var/lib/cis/identity.db";
///   config.dbType = DatabaseType::SQLite;
///   if (db.connect(config)) {
///       auto txn = db.beginTransaction();
///   }
/// @endcode
class Database {
public:
    Database();
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) noexcept;
    Database& operator=(Database&&) noexcept;

    [[nodiscard]] ServiceResult<void> connect(const DatabaseConfig& config);

    void disconnect();

    [[nodiscard]] bool isConnected() const noexcept;

    [[nodiscard]] DatabaseType type() const noexcept;

    /// Upper bound on pooled connections. An in-memory SQLite database is
    /// always held on a single connection.
    [[nodiscard]] uint32_t poolCapacity() const noexcept;

    [[nodiscard]] ServiceResult<QueryResult> query(std::string_view sql);
    [[nodiscard]] ServiceResult<QueryResult> query(const PreparedStatement& stmt);

    [[nodiscard]] ServiceResult<void> execute(std::string_view sql);
    [[nodiscard]] ServiceResult<void> execute(const PreparedStatement& stmt);

    /// Begin a new transaction on a dedicated pooled connection.
    [[nodiscard]] ServiceResult<Transaction> beginTransaction();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cis::foundation
