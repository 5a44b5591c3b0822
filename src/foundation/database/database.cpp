/// @file database.cpp
/// @brief Database implementation wrapping kcenon database_system.

#include "cis/foundation/database.hpp"
#include "cis/foundation/service_logger.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace cis::foundation {

static ::database::database_types toKcenon(DatabaseType type) {
    switch (type) {
        case DatabaseType::PostgreSQL: return ::database::database_types::postgres;
        case DatabaseType::SQLite:     return ::database::database_types::sqlite;
    }
    return ::database::database_types::sqlite;
}

/// Each SQLite connection to an in-memory database gets a private database.
static bool isInMemorySqlite(const DatabaseConfig& config) {
    return config.dbType == DatabaseType::SQLite &&
           (config.connectionString == ":memory:" ||
            config.connectionString.find("mode=memory") != std::string::npos);
}

static QueryResult convertResult(const ::database::core::database_result& kcResult) {
    QueryResult result;
    result.reserve(kcResult.size());

    for (const auto& kcRow : kcResult) {
        DbRow row;
        for (const auto& [col, val] : kcRow) {
            std::visit([&](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::string> ||
                              std::is_same_v<T, std::int64_t> ||
                              std::is_same_v<T, double> ||
                              std::is_same_v<T, bool>) {
                    row[col] = arg;
                } else {
                    row[col] = DbNull{};
                }
            }, val);
        }
        result.push_back(std::move(row));
    }
    return result;
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(std::string sql)
    : sql_(std::move(sql)) {}

PreparedStatement& PreparedStatement::bindString(std::string_view name, std::string value) {
    params_[std::string(name)] = std::move(value);
    return *this;
}

PreparedStatement& PreparedStatement::bindInt(std::string_view name, std::int64_t value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindBool(std::string_view name, bool value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindNull(std::string_view name) {
    params_[std::string(name)] = DbNull{};
    return *this;
}

PreparedStatement& PreparedStatement::bindOptional(std::string_view name,
                                                   const std::optional<std::string>& value) {
    return value ? bindString(name, *value) : bindNull(name);
}

PreparedStatement& PreparedStatement::bindOptional(std::string_view name,
                                                   const std::optional<int>& value) {
    return value ? bindInt(name, *value) : bindNull(name);
}

std::string_view PreparedStatement::sql() const noexcept {
    return sql_;
}

static std::string renderValue(const DbValue& val) {
    std::string out;
    std::visit([&](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            out = "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            out.reserve(arg.size() + 2);
            out += '\'';
            for (char c : arg) {
                if (c == '\'') {
                    out += "''";
                } else {
                    out += c;
                }
            }
            out += '\'';
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            out = std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            out = std::to_string(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            out = arg ? "TRUE" : "FALSE";
        }
    }, val);
    return out;
}

static bool isParamChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string PreparedStatement::resolve() const {
    // Single pass over the template: substituted values are never rescanned,
    // so a bound string containing "$name" stays literal.
    std::string resolved;
    resolved.reserve(sql_.size());

    std::size_t pos = 0;
    while (pos < sql_.size()) {
        if (sql_[pos] != '$') {
            resolved += sql_[pos++];
            continue;
        }
        auto nameEnd = pos + 1;
        while (nameEnd < sql_.size() && isParamChar(sql_[nameEnd])) {
            ++nameEnd;
        }
        auto it = params_.find(sql_.substr(pos + 1, nameEnd - pos - 1));
        if (nameEnd == pos + 1 || it == params_.end()) {
            resolved.append(sql_, pos, nameEnd - pos);
        } else {
            resolved += renderValue(it->second);
        }
        pos = nameEnd;
    }
    return resolved;
}

// ---------------------------------------------------------------------------
// Pool entry
// ---------------------------------------------------------------------------

struct PooledConnection {
    std::shared_ptr<::database::database_context> context;
    std::shared_ptr<::database::database_manager> manager;
    bool inUse = false;
};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

struct Transaction::Impl {
    std::shared_ptr<::database::database_manager> manager;
    std::function<void(::database::database_manager*)> returnConnection;
    bool active = true;

    void release() {
        if (active) {
            (void)manager->rollback_transaction();
            active = false;
        }
        if (returnConnection) {
            returnConnection(manager.get());
            returnConnection = nullptr;
        }
    }
};

Transaction::Transaction(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

Transaction::~Transaction() {
    if (impl_) {
        impl_->release();
    }
}

Transaction::Transaction(Transaction&& other) noexcept = default;

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            impl_->release();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

ServiceResult<void> Transaction::commit() {
    if (!isActive()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->manager->commit_transaction();
    impl_->active = false;
    if (impl_->returnConnection) {
        impl_->returnConnection(impl_->manager.get());
        impl_->returnConnection = nullptr;
    }

    if (!result.is_ok()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed, "commit failed: " + result.error().message));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> Transaction::rollback() {
    if (!isActive()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->manager->rollback_transaction();
    impl_->active = false;
    if (impl_->returnConnection) {
        impl_->returnConnection(impl_->manager.get());
        impl_->returnConnection = nullptr;
    }

    if (!result.is_ok()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed, "rollback failed: " + result.error().message));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<QueryResult> Transaction::query(std::string_view sql) {
    if (!isActive()) {
        return ServiceResult<QueryResult>::err(
            ServiceError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->manager->select_query_result(std::string(sql));
    if (!result.is_ok()) {
        return ServiceResult<QueryResult>::err(
            ServiceError(ErrorCode::QueryFailed, result.error().message));
    }
    return ServiceResult<QueryResult>::ok(convertResult(result.value()));
}

ServiceResult<QueryResult> Transaction::query(const PreparedStatement& stmt) {
    return query(stmt.resolve());
}

ServiceResult<void> Transaction::execute(std::string_view sql) {
    if (!isActive()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TransactionFailed, "transaction not active"));
    }

    auto result = impl_->manager->execute_query_result(std::string(sql));
    if (!result.is_ok()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::QueryFailed, result.error().message));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> Transaction::execute(const PreparedStatement& stmt) {
    return execute(stmt.resolve());
}

bool Transaction::isActive() const noexcept {
    return impl_ && impl_->active;
}

// ---------------------------------------------------------------------------
// Database::Impl
// ---------------------------------------------------------------------------

struct Database::Impl {
    DatabaseConfig config;

    std::vector<PooledConnection> pool;
    mutable std::mutex poolMutex;
    std::condition_variable poolCv;
    std::atomic<bool> connected{false};

    std::shared_ptr<::database::database_manager> checkout() {
        std::unique_lock lock(poolMutex);
        auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;

        while (true) {
            for (auto& conn : pool) {
                if (!conn.inUse) {
                    conn.inUse = true;
                    return conn.manager;
                }
            }

            if (pool.size() < config.maxConnections) {
                auto conn = createConnection();
                if (conn.manager) {
                    conn.inUse = true;
                    auto mgr = conn.manager;
                    pool.push_back(std::move(conn));
                    return mgr;
                }
            }

            if (poolCv.wait_until(lock, deadline) == std::cv_status::timeout) {
                return nullptr;
            }
        }
    }

    void checkin(::database::database_manager* mgr) {
        std::lock_guard lock(poolMutex);
        for (auto& conn : pool) {
            if (conn.manager.get() == mgr) {
                conn.inUse = false;
                poolCv.notify_one();
                return;
            }
        }
    }

    PooledConnection createConnection() {
        PooledConnection conn;
        conn.context = std::make_shared<::database::database_context>();
        conn.manager = std::make_shared<::database::database_manager>(conn.context);

        if (!conn.manager->set_mode(toKcenon(config.dbType))) {
            conn.manager.reset();
            return conn;
        }

        auto result = conn.manager->connect_result(config.connectionString);
        if (!result.is_ok()) {
            conn.manager.reset();
            return conn;
        }
        return conn;
    }
};

Database::Database()
    : impl_(std::make_unique<Impl>()) {}

Database::~Database() {
    if (impl_) {
        disconnect();
    }
}

Database::Database(Database&&) noexcept = default;

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            disconnect();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

ServiceResult<void> Database::connect(const DatabaseConfig& config) {
    if (impl_->connected.load()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "already connected"));
    }

    impl_->config = config;
    if (impl_->config.maxConnections == 0) {
        impl_->config.maxConnections = 1;
    }
    if (isInMemorySqlite(config) && impl_->config.maxConnections > 1) {
        CIS_LOG_WARN(LogCategory::Storage,
                     "in-memory sqlite database; limiting pool to one connection");
        impl_->config.maxConnections = 1;
    }
    impl_->config.minConnections =
        std::min(impl_->config.minConnections, impl_->config.maxConnections);

    for (uint32_t i = 0; i < impl_->config.minConnections; ++i) {
        auto conn = impl_->createConnection();
        if (!conn.manager) {
            disconnect();
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::DatabaseError,
                             "failed to create connection " + std::to_string(i + 1) + "/" +
                                 std::to_string(impl_->config.minConnections)));
        }
        std::lock_guard lock(impl_->poolMutex);
        impl_->pool.push_back(std::move(conn));
    }

    impl_->connected.store(true);
    return ServiceResult<void>::ok();
}

void Database::disconnect() {
    impl_->connected.store(false);

    std::lock_guard lock(impl_->poolMutex);
    for (auto& conn : impl_->pool) {
        if (conn.manager) {
            (void)conn.manager->disconnect_result();
        }
    }
    impl_->pool.clear();
}

bool Database::isConnected() const noexcept {
    return impl_->connected.load();
}

DatabaseType Database::type() const noexcept {
    return impl_->config.dbType;
}

uint32_t Database::poolCapacity() const noexcept {
    return impl_->config.maxConnections;
}

ServiceResult<QueryResult> Database::query(std::string_view sql) {
    if (!impl_->connected.load()) {
        return ServiceResult<QueryResult>::err(
            ServiceError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return ServiceResult<QueryResult>::err(
            ServiceError(ErrorCode::ConnectionPoolExhausted, "no available connections in pool"));
    }

    auto result = mgr->select_query_result(std::string(sql));
    impl_->checkin(mgr.get());

    if (!result.is_ok()) {
        return ServiceResult<QueryResult>::err(
            ServiceError(ErrorCode::QueryFailed, result.error().message));
    }
    return ServiceResult<QueryResult>::ok(convertResult(result.value()));
}

ServiceResult<QueryResult> Database::query(const PreparedStatement& stmt) {
    return query(stmt.resolve());
}

ServiceResult<void> Database::execute(std::string_view sql) {
    if (!impl_->connected.load()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConnectionPoolExhausted, "no available connections in pool"));
    }

    auto result = mgr->execute_query_result(std::string(sql));
    impl_->checkin(mgr.get());

    if (!result.is_ok()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::QueryFailed, result.error().message));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<void> Database::execute(const PreparedStatement& stmt) {
    return execute(stmt.resolve());
}

ServiceResult<Transaction> Database::beginTransaction() {
    if (!impl_->connected.load()) {
        return ServiceResult<Transaction>::err(
            ServiceError(ErrorCode::NotConnected, "not connected to database"));
    }

    auto mgr = impl_->checkout();
    if (!mgr) {
        return ServiceResult<Transaction>::err(
            ServiceError(ErrorCode::ConnectionPoolExhausted, "no available connections in pool"));
    }

    auto result = mgr->begin_transaction();
    if (!result.is_ok()) {
        impl_->checkin(mgr.get());
        return ServiceResult<Transaction>::err(
            ServiceError(ErrorCode::TransactionFailed,
                         "failed to begin transaction: " + result.error().message));
    }

    auto txnImpl = std::make_unique<Transaction::Impl>();
    txnImpl->manager = mgr;
    txnImpl->active = true;
    auto* implPtr = impl_.get();
    txnImpl->returnConnection = [implPtr](::database::database_manager* m) {
        implPtr->checkin(m);
    };

    return ServiceResult<Transaction>::ok(Transaction(std::move(txnImpl)));
}

} // namespace cis::foundation
