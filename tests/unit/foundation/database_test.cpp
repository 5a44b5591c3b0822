#include <gtest/gtest.h>

#include "cis/foundation/database.hpp"
#include "cis/foundation/error_code.hpp"

#include "../support/mock_logger.hpp"

#include <filesystem>
#include <optional>
#include <string>

using namespace cis::foundation;
using cis::testing::ScopedMockLogger;

// ===========================================================================
// DatabaseConfig
// ===========================================================================

TEST(DatabaseConfigTest, DefaultValues) {
    DatabaseConfig config;
    EXPECT_TRUE(config.connectionString.empty());
    EXPECT_EQ(config.dbType, DatabaseType::SQLite);
    EXPECT_EQ(config.minConnections, 1u);
    EXPECT_EQ(config.maxConnections, 4u);
    EXPECT_EQ(config.connectionTimeout, std::chrono::seconds(10));
}

// ===========================================================================
// PreparedStatement
// ===========================================================================

TEST(PreparedStatementTest, BindsEachType) {
    PreparedStatement stmt(
        "UPDATE accounts SET username = $name, active = $active, avatar_url = $avatar "
        "WHERE id = $id");
    stmt.bindString("name", "alice").bindBool("active", false).bindNull("avatar").bindInt("id", 7);

    EXPECT_EQ(stmt.resolve(),
              "UPDATE accounts SET username = 'alice', active = FALSE, avatar_url = NULL "
              "WHERE id = 7");
}

TEST(PreparedStatementTest, EscapesQuotes) {
    PreparedStatement stmt("SELECT * FROM accounts WHERE username = $name");
    stmt.bindString("name", "o'brien'; DROP TABLE accounts; --");

    EXPECT_EQ(stmt.resolve(),
              "SELECT * FROM accounts WHERE username = 'o''brien''; DROP TABLE accounts; --'");
}

TEST(PreparedStatementTest, MatchesWholeParameterNames) {
    PreparedStatement stmt("SELECT $id, $id_hash FROM t");
    stmt.bindInt("id", 1).bindString("id_hash", "h");

    EXPECT_EQ(stmt.resolve(), "SELECT 1, 'h' FROM t");
}

TEST(PreparedStatementTest, BoundValuesAreNotRescanned) {
    PreparedStatement stmt("INSERT INTO t (a, b) VALUES ($a, $b)");
    stmt.bindString("a", "$b").bindString("b", "x");

    EXPECT_EQ(stmt.resolve(), "INSERT INTO t (a, b) VALUES ('$b', 'x')");
}

TEST(PreparedStatementTest, UnboundPlaceholdersStay) {
    PreparedStatement stmt("SELECT $missing, $ FROM t");
    EXPECT_EQ(stmt.resolve(), "SELECT $missing, $ FROM t");
}

TEST(PreparedStatementTest, OptionalBindings) {
    PreparedStatement stmt("VALUES ($s, $i, $ns, $ni)");
    stmt.bindOptional("s", std::optional<std::string>("v"))
        .bindOptional("i", std::optional<int>(3))
        .bindOptional("ns", std::optional<std::string>())
        .bindOptional("ni", std::optional<int>());

    EXPECT_EQ(stmt.resolve(), "VALUES ('v', 3, NULL, NULL)");
}

// ===========================================================================
// Database: operations without a connection
// ===========================================================================

TEST(DatabaseTest, NotConnectedByDefault) {
    Database db;
    EXPECT_FALSE(db.isConnected());
}

TEST(DatabaseTest, QueryWithoutConnectionFails) {
    Database db;
    auto result = db.query("SELECT 1");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotConnected);
}

TEST(DatabaseTest, ExecuteWithoutConnectionFails) {
    Database db;
    PreparedStatement stmt("DELETE FROM accounts WHERE id = $id");
    stmt.bindInt("id", 1);
    auto result = db.execute(stmt);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotConnected);
}

TEST(DatabaseTest, TransactionWithoutConnectionFails) {
    Database db;
    auto txn = db.beginTransaction();
    ASSERT_TRUE(txn.hasError());
    EXPECT_EQ(txn.error().code(), ErrorCode::NotConnected);
}

// ===========================================================================
// Database: in-memory SQLite
// ===========================================================================

TEST(DatabaseTest, InMemorySqliteUsesSingleConnection) {
    ScopedMockLogger mock;
    DatabaseConfig config;
    config.connectionString = ":memory:";
    config.dbType = DatabaseType::SQLite;
    config.minConnections = 2;
    config.maxConnections = 4;

    Database db;
    auto connected = db.connect(config);
    if (connected.hasError()) {
        GTEST_SKIP() << "sqlite backend unavailable: " << connected.error().message();
    }
    EXPECT_EQ(db.poolCapacity(), 1u);
    EXPECT_TRUE(mock->contains("limiting pool to one connection"));

    // Every statement sees the same database.
    ASSERT_TRUE(db.execute("CREATE TABLE t (x INTEGER)").hasValue());
    {
        auto txn = db.beginTransaction();
        ASSERT_TRUE(txn.hasValue());
        ASSERT_TRUE(txn.value().execute("INSERT INTO t (x) VALUES (7)").hasValue());
        ASSERT_TRUE(txn.value().commit().hasValue());
    }
    auto rows = db.query("SELECT x FROM t");
    ASSERT_TRUE(rows.hasValue());
    EXPECT_EQ(rows.value().size(), 1u);
}

TEST(DatabaseTest, FileSqliteKeepsConfiguredPool) {
    auto path = std::filesystem::temp_directory_path() / "cis_database_pool_test.db";
    std::filesystem::remove(path);
    DatabaseConfig config;
    config.connectionString = path.string();
    config.dbType = DatabaseType::SQLite;
    config.maxConnections = 3;

    Database db;
    auto connected = db.connect(config);
    if (connected.hasError()) {
        GTEST_SKIP() << "sqlite backend unavailable: " << connected.error().message();
    }
    EXPECT_EQ(db.poolCapacity(), 3u);
    db.disconnect();
    std::filesystem::remove(path);
}
