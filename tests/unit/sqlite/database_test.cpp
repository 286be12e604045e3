// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <pgbind/sqlite/database.h>

#include <chrono>
#include <filesystem>
#include <thread>
#include <unistd.h>

#include <fmt/format.h>

using namespace pgbind;
using namespace pgbind::sqlite;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use temporary database for tests
        dbPath_ = std::filesystem::temp_directory_path() /
                  fmt::format("pgbind_sqlite_test_{}.db", ::getpid());
        std::filesystem::remove(dbPath_);

        auto db = Database::open(dbPath_.string(), OpenMode::Create);
        ASSERT_TRUE(db.has_value()) << db.error().message;
        db_ = db.value();
        ASSERT_TRUE(
            db_->execute("CREATE TABLE test (id INTEGER PRIMARY KEY, name TEXT, value REAL)")
                .has_value());
    }

    void TearDown() override {
        db_.reset();
        std::filesystem::remove(dbPath_);
    }

    int64_t count() {
        auto rows = db_->query(Query{"SELECT COUNT(*) FROM test", {}}, {});
        EXPECT_TRUE(rows.has_value());
        return firstRow(rows.value()).value().getInt64(0).value();
    }

    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

TEST_F(DatabaseTest, OpenClose) {
    EXPECT_TRUE(db_->isOpen());
    EXPECT_EQ(db_->path(), dbPath_.string());
    db_->close();
    EXPECT_FALSE(db_->isOpen());

    auto result = db_->execute("SELECT 1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
}

TEST_F(DatabaseTest, OpenMissingReadOnlyFails) {
    auto db = Database::open((dbPath_.parent_path() / "pgbind_absent_dir" / "x.db").string(),
                             OpenMode::ReadOnly);
    ASSERT_FALSE(db.has_value());
    EXPECT_EQ(db.error().code, ErrorCode::ConnectionFailed);
}

TEST_F(DatabaseTest, TableExists) {
    EXPECT_TRUE(db_->tableExists("test").value());
    EXPECT_FALSE(db_->tableExists("nope").value());
}

TEST_F(DatabaseTest, NamedParameters) {
    Query insert{"INSERT INTO test (name, value) VALUES (@name, @value)",
                 {{"name", Value("first")}, {"value", Value(1.5)}}};
    ASSERT_TRUE(db_->exec(insert, {}).has_value());
    EXPECT_EQ(db_->lastInsertRowId(), 1);

    auto rows = db_->query(Query{"SELECT id, name, value FROM test WHERE name = @name",
                                 {{"name", Value("first")}}},
                           {});
    ASSERT_TRUE(rows.has_value());
    auto row = firstRow(rows.value());
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row.value().columnName(1), "name");

    int64_t id = 0;
    std::string name;
    double value = 0;
    ASSERT_TRUE(row.value().scan(id, name, value).has_value());
    EXPECT_EQ(id, 1);
    EXPECT_EQ(name, "first");
    EXPECT_DOUBLE_EQ(value, 1.5);
}

TEST_F(DatabaseTest, UnboundNamesAreNull) {
    ASSERT_TRUE(db_->exec(Query{"INSERT INTO test (name) VALUES (@missing)", {}}, {}).has_value());
    auto rows = db_->query(Query{"SELECT name FROM test", {}}, {});
    ASSERT_TRUE(rows.has_value());
    auto row = firstRow(rows.value());
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(row.value().isNull(0));
}

TEST_F(DatabaseTest, SequencesBindAsJsonArrays) {
    db_->execute("INSERT INTO test (name) VALUES ('a'), ('b'), ('c')");
    Query query{"SELECT name FROM test WHERE name IN (SELECT value FROM json_each(@names)) "
                "ORDER BY name",
                {{"names", Value(Value::StringList{"a", "c"})}}};
    auto rows = db_->query(query, {});
    ASSERT_TRUE(rows.has_value()) << rows.error().message;
    EXPECT_EQ(rows.value().size(), 2u);
}

TEST_F(DatabaseTest, MultipleStatementsKeepLastRows) {
    auto rows = db_->query(
        Query{"INSERT INTO test (name) VALUES ('x'); SELECT name FROM test; ", {}}, {});
    ASSERT_TRUE(rows.has_value()) << rows.error().message;
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(firstRow(rows.value()).value().getString(0).value(), "x");
}

TEST_F(DatabaseTest, SyntaxError) {
    auto result = db_->execute("SELEKT 1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DatabaseError);
}

TEST_F(DatabaseTest, SavepointCommit) {
    auto txn = db_->begin({});
    ASSERT_TRUE(txn.has_value());
    ASSERT_TRUE(txn.value()->exec(Query{"INSERT INTO test (name) VALUES ('kept')", {}}, {})
                    .has_value());
    ASSERT_TRUE(txn.value()->commit({}).has_value());
    EXPECT_EQ(count(), 1);

    auto again = txn.value()->commit({});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST_F(DatabaseTest, SavepointRollback) {
    auto txn = db_->begin({});
    ASSERT_TRUE(txn.has_value());
    txn.value()->exec(Query{"INSERT INTO test (name) VALUES ('gone')", {}}, {});
    ASSERT_TRUE(txn.value()->rollback({}).has_value());
    EXPECT_EQ(count(), 0);
}

TEST_F(DatabaseTest, NestedSavepoints) {
    auto outer = db_->begin({});
    ASSERT_TRUE(outer.has_value());
    outer.value()->exec(Query{"INSERT INTO test (name) VALUES ('outer')", {}}, {});

    {
        auto inner = outer.value()->begin({});
        ASSERT_TRUE(inner.has_value());
        inner.value()->exec(Query{"INSERT INTO test (name) VALUES ('inner')", {}}, {});
        // Destroyed without commit: rolled back
    }

    ASSERT_TRUE(outer.value()->commit({}).has_value());
    EXPECT_EQ(count(), 1);
}

TEST_F(DatabaseTest, DroppedTransactionRollsBack) {
    {
        auto txn = db_->begin({});
        ASSERT_TRUE(txn.has_value());
        txn.value()->exec(Query{"INSERT INTO test (name) VALUES ('dropped')", {}}, {});
    }
    EXPECT_EQ(count(), 0);
}

TEST_F(DatabaseTest, LockedDatabaseRetriesWithoutDuplicateRows) {
    ASSERT_TRUE(db_->execute("INSERT INTO test (name) VALUES ('a'), ('b'), ('c')").has_value());
    ASSERT_TRUE(db_->setBusyTimeout(std::chrono::milliseconds(0)).has_value());

    auto other = Database::open(dbPath_.string(), OpenMode::ReadWrite);
    ASSERT_TRUE(other.has_value());
    ASSERT_TRUE(other.value()->execute("BEGIN EXCLUSIVE").has_value());

    auto blocked = db_->query(Query{"SELECT name FROM test", {}}, {});
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, ErrorCode::DatabaseError);

    std::jthread release([&other] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        (void)other.value()->execute("COMMIT");
    });
    auto rows = db_->query(Query{"SELECT name FROM test ORDER BY name", {}}, {});
    release.join();
    ASSERT_TRUE(rows.has_value()) << rows.error().message;
    EXPECT_EQ(rows.value().size(), 3u);
}

TEST_F(DatabaseTest, StopRequestedBeforeRun) {
    std::stop_source stop;
    stop.request_stop();
    auto result = db_->query(Query{"SELECT 1", {}}, stop.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
}

TEST_F(DatabaseTest, InMemory) {
    auto db = Database::open(":memory:", OpenMode::Memory);
    ASSERT_TRUE(db.has_value());
    EXPECT_FALSE(Database::version().empty());
    auto rows = db.value()->query(Query{"SELECT 1 + 1 AS two", {}}, {});
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(firstRow(rows.value()).value().getInt64(0).value(), 2);
}
