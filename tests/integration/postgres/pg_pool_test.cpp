// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

// Runs against a live server described by the file PGBIND_CONFIG points at; skipped otherwise.

#include <gtest/gtest.h>
#include <pgbind/config/config_helpers.h>
#include <pgbind/config/connection_options.h>
#include <pgbind/conn/offset_limit.h>
#include <pgbind/postgres/pg_pool.h>

#include <chrono>
#include <cstdlib>
#include <thread>
#include <unistd.h>

#include <fmt/format.h>

using namespace pgbind;
using namespace pgbind::postgres;
using namespace std::chrono_literals;

namespace {

struct Job {
    int64_t id = 0;
    std::string name;

    Result<void> scan(const Row& row) { return row.scan(id, name); }

    Result<std::string> insert(Bind& bind) const {
        bind.set("name", name);
        return std::string("INSERT INTO ${\"table\"} (name) VALUES (@name) RETURNING id, name");
    }

    Result<void> patch(Bind& bind) const {
        bind.set("name", name);
        return {};
    }

    Result<std::string> select(Bind& bind, Op op) const {
        bind.set("id", id);
        switch (op) {
            case Op::Get:
                return std::string("SELECT id, name FROM ${\"table\"} WHERE id = @id");
            case Op::Patch:
                return std::string(
                    "UPDATE ${\"table\"} SET name = @name WHERE id = @id RETURNING id, name");
            case Op::Delete:
                return std::string("DELETE FROM ${\"table\"} WHERE id = @id RETURNING id, name");
            default:
                return Error{ErrorCode::NotImplemented, "unsupported"};
        }
    }
};

struct JobList {
    uint64_t count = 0;
    std::vector<Job> jobs;

    Result<void> scanCount(const Row& row) { return row.scan(count); }

    Result<void> scan(const Row& row) {
        Job job;
        auto result = job.scan(row);
        if (result) {
            jobs.push_back(std::move(job));
        }
        return result;
    }
};

struct JobListRequest {
    OffsetLimit page;

    Result<std::string> select(Bind& bind, Op) const {
        bind.set(kOrderByKey, "ORDER BY id");
        auto bounded = page;
        bounded.bind(bind, 10);
        return std::string("SELECT id, name FROM ${\"table\"}");
    }
};

} // namespace

class PgPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::getenv("PGBIND_CONFIG")) {
            GTEST_SKIP() << "PGBIND_CONFIG not set";
        }
        auto options = config::loadConnectionOptions(config::resolve_config_path());
        ASSERT_TRUE(options.has_value()) << options.error().message;
        options_ = options.value();
        options_.set("pool_max_conns", "2");

        table_ = fmt::format("pgbind_jobs_{}", ::getpid());
        PgPoolConfig config;
        config.minConnections = 1;
        config.acquireTimeout = 500ms;
        config.maintenanceInterval = std::chrono::seconds(0);
        config.binds = {{"table", Value(table_)}};

        auto pool = PgPool::create(options_, config);
        ASSERT_TRUE(pool.has_value()) << pool.error().message;
        pool_ = pool.value();

        auto conn = pool_->connection();
        ASSERT_TRUE(
            conn.exec("CREATE TABLE ${\"table\"} (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL)")
                .has_value());
    }

    void TearDown() override {
        if (pool_) {
            auto conn = pool_->connection();
            (void)conn.exec("DROP TABLE IF EXISTS ${\"table\"}");
        }
    }

    int64_t count() {
        auto rows = pool_->query(Query{fmt::format("SELECT COUNT(*) FROM \"{}\"", table_), {}}, {});
        EXPECT_TRUE(rows.has_value());
        return firstRow(rows.value()).value().getInt64(0).value();
    }

    config::ConnectionOptions options_;
    std::string table_;
    std::shared_ptr<PgPool> pool_;
};

TEST_F(PgPoolTest, PingAndStats) {
    ASSERT_TRUE(pool_->ping().has_value());
    auto stats = pool_->getStats();
    EXPECT_GE(stats.totalConnections, 1u);
    EXPECT_LE(stats.totalConnections, 2u);
    EXPECT_EQ(stats.activeConnections, 0u);
    EXPECT_EQ(pool_->maxConnections(), 2u);
}

TEST_F(PgPoolTest, Crud) {
    auto conn = pool_->connection();

    Job inserted;
    ASSERT_TRUE(conn.insert(inserted, Job{0, "first"}).has_value());
    EXPECT_GT(inserted.id, 0);

    Job patched;
    ASSERT_TRUE(conn.patch(patched, Job{inserted.id, ""}, Job{0, "renamed"}).has_value());
    EXPECT_EQ(patched.name, "renamed");

    Job fetched;
    ASSERT_TRUE(conn.get(fetched, Job{inserted.id, ""}).has_value());
    EXPECT_EQ(fetched.name, "renamed");

    Job removed;
    ASSERT_TRUE(conn.remove(removed, Job{inserted.id, ""}).has_value());
    auto missing = conn.get(fetched, Job{inserted.id, ""});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(PgPoolTest, ListWithCount) {
    auto conn = pool_->connection();
    for (int i = 0; i < 5; ++i) {
        Job job;
        ASSERT_TRUE(conn.insert(job, Job{0, fmt::format("job{}", i)}).has_value());
    }

    JobList list;
    ASSERT_TRUE(conn.list(list, JobListRequest{OffsetLimit{1, 2}}).has_value());
    EXPECT_EQ(list.count, 5u);
    ASSERT_EQ(list.jobs.size(), 2u);
    EXPECT_EQ(list.jobs[0].name, "job1");
}

TEST_F(PgPoolTest, TransactionCommitAndRollback) {
    auto conn = pool_->connection();

    auto committed = conn.tx([](Connection& tx) -> Result<void> {
        Job job;
        return tx.insert(job, Job{0, "kept"});
    });
    ASSERT_TRUE(committed.has_value()) << committed.error().message;

    auto rolled = conn.tx([](Connection& tx) -> Result<void> {
        Job job;
        auto inserted = tx.insert(job, Job{0, "dropped"});
        if (!inserted) {
            return inserted;
        }
        return Error{ErrorCode::InvalidState, "abort"};
    });
    ASSERT_FALSE(rolled.has_value());
    EXPECT_EQ(count(), 1);
    EXPECT_EQ(pool_->getStats().activeConnections, 0u);
}

TEST_F(PgPoolTest, NestedTransactionUsesSavepoint) {
    auto conn = pool_->connection();
    auto result = conn.tx([](Connection& outer) -> Result<void> {
        Job job;
        auto inserted = outer.insert(job, Job{0, "outer"});
        if (!inserted) {
            return inserted;
        }
        auto inner = outer.tx([](Connection& tx) -> Result<void> {
            Job innerJob;
            (void)tx.insert(innerJob, Job{0, "inner"});
            return Error{ErrorCode::InvalidState, "inner abort"};
        });
        EXPECT_FALSE(inner.has_value());
        return {};
    });
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(count(), 1);
}

TEST_F(PgPoolTest, ServerErrorCarriesSqlState) {
    auto conn = pool_->connection();
    auto result = conn.exec("SELECT * FROM pgbind_no_such_table");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DatabaseError);
    EXPECT_NE(result.error().message.find("42P01"), std::string::npos);
}

TEST_F(PgPoolTest, ArrayParameters) {
    auto rows = pool_->query(
        Query{"SELECT array_length(@ids::bigint[], 1), @names::text[]",
              {{"ids", Value(Value::List{Scalar{int64_t{1}}, Scalar{int64_t{2}}})},
               {"names", Value(Value::StringList{"a b", "c\"d"})}}},
        {});
    ASSERT_TRUE(rows.has_value()) << rows.error().message;
    auto row = firstRow(rows.value());
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row.value().getInt64(0).value(), 2);
    EXPECT_EQ(row.value().getString(1).value(), "{\"a b\",\"c\\\"d\"}");
}

TEST_F(PgPoolTest, AcquireTimesOutWhenExhausted) {
    auto first = pool_->acquireConnection({});
    auto second = pool_->acquireConnection({});
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    auto third = pool_->acquireConnection({});
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().code, ErrorCode::Timeout);
    EXPECT_GE(pool_->getStats().timeoutCount, 1u);
}

TEST_F(PgPoolTest, CancelLongStatement) {
    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(200ms);
        stop.request_stop();
    });

    auto started = std::chrono::steady_clock::now();
    auto result = pool_->exec(Query{"SELECT pg_sleep(30)", {}}, stop.get_token());
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_LT(elapsed, 10s);
    EXPECT_TRUE(pool_->ping().has_value());
}

TEST_F(PgPoolTest, ShutdownRejectsAcquire) {
    auto conn = pool_->connection();
    ASSERT_TRUE(conn.exec("DROP TABLE ${\"table\"}").has_value());

    pool_->shutdown();
    auto acquired = pool_->acquireConnection({});
    ASSERT_FALSE(acquired.has_value());
    EXPECT_EQ(acquired.error().code, ErrorCode::InvalidState);
    pool_.reset();
}

TEST(PgPoolCreateTest, RejectsBadLimits) {
    config::ConnectionOptions options;
    options.set("pool_max_conns", "zero");
    auto pool = PgPool::create(options);
    ASSERT_FALSE(pool.has_value());
    EXPECT_EQ(pool.error().code, ErrorCode::BadParameter);

    options.set("pool_max_conns", "1");
    PgPoolConfig config;
    config.minConnections = 2;
    auto tooMany = PgPool::create(options, config);
    ASSERT_FALSE(tooMany.has_value());
    EXPECT_EQ(tooMany.error().code, ErrorCode::BadParameter);
}
