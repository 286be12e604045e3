// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/driver/driver.h>
#include <pgbind/postgres/pooled_connection.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

namespace pgbind::postgres {

/**
 * @brief A transaction on one pooled connection
 *
 * The top level is BEGIN/COMMIT/ROLLBACK; begin() on a transaction opens a savepoint that
 * shares the connection. The connection goes back to the pool once every level is destroyed.
 */
class PgTransaction final : public Transaction {
public:
    // Take ownership of conn, on which BEGIN has already succeeded
    explicit PgTransaction(std::unique_ptr<PooledConnection> conn);
    ~PgTransaction() override;

    PgTransaction(const PgTransaction&) = delete;
    PgTransaction& operator=(const PgTransaction&) = delete;

    Result<void> exec(const Query& query, std::stop_token stop) override;
    Result<RowSet> query(const Query& query, std::stop_token stop) override;
    Result<std::unique_ptr<Transaction>> begin(std::stop_token stop) override;
    Result<void> commit(std::stop_token stop) override;
    Result<void> rollback(std::stop_token stop) override;

    [[nodiscard]] bool isNested() const noexcept { return !savepoint_.empty(); }

private:
    struct Shared {
        std::unique_ptr<PooledConnection> conn;
        std::mutex mutex;
        uint64_t savepoints = 0;
    };

    PgTransaction(std::shared_ptr<Shared> shared, std::string savepoint);

    std::shared_ptr<Shared> shared_;
    std::string savepoint_;
    bool finished_ = false;

    Result<RowSet> run(const Query& query, std::stop_token stop);
    Result<void> finish(const std::string& sql, std::stop_token stop);
};

} // namespace pgbind::postgres
