// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <pgbind/postgres/pg_transaction.h>

namespace pgbind::postgres {

PgTransaction::PgTransaction(std::unique_ptr<PooledConnection> conn)
    : shared_(std::make_shared<Shared>()) {
    shared_->conn = std::move(conn);
}

PgTransaction::PgTransaction(std::shared_ptr<Shared> shared, std::string savepoint)
    : shared_(std::move(shared)), savepoint_(std::move(savepoint)) {}

PgTransaction::~PgTransaction() {
    if (!finished_) {
        auto result = rollback({});
        if (!result) {
            spdlog::warn("pgbind: implicit rollback failed: {}", result.error().message);
        }
    }
}

Result<void> PgTransaction::exec(const Query& query, std::stop_token stop) {
    auto result = run(query, stop);
    if (!result) {
        return result.error();
    }
    return {};
}

Result<RowSet> PgTransaction::query(const Query& query, std::stop_token stop) {
    return run(query, stop);
}

Result<std::unique_ptr<Transaction>> PgTransaction::begin(std::stop_token stop) {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        name = fmt::format("pgbind_sp_{}", ++shared_->savepoints);
    }
    auto result = run(Query{"SAVEPOINT " + name, {}}, stop);
    if (!result) {
        return Error{ErrorCode::TransactionFailed, result.error().message};
    }
    spdlog::debug("pgbind: began savepoint {}", name);
    return std::unique_ptr<Transaction>(new PgTransaction(shared_, std::move(name)));
}

Result<void> PgTransaction::commit(std::stop_token stop) {
    return finish(isNested() ? "RELEASE SAVEPOINT " + savepoint_ : std::string("COMMIT"), stop);
}

Result<void> PgTransaction::rollback(std::stop_token stop) {
    return finish(isNested()
                      ? "ROLLBACK TO SAVEPOINT " + savepoint_ + "; RELEASE SAVEPOINT " + savepoint_
                      : std::string("ROLLBACK"),
                  stop);
}

Result<RowSet> PgTransaction::run(const Query& query, std::stop_token stop) {
    if (finished_) {
        return Error{ErrorCode::InvalidState, "transaction already finished"};
    }
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (!shared_->conn || !shared_->conn->isValid()) {
        return Error{ErrorCode::InvalidState, "transaction has no connection"};
    }
    shared_->conn->touch();
    return (*shared_->conn)->execute(query, stop);
}

Result<void> PgTransaction::finish(const std::string& sql, std::stop_token stop) {
    if (finished_) {
        return Error{ErrorCode::InvalidState, "transaction already finished"};
    }
    auto result = run(Query{sql, {}}, stop);
    finished_ = true;
    if (!result) {
        return Error{ErrorCode::TransactionFailed, result.error().message};
    }
    spdlog::debug("pgbind: {}", sql);
    return {};
}

} // namespace pgbind::postgres
