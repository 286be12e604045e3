// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/conn/connection.h>
#include <pgbind/core/result_helpers.h>

#include <spdlog/spdlog.h>

namespace pgbind {

namespace {

std::string_view trimSql(std::string_view sql) {
    constexpr std::string_view kSpace = " \t\r\n";
    auto start = sql.find_first_not_of(kSpace);
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = sql.find_last_not_of(kSpace);
    return sql.substr(start, end - start + 1);
}

void logFailure(const Query& query, const Error& error) {
    if (error.code == ErrorCode::OperationCancelled) {
        spdlog::debug("pgbind: statement cancelled: {}", trimSql(query.sql));
        return;
    }
    spdlog::error("pgbind: statement failed: {} [{}]", error.message, trimSql(query.sql));
}

} // namespace

Connection::Connection(std::shared_ptr<TxHandle> handle, std::unique_ptr<Bind> bind,
                       TraceFn trace)
    : handle_(std::move(handle)), bind_(std::move(bind)), trace_(std::move(trace)) {
    if (!bind_) {
        bind_ = std::make_unique<Bind>();
    }
}

Connection Connection::with(std::initializer_list<BindPair> pairs) const {
    return Connection(handle_, bind_->copy(pairs), trace_);
}

Result<void> Connection::exec(std::string_view text, std::stop_token stop) {
    auto query = bind_->render(text);
    spdlog::trace("pgbind: exec {}", trimSql(query.sql));

    auto result = handle_->exec(query, stop);
    traceStatement(query, result.status());
    if (!result) {
        logFailure(query, result.error());
    }
    return result;
}

std::string Connection::countQuery(std::string_view query) {
    return "WITH sq AS (" + std::string(query) + " ${groupby}) SELECT COUNT(*) AS \"count\" FROM sq";
}

std::string Connection::listQuery(std::string_view query) {
    return std::string(query) + " ${groupby} ${orderby} ${offsetlimit}";
}

Result<void> Connection::queryRow(std::string_view text, const RowFn& fn, std::stop_token stop) {
    auto query = bind_->render(text);
    spdlog::trace("pgbind: query {}", trimSql(query.sql));

    auto rows = handle_->query(query, stop);
    traceStatement(query, rows ? Error{} : rows.error());
    if (!rows) {
        logFailure(query, rows.error());
        return notFound(rows.error());
    }

    auto row = firstRow(rows.value());
    if (!row) {
        return notFound(row.error());
    }
    return notFound(fn(row.value()));
}

Result<void> Connection::queryRows(std::string_view text, const RowFn& fn, std::stop_token stop) {
    auto query = bind_->render(text);
    spdlog::trace("pgbind: query {}", trimSql(query.sql));

    auto rows = handle_->query(query, stop);
    traceStatement(query, rows ? Error{} : rows.error());
    if (!rows) {
        logFailure(query, rows.error());
        return notFound(rows.error());
    }

    auto& set = rows.value();
    while (true) {
        PGBIND_TRY_UNWRAP(hasRow, set.next());
        if (!hasRow) {
            break;
        }
        PGBIND_TRY(fn(set.row()));
    }
    return {};
}

void Connection::traceStatement(const Query& query, const Error& error) const {
    if (trace_) {
        trace_(trimSql(query.sql), query.args, error);
    }
}

Result<void> Connection::finishTx(Transaction& txn, const Result<void>& outcome,
                                  std::stop_token stop) {
    if (!outcome) {
        spdlog::debug("pgbind: rolling back transaction: {}", outcome.error().message);
        // Rollback runs even when stop has been requested
        return joinErrors(outcome, txn.rollback({}));
    }
    auto committed = txn.commit(stop);
    if (!committed) {
        spdlog::debug("pgbind: commit failed: {}", committed.error().message);
    }
    return joinErrors(outcome, committed);
}

void Connection::rollbackAfterException(Transaction& txn) {
    auto rolled = txn.rollback({});
    if (!rolled) {
        spdlog::warn("pgbind: rollback after exception failed: {}", rolled.error().message);
    }
}

} // namespace pgbind
