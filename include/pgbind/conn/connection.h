// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/bind/bind.h>
#include <pgbind/conn/capabilities.h>
#include <pgbind/conn/op.h>
#include <pgbind/core/types.h>
#include <pgbind/driver/driver.h>

#include <concepts>
#include <functional>
#include <initializer_list>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace pgbind {

/**
 * @brief Called once per executed statement with the rendered SQL, the bound arguments and the
 * outcome (code Success when the statement succeeded)
 */
using TraceFn =
    std::function<void(std::string_view sql, const NamedArgs& args, const Error& error)>;

/**
 * @brief One logical database session: a transaction handle plus its own bind variables
 *
 * Every operation asks the caller's Selector/Writer for SQL text, expands it against the bind
 * variables, executes it on the handle and scans the result into the Reader. Zero rows where
 * one row was expected is reported as NotFound; every other error passes through unchanged.
 *
 * with() and tx() fork the bind variables, so a fork never sees later changes to its parent or
 * the other way round. Forks share the handle; statements issued concurrently on forks of the
 * same handle must be serialised by the caller.
 *
 * Example:
 * @code
 * auto conn = pool->connection();
 * Item item;
 * auto result = conn.with({{"id", 42}}).get(item, item);
 * if (!result && result.error().code == ErrorCode::NotFound) { ... }
 * @endcode
 */
class Connection {
public:
    explicit Connection(std::shared_ptr<TxHandle> handle, std::unique_ptr<Bind> bind = nullptr,
                        TraceFn trace = {});

    // Move-only
    Connection(Connection&&) noexcept = default;
    Connection& operator=(Connection&&) noexcept = default;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief A connection on the same handle with the given variables overlaid on a copy of
     * this connection's variables
     */
    [[nodiscard]] Connection with(std::initializer_list<BindPair> pairs) const;

    [[nodiscard]] Bind& bind() const noexcept { return *bind_; }
    [[nodiscard]] const std::shared_ptr<TxHandle>& handle() const noexcept { return handle_; }

    void setTrace(TraceFn trace) { trace_ = std::move(trace); }

    /**
     * @brief Run fn inside a transaction nested in this connection's handle
     *
     * fn receives a connection on the new transaction with a copy of the bind variables. When fn
     * fails the transaction is rolled back and the result joins fn's error with any rollback
     * error; otherwise the transaction is committed and any commit error is returned. If fn
     * throws, the transaction is rolled back and the exception propagates.
     */
    template <typename Fn>
    requires std::invocable<Fn&, Connection&> Result<void> tx(Fn&& fn, std::stop_token stop = {}) {
        auto begun = handle_->begin(stop);
        if (!begun) {
            return begun.error();
        }
        std::shared_ptr<Transaction> txn = std::move(begun).value();
        Connection child(txn, bind_->copy(), trace_);

        Result<void> outcome;
        try {
            outcome = notFound(std::invoke(fn, child));
        } catch (...) {
            rollbackAfterException(*txn);
            throw;
        }
        return finishTx(*txn, outcome, stop);
    }

    // Execute a statement that returns no rows
    Result<void> exec(std::string_view query, std::stop_token stop = {});

    // Insert the writer's fields and scan the returned row into reader
    template <Reader R, Writer W>
    Result<void> insert(R& reader, const W& writer, std::stop_token stop = {}) {
        auto query = writer.insert(*bind_);
        if (!query) {
            return query.error();
        }
        return queryRow(
            query.value(), [&reader](const Row& row) { return reader.scan(row); }, stop);
    }

    // Update the row chosen by selector with the writer's fields and scan the returned row
    template <Reader R, Selector S, Writer W>
    Result<void> patch(R& reader, const S& selector, const W& writer, std::stop_token stop = {}) {
        auto query = selector.select(*bind_, Op::Patch);
        if (!query) {
            return query.error();
        }
        auto patched = writer.patch(*bind_);
        if (!patched) {
            return patched.error();
        }
        return queryRow(
            query.value(), [&reader](const Row& row) { return reader.scan(row); }, stop);
    }

    // Delete the row chosen by selector and scan its prior values
    template <Reader R, Selector S>
    Result<void> remove(R& reader, const S& selector, std::stop_token stop = {}) {
        return selectRow(reader, selector, Op::Delete, stop);
    }

    template <Reader R, Selector S>
    Result<void> get(R& reader, const S& selector, std::stop_token stop = {}) {
        return selectRow(reader, selector, Op::Get, stop);
    }

    /**
     * @brief Scan every row of the selector's list statement into reader
     *
     * The groupby, orderby and offsetlimit variables are reset before the selector runs and
     * appended to its statement in that order. A ListReader first receives the row count of the
     * statement with only the groupby fragment applied.
     */
    template <Reader R, Selector S>
    Result<void> list(R& reader, const S& selector, std::stop_token stop = {}) {
        bind_->set(kGroupByKey, "");
        bind_->set(kOrderByKey, "");
        bind_->set(kOffsetLimitKey, "");

        auto query = selector.select(*bind_, Op::List);
        if (!query) {
            return notFound(query.error());
        }

        if constexpr (ListReader<R>) {
            auto counted = queryRow(
                countQuery(query.value()),
                [&reader](const Row& row) { return reader.scanCount(row); }, stop);
            if (!counted) {
                return counted;
            }
        }

        return queryRows(
            listQuery(query.value()), [&reader](const Row& row) { return reader.scan(row); },
            stop);
    }

    // Statement used for the row count of a list
    static std::string countQuery(std::string_view query);

    // Statement used for the rows of a list
    static std::string listQuery(std::string_view query);

private:
    using RowFn = std::function<Result<void>(const Row&)>;

    std::shared_ptr<TxHandle> handle_;
    std::unique_ptr<Bind> bind_;
    TraceFn trace_;

    template <Reader R, Selector S>
    Result<void> selectRow(R& reader, const S& selector, Op op, std::stop_token stop) {
        auto query = selector.select(*bind_, op);
        if (!query) {
            return query.error();
        }
        return queryRow(
            query.value(), [&reader](const Row& row) { return reader.scan(row); }, stop);
    }

    Result<void> queryRow(std::string_view query, const RowFn& fn, std::stop_token stop);
    Result<void> queryRows(std::string_view query, const RowFn& fn, std::stop_token stop);
    void traceStatement(const Query& query, const Error& error) const;

    Result<void> finishTx(Transaction& txn, const Result<void>& outcome, std::stop_token stop);
    static void rollbackAfterException(Transaction& txn);
};

} // namespace pgbind
