// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/core/types.h>
#include <pgbind/driver/driver.h>

#include <sqlite3.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

namespace pgbind::sqlite {

/**
 * @brief Database open mode
 */
enum class OpenMode {
    ReadWrite, ///< Existing database, read-write
    ReadOnly,  ///< Existing database, read-only
    Create,    ///< Create if not exists (default)
    Memory     ///< Private in-memory database
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Prepare the first statement of sql
     *
     * tail receives the offset of the remaining text. The result is empty (no statement) when the
     * prepared text was only whitespace or comments.
     */
    static Result<Statement> prepare(sqlite3* db, std::string_view sql, std::size_t& tail);

    [[nodiscard]] bool empty() const noexcept { return stmt_ == nullptr; }

    /**
     * @brief Bind every `@name`, `:name` or `$name` parameter from args
     *
     * Names without a binding, and anonymous parameters, bind NULL.
     */
    Result<void> bindArgs(const NamedArgs& args);

    /**
     * @brief Step through results
     *
     * Lock contention is retried with backoff, but only until the first row has been returned.
     * @return true if a row is available, false when done
     */
    Result<bool> step();

    [[nodiscard]] int columnCount() const;
    [[nodiscard]] std::string columnName(int column) const;

    // Current row in the driver's text form
    [[nodiscard]] Row row(const Row::Columns& columns) const;

private:
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    sqlite3_stmt* stmt_ = nullptr;
    bool producedRow_ = false;

    Result<void> bindValue(int index, const Value& value);
};

/**
 * @brief A TxHandle over one SQLite connection
 *
 * Statements are serialised by a mutex. Transactions at every depth are savepoints on the same
 * connection, so a statement issued on the database while a transaction is open runs inside
 * that transaction. A stop request interrupts the running statement.
 */
class Database : public TxHandle, public std::enable_shared_from_this<Database> {
public:
    ~Database() override;

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) = delete;
    Database& operator=(Database&&) = delete;

    /**
     * @brief Open a database; ":memory:" or OpenMode::Memory gives a private in-memory one
     */
    static Result<std::shared_ptr<Database>> open(const std::string& path,
                                                  OpenMode mode = OpenMode::Create);

    Result<void> exec(const Query& query, std::stop_token stop) override;
    Result<RowSet> query(const Query& query, std::stop_token stop) override;
    Result<std::unique_ptr<Transaction>> begin(std::stop_token stop) override;

    // Execute sql with no variables
    Result<void> execute(std::string_view sql);

    void close();

    [[nodiscard]] bool isOpen() const;

    [[nodiscard]] const std::string& path() const { return path_; }

    [[nodiscard]] int64_t lastInsertRowId() const;

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);

    Result<bool> tableExists(std::string_view table);

    static std::string version();

private:
    Database() = default;

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> savepointSeq_{0};

    // Run every statement in sql; rows of the last statement that returns columns are kept
    Result<RowSet> run(std::string_view sql, const NamedArgs& args, std::stop_token stop);
    Result<RowSet> runLocked(std::string_view sql, const NamedArgs& args);

    std::string errorMessage() const;
};

} // namespace pgbind::sqlite
