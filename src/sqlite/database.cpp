// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <chrono>
#include <limits>
#include <thread>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <pgbind/sqlite/database.h>

namespace pgbind::sqlite {

namespace {

Error cancelled() {
    return Error{ErrorCode::OperationCancelled, "statement interrupted"};
}

/**
 * @brief Savepoint on a shared Database
 *
 * Commit releases the savepoint; rollback rolls back to it and then releases it so the
 * enclosing transaction continues.
 */
class SavepointTransaction final : public Transaction {
public:
    SavepointTransaction(std::shared_ptr<Database> db, std::string name)
        : db_(std::move(db)), name_(std::move(name)) {}

    ~SavepointTransaction() override {
        if (!finished_) {
            auto result = rollback({});
            if (!result) {
                spdlog::warn("pgbind: implicit rollback of {} failed: {}", name_,
                             result.error().message);
            }
        }
    }

    Result<void> exec(const Query& query, std::stop_token stop) override {
        return db_->exec(query, stop);
    }

    Result<RowSet> query(const Query& query, std::stop_token stop) override {
        return db_->query(query, stop);
    }

    Result<std::unique_ptr<Transaction>> begin(std::stop_token stop) override {
        if (finished_) {
            return Error{ErrorCode::InvalidState, "transaction already finished"};
        }
        return db_->begin(stop);
    }

    Result<void> commit(std::stop_token stop) override {
        if (finished_) {
            return Error{ErrorCode::InvalidState, "transaction already finished"};
        }
        finished_ = true;
        auto result = db_->exec(Query{"RELEASE SAVEPOINT " + name_, {}}, stop);
        if (!result) {
            // Leave nothing half-open behind a failed release
            auto undo =
                db_->execute("ROLLBACK TO SAVEPOINT " + name_ + "; RELEASE SAVEPOINT " + name_);
            return joinErrors(Error{ErrorCode::TransactionFailed, result.error().message},
                              undo.status());
        }
        spdlog::debug("pgbind: released savepoint {}", name_);
        return {};
    }

    Result<void> rollback(std::stop_token stop) override {
        if (finished_) {
            return Error{ErrorCode::InvalidState, "transaction already finished"};
        }
        finished_ = true;
        auto result = db_->exec(
            Query{"ROLLBACK TO SAVEPOINT " + name_ + "; RELEASE SAVEPOINT " + name_, {}}, stop);
        if (!result) {
            return Error{ErrorCode::TransactionFailed, result.error().message};
        }
        spdlog::debug("pgbind: rolled back savepoint {}", name_);
        return {};
    }

private:
    std::shared_ptr<Database> db_;
    std::string name_;
    bool finished_ = false;
};

} // namespace

// Statement implementation
Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : stmt_(other.stmt_), producedRow_(other.producedRow_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        producedRow_ = other.producedRow_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<Statement> Statement::prepare(sqlite3* db, std::string_view sql, std::size_t& tail) {
    sqlite3_stmt* stmt = nullptr;
    const char* end = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt, &end);
    if (rc != SQLITE_OK) {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
        return Error{ErrorCode::DatabaseError,
                     "Failed to prepare statement: " + std::string(sqlite3_errmsg(db))};
    }
    tail = end ? static_cast<std::size_t>(end - sql.data()) : sql.size();
    return Statement(stmt);
}

Result<void> Statement::bindArgs(const NamedArgs& args) {
    int count = sqlite3_bind_parameter_count(stmt_);
    for (int index = 1; index <= count; ++index) {
        const char* name = sqlite3_bind_parameter_name(stmt_, index);
        const Value* value = nullptr;
        if (name && name[0] != '?' && name[0] != '\0') {
            auto it = args.find(std::string_view(name + 1));
            if (it != args.end()) {
                value = &it->second;
            }
        }
        auto result = value ? bindValue(index, *value) : bindValue(index, Value{});
        if (!result) {
            return result;
        }
    }
    return {};
}

Result<void> Statement::bindValue(int index, const Value& value) {
    int rc = SQLITE_OK;
    const auto& storage = value.storage();
    if (value.isNull()) {
        rc = sqlite3_bind_null(stmt_, index);
    } else if (const auto* b = std::get_if<bool>(&storage)) {
        rc = sqlite3_bind_int(stmt_, index, *b ? 1 : 0);
    } else if (const auto* i = std::get_if<int64_t>(&storage)) {
        rc = sqlite3_bind_int64(stmt_, index, *i);
    } else if (const auto* u = std::get_if<uint64_t>(&storage)) {
        if (*u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            auto text = std::to_string(*u);
            rc = sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()),
                                   SQLITE_TRANSIENT);
        } else {
            rc = sqlite3_bind_int64(stmt_, index, static_cast<int64_t>(*u));
        }
    } else if (const auto* d = std::get_if<double>(&storage)) {
        rc = sqlite3_bind_double(stmt_, index, *d);
    } else if (const auto* s = std::get_if<std::string>(&storage)) {
        rc = sqlite3_bind_text(stmt_, index, s->c_str(), static_cast<int>(s->size()),
                               SQLITE_TRANSIENT);
    } else {
        // Sequences bind as a JSON array, usable with json_each()
        auto text = value.toJson().dump();
        rc = sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()),
                               SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     fmt::format("Failed to bind parameter {}: {}", index, sqlite3_errstr(rc))};
    }
    return {};
}

Result<bool> Statement::step() {
    // Retry transient lock errors (SQLITE_BUSY, SQLITE_LOCKED). A reset restarts the statement,
    // so once rows have been handed out the error is returned instead.
    constexpr int kMaxRetries = 5;
    auto backoff = std::chrono::milliseconds(10);

    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            producedRow_ = true;
            return true;
        } else if (rc == SQLITE_DONE) {
            return false;
        }
        if (rc == SQLITE_INTERRUPT) {
            return cancelled();
        }
        if ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && !producedRow_ &&
            attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        std::string message = sqlite3_errmsg(sqlite3_db_handle(stmt_));
        return Error{ErrorCode::DatabaseError, "Failed to step statement: " + message};
    }
    return Error{ErrorCode::DatabaseError, "Failed to step statement: max retries exceeded"};
}

int Statement::columnCount() const {
    return sqlite3_column_count(stmt_);
}

std::string Statement::columnName(int column) const {
    const char* name = sqlite3_column_name(stmt_, column);
    return name ? name : "";
}

Row Statement::row(const Row::Columns& columns) const {
    int count = columnCount();
    std::vector<Row::Cell> cells;
    cells.reserve(static_cast<std::size_t>(count));
    for (int column = 0; column < count; ++column) {
        switch (sqlite3_column_type(stmt_, column)) {
            case SQLITE_NULL:
                cells.emplace_back(std::nullopt);
                break;
            case SQLITE_INTEGER:
                cells.emplace_back(std::to_string(sqlite3_column_int64(stmt_, column)));
                break;
            case SQLITE_FLOAT:
                cells.emplace_back(fmt::format("{}", sqlite3_column_double(stmt_, column)));
                break;
            default: {
                const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt_, column));
                int size = sqlite3_column_bytes(stmt_, column);
                cells.emplace_back(data ? std::string(data, static_cast<std::size_t>(size))
                                        : std::string{});
                break;
            }
        }
    }
    return Row(columns, std::move(cells));
}

// Database implementation
Database::~Database() {
    close();
}

Result<std::shared_ptr<Database>> Database::open(const std::string& path, OpenMode mode) {
    int flags = 0;
    switch (mode) {
        case OpenMode::ReadOnly:
            flags = SQLITE_OPEN_READONLY;
            break;
        case OpenMode::ReadWrite:
            flags = SQLITE_OPEN_READWRITE;
            break;
        case OpenMode::Create:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case OpenMode::Memory:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }
    flags |= SQLITE_OPEN_FULLMUTEX;

    std::shared_ptr<Database> db(new Database());
    int rc = sqlite3_open_v2(path.c_str(), &db->db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db->db_ ? sqlite3_errmsg(db->db_) : "Unknown error";
        return Error{ErrorCode::ConnectionFailed, "Failed to open database: " + error};
    }

    // Avoid indefinite blocking on a locked file
    sqlite3_busy_timeout(db->db_, 5000);
    db->path_ = path;
    spdlog::debug("pgbind: opened sqlite database {}", path);
    return db;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Result<void> Database::exec(const Query& query, std::stop_token stop) {
    auto result = run(query.sql, query.args, stop);
    if (!result) {
        return result.error();
    }
    return {};
}

Result<RowSet> Database::query(const Query& query, std::stop_token stop) {
    return run(query.sql, query.args, stop);
}

Result<std::unique_ptr<Transaction>> Database::begin(std::stop_token stop) {
    auto name = fmt::format("pgbind_sp_{}", ++savepointSeq_);
    auto result = exec(Query{"SAVEPOINT " + name, {}}, stop);
    if (!result) {
        return Error{ErrorCode::TransactionFailed, result.error().message};
    }
    spdlog::debug("pgbind: began savepoint {}", name);
    return std::unique_ptr<Transaction>(
        std::make_unique<SavepointTransaction>(shared_from_this(), std::move(name)));
}

Result<void> Database::execute(std::string_view sql) {
    auto result = run(sql, {}, {});
    if (!result) {
        return result.error();
    }
    return {};
}

Result<RowSet> Database::run(std::string_view sql, const NamedArgs& args, std::stop_token stop) {
    if (stop.stop_requested()) {
        return cancelled();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    sqlite3* handle = db_;
    std::stop_callback interrupt(stop, [handle] { sqlite3_interrupt(handle); });
    auto result = runLocked(sql, args);
    if (!result && stop.stop_requested()) {
        return cancelled();
    }
    return result;
}

Result<RowSet> Database::runLocked(std::string_view sql, const NamedArgs& args) {
    std::vector<Row> rows;
    Row::Columns columns;

    std::size_t offset = 0;
    while (offset < sql.size()) {
        std::size_t tail = 0;
        auto prepared = Statement::prepare(db_, sql.substr(offset), tail);
        if (!prepared) {
            return prepared.error();
        }
        offset += tail;
        if (tail == 0) {
            break;
        }

        auto stmt = std::move(prepared).value();
        if (stmt.empty()) {
            continue;
        }
        auto bound = stmt.bindArgs(args);
        if (!bound) {
            return bound.error();
        }

        bool collect = stmt.columnCount() > 0;
        if (collect) {
            auto names = std::make_shared<std::vector<std::string>>();
            for (int column = 0; column < stmt.columnCount(); ++column) {
                names->push_back(stmt.columnName(column));
            }
            columns = std::move(names);
            rows.clear();
        }

        while (true) {
            auto stepped = stmt.step();
            if (!stepped) {
                if (collect && !rows.empty()) {
                    // Surface the failure after the rows already produced
                    return RowSet(std::move(rows), stepped.error());
                }
                return stepped.error();
            }
            if (!stepped.value()) {
                break;
            }
            if (collect) {
                rows.push_back(stmt.row(columns));
            }
        }
    }
    return RowSet(std::move(rows));
}

int64_t Database::lastInsertRowId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to set busy timeout: " + errorMessage()};
    }
    return {};
}

Result<bool> Database::tableExists(std::string_view table) {
    auto rows = query(
        Query{"SELECT 1 FROM sqlite_master WHERE type='table' AND name=@name", {{"name", table}}},
        {});
    if (!rows) {
        return rows.error();
    }
    return rows.value().size() > 0;
}

std::string Database::version() {
    return sqlite3_libversion();
}

std::string Database::errorMessage() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace pgbind::sqlite
