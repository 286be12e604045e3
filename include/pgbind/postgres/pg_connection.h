// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/bind/bind.h>
#include <pgbind/core/types.h>
#include <pgbind/driver/driver.h>
#include <pgbind/postgres/named_args.h>

#include <libpq-fe.h>
#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace pgbind::postgres {

/**
 * @brief One libpq connection driven in non-blocking mode
 *
 * Every round trip polls the socket in short slices so a stop request is noticed promptly;
 * a stop while a statement is running sends a cancel request and drains the connection before
 * returning OperationCancelled. Results are materialised in text form.
 */
class PgConnection {
public:
    ~PgConnection();

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;
    PgConnection(PgConnection&&) = delete;
    PgConnection& operator=(PgConnection&&) = delete;

    /**
     * @brief Connect using a libpq conninfo string
     */
    static Result<std::unique_ptr<PgConnection>> connect(const std::string& conninfo,
                                                         std::chrono::milliseconds timeout,
                                                         std::stop_token stop);

    /**
     * @brief Execute a statement with `@name` parameters bound from query.args
     *
     * Statements without parameters go through the simple query protocol, so they may
     * contain several commands; rows of the last command are returned.
     */
    Result<RowSet> execute(const Query& query, std::stop_token stop);

    // Execute sql with no parameters
    Result<RowSet> execute(std::string_view sql, std::stop_token stop);

    // Block until a notification arrives on a LISTEN channel or stop is requested
    Result<Notification> waitForNotification(std::stop_token stop);

    // Close the socket now; the object stays valid but unusable
    void close();

    [[nodiscard]] bool isOpen() const noexcept { return conn_ != nullptr; }

    // Open, not marked broken, and not inside a transaction block
    [[nodiscard]] bool isReusable() const;

    [[nodiscard]] int serverVersion() const;

private:
    PgConnection() = default;

    PGconn* conn_ = nullptr;
    bool broken_ = false;

    Result<RowSet> send(const PositionalQuery& query, std::stop_token stop);
    Result<void> flush(std::stop_token stop);
    Result<RowSet> collect(std::stop_token stop);

    // Wait until the socket is readable (or writable); false when stop was requested
    Result<bool> waitSocket(bool forWrite, std::stop_token stop,
                            std::optional<std::chrono::steady_clock::time_point> deadline = {});

    void cancel();
    void drain();
    Error connectionError(ErrorCode code, std::string_view what);
};

/**
 * @brief Error from a failed result: server message plus SQLSTATE
 */
Error resultError(const PGresult* result);

} // namespace pgbind::postgres
