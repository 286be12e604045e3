// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/postgres/pg_connection.h>

#include <chrono>
#include <functional>
#include <memory>

namespace pgbind::postgres {

/**
 * @brief A PgConnection checked out of a PgPool
 *
 * Destroying it hands the connection back through returnFunc; the pool decides whether to
 * keep it.
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<PgConnection> conn,
                     std::function<void(PooledConnection*)> returnFunc,
                     std::chrono::steady_clock::time_point createdAt);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
    PooledConnection(PooledConnection&&) = delete;
    PooledConnection& operator=(PooledConnection&&) = delete;

    PgConnection* operator->() { return conn_.get(); }
    const PgConnection* operator->() const { return conn_.get(); }
    PgConnection& operator*() { return *conn_; }
    const PgConnection& operator*() const { return *conn_; }

    [[nodiscard]] bool isValid() const { return conn_ != nullptr; }

    [[nodiscard]] std::chrono::steady_clock::time_point lastAccessed() const {
        return lastAccessed_;
    }

    [[nodiscard]] std::chrono::steady_clock::time_point createdAt() const { return createdAt_; }

    void touch() { lastAccessed_ = std::chrono::steady_clock::now(); }

private:
    friend class PgPool;

    std::unique_ptr<PgConnection> conn_;
    std::function<void(PooledConnection*)> returnFunc_;
    std::chrono::steady_clock::time_point lastAccessed_{std::chrono::steady_clock::now()};
    std::chrono::steady_clock::time_point createdAt_;
    bool returned_ = false;
};

} // namespace pgbind::postgres
