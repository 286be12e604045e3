// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/config/connection_options.h>
#include <pgbind/conn/connection.h>
#include <pgbind/conn/listener.h>
#include <pgbind/driver/driver.h>
#include <pgbind/postgres/pooled_connection.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace pgbind::postgres {

/**
 * @brief Configuration for connection pool
 */
struct PgPoolConfig {
    size_t minConnections = 0;                       ///< Connections opened up front and kept warm
    std::chrono::milliseconds connectTimeout{10000}; ///< Connection establishment timeout
    std::chrono::milliseconds acquireTimeout{30000}; ///< Wait for a free connection
    std::chrono::seconds idleTimeout{300};           ///< Idle connection timeout
    std::chrono::seconds maxConnectionAge{3600};     ///< Maximum connection age before refresh
    std::chrono::seconds maintenanceInterval{60};    ///< Prune and top-up period; zero disables
    NamedArgs binds;                                 ///< Seed variables for every connection()
    TraceFn trace;                                   ///< Statement trace for every connection()
};

/**
 * @brief Thread-safe pool of libpq connections
 *
 * The pool is itself a TxHandle: exec() and query() borrow a connection for one statement,
 * begin() holds one for the life of the transaction. As a ConnectionSource it hands out
 * dedicated connections for LISTEN. Connections that come back broken, closed or still inside
 * a transaction block are discarded.
 */
class PgPool final : public TxHandle,
                     public ConnectionSource,
                     public std::enable_shared_from_this<PgPool> {
public:
    /**
     * @brief Create a pool and open config.minConnections connections
     *
     * The upper bound is options.poolMaxConns().
     */
    static Result<std::shared_ptr<PgPool>> create(const config::ConnectionOptions& options,
                                                  PgPoolConfig config = {},
                                                  std::stop_token stop = {});

    ~PgPool() override;

    PgPool(const PgPool&) = delete;
    PgPool& operator=(const PgPool&) = delete;
    PgPool(PgPool&&) = delete;
    PgPool& operator=(PgPool&&) = delete;

    Result<void> exec(const Query& query, std::stop_token stop) override;
    Result<RowSet> query(const Query& query, std::stop_token stop) override;
    Result<std::unique_ptr<Transaction>> begin(std::stop_token stop) override;

    Result<std::unique_ptr<DedicatedConnection>> acquire(std::stop_token stop) override;

    /**
     * @brief Take a connection out of the pool, opening one if below the limit
     *
     * Waits up to acquireTimeout for a connection to come back. Fails with Timeout when the
     * wait runs out and OperationCancelled when stop is requested first.
     */
    Result<std::unique_ptr<PooledConnection>> acquireConnection(std::stop_token stop);

    // A Connection on this pool seeded with the configured bind variables and trace
    [[nodiscard]] Connection connection();

    [[nodiscard]] std::unique_ptr<Listener> listener();

    Result<void> ping(std::stop_token stop = {});

    /**
     * @brief Stop handing out connections and close the idle ones
     */
    void shutdown();

    struct Stats {
        size_t totalConnections;
        size_t availableConnections;
        size_t activeConnections;
        size_t waitingRequests;
        size_t maxObservedWaiting;
        std::uint64_t totalWaitMicros;
        size_t timeoutCount;
        size_t totalAcquired;
        size_t totalReleased;
        size_t failedAcquisitions;
        size_t discardedConnections;
    };

    [[nodiscard]] Stats getStats() const;

    [[nodiscard]] size_t maxConnections() const noexcept { return maxConnections_; }

    /**
     * @brief Open connections until minConnections are live
     */
    Result<void> healthCheck(std::stop_token stop = {});

    /**
     * @brief Close idle connections past idleTimeout or maxConnectionAge, keeping the minimum
     */
    void pruneIdleConnections();

private:
    PgPool(std::string conninfo, size_t maxConnections, PgPoolConfig config);

    std::string conninfo_;
    size_t maxConnections_;
    PgPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::unique_ptr<PooledConnection>> available_;
    size_t totalConnections_ = 0;
    size_t activeConnections_ = 0;
    std::atomic<size_t> waitingRequests_{0};
    std::atomic<size_t> maxWaitingRequests_{0};
    std::atomic<std::uint64_t> totalWaitMicros_{0};
    std::atomic<size_t> timeoutCount_{0};
    std::atomic<size_t> totalAcquired_{0};
    std::atomic<size_t> totalReleased_{0};
    std::atomic<size_t> failedAcquisitions_{0};
    std::atomic<size_t> discarded_{0};
    bool shutdown_ = false;

    std::mutex maintenanceMutex_;
    std::condition_variable_any maintenanceCv_;
    std::jthread maintenanceThread_;

    Result<void> initialize(std::stop_token stop);
    Result<std::unique_ptr<PgConnection>> createConnection(std::stop_token stop);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<PgConnection> conn,
                                           std::chrono::steady_clock::time_point createdAt);
    void returnConnection(PooledConnection* conn);
    void startMaintenanceThread();
};

} // namespace pgbind::postgres
