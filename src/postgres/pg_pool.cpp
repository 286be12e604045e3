// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <vector>
#include <pgbind/postgres/pg_pool.h>
#include <pgbind/postgres/pg_transaction.h>

namespace pgbind::postgres {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<PgConnection> conn,
                                   std::function<void(PooledConnection*)> returnFunc,
                                   std::chrono::steady_clock::time_point createdAt)
    : conn_(std::move(conn)), returnFunc_(std::move(returnFunc)), createdAt_(createdAt) {}

PooledConnection::~PooledConnection() {
    if (conn_ && returnFunc_ && !returned_) {
        returnFunc_(this);
    }
}

namespace {

/**
 * A pooled connection reserved for LISTEN. Released connections that were not force-closed
 * drop their subscriptions first so the pool can reuse them.
 */
class PgDedicatedConnection final : public DedicatedConnection {
public:
    explicit PgDedicatedConnection(std::unique_ptr<PooledConnection> conn)
        : conn_(std::move(conn)) {}

    ~PgDedicatedConnection() override {
        if (closed_ || !(*conn_)->isOpen()) {
            return;
        }
        auto result = (*conn_)->execute(std::string_view("UNLISTEN *"), std::stop_token{});
        if (!result) {
            spdlog::warn("pgbind: UNLISTEN on release failed, closing connection: {}",
                         result.error().message);
            (*conn_)->close();
        }
    }

    Result<void> exec(std::string_view sql, std::stop_token stop) override {
        if (closed_) {
            return Error{ErrorCode::InvalidState, "connection is closed"};
        }
        conn_->touch();
        auto result = (*conn_)->execute(sql, stop);
        if (!result) {
            return result.error();
        }
        return {};
    }

    Result<Notification> waitForNotification(std::stop_token stop) override {
        if (closed_) {
            return Error{ErrorCode::InvalidState, "connection is closed"};
        }
        conn_->touch();
        return (*conn_)->waitForNotification(stop);
    }

    Result<void> forceClose() override {
        if (!closed_) {
            (*conn_)->close();
            closed_ = true;
        }
        return {};
    }

private:
    std::unique_ptr<PooledConnection> conn_;
    bool closed_ = false;
};

} // namespace

// PgPool implementation
PgPool::PgPool(std::string conninfo, size_t maxConnections, PgPoolConfig config)
    : conninfo_(std::move(conninfo)), maxConnections_(maxConnections), config_(std::move(config)) {}

PgPool::~PgPool() {
    shutdown();
    if (maintenanceThread_.joinable()) {
        maintenanceThread_.join();
    }
}

Result<std::shared_ptr<PgPool>> PgPool::create(const config::ConnectionOptions& options,
                                               PgPoolConfig config, std::stop_token stop) {
    auto maxConns = options.poolMaxConns();
    if (!maxConns) {
        return maxConns.error();
    }
    if (config.minConnections > maxConns.value()) {
        return Error{ErrorCode::BadParameter,
                     fmt::format("minConnections {} exceeds pool_max_conns {}",
                                 config.minConnections, maxConns.value())};
    }

    std::shared_ptr<PgPool> pool(
        new PgPool(options.connInfo(), maxConns.value(), std::move(config)));
    auto init = pool->initialize(stop);
    if (!init) {
        return init.error();
    }
    return pool;
}

Result<void> PgPool::initialize(std::stop_token stop) {
    auto warm = healthCheck(stop);
    if (!warm) {
        return warm.error();
    }
    spdlog::debug("pgbind: connection pool initialized with {} of {} connections",
                  config_.minConnections, maxConnections_);
    startMaintenanceThread();
    return {};
}

void PgPool::shutdown() {
    std::vector<std::unique_ptr<PooledConnection>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;

        for (auto& conn : available_) {
            // Mark connection as returned to prevent callback
            conn->returned_ = true;
            idle.push_back(std::move(conn));
        }
        available_.clear();

        // Checked-out connections are closed by their holders
        totalConnections_ = 0;
        activeConnections_ = 0;
    }
    cv_.notify_all();
    maintenanceThread_.request_stop();
    spdlog::debug("pgbind: connection pool shut down, closed {} idle connections", idle.size());
}

Result<std::unique_ptr<PgConnection>> PgPool::createConnection(std::stop_token stop) {
    return PgConnection::connect(conninfo_, config_.connectTimeout, stop);
}

std::unique_ptr<PooledConnection>
PgPool::wrap(std::unique_ptr<PgConnection> conn, std::chrono::steady_clock::time_point createdAt) {
    std::weak_ptr<PgPool> weak = weak_from_this();
    return std::make_unique<PooledConnection>(
        std::move(conn),
        [weak](PooledConnection* returned) {
            if (auto pool = weak.lock()) {
                pool->returnConnection(returned);
            }
        },
        createdAt);
}

Result<std::unique_ptr<PooledConnection>> PgPool::acquireConnection(std::stop_token stop) {
    // Closed after the lock is released
    std::vector<std::unique_ptr<PooledConnection>> stale;
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    class WaitingRequestGuard {
    public:
        explicit WaitingRequestGuard(PgPool& pool) : pool_(pool) {}
        ~WaitingRequestGuard() { finish(); }

        void activate() {
            if (active_)
                return;
            active_ = true;
            startedAt_ = std::chrono::steady_clock::now();
            const auto current = pool_.waitingRequests_.fetch_add(1, std::memory_order_relaxed) + 1;
            auto previous = pool_.maxWaitingRequests_.load(std::memory_order_relaxed);
            while (current > previous &&
                   !pool_.maxWaitingRequests_.compare_exchange_weak(
                       previous, current, std::memory_order_relaxed, std::memory_order_relaxed)) {
            }
        }

        void markTimeout() { timeout_ = true; }

        void finish() {
            if (!active_)
                return;
            const auto ended = std::chrono::steady_clock::now();
            pool_.waitingRequests_.fetch_sub(1, std::memory_order_relaxed);
            const auto micros =
                std::chrono::duration_cast<std::chrono::microseconds>(ended - startedAt_).count();
            pool_.totalWaitMicros_.fetch_add(static_cast<std::uint64_t>(micros),
                                             std::memory_order_relaxed);
            if (timeout_) {
                pool_.timeoutCount_.fetch_add(1, std::memory_order_relaxed);
            }
            active_ = false;
            timeout_ = false;
        }

    private:
        PgPool& pool_;
        bool active_{false};
        bool timeout_{false};
        std::chrono::steady_clock::time_point startedAt_{};
    } waitingGuard(*this);

    const auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;

    for (;;) {
        while (available_.empty()) {
            if (stop.stop_requested()) {
                failedAcquisitions_++;
                return Error{ErrorCode::OperationCancelled, "connection acquisition cancelled"};
            }

            // Can we create a new connection?
            if (totalConnections_ < maxConnections_) {
                totalConnections_++;
                lock.unlock();
                auto connResult = createConnection(stop);
                lock.lock();

                if (!connResult) {
                    totalConnections_--;
                    failedAcquisitions_++;
                    cv_.notify_one();
                    return connResult.error();
                }
                if (shutdown_) {
                    failedAcquisitions_++;
                    return Error{ErrorCode::InvalidState, "Pool is shut down"};
                }

                activeConnections_++;
                totalAcquired_++;
                return wrap(std::move(connResult).value(), std::chrono::steady_clock::now());
            }

            // Wait for connection to become available
            waitingGuard.activate();
            bool ready = cv_.wait_until(lock, stop, deadline, [this] {
                return !available_.empty() || totalConnections_ < maxConnections_ || shutdown_;
            });
            if (shutdown_) {
                failedAcquisitions_++;
                return Error{ErrorCode::InvalidState, "Pool is shut down"};
            }
            if (!ready) {
                failedAcquisitions_++;
                if (stop.stop_requested()) {
                    return Error{ErrorCode::OperationCancelled,
                                 "connection acquisition cancelled"};
                }
                waitingGuard.markTimeout();
                return Error{ErrorCode::Timeout, "Timeout acquiring connection"};
            }
            waitingGuard.finish();
        }

        auto conn = std::move(available_.front());
        available_.pop_front();

        auto age = std::chrono::steady_clock::now() - conn->createdAt();
        if (!conn->conn_->isReusable() || age >= config_.maxConnectionAge) {
            conn->returned_ = true; // Prevent destructor deadlock
            totalConnections_--;
            discarded_++;
            spdlog::debug("pgbind: discarded stale connection on acquire");
            stale.push_back(std::move(conn));
            continue;
        }

        conn->touch();
        activeConnections_++;
        totalAcquired_++;
        return conn;
    }
}

void PgPool::returnConnection(PooledConnection* conn) {
    if (!conn || !conn->conn_)
        return;

    // A connection that is closed, broken or left inside a transaction is not reused
    bool reusable = conn->conn_->isReusable();
    std::unique_ptr<PgConnection> raw = std::move(conn->conn_);
    conn->returned_ = true;

    std::lock_guard<std::mutex> lock(mutex_);

    // If we're shut down, just discard the connection
    if (shutdown_) {
        spdlog::debug("pgbind: discarding connection during shutdown");
        return;
    }

    activeConnections_--;
    if (!reusable) {
        totalConnections_--;
        discarded_++;
        spdlog::warn("pgbind: returned connection is not reusable, discarding");
        cv_.notify_one();
        return;
    }

    available_.push_back(wrap(std::move(raw), conn->createdAt_));
    totalReleased_++;
    cv_.notify_one();
}

Result<void> PgPool::exec(const Query& query, std::stop_token stop) {
    auto rows = this->query(query, stop);
    if (!rows) {
        return rows.error();
    }
    return {};
}

Result<RowSet> PgPool::query(const Query& query, std::stop_token stop) {
    auto conn = acquireConnection(stop);
    if (!conn) {
        return conn.error();
    }
    auto pooled = std::move(conn).value();
    return (*pooled)->execute(query, stop);
}

Result<std::unique_ptr<Transaction>> PgPool::begin(std::stop_token stop) {
    auto conn = acquireConnection(stop);
    if (!conn) {
        return conn.error();
    }
    auto pooled = std::move(conn).value();
    auto begun = (*pooled)->execute(std::string_view("BEGIN"), stop);
    if (!begun) {
        if (begun.error().code == ErrorCode::OperationCancelled) {
            return begun.error();
        }
        return Error{ErrorCode::TransactionFailed, begun.error().message};
    }
    return std::unique_ptr<Transaction>(std::make_unique<PgTransaction>(std::move(pooled)));
}

Result<std::unique_ptr<DedicatedConnection>> PgPool::acquire(std::stop_token stop) {
    auto conn = acquireConnection(stop);
    if (!conn) {
        return conn.error();
    }
    return std::unique_ptr<DedicatedConnection>(
        std::make_unique<PgDedicatedConnection>(std::move(conn).value()));
}

Connection PgPool::connection() {
    return Connection(shared_from_this(), std::make_unique<Bind>(config_.binds), config_.trace);
}

std::unique_ptr<Listener> PgPool::listener() {
    return std::make_unique<Listener>(shared_from_this());
}

Result<void> PgPool::ping(std::stop_token stop) {
    return exec(Query{"SELECT 1", {}}, stop);
}

PgPool::Stats PgPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    return {totalConnections_,
            available_.size(),
            activeConnections_,
            waitingRequests_.load(std::memory_order_relaxed),
            maxWaitingRequests_.load(std::memory_order_relaxed),
            totalWaitMicros_.load(std::memory_order_relaxed),
            timeoutCount_.load(std::memory_order_relaxed),
            totalAcquired_.load(),
            totalReleased_.load(),
            failedAcquisitions_.load(),
            discarded_.load()};
}

Result<void> PgPool::healthCheck(std::stop_token stop) {
    size_t needed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
        if (totalConnections_ < config_.minConnections) {
            needed = std::min(config_.minConnections - totalConnections_,
                              maxConnections_ - totalConnections_);
        }
        // Reserve the slots while connecting outside the lock
        totalConnections_ += needed;
    }

    if (needed == 0) {
        return {};
    }

    Result<void> status;
    std::vector<std::unique_ptr<PgConnection>> fresh;
    fresh.reserve(needed);
    for (size_t i = 0; i < needed; ++i) {
        auto connResult = createConnection(stop);
        if (!connResult) {
            status = connResult.error();
            break;
        }
        fresh.push_back(std::move(connResult).value());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }
    totalConnections_ -= needed - fresh.size();
    auto now = std::chrono::steady_clock::now();
    for (auto& conn : fresh) {
        available_.push_back(wrap(std::move(conn), now));
    }
    cv_.notify_all();
    return status;
}

void PgPool::pruneIdleConnections() {
    std::vector<std::unique_ptr<PooledConnection>> pruned;
    size_t prunedIdle = 0;
    size_t prunedAge = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::deque<std::unique_ptr<PooledConnection>> keep;
        auto now = std::chrono::steady_clock::now();

        while (!available_.empty()) {
            auto conn = std::move(available_.front());
            available_.pop_front();

            auto age = now - conn->createdAt();
            auto idleTime = now - conn->lastAccessed();
            bool aged = age >= config_.maxConnectionAge;
            bool idle = idleTime >= config_.idleTimeout &&
                        keep.size() + activeConnections_ >= config_.minConnections;

            if (aged || idle) {
                conn->returned_ = true; // Prevent destructor deadlock
                totalConnections_--;
                if (aged) {
                    prunedAge++;
                } else {
                    prunedIdle++;
                }
                pruned.push_back(std::move(conn));
            } else {
                keep.push_back(std::move(conn));
            }
        }

        available_ = std::move(keep);
        if (!pruned.empty()) {
            cv_.notify_all();
        }
    }

    if (prunedIdle > 0 || prunedAge > 0) {
        spdlog::info("pgbind: connection pool pruned {} idle, {} aged connections", prunedIdle,
                     prunedAge);
    }
}

void PgPool::startMaintenanceThread() {
    if (config_.maintenanceInterval.count() <= 0) {
        return;
    }
    maintenanceThread_ = std::jthread([this](std::stop_token st) {
        while (!st.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(maintenanceMutex_);
                maintenanceCv_.wait_for(lock, st, config_.maintenanceInterval, [] { return false; });
            }
            if (st.stop_requested()) {
                break;
            }
            pruneIdleConnections();
            auto topUp = healthCheck(st);
            if (!topUp && topUp.error().code != ErrorCode::OperationCancelled) {
                spdlog::warn("pgbind: connection pool top-up failed: {}", topUp.error().message);
            }
        }
    });
}

} // namespace pgbind::postgres
