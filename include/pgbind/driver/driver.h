// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/bind/bind.h>
#include <pgbind/core/types.h>
#include <pgbind/driver/row.h>

#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace pgbind {

class Transaction;

/**
 * @brief Something statements can be issued on: a pool, a connection or an open transaction
 *
 * A handle is not safe for concurrent statement issuance unless the implementation says
 * otherwise. Every call observes its stop token and returns OperationCancelled when a stop is
 * requested while it is in flight.
 */
class TxHandle {
public:
    virtual ~TxHandle() = default;

    // Execute a statement, discarding any rows
    virtual Result<void> exec(const Query& query, std::stop_token stop) = 0;

    // Execute a statement and return its rows
    virtual Result<RowSet> query(const Query& query, std::stop_token stop) = 0;

    // Begin a transaction, nested inside this one when the handle is itself a transaction
    virtual Result<std::unique_ptr<Transaction>> begin(std::stop_token stop) = 0;
};

/**
 * @brief An open transaction
 *
 * Destroying a transaction that was neither committed nor rolled back rolls it back.
 */
class Transaction : public TxHandle {
public:
    virtual Result<void> commit(std::stop_token stop) = 0;
    virtual Result<void> rollback(std::stop_token stop) = 0;
};

/**
 * @brief A server notification delivered on a LISTEN channel
 */
struct Notification {
    std::string channel;
    std::vector<std::byte> payload;

    [[nodiscard]] std::string payloadString() const {
        return std::string(reinterpret_cast<const char*>(payload.data()), payload.size());
    }
};

/**
 * @brief A physical connection taken out of general rotation
 *
 * Destroying it hands it back to its source. After forceClose() the source discards it
 * instead of reusing it.
 */
class DedicatedConnection {
public:
    virtual ~DedicatedConnection() = default;

    virtual Result<void> exec(std::string_view sql, std::stop_token stop) = 0;

    // Block until a notification arrives or stop is requested
    virtual Result<Notification> waitForNotification(std::stop_token stop) = 0;

    virtual Result<void> forceClose() = 0;
};

class ConnectionSource {
public:
    virtual ~ConnectionSource() = default;

    virtual Result<std::unique_ptr<DedicatedConnection>> acquire(std::stop_token stop) = 0;
};

} // namespace pgbind
