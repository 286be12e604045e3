// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <pgbind/core/types.h>
#include <pgbind/driver/driver.h>

#include <memory>
#include <mutex>
#include <stop_token>
#include <string_view>

namespace pgbind {

/**
 * @brief LISTEN/NOTIFY subscription on one dedicated connection
 *
 * The first listen() takes a connection out of the source and keeps it until close(). close()
 * force-closes that connection before handing it back, so a connection still subscribed to a
 * channel is never reused. All operations are serialised by one mutex: a pending
 * waitForNotification() blocks every other call until it returns.
 */
class Listener {
public:
    explicit Listener(std::shared_ptr<ConnectionSource> source);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;
    Listener(Listener&&) = delete;
    Listener& operator=(Listener&&) = delete;

    // Subscribe to topic, acquiring the dedicated connection if none is held
    Result<void> listen(std::string_view topic, std::stop_token stop = {});

    // Fails with InvalidState when no connection is held
    Result<void> unlisten(std::string_view topic, std::stop_token stop = {});

    // Block until a notification arrives or stop is requested
    Result<Notification> waitForNotification(std::stop_token stop = {});

    // Force-close and release the held connection; a no-op when none is held
    Result<void> close();

    [[nodiscard]] bool isListening() const;

private:
    std::shared_ptr<ConnectionSource> source_;
    std::unique_ptr<DedicatedConnection> conn_;
    mutable std::mutex mutex_;

    Result<void> closeLocked();
};

} // namespace pgbind
