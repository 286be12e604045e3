// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/bind/quote.h>
#include <pgbind/conn/listener.h>

#include <spdlog/spdlog.h>

namespace pgbind {

Listener::Listener(std::shared_ptr<ConnectionSource> source) : source_(std::move(source)) {}

Listener::~Listener() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = closeLocked();
    if (!result) {
        spdlog::warn("pgbind: listener close failed: {}", result.error().message);
    }
}

Result<void> Listener::listen(std::string_view topic, std::stop_token stop) {
    if (topic.empty()) {
        return Error{ErrorCode::BadParameter, "listen: empty topic"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_) {
        if (!source_) {
            return Error{ErrorCode::InvalidState, "listener has no connection source"};
        }
        auto acquired = source_->acquire(stop);
        if (!acquired) {
            return acquired.error();
        }
        conn_ = std::move(acquired).value();
        spdlog::debug("pgbind: listener acquired dedicated connection");
    }
    return conn_->exec("LISTEN " + doubleQuote(topic), stop);
}

Result<void> Listener::unlisten(std::string_view topic, std::stop_token stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_) {
        return Error{ErrorCode::InvalidState, "connection is nil"};
    }
    return conn_->exec("UNLISTEN " + doubleQuote(topic), stop);
}

Result<Notification> Listener::waitForNotification(std::stop_token stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_) {
        return Error{ErrorCode::InvalidState, "connection is nil"};
    }
    return conn_->waitForNotification(stop);
}

Result<void> Listener::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeLocked();
}

bool Listener::isListening() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conn_ != nullptr;
}

Result<void> Listener::closeLocked() {
    if (!conn_) {
        return {};
    }

    // A Listen without a matching Unlisten would leave the connection subscribed
    auto closed = conn_->forceClose();

    // Release
    conn_.reset();
    spdlog::debug("pgbind: listener closed dedicated connection");
    return closed;
}

} // namespace pgbind
