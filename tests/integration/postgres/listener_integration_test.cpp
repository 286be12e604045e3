// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <pgbind/config/config_helpers.h>
#include <pgbind/config/connection_options.h>
#include <pgbind/conn/listener.h>
#include <pgbind/postgres/pg_pool.h>

#include <chrono>
#include <cstdlib>
#include <thread>
#include <unistd.h>

#include <fmt/format.h>

using namespace pgbind;
using namespace pgbind::postgres;
using namespace std::chrono_literals;

class ListenerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::getenv("PGBIND_CONFIG")) {
            GTEST_SKIP() << "PGBIND_CONFIG not set";
        }
        auto options = config::loadConnectionOptions(config::resolve_config_path());
        ASSERT_TRUE(options.has_value()) << options.error().message;
        options.value().set("pool_max_conns", "2");

        PgPoolConfig config;
        config.acquireTimeout = 500ms;
        config.maintenanceInterval = std::chrono::seconds(0);
        auto pool = PgPool::create(options.value(), config);
        ASSERT_TRUE(pool.has_value()) << pool.error().message;
        pool_ = pool.value();
        channel_ = fmt::format("pgbind_events_{}", ::getpid());
    }

    Result<void> notify(std::string_view payload) {
        return pool_->exec(Query{"SELECT pg_notify(@channel, @payload)",
                                 {{"channel", Value(channel_)}, {"payload", Value(payload)}}},
                           {});
    }

    std::shared_ptr<PgPool> pool_;
    std::string channel_;
};

TEST_F(ListenerIntegrationTest, ReceivesNotification) {
    auto listener = pool_->listener();
    ASSERT_TRUE(listener->listen(channel_).has_value());
    EXPECT_TRUE(listener->isListening());

    ASSERT_TRUE(notify("hello").has_value());

    std::stop_source stop;
    std::jthread watchdog([&stop](std::stop_token done) {
        for (int i = 0; i < 100 && !done.stop_requested(); ++i) {
            std::this_thread::sleep_for(50ms);
        }
        stop.request_stop();
    });

    auto note = listener->waitForNotification(stop.get_token());
    ASSERT_TRUE(note.has_value()) << note.error().message;
    EXPECT_EQ(note.value().channel, channel_);
    EXPECT_EQ(note.value().payloadString(), "hello");
}

TEST_F(ListenerIntegrationTest, WaitIsCancellable) {
    auto listener = pool_->listener();
    ASSERT_TRUE(listener->listen(channel_).has_value());

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(200ms);
        stop.request_stop();
    });

    auto note = listener->waitForNotification(stop.get_token());
    ASSERT_FALSE(note.has_value());
    EXPECT_EQ(note.error().code, ErrorCode::OperationCancelled);
}

TEST_F(ListenerIntegrationTest, CloseDiscardsConnection) {
    auto listener = pool_->listener();
    ASSERT_TRUE(listener->listen(channel_).has_value());
    EXPECT_EQ(pool_->getStats().activeConnections, 1u);

    ASSERT_TRUE(listener->close().has_value());
    EXPECT_FALSE(listener->isListening());

    auto stats = pool_->getStats();
    EXPECT_EQ(stats.activeConnections, 0u);
    EXPECT_GE(stats.discardedConnections, 1u);
    EXPECT_TRUE(pool_->ping().has_value());
}

TEST_F(ListenerIntegrationTest, UnlistenStopsDelivery) {
    auto listener = pool_->listener();
    ASSERT_TRUE(listener->listen(channel_).has_value());
    ASSERT_TRUE(listener->unlisten(channel_).has_value());
    ASSERT_TRUE(notify("ignored").has_value());

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(300ms);
        stop.request_stop();
    });

    auto note = listener->waitForNotification(stop.get_token());
    ASSERT_FALSE(note.has_value());
    EXPECT_EQ(note.error().code, ErrorCode::OperationCancelled);
}
