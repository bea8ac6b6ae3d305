#include "fake_broker.hpp"

#include "bus/connection_manager.hpp"
#include "bus/errors.hpp"

#include <boost/asio/thread_pool.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using mqtransit::Binding;
using mqtransit::ChannelFailure;
using mqtransit::ConnectionFailure;
using mqtransit::ConnectionManager;
using mqtransit::TransporterConfig;
using mqtransit::test::FakeBroker;
using mqtransit::test::wait_until;

class ConnectionManagerTest : public ::testing::Test {
protected:
    ConnectionManagerTest()
        : pool_(2)
        , manager_(config(), broker_.connector(), pool_) {
    }

    void TearDown() override {
        pool_.join();
    }

    static TransporterConfig config() {
        TransporterConfig config;
        config.url = "amqp://fake";
        config.node_id = "node-1";
        config.prefetch = 5;
        return config;
    }

    FakeBroker broker_;
    boost::asio::thread_pool pool_;
    ConnectionManager manager_;
};

TEST_F(ConnectionManagerTest, ConnectOpensChannelAndSetsPrefetch) {
    std::atomic<bool> on_connected{false};
    manager_.connect([&]() { on_connected = true; }).get();

    EXPECT_TRUE(on_connected.load());
    EXPECT_TRUE(manager_.is_connected());
    EXPECT_EQ(manager_.state(), ConnectionManager::State::Open);
    EXPECT_TRUE(static_cast<bool>(manager_.channel()));
    EXPECT_GE(broker_.index_of("connect amqp://fake"), 0);
    EXPECT_GE(broker_.index_of("prefetch 5"), 0);
}

TEST_F(ConnectionManagerTest, ConnectWhileConnectedIsNoOp) {
    manager_.connect().get();
    manager_.connect().get();
    EXPECT_EQ(broker_.connection_count(), 1u);
}

TEST_F(ConnectionManagerTest, ConnectFailureRejectsWithConnectionFailure) {
    broker_.fail_connect = true;
    auto future = manager_.connect();
    EXPECT_THROW(future.get(), ConnectionFailure);
    EXPECT_FALSE(manager_.is_connected());
    EXPECT_EQ(manager_.state(), ConnectionManager::State::Absent);
}

TEST_F(ConnectionManagerTest, ChannelOpenFailureClosesConnection) {
    broker_.fail_channel_open = true;
    auto future = manager_.connect();
    EXPECT_THROW(future.get(), ChannelFailure);
    EXPECT_FALSE(manager_.is_connected());
    EXPECT_GE(broker_.index_of("connection.close"), 0);
}

TEST_F(ConnectionManagerTest, FailingOnConnectedStepRejectsConnect) {
    auto future = manager_.connect([]() { throw std::runtime_error("subscriptions failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    EXPECT_FALSE(manager_.is_connected());
    EXPECT_EQ(manager_.state(), ConnectionManager::State::Absent);
    EXPECT_FALSE(static_cast<bool>(manager_.channel()));
    EXPECT_GE(broker_.index_of("channel.close"), 0);
    EXPECT_GE(broker_.index_of("connection.close"), 0);

    std::atomic<bool> retried{false};
    manager_.connect([&]() { retried = true; }).get();
    EXPECT_TRUE(retried.load());
    EXPECT_TRUE(manager_.is_connected());
    EXPECT_EQ(broker_.connection_count(), 2u);
}

TEST_F(ConnectionManagerTest, ConnectWhileConnectingWaitsForPendingAttempt) {
    std::promise<void> gate;
    broker_.hold_connect(gate.get_future().share());

    std::atomic<int> on_connected{0};
    auto first = manager_.connect([&]() { on_connected.fetch_add(1); });
    auto second = manager_.connect([&]() { on_connected.fetch_add(1); });
    EXPECT_EQ(manager_.state(), ConnectionManager::State::Connecting);
    EXPECT_EQ(second.wait_for(20ms), std::future_status::timeout);

    gate.set_value();
    second.get();
    EXPECT_TRUE(manager_.is_connected());
    EXPECT_NO_THROW(first.get());
    EXPECT_EQ(on_connected.load(), 1);
    EXPECT_EQ(broker_.connection_count(), 1u);
}

TEST_F(ConnectionManagerTest, ConnectDuringDisconnectIsRejected) {
    manager_.connect().get();
    std::promise<void> gate;
    broker_.hold_channel_close(gate.get_future().share());

    auto stopping = manager_.disconnect();
    ASSERT_TRUE(wait_until([&]() { return broker_.index_of("channel.close") >= 0; }));
    EXPECT_TRUE(manager_.disconnecting());
    EXPECT_THROW(manager_.connect().get(), ConnectionFailure);

    gate.set_value();
    stopping.get();
    EXPECT_FALSE(manager_.disconnecting());

    broker_.hold_channel_close(std::shared_future<void>());
    manager_.connect().get();
    EXPECT_TRUE(manager_.is_connected());
    EXPECT_EQ(broker_.connection_count(), 2u);
}

TEST_F(ConnectionManagerTest, ConnectionErrorMarksDisconnected) {
    manager_.connect().get();
    broker_.last_connection()->emit_error(std::make_exception_ptr(std::runtime_error("socket reset")));

    ASSERT_TRUE(wait_until([&]() { return !manager_.is_connected(); }));
    EXPECT_FALSE(static_cast<bool>(manager_.channel()));
}

TEST_F(ConnectionManagerTest, ConnectionCloseMarksDisconnected) {
    manager_.connect().get();
    broker_.last_connection()->emit_close(std::make_exception_ptr(std::runtime_error("CONNECTION_FORCED")));

    ASSERT_TRUE(wait_until([&]() { return !manager_.is_connected(); }));
}

TEST_F(ConnectionManagerTest, ChannelLossClosesOrphanedConnection) {
    manager_.connect().get();
    auto generation = manager_.channel().generation;
    broker_.last_channel()->emit_close(std::make_exception_ptr(std::runtime_error("PRECONDITION_FAILED")));

    ASSERT_TRUE(wait_until([&]() { return broker_.index_of("connection.close") >= 0; }));
    EXPECT_FALSE(manager_.is_connected());
    EXPECT_EQ(manager_.channel_for(generation), nullptr);
}

TEST_F(ConnectionManagerTest, BlockedNotificationKeepsConnection) {
    manager_.connect().get();
    broker_.last_connection()->emit_blocked("low on memory");
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(manager_.is_connected());
}

TEST_F(ConnectionManagerTest, ReconnectStartsNewGeneration) {
    manager_.connect().get();
    auto first = manager_.channel().generation;
    broker_.last_connection()->emit_close(std::make_exception_ptr(std::runtime_error("gone")));
    ASSERT_TRUE(wait_until([&]() { return !manager_.is_connected(); }));

    manager_.connect().get();
    auto second = manager_.channel().generation;
    EXPECT_NE(first, second);
    EXPECT_EQ(manager_.channel_for(first), nullptr);
    EXPECT_NE(manager_.channel_for(second), nullptr);
    EXPECT_EQ(broker_.connection_count(), 2u);
}

TEST_F(ConnectionManagerTest, DisconnectUnbindsThenClosesChannelThenConnection) {
    manager_.connect().get();
    auto handle = manager_.channel();
    Binding binding{"MOL.EVENT.node-1", "MOL.EVENT", ""};
    handle.channel->bind_queue(binding).get();
    manager_.bindings().add(binding);

    manager_.disconnect().get();

    int unbind = broker_.index_of("unbind MOL.EVENT.node-1 MOL.EVENT");
    int channel_close = broker_.index_of("channel.close");
    int connection_close = broker_.index_of("connection.close");
    ASSERT_GE(unbind, 0);
    EXPECT_LT(unbind, channel_close);
    EXPECT_LT(channel_close, connection_close);

    EXPECT_EQ(manager_.bindings().size(), 0u);
    EXPECT_FALSE(manager_.is_connected());
    EXPECT_EQ(manager_.state(), ConnectionManager::State::Absent);
}

TEST_F(ConnectionManagerTest, DisconnectContinuesPastUnbindFailure) {
    manager_.connect().get();
    manager_.bindings().add(Binding{"MOL.INFO.node-1", "MOL.INFO", ""});
    broker_.fail_unbind = true;

    EXPECT_NO_THROW(manager_.disconnect().get());
    EXPECT_GE(broker_.index_of("channel.close"), 0);
    EXPECT_GE(broker_.index_of("connection.close"), 0);
}

TEST_F(ConnectionManagerTest, DisconnectWithoutConnectionIsNoOp) {
    EXPECT_NO_THROW(manager_.disconnect().get());
    EXPECT_TRUE(broker_.events().empty());
}
