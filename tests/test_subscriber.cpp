#include "fake_broker.hpp"

#include "bus/connection_manager.hpp"
#include "bus/metrics.hpp"
#include "bus/subscriber.hpp"
#include "bus/topology.hpp"

#include <boost/asio/thread_pool.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using mqtransit::ConnectionManager;
using mqtransit::HandlerDone;
using mqtransit::Metrics;
using mqtransit::PacketType;
using mqtransit::Subscriber;
using mqtransit::TopicNames;
using mqtransit::TopologyPolicy;
using mqtransit::TransporterConfig;
using mqtransit::test::FakeBroker;
using mqtransit::test::wait_until;

namespace {
TransporterConfig make_config() {
    TransporterConfig config;
    config.url = "amqp://fake";
    config.node_id = "node-1";
    return config;
}
} // namespace

class SubscriberTest : public ::testing::Test {
protected:
    SubscriberTest()
        : config_(make_config())
        , pool_(2)
        , names_(config_.ns, config_.node_id)
        , policy_(config_.event_time_to_live)
        , manager_(config_, broker_.connector(), pool_)
        , subscriber_(config_, names_, policy_, manager_, pool_, metrics_,
                      [this](PacketType type, const std::string& content, HandlerDone done) {
                          handled_.fetch_add(1);
                          handler_(type, content, std::move(done));
                      }) {
    }

    void SetUp() override {
        handler_ = [](PacketType, const std::string&, HandlerDone done) { done(nullptr); };
    }

    void TearDown() override {
        pool_.join();
    }

    // Declares `queue` and consumes it with acknowledgments.
    void consume_with_ack(const std::string& queue) {
        auto handle = manager_.channel();
        ASSERT_TRUE(static_cast<bool>(handle));
        handle.channel->assert_queue(queue, policy_.balanced_options_for(PacketType::Request)).get();
        subscriber_.consume(handle, queue, PacketType::Request, true).get();
    }

    // Keeps an async handler's completion for the test to call later.
    void stash(HandlerDone done) {
        std::lock_guard<std::mutex> lock(stash_mutex_);
        stashed_.push_back(std::move(done));
    }

    HandlerDone take_stashed() {
        std::lock_guard<std::mutex> lock(stash_mutex_);
        HandlerDone done = std::move(stashed_.front());
        stashed_.erase(stashed_.begin());
        return done;
    }

    FakeBroker broker_;
    TransporterConfig config_;
    boost::asio::thread_pool pool_;
    Metrics metrics_;
    TopicNames names_;
    TopologyPolicy policy_;
    ConnectionManager manager_;
    std::function<void(PacketType, const std::string&, HandlerDone)> handler_;
    std::atomic<int> handled_{0};
    std::mutex stash_mutex_;
    std::vector<HandlerDone> stashed_;
    Subscriber subscriber_;
};

TEST_F(SubscriberTest, NodeQueueSubscriptionHasNoExchange) {
    manager_.connect().get();
    subscriber_.subscribe(PacketType::Request, std::string("node-1")).get();

    EXPECT_TRUE(broker_.has_queue("MOL.REQUEST.node-1"));
    EXPECT_FALSE(broker_.exchange_type("MOL.REQUEST").has_value());

    auto consumers = broker_.consumers_of("MOL.REQUEST.node-1");
    ASSERT_EQ(consumers.size(), 1u);
    EXPECT_EQ(consumers[0].options.no_ack, true);
}

TEST_F(SubscriberTest, BroadcastSubscriptionBindsOwnQueueToFanout) {
    manager_.connect().get();
    subscriber_.subscribe(PacketType::Heartbeat, std::nullopt).get();

    EXPECT_EQ(broker_.exchange_type("MOL.HEARTBEAT"), mqtransit::broker::ExchangeType::Fanout);
    EXPECT_TRUE(broker_.has_queue("MOL.HEARTBEAT.node-1"));

    auto bindings = broker_.bindings();
    ASSERT_EQ(bindings.size(), 1u);
    EXPECT_EQ(bindings[0].queue, "MOL.HEARTBEAT.node-1");
    EXPECT_EQ(bindings[0].exchange, "MOL.HEARTBEAT");
    EXPECT_EQ(bindings[0].routing_key, "");

    auto recorded = manager_.bindings().snapshot();
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0], bindings[0]);
}

TEST_F(SubscriberTest, SubscribeWithoutChannelIsNoOp) {
    EXPECT_NO_THROW(subscriber_.subscribe(PacketType::Event, std::nullopt).get());
    EXPECT_TRUE(broker_.events().empty());
}

TEST_F(SubscriberTest, SubscribeOnDeadChannelCompletesQuietly) {
    manager_.connect().get();
    broker_.last_channel()->shut();
    EXPECT_NO_THROW(subscriber_.subscribe(PacketType::Ping, std::nullopt).get());
}

TEST_F(SubscriberTest, DeliveryReachesHandlerWithCategory) {
    std::promise<std::pair<PacketType, std::string>> seen;
    handler_ = [&seen](PacketType type, const std::string& content, HandlerDone done) {
        seen.set_value({type, content});
        done(nullptr);
    };
    manager_.connect().get();
    subscriber_.subscribe(PacketType::Pong, std::string("node-1")).get();

    broker_.deliver("MOL.PONG.node-1", "payload");

    auto future = seen.get_future();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    auto result = future.get();
    EXPECT_EQ(result.first, PacketType::Pong);
    EXPECT_EQ(result.second, "payload");
}

TEST_F(SubscriberTest, HandlerRunsOffTheDeliveringThread) {
    std::promise<std::thread::id> handler_thread;
    handler_ = [&handler_thread](PacketType, const std::string&, HandlerDone done) {
        handler_thread.set_value(std::this_thread::get_id());
        done(nullptr);
    };
    manager_.connect().get();
    subscriber_.subscribe(PacketType::Pong, std::string("node-1")).get();

    broker_.deliver("MOL.PONG.node-1", "x");

    auto future = handler_thread.get_future();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_NE(future.get(), std::this_thread::get_id());
}

TEST_F(SubscriberTest, NoAckConsumerNeverSettles) {
    handler_ = [](PacketType, const std::string&, HandlerDone) {
        throw std::runtime_error("handler failed");
    };
    manager_.connect().get();
    subscriber_.subscribe(PacketType::Request, std::string("node-1")).get();

    broker_.deliver("MOL.REQUEST.node-1", "x");

    ASSERT_TRUE(wait_until([&]() { return metrics_.get_stats().packets_received == 1; }));
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(broker_.acks().empty());
    EXPECT_TRUE(broker_.nacks().empty());
}

TEST_F(SubscriberTest, SyncSuccessIsAcked) {
    manager_.connect().get();
    consume_with_ack("MOL.REQUEST-LB.sum");

    broker_.deliver("MOL.REQUEST-LB.sum", "x");

    ASSERT_TRUE(wait_until([&]() { return broker_.acks().size() == 1; }));
    EXPECT_TRUE(broker_.nacks().empty());
    EXPECT_EQ(metrics_.get_stats().packets_acked, 1u);
}

TEST_F(SubscriberTest, SyncFailureIsNacked) {
    handler_ = [](PacketType, const std::string&, HandlerDone) {
        throw std::runtime_error("handler failed");
    };
    manager_.connect().get();
    consume_with_ack("MOL.REQUEST-LB.sum");

    broker_.deliver("MOL.REQUEST-LB.sum", "x");

    ASSERT_TRUE(wait_until([&]() { return broker_.nacks().size() == 1; }));
    EXPECT_TRUE(broker_.acks().empty());
    EXPECT_EQ(metrics_.get_stats().packets_nacked, 1u);
}

TEST_F(SubscriberTest, AsyncSuccessIsAckedAfterCompletion) {
    handler_ = [this](PacketType, const std::string&, HandlerDone done) { stash(std::move(done)); };
    manager_.connect().get();
    consume_with_ack("MOL.REQUEST-LB.sum");

    broker_.deliver("MOL.REQUEST-LB.sum", "x");

    ASSERT_TRUE(wait_until([&]() { return handled_.load() == 1; }));
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(broker_.acks().empty());

    take_stashed()(nullptr);
    ASSERT_TRUE(wait_until([&]() { return broker_.acks().size() == 1; }));
    EXPECT_EQ(metrics_.get_stats().packets_acked, 1u);
}

TEST_F(SubscriberTest, PendingAsyncHandlersDoNotHoldWorkers) {
    handler_ = [this](PacketType, const std::string&, HandlerDone done) { stash(std::move(done)); };
    manager_.connect().get();
    consume_with_ack("MOL.REQUEST-LB.sum");

    // More unfinished deliveries than the pool has threads.
    for (int i = 0; i < 5; ++i) {
        broker_.deliver("MOL.REQUEST-LB.sum", "x" + std::to_string(i));
    }
    ASSERT_TRUE(wait_until([&]() { return handled_.load() == 5; }));
    EXPECT_TRUE(broker_.acks().empty());

    std::vector<HandlerDone> finished;
    {
        std::lock_guard<std::mutex> lock(stash_mutex_);
        finished.swap(stashed_);
    }
    std::thread completer([&finished]() {
        for (auto& done : finished) {
            done(nullptr);
        }
    });
    completer.join();
    ASSERT_TRUE(wait_until([&]() { return broker_.acks().size() == 5; }));
}

TEST_F(SubscriberTest, AsyncFailureIsNacked) {
    handler_ = [this](PacketType, const std::string&, HandlerDone done) { stash(std::move(done)); };
    manager_.connect().get();
    consume_with_ack("MOL.REQUEST-LB.sum");

    broker_.deliver("MOL.REQUEST-LB.sum", "x");
    ASSERT_TRUE(wait_until([&]() { return handled_.load() == 1; }));

    HandlerDone done = take_stashed();
    std::thread completer([done]() { done(std::make_exception_ptr(std::runtime_error("async failure"))); });
    completer.join();

    ASSERT_TRUE(wait_until([&]() { return broker_.nacks().size() == 1; }));
    EXPECT_TRUE(broker_.acks().empty());
}

TEST_F(SubscriberTest, CompletionIsSettledOnce) {
    handler_ = [](PacketType, const std::string&, HandlerDone done) {
        done(nullptr);
        done(std::make_exception_ptr(std::runtime_error("second completion")));
        throw std::runtime_error("thrown after completing");
    };
    manager_.connect().get();
    consume_with_ack("MOL.REQUEST-LB.sum");

    broker_.deliver("MOL.REQUEST-LB.sum", "x");

    ASSERT_TRUE(wait_until([&]() { return broker_.acks().size() == 1; }));
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(broker_.acks().size(), 1u);
    EXPECT_TRUE(broker_.nacks().empty());
}

TEST_F(SubscriberTest, SettlementSkippedAfterChannelIsReplaced) {
    handler_ = [this](PacketType, const std::string&, HandlerDone done) { stash(std::move(done)); };
    manager_.connect().get();
    consume_with_ack("MOL.REQUEST-LB.sum");

    broker_.deliver("MOL.REQUEST-LB.sum", "x");
    ASSERT_TRUE(wait_until([&]() { return handled_.load() == 1; }));

    broker_.last_channel()->emit_close(std::make_exception_ptr(std::runtime_error("channel killed")));
    ASSERT_TRUE(wait_until([&]() { return !manager_.is_connected(); }));

    take_stashed()(nullptr);
    EXPECT_GT(metrics_.get_stats().p50, 0.0);
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(broker_.acks().empty());
    EXPECT_TRUE(broker_.nacks().empty());
}

TEST_F(SubscriberTest, AckConsumerIgnoresNoAckOverride) {
    config_.consume_options.no_ack = true;
    Subscriber overridden(config_, names_, policy_, manager_, pool_, metrics_,
                          [](PacketType, const std::string&, HandlerDone done) { done(nullptr); });
    manager_.connect().get();

    auto handle = manager_.channel();
    handle.channel->assert_queue("MOL.REQUEST-LB.sum", mqtransit::QueueOptions{}).get();
    overridden.consume(handle, "MOL.REQUEST-LB.sum", PacketType::Request, true).get();

    auto consumers = broker_.consumers_of("MOL.REQUEST-LB.sum");
    ASSERT_EQ(consumers.size(), 1u);
    EXPECT_EQ(consumers[0].options.no_ack, false);
}
