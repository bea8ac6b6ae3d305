#include "bus/topology.hpp"
#include "bus/types.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace std::chrono_literals;
using mqtransit::PacketType;
using mqtransit::QueueOptions;
using mqtransit::TopicNames;
using mqtransit::TopologyPolicy;

// -----------------------------------------------------------------------------
// Naming
// -----------------------------------------------------------------------------
TEST(TopicNamesTest, DefaultPrefix) {
    TopicNames names("", "node-1");
    EXPECT_EQ(names.prefix(), "MOL");
    EXPECT_EQ(names.topic(PacketType::Heartbeat), "MOL.HEARTBEAT");
    EXPECT_EQ(names.topic(PacketType::Request, std::string("node-2")), "MOL.REQUEST.node-2");
    EXPECT_EQ(names.topic(PacketType::Event, std::nullopt), "MOL.EVENT");
}

TEST(TopicNamesTest, NamespacedPrefix) {
    TopicNames names("dev", "node-1");
    EXPECT_EQ(names.prefix(), "MOL-dev");
    EXPECT_EQ(names.topic(PacketType::Info), "MOL-dev.INFO");
    EXPECT_EQ(names.node_queue(PacketType::Info), "MOL-dev.INFO.node-1");
}

TEST(TopicNamesTest, BalancedQueueNames) {
    TopicNames names("", "node-1");
    EXPECT_EQ(names.action_queue("math.add"), "MOL.REQUEST-LB.math.add");
    EXPECT_EQ(names.event_group_queue("users", "user.created"), "MOL.EVENT-LB.users.user.created");

    TopicNames dev("dev", "node-1");
    EXPECT_EQ(dev.action_queue("sum"), "MOL-dev.REQUEST-LB.sum");
}

TEST(TopicNamesTest, EveryCategoryIsUpperCase) {
    TopicNames names("", "n");
    EXPECT_EQ(names.topic(PacketType::Response), "MOL.RESPONSE");
    EXPECT_EQ(names.topic(PacketType::Discover), "MOL.DISCOVER");
    EXPECT_EQ(names.topic(PacketType::Disconnect), "MOL.DISCONNECT");
    EXPECT_EQ(names.topic(PacketType::Ping), "MOL.PING");
    EXPECT_EQ(names.topic(PacketType::Pong), "MOL.PONG");
    EXPECT_EQ(names.topic(PacketType::Unknown), "MOL.UNKNOWN");
}

// -----------------------------------------------------------------------------
// Queue policy
// -----------------------------------------------------------------------------
TEST(TopologyPolicyTest, RequestAndResponseNeverExpire) {
    TopologyPolicy policy(10s);
    for (auto type : {PacketType::Request, PacketType::Response}) {
        QueueOptions options = policy.options_for(type);
        EXPECT_FALSE(options.message_ttl.has_value());
        EXPECT_FALSE(options.auto_delete.has_value());
    }
}

TEST(TopologyPolicyTest, ControlCategoriesExpireAfterFiveSeconds) {
    TopologyPolicy policy(10s);
    for (auto type : {PacketType::Discover, PacketType::Info, PacketType::Disconnect,
                      PacketType::Heartbeat, PacketType::Ping, PacketType::Pong}) {
        QueueOptions options = policy.options_for(type);
        ASSERT_TRUE(options.message_ttl.has_value()) << mqtransit::to_string(type);
        EXPECT_EQ(*options.message_ttl, 5000ms);
        EXPECT_EQ(options.auto_delete, true);
    }
}

TEST(TopologyPolicyTest, EventUsesConfiguredTimeToLive) {
    TopologyPolicy policy(1500ms);
    QueueOptions options = policy.options_for(PacketType::Event);
    ASSERT_TRUE(options.message_ttl.has_value());
    EXPECT_EQ(*options.message_ttl, 1500ms);
    EXPECT_EQ(options.auto_delete, true);
}

TEST(TopologyPolicyTest, OverridesWinFieldByField) {
    QueueOptions overrides;
    overrides.message_ttl = 42ms;
    overrides.durable = true;
    TopologyPolicy policy(5s, overrides);

    QueueOptions heartbeat = policy.options_for(PacketType::Heartbeat);
    EXPECT_EQ(*heartbeat.message_ttl, 42ms);
    EXPECT_EQ(heartbeat.durable, true);
    // Fields the override leaves unset keep the computed default.
    EXPECT_EQ(heartbeat.auto_delete, true);

    QueueOptions request = policy.options_for(PacketType::Request);
    EXPECT_EQ(*request.message_ttl, 42ms);
    EXPECT_FALSE(request.auto_delete.has_value());
}

TEST(TopologyPolicyTest, BalancedQueuesCarryOnlyOverrides) {
    QueueOptions overrides;
    overrides.max_length = 100u;
    TopologyPolicy policy(5s, overrides);

    QueueOptions lb = policy.balanced_options_for(PacketType::Request);
    EXPECT_FALSE(lb.message_ttl.has_value());
    EXPECT_FALSE(lb.auto_delete.has_value());
    EXPECT_EQ(lb.max_length, 100u);

    EXPECT_NO_THROW(policy.balanced_options_for(PacketType::Event));
    EXPECT_THROW(policy.balanced_options_for(PacketType::Heartbeat), std::logic_error);
}

TEST(OptionsMergeTest, UnsetOverrideKeepsDefault) {
    mqtransit::MessageOptions defaults;
    defaults.persistent = false;
    defaults.priority = static_cast<uint8_t>(1);

    mqtransit::MessageOptions overrides;
    overrides.persistent = true;

    auto merged = mqtransit::merge(defaults, overrides);
    EXPECT_EQ(merged.persistent, true);
    EXPECT_EQ(merged.priority, static_cast<uint8_t>(1));
    EXPECT_FALSE(merged.expiration.has_value());
}
