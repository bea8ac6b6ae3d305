#pragma once

#include "types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace mqtransit {

/**
 * TopologyPolicy decides how long queues of each packet category live.
 *
 * - REQUEST, RESPONSE and the load-balanced REQUEST-LB / EVENT-LB queues
 *   never expire.
 * - Control traffic (DISCOVER, INFO, DISCONNECT, HEARTBEAT, PING, PONG,
 *   UNKNOWN) expires after kControlTimeToLive and auto-deletes.
 * - EVENT expires after the configured event TTL and auto-deletes.
 *
 * Caller overrides are merged on top of the computed defaults.
 */
class TopologyPolicy {
public:
    static constexpr std::chrono::milliseconds kControlTimeToLive{5000};

    explicit TopologyPolicy(std::chrono::milliseconds event_ttl = std::chrono::milliseconds(5000),
                            QueueOptions overrides = QueueOptions{});

    QueueOptions options_for(PacketType type) const;

    // REQUEST-LB and EVENT-LB. Any other category is a logic_error.
    QueueOptions balanced_options_for(PacketType type) const;

    std::chrono::milliseconds event_ttl() const { return event_ttl_; }

private:
    std::chrono::milliseconds event_ttl_;
    QueueOptions overrides_;
};

/**
 * Broker object names. These must stay bit-exact for interop:
 *   {prefix}.{TYPE}                   exchanges, node-less queues
 *   {prefix}.{TYPE}.{nodeID}          per-node queues
 *   {prefix}.REQUEST-LB.{action}      shared action queues
 *   {prefix}.EVENT-LB.{group}.{event} grouped event queues
 */
class TopicNames {
public:
    TopicNames(const std::string& ns, std::string node_id);

    const std::string& prefix() const { return prefix_; }
    const std::string& node_id() const { return node_id_; }

    std::string topic(PacketType type) const;
    std::string topic(PacketType type, const std::optional<std::string>& node_id) const;

    // Queue this node reads broadcasts of `type` from.
    std::string node_queue(PacketType type) const;

    std::string action_queue(const std::string& action) const;

    std::string event_group_queue(const std::string& group, const std::string& event) const;

private:
    std::string prefix_;
    std::string node_id_;
};

} // namespace mqtransit
