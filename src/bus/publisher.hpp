#pragma once

#include "connection_manager.hpp"
#include "metrics.hpp"
#include "serializer.hpp"
#include "service_topology.hpp"
#include "topology.hpp"
#include "types.hpp"

#include <spdlog/logger.h>

#include <future>
#include <memory>
#include <string>

namespace mqtransit {

/**
 * Publisher routes outgoing packets:
 * - EVENT with groups and no target: one copy per group, straight to
 *   {prefix}.EVENT-LB.{group}.{event}; the broker load-balances consumers.
 * - REQUEST with no target: shared action queue {prefix}.REQUEST-LB.{action}.
 * - Any packet with a target: that node's {prefix}.{TYPE}.{target} queue.
 * - Everything else: the category's fanout exchange.
 *
 * Broadcasting INFO also (re)declares this node's service queues.
 * Without a channel every publish is a completed no-op.
 */
class Publisher {
public:
    Publisher(const TransporterConfig& config,
              const TopicNames& names,
              ConnectionManager& connection,
              const Serializer& serializer,
              ServiceTopologyBuilder& service_topology,
              Metrics& metrics);

    std::future<void> publish(const Packet& packet);

private:
    void send_to_queue(broker::Channel& channel, const std::string& queue, const std::string& payload);

    const TopicNames& names_;
    MessageOptions message_options_;
    ConnectionManager& connection_;
    const Serializer& serializer_;
    ServiceTopologyBuilder& service_topology_;
    Metrics& metrics_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mqtransit
