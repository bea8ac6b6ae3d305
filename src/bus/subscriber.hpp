#pragma once

#include "channel.hpp"
#include "connection_manager.hpp"
#include "metrics.hpp"
#include "topology.hpp"
#include "types.hpp"

#include <boost/asio/thread_pool.hpp>
#include <spdlog/logger.h>

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace mqtransit {

/**
 * Subscriber declares the broker objects a packet category needs and
 * attaches consumers that feed the injected message handler.
 *
 * Topology:
 * - Node-addressed categories: one queue {prefix}.{TYPE}.{nodeID}, no ack.
 * - Broadcast categories: fanout exchange {prefix}.{TYPE} bound to this
 *   node's own {prefix}.{TYPE}.{selfNodeID} queue, no ack.
 *
 * Deliveries are never handled on the broker I/O thread: each one is posted
 * to the worker pool, where the handler runs. For need-ack consumers the
 * ack/nack is issued when the handler reports completion, which an async
 * handler may do later from another thread without holding the worker.
 */
class Subscriber {
public:
    Subscriber(const TransporterConfig& config,
               const TopicNames& names,
               const TopologyPolicy& policy,
               ConnectionManager& connection,
               boost::asio::thread_pool& pool,
               Metrics& metrics,
               MessageHandler handler);

    std::future<void> subscribe(PacketType type, const std::optional<std::string>& node_id);

    // Attaches a consumer to an already declared queue on `handle`.
    std::future<void> consume(const ConnectionManager::ChannelHandle& handle,
                              const std::string& queue,
                              PacketType type,
                              bool need_ack);

    broker::DeliveryCallback consume_handler(PacketType type, bool need_ack, uint64_t generation);

private:
    void process_delivery(PacketType type, bool need_ack, uint64_t generation,
                          const broker::Delivery& delivery);

    void settle(uint64_t generation, const broker::Delivery& delivery, bool success);

    const TopicNames& names_;
    const TopologyPolicy& policy_;
    ExchangeOptions exchange_options_;
    ConsumeOptions consume_options_;

    ConnectionManager& connection_;
    boost::asio::thread_pool& worker_pool_;
    Metrics& metrics_;
    MessageHandler handler_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace mqtransit
