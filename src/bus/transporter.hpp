#pragma once

#include "channel.hpp"
#include "connection_manager.hpp"
#include "metrics.hpp"
#include "publisher.hpp"
#include "serializer.hpp"
#include "service_topology.hpp"
#include "subscriber.hpp"
#include "topology.hpp"
#include "types.hpp"

#include <boost/asio/thread_pool.hpp>
#include <spdlog/logger.h>

#include <future>
#include <memory>
#include <optional>
#include <string>

namespace mqtransit {

/**
 * Transporter maps the node-to-node packet protocol onto an AMQP broker.
 *
 * Architecture:
 * - ConnectionManager: single connection + channel, lifecycle on a strand
 * - Subscriber: category queues/exchanges, consumers -> worker pool
 * - Publisher: per-packet routing (unicast, fanout, load-balanced queues)
 * - ServiceTopologyBuilder: action/event-group queues, on INFO broadcast
 * - Worker pool: Boost.Asio thread_pool running message handlers
 *
 * The broker does the load balancing (competing consumers on shared
 * queues), so has_built_in_balancer() is true.
 */
class Transporter {
public:
    Transporter(TransporterConfig config,
                broker::Connector connector,
                std::shared_ptr<const Serializer> serializer,
                MessageHandler handler,
                ServiceTopologyProvider provider);
    ~Transporter();

    Transporter(const Transporter&) = delete;
    Transporter& operator=(const Transporter&) = delete;

    // Resolves once the channel is open and the standard subscriptions exist.
    std::shared_future<void> connect();

    std::future<void> disconnect();

    std::future<void> subscribe(PacketType type, const std::optional<std::string>& node_id = std::nullopt);

    std::future<void> publish(const Packet& packet);

    bool is_connected() const { return connection_.is_connected(); }

    bool has_built_in_balancer() const { return true; }

    std::string topic_name(PacketType type, const std::optional<std::string>& node_id = std::nullopt) const;

    const TopicNames& names() const { return names_; }

    const std::string& node_id() const { return names_.node_id(); }

    Metrics::Stats get_metrics() { return metrics_.get_stats(); }

    void stop();

private:
    void make_subscriptions();

    TransporterConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    boost::asio::thread_pool worker_pool_;
    Metrics metrics_;

    TopicNames names_;
    TopologyPolicy policy_;
    std::shared_ptr<const Serializer> serializer_;

    ConnectionManager connection_;
    Subscriber subscriber_;
    ServiceTopologyBuilder service_topology_;
    Publisher publisher_;

    bool stopped_ = false;
};

} // namespace mqtransit
