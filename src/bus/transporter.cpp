#include "transporter.hpp"

#include "futures.hpp"
#include "log.hpp"

#include <vector>

namespace mqtransit {

Transporter::Transporter(TransporterConfig config,
                         broker::Connector connector,
                         std::shared_ptr<const Serializer> serializer,
                         MessageHandler handler,
                         ServiceTopologyProvider provider)
    : config_(std::move(config))
    , logger_(log::or_default(config_.logger))
    , worker_pool_(static_cast<size_t>(config_.worker_threads > 0 ? config_.worker_threads : 1))
    , metrics_(config_.metrics_period)
    , names_(config_.ns, config_.node_id)
    , policy_(config_.event_time_to_live, config_.queue_options)
    , serializer_(std::move(serializer))
    , connection_(config_, std::move(connector), worker_pool_)
    , subscriber_(config_, names_, policy_, connection_, worker_pool_, metrics_, std::move(handler))
    , service_topology_(config_, names_, policy_, connection_, subscriber_, std::move(provider))
    , publisher_(config_, names_, connection_, *serializer_, service_topology_, metrics_) {
}

Transporter::~Transporter() {
    stop();
}

void Transporter::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    if (connection_.is_connected()) {
        try {
            disconnect().get();
        } catch (const std::exception& e) {
            logger_->warn("AMQP disconnect on shutdown failed: {}", e.what());
        }
    }

    worker_pool_.stop();
    worker_pool_.join();
}

std::shared_future<void> Transporter::connect() {
    return connection_.connect([this]() { make_subscriptions(); });
}

std::future<void> Transporter::disconnect() {
    return connection_.disconnect();
}

std::future<void> Transporter::subscribe(PacketType type, const std::optional<std::string>& node_id) {
    return subscriber_.subscribe(type, node_id);
}

std::future<void> Transporter::publish(const Packet& packet) {
    return publisher_.publish(packet);
}

std::string Transporter::topic_name(PacketType type, const std::optional<std::string>& node_id) const {
    return names_.topic(type, node_id);
}

void Transporter::make_subscriptions() {
    const std::optional<std::string> self = names_.node_id();
    const std::optional<std::string> broadcast;

    std::vector<std::future<void>> steps;
    steps.push_back(subscribe(PacketType::Event, broadcast));
    steps.push_back(subscribe(PacketType::Request, self));
    steps.push_back(subscribe(PacketType::Response, self));
    steps.push_back(subscribe(PacketType::Discover, broadcast));
    steps.push_back(subscribe(PacketType::Discover, self));
    steps.push_back(subscribe(PacketType::Info, broadcast));
    steps.push_back(subscribe(PacketType::Info, self));
    steps.push_back(subscribe(PacketType::Disconnect, broadcast));
    steps.push_back(subscribe(PacketType::Heartbeat, broadcast));
    steps.push_back(subscribe(PacketType::Ping, broadcast));
    steps.push_back(subscribe(PacketType::Ping, self));
    steps.push_back(subscribe(PacketType::Pong, self));
    wait_all(steps);

    logger_->info("AMQP subscriptions for node '{}' are ready.", names_.node_id());
}

} // namespace mqtransit
