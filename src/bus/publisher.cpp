#include "publisher.hpp"

#include "errors.hpp"
#include "futures.hpp"
#include "log.hpp"

namespace mqtransit {

Publisher::Publisher(const TransporterConfig& config,
                     const TopicNames& names,
                     ConnectionManager& connection,
                     const Serializer& serializer,
                     ServiceTopologyBuilder& service_topology,
                     Metrics& metrics)
    : names_(names)
    , message_options_(config.message_options)
    , connection_(connection)
    , serializer_(serializer)
    , service_topology_(service_topology)
    , metrics_(metrics)
    , logger_(log::or_default(config.logger)) {
}

std::future<void> Publisher::publish(const Packet& packet) {
    auto handle = connection_.channel();
    if (!handle) {
        metrics_.record_dropped();
        return ready_future();
    }
    broker::Channel& channel = *handle.channel;

    try {
        const auto& groups = packet.payload.groups;
        if (packet.type == PacketType::Event && !groups.empty()) {
            if (!packet.target) {
                // Each copy names only its own group, so a consumer that
                // belongs to several groups handles it once per group.
                Packet copy = packet;
                for (const auto& group : groups) {
                    copy.payload.groups.assign(1, group);
                    send_to_queue(channel, names_.event_group_queue(group, packet.payload.event),
                                  serializer_.serialize(copy));
                }
                return ready_future();
            }
            logger_->warn("AMQP event '{}' has both a target and groups; sending to '{}' only.",
                          packet.payload.event, *packet.target);
        }

        std::string payload = serializer_.serialize(packet);

        if (packet.type == PacketType::Request && !packet.target) {
            send_to_queue(channel, names_.action_queue(packet.payload.action), payload);
            return ready_future();
        }

        if (packet.target) {
            send_to_queue(channel, names_.topic(packet.type, packet.target), payload);
        } else {
            if (!channel.publish(names_.topic(packet.type), "", payload, message_options_)) {
                logger_->debug("AMQP publish buffer is full, waiting for drain.");
            }
            metrics_.record_published();
        }
    } catch (const ChannelClosed& e) {
        logger_->debug("AMQP publish of {} skipped: {}", to_string(packet.type), e.what());
        return ready_future();
    } catch (const std::exception&) {
        return failed_future(std::current_exception());
    }

    // Broadcast INFO is the point where this node's own services are known.
    if (packet.type == PacketType::Info && !packet.target) {
        return service_topology_.declare_service_queues();
    }
    return ready_future();
}

void Publisher::send_to_queue(broker::Channel& channel, const std::string& queue, const std::string& payload) {
    if (!channel.send_to_queue(queue, payload, message_options_)) {
        logger_->debug("AMQP send buffer is full, waiting for drain.");
    }
    metrics_.record_published();
}

} // namespace mqtransit
