#include "topology.hpp"

#include <stdexcept>

namespace mqtransit {

TopologyPolicy::TopologyPolicy(std::chrono::milliseconds event_ttl, QueueOptions overrides)
    : event_ttl_(event_ttl)
    , overrides_(std::move(overrides)) {
}

QueueOptions TopologyPolicy::options_for(PacketType type) const {
    QueueOptions options;
    switch (type) {
    case PacketType::Request:
    case PacketType::Response:
        break;
    case PacketType::Discover:
    case PacketType::Info:
    case PacketType::Disconnect:
    case PacketType::Heartbeat:
    case PacketType::Ping:
    case PacketType::Pong:
    case PacketType::Unknown:
        options.message_ttl = kControlTimeToLive;
        options.auto_delete = true;
        break;
    case PacketType::Event:
        options.message_ttl = event_ttl_;
        options.auto_delete = true;
        break;
    default:
        throw std::logic_error("no queue policy for packet type");
    }
    return merge(options, overrides_);
}

QueueOptions TopologyPolicy::balanced_options_for(PacketType type) const {
    if (type != PacketType::Request && type != PacketType::Event) {
        throw std::logic_error(std::string("no load-balanced queue policy for ") + to_string(type));
    }
    return merge(QueueOptions{}, overrides_);
}

TopicNames::TopicNames(const std::string& ns, std::string node_id)
    : prefix_(ns.empty() ? "MOL" : "MOL-" + ns)
    , node_id_(std::move(node_id)) {
}

std::string TopicNames::topic(PacketType type) const {
    return prefix_ + "." + to_string(type);
}

std::string TopicNames::topic(PacketType type, const std::optional<std::string>& node_id) const {
    if (node_id) {
        return topic(type) + "." + *node_id;
    }
    return topic(type);
}

std::string TopicNames::node_queue(PacketType type) const {
    return topic(type) + "." + node_id_;
}

std::string TopicNames::action_queue(const std::string& action) const {
    return prefix_ + ".REQUEST-LB." + action;
}

std::string TopicNames::event_group_queue(const std::string& group, const std::string& event) const {
    return prefix_ + ".EVENT-LB." + group + "." + event;
}

} // namespace mqtransit
