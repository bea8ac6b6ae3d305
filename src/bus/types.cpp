#include "types.hpp"

#include <stdexcept>

namespace mqtransit {

const char* to_string(PacketType type) {
    switch (type) {
    case PacketType::Request:    return "REQUEST";
    case PacketType::Response:   return "RESPONSE";
    case PacketType::Event:      return "EVENT";
    case PacketType::Discover:   return "DISCOVER";
    case PacketType::Info:       return "INFO";
    case PacketType::Disconnect: return "DISCONNECT";
    case PacketType::Heartbeat:  return "HEARTBEAT";
    case PacketType::Ping:       return "PING";
    case PacketType::Pong:       return "PONG";
    case PacketType::Unknown:    return "UNKNOWN";
    }
    throw std::logic_error("unknown packet type");
}

namespace {

template <typename T>
void override_field(std::optional<T>& target, const std::optional<T>& source) {
    if (source) {
        target = source;
    }
}

} // namespace

QueueOptions merge(QueueOptions defaults, const QueueOptions& overrides) {
    override_field(defaults.durable, overrides.durable);
    override_field(defaults.exclusive, overrides.exclusive);
    override_field(defaults.auto_delete, overrides.auto_delete);
    override_field(defaults.message_ttl, overrides.message_ttl);
    override_field(defaults.expires, overrides.expires);
    override_field(defaults.max_length, overrides.max_length);
    override_field(defaults.dead_letter_exchange, overrides.dead_letter_exchange);
    return defaults;
}

ExchangeOptions merge(ExchangeOptions defaults, const ExchangeOptions& overrides) {
    override_field(defaults.durable, overrides.durable);
    override_field(defaults.auto_delete, overrides.auto_delete);
    override_field(defaults.internal, overrides.internal);
    return defaults;
}

MessageOptions merge(MessageOptions defaults, const MessageOptions& overrides) {
    override_field(defaults.persistent, overrides.persistent);
    override_field(defaults.mandatory, overrides.mandatory);
    override_field(defaults.expiration, overrides.expiration);
    override_field(defaults.priority, overrides.priority);
    override_field(defaults.content_type, overrides.content_type);
    return defaults;
}

ConsumeOptions merge(ConsumeOptions defaults, const ConsumeOptions& overrides) {
    override_field(defaults.no_ack, overrides.no_ack);
    override_field(defaults.exclusive, overrides.exclusive);
    override_field(defaults.consumer_tag, overrides.consumer_tag);
    return defaults;
}

TransporterConfig TransporterConfig::from_url(const std::string& url) {
    TransporterConfig config;
    config.url = url;
    return config;
}

} // namespace mqtransit
