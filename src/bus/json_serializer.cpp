#include "json_serializer.hpp"

#include "errors.hpp"

#include <nlohmann/json.hpp>

namespace mqtransit {

namespace {

void put_if_set(nlohmann::json& object, const char* key, const std::string& value) {
    if (!value.empty()) {
        object[key] = value;
    }
}

std::string string_or_empty(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::string();
    }
    return it->get<std::string>();
}

} // namespace

std::string JsonSerializer::serialize(const Packet& packet) const {
    nlohmann::json object;
    object["ver"] = kProtocolVersion;
    put_if_set(object, "sender", packet.payload.sender);
    put_if_set(object, "id", packet.payload.id);
    put_if_set(object, "action", packet.payload.action);
    put_if_set(object, "event", packet.payload.event);
    if (!packet.payload.groups.empty()) {
        object["groups"] = packet.payload.groups;
    }
    try {
        object["data"] = packet.payload.data.empty()
            ? nlohmann::json()
            : nlohmann::json::parse(packet.payload.data);
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("packet data is not valid JSON: ") + e.what());
    }
    return object.dump();
}

Packet JsonSerializer::deserialize(PacketType type, const std::string& bytes) const {
    Packet packet;
    packet.type = type;
    try {
        nlohmann::json object = nlohmann::json::parse(bytes);
        if (!object.is_object()) {
            throw SerializationError("packet is not a JSON object");
        }
        std::string version = string_or_empty(object, "ver");
        if (version != kProtocolVersion) {
            throw SerializationError("unsupported protocol version '" + version + "'");
        }
        packet.payload.sender = string_or_empty(object, "sender");
        packet.payload.id = string_or_empty(object, "id");
        packet.payload.action = string_or_empty(object, "action");
        packet.payload.event = string_or_empty(object, "event");
        auto groups = object.find("groups");
        if (groups != object.end() && groups->is_array()) {
            packet.payload.groups = groups->get<std::vector<std::string>>();
        }
        auto data = object.find("data");
        if (data != object.end() && !data->is_null()) {
            packet.payload.data = data->dump();
        }
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("malformed packet: ") + e.what());
    }
    return packet;
}

} // namespace mqtransit
