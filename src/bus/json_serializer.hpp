#pragma once

#include "serializer.hpp"

namespace mqtransit {

/**
 * JSON wire format:
 *   {"ver":"4","sender":..,"id":..,"action":..,"event":..,"groups":[..],"data":<json>}
 * Empty routing fields are left out. `data` must itself be JSON text.
 */
class JsonSerializer : public Serializer {
public:
    static constexpr const char* kProtocolVersion = "4";

    std::string serialize(const Packet& packet) const override;

    Packet deserialize(PacketType type, const std::string& bytes) const override;
};

} // namespace mqtransit
