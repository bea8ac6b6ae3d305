#pragma once

#include "types.hpp"

#include <string>

namespace mqtransit {

// Packet wire format. Implementations throw SerializationError on bad input.
class Serializer {
public:
    virtual ~Serializer() = default;

    virtual std::string serialize(const Packet& packet) const = 0;

    virtual Packet deserialize(PacketType type, const std::string& bytes) const = 0;
};

} // namespace mqtransit
