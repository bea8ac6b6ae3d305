#include "channel.hpp"

#include <stdexcept>

namespace mqtransit {
namespace broker {

const char* to_string(ExchangeType type) {
    switch (type) {
    case ExchangeType::Direct: return "direct";
    case ExchangeType::Fanout: return "fanout";
    case ExchangeType::Topic:  return "topic";
    }
    throw std::logic_error("unknown exchange type");
}

} // namespace broker
} // namespace mqtransit
