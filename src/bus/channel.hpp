#pragma once

#include "types.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace mqtransit {
namespace broker {

enum class ExchangeType {
    Direct,
    Fanout,
    Topic
};

const char* to_string(ExchangeType type);

struct Delivery {
    std::string content;
    uint64_t delivery_tag = 0;
    bool redelivered = false;
    std::string exchange;
    std::string routing_key;
    std::string consumer_tag;
};

// A mandatory message the broker could not route.
struct ReturnedMessage {
    uint16_t reply_code = 0;
    std::string reply_text;
    std::string exchange;
    std::string routing_key;
    std::string content;
};

using DeliveryCallback = std::function<void(const Delivery&)>;

/**
 * Channel is the broker-side primitive set this adapter is built on.
 *
 * Result-bearing operations return futures; send_to_queue/publish/ack/nack
 * are fire-and-forget. Operations on a channel that has gone away fail with
 * ChannelClosed.
 */
class Channel {
public:
    struct Listener {
        std::function<void(std::exception_ptr)> error;
        // Argument is null when the close was requested through close().
        std::function<void(std::exception_ptr)> close;
        std::function<void()> drain;
        std::function<void(const ReturnedMessage&)> returned;
    };

    virtual ~Channel() = default;

    virtual void listen(Listener listener) = 0;

    virtual std::future<void> prefetch(uint16_t count) = 0;

    virtual std::future<void> assert_queue(const std::string& name, const QueueOptions& options) = 0;

    virtual std::future<void> assert_exchange(const std::string& name,
                                              ExchangeType type,
                                              const ExchangeOptions& options) = 0;

    virtual std::future<void> bind_queue(const Binding& binding) = 0;

    virtual std::future<void> unbind_queue(const Binding& binding) = 0;

    // Resolves to the consumer tag.
    virtual std::future<std::string> consume(const std::string& queue,
                                             DeliveryCallback callback,
                                             const ConsumeOptions& options) = 0;

    // Returns false when the outgoing buffer is full; wait for drain.
    virtual bool send_to_queue(const std::string& queue,
                               const std::string& content,
                               const MessageOptions& options) = 0;

    virtual bool publish(const std::string& exchange,
                         const std::string& routing_key,
                         const std::string& content,
                         const MessageOptions& options) = 0;

    virtual void ack(const Delivery& delivery) = 0;

    // Requeues the message for redelivery.
    virtual void nack(const Delivery& delivery) = 0;

    virtual std::future<void> close() = 0;
};

class Connection {
public:
    struct Listener {
        std::function<void(std::exception_ptr)> error;
        // Argument is null when the close was requested through close().
        std::function<void(std::exception_ptr)> close;
        std::function<void(const std::string&)> blocked;
        std::function<void()> unblocked;
    };

    virtual ~Connection() = default;

    virtual void listen(Listener listener) = 0;

    virtual std::future<std::shared_ptr<Channel>> create_channel() = 0;

    virtual std::future<void> close() = 0;
};

using Connector = std::function<std::future<std::shared_ptr<Connection>>(const std::string& url)>;

} // namespace broker
} // namespace mqtransit
