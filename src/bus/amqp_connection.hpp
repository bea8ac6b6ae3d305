#pragma once

#include "channel.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace mqtransit {

struct AmqpOptions {
    int heartbeat_seconds = 60;
    int frame_max = 131072;

    // How long the I/O thread waits for a delivery before servicing
    // queued channel operations again.
    std::chrono::milliseconds poll_interval{10};

    // Per-producer high-water mark of the publish/ack ingress.
    int ingress_hwm = 10000;
    std::chrono::milliseconds ingress_timeout{1000};

    std::shared_ptr<spdlog::logger> logger;
};

/**
 * Opens an AMQP 0-9-1 connection (rabbitmq-c) to
 * amqp[s]://user:password@host:port/vhost.
 *
 * Architecture:
 * - I/O thread: sole owner of the rabbitmq-c connection state. Polls
 *   deliveries and dispatches them to consumer callbacks.
 * - Data plane: publish/ack/nack from any thread go through a thread-local
 *   ZeroMQ PUSH socket into an inproc PULL socket drained by the I/O thread.
 * - Control plane: declare/bind/consume/close are posted to an io_context
 *   polled by the I/O thread and answered through futures.
 *
 * One channel per connection.
 */
std::future<std::shared_ptr<broker::Connection>> connect_amqp(const std::string& url,
                                                              const AmqpOptions& options = AmqpOptions{});

broker::Connector amqp_connector(AmqpOptions options = AmqpOptions{});

} // namespace mqtransit
