#include "subscriber.hpp"

#include "errors.hpp"
#include "futures.hpp"
#include "log.hpp"

#include <boost/asio/post.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace mqtransit {

Subscriber::Subscriber(const TransporterConfig& config,
                       const TopicNames& names,
                       const TopologyPolicy& policy,
                       ConnectionManager& connection,
                       boost::asio::thread_pool& pool,
                       Metrics& metrics,
                       MessageHandler handler)
    : names_(names)
    , policy_(policy)
    , exchange_options_(config.exchange_options)
    , consume_options_(config.consume_options)
    , connection_(connection)
    , worker_pool_(pool)
    , metrics_(metrics)
    , handler_(std::move(handler))
    , logger_(log::or_default(config.logger)) {
}

std::future<void> Subscriber::subscribe(PacketType type, const std::optional<std::string>& node_id) {
    auto handle = connection_.channel();
    if (!handle) {
        return ready_future();
    }

    std::vector<std::future<void>> steps;
    try {
        if (node_id) {
            // Already specific to one node: no exchange needed.
            std::string queue = names_.topic(type, node_id);
            steps.push_back(handle.channel->assert_queue(queue, policy_.options_for(type)));
            steps.push_back(consume(handle, queue, type, false));
        } else {
            std::string exchange = names_.topic(type);
            Binding binding{names_.node_queue(type), exchange, ""};
            connection_.bindings().add(binding);

            steps.push_back(handle.channel->assert_exchange(exchange, broker::ExchangeType::Fanout, exchange_options_));
            steps.push_back(handle.channel->assert_queue(binding.queue, policy_.options_for(type)));
            steps.push_back(handle.channel->bind_queue(binding));
            steps.push_back(consume(handle, binding.queue, type, false));
        }
    } catch (const ChannelClosed& e) {
        logger_->debug("AMQP subscribe to {} skipped: {}", to_string(type), e.what());
    }
    return join_steps(std::move(steps), logger_);
}

std::future<void> Subscriber::consume(const ConnectionManager::ChannelHandle& handle,
                                      const std::string& queue,
                                      PacketType type,
                                      bool need_ack) {
    ConsumeOptions defaults;
    defaults.no_ack = !need_ack;
    ConsumeOptions options = merge(defaults, consume_options_);
    if (need_ack) {
        options.no_ack = false;
    }
    logger_->debug("AMQP consuming '{}' (ack: {})", queue, need_ack);
    return discard_value(handle.channel->consume(queue, consume_handler(type, need_ack, handle.generation), options));
}

broker::DeliveryCallback Subscriber::consume_handler(PacketType type, bool need_ack, uint64_t generation) {
    return [this, type, need_ack, generation](const broker::Delivery& delivery) {
        boost::asio::post(worker_pool_, [this, type, need_ack, generation, delivery]() {
            process_delivery(type, need_ack, generation, delivery);
        });
    };
}

void Subscriber::process_delivery(PacketType type, bool need_ack, uint64_t generation,
                                  const broker::Delivery& delivery) {
    metrics_.record_received();
    auto start = std::chrono::steady_clock::now();

    // The worker returns as soon as the handler does; an async handler
    // settles the delivery later through `done`.
    auto finished = std::make_shared<std::atomic<bool>>(false);
    HandlerDone done = [this, type, need_ack, generation, delivery, start, finished](std::exception_ptr error) {
        if (finished->exchange(true)) {
            return;
        }
        if (error) {
            logger_->error("Message handling error ({}): {}", to_string(type), describe(error));
        }
        metrics_.record_handler_latency(std::chrono::steady_clock::now() - start);
        if (need_ack) {
            settle(generation, delivery, !error);
        }
    };

    try {
        handler_(type, delivery.content, done);
    } catch (const std::exception&) {
        done(std::current_exception());
    }
}

void Subscriber::settle(uint64_t generation, const broker::Delivery& delivery, bool success) {
    auto channel = connection_.channel_for(generation);
    if (!channel) {
        // The broker requeues whatever the dead channel still held.
        return;
    }
    try {
        if (success) {
            channel->ack(delivery);
            metrics_.record_acked();
        } else {
            channel->nack(delivery);
            metrics_.record_nacked();
        }
    } catch (const ChannelClosed& e) {
        logger_->debug("AMQP {} skipped: {}", success ? "ack" : "nack", e.what());
    }
}

} // namespace mqtransit
