#pragma once

#include "binding_registry.hpp"
#include "channel.hpp"
#include "types.hpp"

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/logger.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace mqtransit {

/**
 * ConnectionManager owns the single broker connection and its channel.
 *
 * Lifecycle: absent -> connecting -> open -> (error|closed) -> absent.
 *
 * - connect() runs on the worker pool and resolves once the channel is open,
 *   the prefetch is set and the on-connected step has finished. If any of
 *   these fails, whatever was opened is closed and the state is absent again.
 * - connect() while connecting hands out the pending attempt's future;
 *   while a disconnect is still tearing down it fails with ConnectionFailure.
 * - Broker events (error/close/blocked/... at both levels) are funnelled onto
 *   one strand so concurrent error and close notifications are serialized.
 * - Each open channel carries a generation; events and acks belonging to an
 *   older generation are dropped.
 * - Nothing is retried here. A lost connection stays lost until the owner
 *   calls connect() again.
 */
class ConnectionManager {
public:
    enum class State {
        Absent,
        Connecting,
        Open
    };

    struct ChannelHandle {
        std::shared_ptr<broker::Channel> channel;
        uint64_t generation = 0;

        explicit operator bool() const { return channel != nullptr; }
    };

    ConnectionManager(const TransporterConfig& config,
                      broker::Connector connector,
                      boost::asio::thread_pool& pool);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    std::shared_future<void> connect(std::function<void()> on_connected = nullptr);

    // Unbinds every recorded binding, then closes channel and connection.
    // Queues and exchanges are left in place.
    std::future<void> disconnect();

    bool is_connected() const;

    State state() const;

    bool disconnecting() const { return disconnecting_.load(); }

    ChannelHandle channel() const;

    // Null unless `generation` is the live channel.
    std::shared_ptr<broker::Channel> channel_for(uint64_t generation) const;

    BindingRegistry& bindings() { return bindings_; }

private:
    class PendingConnect;

    void run_connect(const std::shared_ptr<PendingConnect>& pending,
                     uint64_t generation,
                     const std::function<void()>& on_connected);

    void fail_connect(const std::shared_ptr<PendingConnect>& pending,
                      uint64_t generation,
                      std::exception_ptr error);

    void teardown(const std::shared_ptr<broker::Connection>& connection,
                  const std::shared_ptr<broker::Channel>& channel);

    broker::Connection::Listener connection_listener(uint64_t generation);
    broker::Channel::Listener channel_listener(uint64_t generation);

    // Runs on the strand.
    void mark_down(uint64_t generation, std::exception_ptr error, bool channel_level);

    std::string url_;
    uint16_t prefetch_;
    broker::Connector connector_;
    std::shared_ptr<spdlog::logger> logger_;

    boost::asio::thread_pool& pool_;
    boost::asio::strand<boost::asio::thread_pool::executor_type> strand_;

    mutable std::mutex mutex_;
    State state_ = State::Absent;
    uint64_t generation_ = 0;
    std::shared_ptr<PendingConnect> pending_;
    std::shared_ptr<broker::Connection> connection_;
    std::shared_ptr<broker::Channel> channel_;

    std::atomic<bool> disconnecting_{false};

    BindingRegistry bindings_;
};

// what() of the stored exception, for log lines.
std::string describe(std::exception_ptr error);

} // namespace mqtransit
