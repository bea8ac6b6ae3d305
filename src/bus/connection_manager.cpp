#include "connection_manager.hpp"

#include "errors.hpp"
#include "futures.hpp"
#include "log.hpp"

#include <boost/asio/post.hpp>

#include <vector>

namespace mqtransit {

// Settles the connect() future exactly once, whichever of the connect task
// or a lifecycle event gets there first.
class ConnectionManager::PendingConnect {
public:
    std::shared_future<void> get_future() const { return future_; }

    bool resolve() {
        if (settled_.exchange(true)) {
            return false;
        }
        promise_.set_value();
        return true;
    }

    bool reject(std::exception_ptr error) {
        if (settled_.exchange(true)) {
            return false;
        }
        promise_.set_exception(error);
        return true;
    }

private:
    std::promise<void> promise_;
    std::shared_future<void> future_ = promise_.get_future().share();
    std::atomic<bool> settled_{false};
};

std::string describe(std::exception_ptr error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "unknown error";
}

ConnectionManager::ConnectionManager(const TransporterConfig& config,
                                     broker::Connector connector,
                                     boost::asio::thread_pool& pool)
    : url_(config.url)
    , prefetch_(config.prefetch)
    , connector_(std::move(connector))
    , logger_(log::or_default(config.logger))
    , pool_(pool)
    , strand_(boost::asio::make_strand(pool.get_executor())) {
}

std::shared_future<void> ConnectionManager::connect(std::function<void()> on_connected) {
    std::shared_ptr<PendingConnect> pending;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disconnecting_.load()) {
            logger_->warn("AMQP connect requested while disconnecting.");
            return failed_future(std::make_exception_ptr(ConnectionFailure("AMQP disconnect in progress"))).share();
        }
        if (state_ == State::Connecting && pending_) {
            logger_->debug("AMQP connect requested while connecting; joining the pending attempt.");
            return pending_->get_future();
        }
        if (state_ == State::Open) {
            logger_->warn("AMQP connect requested while already connected.");
            return ready_future().share();
        }
        state_ = State::Connecting;
        generation = ++generation_;
        pending = std::make_shared<PendingConnect>();
        pending_ = pending;
    }

    auto future = pending->get_future();
    boost::asio::post(pool_, [this, pending, generation, on_connected]() {
        run_connect(pending, generation, on_connected);
    });
    return future;
}

void ConnectionManager::run_connect(const std::shared_ptr<PendingConnect>& pending,
                                    uint64_t generation,
                                    const std::function<void()>& on_connected) {
    std::shared_ptr<broker::Connection> connection;
    try {
        connection = connector_(url_).get();
    } catch (const std::exception& e) {
        logger_->warn("AMQP failed to connect: {}", e.what());
        fail_connect(pending, generation, std::make_exception_ptr(ConnectionFailure(e.what())));
        return;
    }
    logger_->info("AMQP is connected.");

    connection->listen(connection_listener(generation));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = connection;
    }

    std::shared_ptr<broker::Channel> channel;
    try {
        channel = connection->create_channel().get();
    } catch (const std::exception& e) {
        logger_->error("AMQP failed to create channel: {}", e.what());
        fail_connect(pending, generation, std::make_exception_ptr(ChannelFailure(e.what())));
        return;
    }

    channel->listen(channel_listener(generation));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != State::Connecting) {
            // The connection died while the channel was being opened.
            return;
        }
        channel_ = channel;
        state_ = State::Open;
    }
    logger_->info("AMQP channel is created.");

    try {
        channel->prefetch(prefetch_).get();
        if (on_connected) {
            on_connected();
        }
    } catch (const std::exception& e) {
        logger_->error("AMQP post-connect setup failed: {}", e.what());
        fail_connect(pending, generation, std::current_exception());
        return;
    }
    pending->resolve();
}

void ConnectionManager::fail_connect(const std::shared_ptr<PendingConnect>& pending,
                                     uint64_t generation,
                                     std::exception_ptr error) {
    std::shared_ptr<broker::Connection> connection;
    std::shared_ptr<broker::Channel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_) {
            state_ = State::Absent;
            connection.swap(connection_);
            channel.swap(channel_);
            pending_.reset();
            // Close events of the abandoned objects must not touch a retry.
            ++generation_;
        }
    }
    if (channel) {
        try {
            channel->close().get();
        } catch (const std::exception& e) {
            logger_->warn("AMQP failed to close channel: {}", e.what());
        }
    }
    if (connection) {
        try {
            connection->close().get();
        } catch (const std::exception& e) {
            logger_->warn("AMQP failed to close connection: {}", e.what());
        }
    }
    pending->reject(error);
}

std::future<void> ConnectionManager::disconnect() {
    std::shared_ptr<broker::Connection> connection;
    std::shared_ptr<broker::Channel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connection_ || !channel_) {
            return ready_future();
        }
        connection = connection_;
        channel = channel_;
        disconnecting_.store(true);
    }

    auto task = std::make_shared<std::packaged_task<void()>>([this, connection, channel]() {
        teardown(connection, channel);
    });
    auto future = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });
    return future;
}

void ConnectionManager::teardown(const std::shared_ptr<broker::Connection>& connection,
                                 const std::shared_ptr<broker::Channel>& channel) {
    std::vector<std::future<void>> unbinds;
    for (const auto& binding : bindings_.take_all()) {
        try {
            unbinds.push_back(channel->unbind_queue(binding));
        } catch (const std::exception& e) {
            logger_->warn("AMQP failed to unbind '{}' from '{}': {}", binding.queue, binding.exchange, e.what());
        }
    }
    try {
        wait_all(unbinds);
    } catch (const std::exception& e) {
        logger_->warn("AMQP failed to unbind queue: {}", e.what());
    }

    try {
        channel->close().get();
    } catch (const std::exception& e) {
        logger_->warn("AMQP failed to close channel: {}", e.what());
    }

    try {
        connection->close().get();
    } catch (const std::exception& e) {
        logger_->warn("AMQP failed to close connection: {}", e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ == connection || !connection_) {
        connection_.reset();
        channel_.reset();
        pending_.reset();
        state_ = State::Absent;
        ++generation_;
    }
    disconnecting_.store(false);
}

bool ConnectionManager::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::Open && channel_ != nullptr;
}

ConnectionManager::State ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ConnectionManager::ChannelHandle ConnectionManager::channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ChannelHandle handle;
    if (state_ == State::Open) {
        handle.channel = channel_;
        handle.generation = generation_;
    }
    return handle;
}

std::shared_ptr<broker::Channel> ConnectionManager::channel_for(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Open || generation != generation_) {
        return nullptr;
    }
    return channel_;
}

broker::Connection::Listener ConnectionManager::connection_listener(uint64_t generation) {
    broker::Connection::Listener listener;
    listener.error = [this, generation](std::exception_ptr error) {
        boost::asio::post(strand_, [this, generation, error]() {
            logger_->error("AMQP connection error: {}", describe(error));
            mark_down(generation,
                      error ? error : std::make_exception_ptr(ConnectionFailure("AMQP connection error")),
                      false);
        });
    };
    listener.close = [this, generation](std::exception_ptr error) {
        boost::asio::post(strand_, [this, generation, error]() {
            if (disconnecting_.load() || !error) {
                logger_->info("AMQP connection is closed gracefully.");
            } else {
                logger_->error("AMQP connection is closed: {}", describe(error));
            }
            mark_down(generation,
                      error ? error : std::make_exception_ptr(ConnectionFailure("AMQP connection is closed")),
                      false);
        });
    };
    listener.blocked = [this](const std::string& reason) {
        boost::asio::post(strand_, [this, reason]() {
            logger_->warn("AMQP connection is blocked: {}", reason);
        });
    };
    listener.unblocked = [this]() {
        boost::asio::post(strand_, [this]() {
            logger_->info("AMQP connection is unblocked.");
        });
    };
    return listener;
}

broker::Channel::Listener ConnectionManager::channel_listener(uint64_t generation) {
    broker::Channel::Listener listener;
    listener.close = [this, generation](std::exception_ptr error) {
        boost::asio::post(strand_, [this, generation, error]() {
            if (disconnecting_.load() || !error) {
                logger_->info("AMQP channel is closed gracefully.");
            } else {
                logger_->warn("AMQP channel is closed: {}", describe(error));
            }
            mark_down(generation,
                      error ? error : std::make_exception_ptr(ChannelFailure("AMQP channel is closed")),
                      true);
        });
    };
    listener.error = [this, generation](std::exception_ptr error) {
        boost::asio::post(strand_, [this, generation, error]() {
            logger_->error("AMQP channel error: {}", describe(error));
            mark_down(generation,
                      error ? error : std::make_exception_ptr(ChannelFailure("AMQP channel error")),
                      true);
        });
    };
    listener.drain = [this]() {
        boost::asio::post(strand_, [this]() {
            logger_->info("AMQP channel is drained.");
        });
    };
    listener.returned = [this](const broker::ReturnedMessage& message) {
        boost::asio::post(strand_, [this, message]() {
            logger_->warn("AMQP channel returned a message: {} {} (exchange '{}', routing key '{}')",
                          message.reply_code, message.reply_text, message.exchange, message.routing_key);
        });
    };
    return listener;
}

void ConnectionManager::mark_down(uint64_t generation, std::exception_ptr error, bool channel_level) {
    std::shared_ptr<PendingConnect> pending;
    std::shared_ptr<broker::Connection> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        state_ = State::Absent;
        channel_.reset();
        if (channel_level && !disconnecting_.load()) {
            // A channel never outlives its connection, and neither is reused.
            orphaned.swap(connection_);
        } else if (!channel_level) {
            connection_.reset();
        }
        pending.swap(pending_);
    }

    if (pending) {
        pending->reject(error);
    }

    if (orphaned) {
        boost::asio::post(pool_, [this, orphaned]() {
            try {
                orphaned->close().get();
            } catch (const std::exception& e) {
                logger_->warn("AMQP failed to close connection after channel loss: {}", e.what());
            }
        });
    }
}

} // namespace mqtransit
