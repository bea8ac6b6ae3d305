#include "amqp_connection.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <rabbitmq-c/amqp.h>
#include <rabbitmq-c/ssl_socket.h>
#include <rabbitmq-c/tcp_socket.h>
#include <zmq.hpp>
#include <zmq_addon.hpp>

#include <sys/time.h>

#include <atomic>
#include <cstring>
#include <iterator>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace mqtransit {

namespace {

constexpr amqp_channel_t kChannel = 1;
constexpr const char* kIngress = "inproc://mqtransit-ingress";

// Ingress frame 0.
constexpr char kOpPublish = 'P';
constexpr char kOpAck = 'A';
constexpr char kOpNack = 'N';

std::string bytes_to_string(amqp_bytes_t bytes) {
    return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

amqp_bytes_t to_bytes(const std::string& value) {
    amqp_bytes_t bytes;
    bytes.len = value.size();
    bytes.bytes = const_cast<char*>(value.data());
    return bytes;
}

std::string flag_frame(const std::optional<bool>& flag) {
    if (!flag) return std::string();
    return *flag ? "1" : "0";
}

std::optional<bool> parse_flag(const std::string& frame) {
    if (frame.empty()) return std::nullopt;
    return frame == "1";
}

std::string frame_string(const zmq::message_t& frame) {
    return std::string(static_cast<const char*>(frame.data()), frame.size());
}

amqp_table_entry_t int_entry(const char* key, int64_t value) {
    amqp_table_entry_t entry;
    entry.key = amqp_cstring_bytes(key);
    entry.value.kind = AMQP_FIELD_KIND_I64;
    entry.value.value.i64 = value;
    return entry;
}

amqp_table_entry_t string_entry(const char* key, const std::string& value) {
    amqp_table_entry_t entry;
    entry.key = amqp_cstring_bytes(key);
    entry.value.kind = AMQP_FIELD_KIND_UTF8;
    entry.value.value.bytes = to_bytes(value);
    return entry;
}

struct timeval to_timeval(std::chrono::milliseconds interval) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(interval.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((interval.count() % 1000) * 1000);
    return tv;
}

} // namespace

class AmqpConnection : public broker::Connection,
                       public std::enable_shared_from_this<AmqpConnection> {
public:
    explicit AmqpConnection(const AmqpOptions& options);
    ~AmqpConnection() override;

    // Connects, logs in and starts the I/O thread. Throws ConnectionFailure.
    void open(const std::string& url);

    void listen(Listener listener) override;

    std::future<std::shared_ptr<broker::Channel>> create_channel() override;

    std::future<void> close() override;

    // Channel side. Everything below runs on the I/O thread unless noted.
    template <typename T>
    std::future<T> submit(std::function<T()> op);

    // Any thread.
    bool push(std::vector<std::string> frames);

    void listen_channel(broker::Channel::Listener listener);

    void require_channel() const;
    void check_reply(amqp_rpc_reply_t reply, const std::string& context);

    amqp_connection_state_t state() const { return conn_; }

    void add_consumer(const std::string& tag, broker::DeliveryCallback callback);
    void close_channel();

private:
    void io_thread_loop();
    void drain_ingress();
    void handle_ingress(const std::vector<zmq::message_t>& frames);
    void poll_broker();
    void handle_unexpected_frame();

    void channel_lost(std::exception_ptr error);
    void connection_lost(std::exception_ptr error);

    zmq::socket_t& get_thread_local_push_socket();

    Listener connection_listener();
    broker::Channel::Listener channel_listener();

    AmqpOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    amqp_connection_state_t conn_ = nullptr;
    bool connection_open_ = false;
    std::atomic<bool> channel_open_{false};

    std::map<std::string, broker::DeliveryCallback> consumers_;

    boost::asio::io_context control_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> control_work_;

    zmq::context_t context_;
    std::unique_ptr<zmq::socket_t> pull_socket_;
    std::mutex socket_mutex_;
    std::map<std::thread::id, std::unique_ptr<zmq::socket_t>> thread_sockets_;
    std::atomic<bool> needs_drain_{false};

    std::mutex listener_mutex_;
    Listener connection_listener_;
    broker::Channel::Listener channel_listener_;

    std::atomic<bool> running_{false};
    std::thread io_thread_;
};

/**
 * Channel 1 of an AmqpConnection. Keeps the connection alive while held.
 */
class AmqpChannel : public broker::Channel {
public:
    explicit AmqpChannel(std::shared_ptr<AmqpConnection> connection)
        : connection_(std::move(connection)) {}

    void listen(Listener listener) override {
        connection_->listen_channel(std::move(listener));
    }

    std::future<void> prefetch(uint16_t count) override {
        AmqpConnection* conn = connection_.get();
        return conn->submit<void>([conn, count]() {
            conn->require_channel();
            amqp_basic_qos(conn->state(), kChannel, 0, count, 0);
            conn->check_reply(amqp_get_rpc_reply(conn->state()), "setting prefetch");
        });
    }

    std::future<void> assert_queue(const std::string& name, const QueueOptions& options) override {
        AmqpConnection* conn = connection_.get();
        return conn->submit<void>([conn, name, options]() {
            conn->require_channel();
            std::vector<amqp_table_entry_t> entries;
            if (options.message_ttl) entries.push_back(int_entry("x-message-ttl", options.message_ttl->count()));
            if (options.expires) entries.push_back(int_entry("x-expires", options.expires->count()));
            if (options.max_length) entries.push_back(int_entry("x-max-length", *options.max_length));
            if (options.dead_letter_exchange) {
                entries.push_back(string_entry("x-dead-letter-exchange", *options.dead_letter_exchange));
            }
            amqp_table_t arguments;
            arguments.num_entries = static_cast<int>(entries.size());
            arguments.entries = entries.empty() ? nullptr : entries.data();

            amqp_queue_declare(conn->state(), kChannel, to_bytes(name), 0,
                               options.durable.value_or(true),
                               options.exclusive.value_or(false),
                               options.auto_delete.value_or(false),
                               arguments);
            conn->check_reply(amqp_get_rpc_reply(conn->state()), "declaring queue '" + name + "'");
        });
    }

    std::future<void> assert_exchange(const std::string& name,
                                      broker::ExchangeType type,
                                      const ExchangeOptions& options) override {
        AmqpConnection* conn = connection_.get();
        std::string type_name = broker::to_string(type);
        return conn->submit<void>([conn, name, type_name, options]() {
            conn->require_channel();
            amqp_exchange_declare(conn->state(), kChannel, to_bytes(name), to_bytes(type_name), 0,
                                  options.durable.value_or(true),
                                  options.auto_delete.value_or(false),
                                  options.internal.value_or(false),
                                  amqp_empty_table);
            conn->check_reply(amqp_get_rpc_reply(conn->state()), "declaring exchange '" + name + "'");
        });
    }

    std::future<void> bind_queue(const Binding& binding) override {
        AmqpConnection* conn = connection_.get();
        return conn->submit<void>([conn, binding]() {
            conn->require_channel();
            amqp_queue_bind(conn->state(), kChannel, to_bytes(binding.queue), to_bytes(binding.exchange),
                            to_bytes(binding.routing_key), amqp_empty_table);
            conn->check_reply(amqp_get_rpc_reply(conn->state()), "binding queue '" + binding.queue + "'");
        });
    }

    std::future<void> unbind_queue(const Binding& binding) override {
        AmqpConnection* conn = connection_.get();
        return conn->submit<void>([conn, binding]() {
            conn->require_channel();
            amqp_queue_unbind(conn->state(), kChannel, to_bytes(binding.queue), to_bytes(binding.exchange),
                              to_bytes(binding.routing_key), amqp_empty_table);
            conn->check_reply(amqp_get_rpc_reply(conn->state()), "unbinding queue '" + binding.queue + "'");
        });
    }

    std::future<std::string> consume(const std::string& queue,
                                     broker::DeliveryCallback callback,
                                     const ConsumeOptions& options) override {
        AmqpConnection* conn = connection_.get();
        return conn->submit<std::string>([conn, queue, callback, options]() {
            conn->require_channel();
            std::string requested_tag = options.consumer_tag.value_or(std::string());
            amqp_basic_consume_ok_t* ok = amqp_basic_consume(
                conn->state(), kChannel, to_bytes(queue),
                requested_tag.empty() ? amqp_empty_bytes : to_bytes(requested_tag),
                0,
                options.no_ack.value_or(false),
                options.exclusive.value_or(false),
                amqp_empty_table);
            conn->check_reply(amqp_get_rpc_reply(conn->state()), "consuming queue '" + queue + "'");
            std::string tag = ok ? bytes_to_string(ok->consumer_tag) : requested_tag;
            conn->add_consumer(tag, callback);
            return tag;
        });
    }

    bool send_to_queue(const std::string& queue,
                       const std::string& content,
                       const MessageOptions& options) override {
        return publish(std::string(), queue, content, options);
    }

    bool publish(const std::string& exchange,
                 const std::string& routing_key,
                 const std::string& content,
                 const MessageOptions& options) override {
        std::vector<std::string> frames;
        frames.push_back(std::string(1, kOpPublish));
        frames.push_back(exchange);
        frames.push_back(routing_key);
        frames.push_back(content);
        frames.push_back(flag_frame(options.persistent));
        frames.push_back(flag_frame(options.mandatory));
        frames.push_back(options.expiration ? std::to_string(options.expiration->count()) : std::string());
        frames.push_back(options.priority ? std::to_string(*options.priority) : std::string());
        frames.push_back(options.content_type.value_or(std::string()));
        return connection_->push(std::move(frames));
    }

    void ack(const broker::Delivery& delivery) override {
        settle(kOpAck, delivery.delivery_tag);
    }

    void nack(const broker::Delivery& delivery) override {
        settle(kOpNack, delivery.delivery_tag);
    }

    std::future<void> close() override {
        AmqpConnection* conn = connection_.get();
        return conn->submit<void>([conn]() { conn->close_channel(); });
    }

private:
    void settle(char op, uint64_t delivery_tag) {
        std::string tag(sizeof(delivery_tag), '\0');
        std::memcpy(&tag[0], &delivery_tag, sizeof(delivery_tag));
        connection_->push({std::string(1, op), tag});
    }

    std::shared_ptr<AmqpConnection> connection_;
};

AmqpConnection::AmqpConnection(const AmqpOptions& options)
    : options_(options)
    , logger_(log::or_default(options.logger))
    , control_work_(boost::asio::make_work_guard(control_))
    , context_(1) {
    pull_socket_.reset(new zmq::socket_t(context_, zmq::socket_type::pull));
    pull_socket_->set(zmq::sockopt::rcvhwm, options_.ingress_hwm);
    pull_socket_->bind(kIngress);
}

AmqpConnection::~AmqpConnection() {
    running_.store(false);
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    if (conn_) {
        if (connection_open_) {
            amqp_connection_close(conn_, AMQP_REPLY_SUCCESS);
        }
        amqp_destroy_connection(conn_);
        conn_ = nullptr;
    }

    pull_socket_.reset();
    std::lock_guard<std::mutex> lock(socket_mutex_);
    thread_sockets_.clear();
}

void AmqpConnection::open(const std::string& url) {
    std::vector<char> buffer(url.begin(), url.end());
    buffer.push_back('\0');

    struct amqp_connection_info info;
    amqp_default_connection_info(&info);
    int status = amqp_parse_url(buffer.data(), &info);
    if (status != AMQP_STATUS_OK) {
        throw ConnectionFailure("invalid AMQP url '" + url + "': " + amqp_error_string2(status));
    }

    conn_ = amqp_new_connection();
    amqp_socket_t* socket = info.ssl ? amqp_ssl_socket_new(conn_) : amqp_tcp_socket_new(conn_);
    if (!socket) {
        throw ConnectionFailure(std::string("cannot create AMQP socket for ") + info.host);
    }

    status = amqp_socket_open(socket, info.host, info.port);
    if (status != AMQP_STATUS_OK) {
        throw ConnectionFailure(std::string("cannot connect to ") + info.host + ":"
                                + std::to_string(info.port) + ": " + amqp_error_string2(status));
    }

    amqp_rpc_reply_t reply = amqp_login(conn_, info.vhost, 0, options_.frame_max, options_.heartbeat_seconds,
                                        AMQP_SASL_METHOD_PLAIN, info.user, info.password);
    if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
        throw ConnectionFailure(std::string("cannot log into AMQP broker at ") + info.host);
    }
    connection_open_ = true;

    running_.store(true);
    io_thread_ = std::thread(&AmqpConnection::io_thread_loop, this);
}

void AmqpConnection::listen(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    connection_listener_ = std::move(listener);
}

void AmqpConnection::listen_channel(broker::Channel::Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    channel_listener_ = std::move(listener);
}

broker::Connection::Listener AmqpConnection::connection_listener() {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    return connection_listener_;
}

broker::Channel::Listener AmqpConnection::channel_listener() {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    return channel_listener_;
}

template <typename T>
std::future<T> AmqpConnection::submit(std::function<T()> op) {
    auto task = std::make_shared<std::packaged_task<T()>>(std::move(op));
    auto future = task->get_future();
    if (!running_.load()) {
        std::promise<T> closed;
        closed.set_exception(std::make_exception_ptr(ChannelClosed("AMQP connection is closed")));
        return closed.get_future();
    }
    boost::asio::post(control_, [task]() { (*task)(); });
    return future;
}

std::future<std::shared_ptr<broker::Channel>> AmqpConnection::create_channel() {
    std::future<void> opened = submit<void>([this]() {
        if (!connection_open_) {
            throw ConnectionFailure("AMQP connection is closed");
        }
        amqp_channel_open(conn_, kChannel);
        check_reply(amqp_get_rpc_reply(conn_), "opening channel");
        channel_open_.store(true);
    });

    // The channel handle is built on the caller's side so the I/O thread
    // never holds a strong reference to its own connection.
    std::shared_ptr<AmqpConnection> self = shared_from_this();
    return std::async(std::launch::deferred,
                      [self, opened = std::move(opened)]() mutable -> std::shared_ptr<broker::Channel> {
        opened.get();
        return std::make_shared<AmqpChannel>(self);
    });
}

std::future<void> AmqpConnection::close() {
    return submit<void>([this]() {
        if (channel_open_.load()) {
            close_channel();
        }
        running_.store(false);
        if (!connection_open_) {
            return;
        }
        connection_open_ = false;
        amqp_rpc_reply_t reply = amqp_connection_close(conn_, AMQP_REPLY_SUCCESS);

        auto listener = connection_listener();
        if (listener.close) listener.close(nullptr);
        check_reply(reply, "closing connection");
    });
}

void AmqpConnection::close_channel() {
    require_channel();
    channel_open_.store(false);
    consumers_.clear();
    check_reply(amqp_channel_close(conn_, kChannel, AMQP_REPLY_SUCCESS), "closing channel");

    auto listener = channel_listener();
    if (listener.close) listener.close(nullptr);
}

void AmqpConnection::require_channel() const {
    if (!channel_open_.load() || !connection_open_) {
        throw ChannelClosed("AMQP channel is closed");
    }
}

void AmqpConnection::add_consumer(const std::string& tag, broker::DeliveryCallback callback) {
    consumers_[tag] = std::move(callback);
}

void AmqpConnection::check_reply(amqp_rpc_reply_t reply, const std::string& context) {
    switch (reply.reply_type) {
    case AMQP_RESPONSE_NORMAL:
        return;

    case AMQP_RESPONSE_NONE:
        throw ChannelFailure(context + ": missing RPC reply");

    case AMQP_RESPONSE_LIBRARY_EXCEPTION: {
        ConnectionFailure error(context + ": " + amqp_error_string2(reply.library_error));
        connection_lost(std::make_exception_ptr(error));
        throw error;
    }

    case AMQP_RESPONSE_SERVER_EXCEPTION:
        if (reply.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
            auto* method = static_cast<amqp_channel_close_t*>(reply.reply.decoded);
            ChannelFailure error(context + ": " + std::to_string(method->reply_code) + " "
                                 + bytes_to_string(method->reply_text));
            amqp_channel_close_ok_t close_ok;
            amqp_send_method(conn_, kChannel, AMQP_CHANNEL_CLOSE_OK_METHOD, &close_ok);
            channel_lost(std::make_exception_ptr(error));
            throw error;
        }
        if (reply.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
            auto* method = static_cast<amqp_connection_close_t*>(reply.reply.decoded);
            ConnectionFailure error(context + ": " + std::to_string(method->reply_code) + " "
                                    + bytes_to_string(method->reply_text));
            amqp_connection_close_ok_t close_ok;
            amqp_send_method(conn_, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &close_ok);
            connection_lost(std::make_exception_ptr(error));
            throw error;
        }
        throw ChannelFailure(context + ": unexpected server method " + std::to_string(reply.reply.id));
    }
    throw ChannelFailure(context + ": unknown reply type");
}

void AmqpConnection::io_thread_loop() {
    while (running_.load()) {
        control_.poll();
        drain_ingress();

        if (connection_open_) {
            poll_broker();
        } else {
            std::this_thread::sleep_for(options_.poll_interval);
        }
    }
    // Pending control operations fail with broken_promise once control_ is gone.
    control_.stop();
}

void AmqpConnection::drain_ingress() {
    while (true) {
        std::vector<zmq::message_t> frames;
        auto result = zmq::recv_multipart(*pull_socket_, std::back_inserter(frames),
                                          zmq::recv_flags::dontwait);
        if (!result.has_value()) {
            break;
        }
        handle_ingress(frames);
    }

    if (needs_drain_.exchange(false)) {
        auto listener = channel_listener();
        if (listener.drain) listener.drain();
    }
}

void AmqpConnection::handle_ingress(const std::vector<zmq::message_t>& frames) {
    if (frames.empty() || frames[0].size() != 1) {
        return;
    }
    if (!channel_open_.load() || !connection_open_) {
        logger_->debug("AMQP dropping outgoing frame, channel is closed.");
        return;
    }

    const char op = *static_cast<const char*>(frames[0].data());
    if ((op == kOpAck || op == kOpNack) && frames.size() == 2 && frames[1].size() == sizeof(uint64_t)) {
        uint64_t delivery_tag;
        std::memcpy(&delivery_tag, frames[1].data(), sizeof(delivery_tag));
        int status = op == kOpAck
            ? amqp_basic_ack(conn_, kChannel, delivery_tag, 0)
            : amqp_basic_nack(conn_, kChannel, delivery_tag, 0, 1);
        if (status != AMQP_STATUS_OK) {
            connection_lost(std::make_exception_ptr(ConnectionFailure(
                std::string("AMQP acknowledgment failed: ") + amqp_error_string2(status))));
        }
        return;
    }

    if (op != kOpPublish || frames.size() != 9) {
        logger_->warn("AMQP ignoring malformed ingress message.");
        return;
    }

    std::string exchange = frame_string(frames[1]);
    std::string routing_key = frame_string(frames[2]);
    std::optional<bool> persistent = parse_flag(frame_string(frames[4]));
    std::optional<bool> mandatory = parse_flag(frame_string(frames[5]));
    std::string expiration = frame_string(frames[6]);
    std::string priority = frame_string(frames[7]);
    std::string content_type = frame_string(frames[8]);

    amqp_basic_properties_t props;
    std::memset(&props, 0, sizeof(props));
    props._flags = 0;
    if (!content_type.empty()) {
        props._flags |= AMQP_BASIC_CONTENT_TYPE_FLAG;
        props.content_type = to_bytes(content_type);
    }
    if (persistent) {
        props._flags |= AMQP_BASIC_DELIVERY_MODE_FLAG;
        props.delivery_mode = *persistent ? 2 : 1;
    }
    if (!expiration.empty()) {
        props._flags |= AMQP_BASIC_EXPIRATION_FLAG;
        props.expiration = to_bytes(expiration);
    }
    if (!priority.empty()) {
        props._flags |= AMQP_BASIC_PRIORITY_FLAG;
        props.priority = static_cast<uint8_t>(std::stoi(priority));
    }

    amqp_bytes_t body;
    body.len = frames[3].size();
    body.bytes = const_cast<void*>(frames[3].data());

    int status = amqp_basic_publish(conn_, kChannel, to_bytes(exchange), to_bytes(routing_key),
                                    mandatory.value_or(false), 0, &props, body);
    if (status != AMQP_STATUS_OK) {
        connection_lost(std::make_exception_ptr(ConnectionFailure(
            std::string("AMQP publish failed: ") + amqp_error_string2(status))));
    }
}

void AmqpConnection::poll_broker() {
    amqp_maybe_release_buffers(conn_);

    amqp_envelope_t envelope;
    struct timeval timeout = to_timeval(options_.poll_interval);
    amqp_rpc_reply_t reply = amqp_consume_message(conn_, &envelope, &timeout, 0);

    if (reply.reply_type == AMQP_RESPONSE_NORMAL) {
        broker::Delivery delivery;
        delivery.content = bytes_to_string(envelope.message.body);
        delivery.delivery_tag = envelope.delivery_tag;
        delivery.redelivered = envelope.redelivered != 0;
        delivery.exchange = bytes_to_string(envelope.exchange);
        delivery.routing_key = bytes_to_string(envelope.routing_key);
        delivery.consumer_tag = bytes_to_string(envelope.consumer_tag);
        amqp_destroy_envelope(&envelope);

        auto it = consumers_.find(delivery.consumer_tag);
        if (it == consumers_.end()) {
            logger_->warn("AMQP delivery for unknown consumer '{}'", delivery.consumer_tag);
            return;
        }
        it->second(delivery);
        return;
    }

    if (reply.reply_type != AMQP_RESPONSE_LIBRARY_EXCEPTION) {
        return;
    }
    if (reply.library_error == AMQP_STATUS_TIMEOUT) {
        return;
    }
    if (reply.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
        handle_unexpected_frame();
        return;
    }
    connection_lost(std::make_exception_ptr(ConnectionFailure(
        std::string("AMQP connection lost: ") + amqp_error_string2(reply.library_error))));
}

void AmqpConnection::handle_unexpected_frame() {
    amqp_frame_t frame;
    if (amqp_simple_wait_frame(conn_, &frame) != AMQP_STATUS_OK) {
        connection_lost(std::make_exception_ptr(ConnectionFailure("AMQP connection lost while reading frame")));
        return;
    }
    if (frame.frame_type != AMQP_FRAME_METHOD) {
        return;
    }

    switch (frame.payload.method.id) {
    case AMQP_BASIC_ACK_METHOD:
        break;

    case AMQP_BASIC_RETURN_METHOD: {
        auto* method = static_cast<amqp_basic_return_t*>(frame.payload.method.decoded);
        broker::ReturnedMessage returned;
        returned.reply_code = method->reply_code;
        returned.reply_text = bytes_to_string(method->reply_text);
        returned.exchange = bytes_to_string(method->exchange);
        returned.routing_key = bytes_to_string(method->routing_key);

        amqp_message_t message;
        amqp_rpc_reply_t reply = amqp_read_message(conn_, frame.channel, &message, 0);
        if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
            connection_lost(std::make_exception_ptr(ConnectionFailure("AMQP failed to read returned message")));
            return;
        }
        returned.content = bytes_to_string(message.body);
        amqp_destroy_message(&message);

        auto listener = channel_listener();
        if (listener.returned) listener.returned(returned);
        break;
    }

    case AMQP_CHANNEL_CLOSE_METHOD: {
        auto* method = static_cast<amqp_channel_close_t*>(frame.payload.method.decoded);
        ChannelFailure error("AMQP channel closed by broker: " + std::to_string(method->reply_code) + " "
                             + bytes_to_string(method->reply_text));
        amqp_channel_close_ok_t close_ok;
        amqp_send_method(conn_, frame.channel, AMQP_CHANNEL_CLOSE_OK_METHOD, &close_ok);
        channel_lost(std::make_exception_ptr(error));
        break;
    }

    case AMQP_CONNECTION_CLOSE_METHOD: {
        auto* method = static_cast<amqp_connection_close_t*>(frame.payload.method.decoded);
        ConnectionFailure error("AMQP connection closed by broker: " + std::to_string(method->reply_code) + " "
                                + bytes_to_string(method->reply_text));
        amqp_connection_close_ok_t close_ok;
        amqp_send_method(conn_, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &close_ok);
        connection_lost(std::make_exception_ptr(error));
        break;
    }

    case AMQP_CONNECTION_BLOCKED_METHOD: {
        auto* method = static_cast<amqp_connection_blocked_t*>(frame.payload.method.decoded);
        auto listener = connection_listener();
        if (listener.blocked) listener.blocked(bytes_to_string(method->reason));
        break;
    }

    case AMQP_CONNECTION_UNBLOCKED_METHOD: {
        auto listener = connection_listener();
        if (listener.unblocked) listener.unblocked();
        break;
    }

    default:
        logger_->debug("AMQP ignoring method 0x{:08x}", frame.payload.method.id);
        break;
    }
}

void AmqpConnection::channel_lost(std::exception_ptr error) {
    if (!channel_open_.exchange(false)) {
        return;
    }
    consumers_.clear();

    auto listener = channel_listener();
    if (listener.error) listener.error(error);
    if (listener.close) listener.close(error);
}

void AmqpConnection::connection_lost(std::exception_ptr error) {
    if (!connection_open_) {
        return;
    }
    connection_open_ = false;
    channel_lost(error);

    auto listener = connection_listener();
    if (listener.error) listener.error(error);
    if (listener.close) listener.close(error);
}

bool AmqpConnection::push(std::vector<std::string> frames) {
    if (!running_.load() || !channel_open_.load()) {
        throw ChannelClosed("AMQP channel is closed");
    }

    auto& push_socket = get_thread_local_push_socket();
    bool accepted = true;

    for (size_t i = 0; i < frames.size(); ++i) {
        zmq::message_t msg(frames[i].size());
        std::memcpy(msg.data(), frames[i].data(), frames[i].size());
        zmq::send_flags flags = (i + 1 < frames.size()) ? zmq::send_flags::sndmore : zmq::send_flags::none;

        if (i == 0) {
            if (push_socket.send(msg, flags | zmq::send_flags::dontwait).has_value()) {
                continue;
            }
            // Ingress is full: report backpressure, then wait (bounded by sndtimeo).
            accepted = false;
            needs_drain_.store(true);
        }
        if (!push_socket.send(msg, flags).has_value()) {
            throw ChannelClosed("AMQP ingress is not draining");
        }
    }
    return accepted;
}

zmq::socket_t& AmqpConnection::get_thread_local_push_socket() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    auto thread_id = std::this_thread::get_id();

    auto it = thread_sockets_.find(thread_id);
    if (it == thread_sockets_.end()) {
        auto socket = std::unique_ptr<zmq::socket_t>(new zmq::socket_t(context_, zmq::socket_type::push));
        socket->set(zmq::sockopt::sndhwm, options_.ingress_hwm);
        socket->set(zmq::sockopt::sndtimeo, static_cast<int>(options_.ingress_timeout.count()));
        socket->set(zmq::sockopt::linger, 0);
        socket->connect(kIngress);
        thread_sockets_[thread_id] = std::move(socket);
        return *thread_sockets_[thread_id];
    }
    return *it->second;
}

std::future<std::shared_ptr<broker::Connection>> connect_amqp(const std::string& url, const AmqpOptions& options) {
    return std::async(std::launch::async, [url, options]() -> std::shared_ptr<broker::Connection> {
        auto connection = std::make_shared<AmqpConnection>(options);
        connection->open(url);
        return connection;
    });
}

broker::Connector amqp_connector(AmqpOptions options) {
    return [options](const std::string& url) {
        return connect_amqp(url, options);
    };
}

} // namespace mqtransit
