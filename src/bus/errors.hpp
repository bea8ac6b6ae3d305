#pragma once

#include <stdexcept>
#include <string>

namespace mqtransit {

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// The broker rejected the connection attempt.
class ConnectionFailure : public TransportError {
public:
    explicit ConnectionFailure(const std::string& what) : TransportError(what) {}
};

// Channel could not be opened, or failed while open.
class ChannelFailure : public TransportError {
public:
    explicit ChannelFailure(const std::string& what) : TransportError(what) {}
};

// Operation issued against a channel that has already gone away.
class ChannelClosed : public TransportError {
public:
    explicit ChannelClosed(const std::string& what = "channel is closed") : TransportError(what) {}
};

class SerializationError : public TransportError {
public:
    explicit SerializationError(const std::string& what) : TransportError(what) {}
};

} // namespace mqtransit
