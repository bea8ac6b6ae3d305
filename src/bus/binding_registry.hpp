#pragma once

#include "types.hpp"

#include <mutex>
#include <vector>

namespace mqtransit {

/**
 * Exchange-to-queue bindings created by this node, kept until a graceful
 * disconnect unwinds them. Thread-safe.
 */
class BindingRegistry {
public:
    // One entry per call, repeats included.
    void add(const Binding& binding);

    std::vector<Binding> snapshot() const;

    // Removes and returns every binding.
    std::vector<Binding> take_all();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Binding> bindings_;
};

} // namespace mqtransit
