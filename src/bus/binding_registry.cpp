#include "binding_registry.hpp"

namespace mqtransit {

void BindingRegistry::add(const Binding& binding) {
    std::lock_guard<std::mutex> lock(mutex_);
    bindings_.push_back(binding);
}

std::vector<Binding> BindingRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_;
}

std::vector<Binding> BindingRegistry::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Binding> taken;
    taken.swap(bindings_);
    return taken;
}

size_t BindingRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.size();
}

} // namespace mqtransit
