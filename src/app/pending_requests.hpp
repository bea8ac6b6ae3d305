#pragma once

#include <cstddef>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace mqtransit {
namespace app {

/**
 * Matches RESPONSE packets to the requests waiting for them.
 */
class PendingRequests {
public:
    std::future<std::string> add(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_[id].get_future();
    }

    void resolve(const std::string& id, const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        it->second.set_value(data);
        pending_.erase(it);
    }

    // Drops a request that timed out; a late response is then ignored.
    void cancel(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::promise<std::string>> pending_;
};

} // namespace app
} // namespace mqtransit
