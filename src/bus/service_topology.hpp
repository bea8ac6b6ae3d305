#pragma once

#include "connection_manager.hpp"
#include "subscriber.hpp"
#include "topology.hpp"
#include "types.hpp"

#include <spdlog/logger.h>

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace mqtransit {

/**
 * ServiceTopologyBuilder declares the queues whose names depend on the
 * services hosted by this node:
 *   {prefix}.REQUEST-LB.{action}       one per local action
 *   {prefix}.EVENT-LB.{group}.{event}  one per local event (group defaults
 *                                      to the service name)
 * Both are consumed with acknowledgments so a worker dying mid-request
 * hands the message to another worker.
 *
 * Queue declaration is idempotent and repeated on every announcement.
 * Consumers are attached once per queue for each channel generation.
 */
class ServiceTopologyBuilder {
public:
    ServiceTopologyBuilder(const TransporterConfig& config,
                           const TopicNames& names,
                           const TopologyPolicy& policy,
                           ConnectionManager& connection,
                           Subscriber& subscriber,
                           ServiceTopologyProvider provider);

    std::future<void> declare_service_queues();

private:
    // True the first time `queue` is seen for `generation`.
    bool claim_consumer(uint64_t generation, const std::string& queue);

    const TopicNames& names_;
    const TopologyPolicy& policy_;
    ConnectionManager& connection_;
    Subscriber& subscriber_;
    ServiceTopologyProvider provider_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex mutex_;
    uint64_t consumer_generation_ = 0;
    std::set<std::string> consumed_queues_;
};

} // namespace mqtransit
