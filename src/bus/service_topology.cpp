#include "service_topology.hpp"

#include "errors.hpp"
#include "futures.hpp"
#include "log.hpp"

#include <vector>

namespace mqtransit {

ServiceTopologyBuilder::ServiceTopologyBuilder(const TransporterConfig& config,
                                               const TopicNames& names,
                                               const TopologyPolicy& policy,
                                               ConnectionManager& connection,
                                               Subscriber& subscriber,
                                               ServiceTopologyProvider provider)
    : names_(names)
    , policy_(policy)
    , connection_(connection)
    , subscriber_(subscriber)
    , provider_(std::move(provider))
    , logger_(log::or_default(config.logger)) {
}

std::future<void> ServiceTopologyBuilder::declare_service_queues() {
    auto handle = connection_.channel();
    if (!handle || !provider_) {
        return ready_future();
    }

    std::vector<ServiceInfo> services = provider_();
    std::vector<std::future<void>> steps;
    try {
        for (const auto& service : services) {
            for (const auto& action : service.actions) {
                std::string queue = names_.action_queue(action);
                steps.push_back(handle.channel->assert_queue(queue, policy_.balanced_options_for(PacketType::Request)));
                if (claim_consumer(handle.generation, queue)) {
                    steps.push_back(subscriber_.consume(handle, queue, PacketType::Request, true));
                }
            }

            for (const auto& event : service.events) {
                const std::string& group = event.group ? *event.group : service.name;
                std::string queue = names_.event_group_queue(group, event.name);
                steps.push_back(handle.channel->assert_queue(queue, policy_.balanced_options_for(PacketType::Event)));
                if (claim_consumer(handle.generation, queue)) {
                    steps.push_back(subscriber_.consume(handle, queue, PacketType::Event, true));
                }
            }
        }
    } catch (const ChannelClosed& e) {
        logger_->debug("AMQP service queue declaration skipped: {}", e.what());
    }

    logger_->debug("AMQP declared service queues for {} service(s)", services.size());
    return join_steps(std::move(steps), logger_);
}

bool ServiceTopologyBuilder::claim_consumer(uint64_t generation, const std::string& queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != consumer_generation_) {
        consumer_generation_ = generation;
        consumed_queues_.clear();
    }
    return consumed_queues_.insert(queue).second;
}

} // namespace mqtransit
