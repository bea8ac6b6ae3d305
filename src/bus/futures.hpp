#pragma once

#include "errors.hpp"

#include <spdlog/logger.h>

#include <exception>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mqtransit {

inline std::future<void> ready_future() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

inline std::future<void> failed_future(std::exception_ptr error) {
    std::promise<void> promise;
    promise.set_exception(error);
    return promise.get_future();
}

/**
 * Waits for every future, then rethrows the first failure (if any).
 * Unlike calling get() in a loop, no future is left unobserved on error.
 */
inline void wait_all(std::vector<std::future<void>>& futures) {
    std::exception_ptr first_error;
    for (auto& future : futures) {
        if (!future.valid()) {
            continue;
        }
        try {
            future.get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

/**
 * Combines pipelined channel operations into one lazily-awaited future.
 * A channel that went away mid-way (ChannelClosed) completes it quietly;
 * any other failure is delivered to the waiter.
 */
inline std::future<void> join_steps(std::vector<std::future<void>> steps,
                                    std::shared_ptr<spdlog::logger> logger) {
    return std::async(std::launch::deferred, [steps = std::move(steps), logger]() mutable {
        try {
            wait_all(steps);
        } catch (const ChannelClosed& e) {
            logger->debug("AMQP channel went away mid-operation: {}", e.what());
        }
    });
}

template <typename T>
std::future<void> discard_value(std::future<T> future) {
    return std::async(std::launch::deferred, [future = std::move(future)]() mutable {
        future.get();
    });
}

} // namespace mqtransit
