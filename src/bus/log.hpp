#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace mqtransit {
namespace log {

// Shared "mqtransit" logger, created on first use with a colored stdout sink.
std::shared_ptr<spdlog::logger> get();

// Returns `logger` when set, the shared logger otherwise.
std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> logger);

} // namespace log
} // namespace mqtransit
