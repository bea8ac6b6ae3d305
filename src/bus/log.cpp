#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace mqtransit {
namespace log {

std::shared_ptr<spdlog::logger> get() {
    static const char* name = "mqtransit";
    auto logger = spdlog::get(name);
    if (!logger) {
        try {
            logger = spdlog::stdout_color_mt(name);
        } catch (const spdlog::spdlog_ex&) {
            // Lost the registration race with another thread.
            logger = spdlog::get(name);
        }
    }
    return logger;
}

std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> logger) {
    return logger ? logger : get();
}

} // namespace log
} // namespace mqtransit
