// =============================================================================
// logging.cpp - spdlog logger setup
// =============================================================================

#include "cpmm/logging.hpp"
#include <mutex>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cpmm {
namespace logging {

LogPtr get() {
    static std::once_flag once;
    static LogPtr logger;
    std::call_once(once, [] {
        logger = spdlog::get(LOGGER_NAME);
        if (!logger) {
            logger = spdlog::stdout_color_mt(LOGGER_NAME);
            logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e [%n %^%l%$] %v");
            logger->set_level(spdlog::level::info);
        }
    });
    return logger;
}

bool is_level_name(std::string_view level) {
    std::string name{level};
    // from_str maps unknown names to "off"
    return spdlog::level::from_str(name) != spdlog::level::off || name == "off";
}

void set_level(std::string_view level) {
    std::string name{level};
    if (!is_level_name(name)) {
        throw std::invalid_argument("unknown log level: " + name);
    }
    get()->set_level(spdlog::level::from_str(name));
}

} // namespace logging
} // namespace cpmm
