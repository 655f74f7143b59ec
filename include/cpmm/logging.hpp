#ifndef CPMM_LOGGING_HPP
#define CPMM_LOGGING_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

// =============================================================================
// Logging Macros (format string checked at compile time)
// =============================================================================

#define CPMM_LOG_CHECK(level, action) \
    do { \
        auto lg = ::cpmm::logging::get(); \
        if (lg->should_log(level)) { \
            action; \
        } \
    } while (false)

#define CPMM_LOG_TRACE(f, ...) \
    CPMM_LOG_CHECK(spdlog::level::trace, SPDLOG_LOGGER_TRACE(lg, FMT_STRING(f), ##__VA_ARGS__))
#define CPMM_LOG_DEBUG(f, ...) \
    CPMM_LOG_CHECK(spdlog::level::debug, SPDLOG_LOGGER_DEBUG(lg, FMT_STRING(f), ##__VA_ARGS__))
#define CPMM_LOG_INFO(f, ...) \
    CPMM_LOG_CHECK(spdlog::level::info, SPDLOG_LOGGER_INFO(lg, FMT_STRING(f), ##__VA_ARGS__))
#define CPMM_LOG_WARN(f, ...) \
    CPMM_LOG_CHECK(spdlog::level::warn, SPDLOG_LOGGER_WARN(lg, FMT_STRING(f), ##__VA_ARGS__))
#define CPMM_LOG_ERROR(f, ...) \
    CPMM_LOG_CHECK(spdlog::level::err, SPDLOG_LOGGER_ERROR(lg, FMT_STRING(f), ##__VA_ARGS__))
#define CPMM_LOG_CRITICAL(f, ...) \
    CPMM_LOG_CHECK(spdlog::level::critical, SPDLOG_LOGGER_CRITICAL(lg, FMT_STRING(f), ##__VA_ARGS__))

namespace cpmm {
namespace logging {

using LogPtr = std::shared_ptr<spdlog::logger>;

constexpr const char* LOGGER_NAME = "cpmm";

// The "cpmm" logger; created on first use with a colour stdout sink
LogPtr get();

// True for the names set_level accepts
bool is_level_name(std::string_view level);

// Level names as spdlog spells them: trace, debug, info, warn, error, critical, off.
// Throws std::invalid_argument on an unknown name.
void set_level(std::string_view level);

} // namespace logging
} // namespace cpmm

#endif // CPMM_LOGGING_HPP
