#pragma once

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cogreader {

/// Name of the library logger
inline constexpr std::string_view kLoggerName = "cogreader";

namespace logging_detail {

/// @brief Level requested through COGREADER_LOG_LEVEL, warn when unset or unknown
[[nodiscard]] inline spdlog::level::level_enum level_from_environment() noexcept {
    const char* value = std::getenv("COGREADER_LOG_LEVEL");
    if (value == nullptr) {
        return spdlog::level::warn;
    }
    auto level = spdlog::level::from_str(value);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && std::string_view(value) != "off") {
        return spdlog::level::warn;
    }
    return level;
}

struct LoggerSlot {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
};

[[nodiscard]] inline LoggerSlot& slot() noexcept {
    static LoggerSlot instance;
    return instance;
}

} // namespace logging_detail

/// @brief Logger used by every cogreader component
/// @note Created on first use with a colored stderr sink. It is not registered in the
///       spdlog registry, so it never collides with application loggers.
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
    auto& s = logging_detail::slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.logger) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        s.logger = std::make_shared<spdlog::logger>(std::string(kLoggerName), std::move(sink));
        s.logger->set_level(logging_detail::level_from_environment());
    }
    return s.logger;
}

/// @brief Replace the library logger (e.g. to route messages into an application sink)
/// @param replacement New logger; nullptr restores the default on next use
inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    auto& s = logging_detail::slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.logger = std::move(replacement);
}

} // namespace cogreader
