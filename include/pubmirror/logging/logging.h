#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace pubmirror::logging {

/**
 * @brief Process-wide logging setup, built once at startup and injected into components.
 */
struct LogConfig {
    std::string level{"info"};
    std::filesystem::path file; // empty = console only
    std::size_t maxFileBytes{10 * 1024 * 1024};
    std::size_t maxFiles{3};
    bool console{true};
};

/**
 * @brief Parse a level name (trace, debug, info, warn, error, critical, off).
 * Accepts the common aliases "warning", "err", "crit", "none" and "silent".
 */
std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

/**
 * @brief Build the "pubmirror" logger from config and install it as the spdlog default.
 *
 * PUBMIRROR_LOG_LEVEL, when set, wins over config.level.
 */
std::shared_ptr<spdlog::logger> makeLogger(const LogConfig& config);

/**
 * @brief Logger to use when a component was not handed one explicitly.
 */
inline std::shared_ptr<spdlog::logger> orDefault(std::shared_ptr<spdlog::logger> logger) {
    return logger ? std::move(logger) : spdlog::default_logger();
}

} // namespace pubmirror::logging
