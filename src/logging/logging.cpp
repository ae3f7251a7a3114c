#include <pubmirror/logging/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <cstdlib>
#include <vector>

namespace pubmirror::logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    std::string v;
    v.reserve(name.size());
    for (unsigned char c : name)
        v.push_back(static_cast<char>(std::tolower(c)));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> makeLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!config.file.empty()) {
        std::error_code ec;
        if (config.file.has_parent_path()) {
            std::filesystem::create_directories(config.file.parent_path(), ec);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file.string(), config.maxFileBytes, config.maxFiles));
    }

    auto logger = std::make_shared<spdlog::logger>("pubmirror", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");

    auto level = parseLevel(config.level).value_or(spdlog::level::info);
    if (const char* envLvl = std::getenv("PUBMIRROR_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            level = *lvl;
        }
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return logger;
}

} // namespace pubmirror::logging
