#pragma once

#include <pubmirror/core/types.h>
#include <pubmirror/ingest/ingest_handler.h>
#include <pubmirror/logging/logging.h>
#include <pubmirror/mirror/mirror.hpp>
#include <pubmirror/transport/transport.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace pubmirror::config {

/**
 * @brief Effective settings for one pubmirror invocation.
 *
 * Filled from built-in defaults, then the config file, then the environment.
 * Command-line options are applied on top by the CLI.
 */
struct Settings {
    transport::TransportConfig remote{};
    mirror::MirrorConfig mirror{};
    std::string dataset{"compounds"};
    std::string format{"sdf"};
    ingest::IngestBackend backend{ingest::IngestBackend::Sqlite};
    std::filesystem::path storeLocation; // empty = backend default under the mirror dir
    logging::LogConfig log{};
};

/**
 * @brief Apply "section.key" values onto settings. Unknown keys are ignored.
 */
Result<void> applyConfigValues(Settings& settings,
                               const std::map<std::string, std::string>& values);

/**
 * @brief Load settings: defaults, then the config file (if it exists), then environment.
 */
Result<Settings> loadSettings(const std::filesystem::path& configPath);

} // namespace pubmirror::config
