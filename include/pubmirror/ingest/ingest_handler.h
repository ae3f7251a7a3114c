#pragma once

#include <pubmirror/core/types.h>

#include <spdlog/logger.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace pubmirror::ingest {

/**
 * @brief Running counters of one handler across a pipeline run
 */
struct IngestStats {
    std::uint64_t files{0};
    std::uint64_t records{0};        ///< Records ingested
    std::uint64_t recordsFailed{0};  ///< Malformed or rejected records
    std::uint64_t recordsSkipped{0}; ///< Well-formed but not applicable to the backend
};

/**
 * @brief Consumes one decompressed SD file.
 *
 * Record-level failures are logged and counted, never returned. An error result
 * means the sink itself is unusable and the pipeline should stop.
 */
class IIngestHandler {
public:
    virtual ~IIngestHandler() = default;

    [[nodiscard]] virtual Result<void> handle(const std::filesystem::path& path) = 0;

    /**
     * @brief Flush buffered output at the end of a run
     */
    [[nodiscard]] virtual Result<void> flush() { return {}; }

    [[nodiscard]] virtual IngestStats stats() const = 0;
};

enum class IngestBackend { Sqlite, SearchIndex, None };

std::optional<IngestBackend> parseBackend(std::string_view name);

const char* toString(IngestBackend backend) noexcept;

/**
 * @brief Default store location for a backend under the mirror directory
 */
std::filesystem::path defaultLocation(IngestBackend backend,
                                      const std::filesystem::path& mirrorDir);

/**
 * @brief Open (or create) the store at location and return its handler
 */
Result<std::unique_ptr<IIngestHandler>>
makeIngestHandler(IngestBackend backend, const std::filesystem::path& location,
                  std::shared_ptr<spdlog::logger> logger = {});

} // namespace pubmirror::ingest
