#pragma once

#include <pubmirror/core/types.h>
#include <pubmirror/ingest/ingest_handler.h>

#include <spdlog/logger.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include <sys/types.h>

namespace pubmirror::extraction {

struct ExtractReport {
    std::uint64_t archivesSeen{0};
    std::uint64_t archivesHandled{0};
    std::uint64_t archivesCorrupt{0};  ///< Truncated or invalid gzip; skipped
    std::uint64_t staleStagingRemoved{0}; ///< Leftovers of killed runs reclaimed
    std::uint64_t bytesDecompressed{0};
};

/**
 * @brief Removes a file when it goes out of scope; failures are logged only
 */
class ScopedFileRemoval {
public:
    ScopedFileRemoval(std::filesystem::path path, std::shared_ptr<spdlog::logger> logger);
    ~ScopedFileRemoval();

    ScopedFileRemoval(const ScopedFileRemoval&) = delete;
    ScopedFileRemoval& operator=(const ScopedFileRemoval&) = delete;

private:
    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Walks a tree, decompresses each .gz and hands the result to a handler.
 *
 * x.sdf.gz is decompressed to "<dir>/.extract-<pid>/x.sdf", a directory private to
 * this process, so files the user keeps next to the archive are never touched.
 * The decompressed file is always removed after the handler returns or throws.
 * Staging directories left by a killed run are reclaimed at the start of the next.
 * Corrupt archives are logged and skipped. A handler error stops the walk and is
 * returned; a handler exception propagates.
 */
class ArchiveExtractor {
public:
    explicit ArchiveExtractor(std::shared_ptr<spdlog::logger> logger = {},
                              std::size_t chunkSize = DEFAULT_BUFFER_SIZE);

    Result<ExtractReport> extract(const std::filesystem::path& rootDir,
                                  ingest::IIngestHandler& handler);

    static bool isArchive(const std::filesystem::path& path);

    /**
     * @brief dir/x.sdf.gz -> dir/.extract-<our pid>/x.sdf
     */
    static std::filesystem::path decompressedPathFor(const std::filesystem::path& archive);

    /**
     * @brief Owner pid of a staging directory name; nullopt for any other path
     */
    static std::optional<pid_t> stagingOwner(const std::filesystem::path& path);

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::size_t chunkSize_;
};

} // namespace pubmirror::extraction
