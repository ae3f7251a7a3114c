#pragma once

/*
 * pubmirror mirror - incremental sync of one remote dataset directory
 *
 * Per pass, for each extension class in priority order (sidecars first):
 * list remote, scan local, take the base-name set difference, apply the
 * download policy to every target. Transient errors restart the whole pass.
 */

#include <pubmirror/core/types.h>
#include <pubmirror/transport/transport.hpp>

#include <spdlog/logger.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pubmirror::mirror {

/**
 * File classes the mirror knows about.
 */
enum class ExtensionClass { ChecksumSidecar, Payload };

// Processing order within a pass
inline constexpr std::array<ExtensionClass, 2> kClassOrder{ExtensionClass::ChecksumSidecar,
                                                           ExtensionClass::Payload};

/**
 * Final suffix of a class (".md5" or ".gz").
 */
std::string_view extensionOf(ExtensionClass cls) noexcept;

const char* toString(ExtensionClass cls) noexcept;

/**
 * Class of a path by its final suffix, or nullopt for anything else.
 */
std::optional<ExtensionClass> classify(const std::filesystem::path& path);

/**
 * Outcome of applying the download policy to one target.
 */
enum class DownloadOutcome {
    Fetched,
    SkippedAlreadyValid,
    RefreshedSidecar,
    FailedAlreadyPresent,
    RemoteVanished, // listed, but gone by the time it was retrieved
    Ignored
};

const char* toString(DownloadOutcome outcome) noexcept;

/**
 * Whole-pass retry policy. maxPasses == 0 means retry forever.
 */
struct RetryPolicy {
    std::uint32_t maxPasses{0};
    std::chrono::milliseconds initialBackoff{5000};
    double multiplier{1.0};
    std::chrono::milliseconds maxBackoff{300000};

    /**
     * Delay before the pass following failedPasses consecutive failures (1-based).
     */
    [[nodiscard]] std::chrono::milliseconds backoffFor(std::uint32_t failedPasses) const;
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

struct MirrorConfig {
    std::filesystem::path mirrorDir{"."};
    std::string rootPrefix{"pubchem"};
    RetryPolicy retry{};
    bool verifyExisting{false}; // re-check every local payload against its sidecar
    SleepFn sleep;              // empty = std::this_thread::sleep_for
};

/**
 * One remote file selected for download.
 */
struct SyncTarget {
    std::string remotePath;
    ExtensionClass cls{ExtensionClass::Payload};
    std::filesystem::path localPath;
};

/**
 * Per-sync counters. Counters accumulate across passes of one sync call.
 */
struct SyncReport {
    std::string remoteDir;
    std::filesystem::path localDir;
    std::uint64_t fetched{0};
    std::uint64_t skippedAlreadyValid{0};
    std::uint64_t refreshedSidecars{0};
    std::uint64_t failedAlreadyPresent{0};
    std::uint64_t remoteVanished{0};
    std::uint64_t ignored{0};
    std::uint32_t passes{0};
    std::uint64_t bytesFetched{0};
    std::chrono::milliseconds elapsed{0};

    void record(DownloadOutcome outcome);
};

// =========================
// Inventory helpers
// =========================

/**
 * Remote subtree name of a dataset ("compounds" -> "Compound"). InvalidArgument if unknown.
 */
Result<std::string> datasetTypeName(std::string_view dataset);

/**
 * "<rootPrefix>/<DatasetTypeName>/CURRENT-Full/<FORMAT>"
 */
Result<std::string> remoteSourceDir(std::string_view rootPrefix, std::string_view dataset,
                                    std::string_view format);

/**
 * "<mirrorDir>/<DatasetTypeName>/CURRENT-Full/<FORMAT>"
 */
Result<std::filesystem::path> localTargetDir(const std::filesystem::path& mirrorDir,
                                             std::string_view dataset, std::string_view format);

/**
 * Base names of the entries belonging to cls.
 */
std::set<std::string> baseNames(const std::vector<std::string>& paths, ExtensionClass cls);

/**
 * Base names of regular files of class cls directly under dir. Missing dir = empty set.
 */
Result<std::set<std::string>> localInventory(const std::filesystem::path& dir, ExtensionClass cls);

/**
 * remote - local, sorted.
 */
std::vector<std::string> missingSet(const std::set<std::string>& remote,
                                    const std::set<std::string>& local);

/**
 * Targets of one class. Sidecars (and payloads with verifyExisting) target every remote
 * entry; otherwise only the missing ones.
 */
std::vector<SyncTarget> planTargets(ExtensionClass cls, std::string_view remoteDir,
                                    const std::set<std::string>& remote,
                                    const std::set<std::string>& local,
                                    const std::filesystem::path& localDir, bool verifyExisting);

// =========================
// Download policy
// =========================

/**
 * Decides skip / refresh / fetch for one target path and performs the fetch.
 *
 * Exclusive-create collisions are resolved here and never surface as errors.
 * Freshly fetched payloads are verified against their sidecar; a mismatch removes
 * the payload and returns ErrorCode::HashMismatch.
 */
class DownloadPolicy {
public:
    explicit DownloadPolicy(std::shared_ptr<spdlog::logger> logger = {});

    Result<DownloadOutcome> apply(transport::ISession& session, std::string_view remotePath,
                                  const std::filesystem::path& localPath);

    // Bytes fetched by this policy so far
    [[nodiscard]] std::uint64_t bytesFetched() const noexcept { return bytesFetched_; }

private:
    Result<void> fetchVerified(transport::ISession& session, std::string_view remotePath,
                               const std::filesystem::path& localPath, ExtensionClass cls);
    Result<DownloadOutcome> refetch(transport::ISession& session, std::string_view remotePath,
                                    const std::filesystem::path& localPath, ExtensionClass cls,
                                    DownloadOutcome onSuccess);

    std::shared_ptr<spdlog::logger> logger_;
    std::uint64_t bytesFetched_{0};
};

// =========================
// Mirror engine
// =========================

class MirrorEngine {
public:
    MirrorEngine(std::unique_ptr<transport::ITransport> transport,
                 transport::TransportConfig remote, MirrorConfig config,
                 std::shared_ptr<spdlog::logger> logger = {});

    /**
     * Mirror one dataset/format pair until a pass completes, a permanent error
     * occurs, or maxPasses is exhausted (last error returned).
     */
    Result<SyncReport> sync(std::string_view dataset, std::string_view targetFormat);

    [[nodiscard]] const MirrorConfig& config() const noexcept { return config_; }

private:
    Result<void> runPass(const std::string& remoteDir, const std::filesystem::path& localDir,
                         SyncReport& report);

    std::unique_ptr<transport::ITransport> transport_;
    transport::TransportConfig remote_;
    MirrorConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace pubmirror::mirror
