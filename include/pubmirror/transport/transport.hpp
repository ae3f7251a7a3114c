#pragma once

/*
 * pubmirror transport - remote file server sessions
 *
 * Only the subset a mirror needs: list one directory, fetch one named file.
 * Sessions are scoped; closing happens on every exit path and close failures
 * are logged, never propagated. Retry policy lives in the mirror engine.
 */

#include <pubmirror/core/types.h>

#include <spdlog/logger.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace pubmirror::transport {

/**
 * Connection parameters (anonymous/public access by default).
 */
struct TransportConfig {
    std::string scheme{"ftp"};
    std::string host{"ftp.ncbi.nlm.nih.gov"};
    int port{0}; // 0 = scheme default
    std::string user{"anonymous"};
    std::string password{"anonymous@domain.com"};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds stallTimeout{60000}; // abort when no bytes arrive for this long
    std::optional<std::string> proxy;
};

/**
 * Receives downloaded bytes in order. Returning an error aborts the transfer.
 */
using ChunkSink = std::function<Result<void>(std::span<const std::byte>)>;

/**
 * An open session to a remote file server.
 */
class ISession {
public:
    virtual ~ISession() = default;

    /**
     * List a remote directory. Entries are full remote paths ("<remoteDir>/<name>").
     */
    virtual Result<std::vector<std::string>> list(std::string_view remoteDir) = 0;

    /**
     * Stream one remote file into sink. Returns the number of bytes delivered.
     */
    virtual Result<std::uint64_t> retrieve(std::string_view remotePath, const ChunkSink& sink) = 0;

    /**
     * Close the session. Called once by ScopedSession; must tolerate a dead connection.
     */
    virtual Result<void> close() = 0;
};

/**
 * Opens sessions against a remote server.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual Result<std::unique_ptr<ISession>> connect(const TransportConfig& config) = 0;
};

/**
 * RAII owner of a session: closes it on destruction and logs (never throws) on failure.
 */
class ScopedSession {
public:
    ScopedSession(std::unique_ptr<ISession> session, std::shared_ptr<spdlog::logger> logger);
    ~ScopedSession();

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;
    ScopedSession(ScopedSession&& other) noexcept = default;
    ScopedSession& operator=(ScopedSession&& other) noexcept = delete;

    ISession& operator*() const { return *session_; }
    ISession* operator->() const { return session_.get(); }

private:
    std::unique_ptr<ISession> session_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * Fetch remotePath into destination, creating it exclusively.
 *
 * Bytes are staged in a hidden sibling file, fsynced, then published with link(2),
 * which refuses to replace an existing file. Fails with ErrorCode::AlreadyExists
 * when destination exists (before or at publish time). A failed transfer leaves
 * no file under the destination name.
 */
Result<std::uint64_t> fetch(ISession& session, std::string_view remotePath,
                            const std::filesystem::path& destination);

/**
 * Name of the staging file used for destination; staging files never carry a
 * recognised mirror extension.
 */
std::filesystem::path stagingPathFor(const std::filesystem::path& destination);

/**
 * Owner pid encoded in a staging file name; nullopt for anything that is not one.
 */
std::optional<pid_t> stagingOwner(const std::filesystem::path& path);

/**
 * Remove staging files in dir whose owning process is gone (a killed download).
 * Staging files of live processes are left alone. Returns the number removed.
 */
Result<std::size_t> sweepStaleStaging(const std::filesystem::path& dir,
                                      std::shared_ptr<spdlog::logger> logger = {});

/**
 * Factory for the libcurl FTP transport.
 */
std::unique_ptr<ITransport> makeCurlFtpTransport(std::shared_ptr<spdlog::logger> logger = {});

namespace detail {

/**
 * Map a libcurl result (and the last FTP reply code) onto an ErrorCode.
 * Transient network conditions map to retryable codes.
 */
ErrorCode classifyCurlResult(int curlCode, long responseCode);

/**
 * Split an NLST body into full remote paths under remoteDir.
 */
std::vector<std::string> parseNameList(std::string_view body, std::string_view remoteDir);

/**
 * Build "<scheme>://<host>[:port]/<path>" with redundant slashes collapsed.
 */
std::string buildUrl(const TransportConfig& config, std::string_view path, bool directory);

} // namespace detail

} // namespace pubmirror::transport
