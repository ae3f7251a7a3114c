/*
 * staged_fetch.cpp
 *
 * Exclusive, atomic fetch into the local mirror:
 * - Bytes land in a hidden staging sibling (".<name>.part-<pid>-<seq>"), created O_EXCL with 0600
 * - fsync the staging file, then link(2) it to the final name; link never replaces an
 *   existing file, so a concurrent instance that published first wins and we see EEXIST
 * - Unlink the staging file and fsync the directory
 * Interrupted transfers leave only staging files, which never match a mirror extension;
 * sweepStaleStaging() reclaims those whose owning process has exited.
 */

#include <pubmirror/core/process.h>
#include <pubmirror/logging/logging.h>
#include <pubmirror/transport/transport.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace pubmirror::transport {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> g_stagingSeq{0};

Error errnoError(ErrorCode code, const std::string& what, int err) {
    return Error{code, what + ": " + std::strerror(err)};
}

// Simple RAII wrapper for a POSIX descriptor
struct Fd {
    int fd{-1};
    explicit Fd(int f) : fd(f) {}
    ~Fd() {
        if (fd >= 0)
            ::close(fd);
    }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int f = fd;
        fd = -1;
        return f;
    }
};

Result<void> writeAll(int fd, std::span<const std::byte> data, const fs::path& where) {
    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return errnoError(ErrorCode::IoError, "write() failed for " + where.string(), errno);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return {};
}

void fsyncDir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        spdlog::debug("open(O_DIRECTORY) failed for {}: {}", dir.string(), std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        spdlog::debug("fsync(dir) failed for {}: {}", dir.string(), std::strerror(errno));
    }
    ::close(fd);
}

void removeQuietly(const fs::path& p) noexcept {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        spdlog::debug("Failed to remove staging file {}: {}", p.string(), ec.message());
    }
}

} // namespace

ScopedSession::ScopedSession(std::unique_ptr<ISession> session,
                             std::shared_ptr<spdlog::logger> logger)
    : session_(std::move(session)), logger_(logging::orDefault(std::move(logger))) {}

ScopedSession::~ScopedSession() {
    if (!session_)
        return;
    try {
        auto r = session_->close();
        if (!r) {
            logger_->error("Failed to close session: {}", r.error().message);
        }
    } catch (const std::exception& e) {
        logger_->error("Failed to close session: {}", e.what());
    }
}

fs::path stagingPathFor(const fs::path& destination) {
    std::string name = ".";
    name += destination.filename().string();
    name += ".part-";
    name += std::to_string(::getpid());
    name.push_back('-');
    name += std::to_string(g_stagingSeq.fetch_add(1, std::memory_order_relaxed));
    return destination.parent_path() / name;
}

std::optional<pid_t> stagingOwner(const fs::path& path) {
    static constexpr std::string_view kMarker = ".part-";
    const auto name = path.filename().string();
    if (name.size() < 2 || name.front() != '.')
        return std::nullopt;
    const auto at = name.rfind(kMarker);
    if (at == std::string::npos || at == 0)
        return std::nullopt;
    std::string_view rest(name);
    rest.remove_prefix(at + kMarker.size());
    const auto dash = rest.find('-');
    if (dash == std::string_view::npos || dash + 1 == rest.size())
        return std::nullopt;
    return parseLeadingPid(rest.substr(0, dash));
}

Result<std::size_t> sweepStaleStaging(const fs::path& dir, std::shared_ptr<spdlog::logger> logger) {
    logger = logging::orDefault(std::move(logger));
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::size_t{0};
    }
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot list " + dir.string() + ": " + ec.message()};
    }

    std::size_t removed = 0;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            break;
        auto owner = stagingOwner(it->path());
        if (!owner || isProcessAlive(*owner))
            continue;

        std::error_code rec;
        if (fs::remove(it->path(), rec)) {
            ++removed;
            logger->info("Removed stale partial download {}", it->path().string());
        } else if (rec) {
            logger->warn("Cannot remove stale partial download {}: {}", it->path().string(),
                         rec.message());
        }
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot list " + dir.string() + ": " + ec.message()};
    }
    return removed;
}

Result<std::uint64_t> fetch(ISession& session, std::string_view remotePath,
                            const fs::path& destination) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(destination, ec))) {
        return Error{ErrorCode::AlreadyExists, destination.string() + " already exists"};
    }

    const auto parent = destination.has_parent_path() ? destination.parent_path() : fs::path(".");
    const auto staging = stagingPathFor(destination);

    Fd out(::open(staging.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600));
    if (!out) {
        return errnoError(ErrorCode::IoError, "Failed to create staging file " + staging.string(),
                          errno);
    }

    auto sink = [&](std::span<const std::byte> data) -> Result<void> {
        return writeAll(out.fd, data, staging);
    };

    auto got = session.retrieve(remotePath, sink);
    if (!got) {
        removeQuietly(staging);
        return got.error();
    }

    if (::fsync(out.fd) != 0) {
        auto err = errnoError(ErrorCode::IoError, "fsync() failed for " + staging.string(), errno);
        removeQuietly(staging);
        return err;
    }
    if (::close(out.release()) != 0) {
        auto err = errnoError(ErrorCode::IoError, "close() failed for " + staging.string(), errno);
        removeQuietly(staging);
        return err;
    }

    // Publish: link(2) fails with EEXIST instead of replacing
    if (::link(staging.c_str(), destination.c_str()) != 0) {
        const int err = errno;
        removeQuietly(staging);
        if (err == EEXIST) {
            return Error{ErrorCode::AlreadyExists, destination.string() + " already exists"};
        }
        return errnoError(ErrorCode::IoError, "Failed to publish " + destination.string(), err);
    }
    removeQuietly(staging);
    fsyncDir(parent);

    // Published files are plain readable files, not private staging files
    fs::permissions(destination,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions on {}: {}", destination.string(), ec.message());
    }
    return got.value();
}

} // namespace pubmirror::transport
