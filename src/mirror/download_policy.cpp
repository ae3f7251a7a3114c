#include <pubmirror/integrity/checksum.h>
#include <pubmirror/logging/logging.h>
#include <pubmirror/mirror/mirror.hpp>

#include <system_error>

namespace pubmirror::mirror {

namespace fs = std::filesystem;

namespace {

bool pathExists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

Result<void> removeExisting(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IoError, "Cannot remove " + p.string() + ": " + ec.message()};
    }
    return {};
}

} // namespace

DownloadPolicy::DownloadPolicy(std::shared_ptr<spdlog::logger> logger)
    : logger_(logging::orDefault(std::move(logger))) {}

Result<void> DownloadPolicy::fetchVerified(transport::ISession& session,
                                           std::string_view remotePath, const fs::path& localPath,
                                           ExtensionClass cls) {
    auto got = transport::fetch(session, remotePath, localPath);
    if (!got) {
        return got.error();
    }
    bytesFetched_ += got.value();
    logger_->debug("Fetched {} ({} bytes)", localPath.string(), got.value());

    if (cls != ExtensionClass::Payload) {
        return {};
    }

    auto verdict = integrity::verifyAgainstSidecar(localPath, integrity::sidecarFor(localPath));
    if (!verdict) {
        return verdict.error();
    }
    const auto& v = verdict.value();
    switch (v.verdict) {
        case integrity::Verdict::Valid:
            return {};
        case integrity::Verdict::Unverifiable:
            logger_->warn("Cannot verify {}: {}", localPath.string(), v.reason);
            return {};
        case integrity::Verdict::Invalid:
            break;
    }

    // Fresh bytes do not match the sidecar; drop them so the next pass fetches again
    if (auto rm = removeExisting(localPath); !rm) {
        return rm.error();
    }
    return Error{ErrorCode::HashMismatch, "Checksum mismatch for " + localPath.string() +
                                              " (expected " + v.expected + ", got " + v.actual +
                                              ")"};
}

Result<DownloadOutcome> DownloadPolicy::refetch(transport::ISession& session,
                                                std::string_view remotePath,
                                                const fs::path& localPath, ExtensionClass cls,
                                                DownloadOutcome onSuccess) {
    if (auto rm = removeExisting(localPath); !rm) {
        return rm.error();
    }
    auto r = fetchVerified(session, remotePath, localPath, cls);
    if (r) {
        return onSuccess;
    }
    if (r.error().code == ErrorCode::AlreadyExists) {
        // Someone else published between our delete and our link
        logger_->error("{} reappeared while refreshing it; leaving the existing file in place",
                       localPath.string());
        return DownloadOutcome::FailedAlreadyPresent;
    }
    if (r.error().code == ErrorCode::NotFound) {
        logger_->warn("{} was removed from the server while refreshing it", remotePath);
        return DownloadOutcome::RemoteVanished;
    }
    return r.error();
}

Result<DownloadOutcome> DownloadPolicy::apply(transport::ISession& session,
                                              std::string_view remotePath,
                                              const fs::path& localPath) {
    auto cls = classify(localPath);
    if (!cls) {
        logger_->debug("Ignoring {}: not a mirrored file type", localPath.string());
        return DownloadOutcome::Ignored;
    }

    if (!pathExists(localPath)) {
        auto r = fetchVerified(session, remotePath, localPath, *cls);
        if (r) {
            logger_->info("Downloaded {}", localPath.string());
            return DownloadOutcome::Fetched;
        }
        if (r.error().code == ErrorCode::NotFound) {
            // Listed moments ago; the server dropped it since (a dataset rollover)
            logger_->warn("{} was removed from the server before it could be fetched",
                          remotePath);
            return DownloadOutcome::RemoteVanished;
        }
        if (r.error().code != ErrorCode::AlreadyExists) {
            return r.error();
        }
        // Lost the exclusive-create race; treat as already present
        logger_->debug("{} was published concurrently", localPath.string());
    }

    if (*cls == ExtensionClass::ChecksumSidecar) {
        auto r = refetch(session, remotePath, localPath, *cls, DownloadOutcome::RefreshedSidecar);
        if (r && r.value() == DownloadOutcome::RefreshedSidecar) {
            logger_->debug("Refreshed checksum {}", localPath.string());
        }
        return r;
    }

    auto verdict = integrity::verifyAgainstSidecar(localPath, integrity::sidecarFor(localPath));
    if (!verdict) {
        return verdict.error();
    }
    const auto& v = verdict.value();
    if (v.verdict == integrity::Verdict::Valid) {
        logger_->info("{} already downloaded", localPath.string());
        return DownloadOutcome::SkippedAlreadyValid;
    }
    if (v.verdict == integrity::Verdict::Unverifiable) {
        logger_->warn("{} already downloaded but cannot be verified: {}", localPath.string(),
                      v.reason);
        return DownloadOutcome::SkippedAlreadyValid;
    }

    logger_->warn("{} is corrupt (expected {}, got {}); fetching again", localPath.string(),
                  v.expected, v.actual);
    return refetch(session, remotePath, localPath, *cls, DownloadOutcome::Fetched);
}

} // namespace pubmirror::mirror
