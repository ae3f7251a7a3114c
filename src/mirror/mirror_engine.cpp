#include <pubmirror/logging/logging.h>
#include <pubmirror/mirror/mirror.hpp>

#include <system_error>
#include <thread>

namespace pubmirror::mirror {

namespace fs = std::filesystem;

MirrorEngine::MirrorEngine(std::unique_ptr<transport::ITransport> transport,
                           transport::TransportConfig remote, MirrorConfig config,
                           std::shared_ptr<spdlog::logger> logger)
    : transport_(std::move(transport)), remote_(std::move(remote)), config_(std::move(config)),
      logger_(logging::orDefault(std::move(logger))) {
    if (!config_.sleep) {
        config_.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

Result<void> MirrorEngine::runPass(const std::string& remoteDir, const fs::path& localDir,
                                   SyncReport& report) {
    auto connected = transport_->connect(remote_);
    if (!connected) {
        return connected.error();
    }
    transport::ScopedSession session(std::move(connected).value(), logger_);

    if (auto swept = transport::sweepStaleStaging(localDir, logger_); !swept) {
        logger_->warn("Skipping stale staging cleanup: {}", swept.error().message);
    }

    DownloadPolicy policy(logger_);
    const auto bytesBefore = report.bytesFetched;

    for (auto cls : kClassOrder) {
        auto listing = session->list(remoteDir);
        if (!listing) {
            return listing.error();
        }
        auto local = localInventory(localDir, cls);
        if (!local) {
            return local.error();
        }

        const auto remote = baseNames(listing.value(), cls);
        auto targets =
            planTargets(cls, remoteDir, remote, local.value(), localDir, config_.verifyExisting);
        logger_->info("{}: {} remote, {} local, {} to process", toString(cls), remote.size(),
                      local.value().size(), targets.size());

        for (const auto& target : targets) {
            auto outcome = policy.apply(*session, target.remotePath, target.localPath);
            report.bytesFetched = bytesBefore + policy.bytesFetched();
            if (!outcome) {
                const auto& err = outcome.error();
                return Error{err.code, target.remotePath + ": " + err.message};
            }
            report.record(outcome.value());
        }
    }
    return {};
}

Result<SyncReport> MirrorEngine::sync(std::string_view dataset, std::string_view targetFormat) {
    const auto started = std::chrono::steady_clock::now();

    auto remoteDir = remoteSourceDir(config_.rootPrefix, dataset, targetFormat);
    if (!remoteDir) {
        return remoteDir.error();
    }
    auto localDir = localTargetDir(config_.mirrorDir, dataset, targetFormat);
    if (!localDir) {
        return localDir.error();
    }

    SyncReport report;
    report.remoteDir = remoteDir.value();
    report.localDir = localDir.value();

    std::uint32_t failures = 0;
    while (true) {
        std::error_code ec;
        fs::create_directories(report.localDir, ec);
        if (ec && !fs::is_directory(report.localDir)) {
            return Error{ErrorCode::IoError,
                         "Cannot create " + report.localDir.string() + ": " + ec.message()};
        }

        ++report.passes;
        logger_->info("Sync pass {}: {} -> {}", report.passes, report.remoteDir,
                      report.localDir.string());

        auto pass = runPass(report.remoteDir, report.localDir, report);
        if (pass) {
            break;
        }

        const auto& err = pass.error();
        if (!isRetryable(err)) {
            logger_->error("Sync failed: {}", err.message);
            return err;
        }

        ++failures;
        if (config_.retry.maxPasses != 0 && report.passes >= config_.retry.maxPasses) {
            logger_->error("Sync giving up after {} passes: {}", report.passes, err.message);
            return err;
        }

        const auto delay = config_.retry.backoffFor(failures);
        logger_->warn("Transient error ({}): {}; restarting pass in {} ms", err.code, err.message,
                      delay.count());
        config_.sleep(delay);
    }

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    logger_->info("Sync complete: {} fetched, {} skipped, {} sidecars refreshed, {} bytes in {} ms",
                  report.fetched, report.skippedAlreadyValid, report.refreshedSidecars,
                  report.bytesFetched, report.elapsed.count());
    return report;
}

} // namespace pubmirror::mirror
