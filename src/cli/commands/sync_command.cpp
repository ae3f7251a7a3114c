#include <pubmirror/cli/command.h>
#include <pubmirror/cli/pubmirror_cli.h>
#include <pubmirror/mirror/mirror.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace pubmirror::cli {

using json = nlohmann::json;

namespace {

json toJson(const mirror::SyncReport& r) {
    return json{{"remote_dir", r.remoteDir},
                {"local_dir", r.localDir.string()},
                {"passes", r.passes},
                {"fetched", r.fetched},
                {"skipped_already_valid", r.skippedAlreadyValid},
                {"refreshed_sidecars", r.refreshedSidecars},
                {"failed_already_present", r.failedAlreadyPresent},
                {"remote_vanished", r.remoteVanished},
                {"ignored", r.ignored},
                {"bytes_fetched", r.bytesFetched},
                {"elapsed_ms", r.elapsed.count()}};
}

} // namespace

class SyncCommand : public ICommand {
public:
    std::string getName() const override { return "sync"; }

    std::string getDescription() const override {
        return "Mirror a PubChem CURRENT-Full dataset directory, fetching only missing files.";
    }

    void registerCommand(CLI::App& app, PubmirrorCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("sync", getDescription());
        cmd->alias("download");

        cmd->add_option("--mirror-dir", mirrorDir_, "Local mirror root (default: config or .)");
        cmd->add_option("--dataset", dataset_, "Dataset type: [compounds|substances]")
            ->check(CLI::IsMember({"compounds", "substances"}, CLI::ignore_case));
        cmd->add_option("--format", format_, "Dump format directory (default: sdf)");
        cmd->add_option("--host", host_, "FTP host (default: ftp.ncbi.nlm.nih.gov)");
        cmd->add_option("--max-passes", maxPasses_, "Give up after N passes (0 = retry forever)");
        cmd->add_option("--backoff-ms", backoffMs_, "Delay before restarting a failed pass")
            ->check(CLI::Range(0, 3600 * 1000));
        cmd->add_flag("--verify-existing", verifyExisting_,
                      "Check every local payload against its checksum and re-fetch corrupt ones");
        cmd->add_flag("--json", jsonOutput_, "Emit the sync report as JSON to stdout");

        cmd->callback([this]() { cli_->setPendingCommand(this); });

        cmd->footer(R"(Behavior:
  - Checksum sidecars (.md5) are fetched before payloads (.gz) and refreshed on every run.
  - Payloads already present and matching their checksum are never downloaded again.
  - Transient network errors restart the whole pass after --backoff-ms.)");
    }

    Result<void> execute() override {
        auto settings = cli_->settings();
        if (mirrorDir_)
            settings.mirror.mirrorDir = *mirrorDir_;
        if (dataset_)
            settings.dataset = *dataset_;
        if (format_)
            settings.format = *format_;
        if (host_)
            settings.remote.host = *host_;
        if (maxPasses_)
            settings.mirror.retry.maxPasses = *maxPasses_;
        if (backoffMs_)
            settings.mirror.retry.initialBackoff = std::chrono::milliseconds(*backoffMs_);
        if (verifyExisting_)
            settings.mirror.verifyExisting = true;

        auto logger = cli_->logger();
        mirror::MirrorEngine engine(cli_->makeTransport(), settings.remote, settings.mirror,
                                    logger);
        auto report = engine.sync(settings.dataset, settings.format);
        if (!report) {
            return report.error();
        }

        const auto& r = report.value();
        if (jsonOutput_) {
            std::cout << toJson(r).dump(2) << std::endl;
        } else {
            std::cout << "Mirror:    " << r.localDir.string() << "\n"
                      << "Fetched:   " << r.fetched << " (" << r.bytesFetched << " bytes)\n"
                      << "Skipped:   " << r.skippedAlreadyValid << " already valid\n"
                      << "Refreshed: " << r.refreshedSidecars << " checksum files\n"
                      << "Passes:    " << r.passes << "\n";
            if (r.failedAlreadyPresent > 0) {
                std::cout << "Conflicts: " << r.failedAlreadyPresent << "\n";
            }
            if (r.remoteVanished > 0) {
                std::cout << "Vanished:  " << r.remoteVanished << " removed from the server\n";
            }
        }
        return {};
    }

private:
    PubmirrorCLI* cli_{nullptr};
    std::optional<std::string> mirrorDir_;
    std::optional<std::string> dataset_;
    std::optional<std::string> format_;
    std::optional<std::string> host_;
    std::optional<std::uint32_t> maxPasses_;
    std::optional<std::int64_t> backoffMs_;
    bool verifyExisting_{false};
    bool jsonOutput_{false};
};

std::unique_ptr<ICommand> createSyncCommand() {
    return std::make_unique<SyncCommand>();
}

} // namespace pubmirror::cli
