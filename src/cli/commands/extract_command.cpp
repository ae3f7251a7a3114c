#include <pubmirror/cli/command.h>
#include <pubmirror/cli/pubmirror_cli.h>
#include <pubmirror/extraction/archive_extractor.h>
#include <pubmirror/ingest/ingest_handler.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace pubmirror::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

class ExtractCommand : public ICommand {
public:
    std::string getName() const override { return "extract"; }

    std::string getDescription() const override {
        return "Decompress every .gz archive under the mirror and ingest its SD records.";
    }

    void registerCommand(CLI::App& app, PubmirrorCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("extract", getDescription());
        cmd->add_option("--mirror-dir", mirrorDir_, "Local mirror root (default: config or .)");
        cmd->add_option("--backend", backend_, "Ingest backend: [sqlite|search-index|none]")
            ->check(CLI::IsMember({"sqlite", "search-index", "none"}, CLI::ignore_case));
        cmd->add_option("--store-location", storeLocation_,
                        "Store path (default: <mirror>/molecules.db or "
                        "<mirror>/pubchem.bulk.ndjson)");
        cmd->add_flag("--json", jsonOutput_, "Emit the extract report as JSON to stdout");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& settings = cli_->settings();
        fs::path mirrorDir = mirrorDir_ ? fs::path(*mirrorDir_) : settings.mirror.mirrorDir;

        auto backend = settings.backend;
        if (backend_) {
            auto parsed = ingest::parseBackend(*backend_);
            if (!parsed) {
                return Error{ErrorCode::InvalidArgument, "Unknown backend '" + *backend_ + "'"};
            }
            backend = *parsed;
        }

        fs::path location = storeLocation_ ? fs::path(*storeLocation_) : settings.storeLocation;
        if (location.empty()) {
            location = ingest::defaultLocation(backend, mirrorDir);
        }

        auto logger = cli_->logger();
        auto handler = ingest::makeIngestHandler(backend, location, logger);
        if (!handler) {
            return handler.error();
        }

        extraction::ArchiveExtractor extractor(logger);
        auto report = extractor.extract(mirrorDir, *handler.value());
        if (!report) {
            return report.error();
        }

        const auto& r = report.value();
        const auto stats = handler.value()->stats();
        if (jsonOutput_) {
            json out{{"root", mirrorDir.string()},
                     {"backend", ingest::toString(backend)},
                     {"location", location.string()},
                     {"archives_seen", r.archivesSeen},
                     {"archives_handled", r.archivesHandled},
                     {"archives_corrupt", r.archivesCorrupt},
                     {"stale_staging_removed", r.staleStagingRemoved},
                     {"bytes_decompressed", r.bytesDecompressed},
                     {"records", stats.records},
                     {"records_failed", stats.recordsFailed},
                     {"records_skipped", stats.recordsSkipped}};
            std::cout << out.dump(2) << std::endl;
        } else {
            std::cout << "Archives: " << r.archivesHandled << " of " << r.archivesSeen
                      << " ingested";
            if (r.archivesCorrupt > 0)
                std::cout << ", " << r.archivesCorrupt << " corrupt";
            if (r.staleStagingRemoved > 0)
                std::cout << ", " << r.staleStagingRemoved << " interrupted runs cleaned up";
            std::cout << "\nRecords:  " << stats.records << " ingested, " << stats.recordsFailed
                      << " failed, " << stats.recordsSkipped << " skipped\n";
            if (backend != ingest::IngestBackend::None) {
                std::cout << "Store:    " << location.string() << "\n";
            }
        }
        return {};
    }

private:
    PubmirrorCLI* cli_{nullptr};
    std::optional<std::string> mirrorDir_;
    std::optional<std::string> backend_;
    std::optional<std::string> storeLocation_;
    bool jsonOutput_{false};
};

std::unique_ptr<ICommand> createExtractCommand() {
    return std::make_unique<ExtractCommand>();
}

} // namespace pubmirror::cli
