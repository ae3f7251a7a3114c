#include <pubmirror/ingest/ingest_handler.h>
#include <pubmirror/ingest/search_index_writer.h>
#include <pubmirror/ingest/sqlite_molecule_store.h>
#include <pubmirror/logging/logging.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace pubmirror::ingest {

namespace fs = std::filesystem;

namespace {

// Accepts every file, ingests nothing
class NullIngestHandler final : public IIngestHandler {
public:
    explicit NullIngestHandler(std::shared_ptr<spdlog::logger> logger)
        : logger_(logging::orDefault(std::move(logger))) {}

    Result<void> handle(const fs::path& path) override {
        ++stats_.files;
        logger_->debug("No ingest backend configured; ignoring {}", path.string());
        return {};
    }

    IngestStats stats() const override { return stats_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    IngestStats stats_{};
};

} // namespace

std::optional<IngestBackend> parseBackend(std::string_view name) {
    std::string v(name);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "sqlite" || v == "chemdb")
        return IngestBackend::Sqlite;
    if (v == "search-index" || v == "search_index" || v == "elasticsearch")
        return IngestBackend::SearchIndex;
    if (v == "none" || v == "null")
        return IngestBackend::None;
    return std::nullopt;
}

const char* toString(IngestBackend backend) noexcept {
    switch (backend) {
        case IngestBackend::Sqlite:
            return "sqlite";
        case IngestBackend::SearchIndex:
            return "search-index";
        case IngestBackend::None:
            return "none";
    }
    return "unknown";
}

fs::path defaultLocation(IngestBackend backend, const fs::path& mirrorDir) {
    switch (backend) {
        case IngestBackend::Sqlite:
            return mirrorDir / "molecules.db";
        case IngestBackend::SearchIndex:
            return mirrorDir / "pubchem.bulk.ndjson";
        case IngestBackend::None:
            break;
    }
    return {};
}

Result<std::unique_ptr<IIngestHandler>> makeIngestHandler(IngestBackend backend,
                                                          const fs::path& location,
                                                          std::shared_ptr<spdlog::logger> logger) {
    switch (backend) {
        case IngestBackend::Sqlite: {
            auto store = SqliteMoleculeStore::open(location, std::move(logger));
            if (!store)
                return store.error();
            return std::unique_ptr<IIngestHandler>(std::move(store).value());
        }
        case IngestBackend::SearchIndex: {
            auto writer = SearchIndexBulkWriter::open(location, "pubchem", std::move(logger));
            if (!writer)
                return writer.error();
            return std::unique_ptr<IIngestHandler>(std::move(writer).value());
        }
        case IngestBackend::None:
            return std::unique_ptr<IIngestHandler>(
                std::make_unique<NullIngestHandler>(std::move(logger)));
    }
    return Error{ErrorCode::InvalidArgument, "Unknown ingest backend"};
}

} // namespace pubmirror::ingest
