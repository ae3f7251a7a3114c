#pragma once

#include <pubmirror/ingest/ingest_handler.h>
#include <pubmirror/ingest/sdf_reader.h>
#include <pubmirror/metadata/database.h>

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>

namespace pubmirror::ingest {

/**
 * @brief SD records into a SQLite store.
 *
 * Tables: molecules(id, cid, title, molfile, source) and
 * molecule_properties(molecule_id, name, value). One transaction per file with a
 * savepoint per record; re-ingesting a file replaces the rows it produced before.
 */
class SqliteMoleculeStore final : public IIngestHandler {
public:
    static Result<std::unique_ptr<SqliteMoleculeStore>>
    open(const std::filesystem::path& location, std::shared_ptr<spdlog::logger> logger = {});

    [[nodiscard]] Result<void> handle(const std::filesystem::path& path) override;
    [[nodiscard]] IngestStats stats() const override { return stats_; }

    /**
     * @brief Rows currently in molecules
     */
    Result<std::int64_t> moleculeCount();

    metadata::Database& database() { return db_; }

private:
    SqliteMoleculeStore(metadata::Database db, std::shared_ptr<spdlog::logger> logger);

    Result<void> prepareStatements();
    Result<void> removeSource(const std::string& source);
    Result<void> insertRecord(const SdfRecord& record, const std::string& source);

    metadata::Database db_;
    // Declared after db_ so they are finalized before the connection closes
    metadata::Statement insertMolecule_;
    metadata::Statement insertProperty_;
    std::shared_ptr<spdlog::logger> logger_;
    IngestStats stats_{};
};

} // namespace pubmirror::ingest
