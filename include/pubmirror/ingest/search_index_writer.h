#pragma once

#include <pubmirror/ingest/ingest_handler.h>
#include <pubmirror/ingest/sdf_reader.h>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pubmirror::ingest {

/**
 * @brief Set bit positions of a PubChem CACTVS substructure fingerprint.
 *
 * The property is base64 of a 4-byte big-endian bit count followed by the bits,
 * most significant bit first. InvalidData for anything that does not decode.
 */
Result<std::vector<int>> decodeCactvsFingerprint(std::string_view base64);

/**
 * @brief Bulk document for one record: {"smiles", "fingerprint", "fingerprint_len"}.
 * nullopt when the record carries no SMILES.
 */
std::optional<nlohmann::json> toIndexDocument(const SdfRecord& record);

/**
 * @brief Appends Elasticsearch _bulk NDJSON for the "pubchem" index mapping.
 *
 * Every document is an index action line plus a source line, with the PubChem
 * id as _id when the record has one.
 */
class SearchIndexBulkWriter final : public IIngestHandler {
public:
    static Result<std::unique_ptr<SearchIndexBulkWriter>>
    open(const std::filesystem::path& location, std::string indexName = "pubchem",
         std::shared_ptr<spdlog::logger> logger = {});

    [[nodiscard]] Result<void> handle(const std::filesystem::path& path) override;
    [[nodiscard]] Result<void> flush() override;
    [[nodiscard]] IngestStats stats() const override { return stats_; }

private:
    SearchIndexBulkWriter(std::filesystem::path location, std::string indexName,
                          std::shared_ptr<spdlog::logger> logger);

    std::filesystem::path location_;
    std::string indexName_;
    std::ofstream out_;
    std::shared_ptr<spdlog::logger> logger_;
    IngestStats stats_{};
};

} // namespace pubmirror::ingest
