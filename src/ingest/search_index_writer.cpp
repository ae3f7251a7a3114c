#include <pubmirror/ingest/search_index_writer.h>
#include <pubmirror/logging/logging.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

namespace pubmirror::ingest {

namespace fs = std::filesystem;

namespace {

// Newest PubChem naming first
constexpr std::array<std::string_view, 4> kSmilesKeys{
    "PUBCHEM_SMILES", "PUBCHEM_OPENEYE_ISO_SMILES", "PUBCHEM_OPENEYE_CAN_SMILES",
    "PUBCHEM_CONNECTIVITY_SMILES"};

constexpr std::string_view kFingerprintKey = "PUBCHEM_CACTVS_SUBSKEYS";

} // namespace

Result<std::vector<int>> decodeCactvsFingerprint(std::string_view base64) {
    std::string clean;
    clean.reserve(base64.size());
    for (char c : base64) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            clean.push_back(c);
    }
    if (clean.empty() || clean.size() % 4 != 0) {
        return Error{ErrorCode::InvalidData, "Fingerprint is not valid base64"};
    }

    std::vector<unsigned char> raw(clean.size() / 4 * 3);
    const int n = EVP_DecodeBlock(raw.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (n < 0) {
        return Error{ErrorCode::InvalidData, "Fingerprint is not valid base64"};
    }
    // EVP_DecodeBlock counts padding as zero bytes
    std::size_t len = static_cast<std::size_t>(n);
    if (clean.size() >= 1 && clean[clean.size() - 1] == '=')
        --len;
    if (clean.size() >= 2 && clean[clean.size() - 2] == '=')
        --len;
    if (len < 4) {
        return Error{ErrorCode::InvalidData, "Fingerprint too short"};
    }

    const std::uint32_t bitCount = (std::uint32_t{raw[0]} << 24) | (std::uint32_t{raw[1]} << 16) |
                                   (std::uint32_t{raw[2]} << 8) | std::uint32_t{raw[3]};
    if (bitCount > (len - 4) * 8) {
        return Error{ErrorCode::InvalidData, "Fingerprint bit count exceeds payload"};
    }

    std::vector<int> bits;
    for (std::uint32_t i = 0; i < bitCount; ++i) {
        const unsigned char byte = raw[4 + i / 8];
        if (byte & (0x80u >> (i % 8)))
            bits.push_back(static_cast<int>(i));
    }
    return bits;
}

std::optional<nlohmann::json> toIndexDocument(const SdfRecord& record) {
    std::optional<std::string_view> smiles;
    for (auto key : kSmilesKeys) {
        if ((smiles = record.property(key)) && !smiles->empty())
            break;
        smiles.reset();
    }
    if (!smiles)
        return std::nullopt;

    nlohmann::json doc;
    doc["smiles"] = std::string(*smiles);

    auto fpProp = record.property(kFingerprintKey);
    if (fpProp) {
        auto bits = decodeCactvsFingerprint(*fpProp);
        if (bits) {
            nlohmann::json tokens = nlohmann::json::array();
            for (int b : bits.value())
                tokens.push_back(std::to_string(b));
            doc["fingerprint_len"] = bits.value().size();
            doc["fingerprint"] = std::move(tokens);
        }
    }
    return doc;
}

SearchIndexBulkWriter::SearchIndexBulkWriter(fs::path location, std::string indexName,
                                             std::shared_ptr<spdlog::logger> logger)
    : location_(std::move(location)), indexName_(std::move(indexName)),
      logger_(logging::orDefault(std::move(logger))) {}

Result<std::unique_ptr<SearchIndexBulkWriter>>
SearchIndexBulkWriter::open(const fs::path& location, std::string indexName,
                            std::shared_ptr<spdlog::logger> logger) {
    if (location.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(location.parent_path(), ec);
        if (ec && !fs::is_directory(location.parent_path())) {
            return Error{ErrorCode::IoError, "Cannot create " + location.parent_path().string() +
                                                 ": " + ec.message()};
        }
    }

    std::unique_ptr<SearchIndexBulkWriter> writer(
        new SearchIndexBulkWriter(location, std::move(indexName), std::move(logger)));
    writer->out_.open(location, std::ios::binary | std::ios::app);
    if (!writer->out_) {
        return Error{ErrorCode::IoError, "Cannot open " + location.string() + " for writing"};
    }
    return writer;
}

Result<void> SearchIndexBulkWriter::handle(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
    }

    std::uint64_t written = 0;
    std::uint64_t skipped = 0;
    std::uint64_t failed = 0;

    SdfReader reader(in);
    SdfRecord record;
    while (true) {
        auto next = reader.next(record);
        if (!next) {
            if (next.error().code == ErrorCode::IoError)
                return Error{ErrorCode::IoError, path.string() + ": " + next.error().message};
            logger_->warn("{}: skipping malformed record: {}", path.string(),
                          next.error().message);
            ++failed;
            continue;
        }
        if (!next.value())
            break;

        auto doc = toIndexDocument(record);
        if (!doc) {
            logger_->debug("{}: record at line {} has no SMILES; skipped", path.string(),
                           record.firstLine);
            ++skipped;
            continue;
        }

        nlohmann::json action;
        action["index"]["_index"] = indexName_;
        if (auto id = record.pubchemId())
            action["index"]["_id"] = std::to_string(*id);

        out_ << action.dump() << '\n' << doc->dump() << '\n';
        if (!out_) {
            return Error{ErrorCode::IoError, "Write failed for " + location_.string()};
        }
        ++written;
    }

    ++stats_.files;
    stats_.records += written;
    stats_.recordsSkipped += skipped;
    stats_.recordsFailed += failed;
    logger_->info("Wrote {} index documents from {} ({} without SMILES, {} malformed)", written,
                  path.filename().string(), skipped, failed);
    return {};
}

Result<void> SearchIndexBulkWriter::flush() {
    out_.flush();
    if (!out_) {
        return Error{ErrorCode::IoError, "Flush failed for " + location_.string()};
    }
    return {};
}

} // namespace pubmirror::ingest
