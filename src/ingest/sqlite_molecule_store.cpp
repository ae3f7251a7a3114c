#include <pubmirror/ingest/sqlite_molecule_store.h>
#include <pubmirror/logging/logging.h>

#include <chrono>
#include <fstream>
#include <system_error>

namespace pubmirror::ingest {

namespace fs = std::filesystem;

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS molecules (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    cid INTEGER,
    title TEXT,
    molfile TEXT NOT NULL,
    source TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_molecules_cid ON molecules(cid);
CREATE INDEX IF NOT EXISTS idx_molecules_source ON molecules(source);
CREATE TABLE IF NOT EXISTS molecule_properties (
    molecule_id INTEGER NOT NULL REFERENCES molecules(id) ON DELETE CASCADE,
    name TEXT NOT NULL,
    value TEXT
);
CREATE INDEX IF NOT EXISTS idx_molecule_properties_molecule ON molecule_properties(molecule_id);
CREATE INDEX IF NOT EXISTS idx_molecule_properties_name ON molecule_properties(name);
)sql";

constexpr std::string_view kRecordSavepoint = "record";

// How long a write waits on a store locked by another process
constexpr std::chrono::milliseconds kBusyTimeout{5000};

} // namespace

SqliteMoleculeStore::SqliteMoleculeStore(metadata::Database db,
                                         std::shared_ptr<spdlog::logger> logger)
    : db_(std::move(db)), logger_(logging::orDefault(std::move(logger))) {}

Result<std::unique_ptr<SqliteMoleculeStore>>
SqliteMoleculeStore::open(const fs::path& location, std::shared_ptr<spdlog::logger> logger) {
    if (location.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(location.parent_path(), ec);
        if (ec && !fs::is_directory(location.parent_path())) {
            return Error{ErrorCode::IoError, "Cannot create " + location.parent_path().string() +
                                                 ": " + ec.message()};
        }
    }

    metadata::Database db;
    if (auto r = db.open(location.string(), metadata::ConnectionMode::Create); !r) {
        return r.error();
    }
    if (auto r = db.setBusyTimeout(kBusyTimeout); !r) {
        return r.error();
    }
    if (auto r = db.enableWAL(); !r) {
        return r.error();
    }
    if (auto r = db.execute("PRAGMA foreign_keys=ON"); !r) {
        return r.error();
    }
    if (auto r = db.execute(kSchema); !r) {
        return r.error();
    }

    std::unique_ptr<SqliteMoleculeStore> store(
        new SqliteMoleculeStore(std::move(db), std::move(logger)));
    if (auto r = store->prepareStatements(); !r) {
        return r.error();
    }
    store->logger_->debug("Opened molecule store {}", location.string());
    return store;
}

Result<void> SqliteMoleculeStore::prepareStatements() {
    auto mol = db_.prepare(
        "INSERT INTO molecules (cid, title, molfile, source) VALUES (?, ?, ?, ?)");
    if (!mol)
        return mol.error();
    insertMolecule_ = std::move(mol).value();

    auto prop =
        db_.prepare("INSERT INTO molecule_properties (molecule_id, name, value) VALUES (?, ?, ?)");
    if (!prop)
        return prop.error();
    insertProperty_ = std::move(prop).value();
    return {};
}

Result<void> SqliteMoleculeStore::removeSource(const std::string& source) {
    auto stmt = db_.prepare("DELETE FROM molecules WHERE source = ?");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    if (auto r = s.bind(1, source); !r)
        return r;
    return s.execute();
}

Result<void> SqliteMoleculeStore::insertRecord(const SdfRecord& record, const std::string& source) {
    if (auto r = insertMolecule_.reset(); !r)
        return r;

    Result<void> bound;
    if (auto id = record.pubchemId()) {
        bound = insertMolecule_.bind(1, static_cast<int64_t>(*id));
    } else {
        bound = insertMolecule_.bind(1, nullptr);
    }
    if (!bound)
        return bound;
    if (auto r = insertMolecule_.bind(2, record.title); !r)
        return r;
    if (auto r = insertMolecule_.bind(3, record.molfile); !r)
        return r;
    if (auto r = insertMolecule_.bind(4, source); !r)
        return r;
    if (auto r = insertMolecule_.execute(); !r)
        return r;

    const int64_t moleculeId = db_.lastInsertRowId();
    for (const auto& [name, value] : record.properties) {
        if (auto r = insertProperty_.reset(); !r)
            return r;
        if (auto r = insertProperty_.bindAll(moleculeId, name, value); !r)
            return r;
        if (auto r = insertProperty_.execute(); !r)
            return r;
    }
    return {};
}

Result<void> SqliteMoleculeStore::handle(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
    }
    const std::string source = path.filename().string();

    std::uint64_t ok = 0;
    std::uint64_t failed = 0;
    auto tx = db_.transaction([&]() -> Result<void> {
        if (auto r = removeSource(source); !r)
            return r;

        SdfReader reader(in);
        SdfRecord record;
        while (true) {
            auto next = reader.next(record);
            if (!next) {
                if (next.error().code == ErrorCode::IoError)
                    return next.error();
                logger_->warn("{}: skipping malformed record: {}", path.string(),
                              next.error().message);
                ++failed;
                continue;
            }
            if (!next.value())
                break;

            if (auto r = db_.savepoint(kRecordSavepoint); !r)
                return r;
            auto inserted = insertRecord(record, source);
            if (!inserted) {
                if (auto r = db_.rollbackToSavepoint(kRecordSavepoint); !r)
                    return r;
                logger_->warn("{}: record at line {} rejected: {}", path.string(),
                              record.firstLine, inserted.error().message);
                ++failed;
            } else {
                ++ok;
            }
            if (auto r = db_.releaseSavepoint(kRecordSavepoint); !r)
                return r;
        }
        return {};
    });
    if (!tx) {
        return Error{tx.error().code, path.string() + ": " + tx.error().message};
    }

    ++stats_.files;
    stats_.records += ok;
    stats_.recordsFailed += failed;
    logger_->info("Ingested {} records from {} ({} failed)", ok, source, failed);
    return {};
}

Result<std::int64_t> SqliteMoleculeStore::moleculeCount() {
    auto stmt = db_.prepare("SELECT COUNT(*) FROM molecules");
    if (!stmt)
        return stmt.error();
    auto s = std::move(stmt).value();
    auto row = s.step();
    if (!row)
        return row.error();
    return s.getInt64(0);
}

} // namespace pubmirror::ingest
