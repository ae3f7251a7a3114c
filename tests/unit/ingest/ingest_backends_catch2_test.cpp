#include <catch2/catch_test_macros.hpp>

#include <pubmirror/ingest/ingest_handler.h>
#include <pubmirror/ingest/search_index_writer.h>
#include <pubmirror/ingest/sqlite_molecule_store.h>

#include <nlohmann/json.hpp>

#include "common/sdf_samples.h"
#include "common/test_helpers_catch2.h"
#include "support/temp_dir_scope.hpp"

#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace pubmirror;
using namespace pubmirror::ingest;
using pubmirror::test_support::TempDirScope;

namespace {

// 16 bits, bits 0, 2 and 15 set
constexpr const char* kFingerprint = "AAAAEKAB";

std::vector<std::string> readLines(const fs::path& p) {
    std::ifstream in(p);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
        lines.push_back(line);
    return lines;
}

} // namespace

TEST_CASE("parseBackend accepts the documented names", "[ingest][catch2]") {
    CHECK(parseBackend("sqlite") == IngestBackend::Sqlite);
    CHECK(parseBackend("SQLite") == IngestBackend::Sqlite);
    CHECK(parseBackend("search-index") == IngestBackend::SearchIndex);
    CHECK(parseBackend("elasticsearch") == IngestBackend::SearchIndex);
    CHECK(parseBackend("none") == IngestBackend::None);
    CHECK_FALSE(parseBackend("bingo").has_value());

    CHECK(std::string(toString(IngestBackend::SearchIndex)) == "search-index");
    CHECK(defaultLocation(IngestBackend::Sqlite, "m") == fs::path("m") / "molecules.db");
    CHECK(defaultLocation(IngestBackend::None, "m").empty());
}

TEST_CASE("decodeCactvsFingerprint yields set bit positions", "[ingest][search][catch2]") {
    auto bits = decodeCactvsFingerprint(kFingerprint);
    REQUIRE(bits);
    CHECK(bits.value() == std::vector<int>{0, 2, 15});

    SECTION("padding is not counted as data") {
        // 8 bits declared, one byte 0x80
        auto padded = decodeCactvsFingerprint("AAAACIA=");
        REQUIRE(padded);
        CHECK(padded.value() == std::vector<int>{0});
    }

    SECTION("invalid input") {
        CHECK_FALSE(decodeCactvsFingerprint(""));
        CHECK_FALSE(decodeCactvsFingerprint("abc"));
        // declares 255 bits but carries none
        auto overlong = decodeCactvsFingerprint("AAAA/w==");
        REQUIRE_FALSE(overlong);
        CHECK(overlong.error().code == ErrorCode::InvalidData);
    }
}

TEST_CASE("toIndexDocument maps SMILES and fingerprint", "[ingest][search][catch2]") {
    SdfRecord record;
    record.properties = {{"PUBCHEM_OPENEYE_CAN_SMILES", "C"},
                         {"PUBCHEM_CACTVS_SUBSKEYS", kFingerprint}};
    auto doc = toIndexDocument(record);
    REQUIRE(doc);
    CHECK((*doc)["smiles"] == "C");
    CHECK((*doc)["fingerprint"] == nlohmann::json::array({"0", "2", "15"}));
    CHECK((*doc)["fingerprint_len"] == 3);

    SdfRecord bare;
    bare.properties = {{"PUBCHEM_CACTVS_SUBSKEYS", kFingerprint}};
    CHECK_FALSE(toIndexDocument(bare).has_value());
}

TEST_CASE("SqliteMoleculeStore ingests records and skips malformed ones",
          "[ingest][sqlite][catch2]") {
    TempDirScope tmp("pubmirror-ingest");
    auto sdf = test::write_file(tmp / "Compound_000000001_000000003.sdf",
                                test::sdfRecord("1", "C") + test::malformedSdfRecord() +
                                    test::sdfRecord("3", "CC"));

    auto opened = SqliteMoleculeStore::open(tmp / "db" / "molecules.db");
    REQUIRE(opened);
    auto store = std::move(opened).value();

    REQUIRE(store->handle(sdf));
    CHECK(store->stats().files == 1);
    CHECK(store->stats().records == 2);
    CHECK(store->stats().recordsFailed == 1);
    auto count = store->moleculeCount();
    REQUIRE(count);
    CHECK(count.value() == 2);

    auto stmt = store->database().prepare(
        "SELECT value FROM molecule_properties p JOIN molecules m ON m.id = p.molecule_id "
        "WHERE m.cid = 3 AND p.name = 'PUBCHEM_SMILES'");
    REQUIRE(stmt);
    auto s = std::move(stmt).value();
    auto row = s.step();
    REQUIRE(row);
    REQUIRE(row.value());
    CHECK(s.getString(0) == "CC");

    SECTION("re-ingesting a file replaces its rows") {
        REQUIRE(store->handle(sdf));
        auto again = store->moleculeCount();
        REQUIRE(again);
        CHECK(again.value() == 2);
        CHECK(store->stats().files == 2);
    }

    SECTION("a missing file is an error") {
        auto r = store->handle(tmp / "missing.sdf");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::FileNotFound);
    }

    SECTION("writers wait on a store locked by another process") {
        auto pragma = store->database().prepare("PRAGMA busy_timeout");
        REQUIRE(pragma);
        auto p = std::move(pragma).value();
        auto has = p.step();
        REQUIRE(has);
        REQUIRE(has.value());
        CHECK(p.getInt64(0) == 5000);
    }
}

TEST_CASE("SearchIndexBulkWriter emits action and source lines", "[ingest][search][catch2]") {
    TempDirScope tmp("pubmirror-ingest");
    auto sdf = test::write_file(tmp / "part.sdf", test::sdfRecord("2244", "CCO", kFingerprint) +
                                                      test::sdfRecord("5") +
                                                      test::malformedSdfRecord());
    const auto out = tmp / "bulk" / "pubchem.bulk.ndjson";

    auto opened = makeIngestHandler(IngestBackend::SearchIndex, out);
    REQUIRE(opened);
    auto handler = std::move(opened).value();
    REQUIRE(handler->handle(sdf));
    REQUIRE(handler->flush());

    CHECK(handler->stats().records == 1);
    CHECK(handler->stats().recordsSkipped == 1);
    CHECK(handler->stats().recordsFailed == 1);

    auto lines = readLines(out);
    REQUIRE(lines.size() == 2);
    auto action = nlohmann::json::parse(lines[0]);
    CHECK(action["index"]["_index"] == "pubchem");
    CHECK(action["index"]["_id"] == "2244");
    auto doc = nlohmann::json::parse(lines[1]);
    CHECK(doc["smiles"] == "CCO");
    CHECK(doc["fingerprint_len"] == 3);
}

TEST_CASE("The none backend accepts files without storing them", "[ingest][catch2]") {
    TempDirScope tmp("pubmirror-ingest");
    auto sdf = test::write_file(tmp / "part.sdf", test::sdfRecord("1"));

    auto opened = makeIngestHandler(IngestBackend::None, {});
    REQUIRE(opened);
    auto handler = std::move(opened).value();
    REQUIRE(handler->handle(sdf));
    REQUIRE(handler->flush());
    CHECK(handler->stats().files == 1);
    CHECK(handler->stats().records == 0);
}
