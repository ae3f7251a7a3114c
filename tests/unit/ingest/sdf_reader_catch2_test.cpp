#include <catch2/catch_test_macros.hpp>

#include <pubmirror/ingest/sdf_reader.h>

#include "common/sdf_samples.h"

#include <sstream>
#include <string>

using namespace pubmirror;
using namespace pubmirror::ingest;

TEST_CASE("SdfReader reads consecutive records", "[ingest][sdf][catch2]") {
    std::istringstream in(test::sdfRecord("2244", "CC(=O)OC1=CC=CC=C1C(=O)O") +
                          test::sdfRecord("3672"));
    SdfReader reader(in);
    SdfRecord record;

    auto first = reader.next(record);
    REQUIRE(first);
    REQUIRE(first.value());
    CHECK(record.title == "2244");
    CHECK(record.firstLine == 1);
    CHECK(record.molfile.find("M  END\n") != std::string::npos);
    CHECK(record.property("PUBCHEM_SMILES") == "CC(=O)OC1=CC=CC=C1C(=O)O");
    CHECK(record.pubchemId() == 2244);

    auto second = reader.next(record);
    REQUIRE(second);
    REQUIRE(second.value());
    CHECK(record.pubchemId() == 3672);
    CHECK_FALSE(record.property("PUBCHEM_SMILES").has_value());

    auto end = reader.next(record);
    REQUIRE(end);
    CHECK_FALSE(end.value());
}

TEST_CASE("SdfReader handles multi-line values and CRLF", "[ingest][sdf][catch2]") {
    std::string text = "title\r\n\r\n\r\n  0  0  0     0  0  0  0  0  0999 V2000\r\nM  END\r\n"
                       "> <NOTES> (1)\r\nline one\r\nline two\r\n\r\n"
                       "> <PUBCHEM_SUBSTANCE_ID>\r\n42\r\n$$$$\r\n";
    std::istringstream in(text);
    SdfReader reader(in);
    SdfRecord record;

    auto r = reader.next(record);
    REQUIRE(r);
    REQUIRE(r.value());
    CHECK(record.property("NOTES") == "line one\nline two");
    CHECK(record.pubchemId() == 42);
}

TEST_CASE("SdfReader reports malformed records and resynchronises", "[ingest][sdf][catch2]") {
    std::istringstream in(test::malformedSdfRecord() + test::sdfRecord("7"));
    SdfReader reader(in);
    SdfRecord record;

    auto bad = reader.next(record);
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidData);

    auto good = reader.next(record);
    REQUIRE(good);
    REQUIRE(good.value());
    CHECK(record.pubchemId() == 7);
}

TEST_CASE("SdfReader rejects a truncated final record", "[ingest][sdf][catch2]") {
    std::string full = test::sdfRecord("1");
    std::istringstream in(full.substr(0, full.find("$$$$")));
    SdfReader reader(in);
    SdfRecord record;

    auto r = reader.next(record);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidData);
}

TEST_CASE("SdfReader treats blank input as empty", "[ingest][sdf][catch2]") {
    std::istringstream in("\n\n  \n");
    SdfReader reader(in);
    SdfRecord record;
    auto r = reader.next(record);
    REQUIRE(r);
    CHECK_FALSE(r.value());
}

TEST_CASE("SdfRecord falls back to a numeric title for its id", "[ingest][sdf][catch2]") {
    SdfRecord record;
    record.title = " 99 ";
    CHECK(record.pubchemId() == 99);
    record.title = "aspirin";
    CHECK_FALSE(record.pubchemId().has_value());
    record.properties.emplace_back("PUBCHEM_COMPOUND_CID", "not a number");
    CHECK_FALSE(record.pubchemId().has_value());
}
