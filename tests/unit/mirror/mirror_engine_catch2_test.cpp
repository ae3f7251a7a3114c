#include <catch2/catch_test_macros.hpp>

#include <pubmirror/integrity/checksum.h>
#include <pubmirror/mirror/mirror.hpp>

#include "common/fake_transport.h"
#include "common/test_helpers_catch2.h"
#include "support/temp_dir_scope.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace pubmirror;
using namespace pubmirror::mirror;
using pubmirror::test_support::TempDirScope;

namespace {

constexpr const char* kRemoteDir = "pubchem/Compound/CURRENT-Full/SDF";

std::string md5Line(const std::string& content, const std::string& name) {
    auto v = integrity::makeIntegrityVerifier(integrity::HashAlgo::Md5);
    v->update(std::as_bytes(std::span(content.data(), content.size())));
    return v->finalize().value().hex + "  " + name + "\n";
}

std::size_t countFiles(const fs::path& dir) {
    std::size_t n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.is_regular_file())
            ++n;
    }
    return n;
}

struct EngineFixture {
    TempDirScope tmp{"pubmirror-engine"};
    std::shared_ptr<test::FakeRemote> remote = std::make_shared<test::FakeRemote>();
    std::vector<std::chrono::milliseconds> sleeps;

    void publish(const std::string& name, const std::string& content) {
        remote->put(std::string(kRemoteDir) + "/" + name, content);
        remote->put(std::string(kRemoteDir) + "/" + name + ".md5", md5Line(content, name));
    }

    MirrorEngine makeEngine(std::uint32_t maxPasses = 0, bool verifyExisting = false) {
        MirrorConfig cfg;
        cfg.mirrorDir = tmp.path();
        cfg.retry.maxPasses = maxPasses;
        cfg.verifyExisting = verifyExisting;
        cfg.sleep = [this](std::chrono::milliseconds d) { sleeps.push_back(d); };
        return MirrorEngine(std::make_unique<test::FakeTransport>(remote),
                            transport::TransportConfig{}, cfg);
    }

    fs::path localDir() const { return tmp / "Compound" / "CURRENT-Full" / "SDF"; }
};

} // namespace

TEST_CASE_METHOD(EngineFixture, "Fresh mirror fetches sidecars before payloads",
                 "[mirror][engine][catch2]") {
    publish("a.gz", "alpha");
    publish("b.gz", "bravo");

    auto engine = makeEngine();
    auto report = engine.sync("compounds", "sdf");
    REQUIRE(report);

    CHECK(countFiles(localDir()) == 4);
    CHECK(report.value().fetched == 4);
    CHECK(report.value().passes == 1);
    CHECK(sleeps.empty());

    REQUIRE(remote->retrieved.size() == 4);
    auto firstPayload = std::find_if(remote->retrieved.begin(), remote->retrieved.end(),
                                     [](const std::string& p) { return p.ends_with(".gz"); });
    auto lastSidecar = std::find_if(remote->retrieved.rbegin(), remote->retrieved.rend(),
                                    [](const std::string& p) { return p.ends_with(".md5"); });
    CHECK(std::distance(remote->retrieved.begin(), firstPayload) == 2);
    CHECK(std::distance(lastSidecar, remote->retrieved.rend()) == 2);

    CHECK(remote->connects == 1);
    CHECK(remote->closes == 1);
}

TEST_CASE_METHOD(EngineFixture, "Partial local state only fetches what is missing",
                 "[mirror][engine][catch2]") {
    publish("a.gz", "alpha");
    test::write_file(localDir() / "a.gz", "alpha");
    test::write_file(localDir() / "a.gz.md5", md5Line("alpha", "a.gz"));
    publish("b.gz", "bravo");

    auto engine = makeEngine();
    auto report = engine.sync("compounds", "sdf");
    REQUIRE(report);

    const auto& got = remote->retrieved;
    CHECK(std::count(got.begin(), got.end(), std::string(kRemoteDir) + "/a.gz") == 0);
    CHECK(std::count(got.begin(), got.end(), std::string(kRemoteDir) + "/a.gz.md5") == 1);
    CHECK(std::count(got.begin(), got.end(), std::string(kRemoteDir) + "/b.gz") == 1);
    CHECK(std::count(got.begin(), got.end(), std::string(kRemoteDir) + "/b.gz.md5") == 1);
    CHECK(report.value().refreshedSidecars == 1);
    CHECK(report.value().fetched == 2);
    CHECK(test::read_file(localDir() / "b.gz") == "bravo");
}

TEST_CASE_METHOD(EngineFixture, "A second sync downloads no payloads",
                 "[mirror][engine][catch2]") {
    publish("a.gz", "alpha");
    publish("b.gz", "bravo");

    auto engine = makeEngine();
    REQUIRE(engine.sync("compounds", "sdf"));
    remote->retrieved.clear();

    auto second = engine.sync("compounds", "sdf");
    REQUIRE(second);
    CHECK(second.value().fetched == 0);
    CHECK(second.value().refreshedSidecars == 2);
    for (const auto& p : remote->retrieved) {
        CHECK(p.ends_with(".md5"));
    }

    SECTION("verifyExisting re-checks payloads without downloading valid ones") {
        remote->retrieved.clear();
        auto verifying = makeEngine(0, true);
        auto third = verifying.sync("compounds", "sdf");
        REQUIRE(third);
        CHECK(third.value().skippedAlreadyValid == 2);
        CHECK(third.value().fetched == 0);
    }
}

TEST_CASE_METHOD(EngineFixture, "Transient errors restart the whole pass after one backoff",
                 "[mirror][engine][retry][catch2]") {
    publish("a.gz", "alpha");
    remote->retrieveFailures[std::string(kRemoteDir) + "/a.gz"].push_back(
        Error{ErrorCode::Timeout, "stalled"});

    auto engine = makeEngine();
    auto report = engine.sync("compounds", "sdf");
    REQUIRE(report);

    CHECK(report.value().passes == 2);
    REQUIRE(sleeps.size() == 1);
    CHECK(sleeps[0] == std::chrono::milliseconds(5000));
    CHECK(remote->connects == 2);
    CHECK(remote->closes == 2);
    CHECK(test::read_file(localDir() / "a.gz") == "alpha");
}

TEST_CASE_METHOD(EngineFixture, "Permanent errors are not retried",
                 "[mirror][engine][retry][catch2]") {
    remote->listFailures.push_back(Error{ErrorCode::PermissionDenied, "530 login incorrect"});

    auto engine = makeEngine();
    auto report = engine.sync("compounds", "sdf");
    REQUIRE_FALSE(report);
    CHECK(report.error().code == ErrorCode::PermissionDenied);
    CHECK(sleeps.empty());
    CHECK(remote->connects == 1);
    CHECK(remote->closes == 1);
}

TEST_CASE_METHOD(EngineFixture, "maxPasses bounds the retry loop",
                 "[mirror][engine][retry][catch2]") {
    for (int i = 0; i < 10; ++i) {
        remote->connectFailures.push_back(Error{ErrorCode::NetworkError, "connection refused"});
    }

    auto engine = makeEngine(3);
    auto report = engine.sync("compounds", "sdf");
    REQUIRE_FALSE(report);
    CHECK(report.error().code == ErrorCode::NetworkError);
    CHECK(remote->connects == 3);
    CHECK(sleeps.size() == 2);
}

TEST_CASE_METHOD(EngineFixture, "A pass reclaims partial downloads of killed runs",
                 "[mirror][engine][catch2]") {
    publish("a.gz", "alpha");
    const auto stale = test::write_file(localDir() / ".a.gz.part-2147483000-0", "alp");

    auto engine = makeEngine();
    auto report = engine.sync("compounds", "sdf");
    REQUIRE(report);

    CHECK_FALSE(fs::exists(stale));
    CHECK(countFiles(localDir()) == 2);
    CHECK(test::read_file(localDir() / "a.gz") == "alpha");
}

TEST_CASE_METHOD(EngineFixture, "Files removed from the server mid-pass do not abort the sync",
                 "[mirror][engine][catch2]") {
    publish("a.gz", "alpha");
    publish("b.gz", "bravo");
    // Listed, then gone by RETR time (550)
    remote->retrieveFailures[std::string(kRemoteDir) + "/b.gz"].push_back(
        Error{ErrorCode::NotFound, "550 no such file"});

    auto engine = makeEngine();
    auto report = engine.sync("compounds", "sdf");
    REQUIRE(report);

    CHECK(report.value().passes == 1);
    CHECK(report.value().remoteVanished == 1);
    CHECK(report.value().fetched == 3);
    CHECK(sleeps.empty());
    CHECK(test::read_file(localDir() / "a.gz") == "alpha");
    CHECK_FALSE(fs::exists(localDir() / "b.gz"));
}

TEST_CASE_METHOD(EngineFixture, "Unknown datasets are rejected before connecting",
                 "[mirror][engine][catch2]") {
    auto engine = makeEngine();
    auto report = engine.sync("proteins", "sdf");
    REQUIRE_FALSE(report);
    CHECK(report.error().code == ErrorCode::InvalidArgument);
    CHECK(remote->connects == 0);
}
