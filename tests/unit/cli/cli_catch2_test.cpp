#include <catch2/catch_test_macros.hpp>

#include <pubmirror/cli/pubmirror_cli.h>
#include <pubmirror/integrity/checksum.h>

#include "common/fake_transport.h"
#include "common/sdf_samples.h"
#include "common/test_helpers_catch2.h"
#include "support/temp_dir_scope.hpp"

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace pubmirror;
using pubmirror::cli::PubmirrorCLI;
using pubmirror::test::ScopedEnvVar;
using pubmirror::test_support::TempDirScope;

namespace {

int runCli(PubmirrorCLI& cli, std::vector<std::string> args) {
    args.insert(args.begin(), "pubmirror");
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& a : args)
        argv.push_back(a.data());
    return cli.run(static_cast<int>(argv.size()), argv.data());
}

std::string md5Line(const std::string& content, const std::string& name) {
    auto v = integrity::makeIntegrityVerifier(integrity::HashAlgo::Md5);
    v->update(std::as_bytes(std::span(content.data(), content.size())));
    return v->finalize().value().hex + "  " + name + "\n";
}

struct CliFixture {
    TempDirScope tmp{"pubmirror-cli"};
    ScopedEnvVar config{"PUBMIRROR_CONFIG", (tmp / "absent.toml").string()};
    ScopedEnvVar mirrorEnv{"PUBMIRROR_MIRROR_DIR", std::nullopt};
    std::shared_ptr<test::FakeRemote> remote = std::make_shared<test::FakeRemote>();
    PubmirrorCLI cli;

    CliFixture() {
        cli.setTransportFactory([this](std::shared_ptr<spdlog::logger>) {
            return std::unique_ptr<transport::ITransport>(
                std::make_unique<test::FakeTransport>(remote));
        });
    }

    void publish(const std::string& dir, const std::string& name, const std::string& content) {
        remote->put(dir + "/" + name, content);
        remote->put(dir + "/" + name + ".md5", md5Line(content, name));
    }
};

} // namespace

TEST_CASE_METHOD(CliFixture, "sync mirrors the requested dataset", "[cli][catch2]") {
    publish("pubchem/Substance/CURRENT-Full/SDF", "Substance_000000001_000500000.sdf.gz",
            test::gzip(test::sdfRecord("1")));

    const auto mirror = tmp / "mirror";
    CHECK(runCli(cli, {"sync", "--mirror-dir", mirror.string(), "--dataset", "substances",
                       "--json"}) == 0);
    CHECK(fs::exists(mirror / "Substance" / "CURRENT-Full" / "SDF" /
                     "Substance_000000001_000500000.sdf.gz"));
    CHECK(remote->retrieved.size() == 2);
}

TEST_CASE_METHOD(CliFixture, "download is an alias for sync", "[cli][catch2]") {
    publish("pubchem/Compound/CURRENT-Full/SDF", "c.sdf.gz", "payload");
    CHECK(runCli(cli, {"download", "--mirror-dir", (tmp / "m").string()}) == 0);
    CHECK(fs::exists(tmp / "m" / "Compound" / "CURRENT-Full" / "SDF" / "c.sdf.gz"));
}

TEST_CASE_METHOD(CliFixture, "sync reports permanent failures", "[cli][catch2]") {
    remote->connectFailures.push_back(Error{ErrorCode::PermissionDenied, "login refused"});
    CHECK(runCli(cli, {"sync", "--mirror-dir", (tmp / "m").string()}) == 1);
}

TEST_CASE_METHOD(CliFixture, "sync rejects unknown datasets at parse time", "[cli][catch2]") {
    CHECK(runCli(cli, {"sync", "--dataset", "proteins"}) != 0);
    CHECK(remote->connects == 0);
}

TEST_CASE_METHOD(CliFixture, "A subcommand is required", "[cli][catch2]") {
    CHECK(runCli(cli, {}) != 0);
}

TEST_CASE_METHOD(CliFixture, "An explicit config file must exist", "[cli][catch2]") {
    CHECK(runCli(cli, {"--config", (tmp / "nope.toml").string(), "sync"}) == 1);
    CHECK(remote->connects == 0);
}

TEST_CASE_METHOD(CliFixture, "Config file values reach the sync command", "[cli][catch2]") {
    const auto mirror = tmp / "from-config";
    auto cfg = test::write_file(tmp / "config.toml",
                                "[mirror]\ndir = \"" + mirror.string() + "\"\n");
    publish("pubchem/Compound/CURRENT-Full/SDF", "c.sdf.gz", "payload");

    CHECK(runCli(cli, {"--config", cfg.string(), "sync"}) == 0);
    CHECK(fs::exists(mirror / "Compound" / "CURRENT-Full" / "SDF" / "c.sdf.gz"));
}

TEST_CASE_METHOD(CliFixture, "extract ingests mirrored archives into SQLite", "[cli][catch2]") {
    const auto mirror = tmp / "mirror";
    test::write_file(mirror / "Compound" / "CURRENT-Full" / "SDF" / "c.sdf.gz",
                     test::gzip(test::sdfRecord("1") + test::sdfRecord("2")));
    const auto db = tmp / "store" / "molecules.db";

    CHECK(runCli(cli, {"extract", "--mirror-dir", mirror.string(), "--backend", "sqlite",
                       "--store-location", db.string()}) == 0);
    CHECK(fs::exists(db));
    CHECK_FALSE(fs::exists(mirror / "Compound" / "CURRENT-Full" / "SDF" / "c.sdf"));
    CHECK(fs::exists(mirror / "Compound" / "CURRENT-Full" / "SDF" / "c.sdf.gz"));
}

TEST_CASE_METHOD(CliFixture, "extract with no backend only decompresses", "[cli][catch2]") {
    const auto mirror = tmp / "mirror";
    test::write_file(mirror / "a.sdf.gz", test::gzip(test::sdfRecord("1")));

    CHECK(runCli(cli, {"extract", "--mirror-dir", mirror.string(), "--backend", "none",
                       "--json"}) == 0);
    CHECK_FALSE(fs::exists(mirror / "a.sdf"));
    CHECK_FALSE(fs::exists(mirror / "molecules.db"));
}

TEST_CASE_METHOD(CliFixture, "extract fails on a missing mirror", "[cli][catch2]") {
    CHECK(runCli(cli, {"extract", "--mirror-dir", (tmp / "nope").string(), "--backend",
                       "none"}) == 1);
}
