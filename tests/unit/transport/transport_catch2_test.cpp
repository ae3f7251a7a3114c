#include <catch2/catch_test_macros.hpp>

#include <pubmirror/transport/transport.hpp>

#include <curl/curl.h>

#include "common/fake_transport.h"
#include "common/test_helpers_catch2.h"
#include "support/temp_dir_scope.hpp"

#include <filesystem>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace pubmirror;
using namespace pubmirror::transport;
using pubmirror::test_support::TempDirScope;

namespace {

bool hasStagingLeftovers(const fs::path& dir) {
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().filename().string().find(".part-") != std::string::npos)
            return true;
    }
    return false;
}

// Session whose transfer dies after delivering some bytes
class DroppingSession final : public ISession {
public:
    Result<std::vector<std::string>> list(std::string_view) override {
        return std::vector<std::string>{};
    }
    Result<std::uint64_t> retrieve(std::string_view, const ChunkSink& sink) override {
        const std::string part = "partial bytes";
        auto r = sink(std::span<const std::byte>(reinterpret_cast<const std::byte*>(part.data()),
                                                 part.size()));
        if (!r)
            return r.error();
        return Error{ErrorCode::TransferInterrupted, "connection reset"};
    }
    Result<void> close() override {
        ++closes;
        return {};
    }
    int closes{0};
};

} // namespace

TEST_CASE("classifyCurlResult maps libcurl failures", "[transport][curl][catch2]") {
    using detail::classifyCurlResult;

    CHECK(classifyCurlResult(CURLE_OK, 226) == ErrorCode::Success);
    CHECK(classifyCurlResult(CURLE_OPERATION_TIMEDOUT, 0) == ErrorCode::Timeout);
    CHECK(classifyCurlResult(CURLE_COULDNT_CONNECT, 0) == ErrorCode::NetworkError);
    CHECK(classifyCurlResult(CURLE_COULDNT_RESOLVE_HOST, 0) == ErrorCode::NetworkError);
    CHECK(classifyCurlResult(CURLE_RECV_ERROR, 0) == ErrorCode::NetworkError);
    CHECK(classifyCurlResult(CURLE_PARTIAL_FILE, 0) == ErrorCode::TransferInterrupted);
    CHECK(classifyCurlResult(CURLE_REMOTE_FILE_NOT_FOUND, 550) == ErrorCode::NotFound);
    CHECK(classifyCurlResult(CURLE_LOGIN_DENIED, 530) == ErrorCode::PermissionDenied);
    CHECK(classifyCurlResult(CURLE_REMOTE_ACCESS_DENIED, 550) == ErrorCode::NotFound);
    CHECK(classifyCurlResult(CURLE_FTP_COULDNT_RETR_FILE, 450) == ErrorCode::ServerBusy);
    CHECK(classifyCurlResult(CURLE_FTP_COULDNT_RETR_FILE, 550) == ErrorCode::NotFound);
    CHECK(classifyCurlResult(CURLE_WRITE_ERROR, 0) == ErrorCode::IoError);
    CHECK(classifyCurlResult(CURLE_URL_MALFORMAT, 0) == ErrorCode::InvalidArgument);

    SECTION("transient classes are retryable, permanent ones are not") {
        CHECK(isRetryable(classifyCurlResult(CURLE_COULDNT_CONNECT, 0)));
        CHECK(isRetryable(classifyCurlResult(CURLE_PARTIAL_FILE, 0)));
        CHECK(isRetryable(classifyCurlResult(CURLE_FTP_COULDNT_RETR_FILE, 421)));
        CHECK_FALSE(isRetryable(classifyCurlResult(CURLE_REMOTE_FILE_NOT_FOUND, 550)));
        CHECK_FALSE(isRetryable(classifyCurlResult(CURLE_LOGIN_DENIED, 530)));
    }
}

TEST_CASE("parseNameList normalises NLST output", "[transport][nlst][catch2]") {
    const std::string body = "a.sdf.gz\r\nb.sdf.gz.md5\r\n.\r\n..\r\n\r\nREADME\n";
    auto names = detail::parseNameList(body, "pubchem/Compound/CURRENT-Full/SDF/");

    REQUIRE(names.size() == 3);
    CHECK(names[0] == "pubchem/Compound/CURRENT-Full/SDF/a.sdf.gz");
    CHECK(names[1] == "pubchem/Compound/CURRENT-Full/SDF/b.sdf.gz.md5");
    CHECK(names[2] == "pubchem/Compound/CURRENT-Full/SDF/README");

    SECTION("entries that already carry a directory are kept") {
        auto full = detail::parseNameList("x/y/z.gz\n", "other");
        REQUIRE(full.size() == 1);
        CHECK(full[0] == "x/y/z.gz");
    }
}

TEST_CASE("buildUrl collapses slashes", "[transport][url][catch2]") {
    TransportConfig cfg;
    cfg.host = "ftp.example.org";

    CHECK(detail::buildUrl(cfg, "/pubchem//Compound/", true) ==
          "ftp://ftp.example.org/pubchem/Compound/");
    CHECK(detail::buildUrl(cfg, "pubchem/Compound/a.gz", false) ==
          "ftp://ftp.example.org/pubchem/Compound/a.gz");
    CHECK(detail::buildUrl(cfg, "", true) == "ftp://ftp.example.org/");

    cfg.port = 2121;
    CHECK(detail::buildUrl(cfg, "x", false) == "ftp://ftp.example.org:2121/x");
}

TEST_CASE("fetch publishes exclusively", "[transport][fetch][catch2]") {
    TempDirScope tmp("pubmirror-fetch");
    auto remote = std::make_shared<test::FakeRemote>();
    remote->put("dir/a.gz", "payload-bytes");
    test::FakeSession session(remote);

    SECTION("fresh destination receives the full content") {
        const auto dest = tmp / "a.gz";
        auto r = fetch(session, "dir/a.gz", dest);
        REQUIRE(r);
        CHECK(r.value() == 13);
        CHECK(test::read_file(dest) == "payload-bytes");
        CHECK_FALSE(hasStagingLeftovers(tmp.path()));
    }

    SECTION("an existing destination is never overwritten") {
        const auto dest = test::write_file(tmp / "a.gz", "local");
        auto r = fetch(session, "dir/a.gz", dest);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::AlreadyExists);
        CHECK(test::read_file(dest) == "local");
        CHECK(remote->retrieved.empty());
    }

    SECTION("a failed transfer leaves no file behind") {
        DroppingSession dropping;
        const auto dest = tmp / "b.gz";
        auto r = fetch(dropping, "dir/b.gz", dest);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::TransferInterrupted);
        CHECK_FALSE(fs::exists(dest));
        CHECK_FALSE(hasStagingLeftovers(tmp.path()));
    }

    SECTION("remote errors propagate unchanged") {
        auto r = fetch(session, "dir/missing.gz", tmp / "missing.gz");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NotFound);
        CHECK_FALSE(fs::exists(tmp / "missing.gz"));
    }
}

TEST_CASE("stagingPathFor never carries a mirror extension", "[transport][fetch][catch2]") {
    const auto staging = stagingPathFor("/m/x/a.sdf.gz");
    CHECK(staging.parent_path() == fs::path("/m/x"));
    CHECK(staging.filename().string().rfind(".a.sdf.gz.part-", 0) == 0);
    CHECK(staging.extension() != ".gz");
    CHECK(staging.extension() != ".md5");
    CHECK(stagingPathFor("/m/x/a.sdf.gz") != staging);
}

TEST_CASE("stagingOwner reads the pid from staging names", "[transport][fetch][catch2]") {
    CHECK(stagingOwner(stagingPathFor("/m/x/a.sdf.gz")) == ::getpid());
    CHECK(stagingOwner("/m/x/.a.gz.part-4242-7") == 4242);
    CHECK_FALSE(stagingOwner("/m/x/a.gz").has_value());
    CHECK_FALSE(stagingOwner("/m/x/.a.gz.part-").has_value());
    CHECK_FALSE(stagingOwner("/m/x/.a.gz.part-abc-1").has_value());
    CHECK_FALSE(stagingOwner("/m/x/a.gz.part-4242-7").has_value());
}

TEST_CASE("sweepStaleStaging removes leftovers of exited processes",
          "[transport][fetch][catch2]") {
    TempDirScope tmp("pubmirror-sweep");
    // Above any pid_max, so kill(2) reports ESRCH
    const auto dead = test::write_file(tmp / ".a.gz.part-2147483000-0", "half a payload");
    const auto live = test::write_file(stagingPathFor(tmp / "b.gz"), "in flight");
    const auto payload = test::write_file(tmp / "a.gz", "complete");

    auto swept = sweepStaleStaging(tmp.path());
    REQUIRE(swept);
    CHECK(swept.value() == 1);
    CHECK_FALSE(fs::exists(dead));
    CHECK(fs::exists(live));
    CHECK(fs::exists(payload));

    SECTION("a missing directory has nothing to sweep") {
        auto none = sweepStaleStaging(tmp / "absent");
        REQUIRE(none);
        CHECK(none.value() == 0);
    }
}

TEST_CASE("ScopedSession closes on every exit path", "[transport][session][catch2]") {
    auto remote = std::make_shared<test::FakeRemote>();
    {
        ScopedSession s(std::make_unique<test::FakeSession>(remote), nullptr);
        auto listing = s->list("nowhere");
        REQUIRE(listing);
    }
    CHECK(remote->closes == 1);

    {
        ScopedSession s(std::make_unique<test::FakeSession>(remote), nullptr);
        auto r = s->retrieve("missing", [](std::span<const std::byte>) -> Result<void> {
            return {};
        });
        CHECK_FALSE(r);
    }
    CHECK(remote->closes == 2);
}
