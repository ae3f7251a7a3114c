#include <pubmirror/mirror/mirror.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <system_error>

namespace pubmirror::mirror {

namespace fs = std::filesystem;

namespace {

struct DatasetEntry {
    std::string_view dataset;
    std::string_view typeName;
};

// Remote subtree per dataset type
constexpr std::array<DatasetEntry, 2> kDatasets{{
    {"compounds", "Compound"},
    {"substances", "Substance"},
}};

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool validFormat(std::string_view format) {
    return !format.empty() && std::all_of(format.begin(), format.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

std::string_view baseName(std::string_view path) {
    auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

std::string_view extensionOf(ExtensionClass cls) noexcept {
    switch (cls) {
        case ExtensionClass::ChecksumSidecar:
            return ".md5";
        case ExtensionClass::Payload:
            return ".gz";
    }
    return "";
}

const char* toString(ExtensionClass cls) noexcept {
    switch (cls) {
        case ExtensionClass::ChecksumSidecar:
            return "checksum";
        case ExtensionClass::Payload:
            return "payload";
    }
    return "unknown";
}

std::optional<ExtensionClass> classify(const fs::path& path) {
    const auto ext = path.extension().string();
    for (auto cls : kClassOrder) {
        if (ext == extensionOf(cls))
            return cls;
    }
    return std::nullopt;
}

const char* toString(DownloadOutcome outcome) noexcept {
    switch (outcome) {
        case DownloadOutcome::Fetched:
            return "fetched";
        case DownloadOutcome::SkippedAlreadyValid:
            return "skipped_already_valid";
        case DownloadOutcome::RefreshedSidecar:
            return "refreshed_sidecar";
        case DownloadOutcome::FailedAlreadyPresent:
            return "failed_already_present";
        case DownloadOutcome::RemoteVanished:
            return "remote_vanished";
        case DownloadOutcome::Ignored:
            return "ignored";
    }
    return "unknown";
}

std::chrono::milliseconds RetryPolicy::backoffFor(std::uint32_t failedPasses) const {
    if (failedPasses <= 1 || multiplier <= 1.0) {
        return std::min(initialBackoff, maxBackoff);
    }
    const double scaled = static_cast<double>(initialBackoff.count()) *
                          std::pow(multiplier, static_cast<double>(failedPasses - 1));
    if (!std::isfinite(scaled) || scaled >= static_cast<double>(maxBackoff.count())) {
        return maxBackoff;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(scaled));
}

void SyncReport::record(DownloadOutcome outcome) {
    switch (outcome) {
        case DownloadOutcome::Fetched:
            ++fetched;
            break;
        case DownloadOutcome::SkippedAlreadyValid:
            ++skippedAlreadyValid;
            break;
        case DownloadOutcome::RefreshedSidecar:
            ++refreshedSidecars;
            break;
        case DownloadOutcome::FailedAlreadyPresent:
            ++failedAlreadyPresent;
            break;
        case DownloadOutcome::RemoteVanished:
            ++remoteVanished;
            break;
        case DownloadOutcome::Ignored:
            ++ignored;
            break;
    }
}

Result<std::string> datasetTypeName(std::string_view dataset) {
    const auto key = lower(dataset);
    for (const auto& entry : kDatasets) {
        if (entry.dataset == key)
            return std::string(entry.typeName);
    }
    return Error{ErrorCode::InvalidArgument,
                 "Unknown dataset '" + std::string(dataset) + "' (expected compounds|substances)"};
}

Result<std::string> remoteSourceDir(std::string_view rootPrefix, std::string_view dataset,
                                    std::string_view format) {
    auto typeName = datasetTypeName(dataset);
    if (!typeName)
        return typeName.error();
    if (!validFormat(format)) {
        return Error{ErrorCode::InvalidArgument, "Invalid format '" + std::string(format) + "'"};
    }

    std::string prefix(rootPrefix);
    while (!prefix.empty() && prefix.back() == '/')
        prefix.pop_back();

    std::string dir;
    if (!prefix.empty()) {
        dir = prefix + "/";
    }
    dir += typeName.value();
    dir += "/CURRENT-Full/";
    dir += upper(format);
    return dir;
}

Result<fs::path> localTargetDir(const fs::path& mirrorDir, std::string_view dataset,
                                std::string_view format) {
    auto typeName = datasetTypeName(dataset);
    if (!typeName)
        return typeName.error();
    if (!validFormat(format)) {
        return Error{ErrorCode::InvalidArgument, "Invalid format '" + std::string(format) + "'"};
    }
    return mirrorDir / typeName.value() / "CURRENT-Full" / upper(format);
}

std::set<std::string> baseNames(const std::vector<std::string>& paths, ExtensionClass cls) {
    std::set<std::string> names;
    for (const auto& p : paths) {
        auto name = baseName(p);
        if (name.empty())
            continue;
        if (classify(fs::path(std::string(name))) == cls)
            names.emplace(name);
    }
    return names;
}

Result<std::set<std::string>> localInventory(const fs::path& dir, ExtensionClass cls) {
    std::set<std::string> names;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        if (ec) {
            return Error{ErrorCode::IoError, "Cannot stat " + dir.string() + ": " + ec.message()};
        }
        return names;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot list " + dir.string() + ": " + ec.message()};
    }
    // increment(ec): a failing readdir must surface as an error, not as an exception
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            break;
        std::error_code sec;
        if (!it->is_regular_file(sec))
            continue;
        if (classify(it->path()) == cls)
            names.insert(it->path().filename().string());
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot list " + dir.string() + ": " + ec.message()};
    }
    return names;
}

std::vector<std::string> missingSet(const std::set<std::string>& remote,
                                    const std::set<std::string>& local) {
    std::vector<std::string> out;
    std::set_difference(remote.begin(), remote.end(), local.begin(), local.end(),
                        std::back_inserter(out));
    return out;
}

std::vector<SyncTarget> planTargets(ExtensionClass cls, std::string_view remoteDir,
                                    const std::set<std::string>& remote,
                                    const std::set<std::string>& local, const fs::path& localDir,
                                    bool verifyExisting) {
    std::vector<std::string> names;
    if (cls == ExtensionClass::ChecksumSidecar || verifyExisting) {
        names.assign(remote.begin(), remote.end());
    } else {
        names = missingSet(remote, local);
    }

    std::string prefix(remoteDir);
    if (!prefix.empty() && prefix.back() != '/')
        prefix.push_back('/');

    std::vector<SyncTarget> targets;
    targets.reserve(names.size());
    for (auto& name : names) {
        SyncTarget t;
        t.remotePath = prefix + name;
        t.cls = cls;
        t.localPath = localDir / name;
        targets.push_back(std::move(t));
    }
    return targets;
}

} // namespace pubmirror::mirror
