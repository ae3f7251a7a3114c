#include <pubmirror/config/config_helpers.h>
#include <pubmirror/config/settings.h>

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace pubmirror::config {

namespace fs = std::filesystem;

namespace {

Result<std::uint64_t> parseUnsigned(const std::string& key, const std::string& value) {
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v);
    if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid number for " + key + ": '" + value + "'"};
    }
    return v;
}

Result<std::chrono::milliseconds> parseMillis(const std::string& key, const std::string& value) {
    auto n = parseUnsigned(key, value);
    if (!n)
        return n.error();
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(n.value()));
}

Result<bool> parseFlag(const std::string& key, const std::string& value) {
    const bool t = parse_bool(value, true);
    const bool f = parse_bool(value, false);
    if (t != f) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid boolean for " + key + ": '" + value + "'"};
    }
    return t;
}

} // namespace

Result<void> applyConfigValues(Settings& settings,
                               const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        if (key == "remote.host") {
            settings.remote.host = value;
        } else if (key == "remote.user") {
            settings.remote.user = value;
        } else if (key == "remote.password") {
            settings.remote.password = value;
        } else if (key == "remote.proxy") {
            if (!value.empty())
                settings.remote.proxy = value;
        } else if (key == "remote.root_prefix") {
            settings.mirror.rootPrefix = value;
        } else if (key == "remote.timeout_ms") {
            auto ms = parseMillis(key, value);
            if (!ms)
                return ms.error();
            settings.remote.stallTimeout = ms.value();
        } else if (key == "remote.connect_timeout_ms") {
            auto ms = parseMillis(key, value);
            if (!ms)
                return ms.error();
            settings.remote.connectTimeout = ms.value();
        } else if (key == "mirror.dir") {
            settings.mirror.mirrorDir = expand_tilde(value);
        } else if (key == "mirror.dataset") {
            settings.dataset = value;
        } else if (key == "mirror.format") {
            settings.format = value;
        } else if (key == "mirror.max_passes") {
            auto n = parseUnsigned(key, value);
            if (!n)
                return n.error();
            settings.mirror.retry.maxPasses = static_cast<std::uint32_t>(n.value());
        } else if (key == "mirror.backoff_ms") {
            auto ms = parseMillis(key, value);
            if (!ms)
                return ms.error();
            settings.mirror.retry.initialBackoff = ms.value();
        } else if (key == "mirror.max_backoff_ms") {
            auto ms = parseMillis(key, value);
            if (!ms)
                return ms.error();
            settings.mirror.retry.maxBackoff = ms.value();
        } else if (key == "mirror.backoff_multiplier") {
            try {
                settings.mirror.retry.multiplier = std::stod(value);
            } catch (const std::exception&) {
                return Error{ErrorCode::InvalidArgument,
                             "Invalid number for " + key + ": '" + value + "'"};
            }
        } else if (key == "mirror.verify_existing") {
            auto b = parseFlag(key, value);
            if (!b)
                return b.error();
            settings.mirror.verifyExisting = b.value();
        } else if (key == "ingest.backend") {
            auto backend = ingest::parseBackend(value);
            if (!backend) {
                return Error{ErrorCode::InvalidArgument, "Unknown ingest backend '" + value +
                                                             "' (expected sqlite|search-index|none)"};
            }
            settings.backend = *backend;
        } else if (key == "ingest.location") {
            settings.storeLocation = expand_tilde(value);
        } else if (key == "log.level") {
            settings.log.level = value;
        } else if (key == "log.file") {
            settings.log.file = expand_tilde(value);
        }
    }
    return {};
}

Result<Settings> loadSettings(const fs::path& configPath) {
    Settings settings;

    std::error_code ec;
    if (!configPath.empty() && fs::exists(configPath, ec)) {
        if (auto r = applyConfigValues(settings, parse_simple_toml(configPath)); !r) {
            return Error{r.error().code, configPath.string() + ": " + r.error().message};
        }
    }

    if (const char* dir = std::getenv("PUBMIRROR_MIRROR_DIR"); dir && *dir) {
        settings.mirror.mirrorDir = expand_tilde(dir);
    }
    return settings;
}

} // namespace pubmirror::config
