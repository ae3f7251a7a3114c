#include <pubmirror/compression/gzip_decompressor.h>
#include <pubmirror/core/process.h>
#include <pubmirror/extraction/archive_extractor.h>
#include <pubmirror/logging/logging.h>

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pubmirror::extraction {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kStagingPrefix = ".extract-";

// Removes this run's (by then empty) staging directories on every exit path
class StagingDirs {
public:
    explicit StagingDirs(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}
    ~StagingDirs() {
        for (const auto& dir : dirs_) {
            std::error_code ec;
            fs::remove(dir, ec);
            if (ec) {
                logger_->warn("Failed to remove staging directory {}: {}", dir.string(),
                              ec.message());
            }
        }
    }

    StagingDirs(const StagingDirs&) = delete;
    StagingDirs& operator=(const StagingDirs&) = delete;

    Result<void> ensure(const fs::path& dir) {
        if (dirs_.count(dir))
            return {};
        std::error_code ec;
        fs::create_directory(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Cannot create staging directory " + dir.string() + ": " + ec.message()};
        }
        dirs_.insert(dir);
        return {};
    }

private:
    std::set<fs::path> dirs_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

ScopedFileRemoval::ScopedFileRemoval(fs::path path, std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path)), logger_(logging::orDefault(std::move(logger))) {}

ScopedFileRemoval::~ScopedFileRemoval() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        logger_->warn("Failed to remove {}: {}", path_.string(), ec.message());
    }
}

ArchiveExtractor::ArchiveExtractor(std::shared_ptr<spdlog::logger> logger, std::size_t chunkSize)
    : logger_(logging::orDefault(std::move(logger))),
      chunkSize_(chunkSize == 0 ? DEFAULT_BUFFER_SIZE : chunkSize) {}

bool ArchiveExtractor::isArchive(const fs::path& path) {
    return path.extension() == ".gz" && !path.stem().empty();
}

fs::path ArchiveExtractor::decompressedPathFor(const fs::path& archive) {
    return archive.parent_path() / (std::string(kStagingPrefix) + std::to_string(::getpid())) /
           archive.stem();
}

std::optional<pid_t> ArchiveExtractor::stagingOwner(const fs::path& path) {
    const auto name = path.filename().string();
    if (name.rfind(kStagingPrefix, 0) != 0)
        return std::nullopt;
    std::string_view digits(name);
    digits.remove_prefix(kStagingPrefix.size());
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string_view::npos)
        return std::nullopt;
    return parseLeadingPid(digits);
}

Result<ExtractReport> ArchiveExtractor::extract(const fs::path& rootDir,
                                                ingest::IIngestHandler& handler) {
    std::error_code ec;
    if (!fs::exists(rootDir, ec)) {
        return Error{ErrorCode::FileNotFound, rootDir.string() + " does not exist"};
    }
    if (!fs::is_directory(rootDir, ec)) {
        return Error{ErrorCode::InvalidArgument, rootDir.string() + " is not a directory"};
    }

    // Collect first: the walk must not observe the files we create and remove
    std::vector<fs::path> archives;
    std::vector<fs::path> stale;
    fs::recursive_directory_iterator it(rootDir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot walk " + rootDir.string() + ": " + ec.message()};
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            break;
        std::error_code sec;
        if (it->is_directory(sec)) {
            if (auto owner = stagingOwner(it->path())) {
                it.disable_recursion_pending();
                // Our own pid here is a leftover of an earlier process that had it
                if (*owner == ::getpid() || !isProcessAlive(*owner))
                    stale.push_back(it->path());
            }
            continue;
        }
        if (it->is_regular_file(sec) && isArchive(it->path())) {
            archives.push_back(it->path());
        }
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot walk " + rootDir.string() + ": " + ec.message()};
    }
    std::sort(archives.begin(), archives.end());

    ExtractReport report;
    for (const auto& dir : stale) {
        std::error_code rec;
        fs::remove_all(dir, rec);
        if (rec) {
            logger_->warn("Cannot remove stale staging directory {}: {}", dir.string(),
                          rec.message());
            continue;
        }
        logger_->info("Removed staging directory {} left by an interrupted run", dir.string());
        ++report.staleStagingRemoved;
    }

    StagingDirs staging(logger_);
    for (const auto& archive : archives) {
        ++report.archivesSeen;
        const auto decompressed = decompressedPathFor(archive);
        if (auto r = staging.ensure(decompressed.parent_path()); !r) {
            return r.error();
        }

        auto inflated = compression::gunzipFile(archive, decompressed, chunkSize_);
        if (!inflated) {
            const auto& err = inflated.error();
            if (err.code == ErrorCode::CorruptedData || err.code == ErrorCode::CompressionError) {
                logger_->error("Skipping corrupt archive {}: {}", archive.string(), err.message);
                ++report.archivesCorrupt;
                continue;
            }
            logger_->error("Failed to decompress {}: {}", archive.string(), err.message);
            return err;
        }
        report.bytesDecompressed += inflated.value();

        ScopedFileRemoval cleanup(decompressed, logger_);
        logger_->debug("Handling {} ({} bytes)", decompressed.string(), inflated.value());
        auto handled = handler.handle(decompressed);
        if (!handled) {
            logger_->error("Ingest failed for {}: {}", archive.string(), handled.error().message);
            return handled.error();
        }
        ++report.archivesHandled;
    }

    if (auto r = handler.flush(); !r) {
        return r.error();
    }

    logger_->info("Extracted {} of {} archives under {} ({} corrupt)", report.archivesHandled,
                  report.archivesSeen, rootDir.string(), report.archivesCorrupt);
    return report;
}

} // namespace pubmirror::extraction
