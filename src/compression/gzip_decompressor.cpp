#include <pubmirror/compression/gzip_decompressor.h>

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace pubmirror::compression {

namespace fs = std::filesystem;

namespace {

// windowBits 15 + 16: expect a gzip header and trailer
constexpr int GZIP_WINDOW_BITS = 15 + 16;

[[nodiscard]] Error makeZlibError(const char* operation, int code, const z_stream& strm) {
    std::string msg = std::string(operation) + " failed: ";
    msg += strm.msg ? strm.msg : zError(code);
    if (code == Z_DATA_ERROR || code == Z_NEED_DICT) {
        return Error{ErrorCode::CorruptedData, msg};
    }
    if (code == Z_MEM_ERROR) {
        return Error{ErrorCode::InternalError, msg};
    }
    return Error{ErrorCode::CompressionError, msg};
}

} // namespace

class GzipStreamDecompressor::Impl {
public:
    Impl() { std::memset(&strm_, 0, sizeof(strm_)); }

    ~Impl() {
        if (initialized_)
            inflateEnd(&strm_);
    }

    [[nodiscard]] Result<void> init() {
        if (initialized_) {
            inflateEnd(&strm_);
            initialized_ = false;
        }
        std::memset(&strm_, 0, sizeof(strm_));
        const int rc = inflateInit2(&strm_, GZIP_WINDOW_BITS);
        if (rc != Z_OK) {
            return makeZlibError("inflateInit2", rc, strm_);
        }
        initialized_ = true;
        inMember_ = false;
        finished_ = false;
        return {};
    }

    [[nodiscard]] Result<StreamingResult> decompress(std::span<const std::byte> input,
                                                     std::span<std::byte> output) {
        if (!initialized_) {
            return Error{ErrorCode::InvalidState, "Decompression stream not initialized"};
        }

        StreamingResult out;
        // Empty input only drains output still held inside zlib for an open member
        if (input.empty() && !inMember_)
            return out;

        if (!inMember_) {
            // Next member starts here; a previous member's end leaves the stream ready
            inMember_ = true;
            finished_ = false;
        }

        strm_.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
        strm_.avail_in = static_cast<uInt>(input.size());
        strm_.next_out = reinterpret_cast<Bytef*>(output.data());
        strm_.avail_out = static_cast<uInt>(output.size());

        const int rc = inflate(&strm_, Z_NO_FLUSH);
        out.bytesConsumed = input.size() - strm_.avail_in;
        out.bytesProduced = output.size() - strm_.avail_out;

        if (rc == Z_STREAM_END) {
            out.memberFinished = true;
            inMember_ = false;
            finished_ = true;
            const int rr = inflateReset(&strm_);
            if (rr != Z_OK) {
                return makeZlibError("inflateReset", rr, strm_);
            }
            return out;
        }
        if (rc == Z_BUF_ERROR && out.bytesConsumed == 0 && out.bytesProduced == 0) {
            // No progress possible; caller must supply more input or output space
            return out;
        }
        if (rc != Z_OK) {
            return makeZlibError("inflate", rc, strm_);
        }
        return out;
    }

    [[nodiscard]] bool isFinished() const { return finished_ && !inMember_; }

private:
    z_stream strm_{};
    bool initialized_{false};
    bool inMember_{false};
    bool finished_{false};
};

GzipStreamDecompressor::GzipStreamDecompressor() : pImpl(std::make_unique<Impl>()) {}

GzipStreamDecompressor::~GzipStreamDecompressor() = default;

Result<void> GzipStreamDecompressor::init() {
    return pImpl->init();
}

Result<StreamingResult> GzipStreamDecompressor::decompress(std::span<const std::byte> input,
                                                           std::span<std::byte> output) {
    return pImpl->decompress(input, output);
}

bool GzipStreamDecompressor::isFinished() const {
    return pImpl->isFinished();
}

Result<std::uint64_t> gunzipFile(const fs::path& source, const fs::path& destination,
                                 std::size_t chunkSize) {
    if (chunkSize == 0)
        chunkSize = DEFAULT_BUFFER_SIZE;

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + source.string()};
    }

    int fd = ::open(destination.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        if (err == EEXIST) {
            return Error{ErrorCode::AlreadyExists, destination.string() + " already exists"};
        }
        return Error{ErrorCode::IoError,
                     "Cannot create " + destination.string() + ": " + std::strerror(err)};
    }

    // Remove the partial output on every failure path
    struct OutputGuard {
        int fd;
        const fs::path& path;
        bool keep{false};
        ~OutputGuard() {
            if (fd >= 0)
                ::close(fd);
            if (!keep) {
                std::error_code ec;
                fs::remove(path, ec);
            }
        }
    } guard{fd, destination};

    GzipStreamDecompressor gz;
    if (auto r = gz.init(); !r) {
        return r.error();
    }

    std::vector<std::byte> inBuf(chunkSize);
    std::vector<std::byte> outBuf(chunkSize);
    std::uint64_t written = 0;
    bool sawInput = false;

    auto writeOut = [&](std::size_t n) -> Result<void> {
        const auto* p = reinterpret_cast<const char*>(outBuf.data());
        std::size_t left = n;
        while (left > 0) {
            ssize_t w = ::write(guard.fd, p, left);
            if (w < 0) {
                if (errno == EINTR)
                    continue;
                return Error{ErrorCode::IoError,
                             "write() failed for " + destination.string() + ": " +
                                 std::strerror(errno)};
            }
            p += w;
            left -= static_cast<std::size_t>(w);
        }
        written += n;
        return {};
    };

    while (in) {
        in.read(reinterpret_cast<char*>(inBuf.data()), static_cast<std::streamsize>(inBuf.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0)
            break;
        sawInput = true;

        std::span<const std::byte> pending(inBuf.data(), got);
        while (!pending.empty()) {
            auto step = gz.decompress(pending, outBuf);
            if (!step) {
                return Error{step.error().code,
                             source.string() + ": " + step.error().message};
            }
            const auto& s = step.value();
            if (s.bytesProduced > 0) {
                if (auto w = writeOut(s.bytesProduced); !w)
                    return w.error();
            }
            if (s.bytesConsumed == 0 && s.bytesProduced == 0)
                break;
            pending = pending.subspan(s.bytesConsumed);
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read failed for " + source.string()};
    }

    // Drain output still buffered inside zlib for the current member
    while (!gz.isFinished() && sawInput) {
        auto step = gz.decompress(std::span<const std::byte>(), outBuf);
        if (!step || step.value().bytesProduced == 0)
            break;
        if (auto w = writeOut(step.value().bytesProduced); !w)
            return w.error();
    }

    if (!sawInput || !gz.isFinished()) {
        return Error{ErrorCode::CorruptedData,
                     source.string() + ": unexpected end of gzip stream (truncated archive)"};
    }

    if (::fsync(guard.fd) != 0) {
        spdlog::debug("fsync() failed for {}: {}", destination.string(), std::strerror(errno));
    }
    guard.keep = true;
    return written;
}

} // namespace pubmirror::compression
