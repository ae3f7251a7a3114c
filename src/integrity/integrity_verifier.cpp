/*
 * pubmirror/src/integrity/integrity_verifier.cpp
 *
 * Streaming digests via OpenSSL EVP (MD5 for PubChem sidecars, SHA-256 available).
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns a Checksum { algo, hex } and re-initialises the context.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <pubmirror/integrity/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <string>
#include <vector>

namespace pubmirror::integrity {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha256:
            return EVP_sha256();
    }
    return EVP_md5();
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit OpenSslIntegrityVerifier(HashAlgo algo) { (void)reset(algo); }

    Result<void> reset(HashAlgo algo) override {
        _algo = algo;
        _ctx = EvpMdCtx{};
        _ready = false;
        if (!_ctx) {
            return Error{ErrorCode::InternalError, "EVP_MD_CTX_new failed"};
        }
        if (EVP_DigestInit_ex(_ctx.ctx, resolve_algo(_algo), nullptr) != 1) {
            return Error{ErrorCode::InternalError, "EVP_DigestInit_ex failed"};
        }
        _ready = true;
        return {};
    }

    void update(std::span<const std::byte> data) override {
        if (!_ready || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            _ready = false;
        }
    }

    Result<Checksum> finalize() override {
        if (!_ready) {
            return Error{ErrorCode::InternalError, "Digest context is not initialised"};
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            _ready = false;
            return Error{ErrorCode::InternalError, "EVP_DigestFinal_ex failed"};
        }

        Checksum out;
        out.algo = _algo;
        out.hex = to_hex_lower(md_buf.data(), md_len);

        // Prepare for reuse with the same algorithm
        (void)reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Md5};
    EvpMdCtx _ctx{};
    bool _ready{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<OpenSslIntegrityVerifier>(algo);
}

Result<Checksum> computeFileDigest(const std::filesystem::path& path, HashAlgo algo,
                                   std::size_t bufferSize) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
    }

    auto verifier = makeIntegrityVerifier(algo);
    if (auto r = verifier->reset(algo); !r) {
        return r.error();
    }

    std::vector<char> buffer(bufferSize == 0 ? DEFAULT_BUFFER_SIZE : bufferSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto read = in.gcount();
        if (read > 0) {
            verifier->update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(read)));
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read failed for " + path.string()};
    }
    return verifier->finalize();
}

} // namespace pubmirror::integrity
