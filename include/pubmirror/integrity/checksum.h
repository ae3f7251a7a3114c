#pragma once

#include <pubmirror/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace pubmirror::integrity {

/**
 * Hash algorithms supported for sidecar verification.
 */
enum class HashAlgo { Md5, Sha256 };

/**
 * Checksum descriptor (algorithm + lower-case hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Md5};
    std::string hex;
};

/**
 * Streaming hash calculator.
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual Result<void> reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Result<Checksum> finalize() = 0;
};

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo = HashAlgo::Md5);

/**
 * Digest a file in fixed-size chunks.
 */
Result<Checksum> computeFileDigest(const std::filesystem::path& path, HashAlgo algo,
                                   std::size_t bufferSize = DEFAULT_BUFFER_SIZE);

/**
 * Sidecar path for a payload: "<payload><extension>" (a.sdf.gz -> a.sdf.gz.md5).
 */
std::filesystem::path sidecarFor(const std::filesystem::path& payload,
                                 std::string_view extension = ".md5");

/**
 * Parse the expected digest out of sidecar text.
 * Accepts "<hex>  <name>", "<hex> *<name>", a bare "<hex>" and BSD "MD5 (<name>) = <hex>".
 */
Result<std::string> parseSidecarDigest(std::string_view text);

enum class Verdict { Valid, Invalid, Unverifiable };

struct VerifyResult {
    Verdict verdict{Verdict::Unverifiable};
    std::string expected;
    std::string actual;
    std::string reason; // set for Unverifiable
};

/**
 * Compare payload's digest with the one recorded in sidecar.
 *
 * A missing or unparsable sidecar yields Verdict::Unverifiable; an unreadable payload
 * is an error.
 */
Result<VerifyResult> verifyAgainstSidecar(const std::filesystem::path& payload,
                                          const std::filesystem::path& sidecar,
                                          HashAlgo algo = HashAlgo::Md5);

} // namespace pubmirror::integrity
