#pragma once

#include <pubmirror/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace pubmirror::compression {

/**
 * @brief Result of one streaming decompression step
 */
struct StreamingResult {
    size_t bytesConsumed{0}; ///< Bytes consumed from input
    size_t bytesProduced{0}; ///< Bytes written to output
    bool memberFinished{false}; ///< A gzip member ended during this step
};

/**
 * @brief Streaming decompression interface
 */
class IStreamingDecompressor {
public:
    virtual ~IStreamingDecompressor() = default;

    /**
     * @brief Initialize decompression stream
     */
    [[nodiscard]] virtual Result<void> init() = 0;

    /**
     * @brief Feed compressed data; call again with the unconsumed remainder
     * @param input Compressed data chunk
     * @param output Output buffer for decompressed data
     */
    [[nodiscard]] virtual Result<StreamingResult> decompress(std::span<const std::byte> input,
                                                             std::span<std::byte> output) = 0;

    /**
     * @brief True when the last member ended and no partial member is pending
     */
    [[nodiscard]] virtual bool isFinished() const = 0;
};

/**
 * @brief gzip (RFC 1952) stream decompressor over zlib, multi-member aware
 */
class GzipStreamDecompressor final : public IStreamingDecompressor {
public:
    GzipStreamDecompressor();
    ~GzipStreamDecompressor() override;

    GzipStreamDecompressor(const GzipStreamDecompressor&) = delete;
    GzipStreamDecompressor& operator=(const GzipStreamDecompressor&) = delete;

    [[nodiscard]] Result<void> init() override;
    [[nodiscard]] Result<StreamingResult> decompress(std::span<const std::byte> input,
                                                     std::span<std::byte> output) override;
    [[nodiscard]] bool isFinished() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Decompress a gzip file into destination in fixed-size chunks.
 *
 * destination is created exclusively (ErrorCode::AlreadyExists if present) and removed
 * again on any failure. A truncated or invalid stream yields ErrorCode::CorruptedData.
 * @return Number of decompressed bytes written
 */
Result<std::uint64_t> gunzipFile(const std::filesystem::path& source,
                                 const std::filesystem::path& destination,
                                 std::size_t chunkSize = DEFAULT_BUFFER_SIZE);

} // namespace pubmirror::compression
