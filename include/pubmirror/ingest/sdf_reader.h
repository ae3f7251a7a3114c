#pragma once

#include <pubmirror/core/types.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pubmirror::ingest {

/**
 * @brief One SD-file record: molfile block plus "> <NAME>" data items
 */
struct SdfRecord {
    std::string title;   ///< First line of the molfile block
    std::string molfile; ///< Header, counts, atom/bond blocks up to and including "M  END"
    std::vector<std::pair<std::string, std::string>> properties;
    std::size_t firstLine{0}; ///< 1-based line number where the record starts

    /**
     * @brief First value of the named data item
     */
    [[nodiscard]] std::optional<std::string_view> property(std::string_view name) const;

    /**
     * @brief PubChem identifier: compound CID, substance SID, or a numeric title
     */
    [[nodiscard]] std::optional<std::int64_t> pubchemId() const;
};

/**
 * @brief Streaming SD-file reader; holds one record in memory at a time.
 *
 * A malformed record (no "M  END" before "$$$$", or end of input inside a record)
 * is reported as ErrorCode::InvalidData. The reader has already skipped past the
 * record's "$$$$", so the next call continues with the following record.
 */
class SdfReader {
public:
    explicit SdfReader(std::istream& in);

    /**
     * @brief Read the next record into out
     * @return true when a record was read, false at end of input
     */
    Result<bool> next(SdfRecord& out);

    [[nodiscard]] std::size_t lineNumber() const noexcept { return line_; }

private:
    bool readLine(std::string& line);

    std::istream& in_;
    std::size_t line_{0};
};

} // namespace pubmirror::ingest
