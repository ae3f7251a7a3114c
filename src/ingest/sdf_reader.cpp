#include <pubmirror/ingest/sdf_reader.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <initializer_list>

namespace pubmirror::ingest {

namespace {

constexpr std::string_view kRecordEnd = "$$$$";
constexpr std::string_view kMolEnd = "M  END";

bool isBlank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::optional<std::int64_t> parseId(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    if (s.empty())
        return std::nullopt;
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || v <= 0)
        return std::nullopt;
    return v;
}

// "> <NAME>" or ">  <NAME> (extra)" -> NAME
std::string dataItemName(std::string_view header) {
    auto open = header.find('<');
    if (open == std::string_view::npos)
        return {};
    auto close = header.find('>', open + 1);
    if (close == std::string_view::npos)
        return {};
    return std::string(header.substr(open + 1, close - open - 1));
}

} // namespace

std::optional<std::string_view> SdfRecord::property(std::string_view name) const {
    for (const auto& [k, v] : properties) {
        if (k == name)
            return std::string_view(v);
    }
    return std::nullopt;
}

std::optional<std::int64_t> SdfRecord::pubchemId() const {
    for (auto key : {"PUBCHEM_COMPOUND_CID", "PUBCHEM_SUBSTANCE_ID"}) {
        if (auto v = property(key)) {
            if (auto id = parseId(*v))
                return id;
        }
    }
    return parseId(title);
}

SdfReader::SdfReader(std::istream& in) : in_(in) {}

bool SdfReader::readLine(std::string& line) {
    if (!std::getline(in_, line))
        return false;
    ++line_;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

Result<bool> SdfReader::next(SdfRecord& out) {
    out = SdfRecord{};
    std::string line;

    // Molfile block
    bool haveMolEnd = false;
    bool sawContent = false;
    std::size_t molLines = 0;
    while (readLine(line)) {
        if (molLines == 0) {
            out.firstLine = line_;
            out.title = line;
        }
        ++molLines;
        if (!isBlank(line))
            sawContent = true;
        if (line == kRecordEnd) {
            return Error{ErrorCode::InvalidData, "Record at line " + std::to_string(out.firstLine) +
                                                     ": '$$$$' before 'M  END'"};
        }
        out.molfile += line;
        out.molfile.push_back('\n');
        if (startsWith(line, kMolEnd)) {
            haveMolEnd = true;
            break;
        }
    }
    if (!haveMolEnd) {
        if (in_.bad()) {
            return Error{ErrorCode::IoError, "Read failed at line " + std::to_string(line_)};
        }
        if (!sawContent) {
            return false;
        }
        return Error{ErrorCode::InvalidData, "Record at line " + std::to_string(out.firstLine) +
                                                 ": end of input inside molfile block"};
    }

    // Data items
    while (readLine(line)) {
        if (line == kRecordEnd) {
            return true;
        }
        if (line.empty() || line.front() != '>') {
            continue;
        }

        std::string name = dataItemName(line);
        std::string value;
        bool first = true;
        while (readLine(line)) {
            if (line == kRecordEnd) {
                out.properties.emplace_back(std::move(name), std::move(value));
                return true;
            }
            if (line.empty())
                break;
            if (!first)
                value.push_back('\n');
            value += line;
            first = false;
        }
        if (!name.empty() || !value.empty()) {
            out.properties.emplace_back(std::move(name), std::move(value));
        }
    }

    if (in_.bad()) {
        return Error{ErrorCode::IoError, "Read failed at line " + std::to_string(line_)};
    }
    return Error{ErrorCode::InvalidData, "Record at line " + std::to_string(out.firstLine) +
                                             ": end of input before '$$$$'"};
}

} // namespace pubmirror::ingest
