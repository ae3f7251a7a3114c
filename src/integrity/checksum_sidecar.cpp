#include <pubmirror/integrity/checksum.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace pubmirror::integrity {

namespace {

bool isHexDigest(std::string_view s) {
    if (s.size() < 32 || s.size() % 2 != 0)
        return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

std::filesystem::path sidecarFor(const std::filesystem::path& payload,
                                 std::string_view extension) {
    auto sidecar = payload;
    sidecar += std::string(extension);
    return sidecar;
}

Result<std::string> parseSidecarDigest(std::string_view text) {
    auto line = trimView(text.substr(0, text.find('\n')));
    if (line.empty()) {
        return Error{ErrorCode::InvalidData, "Empty checksum sidecar"};
    }

    // BSD style: "MD5 (name) = hex"
    if (auto eq = line.rfind(" = "); eq != std::string_view::npos && line.find('(') < eq) {
        auto hex = trimView(line.substr(eq + 3));
        if (isHexDigest(hex))
            return toLower(hex);
    }

    // GNU style: "hex  name", "hex *name" or bare "hex"
    auto end = line.find_first_of(" \t");
    auto hex = line.substr(0, end);
    if (!isHexDigest(hex)) {
        return Error{ErrorCode::InvalidData,
                     "Checksum sidecar does not start with a hex digest: " + std::string(line)};
    }
    return toLower(hex);
}

Result<VerifyResult> verifyAgainstSidecar(const std::filesystem::path& payload,
                                          const std::filesystem::path& sidecar, HashAlgo algo) {
    VerifyResult out;

    std::ifstream in(sidecar);
    if (!in) {
        out.verdict = Verdict::Unverifiable;
        out.reason = "no checksum sidecar at " + sidecar.string();
        return out;
    }
    std::stringstream text;
    text << in.rdbuf();

    auto expected = parseSidecarDigest(text.str());
    if (!expected) {
        out.verdict = Verdict::Unverifiable;
        out.reason = expected.error().message;
        return out;
    }

    auto actual = computeFileDigest(payload, algo);
    if (!actual) {
        return actual.error();
    }

    out.expected = expected.value();
    out.actual = actual.value().hex;
    out.verdict = out.expected == out.actual ? Verdict::Valid : Verdict::Invalid;
    return out;
}

} // namespace pubmirror::integrity
