#pragma once

#include <cerrno>
#include <charconv>
#include <optional>
#include <string_view>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace pubmirror {

/**
 * @brief Whether pid names a running process (EPERM still means it exists).
 */
inline bool isProcessAlive(pid_t pid) noexcept {
    if (pid <= 0)
        return false;
    if (::kill(pid, 0) == 0)
        return true;
    return errno == EPERM;
}

/**
 * @brief Leading decimal pid of s ("1234-7" -> 1234); nullopt when s does not start with one.
 */
inline std::optional<pid_t> parseLeadingPid(std::string_view s) noexcept {
    long v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr == s.data() || v <= 0)
        return std::nullopt;
    return static_cast<pid_t>(v);
}

} // namespace pubmirror
