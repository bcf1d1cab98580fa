#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace margin::runblock {

inline constexpr std::chrono::seconds kDefaultExecutionTimeout{30};
// Longer timeouts are clamped to this.
inline constexpr std::chrono::hours kMaxExecutionTimeout{24};

#if defined(_WIN32)
inline constexpr bool kWindowsHost = true;
#else
inline constexpr bool kWindowsHost = false;
#endif

inline std::vector<std::string> DefaultWindowsShellCandidates() {
    return {
        R"(C:\Program Files\Git\bin\bash.exe)",
        R"(C:\Program Files\Git\usr\bin\bash.exe)",
        "wsl.exe",
    };
}

struct ExecutionOptions {
    std::chrono::milliseconds timeout = kDefaultExecutionTimeout;
    // Tried after bash and sh when windows_host is set.
    std::vector<std::string> windows_shell_candidates = DefaultWindowsShellCandidates();
    bool windows_host = kWindowsHost;
};

}  // namespace margin::runblock
