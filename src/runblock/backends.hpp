#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "runblock/options.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/cancellation.hpp"

namespace margin::runblock {

using Deadline = std::chrono::steady_clock::time_point;

// now + timeout, with timeout clamped to [0, kMaxExecutionTimeout].
Deadline DeadlineAfter(std::chrono::milliseconds timeout);

struct BackendOutput {
    std::string output;
    int exit_code = 0;
};

enum class ShellAttempt {
    kNotFound,
    kRan,
    kLaunchError
};

// Configured shell, bash, sh, then the Windows candidates on Windows
// hosts. Blank entries are dropped and duplicates keep their first slot.
std::vector<std::string> ShellCandidates(const std::string& configured,
                                         const ExecutionOptions& options);

// Arguments passed to shell so that it runs code inline.
std::vector<std::string> ShellArguments(const std::string& shell, const std::string& code);

ShellAttempt ClassifyShellAttempt(const sandbox::ExecResult& result);

// Maps a finished process onto the output/exit code convention:
// 124 on timeout, 130 on cancellation, 1 on launch or I/O failure.
BackendOutput NormalizeExecResult(const sandbox::ExecResult& result);

// Throws RunBlockError(kNoShellFound) when every candidate is missing.
BackendOutput RunShell(const std::string& code,
                       const std::string& configured_shell,
                       Deadline deadline,
                       const utils::CancellationToken& cancel,
                       const ExecutionOptions& options);

BackendOutput RunPython(const std::string& code,
                        const std::string& python_bin,
                        Deadline deadline,
                        const utils::CancellationToken& cancel);

BackendOutput PrettyJson(const std::string& code);

// Splits command the way a POSIX shell splits words: single quotes are
// literal, double quotes honour \" \\ \$ and \`, a bare backslash escapes
// the next character. No expansion is performed. Throws
// RunBlockError(kExecutionFailure) on an unterminated quote, a trailing
// backslash or when no program remains.
std::vector<std::string> SplitCommand(const std::string& command);

BackendOutput RunWithCommand(const std::string& command,
                             const std::string& input,
                             Deadline deadline,
                             const utils::CancellationToken& cancel);

}  // namespace margin::runblock
