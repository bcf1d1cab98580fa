#include "runblock/backends.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unordered_set>
#include <utility>
#include <unistd.h>

#include "nlohmann/json.hpp"

#include "runblock/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace margin::runblock {
namespace {

constexpr const char* kDefaultPython = "python";
constexpr const char* kTimedOutNotice = "command timed out";
constexpr const char* kCanceledNotice = "command canceled";

std::string AppendNotice(const std::string& output, const std::string& notice) {
    if (output.empty()) {
        return notice;
    }
    if (output.back() == '\n') {
        return output + notice;
    }
    return output + "\n" + notice;
}

// Owns a file under the temp directory and removes it when it goes out of
// scope, whichever way that happens.
class ScopedTempFile {
public:
    ScopedTempFile() = default;
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    ~ScopedTempFile() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "runblock",
                       "failed to remove " + path_.string() + ": " + ec.message());
        }
    }

    // Creates the file with a unique name ending in suffix. Returns an error
    // message, empty on success.
    std::string Create(const std::string& prefix, const std::string& suffix) {
        std::error_code ec;
        const auto dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return "temp dir: " + ec.message();
        }
        std::string pattern = (dir / (prefix + "XXXXXX" + suffix)).string();
        const int fd = ::mkstemps(pattern.data(), static_cast<int>(suffix.size()));
        if (fd < 0) {
            return "create temp file: " + std::string(std::strerror(errno));
        }
        ::close(fd);
        path_ = pattern;
        return {};
    }

    std::string Write(const std::string& content) const {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return "open " + path_.string() + ": " + std::strerror(errno);
        }
        out << content;
        out.close();
        if (!out) {
            return "write " + path_.string() + ": failed";
        }
        return {};
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Characters a backslash escapes inside double quotes.
bool IsDoubleQuoteEscape(char c) {
    return c == '"' || c == '\\' || c == '$' || c == '`';
}

RunBlockError InvalidSqlCommand(const std::string& command, const std::string& reason) {
    return RunBlockError(ErrorKind::kExecutionFailure,
                         "invalid sql command \"" + command + "\": " + reason);
}

}  // namespace

Deadline DeadlineAfter(std::chrono::milliseconds timeout) {
    const std::chrono::milliseconds max_timeout = kMaxExecutionTimeout;
    if (timeout < std::chrono::milliseconds::zero()) {
        timeout = std::chrono::milliseconds::zero();
    } else if (timeout > max_timeout) {
        timeout = max_timeout;
    }
    return std::chrono::steady_clock::now() + timeout;
}

std::vector<std::string> ShellCandidates(const std::string& configured,
                                         const ExecutionOptions& options) {
    std::vector<std::string> raw;
    raw.push_back(configured);
    raw.emplace_back("bash");
    raw.emplace_back("sh");
    if (options.windows_host) {
        raw.insert(raw.end(), options.windows_shell_candidates.begin(),
                   options.windows_shell_candidates.end());
    }
    std::vector<std::string> candidates;
    std::unordered_set<std::string> seen;
    for (const auto& entry : raw) {
        auto value = utils::Trim(entry);
        if (value.empty() || !seen.insert(value).second) {
            continue;
        }
        candidates.push_back(std::move(value));
    }
    return candidates;
}

std::vector<std::string> ShellArguments(const std::string& shell, const std::string& code) {
    const auto name = utils::ToLower(shell);
    if (name == "wsl.exe" || name == "wsl") {
        return {"bash", "-lc", code};
    }
    if (name == "cmd.exe" || name == "cmd") {
        return {"/C", code};
    }
    return {"-lc", code};
}

ShellAttempt ClassifyShellAttempt(const sandbox::ExecResult& result) {
    switch (result.status) {
        case sandbox::ExecStatus::kNotFound:
            return ShellAttempt::kNotFound;
        case sandbox::ExecStatus::kFailed:
            return ShellAttempt::kLaunchError;
        case sandbox::ExecStatus::kExited:
        case sandbox::ExecStatus::kTimedOut:
        case sandbox::ExecStatus::kCancelled:
            return ShellAttempt::kRan;
    }
    return ShellAttempt::kLaunchError;
}

BackendOutput NormalizeExecResult(const sandbox::ExecResult& result) {
    switch (result.status) {
        case sandbox::ExecStatus::kExited:
            return {result.output, result.exit_code};
        case sandbox::ExecStatus::kTimedOut:
            return {AppendNotice(result.output, kTimedOutNotice), 124};
        case sandbox::ExecStatus::kCancelled:
            return {AppendNotice(result.output, kCanceledNotice), 130};
        case sandbox::ExecStatus::kNotFound:
        case sandbox::ExecStatus::kFailed:
            return {AppendNotice(result.output, result.error), 1};
    }
    return {AppendNotice(result.output, result.error), 1};
}

BackendOutput RunShell(const std::string& code,
                       const std::string& configured_shell,
                       Deadline deadline,
                       const utils::CancellationToken& cancel,
                       const ExecutionOptions& options) {
    const auto candidates = ShellCandidates(configured_shell, options);
    for (const auto& shell : candidates) {
        sandbox::ExecRequest request;
        request.program = shell;
        request.args = ShellArguments(shell, code);
        const auto result = sandbox::SandboxExecutor::Run(request, deadline, cancel);
        switch (ClassifyShellAttempt(result)) {
            case ShellAttempt::kNotFound:
                utils::Log(utils::LogLevel::kDebug, "runblock", "shell not found: " + shell);
                continue;
            case ShellAttempt::kLaunchError:
                utils::Log(utils::LogLevel::kWarn, "runblock",
                           "shell " + shell + " failed to start: " + result.error);
                return NormalizeExecResult(result);
            case ShellAttempt::kRan:
                utils::Log(utils::LogLevel::kDebug, "runblock", "shell=" + shell);
                return NormalizeExecResult(result);
        }
    }
    throw RunBlockError(
        ErrorKind::kNoShellFound,
        "no shell found to run block (tried: " + utils::Join(candidates, ", ") + ")");
}

BackendOutput RunPython(const std::string& code,
                        const std::string& python_bin,
                        Deadline deadline,
                        const utils::CancellationToken& cancel) {
    auto interpreter = utils::Trim(python_bin);
    if (interpreter.empty()) {
        interpreter = kDefaultPython;
    }
    ScopedTempFile script;
    if (auto error = script.Create("margin-run-", ".py"); !error.empty()) {
        return {error, 1};
    }
    if (auto error = script.Write(code); !error.empty()) {
        return {error, 1};
    }
    utils::Log(utils::LogLevel::kDebug, "runblock", "python script=" + script.path().string());

    sandbox::ExecRequest request;
    request.program = interpreter;
    request.args = {script.path().string()};
    return NormalizeExecResult(sandbox::SandboxExecutor::Run(request, deadline, cancel));
}

BackendOutput PrettyJson(const std::string& code) {
    try {
        const auto value = nlohmann::json::parse(code);
        return {value.dump(2), 0};
    } catch (const nlohmann::json::exception& ex) {
        return {ex.what(), 1};
    }
}

std::vector<std::string> SplitCommand(const std::string& command) {
    enum class Quote { kNone, kSingle, kDouble };

    std::vector<std::string> parts;
    std::string word;
    bool in_word = false;
    Quote quote = Quote::kNone;
    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        switch (quote) {
            case Quote::kSingle:
                if (c == '\'') {
                    quote = Quote::kNone;
                } else {
                    word += c;
                }
                break;
            case Quote::kDouble:
                if (c == '"') {
                    quote = Quote::kNone;
                } else if (c == '\\' && i + 1 < command.size() &&
                           IsDoubleQuoteEscape(command[i + 1])) {
                    word += command[++i];
                } else {
                    word += c;
                }
                break;
            case Quote::kNone:
                if (c == ' ' || c == '\t' || c == '\n') {
                    if (in_word) {
                        parts.push_back(std::move(word));
                        word.clear();
                        in_word = false;
                    }
                } else if (c == '\'') {
                    quote = Quote::kSingle;
                    in_word = true;
                } else if (c == '"') {
                    quote = Quote::kDouble;
                    in_word = true;
                } else if (c == '\\') {
                    if (i + 1 >= command.size()) {
                        throw InvalidSqlCommand(command, "trailing backslash");
                    }
                    word += command[++i];
                    in_word = true;
                } else {
                    word += c;
                    in_word = true;
                }
                break;
        }
    }
    if (quote != Quote::kNone) {
        throw InvalidSqlCommand(command, "unterminated quote");
    }
    if (in_word) {
        parts.push_back(std::move(word));
    }
    if (parts.empty() || parts.front().empty()) {
        throw InvalidSqlCommand(command, "no program");
    }
    return parts;
}

BackendOutput RunWithCommand(const std::string& command,
                             const std::string& input,
                             Deadline deadline,
                             const utils::CancellationToken& cancel) {
    auto parts = SplitCommand(command);
    sandbox::ExecRequest request;
    request.program = parts.front();
    request.args.assign(parts.begin() + 1, parts.end());
    request.input = input;
    return NormalizeExecResult(sandbox::SandboxExecutor::Run(request, deadline, cancel));
}

}  // namespace margin::runblock
