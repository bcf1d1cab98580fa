#include "runblock/dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "runblock/backends.hpp"
#include "runblock/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace margin::runblock {
namespace {

template <std::size_t N>
bool Contains(const std::array<const char*, N>& tags, const std::string& language) {
    return std::any_of(tags.begin(), tags.end(), [&](const char* tag) { return language == tag; });
}

}  // namespace

const char* ToString(Backend backend) {
    switch (backend) {
        case Backend::kShell: return "shell";
        case Backend::kPython: return "python";
        case Backend::kJson: return "json";
        case Backend::kSql: return "sql";
        case Backend::kUnsupported: return "unsupported";
    }
    return "unsupported";
}

Backend BackendFor(const std::string& language) {
    const auto lang = utils::ToLower(language);
    if (Contains(kShellLanguages, lang)) {
        return Backend::kShell;
    }
    if (Contains(kPythonLanguages, lang)) {
        return Backend::kPython;
    }
    if (Contains(kJsonLanguages, lang)) {
        return Backend::kJson;
    }
    if (Contains(kSqlLanguages, lang)) {
        return Backend::kSql;
    }
    return Backend::kUnsupported;
}

Result Execute(const Block& block,
               const config::RunBlockConfig& config,
               const utils::CancellationToken& cancel,
               const ExecutionOptions& options) {
    const auto backend = BackendFor(block.language);
    if (backend == Backend::kUnsupported) {
        throw RunBlockError(ErrorKind::kUnsupportedLanguage, "unsupported language: " + block.language);
    }
    if (backend == Backend::kSql && utils::Trim(config.sql_cmd).empty()) {
        throw RunBlockError(ErrorKind::kSqlUnsupported,
                            "sql execution unsupported without runblock.sql_cmd");
    }

    Result result;
    result.language = utils::ToLower(block.language);
    result.ran_at = utils::Now();
    result.block_end = block.end;
    const auto deadline = DeadlineAfter(options.timeout);
    utils::Log(utils::LogLevel::kInfo, "runblock",
               "language=" + result.language + " backend=" + ToString(backend) +
               " bytes=" + std::to_string(block.code.size()));

    BackendOutput output;
    switch (backend) {
        case Backend::kShell:
            output = RunShell(block.code, config.shell, deadline, cancel, options);
            break;
        case Backend::kPython:
            output = RunPython(block.code, config.python_bin, deadline, cancel);
            break;
        case Backend::kJson:
            output = PrettyJson(block.code);
            break;
        case Backend::kSql:
            output = RunWithCommand(config.sql_cmd, block.code, deadline, cancel);
            break;
        case Backend::kUnsupported:
            break;
    }
    result.output = std::move(output.output);
    result.exit_code = output.exit_code;
    utils::Log(utils::LogLevel::kInfo, "runblock",
               "language=" + result.language + " exit=" + std::to_string(result.exit_code));
    return result;
}

}  // namespace margin::runblock
