#pragma once

#include <array>
#include <string>

#include "config/config_schema.hpp"
#include "runblock/block.hpp"
#include "runblock/options.hpp"
#include "utils/cancellation.hpp"

namespace margin::runblock {

enum class Backend {
    kShell,
    kPython,
    kJson,
    kSql,
    kUnsupported
};

inline constexpr std::array<const char*, 3> kShellLanguages = {"bash", "sh", "shell"};
inline constexpr std::array<const char*, 2> kPythonLanguages = {"python", "py"};
inline constexpr std::array<const char*, 1> kJsonLanguages = {"json"};
inline constexpr std::array<const char*, 1> kSqlLanguages = {"sql"};

const char* ToString(Backend backend);

// Case-insensitive.
Backend BackendFor(const std::string& language);

// Runs block through the backend its language maps to. Timeout and
// cancellation come back as results (exit codes 124 and 130); everything
// the caller has to fix is thrown as RunBlockError.
Result Execute(const Block& block,
               const config::RunBlockConfig& config,
               const utils::CancellationToken& cancel,
               const ExecutionOptions& options = {});

}  // namespace margin::runblock
