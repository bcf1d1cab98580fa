#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "runblock/block.hpp"
#include "runblock/options.hpp"
#include "utils/cancellation.hpp"

namespace margin::runblock {

// Reads the document at path, picks the block at cursor and executes it.
// Throws RunBlockError on every failure that produces no result.
Result Run(const std::filesystem::path& path,
           std::size_t cursor,
           const config::RunBlockConfig& config,
           const utils::CancellationToken& cancel,
           const ExecutionOptions& options = {});

// Same as Run() for a document already in memory.
Result RunText(const std::string& text,
               std::size_t cursor,
               const config::RunBlockConfig& config,
               const utils::CancellationToken& cancel,
               const ExecutionOptions& options = {});

// {"language","output","exit_code","ran_at","block_end"} as JSON text.
std::string ResultToJson(const Result& result, int indent = 2);

}  // namespace margin::runblock
