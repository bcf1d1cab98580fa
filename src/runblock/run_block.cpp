#include "runblock/run_block.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

#include "runblock/block_selector.hpp"
#include "runblock/dispatcher.hpp"
#include "runblock/errors.hpp"
#include "runblock/fence_parser.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace margin::runblock {
namespace {

std::string ReadDocument(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw RunBlockError(ErrorKind::kDocumentRead,
                            "open " + path.string() + ": " + std::strerror(errno));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw RunBlockError(ErrorKind::kDocumentRead, "read " + path.string() + ": failed");
    }
    return buffer.str();
}

}  // namespace

Result RunText(const std::string& text,
               std::size_t cursor,
               const config::RunBlockConfig& config,
               const utils::CancellationToken& cancel,
               const ExecutionOptions& options) {
    const auto blocks = ParseBlocks(text);
    if (blocks.empty()) {
        throw RunBlockError(ErrorKind::kNoBlockFound, "no fenced code block found");
    }
    const Block* block = PickBlock(blocks, cursor);
    if (block == nullptr) {
        throw RunBlockError(ErrorKind::kNoBlockSelectable, "unable to select code block");
    }
    utils::Log(utils::LogLevel::kDebug, "runblock",
               "blocks=" + std::to_string(blocks.size()) +
               " cursor=" + std::to_string(cursor) +
               " start=" + std::to_string(block->start) +
               " end=" + std::to_string(block->end));
    return Execute(*block, config, cancel, options);
}

Result Run(const std::filesystem::path& path,
           std::size_t cursor,
           const config::RunBlockConfig& config,
           const utils::CancellationToken& cancel,
           const ExecutionOptions& options) {
    return RunText(ReadDocument(path), cursor, config, cancel, options);
}

std::string ResultToJson(const Result& result, int indent) {
    nlohmann::json json = {
        {"language", result.language},
        {"output", result.output},
        {"exit_code", result.exit_code},
        {"ran_at", utils::FormatRfc3339(result.ran_at)},
        {"block_end", result.block_end}
    };
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace margin::runblock
