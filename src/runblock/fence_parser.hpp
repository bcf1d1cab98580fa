#pragma once

#include <string>
#include <vector>

#include "runblock/block.hpp"

namespace margin::runblock {

// Returns every terminated fenced block of text in document order.
// Unterminated fences are dropped; the function never fails.
std::vector<Block> ParseBlocks(const std::string& text);

}  // namespace margin::runblock
