#pragma once

#include <cstddef>
#include <vector>

#include "runblock/block.hpp"

namespace margin::runblock {

// Picks the first block whose [start, end] contains cursor, otherwise the
// block whose start is nearest to cursor (earliest block on ties).
// Returns nullptr when blocks is empty. The pointer refers into blocks.
const Block* PickBlock(const std::vector<Block>& blocks, std::size_t cursor);

}  // namespace margin::runblock
