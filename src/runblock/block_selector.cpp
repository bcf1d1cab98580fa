#include "runblock/block_selector.hpp"

namespace margin::runblock {
namespace {

std::size_t Distance(std::size_t a, std::size_t b) {
    return a > b ? a - b : b - a;
}

}  // namespace

const Block* PickBlock(const std::vector<Block>& blocks, std::size_t cursor) {
    if (blocks.empty()) {
        return nullptr;
    }
    for (const auto& block : blocks) {
        if (cursor >= block.start && cursor <= block.end) {
            return &block;
        }
    }
    const Block* best = nullptr;
    std::size_t best_distance = 0;
    for (const auto& block : blocks) {
        const auto distance = Distance(block.start, cursor);
        // Strictly less keeps the earliest block on equal distances.
        if (best == nullptr || distance < best_distance) {
            best = &block;
            best_distance = distance;
        }
    }
    return best;
}

}  // namespace margin::runblock
