#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace margin::runblock {

// One fenced region of a document. [start, end) covers both fence lines,
// [code_start, code_end) only the body.
struct Block {
    std::string language;
    std::string code;
    std::size_t start = 0;
    std::size_t end = 0;
    std::size_t code_start = 0;
    std::size_t code_end = 0;
};

struct Result {
    std::string language;
    std::string output;
    int exit_code = 0;
    std::chrono::system_clock::time_point ran_at;
    std::size_t block_end = 0;
};

}  // namespace margin::runblock
