#include "runblock/fence_parser.hpp"

#include <cctype>
#include <string_view>
#include <utility>

namespace margin::runblock {
namespace {

constexpr std::size_t kMaxFenceIndent = 3;
constexpr std::size_t kMinFenceLength = 3;

struct Fence {
    char marker = '`';
    std::size_t length = 0;
    std::string language;
};

bool IsLanguageChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '+' || c == '-';
}

bool IsBlank(char c) {
    return c == ' ' || c == '\t';
}

// line excludes the terminating '\n'.
bool ParseOpeningFence(std::string_view line, Fence& fence) {
    std::size_t i = 0;
    while (i < line.size() && i < kMaxFenceIndent && IsBlank(line[i])) {
        ++i;
    }
    if (i >= line.size() || (line[i] != '`' && line[i] != '~')) {
        return false;
    }
    const char marker = line[i];
    const std::size_t run_start = i;
    while (i < line.size() && line[i] == marker) {
        ++i;
    }
    const std::size_t length = i - run_start;
    if (length < kMinFenceLength) {
        return false;
    }
    const std::size_t lang_start = i;
    while (i < line.size() && IsLanguageChar(line[i])) {
        ++i;
    }
    const std::size_t lang_end = i;
    while (i < line.size() && IsBlank(line[i])) {
        ++i;
    }
    if (i < line.size() && line[i] == '\r') {
        ++i;
    }
    if (i != line.size()) {
        return false;
    }
    fence.marker = marker;
    fence.length = length;
    fence.language = std::string(line.substr(lang_start, lang_end - lang_start));
    return true;
}

bool IsClosingFence(std::string_view line, const Fence& fence) {
    const auto first = line.find_first_not_of(" \t\r\v\f");
    if (first == std::string_view::npos) {
        return false;
    }
    const auto last = line.find_last_not_of(" \t\r\v\f");
    const auto trimmed = line.substr(first, last - first + 1);
    if (trimmed.size() < fence.length) {
        return false;
    }
    for (const char c : trimmed) {
        if (c != fence.marker) {
            return false;
        }
    }
    return true;
}

std::string NormalizeBody(std::string_view raw) {
    std::string code;
    code.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') {
            continue;
        }
        code.push_back(raw[i]);
    }
    if (!code.empty() && code.back() == '\n') {
        code.pop_back();
    }
    return code;
}

}  // namespace

std::vector<Block> ParseBlocks(const std::string& text) {
    std::vector<Block> blocks;
    const std::string_view view(text);
    std::size_t pos = 0;
    while (pos < view.size()) {
        const auto newline = view.find('\n', pos);
        if (newline == std::string_view::npos) {
            // An opener on the last line has no body and no closer.
            break;
        }
        Fence fence;
        if (!ParseOpeningFence(view.substr(pos, newline - pos), fence)) {
            pos = newline + 1;
            continue;
        }

        const std::size_t code_start = newline + 1;
        std::size_t line_start = code_start;
        bool closed = false;
        std::size_t closing_start = 0;
        std::size_t closing_end = 0;
        while (line_start < view.size()) {
            const auto line_newline = view.find('\n', line_start);
            const std::size_t line_end =
                line_newline == std::string_view::npos ? view.size() : line_newline;
            if (IsClosingFence(view.substr(line_start, line_end - line_start), fence)) {
                closed = true;
                closing_start = line_start;
                closing_end = line_newline == std::string_view::npos ? view.size() : line_newline + 1;
                break;
            }
            if (line_newline == std::string_view::npos) {
                break;
            }
            line_start = line_newline + 1;
        }
        if (!closed) {
            pos = code_start;
            continue;
        }

        Block block;
        block.language = fence.language;
        block.code = NormalizeBody(view.substr(code_start, closing_start - code_start));
        block.start = pos;
        block.end = closing_end;
        block.code_start = code_start;
        block.code_end = closing_start;
        blocks.push_back(std::move(block));
        pos = closing_end;
    }
    return blocks;
}

}  // namespace margin::runblock
