#pragma once

#include <stdexcept>
#include <string>

namespace margin::runblock {

enum class ErrorKind {
    kNoBlockFound,
    kNoBlockSelectable,
    kUnsupportedLanguage,
    kSqlUnsupported,
    kNoShellFound,
    kExecutionFailure,
    kDocumentRead
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNoBlockFound: return "NoBlockFound";
        case ErrorKind::kNoBlockSelectable: return "NoBlockSelectable";
        case ErrorKind::kUnsupportedLanguage: return "UnsupportedLanguage";
        case ErrorKind::kSqlUnsupported: return "SQLUnsupported";
        case ErrorKind::kNoShellFound: return "NoShellFound";
        case ErrorKind::kExecutionFailure: return "ExecutionFailure";
        case ErrorKind::kDocumentRead: return "DocumentRead";
    }
    return "Unknown";
}

class RunBlockError : public std::runtime_error {
public:
    RunBlockError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace margin::runblock
