#pragma once

#include <string>

namespace margin::config {

inline constexpr const char* kDefaultPythonBin = "python";
inline constexpr const char* kDefaultShell = "bash";
inline constexpr int kDefaultTimeoutSeconds = 30;
inline constexpr int kMaxTimeoutSeconds = 24 * 60 * 60;

// Empty python_bin/shell mean "backend default"; empty sql_cmd disables sql.
struct RunBlockConfig {
    std::string python_bin;
    std::string shell;
    std::string sql_cmd;
    int timeout_s = kDefaultTimeoutSeconds;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    RunBlockConfig runblock;
    LoggingConfig logging;
};

}  // namespace margin::config
