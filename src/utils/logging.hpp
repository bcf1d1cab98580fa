#pragma once

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

namespace margin::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(std::string value, LogLevel fallback) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (value == "debug") {
        return LogLevel::kDebug;
    }
    if (value == "info") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline LogConfig& GlobalLogConfig() {
    static LogConfig config{};
    return config;
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(GlobalLogConfig().min_level);
}

// Writes "[tag] message" to stderr.
inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace margin::utils
