#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

namespace margin::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n\v\f");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n\v\f");
    return value.substr(first, last - first + 1);
}

// Local time as 2006-01-02T15:04:05+07:00, "Z" when the offset is zero.
inline std::string FormatRfc3339(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &local);
    char offset[8];
    std::strftime(offset, sizeof(offset), "%z", &local);
    std::string zone(offset);
    if (zone.size() == 5) {
        if (zone == "+0000" || zone == "-0000") {
            zone = "Z";
        } else {
            zone.insert(3, ":");
        }
    }
    return std::string(stamp) + zone;
}

}  // namespace margin::utils
