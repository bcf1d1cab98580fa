#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

#include "utils/common.hpp"

namespace margin::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

}  // namespace

std::filesystem::path DefaultRoot() {
    const auto root = GetEnv("MARGIN_ROOT");
    if (!root.empty()) {
        return std::filesystem::path(root);
    }
#if defined(_WIN32)
    const auto app_data = GetEnv("APPDATA");
    if (!app_data.empty()) {
        return std::filesystem::path(app_data) / "Margin";
    }
    return GetHomePath() / "AppData" / "Roaming" / "Margin";
#elif defined(__APPLE__)
    return GetHomePath() / "Library" / "Application Support" / "Margin";
#else
    return GetHomePath() / ".local" / "share" / "margin";
#endif
}

void ApplyConfigFromJson(Config& config, const std::string& json_text) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigError(std::string("invalid config: ") + ex.what());
    }
    if (!data.is_object()) {
        throw ConfigError("invalid config: top-level value must be an object");
    }

    if (data.contains("runblock") && data["runblock"].is_object()) {
        const auto& runblock = data["runblock"];
        ApplyString(config.runblock.python_bin, runblock, "python_bin");
        ApplyString(config.runblock.shell, runblock, "shell");
        ApplyString(config.runblock.sql_cmd, runblock, "sql_cmd");
        if (runblock.contains("timeout_s") && runblock["timeout_s"].is_number_integer()) {
            config.runblock.timeout_s = runblock["timeout_s"].get<int>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

void ApplyEnvironment(Config& config) {
    const auto python_bin = GetEnvFallback(
        "MARGIN_RUNBLOCK__PYTHON_BIN",
        "MARGIN_RUNBLOCK_PYTHON_BIN");
    if (!python_bin.empty()) {
        config.runblock.python_bin = python_bin;
    }

    const auto shell = GetEnvFallback(
        "MARGIN_RUNBLOCK__SHELL",
        "MARGIN_RUNBLOCK_SHELL");
    if (!shell.empty()) {
        config.runblock.shell = shell;
    }

    const auto sql_cmd = GetEnvFallback(
        "MARGIN_RUNBLOCK__SQL_CMD",
        "MARGIN_RUNBLOCK_SQL_CMD");
    if (!sql_cmd.empty()) {
        config.runblock.sql_cmd = sql_cmd;
    }

    const auto timeout_s = GetEnvFallback(
        "MARGIN_RUNBLOCK__TIMEOUT_S",
        "MARGIN_RUNBLOCK_TIMEOUT_S");
    if (!timeout_s.empty()) {
        config.runblock.timeout_s = ParseInt(timeout_s, config.runblock.timeout_s);
    }

    const auto log_level = GetEnv("MARGIN_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

void ApplyDefaults(Config& config) {
    if (utils::Trim(config.runblock.python_bin).empty()) {
        config.runblock.python_bin = kDefaultPythonBin;
    }
    if (utils::Trim(config.runblock.shell).empty()) {
        config.runblock.shell = kDefaultShell;
    }
    if (config.runblock.timeout_s <= 0) {
        config.runblock.timeout_s = kDefaultTimeoutSeconds;
    } else if (config.runblock.timeout_s > kMaxTimeoutSeconds) {
        config.runblock.timeout_s = kMaxTimeoutSeconds;
    }
}

Config LoadConfig(const std::filesystem::path& root, const std::filesystem::path& config_path) {
    Config config{};
    const auto path = config_path.empty() ? root / "config.json" : config_path;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        if (!input.is_open()) {
            throw ConfigError("cannot open config " + path.string());
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        ApplyConfigFromJson(config, buffer.str());
    } else if (ec) {
        throw ConfigError("cannot stat config " + path.string() + ": " + ec.message());
    }

    ApplyEnvironment(config);
    ApplyDefaults(config);
    return config;
}

}  // namespace margin::config
