#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "config/config_schema.hpp"

namespace margin::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// $MARGIN_ROOT, otherwise the per-user data directory:
// ~/.local/share/margin, ~/Library/Application Support/Margin on macOS,
// %APPDATA%\Margin on Windows.
std::filesystem::path DefaultRoot();

// Reads <root>/config.json (or config_path when given), then applies
// MARGIN_* environment overrides and fills defaults. A missing file is not
// an error; an unreadable or malformed one throws ConfigError.
Config LoadConfig(const std::filesystem::path& root,
                  const std::filesystem::path& config_path = {});

// Exposed for tests.
void ApplyConfigFromJson(Config& config, const std::string& json_text);
void ApplyEnvironment(Config& config);
void ApplyDefaults(Config& config);

}  // namespace margin::config
