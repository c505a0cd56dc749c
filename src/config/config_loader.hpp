#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace warden::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Explicit path, then $WARDEN_CONFIG, then ~/.warden/config.json.
std::filesystem::path ResolveConfigPath(const std::optional<std::filesystem::path>& explicit_path);

// Defaults, then the config file when present, then WARDEN_* environment
// overrides, then validation. An explicit path that does not exist, a file
// that does not parse, a mistyped key or a missing shared secret throws
// ConfigError.
Config LoadConfig(const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);
void ValidateConfig(const Config& config);

// warden_worker beside the running executable.
std::filesystem::path DefaultWorkerPath();

// The effective configuration with the secret redacted.
nlohmann::json ToJson(const Config& config);

}  // namespace warden::config
