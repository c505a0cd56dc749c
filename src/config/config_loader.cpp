#include "config/config_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "script/modules.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace warden::config {
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
    return std::filesystem::path(home ? home : ".");
}

template <typename T>
void ReadInteger(const nlohmann::json& section, const char* key, const std::string& where, T& target) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section[key];
    if (!value.is_number_integer()) {
        throw ConfigError(where + "." + key + " must be an integer");
    }
    const auto number = value.get<long long>();
    if (number < 0 || static_cast<unsigned long long>(number) > std::numeric_limits<T>::max()) {
        throw ConfigError(where + "." + key + " is out of range");
    }
    target = static_cast<T>(number);
}

void ReadString(const nlohmann::json& section, const char* key, const std::string& where, std::string& target) {
    if (!section.contains(key)) {
        return;
    }
    if (!section[key].is_string()) {
        throw ConfigError(where + "." + key + " must be a string");
    }
    target = section[key].get<std::string>();
}

const nlohmann::json* Section(const nlohmann::json& data, const char* key) {
    if (!data.contains(key)) {
        return nullptr;
    }
    if (!data[key].is_object()) {
        throw ConfigError(std::string(key) + " must be an object");
    }
    return &data[key];
}

long long ParseInt(const std::string& name, const std::string& value) {
    std::size_t used = 0;
    long long number = 0;
    try {
        number = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (used != value.size() || number < 0) {
        throw ConfigError(name + " must be a non-negative integer, got '" + value + "'");
    }
    return number;
}

template <typename T>
void OverrideInteger(const char* name, T& target) {
    const auto value = GetEnv(name);
    if (value.empty()) {
        return;
    }
    const auto number = ParseInt(name, value);
    if (static_cast<unsigned long long>(number) > std::numeric_limits<T>::max()) {
        throw ConfigError(std::string(name) + " is out of range");
    }
    target = static_cast<T>(number);
}

void OverrideString(const char* name, std::string& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = value;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

}  // namespace

std::filesystem::path ResolveConfigPath(const std::optional<std::filesystem::path>& explicit_path) {
    if (explicit_path) {
        return *explicit_path;
    }
    const auto from_env = GetEnv("WARDEN_CONFIG");
    if (!from_env.empty()) {
        return from_env;
    }
    return GetHomePath() / ".warden" / "config.json";
}

std::filesystem::path DefaultWorkerPath() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path() / "warden_worker";
    }
    return self.parent_path() / "warden_worker";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("config root must be an object");
    }

    if (const auto* sandbox = Section(data, "sandbox")) {
        auto& target = config.sandbox;
        if (sandbox->contains("allowedImports")) {
            const auto& imports = (*sandbox)["allowedImports"];
            if (!imports.is_array()) {
                throw ConfigError("sandbox.allowedImports must be an array");
            }
            target.allowed_imports.clear();
            for (const auto& item : imports) {
                if (!item.is_string()) {
                    throw ConfigError("sandbox.allowedImports must hold strings");
                }
                target.allowed_imports.push_back(item.get<std::string>());
            }
        }
        ReadInteger(*sandbox, "maxCodeBytes", "sandbox", target.max_code_bytes);
        ReadInteger(*sandbox, "maxAstNodes", "sandbox", target.max_ast_nodes);
        ReadInteger(*sandbox, "maxCpuSeconds", "sandbox", target.max_cpu_seconds);
        ReadInteger(*sandbox, "maxMemoryBytes", "sandbox", target.max_memory_bytes);
        ReadInteger(*sandbox, "maxOutputBytes", "sandbox", target.max_output_bytes);
        ReadInteger(*sandbox, "maxConcurrentExecutions", "sandbox", target.max_concurrent_executions);
        ReadString(*sandbox, "sharedSecret", "sandbox", target.shared_secret);
        ReadString(*sandbox, "workerPath", "sandbox", target.worker_path);
        ReadInteger(*sandbox, "queueTimeoutMs", "sandbox", target.queue_timeout_ms);
        ReadInteger(*sandbox, "defaultTimeoutSeconds", "sandbox", target.default_timeout_seconds);
        ReadInteger(*sandbox, "maxTimeoutSeconds", "sandbox", target.max_timeout_seconds);
        ReadInteger(*sandbox, "killGraceMs", "sandbox", target.kill_grace_ms);
        ReadInteger(*sandbox, "maxProcesses", "sandbox", target.max_processes);
        ReadInteger(*sandbox, "maxOpenFiles", "sandbox", target.max_open_files);
        ReadInteger(*sandbox, "maxStackBytes", "sandbox", target.max_stack_bytes);
        ReadInteger(*sandbox, "maxContextBytes", "sandbox", target.max_context_bytes);
        ReadInteger(*sandbox, "maxContextDepth", "sandbox", target.max_context_depth);
        ReadInteger(*sandbox, "maxRequestBytes", "sandbox", target.max_request_bytes);
    }

    if (const auto* server = Section(data, "server")) {
        ReadString(*server, "host", "server", config.server.host);
        ReadInteger(*server, "port", "server", config.server.port);
    }

    if (const auto* logging = Section(data, "logging")) {
        ReadString(*logging, "level", "logging", config.logging.level);
    }
}

void ApplyEnvOverrides(Config& config) {
    auto& sandbox = config.sandbox;
    const auto secret = GetEnvFallback("WARDEN_SANDBOX__SHARED_SECRET", "WARDEN_SHARED_SECRET");
    if (!secret.empty()) {
        sandbox.shared_secret = secret;
    }
    const auto imports = GetEnv("WARDEN_SANDBOX__ALLOWED_IMPORTS");
    if (!imports.empty()) {
        sandbox.allowed_imports = SplitCsv(imports);
    }
    OverrideInteger("WARDEN_SANDBOX__MAX_CODE_BYTES", sandbox.max_code_bytes);
    OverrideInteger("WARDEN_SANDBOX__MAX_AST_NODES", sandbox.max_ast_nodes);
    OverrideInteger("WARDEN_SANDBOX__MAX_CPU_SECONDS", sandbox.max_cpu_seconds);
    OverrideInteger("WARDEN_SANDBOX__MAX_MEMORY_BYTES", sandbox.max_memory_bytes);
    OverrideInteger("WARDEN_SANDBOX__MAX_OUTPUT_BYTES", sandbox.max_output_bytes);
    OverrideInteger("WARDEN_SANDBOX__MAX_CONCURRENT_EXECUTIONS", sandbox.max_concurrent_executions);
    OverrideString("WARDEN_SANDBOX__WORKER_PATH", sandbox.worker_path);
    OverrideInteger("WARDEN_SANDBOX__QUEUE_TIMEOUT_MS", sandbox.queue_timeout_ms);
    OverrideInteger("WARDEN_SANDBOX__DEFAULT_TIMEOUT_SECONDS", sandbox.default_timeout_seconds);
    OverrideInteger("WARDEN_SANDBOX__MAX_TIMEOUT_SECONDS", sandbox.max_timeout_seconds);
    OverrideInteger("WARDEN_SANDBOX__KILL_GRACE_MS", sandbox.kill_grace_ms);
    OverrideInteger("WARDEN_SANDBOX__MAX_PROCESSES", sandbox.max_processes);
    OverrideInteger("WARDEN_SANDBOX__MAX_OPEN_FILES", sandbox.max_open_files);
    OverrideInteger("WARDEN_SANDBOX__MAX_STACK_BYTES", sandbox.max_stack_bytes);
    OverrideInteger("WARDEN_SANDBOX__MAX_CONTEXT_BYTES", sandbox.max_context_bytes);
    OverrideInteger("WARDEN_SANDBOX__MAX_CONTEXT_DEPTH", sandbox.max_context_depth);
    OverrideInteger("WARDEN_SANDBOX__MAX_REQUEST_BYTES", sandbox.max_request_bytes);

    OverrideString("WARDEN_SERVER__HOST", config.server.host);
    OverrideInteger("WARDEN_SERVER__PORT", config.server.port);
    const auto level = GetEnvFallback("WARDEN_LOGGING__LEVEL", "WARDEN_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }
}

void ValidateConfig(const Config& config) {
    const auto& sandbox = config.sandbox;
    Require(!sandbox.shared_secret.empty(), "sandbox.sharedSecret is required");
    Require(!sandbox.worker_path.empty(), "sandbox.workerPath must not be empty");
    Require(sandbox.max_code_bytes > 0, "sandbox.maxCodeBytes must be positive");
    Require(sandbox.max_ast_nodes > 0, "sandbox.maxAstNodes must be positive");
    Require(sandbox.max_cpu_seconds > 0, "sandbox.maxCpuSeconds must be positive");
    Require(sandbox.max_memory_bytes >= 16u * 1024 * 1024, "sandbox.maxMemoryBytes must be at least 16 MiB");
    Require(sandbox.max_output_bytes > 0, "sandbox.maxOutputBytes must be positive");
    Require(sandbox.max_concurrent_executions > 0, "sandbox.maxConcurrentExecutions must be positive");
    Require(sandbox.max_timeout_seconds > 0, "sandbox.maxTimeoutSeconds must be positive");
    Require(sandbox.default_timeout_seconds > 0 && sandbox.default_timeout_seconds <= sandbox.max_timeout_seconds,
            "sandbox.defaultTimeoutSeconds must be within 1..maxTimeoutSeconds");
    Require(sandbox.max_open_files >= 3, "sandbox.maxOpenFiles must leave room for the standard streams");
    Require(sandbox.max_stack_bytes >= 64 * 1024, "sandbox.maxStackBytes must be at least 64 KiB");
    Require(sandbox.max_request_bytes > 0, "sandbox.maxRequestBytes must be positive");

    const auto available = script::AvailableModules();
    for (const auto& name : sandbox.allowed_imports) {
        Require(std::find(available.begin(), available.end(), name) != available.end(),
                "sandbox.allowedImports names unknown module '" + name + "' (available: " +
                    utils::Join(available, ", ") + ")");
    }

    Require(config.server.port > 0 && config.server.port <= 65535, "server.port must be within 1..65535");
    utils::LogLevel level;
    Require(utils::ParseLogLevel(config.logging.level, level), "logging.level '" + config.logging.level +
                                                                   "' is not one of debug, info, warn, error");
}

Config LoadConfig(const std::optional<std::filesystem::path>& explicit_path) {
    Config config{};

    const auto config_path = ResolveConfigPath(explicit_path);
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            throw ConfigError("cannot open " + config_path.string());
        }
        nlohmann::json data;
        try {
            input >> data;
        } catch (const nlohmann::json::parse_error& ex) {
            throw ConfigError("cannot parse " + config_path.string() + ": " + ex.what());
        }
        ApplyConfigFromJson(config, data);
    } else if (explicit_path) {
        throw ConfigError("config file not found: " + config_path.string());
    }

    ApplyEnvOverrides(config);
    if (config.sandbox.worker_path.empty()) {
        config.sandbox.worker_path = DefaultWorkerPath().string();
    }
    ValidateConfig(config);
    return config;
}

nlohmann::json ToJson(const Config& config) {
    const auto& sandbox = config.sandbox;
    return {
        {"sandbox", {
            {"allowedImports", sandbox.allowed_imports},
            {"maxCodeBytes", sandbox.max_code_bytes},
            {"maxAstNodes", sandbox.max_ast_nodes},
            {"maxCpuSeconds", sandbox.max_cpu_seconds},
            {"maxMemoryBytes", sandbox.max_memory_bytes},
            {"maxOutputBytes", sandbox.max_output_bytes},
            {"maxConcurrentExecutions", sandbox.max_concurrent_executions},
            {"sharedSecret", sandbox.shared_secret.empty() ? "" : "<redacted>"},
            {"workerPath", sandbox.worker_path},
            {"queueTimeoutMs", sandbox.queue_timeout_ms},
            {"defaultTimeoutSeconds", sandbox.default_timeout_seconds},
            {"maxTimeoutSeconds", sandbox.max_timeout_seconds},
            {"killGraceMs", sandbox.kill_grace_ms},
            {"maxProcesses", sandbox.max_processes},
            {"maxOpenFiles", sandbox.max_open_files},
            {"maxStackBytes", sandbox.max_stack_bytes},
            {"maxContextBytes", sandbox.max_context_bytes},
            {"maxContextDepth", sandbox.max_context_depth},
            {"maxRequestBytes", sandbox.max_request_bytes}
        }},
        {"server", {{"host", config.server.host}, {"port", config.server.port}}},
        {"logging", {{"level", config.logging.level}}}
    };
}

}  // namespace warden::config
