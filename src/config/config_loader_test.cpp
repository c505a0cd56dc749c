#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

#include <gtest/gtest.h>

namespace warden::config {
namespace {

namespace fs = std::filesystem;

constexpr const char* kTouchedVariables[] = {
    "WARDEN_CONFIG",
    "WARDEN_SANDBOX__SHARED_SECRET",
    "WARDEN_SHARED_SECRET",
    "WARDEN_SANDBOX__ALLOWED_IMPORTS",
    "WARDEN_SANDBOX__MAX_CPU_SECONDS",
    "WARDEN_SANDBOX__WORKER_PATH",
    "WARDEN_SERVER__PORT",
    "WARDEN_LOGGING__LEVEL",
    "WARDEN_LOG_LEVEL",
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ClearEnvironment();
        dir_ = fs::temp_directory_path() / ("warden_config_test_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        ClearEnvironment();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static void ClearEnvironment() {
        for (const auto* name : kTouchedVariables) {
            ::unsetenv(name);
        }
    }

    fs::path WriteFile(const std::string& name, const std::string& content) {
        const auto path = dir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    fs::path dir_;
};

TEST_F(ConfigLoaderTest, ReadsCamelCaseSections) {
    Config config;
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "sandbox": {"sharedSecret": "abc", "maxCpuSeconds": 9, "allowedImports": ["math"]},
        "server": {"host": "0.0.0.0", "port": 9000},
        "logging": {"level": "debug"}
    })"));
    EXPECT_EQ(config.sandbox.shared_secret, "abc");
    EXPECT_EQ(config.sandbox.max_cpu_seconds, 9);
    EXPECT_EQ(config.sandbox.allowed_imports, std::vector<std::string>{"math"});
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 9000);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.sandbox.max_output_bytes, SandboxConfig{}.max_output_bytes);
}

TEST_F(ConfigLoaderTest, RejectsMistypedValues) {
    Config config;
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"sandbox": {"maxCpuSeconds": "5"}})")),
                 ConfigError);
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"sandbox": {"allowedImports": "math"}})")),
                 ConfigError);
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::parse(R"({"server": []})")), ConfigError);
    EXPECT_THROW(ApplyConfigFromJson(config, nlohmann::json::array()), ConfigError);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = WriteFile("config.json", R"({"sandbox": {"sharedSecret": "from-file", "maxCpuSeconds": 3}})");
    ::setenv("WARDEN_SANDBOX__SHARED_SECRET", "from-env", 1);
    ::setenv("WARDEN_SANDBOX__MAX_CPU_SECONDS", "7", 1);
    ::setenv("WARDEN_SANDBOX__ALLOWED_IMPORTS", "math,json", 1);
    ::setenv("WARDEN_LOG_LEVEL", "warn", 1);

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.sandbox.shared_secret, "from-env");
    EXPECT_EQ(config.sandbox.max_cpu_seconds, 7);
    EXPECT_EQ(config.sandbox.allowed_imports, (std::vector<std::string>{"math", "json"}));
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_FALSE(config.sandbox.worker_path.empty());
}

TEST_F(ConfigLoaderTest, ShortSecretVariableIsAFallback) {
    ::setenv("WARDEN_SHARED_SECRET", "short", 1);
    Config config;
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.sandbox.shared_secret, "short");
    ::setenv("WARDEN_SANDBOX__SHARED_SECRET", "long", 1);
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.sandbox.shared_secret, "long");
}

TEST_F(ConfigLoaderTest, RejectsMalformedEnvironmentNumbers) {
    ::setenv("WARDEN_SERVER__PORT", "eighty", 1);
    Config config;
    EXPECT_THROW(ApplyEnvOverrides(config), ConfigError);
}

TEST_F(ConfigLoaderTest, ConfigPathFromEnvironment) {
    const auto path = WriteFile("env.json", R"({"sandbox": {"sharedSecret": "s"}, "server": {"port": 7001}})");
    ::setenv("WARDEN_CONFIG", path.c_str(), 1);
    EXPECT_EQ(ResolveConfigPath(std::nullopt), path);
    EXPECT_EQ(LoadConfig().server.port, 7001);
    EXPECT_EQ(ResolveConfigPath(fs::path("/explicit.json")), fs::path("/explicit.json"));
}

TEST_F(ConfigLoaderTest, MissingExplicitFileIsAnError) {
    EXPECT_THROW(LoadConfig(dir_ / "absent.json"), ConfigError);
}

TEST_F(ConfigLoaderTest, UnparsableFileIsAnError) {
    const auto path = WriteFile("broken.json", "{\"sandbox\": ");
    EXPECT_THROW(LoadConfig(path), ConfigError);
}

TEST_F(ConfigLoaderTest, SecretIsRequired) {
    const auto path = WriteFile("empty.json", "{}");
    try {
        LoadConfig(path);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& ex) {
        EXPECT_STREQ(ex.what(), "sandbox.sharedSecret is required");
    }
}

TEST_F(ConfigLoaderTest, OmittedSandboxKeysKeepDefaults) {
    const auto path = WriteFile("secret_only.json", R"({"sandbox": {"sharedSecret": "abc"}})");
    const auto config = LoadConfig(path);
    const SandboxConfig defaults;
    EXPECT_EQ(config.sandbox.allowed_imports, defaults.allowed_imports);
    EXPECT_EQ(config.sandbox.max_code_bytes, defaults.max_code_bytes);
    EXPECT_EQ(config.sandbox.max_ast_nodes, defaults.max_ast_nodes);
    EXPECT_EQ(config.sandbox.max_cpu_seconds, defaults.max_cpu_seconds);
    EXPECT_EQ(config.sandbox.max_memory_bytes, defaults.max_memory_bytes);
    EXPECT_EQ(config.sandbox.max_output_bytes, defaults.max_output_bytes);
    EXPECT_EQ(config.sandbox.max_concurrent_executions, defaults.max_concurrent_executions);
    EXPECT_FALSE(config.sandbox.worker_path.empty());
}

TEST_F(ConfigLoaderTest, ValidatesRanges) {
    Config config;
    config.sandbox.shared_secret = "s";
    config.sandbox.worker_path = "/usr/bin/warden_worker";
    EXPECT_NO_THROW(ValidateConfig(config));

    auto bad = config;
    bad.sandbox.allowed_imports = {"json", "os"};
    EXPECT_THROW(ValidateConfig(bad), ConfigError);

    bad = config;
    bad.sandbox.default_timeout_seconds = bad.sandbox.max_timeout_seconds + 1;
    EXPECT_THROW(ValidateConfig(bad), ConfigError);

    bad = config;
    bad.server.port = 70000;
    EXPECT_THROW(ValidateConfig(bad), ConfigError);

    bad = config;
    bad.logging.level = "loud";
    EXPECT_THROW(ValidateConfig(bad), ConfigError);

    bad = config;
    bad.sandbox.max_concurrent_executions = 0;
    EXPECT_THROW(ValidateConfig(bad), ConfigError);
}

TEST_F(ConfigLoaderTest, RedactsSecret) {
    Config config;
    config.sandbox.shared_secret = "do-not-print";
    const auto json = ToJson(config);
    EXPECT_EQ(json["sandbox"]["sharedSecret"], "<redacted>");
    EXPECT_EQ(json.dump().find("do-not-print"), std::string::npos);
}

}  // namespace
}  // namespace warden::config
