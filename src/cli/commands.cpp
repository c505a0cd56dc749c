#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "coordinator/coordinator.hpp"
#include "sandbox/types.hpp"
#include "utils/json.hpp"
#include "utils/logging.hpp"

namespace {

using warden::utils::Json;

constexpr char kUsage[] =
    "Usage: warden validate <file> [--config path]\n"
    "       warden run <file> [--context JSON] [--timeout seconds] [--config path]\n"
    "       warden health [--config path]\n"
    "       warden config [--config path]";

struct Options {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> context;
    std::optional<int> timeout_seconds;
};

bool ParseOptions(int argc, char** argv, Options& options) {
    if (argc < 2) {
        return false;
    }
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            options.config_path = std::filesystem::path(argv[++i]);
        } else if (arg == "--context" && has_value) {
            options.context = argv[++i];
        } else if (arg == "--timeout" && has_value) {
            try {
                options.timeout_seconds = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                return false;
            }
        } else if (arg.rfind("--", 0) == 0) {
            return false;
        } else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

std::optional<std::string> ReadSource(const std::string& path) {
    if (path == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void PrintJson(const Json& json) {
    std::cout << json.dump(2, ' ', false, Json::error_handler_t::replace) << std::endl;
}

warden::config::Config LoadAndConfigure(const Options& options) {
    auto config = warden::config::LoadConfig(options.config_path);
    warden::utils::LogConfig log_config;
    if (!warden::utils::ParseLogLevel(config.logging.level, log_config.min_level)) {
        throw warden::config::ConfigError("unknown log level: " + config.logging.level);
    }
    warden::utils::ConfigureLogging(log_config);
    return config;
}

Json ValidationJson(const warden::validator::ValidationResult& validation) {
    Json details = Json::array();
    for (const auto& issue : validation.errors) {
        details.push_back({{"line", issue.line}, {"column", issue.column}, {"message", issue.message}});
    }
    return {{"valid", validation.valid}, {"errors", validation.Messages()}, {"details", details}};
}

int RunValidate(const Options& options) {
    if (options.positional.size() != 1) {
        std::cerr << kUsage << std::endl;
        return 2;
    }
    const auto source = ReadSource(options.positional.front());
    if (!source) {
        std::cerr << "Failed to read " << options.positional.front() << std::endl;
        return 1;
    }
    const auto config = LoadAndConfigure(options);
    warden::coordinator::Coordinator coordinator(config.sandbox);
    const auto validation = coordinator.Validate(*source);
    PrintJson(ValidationJson(validation));
    return validation.valid ? 0 : 1;
}

int RunExecute(const Options& options) {
    if (options.positional.size() != 1) {
        std::cerr << kUsage << std::endl;
        return 2;
    }
    const auto source = ReadSource(options.positional.front());
    if (!source) {
        std::cerr << "Failed to read " << options.positional.front() << std::endl;
        return 1;
    }

    warden::sandbox::ExecutionRequest request;
    request.code = *source;
    request.timeout_seconds = options.timeout_seconds;
    if (options.context) {
        try {
            request.context = Json::parse(*options.context);
        } catch (const Json::parse_error& ex) {
            std::cerr << "Invalid --context JSON: " << ex.what() << std::endl;
            return 2;
        }
    }

    const auto config = LoadAndConfigure(options);
    warden::coordinator::Coordinator coordinator(config.sandbox);
    if (!coordinator.Initialize()) {
        std::cerr << "Sandbox failed to initialize." << std::endl;
        return 1;
    }

    const auto response = coordinator.Execute(request, config.sandbox.shared_secret);
    switch (response.disposition) {
        case warden::coordinator::Disposition::kExecuted:
            PrintJson(warden::sandbox::ToJson(*response.result));
            return response.result->success ? 0 : 1;
        case warden::coordinator::Disposition::kRejectedValidation:
            PrintJson(ValidationJson(*response.validation));
            return 1;
        default:
            PrintJson({{"disposition", warden::coordinator::ToString(response.disposition)},
                       {"error", response.message}});
            return 1;
    }
}

int RunHealth(const Options& options) {
    const auto config = LoadAndConfigure(options);
    warden::coordinator::Coordinator coordinator(config.sandbox);
    const bool ready = coordinator.Initialize();
    auto report = warden::coordinator::ToJson(coordinator.Health());
    report["stats"] = warden::coordinator::ToJson(coordinator.Stats());
    PrintJson(report);
    return ready ? 0 : 1;
}

int RunConfig(const Options& options) {
    const auto config = LoadAndConfigure(options);
    PrintJson(warden::config::ToJson(config));
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    Options options;
    if (!ParseOptions(argc, argv, options)) {
        std::cerr << kUsage << std::endl;
        return 2;
    }

    try {
        if (options.command == "validate") {
            return RunValidate(options);
        }
        if (options.command == "run") {
            return RunExecute(options);
        }
        if (options.command == "health") {
            return RunHealth(options);
        }
        if (options.command == "config") {
            return RunConfig(options);
        }
    } catch (const warden::config::ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    }

    std::cerr << kUsage << std::endl;
    return 2;
}
