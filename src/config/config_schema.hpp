#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace warden::config {

struct SandboxConfig {
    std::vector<std::string> allowed_imports = {"functools", "itertools", "json", "math", "re", "string"};
    std::size_t max_code_bytes = 64 * 1024;
    std::size_t max_ast_nodes = 5000;
    int max_cpu_seconds = 5;
    std::size_t max_memory_bytes = 256u * 1024 * 1024;
    std::size_t max_output_bytes = 64 * 1024;
    int max_concurrent_executions = 4;
    std::string shared_secret;
    std::string worker_path;
    int queue_timeout_ms = 2000;
    int default_timeout_seconds = 5;
    int max_timeout_seconds = 30;
    int kill_grace_ms = 500;
    int max_processes = 0;
    int max_open_files = 16;
    std::size_t max_stack_bytes = 8u * 1024 * 1024;
    std::size_t max_context_bytes = 1024 * 1024;
    int max_context_depth = 4;
    std::size_t max_request_bytes = 2u * 1024 * 1024;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 8080;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    ServerConfig server;
    LoggingConfig logging;
};

}  // namespace warden::config
