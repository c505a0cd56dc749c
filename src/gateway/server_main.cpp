#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "coordinator/coordinator.hpp"
#include "gateway/http_gateway.hpp"
#include "httplib.h"
#include "utils/logging.hpp"

namespace {

using warden::utils::Log;
using warden::utils::LogLevel;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

warden::gateway::HttpRequest ToGatewayRequest(const httplib::Request& req) {
    warden::gateway::HttpRequest request;
    request.method = req.method;
    request.path = req.path;
    request.body = req.body;
    for (const auto& [name, value] : req.headers) {
        request.headers.emplace(name, value);
    }
    return request;
}

void Respond(warden::gateway::HttpGateway& gateway, const httplib::Request& req, httplib::Response& res) {
    const auto response = gateway.Handle(ToGatewayRequest(req));
    res.status = response.status;
    res.set_content(response.body, response.content_type.c_str());
}

}  // namespace

int main(int argc, char** argv) {
    std::optional<std::filesystem::path> config_path;
    if (argc == 3 && std::string(argv[1]) == "--config") {
        config_path = std::filesystem::path(argv[2]);
    } else if (argc != 1) {
        std::cerr << "Usage: warden_server [--config path]" << std::endl;
        return 2;
    }

    warden::config::Config config;
    try {
        config = warden::config::LoadConfig(config_path);
    } catch (const warden::config::ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    }

    warden::utils::LogConfig log_config;
    if (!warden::utils::ParseLogLevel(config.logging.level, log_config.min_level)) {
        std::cerr << "Configuration error: unknown log level " << config.logging.level << std::endl;
        return 1;
    }
    warden::utils::ConfigureLogging(log_config);

    warden::coordinator::Coordinator coordinator(config.sandbox);
    // A failed self-check leaves the server up but reporting degraded health.
    if (!coordinator.Initialize()) {
        warden::utils::Log(warden::utils::LogLevel::kWarn, "server", "starting degraded",
                           {{"worker", config.sandbox.worker_path}});
    }
    warden::gateway::HttpGateway gateway(coordinator, config.sandbox.max_request_bytes);

    httplib::Server http_server;
    http_server.set_payload_max_length(config.sandbox.max_request_bytes + 1);
    const auto handler = [&gateway](const httplib::Request& req, httplib::Response& res) {
        Respond(gateway, req, res);
    };
    http_server.Post("/execute", handler);
    http_server.Get("/health", handler);
    http_server.Get(R"(/.*)", handler);
    http_server.Post(R"(/.*)", handler);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    const std::string host = config.server.host;
    const int port = config.server.port;
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        if (!http_server.listen(host, port)) {
            Log(LogLevel::kError, "server", "failed to listen", {{"host", host}, {"port", std::to_string(port)}});
            listen_failed.store(true);
        }
    });

    Log(LogLevel::kInfo, "server", "warden server started", {{"host", host}, {"port", std::to_string(port)}});
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    Log(LogLevel::kInfo, "server", "warden server stopped");
    return listen_failed.load() ? 1 : 0;
}
