#pragma once

#include <map>
#include <optional>
#include <string>

#include "coordinator/coordinator.hpp"

namespace warden::gateway {

struct HttpRequest {
    std::string method;
    std::string path;
    // Keys are matched case-insensitively.
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

std::optional<std::string> FindHeader(const HttpRequest& request, const std::string& name);

int StatusFor(coordinator::Disposition disposition);

// Maps HTTP requests onto the coordinator. Knows nothing about sockets, so
// any server library can drive it.
class HttpGateway {
public:
    HttpGateway(coordinator::Coordinator& coordinator, std::size_t max_request_bytes);

    HttpResponse Handle(const HttpRequest& request);

private:
    HttpResponse HandleExecute(const HttpRequest& request);
    HttpResponse HandleHealth() const;

    coordinator::Coordinator& coordinator_;
    std::size_t max_request_bytes_;
};

}  // namespace warden::gateway
