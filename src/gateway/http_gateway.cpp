#include "gateway/http_gateway.hpp"

#include <algorithm>
#include <cctype>

#include "sandbox/types.hpp"
#include "utils/json.hpp"

namespace warden::gateway {
namespace {

std::string Lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

HttpResponse JsonResponse(int status, const utils::Json& body) {
    HttpResponse response;
    response.status = status;
    response.body = sandbox::Dump(body);
    return response;
}

HttpResponse ErrorResponse(int status, const std::string& message) {
    return JsonResponse(status, {{"error", message}});
}

utils::Json ValidationBody(const validator::ValidationResult& validation) {
    utils::Json details = utils::Json::array();
    for (const auto& issue : validation.errors) {
        details.push_back({{"line", issue.line}, {"column", issue.column}, {"message", issue.message}});
    }
    return {{"valid", false}, {"errors", validation.Messages()}, {"details", details}};
}

}  // namespace

std::optional<std::string> FindHeader(const HttpRequest& request, const std::string& name) {
    const auto wanted = Lowercase(name);
    for (const auto& [key, value] : request.headers) {
        if (Lowercase(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

int StatusFor(coordinator::Disposition disposition) {
    switch (disposition) {
        case coordinator::Disposition::kExecuted: return 200;
        case coordinator::Disposition::kRejectedValidation: return 400;
        case coordinator::Disposition::kRejectedAuth: return 401;
        case coordinator::Disposition::kRejectedInvalidRequest: return 422;
        case coordinator::Disposition::kRejectedBusy: return 429;
        case coordinator::Disposition::kUnavailable: return 503;
        case coordinator::Disposition::kInternalError: return 500;
    }
    return 500;
}

HttpGateway::HttpGateway(coordinator::Coordinator& coordinator, std::size_t max_request_bytes)
    : coordinator_(coordinator), max_request_bytes_(max_request_bytes) {}

HttpResponse HttpGateway::Handle(const HttpRequest& request) {
    if (request.path == "/execute") {
        if (request.method != "POST") {
            return ErrorResponse(405, "method not allowed");
        }
        return HandleExecute(request);
    }
    if (request.path == "/health") {
        if (request.method != "GET") {
            return ErrorResponse(405, "method not allowed");
        }
        return HandleHealth();
    }
    return ErrorResponse(404, "not found");
}

HttpResponse HttpGateway::HandleExecute(const HttpRequest& request) {
    if (request.body.size() > max_request_bytes_) {
        return ErrorResponse(413, "request body too large");
    }
    const auto credential = coordinator::ExtractCredential(FindHeader(request, "X-Sandbox-Secret"),
                                                           FindHeader(request, "Authorization"));
    // The body is not read for callers without the secret.
    if (!coordinator_.Authenticate(credential)) {
        return ErrorResponse(StatusFor(coordinator::Disposition::kRejectedAuth), "invalid credential");
    }

    sandbox::ExecutionRequest execution;
    try {
        execution = sandbox::RequestFromJson(utils::Json::parse(request.body));
    } catch (const utils::Json::parse_error&) {
        return ErrorResponse(422, "request body is not valid JSON");
    } catch (const sandbox::InvalidRequestError& ex) {
        return ErrorResponse(422, ex.what());
    }

    const auto response = coordinator_.Execute(execution, credential);
    const int status = StatusFor(response.disposition);
    switch (response.disposition) {
        case coordinator::Disposition::kExecuted:
            return JsonResponse(status, sandbox::ToJson(*response.result));
        case coordinator::Disposition::kRejectedValidation:
            return JsonResponse(status, ValidationBody(*response.validation));
        default:
            return ErrorResponse(status, response.message);
    }
}

HttpResponse HttpGateway::HandleHealth() const {
    const auto health = coordinator_.Health();
    return JsonResponse(health.healthy ? 200 : 503, coordinator::ToJson(health));
}

}  // namespace warden::gateway
