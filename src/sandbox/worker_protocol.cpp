#include "sandbox/worker_protocol.hpp"

#include "sandbox/types.hpp"

namespace warden::sandbox {

utils::Json ToJson(const WorkerRequest& request) {
    return {
        {"code", request.code},
        {"context", request.context},
        {"allowed_imports", request.allowed_imports},
        {"max_output_bytes", request.max_output_bytes}
    };
}

WorkerRequest WorkerRequestFromJson(const utils::Json& data) {
    if (!data.is_object()) {
        throw ProtocolError("worker request must be an object");
    }
    WorkerRequest request;
    if (!data.contains("code") || !data["code"].is_string()) {
        throw ProtocolError("worker request needs a string 'code'");
    }
    request.code = data["code"].get<std::string>();
    if (data.contains("context")) {
        if (!data["context"].is_object()) {
            throw ProtocolError("worker request 'context' must be an object");
        }
        request.context = data["context"];
    }
    if (data.contains("allowed_imports")) {
        if (!data["allowed_imports"].is_array()) {
            throw ProtocolError("worker request 'allowed_imports' must be an array");
        }
        for (const auto& item : data["allowed_imports"]) {
            if (!item.is_string()) {
                throw ProtocolError("worker request 'allowed_imports' must hold strings");
            }
            request.allowed_imports.push_back(item.get<std::string>());
        }
    }
    if (data.contains("max_output_bytes")) {
        if (!data["max_output_bytes"].is_number_unsigned()) {
            throw ProtocolError("worker request 'max_output_bytes' must be a positive integer");
        }
        request.max_output_bytes = data["max_output_bytes"].get<std::size_t>();
    }
    return request;
}

}  // namespace warden::sandbox
