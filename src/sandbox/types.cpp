#include "sandbox/types.hpp"

#include <utility>

namespace warden::sandbox {
namespace {

template <typename Error>
const utils::Json& Require(const utils::Json& data, const char* key) {
    if (!data.contains(key)) {
        throw Error(std::string("missing field '") + key + "'");
    }
    return data[key];
}

CapturedStream StreamFromJson(const utils::Json& data, const char* text_key, const char* flag_key) {
    CapturedStream stream;
    const auto& text = Require<ProtocolError>(data, text_key);
    if (!text.is_string()) {
        throw ProtocolError(std::string("field '") + text_key + "' must be a string");
    }
    stream.text = text.get<std::string>();
    if (data.contains(flag_key) && data[flag_key].is_boolean()) {
        stream.truncated = data[flag_key].get<bool>();
    }
    return stream;
}

}  // namespace

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kTimedOut: return "TimedOut";
        case ErrorKind::kResourceLimitExceeded: return "ResourceLimitExceeded";
        case ErrorKind::kRuntimeError: return "RuntimeError";
        case ErrorKind::kSecurityViolation: return "SecurityViolation";
        case ErrorKind::kInternalError: return "InternalError";
    }
    return "InternalError";
}

std::optional<ErrorKind> ParseErrorKind(std::string_view value) {
    for (const auto kind : {ErrorKind::kTimedOut, ErrorKind::kResourceLimitExceeded,
                            ErrorKind::kRuntimeError, ErrorKind::kSecurityViolation,
                            ErrorKind::kInternalError}) {
        if (value == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

ExecutionResult ExecutionResult::Failure(ErrorKind kind, std::string message) {
    ExecutionResult result;
    result.success = false;
    result.error = ExecutionError{kind, std::move(message)};
    return result;
}

utils::Json ToJson(const ExecutionResult& result) {
    utils::Json data = utils::Json::object();
    data["success"] = result.success;
    data["return_value"] = result.return_value;
    data["return_value_truncated"] = result.return_value_truncated;
    data["stdout"] = result.out.text;
    data["stdout_truncated"] = result.out.truncated;
    data["stderr"] = result.err.text;
    data["stderr_truncated"] = result.err.truncated;
    if (result.error) {
        data["error"] = {{"kind", ToString(result.error->kind)}, {"message", result.error->message}};
    } else {
        data["error"] = nullptr;
    }
    data["execution_time_ms"] = result.execution_time_ms;
    data["memory_used_mb"] = result.memory_used_mb;
    return data;
}

ExecutionResult ResultFromJson(const utils::Json& data) {
    if (!data.is_object()) {
        throw ProtocolError("result document must be an object");
    }
    ExecutionResult result;
    const auto& success = Require<ProtocolError>(data, "success");
    if (!success.is_boolean()) {
        throw ProtocolError("field 'success' must be a boolean");
    }
    result.success = success.get<bool>();
    result.return_value = data.contains("return_value") ? data["return_value"] : utils::Json();
    if (data.contains("return_value_truncated") && data["return_value_truncated"].is_boolean()) {
        result.return_value_truncated = data["return_value_truncated"].get<bool>();
    }
    result.out = StreamFromJson(data, "stdout", "stdout_truncated");
    result.err = StreamFromJson(data, "stderr", "stderr_truncated");

    if (data.contains("error") && !data["error"].is_null()) {
        const auto& error = data["error"];
        if (!error.is_object() || !error.contains("kind") || !error["kind"].is_string()) {
            throw ProtocolError("field 'error' is malformed");
        }
        const auto kind = ParseErrorKind(error["kind"].get<std::string>());
        if (!kind) {
            throw ProtocolError("unknown error kind '" + error["kind"].get<std::string>() + "'");
        }
        std::string message;
        if (error.contains("message") && error["message"].is_string()) {
            message = error["message"].get<std::string>();
        }
        result.error = ExecutionError{*kind, std::move(message)};
    }
    if (result.success == result.error.has_value()) {
        throw ProtocolError("'success' disagrees with 'error'");
    }
    if (data.contains("execution_time_ms") && data["execution_time_ms"].is_number_integer()) {
        result.execution_time_ms = data["execution_time_ms"].get<std::int64_t>();
    }
    if (data.contains("memory_used_mb") && data["memory_used_mb"].is_number()) {
        result.memory_used_mb = data["memory_used_mb"].get<double>();
    }
    return result;
}

ExecutionRequest RequestFromJson(const utils::Json& data) {
    if (!data.is_object()) {
        throw InvalidRequestError("request body must be a JSON object");
    }
    ExecutionRequest request;
    const auto& code = Require<InvalidRequestError>(data, "code");
    if (!code.is_string()) {
        throw InvalidRequestError("field 'code' must be a string");
    }
    request.code = code.get<std::string>();

    if (data.contains("context") && !data["context"].is_null()) {
        if (!data["context"].is_object()) {
            throw InvalidRequestError("field 'context' must be an object");
        }
        request.context = data["context"];
    }
    if (data.contains("timeout_seconds") && !data["timeout_seconds"].is_null()) {
        const auto& timeout = data["timeout_seconds"];
        if (!timeout.is_number()) {
            throw InvalidRequestError("field 'timeout_seconds' must be a number");
        }
        const auto seconds = timeout.get<double>();
        if (!(seconds > 0) || seconds > 86400.0) {
            throw InvalidRequestError("field 'timeout_seconds' is out of range");
        }
        request.timeout_seconds = static_cast<int>(seconds < 1.0 ? 1.0 : seconds);
    }
    if (data.contains("max_output_bytes") && !data["max_output_bytes"].is_null()) {
        const auto& bytes = data["max_output_bytes"];
        if (!bytes.is_number_integer() || bytes.get<std::int64_t>() <= 0) {
            throw InvalidRequestError("field 'max_output_bytes' must be a positive integer");
        }
        request.max_output_bytes = bytes.get<std::size_t>();
    }
    return request;
}

std::string Dump(const utils::Json& data) {
    return data.dump(-1, ' ', false, utils::Json::error_handler_t::replace);
}

}  // namespace warden::sandbox
