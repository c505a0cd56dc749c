#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "utils/json.hpp"

namespace warden::sandbox {

// Names beginning with this prefix are never reachable from scripts.
inline constexpr char kReservedPrefix[] = "_";

// Stands in for a result that could not be serialized within bounds.
inline constexpr char kTruncationMarker[] = "<truncated>";

enum class ErrorKind {
    kTimedOut,
    kResourceLimitExceeded,
    kRuntimeError,
    kSecurityViolation,
    kInternalError
};

const char* ToString(ErrorKind kind);
std::optional<ErrorKind> ParseErrorKind(std::string_view value);

struct ExecutionError {
    ErrorKind kind = ErrorKind::kInternalError;
    std::string message;
};

struct CapturedStream {
    std::string text;
    bool truncated = false;
};

struct ExecutionResult {
    bool success = false;
    utils::Json return_value;
    bool return_value_truncated = false;
    CapturedStream out;
    CapturedStream err;
    std::optional<ExecutionError> error;
    std::int64_t execution_time_ms = 0;
    double memory_used_mb = 0.0;

    static ExecutionResult Failure(ErrorKind kind, std::string message);
};

struct ExecutionRequest {
    std::string code;
    utils::Json context = utils::Json::object();
    std::optional<int> timeout_seconds;
    std::optional<std::size_t> max_output_bytes;
};

// The body of an execution request is malformed.
class InvalidRequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A worker document did not have the expected shape.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

utils::Json ToJson(const ExecutionResult& result);
// Throws ProtocolError when a field is missing or has the wrong type.
ExecutionResult ResultFromJson(const utils::Json& data);

// Throws InvalidRequestError.
ExecutionRequest RequestFromJson(const utils::Json& data);

// Serializes without throwing on invalid UTF-8 from script strings.
std::string Dump(const utils::Json& data);

}  // namespace warden::sandbox
