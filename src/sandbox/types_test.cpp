#include "sandbox/types.hpp"

#include <gtest/gtest.h>

#include "sandbox/worker_protocol.hpp"

namespace warden::sandbox {
namespace {

TEST(ExecutionResultTest, SerializesEveryField) {
    ExecutionResult result;
    result.success = true;
    result.return_value = 4;
    result.out = {"hi\n", false};
    result.err = {"", false};
    result.execution_time_ms = 12;
    result.memory_used_mb = 3.5;

    const auto json = ToJson(result);
    EXPECT_EQ(json["success"], true);
    EXPECT_EQ(json["return_value"], 4);
    EXPECT_EQ(json["return_value_truncated"], false);
    EXPECT_EQ(json["stdout"], "hi\n");
    EXPECT_EQ(json["stdout_truncated"], false);
    EXPECT_EQ(json["stderr"], "");
    EXPECT_TRUE(json["error"].is_null());
    EXPECT_EQ(json["execution_time_ms"], 12);
    EXPECT_DOUBLE_EQ(json["memory_used_mb"].get<double>(), 3.5);
}

TEST(ExecutionResultTest, ReadsWorkerDocument) {
    const auto result = ResultFromJson(utils::Json::parse(R"({
        "success": false, "return_value": null, "stdout": "", "stdout_truncated": false,
        "stderr": "NameError: x\n", "stderr_truncated": true,
        "error": {"kind": "RuntimeError", "message": "NameError: x"},
        "execution_time_ms": 3, "memory_used_mb": 1.25})"));
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kRuntimeError);
    EXPECT_EQ(result.error->message, "NameError: x");
    EXPECT_TRUE(result.err.truncated);
    EXPECT_EQ(result.execution_time_ms, 3);
}

TEST(ExecutionResultTest, RejectsMalformedWorkerDocuments) {
    EXPECT_THROW(ResultFromJson(utils::Json::array()), ProtocolError);
    EXPECT_THROW(ResultFromJson(utils::Json::parse(R"({"stdout": "", "stderr": ""})")), ProtocolError);
    EXPECT_THROW(ResultFromJson(utils::Json::parse(R"({"success": true, "stderr": ""})")), ProtocolError);
    EXPECT_THROW(ResultFromJson(utils::Json::parse(
                     R"({"success": false, "stdout": "", "stderr": "", "error": {"kind": "Bogus"}})")),
                 ProtocolError);
}

TEST(ExecutionResultTest, RequiresSuccessToAgreeWithError) {
    EXPECT_THROW(ResultFromJson(utils::Json::parse(
                     R"({"success": true, "stdout": "", "stderr": "", "error": {"kind": "RuntimeError"}})")),
                 ProtocolError);
    EXPECT_THROW(ResultFromJson(utils::Json::parse(R"({"success": false, "stdout": "", "stderr": ""})")),
                 ProtocolError);
}

TEST(ErrorKindTest, ParsesItsOwnNames) {
    for (const auto kind : {ErrorKind::kTimedOut, ErrorKind::kResourceLimitExceeded, ErrorKind::kRuntimeError,
                            ErrorKind::kSecurityViolation, ErrorKind::kInternalError}) {
        EXPECT_EQ(ParseErrorKind(ToString(kind)), kind);
    }
    EXPECT_FALSE(ParseErrorKind("timeout").has_value());
}

TEST(ExecutionRequestTest, ReadsOptionalFields) {
    const auto request = RequestFromJson(utils::Json::parse(
        R"({"code": "result = 1", "context": {"n": 2}, "timeout_seconds": 0.2, "max_output_bytes": 100})"));
    EXPECT_EQ(request.code, "result = 1");
    EXPECT_EQ(request.context["n"], 2);
    EXPECT_EQ(request.timeout_seconds, 1);
    EXPECT_EQ(request.max_output_bytes, 100u);
}

TEST(ExecutionRequestTest, DefaultsMissingContextToEmptyObject) {
    const auto request = RequestFromJson(utils::Json::parse(R"({"code": "", "context": null})"));
    EXPECT_TRUE(request.context.is_object());
    EXPECT_TRUE(request.context.empty());
    EXPECT_FALSE(request.timeout_seconds.has_value());
}

TEST(ExecutionRequestTest, RejectsMalformedBodies) {
    EXPECT_THROW(RequestFromJson(utils::Json::parse("[]")), InvalidRequestError);
    EXPECT_THROW(RequestFromJson(utils::Json::parse(R"({"context": {}})")), InvalidRequestError);
    EXPECT_THROW(RequestFromJson(utils::Json::parse(R"({"code": 5})")), InvalidRequestError);
    EXPECT_THROW(RequestFromJson(utils::Json::parse(R"({"code": "", "context": [1]})")), InvalidRequestError);
    EXPECT_THROW(RequestFromJson(utils::Json::parse(R"({"code": "", "timeout_seconds": -1})")),
                 InvalidRequestError);
    EXPECT_THROW(RequestFromJson(utils::Json::parse(R"({"code": "", "timeout_seconds": "5"})")),
                 InvalidRequestError);
    EXPECT_THROW(RequestFromJson(utils::Json::parse(R"({"code": "", "max_output_bytes": 0})")),
                 InvalidRequestError);
}

TEST(DumpTest, ReplacesInvalidUtf8) {
    const utils::Json data = std::string("a\xff");
    EXPECT_NO_THROW(Dump(data));
    EXPECT_EQ(Dump(data), "\"a\xEF\xBF\xBD\"");
}

TEST(WorkerProtocolTest, CarriesRequestFields) {
    WorkerRequest request;
    request.code = "result = 1";
    request.context = {{"n", 1}};
    request.allowed_imports = {"json"};
    request.max_output_bytes = 99;

    const auto parsed = WorkerRequestFromJson(ToJson(request));
    EXPECT_EQ(parsed.code, request.code);
    EXPECT_EQ(parsed.context, request.context);
    EXPECT_EQ(parsed.allowed_imports, request.allowed_imports);
    EXPECT_EQ(parsed.max_output_bytes, 99u);
}

TEST(WorkerProtocolTest, NeverCarriesASecret) {
    const auto json = ToJson(WorkerRequest{});
    for (const auto& [key, value] : json.items()) {
        EXPECT_EQ(key.find("secret"), std::string::npos);
    }
}

TEST(WorkerProtocolTest, RejectsMalformedRequests) {
    EXPECT_THROW(WorkerRequestFromJson(utils::Json::parse(R"({"context": {}})")), ProtocolError);
    EXPECT_THROW(WorkerRequestFromJson(utils::Json::parse(R"({"code": "", "allowed_imports": "json"})")),
                 ProtocolError);
    EXPECT_THROW(WorkerRequestFromJson(utils::Json::parse(R"({"code": "", "max_output_bytes": -3})")),
                 ProtocolError);
}

}  // namespace
}  // namespace warden::sandbox
