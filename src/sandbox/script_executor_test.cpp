#include "sandbox/script_executor.hpp"

#include <string>

#include <gtest/gtest.h>

#include "script/errors.hpp"

namespace warden::sandbox {
namespace {

constexpr std::size_t kMemoryBound = 64u * 1024 * 1024;

WorkerRequest Request(const std::string& code) {
    WorkerRequest request;
    request.code = code;
    request.allowed_imports = {"json", "math", "re", "string"};
    request.max_output_bytes = 1024;
    return request;
}

TEST(ScriptExecutorTest, ReturnsResultBinding) {
    const auto result = ScriptExecutor::Run(Request("result = 2 + 2\n"), kMemoryBound);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.return_value, 4);
    EXPECT_FALSE(result.return_value_truncated);
}

TEST(ScriptExecutorTest, ReturnsNullWithoutResultBinding) {
    const auto result = ScriptExecutor::Run(Request("print('hello')\n"), kMemoryBound);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.return_value.is_null());
    EXPECT_EQ(result.out.text, "hello\n");
}

TEST(ScriptExecutorTest, InjectsContext) {
    auto request = Request("result = {'total': sum(values), 'name': name}\n");
    request.context = {{"values", {1, 2, 3}}, {"name", "n"}};
    const auto result = ScriptExecutor::Run(request, kMemoryBound);
    ASSERT_TRUE(result.success) << result.err.text;
    EXPECT_EQ(result.return_value["total"], 6);
    EXPECT_EQ(result.return_value["name"], "n");
}

TEST(ScriptExecutorTest, ReportsRuntimeErrorsWithTypeAndLine) {
    const auto result = ScriptExecutor::Run(Request("x = 1\ny = x / 0\n"), kMemoryBound);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kRuntimeError);
    EXPECT_EQ(result.error->message, "ZeroDivisionError: division by zero (line 2)");
    EXPECT_NE(result.err.text.find("ZeroDivisionError"), std::string::npos);
}

TEST(ScriptExecutorTest, ReportsSyntaxErrorsAsRuntimeErrors) {
    const auto result = ScriptExecutor::Run(Request("x = (1\n"), kMemoryBound);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kRuntimeError);
    EXPECT_EQ(result.error->message.rfind("SyntaxError: ", 0), 0u);
}

TEST(ScriptExecutorTest, RefusesImportsEvenWithoutValidation) {
    const auto result = ScriptExecutor::Run(Request("import os\nresult = os.getcwd()\n"), kMemoryBound);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kSecurityViolation);
    EXPECT_EQ(result.error->message, "import of 'os' not allowed (line 1)");
}

TEST(ScriptExecutorTest, RefusesReservedAttributes) {
    const auto result = ScriptExecutor::Run(Request("x = ().__class__\n"), kMemoryBound);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kSecurityViolation);
}

TEST(ScriptExecutorTest, TruncatesOutput) {
    const auto result = ScriptExecutor::Run(Request("print('x' * 10_000_000)\n"), kMemoryBound);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.out.text.size(), 1024u);
    EXPECT_TRUE(result.out.truncated);
}

TEST(ScriptExecutorTest, MarksOversizedResult) {
    const auto result = ScriptExecutor::Run(Request("result = 'y' * 5000\n"), kMemoryBound);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.return_value, kTruncationMarker);
    EXPECT_TRUE(result.return_value_truncated);
}

TEST(ScriptExecutorTest, MarksUnrepresentableResult) {
    const auto result = ScriptExecutor::Run(Request("def f():\n    return 1\nresult = f\n"), kMemoryBound);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.return_value, kTruncationMarker);
    EXPECT_TRUE(result.return_value_truncated);
}

TEST(ScriptExecutorTest, LeavesMemoryExhaustionToTheCaller) {
    EXPECT_THROW(ScriptExecutor::Run(Request("s = 'x' * 1_000_000_000\n"), kMemoryBound),
                 script::ResourceExhausted);
}

TEST(ScriptExecutorTest, EveryRunStartsClean) {
    ScriptExecutor::Run(Request("leaked = 42\n"), kMemoryBound);
    const auto result = ScriptExecutor::Run(Request("result = leaked\n"), kMemoryBound);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->message.rfind("NameError", 0), 0u);
}

TEST(ScriptExecutorTest, SelfCheckSucceeds) {
    EXPECT_NO_THROW(ScriptExecutor::SelfCheck(kMemoryBound));
}

TEST(SanitizeMessageTest, HidesHostPaths) {
    EXPECT_EQ(SanitizeMessage("cannot read /usr/lib/python3/site.py"), "cannot read <path>");
    EXPECT_EQ(SanitizeMessage("ratio 1/2"), "ratio 1/2");
}

TEST(SanitizeMessageTest, BoundsLength) {
    const auto text = SanitizeMessage(std::string(2000, 'e'));
    EXPECT_EQ(text.size(), 515u);
    EXPECT_EQ(text.substr(512), "...");
}

}  // namespace
}  // namespace warden::sandbox
