#include "sandbox/sandbox_executor.hpp"

#include <csignal>
#include <string>

#include <gtest/gtest.h>

namespace warden::sandbox {
namespace {

SpawnSpec Shell(const std::string& script) {
    SpawnSpec spec;
    spec.program = "/bin/sh";
    spec.args = {"-c", script};
    spec.timeout = std::chrono::milliseconds(5000);
    spec.kill_grace = std::chrono::milliseconds(200);
    return spec;
}

TEST(SandboxExecutorTest, FeedsInputAndCollectsOutput) {
    SpawnSpec spec;
    spec.program = "/bin/cat";
    spec.input = "hello worker";
    const auto result = SandboxExecutor::Run(spec);
    ASSERT_TRUE(result.started) << result.spawn_error;
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello worker");
    EXPECT_FALSE(result.timed_out);
}

TEST(SandboxExecutorTest, FeedsInputLargerThanPipeBuffer) {
    SpawnSpec spec;
    spec.program = "/bin/cat";
    spec.input = std::string(512 * 1024, 'a');
    spec.max_capture_bytes = 1024 * 1024;
    const auto result = SandboxExecutor::Run(spec);
    ASSERT_TRUE(result.started);
    EXPECT_EQ(result.output.size(), spec.input.size());
    EXPECT_FALSE(result.output_overflow);
}

TEST(SandboxExecutorTest, SeparatesStreamsAndExitCode) {
    const auto result = SandboxExecutor::Run(Shell("echo out; echo err >&2; exit 3"));
    ASSERT_TRUE(result.started);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.term_signal, 0);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
}

TEST(SandboxExecutorTest, StartsWithEmptyEnvironment) {
    const auto result = SandboxExecutor::Run(Shell("echo \"${HOME:-unset}\""));
    EXPECT_EQ(result.output, "unset\n");
}

TEST(SandboxExecutorTest, PassesOnlyStandardDescriptors) {
    const auto result = SandboxExecutor::Run(
        Shell("for fd in 3 4 5 6 7 8 9; do if [ -e /proc/$$/fd/$fd ]; then echo open $fd; fi; done"));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "");
}

TEST(SandboxExecutorTest, KillsOnDeadline) {
    auto spec = Shell("exec /bin/sleep 30");
    spec.timeout = std::chrono::milliseconds(300);
    const auto result = SandboxExecutor::Run(spec);
    ASSERT_TRUE(result.started);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.term_signal, SIGTERM);
    EXPECT_LT(result.elapsed_ms, 3000);
}

TEST(SandboxExecutorTest, EscalatesToSigkillWhenTermIsIgnored) {
    auto spec = Shell("trap '' TERM; while :; do :; done");
    spec.timeout = std::chrono::milliseconds(300);
    spec.kill_grace = std::chrono::milliseconds(200);
    const auto result = SandboxExecutor::Run(spec);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_FALSE(result.killed_externally);
    EXPECT_LT(result.elapsed_ms, 3000);
}

TEST(SandboxExecutorTest, ReportsSignalsItDidNotSend) {
    const auto result = SandboxExecutor::Run(Shell("kill -KILL $$"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
    EXPECT_TRUE(result.killed_externally);
}

TEST(SandboxExecutorTest, BoundsCapturedOutput) {
    auto spec = Shell("i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done");
    spec.max_capture_bytes = 1000;
    const auto result = SandboxExecutor::Run(spec);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output.size(), 1000u);
    EXPECT_TRUE(result.output_overflow);
}

TEST(SandboxExecutorTest, ReportsSpawnFailure) {
    SpawnSpec spec;
    spec.program = "/nonexistent/warden_worker";
    const auto result = SandboxExecutor::Run(spec);
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.spawn_error.empty());
}

}  // namespace
}  // namespace warden::sandbox
