#include "coordinator/coordinator.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "utils/logging.hpp"

namespace warden::coordinator {
namespace {

using namespace std::chrono_literals;

constexpr char kSecret[] = "test-secret";

config::SandboxConfig TestConfig() {
    config::SandboxConfig config;
    config.shared_secret = kSecret;
    config.worker_path = WARDEN_WORKER_PATH;
    config.max_output_bytes = 4096;
    config.kill_grace_ms = 300;
    return config;
}

sandbox::ExecutionRequest Request(const std::string& code) {
    sandbox::ExecutionRequest request;
    request.code = code;
    return request;
}

class CoordinatorTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { utils::ConfigureLogging({utils::LogLevel::kError}); }

    void SetUp() override { ASSERT_TRUE(coordinator_.Initialize()); }

    ExecuteResponse Execute(const std::string& code) { return coordinator_.Execute(Request(code), kSecret); }

    Coordinator coordinator_{TestConfig()};
};

TEST(CoordinatorStartupTest, RefusesWorkBeforeInitialize) {
    Coordinator coordinator(TestConfig());
    EXPECT_FALSE(coordinator.Health().healthy);
    const auto response = coordinator.Execute(Request("result = 1\n"), std::string(kSecret));
    EXPECT_EQ(response.disposition, Disposition::kUnavailable);
    EXPECT_EQ(response.message, "sandbox unavailable");
    EXPECT_EQ(coordinator.Stats().workers_spawned, 0u);
}

TEST(CoordinatorStartupTest, SelfCheckFailsForMissingWorker) {
    auto config = TestConfig();
    config.worker_path = "/nonexistent/warden_worker";
    Coordinator coordinator(config);
    EXPECT_FALSE(coordinator.Initialize());
    EXPECT_FALSE(coordinator.Health().sandbox_initialized);
    EXPECT_EQ(ToJson(coordinator.Health())["status"], "degraded");
}

TEST_F(CoordinatorTest, ReportsHealthyAfterSelfCheck) {
    EXPECT_TRUE(coordinator_.Health().healthy);
    EXPECT_EQ(ToJson(coordinator_.Health())["status"], "healthy");
}

TEST_F(CoordinatorTest, RunsScript) {
    const auto response = Execute("result = 2 + 2\n");
    ASSERT_EQ(response.disposition, Disposition::kExecuted) << response.message;
    EXPECT_EQ(response.final_state, ExecutionState::kCompleted);
    ASSERT_TRUE(response.result.has_value());
    EXPECT_TRUE(response.result->success);
    EXPECT_EQ(response.result->return_value, 4);
    EXPECT_GE(response.result->execution_time_ms, 0);
}

TEST_F(CoordinatorTest, PassesContext) {
    auto request = Request("print(greeting)\nresult = len(items)\n");
    request.context = {{"greeting", "hi"}, {"items", {1, 2, 3}}};
    const auto response = coordinator_.Execute(request, kSecret);
    ASSERT_TRUE(response.result.has_value());
    EXPECT_EQ(response.result->return_value, 3);
    EXPECT_EQ(response.result->out.text, "hi\n");
}

TEST_F(CoordinatorTest, RejectsBadCredentialBeforeSpawning) {
    const auto response = coordinator_.Execute(Request("result = 1\n"), std::string("wrong"));
    EXPECT_EQ(response.disposition, Disposition::kRejectedAuth);
    EXPECT_EQ(response.message, "invalid credential");
    EXPECT_EQ(coordinator_.Execute(Request("result = 1\n"), std::nullopt).disposition, Disposition::kRejectedAuth);
    EXPECT_EQ(coordinator_.Stats().workers_spawned, 0u);
}

TEST_F(CoordinatorTest, AuthenticateCountsRefusals) {
    EXPECT_TRUE(coordinator_.Authenticate(std::string(kSecret)));
    EXPECT_FALSE(coordinator_.Authenticate(std::string("wrong")));
    EXPECT_FALSE(coordinator_.Authenticate(std::nullopt));
    EXPECT_EQ(coordinator_.Stats().rejected_auth, 2u);
    EXPECT_EQ(coordinator_.Stats().requests, 2u);
}

TEST_F(CoordinatorTest, RejectsInvalidContext) {
    auto request = Request("result = 1\n");
    request.context = {{"__class__", 1}};
    const auto response = coordinator_.Execute(request, kSecret);
    EXPECT_EQ(response.disposition, Disposition::kRejectedInvalidRequest);
    EXPECT_EQ(response.final_state, ExecutionState::kRejectedInvalidRequest);
    EXPECT_EQ(coordinator_.Stats().workers_spawned, 0u);
}

TEST_F(CoordinatorTest, RejectsForbiddenImportWithoutSpawning) {
    const auto response = Execute("import os\nresult = os.listdir('/')\n");
    EXPECT_EQ(response.disposition, Disposition::kRejectedValidation);
    ASSERT_TRUE(response.validation.has_value());
    EXPECT_FALSE(response.validation->valid);
    EXPECT_EQ(response.validation->Messages().front(), "import of 'os' not allowed");
    EXPECT_EQ(coordinator_.Stats().workers_spawned, 0u);
}

TEST_F(CoordinatorTest, RejectsOversizedCodeWithoutSpawning) {
    const auto response = Execute(std::string(coordinator_.config().max_code_bytes + 1, '#'));
    EXPECT_EQ(response.disposition, Disposition::kRejectedValidation);
    EXPECT_EQ(coordinator_.Stats().workers_spawned, 0u);
}

TEST_F(CoordinatorTest, TruncatesOutput) {
    const auto response = Execute("print('x' * 10_000_000)\n");
    ASSERT_TRUE(response.result.has_value());
    EXPECT_TRUE(response.result->success);
    EXPECT_EQ(response.result->out.text.size(), 4096u);
    EXPECT_TRUE(response.result->out.truncated);
}

TEST_F(CoordinatorTest, ReportsRuntimeFailures) {
    const auto response = Execute("x = [1]\ny = x[5]\n");
    EXPECT_EQ(response.disposition, Disposition::kExecuted);
    EXPECT_EQ(response.final_state, ExecutionState::kRuntimeFailed);
    ASSERT_TRUE(response.result && response.result->error);
    EXPECT_EQ(response.result->error->kind, sandbox::ErrorKind::kRuntimeError);
    EXPECT_EQ(response.result->error->message.rfind("IndexError", 0), 0u);
}

TEST_F(CoordinatorTest, ReportsSecurityViolationsFromTheWorker) {
    const auto response = Execute("for item in len:\n    pass\n");
    EXPECT_EQ(response.final_state, ExecutionState::kRuntimeFailed);
    ASSERT_TRUE(response.result && response.result->error);
    EXPECT_EQ(response.result->error->kind, sandbox::ErrorKind::kSecurityViolation);
}

TEST_F(CoordinatorTest, EnforcesTimeout) {
    auto request = Request("while True:\n    pass\n");
    request.timeout_seconds = 1;
    const auto started = std::chrono::steady_clock::now();
    const auto response = coordinator_.Execute(request, kSecret);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(response.final_state, ExecutionState::kTimedOut);
    ASSERT_TRUE(response.result && response.result->error);
    EXPECT_EQ(response.result->error->kind, sandbox::ErrorKind::kTimedOut);
    EXPECT_EQ(response.result->error->message, "execution exceeded 1s timeout");
    EXPECT_LT(elapsed, 3s);
}

TEST_F(CoordinatorTest, ClampsRequestedTimeout) {
    auto request = Request("while True:\n    pass\n");
    request.timeout_seconds = 0;
    const auto response = coordinator_.Execute(request, kSecret);
    ASSERT_TRUE(response.result && response.result->error);
    EXPECT_EQ(response.result->error->message, "execution exceeded 1s timeout");
}

TEST_F(CoordinatorTest, KeepsNoStateBetweenRuns) {
    ASSERT_TRUE(Execute("counter = 41\nresult = counter\n").result->success);
    const auto response = Execute("result = counter + 1\n");
    ASSERT_TRUE(response.result && response.result->error);
    EXPECT_EQ(response.result->error->message.rfind("NameError", 0), 0u);
}

TEST_F(CoordinatorTest, SurvivesManyFailures) {
    for (int i = 0; i < 5; ++i) {
        Execute("result = 1 / 0\n");
    }
    EXPECT_TRUE(coordinator_.Health().healthy);
    EXPECT_EQ(Execute("result = 'ok'\n").result->return_value, "ok");
    EXPECT_EQ(coordinator_.Stats().runtime_failed, 5u);
    EXPECT_EQ(coordinator_.Stats().running, 0u);
}

TEST(CoordinatorConcurrencyTest, NeverRunsMoreWorkersThanConfigured) {
    auto config = TestConfig();
    config.max_concurrent_executions = 2;
    config.queue_timeout_ms = 30000;
    Coordinator coordinator(config);
    ASSERT_TRUE(coordinator.Initialize());

    std::vector<std::thread> threads;
    std::vector<Disposition> dispositions(6);
    for (std::size_t i = 0; i < dispositions.size(); ++i) {
        threads.emplace_back([&coordinator, &dispositions, i] {
            auto request = Request("x = 0\nfor i in range(20000):\n    x += i\nresult = x\n");
            dispositions[i] = coordinator.Execute(request, std::string(kSecret)).disposition;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (auto disposition : dispositions) {
        EXPECT_EQ(disposition, Disposition::kExecuted);
    }
    EXPECT_LE(coordinator.limiter().MaxObserved(), 2u);
    EXPECT_EQ(coordinator.Stats().workers_spawned, 6u);
}

TEST(CoordinatorConcurrencyTest, RejectsWhenQueueWaitExpires) {
    auto config = TestConfig();
    config.max_concurrent_executions = 1;
    config.queue_timeout_ms = 50;
    Coordinator coordinator(config);
    ASSERT_TRUE(coordinator.Initialize());

    std::thread busy([&coordinator] {
        auto request = Request("while True:\n    pass\n");
        request.timeout_seconds = 2;
        coordinator.Execute(request, std::string(kSecret));
    });
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (coordinator.limiter().Running() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    if (coordinator.limiter().Running() == 0) {
        busy.join();
        FAIL() << "long-running execution never took the slot";
    }
    const auto response = coordinator.Execute(Request("result = 1\n"), std::string(kSecret));
    busy.join();

    EXPECT_EQ(response.disposition, Disposition::kRejectedBusy);
    EXPECT_EQ(response.final_state, ExecutionState::kRejectedBusy);
    EXPECT_EQ(coordinator.Stats().rejected_busy, 1u);
}

}  // namespace
}  // namespace warden::coordinator
