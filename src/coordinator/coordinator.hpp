#pragma once

#include <atomic>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "coordinator/auth.hpp"
#include "coordinator/concurrency_limiter.hpp"
#include "coordinator/execution_stats.hpp"
#include "coordinator/lifecycle.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "sandbox/types.hpp"
#include "utils/json.hpp"
#include "validator/validator.hpp"

namespace warden::coordinator {

enum class Disposition {
    kExecuted,
    kRejectedAuth,
    kRejectedInvalidRequest,
    kRejectedValidation,
    kRejectedBusy,
    kUnavailable,
    kInternalError
};

const char* ToString(Disposition disposition);

struct ExecuteResponse {
    Disposition disposition = Disposition::kInternalError;
    ExecutionState final_state = ExecutionState::kFailedInternal;
    // Present when a worker ran, and for internal failures after dispatch.
    std::optional<sandbox::ExecutionResult> result;
    // Present for validation rejections.
    std::optional<validator::ValidationResult> validation;
    // Caller-safe reason for rejections.
    std::string message;
};

struct HealthStatus {
    bool healthy = false;
    bool sandbox_initialized = false;
};

utils::Json ToJson(const HealthStatus& health);

// Owns the concurrency bound and turns requests into worker runs. Every call
// to Execute returns a complete response; nothing about one execution is
// fatal to the coordinator.
class Coordinator {
public:
    explicit Coordinator(config::SandboxConfig config);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Spawns a self-check worker. Until it succeeds executions are refused.
    bool Initialize();

    // Checks a credential without touching the request. A refusal is
    // counted the same way Execute counts one.
    bool Authenticate(const std::optional<std::string>& credential);

    ExecuteResponse Execute(const sandbox::ExecutionRequest& request, const std::optional<std::string>& credential);

    // Validation only; never takes a concurrency slot.
    validator::ValidationResult Validate(const std::string& code) const;

    HealthStatus Health() const;
    StatsSnapshot Stats() const;
    const ConcurrencyLimiter& limiter() const { return limiter_; }
    const config::SandboxConfig& config() const { return config_; }

private:
    ExecuteResponse Dispatch(const sandbox::ExecutionRequest& request, const std::optional<std::string>& credential,
                             ExecutionLifecycle& lifecycle, std::uint64_t id);
    sandbox::ExecutionResult RunWorker(const sandbox::ExecutionRequest& request, const utils::Json& context,
                                       ExecutionLifecycle& lifecycle, std::uint64_t id);
    sandbox::ExecutionResult Normalize(const sandbox::ExecResult& outcome, int timeout_seconds,
                                       std::size_t max_output_bytes, ExecutionLifecycle& lifecycle,
                                       std::uint64_t id) const;

    config::SandboxConfig config_;
    SecretAuthenticator authenticator_;
    validator::Validator validator_;
    ConcurrencyLimiter limiter_;
    ExecutionStats stats_;
    std::atomic<bool> sandbox_initialized_{false};
    std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace warden::coordinator
