#include "coordinator/coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <utility>

#include "sandbox/context_sanitizer.hpp"
#include "sandbox/resource_limits.hpp"
#include "sandbox/worker_protocol.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace warden::coordinator {
namespace {

using utils::Log;
using utils::LogLevel;

constexpr char kGenericInternalMessage[] = "internal error";
constexpr auto kSelfCheckTimeout = std::chrono::seconds(10);

validator::ValidatorOptions MakeValidatorOptions(const config::SandboxConfig& config) {
    validator::ValidatorOptions options;
    options.allowed_imports = config.allowed_imports;
    options.max_code_bytes = config.max_code_bytes;
    options.max_ast_nodes = config.max_ast_nodes;
    options.reserved_prefix = sandbox::kReservedPrefix;
    return options;
}

sandbox::ResourceLimits MakeResourceLimits(const config::SandboxConfig& config) {
    sandbox::ResourceLimits limits;
    limits.max_cpu_seconds = config.max_cpu_seconds;
    limits.max_memory_bytes = config.max_memory_bytes;
    limits.max_processes = config.max_processes;
    limits.max_open_files = config.max_open_files;
    limits.max_stack_bytes = config.max_stack_bytes;
    return limits;
}

ExecuteResponse Reject(ExecutionLifecycle& lifecycle, ExecutionState state, Disposition disposition,
                       std::string message) {
    lifecycle.Advance(state);
    ExecuteResponse response;
    response.disposition = disposition;
    response.final_state = state;
    response.message = std::move(message);
    return response;
}

std::string DescribeExit(const sandbox::ExecResult& outcome) {
    if (outcome.term_signal != 0) {
        return "signal " + std::to_string(outcome.term_signal);
    }
    return "exit " + std::to_string(outcome.exit_code);
}

void Clamp(sandbox::CapturedStream& stream, std::size_t max_bytes) {
    if (stream.text.size() > max_bytes) {
        stream.text.resize(max_bytes);
        stream.truncated = true;
    }
}

}  // namespace

const char* ToString(Disposition disposition) {
    switch (disposition) {
        case Disposition::kExecuted: return "executed";
        case Disposition::kRejectedAuth: return "rejected_auth";
        case Disposition::kRejectedInvalidRequest: return "rejected_invalid_request";
        case Disposition::kRejectedValidation: return "rejected_validation";
        case Disposition::kRejectedBusy: return "rejected_busy";
        case Disposition::kUnavailable: return "unavailable";
        case Disposition::kInternalError: return "internal_error";
    }
    return "internal_error";
}

utils::Json ToJson(const HealthStatus& health) {
    return {
        {"status", health.healthy ? "healthy" : "degraded"},
        {"sandbox_initialized", health.sandbox_initialized}
    };
}

Coordinator::Coordinator(config::SandboxConfig config)
    : config_(std::move(config)),
      authenticator_(config_.shared_secret),
      validator_(MakeValidatorOptions(config_)),
      limiter_(static_cast<std::size_t>(config_.max_concurrent_executions)) {}

bool Coordinator::Initialize() {
    sandbox::SpawnSpec spec;
    spec.program = config_.worker_path;
    spec.args = sandbox::ToArguments(MakeResourceLimits(config_));
    spec.args.emplace_back(sandbox::kSelfCheckFlag);
    spec.timeout = kSelfCheckTimeout;
    spec.kill_grace = std::chrono::milliseconds(config_.kill_grace_ms);
    spec.max_capture_bytes = 64 * 1024;

    const auto outcome = sandbox::SandboxExecutor::Run(spec);
    const bool ready = outcome.started && !outcome.timed_out && outcome.exit_code == sandbox::kExitOk &&
                       utils::StartsWith(outcome.output, sandbox::kReadyLine);
    sandbox_initialized_.store(ready);
    if (ready) {
        Log(LogLevel::kInfo, "coordinator", "sandbox initialized", {{"worker", config_.worker_path}});
    } else {
        Log(LogLevel::kError, "coordinator", "sandbox self-check failed",
            {{"worker", config_.worker_path},
             {"status", outcome.started ? DescribeExit(outcome) : outcome.spawn_error},
             {"stderr", outcome.error}});
    }
    return ready;
}

HealthStatus Coordinator::Health() const {
    HealthStatus health;
    health.sandbox_initialized = sandbox_initialized_.load();
    health.healthy = health.sandbox_initialized;
    return health;
}

StatsSnapshot Coordinator::Stats() const {
    auto snapshot = stats_.Snapshot();
    snapshot.running = limiter_.Running();
    snapshot.queued = limiter_.Queued();
    return snapshot;
}

validator::ValidationResult Coordinator::Validate(const std::string& code) const {
    return validator_.Validate(code);
}

bool Coordinator::Authenticate(const std::optional<std::string>& credential) {
    if (credential && authenticator_.Verify(*credential)) {
        return true;
    }
    stats_.RecordRequest();
    stats_.RecordOutcome(ExecutionState::kRejectedAuth);
    Log(LogLevel::kInfo, "coordinator", "request finished", {{"state", ToString(ExecutionState::kRejectedAuth)}});
    return false;
}

ExecuteResponse Coordinator::Execute(const sandbox::ExecutionRequest& request,
                                     const std::optional<std::string>& credential) {
    stats_.RecordRequest();
    const auto id = next_id_.fetch_add(1);
    ExecutionLifecycle lifecycle;
    ExecuteResponse response;
    try {
        response = Dispatch(request, credential, lifecycle, id);
    } catch (const std::exception& ex) {
        Log(LogLevel::kError, "coordinator", "execution failed internally",
            {{"id", std::to_string(id)}, {"state", ToString(lifecycle.state())}, {"error", ex.what()}});
        if (!IsTerminal(lifecycle.state())) {
            lifecycle.Advance(ExecutionState::kFailedInternal);
        }
        response = ExecuteResponse{};
        response.disposition = Disposition::kInternalError;
        response.final_state = ExecutionState::kFailedInternal;
        response.message = kGenericInternalMessage;
        response.result = sandbox::ExecutionResult::Failure(sandbox::ErrorKind::kInternalError,
                                                            kGenericInternalMessage);
    }
    stats_.RecordOutcome(response.final_state);
    Log(LogLevel::kInfo, "coordinator", "request finished",
        {{"id", std::to_string(id)}, {"state", ToString(response.final_state)},
         {"code_bytes", std::to_string(request.code.size())}});
    return response;
}

ExecuteResponse Coordinator::Dispatch(const sandbox::ExecutionRequest& request,
                                      const std::optional<std::string>& credential,
                                      ExecutionLifecycle& lifecycle, std::uint64_t id) {
    if (!sandbox_initialized_.load()) {
        return Reject(lifecycle, ExecutionState::kRejectedUnavailable, Disposition::kUnavailable,
                      "sandbox unavailable");
    }
    if (!credential || !authenticator_.Verify(*credential)) {
        return Reject(lifecycle, ExecutionState::kRejectedAuth, Disposition::kRejectedAuth, "invalid credential");
    }

    utils::Json context;
    try {
        sandbox::ContextLimits limits;
        limits.max_depth = config_.max_context_depth;
        limits.max_bytes = config_.max_context_bytes;
        context = sandbox::SanitizeContext(request.context, limits);
    } catch (const sandbox::InvalidRequestError& ex) {
        return Reject(lifecycle, ExecutionState::kRejectedInvalidRequest, Disposition::kRejectedInvalidRequest,
                      ex.what());
    }

    auto validation = validator_.Validate(request.code);
    if (!validation.valid) {
        auto response = Reject(lifecycle, ExecutionState::kRejectedValidation, Disposition::kRejectedValidation,
                               "validation failed");
        response.validation = std::move(validation);
        return response;
    }
    lifecycle.Advance(ExecutionState::kValidated);

    lifecycle.Advance(ExecutionState::kQueued);
    auto slot = limiter_.TryAcquireFor(std::chrono::milliseconds(config_.queue_timeout_ms));
    if (!slot) {
        Log(LogLevel::kWarn, "coordinator", "no execution slot", {{"id", std::to_string(id)}});
        return Reject(lifecycle, ExecutionState::kRejectedBusy, Disposition::kRejectedBusy, "sandbox busy");
    }
    lifecycle.Advance(ExecutionState::kRunning);

    ExecuteResponse response;
    response.result = RunWorker(request, context, lifecycle, id);
    response.final_state = lifecycle.state();
    response.disposition =
        response.final_state == ExecutionState::kFailedInternal ? Disposition::kInternalError : Disposition::kExecuted;
    if (response.disposition == Disposition::kInternalError) {
        response.message = kGenericInternalMessage;
    }
    return response;
}

sandbox::ExecutionResult Coordinator::RunWorker(const sandbox::ExecutionRequest& request, const utils::Json& context,
                                                ExecutionLifecycle& lifecycle, std::uint64_t id) {
    const int timeout_seconds = std::clamp(request.timeout_seconds.value_or(config_.default_timeout_seconds), 1,
                                           config_.max_timeout_seconds);
    const std::size_t max_output = std::clamp<std::size_t>(
        request.max_output_bytes.value_or(config_.max_output_bytes), 1, config_.max_output_bytes);

    sandbox::WorkerRequest worker_request;
    worker_request.code = request.code;
    worker_request.context = context;
    worker_request.allowed_imports = config_.allowed_imports;
    worker_request.max_output_bytes = max_output;

    sandbox::SpawnSpec spec;
    spec.program = config_.worker_path;
    spec.args = sandbox::ToArguments(MakeResourceLimits(config_));
    spec.input = sandbox::Dump(sandbox::ToJson(worker_request));
    spec.timeout = std::chrono::seconds(timeout_seconds);
    spec.kill_grace = std::chrono::milliseconds(config_.kill_grace_ms);
    // Every field of the result document is bounded by max_output; escaping
    // can grow text up to six times.
    spec.max_capture_bytes = 6 * 3 * max_output + 64 * 1024;

    stats_.RecordWorkerSpawned();
    const auto outcome = sandbox::SandboxExecutor::Run(spec);
    return Normalize(outcome, timeout_seconds, max_output, lifecycle, id);
}

sandbox::ExecutionResult Coordinator::Normalize(const sandbox::ExecResult& outcome, int timeout_seconds,
                                                std::size_t max_output_bytes, ExecutionLifecycle& lifecycle,
                                                std::uint64_t id) const {
    using sandbox::ErrorKind;
    using sandbox::ExecutionResult;

    auto finish = [&](ExecutionResult result, ExecutionState state) {
        lifecycle.Advance(state);
        result.execution_time_ms = outcome.elapsed_ms;
        result.memory_used_mb = std::max(result.memory_used_mb, outcome.peak_memory_mb);
        return result;
    };
    auto internal = [&](const std::string& detail) {
        Log(LogLevel::kError, "coordinator", "worker failed",
            {{"id", std::to_string(id)}, {"detail", detail}, {"stderr", outcome.error}});
        return finish(ExecutionResult::Failure(ErrorKind::kInternalError, kGenericInternalMessage),
                      ExecutionState::kFailedInternal);
    };

    if (!outcome.started) {
        return internal(outcome.spawn_error);
    }
    if (outcome.timed_out) {
        return finish(ExecutionResult::Failure(ErrorKind::kTimedOut, "execution exceeded " +
                                                                         std::to_string(timeout_seconds) +
                                                                         "s timeout"),
                      ExecutionState::kTimedOut);
    }
    if (!outcome.spawn_error.empty()) {
        return internal(outcome.spawn_error);
    }
    const bool resource_signal = outcome.term_signal == SIGXCPU || outcome.term_signal == SIGXFSZ;
    if (resource_signal || outcome.killed_externally || outcome.exit_code == sandbox::kExitResourceLimit) {
        Log(LogLevel::kWarn, "coordinator", "worker hit a resource limit",
            {{"id", std::to_string(id)}, {"status", DescribeExit(outcome)}});
        return finish(ExecutionResult::Failure(ErrorKind::kResourceLimitExceeded,
                                               "execution exceeded resource limits"),
                      ExecutionState::kResourceKilled);
    }
    if (outcome.exit_code != sandbox::kExitOk) {
        return internal("worker ended with " + DescribeExit(outcome));
    }
    if (outcome.output_overflow) {
        return internal("worker result exceeded capture bound");
    }

    ExecutionResult result;
    try {
        const auto newline = outcome.output.find('\n');
        result = sandbox::ResultFromJson(utils::Json::parse(outcome.output.substr(0, newline)));
    } catch (const utils::Json::exception& ex) {
        return internal(std::string("unreadable worker result: ") + ex.what());
    } catch (const sandbox::ProtocolError& ex) {
        return internal(std::string("malformed worker result: ") + ex.what());
    }
    if (result.error && result.error->kind != ErrorKind::kRuntimeError &&
        result.error->kind != ErrorKind::kSecurityViolation) {
        return internal(std::string("worker reported ") + sandbox::ToString(result.error->kind));
    }

    Clamp(result.out, max_output_bytes);
    Clamp(result.err, max_output_bytes);
    const auto state = result.success ? ExecutionState::kCompleted : ExecutionState::kRuntimeFailed;
    return finish(std::move(result), state);
}

}  // namespace warden::coordinator
