#include "coordinator/execution_stats.hpp"

namespace warden::coordinator {

utils::Json ToJson(const StatsSnapshot& snapshot) {
    return {
        {"requests", snapshot.requests},
        {"running", snapshot.running},
        {"queued", snapshot.queued},
        {"rejected", {
            {"auth", snapshot.rejected_auth},
            {"invalid_request", snapshot.rejected_invalid_request},
            {"validation", snapshot.rejected_validation},
            {"busy", snapshot.rejected_busy},
            {"unavailable", snapshot.rejected_unavailable}
        }},
        {"workers_spawned", snapshot.workers_spawned},
        {"outcomes", {
            {"completed", snapshot.completed},
            {"timed_out", snapshot.timed_out},
            {"resource_killed", snapshot.resource_killed},
            {"runtime_failed", snapshot.runtime_failed},
            {"internal_error", snapshot.internal_errors}
        }}
    };
}

void ExecutionStats::RecordOutcome(ExecutionState state) {
    switch (state) {
        case ExecutionState::kCompleted: completed_.fetch_add(1, std::memory_order_relaxed); break;
        case ExecutionState::kTimedOut: timed_out_.fetch_add(1, std::memory_order_relaxed); break;
        case ExecutionState::kResourceKilled: resource_killed_.fetch_add(1, std::memory_order_relaxed); break;
        case ExecutionState::kRuntimeFailed: runtime_failed_.fetch_add(1, std::memory_order_relaxed); break;
        case ExecutionState::kRejectedValidation:
            rejected_validation_.fetch_add(1, std::memory_order_relaxed);
            break;
        case ExecutionState::kRejectedAuth: rejected_auth_.fetch_add(1, std::memory_order_relaxed); break;
        case ExecutionState::kRejectedBusy: rejected_busy_.fetch_add(1, std::memory_order_relaxed); break;
        case ExecutionState::kRejectedInvalidRequest:
            rejected_invalid_request_.fetch_add(1, std::memory_order_relaxed);
            break;
        case ExecutionState::kRejectedUnavailable:
            rejected_unavailable_.fetch_add(1, std::memory_order_relaxed);
            break;
        case ExecutionState::kFailedInternal: internal_errors_.fetch_add(1, std::memory_order_relaxed); break;
        default:
            break;
    }
}

StatsSnapshot ExecutionStats::Snapshot() const {
    StatsSnapshot snapshot;
    snapshot.requests = requests_.load();
    snapshot.rejected_auth = rejected_auth_.load();
    snapshot.rejected_invalid_request = rejected_invalid_request_.load();
    snapshot.rejected_validation = rejected_validation_.load();
    snapshot.rejected_busy = rejected_busy_.load();
    snapshot.rejected_unavailable = rejected_unavailable_.load();
    snapshot.workers_spawned = workers_spawned_.load();
    snapshot.completed = completed_.load();
    snapshot.timed_out = timed_out_.load();
    snapshot.resource_killed = resource_killed_.load();
    snapshot.runtime_failed = runtime_failed_.load();
    snapshot.internal_errors = internal_errors_.load();
    return snapshot;
}

}  // namespace warden::coordinator
