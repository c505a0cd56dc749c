#include "coordinator/lifecycle.hpp"

#include <stdexcept>
#include <string>

namespace warden::coordinator {

const char* ToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::kReceived: return "received";
        case ExecutionState::kValidated: return "validated";
        case ExecutionState::kQueued: return "queued";
        case ExecutionState::kRunning: return "running";
        case ExecutionState::kCompleted: return "completed";
        case ExecutionState::kTimedOut: return "timed_out";
        case ExecutionState::kResourceKilled: return "resource_killed";
        case ExecutionState::kRuntimeFailed: return "runtime_failed";
        case ExecutionState::kRejectedValidation: return "rejected_validation";
        case ExecutionState::kRejectedAuth: return "rejected_auth";
        case ExecutionState::kRejectedBusy: return "rejected_busy";
        case ExecutionState::kRejectedInvalidRequest: return "rejected_invalid_request";
        case ExecutionState::kRejectedUnavailable: return "rejected_unavailable";
        case ExecutionState::kFailedInternal: return "failed_internal";
    }
    return "unknown";
}

bool IsTerminal(ExecutionState state) {
    switch (state) {
        case ExecutionState::kReceived:
        case ExecutionState::kValidated:
        case ExecutionState::kQueued:
        case ExecutionState::kRunning:
            return false;
        default:
            return true;
    }
}

bool IsTransitionAllowed(ExecutionState from, ExecutionState to) {
    if (to == ExecutionState::kFailedInternal) {
        return !IsTerminal(from);
    }
    switch (from) {
        case ExecutionState::kReceived:
            return to == ExecutionState::kValidated || to == ExecutionState::kRejectedAuth ||
                   to == ExecutionState::kRejectedInvalidRequest || to == ExecutionState::kRejectedValidation ||
                   to == ExecutionState::kRejectedUnavailable;
        case ExecutionState::kValidated:
            return to == ExecutionState::kQueued;
        case ExecutionState::kQueued:
            return to == ExecutionState::kRunning || to == ExecutionState::kRejectedBusy;
        case ExecutionState::kRunning:
            return to == ExecutionState::kCompleted || to == ExecutionState::kTimedOut ||
                   to == ExecutionState::kResourceKilled || to == ExecutionState::kRuntimeFailed;
        default:
            return false;
    }
}

void ExecutionLifecycle::Advance(ExecutionState next) {
    if (!IsTransitionAllowed(state_, next)) {
        throw std::logic_error(std::string("illegal execution transition ") + ToString(state_) + " -> " +
                               ToString(next));
    }
    state_ = next;
}

}  // namespace warden::coordinator
