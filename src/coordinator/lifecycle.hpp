#pragma once

namespace warden::coordinator {

enum class ExecutionState {
    kReceived,
    kValidated,
    kQueued,
    kRunning,
    kCompleted,
    kTimedOut,
    kResourceKilled,
    kRuntimeFailed,
    kRejectedValidation,
    kRejectedAuth,
    kRejectedBusy,
    kRejectedInvalidRequest,
    kRejectedUnavailable,
    kFailedInternal
};

const char* ToString(ExecutionState state);
bool IsTerminal(ExecutionState state);
bool IsTransitionAllowed(ExecutionState from, ExecutionState to);

// Tracks one request from receipt to its terminal state.
class ExecutionLifecycle {
public:
    ExecutionState state() const { return state_; }

    // Throws std::logic_error on a transition the state machine does not have.
    void Advance(ExecutionState next);

private:
    ExecutionState state_ = ExecutionState::kReceived;
};

}  // namespace warden::coordinator
