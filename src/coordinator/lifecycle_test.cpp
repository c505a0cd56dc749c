#include "coordinator/lifecycle.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

#include "coordinator/execution_stats.hpp"

namespace warden::coordinator {
namespace {

TEST(ExecutionLifecycleTest, FollowsHappyPath) {
    ExecutionLifecycle lifecycle;
    EXPECT_EQ(lifecycle.state(), ExecutionState::kReceived);
    lifecycle.Advance(ExecutionState::kValidated);
    lifecycle.Advance(ExecutionState::kQueued);
    lifecycle.Advance(ExecutionState::kRunning);
    lifecycle.Advance(ExecutionState::kCompleted);
    EXPECT_TRUE(IsTerminal(lifecycle.state()));
}

TEST(ExecutionLifecycleTest, RejectsSkippedStates) {
    ExecutionLifecycle lifecycle;
    EXPECT_THROW(lifecycle.Advance(ExecutionState::kRunning), std::logic_error);
    lifecycle.Advance(ExecutionState::kValidated);
    EXPECT_THROW(lifecycle.Advance(ExecutionState::kRejectedAuth), std::logic_error);
    EXPECT_EQ(lifecycle.state(), ExecutionState::kValidated);
}

TEST(ExecutionLifecycleTest, TerminalStatesAreFinal) {
    ExecutionLifecycle lifecycle;
    lifecycle.Advance(ExecutionState::kRejectedAuth);
    EXPECT_THROW(lifecycle.Advance(ExecutionState::kValidated), std::logic_error);
    EXPECT_THROW(lifecycle.Advance(ExecutionState::kFailedInternal), std::logic_error);
}

TEST(ExecutionLifecycleTest, InternalFailureFromAnyLiveState) {
    for (auto state : {ExecutionState::kReceived, ExecutionState::kValidated, ExecutionState::kQueued,
                       ExecutionState::kRunning}) {
        EXPECT_TRUE(IsTransitionAllowed(state, ExecutionState::kFailedInternal)) << ToString(state);
    }
}

TEST(ExecutionLifecycleTest, BusyOnlyWhileQueued) {
    EXPECT_TRUE(IsTransitionAllowed(ExecutionState::kQueued, ExecutionState::kRejectedBusy));
    EXPECT_FALSE(IsTransitionAllowed(ExecutionState::kRunning, ExecutionState::kRejectedBusy));
}

TEST(ExecutionStatsTest, CountsOutcomes) {
    ExecutionStats stats;
    stats.RecordRequest();
    stats.RecordRequest();
    stats.RecordWorkerSpawned();
    stats.RecordOutcome(ExecutionState::kCompleted);
    stats.RecordOutcome(ExecutionState::kRejectedAuth);
    stats.RecordOutcome(ExecutionState::kRunning);

    const auto snapshot = stats.Snapshot();
    EXPECT_EQ(snapshot.requests, 2u);
    EXPECT_EQ(snapshot.workers_spawned, 1u);
    EXPECT_EQ(snapshot.completed, 1u);
    EXPECT_EQ(snapshot.rejected_auth, 1u);

    const auto json = ToJson(snapshot);
    EXPECT_EQ(json["requests"], 2);
    EXPECT_EQ(json["rejected"]["auth"], 1);
    EXPECT_EQ(json["outcomes"]["completed"], 1);
    EXPECT_EQ(json["outcomes"]["timed_out"], 0);
}

}  // namespace
}  // namespace warden::coordinator
