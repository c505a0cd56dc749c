#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "coordinator/lifecycle.hpp"
#include "utils/json.hpp"

namespace warden::coordinator {

struct StatsSnapshot {
    std::uint64_t requests = 0;
    std::uint64_t rejected_auth = 0;
    std::uint64_t rejected_invalid_request = 0;
    std::uint64_t rejected_validation = 0;
    std::uint64_t rejected_busy = 0;
    std::uint64_t rejected_unavailable = 0;
    std::uint64_t workers_spawned = 0;
    std::uint64_t completed = 0;
    std::uint64_t timed_out = 0;
    std::uint64_t resource_killed = 0;
    std::uint64_t runtime_failed = 0;
    std::uint64_t internal_errors = 0;
    // Gauges, filled in by the owner of the concurrency limiter.
    std::size_t running = 0;
    std::size_t queued = 0;
};

utils::Json ToJson(const StatsSnapshot& snapshot);

// Process-wide counters. Lock-free; safe to bump from any request thread.
class ExecutionStats {
public:
    void RecordRequest() { requests_.fetch_add(1, std::memory_order_relaxed); }
    void RecordWorkerSpawned() { workers_spawned_.fetch_add(1, std::memory_order_relaxed); }
    // Counts a request under its terminal state.
    void RecordOutcome(ExecutionState state);

    StatsSnapshot Snapshot() const;

private:
    std::atomic<std::uint64_t> requests_{0};
    std::atomic<std::uint64_t> rejected_auth_{0};
    std::atomic<std::uint64_t> rejected_invalid_request_{0};
    std::atomic<std::uint64_t> rejected_validation_{0};
    std::atomic<std::uint64_t> rejected_busy_{0};
    std::atomic<std::uint64_t> rejected_unavailable_{0};
    std::atomic<std::uint64_t> workers_spawned_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> timed_out_{0};
    std::atomic<std::uint64_t> resource_killed_{0};
    std::atomic<std::uint64_t> runtime_failed_{0};
    std::atomic<std::uint64_t> internal_errors_{0};
};

}  // namespace warden::coordinator
