#pragma once

#include <cstddef>
#include <string>

#include "sandbox/types.hpp"
#include "sandbox/worker_protocol.hpp"

namespace warden::sandbox {

// Runs a script inside the current process with the allow-list runtime. Used
// by warden_worker after its limits are in place.
class ScriptExecutor {
public:
    // memory_bound caps any single string or sequence the script builds.
    // Throws script::ResourceExhausted and std::bad_alloc for the caller to
    // turn into a resource-limit exit, and script::GuardConfigurationError
    // when the runtime cannot be assembled.
    static ExecutionResult Run(const WorkerRequest& request, std::size_t memory_bound);

    // Builds the runtime once without running anything.
    static void SelfCheck(std::size_t memory_bound);
};

// Strips host paths and bounds the length of an error message.
std::string SanitizeMessage(const std::string& message);

}  // namespace warden::sandbox
