#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace warden::sandbox {

struct SpawnSpec {
    std::string program;
    std::vector<std::string> args;
    std::string input;
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds kill_grace{500};
    // Bytes kept from each of stdout and stderr; the rest is drained and dropped.
    std::size_t max_capture_bytes = 1024 * 1024;
};

struct ExecResult {
    bool started = false;
    bool timed_out = false;
    // Set when the process died of SIGKILL that the executor did not send.
    bool killed_externally = false;
    int exit_code = -1;
    int term_signal = 0;
    std::string output;
    std::string error;
    bool output_overflow = false;
    std::string spawn_error;
    double peak_memory_mb = 0.0;
    std::int64_t elapsed_ms = 0;
};

// Launches a fresh executable with an empty environment and only the three
// standard descriptors, feeds it input on stdin and collects its output
// until it exits or the deadline passes. On the deadline the process gets
// SIGTERM, then SIGKILL after the grace period.
class SandboxExecutor {
public:
    static ExecResult Run(const SpawnSpec& spec);
};

}  // namespace warden::sandbox
