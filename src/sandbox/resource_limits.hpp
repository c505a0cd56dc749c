#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace warden::sandbox {

struct ResourceLimits {
    int max_cpu_seconds = 5;
    std::size_t max_memory_bytes = 256u * 1024 * 1024;
    int max_processes = 0;
    int max_open_files = 16;
    std::size_t max_stack_bytes = 8u * 1024 * 1024;
};

// Applies limits to the calling process: CPU (hard = soft + 1), address
// space, data, processes, file size 0, core 0, open files, stack, then
// no_new_privs and SIGKILL on parent death. A limit above the current hard
// ceiling is clamped to it. Throws std::system_error naming the failed call.
void ApplyResourceLimits(const ResourceLimits& limits);

// Closes every descriptor above stderr.
void CloseInheritedDescriptors();

// Command line form used to hand limits to a worker.
std::vector<std::string> ToArguments(const ResourceLimits& limits);
// Throws std::invalid_argument on an unknown flag or malformed number.
ResourceLimits ParseArguments(const std::vector<std::string>& args);

}  // namespace warden::sandbox
