#include "sandbox/resource_limits.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>

namespace warden::sandbox {
namespace {

void SetLimit(int resource, const char* name, rlim_t soft, rlim_t hard) {
    struct rlimit current {};
    if (::getrlimit(resource, &current) != 0) {
        throw std::system_error(errno, std::generic_category(), std::string("getrlimit ") + name);
    }
    if (current.rlim_max != RLIM_INFINITY) {
        hard = std::min(hard, current.rlim_max);
        soft = std::min(soft, hard);
    }
    const struct rlimit value { soft, hard };
    if (::setrlimit(resource, &value) != 0) {
        throw std::system_error(errno, std::generic_category(), std::string("setrlimit ") + name);
    }
}

void SetLimit(int resource, const char* name, rlim_t value) {
    SetLimit(resource, name, value, value);
}

long long ParseNumber(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("malformed value for " + flag + ": " + text);
    }
    if (used != text.size() || value < 0) {
        throw std::invalid_argument("malformed value for " + flag + ": " + text);
    }
    return value;
}

}  // namespace

void ApplyResourceLimits(const ResourceLimits& limits) {
    const auto cpu = static_cast<rlim_t>(limits.max_cpu_seconds);
    SetLimit(RLIMIT_CPU, "RLIMIT_CPU", cpu, cpu + 1);
    SetLimit(RLIMIT_AS, "RLIMIT_AS", static_cast<rlim_t>(limits.max_memory_bytes));
    SetLimit(RLIMIT_DATA, "RLIMIT_DATA", static_cast<rlim_t>(limits.max_memory_bytes));
    SetLimit(RLIMIT_NPROC, "RLIMIT_NPROC", static_cast<rlim_t>(limits.max_processes));
    SetLimit(RLIMIT_FSIZE, "RLIMIT_FSIZE", 0);
    SetLimit(RLIMIT_CORE, "RLIMIT_CORE", 0);
    SetLimit(RLIMIT_NOFILE, "RLIMIT_NOFILE", static_cast<rlim_t>(limits.max_open_files));
    SetLimit(RLIMIT_STACK, "RLIMIT_STACK", static_cast<rlim_t>(limits.max_stack_bytes));

    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        throw std::system_error(errno, std::generic_category(), "prctl PR_SET_NO_NEW_PRIVS");
    }
    if (::prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) {
        throw std::system_error(errno, std::generic_category(), "prctl PR_SET_PDEATHSIG");
    }
}

void CloseInheritedDescriptors() {
    std::vector<int> descriptors;
    std::error_code ec;
    for (std::filesystem::directory_iterator it("/proc/self/fd", ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        char* parsed_end = nullptr;
        const long fd = std::strtol(name.c_str(), &parsed_end, 10);
        if (parsed_end != name.c_str() && *parsed_end == '\0' && fd > STDERR_FILENO) {
            descriptors.push_back(static_cast<int>(fd));
        }
    }
    if (ec) {
        descriptors.clear();
        for (int fd = STDERR_FILENO + 1; fd < 1024; ++fd) {
            descriptors.push_back(fd);
        }
    }
    for (const int fd : descriptors) {
        ::close(fd);
    }
}

std::vector<std::string> ToArguments(const ResourceLimits& limits) {
    return {
        "--cpu-seconds", std::to_string(limits.max_cpu_seconds),
        "--memory-bytes", std::to_string(limits.max_memory_bytes),
        "--max-processes", std::to_string(limits.max_processes),
        "--max-open-files", std::to_string(limits.max_open_files),
        "--stack-bytes", std::to_string(limits.max_stack_bytes),
    };
}

ResourceLimits ParseArguments(const std::vector<std::string>& args) {
    ResourceLimits limits;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& flag = args[i];
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + flag);
        }
        const auto value = ParseNumber(flag, args[++i]);
        if (flag == "--cpu-seconds") {
            limits.max_cpu_seconds = static_cast<int>(value);
        } else if (flag == "--memory-bytes") {
            limits.max_memory_bytes = static_cast<std::size_t>(value);
        } else if (flag == "--max-processes") {
            limits.max_processes = static_cast<int>(value);
        } else if (flag == "--max-open-files") {
            limits.max_open_files = static_cast<int>(value);
        } else if (flag == "--stack-bytes") {
            limits.max_stack_bytes = static_cast<std::size_t>(value);
        } else {
            throw std::invalid_argument("unknown flag " + flag);
        }
    }
    return limits;
}

}  // namespace warden::sandbox
