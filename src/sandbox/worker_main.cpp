#include <cstdlib>
#include <iostream>
#include <iterator>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <sys/resource.h>

#include "sandbox/resource_limits.hpp"
#include "sandbox/script_executor.hpp"
#include "sandbox/types.hpp"
#include "sandbox/worker_protocol.hpp"
#include "script/errors.hpp"
#include "utils/logging.hpp"

namespace {

using warden::utils::Log;
using warden::utils::LogLevel;

double PeakMemoryMb() {
    struct rusage usage {};
    if (::getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    return static_cast<double>(usage.ru_maxrss) / 1024.0;
}

int Serve(const warden::sandbox::ResourceLimits& limits, bool self_check) {
    // Half the address space leaves room for the runtime itself.
    const auto memory_bound = limits.max_memory_bytes / 2;
    if (self_check) {
        warden::sandbox::ScriptExecutor::SelfCheck(memory_bound);
        std::cout << warden::sandbox::kReadyLine << std::endl;
        return warden::sandbox::kExitOk;
    }

    const std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    warden::sandbox::WorkerRequest request;
    try {
        request = warden::sandbox::WorkerRequestFromJson(warden::utils::Json::parse(input));
    } catch (const warden::utils::Json::exception& ex) {
        Log(LogLevel::kError, "worker", "unreadable request", {{"error", ex.what()}});
        return warden::sandbox::kExitBadRequest;
    } catch (const warden::sandbox::ProtocolError& ex) {
        Log(LogLevel::kError, "worker", "malformed request", {{"error", ex.what()}});
        return warden::sandbox::kExitBadRequest;
    }

    auto result = warden::sandbox::ScriptExecutor::Run(request, memory_bound);
    result.memory_used_mb = PeakMemoryMb();
    std::cout << warden::sandbox::Dump(warden::sandbox::ToJson(result)) << '\n' << std::flush;
    return std::cout ? warden::sandbox::kExitOk : warden::sandbox::kExitInternal;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args;
    bool self_check = false;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == warden::sandbox::kSelfCheckFlag) {
            self_check = true;
        } else {
            args.emplace_back(argv[i]);
        }
    }

    warden::sandbox::ResourceLimits limits;
    try {
        limits = warden::sandbox::ParseArguments(args);
    } catch (const std::invalid_argument& ex) {
        Log(LogLevel::kError, "worker", "bad command line", {{"error", ex.what()}});
        return warden::sandbox::kExitUsage;
    }

    warden::sandbox::CloseInheritedDescriptors();
    try {
        warden::sandbox::ApplyResourceLimits(limits);
    } catch (const std::system_error& ex) {
        Log(LogLevel::kError, "worker", "failed to apply resource limits", {{"error", ex.what()}});
        return warden::sandbox::kExitLimitSetup;
    }

    try {
        return Serve(limits, self_check);
    } catch (const warden::script::ResourceExhausted&) {
        std::_Exit(warden::sandbox::kExitResourceLimit);
    } catch (const std::bad_alloc&) {
        std::_Exit(warden::sandbox::kExitResourceLimit);
    } catch (const std::length_error&) {
        std::_Exit(warden::sandbox::kExitResourceLimit);
    } catch (const warden::script::GuardConfigurationError& ex) {
        Log(LogLevel::kError, "worker", "runtime refused to start", {{"error", ex.what()}});
        return warden::sandbox::kExitInternal;
    } catch (const std::exception& ex) {
        Log(LogLevel::kError, "worker", "internal failure", {{"error", ex.what()}});
        return warden::sandbox::kExitInternal;
    }
}
