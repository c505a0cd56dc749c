#include "sandbox/resource_limits.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace warden::sandbox {
namespace {

ResourceLimits TestLimits() {
    ResourceLimits limits;
    limits.max_cpu_seconds = 2;
    // Generous: the forked test process already maps a fair amount.
    limits.max_memory_bytes = 2048u * 1024 * 1024;
    limits.max_open_files = 64;
    return limits;
}

TEST(ResourceLimitsTest, ArgumentsSurviveTheCommandLine) {
    ResourceLimits limits;
    limits.max_cpu_seconds = 7;
    limits.max_memory_bytes = 123456789;
    limits.max_processes = 3;
    limits.max_open_files = 20;
    limits.max_stack_bytes = 1 << 20;

    const auto parsed = ParseArguments(ToArguments(limits));
    EXPECT_EQ(parsed.max_cpu_seconds, 7);
    EXPECT_EQ(parsed.max_memory_bytes, 123456789u);
    EXPECT_EQ(parsed.max_processes, 3);
    EXPECT_EQ(parsed.max_open_files, 20);
    EXPECT_EQ(parsed.max_stack_bytes, 1u << 20);
}

TEST(ResourceLimitsTest, MissingFlagsKeepDefaults) {
    const auto parsed = ParseArguments({"--cpu-seconds", "9"});
    EXPECT_EQ(parsed.max_cpu_seconds, 9);
    EXPECT_EQ(parsed.max_open_files, ResourceLimits{}.max_open_files);
}

TEST(ResourceLimitsTest, RejectsMalformedArguments) {
    EXPECT_THROW(ParseArguments({"--cpu-seconds"}), std::invalid_argument);
    EXPECT_THROW(ParseArguments({"--cpu-seconds", "five"}), std::invalid_argument);
    EXPECT_THROW(ParseArguments({"--cpu-seconds", "5s"}), std::invalid_argument);
    EXPECT_THROW(ParseArguments({"--cpu-seconds", "-1"}), std::invalid_argument);
    EXPECT_THROW(ParseArguments({"--network", "1"}), std::invalid_argument);
}

TEST(ResourceLimitsDeathTest, SetsKernelLimits) {
    EXPECT_EXIT(
        {
            ApplyResourceLimits(TestLimits());
            struct rlimit cpu {};
            struct rlimit fsize {};
            struct rlimit core {};
            ::getrlimit(RLIMIT_CPU, &cpu);
            ::getrlimit(RLIMIT_FSIZE, &fsize);
            ::getrlimit(RLIMIT_CORE, &core);
            const bool ok = cpu.rlim_cur == 2 && cpu.rlim_max == 3 && fsize.rlim_cur == 0 && core.rlim_cur == 0;
            std::_Exit(ok ? 0 : 1);
        },
        ::testing::ExitedWithCode(0), "");
}

TEST(ResourceLimitsDeathTest, FileWritesAreRefused) {
    EXPECT_EXIT(
        {
            ApplyResourceLimits(TestLimits());
            std::FILE* file = std::tmpfile();
            if (file == nullptr) {
                std::_Exit(2);
            }
            std::fputs("data", file);
            std::fflush(file);
            std::_Exit(0);
        },
        ::testing::KilledBySignal(SIGXFSZ), "");
}

TEST(ResourceLimitsDeathTest, CpuLimitEndsBusyLoop) {
    EXPECT_EXIT(
        {
            auto limits = TestLimits();
            limits.max_cpu_seconds = 1;
            ApplyResourceLimits(limits);
            volatile unsigned long spin = 0;
            while (true) {
                spin = spin + 1;
            }
        },
        ::testing::KilledBySignal(SIGXCPU), "");
}

TEST(ResourceLimitsDeathTest, ClosesInheritedDescriptors) {
    EXPECT_EXIT(
        {
            const int fd = ::open("/dev/null", O_RDONLY);
            CloseInheritedDescriptors();
            const bool closed = fd > STDERR_FILENO && ::fcntl(fd, F_GETFD) == -1;
            const bool kept = ::fcntl(STDERR_FILENO, F_GETFD) != -1;
            std::_Exit(closed && kept ? 0 : 1);
        },
        ::testing::ExitedWithCode(0), "");
}

}  // namespace
}  // namespace warden::sandbox
