#include "coordinator/concurrency_limiter.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace warden::coordinator {
namespace {

using namespace std::chrono_literals;

TEST(ConcurrencyLimiterTest, RejectsZeroCapacity) {
    EXPECT_THROW(ConcurrencyLimiter(0), std::invalid_argument);
}

TEST(ConcurrencyLimiterTest, SlotsReleaseOnDestruction) {
    ConcurrencyLimiter limiter(1);
    {
        auto slot = limiter.TryAcquireFor(0ms);
        ASSERT_TRUE(slot.has_value());
        EXPECT_EQ(limiter.Running(), 1u);
        EXPECT_FALSE(limiter.TryAcquireFor(10ms).has_value());
    }
    EXPECT_EQ(limiter.Running(), 0u);
    EXPECT_TRUE(limiter.TryAcquireFor(0ms).has_value());
}

TEST(ConcurrencyLimiterTest, MovedSlotReleasesOnce) {
    ConcurrencyLimiter limiter(2);
    auto first = limiter.TryAcquireFor(0ms);
    ASSERT_TRUE(first.has_value());
    {
        auto moved = std::move(*first);
        EXPECT_EQ(limiter.Running(), 1u);
    }
    EXPECT_EQ(limiter.Running(), 0u);
    first.reset();
    EXPECT_EQ(limiter.Running(), 0u);
}

TEST(ConcurrencyLimiterTest, WaiterGetsReleasedSlot) {
    ConcurrencyLimiter limiter(1);
    auto held = limiter.TryAcquireFor(0ms);
    ASSERT_TRUE(held.has_value());

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto slot = limiter.TryAcquireFor(2000ms);
        acquired.store(slot.has_value());
    });
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (limiter.Queued() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(limiter.Queued(), 1u);
    held.reset();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST(ConcurrencyLimiterTest, NeverExceedsCapacity) {
    constexpr std::size_t kCapacity = 3;
    ConcurrencyLimiter limiter(kCapacity);
    std::atomic<int> inside{0};
    std::atomic<int> worst{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            auto slot = limiter.TryAcquireFor(5000ms);
            ASSERT_TRUE(slot.has_value());
            const int now = ++inside;
            int seen = worst.load();
            while (now > seen && !worst.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(5ms);
            --inside;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_LE(worst.load(), static_cast<int>(kCapacity));
    EXPECT_LE(limiter.MaxObserved(), kCapacity);
    EXPECT_EQ(limiter.Running(), 0u);
    EXPECT_EQ(limiter.Queued(), 0u);
}

}  // namespace
}  // namespace warden::coordinator
