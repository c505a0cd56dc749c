#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace warden::coordinator {

// Counting semaphore with a bounded wait. Callers hold a Slot for as long as
// their execution runs.
class ConcurrencyLimiter {
public:
    class Slot {
    public:
        Slot(Slot&& other) noexcept;
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot();

    private:
        friend class ConcurrencyLimiter;
        explicit Slot(ConcurrencyLimiter* owner) : owner_(owner) {}
        void Release();

        ConcurrencyLimiter* owner_ = nullptr;
    };

    explicit ConcurrencyLimiter(std::size_t capacity);

    // Waits up to timeout for a free slot. Returns nullopt when none opened.
    std::optional<Slot> TryAcquireFor(std::chrono::milliseconds timeout);

    std::size_t capacity() const { return capacity_; }
    std::size_t Running() const;
    std::size_t Queued() const;
    // Highest number of slots ever held at once.
    std::size_t MaxObserved() const;

private:
    void Release();

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t running_ = 0;
    std::size_t queued_ = 0;
    std::size_t max_observed_ = 0;
};

}  // namespace warden::coordinator
