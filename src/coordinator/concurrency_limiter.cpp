#include "coordinator/concurrency_limiter.hpp"

#include <algorithm>
#include <stdexcept>

namespace warden::coordinator {

ConcurrencyLimiter::Slot::Slot(Slot&& other) noexcept : owner_(other.owner_) {
    other.owner_ = nullptr;
}

ConcurrencyLimiter::Slot& ConcurrencyLimiter::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        Release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

ConcurrencyLimiter::Slot::~Slot() {
    Release();
}

void ConcurrencyLimiter::Slot::Release() {
    if (owner_) {
        owner_->Release();
        owner_ = nullptr;
    }
}

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("concurrency limit must be positive");
    }
}

std::optional<ConcurrencyLimiter::Slot> ConcurrencyLimiter::TryAcquireFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    ++queued_;
    const bool acquired = cv_.wait_for(lock, timeout, [this] { return running_ < capacity_; });
    --queued_;
    if (!acquired) {
        return std::nullopt;
    }
    ++running_;
    max_observed_ = std::max(max_observed_, running_);
    return Slot(this);
}

std::size_t ConcurrencyLimiter::Running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::size_t ConcurrencyLimiter::Queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_;
}

std::size_t ConcurrencyLimiter::MaxObserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_observed_;
}

void ConcurrencyLimiter::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
    }
    cv_.notify_one();
}

}  // namespace warden::coordinator
