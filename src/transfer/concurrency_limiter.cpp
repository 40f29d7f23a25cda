#include "concurrency_limiter.hpp"

ConcurrencyLimiter::ConcurrencyLimiter(int capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

ConcurrencyLimiter::Permit ConcurrencyLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_use_ < capacity_; });
    ++in_use_;
    return Permit(this);
}

ConcurrencyLimiter::Permit ConcurrencyLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ >= capacity_) {
        return Permit();
    }
    ++in_use_;
    return Permit(this);
}

void ConcurrencyLimiter::set_capacity(int capacity) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = capacity > 0 ? capacity : 1;
    }
    cv_.notify_all();
}

int ConcurrencyLimiter::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

int ConcurrencyLimiter::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

void ConcurrencyLimiter::release_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_one();
}
