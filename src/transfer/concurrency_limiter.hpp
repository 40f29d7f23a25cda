#pragma once

#include <mutex>
#include <condition_variable>

// Counting permit pool bounding simultaneous file copies across the process.
// A unit holds at most one permit and acquires nothing else while holding it.
class ConcurrencyLimiter {
public:
    // Released on destruction; move-only.
    class Permit {
    public:
        Permit() = default;
        explicit Permit(ConcurrencyLimiter* owner) : owner_(owner) {}
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        bool held() const { return owner_ != nullptr; }

        void release() {
            if (owner_) {
                owner_->release_one();
                owner_ = nullptr;
            }
        }

    private:
        ConcurrencyLimiter* owner_ = nullptr;
    };

    explicit ConcurrencyLimiter(int capacity);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    // Blocks until a permit is free.
    Permit acquire();

    // Returns an empty permit if none is free.
    Permit try_acquire();

    // Shrinking never revokes held permits; new acquisitions wait until
    // in_use() drops below the new capacity.
    void set_capacity(int capacity);

    int capacity() const;
    int in_use() const;

private:
    void release_one();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int capacity_;
    int in_use_ = 0;
};
