#pragma once

#include <string>
#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <cstdint>
#include <core/types.hpp>
#include <core/constants.hpp>

// Bounded exponential backoff with jitter around one copy+verify unit.
// Only IoFailure and IntegrityMismatch are retried; any other error is
// returned at once. max_attempts counts every attempt, the first included.
class RetryPolicy {
public:
    using Unit = std::function<Result<uint64_t>(int attempt)>;
    using Cleanup = std::function<void()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryPolicy(int max_attempts = MAX_RETRY_ATTEMPTS,
                int base_delay_ms = RETRY_BASE_DELAY_MS,
                Sleeper sleeper = nullptr);

    // before_retry runs after a failed attempt and before the next one
    // (e.g. to delete a partial destination file).
    Result<uint64_t> run_with_retry(const Unit& unit,
                                    const Cleanup& before_retry = nullptr,
                                    const std::string& label = "") const;

    // Delay after failed attempt n (1-based): base * 2^(n-1) plus up to the
    // same amount again of random jitter.
    std::chrono::milliseconds backoff_after(int attempt) const;

    int max_attempts() const { return max_attempts_; }
    int base_delay_ms() const { return base_delay_ms_; }

    static bool is_retriable(ErrorKind kind) {
        return kind == ErrorKind::IoFailure || kind == ErrorKind::IntegrityMismatch;
    }

private:
    int max_attempts_;
    int base_delay_ms_;
    Sleeper sleeper_;

    mutable std::mutex rng_mutex_;
    mutable std::mt19937 rng_;
};
