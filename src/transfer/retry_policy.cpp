#include "retry_policy.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <thread>

RetryPolicy::RetryPolicy(int max_attempts, int base_delay_ms, Sleeper sleeper)
    : max_attempts_(max_attempts > 0 ? max_attempts : 1),
      base_delay_ms_(base_delay_ms >= 0 ? base_delay_ms : 0),
      sleeper_(std::move(sleeper)),
      rng_(std::random_device{}()) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::milliseconds RetryPolicy::backoff_after(int attempt) const {
    int shift = attempt > 1 ? attempt - 1 : 0;
    if (shift > 20) shift = 20;
    int64_t base = static_cast<int64_t>(base_delay_ms_) << shift;

    int64_t jitter = 0;
    if (base > 0) {
        std::uniform_int_distribution<int64_t> dist(0, base);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        jitter = dist(rng_);
    }
    return std::chrono::milliseconds(base + jitter);
}

Result<uint64_t> RetryPolicy::run_with_retry(const Unit& unit,
                                             const Cleanup& before_retry,
                                             const std::string& label) const {
    Result<uint64_t> last = Result<uint64_t>::Err(ErrorKind::IoFailure, "no attempt made");

    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        last = unit(attempt);
        if (last.is_ok()) {
            if (attempt > 1) {
                haul_log(fmt::format("retry: {} succeeded on attempt {}", label, attempt));
            }
            return last;
        }

        haul_log(fmt::format("retry: {} attempt {}/{} failed ({}): {}", label, attempt,
                             max_attempts_, error_kind_name(last.kind), last.error));

        if (!is_retriable(last.kind) || attempt == max_attempts_) {
            break;
        }

        if (before_retry) before_retry();
        sleeper_(backoff_after(attempt));
    }

    return last;
}
