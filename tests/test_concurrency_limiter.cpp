#include <gtest/gtest.h>
#include <transfer/concurrency_limiter.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

TEST(ConcurrencyLimiter, PermitReleasedOnScopeExit) {
    ConcurrencyLimiter limiter(2);
    {
        auto a = limiter.acquire();
        auto b = limiter.acquire();
        EXPECT_EQ(limiter.in_use(), 2);
        EXPECT_FALSE(limiter.try_acquire().held());
    }
    EXPECT_EQ(limiter.in_use(), 0);
    EXPECT_TRUE(limiter.try_acquire().held());
    EXPECT_EQ(limiter.in_use(), 0);
}

TEST(ConcurrencyLimiter, MovedPermitReleasesOnce) {
    ConcurrencyLimiter limiter(1);
    {
        auto a = limiter.acquire();
        ConcurrencyLimiter::Permit b = std::move(a);
        EXPECT_FALSE(a.held());
        EXPECT_TRUE(b.held());
        EXPECT_EQ(limiter.in_use(), 1);
    }
    EXPECT_EQ(limiter.in_use(), 0);
}

TEST(ConcurrencyLimiter, ExplicitReleaseIsIdempotent) {
    ConcurrencyLimiter limiter(1);
    auto p = limiter.acquire();
    p.release();
    p.release();
    EXPECT_EQ(limiter.in_use(), 0);
}

TEST(ConcurrencyLimiter, NeverExceedsCapacity) {
    const int capacity = 4;
    const int workers = 16;
    ConcurrencyLimiter limiter(capacity);

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < workers; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto permit = limiter.acquire();
                int now = ++active;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                --active;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), capacity);
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(limiter.in_use(), 0);
}

TEST(ConcurrencyLimiter, RaisingCapacityWakesWaiters) {
    ConcurrencyLimiter limiter(1);
    auto held = limiter.acquire();

    std::atomic<bool> got{false};
    std::thread waiter([&] {
        auto p = limiter.acquire();
        got = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(got.load());

    limiter.set_capacity(2);
    waiter.join();
    EXPECT_TRUE(got.load());
}

TEST(ConcurrencyLimiter, ShrinkingKeepsHeldPermits) {
    ConcurrencyLimiter limiter(3);
    auto a = limiter.acquire();
    auto b = limiter.acquire();
    limiter.set_capacity(1);

    EXPECT_EQ(limiter.in_use(), 2);
    EXPECT_FALSE(limiter.try_acquire().held());
    a.release();
    EXPECT_FALSE(limiter.try_acquire().held());
    b.release();
    EXPECT_TRUE(limiter.try_acquire().held());
}
