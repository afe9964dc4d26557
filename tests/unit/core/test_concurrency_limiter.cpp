/**
 * @file test_concurrency_limiter.cpp
 * @brief Unit tests for concurrency_limiter and cancellation_token
 */

#include <gtest/gtest.h>

#include <chunked_upload/core/cancellation_token.h>
#include <chunked_upload/core/concurrency_limiter.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace chunked_upload::test {

using namespace std::chrono_literals;

namespace {

/**
 * @brief Spin until the limiter reports `count` queued acquirers
 */
auto wait_for_waiters(const concurrency_limiter& limiter, std::size_t count) -> bool {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (limiter.waiting() >= count) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return false;
}

}  // namespace

// =============================================================================
// concurrency_limiter
// =============================================================================

class ConcurrencyLimiterTest : public ::testing::Test {};

TEST_F(ConcurrencyLimiterTest, InitialState) {
    concurrency_limiter limiter(3);
    EXPECT_EQ(limiter.capacity(), 3u);
    EXPECT_EQ(limiter.available(), 3u);
    EXPECT_EQ(limiter.in_use(), 0u);
    EXPECT_EQ(limiter.waiting(), 0u);
}

TEST_F(ConcurrencyLimiterTest, AcquireWithoutWaiting) {
    concurrency_limiter limiter(2);
    ASSERT_TRUE(limiter.acquire());
    ASSERT_TRUE(limiter.acquire());
    EXPECT_EQ(limiter.available(), 0u);
    EXPECT_EQ(limiter.in_use(), 2u);
    EXPECT_FALSE(limiter.try_acquire());

    limiter.release();
    EXPECT_EQ(limiter.available(), 1u);
    EXPECT_TRUE(limiter.try_acquire());
}

TEST_F(ConcurrencyLimiterTest, ReleaseNeverExceedsCapacity) {
    concurrency_limiter limiter(1);
    limiter.release();
    limiter.release();
    EXPECT_EQ(limiter.available(), 1u);
}

TEST_F(ConcurrencyLimiterTest, WaitersAreServedInArrivalOrder) {
    concurrency_limiter limiter(1);
    ASSERT_TRUE(limiter.acquire());

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> threads;

    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i]() {
            if (limiter.acquire()) {
                {
                    std::lock_guard<std::mutex> lock(order_mutex);
                    order.push_back(i);
                }
                limiter.release();
            }
        });
        // Let waiter i queue before waiter i+1 arrives.
        ASSERT_TRUE(wait_for_waiters(limiter, static_cast<std::size_t>(i + 1)));
    }

    limiter.release();
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST_F(ConcurrencyLimiterTest, ReleaseHandsPermitToWaiter) {
    concurrency_limiter limiter(1);
    ASSERT_TRUE(limiter.acquire());

    std::atomic<bool> acquired{false};
    std::atomic<bool> done{false};
    std::thread waiter([&]() {
        if (limiter.acquire()) {
            acquired = true;
            while (!done) {
                std::this_thread::sleep_for(1ms);
            }
            limiter.release();
        }
    });
    ASSERT_TRUE(wait_for_waiters(limiter, 1));

    limiter.release();

    // The permit went straight to the waiter, so nothing is free.
    EXPECT_EQ(limiter.available(), 0u);
    EXPECT_FALSE(limiter.try_acquire());

    done = true;
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(limiter.available(), 1u);
}

TEST_F(ConcurrencyLimiterTest, NeverExceedsCapacityUnderContention) {
    concurrency_limiter limiter(3);
    std::atomic<int> current{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            for (int n = 0; n < 20; ++n) {
                if (!limiter.acquire()) {
                    return;
                }
                int now = ++current;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(100us);
                --current;
                limiter.release();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(limiter.available(), 3u);
}

TEST_F(ConcurrencyLimiterTest, CancelledTokenFailsImmediately) {
    concurrency_limiter limiter(1);
    cancellation_token token;
    token.cancel();

    auto acquired = limiter.acquire(token);
    ASSERT_FALSE(acquired);
    EXPECT_EQ(acquired.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(limiter.available(), 1u);
}

TEST_F(ConcurrencyLimiterTest, CancellationWakesWaiter) {
    concurrency_limiter limiter(1);
    ASSERT_TRUE(limiter.acquire());

    cancellation_token token;
    result<void> outcome;
    std::thread waiter([&]() { outcome = limiter.acquire(token); });
    ASSERT_TRUE(wait_for_waiters(limiter, 1));

    token.cancel();
    waiter.join();

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(limiter.waiting(), 0u);

    // The permit held by the test is still the only one in use.
    EXPECT_EQ(limiter.in_use(), 1u);
    limiter.release();
    EXPECT_EQ(limiter.available(), 1u);
}

TEST_F(ConcurrencyLimiterTest, ShutdownRejectsWaiters) {
    concurrency_limiter limiter(1);
    ASSERT_TRUE(limiter.acquire());

    result<void> outcome;
    std::thread waiter([&]() { outcome = limiter.acquire(); });
    ASSERT_TRUE(wait_for_waiters(limiter, 1));

    limiter.shutdown();
    waiter.join();

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::invalid_state);

    auto after = limiter.acquire();
    ASSERT_FALSE(after);
    EXPECT_EQ(after.error().code, error_code::invalid_state);
}

TEST_F(ConcurrencyLimiterTest, ScopedPermitReleases) {
    concurrency_limiter limiter(1);
    {
        ASSERT_TRUE(limiter.acquire());
        scoped_permit permit(limiter);
        EXPECT_TRUE(permit.owns_permit());
        EXPECT_EQ(limiter.available(), 0u);

        scoped_permit moved(std::move(permit));
        EXPECT_FALSE(permit.owns_permit());
        EXPECT_TRUE(moved.owns_permit());
    }
    EXPECT_EQ(limiter.available(), 1u);
}

// =============================================================================
// cancellation_token
// =============================================================================

class CancellationTokenTest : public ::testing::Test {};

TEST_F(CancellationTokenTest, StartsUncancelled) {
    cancellation_token token;
    EXPECT_FALSE(token.is_cancelled());
}

TEST_F(CancellationTokenTest, CopiesShareState) {
    cancellation_token token;
    auto copy = token;
    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
}

TEST_F(CancellationTokenTest, CallbacksRunOnce) {
    cancellation_token token;
    int calls = 0;
    token.subscribe([&]() { ++calls; });

    token.cancel();
    token.cancel();
    EXPECT_EQ(calls, 1);
}

TEST_F(CancellationTokenTest, SubscribeAfterCancelRunsImmediately) {
    cancellation_token token;
    token.cancel();

    int calls = 0;
    auto id = token.subscribe([&]() { ++calls; });
    EXPECT_EQ(id, 0u);
    EXPECT_EQ(calls, 1);
}

TEST_F(CancellationTokenTest, UnsubscribedCallbackDoesNotRun) {
    cancellation_token token;
    int calls = 0;
    {
        cancellation_subscription sub(token, [&]() { ++calls; });
    }
    token.cancel();
    EXPECT_EQ(calls, 0);
}

TEST_F(CancellationTokenTest, WaitForTimesOut) {
    cancellation_token token;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST_F(CancellationTokenTest, WaitForEndsEarlyOnCancel) {
    cancellation_token token;
    std::thread canceller([token]() {
        std::this_thread::sleep_for(10ms);
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

}  // namespace chunked_upload::test
