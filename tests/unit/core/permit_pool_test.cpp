#include <gtest/gtest.h>
#include <vellum/core/permit_pool.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace vellum::core;
using namespace std::chrono_literals;

TEST(PermitPoolTest, RejectsZeroPermits) {
    EXPECT_THROW(PermitPool(0, 1), std::invalid_argument);
    EXPECT_THROW(PermitPool(1, 0), std::invalid_argument);
}

TEST(PermitPoolTest, AcquireTimesOutWhenExhausted) {
    PermitPool pool(1, 1);
    ASSERT_TRUE(pool.acquire(PermitLane::Embedding, 10ms));
    EXPECT_FALSE(pool.acquire(PermitLane::Embedding, 10ms));

    // Lanes are independent
    EXPECT_TRUE(pool.acquire(PermitLane::Reranker, 10ms));

    auto m = pool.metrics(PermitLane::Embedding);
    EXPECT_EQ(m.capacity, 1u);
    EXPECT_EQ(m.inFlight, 1u);
    EXPECT_EQ(m.timeouts, 1u);

    pool.release(PermitLane::Embedding);
    pool.release(PermitLane::Reranker);
    EXPECT_EQ(pool.metrics(PermitLane::Embedding).inFlight, 0u);
}

TEST(PermitPoolTest, RaiiPermitReleasesOnScopeExit) {
    PermitPool pool(1, 1);
    {
        PermitPool::Permit permit(pool, PermitLane::Embedding, 10ms);
        ASSERT_TRUE(permit);
        PermitPool::Permit second(pool, PermitLane::Embedding, 5ms);
        EXPECT_FALSE(second.acquired());
    }
    PermitPool::Permit again(pool, PermitLane::Embedding, 10ms);
    EXPECT_TRUE(again.acquired());
}

TEST(PermitPoolTest, ConcurrencyNeverExceedsCapacity) {
    PermitPool pool(3, 1);
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                PermitPool::Permit permit(pool, PermitLane::Embedding, 5s);
                ASSERT_TRUE(permit);
                int now = ++inside;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(200us);
                --inside;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_LE(peak.load(), 3);
    EXPECT_LE(pool.metrics(PermitLane::Embedding).peakInFlight, 3u);
    EXPECT_EQ(pool.metrics(PermitLane::Embedding).inFlight, 0u);
}
