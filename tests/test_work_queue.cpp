#include "test_support.hpp"
#include <managers/work_queue.hpp>
#include <core/cancellation.hpp>
#include <algorithm>
#include <chrono>

using namespace std::chrono_literals;

// ── WorkQueue ───────────────────────────────────────────────

TEST(WorkQueue, FifoOrder) {
    WorkQueue<int> q;
    q.push(1);
    q.push(2);
    q.push(3);
    size_t remaining = 99;
    EXPECT_EQ(*q.pop(&remaining), 1);
    EXPECT_EQ(remaining, 2u);
    EXPECT_EQ(*q.pop(), 2);
    EXPECT_EQ(*q.pop(), 3);
}

TEST(WorkQueue, CloseDrainsThenStops) {
    WorkQueue<int> q;
    q.push(1);
    q.close();
    EXPECT_FALSE(q.push(2));
    EXPECT_EQ(*q.pop(), 1);
    EXPECT_FALSE(q.pop().has_value());
}

TEST(WorkQueue, AbortDropsPending) {
    WorkQueue<int> q;
    q.push(1);
    q.push(2);
    EXPECT_EQ(q.abort(), 2u);
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_EQ(q.size(), 0u);
}

TEST(WorkQueue, CloseWakesBlockedConsumers) {
    WorkQueue<int> q;
    std::atomic<int> finished{0};
    std::vector<std::thread> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.emplace_back([&] {
            while (q.pop()) {}
            finished++;
        });
    }
    std::this_thread::sleep_for(20ms);
    q.close();
    for (auto& t : consumers) t.join();
    EXPECT_EQ(finished.load(), 3);
}

TEST(WorkQueue, EveryItemConsumedOnce) {
    WorkQueue<int> q;
    std::mutex m;
    std::vector<int> seen;
    std::vector<std::thread> consumers;
    for (int i = 0; i < 4; ++i) {
        consumers.emplace_back([&] {
            while (auto v = q.pop()) {
                std::lock_guard<std::mutex> lock(m);
                seen.push_back(*v);
            }
        });
    }
    for (int i = 0; i < 1000; ++i) q.push(i);
    q.close();
    for (auto& t : consumers) t.join();

    std::sort(seen.begin(), seen.end());
    ASSERT_EQ(seen.size(), 1000u);
    for (int i = 0; i < 1000; ++i) EXPECT_EQ(seen[i], i);
}

// ── WaitGroup ───────────────────────────────────────────────

TEST(WaitGroup, WaitsForAllDone) {
    CancellationToken token;
    WaitGroup wg;
    wg.add(3);
    std::thread worker([&] {
        for (int i = 0; i < 3; ++i) {
            std::this_thread::sleep_for(5ms);
            wg.done();
        }
    });
    EXPECT_TRUE(wg.wait(token));
    EXPECT_EQ(wg.pending(), 0u);
    worker.join();
}

TEST(WaitGroup, NothingPendingReturnsImmediately) {
    CancellationToken token;
    WaitGroup wg;
    EXPECT_TRUE(wg.wait(token));
}

TEST(WaitGroup, CancellationWakesWaiter) {
    CancellationToken token;
    WaitGroup wg;
    wg.add(1);
    std::thread canceler([&] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    EXPECT_FALSE(wg.wait(token));
    canceler.join();
}

// ── CancellationToken ───────────────────────────────────────

TEST(CancellationToken, TransitionsOnce) {
    CancellationToken token;
    int calls = 0;
    token.add_listener([&] { ++calls; });
    EXPECT_FALSE(token.is_canceled());
    EXPECT_TRUE(token.cancel());
    EXPECT_FALSE(token.cancel());
    EXPECT_TRUE(token.is_canceled());
    EXPECT_EQ(calls, 1);
}

TEST(CancellationToken, LateListenerRunsImmediately) {
    CancellationToken token;
    token.cancel();
    bool ran = false;
    token.add_listener([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancellationToken, RemovedListenerNotCalled) {
    CancellationToken token;
    bool ran = false;
    {
        ScopedCancelListener guard(token, [&] { ran = true; });
    }
    token.cancel();
    EXPECT_FALSE(ran);
}

TEST(CancellationToken, WaitForTimesOut) {
    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(CancellationToken, WaitForWakesEarly) {
    CancellationToken token;
    std::thread canceler([&] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceler.join();
}
