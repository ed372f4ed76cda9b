#include <gtest/gtest.h>
#include "concurrency/Gate.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace rf::concurrency;
using namespace std::chrono_literals;

namespace {

// Tracks the highest concurrent count seen.
struct Peak {
    std::atomic<int> current{0};
    std::atomic<int> max{0};

    void enter() {
        const int now = ++current;
        int seen = max.load();
        while (now > seen && !max.compare_exchange_weak(seen, now)) {}
    }
    void leave() { --current; }
};

}

TEST(GateTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(Gate::create(0), std::invalid_argument);
}

TEST(GateTest, TokensReleaseOnDestruction) {
    const auto gate = Gate::create(2);
    {
        auto a = gate->acquire();
        auto b = gate->acquire();
        EXPECT_EQ(gate->inFlight(), 2u);
    }
    EXPECT_EQ(gate->inFlight(), 0u);
}

TEST(GateTest, ReleaseIsIdempotentAndMoveSafe) {
    const auto gate = Gate::create(1);
    auto a = gate->acquire();
    auto b = std::move(a);
    EXPECT_FALSE(static_cast<bool>(a));
    EXPECT_TRUE(static_cast<bool>(b));
    b.release();
    b.release();
    a.release();
    EXPECT_EQ(gate->inFlight(), 0u);
}

TEST(GateTest, BlockingAcquireNeverExceedsCapacity) {
    constexpr size_t N = 4;
    constexpr int extra = 12;
    const auto gate = Gate::create(N);
    Peak peak;
    std::atomic<int> completed{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < static_cast<int>(N) + extra; ++i) {
        threads.emplace_back([&] {
            const auto token = gate->acquire();
            peak.enter();
            std::this_thread::sleep_for(10ms);
            peak.leave();
            ++completed;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.max.load(), static_cast<int>(N));
    EXPECT_GE(peak.max.load(), 1);
    EXPECT_EQ(completed.load(), static_cast<int>(N) + extra);
    EXPECT_EQ(gate->inFlight(), 0u);
    EXPECT_EQ(gate->waiting(), 0u);
}

TEST(GateTest, AsyncAcquireRunsImmediatelyWhenFree) {
    const auto gate = Gate::create(1);
    bool ran = false;
    gate->asyncAcquire([&](Gate::Token token) {
        ran = true;
        EXPECT_TRUE(static_cast<bool>(token));
        EXPECT_EQ(gate->inFlight(), 1u);
    });
    EXPECT_TRUE(ran);
    EXPECT_EQ(gate->inFlight(), 0u);
}

TEST(GateTest, AsyncAcquireQueuesAndHandsOffInOrder) {
    const auto gate = Gate::create(1);
    auto held = gate->acquire();

    std::vector<int> order;
    std::vector<Gate::Token> kept;
    kept.reserve(3);
    for (int i = 0; i < 3; ++i)
        gate->asyncAcquire([&, i](Gate::Token token) {
            order.push_back(i);
            kept.push_back(std::move(token));
        });

    EXPECT_TRUE(order.empty());
    EXPECT_EQ(gate->waiting(), 3u);

    held.release();
    ASSERT_EQ(order, (std::vector{0}));
    EXPECT_EQ(gate->inFlight(), 1u);

    // Releasing the handed-off token wakes the next handler, one at a time.
    auto first = std::move(kept.front());
    first.release();
    EXPECT_EQ(order, (std::vector{0, 1}));

    kept[1].release();
    EXPECT_EQ(order, (std::vector{0, 1, 2}));
    kept[2].release();

    EXPECT_EQ(gate->inFlight(), 0u);
    EXPECT_EQ(gate->waiting(), 0u);
}

TEST(GateTest, AsyncUnderLoadStaysWithinCapacity) {
    constexpr size_t N = 3;
    constexpr int jobs = 40;
    const auto gate = Gate::create(N);
    Peak peak;
    std::atomic<int> completed{0};

    std::mutex m;
    std::vector<std::thread> workers;

    for (int i = 0; i < jobs; ++i) {
        gate->asyncAcquire([&](Gate::Token token) {
            peak.enter();
            std::scoped_lock lock(m);
            workers.emplace_back([&, t = std::move(token)]() mutable {
                std::this_thread::sleep_for(2ms);
                peak.leave();
                ++completed;
                t.release();
            });
        });
    }

    // Handlers may spawn more workers while we wait; poll until all finished.
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (completed.load() < jobs && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);

    {
        std::scoped_lock lock(m);
        for (auto& w : workers) w.join();
    }

    EXPECT_EQ(completed.load(), jobs);
    EXPECT_LE(peak.max.load(), static_cast<int>(N));
    EXPECT_EQ(gate->inFlight(), 0u);
}

TEST(GateTest, ChainedHandoffsDoNotNest) {
    const auto gate = Gate::create(1);
    auto held = gate->acquire();

    constexpr int waiters = 10000;
    int depth = 0, maxDepth = 0, ran = 0;
    for (int i = 0; i < waiters; ++i)
        gate->asyncAcquire([&](Gate::Token token) {
            maxDepth = std::max(maxDepth, ++depth);
            ++ran;
            token.release(); // hands the slot on from inside the handler
            --depth;
        });

    held.release();
    EXPECT_EQ(ran, waiters);
    EXPECT_EQ(maxDepth, 1);
    EXPECT_EQ(gate->inFlight(), 0u);
    EXPECT_EQ(gate->waiting(), 0u);
}
