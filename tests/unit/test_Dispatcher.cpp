#include <gtest/gtest.h>
#include "fixtures.hpp"
#include "concurrency/Gate.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/Task.hpp"
#include "image/Dispatcher.hpp"
#include "image/Pipeline.hpp"
#include "image/Error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>

using namespace rf;
using namespace rf::image;
using namespace rf::image::model;
using namespace std::chrono_literals;

namespace {

struct Counter final : concurrency::Task {
    std::atomic<int>& hits;
    explicit Counter(std::atomic<int>& h) : hits(h) {}
    void operator()() override { ++hits; }
};

// Parks its worker until released.
struct Blocker final : concurrency::Task {
    std::atomic<bool>& started;
    std::atomic<bool>& release;
    Blocker(std::atomic<bool>& s, std::atomic<bool>& r) : started(s), release(r) {}
    void operator()() override {
        started = true;
        while (!release.load()) std::this_thread::sleep_for(1ms);
    }
};

// Holds a gate slot for as long as it runs, like a queued pipeline job.
struct SlotHolder final : concurrency::Task {
    concurrency::Gate::Token token;
    std::atomic<bool>& started;
    std::atomic<bool>& release;
    SlotHolder(concurrency::Gate::Token t, std::atomic<bool>& s, std::atomic<bool>& r)
        : token(std::move(t)), started(s), release(r) {}
    void operator()() override {
        started = true;
        while (!release.load()) std::this_thread::sleep_for(1ms);
    }
};

struct Thrower final : concurrency::Task {
    void operator()() override { throw std::runtime_error("boom"); }
};

// Collects outcomes from worker threads.
class Outcomes {
public:
    Completion completion() {
        return [this](Outcome o) {
            std::scoped_lock lock(m_);
            outcomes_.push_back(std::move(o));
            cv_.notify_all();
        };
    }

    bool waitFor(const size_t n, const std::chrono::seconds timeout = 60s) {
        std::unique_lock lock(m_);
        return cv_.wait_for(lock, timeout, [&] { return outcomes_.size() >= n; });
    }

    std::vector<Outcome> take() {
        std::scoped_lock lock(m_);
        return std::move(outcomes_);
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    std::vector<Outcome> outcomes_;
};

}

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    concurrency::ThreadPool pool(3);
    EXPECT_EQ(pool.workerCount(), 3u);

    std::atomic<int> hits{0};
    for (int i = 0; i < 50; ++i) pool.submit(std::make_shared<Counter>(hits));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (hits.load() < 50 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    EXPECT_EQ(hits.load(), 50);
}

TEST(ThreadPoolTest, WorkerSurvivesThrowingTask) {
    concurrency::ThreadPool pool(1);
    std::atomic<int> hits{0};
    pool.submit(std::make_shared<Thrower>());
    pool.submit(std::make_shared<Counter>(hits));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (hits.load() < 1 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    EXPECT_EQ(hits.load(), 1);
}

TEST(ThreadPoolTest, QueueDepthCountsWaitingTasks) {
    concurrency::ThreadPool pool(1);
    std::atomic<bool> started{false}, release{false};
    std::atomic<int> hits{0};

    pool.submit(std::make_shared<Blocker>(started, release));
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!started.load() && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    ASSERT_TRUE(started.load());

    for (int i = 0; i < 3; ++i) pool.submit(std::make_shared<Counter>(hits));
    EXPECT_EQ(pool.queueDepth(), 3u);

    release = true;
    while (hits.load() < 3 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    EXPECT_EQ(hits.load(), 3);
    EXPECT_EQ(pool.queueDepth(), 0u);
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    concurrency::ThreadPool pool(1);
    pool.stop();
    std::atomic<int> hits{0};
    EXPECT_THROW(pool.submit(std::make_shared<Counter>(hits)), std::runtime_error);
}

TEST(ThreadPoolTest, StopReturnsWhileGateHasWaiters) {
    const auto gate = concurrency::Gate::create(4);
    const auto pool = std::make_shared<concurrency::ThreadPool>(1);
    std::atomic<bool> started{false}, release{false};
    std::atomic<int> rejected{0};

    for (int i = 0; i < 8; ++i)
        gate->asyncAcquire([&, pool](concurrency::Gate::Token token) {
            try {
                pool->submit(std::make_shared<SlotHolder>(std::move(token), started, release));
            } catch (const std::runtime_error&) {
                ++rejected;
            }
        });

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!started.load() && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    ASSERT_TRUE(started.load());
    EXPECT_EQ(gate->inFlight(), 4u);
    EXPECT_EQ(gate->waiting(), 4u);
    EXPECT_EQ(pool->queueDepth(), 3u);

    std::promise<void> stopped;
    auto stopDone = stopped.get_future();
    std::thread stopper([&] {
        pool->stop();
        stopped.set_value();
    });

    // The three dropped tasks free their slots, and every waiter is turned away by the stopped pool.
    deadline = std::chrono::steady_clock::now() + 5s;
    while (rejected.load() < 4 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    release = true;

    const bool returned = stopDone.wait_for(5s) == std::future_status::ready;
    if (returned) stopper.join();
    else stopper.detach();
    ASSERT_TRUE(returned);

    EXPECT_EQ(rejected.load(), 4);
    EXPECT_EQ(gate->inFlight(), 0u);
    EXPECT_EQ(gate->waiting(), 0u);
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        rf::test::writePng(dir_ / "small.png", 64, 48);
        EncodeConfig cfg;
        cfg.speed = 10;
        pipeline_ = std::make_shared<const Pipeline>(cfg);
    }

    rf::test::TempDir dir_{"reframe_dispatcher"};
    std::shared_ptr<const Pipeline> pipeline_;
};

TEST_F(DispatcherTest, RejectsMissingCollaborators) {
    const auto gate = concurrency::Gate::create(1);
    const auto pool = std::make_shared<concurrency::ThreadPool>(1);
    EXPECT_THROW(Dispatcher(nullptr, pool, pipeline_), std::invalid_argument);
    EXPECT_THROW(Dispatcher(gate, nullptr, pipeline_), std::invalid_argument);
    EXPECT_THROW(Dispatcher(gate, pool, nullptr), std::invalid_argument);
}

TEST_F(DispatcherTest, DeliversEncodedImage) {
    const auto gate = concurrency::Gate::create(2);
    const auto pool = std::make_shared<concurrency::ThreadPool>(2);
    const Dispatcher dispatcher(gate, pool, pipeline_);

    Outcomes outcomes;
    dispatcher.dispatch({dir_ / "small.png", Width{32}, Encoding::Jpeg}, outcomes.completion());
    ASSERT_TRUE(outcomes.waitFor(1));

    auto results = outcomes.take();
    const auto* encoded = std::get_if<Encoded>(&results.front());
    ASSERT_NE(encoded, nullptr);
    EXPECT_EQ(rf::test::decodedSize(*encoded), (std::pair{32u, 24u}));
    EXPECT_EQ(gate->inFlight(), 0u);
}

TEST_F(DispatcherTest, DeliversPipelineErrors) {
    const auto gate = concurrency::Gate::create(1);
    const auto pool = std::make_shared<concurrency::ThreadPool>(1);
    const Dispatcher dispatcher(gate, pool, pipeline_);

    Outcomes outcomes;
    dispatcher.dispatch({dir_ / "missing.png", Width{32}, Encoding::Jpeg}, outcomes.completion());
    dispatcher.dispatch({dir_ / "small.png", WidthAndHeight{0, 10}, Encoding::Jpeg}, outcomes.completion());
    ASSERT_TRUE(outcomes.waitFor(2));

    int notFound = 0, failed = 0;
    for (auto& o : outcomes.take()) {
        ASSERT_TRUE(std::holds_alternative<std::exception_ptr>(o));
        try {
            std::rethrow_exception(std::get<std::exception_ptr>(o));
        } catch (const NotFound&) {
            ++notFound;
        } catch (const FailedToResize&) {
            ++failed;
        }
    }
    EXPECT_EQ(notFound, 1);
    EXPECT_EQ(failed, 1);
    EXPECT_EQ(gate->inFlight(), 0u);
}

TEST_F(DispatcherTest, PeakConcurrencyHonorsGate) {
    constexpr size_t N = 2;
    constexpr int jobs = 12;
    const auto gate = concurrency::Gate::create(N);
    const auto pool = std::make_shared<concurrency::ThreadPool>(6);
    const Dispatcher dispatcher(gate, pool, pipeline_);

    std::atomic<bool> done{false};
    std::atomic<size_t> peak{0};
    std::thread sampler([&] {
        while (!done.load()) {
            peak.store(std::max(peak.load(), gate->inFlight()));
            std::this_thread::sleep_for(100us);
        }
    });

    Outcomes outcomes;
    for (int i = 0; i < jobs; ++i)
        dispatcher.dispatch({dir_ / "small.png", Scale{4.0}, Encoding::Avif}, outcomes.completion());

    const bool finished = outcomes.waitFor(jobs);
    done = true;
    sampler.join();
    ASSERT_TRUE(finished);

    auto results = outcomes.take();
    ASSERT_EQ(results.size(), static_cast<size_t>(jobs));
    for (const auto& o : results) EXPECT_TRUE(std::holds_alternative<Encoded>(o));

    EXPECT_LE(peak.load(), N);
    EXPECT_EQ(gate->inFlight(), 0u);
    EXPECT_EQ(gate->waiting(), 0u);
}

TEST_F(DispatcherTest, StoppedPoolFailsJobsWaitingAtTheGate) {
    const auto gate = concurrency::Gate::create(1);
    const auto pool = std::make_shared<concurrency::ThreadPool>(1);
    const Dispatcher dispatcher(gate, pool, pipeline_);

    auto held = gate->acquire();
    Outcomes outcomes;
    for (int i = 0; i < 5; ++i)
        dispatcher.dispatch({dir_ / "small.png", Width{16}, Encoding::Jpeg}, outcomes.completion());
    EXPECT_EQ(gate->waiting(), 5u);

    pool->stop();
    held.release();

    ASSERT_TRUE(outcomes.waitFor(5, 5s));
    for (auto& o : outcomes.take()) {
        ASSERT_TRUE(std::holds_alternative<std::exception_ptr>(o));
        EXPECT_THROW(std::rethrow_exception(std::get<std::exception_ptr>(o)), std::runtime_error);
    }
    EXPECT_EQ(gate->inFlight(), 0u);
    EXPECT_EQ(gate->waiting(), 0u);
}

TEST_F(DispatcherTest, StopUnderLoadCompletesEveryJob) {
    constexpr size_t N = 4, jobs = 12;
    const auto gate = concurrency::Gate::create(N);
    const auto pool = std::make_shared<concurrency::ThreadPool>(1);
    const Dispatcher dispatcher(gate, pool, pipeline_);

    Outcomes outcomes;
    for (size_t i = 0; i < jobs; ++i)
        dispatcher.dispatch({dir_ / "small.png", Width{32}, Encoding::Jpeg}, outcomes.completion());

    std::promise<void> stopped;
    auto stopDone = stopped.get_future();
    std::thread stopper([&] {
        pool->stop();
        stopped.set_value();
    });

    const bool returned = stopDone.wait_for(30s) == std::future_status::ready;
    if (returned) stopper.join();
    else stopper.detach();
    ASSERT_TRUE(returned);

    ASSERT_TRUE(outcomes.waitFor(jobs, 30s));
    EXPECT_EQ(outcomes.take().size(), jobs);
    EXPECT_EQ(gate->inFlight(), 0u);
    EXPECT_EQ(gate->waiting(), 0u);
}
