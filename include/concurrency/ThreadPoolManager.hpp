#pragma once

#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

namespace rf::concurrency {

// Owns the pool that runs CPU-bound pipeline work, apart from the I/O threads.
class ThreadPoolManager {
public:
    static ThreadPoolManager& instance() {
        static ThreadPoolManager instance;
        return instance;
    }

    void init(unsigned int pipelineThreads = 0) {
        if (running_.exchange(true)) return; // already running

        pipeline_ = std::make_shared<ThreadPool>(pipelineThreads);
        log::Registry::reframe()->info("[ThreadPoolManager] Pipeline pool started with {} workers",
                                       pipeline_->workerCount());
    }

    void shutdown() {
        if (!running_.exchange(false)) return;

        log::Registry::reframe()->info("[ThreadPoolManager] Stopping thread pools...");
        if (pipeline_) pipeline_->stop();
    }

    std::shared_ptr<ThreadPool> pipelinePool() const {
        if (!pipeline_) throw std::runtime_error("ThreadPoolManager used before init()");
        return pipeline_;
    }

private:
    ThreadPoolManager() = default;
    ~ThreadPoolManager() { if (pipeline_) pipeline_->stop(); }

    std::shared_ptr<ThreadPool> pipeline_;
    std::atomic<bool> running_{false};
};

}
