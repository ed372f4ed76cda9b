#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace rf::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks, lets running ones finish and joins the workers.
    void stop();

    // Throws std::runtime_error once the pool is stopped.
    void submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] bool isStopped() const noexcept { return stopFlag.load(); }

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
