#include "image/Dispatcher.hpp"
#include "image/task/Process.hpp"
#include "concurrency/Gate.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace rf::image;
using namespace rf::concurrency;

Dispatcher::Dispatcher(std::shared_ptr<Gate> gate,
                       std::shared_ptr<ThreadPool> pool,
                       std::shared_ptr<const Pipeline> pipeline)
    : gate_(std::move(gate)), pool_(std::move(pool)), pipeline_(std::move(pipeline)) {
    if (!gate_) throw std::invalid_argument("Dispatcher requires a gate");
    if (!pool_) throw std::invalid_argument("Dispatcher requires a thread pool");
    if (!pipeline_) throw std::invalid_argument("Dispatcher requires a pipeline");
}

void Dispatcher::dispatch(Job job, Completion done) const {
    gate_->asyncAcquire([pool = pool_, pipeline = pipeline_, job = std::move(job), done = std::move(done)]
                        (Gate::Token token) mutable {
        if (pool->isStopped()) {
            token.release();
            done(std::make_exception_ptr(std::runtime_error("pipeline pool is stopped")));
            return;
        }

        auto task = std::make_shared<task::Process>(std::move(token), pipeline, std::move(job), done);
        try {
            pool->submit(task);
        } catch (const std::exception& e) {
            // Stopped between the check and the submit. Dropping the task completes it with an error.
            log::Registry::pipeline()->error("[Dispatcher] Failed to submit pipeline task: {}", e.what());
        }
    });
}
