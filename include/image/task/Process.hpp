#pragma once

#include "concurrency/Task.hpp"
#include "concurrency/Gate.hpp"
#include "image/Dispatcher.hpp"
#include "image/Pipeline.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <stdexcept>

namespace rf::image::task {

class Process final : public concurrency::Task {
public:
    Process(concurrency::Gate::Token token,
            std::shared_ptr<const Pipeline> pipeline,
            Job job,
            Completion done)
        : token_(std::move(token)), pipeline_(std::move(pipeline)), job_(std::move(job)), done_(std::move(done)) {}

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // Dropped from a stopping pool without running: the caller still hears back.
    ~Process() override {
        if (ran_) return;
        token_.release();
        try {
            done_(std::make_exception_ptr(std::runtime_error("pipeline pool stopped before the job ran")));
        } catch (const std::exception& e) {
            log::Registry::pipeline()->error("[task::Process] Completion for {} threw: {}", job_.source.string(), e.what());
        }
    }

    void operator()() override {
        ran_ = true;
        Outcome outcome;
        try {
            outcome = pipeline_->process(job_.source, job_.to, job_.encoding);
        } catch (const std::exception& e) {
            log::Registry::pipeline()->debug("[task::Process] {} failed: {}", job_.source.string(), e.what());
            outcome = std::current_exception();
        }

        token_.release();
        done_(std::move(outcome));
    }

private:
    concurrency::Gate::Token token_;
    std::shared_ptr<const Pipeline> pipeline_;
    Job job_;
    Completion done_;
    bool ran_ = false;
};

}
