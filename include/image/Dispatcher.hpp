#pragma once

#include "image/model/Encoding.hpp"
#include "image/model/ResizeSpec.hpp"

#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <variant>

namespace rf::concurrency {
class Gate;
class ThreadPool;
}

namespace rf::image {

class Pipeline;

struct Job {
    std::filesystem::path source;
    model::ResizeSpec to;
    model::Encoding encoding;
};

using Outcome = std::variant<model::Encoded, std::exception_ptr>;
using Completion = std::function<void(Outcome)>;

// Service-side entry to the pipeline: gate token first, then a worker from the pipeline
// pool. The completion runs on that worker after the token has been returned.
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<concurrency::Gate> gate,
               std::shared_ptr<concurrency::ThreadPool> pool,
               std::shared_ptr<const Pipeline> pipeline);

    void dispatch(Job job, Completion done) const;

private:
    std::shared_ptr<concurrency::Gate> gate_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::shared_ptr<const Pipeline> pipeline_;
};

}
