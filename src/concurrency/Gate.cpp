#include "concurrency/Gate.hpp"
#include "log/Registry.hpp"

#include <deque>
#include <memory>
#include <stdexcept>

using namespace rf::concurrency;

namespace {

// Handoffs triggered while this thread is already running a queued handler. They run
// after it returns instead of nesting, so a chain of releases never deepens the stack.
struct Handoff {
    std::shared_ptr<Gate> gate;
    Gate::Handler handler;
};

thread_local bool draining = false;
thread_local std::deque<Handoff> deferred;

}

void Gate::Token::release() noexcept {
    if (const auto gate = std::move(gate_)) gate->release();
}

std::shared_ptr<Gate> Gate::create(const size_t capacity) {
    if (capacity == 0) throw std::invalid_argument("Gate capacity must be at least 1");
    return std::shared_ptr<Gate>(new Gate(capacity));
}

Gate::Gate(const size_t capacity) : capacity_(capacity) {}

Gate::Token Gate::acquire() {
    std::unique_lock lock(mutex_);
    ++blocked_;
    cv_.wait(lock, [this] { return inFlight_ < capacity_; });
    --blocked_;
    ++inFlight_;
    return Token(shared_from_this());
}

void Gate::asyncAcquire(Handler handler) {
    {
        std::scoped_lock lock(mutex_);
        if (inFlight_ >= capacity_) {
            pending_.push_back(std::move(handler));
            log::Registry::gate()->debug("[Gate] At capacity ({}), {} waiting", capacity_, pending_.size());
            return;
        }
        ++inFlight_;
    }
    handler(Token(shared_from_this()));
}

void Gate::release() noexcept {
    Handler next;
    {
        std::scoped_lock lock(mutex_);
        if (!pending_.empty()) {
            // Hand the slot straight to the next queued handler; inFlight_ is unchanged.
            next = std::move(pending_.front());
            pending_.pop_front();
        } else {
            --inFlight_;
        }
    }

    if (!next) {
        cv_.notify_one();
        return;
    }

    if (draining) {
        deferred.push_back({shared_from_this(), std::move(next)});
        return;
    }

    draining = true;
    runHandoff(shared_from_this(), next);
    while (!deferred.empty()) {
        auto handoff = std::move(deferred.front());
        deferred.pop_front();
        handoff.gate->runHandoff(handoff.gate, handoff.handler);
    }
    draining = false;
}

void Gate::runHandoff(const std::shared_ptr<Gate>& self, const Handler& handler) noexcept {
    try {
        handler(Token(self));
    } catch (const std::exception& e) {
        log::Registry::gate()->error("[Gate] Queued handler threw: {}", e.what());
    }
}

size_t Gate::inFlight() const {
    std::scoped_lock lock(mutex_);
    return inFlight_;
}

size_t Gate::waiting() const {
    std::scoped_lock lock(mutex_);
    return pending_.size() + blocked_;
}
