#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace rf::concurrency {

// Counting admission control in front of pipeline runs. At most capacity() tokens are
// outstanding at any instant; callers beyond that wait, they are never rejected.
class Gate : public std::enable_shared_from_this<Gate> {
public:
    class Token {
    public:
        Token() = default;
        ~Token() { release(); }

        Token(const Token&) = delete;
        Token& operator=(const Token&) = delete;

        Token(Token&& other) noexcept : gate_(std::move(other.gate_)) {}
        Token& operator=(Token&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = std::move(other.gate_);
            }
            return *this;
        }

        // Idempotent; also runs on destruction.
        void release() noexcept;

        explicit operator bool() const noexcept { return static_cast<bool>(gate_); }

    private:
        friend class Gate;
        explicit Token(std::shared_ptr<Gate> gate) : gate_(std::move(gate)) {}

        std::shared_ptr<Gate> gate_;
    };

    using Handler = std::function<void(Token)>;

    // Throws std::invalid_argument for a zero capacity.
    static std::shared_ptr<Gate> create(size_t capacity);

    // Blocks the calling thread until a token is free.
    Token acquire();

    // Runs handler with a token now if one is free, otherwise on the thread that
    // releases the next one. Handlers must not throw: they run inside Token::release(),
    // which is noexcept. A std::exception that escapes is logged and dropped.
    void asyncAcquire(Handler handler);

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t inFlight() const;
    [[nodiscard]] size_t waiting() const;

private:
    explicit Gate(size_t capacity);

    void release() noexcept;
    void runHandoff(const std::shared_ptr<Gate>& self, const Handler& handler) noexcept;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t inFlight_{0};
    size_t blocked_{0};
    std::deque<Handler> pending_;
};

}
