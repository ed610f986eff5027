#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

// Single-value hand-off from one producer thread to one waiter. The first
// set() wins; interrupt() releases the waiter without a value.
template <typename T>
class CompletionSignal {
public:
    using clock = std::chrono::steady_clock;

    bool set(T value) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (value_) return false;
            value_.emplace(std::move(value));
        }
        cv_.notify_all();
        return true;
    }

    void interrupt() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    bool ready() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return value_.has_value();
    }

    // Returns the value if it arrived before the deadline and before an
    // interrupt. A value that is already there wins over both.
    std::optional<T> wait_until(std::optional<clock::time_point> deadline) {
        std::unique_lock<std::mutex> lock(mtx_);
        auto released = [this] { return value_.has_value() || interrupted_; };
        if (deadline) {
            cv_.wait_until(lock, *deadline, released);
        } else {
            cv_.wait(lock, released);
        }
        if (!value_) return std::nullopt;
        return std::move(value_);
    }

    // Waits for the producer regardless of interrupts.
    std::optional<T> take() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return value_.has_value(); });
        return std::move(value_);
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::optional<T> value_;
    bool interrupted_{false};
};
