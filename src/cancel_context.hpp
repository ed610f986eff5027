#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

enum class ContextError {
    None,
    Cancelled,
    DeadlineExceeded
};

const char* context_error_name(ContextError e);

// Deadline plus cancellation, shared by a request and everything it starts.
// Cancelling a context cancels all of its children; a child's deadline never
// extends past its parent's.
class CancelContext : public std::enable_shared_from_this<CancelContext> {
public:
    using clock = std::chrono::steady_clock;
    using Ptr = std::shared_ptr<CancelContext>;

    class Registration {
    public:
        Registration() = default;
        Registration(std::weak_ptr<CancelContext> ctx, uint64_t id) : ctx_(std::move(ctx)), id_(id) {}
        Registration(Registration&& other) noexcept : ctx_(std::move(other.ctx_)), id_(other.id_) { other.id_ = 0; }
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        ~Registration() { reset(); }

        void reset();

    private:
        std::weak_ptr<CancelContext> ctx_;
        uint64_t id_{0};
    };

    static Ptr background();
    static Ptr with_cancel(const Ptr& parent);
    static Ptr with_timeout(const Ptr& parent, std::chrono::milliseconds timeout);
    static Ptr with_deadline(const Ptr& parent, clock::time_point deadline);

    ~CancelContext();

    void cancel();

    // Cancelled wins over an elapsed deadline once it has been recorded.
    ContextError err() const;
    bool done() const { return err() != ContextError::None; }

    std::optional<clock::time_point> deadline() const { return deadline_; }

    // Runs cb once when the context is cancelled (directly or through a
    // parent). Runs it immediately if that already happened. Resetting the
    // returned Registration waits for a cb that is running on another thread. Deadlines do not
    // fire callbacks; waiters combine on_done with deadline().
    Registration on_done(std::function<void()> cb);

    // Blocks until cancelled or the deadline passes.
    ContextError wait() const;

private:
    CancelContext() = default;

    void cancel_with(ContextError reason);
    void unregister(uint64_t id);

    std::optional<clock::time_point> deadline_;
    Registration parent_link_;

    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    ContextError cancelled_{ContextError::None};
    uint64_t next_id_{1};
    // Callback being run by cancel_with(), and the thread running it.
    uint64_t running_id_{0};
    std::thread::id running_thread_;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks_;
};
