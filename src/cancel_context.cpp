#include "cancel_context.hpp"

const char* context_error_name(ContextError e) {
    switch (e) {
        case ContextError::None: return "none";
        case ContextError::Cancelled: return "context canceled";
        case ContextError::DeadlineExceeded: return "context deadline exceeded";
    }
    return "unknown";
}

CancelContext::Registration& CancelContext::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        ctx_ = std::move(other.ctx_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancelContext::Registration::reset() {
    if (id_ == 0) return;
    if (auto ctx = ctx_.lock()) {
        ctx->unregister(id_);
    }
    ctx_.reset();
    id_ = 0;
}

CancelContext::Ptr CancelContext::background() {
    return Ptr(new CancelContext());
}

CancelContext::Ptr CancelContext::with_cancel(const Ptr& parent) {
    Ptr child(new CancelContext());
    if (!parent) return child;

    child->deadline_ = parent->deadline_;
    std::weak_ptr<CancelContext> weak_child = child;
    std::weak_ptr<CancelContext> weak_parent = parent;
    child->parent_link_ = parent->on_done([weak_child, weak_parent] {
        auto c = weak_child.lock();
        auto p = weak_parent.lock();
        if (c) c->cancel_with(p ? p->err() : ContextError::Cancelled);
    });
    return child;
}

CancelContext::Ptr CancelContext::with_timeout(const Ptr& parent, std::chrono::milliseconds timeout) {
    return with_deadline(parent, clock::now() + timeout);
}

CancelContext::Ptr CancelContext::with_deadline(const Ptr& parent, clock::time_point deadline) {
    auto child = with_cancel(parent);
    if (!child->deadline_ || deadline < *child->deadline_) {
        child->deadline_ = deadline;
    }
    return child;
}

CancelContext::~CancelContext() {
    parent_link_.reset();
}

void CancelContext::cancel() {
    cancel_with(ContextError::Cancelled);
}

void CancelContext::cancel_with(ContextError reason) {
    if (reason == ContextError::None) reason = ContextError::Cancelled;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cancelled_ != ContextError::None) return;
        cancelled_ = reason;
        running_thread_ = std::this_thread::get_id();
    }
    cv_.notify_all();

    // Callbacks run outside the lock, one at a time; they may cancel children
    // or touch other contexts. The id of the one running stays visible so
    // unregister() can wait for it.
    for (;;) {
        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            running_id_ = 0;
            if (callbacks_.empty()) break;
            running_id_ = callbacks_.front().first;
            cb = std::move(callbacks_.front().second);
            callbacks_.erase(callbacks_.begin());
        }
        cv_.notify_all();
        cb();
    }
    cv_.notify_all();
}

ContextError CancelContext::err() const {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cancelled_ != ContextError::None) return cancelled_;
    }
    if (deadline_ && clock::now() >= *deadline_) return ContextError::DeadlineExceeded;
    return ContextError::None;
}

CancelContext::Registration CancelContext::on_done(std::function<void()> cb) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cancelled_ == ContextError::None) {
            id = next_id_++;
            callbacks_.emplace_back(id, std::move(cb));
        }
    }
    if (id == 0) {
        cb();
        return Registration();
    }
    return Registration(weak_from_this(), id);
}

void CancelContext::unregister(uint64_t id) {
    std::unique_lock<std::mutex> lock(mtx_);
    for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
        if (it->first == id) {
            callbacks_.erase(it);
            return;
        }
    }
    // A callback resetting its own registration must not wait for itself.
    if (running_id_ == id && running_thread_ != std::this_thread::get_id()) {
        cv_.wait(lock, [this, id] { return running_id_ != id; });
    }
}

ContextError CancelContext::wait() const {
    std::unique_lock<std::mutex> lock(mtx_);
    auto cancelled = [this] { return cancelled_ != ContextError::None; };
    if (deadline_) {
        if (!cv_.wait_until(lock, *deadline_, cancelled)) {
            return ContextError::DeadlineExceeded;
        }
    } else {
        cv_.wait(lock, cancelled);
    }
    return cancelled_;
}
