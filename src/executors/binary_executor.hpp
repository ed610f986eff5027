#pragma once
#include "iexecutor.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

// Runs an external binary with fork/execve. The child gets its own process
// group so a timeout or cancellation can kill it together with anything it
// spawned.
class BinaryExecutor : public IExecutor {
public:
    explicit BinaryExecutor(size_t stderr_tail_bytes = 4096) : stderr_tail_bytes_(stderr_tail_bytes) {}

    ExecResult execute(const std::string& executable,
                       const std::vector<std::string>& args,
                       const CancelContext::Ptr& ctx) override;

    // Returns exe unchanged when it contains a slash, otherwise the first
    // executable match on $PATH. Empty when nothing matches.
    static std::string resolve_executable(const std::string& exe);

protected:
    // Starts the thread that drains and waits for the child.
    virtual std::thread spawn_thread(std::function<void()> fn) { return std::thread(std::move(fn)); }

private:
    size_t stderr_tail_bytes_;
};
