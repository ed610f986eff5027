#pragma once
#include "../cancel_context.hpp"
#include <string>
#include <vector>

enum class ExecStatus {
    Output,
    Failed,
    TimedOut,
    Cancelled
};

const char* exec_status_name(ExecStatus s);

struct ExecResult {
    ExecStatus status{ExecStatus::Failed};
    std::string output;       // captured stdout, Output only
    std::string error;        // Failed: what went wrong; otherwise the context error
    std::string diagnostics;  // tail of the child's stderr, for logs only
    int exit_code{-1};
    double ms{0.0};

    bool ok() const { return status == ExecStatus::Output; }
};

class IExecutor {
public:
    virtual ~IExecutor() = default;

    // Runs one external program to completion or until ctx is done,
    // whichever comes first. Never throws for process failures.
    virtual ExecResult execute(const std::string& executable,
                               const std::vector<std::string>& args,
                               const CancelContext::Ptr& ctx) = 0;
};
