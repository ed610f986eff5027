#include <executors/binary_executor.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sys/wait.h>

#include <cerrno>
#include <chrono>
#include <system_error>
#include <thread>

namespace {

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::StartsWith;

ExecResult run_sh(const std::string& script, const CancelContext::Ptr& ctx = CancelContext::background())
{
    BinaryExecutor exec;
    return exec.execute("/bin/sh", {"-c", script}, ctx);
}

TEST(BinaryExecutor, CapturesStdoutVerbatim)
{
    auto r = run_sh("printf 'hello\\nworld'");
    ASSERT_EQ(r.status, ExecStatus::Output) << r.error;
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.output, "hello\nworld");
    EXPECT_EQ(r.exit_code, 0);
}

TEST(BinaryExecutor, PassesArgumentsWithoutShellSplitting)
{
    BinaryExecutor exec;
    auto r = exec.execute("/bin/sh", {"-c", "printf '%s|' \"$@\"", "sh", "a b", "", "c"},
                          CancelContext::background());
    ASSERT_EQ(r.status, ExecStatus::Output) << r.error;
    EXPECT_EQ(r.output, "a b||c|");
}

TEST(BinaryExecutor, KeepsStderrOutOfOutput)
{
    auto r = run_sh("echo out; echo err 1>&2");
    ASSERT_EQ(r.status, ExecStatus::Output) << r.error;
    EXPECT_EQ(r.output, "out\n");
    EXPECT_EQ(r.diagnostics, "err\n");
}

TEST(BinaryExecutor, StderrTailIsBounded)
{
    BinaryExecutor exec(16);
    auto r = exec.execute("/bin/sh", {"-c", "head -c 1000 /dev/zero | tr '\\0' x 1>&2; printf ok"},
                          CancelContext::background());
    ASSERT_EQ(r.status, ExecStatus::Output) << r.error;
    EXPECT_EQ(r.output, "ok");
    EXPECT_EQ(r.diagnostics, std::string(16, 'x'));
}

TEST(BinaryExecutor, ReadsOutputLargerThanPipeBuffer)
{
    auto r = run_sh("head -c 300000 /dev/zero | tr '\\0' y");
    ASSERT_EQ(r.status, ExecStatus::Output) << r.error;
    EXPECT_EQ(r.output.size(), 300000u);
}

TEST(BinaryExecutor, NonZeroExitIsFailure)
{
    auto r = run_sh("echo partial; echo broken 1>&2; exit 3");
    EXPECT_EQ(r.status, ExecStatus::Failed);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.error, "process exited with code 3");
    EXPECT_TRUE(r.output.empty());
    EXPECT_EQ(r.diagnostics, "broken\n");
}

TEST(BinaryExecutor, SignalledChildIsFailure)
{
    auto r = run_sh("kill -TERM $$");
    EXPECT_EQ(r.status, ExecStatus::Failed);
    EXPECT_THAT(r.error, StartsWith("process killed by signal"));
}

TEST(BinaryExecutor, MissingPathIsLaunchFailure)
{
    BinaryExecutor exec;
    auto r = exec.execute("/nonexistent/llama-cli", {"-p", "hi"}, CancelContext::background());
    EXPECT_EQ(r.status, ExecStatus::Failed);
    EXPECT_THAT(r.error, StartsWith("failed to launch /nonexistent/llama-cli"));
}

TEST(BinaryExecutor, UnknownCommandNameIsLaunchFailure)
{
    BinaryExecutor exec;
    auto r = exec.execute("no-such-command-for-tests", {}, CancelContext::background());
    EXPECT_EQ(r.status, ExecStatus::Failed);
    EXPECT_THAT(r.error, HasSubstr("executable file not found"));
}

TEST(BinaryExecutor, EmptyPathIsLaunchFailure)
{
    BinaryExecutor exec;
    auto r = exec.execute("", {}, CancelContext::background());
    EXPECT_EQ(r.status, ExecStatus::Failed);
    EXPECT_THAT(r.error, StartsWith("failed to launch"));
}

TEST(BinaryExecutor, ElapsedDeadlineDoesNotStartProcess)
{
    auto ctx = CancelContext::with_deadline(CancelContext::background(),
                                            CancelContext::clock::now() - 1s);
    auto r = run_sh("printf ran", ctx);
    EXPECT_EQ(r.status, ExecStatus::TimedOut);
    EXPECT_TRUE(r.output.empty());
    EXPECT_EQ(r.error, "context deadline exceeded");
}

TEST(BinaryExecutor, CancelledContextDoesNotStartProcess)
{
    auto ctx = CancelContext::with_cancel(CancelContext::background());
    ctx->cancel();
    auto r = run_sh("printf ran", ctx);
    EXPECT_EQ(r.status, ExecStatus::Cancelled);
    EXPECT_EQ(r.error, "context canceled");
}

TEST(BinaryExecutor, DeadlineKillsLongRunningChild)
{
    auto ctx = CancelContext::with_timeout(CancelContext::background(), 200ms);
    auto t0 = std::chrono::steady_clock::now();
    auto r = run_sh("sleep 30", ctx);
    auto took = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(r.status, ExecStatus::TimedOut);
    EXPECT_TRUE(r.output.empty());
    EXPECT_LT(took, 5s);
    EXPECT_GE(took, 150ms);
}

TEST(BinaryExecutor, CancellationFromAnotherThreadKillsChild)
{
    auto ctx = CancelContext::with_cancel(CancelContext::background());
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(200ms);
        ctx->cancel();
    });
    auto t0 = std::chrono::steady_clock::now();
    auto r = run_sh("sleep 30", ctx);
    auto took = std::chrono::steady_clock::now() - t0;
    canceller.join();

    EXPECT_EQ(r.status, ExecStatus::Cancelled);
    EXPECT_LT(took, 5s);
}

TEST(BinaryExecutor, ParentCancellationReachesChildContext)
{
    auto root = CancelContext::with_cancel(CancelContext::background());
    auto ctx = CancelContext::with_timeout(root, 60s);
    std::thread canceller([root] {
        std::this_thread::sleep_for(200ms);
        root->cancel();
    });
    auto r = run_sh("sleep 30", ctx);
    canceller.join();
    EXPECT_EQ(r.status, ExecStatus::Cancelled);
}

TEST(BinaryExecutor, BackgroundGrandchildDoesNotOutliveDeadline)
{
    // The grandchild keeps stdout open after the shell exits.
    auto ctx = CancelContext::with_timeout(CancelContext::background(), 300ms);
    auto t0 = std::chrono::steady_clock::now();
    auto r = run_sh("sleep 30 & echo started", ctx);
    auto took = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(r.status, ExecStatus::TimedOut);
    EXPECT_LT(took, 5s);
}

TEST(BinaryExecutor, FinishesBeforeGenerousDeadline)
{
    auto ctx = CancelContext::with_timeout(CancelContext::background(), 30s);
    auto r = run_sh("printf done", ctx);
    ASSERT_EQ(r.status, ExecStatus::Output) << r.error;
    EXPECT_EQ(r.output, "done");
}

class NoThreadsExecutor : public BinaryExecutor {
protected:
    std::thread spawn_thread(std::function<void()>) override
    {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    }
};

TEST(BinaryExecutor, WaiterStartFailureKillsAndReapsChild)
{
    NoThreadsExecutor exec;
    auto t0 = std::chrono::steady_clock::now();
    ExecResult r;
    ASSERT_NO_THROW(r = exec.execute("/bin/sh", {"-c", "sleep 30"}, CancelContext::background()));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
    EXPECT_EQ(r.status, ExecStatus::Failed);
    EXPECT_THAT(r.error, StartsWith("failed to start waiter: "));

    // Nothing is left running or waiting to be reaped.
    errno = 0;
    EXPECT_EQ(::waitpid(-1, nullptr, WNOHANG), -1);
    EXPECT_EQ(errno, ECHILD);
}

TEST(BinaryExecutor, ResolvesCommandNamesOnPath)
{
    EXPECT_EQ(BinaryExecutor::resolve_executable("/opt/llama/llama-cli"), "/opt/llama/llama-cli");
    EXPECT_THAT(BinaryExecutor::resolve_executable("sh"), ::testing::EndsWith("/sh"));
    EXPECT_EQ(BinaryExecutor::resolve_executable("no-such-command-for-tests"), "");
    EXPECT_EQ(BinaryExecutor::resolve_executable(""), "");
}

} // namespace
