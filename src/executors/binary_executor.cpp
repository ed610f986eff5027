#include "binary_executor.hpp"
#include "../app_log.hpp"
#include "../completion_signal.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <cstdlib>
#include <system_error>
#include <thread>
extern char **environ;

const char* exec_status_name(ExecStatus s) {
    switch (s) {
        case ExecStatus::Output: return "output";
        case ExecStatus::Failed: return "failed";
        case ExecStatus::TimedOut: return "timed_out";
        case ExecStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

namespace {

// What the waiter thread hands back once both pipes are drained and the child
// has exited (the child is left unreaped for the caller).
struct ProcessOutcome {
    std::string out;
    std::string err_tail;
    std::string io_error;
};

struct Fd {
    int fd{-1};
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

struct Pipe {
    Fd read_end;
    Fd write_end;
    bool open(std::string& error) {
        int p[2];
        if (pipe2(p, O_CLOEXEC) == -1) {
            error = std::string("failed to create pipe: ") + std::strerror(errno);
            return false;
        }
        read_end.fd = p[0];
        write_end.fd = p[1];
        return true;
    }
};

void append_tail(std::string& tail, const char* data, size_t n, size_t limit) {
    tail.append(data, n);
    if (tail.size() > limit) tail.erase(0, tail.size() - limit);
}

// Reads stdout and stderr until both hit EOF or the wake pipe becomes
// readable, then waits for the child to exit without reaping it.
ProcessOutcome drain_and_wait(pid_t pid, int out_fd, int err_fd, int wake_fd, size_t tail_limit) {
    ProcessOutcome o;
    bool out_open = true, err_open = true;
    char buf[4096];

    while (out_open || err_open) {
        pollfd fds[3];
        nfds_t n = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) { out_idx = n; fds[n++] = {out_fd, POLLIN, 0}; }
        if (err_open) { err_idx = n; fds[n++] = {err_fd, POLLIN, 0}; }
        int wake_idx = n;
        fds[n++] = {wake_fd, POLLIN, 0};

        int rc = ::poll(fds, n, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            o.io_error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (fds[wake_idx].revents) break;

        if (out_idx >= 0 && fds[out_idx].revents) {
            ssize_t r = ::read(out_fd, buf, sizeof(buf));
            if (r > 0) {
                o.out.append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                if (r < 0) o.io_error = std::string("read stdout: ") + std::strerror(errno);
                out_open = false;
            }
        }
        if (err_idx >= 0 && fds[err_idx].revents) {
            ssize_t r = ::read(err_fd, buf, sizeof(buf));
            if (r > 0) {
                append_tail(o.err_tail, buf, static_cast<size_t>(r), tail_limit);
            } else if (r == 0 || errno != EINTR) {
                err_open = false;
            }
        }
    }

    siginfo_t info;
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) == -1 && errno == EINTR) {
    }
    return o;
}

std::string describe_command(const std::string& exe, const std::vector<std::string>& args) {
    std::string s = exe;
    for (const auto& a : args) {
        s += ' ';
        s += a.size() > 80 ? a.substr(0, 80) + "..." : a;
    }
    return s;
}

double elapsed_ms(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

std::string BinaryExecutor::resolve_executable(const std::string& exe) {
    if (exe.empty()) return "";
    if (exe.find('/') != std::string::npos) return exe;

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + exe;
        struct stat st;
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return "";
}

ExecResult BinaryExecutor::execute(const std::string& executable,
                                   const std::vector<std::string>& args,
                                   const CancelContext::Ptr& ctx) {
    ExecResult r;
    auto t0 = std::chrono::steady_clock::now();

    if (ctx) {
        ContextError e = ctx->err();
        if (e != ContextError::None) {
            r.status = (e == ContextError::DeadlineExceeded) ? ExecStatus::TimedOut : ExecStatus::Cancelled;
            r.error = context_error_name(e);
            log_info("executor") << "Not starting " << executable << ": " << r.error;
            return r;
        }
    }

    std::string exe = resolve_executable(executable);
    if (exe.empty()) {
        r.error = "failed to launch " + (executable.empty() ? std::string("<empty path>") : executable) +
                  ": executable file not found";
        log_error("executor") << r.error;
        return r;
    }

    // Convert to char* array for execve
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    Pipe out, err, exec_status, wake;
    if (!out.open(r.error) || !err.open(r.error) || !exec_status.open(r.error) || !wake.open(r.error)) {
        log_error("executor") << r.error;
        return r;
    }

    log_info("executor") << "Executing: " << describe_command(exe, args);

    pid_t pid = fork();
    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out.write_end.fd, STDOUT_FILENO);
        ::dup2(err.write_end.fd, STDERR_FILENO);
        ::execve(exe.c_str(), argv.data(), environ);
        int code = errno;
        ssize_t ignored = ::write(exec_status.write_end.fd, &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }
    if (pid < 0) {
        r.error = std::string("fork failed: ") + std::strerror(errno);
        log_error("executor") << r.error;
        return r;
    }

    ::setpgid(pid, pid);
    out.write_end.reset();
    err.write_end.reset();
    exec_status.write_end.reset();

    // The status pipe closes on a successful exec; a payload means execve failed.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read_end.fd, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        r.error = "failed to launch " + exe + ": " + std::strerror(exec_errno);
        r.ms = elapsed_ms(t0);
        log_error("executor") << r.error;
        return r;
    }

    CompletionSignal<ProcessOutcome> done;
    size_t tail_limit = stderr_tail_bytes_;
    int out_fd = out.read_end.fd, err_fd = err.read_end.fd, wake_fd = wake.read_end.fd;
    std::thread waiter;
    try {
        waiter = spawn_thread([&done, pid, out_fd, err_fd, wake_fd, tail_limit] {
            done.set(drain_and_wait(pid, out_fd, err_fd, wake_fd, tail_limit));
        });
    } catch (std::system_error const& e) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        r.error = std::string("failed to start waiter: ") + e.what();
        r.ms = elapsed_ms(t0);
        log_error("executor") << r.error;
        return r;
    }

    CancelContext::Registration reg;
    std::optional<CancelContext::clock::time_point> deadline;
    if (ctx) {
        reg = ctx->on_done([&done] { done.interrupt(); });
        deadline = ctx->deadline();
    }

    std::optional<ProcessOutcome> outcome = done.wait_until(deadline);
    reg.reset();

    if (!outcome) {
        // The context won. The child is not reaped yet, so its pid and process
        // group are still ours to signal.
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        char wake_byte = 1;
        ssize_t ignored = ::write(wake.write_end.fd, &wake_byte, 1);
        (void)ignored;
    }

    waiter.join();
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    r.ms = elapsed_ms(t0);

    if (!outcome) {
        ContextError e = ctx ? ctx->err() : ContextError::Cancelled;
        r.status = (e == ContextError::Cancelled) ? ExecStatus::Cancelled : ExecStatus::TimedOut;
        r.error = context_error_name(e == ContextError::None ? ContextError::DeadlineExceeded : e);
        if (auto late = done.take()) r.diagnostics = std::move(late->err_tail);
        log_info("executor") << "Process " << pid << " killed after " << static_cast<long long>(r.ms)
                             << " ms: " << r.error;
        return r;
    }

    r.diagnostics = std::move(outcome->err_tail);

    if (!outcome->io_error.empty()) {
        r.error = outcome->io_error;
    } else if (WIFEXITED(status)) {
        r.exit_code = WEXITSTATUS(status);
        if (r.exit_code == 0) {
            r.status = ExecStatus::Output;
            r.output = std::move(outcome->out);
            log_info("executor") << "Process exited with code 0, read " << r.output.size() << " bytes from stdout";
            return r;
        }
        r.error = "process exited with code " + std::to_string(r.exit_code);
    } else if (WIFSIGNALED(status)) {
        r.error = "process killed by signal " + std::to_string(WTERMSIG(status));
    } else {
        r.error = "process terminated abnormally";
    }

    log_error("executor") << r.error;
    if (!r.diagnostics.empty()) log_error("executor") << "stderr: " << r.diagnostics;
    return r;
}
