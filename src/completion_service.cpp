#include "completion_service.hpp"
#include "app_log.hpp"
#include "value_parse.hpp"
#include <chrono>

CompletionService::CompletionService(AppConfig app, LlamaCliConfig llama, std::shared_ptr<IExecutor> executor,
                                     CancelContext::Ptr root)
    : app_(std::move(app)),
      llama_(std::move(llama)),
      executor_(std::move(executor)),
      root_(root ? std::move(root) : CancelContext::background()) {}

ToolReply CompletionService::generate(const CompletionArguments& args) {
    auto t0 = std::chrono::steady_clock::now();
    requests_++;

    if (args.prompt.empty()) {
        log_info("completion") << "Empty prompt received";
        errors_++;
        return {"Error: Prompt cannot be empty", true};
    }

    log_info("completion") << "Handling completion request for prompt: " << truncate_utf8(args.prompt, 100) << "...";

    const int timeout_seconds = app_.effective_timeout_seconds();
    auto ctx = CancelContext::with_timeout(root_, std::chrono::seconds(timeout_seconds));
    log_info("completion") << "Starting completion with timeout of " << timeout_seconds << " seconds";

    auto argv = resolve_llama_args(llama_, args);
    ExecResult result = executor_->execute(app_.llama_cli_path, argv, ctx);
    ctx->cancel();

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    record(result.status, ms);
    auto m = metrics();
    log_info("completion") << "Request completed in " << static_cast<long long>(ms) << " ms (avg: "
                           << static_cast<long long>(m.average_ms()) << " ms)";

    switch (result.status) {
        case ExecStatus::Output:
            log_info("completion") << "Completion generated successfully, output length: " << result.output.size()
                                   << " chars";
            return {std::move(result.output), false};
        case ExecStatus::TimedOut:
            log_info("completion") << "Completion timed out after " << timeout_seconds << " seconds";
            return {"Error: Completion timed out after " + std::to_string(timeout_seconds) + " seconds", true};
        case ExecStatus::Cancelled:
            log_info("completion") << "Completion cancelled: " << result.error;
            return {"Error: Completion cancelled", true};
        case ExecStatus::Failed:
            break;
    }
    log_error("completion") << "Error generating completion: " << result.error;
    return {"Error generating completion: " + result.error, true};
}

void CompletionService::record(ExecStatus status, double ms) {
    switch (status) {
        case ExecStatus::Output: successes_++; break;
        case ExecStatus::TimedOut: timeouts_++; errors_++; break;
        case ExecStatus::Cancelled: cancellations_++; errors_++; break;
        case ExecStatus::Failed: errors_++; break;
    }
    total_us_ += static_cast<int64_t>(ms * 1000.0);
}

CompletionMetrics CompletionService::metrics() const {
    CompletionMetrics m;
    m.requests = requests_.load();
    m.successes = successes_.load();
    m.errors = errors_.load();
    m.timeouts = timeouts_.load();
    m.cancellations = cancellations_.load();
    m.total_ms = static_cast<double>(total_us_.load()) / 1000.0;
    return m;
}
