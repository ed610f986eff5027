#pragma once
#include "app_config.hpp"
#include "arg_resolver.hpp"
#include "cancel_context.hpp"
#include "executors/iexecutor.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

// Text handed back to the MCP client as tool content.
struct ToolReply {
    std::string text;
    bool is_error{false};
};

struct CompletionMetrics {
    int64_t requests{0};
    int64_t successes{0};
    int64_t errors{0};
    int64_t timeouts{0};
    int64_t cancellations{0};
    double total_ms{0.0};

    double average_ms() const { return requests > 0 ? total_ms / static_cast<double>(requests) : 0.0; }
};

// Handles one generate_completion call: validate, derive the deadline, build
// the llama-cli arguments, run, and turn the outcome into reply text. Safe to
// call from many session threads at once; configuration is read-only.
class CompletionService {
public:
    CompletionService(AppConfig app, LlamaCliConfig llama, std::shared_ptr<IExecutor> executor,
                      CancelContext::Ptr root);

    ToolReply generate(const CompletionArguments& args);

    CompletionMetrics metrics() const;
    const AppConfig& app_config() const { return app_; }
    const LlamaCliConfig& llama_config() const { return llama_; }

private:
    void record(ExecStatus status, double ms);

    const AppConfig app_;
    const LlamaCliConfig llama_;
    std::shared_ptr<IExecutor> executor_;
    CancelContext::Ptr root_;

    std::atomic<int64_t> requests_{0};
    std::atomic<int64_t> successes_{0};
    std::atomic<int64_t> errors_{0};
    std::atomic<int64_t> timeouts_{0};
    std::atomic<int64_t> cancellations_{0};
    std::atomic<int64_t> total_us_{0};
};
