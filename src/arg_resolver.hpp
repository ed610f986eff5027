#pragma once
#include "app_config.hpp"
#include <string>
#include <vector>

// Per-request overrides. Empty strings and values <= 0 mean "not set" and
// fall back to the configured default.
struct CompletionArguments {
    std::string prompt;

    std::string model;
    int threads{0};
    int gpu_layers{0};
    int ctx_size{0};
    int batch_size{0};

    int predict{0};
    double temperature{0.0};
    int top_k{0};
    double top_p{0.0};
    double repeat_penalty{0.0};

    std::string prompt_file;
    std::string log_file;
};

// Builds the llama-cli argument vector from the static configuration and one
// request's overrides. Never fails: configured defaults that do not parse are
// left out.
std::vector<std::string> resolve_llama_args(const LlamaCliConfig& cfg, const CompletionArguments& args);
