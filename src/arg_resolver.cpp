#include "arg_resolver.hpp"
#include "value_parse.hpp"

namespace {

using Args = std::vector<std::string>;

void emit(Args& out, const std::string& flag, const std::string& value) {
    if (flag.empty()) return;
    out.push_back(flag);
    out.push_back(value);
}

void emit_switch(Args& out, const SwitchOption& opt) {
    if (opt.enabled && !opt.flag.empty()) out.push_back(opt.flag);
}

void resolve_string(Args& out, const ValueOption& opt, const std::string& override_value) {
    if (!override_value.empty()) {
        emit(out, opt.flag, override_value);
    } else if (!opt.value.empty()) {
        emit(out, opt.flag, opt.value);
    }
}

// Override is formatted base-10; the default is passed through verbatim.
void resolve_int(Args& out, const ValueOption& opt, int override_value) {
    if (override_value > 0) {
        emit(out, opt.flag, std::to_string(override_value));
        return;
    }
    auto def = parse_int64(opt.value);
    if (def && *def > 0) emit(out, opt.flag, opt.value);
}

// Override is formatted with two decimals; the default is passed through verbatim.
void resolve_float(Args& out, const ValueOption& opt, double override_value) {
    if (override_value > 0) {
        emit(out, opt.flag, format_fixed2(override_value));
        return;
    }
    auto def = parse_double(opt.value);
    if (def && *def > 0) emit(out, opt.flag, opt.value);
}

} // namespace

std::vector<std::string> resolve_llama_args(const LlamaCliConfig& cfg, const CompletionArguments& args) {
    Args out;

    resolve_string(out, cfg.model, args.model);
    resolve_int(out, cfg.threads, args.threads);
    resolve_int(out, cfg.gpu_layers, args.gpu_layers);
    resolve_int(out, cfg.ctx_size, args.ctx_size);
    resolve_int(out, cfg.batch_size, args.batch_size);

    resolve_int(out, cfg.predict, args.predict);
    resolve_float(out, cfg.temperature, args.temperature);
    resolve_int(out, cfg.top_k, args.top_k);
    resolve_float(out, cfg.top_p, args.top_p);
    resolve_float(out, cfg.repeat_penalty, args.repeat_penalty);

    // At most one prompt source. The configured PromptText is never used.
    if (!args.prompt_file.empty()) {
        emit(out, cfg.prompt_file.flag, args.prompt_file);
    } else if (!args.prompt.empty()) {
        emit(out, cfg.prompt.flag, args.prompt);
    }

    resolve_string(out, cfg.log_file, args.log_file);

    emit_switch(out, cfg.multiline_input);
    emit_switch(out, cfg.flash_attention);
    if (!cfg.prompt_cache.value.empty()) emit(out, cfg.prompt_cache.flag, cfg.prompt_cache.value);
    emit_switch(out, cfg.no_display_prompt);
    emit_switch(out, cfg.escape_newlines);
    emit_switch(out, cfg.no_conversation);
    emit_switch(out, cfg.no_context_shift);

    return out;
}
