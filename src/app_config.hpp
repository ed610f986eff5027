#pragma once
#include <string>
#include <unordered_map>

constexpr const char* kDefaultConfigFile = "byte-vision-cfg.env";
constexpr int kDefaultTimeoutSeconds = 300;

// A flag with a string value, e.g. {"--ctx-size", "40960"}.
struct ValueOption {
    std::string flag;
    std::string value;
};

// A flag without a value, e.g. {"--flash-attn", true}.
struct SwitchOption {
    std::string flag;
    bool enabled{false};
};

// Static llama-cli options. Every flag token comes from configuration so an
// option can be remapped to another program's spelling without code changes.
struct LlamaCliConfig {
    ValueOption model;
    ValueOption threads;
    ValueOption gpu_layers;
    ValueOption ctx_size;
    ValueOption batch_size;

    ValueOption predict;
    ValueOption temperature;
    ValueOption top_k;
    ValueOption top_p;
    ValueOption repeat_penalty;

    // The default prompt text is configuration only; a request always
    // supplies its own.
    ValueOption prompt;
    ValueOption prompt_file;
    ValueOption log_file;
    ValueOption prompt_cache;

    SwitchOption multiline_input;
    SwitchOption flash_attention;
    SwitchOption no_display_prompt;
    SwitchOption escape_newlines;
    SwitchOption no_conversation;
    SwitchOption no_context_shift;
};

struct AppConfig {
    std::string llama_cli_path;
    std::string model_path;
    std::string app_log_path;
    std::string app_log_file_name;
    std::string prompt_cache_path;

    std::string http_port;
    std::string end_point;
    int timeout_seconds{kDefaultTimeoutSeconds};

    std::string bind_address{"0.0.0.0"};
    bool use_tls{false};
    std::string tls_cert_file{"server.crt"};
    std::string tls_key_file{"server.key"};

    // timeout_seconds, or the default when it is not positive.
    int effective_timeout_seconds() const;
};

// Key/value source: an env file plus the process environment. Variables that
// are already set in the environment win over the file.
class EnvSource {
public:
    EnvSource() = default;
    explicit EnvSource(bool use_process_env) : use_process_env_(use_process_env) {}

    bool load_file(const std::string& path, std::string& error);
    bool load_text(const std::string& text, std::string& error);
    void set(const std::string& key, const std::string& value) { values_[key] = value; }

    std::string get(const std::string& key) const;
    bool get_bool(const std::string& key, bool fallback) const;
    int get_int(const std::string& key, int fallback) const;

    size_t size() const { return values_.size(); }

private:
    std::unordered_map<std::string, std::string> values_;
    bool use_process_env_{true};
};

LlamaCliConfig parse_llama_cli_config(const EnvSource& env);
AppConfig parse_app_config(const EnvSource& env);

// "8080", ":8080" or "host:8080". Host falls back to default_host.
bool parse_listen_address(const std::string& http_port, const std::string& default_host,
                          std::string& host, unsigned short& port, std::string& error);
