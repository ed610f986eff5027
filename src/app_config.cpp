#include "app_config.hpp"
#include "value_parse.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool parse_double_quoted(const std::string& raw, std::string& out) {
    out.clear();
    for (size_t i = 1; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '"') return true;
        if (c == '\\' && i + 1 < raw.size()) {
            char n = raw[++i];
            switch (n) {
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                default: out += '\\'; out += n; break;
            }
            continue;
        }
        out += c;
    }
    return false;
}

// Parses one non-comment line. Returns false with error set on malformed input.
bool parse_env_line(const std::string& line, std::string& key, std::string& value, std::string& error) {
    std::string s = trim(line);
    if (s.compare(0, 7, "export ") == 0) s = trim(s.substr(7));

    auto eq = s.find('=');
    if (eq == std::string::npos) {
        error = "missing '='";
        return false;
    }
    key = trim(s.substr(0, eq));
    if (key.empty()) {
        error = "empty key";
        return false;
    }

    std::string raw = trim(s.substr(eq + 1));
    if (!raw.empty() && raw[0] == '"') {
        if (!parse_double_quoted(raw, value)) {
            error = "unterminated double quote";
            return false;
        }
        return true;
    }
    if (!raw.empty() && raw[0] == '\'') {
        auto close = raw.find('\'', 1);
        if (close == std::string::npos) {
            error = "unterminated single quote";
            return false;
        }
        value = raw.substr(1, close - 1);
        return true;
    }

    // Unquoted: " #" starts a trailing comment.
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '#' && i > 0 && (raw[i - 1] == ' ' || raw[i - 1] == '\t')) {
            raw = raw.substr(0, i);
            break;
        }
    }
    value = trim(raw);
    return true;
}

} // namespace

int AppConfig::effective_timeout_seconds() const {
    return timeout_seconds > 0 ? timeout_seconds : kDefaultTimeoutSeconds;
}

bool EnvSource::load_file(const std::string& path, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "open " + path + ": no such file or not readable";
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (!load_text(ss.str(), error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

bool EnvSource::load_text(const std::string& text, std::string& error) {
    std::istringstream in(text);
    std::string line;
    int line_no = 0;
    std::unordered_map<std::string, std::string> parsed;
    while (std::getline(in, line)) {
        ++line_no;
        if (line_no == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line = line.substr(3);
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;

        std::string key, value, line_error;
        if (!parse_env_line(t, key, value, line_error)) {
            error = "line " + std::to_string(line_no) + ": " + line_error;
            return false;
        }
        parsed[key] = value;
    }
    for (auto& kv : parsed) values_[kv.first] = std::move(kv.second);
    return true;
}

std::string EnvSource::get(const std::string& key) const {
    if (use_process_env_) {
        if (const char* v = std::getenv(key.c_str())) return v;
    }
    auto it = values_.find(key);
    return it == values_.end() ? std::string() : it->second;
}

bool EnvSource::get_bool(const std::string& key, bool fallback) const {
    auto v = get(key);
    if (v.empty()) return fallback;
    auto parsed = parse_bool(v);
    return parsed ? *parsed : fallback;
}

int EnvSource::get_int(const std::string& key, int fallback) const {
    auto v = get(key);
    if (v.empty()) return fallback;
    auto parsed = parse_int64(v);
    if (!parsed || *parsed < std::numeric_limits<int>::min() || *parsed > std::numeric_limits<int>::max()) {
        return fallback;
    }
    return static_cast<int>(*parsed);
}

LlamaCliConfig parse_llama_cli_config(const EnvSource& env) {
    LlamaCliConfig c;
    c.model = {env.get("ModelCmd"), env.get("ModelFullPathVal")};
    c.threads = {env.get("ThreadsCmd"), env.get("ThreadsVal")};
    c.gpu_layers = {env.get("GPULayersCmd"), env.get("GPULayersVal")};
    c.ctx_size = {env.get("CtxSizeCmd"), env.get("CtxSizeVal")};
    c.batch_size = {env.get("BatchCmd"), env.get("BatchCmdVal")};

    c.predict = {env.get("PredictCmd"), env.get("PredictVal")};
    c.temperature = {env.get("TemperatureCmd"), env.get("TemperatureVal")};
    c.top_k = {env.get("TopKCmd"), env.get("TopKVal")};
    c.top_p = {env.get("TopPCmd"), env.get("TopPVal")};
    c.repeat_penalty = {env.get("RepeatPenaltyCmd"), env.get("RepeatPenaltyVal")};

    c.prompt = {env.get("PromptCmd"), env.get("PromptText")};
    c.prompt_file = {env.get("PromptFileCmd"), env.get("PromptFileVal")};
    c.log_file = {env.get("ModelLogFileCmd"), env.get("ModelLogFileNameVal")};
    c.prompt_cache = {env.get("PromptCacheCmd"), env.get("PromptCacheVal")};

    c.multiline_input = {env.get("MultilineInputCmd"), env.get_bool("MultilineInputCmdEnabled", false)};
    c.flash_attention = {env.get("FlashAttentionCmd"), env.get_bool("FlashAttentionCmdEnabled", false)};
    c.no_display_prompt = {env.get("NoDisplayPromptCmd"), env.get_bool("NoDisplayPromptEnabled", false)};
    c.escape_newlines = {env.get("EscapeNewLinesCmd"), env.get_bool("EscapeNewLinesCmdEnabled", false)};
    c.no_conversation = {env.get("NoConversationCmd"), env.get_bool("NoConversationCmdEnabled", false)};
    c.no_context_shift = {env.get("NoContextShiftCmd"), env.get_bool("NoContextShiftCmdEnabled", false)};
    return c;
}

AppConfig parse_app_config(const EnvSource& env) {
    AppConfig a;
    a.llama_cli_path = env.get("LLamaCliPath");
    a.model_path = env.get("ModelPath");
    a.app_log_path = env.get("AppLogPath");
    a.app_log_file_name = env.get("AppLogFileName");
    a.prompt_cache_path = env.get("PromptCachePath");

    a.http_port = env.get("HttpPort");
    a.end_point = env.get("EndPoint");
    a.timeout_seconds = env.get_int("TimeOutSeconds", kDefaultTimeoutSeconds);

    auto bind = env.get("BindAddress");
    if (!bind.empty()) a.bind_address = bind;
    a.use_tls = env.get_bool("UseTls", false);
    auto cert = env.get("TlsCertFile");
    if (!cert.empty()) a.tls_cert_file = cert;
    auto key = env.get("TlsKeyFile");
    if (!key.empty()) a.tls_key_file = key;

    if (a.app_log_file_name.empty()) a.app_log_file_name = "app.log";
    if (a.end_point.empty()) a.end_point = "/mcp-completion";
    if (a.http_port.empty()) a.http_port = ":8080";
    return a;
}

bool parse_listen_address(const std::string& http_port, const std::string& default_host,
                          std::string& host, unsigned short& port, std::string& error) {
    std::string s = trim(http_port);
    std::string port_part = s;
    host = default_host;

    auto colon = s.rfind(':');
    if (colon != std::string::npos) {
        if (colon > 0) host = s.substr(0, colon);
        port_part = s.substr(colon + 1);
    }
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    auto parsed = parse_int64(port_part);
    if (!parsed || *parsed < 0 || *parsed > 65535) {
        error = "invalid HttpPort '" + http_port + "'";
        return false;
    }
    port = static_cast<unsigned short>(*parsed);
    return true;
}
