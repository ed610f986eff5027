#include "mcp_dispatcher.hpp"
#include "app_log.hpp"
#include <limits>

using json = nlohmann::json;

namespace {

json make_result(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json make_error(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

bool read_string(const json& j, const char* key, std::string& out, std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_int(const json& j, const char* key, int& out, std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            error = std::string("'") + key + "' is out of range";
            return false;
        }
        out = static_cast<int>(v);
        return true;
    }
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            error = std::string("'") + key + "' is out of range";
            return false;
        }
        out = static_cast<int>(v);
        return true;
    }
    error = std::string("'") + key + "' must be an integer";
    return false;
}

bool read_double(const json& j, const char* key, double& out, std::string& error) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_number()) {
        error = std::string("'") + key + "' must be a number";
        return false;
    }
    out = it->get<double>();
    return true;
}

} // namespace

bool parse_completion_arguments(const json& j, CompletionArguments& out, std::string& error) {
    if (j.is_null()) {
        error = "missing arguments";
        return false;
    }
    if (!j.is_object()) {
        error = "arguments must be an object";
        return false;
    }
    return read_string(j, "prompt", out.prompt, error)
        && read_string(j, "model", out.model, error)
        && read_int(j, "threads", out.threads, error)
        && read_int(j, "gpu_layers", out.gpu_layers, error)
        && read_int(j, "ctx_size", out.ctx_size, error)
        && read_int(j, "batch_size", out.batch_size, error)
        && read_int(j, "predict", out.predict, error)
        && read_double(j, "temperature", out.temperature, error)
        && read_int(j, "top_k", out.top_k, error)
        && read_double(j, "top_p", out.top_p, error)
        && read_double(j, "repeat_penalty", out.repeat_penalty, error)
        && read_string(j, "prompt_file", out.prompt_file, error)
        && read_string(j, "log_file", out.log_file, error);
}

json McpDispatcher::tool_definition() {
    auto prop = [](const char* type, const char* description) {
        return json{{"type", type}, {"description", description}};
    };
    json properties = {
        {"prompt", prop("string", "The prompt text to generate completion for")},
        {"model", prop("string", "Model path (overrides default)")},
        {"threads", prop("integer", "CPU threads for generation")},
        {"gpu_layers", prop("integer", "GPU acceleration layers")},
        {"ctx_size", prop("integer", "Context window size")},
        {"batch_size", prop("integer", "Batch processing size")},
        {"predict", prop("integer", "Number of tokens to generate")},
        {"temperature", prop("number", "Creativity/randomness control")},
        {"top_k", prop("integer", "Top-K sampling")},
        {"top_p", prop("number", "Top-P (nucleus) sampling")},
        {"repeat_penalty", prop("number", "Repetition penalty")},
        {"prompt_file", prop("string", "Prompt from file")},
        {"log_file", prop("string", "Output logging")},
    };
    return json{
        {"name", kCompletionToolName},
        {"description", "Generate text completion using the local LLM"},
        {"inputSchema", {{"type", "object"}, {"properties", properties}, {"required", json::array({"prompt"})}}},
    };
}

std::optional<json> McpDispatcher::handle(const json& msg) {
    if (!msg.is_object()) {
        return make_error(nullptr, kInvalidRequest, "request must be a JSON object");
    }

    const bool is_notification = !msg.contains("id");
    json id = is_notification ? json(nullptr) : msg["id"];
    if (!id.is_null() && !id.is_string() && !id.is_number_integer()) {
        return make_error(nullptr, kInvalidRequest, "invalid id");
    }

    auto method_it = msg.find("method");
    if (method_it == msg.end() || !method_it->is_string()) {
        if (is_notification) return std::nullopt;
        return make_error(id, kInvalidRequest, "missing method");
    }
    const std::string method = method_it->get<std::string>();
    const json params = msg.value("params", json::object());

    if (is_notification) {
        if (method.compare(0, 14, "notifications/") != 0) {
            log_info("mcp") << "Ignoring notification " << method;
        }
        return std::nullopt;
    }

    if (method == "initialize") return handle_initialize(id, params);
    if (method == "ping") return make_result(id, json::object());
    if (method == "tools/list") {
        return make_result(id, json{{"tools", json::array({tool_definition()})}});
    }
    if (method == "tools/call") return handle_tools_call(id, params);

    return make_error(id, kMethodNotFound, "method not found: " + method);
}

std::optional<std::string> McpDispatcher::handle_text(const std::string& body) {
    json req = json::parse(body, nullptr, false);
    if (req.is_discarded()) {
        return make_error(nullptr, kParseError, "parse error").dump();
    }
    if (req.is_array()) {
        return make_error(nullptr, kInvalidRequest, "batch requests are not supported").dump();
    }
    auto resp = handle(req);
    if (!resp) return std::nullopt;
    // Program output is not guaranteed to be valid UTF-8.
    return resp->dump(-1, ' ', false, json::error_handler_t::replace);
}

json McpDispatcher::handle_initialize(const json& id, const json& params) {
    std::string client_version = kMcpProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        client_version = params["protocolVersion"].get<std::string>();
    }
    log_info("mcp") << "Client initialize, protocol " << client_version;
    return make_result(id, json{
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", "completion-bridge"}, {"version", "1.0.0"}}},
    });
}

json McpDispatcher::handle_tools_call(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, kInvalidParams, "tools/call requires a tool name");
    }
    const std::string name = params["name"].get<std::string>();
    if (name != kCompletionToolName) {
        return make_error(id, kInvalidParams, "unknown tool: " + name);
    }

    CompletionArguments args;
    std::string error;
    if (!parse_completion_arguments(params.value("arguments", json()), args, error)) {
        return make_error(id, kInvalidParams, "invalid arguments: " + error);
    }

    ToolReply reply = service_.generate(args);
    json content = json::array({json{{"type", "text"}, {"text", reply.text}}});
    return make_result(id, json{{"content", content}, {"isError", reply.is_error}});
}
