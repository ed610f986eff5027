#pragma once
#include "arg_resolver.hpp"
#include "completion_service.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

constexpr const char* kMcpProtocolVersion = "2024-11-05";
constexpr const char* kCompletionToolName = "generate_completion";

// JSON-RPC 2.0 error codes.
enum RpcError {
    kParseError = -32700,
    kInvalidRequest = -32600,
    kMethodNotFound = -32601,
    kInvalidParams = -32602,
    kInternalError = -32603
};

// Fills out from the tool call "arguments" object. Missing or null fields are
// left unset.
bool parse_completion_arguments(const nlohmann::json& j, CompletionArguments& out, std::string& error);

// Routes MCP messages (initialize, ping, tools/list, tools/call) to the
// completion service.
class McpDispatcher {
public:
    using json = nlohmann::json;

    explicit McpDispatcher(CompletionService& service) : service_(service) {}

    // nullopt for notifications, which get no response.
    std::optional<json> handle(const json& msg);
    std::optional<std::string> handle_text(const std::string& body);

    static json tool_definition();

private:
    json handle_initialize(const json& id, const json& params);
    json handle_tools_call(const json& id, const json& params);

    CompletionService& service_;
};
