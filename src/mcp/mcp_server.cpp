#include <memory_mcp/mcp/mcp_server.hpp>

#include <memory_mcp/core/log.hpp>
#include <memory_mcp/core/version.hpp>

#include <optional>
#include <string>

namespace memory_mcp {

namespace {

constexpr const char* kLogComponent = "mcp";

std::string NegotiateProtocolVersion(const nlohmann::json& params) {
    if (params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        const auto& requested =
            params["protocolVersion"].get_ref<const std::string&>();
        for (const char* supported : kSupportedProtocolVersions) {
            if (requested == supported) {
                return requested;
            }
        }
        LogWarn(kLogComponent, "Peer requested unsupported protocol version " +
                               requested + ", answering with " +
                               kSupportedProtocolVersions[0]);
    }
    return kSupportedProtocolVersions[0];
}

// Peer-supplied fields of the wrong type fall back to the default.
std::string StringField(const nlohmann::json& object, const char* key,
                        const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo(kLogComponent, "Serving " + std::to_string(registry_.Tools().size()) +
                           " tools on stdio");

    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn(kLogComponent, std::string("Parse error: ") + e.what());
            Send(MakeError(nullptr, kParseError, "Parse error"));
            continue;
        }

        std::optional<nlohmann::json> response;
        try {
            response = HandleMessage(message);
        } catch (const nlohmann::json::exception& e) {
            LogError(kLogComponent, std::string("Failed to handle message: ") + e.what());
            if (message.is_object() && message.contains("id")) {
                response = MakeError(message["id"], kInternalError,
                                     "Internal error");
            }
        }
        if (response) {
            Send(*response);
        }
    }

    LogInfo(kLogComponent, "Input closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    // Notifications have no "id".
    const bool is_notification = !message.contains("id");
    const nlohmann::json id = is_notification ? nlohmann::json() : message["id"];

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (!is_notification) {
            return MakeError(id, kInvalidRequest, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    if (!message.contains("method") || !message["method"].is_string()) {
        if (!is_notification) {
            return MakeError(id, kInvalidRequest, "Missing 'method'");
        }
        return std::nullopt;
    }
    const auto& method = message["method"].get_ref<const std::string&>();

    if (is_notification) {
        LogDebug(kLogComponent, "Notification: " + method);
        return std::nullopt;
    }

    nlohmann::json params = nlohmann::json::object();
    if (message.contains("params") && !message["params"].is_null()) {
        params = message["params"];
        if (!params.is_object()) {
            return MakeError(id, kInvalidParams, "'params' must be an object");
        }
    }

    LogDebug(kLogComponent, "Request: " + method);

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else {
        return MakeError(id, kMethodNotFound, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (state_ == ServerState::Ready) {
        LogWarn(kLogComponent, "Repeated initialize, answering again");
    }
    state_ = ServerState::Ready;

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LogInfo(kLogComponent,
                "Handshake from " + StringField(params["clientInfo"], "name", "<unnamed>") +
                " " + StringField(params["clientInfo"], "version", ""));
    }

    nlohmann::json result;
    result["protocolVersion"] = NegotiateProtocolVersion(params);
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) const {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }
    const auto& tool_name = params["name"].get_ref<const std::string&>();

    // Absent or null arguments mean "no arguments". Anything else is handed
    // to the tool, which decides whether it can use it.
    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    auto outcome = registry_.Execute(tool_name, arguments);
    if (outcome.IsErr()) {
        LogWarn(kLogComponent, tool_name + " failed: " + outcome.Error().message);
        return MakeToolError(id, outcome.Error());
    }

    return MakeResult(id, {{"content", std::move(outcome).Value().content}});
}

int McpServer::ErrorCodeFor(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::UnknownTool:      return kInvalidParams;
        case ErrorCategory::InvalidArguments: return kInvalidParams;
        case ErrorCategory::IoFailure:        return kInternalError;
        case ErrorCategory::Config:           return kInternalError;
        case ErrorCategory::InternalFailure:  return kInternalError;
    }
    return kInternalError;
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

// Tool failures also carry data.kind so peers can tell UnknownTool from
// InvalidArguments, which share a JSON-RPC code.
nlohmann::json McpServer::MakeToolError(const nlohmann::json& id,
                                        const Error& error) {
    auto response = MakeError(id, ErrorCodeFor(error.category), error.message);
    response["error"]["data"] = {{"kind", error.CategoryName()}};
    return response;
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

void McpServer::Send(const nlohmann::json& message) {
    // Stored notes are not guaranteed to be valid UTF-8.
    out_ << message.dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::replace)
         << "\n";
    out_.flush();
}

} // namespace memory_mcp
