#include <browser_mcp/mcp/mcp_server.hpp>

#include <browser_mcp/core/log.hpp>
#include <browser_mcp/core/version.hpp>

#include <exception>
#include <optional>
#include <string>

namespace browser_mcp {

namespace {

constexpr const char* kComponent = "mcp";
constexpr const char* kProtocolVersion = "2024-11-05";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

} // anonymous namespace

McpServer::McpServer(Dispatcher& dispatcher,
                     std::istream& in,
                     std::ostream& out,
                     const std::atomic<bool>* stop_requested)
    : dispatcher_(dispatcher), in_(in), out_(out), stop_requested_(stop_requested) {}

void McpServer::Run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (stop_requested_ != nullptr && stop_requested_->load()) {
            break;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn(kComponent, std::string("Malformed message: ") + e.what());
            Send(MakeError(nullptr, kParseError, "Parse error"));
            continue;
        }

        std::optional<nlohmann::json> response;
        try {
            response = HandleMessage(message);
        } catch (const std::exception& e) {
            LogError(kComponent, std::string("Failed to handle message: ") + e.what());
            auto id = message.is_object() && message.contains("id") ? message["id"]
                                                                    : nlohmann::json(nullptr);
            response = MakeError(id, kInternalError, std::string("Internal error: ") + e.what());
        }
        if (response) {
            Send(*response);
        }
    }
    if (stop_requested_ != nullptr && stop_requested_->load()) {
        LogInfo(kComponent, "Stop requested, leaving the message loop");
    } else {
        LogInfo(kComponent, "Input closed, leaving the message loop");
    }
}

std::optional<nlohmann::json> McpServer::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Invalid Request");
    }
    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], kInvalidRequest, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    auto method = message.value("method", "");
    auto params = message.value("params", nlohmann::json::object());

    // Notifications have no "id" and get no response.
    if (!message.contains("id")) {
        LogDebug(kComponent, "Notification: " + method);
        return std::nullopt;
    }

    const auto& id = message["id"];
    if (method == "initialize") {
        return HandleInitialize(params, id);
    }
    if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    }
    if (method == "tools/list") {
        return HandleToolsList(id);
    }
    if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& params,
                                           const nlohmann::json& id) {
    initialized_ = true;
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LogInfo(kComponent, "Client connected: " +
                                params["clientInfo"].value("name", std::string("unknown")));
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "browser-mcp"},
        {"version", kVersion}
    };
    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : dispatcher_.Registry().Tools()) {
        tools.push_back({
            {"name", descriptor.name},
            {"description", descriptor.description},
            {"inputSchema", descriptor.input_schema}
        });
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params,
                                          const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    auto response = dispatcher_.Dispatch(tool_name, arguments);
    return MakeResult(id, response.ToJson());
}

void McpServer::Send(const nlohmann::json& message) {
    out_ << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    out_.flush();
}

nlohmann::json McpServer::MakeError(const nlohmann::json& id, int code,
                                    const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace browser_mcp
