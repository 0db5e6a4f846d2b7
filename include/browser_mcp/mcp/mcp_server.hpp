#pragma once

#include <browser_mcp/mcp/dispatcher.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <iostream>
#include <optional>
#include <string>

namespace browser_mcp {

// ---------------------------------------------------------------------------
// McpServer: JSON-RPC 2.0 over newline-delimited stdio. Requests are
// answered one at a time in arrival order.
// ---------------------------------------------------------------------------
class McpServer {
public:
    // `stop_requested` (optional) is polled between messages.
    McpServer(Dispatcher& dispatcher,
              std::istream& in = std::cin,
              std::ostream& out = std::cout,
              const std::atomic<bool>* stop_requested = nullptr);

    // Read and answer messages until EOF, a read error or a stop request.
    void Run();

    // Handle one parsed message. Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params, const nlohmann::json& id);

    void Send(const nlohmann::json& message);

    static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                    const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);

    Dispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    const std::atomic<bool>* stop_requested_;
    bool initialized_ = false;
};

} // namespace browser_mcp
