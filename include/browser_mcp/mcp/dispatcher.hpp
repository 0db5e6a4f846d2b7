#pragma once

#include <browser_mcp/codegen/recorder.hpp>
#include <browser_mcp/config/app_config.hpp>
#include <browser_mcp/mcp/tool_registry.hpp>
#include <browser_mcp/mcp/tool_response.hpp>
#include <browser_mcp/session/execution_context.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace browser_mcp {

// ---------------------------------------------------------------------------
// Dispatcher: routes one tool call to its handler against the execution
// context and shapes the outcome. Dispatch never throws; every failure
// becomes an isError response.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry,
               const GlobalLaunchConfig& launch_config,
               ExecutionContext& context,
               CodegenRecorder& recorder);

    [[nodiscard]] ToolResponse Dispatch(const std::string& name,
                                        const nlohmann::json& args);

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

private:
    Result<ToolResponse, Error> Run(const ToolDescriptor& descriptor,
                                    const ToolHandler& handler,
                                    const nlohmann::json& args);

    const ToolRegistry& registry_;
    const GlobalLaunchConfig& launch_config_;
    ExecutionContext& context_;
    CodegenRecorder& recorder_;
};

} // namespace browser_mcp
