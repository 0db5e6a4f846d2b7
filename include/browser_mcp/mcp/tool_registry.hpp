#pragma once

#include <browser_mcp/core/result.hpp>
#include <browser_mcp/mcp/tool_response.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace browser_mcp {

class ExecutionContext;

enum class ToolCategory {
    Browser,
    Http,
    Codegen,
};

// ---------------------------------------------------------------------------
// ToolDescriptor: what tools/list advertises, plus dispatch metadata.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;   // JSON Schema object
    ToolCategory category = ToolCategory::Browser;
    bool opens_session = false;    // ensure a browser session before the handler
};

// A tool handler receives schema-validated arguments and the context.
using ToolHandler = std::function<Result<ToolResponse, Error>(
    const nlohmann::json& args, ExecutionContext& context)>;

// ---------------------------------------------------------------------------
// ToolRegistry: registry of MCP tools, in registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Rejects duplicate names; the first registration stays.
    Result<void, Error> Register(ToolDescriptor descriptor, ToolHandler handler);

    [[nodiscard]] const ToolDescriptor* Find(std::string_view name) const;
    [[nodiscard]] const ToolHandler* FindHandler(std::string_view name) const;

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

private:
    std::vector<ToolDescriptor> descriptors_;
    std::vector<ToolHandler> handlers_;
    std::map<std::string, size_t, std::less<>> index_;
};

// ---------------------------------------------------------------------------
// JSON Schema helpers used when declaring tools.
// ---------------------------------------------------------------------------
nlohmann::json StringProp(const std::string& desc);
nlohmann::json IntProp(const std::string& desc);
nlohmann::json BoolProp(const std::string& desc);
nlohmann::json EnumProp(const std::string& desc, const std::vector<std::string>& values);
nlohmann::json ObjectProp(const std::string& desc, const nlohmann::json& properties,
                          const nlohmann::json& required = nlohmann::json::array());
nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required = nlohmann::json::array());

} // namespace browser_mcp
