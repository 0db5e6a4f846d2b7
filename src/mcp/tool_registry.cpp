#include <browser_mcp/mcp/tool_registry.hpp>

namespace browser_mcp {

Result<void, Error> ToolRegistry::Register(ToolDescriptor descriptor,
                                           ToolHandler handler) {
    if (index_.count(descriptor.name) > 0) {
        return Result<void, Error>::Err(Error{
            "RegisterTool", descriptor.name, std::nullopt,
            "Tool already registered", ErrorCategory::Internal});
    }
    index_.emplace(descriptor.name, descriptors_.size());
    descriptors_.push_back(std::move(descriptor));
    handlers_.push_back(std::move(handler));
    return Result<void, Error>::Ok();
}

const ToolDescriptor* ToolRegistry::Find(std::string_view name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &descriptors_[it->second];
}

const ToolHandler* ToolRegistry::FindHandler(std::string_view name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &handlers_[it->second];
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json EnumProp(const std::string& desc, const std::vector<std::string>& values) {
    return {{"type", "string"}, {"description", desc}, {"enum", values}};
}

nlohmann::json ObjectProp(const std::string& desc, const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"description", desc},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

} // namespace browser_mcp
