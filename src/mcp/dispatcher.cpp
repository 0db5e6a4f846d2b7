#include <browser_mcp/mcp/dispatcher.hpp>

#include <browser_mcp/config/config_loader.hpp>
#include <browser_mcp/core/log.hpp>
#include <browser_mcp/mcp/schema_validator.hpp>
#include <browser_mcp/mcp/tool_arguments.hpp>

#include <exception>

namespace browser_mcp {

Dispatcher::Dispatcher(const ToolRegistry& registry,
                       const GlobalLaunchConfig& launch_config,
                       ExecutionContext& context,
                       CodegenRecorder& recorder)
    : registry_(registry),
      launch_config_(launch_config),
      context_(context),
      recorder_(recorder) {}

ToolResponse Dispatcher::Dispatch(const std::string& name,
                                  const nlohmann::json& args) {
    const auto* descriptor = registry_.Find(name);
    const auto* handler = registry_.FindHandler(name);
    if (descriptor == nullptr || handler == nullptr) {
        LogWarn("dispatch", "Unknown tool: " + name);
        return BuildError(ErrorCategory::UnknownTool, "Unknown tool: " + name);
    }

    LogDebug("dispatch", "Calling " + name);
    auto result = Run(*descriptor, *handler, args);
    if (result.IsErr()) {
        LogInfo("dispatch", name + " failed: " + result.Error().ToString());
        return BuildError(result.Error());
    }

    if (descriptor->category == ToolCategory::Browser && !result.Value().IsError()) {
        recorder_.Record(name, args);
    }
    return std::move(result).Value();
}

Result<ToolResponse, Error> Dispatcher::Run(const ToolDescriptor& descriptor,
                                            const ToolHandler& handler,
                                            const nlohmann::json& args) {
    auto valid = ValidateArguments(descriptor.input_schema, args, descriptor.name);
    if (valid.IsErr()) {
        return Result<ToolResponse, Error>::Err(valid.Error());
    }

    try {
        if (descriptor.opens_session) {
            auto per_call = ParseLaunchArgs(args);
            if (per_call.IsErr()) {
                return Result<ToolResponse, Error>::Err(per_call.Error());
            }
            auto settings = ResolveLaunchSettings(launch_config_, per_call.Value());
            auto page = context_.EnsureSession(settings);
            if (page.IsErr()) {
                return Result<ToolResponse, Error>::Err(page.Error());
            }
        }

        // Messages logged by the page before this call belong to the buffer.
        if (descriptor.category == ToolCategory::Browser && context_.Page() != nullptr) {
            auto collected = context_.CollectConsole();
            if (collected.IsErr()) {
                LogDebug("dispatch", "Console collection failed: " +
                                         collected.Error().ToString());
            }
        }

        return handler(args, context_);
    } catch (const std::exception& e) {
        LogError("dispatch", descriptor.name + " threw: " + e.what());
        return Result<ToolResponse, Error>::Err(
            Error{descriptor.name, "", std::nullopt,
                  std::string("Unexpected failure: ") + e.what(),
                  ErrorCategory::Internal});
    }
}

} // namespace browser_mcp
