#pragma once

#include <browser_mcp/codegen/recorder.hpp>
#include <browser_mcp/core/result.hpp>
#include <browser_mcp/mcp/tool_registry.hpp>

namespace browser_mcp {

// browser_* tools (category Browser).
Result<void, Error> RegisterBrowserTools(ToolRegistry& registry);

// api_get, api_post, api_put, api_patch, api_delete (category Http).
Result<void, Error> RegisterApiTools(ToolRegistry& registry);

// *_codegen_session tools (category Codegen).
Result<void, Error> RegisterCodegenTools(ToolRegistry& registry, CodegenRecorder& recorder);

// The complete catalog in advertisement order: browser, HTTP, codegen.
Result<void, Error> RegisterAllTools(ToolRegistry& registry, CodegenRecorder& recorder);

} // namespace browser_mcp
