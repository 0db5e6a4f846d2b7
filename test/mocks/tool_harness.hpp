#pragma once

#include <browser_mcp/codegen/recorder.hpp>
#include <browser_mcp/config/app_config.hpp>
#include <browser_mcp/mcp/dispatcher.hpp>
#include <browser_mcp/mcp/tool_handlers.hpp>
#include <browser_mcp/mcp/tool_registry.hpp>
#include <browser_mcp/session/execution_context.hpp>

#include "mock_api_client.hpp"
#include "mock_browser.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace browser_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// ToolHarness: the full tool catalog wired to mock browser and HTTP
// backends, the way main wires the real ones.
//
// Usage:
//   ToolHarness h;
//   auto r = h.Call("browser_navigate", {{"url", "https://example.com"}});
//   CHECK(r.Text() == "Navigated to https://example.com");
//   CHECK(h.browser->launches.size() == 1);
// ---------------------------------------------------------------------------
struct ToolHarness {
    std::shared_ptr<MockBrowserState> browser = std::make_shared<MockBrowserState>();
    std::shared_ptr<MockApiState> api = std::make_shared<MockApiState>();
    MockBrowserLauncher launcher{browser};
    GlobalLaunchConfig launch_config;
    ExecutionContext context;
    CodegenRecorder recorder;
    ToolRegistry registry;
    Dispatcher dispatcher;

    explicit ToolHarness(ExecutionContextOptions options = MakeOptions())
        : context(launcher, MakeMockApiFactory(api), std::move(options)),
          dispatcher(registry, launch_config, context, recorder) {
        auto registered = RegisterAllTools(registry, recorder);
        if (registered.IsErr()) {
            throw std::runtime_error(registered.Error().ToString());
        }
    }

    ToolResponse Call(const std::string& name,
                      const nlohmann::json& args = nlohmann::json::object()) {
        return dispatcher.Dispatch(name, args);
    }

    // The page state of the current session.
    MockPageState& Page() { return *browser->page; }

    static ExecutionContextOptions MakeOptions() {
        ExecutionContextOptions options;
        options.response_wait = std::chrono::milliseconds(300);
        return options;
    }
};

} // namespace testing
} // namespace browser_mcp
