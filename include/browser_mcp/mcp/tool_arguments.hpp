#pragma once

#include <browser_mcp/browser/i_browser.hpp>
#include <browser_mcp/codegen/recorder.hpp>
#include <browser_mcp/config/app_config.hpp>
#include <browser_mcp/core/result.hpp>
#include <browser_mcp/http/api_client.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace browser_mcp {

// ---------------------------------------------------------------------------
// Typed tool arguments. Each Parse* function runs after schema validation
// and adds the semantic checks a schema cannot express (non-empty strings,
// positive sizes). Failures are ValidationFailure errors.
// ---------------------------------------------------------------------------

// Shared by every session-opening browser tool.
Result<PerCallLaunchArgs, Error> ParseLaunchArgs(const nlohmann::json& args);

struct NavigateArgs {
    std::string url;
    NavigateOptions options;
};
Result<NavigateArgs, Error> ParseNavigateArgs(const nlohmann::json& args);

struct ScreenshotArgs {
    std::string name;
    ScreenshotOptions options;
    bool store_base64 = true;
    bool save_png = false;
    std::optional<std::string> downloads_dir;
};
Result<ScreenshotArgs, Error> ParseScreenshotArgs(const nlohmann::json& args);

// browser_click, browser_hover, browser_click_and_switch_tab
struct SelectorArgs {
    std::string selector;
};
Result<SelectorArgs, Error> ParseSelectorArgs(const nlohmann::json& args);

// browser_fill, browser_select
struct FillArgs {
    std::string selector;
    std::string value;
};
Result<FillArgs, Error> ParseFillArgs(const nlohmann::json& args);

struct FrameClickArgs {
    std::string iframe_selector;
    std::string selector;
};
Result<FrameClickArgs, Error> ParseFrameClickArgs(const nlohmann::json& args);

struct FrameFillArgs {
    std::string iframe_selector;
    std::string selector;
    std::string value;
};
Result<FrameFillArgs, Error> ParseFrameFillArgs(const nlohmann::json& args);

struct UploadFileArgs {
    std::string selector;
    std::string file_path;
};
Result<UploadFileArgs, Error> ParseUploadFileArgs(const nlohmann::json& args);

struct EvaluateArgs {
    std::string script;
};
Result<EvaluateArgs, Error> ParseEvaluateArgs(const nlohmann::json& args);

struct ConsoleLogsArgs {
    std::string type = "all";
    std::optional<std::string> search;
    std::optional<long long> limit;
    bool clear = false;
};
Result<ConsoleLogsArgs, Error> ParseConsoleLogsArgs(const nlohmann::json& args);

struct VisibleTextArgs {
    std::optional<long long> max_length;
};
Result<VisibleTextArgs, Error> ParseVisibleTextArgs(const nlohmann::json& args);

struct VisibleHtmlArgs {
    HtmlOptions options;
    std::optional<long long> max_length;
};
Result<VisibleHtmlArgs, Error> ParseVisibleHtmlArgs(const nlohmann::json& args);

struct DragArgs {
    std::string source_selector;
    std::string target_selector;
};
Result<DragArgs, Error> ParseDragArgs(const nlohmann::json& args);

struct PressKeyArgs {
    std::string key;
    std::optional<std::string> selector;
};
Result<PressKeyArgs, Error> ParsePressKeyArgs(const nlohmann::json& args);

struct SavePdfArgs {
    std::string output_path;
    std::string filename = "page.pdf";
    PdfOptions options;
};
Result<SavePdfArgs, Error> ParseSavePdfArgs(const nlohmann::json& args);

struct ExpectResponseArgs {
    std::string id;
    std::string url;
};
Result<ExpectResponseArgs, Error> ParseExpectResponseArgs(const nlohmann::json& args);

struct AssertResponseArgs {
    std::string id;
    std::optional<std::string> value;
};
Result<AssertResponseArgs, Error> ParseAssertResponseArgs(const nlohmann::json& args);

struct UserAgentArgs {
    std::string user_agent;
};
Result<UserAgentArgs, Error> ParseUserAgentArgs(const nlohmann::json& args);

// api_get, api_post, api_put, api_patch, api_delete
struct ApiRequestArgs {
    std::string url;
    std::optional<std::string> value;
    std::optional<std::string> token;
    HttpHeaders headers;
};
Result<ApiRequestArgs, Error> ParseApiRequestArgs(const nlohmann::json& args, bool requires_body);

struct StartCodegenArgs {
    CodegenOptions options;
};
Result<StartCodegenArgs, Error> ParseStartCodegenArgs(const nlohmann::json& args);

// end_, get_ and clear_codegen_session
struct CodegenSessionArgs {
    std::string session_id;
};
Result<CodegenSessionArgs, Error> ParseCodegenSessionArgs(const nlohmann::json& args);

} // namespace browser_mcp
