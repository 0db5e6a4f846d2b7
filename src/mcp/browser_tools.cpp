#include <browser_mcp/mcp/tool_handlers.hpp>

#include <browser_mcp/codegen/test_generator.hpp>
#include <browser_mcp/core/base64.hpp>
#include <browser_mcp/core/log.hpp>
#include <browser_mcp/core/text.hpp>
#include <browser_mcp/core/url.hpp>
#include <browser_mcp/mcp/tool_arguments.hpp>
#include <browser_mcp/session/execution_context.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace browser_mcp {

namespace {

namespace fs = std::filesystem;

using ToolResult = Result<ToolResponse, Error>;

constexpr const char* kComponent = "tools";
constexpr std::chrono::milliseconds kNewTabTimeout{10000};
constexpr std::chrono::milliseconds kResponsePollInterval{100};

ToolResult Ok(ToolResponse response) {
    return ToolResult::Ok(std::move(response));
}

ToolResult Fail(const Error& error) {
    return ToolResult::Err(error);
}

Error MakeToolError(const std::string& tool, const std::string& target,
                    const std::string& message, ErrorCategory category) {
    return Error{tool, target, std::nullopt, message, category};
}

Error WriteError(const std::string& tool, const fs::path& path, const std::string& message) {
    return MakeToolError(tool, path.string(), message, ErrorCategory::Internal);
}

Result<void, Error> WriteBinaryFile(const std::string& tool, const fs::path& path,
                                    const std::string& bytes) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::Err(
                WriteError(tool, path, "Cannot create directory: " + ec.message()));
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(WriteError(tool, path, "Cannot open file for writing"));
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        return Result<void, Error>::Err(WriteError(tool, path, "Write failed"));
    }
    return Result<void, Error>::Ok();
}

// Keep long page artifacts short enough for the prefix added around them.
// At the absolute cap the headroom keeps prefix and marker inside the cap;
// below it only the caller's real prefix is reserved.
std::string TruncateForPrefix(const std::string& text, std::optional<long long> requested_max,
                              size_t prefix_length = kPrefixHeadroom) {
    auto effective = EffectiveMaxLength(requested_max);
    auto reserved = effective == kAbsoluteMaxLength
                        ? kPrefixHeadroom + Utf8Length(kTruncationMarker)
                        : prefix_length;
    auto budget = effective > reserved ? effective - reserved : 0;
    return TruncateText(text, static_cast<long long>(budget));
}

nlohmann::json LaunchProperties() {
    return {
        {"browserType", EnumProp("Browser engine (default: chromium)",
                                 {"chromium", "firefox", "webkit"})},
        {"width", IntProp("Viewport width in pixels (default: 1280)")},
        {"height", IntProp("Viewport height in pixels (default: 720)")},
        {"headless", BoolProp("Run the browser headless (default: false)")},
        {"proxy", ObjectProp(
                      "Proxy for the browser session",
                      {{"server", StringProp("Proxy URL, e.g. http://proxy.example:8080")},
                       {"bypass", StringProp("Comma-separated hosts that skip the proxy")},
                       {"username", StringProp("Proxy user")},
                       {"password", StringProp("Proxy password")}},
                      nlohmann::json::array({"server"}))},
    };
}

// ---------------------------------------------------------------------------
// Navigation
// ---------------------------------------------------------------------------

// browser_navigate
ToolResult HandleNavigate(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseNavigateArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_navigate");
    if (page.IsErr()) return Fail(page.Error());

    const auto& nav = parsed.Value();
    auto result = page.Value()->Navigate(nav.url, nav.options);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Navigated to " + nav.url));
}

// browser_go_back, browser_go_forward
ToolResult HandleHistory(ExecutionContext& context, bool back) {
    auto page = context.RequirePage(back ? "browser_go_back" : "browser_go_forward");
    if (page.IsErr()) return Fail(page.Error());

    auto result = back ? page.Value()->GoBack() : page.Value()->GoForward();
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess(back ? "Navigated back in browser history"
                                : "Navigated forward in browser history"));
}

// ---------------------------------------------------------------------------
// Interaction
// ---------------------------------------------------------------------------

// browser_click
ToolResult HandleClick(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseSelectorArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_click");
    if (page.IsErr()) return Fail(page.Error());

    auto result = page.Value()->Click(parsed.Value().selector);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Clicked element: " + parsed.Value().selector));
}

// browser_iframe_click
ToolResult HandleIframeClick(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseFrameClickArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_iframe_click");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto result = page.Value()->ClickInFrame(a.iframe_selector, a.selector);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Clicked element " + a.selector + " inside iframe " +
                           a.iframe_selector));
}

// browser_iframe_fill
ToolResult HandleIframeFill(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseFrameFillArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_iframe_fill");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto result = page.Value()->FillInFrame(a.iframe_selector, a.selector, a.value);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Filled element " + a.selector + " inside iframe " +
                           a.iframe_selector + " with: " + a.value));
}

// browser_fill
ToolResult HandleFill(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseFillArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_fill");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto result = page.Value()->Fill(a.selector, a.value);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Filled " + a.selector + " with: " + a.value));
}

// browser_select
ToolResult HandleSelect(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseFillArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_select");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto result = page.Value()->SelectOption(a.selector, a.value);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Selected " + a.selector + " with: " + a.value));
}

// browser_hover
ToolResult HandleHover(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseSelectorArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_hover");
    if (page.IsErr()) return Fail(page.Error());

    auto result = page.Value()->Hover(parsed.Value().selector);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Hovered " + parsed.Value().selector));
}

// browser_upload_file
ToolResult HandleUploadFile(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseUploadFileArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());

    const auto& a = parsed.Value();
    std::error_code ec;
    if (!fs::is_regular_file(a.file_path, ec)) {
        return Fail(MakeToolError("browser_upload_file", a.file_path,
                                  "File not found: " + a.file_path,
                                  ErrorCategory::ValidationFailure));
    }
    auto absolute = fs::absolute(a.file_path, ec);
    if (ec) {
        return Fail(MakeToolError("browser_upload_file", a.file_path,
                                  "Cannot resolve path: " + ec.message(),
                                  ErrorCategory::ValidationFailure));
    }

    auto page = context.RequirePage("browser_upload_file");
    if (page.IsErr()) return Fail(page.Error());
    auto result = page.Value()->SetInputFile(a.selector, absolute.string());
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Uploaded file '" + absolute.string() + "' to '" +
                           a.selector + "'"));
}

// browser_drag
ToolResult HandleDrag(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseDragArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_drag");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto result = page.Value()->DragAndDrop(a.source_selector, a.target_selector);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Dragged element from " + a.source_selector + " to " +
                           a.target_selector));
}

// browser_press_key
ToolResult HandlePressKey(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParsePressKeyArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_press_key");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto result = page.Value()->PressKey(a.key, a.selector);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Pressed key: " + a.key));
}

// browser_click_and_switch_tab
ToolResult HandleClickAndSwitchTab(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseSelectorArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_click_and_switch_tab");
    if (page.IsErr()) return Fail(page.Error());

    auto* current = page.Value();
    const auto& selector = parsed.Value().selector;
    auto opened = context.Browser()->WaitForNewPage(
        [current, &selector]() { return current->Click(selector); }, kNewTabTimeout);
    if (opened.IsErr()) return Fail(opened.Error());

    context.ReplacePage(std::move(opened).Value());
    auto url = context.Page()->CurrentUrl();
    if (url.IsErr()) return Fail(url.Error());
    return Ok(BuildSuccess("Clicked link and switched to new tab. New tab URL: " +
                           url.Value()));
}

// ---------------------------------------------------------------------------
// Content
// ---------------------------------------------------------------------------

// browser_screenshot
ToolResult HandleScreenshot(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseScreenshotArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_screenshot");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto png = page.Value()->Screenshot(a.options);
    if (png.IsErr()) return Fail(png.Error());

    std::vector<std::string> lines;
    if (a.save_png) {
        auto bytes = Base64Decode(png.Value());
        if (bytes.IsErr()) {
            return Fail(MakeToolError("browser_screenshot", a.name,
                                      "Malformed screenshot data: " + bytes.Error(),
                                      ErrorCategory::UpstreamFailure));
        }
        fs::path dir = a.downloads_dir.value_or(context.Options().downloads_dir);
        if (dir.empty()) {
            dir = fs::current_path();
        }
        auto path = dir / (MakeTestName(a.name, std::chrono::system_clock::now()) + ".png");
        auto written = WriteBinaryFile("browser_screenshot", path, bytes.Value());
        if (written.IsErr()) return Fail(written.Error());
        LogInfo(kComponent, "Screenshot saved to " + path.string());
        lines.push_back("Screenshot saved to: " + path.string());
    }

    if (a.store_base64) {
        lines.push_back("Screenshot '" + a.name + "' taken");
        std::string text;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) text += '\n';
            text += lines[i];
        }
        return Ok(BuildImage(text, png.Value()));
    }
    if (lines.empty()) {
        lines.push_back("Screenshot '" + a.name + "' taken (not stored)");
    }
    return Ok(BuildSuccess(lines));
}

// browser_evaluate
ToolResult HandleEvaluate(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseEvaluateArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_evaluate");
    if (page.IsErr()) return Fail(page.Error());

    auto result = page.Value()->Evaluate(parsed.Value().script);
    if (result.IsErr()) return Fail(result.Error());

    auto rendered = result.Value().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    return Ok(BuildSuccess(std::vector<std::string>{
        "Executed JavaScript:",
        parsed.Value().script,
        "",
        "Result:",
        TruncateForPrefix(rendered, std::nullopt),
    }));
}

// browser_get_visible_text
ToolResult HandleVisibleText(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseVisibleTextArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_get_visible_text");
    if (page.IsErr()) return Fail(page.Error());

    auto text = page.Value()->VisibleText();
    if (text.IsErr()) return Fail(text.Error());
    return Ok(BuildSuccess("Visible text content:\n" + text.Value(), parsed.Value().max_length));
}

// browser_get_visible_html
ToolResult HandleVisibleHtml(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseVisibleHtmlArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_get_visible_html");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto html = page.Value()->Html(a.options);
    if (html.IsErr()) return Fail(html.Error());
    const std::string prefix = "HTML content:\n";
    return Ok(BuildSuccess(
        prefix + TruncateForPrefix(html.Value(), a.max_length, Utf8Length(prefix)),
        a.max_length));
}

// browser_save_as_pdf
ToolResult HandleSavePdf(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseSavePdfArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_save_as_pdf");
    if (page.IsErr()) return Fail(page.Error());

    const auto& a = parsed.Value();
    auto pdf = page.Value()->PrintPdf(a.options);
    if (pdf.IsErr()) return Fail(pdf.Error());

    auto bytes = Base64Decode(pdf.Value());
    if (bytes.IsErr()) {
        return Fail(MakeToolError("browser_save_as_pdf", a.output_path,
                                  "Malformed PDF data: " + bytes.Error(),
                                  ErrorCategory::UpstreamFailure));
    }
    auto path = fs::path(a.output_path) / a.filename;
    auto written = WriteBinaryFile("browser_save_as_pdf", path, bytes.Value());
    if (written.IsErr()) return Fail(written.Error());
    return Ok(BuildSuccess("Saved page as PDF: " + path.string()));
}

// ---------------------------------------------------------------------------
// Observation
// ---------------------------------------------------------------------------

// browser_console_logs
ToolResult HandleConsoleLogs(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseConsoleLogsArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    const auto& a = parsed.Value();

    std::vector<std::string> matching;
    for (const auto& entry : context.ConsoleMessages()) {
        if (a.type != "all" && entry.type != a.type) continue;
        if (a.search && entry.text.find(*a.search) == std::string::npos) continue;
        matching.push_back("[" + entry.type + "] " + entry.text);
    }
    if (a.limit.has_value() && matching.size() > static_cast<size_t>(*a.limit)) {
        matching.erase(matching.begin(),
                       matching.end() - static_cast<std::ptrdiff_t>(*a.limit));
    }
    if (a.clear) {
        context.ClearConsole();
    }

    if (matching.empty()) {
        return Ok(BuildSuccess("No console logs matching the criteria"));
    }

    std::string joined;
    for (size_t i = 0; i < matching.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += matching[i];
    }
    return Ok(BuildSuccess(std::vector<std::string>{
        "Retrieved " + std::to_string(matching.size()) + " console log(s):",
        TruncateForPrefix(joined, std::nullopt),
    }));
}

// browser_expect_response
ToolResult HandleExpectResponse(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseExpectResponseArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_expect_response");
    if (page.IsErr()) return Fail(page.Error());

    // Only responses arriving after this call may satisfy the expectation.
    auto pulled = context.CollectResponses();
    if (pulled.IsErr()) return Fail(pulled.Error());
    const auto& a = parsed.Value();
    auto& buffer = context.CapturedResponses();
    buffer.erase(std::remove_if(buffer.begin(), buffer.end(),
                                [&a](const CapturedResponse& r) {
                                    return UrlMatchesGlob(r.url, a.url);
                                }),
                 buffer.end());

    context.ArmExpectation(ResponseExpectation{a.id, a.url});
    return Ok(BuildSuccess("Started waiting for response with ID " + a.id));
}

// browser_assert_response
ToolResult HandleAssertResponse(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseAssertResponseArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    const auto& a = parsed.Value();

    auto expectation = context.TakeExpectation(a.id);
    if (!expectation.has_value()) {
        return Fail(MakeToolError("browser_assert_response", a.id,
                                  "No response expectation with ID " + a.id +
                                      "; call browser_expect_response first",
                                  ErrorCategory::ValidationFailure));
    }
    auto page = context.RequirePage("browser_assert_response");
    if (page.IsErr()) return Fail(page.Error());

    auto& buffer = context.CapturedResponses();
    auto deadline = std::chrono::steady_clock::now() + context.Options().response_wait;
    std::optional<CapturedResponse> matched;
    while (!matched.has_value()) {
        auto pulled = context.CollectResponses();
        if (pulled.IsErr()) return Fail(pulled.Error());
        auto it = std::find_if(buffer.begin(), buffer.end(),
                               [&](const CapturedResponse& r) {
                                   return UrlMatchesGlob(r.url, expectation->url_pattern);
                               });
        if (it != buffer.end()) {
            matched = *it;
            buffer.erase(it);
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Fail(MakeToolError("browser_assert_response", expectation->url_pattern,
                                      "Timed out waiting for a response matching " +
                                          expectation->url_pattern,
                                      ErrorCategory::Timeout));
        }
        std::this_thread::sleep_for(kResponsePollInterval);
    }

    if (a.value.has_value() && matched->body.find(*a.value) == std::string::npos) {
        return Fail(MakeToolError("browser_assert_response", matched->url,
                                  "Response body does not contain expected value: " +
                                      *a.value + "\nActual body: " +
                                      TruncateForPrefix(matched->body, std::nullopt),
                                  ErrorCategory::UpstreamFailure));
    }

    return Ok(BuildSuccess(std::vector<std::string>{
        "Response assertion for ID " + a.id + " successful",
        "URL: " + matched->url,
        "Status: " + std::to_string(matched->status),
        "Body: " + TruncateForPrefix(matched->body, std::nullopt),
    }));
}

// browser_custom_user_agent
ToolResult HandleCustomUserAgent(const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseUserAgentArgs(args);
    if (parsed.IsErr()) return Fail(parsed.Error());
    auto page = context.RequirePage("browser_custom_user_agent");
    if (page.IsErr()) return Fail(page.Error());

    auto result = page.Value()->SetUserAgent(parsed.Value().user_agent);
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("User agent set to: " + parsed.Value().user_agent));
}

// browser_close
ToolResult HandleClose(ExecutionContext& context) {
    if (!context.HasSession()) {
        return Ok(BuildSuccess("No browser session is open"));
    }
    auto result = context.CloseSession();
    if (result.IsErr()) return Fail(result.Error());
    return Ok(BuildSuccess("Browser closed successfully"));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterBrowserTools
// ---------------------------------------------------------------------------
Result<void, Error> RegisterBrowserTools(ToolRegistry& registry) {
    auto status = Result<void, Error>::Ok();
    auto add = [&registry, &status](std::string name, std::string description,
                                    nlohmann::json schema, ToolHandler handler,
                                    bool opens_session = true) {
        if (status.IsErr()) return;
        status = registry.Register(
            ToolDescriptor{std::move(name), std::move(description), std::move(schema),
                           ToolCategory::Browser, opens_session},
            std::move(handler));
    };
    auto no_args = [] { return MakeSchema(nlohmann::json::object()); };

    auto navigate_props = LaunchProperties();
    navigate_props["url"] = StringProp("URL to navigate to");
    navigate_props["timeout"] = IntProp("Navigation timeout in milliseconds (default: 30000)");
    navigate_props["waitUntil"] = EnumProp("Navigation wait condition (default: load)",
                                           {"load", "domcontentloaded", "networkidle", "commit"});
    add("browser_navigate",
        "Navigate to a URL. Launches the browser on first use; launch options "
        "(browserType, size, headless, proxy) only apply to a new session.",
        MakeSchema(navigate_props, nlohmann::json::array({"url"})),
        HandleNavigate);

    add("browser_screenshot",
        "Take a screenshot of the current page or of a single element.",
        MakeSchema(
            {{"name", StringProp("Name for the screenshot")},
             {"selector", StringProp("CSS selector of the element to capture")},
             {"fullPage", BoolProp("Capture the full scrollable page (default: false)")},
             {"storeBase64", BoolProp("Return the image in the response (default: true)")},
             {"savePng", BoolProp("Save the image as a PNG file (default: false)")},
             {"downloadsDir", StringProp("Directory for the PNG file")}},
            nlohmann::json::array({"name"})),
        HandleScreenshot);

    add("browser_click",
        "Click an element on the page.",
        MakeSchema({{"selector", StringProp("CSS selector of the element to click")}},
                   nlohmann::json::array({"selector"})),
        HandleClick);

    add("browser_iframe_click",
        "Click an element inside an iframe.",
        MakeSchema(
            {{"iframeSelector", StringProp("CSS selector of the iframe")},
             {"selector", StringProp("CSS selector of the element inside the iframe")}},
            nlohmann::json::array({"iframeSelector", "selector"})),
        HandleIframeClick);

    add("browser_iframe_fill",
        "Fill an input field inside an iframe.",
        MakeSchema(
            {{"iframeSelector", StringProp("CSS selector of the iframe")},
             {"selector", StringProp("CSS selector of the input inside the iframe")},
             {"value", StringProp("Value to fill")}},
            nlohmann::json::array({"iframeSelector", "selector", "value"})),
        HandleIframeFill);

    add("browser_fill",
        "Fill an input field.",
        MakeSchema(
            {{"selector", StringProp("CSS selector of the input field")},
             {"value", StringProp("Value to fill")}},
            nlohmann::json::array({"selector", "value"})),
        HandleFill);

    add("browser_select",
        "Select an option in a <select> element.",
        MakeSchema(
            {{"selector", StringProp("CSS selector of the select element")},
             {"value", StringProp("Option value to select")}},
            nlohmann::json::array({"selector", "value"})),
        HandleSelect);

    add("browser_hover",
        "Hover over an element on the page.",
        MakeSchema({{"selector", StringProp("CSS selector of the element to hover")}},
                   nlohmann::json::array({"selector"})),
        HandleHover);

    add("browser_upload_file",
        "Upload a local file through an <input type=\"file\"> element.",
        MakeSchema(
            {{"selector", StringProp("CSS selector of the file input")},
             {"filePath", StringProp("Path of the file to upload")}},
            nlohmann::json::array({"selector", "filePath"})),
        HandleUploadFile);

    add("browser_evaluate",
        "Execute JavaScript in the page and return the result.",
        MakeSchema({{"script", StringProp("JavaScript expression to evaluate")}},
                   nlohmann::json::array({"script"})),
        HandleEvaluate);

    add("browser_console_logs",
        "Retrieve console messages captured from the page.",
        MakeSchema(
            {{"type", EnumProp("Message type filter (default: all)",
                               {"all", "error", "warning", "log", "info", "debug",
                                "exception"})},
             {"search", StringProp("Only messages containing this text")},
             {"limit", IntProp("Return at most this many of the latest messages")},
             {"clear", BoolProp("Clear the buffer after retrieval (default: false)")}}),
        HandleConsoleLogs);

    add("browser_close",
        "Close the browser and release all resources.",
        no_args(),
        [](const nlohmann::json&, ExecutionContext& context) { return HandleClose(context); },
        false);

    add("browser_get_visible_text",
        "Get the visible text content of the current page.",
        MakeSchema({{"maxLength", IntProp("Maximum characters to return (default and "
                                          "maximum: 20000)")}}),
        HandleVisibleText);

    add("browser_get_visible_html",
        "Get the HTML of the current page. Scripts are removed by default.",
        MakeSchema(
            {{"selector", StringProp("Only the HTML of this element")},
             {"removeScripts", BoolProp("Remove <script> tags (default: true)")},
             {"removeComments", BoolProp("Remove HTML comments (default: false)")},
             {"removeStyles", BoolProp("Remove <style> tags and style attributes "
                                       "(default: false)")},
             {"removeMeta", BoolProp("Remove <meta> tags (default: false)")},
             {"cleanHtml", BoolProp("Apply all removals (default: false)")},
             {"minify", BoolProp("Collapse whitespace (default: false)")},
             {"maxLength", IntProp("Maximum characters to return (default and "
                                   "maximum: 20000)")}}),
        HandleVisibleHtml);

    add("browser_go_back",
        "Navigate back in browser history.",
        no_args(),
        [](const nlohmann::json&, ExecutionContext& context) {
            return HandleHistory(context, true);
        });

    add("browser_go_forward",
        "Navigate forward in browser history.",
        no_args(),
        [](const nlohmann::json&, ExecutionContext& context) {
            return HandleHistory(context, false);
        });

    add("browser_drag",
        "Drag an element onto another element.",
        MakeSchema(
            {{"sourceSelector", StringProp("CSS selector of the element to drag")},
             {"targetSelector", StringProp("CSS selector of the drop target")}},
            nlohmann::json::array({"sourceSelector", "targetSelector"})),
        HandleDrag);

    add("browser_press_key",
        "Press a keyboard key, optionally after focusing an element.",
        MakeSchema(
            {{"key", StringProp("Key to press, e.g. Enter, ArrowDown, Control+A")},
             {"selector", StringProp("CSS selector of the element to focus first")}},
            nlohmann::json::array({"key"})),
        HandlePressKey);

    add("browser_save_as_pdf",
        "Save the current page as a PDF file.",
        MakeSchema(
            {{"outputPath", StringProp("Directory for the PDF file")},
             {"filename", StringProp("File name (default: page.pdf)")},
             {"format", StringProp("Paper format, e.g. A4, Letter (default: A4)")},
             {"printBackground", BoolProp("Print background graphics (default: true)")},
             {"margin", ObjectProp("Page margins as CSS lengths, e.g. 1cm",
                                   {{"top", StringProp("Top margin")},
                                    {"right", StringProp("Right margin")},
                                    {"bottom", StringProp("Bottom margin")},
                                    {"left", StringProp("Left margin")}})}},
            nlohmann::json::array({"outputPath"})),
        HandleSavePdf);

    add("browser_click_and_switch_tab",
        "Click a link that opens a new tab and continue in that tab.",
        MakeSchema({{"selector", StringProp("CSS selector of the link")}},
                   nlohmann::json::array({"selector"})),
        HandleClickAndSwitchTab);

    add("browser_expect_response",
        "Start waiting for an HTTP response. Pair with browser_assert_response.",
        MakeSchema(
            {{"id", StringProp("Identifier used by browser_assert_response")},
             {"url", StringProp("URL glob: * matches within a segment, ** across")}},
            nlohmann::json::array({"id", "url"})),
        HandleExpectResponse);

    add("browser_assert_response",
        "Wait for a response registered with browser_expect_response and check it.",
        MakeSchema(
            {{"id", StringProp("Identifier passed to browser_expect_response")},
             {"value", StringProp("Text the response body must contain")}},
            nlohmann::json::array({"id"})),
        HandleAssertResponse);

    add("browser_custom_user_agent",
        "Set a custom User-Agent for the browser session.",
        MakeSchema({{"userAgent", StringProp("User-Agent string")}},
                   nlohmann::json::array({"userAgent"})),
        HandleCustomUserAgent);

    return status;
}

} // namespace browser_mcp
