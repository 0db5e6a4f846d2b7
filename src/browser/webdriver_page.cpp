#include <browser_mcp/browser/webdriver_page.hpp>

#include <browser_mcp/browser/page_scripts.hpp>
#include <browser_mcp/browser/webdriver_protocol.hpp>
#include <browser_mcp/core/log.hpp>

#include <algorithm>
#include <thread>

namespace browser_mcp {

namespace {

constexpr const char* kComponent = "webdriver";
constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kNetworkIdleQuiet = std::chrono::milliseconds(500);

nlohmann::json ElementRef(const std::string& id) {
    return nlohmann::json{{kWebElementKey, id}};
}

const char* WaitUntilName(WaitUntil wait_until) {
    switch (wait_until) {
        case WaitUntil::Load:             return "load";
        case WaitUntil::DomContentLoaded: return "domcontentloaded";
        case WaitUntil::NetworkIdle:      return "networkidle";
        case WaitUntil::Commit:           return "commit";
    }
    return "load";
}

Result<void, Error> ToVoid(const Result<nlohmann::json, Error>& result) {
    if (result.IsErr()) {
        return Result<void, Error>::Err(result.Error());
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> ExpectString(Result<nlohmann::json, Error> result,
                                        std::string_view operation) {
    if (result.IsErr()) {
        return Result<std::string, Error>::Err(std::move(result).Error());
    }
    const auto& value = result.Value();
    if (!value.is_string()) {
        return Result<std::string, Error>::Err(Error{
            std::string(operation), "", std::nullopt,
            "Expected a string from WebDriver, got " + std::string(value.type_name()),
            ErrorCategory::UpstreamFailure});
    }
    return Result<std::string, Error>::Ok(value.get<std::string>());
}

nlohmann::json PointerActions(nlohmann::json steps) {
    nlohmann::json source = {
        {"type", "pointer"},
        {"id", "mouse"},
        {"parameters", {{"pointerType", "mouse"}}},
        {"actions", std::move(steps)},
    };
    nlohmann::json payload;
    payload["actions"] = nlohmann::json::array({source});
    return payload;
}

nlohmann::json MoveTo(const std::string& element_id, int duration_ms) {
    return {{"type", "pointerMove"},
            {"duration", duration_ms},
            {"origin", ElementRef(element_id)},
            {"x", 0},
            {"y", 0}};
}

} // anonymous namespace

WebDriverPage::WebDriverPage(std::shared_ptr<WebDriverSession> session, std::string handle)
    : session_(std::move(session)), handle_(std::move(handle)) {}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Result<void, Error> WebDriverPage::Activate() {
    if (session_->current_window == handle_) {
        return Result<void, Error>::Ok();
    }
    auto res = session_->client->Post(session_->Path("/window"),
                                      {{"handle", handle_}}, "SwitchToWindow");
    if (res.IsErr()) {
        return Result<void, Error>::Err(res.Error());
    }
    session_->current_window = handle_;
    return Result<void, Error>::Ok();
}

Result<std::string, Error> WebDriverPage::FindElement(std::string_view selector,
                                                      std::string_view operation) {
    auto locator = TranslateSelector(selector);
    auto res = session_->client->Post(
        session_->Path("/element"),
        {{"using", locator.strategy}, {"value", locator.value}}, operation);
    if (res.IsErr()) {
        auto error = std::move(res).Error();
        error.target = std::string(selector);
        return Result<std::string, Error>::Err(std::move(error));
    }
    const auto& value = res.Value();
    if (!value.is_object() || !value.contains(kWebElementKey) ||
        !value[kWebElementKey].is_string()) {
        return Result<std::string, Error>::Err(Error{
            std::string(operation), std::string(selector), std::nullopt,
            "WebDriver returned no element reference", ErrorCategory::UpstreamFailure});
    }
    return Result<std::string, Error>::Ok(value[kWebElementKey].get<std::string>());
}

Result<nlohmann::json, Error> WebDriverPage::Execute(const char* script,
                                                     const nlohmann::json& args,
                                                     std::string_view operation) {
    return session_->client->Post(session_->Path("/execute/sync"),
                                  {{"script", script}, {"args", args}}, operation);
}

Result<void, Error> WebDriverPage::PerformActions(const nlohmann::json& actions,
                                                  std::string_view operation) {
    auto res = session_->client->Post(session_->Path("/actions"), actions, operation);
    // Release pressed keys and buttons even when the chain failed half-way.
    auto release = session_->client->Delete(session_->Path("/actions"), "ReleaseActions");
    if (release.IsErr()) {
        LogDebug(kComponent, "Release actions failed: " + release.Error().ToString());
    }
    return ToVoid(res);
}

Result<void, Error> WebDriverPage::WithFrame(
    std::string_view frame_selector, std::string_view operation,
    const std::function<Result<void, Error>()>& body) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;

    auto frame = FindElement(frame_selector, operation);
    if (frame.IsErr()) {
        return Result<void, Error>::Err(frame.Error());
    }
    auto entered = session_->client->Post(session_->Path("/frame"),
                                          {{"id", ElementRef(frame.Value())}},
                                          "SwitchToFrame");
    if (entered.IsErr()) {
        auto error = entered.Error();
        error.target = std::string(frame_selector);
        return Result<void, Error>::Err(std::move(error));
    }

    auto result = body();

    nlohmann::json top = {{"id", nullptr}};
    auto left = session_->client->Post(session_->Path("/frame"), top, "SwitchToTopFrame");
    if (result.IsOk() && left.IsErr()) {
        return Result<void, Error>::Err(left.Error());
    }
    return result;
}

Result<void, Error> WebDriverPage::ClickElement(std::string_view selector) {
    auto element = FindElement(selector, "Click");
    if (element.IsErr()) return Result<void, Error>::Err(element.Error());
    return ToVoid(session_->client->Post(
        session_->Path("/element/" + element.Value() + "/click"),
        nlohmann::json::object(), "Click"));
}

Result<void, Error> WebDriverPage::FillElement(std::string_view selector,
                                               std::string_view value) {
    auto element = FindElement(selector, "Fill");
    if (element.IsErr()) return Result<void, Error>::Err(element.Error());
    auto base = session_->Path("/element/" + element.Value());
    auto cleared = session_->client->Post(base + "/clear", nlohmann::json::object(), "Fill");
    if (cleared.IsErr()) return ToVoid(cleared);
    return ToVoid(session_->client->Post(base + "/value",
                                         {{"text", std::string(value)}}, "Fill"));
}

Result<void, Error> WebDriverPage::InstallHooks(bool persistent) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;

    if (persistent && session_->engine == BrowserEngine::Chromium) {
        auto registered = session_->client->Post(
            session_->Path("/goog/cdp/execute"),
            {{"cmd", "Page.addScriptToEvaluateOnNewDocument"},
             {"params", {{"source", page_scripts::kInstallHooks}}}},
            "InstallHooks");
        if (registered.IsErr()) {
            LogDebug(kComponent, "Document-start hooks unavailable: " +
                                     registered.Error().ToString());
        }
    }
    return ToVoid(Execute(page_scripts::kInstallHooks, nlohmann::json::array(),
                          "InstallHooks"));
}

// ---------------------------------------------------------------------------
// Navigation
// ---------------------------------------------------------------------------

Result<void, Error> WebDriverPage::WaitForLoadState(
    std::string_view url, const NavigateOptions& options,
    std::chrono::steady_clock::time_point deadline) {
    if (options.wait_until == WaitUntil::Commit ||
        options.wait_until == WaitUntil::DomContentLoaded) {
        // pageLoadStrategy "eager" returns from navigation at DOMContentLoaded.
        return Result<void, Error>::Ok();
    }

    auto timed_out = [&]() {
        return Result<void, Error>::Err(Error{
            "Navigate", std::string(url), std::nullopt,
            "Page did not reach '" + std::string(WaitUntilName(options.wait_until)) +
                "' within " + std::to_string(options.timeout.count()) + " ms",
            ErrorCategory::Timeout});
    };

    while (true) {
        auto state = ExpectString(
            Execute(page_scripts::kReadyState, nlohmann::json::array(), "Navigate"),
            "Navigate");
        if (state.IsErr()) return Result<void, Error>::Err(state.Error());
        if (state.Value() == "complete") break;
        if (std::chrono::steady_clock::now() >= deadline) return timed_out();
        std::this_thread::sleep_for(kPollInterval);
    }

    if (options.wait_until != WaitUntil::NetworkIdle) {
        return Result<void, Error>::Ok();
    }

    auto quiet_since = std::chrono::steady_clock::now();
    while (true) {
        auto pending = Execute(page_scripts::kPendingRequests, nlohmann::json::array(),
                               "Navigate");
        if (pending.IsErr()) return ToVoid(pending);
        auto now = std::chrono::steady_clock::now();
        if (!pending.Value().is_number() || pending.Value().get<int>() > 0) {
            quiet_since = now;
        } else if (now - quiet_since >= kNetworkIdleQuiet) {
            return Result<void, Error>::Ok();
        }
        if (now >= deadline) return timed_out();
        std::this_thread::sleep_for(kPollInterval);
    }
}

Result<void, Error> WebDriverPage::Navigate(std::string_view url,
                                            const NavigateOptions& options) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;

    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    auto timeouts = session_->client->Post(
        session_->Path("/timeouts"),
        {{"pageLoad", options.timeout.count()}}, "Navigate");
    if (timeouts.IsErr()) return ToVoid(timeouts);

    // The HTTP read timeout must outlast the page load timeout.
    auto http_timeout = std::max(session_->command_timeout,
                                 options.timeout + std::chrono::milliseconds(5000));
    session_->client->SetCommandTimeout(http_timeout);
    auto navigated = session_->client->Post(session_->Path("/url"),
                                            {{"url", std::string(url)}}, "Navigate");
    session_->client->SetCommandTimeout(session_->command_timeout);
    if (navigated.IsErr()) {
        auto error = std::move(navigated).Error();
        error.target = std::string(url);
        return Result<void, Error>::Err(std::move(error));
    }

    auto hooks = InstallHooks(false);
    if (hooks.IsErr()) {
        LogDebug(kComponent, "Page hooks not installed: " + hooks.Error().ToString());
    }

    return WaitForLoadState(url, options, deadline);
}

Result<std::string, Error> WebDriverPage::CurrentUrl() {
    auto activated = Activate();
    if (activated.IsErr()) return Result<std::string, Error>::Err(activated.Error());
    return ExpectString(session_->client->Get(session_->Path("/url"), "CurrentUrl"),
                        "CurrentUrl");
}

Result<void, Error> WebDriverPage::GoBack() {
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    auto res = session_->client->Post(session_->Path("/back"),
                                      nlohmann::json::object(), "GoBack");
    if (res.IsErr()) return ToVoid(res);
    auto hooks = InstallHooks(false);
    if (hooks.IsErr()) {
        LogDebug(kComponent, "Page hooks not installed: " + hooks.Error().ToString());
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> WebDriverPage::GoForward() {
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    auto res = session_->client->Post(session_->Path("/forward"),
                                      nlohmann::json::object(), "GoForward");
    if (res.IsErr()) return ToVoid(res);
    auto hooks = InstallHooks(false);
    if (hooks.IsErr()) {
        LogDebug(kComponent, "Page hooks not installed: " + hooks.Error().ToString());
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Interaction
// ---------------------------------------------------------------------------

Result<void, Error> WebDriverPage::Click(std::string_view selector) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    return ClickElement(selector);
}

Result<void, Error> WebDriverPage::ClickInFrame(std::string_view frame_selector,
                                                std::string_view selector) {
    return WithFrame(frame_selector, "ClickInFrame",
                     [&]() { return ClickElement(selector); });
}

Result<void, Error> WebDriverPage::Fill(std::string_view selector, std::string_view value) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    return FillElement(selector, value);
}

Result<void, Error> WebDriverPage::FillInFrame(std::string_view frame_selector,
                                               std::string_view selector,
                                               std::string_view value) {
    return WithFrame(frame_selector, "FillInFrame",
                     [&]() { return FillElement(selector, value); });
}

Result<void, Error> WebDriverPage::SelectOption(std::string_view selector,
                                                std::string_view value) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    auto element = FindElement(selector, "SelectOption");
    if (element.IsErr()) return Result<void, Error>::Err(element.Error());
    nlohmann::json args = nlohmann::json::array({ElementRef(element.Value()), std::string(value)});
    return ToVoid(Execute(page_scripts::kSelectOption, args, "SelectOption"));
}

Result<void, Error> WebDriverPage::Hover(std::string_view selector) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    auto element = FindElement(selector, "Hover");
    if (element.IsErr()) return Result<void, Error>::Err(element.Error());
    return PerformActions(
        PointerActions(nlohmann::json::array({MoveTo(element.Value(), 0)})), "Hover");
}

Result<void, Error> WebDriverPage::SetInputFile(std::string_view selector,
                                                std::string_view file_path) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    auto element = FindElement(selector, "SetInputFile");
    if (element.IsErr()) return Result<void, Error>::Err(element.Error());
    return ToVoid(session_->client->Post(
        session_->Path("/element/" + element.Value() + "/value"),
        {{"text", std::string(file_path)}}, "SetInputFile"));
}

Result<void, Error> WebDriverPage::DragAndDrop(std::string_view source_selector,
                                               std::string_view target_selector) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    auto source = FindElement(source_selector, "DragAndDrop");
    if (source.IsErr()) return Result<void, Error>::Err(source.Error());
    auto target = FindElement(target_selector, "DragAndDrop");
    if (target.IsErr()) return Result<void, Error>::Err(target.Error());

    nlohmann::json steps = nlohmann::json::array();
    steps.push_back(MoveTo(source.Value(), 0));
    steps.push_back({{"type", "pointerDown"}, {"button", 0}});
    steps.push_back(MoveTo(target.Value(), 250));
    steps.push_back({{"type", "pointerUp"}, {"button", 0}});
    return PerformActions(PointerActions(std::move(steps)), "DragAndDrop");
}

Result<void, Error> WebDriverPage::PressKey(std::string_view key,
                                            const std::optional<std::string>& selector) {
    auto activated = Activate();
    if (activated.IsErr()) return activated;

    auto actions = BuildKeyPressActions(key);
    if (actions.IsErr()) {
        return Result<void, Error>::Err(Error{"PressKey", std::string(key), std::nullopt,
                                              actions.Error(),
                                              ErrorCategory::UpstreamFailure});
    }

    if (selector.has_value()) {
        auto element = FindElement(*selector, "PressKey");
        if (element.IsErr()) return Result<void, Error>::Err(element.Error());
        auto focused = Execute("arguments[0].focus();",
                               nlohmann::json::array({ElementRef(element.Value())}),
                               "PressKey");
        if (focused.IsErr()) return ToVoid(focused);
    }
    return PerformActions(actions.Value(), "PressKey");
}

// ---------------------------------------------------------------------------
// Content
// ---------------------------------------------------------------------------

Result<nlohmann::json, Error> WebDriverPage::Evaluate(std::string_view script) {
    auto activated = Activate();
    if (activated.IsErr()) return Result<nlohmann::json, Error>::Err(activated.Error());
    return Execute(page_scripts::kEvaluate,
                   nlohmann::json::array({std::string(script)}), "Evaluate");
}

Result<std::string, Error> WebDriverPage::VisibleText() {
    auto activated = Activate();
    if (activated.IsErr()) return Result<std::string, Error>::Err(activated.Error());
    return ExpectString(Execute(page_scripts::kVisibleText, nlohmann::json::array(),
                                "VisibleText"),
                        "VisibleText");
}

Result<std::string, Error> WebDriverPage::Html(const HtmlOptions& options) {
    auto activated = Activate();
    if (activated.IsErr()) return Result<std::string, Error>::Err(activated.Error());

    nlohmann::json root = nullptr;
    if (options.selector.has_value()) {
        auto element = FindElement(*options.selector, "Html");
        if (element.IsErr()) return Result<std::string, Error>::Err(element.Error());
        root = ElementRef(element.Value());
    }
    nlohmann::json flags = {
        {"removeScripts", options.remove_scripts},
        {"removeComments", options.remove_comments},
        {"removeStyles", options.remove_styles},
        {"removeMeta", options.remove_meta},
        {"cleanHtml", options.clean_html},
        {"minify", options.minify},
    };
    return ExpectString(Execute(page_scripts::kCleanHtml,
                                nlohmann::json::array({root, flags}), "Html"),
                        "Html");
}

Result<std::string, Error> WebDriverPage::Screenshot(const ScreenshotOptions& options) {
    auto activated = Activate();
    if (activated.IsErr()) return Result<std::string, Error>::Err(activated.Error());

    if (options.selector.has_value()) {
        auto element = FindElement(*options.selector, "Screenshot");
        if (element.IsErr()) return Result<std::string, Error>::Err(element.Error());
        return ExpectString(
            session_->client->Get(
                session_->Path("/element/" + element.Value() + "/screenshot"),
                "Screenshot"),
            "Screenshot");
    }

    if (options.full_page) {
        switch (session_->engine) {
            case BrowserEngine::Chromium: {
                auto res = session_->client->Post(
                    session_->Path("/goog/cdp/execute"),
                    {{"cmd", "Page.captureScreenshot"},
                     {"params", {{"format", "png"}, {"captureBeyondViewport", true}}}},
                    "Screenshot");
                if (res.IsErr()) return Result<std::string, Error>::Err(res.Error());
                const auto& value = res.Value();
                if (!value.is_object() || !value.contains("data") || !value["data"].is_string()) {
                    return Result<std::string, Error>::Err(Error{
                        "Screenshot", "", std::nullopt,
                        "Full-page capture returned no image data",
                        ErrorCategory::UpstreamFailure});
                }
                return Result<std::string, Error>::Ok(value["data"].get<std::string>());
            }
            case BrowserEngine::Firefox:
                return ExpectString(
                    session_->client->Get(session_->Path("/moz/screenshot/full"), "Screenshot"),
                    "Screenshot");
            case BrowserEngine::Webkit:
                LogWarn(kComponent, "Full-page screenshots are not supported on webkit; "
                                    "capturing the viewport");
                break;
        }
    }

    return ExpectString(session_->client->Get(session_->Path("/screenshot"), "Screenshot"),
                        "Screenshot");
}

Result<std::string, Error> WebDriverPage::PrintPdf(const PdfOptions& options) {
    auto activated = Activate();
    if (activated.IsErr()) return Result<std::string, Error>::Err(activated.Error());

    auto params = BuildPrintParameters(options);
    if (params.IsErr()) {
        return Result<std::string, Error>::Err(Error{
            "PrintPdf", options.format, std::nullopt, params.Error(),
            ErrorCategory::UpstreamFailure});
    }
    return ExpectString(session_->client->Post(session_->Path("/print"), params.Value(),
                                               "PrintPdf"),
                        "PrintPdf");
}

// ---------------------------------------------------------------------------
// Observation
// ---------------------------------------------------------------------------

Result<std::vector<ConsoleEntry>, Error> WebDriverPage::DrainConsole() {
    auto hooks = InstallHooks(false);
    if (hooks.IsErr()) return Result<std::vector<ConsoleEntry>, Error>::Err(hooks.Error());

    auto res = Execute(page_scripts::kDrainConsole, nlohmann::json::array(), "DrainConsole");
    if (res.IsErr()) return Result<std::vector<ConsoleEntry>, Error>::Err(res.Error());

    std::vector<ConsoleEntry> entries;
    if (res.Value().is_array()) {
        for (const auto& item : res.Value()) {
            if (!item.is_object()) continue;
            entries.push_back(ConsoleEntry{item.value("type", "log"), item.value("text", "")});
        }
    }
    return Result<std::vector<ConsoleEntry>, Error>::Ok(std::move(entries));
}

Result<std::vector<CapturedResponse>, Error> WebDriverPage::DrainResponses() {
    auto hooks = InstallHooks(false);
    if (hooks.IsErr()) {
        return Result<std::vector<CapturedResponse>, Error>::Err(hooks.Error());
    }

    auto res = Execute(page_scripts::kDrainResponses, nlohmann::json::array(),
                       "DrainResponses");
    if (res.IsErr()) return Result<std::vector<CapturedResponse>, Error>::Err(res.Error());

    std::vector<CapturedResponse> responses;
    if (res.Value().is_array()) {
        for (const auto& item : res.Value()) {
            if (!item.is_object()) continue;
            responses.push_back(CapturedResponse{item.value("url", ""),
                                                 item.value("status", 0),
                                                 item.value("body", "")});
        }
    }
    return Result<std::vector<CapturedResponse>, Error>::Ok(std::move(responses));
}

Result<void, Error> WebDriverPage::SetUserAgent(std::string_view user_agent) {
    if (session_->engine != BrowserEngine::Chromium) {
        return Result<void, Error>::Err(Error{
            "SetUserAgent", "", std::nullopt,
            "Overriding the user agent of a running browser requires the chromium engine",
            ErrorCategory::UpstreamFailure});
    }
    auto activated = Activate();
    if (activated.IsErr()) return activated;
    return ToVoid(session_->client->Post(
        session_->Path("/goog/cdp/execute"),
        {{"cmd", "Network.setUserAgentOverride"},
         {"params", {{"userAgent", std::string(user_agent)}}}},
        "SetUserAgent"));
}

bool WebDriverPage::IsClosed() {
    auto handles = session_->client->Get(session_->Path("/window/handles"), "WindowHandles");
    if (handles.IsErr() || !handles.Value().is_array()) {
        return true;
    }
    for (const auto& handle : handles.Value()) {
        if (handle.is_string() && handle.get<std::string>() == handle_) {
            return false;
        }
    }
    return true;
}

} // namespace browser_mcp
