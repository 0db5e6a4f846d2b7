#pragma once

#include <browser_mcp/config/app_config.hpp>
#include <browser_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace browser_mcp {

enum class WaitUntil {
    Load,
    DomContentLoaded,
    NetworkIdle,
    Commit,
};

struct NavigateOptions {
    std::chrono::milliseconds timeout{30000};
    WaitUntil wait_until = WaitUntil::Load;
};

struct ScreenshotOptions {
    std::optional<std::string> selector;
    bool full_page = false;
};

struct HtmlOptions {
    std::optional<std::string> selector;
    bool remove_scripts = true;
    bool remove_comments = false;
    bool remove_styles = false;
    bool remove_meta = false;
    bool clean_html = false;
    bool minify = false;
};

struct PdfMargins {
    std::string top;
    std::string right;
    std::string bottom;
    std::string left;
};

struct PdfOptions {
    std::string format = "A4";
    bool print_background = true;
    PdfMargins margin;
};

// One console message captured in the page (console.*, uncaught errors
// and unhandled promise rejections).
struct ConsoleEntry {
    std::string type;   // log, info, warning, error, debug, exception
    std::string text;
};

// One fetch/XHR response observed in the page.
struct CapturedResponse {
    std::string url;
    int status = 0;
    std::string body;
};

// ---------------------------------------------------------------------------
// IPage: one browser tab. All interactions use CSS selectors; "xpath=..."
// and "text=..." prefixes are also understood.
// ---------------------------------------------------------------------------
class IPage {
public:
    virtual ~IPage() = default;

    IPage(const IPage&) = delete;
    IPage& operator=(const IPage&) = delete;
    IPage(IPage&&) = delete;
    IPage& operator=(IPage&&) = delete;

    // -- Navigation ----------------------------------------------------------

    [[nodiscard]] virtual Result<void, Error> Navigate(
        std::string_view url, const NavigateOptions& options) = 0;
    [[nodiscard]] virtual Result<std::string, Error> CurrentUrl() = 0;
    [[nodiscard]] virtual Result<void, Error> GoBack() = 0;
    [[nodiscard]] virtual Result<void, Error> GoForward() = 0;

    // -- Interaction ---------------------------------------------------------

    [[nodiscard]] virtual Result<void, Error> Click(std::string_view selector) = 0;
    [[nodiscard]] virtual Result<void, Error> ClickInFrame(
        std::string_view frame_selector, std::string_view selector) = 0;
    [[nodiscard]] virtual Result<void, Error> Fill(
        std::string_view selector, std::string_view value) = 0;
    [[nodiscard]] virtual Result<void, Error> FillInFrame(
        std::string_view frame_selector, std::string_view selector,
        std::string_view value) = 0;
    [[nodiscard]] virtual Result<void, Error> SelectOption(
        std::string_view selector, std::string_view value) = 0;
    [[nodiscard]] virtual Result<void, Error> Hover(std::string_view selector) = 0;
    [[nodiscard]] virtual Result<void, Error> SetInputFile(
        std::string_view selector, std::string_view file_path) = 0;
    [[nodiscard]] virtual Result<void, Error> DragAndDrop(
        std::string_view source_selector, std::string_view target_selector) = 0;
    [[nodiscard]] virtual Result<void, Error> PressKey(
        std::string_view key, const std::optional<std::string>& selector) = 0;

    // -- Content -------------------------------------------------------------

    /// Evaluate a JavaScript expression; promises are awaited.
    [[nodiscard]] virtual Result<nlohmann::json, Error> Evaluate(
        std::string_view script) = 0;
    [[nodiscard]] virtual Result<std::string, Error> VisibleText() = 0;
    [[nodiscard]] virtual Result<std::string, Error> Html(const HtmlOptions& options) = 0;
    /// Base64-encoded PNG.
    [[nodiscard]] virtual Result<std::string, Error> Screenshot(
        const ScreenshotOptions& options) = 0;
    /// Base64-encoded PDF.
    [[nodiscard]] virtual Result<std::string, Error> PrintPdf(const PdfOptions& options) = 0;

    // -- Observation ---------------------------------------------------------

    /// Console messages captured since the previous drain.
    [[nodiscard]] virtual Result<std::vector<ConsoleEntry>, Error> DrainConsole() = 0;
    /// Responses captured since the previous drain.
    [[nodiscard]] virtual Result<std::vector<CapturedResponse>, Error> DrainResponses() = 0;

    [[nodiscard]] virtual Result<void, Error> SetUserAgent(std::string_view user_agent) = 0;

    /// True once the tab has been closed (by the user or by the page).
    [[nodiscard]] virtual bool IsClosed() = 0;

protected:
    IPage() = default;
};

// ---------------------------------------------------------------------------
// IBrowser: a launched browser instance owning zero or more pages.
// Pages must be released before the browser that created them.
// ---------------------------------------------------------------------------
class IBrowser {
public:
    virtual ~IBrowser() = default;

    IBrowser(const IBrowser&) = delete;
    IBrowser& operator=(const IBrowser&) = delete;
    IBrowser(IBrowser&&) = delete;
    IBrowser& operator=(IBrowser&&) = delete;

    [[nodiscard]] virtual bool IsConnected() = 0;

    [[nodiscard]] virtual Result<std::unique_ptr<IPage>, Error> OpenPage() = 0;

    /// Run `trigger` and return the tab it opened.
    [[nodiscard]] virtual Result<std::unique_ptr<IPage>, Error> WaitForNewPage(
        const std::function<Result<void, Error>()>& trigger,
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual Result<void, Error> Close() = 0;

protected:
    IBrowser() = default;
};

// ---------------------------------------------------------------------------
// IBrowserLauncher: creates browsers. The real implementation talks to a
// WebDriver server; tests use MockBrowserLauncher.
// ---------------------------------------------------------------------------
class IBrowserLauncher {
public:
    virtual ~IBrowserLauncher() = default;

    IBrowserLauncher(const IBrowserLauncher&) = delete;
    IBrowserLauncher& operator=(const IBrowserLauncher&) = delete;
    IBrowserLauncher(IBrowserLauncher&&) = delete;
    IBrowserLauncher& operator=(IBrowserLauncher&&) = delete;

    [[nodiscard]] virtual Result<std::unique_ptr<IBrowser>, Error> Launch(
        const LaunchSettings& settings) = 0;

protected:
    IBrowserLauncher() = default;
};

} // namespace browser_mcp
