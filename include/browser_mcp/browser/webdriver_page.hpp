#pragma once

#include <browser_mcp/browser/i_browser.hpp>
#include <browser_mcp/browser/webdriver_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace browser_mcp {

// ---------------------------------------------------------------------------
// WebDriverSession: state shared by a browser and its pages: the transport,
// the session id and the window WebDriver currently targets.
// ---------------------------------------------------------------------------
struct WebDriverSession {
    std::unique_ptr<WebDriverClient> client;
    std::string id;
    BrowserEngine engine = BrowserEngine::Chromium;
    std::string current_window;
    std::chrono::milliseconds command_timeout{60000};

    [[nodiscard]] std::string Path(std::string_view suffix) const {
        return "/session/" + id + std::string(suffix);
    }
};

// ---------------------------------------------------------------------------
// WebDriverPage: IPage for one top-level browsing context (window handle).
// Switches the session to its window before every command.
// ---------------------------------------------------------------------------
class WebDriverPage : public IPage {
public:
    WebDriverPage(std::shared_ptr<WebDriverSession> session, std::string handle);
    ~WebDriverPage() override = default;

    [[nodiscard]] const std::string& Handle() const noexcept { return handle_; }

    // Install the console/network hooks in the current document and, on
    // chromium, register them for every future document of this page.
    [[nodiscard]] Result<void, Error> InstallHooks(bool persistent);

    // -- IPage ---------------------------------------------------------------

    [[nodiscard]] Result<void, Error> Navigate(
        std::string_view url, const NavigateOptions& options) override;
    [[nodiscard]] Result<std::string, Error> CurrentUrl() override;
    [[nodiscard]] Result<void, Error> GoBack() override;
    [[nodiscard]] Result<void, Error> GoForward() override;

    [[nodiscard]] Result<void, Error> Click(std::string_view selector) override;
    [[nodiscard]] Result<void, Error> ClickInFrame(
        std::string_view frame_selector, std::string_view selector) override;
    [[nodiscard]] Result<void, Error> Fill(
        std::string_view selector, std::string_view value) override;
    [[nodiscard]] Result<void, Error> FillInFrame(
        std::string_view frame_selector, std::string_view selector,
        std::string_view value) override;
    [[nodiscard]] Result<void, Error> SelectOption(
        std::string_view selector, std::string_view value) override;
    [[nodiscard]] Result<void, Error> Hover(std::string_view selector) override;
    [[nodiscard]] Result<void, Error> SetInputFile(
        std::string_view selector, std::string_view file_path) override;
    [[nodiscard]] Result<void, Error> DragAndDrop(
        std::string_view source_selector, std::string_view target_selector) override;
    [[nodiscard]] Result<void, Error> PressKey(
        std::string_view key, const std::optional<std::string>& selector) override;

    [[nodiscard]] Result<nlohmann::json, Error> Evaluate(std::string_view script) override;
    [[nodiscard]] Result<std::string, Error> VisibleText() override;
    [[nodiscard]] Result<std::string, Error> Html(const HtmlOptions& options) override;
    [[nodiscard]] Result<std::string, Error> Screenshot(
        const ScreenshotOptions& options) override;
    [[nodiscard]] Result<std::string, Error> PrintPdf(const PdfOptions& options) override;

    [[nodiscard]] Result<std::vector<ConsoleEntry>, Error> DrainConsole() override;
    [[nodiscard]] Result<std::vector<CapturedResponse>, Error> DrainResponses() override;

    [[nodiscard]] Result<void, Error> SetUserAgent(std::string_view user_agent) override;

    [[nodiscard]] bool IsClosed() override;

private:
    Result<void, Error> Activate();
    Result<std::string, Error> FindElement(std::string_view selector,
                                           std::string_view operation);
    Result<nlohmann::json, Error> Execute(const char* script,
                                          const nlohmann::json& args,
                                          std::string_view operation);
    Result<void, Error> PerformActions(const nlohmann::json& actions,
                                       std::string_view operation);
    Result<void, Error> WithFrame(std::string_view frame_selector,
                                  std::string_view operation,
                                  const std::function<Result<void, Error>()>& body);
    Result<void, Error> WaitForLoadState(std::string_view url,
                                         const NavigateOptions& options,
                                         std::chrono::steady_clock::time_point deadline);
    Result<void, Error> ClickElement(std::string_view selector);
    Result<void, Error> FillElement(std::string_view selector, std::string_view value);

    std::shared_ptr<WebDriverSession> session_;
    std::string handle_;
};

} // namespace browser_mcp
