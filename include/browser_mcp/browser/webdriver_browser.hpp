#pragma once

#include <browser_mcp/browser/driver_process.hpp>
#include <browser_mcp/browser/i_browser.hpp>
#include <browser_mcp/browser/webdriver_page.hpp>

#include <chrono>
#include <map>
#include <memory>

namespace browser_mcp {

// ---------------------------------------------------------------------------
// WebDriverBrowser: one WebDriver session, plus the driver process when
// this server spawned it. Closing deletes the session and stops the driver.
// ---------------------------------------------------------------------------
class WebDriverBrowser : public IBrowser {
public:
    WebDriverBrowser(std::shared_ptr<WebDriverSession> session,
                     std::unique_ptr<DriverProcess> process,
                     LaunchSettings settings);
    ~WebDriverBrowser() override;

    [[nodiscard]] bool IsConnected() override;
    [[nodiscard]] Result<std::unique_ptr<IPage>, Error> OpenPage() override;
    [[nodiscard]] Result<std::unique_ptr<IPage>, Error> WaitForNewPage(
        const std::function<Result<void, Error>()>& trigger,
        std::chrono::milliseconds timeout) override;
    [[nodiscard]] Result<void, Error> Close() override;

private:
    Result<std::vector<std::string>, Error> WindowHandles();

    std::shared_ptr<WebDriverSession> session_;
    std::unique_ptr<DriverProcess> process_;
    LaunchSettings settings_;
    bool initial_page_taken_ = false;
    bool closed_ = false;
};

struct WebDriverLauncherOptions {
    std::map<BrowserEngine, DriverConfig> drivers;
    std::chrono::milliseconds launch_timeout{20000};
    std::chrono::milliseconds command_timeout{60000};
};

// ---------------------------------------------------------------------------
// WebDriverLauncher: IBrowserLauncher that creates WebDriver sessions,
// spawning the engine's driver binary unless an endpoint URL is configured.
// ---------------------------------------------------------------------------
class WebDriverLauncher : public IBrowserLauncher {
public:
    explicit WebDriverLauncher(WebDriverLauncherOptions options);

    [[nodiscard]] Result<std::unique_ptr<IBrowser>, Error> Launch(
        const LaunchSettings& settings) override;

private:
    WebDriverLauncherOptions options_;
};

// chromedriver, geckodriver or WebKitWebDriver.
const char* DefaultDriverExecutable(BrowserEngine engine);

} // namespace browser_mcp
