#include <browser_mcp/browser/webdriver_browser.hpp>

#include <browser_mcp/browser/webdriver_protocol.hpp>
#include <browser_mcp/config/config_loader.hpp>
#include <browser_mcp/core/log.hpp>

#include <algorithm>
#include <thread>

namespace browser_mcp {

namespace {

constexpr const char* kComponent = "webdriver";
constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr auto kImplicitWait = std::chrono::milliseconds(5000);

Error AsLaunchFailure(Error error) {
    error.category = ErrorCategory::LaunchFailure;
    return error;
}

Error MakeLaunchError(const std::string& target, const std::string& message) {
    return Error{"Launch", target, std::nullopt, message, ErrorCategory::LaunchFailure};
}

Result<void, Error> WaitUntilReady(WebDriverClient& client, DriverProcess* process,
                                   std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (client.IsReady()) {
            return Result<void, Error>::Ok();
        }
        if (process != nullptr && !process->IsRunning()) {
            return Result<void, Error>::Err(MakeLaunchError(
                client.Endpoint(), "WebDriver server exited during startup"));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Result<void, Error>::Err(MakeLaunchError(
                client.Endpoint(), "WebDriver server not ready after " +
                                       std::to_string(timeout.count()) + " ms"));
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

} // anonymous namespace

const char* DefaultDriverExecutable(BrowserEngine engine) {
    switch (engine) {
        case BrowserEngine::Chromium: return "chromedriver";
        case BrowserEngine::Firefox:  return "geckodriver";
        case BrowserEngine::Webkit:   return "WebKitWebDriver";
    }
    return "chromedriver";
}

// ---------------------------------------------------------------------------
// WebDriverBrowser
// ---------------------------------------------------------------------------

WebDriverBrowser::WebDriverBrowser(std::shared_ptr<WebDriverSession> session,
                                   std::unique_ptr<DriverProcess> process,
                                   LaunchSettings settings)
    : session_(std::move(session)),
      process_(std::move(process)),
      settings_(std::move(settings)) {}

WebDriverBrowser::~WebDriverBrowser() {
    if (!closed_) {
        auto closed = Close();
        if (closed.IsErr()) {
            LogWarn(kComponent, "Browser close failed: " + closed.Error().ToString());
        }
    }
}

Result<std::vector<std::string>, Error> WebDriverBrowser::WindowHandles() {
    auto res = session_->client->Get(session_->Path("/window/handles"), "WindowHandles");
    if (res.IsErr()) {
        return Result<std::vector<std::string>, Error>::Err(res.Error());
    }
    std::vector<std::string> handles;
    if (res.Value().is_array()) {
        for (const auto& h : res.Value()) {
            if (h.is_string()) handles.push_back(h.get<std::string>());
        }
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(handles));
}

bool WebDriverBrowser::IsConnected() {
    if (closed_) return false;
    if (process_ && !process_->IsRunning()) return false;
    return WindowHandles().IsOk();
}

Result<std::unique_ptr<IPage>, Error> WebDriverBrowser::OpenPage() {
    std::string handle;
    if (!initial_page_taken_) {
        auto current = session_->client->Get(session_->Path("/window"), "OpenPage");
        if (current.IsErr() || !current.Value().is_string()) {
            // The initial window can be gone; fall through to a new tab.
            LogDebug(kComponent, "Initial window unavailable, opening a new tab");
        } else {
            handle = current.Value().get<std::string>();
        }
        initial_page_taken_ = true;
    }
    if (handle.empty()) {
        auto created = session_->client->Post(session_->Path("/window/new"),
                                              {{"type", "tab"}}, "OpenPage");
        if (created.IsErr()) {
            return Result<std::unique_ptr<IPage>, Error>::Err(created.Error());
        }
        const auto& value = created.Value();
        if (!value.is_object() || !value.contains("handle") || !value["handle"].is_string()) {
            return Result<std::unique_ptr<IPage>, Error>::Err(Error{
                "OpenPage", "", std::nullopt, "New window response has no handle",
                ErrorCategory::UpstreamFailure});
        }
        handle = value["handle"].get<std::string>();
    }

    auto page = std::make_unique<WebDriverPage>(session_, handle);
    auto hooks = page->InstallHooks(true);
    if (hooks.IsErr()) {
        return Result<std::unique_ptr<IPage>, Error>::Err(hooks.Error());
    }

    auto rect = session_->client->Post(
        session_->Path("/window/rect"),
        {{"width", settings_.width}, {"height", settings_.height}}, "SetWindowRect");
    if (rect.IsErr()) {
        // Headless chromium already sized the window via --window-size.
        LogDebug(kComponent, "Window resize failed: " + rect.Error().ToString());
    }
    return Result<std::unique_ptr<IPage>, Error>::Ok(std::move(page));
}

Result<std::unique_ptr<IPage>, Error> WebDriverBrowser::WaitForNewPage(
    const std::function<Result<void, Error>()>& trigger,
    std::chrono::milliseconds timeout) {
    auto before = WindowHandles();
    if (before.IsErr()) {
        return Result<std::unique_ptr<IPage>, Error>::Err(before.Error());
    }

    auto triggered = trigger();
    if (triggered.IsErr()) {
        return Result<std::unique_ptr<IPage>, Error>::Err(triggered.Error());
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto after = WindowHandles();
        if (after.IsErr()) {
            return Result<std::unique_ptr<IPage>, Error>::Err(after.Error());
        }
        for (const auto& handle : after.Value()) {
            if (std::find(before.Value().begin(), before.Value().end(), handle) ==
                before.Value().end()) {
                LogDebug(kComponent, "New tab opened: " + handle);
                auto page = std::make_unique<WebDriverPage>(session_, handle);
                auto hooks = page->InstallHooks(true);
                if (hooks.IsErr()) {
                    LogDebug(kComponent, "Page hooks not installed: " +
                                             hooks.Error().ToString());
                }
                return Result<std::unique_ptr<IPage>, Error>::Ok(std::move(page));
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Result<std::unique_ptr<IPage>, Error>::Err(Error{
                "WaitForNewPage", "", std::nullopt,
                "No new tab opened within " + std::to_string(timeout.count()) + " ms",
                ErrorCategory::Timeout});
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

Result<void, Error> WebDriverBrowser::Close() {
    if (closed_) {
        return Result<void, Error>::Ok();
    }
    closed_ = true;

    auto deleted = session_->client->Delete(session_->Path(""), "CloseSession");
    if (process_) {
        process_->Stop();
    }
    if (deleted.IsErr()) {
        return Result<void, Error>::Err(deleted.Error());
    }
    LogInfo(kComponent, "Session " + session_->id + " closed");
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// WebDriverLauncher
// ---------------------------------------------------------------------------

WebDriverLauncher::WebDriverLauncher(WebDriverLauncherOptions options)
    : options_(std::move(options)) {}

Result<std::unique_ptr<IBrowser>, Error> WebDriverLauncher::Launch(
    const LaunchSettings& settings) {
    DriverConfig driver;
    auto it = options_.drivers.find(settings.engine);
    if (it != options_.drivers.end()) {
        driver = it->second;
    }

    std::unique_ptr<DriverProcess> process;
    std::string endpoint;
    if (driver.url.has_value()) {
        endpoint = *driver.url;
    } else {
        auto executable = driver.executable.value_or(DefaultDriverExecutable(settings.engine));
        auto started = DriverProcess::Start(executable);
        if (started.IsErr()) {
            return Result<std::unique_ptr<IBrowser>, Error>::Err(started.Error());
        }
        process = std::move(started).Value();
        endpoint = process->Endpoint();
    }

    WebDriverClientOptions client_options;
    client_options.command_timeout = options_.launch_timeout;
    auto client = WebDriverClient::Create(endpoint, client_options);
    if (client.IsErr()) {
        return Result<std::unique_ptr<IBrowser>, Error>::Err(client.Error());
    }
    auto session = std::make_shared<WebDriverSession>();
    session->client = std::move(client).Value();
    session->engine = settings.engine;
    session->command_timeout = options_.command_timeout;

    auto ready = WaitUntilReady(*session->client, process.get(), options_.launch_timeout);
    if (ready.IsErr()) {
        return Result<std::unique_ptr<IBrowser>, Error>::Err(ready.Error());
    }

    if (settings.proxy.has_value() && settings.proxy->username.has_value()) {
        LogWarn(kComponent, "Proxy credentials cannot be passed through WebDriver "
                            "capabilities; the proxy must not require authentication");
    }

    LogInfo(kComponent, std::string("Launching ") + EngineName(settings.engine) +
                            (settings.headless ? " (headless)" : "") + " via " + endpoint);
    auto created = session->client->Post("/session", BuildCapabilities(settings),
                                         "NewSession");
    if (created.IsErr()) {
        return Result<std::unique_ptr<IBrowser>, Error>::Err(
            AsLaunchFailure(std::move(created).Error()));
    }
    const auto& value = created.Value();
    if (!value.is_object() || !value.contains("sessionId") || !value["sessionId"].is_string()) {
        return Result<std::unique_ptr<IBrowser>, Error>::Err(
            MakeLaunchError(endpoint, "New Session response has no sessionId"));
    }
    session->id = value["sessionId"].get<std::string>();
    session->client->SetCommandTimeout(options_.command_timeout);

    auto timeouts = session->client->Post(
        session->Path("/timeouts"),
        {{"implicit", kImplicitWait.count()},
         {"script", options_.command_timeout.count()}},
        "SetTimeouts");
    auto browser = std::make_unique<WebDriverBrowser>(session, std::move(process), settings);
    if (timeouts.IsErr()) {
        return Result<std::unique_ptr<IBrowser>, Error>::Err(
            AsLaunchFailure(std::move(timeouts).Error()));
    }

    LogInfo(kComponent, "Session " + session->id + " created");
    return Result<std::unique_ptr<IBrowser>, Error>::Ok(std::move(browser));
}

} // namespace browser_mcp
