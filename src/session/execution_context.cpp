#include <browser_mcp/session/execution_context.hpp>

#include <browser_mcp/config/config_loader.hpp>
#include <browser_mcp/core/log.hpp>

#include <algorithm>

namespace browser_mcp {

namespace {

constexpr const char* kComponent = "session";

std::string DescribeSettings(const LaunchSettings& settings) {
    std::string text = EngineName(settings.engine);
    text += settings.headless ? " headless" : " headed";
    text += " " + std::to_string(settings.width) + "x" + std::to_string(settings.height);
    if (settings.proxy.has_value()) {
        text += " via proxy";
    }
    return text;
}

} // anonymous namespace

ExecutionContext::ExecutionContext(IBrowserLauncher& launcher,
                                   ApiClientFactory api_factory,
                                   ExecutionContextOptions options)
    : launcher_(launcher),
      api_factory_(std::move(api_factory)),
      options_(std::move(options)) {}

ExecutionContext::~ExecutionContext() {
    if (HasSession()) {
        auto closed = CloseSession();
        if (closed.IsErr()) {
            LogWarn(kComponent, "Closing browser on shutdown failed: " +
                                    closed.Error().ToString());
        }
    }
}

// ---------------------------------------------------------------------------
// Browser session
// ---------------------------------------------------------------------------

bool ExecutionContext::IsStale() {
    if (!browser_->IsConnected()) {
        DiscardSession("browser disconnected");
        return true;
    }
    if (!page_ || page_->IsClosed()) {
        DiscardSession("page closed");
        return true;
    }
    return false;
}

void ExecutionContext::DiscardSession(const std::string& reason) {
    LogInfo(kComponent, "Discarding browser session: " + reason);
    auto closed = CloseSession();
    if (closed.IsErr()) {
        LogDebug(kComponent, "Close of stale session failed: " + closed.Error().ToString());
    }
}

Result<IPage*, Error> ExecutionContext::EnsureSession(const LaunchSettings& settings) {
    if (browser_ && !IsStale()) {
        if (active_settings_.has_value() && *active_settings_ != settings) {
            LogDebug(kComponent, "Ignoring launch settings (" + DescribeSettings(settings) +
                                     ") for live session (" +
                                     DescribeSettings(*active_settings_) + ")");
        }
        return Result<IPage*, Error>::Ok(page_.get());
    }

    LogInfo(kComponent, "Launching browser: " + DescribeSettings(settings));
    auto launched = launcher_.Launch(settings);
    if (launched.IsErr()) {
        auto error = std::move(launched).Error();
        error.category = ErrorCategory::LaunchFailure;
        return Result<IPage*, Error>::Err(std::move(error));
    }
    auto browser = std::move(launched).Value();

    auto opened = browser->OpenPage();
    if (opened.IsErr()) {
        auto error = std::move(opened).Error();
        error.category = ErrorCategory::LaunchFailure;
        auto closed = browser->Close();
        if (closed.IsErr()) {
            LogDebug(kComponent, "Close after failed page open: " + closed.Error().ToString());
        }
        return Result<IPage*, Error>::Err(std::move(error));
    }

    browser_ = std::move(browser);
    page_ = std::move(opened).Value();
    active_settings_ = settings;
    ++generation_;
    LogDebug(kComponent, "Session generation " + std::to_string(generation_));
    return Result<IPage*, Error>::Ok(page_.get());
}

Result<void, Error> ExecutionContext::CloseSession() {
    console_.clear();
    expectations_.clear();
    responses_.clear();
    active_settings_.reset();

    page_.reset();
    if (!browser_) {
        return Result<void, Error>::Ok();
    }
    auto browser = std::move(browser_);
    auto closed = browser->Close();
    if (closed.IsErr()) {
        return closed;
    }
    LogInfo(kComponent, "Browser session closed");
    return Result<void, Error>::Ok();
}

Result<IPage*, Error> ExecutionContext::RequirePage(std::string_view operation) {
    if (!page_) {
        return Result<IPage*, Error>::Err(Error{
            std::string(operation), "", std::nullopt,
            "No browser session is open", ErrorCategory::Internal});
    }
    return Result<IPage*, Error>::Ok(page_.get());
}

void ExecutionContext::ReplacePage(std::unique_ptr<IPage> page) {
    page_ = std::move(page);
}

// ---------------------------------------------------------------------------
// HTTP
// ---------------------------------------------------------------------------

IApiClient& ExecutionContext::EnsureApiClient() {
    if (!api_client_) {
        LogDebug(kComponent, "Creating HTTP client");
        api_client_ = api_factory_();
    }
    return *api_client_;
}

// ---------------------------------------------------------------------------
// Console
// ---------------------------------------------------------------------------

Result<void, Error> ExecutionContext::CollectConsole() {
    if (!page_) {
        return Result<void, Error>::Ok();
    }
    auto drained = page_->DrainConsole();
    if (drained.IsErr()) {
        return Result<void, Error>::Err(drained.Error());
    }
    for (auto& entry : std::move(drained).Value()) {
        console_.push_back(std::move(entry));
    }
    while (console_.size() > options_.console_capacity) {
        console_.pop_front();
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ExecutionContext::CollectResponses() {
    if (!page_) {
        return Result<void, Error>::Ok();
    }
    auto drained = page_->DrainResponses();
    if (drained.IsErr()) {
        return Result<void, Error>::Err(drained.Error());
    }
    for (auto& response : std::move(drained).Value()) {
        responses_.push_back(std::move(response));
    }
    while (responses_.size() > options_.response_capacity) {
        responses_.pop_front();
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Response expectations
// ---------------------------------------------------------------------------

void ExecutionContext::ArmExpectation(ResponseExpectation expectation) {
    auto it = std::find_if(expectations_.begin(), expectations_.end(),
                           [&](const ResponseExpectation& e) { return e.id == expectation.id; });
    if (it != expectations_.end()) {
        LogDebug(kComponent, "Replacing response expectation '" + expectation.id + "'");
        *it = std::move(expectation);
        return;
    }
    expectations_.push_back(std::move(expectation));
}

std::optional<ResponseExpectation> ExecutionContext::TakeExpectation(const std::string& id) {
    auto it = std::find_if(expectations_.begin(), expectations_.end(),
                           [&](const ResponseExpectation& e) { return e.id == id; });
    if (it == expectations_.end()) {
        return std::nullopt;
    }
    auto expectation = std::move(*it);
    expectations_.erase(it);
    return expectation;
}

} // namespace browser_mcp
