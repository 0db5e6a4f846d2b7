#pragma once

#include <browser_mcp/browser/i_browser.hpp>
#include <browser_mcp/core/result.hpp>
#include <browser_mcp/http/api_client.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace browser_mcp {

// A browser_expect_response registration waiting for its assertion.
struct ResponseExpectation {
    std::string id;
    std::string url_pattern;
};

struct ExecutionContextOptions {
    std::string downloads_dir;
    std::chrono::milliseconds response_wait{30000};
    size_t console_capacity = 5000;
    size_t response_capacity = 200;
};

using ApiClientFactory = std::function<std::unique_ptr<IApiClient>()>;

// ---------------------------------------------------------------------------
// ExecutionContext: the mutable state every tool call runs against: the
// browser session (browser + current page), the lazily created HTTP client,
// captured console messages and pending response expectations.
//
// Owned by main and passed by reference; single-threaded.
// ---------------------------------------------------------------------------
class ExecutionContext {
public:
    ExecutionContext(IBrowserLauncher& launcher,
                     ApiClientFactory api_factory,
                     ExecutionContextOptions options = {});
    ~ExecutionContext();

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // -- Browser session -----------------------------------------------------

    // Return the live page, launching a browser first if there is none or
    // the existing one is disconnected or its page was closed. Settings of a
    // live session are never changed.
    [[nodiscard]] Result<IPage*, Error> EnsureSession(const LaunchSettings& settings);

    // Release page then browser, clear console and expectations.
    [[nodiscard]] Result<void, Error> CloseSession();

    [[nodiscard]] bool HasSession() const noexcept { return browser_ != nullptr; }
    [[nodiscard]] IBrowser* Browser() noexcept { return browser_.get(); }
    [[nodiscard]] IPage* Page() noexcept { return page_.get(); }

    // The current page, or an error when no session is open.
    [[nodiscard]] Result<IPage*, Error> RequirePage(std::string_view operation);

    // Make `page` the current page (a click opened a new tab).
    void ReplacePage(std::unique_ptr<IPage> page);

    // Incremented on every successful launch.
    [[nodiscard]] uint64_t SessionGeneration() const noexcept { return generation_; }

    [[nodiscard]] const std::optional<LaunchSettings>& ActiveSettings() const noexcept {
        return active_settings_;
    }

    // -- HTTP ----------------------------------------------------------------

    IApiClient& EnsureApiClient();
    [[nodiscard]] bool HasApiClient() const noexcept { return api_client_ != nullptr; }

    // -- Console -------------------------------------------------------------

    // Move messages captured in the current page into the buffer.
    [[nodiscard]] Result<void, Error> CollectConsole();
    [[nodiscard]] const std::deque<ConsoleEntry>& ConsoleMessages() const noexcept {
        return console_;
    }
    void ClearConsole() { console_.clear(); }

    // -- Response expectations -----------------------------------------------

    void ArmExpectation(ResponseExpectation expectation);
    [[nodiscard]] std::optional<ResponseExpectation> TakeExpectation(const std::string& id);
    [[nodiscard]] size_t PendingExpectations() const noexcept { return expectations_.size(); }

    // Move responses captured in the current page into the buffer. Only the
    // newest response_capacity entries are kept.
    [[nodiscard]] Result<void, Error> CollectResponses();

    // Responses drained from the page that no assertion consumed yet.
    [[nodiscard]] std::deque<CapturedResponse>& CapturedResponses() noexcept {
        return responses_;
    }

    [[nodiscard]] const ExecutionContextOptions& Options() const noexcept { return options_; }

private:
    bool IsStale();
    void DiscardSession(const std::string& reason);

    IBrowserLauncher& launcher_;
    ApiClientFactory api_factory_;
    ExecutionContextOptions options_;

    // Declaration order matters: the page is destroyed before the browser.
    std::unique_ptr<IBrowser> browser_;
    std::unique_ptr<IPage> page_;
    std::optional<LaunchSettings> active_settings_;
    uint64_t generation_ = 0;

    std::unique_ptr<IApiClient> api_client_;
    std::deque<ConsoleEntry> console_;
    std::vector<ResponseExpectation> expectations_;
    std::deque<CapturedResponse> responses_;
};

} // namespace browser_mcp
