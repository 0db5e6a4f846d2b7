#pragma once

#include <browser_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace browser_mcp {

struct WebDriverClientOptions {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds command_timeout{60000};
};

// ---------------------------------------------------------------------------
// WebDriverClient: JSON-over-HTTP transport to a W3C WebDriver server.
//
// Uses pimpl to keep httplib out of the public header. Every call returns
// the unwrapped "value" member of the response; non-2xx responses are
// mapped through Error::FromWebDriver, transport failures to Timeout or
// UpstreamFailure.
// ---------------------------------------------------------------------------
class WebDriverClient {
public:
    // `endpoint` is the server base URL, e.g. "http://127.0.0.1:9515" or
    // "http://grid:4444/wd/hub".
    static Result<std::unique_ptr<WebDriverClient>, Error> Create(
        std::string_view endpoint, const WebDriverClientOptions& options = {});

    ~WebDriverClient();

    WebDriverClient(const WebDriverClient&) = delete;
    WebDriverClient& operator=(const WebDriverClient&) = delete;
    WebDriverClient(WebDriverClient&&) = delete;
    WebDriverClient& operator=(WebDriverClient&&) = delete;

    [[nodiscard]] Result<nlohmann::json, Error> Get(
        std::string_view path, std::string_view operation);

    [[nodiscard]] Result<nlohmann::json, Error> Post(
        std::string_view path, const nlohmann::json& body,
        std::string_view operation);

    [[nodiscard]] Result<nlohmann::json, Error> Delete(
        std::string_view path, std::string_view operation);

    // GET /status and report readiness; never fails.
    [[nodiscard]] bool IsReady();

    void SetCommandTimeout(std::chrono::milliseconds timeout);

    [[nodiscard]] const std::string& Endpoint() const noexcept;

private:
    struct Impl;
    explicit WebDriverClient(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace browser_mcp
