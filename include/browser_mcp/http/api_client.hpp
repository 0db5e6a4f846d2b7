#pragma once

#include <browser_mcp/core/result.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace browser_mcp {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete,
};

const char* MethodName(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;            // absolute http(s) URL
    HttpHeaders headers;
    std::string body;
    std::string content_type;   // empty for requests without a body
};

// ---------------------------------------------------------------------------
// IApiClient: HTTP client used by the api_* tools. Any status code is a
// successful response; only transport failures are errors.
// ---------------------------------------------------------------------------
class IApiClient {
public:
    virtual ~IApiClient() = default;

    IApiClient(const IApiClient&) = delete;
    IApiClient& operator=(const IApiClient&) = delete;
    IApiClient(IApiClient&&) = delete;
    IApiClient& operator=(IApiClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Send(const HttpRequest& request) = 0;

protected:
    IApiClient() = default;
};

struct ApiClientOptions {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};
};

// ---------------------------------------------------------------------------
// ApiClient: cpp-httplib implementation. One client per origin is kept so
// connections are reused across calls.
// ---------------------------------------------------------------------------
class ApiClient : public IApiClient {
public:
    explicit ApiClient(const ApiClientOptions& options = {});
    ~ApiClient() override;

    [[nodiscard]] Result<HttpResponse, Error> Send(const HttpRequest& request) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Request helpers shared by the api_* tools.

// True when the body parses as a JSON object or array.
bool LooksLikeJson(std::string_view body);

// Copy of `headers` with Authorization values masked, for logging.
HttpHeaders RedactHeaders(const HttpHeaders& headers);

} // namespace browser_mcp
