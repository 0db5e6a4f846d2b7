#include <browser_mcp/http/api_client.hpp>

#include <browser_mcp/core/log.hpp>
#include <browser_mcp/core/url.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace browser_mcp {

namespace {

constexpr const char* kComponent = "http";

bool IEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

ErrorCategory CategoryFromTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::UpstreamFailure;
    }
}

} // anonymous namespace

const char* MethodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

bool LooksLikeJson(std::string_view body) {
    auto first = body.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return false;
    if (body[first] != '{' && body[first] != '[') return false;
    return !nlohmann::json::parse(body, nullptr, false).is_discarded();
}

HttpHeaders RedactHeaders(const HttpHeaders& headers) {
    HttpHeaders redacted;
    for (const auto& [key, value] : headers) {
        if (IEquals(key, "authorization") || IEquals(key, "proxy-authorization") ||
            IEquals(key, "cookie")) {
            redacted[key] = "***";
        } else {
            redacted[key] = value;
        }
    }
    return redacted;
}

// ---------------------------------------------------------------------------
// Impl: one httplib::Client per origin.
// ---------------------------------------------------------------------------
struct ApiClient::Impl {
    ApiClientOptions options;
    std::map<std::string, std::unique_ptr<httplib::Client>> clients;

    httplib::Client& ClientFor(const UrlParts& url) {
        auto origin = url.Origin();
        auto it = clients.find(origin);
        if (it != clients.end()) {
            return *it->second;
        }
        auto client = std::make_unique<httplib::Client>(origin);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_write_timeout(options.read_timeout);
        client->set_follow_location(true);
        client->set_keep_alive(true);
        auto& ref = *client;
        clients.emplace(origin, std::move(client));
        return ref;
    }
};

ApiClient::ApiClient(const ApiClientOptions& options)
    : impl_(std::make_unique<Impl>()) {
    impl_->options = options;
}

ApiClient::~ApiClient() = default;

Result<HttpResponse, Error> ApiClient::Send(const HttpRequest& request) {
    const auto* method = MethodName(request.method);
    auto url = ParseUrl(request.url);
    if (url.IsErr()) {
        return Result<HttpResponse, Error>::Err(Error{
            method, request.url, std::nullopt, url.Error(),
            ErrorCategory::UpstreamFailure});
    }

    httplib::Headers headers;
    for (const auto& [key, value] : request.headers) {
        headers.emplace(key, value);
    }

    LogDebug(kComponent, std::string(method) + " " + request.url);
    auto& client = impl_->ClientFor(url.Value());
    const auto& path = url.Value().path;

    auto perform = [&]() -> httplib::Result {
        switch (request.method) {
            case HttpMethod::Post:
                return client.Post(path, headers, request.body, request.content_type);
            case HttpMethod::Put:
                return client.Put(path, headers, request.body, request.content_type);
            case HttpMethod::Patch:
                return client.Patch(path, headers, request.body, request.content_type);
            case HttpMethod::Delete:
                return client.Delete(path, headers);
            case HttpMethod::Get:
                break;
        }
        return client.Get(path, headers);
    };
    auto res = perform();

    if (!res) {
        return Result<HttpResponse, Error>::Err(Error{
            method, request.url, std::nullopt,
            "Request failed: " + httplib::to_string(res.error()),
            CategoryFromTransportError(res.error())});
    }

    HttpResponse response;
    response.status_code = res->status;
    response.body = res->body;
    for (const auto& [key, value] : res->headers) {
        response.headers[key] = value;
    }
    LogDebug(kComponent, std::string(method) + " " + request.url + " -> " +
                             std::to_string(response.status_code));
    return Result<HttpResponse, Error>::Ok(std::move(response));
}

} // namespace browser_mcp
