#include <browser_mcp/browser/webdriver_client.hpp>

#include <browser_mcp/core/log.hpp>
#include <browser_mcp/core/url.hpp>

#include <httplib.h>

namespace browser_mcp {

namespace {

constexpr const char* kComponent = "webdriver";

Error MakeTransportError(std::string_view operation,
                         const std::string& target,
                         httplib::Error error) {
    auto category = (error == httplib::Error::Timeout ||
                     error == httplib::Error::ConnectionTimeout ||
                     error == httplib::Error::Read)
                        ? ErrorCategory::Timeout
                        : ErrorCategory::UpstreamFailure;
    return Error{std::string(operation), target, std::nullopt,
                 "WebDriver request failed: " + httplib::to_string(error), category};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct WebDriverClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string endpoint;
    std::string base_path;   // "" or "/wd/hub"
    WebDriverClientOptions options;

    std::string FullPath(std::string_view path) const {
        return base_path + std::string(path);
    }

    Result<nlohmann::json, Error> Unwrap(std::string_view operation,
                                         const std::string& path,
                                         const httplib::Result& res) const {
        if (!res) {
            return Result<nlohmann::json, Error>::Err(
                MakeTransportError(operation, path, res.error()));
        }
        if (res->status < 200 || res->status >= 300) {
            return Result<nlohmann::json, Error>::Err(
                Error::FromWebDriver(std::string(operation), path, res->status, res->body));
        }
        auto doc = nlohmann::json::parse(res->body, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return Result<nlohmann::json, Error>::Err(Error{
                std::string(operation), path, res->status,
                "WebDriver response is not a JSON object",
                ErrorCategory::UpstreamFailure});
        }
        if (!doc.contains("value")) {
            return Result<nlohmann::json, Error>::Ok(nlohmann::json());
        }
        return Result<nlohmann::json, Error>::Ok(std::move(doc["value"]));
    }
};

Result<std::unique_ptr<WebDriverClient>, Error> WebDriverClient::Create(
    std::string_view endpoint, const WebDriverClientOptions& options) {
    auto parts = ParseUrl(endpoint);
    if (parts.IsErr()) {
        return Result<std::unique_ptr<WebDriverClient>, Error>::Err(Error{
            "WebDriverClient", std::string(endpoint), std::nullopt,
            "Invalid WebDriver endpoint: " + parts.Error(), ErrorCategory::LaunchFailure});
    }

    auto impl = std::make_unique<Impl>();
    impl->endpoint = std::string(endpoint);
    impl->base_path = parts.Value().path;
    while (!impl->base_path.empty() && impl->base_path.back() == '/') {
        impl->base_path.pop_back();
    }
    impl->options = options;
    impl->client = std::make_unique<httplib::Client>(parts.Value().Origin());
    impl->client->set_connection_timeout(options.connect_timeout);
    impl->client->set_read_timeout(options.command_timeout);
    impl->client->set_write_timeout(options.command_timeout);

    return Result<std::unique_ptr<WebDriverClient>, Error>::Ok(
        std::unique_ptr<WebDriverClient>(new WebDriverClient(std::move(impl))));
}

WebDriverClient::WebDriverClient(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

WebDriverClient::~WebDriverClient() = default;

Result<nlohmann::json, Error> WebDriverClient::Get(std::string_view path,
                                                   std::string_view operation) {
    auto full = impl_->FullPath(path);
    LogDebug(kComponent, "GET " + full);
    auto res = impl_->client->Get(full);
    return impl_->Unwrap(operation, full, res);
}

Result<nlohmann::json, Error> WebDriverClient::Post(std::string_view path,
                                                    const nlohmann::json& body,
                                                    std::string_view operation) {
    auto full = impl_->FullPath(path);
    LogDebug(kComponent, "POST " + full);
    auto payload = body.is_null() ? std::string("{}") : body.dump();
    auto res = impl_->client->Post(full, payload, "application/json; charset=utf-8");
    return impl_->Unwrap(operation, full, res);
}

Result<nlohmann::json, Error> WebDriverClient::Delete(std::string_view path,
                                                      std::string_view operation) {
    auto full = impl_->FullPath(path);
    LogDebug(kComponent, "DELETE " + full);
    auto res = impl_->client->Delete(full);
    return impl_->Unwrap(operation, full, res);
}

bool WebDriverClient::IsReady() {
    auto status = Get("/status", "Status");
    if (status.IsErr()) {
        return false;
    }
    const auto& value = status.Value();
    // Some drivers omit "ready"; a 2xx /status then counts as ready.
    if (value.is_object() && value.contains("ready") && value["ready"].is_boolean()) {
        return value["ready"].get<bool>();
    }
    return true;
}

void WebDriverClient::SetCommandTimeout(std::chrono::milliseconds timeout) {
    impl_->options.command_timeout = timeout;
    impl_->client->set_read_timeout(timeout);
    impl_->client->set_write_timeout(timeout);
}

const std::string& WebDriverClient::Endpoint() const noexcept {
    return impl_->endpoint;
}

} // namespace browser_mcp
