#include <catch2/catch_test_macros.hpp>

#include <browser_mcp/browser/webdriver_client.hpp>
#include "../../test/mocks/local_server.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace browser_mcp;
using namespace browser_mcp::testing;

namespace {

std::unique_ptr<WebDriverClient> MakeClient(const std::string& endpoint,
                                            std::chrono::milliseconds command_timeout =
                                                std::chrono::milliseconds(5000)) {
    WebDriverClientOptions options;
    options.connect_timeout = std::chrono::milliseconds(2000);
    options.command_timeout = command_timeout;
    auto client = WebDriverClient::Create(endpoint, options);
    REQUIRE(client.IsOk());
    return std::move(client).Value();
}

} // anonymous namespace

// ===========================================================================
// Create
// ===========================================================================

TEST_CASE("WebDriverClient: invalid endpoint is a launch failure", "[browser][client]") {
    auto client = WebDriverClient::Create("not a url");
    REQUIRE(client.IsErr());
    CHECK(client.Error().category == ErrorCategory::LaunchFailure);
    CHECK(client.Error().target == "not a url");
}

// ===========================================================================
// Requests
// ===========================================================================

TEST_CASE("WebDriverClient: GET unwraps the value member", "[browser][client]") {
    httplib::Server svr;
    svr.Get("/session/abc/url", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"value":"https://example.com/"})", "application/json");
    });
    LocalServer server(svr);

    auto client = MakeClient(server.Url());
    auto result = client->Get("/session/abc/url", "CurrentUrl");
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "https://example.com/");
}

TEST_CASE("WebDriverClient: POST sends a JSON body", "[browser][client]") {
    httplib::Server svr;
    std::string received_body;
    std::string received_type;
    svr.Post("/session/abc/url", [&](const httplib::Request& req, httplib::Response& res) {
        received_body = req.body;
        received_type = req.get_header_value("Content-Type");
        res.set_content(R"({"value":null})", "application/json");
    });
    LocalServer server(svr);

    auto client = MakeClient(server.Url());
    auto result = client->Post("/session/abc/url", {{"url", "https://example.com"}},
                               "Navigate");
    REQUIRE(result.IsOk());
    CHECK(result.Value().is_null());
    CHECK(nlohmann::json::parse(received_body)["url"] == "https://example.com");
    CHECK(received_type.rfind("application/json", 0) == 0);
}

TEST_CASE("WebDriverClient: null POST body is sent as an empty object", "[browser][client]") {
    httplib::Server svr;
    std::string received_body;
    svr.Post("/session/abc/back", [&](const httplib::Request& req, httplib::Response& res) {
        received_body = req.body;
        res.set_content(R"({"value":null})", "application/json");
    });
    LocalServer server(svr);

    auto client = MakeClient(server.Url());
    REQUIRE(client->Post("/session/abc/back", nlohmann::json(), "GoBack").IsOk());
    CHECK(received_body == "{}");
}

TEST_CASE("WebDriverClient: endpoint base path prefixes every request", "[browser][client]") {
    httplib::Server svr;
    svr.Delete("/wd/hub/session/abc", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"value":null})", "application/json");
    });
    LocalServer server(svr);

    auto client = MakeClient(server.Url("/wd/hub/"));
    CHECK(client->Endpoint() == server.Url("/wd/hub/"));
    CHECK(client->Delete("/session/abc", "CloseSession").IsOk());
}

TEST_CASE("WebDriverClient: response without value member is null", "[browser][client]") {
    httplib::Server svr;
    svr.Get("/x", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"other":1})", "application/json");
    });
    LocalServer server(svr);

    auto result = MakeClient(server.Url())->Get("/x", "X");
    REQUIRE(result.IsOk());
    CHECK(result.Value().is_null());
}

// ===========================================================================
// Failures
// ===========================================================================

TEST_CASE("WebDriverClient: W3C error response is mapped", "[browser][client]") {
    httplib::Server svr;
    svr.Post("/session/abc/element", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content(
            R"({"value":{"error":"no such element","message":"Unable to locate element: #nope"}})",
            "application/json");
    });
    LocalServer server(svr);

    auto result = MakeClient(server.Url())
                      ->Post("/session/abc/element",
                             {{"using", "css selector"}, {"value", "#nope"}}, "Click");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "Click");
    CHECK(result.Error().http_status == 404);
    CHECK(result.Error().message == "no such element: Unable to locate element: #nope");
    CHECK(result.Error().category == ErrorCategory::UpstreamFailure);
}

TEST_CASE("WebDriverClient: non-JSON success body is an upstream failure", "[browser][client]") {
    httplib::Server svr;
    svr.Get("/status", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("<html>proxy page</html>", "text/html");
    });
    LocalServer server(svr);

    auto result = MakeClient(server.Url())->Get("/status", "Status");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamFailure);
}

TEST_CASE("WebDriverClient: slow response times out", "[browser][client]") {
    httplib::Server svr;
    svr.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        res.set_content(R"({"value":null})", "application/json");
    });
    LocalServer server(svr);

    auto client = MakeClient(server.Url(), std::chrono::milliseconds(200));
    auto result = client->Get("/slow", "Slow");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
}

TEST_CASE("WebDriverClient: refused connection is an upstream failure", "[browser][client]") {
    int port = 0;
    {
        httplib::Server svr;
        LocalServer server(svr);
        port = server.Port();
    }
    auto client = MakeClient("http://127.0.0.1:" + std::to_string(port));
    auto result = client->Get("/status", "Status");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamFailure);
    CHECK(result.Error().message.rfind("WebDriver request failed: ", 0) == 0);
    CHECK_FALSE(client->IsReady());
}

// ===========================================================================
// IsReady
// ===========================================================================

TEST_CASE("WebDriverClient: IsReady follows the ready flag", "[browser][client]") {
    httplib::Server svr;
    std::atomic<bool> ready{false};
    svr.Get("/status", [&](const httplib::Request&, httplib::Response& res) {
        res.set_content(nlohmann::json{{"value", {{"ready", ready.load()}}}}.dump(),
                        "application/json");
    });
    LocalServer server(svr);

    auto client = MakeClient(server.Url());
    CHECK_FALSE(client->IsReady());
    ready = true;
    CHECK(client->IsReady());
}

TEST_CASE("WebDriverClient: status without ready flag counts as ready", "[browser][client]") {
    httplib::Server svr;
    svr.Get("/status", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"value":{"build":{"version":"1.0"}}})", "application/json");
    });
    LocalServer server(svr);

    CHECK(MakeClient(server.Url())->IsReady());
}
