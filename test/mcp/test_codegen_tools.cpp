#include <catch2/catch_test_macros.hpp>

#include "../../test/mocks/tool_harness.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>

using namespace browser_mcp;
using namespace browser_mcp::testing;
using nlohmann::json;

namespace fs = std::filesystem;

namespace {

fs::path TempDir(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("browser_mcp_codegen_" + name);
    fs::remove_all(dir);
    return dir;
}

json Payload(const ToolResponse& response) {
    return json::parse(response.Text());
}

std::string StartSession(ToolHarness& h, const json& options) {
    auto response = h.Call("start_codegen_session", json{{"options", options}});
    REQUIRE_FALSE(response.IsError());
    return Payload(response)["sessionId"].get<std::string>();
}

} // anonymous namespace

TEST_CASE("Codegen tools: catalog", "[mcp][codegen_tools]") {
    ToolHarness h;
    for (const auto* name : {"start_codegen_session", "end_codegen_session",
                             "get_codegen_session", "clear_codegen_session"}) {
        INFO(name);
        REQUIRE(h.registry.Find(name) != nullptr);
        CHECK(h.registry.Find(name)->category == ToolCategory::Codegen);
    }

    // Browser tools first, then HTTP, then codegen.
    const auto& tools = h.registry.Tools();
    CHECK(tools.front().name == "browser_navigate");
    CHECK(tools.back().name == "clear_codegen_session");
}

TEST_CASE("Codegen tools: start a session", "[mcp][codegen_tools]") {
    ToolHarness h;
    auto response = h.Call("start_codegen_session",
                           json{{"options", {{"outputPath", "/tmp/generated"},
                                             {"testNamePrefix", "Checkout"}}}});
    REQUIRE_FALSE(response.IsError());

    auto payload = Payload(response);
    std::regex uuid("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
    CHECK(std::regex_match(payload["sessionId"].get<std::string>(), uuid));
    CHECK(payload["options"]["outputPath"] == "/tmp/generated");
    CHECK(payload["options"]["testNamePrefix"] == "Checkout");
    CHECK(payload["options"]["includeComments"] == true);
    CHECK(payload["message"] == "Started codegen session. Browser actions are now recorded.");
}

TEST_CASE("Codegen tools: start requires an output path", "[mcp][codegen_tools]") {
    ToolHarness h;
    auto response = h.Call("start_codegen_session", json{{"options", json::object()}});
    CHECK(response.IsError());
    CHECK(response.Text() == "ValidationFailure: ValidateArguments [start_codegen_session]: "
                             "Missing required parameter: options.outputPath");
}

TEST_CASE("Codegen tools: get shows recorded actions", "[mcp][codegen_tools]") {
    ToolHarness h;
    auto id = StartSession(h, json{{"outputPath", "/tmp/generated"}});

    REQUIRE_FALSE(h.Call("browser_navigate", json{{"url", "https://shop.example"}}).IsError());
    REQUIRE_FALSE(h.Call("browser_click", json{{"selector", "#buy"}}).IsError());
    REQUIRE_FALSE(h.Call("api_get", json{{"url", "https://api.example.com"}}).IsError());

    auto response = h.Call("get_codegen_session", json{{"sessionId", id}});
    REQUIRE_FALSE(response.IsError());
    auto payload = Payload(response);
    CHECK(payload["id"] == id);
    CHECK(payload["actionCount"] == 2);
    REQUIRE(payload["actions"].size() == 2);
    CHECK(payload["actions"][0]["toolName"] == "browser_navigate");
    CHECK(payload["actions"][0]["parameters"]["url"] == "https://shop.example");
    CHECK(payload["actions"][1]["toolName"] == "browser_click");
    CHECK(payload["actions"][1]["timestamp"].get<std::string>().back() == 'Z');
}

TEST_CASE("Codegen tools: end writes the test file", "[mcp][codegen_tools]") {
    ToolHarness h;
    auto dir = TempDir("end");
    auto id = StartSession(h, json{{"outputPath", dir.string()}, {"testNamePrefix", "Login"}});

    REQUIRE_FALSE(h.Call("browser_navigate", json{{"url", "https://app.example"}}).IsError());
    REQUIRE_FALSE(h.Call("browser_fill", json{{"selector", "#user"}, {"value", "ada"}}).IsError());

    auto response = h.Call("end_codegen_session", json{{"sessionId", id}});
    REQUIRE_FALSE(response.IsError());
    auto payload = Payload(response);

    auto path = payload["filePath"].get<std::string>();
    CHECK(fs::path(path).parent_path() == dir);
    CHECK(payload["testName"].get<std::string>().find("Login_") == 0);
    CHECK(payload["actionCount"] == 2);
    CHECK(payload["message"] == "Generated test file: " + path);

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(content == payload["testCode"].get<std::string>());
    CHECK(content.find("await page.goto('https://app.example');") != std::string::npos);
    CHECK(content.find("await page.fill('#user', 'ada');") != std::string::npos);

    // The session is gone and recording stopped.
    CHECK(h.Call("get_codegen_session", json{{"sessionId", id}}).IsError());
    CHECK_FALSE(h.recorder.ActiveSessionId().has_value());

    fs::remove_all(dir);
}

TEST_CASE("Codegen tools: clear discards a session", "[mcp][codegen_tools]") {
    ToolHarness h;
    auto id = StartSession(h, json{{"outputPath", "/tmp/generated"}});
    auto response = h.Call("clear_codegen_session", json{{"sessionId", id}});
    REQUIRE_FALSE(response.IsError());
    CHECK(response.Text() == "Cleared codegen session " + id);

    auto again = h.Call("clear_codegen_session", json{{"sessionId", id}});
    CHECK(again.IsError());
}

TEST_CASE("Codegen tools: unknown session ids", "[mcp][codegen_tools]") {
    ToolHarness h;
    auto response = h.Call("end_codegen_session", json{{"sessionId", "nope"}});
    CHECK(response.IsError());
    CHECK(response.Text() ==
          "ValidationFailure: EndCodegen [nope]: Codegen session not found: nope");

    CHECK(h.Call("get_codegen_session", json{{"sessionId", "nope"}}).Text() ==
          "ValidationFailure: GetCodegen [nope]: Codegen session not found: nope");
}
