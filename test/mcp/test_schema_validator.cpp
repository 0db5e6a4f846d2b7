#include <catch2/catch_test_macros.hpp>

#include <browser_mcp/mcp/schema_validator.hpp>
#include <browser_mcp/mcp/tool_registry.hpp>

using namespace browser_mcp;
using nlohmann::json;

namespace {

json NavigateLikeSchema() {
    return MakeSchema(
        {{"url", StringProp("URL")},
         {"timeout", IntProp("Timeout in ms")},
         {"headless", BoolProp("Headless")},
         {"waitUntil", EnumProp("Wait", {"load", "domcontentloaded", "networkidle", "commit"})},
         {"proxy", ObjectProp("Proxy", {{"server", StringProp("Server")}},
                              json::array({"server"}))}},
        json::array({"url"}));
}

} // anonymous namespace

TEST_CASE("ValidateArguments: accepts well-formed arguments", "[mcp][validator]") {
    auto args = json{{"url", "https://example.com"},
                     {"timeout", 5000},
                     {"headless", true},
                     {"waitUntil", "networkidle"},
                     {"proxy", {{"server", "http://proxy:8080"}}}};
    CHECK(ValidateArguments(NavigateLikeSchema(), args, "browser_navigate").IsOk());
}

TEST_CASE("ValidateArguments: unknown properties are allowed", "[mcp][validator]") {
    auto args = json{{"url", "https://example.com"}, {"extra", 1}};
    CHECK(ValidateArguments(NavigateLikeSchema(), args).IsOk());
}

TEST_CASE("ValidateArguments: missing required property", "[mcp][validator]") {
    auto result = ValidateArguments(NavigateLikeSchema(), json::object(), "browser_navigate");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ValidationFailure);
    CHECK(result.Error().target == "browser_navigate");
    CHECK(result.Error().message == "Missing required parameter: url");
}

TEST_CASE("ValidateArguments: null counts as missing", "[mcp][validator]") {
    auto result = ValidateArguments(NavigateLikeSchema(), json{{"url", nullptr}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Missing required parameter: url");
}

TEST_CASE("ValidateArguments: wrong property type", "[mcp][validator]") {
    auto result = ValidateArguments(NavigateLikeSchema(),
                                    json{{"url", "https://example.com"}, {"timeout", "soon"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Parameter 'timeout' must be of type integer, got string");

    auto headless = ValidateArguments(NavigateLikeSchema(),
                                      json{{"url", "x"}, {"headless", "yes"}});
    REQUIRE(headless.IsErr());
    CHECK(headless.Error().message == "Parameter 'headless' must be of type boolean, got string");
}

TEST_CASE("ValidateArguments: integral floats are integers", "[mcp][validator]") {
    CHECK(ValidateArguments(NavigateLikeSchema(), json{{"url", "x"}, {"timeout", 30000.0}}).IsOk());
    CHECK(ValidateArguments(NavigateLikeSchema(), json{{"url", "x"}, {"timeout", 1.5}}).IsErr());
}

TEST_CASE("ValidateArguments: enum values", "[mcp][validator]") {
    auto result = ValidateArguments(NavigateLikeSchema(),
                                    json{{"url", "x"}, {"waitUntil", "idle"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Parameter 'waitUntil' must be one of") == 0);
    CHECK(result.Error().message.find("\"idle\"") != std::string::npos);
}

TEST_CASE("ValidateArguments: nested object paths", "[mcp][validator]") {
    auto missing = ValidateArguments(NavigateLikeSchema(),
                                     json{{"url", "x"}, {"proxy", json::object()}});
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().message == "Missing required parameter: proxy.server");

    auto typed = ValidateArguments(NavigateLikeSchema(),
                                   json{{"url", "x"}, {"proxy", {{"server", 8080}}}});
    REQUIRE(typed.IsErr());
    CHECK(typed.Error().message == "Parameter 'proxy.server' must be of type string, got number");
}

TEST_CASE("ValidateArguments: array items", "[mcp][validator]") {
    json schema = MakeSchema({{"tags", {{"type", "array"}, {"items", StringProp("tag")}}}});
    CHECK(ValidateArguments(schema, json{{"tags", json::array({"a", "b"})}}).IsOk());

    auto result = ValidateArguments(schema, json{{"tags", json::array({"a", 2})}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Parameter 'tags[1]' must be of type string, got number");
}

TEST_CASE("ValidateArguments: arguments must be an object", "[mcp][validator]") {
    auto result = ValidateArguments(NavigateLikeSchema(), json::array());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Arguments must be a JSON object, got array");
}
