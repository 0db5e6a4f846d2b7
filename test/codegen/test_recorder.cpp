#include <catch2/catch_test_macros.hpp>

#include <browser_mcp/codegen/recorder.hpp>

#include <regex>
#include <string>

using namespace browser_mcp;

namespace {

CodegenOptions OptionsFor(const std::string& output_path) {
    CodegenOptions options;
    options.output_path = output_path;
    return options;
}

} // anonymous namespace

TEST_CASE("CodegenRecorder: start returns a UUID and activates the session", "[codegen]") {
    CodegenRecorder recorder;
    auto id = recorder.Start(OptionsFor("/tmp/out"));
    REQUIRE(id.IsOk());
    static const std::regex kUuid(
        "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
    CHECK(std::regex_match(id.Value(), kUuid));
    CHECK(recorder.ActiveSessionId() == id.Value());

    auto session = recorder.Get(id.Value());
    REQUIRE(session.IsOk());
    CHECK(session.Value()->options.output_path == "/tmp/out");
    CHECK(session.Value()->options.test_name_prefix == "GeneratedTest");
    CHECK(session.Value()->actions.empty());
}

TEST_CASE("CodegenRecorder: empty output path is rejected", "[codegen]") {
    CodegenRecorder recorder;
    auto id = recorder.Start(OptionsFor(""));
    REQUIRE(id.IsErr());
    CHECK(id.Error().category == ErrorCategory::ValidationFailure);
    CHECK_FALSE(recorder.ActiveSessionId().has_value());
}

TEST_CASE("CodegenRecorder: actions go to the newest open session", "[codegen]") {
    CodegenRecorder recorder;
    recorder.Record("browser_click", {{"selector", "#ignored"}});

    auto first = recorder.Start(OptionsFor("/tmp/a")).Value();
    recorder.Record("browser_navigate", {{"url", "https://example.com"}});
    auto second = recorder.Start(OptionsFor("/tmp/b")).Value();
    CHECK(first != second);
    recorder.Record("browser_click", {{"selector", "#go"}});

    const auto* a = recorder.Get(first).Value();
    const auto* b = recorder.Get(second).Value();
    REQUIRE(a->actions.size() == 1);
    CHECK(a->actions[0].tool_name == "browser_navigate");
    CHECK(a->actions[0].parameters["url"] == "https://example.com");
    REQUIRE(b->actions.size() == 1);
    CHECK(b->actions[0].tool_name == "browser_click");
    CHECK(b->actions[0].timestamp >= b->started_at);
}

TEST_CASE("CodegenRecorder: proxy passwords are redacted", "[codegen]") {
    CodegenRecorder recorder;
    auto id = recorder.Start(OptionsFor("/tmp/a")).Value();
    nlohmann::json args = {
        {"url", "https://example.com"},
        {"proxy", {{"server", "http://proxy:8080"}, {"username", "alice"},
                   {"password", "s3cret"}}},
    };
    recorder.Record("browser_navigate", args);

    const auto* session = recorder.Get(id).Value();
    REQUIRE(session->actions.size() == 1);
    const auto& recorded = session->actions[0].parameters;
    CHECK(recorded["proxy"]["password"] == "***");
    CHECK(recorded["proxy"]["username"] == "alice");
    CHECK(recorded["url"] == "https://example.com");
    CHECK(session->actions[0].parameters.dump().find("s3cret") == std::string::npos);
}

TEST_CASE("CodegenRecorder: end removes the session and stops recording", "[codegen]") {
    CodegenRecorder recorder;
    auto id = recorder.Start(OptionsFor("/tmp/out")).Value();
    recorder.Record("browser_hover", {{"selector", "nav"}});

    auto ended = recorder.End(id);
    REQUIRE(ended.IsOk());
    CHECK(ended.Value().id == id);
    CHECK(ended.Value().actions.size() == 1);
    CHECK_FALSE(recorder.ActiveSessionId().has_value());
    CHECK(recorder.Get(id).IsErr());

    recorder.Record("browser_hover", {{"selector", "nav"}});
    CHECK(recorder.End(id).IsErr());
}

TEST_CASE("CodegenRecorder: ending an older session keeps the active one", "[codegen]") {
    CodegenRecorder recorder;
    auto first = recorder.Start(OptionsFor("/tmp/a")).Value();
    auto second = recorder.Start(OptionsFor("/tmp/b")).Value();
    REQUIRE(recorder.End(first).IsOk());
    CHECK(recorder.ActiveSessionId() == second);
}

TEST_CASE("CodegenRecorder: clear discards the session", "[codegen]") {
    CodegenRecorder recorder;
    auto id = recorder.Start(OptionsFor("/tmp/out")).Value();
    REQUIRE(recorder.Clear(id).IsOk());
    CHECK(recorder.Get(id).IsErr());
    CHECK_FALSE(recorder.ActiveSessionId().has_value());
}

TEST_CASE("CodegenRecorder: unknown ids", "[codegen]") {
    CodegenRecorder recorder;
    auto get = recorder.Get("nope");
    REQUIRE(get.IsErr());
    CHECK(get.Error().message == "Codegen session not found: nope");
    CHECK(get.Error().category == ErrorCategory::ValidationFailure);
    CHECK(recorder.End("nope").IsErr());
    CHECK(recorder.Clear("nope").IsErr());
}
