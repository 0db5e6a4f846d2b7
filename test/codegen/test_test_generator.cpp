#include <catch2/catch_test_macros.hpp>

#include <browser_mcp/codegen/test_generator.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace browser_mcp;

namespace {

RecordedAction Action(const std::string& tool, nlohmann::json params) {
    return RecordedAction{tool, std::move(params), std::chrono::system_clock::now()};
}

// 2024-01-02T03:04:05.678Z
std::chrono::system_clock::time_point FixedTime() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1704164645)) +
           std::chrono::milliseconds(678);
}

std::filesystem::path TempDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("browser_mcp_test_" + name);
    std::filesystem::remove_all(dir);
    return dir;
}

} // anonymous namespace

// ===========================================================================
// JsStringLiteral / MakeTestName
// ===========================================================================

TEST_CASE("JsStringLiteral: escapes quotes and control characters", "[codegen][generator]") {
    CHECK(JsStringLiteral("plain") == "'plain'");
    CHECK(JsStringLiteral("it's") == "'it\\'s'");
    CHECK(JsStringLiteral("a\\b") == "'a\\\\b'");
    CHECK(JsStringLiteral("line1\nline2\t") == "'line1\\nline2\\t'");
}

TEST_CASE("MakeTestName: prefix and UTC timestamp", "[codegen][generator]") {
    CHECK(MakeTestName("GeneratedTest", FixedTime()) ==
          "GeneratedTest_2024-01-02T03-04-05-678Z");
}

// ===========================================================================
// ActionToCode
// ===========================================================================

TEST_CASE("ActionToCode: navigation and interaction", "[codegen][generator]") {
    CHECK(ActionToCode(Action("browser_navigate", {{"url", "https://example.com"}})) ==
          "await page.goto('https://example.com');");
    CHECK(ActionToCode(Action("browser_click", {{"selector", "#go"}})) ==
          "await page.click('#go');");
    CHECK(ActionToCode(Action("browser_fill", {{"selector", "#q"}, {"value", "o'reilly"}})) ==
          "await page.fill('#q', 'o\\'reilly');");
    CHECK(ActionToCode(Action("browser_select", {{"selector", "#s"}, {"value", "b"}})) ==
          "await page.selectOption('#s', 'b');");
    CHECK(ActionToCode(Action("browser_hover", {{"selector", "nav"}})) ==
          "await page.hover('nav');");
    CHECK(ActionToCode(Action("browser_go_back", nlohmann::json::object())) ==
          "await page.goBack();");
    CHECK(ActionToCode(Action("browser_drag",
                              {{"sourceSelector", "#a"}, {"targetSelector", "#b"}})) ==
          "await page.dragAndDrop('#a', '#b');");
}

TEST_CASE("ActionToCode: iframe actions use frame locators", "[codegen][generator]") {
    CHECK(ActionToCode(Action("browser_iframe_click",
                              {{"iframeSelector", "#f"}, {"selector", "button"}})) ==
          "await page.frameLocator('#f').locator('button').click();");
    CHECK(ActionToCode(Action("browser_iframe_fill",
                              {{"iframeSelector", "#f"}, {"selector", "input"},
                               {"value", "x"}})) ==
          "await page.frameLocator('#f').locator('input').fill('x');");
}

TEST_CASE("ActionToCode: key presses with and without a target", "[codegen][generator]") {
    CHECK(ActionToCode(Action("browser_press_key", {{"key", "Enter"}})) ==
          "await page.keyboard.press('Enter');");
    CHECK(ActionToCode(Action("browser_press_key", {{"key", "Enter"}, {"selector", "#q"}})) ==
          "await page.press('#q', 'Enter');");
}

TEST_CASE("ActionToCode: screenshots", "[codegen][generator]") {
    CHECK(ActionToCode(Action("browser_screenshot", {{"name", "home"}})) ==
          "await page.screenshot({ path: 'home.png' });");
    CHECK(ActionToCode(Action("browser_screenshot",
                              {{"name", "hero"}, {"selector", ".hero"}, {"fullPage", true}})) ==
          "await page.locator('.hero').screenshot({ path: 'hero.png', fullPage: true });");
}

TEST_CASE("ActionToCode: response expectation pair", "[codegen][generator]") {
    CHECK(ActionToCode(Action("browser_expect_response",
                              {{"id", "user-list"}, {"url", "**/api/users"}})) ==
          "const user_listPromise = page.waitForResponse('**/api/users');");
    auto assert_code = ActionToCode(Action("browser_assert_response",
                                           {{"id", "user-list"}, {"value", "alice"}}));
    CHECK(assert_code.find("const user_listResponse = await user_listPromise;") == 0);
    CHECK(assert_code.find("toContain('alice')") != std::string::npos);
}

TEST_CASE("ActionToCode: tools without page effects", "[codegen][generator]") {
    CHECK(ActionToCode(Action("browser_get_visible_text", nlohmann::json::object())).empty());
    CHECK(ActionToCode(Action("browser_console_logs", nlohmann::json::object())).empty());
}

// ===========================================================================
// GenerateTestSource / WriteTestFile
// ===========================================================================

TEST_CASE("GenerateTestSource: full test with comments", "[codegen][generator]") {
    CodegenSession session;
    session.options.output_path = "/tmp";
    session.actions.push_back(Action("browser_navigate", {{"url", "https://example.com"}}));
    session.actions.push_back(Action("browser_get_visible_text", nlohmann::json::object()));

    auto source = GenerateTestSource(session, "MyTest");
    CHECK(source.rfind("import { test, expect } from '@playwright/test';\n", 0) == 0);
    CHECK(source.find("test('MyTest', async ({ page }) => {\n") != std::string::npos);
    CHECK(source.find("  // browser_navigate\n  await page.goto('https://example.com');\n") !=
          std::string::npos);
    CHECK(source.find("// browser_get_visible_text (no generated code)") != std::string::npos);
    CHECK(source.substr(source.size() - 4) == "});\n");
}

TEST_CASE("GenerateTestSource: comments can be disabled", "[codegen][generator]") {
    CodegenSession session;
    session.options.include_comments = false;
    session.actions.push_back(Action("browser_click", {{"selector", "#go"}}));
    session.actions.push_back(Action("browser_console_logs", nlohmann::json::object()));

    auto source = GenerateTestSource(session, "T");
    CHECK(source.find("//") == std::string::npos);
    CHECK(source.find("  await page.click('#go');\n") != std::string::npos);
}

TEST_CASE("WriteTestFile: writes the .spec.ts file", "[codegen][generator]") {
    auto dir = TempDir("write") / "nested";
    CodegenSession session;
    session.options.output_path = dir.string();
    session.options.test_name_prefix = "Checkout";
    session.actions.push_back(Action("browser_click", {{"selector", "#buy"}}));

    auto written = WriteTestFile(session, FixedTime());
    REQUIRE(written.IsOk());
    const auto& test = written.Value();
    CHECK(test.test_name == "Checkout_2024-01-02T03-04-05-678Z");
    CHECK(test.action_count == 1);
    CHECK(test.file_path == (dir / (test.test_name + ".spec.ts")).string());

    std::ifstream in(test.file_path);
    std::stringstream content;
    content << in.rdbuf();
    CHECK(content.str() == test.content);

    std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("WriteTestFile: unwritable output directory", "[codegen][generator]") {
    auto blocker = TempDir("blocked");
    std::filesystem::create_directories(blocker.parent_path());
    std::ofstream(blocker.string()) << "not a directory";

    CodegenSession session;
    session.options.output_path = (blocker / "sub").string();
    auto written = WriteTestFile(session, FixedTime());
    REQUIRE(written.IsErr());
    CHECK(written.Error().category == ErrorCategory::Internal);

    std::filesystem::remove(blocker);
}
