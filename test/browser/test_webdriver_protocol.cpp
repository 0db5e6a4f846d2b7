#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <browser_mcp/browser/webdriver_protocol.hpp>

using namespace browser_mcp;
using Catch::Matchers::WithinAbs;

// ===========================================================================
// TranslateSelector
// ===========================================================================

TEST_CASE("TranslateSelector: CSS by default", "[browser][protocol]") {
    auto loc = TranslateSelector("#login > button.primary");
    CHECK(loc.strategy == "css selector");
    CHECK(loc.value == "#login > button.primary");

    auto prefixed = TranslateSelector("css=div");
    CHECK(prefixed.strategy == "css selector");
    CHECK(prefixed.value == "div");
}

TEST_CASE("TranslateSelector: xpath forms", "[browser][protocol]") {
    auto explicit_xpath = TranslateSelector("xpath=//a[@href]");
    CHECK(explicit_xpath.strategy == "xpath");
    CHECK(explicit_xpath.value == "//a[@href]");

    auto bare = TranslateSelector("//input[@name='q']");
    CHECK(bare.strategy == "xpath");
    CHECK(bare.value == "//input[@name='q']");

    CHECK(TranslateSelector("(//li)[2]").strategy == "xpath");
}

TEST_CASE("TranslateSelector: text selectors", "[browser][protocol]") {
    auto contains = TranslateSelector("text=Sign in");
    CHECK(contains.strategy == "xpath");
    CHECK(contains.value.find("contains(normalize-space(.),'Sign in')") != std::string::npos);

    auto exact = TranslateSelector("text=\"Sign in\"");
    CHECK(exact.strategy == "xpath");
    CHECK(exact.value.find("normalize-space(.)='Sign in'") != std::string::npos);

    auto quoted = TranslateSelector("text=Don't");
    CHECK(quoted.value.find("\"Don't\"") != std::string::npos);
}

// ===========================================================================
// BuildCapabilities
// ===========================================================================

TEST_CASE("BuildCapabilities: chromium headed", "[browser][protocol]") {
    LaunchSettings settings;
    settings.width = 1024;
    settings.height = 768;
    auto caps = BuildCapabilities(settings);

    const auto& always = caps["capabilities"]["alwaysMatch"];
    CHECK(always["browserName"] == "chrome");
    const auto& args = always["goog:chromeOptions"]["args"];
    REQUIRE(args.is_array());
    CHECK(args[0] == "--window-size=1024,768");
    for (const auto& arg : args) {
        CHECK(arg != "--headless=new");
    }
    CHECK_FALSE(always.contains("proxy"));
}

TEST_CASE("BuildCapabilities: firefox headless", "[browser][protocol]") {
    LaunchSettings settings;
    settings.engine = BrowserEngine::Firefox;
    settings.headless = true;
    auto caps = BuildCapabilities(settings);

    const auto& always = caps["capabilities"]["alwaysMatch"];
    CHECK(always["browserName"] == "firefox");
    const auto& args = always["moz:firefoxOptions"]["args"];
    REQUIRE(args.is_array());
    REQUIRE(args.size() == 3);
    CHECK(args[0] == "--width=1280");
    CHECK(args[1] == "--height=720");
    CHECK(args[2] == "-headless");
}

TEST_CASE("BuildCapabilities: webkit", "[browser][protocol]") {
    LaunchSettings settings;
    settings.engine = BrowserEngine::Webkit;
    auto caps = BuildCapabilities(settings);
    const auto& args = caps["capabilities"]["alwaysMatch"]["webkitgtk:browserOptions"]["args"];
    REQUIRE(args.is_array());
    REQUIRE(args.size() == 1);
    CHECK(args[0] == "--automation");
}

TEST_CASE("BuildCapabilities: proxy is attached", "[browser][protocol]") {
    LaunchSettings settings;
    ProxySettings proxy;
    proxy.server = "http://proxy.local:3128";
    settings.proxy = proxy;
    auto caps = BuildCapabilities(settings);
    const auto& cap = caps["capabilities"]["alwaysMatch"]["proxy"];
    CHECK(cap["proxyType"] == "manual");
    CHECK(cap["httpProxy"] == "proxy.local:3128");
}

// ===========================================================================
// BuildProxyCapability
// ===========================================================================

TEST_CASE("BuildProxyCapability: http proxy with bypass list", "[browser][protocol]") {
    ProxySettings proxy;
    proxy.server = "http://proxy.local:3128/";
    proxy.bypass = "localhost, *.internal ,,";
    proxy.username = "alice";
    proxy.password = "s3cret";

    auto cap = BuildProxyCapability(proxy);
    CHECK(cap["httpProxy"] == "proxy.local:3128");
    CHECK(cap["sslProxy"] == "proxy.local:3128");
    REQUIRE(cap["noProxy"].size() == 2);
    CHECK(cap["noProxy"][0] == "localhost");
    CHECK(cap["noProxy"][1] == "*.internal");
    CHECK(cap.dump().find("s3cret") == std::string::npos);
}

TEST_CASE("BuildProxyCapability: socks proxy", "[browser][protocol]") {
    ProxySettings proxy;
    proxy.server = "socks5://127.0.0.1:1080";
    auto cap = BuildProxyCapability(proxy);
    CHECK(cap["socksProxy"] == "127.0.0.1:1080");
    CHECK(cap["socksVersion"] == 5);
    CHECK_FALSE(cap.contains("httpProxy"));
}

TEST_CASE("BuildProxyCapability: server without scheme", "[browser][protocol]") {
    ProxySettings proxy;
    proxy.server = "proxy:8080";
    auto cap = BuildProxyCapability(proxy);
    CHECK(cap["httpProxy"] == "proxy:8080");
    CHECK_FALSE(cap.contains("noProxy"));
}

// ===========================================================================
// BuildKeyPressActions
// ===========================================================================

TEST_CASE("BuildKeyPressActions: named key", "[browser][protocol]") {
    auto result = BuildKeyPressActions("Enter");
    REQUIRE(result.IsOk());
    const auto& actions = result.Value()["actions"][0]["actions"];
    REQUIRE(actions.size() == 2);
    CHECK(actions[0]["type"] == "keyDown");
    CHECK(actions[0]["value"] == "\xEE\x80\x87");
    CHECK(actions[1]["type"] == "keyUp");
}

TEST_CASE("BuildKeyPressActions: chord releases in reverse order", "[browser][protocol]") {
    auto result = BuildKeyPressActions("Control+Shift+K");
    REQUIRE(result.IsOk());
    const auto& actions = result.Value()["actions"][0]["actions"];
    REQUIRE(actions.size() == 6);
    CHECK(actions[0]["value"] == "\xEE\x80\x89");  // Control
    CHECK(actions[1]["value"] == "\xEE\x80\x88");  // Shift
    CHECK(actions[2]["value"] == "K");
    CHECK(actions[3]["type"] == "keyUp");
    CHECK(actions[3]["value"] == "K");
    CHECK(actions[5]["value"] == "\xEE\x80\x89");
}

TEST_CASE("BuildKeyPressActions: literal plus key", "[browser][protocol]") {
    auto result = BuildKeyPressActions("Shift++");
    REQUIRE(result.IsOk());
    const auto& actions = result.Value()["actions"][0]["actions"];
    REQUIRE(actions.size() == 4);
    CHECK(actions[1]["value"] == "+");
}

TEST_CASE("BuildKeyPressActions: rejects unknown and empty keys", "[browser][protocol]") {
    CHECK(BuildKeyPressActions("").IsErr());
    auto unknown = BuildKeyPressActions("Hyper");
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error() == "Unknown key: Hyper");
}

// ===========================================================================
// Paper sizes and lengths
// ===========================================================================

TEST_CASE("PaperSizeCm: named formats are case-insensitive", "[browser][protocol]") {
    auto a4 = PaperSizeCm("a4");
    REQUIRE(a4.has_value());
    CHECK_THAT(a4->first, WithinAbs(21.0, 1e-9));
    CHECK_THAT(a4->second, WithinAbs(29.7, 1e-9));
    CHECK(PaperSizeCm("Letter").has_value());
    CHECK_FALSE(PaperSizeCm("B5").has_value());
}

TEST_CASE("CssLengthToCm: units", "[browser][protocol]") {
    CHECK_THAT(CssLengthToCm("1cm").Value(), WithinAbs(1.0, 1e-9));
    CHECK_THAT(CssLengthToCm("10mm").Value(), WithinAbs(1.0, 1e-9));
    CHECK_THAT(CssLengthToCm("1in").Value(), WithinAbs(2.54, 1e-9));
    CHECK_THAT(CssLengthToCm("96px").Value(), WithinAbs(2.54, 1e-9));
    CHECK_THAT(CssLengthToCm("48").Value(), WithinAbs(1.27, 1e-9));
    CHECK(CssLengthToCm("").IsErr());
    CHECK(CssLengthToCm("wide").IsErr());
    CHECK(CssLengthToCm("-1cm").IsErr());
    CHECK(CssLengthToCm("2pt").IsErr());
}

TEST_CASE("BuildPrintParameters: page and margins", "[browser][protocol]") {
    PdfOptions options;
    options.format = "Letter";
    options.print_background = false;
    options.margin.top = "1cm";
    options.margin.left = "0.5in";

    auto result = BuildPrintParameters(options);
    REQUIRE(result.IsOk());
    const auto& params = result.Value();
    CHECK(params["background"] == false);
    CHECK_THAT(params["page"]["width"].get<double>(), WithinAbs(21.59, 1e-9));
    CHECK_THAT(params["margin"]["top"].get<double>(), WithinAbs(1.0, 1e-9));
    CHECK_THAT(params["margin"]["left"].get<double>(), WithinAbs(1.27, 1e-9));
    CHECK_FALSE(params["margin"].contains("bottom"));
}

TEST_CASE("BuildPrintParameters: no margins given", "[browser][protocol]") {
    auto result = BuildPrintParameters(PdfOptions{});
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().contains("margin"));
    CHECK(result.Value()["background"] == true);
}

TEST_CASE("BuildPrintParameters: invalid inputs", "[browser][protocol]") {
    PdfOptions bad_format;
    bad_format.format = "Napkin";
    CHECK(BuildPrintParameters(bad_format).IsErr());

    PdfOptions bad_margin;
    bad_margin.margin.right = "3furlongs";
    auto result = BuildPrintParameters(bad_margin);
    REQUIRE(result.IsErr());
    CHECK(result.Error().rfind("margin.right: ", 0) == 0);
}
