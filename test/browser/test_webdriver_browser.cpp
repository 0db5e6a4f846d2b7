#include <catch2/catch_test_macros.hpp>

#include <browser_mcp/browser/webdriver_browser.hpp>
#include "../../test/mocks/fake_webdriver.hpp"
#include "../../test/mocks/local_server.hpp"

#include <httplib.h>

#include <chrono>
#include <memory>
#include <string>

using namespace browser_mcp;
using namespace browser_mcp::testing;

namespace {

WebDriverLauncherOptions OptionsFor(const LocalServer& server, BrowserEngine engine,
                                    std::chrono::milliseconds launch_timeout =
                                        std::chrono::milliseconds(3000)) {
    WebDriverLauncherOptions options;
    DriverConfig driver;
    driver.url = server.Url();
    options.drivers[engine] = driver;
    options.launch_timeout = launch_timeout;
    options.command_timeout = std::chrono::milliseconds(5000);
    return options;
}

// A launched browser with its first page, talking to a FakeWebDriver.
struct Fixture {
    FakeWebDriver fake;
    httplib::Server svr;
    std::unique_ptr<LocalServer> server;
    std::unique_ptr<IBrowser> browser;
    std::unique_ptr<IPage> page;

    explicit Fixture(BrowserEngine engine = BrowserEngine::Chromium) {
        fake.Install(svr);
        server = std::make_unique<LocalServer>(svr);
        WebDriverLauncher launcher(OptionsFor(*server, engine));
        LaunchSettings settings;
        settings.engine = engine;
        auto launched = launcher.Launch(settings);
        REQUIRE(launched.IsOk());
        browser = std::move(launched).Value();
        auto opened = browser->OpenPage();
        REQUIRE(opened.IsOk());
        page = std::move(opened).Value();
    }

    ~Fixture() {
        page.reset();
        browser.reset();
        server.reset();
    }
};

} // anonymous namespace

// ===========================================================================
// Launch
// ===========================================================================

TEST_CASE("WebDriverLauncher: creates a session with capabilities", "[browser][webdriver]") {
    FakeWebDriver fake;
    httplib::Server svr;
    fake.Install(svr);
    LocalServer server(svr);

    WebDriverLauncher launcher(OptionsFor(server, BrowserEngine::Chromium));
    LaunchSettings settings;
    settings.headless = true;
    auto launched = launcher.Launch(settings);
    REQUIRE(launched.IsOk());

    auto caps = fake.Capabilities();
    CHECK(caps["capabilities"]["alwaysMatch"]["browserName"] == "chrome");
    CHECK(fake.Called("GET", "/status"));
    auto timeouts = fake.BodiesFor("POST", "/timeouts");
    REQUIRE(timeouts.size() == 1);
    CHECK(timeouts[0]["implicit"] == 5000);
    CHECK(timeouts[0]["script"] == 5000);

    auto browser = std::move(launched).Value();
    CHECK(browser->IsConnected());
    REQUIRE(browser->Close().IsOk());
    CHECK(fake.SessionDeleted());
    CHECK_FALSE(browser->IsConnected());
    // Closing twice is harmless.
    CHECK(browser->Close().IsOk());
}

TEST_CASE("WebDriverLauncher: server that never becomes ready", "[browser][webdriver]") {
    FakeWebDriver fake;
    fake.ready = false;
    httplib::Server svr;
    fake.Install(svr);
    LocalServer server(svr);

    WebDriverLauncher launcher(OptionsFor(server, BrowserEngine::Chromium,
                                          std::chrono::milliseconds(300)));
    auto launched = launcher.Launch(LaunchSettings{});
    REQUIRE(launched.IsErr());
    CHECK(launched.Error().category == ErrorCategory::LaunchFailure);
    CHECK(launched.Error().message.find("not ready") != std::string::npos);
}

TEST_CASE("WebDriverLauncher: session creation failure", "[browser][webdriver]") {
    FakeWebDriver fake;
    fake.new_session_status = 500;
    httplib::Server svr;
    fake.Install(svr);
    LocalServer server(svr);

    WebDriverLauncher launcher(OptionsFor(server, BrowserEngine::Firefox));
    LaunchSettings settings;
    settings.engine = BrowserEngine::Firefox;
    auto launched = launcher.Launch(settings);
    REQUIRE(launched.IsErr());
    CHECK(launched.Error().category == ErrorCategory::LaunchFailure);
    CHECK(launched.Error().message ==
          "session not created: browser binary not found");
}

TEST_CASE("WebDriverLauncher: missing driver binary", "[browser][webdriver]") {
    WebDriverLauncherOptions options;
    DriverConfig driver;
    driver.executable = "/nonexistent/path/to/chromedriver";
    options.drivers[BrowserEngine::Chromium] = driver;
    WebDriverLauncher launcher(options);

    auto launched = launcher.Launch(LaunchSettings{});
    REQUIRE(launched.IsErr());
    CHECK(launched.Error().category == ErrorCategory::LaunchFailure);
}

TEST_CASE("DefaultDriverExecutable: per engine", "[browser][webdriver]") {
    CHECK(std::string(DefaultDriverExecutable(BrowserEngine::Chromium)) == "chromedriver");
    CHECK(std::string(DefaultDriverExecutable(BrowserEngine::Firefox)) == "geckodriver");
    CHECK(std::string(DefaultDriverExecutable(BrowserEngine::Webkit)) == "WebKitWebDriver");
}

// ===========================================================================
// Pages
// ===========================================================================

TEST_CASE("WebDriverBrowser: first page reuses the initial window", "[browser][webdriver]") {
    Fixture f;
    CHECK(f.fake.Called("GET", "/window"));
    CHECK_FALSE(f.fake.Called("POST", "/window/new"));
    auto switches = f.fake.BodiesFor("POST", "/window");
    REQUIRE_FALSE(switches.empty());
    CHECK(switches.back()["handle"] == "win-1");
    // Chromium registers the hooks for future documents.
    CHECK(f.fake.Called("POST", "/goog/cdp/execute"));

    auto rects = f.fake.BodiesFor("POST", "/window/rect");
    REQUIRE(rects.size() == 1);
    CHECK(rects[0]["width"] == 1280);
    CHECK(rects[0]["height"] == 720);

    auto second = f.browser->OpenPage();
    REQUIRE(second.IsOk());
    CHECK(f.fake.Called("POST", "/window/new"));
}

TEST_CASE("WebDriverBrowser: firefox pages skip CDP registration", "[browser][webdriver]") {
    Fixture f(BrowserEngine::Firefox);
    CHECK_FALSE(f.fake.Called("POST", "/goog/cdp/execute"));
    CHECK(f.fake.Called("POST", "/execute/sync"));
}

TEST_CASE("WebDriverPage: navigate and read back the URL", "[browser][webdriver]") {
    Fixture f;
    NavigateOptions options;
    options.timeout = std::chrono::milliseconds(4000);
    REQUIRE(f.page->Navigate("https://example.com/", options).IsOk());
    CHECK(f.fake.CurrentUrl() == "https://example.com/");

    auto timeouts = f.fake.BodiesFor("POST", "/timeouts");
    REQUIRE_FALSE(timeouts.empty());
    CHECK(timeouts.back()["pageLoad"] == 4000);

    auto url = f.page->CurrentUrl();
    REQUIRE(url.IsOk());
    CHECK(url.Value() == "https://example.com/");
}

TEST_CASE("WebDriverPage: networkidle waits for a quiet period", "[browser][webdriver]") {
    Fixture f;
    NavigateOptions options;
    options.wait_until = WaitUntil::NetworkIdle;
    auto start = std::chrono::steady_clock::now();
    REQUIRE(f.page->Navigate("https://example.com/", options).IsOk());
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(500));
}

TEST_CASE("WebDriverPage: history navigation", "[browser][webdriver]") {
    Fixture f;
    REQUIRE(f.page->GoBack().IsOk());
    REQUIRE(f.page->GoForward().IsOk());
    CHECK(f.fake.Called("POST", "/back"));
    CHECK(f.fake.Called("POST", "/forward"));
}

TEST_CASE("WebDriverPage: click and fill", "[browser][webdriver]") {
    Fixture f;
    REQUIRE(f.page->Click("#submit").IsOk());
    CHECK(f.fake.Called("POST", "/element/el-1/click"));

    REQUIRE(f.page->Fill("input[name=q]", "hello").IsOk());
    CHECK(f.fake.Called("POST", "/element/el-2/clear"));
    auto values = f.fake.BodiesFor("POST", "/element/el-2/value");
    REQUIRE(values.size() == 1);
    CHECK(values[0]["text"] == "hello");

    auto lookups = f.fake.BodiesFor("POST", "/element");
    REQUIRE(lookups.size() == 2);
    CHECK(lookups[0]["using"] == "css selector");
    CHECK(lookups[0]["value"] == "#submit");
}

TEST_CASE("WebDriverPage: missing element names the selector", "[browser][webdriver]") {
    Fixture f;
    f.fake.missing_selectors.insert("#ghost");
    auto clicked = f.page->Click("#ghost");
    REQUIRE(clicked.IsErr());
    CHECK(clicked.Error().target == "#ghost");
    CHECK(clicked.Error().message.rfind("no such element", 0) == 0);
}

TEST_CASE("WebDriverPage: frame interaction returns to the top frame", "[browser][webdriver]") {
    Fixture f;
    REQUIRE(f.page->ClickInFrame("iframe#pay", "button").IsOk());
    auto frames = f.fake.BodiesFor("POST", "/frame");
    REQUIRE(frames.size() == 2);
    CHECK(frames[0]["id"].contains(kWebElementKey));
    CHECK(frames[1]["id"].is_null());
}

TEST_CASE("WebDriverPage: pointer and key actions are released", "[browser][webdriver]") {
    Fixture f;
    REQUIRE(f.page->Hover("#menu").IsOk());
    REQUIRE(f.page->DragAndDrop("#a", "#b").IsOk());
    REQUIRE(f.page->PressKey("Enter", std::string("#q")).IsOk());
    CHECK(f.fake.BodiesFor("POST", "/actions").size() == 3);
    CHECK(f.fake.BodiesFor("DELETE", "/actions").size() == 3);
}

TEST_CASE("WebDriverPage: content accessors", "[browser][webdriver]") {
    Fixture f;
    f.fake.evaluate_result = {{"answer", 42}};

    auto text = f.page->VisibleText();
    REQUIRE(text.IsOk());
    CHECK(text.Value() == "Hello from the fake page");

    auto html = f.page->Html(HtmlOptions{});
    REQUIRE(html.IsOk());
    CHECK(html.Value() == "<p>Hello</p>");

    auto value = f.page->Evaluate("({answer: 42})");
    REQUIRE(value.IsOk());
    CHECK(value.Value()["answer"] == 42);

    auto shot = f.page->Screenshot(ScreenshotOptions{});
    REQUIRE(shot.IsOk());
    CHECK(shot.Value() == "iVBORw0KGgo=");

    auto pdf = f.page->PrintPdf(PdfOptions{});
    REQUIRE(pdf.IsOk());
    CHECK(pdf.Value() == "JVBERi0xLjQK");
}

TEST_CASE("WebDriverPage: full-page screenshot on chromium uses CDP", "[browser][webdriver]") {
    Fixture f;
    ScreenshotOptions options;
    options.full_page = true;
    auto shot = f.page->Screenshot(options);
    REQUIRE(shot.IsOk());
    CHECK(shot.Value() == "iVBORw0KGgo=");
    bool captured = false;
    for (const auto& body : f.fake.BodiesFor("POST", "/goog/cdp/execute")) {
        if (body["cmd"] == "Page.captureScreenshot") captured = true;
    }
    CHECK(captured);
}

TEST_CASE("WebDriverPage: invalid print options", "[browser][webdriver]") {
    Fixture f;
    PdfOptions options;
    options.format = "Napkin";
    auto pdf = f.page->PrintPdf(options);
    REQUIRE(pdf.IsErr());
    CHECK_FALSE(f.fake.Called("POST", "/print"));
}

TEST_CASE("WebDriverPage: console and responses are drained once", "[browser][webdriver]") {
    Fixture f;
    f.fake.QueueConsole("error", "boom");
    f.fake.QueueConsole("log", "hello");
    f.fake.QueueResponse("https://example.com/api", 201, "{\"ok\":true}");

    auto console = f.page->DrainConsole();
    REQUIRE(console.IsOk());
    REQUIRE(console.Value().size() == 2);
    CHECK(console.Value()[0].type == "error");
    CHECK(console.Value()[0].text == "boom");
    CHECK(f.page->DrainConsole().Value().empty());

    auto responses = f.page->DrainResponses();
    REQUIRE(responses.IsOk());
    REQUIRE(responses.Value().size() == 1);
    CHECK(responses.Value()[0].url == "https://example.com/api");
    CHECK(responses.Value()[0].status == 201);
    CHECK(responses.Value()[0].body == "{\"ok\":true}");
}

TEST_CASE("WebDriverPage: user agent override", "[browser][webdriver]") {
    Fixture chromium;
    REQUIRE(chromium.page->SetUserAgent("TestAgent/1.0").IsOk());
    bool overridden = false;
    for (const auto& body : chromium.fake.BodiesFor("POST", "/goog/cdp/execute")) {
        if (body["cmd"] == "Network.setUserAgentOverride" &&
            body["params"]["userAgent"] == "TestAgent/1.0") {
            overridden = true;
        }
    }
    CHECK(overridden);

    Fixture firefox(BrowserEngine::Firefox);
    auto result = firefox.page->SetUserAgent("TestAgent/1.0");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("chromium") != std::string::npos);
}

TEST_CASE("WebDriverBrowser: new tab opened by a click", "[browser][webdriver]") {
    Fixture f;
    f.fake.open_tab_on_click = true;
    auto& page = *f.page;
    auto opened = f.browser->WaitForNewPage([&page]() { return page.Click("a[target]"); },
                                            std::chrono::milliseconds(2000));
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Value()->CurrentUrl().IsOk());
    auto switches = f.fake.BodiesFor("POST", "/window");
    REQUIRE_FALSE(switches.empty());
    CHECK(switches.back()["handle"] == "win-2");
}

TEST_CASE("WebDriverBrowser: no new tab times out", "[browser][webdriver]") {
    Fixture f;
    auto& page = *f.page;
    auto opened = f.browser->WaitForNewPage([&page]() { return page.Click("a"); },
                                            std::chrono::milliseconds(300));
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Timeout);
}

TEST_CASE("WebDriverPage: closed window is detected", "[browser][webdriver]") {
    Fixture f;
    CHECK_FALSE(f.page->IsClosed());
    f.fake.CloseAllWindows();
    CHECK(f.page->IsClosed());
}

// ===========================================================================
// Driver process helpers
// ===========================================================================

TEST_CASE("FindExecutable: PATH lookup and explicit paths", "[browser][driver]") {
    auto sh = FindExecutable("sh");
    REQUIRE(sh.IsOk());
    CHECK(sh.Value().find("/sh") != std::string::npos);

    CHECK(FindExecutable("/bin/sh").IsOk());
    CHECK(FindExecutable("").IsErr());
    CHECK(FindExecutable("/nonexistent/driver").IsErr());
    CHECK(FindExecutable("definitely-not-a-real-driver-binary").IsErr());
}

TEST_CASE("FindFreePort: returns a usable port", "[browser][driver]") {
    auto port = FindFreePort();
    REQUIRE(port.IsOk());
    CHECK(port.Value() > 0);
    CHECK(port.Value() <= 65535);
}
