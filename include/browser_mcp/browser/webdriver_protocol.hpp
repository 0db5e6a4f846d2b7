#pragma once

#include <browser_mcp/browser/i_browser.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace browser_mcp {

// W3C web element reference key.
inline constexpr const char* kWebElementKey = "element-6066-11e4-a52e-4f735466cecf";

// ---------------------------------------------------------------------------
// Locator: a WebDriver element location strategy and value.
// ---------------------------------------------------------------------------
struct Locator {
    std::string strategy;   // "css selector", "xpath", ...
    std::string value;
};

// "xpath=..." and selectors starting with "//" become xpath, "text=..."
// becomes a text-content xpath, anything else is a CSS selector.
Locator TranslateSelector(std::string_view selector);

// New Session payload ({"capabilities":{"alwaysMatch":{...}}}).
nlohmann::json BuildCapabilities(const LaunchSettings& settings);

// W3C "manual" proxy capability. Credentials cannot be expressed in
// capabilities and are not included.
nlohmann::json BuildProxyCapability(const ProxySettings& proxy);

// Key actions for a Playwright-style key expression ("Enter", "a",
// "Control+Shift+K", "Shift++").
Result<nlohmann::json, std::string> BuildKeyPressActions(std::string_view key);

// Paper width and height in centimetres for a named format (A4, Letter, ...).
std::optional<std::pair<double, double>> PaperSizeCm(std::string_view format);

// "1cm", "10mm", "0.5in", "96px" or a bare number of pixels.
Result<double, std::string> CssLengthToCm(std::string_view length);

// Print command parameters (POST /session/{id}/print).
Result<nlohmann::json, std::string> BuildPrintParameters(const PdfOptions& options);

} // namespace browser_mcp
