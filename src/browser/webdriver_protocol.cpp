#include <browser_mcp/browser/webdriver_protocol.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <vector>

namespace browser_mcp {

namespace {

std::string EncodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

// Named keys from the WebDriver "normalized key value" table.
const std::map<std::string, char32_t>& NamedKeys() {
    static const std::map<std::string, char32_t> keys = [] {
        std::map<std::string, char32_t> k = {
            {"Cancel", 0xE001},    {"Help", 0xE002},       {"Backspace", 0xE003},
            {"Tab", 0xE004},       {"Clear", 0xE005},      {"Enter", 0xE007},
            {"Shift", 0xE008},     {"Control", 0xE009},    {"Alt", 0xE00A},
            {"Pause", 0xE00B},     {"Escape", 0xE00C},     {"Space", 0xE00D},
            {"PageUp", 0xE00E},    {"PageDown", 0xE00F},   {"End", 0xE010},
            {"Home", 0xE011},      {"ArrowLeft", 0xE012},  {"ArrowUp", 0xE013},
            {"ArrowRight", 0xE014}, {"ArrowDown", 0xE015}, {"Insert", 0xE016},
            {"Delete", 0xE017},    {"Meta", 0xE03D},       {"ControlOrMeta", 0xE009},
        };
        for (int i = 0; i < 10; ++i) {
            k["Numpad" + std::to_string(i)] = static_cast<char32_t>(0xE01A + i);
        }
        for (int i = 1; i <= 12; ++i) {
            k["F" + std::to_string(i)] = static_cast<char32_t>(0xE031 + i - 1);
        }
        return k;
    }();
    return keys;
}

bool IsSingleCodePoint(std::string_view text) {
    if (text.empty()) return false;
    auto lead = static_cast<unsigned char>(text[0]);
    size_t width = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : 4;
    return text.size() == width;
}

Result<std::string, std::string> KeyValue(const std::string& name) {
    const auto& keys = NamedKeys();
    auto it = keys.find(name);
    if (it != keys.end()) {
        return Result<std::string, std::string>::Ok(EncodeUtf8(it->second));
    }
    if (IsSingleCodePoint(name)) {
        return Result<std::string, std::string>::Ok(name);
    }
    return Result<std::string, std::string>::Err("Unknown key: " + name);
}

std::string Trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return std::string(s.substr(begin, end - begin + 1));
}

std::string EscapeXPathLiteral(const std::string& text) {
    if (text.find('\'') == std::string::npos) {
        return "'" + text + "'";
    }
    if (text.find('"') == std::string::npos) {
        return "\"" + text + "\"";
    }
    std::string out = "concat(";
    size_t start = 0;
    while (true) {
        auto quote = text.find('\'', start);
        out += "'" + text.substr(start, quote - start) + "'";
        if (quote == std::string::npos) break;
        out += ",\"'\",";
        start = quote + 1;
    }
    return out + ")";
}

} // anonymous namespace

Locator TranslateSelector(std::string_view selector) {
    if (selector.rfind("xpath=", 0) == 0) {
        return {"xpath", std::string(selector.substr(6))};
    }
    if (selector.rfind("//", 0) == 0 || selector.rfind("(//", 0) == 0) {
        return {"xpath", std::string(selector)};
    }
    if (selector.rfind("text=", 0) == 0) {
        auto text = std::string(selector.substr(5));
        if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
            text.back() == text.front()) {
            text = text.substr(1, text.size() - 2);
            return {"xpath", "//*[normalize-space(.)=" + EscapeXPathLiteral(text) +
                                 " and not(*[normalize-space(.)=" +
                                 EscapeXPathLiteral(text) + "])]"};
        }
        return {"xpath", "//*[contains(normalize-space(.)," + EscapeXPathLiteral(text) +
                             ") and not(*[contains(normalize-space(.)," +
                             EscapeXPathLiteral(text) + ")])]"};
    }
    if (selector.rfind("css=", 0) == 0) {
        return {"css selector", std::string(selector.substr(4))};
    }
    return {"css selector", std::string(selector)};
}

nlohmann::json BuildProxyCapability(const ProxySettings& proxy) {
    std::string scheme;
    std::string address = proxy.server;
    auto scheme_end = address.find("://");
    if (scheme_end != std::string::npos) {
        scheme = address.substr(0, scheme_end);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        address = address.substr(scheme_end + 3);
    }
    auto slash = address.find('/');
    if (slash != std::string::npos) {
        address.resize(slash);
    }

    nlohmann::json cap = {{"proxyType", "manual"}};
    if (scheme.rfind("socks", 0) == 0) {
        cap["socksProxy"] = address;
        cap["socksVersion"] = scheme == "socks4" ? 4 : 5;
    } else {
        cap["httpProxy"] = address;
        cap["sslProxy"] = address;
    }

    if (proxy.bypass.has_value()) {
        nlohmann::json no_proxy = nlohmann::json::array();
        std::string_view bypass = *proxy.bypass;
        size_t start = 0;
        while (start <= bypass.size()) {
            auto comma = bypass.find(',', start);
            auto entry = Trim(bypass.substr(start, comma == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : comma - start));
            if (!entry.empty()) {
                no_proxy.push_back(entry);
            }
            if (comma == std::string_view::npos) break;
            start = comma + 1;
        }
        if (!no_proxy.empty()) {
            cap["noProxy"] = no_proxy;
        }
    }
    return cap;
}

nlohmann::json BuildCapabilities(const LaunchSettings& settings) {
    nlohmann::json always = {
        {"pageLoadStrategy", "eager"},
        {"unhandledPromptBehavior", "dismiss and notify"},
    };

    auto window_size = std::to_string(settings.width) + "," + std::to_string(settings.height);
    switch (settings.engine) {
        case BrowserEngine::Chromium: {
            auto args = nlohmann::json::array({"--window-size=" + window_size,
                                               "--no-first-run",
                                               "--no-default-browser-check"});
            if (settings.headless) {
                args.push_back("--headless=new");
            }
            always["browserName"] = "chrome";
            always["goog:chromeOptions"] = {{"args", args}};
            break;
        }
        case BrowserEngine::Firefox: {
            auto args = nlohmann::json::array({"--width=" + std::to_string(settings.width),
                                               "--height=" + std::to_string(settings.height)});
            if (settings.headless) {
                args.push_back("-headless");
            }
            always["browserName"] = "firefox";
            always["moz:firefoxOptions"] = {{"args", args}};
            break;
        }
        case BrowserEngine::Webkit: {
            auto args = nlohmann::json::array({"--automation"});
            if (settings.headless) {
                args.push_back("--headless");
            }
            always["browserName"] = "MiniBrowser";
            always["webkitgtk:browserOptions"] = {{"args", args}};
            break;
        }
    }

    if (settings.proxy.has_value()) {
        always["proxy"] = BuildProxyCapability(*settings.proxy);
    }

    return {{"capabilities", {{"alwaysMatch", always}}}};
}

Result<nlohmann::json, std::string> BuildKeyPressActions(std::string_view key) {
    if (key.empty()) {
        return Result<nlohmann::json, std::string>::Err("Key must not be empty");
    }

    // Split on '+', keeping a trailing "+" as the literal plus key.
    std::vector<std::string> parts;
    std::string current;
    for (size_t i = 0; i < key.size(); ++i) {
        if (key[i] == '+' && !current.empty()) {
            parts.push_back(current);
            current.clear();
        } else {
            current += key[i];
        }
    }
    parts.push_back(current);

    std::vector<std::string> values;
    for (const auto& part : parts) {
        auto value = KeyValue(part);
        if (value.IsErr()) {
            return Result<nlohmann::json, std::string>::Err(value.Error());
        }
        values.push_back(value.Value());
    }

    nlohmann::json sequence = nlohmann::json::array();
    for (const auto& v : values) {
        sequence.push_back({{"type", "keyDown"}, {"value", v}});
    }
    for (auto it = values.rbegin(); it != values.rend(); ++it) {
        sequence.push_back({{"type", "keyUp"}, {"value", *it}});
    }

    nlohmann::json source = {{"type", "key"}, {"id", "keyboard"}, {"actions", sequence}};
    nlohmann::json payload;
    payload["actions"] = nlohmann::json::array({source});
    return Result<nlohmann::json, std::string>::Ok(std::move(payload));
}

std::optional<std::pair<double, double>> PaperSizeCm(std::string_view format) {
    std::string lower(format);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::map<std::string, std::pair<double, double>> sizes = {
        {"letter", {21.59, 27.94}},  {"legal", {21.59, 35.56}},
        {"tabloid", {27.94, 43.18}}, {"ledger", {43.18, 27.94}},
        {"a0", {84.1, 118.9}},       {"a1", {59.4, 84.1}},
        {"a2", {42.0, 59.4}},        {"a3", {29.7, 42.0}},
        {"a4", {21.0, 29.7}},        {"a5", {14.8, 21.0}},
        {"a6", {10.5, 14.8}},
    };
    auto it = sizes.find(lower);
    if (it == sizes.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<double, std::string> CssLengthToCm(std::string_view length) {
    auto text = Trim(length);
    if (text.empty()) {
        return Result<double, std::string>::Err("Empty length");
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) {
        return Result<double, std::string>::Err("Invalid length: " + text);
    }
    std::string unit = Trim(end);
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value < 0) {
        return Result<double, std::string>::Err("Negative length: " + text);
    }
    if (unit == "cm") return Result<double, std::string>::Ok(value);
    if (unit == "mm") return Result<double, std::string>::Ok(value / 10.0);
    if (unit == "in") return Result<double, std::string>::Ok(value * 2.54);
    if (unit == "px" || unit.empty()) return Result<double, std::string>::Ok(value * 2.54 / 96.0);
    return Result<double, std::string>::Err("Unsupported length unit: " + text);
}

Result<nlohmann::json, std::string> BuildPrintParameters(const PdfOptions& options) {
    auto size = PaperSizeCm(options.format);
    if (!size.has_value()) {
        return Result<nlohmann::json, std::string>::Err(
            "Unsupported paper format: " + options.format);
    }

    nlohmann::json params = {
        {"background", options.print_background},
        {"orientation", "portrait"},
        {"page", {{"width", size->first}, {"height", size->second}}},
    };

    nlohmann::json margin = nlohmann::json::object();
    const std::pair<const char*, const std::string*> sides[] = {
        {"top", &options.margin.top},
        {"right", &options.margin.right},
        {"bottom", &options.margin.bottom},
        {"left", &options.margin.left},
    };
    for (const auto& [name, value] : sides) {
        if (value->empty()) continue;
        auto cm = CssLengthToCm(*value);
        if (cm.IsErr()) {
            return Result<nlohmann::json, std::string>::Err(
                "margin." + std::string(name) + ": " + cm.Error());
        }
        margin[name] = cm.Value();
    }
    if (!margin.empty()) {
        params["margin"] = margin;
    }
    return Result<nlohmann::json, std::string>::Ok(std::move(params));
}

} // namespace browser_mcp
