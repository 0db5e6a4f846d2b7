#include <browser_mcp/mcp/tool_arguments.hpp>

#include <browser_mcp/browser/webdriver_protocol.hpp>
#include <browser_mcp/config/config_loader.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace browser_mcp {

namespace {

Error MakeArgError(const std::string& key, const std::string& message) {
    return Error{"ParseArguments", key, std::nullopt, message,
                 ErrorCategory::ValidationFailure};
}

// Keeps steady_clock deadline arithmetic from overflowing.
constexpr long long kMaxNavigationTimeoutMs = std::numeric_limits<int>::max();

template <typename T>
Result<T, Error> Fail(const Error& error) {
    return Result<T, Error>::Err(error);
}

// Required, non-empty string.
Result<std::string, Error> RequireString(const nlohmann::json& args, const char* key) {
    if (!args.contains(key) || !args[key].is_string()) {
        return Fail<std::string>(
            MakeArgError(key, std::string("Missing required parameter: ") + key));
    }
    auto value = args[key].get<std::string>();
    if (value.empty()) {
        return Fail<std::string>(
            MakeArgError(key, std::string("Parameter must not be empty: ") + key));
    }
    return Result<std::string, Error>::Ok(std::move(value));
}

// Required string that may be empty (fill values, key text).
Result<std::string, Error> RequireText(const nlohmann::json& args, const char* key) {
    if (!args.contains(key) || !args[key].is_string()) {
        return Fail<std::string>(
            MakeArgError(key, std::string("Missing required parameter: ") + key));
    }
    return Result<std::string, Error>::Ok(args[key].get<std::string>());
}

std::optional<std::string> OptString(const nlohmann::json& args, const char* key) {
    if (args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return std::nullopt;
}

// Values outside the long long range saturate instead of wrapping.
std::optional<long long> OptInt(const nlohmann::json& args, const char* key) {
    if (!args.contains(key)) return std::nullopt;
    const auto& v = args[key];
    constexpr auto kMax = std::numeric_limits<long long>::max();
    constexpr auto kMin = std::numeric_limits<long long>::min();
    if (v.is_number_unsigned()) {
        auto u = v.get<unsigned long long>();
        return u > static_cast<unsigned long long>(kMax) ? kMax : static_cast<long long>(u);
    }
    if (v.is_number_integer()) return v.get<long long>();
    if (v.is_number_float()) {
        auto d = std::round(v.get<double>());
        if (std::isnan(d)) return std::nullopt;
        // 2^63 is exactly representable; anything at or past it saturates.
        if (d >= 9223372036854775808.0) return kMax;
        if (d <= -9223372036854775808.0) return kMin;
        return static_cast<long long>(d);
    }
    return std::nullopt;
}

bool OptBool(const nlohmann::json& args, const char* key, bool default_value) {
    if (args.contains(key) && args[key].is_boolean()) {
        return args[key].get<bool>();
    }
    return default_value;
}

Result<std::optional<int>, Error> OptPositive(const nlohmann::json& args, const char* key) {
    auto value = OptInt(args, key);
    if (!value.has_value()) {
        return Result<std::optional<int>, Error>::Ok(std::optional<int>{});
    }
    if (*value <= 0 || *value > 100000) {
        return Fail<std::optional<int>>(MakeArgError(
            key, std::string("Parameter '") + key + "' must be between 1 and 100000"));
    }
    return Result<std::optional<int>, Error>::Ok(static_cast<int>(*value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Launch arguments
// ---------------------------------------------------------------------------

Result<PerCallLaunchArgs, Error> ParseLaunchArgs(const nlohmann::json& args) {
    PerCallLaunchArgs launch;

    if (auto type = OptString(args, "browserType")) {
        auto engine = ParseBrowserEngine(*type);
        if (engine.IsErr()) {
            return Fail<PerCallLaunchArgs>(MakeArgError("browserType", engine.Error()));
        }
        launch.engine = engine.Value();
    }
    if (args.contains("headless") && args["headless"].is_boolean()) {
        launch.headless = args["headless"].get<bool>();
    }

    auto width = OptPositive(args, "width");
    if (width.IsErr()) return Fail<PerCallLaunchArgs>(width.Error());
    launch.width = width.Value();
    auto height = OptPositive(args, "height");
    if (height.IsErr()) return Fail<PerCallLaunchArgs>(height.Error());
    launch.height = height.Value();

    if (args.contains("proxy") && args["proxy"].is_object()) {
        const auto& proxy_json = args["proxy"];
        auto server = RequireString(proxy_json, "server");
        if (server.IsErr()) {
            return Fail<PerCallLaunchArgs>(MakeArgError("proxy.server", server.Error().message));
        }
        ProxySettings proxy;
        proxy.server = server.Value();
        proxy.bypass = OptString(proxy_json, "bypass");
        proxy.username = OptString(proxy_json, "username");
        proxy.password = OptString(proxy_json, "password");
        launch.proxy = std::move(proxy);
    }
    return Result<PerCallLaunchArgs, Error>::Ok(std::move(launch));
}

// ---------------------------------------------------------------------------
// Browser tools
// ---------------------------------------------------------------------------

Result<NavigateArgs, Error> ParseNavigateArgs(const nlohmann::json& args) {
    auto url = RequireString(args, "url");
    if (url.IsErr()) return Fail<NavigateArgs>(url.Error());

    NavigateArgs parsed;
    parsed.url = url.Value();

    if (auto timeout = OptInt(args, "timeout")) {
        if (*timeout <= 0) {
            return Fail<NavigateArgs>(MakeArgError("timeout", "timeout must be positive"));
        }
        parsed.options.timeout = std::chrono::milliseconds(
            std::min<long long>(*timeout, kMaxNavigationTimeoutMs));
    }
    if (auto wait = OptString(args, "waitUntil")) {
        if (*wait == "load") {
            parsed.options.wait_until = WaitUntil::Load;
        } else if (*wait == "domcontentloaded") {
            parsed.options.wait_until = WaitUntil::DomContentLoaded;
        } else if (*wait == "networkidle") {
            parsed.options.wait_until = WaitUntil::NetworkIdle;
        } else if (*wait == "commit") {
            parsed.options.wait_until = WaitUntil::Commit;
        } else {
            return Fail<NavigateArgs>(MakeArgError("waitUntil", "Unknown waitUntil: " + *wait));
        }
    }
    return Result<NavigateArgs, Error>::Ok(std::move(parsed));
}

Result<ScreenshotArgs, Error> ParseScreenshotArgs(const nlohmann::json& args) {
    auto name = RequireString(args, "name");
    if (name.IsErr()) return Fail<ScreenshotArgs>(name.Error());

    ScreenshotArgs parsed;
    parsed.name = name.Value();
    parsed.options.selector = OptString(args, "selector");
    parsed.options.full_page = OptBool(args, "fullPage", false);
    parsed.store_base64 = OptBool(args, "storeBase64", true);
    parsed.save_png = OptBool(args, "savePng", false);
    parsed.downloads_dir = OptString(args, "downloadsDir");
    return Result<ScreenshotArgs, Error>::Ok(std::move(parsed));
}

Result<SelectorArgs, Error> ParseSelectorArgs(const nlohmann::json& args) {
    auto selector = RequireString(args, "selector");
    if (selector.IsErr()) return Fail<SelectorArgs>(selector.Error());
    return Result<SelectorArgs, Error>::Ok(SelectorArgs{selector.Value()});
}

Result<FillArgs, Error> ParseFillArgs(const nlohmann::json& args) {
    auto selector = RequireString(args, "selector");
    if (selector.IsErr()) return Fail<FillArgs>(selector.Error());
    auto value = RequireText(args, "value");
    if (value.IsErr()) return Fail<FillArgs>(value.Error());
    return Result<FillArgs, Error>::Ok(FillArgs{selector.Value(), value.Value()});
}

Result<FrameClickArgs, Error> ParseFrameClickArgs(const nlohmann::json& args) {
    auto frame = RequireString(args, "iframeSelector");
    if (frame.IsErr()) return Fail<FrameClickArgs>(frame.Error());
    auto selector = RequireString(args, "selector");
    if (selector.IsErr()) return Fail<FrameClickArgs>(selector.Error());
    return Result<FrameClickArgs, Error>::Ok(FrameClickArgs{frame.Value(), selector.Value()});
}

Result<FrameFillArgs, Error> ParseFrameFillArgs(const nlohmann::json& args) {
    auto frame = RequireString(args, "iframeSelector");
    if (frame.IsErr()) return Fail<FrameFillArgs>(frame.Error());
    auto selector = RequireString(args, "selector");
    if (selector.IsErr()) return Fail<FrameFillArgs>(selector.Error());
    auto value = RequireText(args, "value");
    if (value.IsErr()) return Fail<FrameFillArgs>(value.Error());
    return Result<FrameFillArgs, Error>::Ok(
        FrameFillArgs{frame.Value(), selector.Value(), value.Value()});
}

Result<UploadFileArgs, Error> ParseUploadFileArgs(const nlohmann::json& args) {
    auto selector = RequireString(args, "selector");
    if (selector.IsErr()) return Fail<UploadFileArgs>(selector.Error());
    auto path = RequireString(args, "filePath");
    if (path.IsErr()) return Fail<UploadFileArgs>(path.Error());
    return Result<UploadFileArgs, Error>::Ok(UploadFileArgs{selector.Value(), path.Value()});
}

Result<EvaluateArgs, Error> ParseEvaluateArgs(const nlohmann::json& args) {
    auto script = RequireString(args, "script");
    if (script.IsErr()) return Fail<EvaluateArgs>(script.Error());
    return Result<EvaluateArgs, Error>::Ok(EvaluateArgs{script.Value()});
}

Result<ConsoleLogsArgs, Error> ParseConsoleLogsArgs(const nlohmann::json& args) {
    ConsoleLogsArgs parsed;
    if (auto type = OptString(args, "type")) {
        parsed.type = *type;
    }
    parsed.search = OptString(args, "search");
    parsed.limit = OptInt(args, "limit");
    if (parsed.limit.has_value() && *parsed.limit < 0) {
        return Fail<ConsoleLogsArgs>(MakeArgError("limit", "limit must not be negative"));
    }
    parsed.clear = OptBool(args, "clear", false);
    return Result<ConsoleLogsArgs, Error>::Ok(std::move(parsed));
}

Result<VisibleTextArgs, Error> ParseVisibleTextArgs(const nlohmann::json& args) {
    return Result<VisibleTextArgs, Error>::Ok(VisibleTextArgs{OptInt(args, "maxLength")});
}

Result<VisibleHtmlArgs, Error> ParseVisibleHtmlArgs(const nlohmann::json& args) {
    VisibleHtmlArgs parsed;
    parsed.options.selector = OptString(args, "selector");
    parsed.options.remove_scripts = OptBool(args, "removeScripts", true);
    parsed.options.remove_comments = OptBool(args, "removeComments", false);
    parsed.options.remove_styles = OptBool(args, "removeStyles", false);
    parsed.options.remove_meta = OptBool(args, "removeMeta", false);
    parsed.options.clean_html = OptBool(args, "cleanHtml", false);
    parsed.options.minify = OptBool(args, "minify", false);
    parsed.max_length = OptInt(args, "maxLength");
    return Result<VisibleHtmlArgs, Error>::Ok(std::move(parsed));
}

Result<DragArgs, Error> ParseDragArgs(const nlohmann::json& args) {
    auto source = RequireString(args, "sourceSelector");
    if (source.IsErr()) return Fail<DragArgs>(source.Error());
    auto target = RequireString(args, "targetSelector");
    if (target.IsErr()) return Fail<DragArgs>(target.Error());
    return Result<DragArgs, Error>::Ok(DragArgs{source.Value(), target.Value()});
}

Result<PressKeyArgs, Error> ParsePressKeyArgs(const nlohmann::json& args) {
    auto key = RequireString(args, "key");
    if (key.IsErr()) return Fail<PressKeyArgs>(key.Error());
    return Result<PressKeyArgs, Error>::Ok(PressKeyArgs{key.Value(), OptString(args, "selector")});
}

Result<SavePdfArgs, Error> ParseSavePdfArgs(const nlohmann::json& args) {
    auto output = RequireString(args, "outputPath");
    if (output.IsErr()) return Fail<SavePdfArgs>(output.Error());

    SavePdfArgs parsed;
    parsed.output_path = output.Value();
    if (auto filename = OptString(args, "filename")) {
        if (filename->empty() || filename->find('/') != std::string::npos) {
            return Fail<SavePdfArgs>(
                MakeArgError("filename", "filename must be a plain, non-empty file name"));
        }
        parsed.filename = *filename;
    }
    if (auto format = OptString(args, "format")) {
        if (!PaperSizeCm(*format).has_value()) {
            return Fail<SavePdfArgs>(MakeArgError("format", "Unsupported paper format: " + *format));
        }
        parsed.options.format = *format;
    }
    parsed.options.print_background = OptBool(args, "printBackground", true);
    if (args.contains("margin") && args["margin"].is_object()) {
        const auto& margin = args["margin"];
        parsed.options.margin.top = OptString(margin, "top").value_or("");
        parsed.options.margin.right = OptString(margin, "right").value_or("");
        parsed.options.margin.bottom = OptString(margin, "bottom").value_or("");
        parsed.options.margin.left = OptString(margin, "left").value_or("");
        for (const auto* side : {&parsed.options.margin.top, &parsed.options.margin.right,
                                 &parsed.options.margin.bottom, &parsed.options.margin.left}) {
            if (side->empty()) continue;
            auto cm = CssLengthToCm(*side);
            if (cm.IsErr()) {
                return Fail<SavePdfArgs>(MakeArgError("margin", cm.Error()));
            }
        }
    }
    return Result<SavePdfArgs, Error>::Ok(std::move(parsed));
}

Result<ExpectResponseArgs, Error> ParseExpectResponseArgs(const nlohmann::json& args) {
    auto id = RequireString(args, "id");
    if (id.IsErr()) return Fail<ExpectResponseArgs>(id.Error());
    auto url = RequireString(args, "url");
    if (url.IsErr()) return Fail<ExpectResponseArgs>(url.Error());
    return Result<ExpectResponseArgs, Error>::Ok(ExpectResponseArgs{id.Value(), url.Value()});
}

Result<AssertResponseArgs, Error> ParseAssertResponseArgs(const nlohmann::json& args) {
    auto id = RequireString(args, "id");
    if (id.IsErr()) return Fail<AssertResponseArgs>(id.Error());
    return Result<AssertResponseArgs, Error>::Ok(
        AssertResponseArgs{id.Value(), OptString(args, "value")});
}

Result<UserAgentArgs, Error> ParseUserAgentArgs(const nlohmann::json& args) {
    auto ua = RequireString(args, "userAgent");
    if (ua.IsErr()) return Fail<UserAgentArgs>(ua.Error());
    return Result<UserAgentArgs, Error>::Ok(UserAgentArgs{ua.Value()});
}

// ---------------------------------------------------------------------------
// HTTP tools
// ---------------------------------------------------------------------------

Result<ApiRequestArgs, Error> ParseApiRequestArgs(const nlohmann::json& args,
                                                  bool requires_body) {
    auto url = RequireString(args, "url");
    if (url.IsErr()) return Fail<ApiRequestArgs>(url.Error());

    ApiRequestArgs parsed;
    parsed.url = url.Value();
    if (requires_body) {
        auto value = RequireText(args, "value");
        if (value.IsErr()) return Fail<ApiRequestArgs>(value.Error());
        parsed.value = value.Value();
    }
    parsed.token = OptString(args, "token");
    if (args.contains("headers") && args["headers"].is_object()) {
        for (const auto& [name, value] : args["headers"].items()) {
            if (!value.is_string()) {
                return Fail<ApiRequestArgs>(MakeArgError(
                    "headers." + name, "Header values must be strings"));
            }
            parsed.headers[name] = value.get<std::string>();
        }
    }
    return Result<ApiRequestArgs, Error>::Ok(std::move(parsed));
}

// ---------------------------------------------------------------------------
// Codegen tools
// ---------------------------------------------------------------------------

Result<StartCodegenArgs, Error> ParseStartCodegenArgs(const nlohmann::json& args) {
    if (!args.contains("options") || !args["options"].is_object()) {
        return Fail<StartCodegenArgs>(
            MakeArgError("options", "Missing required parameter: options"));
    }
    const auto& options = args["options"];
    auto output = RequireString(options, "outputPath");
    if (output.IsErr()) {
        return Fail<StartCodegenArgs>(
            MakeArgError("options.outputPath", output.Error().message));
    }

    StartCodegenArgs parsed;
    parsed.options.output_path = output.Value();
    if (auto prefix = OptString(options, "testNamePrefix"); prefix && !prefix->empty()) {
        parsed.options.test_name_prefix = *prefix;
    }
    parsed.options.include_comments = OptBool(options, "includeComments", true);
    return Result<StartCodegenArgs, Error>::Ok(std::move(parsed));
}

Result<CodegenSessionArgs, Error> ParseCodegenSessionArgs(const nlohmann::json& args) {
    auto id = RequireString(args, "sessionId");
    if (id.IsErr()) return Fail<CodegenSessionArgs>(id.Error());
    return Result<CodegenSessionArgs, Error>::Ok(CodegenSessionArgs{id.Value()});
}

} // namespace browser_mcp
