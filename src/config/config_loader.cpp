#include <browser_mcp/config/config_loader.hpp>

#include <browser_mcp/core/log.hpp>
#include <browser_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <cstdlib>

namespace browser_mcp {

namespace {

Error MakeConfigError(const std::string& message, const std::string& target = "") {
    return Error{"ConfigLoader", target, std::nullopt, message,
                 ErrorCategory::ConfigParseFailure};
}

std::optional<std::string> ReadEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Result<std::optional<std::string>, Error> OptionalProxyField(
    const nlohmann::json& obj, const char* key, std::string_view source) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return Result<std::optional<std::string>, Error>::Ok(std::nullopt);
    }
    if (!obj[key].is_string()) {
        return Result<std::optional<std::string>, Error>::Err(MakeConfigError(
            "Proxy field '" + std::string(key) + "' must be a string",
            std::string(source)));
    }
    return Result<std::optional<std::string>, Error>::Ok(
        obj[key].get<std::string>());
}

// Drop userinfo from a proxy server address so diagnostics cannot leak
// credentials embedded in the URL.
std::string RedactServer(const std::string& server) {
    auto scheme_end = server.find("://");
    auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto at = server.find('@', host_start);
    if (at == std::string::npos) {
        return server;
    }
    auto slash = server.find('/', host_start);
    if (slash != std::string::npos && slash < at) {
        return server;
    }
    return server.substr(0, host_start) + "***@" + server.substr(at + 1);
}

Result<std::chrono::milliseconds, Error> ParseMillis(const YAML::Node& node,
                                                     const std::string& key) {
    auto value = node.as<long long>();
    if (value <= 0) {
        return Result<std::chrono::milliseconds, Error>::Err(
            MakeConfigError("timeouts." + key + " must be positive"));
    }
    return Result<std::chrono::milliseconds, Error>::Ok(
        std::chrono::milliseconds(value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Engine names
// ---------------------------------------------------------------------------
Result<BrowserEngine, std::string> ParseBrowserEngine(std::string_view name) {
    if (name == "chromium") return Result<BrowserEngine, std::string>::Ok(BrowserEngine::Chromium);
    if (name == "firefox") return Result<BrowserEngine, std::string>::Ok(BrowserEngine::Firefox);
    if (name == "webkit") return Result<BrowserEngine, std::string>::Ok(BrowserEngine::Webkit);
    return Result<BrowserEngine, std::string>::Err(
        "Unknown browser type '" + std::string(name) +
        "' (expected chromium, firefox or webkit)");
}

const char* EngineName(BrowserEngine engine) {
    switch (engine) {
        case BrowserEngine::Chromium: return "chromium";
        case BrowserEngine::Firefox:  return "firefox";
        case BrowserEngine::Webkit:   return "webkit";
    }
    return "chromium";
}

// ---------------------------------------------------------------------------
// EnvironmentSnapshot
// ---------------------------------------------------------------------------
EnvironmentSnapshot EnvironmentSnapshot::Capture() {
    EnvironmentSnapshot env;
    env.headless = ReadEnv(kHeadlessEnvVar);
    env.proxy = ReadEnv(kProxyEnvVar);
    return env;
}

// ---------------------------------------------------------------------------
// ParseCommandLine
// ---------------------------------------------------------------------------
Result<CliOptions, Error> ParseCommandLine(int argc, const char* const* argv) {
    argparse::ArgumentParser program("browser-mcp", kVersion,
                                     argparse::default_arguments::help);

    CliOptions options;

    program.add_argument("--headless")
        .help("Force headless mode for every browser launch")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--proxy")
        .help("Global proxy as JSON: {\"server\":..,\"bypass\":..,\"username\":..,\"password\":..}");
    program.add_argument("-c", "--config")
        .help("Path to YAML server config file");
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v info, -vv debug)")
        .action([&options](const auto&) { ++options.verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--log-json")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    // A trailing --proxy, or one followed by another flag, has no value.
    // It is dropped here and reported by the resolver.
    std::vector<std::string> args(argv, argv + argc);
    for (std::size_t i = 1; i < args.size();) {
        bool has_value = i + 1 < args.size() && !args[i + 1].empty() &&
                         args[i + 1][0] != '-';
        if (args[i] == "--proxy" && !has_value) {
            options.proxy_missing_value = true;
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i));
            continue;
        }
        ++i;
    }

    try {
        options.unknown_args = program.parse_known_args(args);
    } catch (const std::runtime_error& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    options.headless = program.get<bool>("--headless");
    if (auto val = program.present("--proxy")) {
        options.proxy_json = *val;
    }
    if (auto val = program.present("--config")) {
        options.config_file = *val;
    }
    options.log_json = program.get<bool>("--log-json");
    options.show_version = program.get<bool>("--version");

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// ParseProxySettings
// ---------------------------------------------------------------------------
Result<ProxySettings, Error> ParseProxySettings(std::string_view json_text,
                                                std::string_view source) {
    auto doc = nlohmann::json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return Result<ProxySettings, Error>::Err(MakeConfigError(
            "Failed to parse proxy configuration: invalid JSON", std::string(source)));
    }
    if (!doc.is_object()) {
        return Result<ProxySettings, Error>::Err(MakeConfigError(
            "Proxy configuration must be a JSON object", std::string(source)));
    }
    if (!doc.contains("server") || !doc["server"].is_string() ||
        doc["server"].get<std::string>().empty()) {
        return Result<ProxySettings, Error>::Err(MakeConfigError(
            "Proxy configuration requires a non-empty string 'server'",
            std::string(source)));
    }

    ProxySettings proxy;
    proxy.server = doc["server"].get<std::string>();

    auto bypass = OptionalProxyField(doc, "bypass", source);
    if (bypass.IsErr()) return Result<ProxySettings, Error>::Err(bypass.Error());
    auto username = OptionalProxyField(doc, "username", source);
    if (username.IsErr()) return Result<ProxySettings, Error>::Err(username.Error());
    auto password = OptionalProxyField(doc, "password", source);
    if (password.IsErr()) return Result<ProxySettings, Error>::Err(password.Error());

    proxy.bypass = std::move(bypass).Value();
    proxy.username = std::move(username).Value();
    proxy.password = std::move(password).Value();
    return Result<ProxySettings, Error>::Ok(std::move(proxy));
}

// ---------------------------------------------------------------------------
// ResolveLaunchConfig
// ---------------------------------------------------------------------------
GlobalLaunchConfig ResolveLaunchConfig(const CliOptions& cli,
                                       const EnvironmentSnapshot& env,
                                       std::vector<Error>& diagnostics) {
    GlobalLaunchConfig config;

    if (cli.headless) {
        config.headless = ConfigSetting<bool>::From(true, SettingSource::Cli);
    } else if (env.headless.has_value() && *env.headless == "true") {
        config.headless = ConfigSetting<bool>::From(true, SettingSource::Env);
    }

    if (cli.proxy_missing_value && !cli.proxy_json.has_value()) {
        diagnostics.push_back(MakeConfigError(
            "Missing value for --proxy; ignoring it", "--proxy"));
    }
    if (cli.proxy_json.has_value()) {
        auto parsed = ParseProxySettings(*cli.proxy_json, "--proxy");
        if (parsed.IsOk()) {
            config.proxy = ConfigSetting<ProxySettings>::From(
                std::move(parsed).Value(), SettingSource::Cli);
            return config;
        }
        diagnostics.push_back(std::move(parsed).Error());
    }
    if (env.proxy.has_value()) {
        auto parsed = ParseProxySettings(*env.proxy, kProxyEnvVar);
        if (parsed.IsOk()) {
            config.proxy = ConfigSetting<ProxySettings>::From(
                std::move(parsed).Value(), SettingSource::Env);
        } else {
            diagnostics.push_back(std::move(parsed).Error());
        }
    }
    return config;
}

// ---------------------------------------------------------------------------
// ReportLaunchConfig
// ---------------------------------------------------------------------------
void ReportLaunchConfig(const GlobalLaunchConfig& config,
                        const std::vector<Error>& diagnostics) {
    for (const auto& diagnostic : diagnostics) {
        LogWarn("config", diagnostic.ToString());
    }
    for (const auto& line : DescribeLaunchConfig(config)) {
        LogNotice("config", line);
    }
}

// ---------------------------------------------------------------------------
// DescribeLaunchConfig
// ---------------------------------------------------------------------------
std::vector<std::string> DescribeLaunchConfig(const GlobalLaunchConfig& config) {
    std::vector<std::string> lines;

    if (config.headless.IsSet() && *config.headless.value) {
        lines.push_back(std::string("Starting in headless mode (") +
                        (config.headless.FromCli()
                             ? "--headless flag"
                             : std::string(kHeadlessEnvVar) + " environment variable") +
                        ")");
    }

    if (config.proxy.IsSet()) {
        const auto& proxy = *config.proxy.value;
        std::string line = "Starting with proxy: " + RedactServer(proxy.server);
        if (proxy.username.has_value()) {
            line += " (authenticated)";
        }
        if (proxy.bypass.has_value()) {
            line += " (bypass: " + *proxy.bypass + ")";
        }
        line += config.proxy.FromCli()
                    ? " (--proxy flag)"
                    : " (" + std::string(kProxyEnvVar) + " environment variable)";
        lines.push_back(std::move(line));
    }

    if (lines.empty()) {
        lines.emplace_back(
            "No global headless or proxy configuration; per-call launch settings apply");
    }
    return lines;
}

// ---------------------------------------------------------------------------
// ResolveLaunchSettings
// ---------------------------------------------------------------------------
LaunchSettings ResolveLaunchSettings(const GlobalLaunchConfig& global,
                                     const PerCallLaunchArgs& per_call) {
    LaunchSettings settings;
    settings.engine = per_call.engine.value_or(BrowserEngine::Chromium);

    if (global.headless.IsSet()) {
        settings.headless = *global.headless.value;
    } else {
        settings.headless = per_call.headless.value_or(false);
    }

    if (global.proxy.IsSet()) {
        settings.proxy = global.proxy.value;
    } else {
        settings.proxy = per_call.proxy;
    }

    settings.width = per_call.width.value_or(settings.width);
    settings.height = per_call.height.value_or(settings.height);
    return settings;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(MakeConfigError(
            "Failed to parse YAML file: " + std::string(e.what()),
            std::string(file_path)));
    }

    ServerConfig config;

    try {
        // -- Drivers --
        if (root["drivers"]) {
            if (!root["drivers"].IsMap()) {
                return Result<ServerConfig, Error>::Err(
                    MakeConfigError("'drivers' must be a mapping", std::string(file_path)));
            }
            for (const auto& entry : root["drivers"]) {
                auto name = entry.first.as<std::string>();
                auto engine = ParseBrowserEngine(name);
                if (engine.IsErr()) {
                    return Result<ServerConfig, Error>::Err(
                        MakeConfigError("drivers: " + engine.Error(), std::string(file_path)));
                }
                DriverConfig driver;
                if (entry.second["executable"]) {
                    driver.executable = entry.second["executable"].as<std::string>();
                }
                if (entry.second["url"]) {
                    driver.url = entry.second["url"].as<std::string>();
                }
                config.drivers[engine.Value()] = std::move(driver);
            }
        }

        // -- Timeouts --
        if (root["timeouts"]) {
            const auto& timeouts = root["timeouts"];
            const std::pair<const char*, std::chrono::milliseconds*> fields[] = {
                {"launch_ms", &config.timeouts.launch},
                {"command_ms", &config.timeouts.command},
                {"http_ms", &config.timeouts.http},
            };
            for (const auto& [key, target] : fields) {
                if (!timeouts[key]) continue;
                auto millis = ParseMillis(timeouts[key], key);
                if (millis.IsErr()) {
                    return Result<ServerConfig, Error>::Err(millis.Error());
                }
                *target = millis.Value();
            }
        }

        if (root["downloads_dir"]) {
            config.downloads_dir = root["downloads_dir"].as<std::string>();
        }

        // -- Log --
        if (root["log"]) {
            const auto& log = root["log"];
            if (log["level"]) {
                auto text = log["level"].as<std::string>();
                auto level = ParseLogLevel(text);
                if (!level.has_value()) {
                    return Result<ServerConfig, Error>::Err(MakeConfigError(
                        "Unknown log level '" + text + "'", std::string(file_path)));
                }
                config.log.level = *level;
            }
            if (log["json"]) {
                config.log.json = log["json"].as<bool>();
            }
            if (log["file"]) {
                config.log.file = log["file"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(MakeConfigError(
            "Invalid value in YAML file: " + std::string(e.what()),
            std::string(file_path)));
    }

    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ApplyCliOverrides
// ---------------------------------------------------------------------------
ServerConfig ApplyCliOverrides(ServerConfig config, const CliOptions& cli) {
    if (cli.verbosity >= 2) {
        config.log.level = LogLevel::Debug;
    } else if (cli.verbosity == 1) {
        config.log.level = LogLevel::Info;
    }
    if (cli.log_json) {
        config.log.json = true;
    }
    return config;
}

} // namespace browser_mcp
