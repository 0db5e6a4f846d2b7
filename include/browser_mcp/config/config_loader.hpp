#pragma once

#include <browser_mcp/config/app_config.hpp>
#include <browser_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace browser_mcp {

inline constexpr const char* kHeadlessEnvVar = "PLAYWRIGHT_HEADLESS";
inline constexpr const char* kProxyEnvVar = "PLAYWRIGHT_PROXY";

// Raw command-line inputs, before precedence is applied.
struct CliOptions {
    bool headless = false;
    std::optional<std::string> proxy_json;
    bool proxy_missing_value = false;   // --proxy given with nothing after it
    std::optional<std::string> config_file;
    int verbosity = 0;              // -v: info, -vv: debug
    bool log_json = false;
    bool show_version = false;
    std::vector<std::string> unknown_args;
};

// Snapshot of the environment variables the resolver reads.
struct EnvironmentSnapshot {
    std::optional<std::string> headless;
    std::optional<std::string> proxy;

    static EnvironmentSnapshot Capture();
};

// Parse argv. Unknown arguments are collected, not rejected.
Result<CliOptions, Error> ParseCommandLine(int argc, const char* const* argv);

// Parse a proxy JSON object ({server, bypass?, username?, password?}).
// `source` names the origin in error messages.
Result<ProxySettings, Error> ParseProxySettings(std::string_view json_text,
                                                std::string_view source);

// Apply CLI > environment > unset. Malformed values are appended to
// `diagnostics` as ConfigParseFailure and treated as absent.
GlobalLaunchConfig ResolveLaunchConfig(const CliOptions& cli,
                                       const EnvironmentSnapshot& env,
                                       std::vector<Error>& diagnostics);

// Log resolver diagnostics at WARN and the startup lines as notices, so
// they appear at the default log level.
void ReportLaunchConfig(const GlobalLaunchConfig& config,
                        const std::vector<Error>& diagnostics);

// Human-readable startup lines. Never contains proxy credentials.
std::vector<std::string> DescribeLaunchConfig(const GlobalLaunchConfig& config);

// Effective launch settings for one call: global headless/proxy win over
// per-call values; engine defaults to chromium, viewport to 1280x720.
LaunchSettings ResolveLaunchSettings(const GlobalLaunchConfig& global,
                                     const PerCallLaunchArgs& per_call);

// Load server settings from a YAML file.
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path);

// CLI logging flags override the YAML log section.
ServerConfig ApplyCliOverrides(ServerConfig config, const CliOptions& cli);

Result<BrowserEngine, std::string> ParseBrowserEngine(std::string_view name);
const char* EngineName(BrowserEngine engine);

} // namespace browser_mcp
