#pragma once

#include <browser_mcp/core/log.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace browser_mcp {

// ---------------------------------------------------------------------------
// SettingSource: where a resolved global setting came from.
// ---------------------------------------------------------------------------
enum class SettingSource {
    Unset,
    Cli,
    Env,
};

// ---------------------------------------------------------------------------
// ConfigSetting<T>: a process-wide setting resolved once at startup.
// An unset setting means per-call arguments decide.
// ---------------------------------------------------------------------------
template <typename T>
struct ConfigSetting {
    std::optional<T> value;
    SettingSource source = SettingSource::Unset;

    static ConfigSetting Unset() { return {}; }
    static ConfigSetting From(T v, SettingSource s) { return {std::move(v), s}; }

    [[nodiscard]] bool IsSet() const noexcept { return value.has_value(); }
    [[nodiscard]] bool FromCli() const noexcept { return source == SettingSource::Cli; }
    [[nodiscard]] bool FromEnv() const noexcept { return source == SettingSource::Env; }
};

struct ProxySettings {
    std::string server;
    std::optional<std::string> bypass;
    std::optional<std::string> username;
    std::optional<std::string> password;

    bool operator==(const ProxySettings& other) const {
        return server == other.server && bypass == other.bypass &&
               username == other.username && password == other.password;
    }
    bool operator!=(const ProxySettings& other) const { return !(*this == other); }
};

// Global launch configuration: the CLI/environment half of the launch
// settings precedence chain. Immutable after startup.
struct GlobalLaunchConfig {
    ConfigSetting<bool> headless;
    ConfigSetting<ProxySettings> proxy;
};

enum class BrowserEngine {
    Chromium,
    Firefox,
    Webkit,
};

// ---------------------------------------------------------------------------
// LaunchSettings: fully resolved parameters for one browser launch.
// ---------------------------------------------------------------------------
struct LaunchSettings {
    BrowserEngine engine = BrowserEngine::Chromium;
    bool headless = false;
    std::optional<ProxySettings> proxy;
    int width = 1280;
    int height = 720;

    bool operator==(const LaunchSettings& other) const {
        return engine == other.engine && headless == other.headless &&
               proxy == other.proxy && width == other.width &&
               height == other.height;
    }
    bool operator!=(const LaunchSettings& other) const { return !(*this == other); }
};

// Launch-relevant arguments of a single tool call, before precedence.
struct PerCallLaunchArgs {
    std::optional<BrowserEngine> engine;
    std::optional<bool> headless;
    std::optional<ProxySettings> proxy;
    std::optional<int> width;
    std::optional<int> height;
};

// How to reach the WebDriver server for one engine: either a running
// endpoint (url) or an executable to spawn. Neither set means the default
// driver binary is searched on PATH.
struct DriverConfig {
    std::optional<std::string> executable;
    std::optional<std::string> url;
};

struct TimeoutConfig {
    std::chrono::milliseconds launch{20000};
    std::chrono::milliseconds command{60000};
    std::chrono::milliseconds http{30000};
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool json = false;
    std::optional<std::string> file;
};

// Server settings from the optional YAML file and CLI logging flags.
struct ServerConfig {
    std::map<BrowserEngine, DriverConfig> drivers;
    TimeoutConfig timeouts;
    std::string downloads_dir;
    LogConfig log;
};

struct AppConfig {
    GlobalLaunchConfig launch;
    ServerConfig server;
};

} // namespace browser_mcp
