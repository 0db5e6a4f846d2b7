#include <browser_mcp/browser/webdriver_browser.hpp>
#include <browser_mcp/codegen/recorder.hpp>
#include <browser_mcp/config/config_loader.hpp>
#include <browser_mcp/core/log.hpp>
#include <browser_mcp/core/terminal.hpp>
#include <browser_mcp/core/version.hpp>
#include <browser_mcp/http/api_client.hpp>
#include <browser_mcp/mcp/dispatcher.hpp>
#include <browser_mcp/mcp/mcp_server.hpp>
#include <browser_mcp/mcp/tool_handlers.hpp>
#include <browser_mcp/session/execution_context.hpp>

#include <atomic>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig = 2;
constexpr int kExitInternal = 99;

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int /*signal*/) {
    g_stop_requested.store(true);
}

// No SA_RESTART: the blocking stdin read returns so the loop can exit.
void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

std::string DefaultDownloadsDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return "";
    }
    return std::string(home) + "/Downloads";
}

// Logs go to stderr, or to the configured file; stdout carries MCP traffic.
bool InitLogging(const browser_mcp::LogConfig& log, std::ofstream& log_file) {
    using namespace browser_mcp;

    std::ostream* out = &std::cerr;
    bool use_color = UseColorForLogs();
    if (log.file.has_value()) {
        log_file.open(*log.file, std::ios::app);
        if (!log_file) {
            std::cerr << "Error: cannot open log file " << *log.file << "\n";
            return false;
        }
        out = &log_file;
        use_color = false;
    }

    if (log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(*out), log.level);
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color, *out), log.level);
    }
    return true;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace browser_mcp;

    auto cli_result = ParseCommandLine(argc, argv);
    if (cli_result.IsErr()) {
        std::cerr << "Error: " << cli_result.Error().message << "\n";
        return kExitConfig;
    }
    auto cli = std::move(cli_result).Value();

    if (cli.show_version) {
        std::cout << "browser-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    ServerConfig server_config;
    if (cli.config_file.has_value()) {
        auto yaml = LoadFromYaml(*cli.config_file);
        if (yaml.IsErr()) {
            std::cerr << "Error: " << yaml.Error().ToString() << "\n";
            return kExitConfig;
        }
        server_config = std::move(yaml).Value();
    }
    server_config = ApplyCliOverrides(std::move(server_config), cli);
    if (server_config.downloads_dir.empty()) {
        server_config.downloads_dir = DefaultDownloadsDir();
    }

    std::ofstream log_file;
    if (!InitLogging(server_config.log, log_file)) {
        return kExitConfig;
    }

    for (const auto& arg : cli.unknown_args) {
        LogWarn("config", "Ignoring unknown argument: " + arg);
    }

    // Resolved once; handlers never read argv or the environment.
    std::vector<Error> diagnostics;
    const auto launch_config =
        ResolveLaunchConfig(cli, EnvironmentSnapshot::Capture(), diagnostics);
    ReportLaunchConfig(launch_config, diagnostics);

    InstallSignalHandlers();

    WebDriverLauncherOptions launcher_options;
    launcher_options.drivers = server_config.drivers;
    launcher_options.launch_timeout = server_config.timeouts.launch;
    launcher_options.command_timeout = server_config.timeouts.command;
    WebDriverLauncher launcher(std::move(launcher_options));

    ApiClientOptions api_options;
    api_options.read_timeout = server_config.timeouts.http;
    ExecutionContextOptions context_options;
    context_options.downloads_dir = server_config.downloads_dir;
    ExecutionContext context(
        launcher,
        [api_options]() -> std::unique_ptr<IApiClient> {
            return std::make_unique<ApiClient>(api_options);
        },
        context_options);

    CodegenRecorder recorder;
    ToolRegistry registry;
    auto registered = RegisterAllTools(registry, recorder);
    if (registered.IsErr()) {
        LogError("mcp", registered.Error().ToString());
        return kExitInternal;
    }

    Dispatcher dispatcher(registry, launch_config, context, recorder);
    McpServer server(dispatcher, std::cin, std::cout, &g_stop_requested);
    LogInfo("mcp", "browser-mcp " + std::string(kVersion) + " serving " +
                       std::to_string(registry.Tools().size()) + " tools on stdio");
    server.Run();

    if (context.HasSession()) {
        auto closed = context.CloseSession();
        if (closed.IsErr()) {
            LogWarn("session", "Closing the browser failed: " + closed.Error().ToString());
        }
    }
    return kExitSuccess;
}
