#pragma once

#include <browser_mcp/core/result.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace browser_mcp {

// ---------------------------------------------------------------------------
// DriverProcess: a WebDriver server child process (chromedriver,
// geckodriver, WebKitWebDriver) listening on a loopback port.
// The process is terminated when the object is destroyed.
// ---------------------------------------------------------------------------
class DriverProcess {
public:
    // Spawn `executable` with a --port argument on a free loopback port.
    // Relative names are searched on PATH.
    static Result<std::unique_ptr<DriverProcess>, Error> Start(
        const std::string& executable,
        const std::vector<std::string>& extra_args = {});

    ~DriverProcess();

    DriverProcess(const DriverProcess&) = delete;
    DriverProcess& operator=(const DriverProcess&) = delete;
    DriverProcess(DriverProcess&&) = delete;
    DriverProcess& operator=(DriverProcess&&) = delete;

    [[nodiscard]] int Pid() const noexcept { return pid_; }
    [[nodiscard]] int Port() const noexcept { return port_; }
    [[nodiscard]] std::string Endpoint() const;

    [[nodiscard]] bool IsRunning();

    // SIGTERM, wait up to `grace`, then SIGKILL. Safe to call twice.
    void Stop(std::chrono::milliseconds grace = std::chrono::milliseconds(3000));

private:
    DriverProcess(int pid, int port, std::string executable);

    int pid_;
    int port_;
    std::string executable_;
};

// Resolve an executable name against PATH; absolute or relative paths
// containing '/' are returned as-is when executable.
Result<std::string, std::string> FindExecutable(const std::string& name);

// Ask the kernel for an unused loopback TCP port.
Result<int, std::string> FindFreePort();

} // namespace browser_mcp
