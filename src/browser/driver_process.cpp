#include <browser_mcp/browser/driver_process.hpp>

#include <browser_mcp/core/log.hpp>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <signal.h>
#include <spawn.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

extern char** environ;

namespace browser_mcp {

namespace {

constexpr const char* kComponent = "driver";

Error MakeLaunchError(const std::string& target, const std::string& message) {
    return Error{"DriverProcess", target, std::nullopt, message,
                 ErrorCategory::LaunchFailure};
}

} // anonymous namespace

Result<std::string, std::string> FindExecutable(const std::string& name) {
    if (name.empty()) {
        return Result<std::string, std::string>::Err("Empty executable name");
    }
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            return Result<std::string, std::string>::Ok(name);
        }
        return Result<std::string, std::string>::Err(
            "Not an executable file: " + name);
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        auto colon = path.find(':', start);
        auto dir = path.substr(start, colon == std::string::npos ? std::string::npos
                                                                 : colon - start);
        if (!dir.empty()) {
            auto candidate = dir + "/" + name;
            if (access(candidate.c_str(), X_OK) == 0) {
                return Result<std::string, std::string>::Ok(candidate);
            }
        }
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return Result<std::string, std::string>::Err(name + " not found on PATH");
}

Result<int, std::string> FindFreePort() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return Result<int, std::string>::Err(
            "socket() failed: " + std::string(std::strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        auto message = std::string(std::strerror(errno));
        close(fd);
        return Result<int, std::string>::Err("bind() failed: " + message);
    }
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        auto message = std::string(std::strerror(errno));
        close(fd);
        return Result<int, std::string>::Err("getsockname() failed: " + message);
    }
    int port = ntohs(addr.sin_port);
    close(fd);
    return Result<int, std::string>::Ok(port);
}

Result<std::unique_ptr<DriverProcess>, Error> DriverProcess::Start(
    const std::string& executable, const std::vector<std::string>& extra_args) {
    auto resolved = FindExecutable(executable);
    if (resolved.IsErr()) {
        return Result<std::unique_ptr<DriverProcess>, Error>::Err(
            MakeLaunchError(executable, resolved.Error()));
    }
    auto port = FindFreePort();
    if (port.IsErr()) {
        return Result<std::unique_ptr<DriverProcess>, Error>::Err(
            MakeLaunchError(executable, port.Error()));
    }

    std::vector<std::string> argv_strings;
    argv_strings.push_back(resolved.Value());
    argv_strings.push_back("--port=" + std::to_string(port.Value()));
    for (const auto& arg : extra_args) {
        argv_strings.push_back(arg);
    }
    std::vector<char*> argv_pointers;
    for (auto& arg : argv_strings) {
        argv_pointers.push_back(arg.data());
    }
    argv_pointers.push_back(nullptr);

    // The driver inherits stdin/stdout otherwise; stdout carries MCP traffic.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, STDERR_FILENO, STDOUT_FILENO);

    pid_t child = 0;
    int status = posix_spawn(&child, resolved.Value().c_str(), &actions, nullptr,
                             argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (status != 0) {
        return Result<std::unique_ptr<DriverProcess>, Error>::Err(MakeLaunchError(
            resolved.Value(), "posix_spawn failed: " + std::string(std::strerror(status))));
    }

    LogInfo(kComponent, "Started " + resolved.Value() + " (pid " +
                            std::to_string(child) + ", port " +
                            std::to_string(port.Value()) + ")");
    return Result<std::unique_ptr<DriverProcess>, Error>::Ok(
        std::unique_ptr<DriverProcess>(
            new DriverProcess(static_cast<int>(child), port.Value(), resolved.Value())));
}

DriverProcess::DriverProcess(int pid, int port, std::string executable)
    : pid_(pid), port_(port), executable_(std::move(executable)) {}

DriverProcess::~DriverProcess() {
    Stop();
}

std::string DriverProcess::Endpoint() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}

bool DriverProcess::IsRunning() {
    if (pid_ <= 0) return false;
    int status = 0;
    auto rc = waitpid(static_cast<pid_t>(pid_), &status, WNOHANG);
    if (rc == 0) return true;
    pid_ = 0;
    return false;
}

void DriverProcess::Stop(std::chrono::milliseconds grace) {
    if (pid_ <= 0) return;
    auto pid = static_cast<pid_t>(pid_);

    if (kill(pid, SIGTERM) != 0 && errno == ESRCH) {
        waitpid(pid, nullptr, WNOHANG);
        pid_ = 0;
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (waitpid(pid, nullptr, WNOHANG) == pid) {
            LogDebug(kComponent, "Stopped " + executable_ + " (pid " + std::to_string(pid) + ")");
            pid_ = 0;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    LogWarn(kComponent, executable_ + " did not exit after SIGTERM; sending SIGKILL");
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    pid_ = 0;
}

} // namespace browser_mcp
