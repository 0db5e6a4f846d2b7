#include <browser_mcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace browser_mcp {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool UseColorForLogs() {
    return IsStderrTty() && !NoColorEnvSet();
}

} // namespace browser_mcp
