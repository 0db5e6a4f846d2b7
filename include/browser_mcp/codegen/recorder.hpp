#pragma once

#include <browser_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace browser_mcp {

struct CodegenOptions {
    std::string output_path;
    std::string test_name_prefix = "GeneratedTest";
    bool include_comments = true;
};

struct RecordedAction {
    std::string tool_name;
    nlohmann::json parameters;
    std::chrono::system_clock::time_point timestamp;
};

struct CodegenSession {
    std::string id;
    CodegenOptions options;
    std::chrono::system_clock::time_point started_at;
    std::vector<RecordedAction> actions;
};

// ---------------------------------------------------------------------------
// CodegenRecorder: code generation sessions. Browser tool calls are
// recorded into the most recently started session that is still open.
// ---------------------------------------------------------------------------
class CodegenRecorder {
public:
    // Returns the new session id.
    [[nodiscard]] Result<std::string, Error> Start(CodegenOptions options);

    [[nodiscard]] Result<const CodegenSession*, Error> Get(const std::string& id) const;

    // Remove the session and return it (for test generation).
    [[nodiscard]] Result<CodegenSession, Error> End(const std::string& id);

    // Remove the session without generating anything.
    [[nodiscard]] Result<void, Error> Clear(const std::string& id);

    // Append an action to the active session; no-op without one.
    void Record(const std::string& tool_name, const nlohmann::json& parameters);

    [[nodiscard]] std::optional<std::string> ActiveSessionId() const { return active_; }

private:
    std::map<std::string, CodegenSession> sessions_;
    std::optional<std::string> active_;
};

} // namespace browser_mcp
