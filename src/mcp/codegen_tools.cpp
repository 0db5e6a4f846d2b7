#include <browser_mcp/mcp/tool_handlers.hpp>

#include <browser_mcp/codegen/test_generator.hpp>
#include <browser_mcp/mcp/tool_arguments.hpp>

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace browser_mcp {

namespace {

using ToolResult = Result<ToolResponse, Error>;

ToolResult MakeOkResult(const nlohmann::json& data) {
    return ToolResult::Ok(
        BuildSuccess(data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)));
}

std::string FormatTimestamp(std::chrono::system_clock::time_point when) {
    auto seconds = std::chrono::system_clock::to_time_t(when);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      when.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

nlohmann::json OptionsToJson(const CodegenOptions& options) {
    return {{"outputPath", options.output_path},
            {"testNamePrefix", options.test_name_prefix},
            {"includeComments", options.include_comments}};
}

// start_codegen_session
ToolResult HandleStart(const nlohmann::json& args, CodegenRecorder& recorder) {
    auto parsed = ParseStartCodegenArgs(args);
    if (parsed.IsErr()) return ToolResult::Err(parsed.Error());

    auto options = parsed.Value().options;
    auto id = recorder.Start(options);
    if (id.IsErr()) return ToolResult::Err(id.Error());

    return MakeOkResult({
        {"sessionId", id.Value()},
        {"options", OptionsToJson(options)},
        {"message", "Started codegen session. Browser actions are now recorded."},
    });
}

// end_codegen_session
ToolResult HandleEnd(const nlohmann::json& args, CodegenRecorder& recorder) {
    auto parsed = ParseCodegenSessionArgs(args);
    if (parsed.IsErr()) return ToolResult::Err(parsed.Error());

    auto session = recorder.End(parsed.Value().session_id);
    if (session.IsErr()) return ToolResult::Err(session.Error());

    auto test = WriteTestFile(session.Value(), std::chrono::system_clock::now());
    if (test.IsErr()) return ToolResult::Err(test.Error());

    const auto& generated = test.Value();
    return MakeOkResult({
        {"filePath", generated.file_path},
        {"testName", generated.test_name},
        {"actionCount", generated.action_count},
        {"testCode", generated.content},
        {"message", "Generated test file: " + generated.file_path},
    });
}

// get_codegen_session
ToolResult HandleGet(const nlohmann::json& args, const CodegenRecorder& recorder) {
    auto parsed = ParseCodegenSessionArgs(args);
    if (parsed.IsErr()) return ToolResult::Err(parsed.Error());

    auto session = recorder.Get(parsed.Value().session_id);
    if (session.IsErr()) return ToolResult::Err(session.Error());

    const auto& s = *session.Value();
    nlohmann::json actions = nlohmann::json::array();
    for (const auto& action : s.actions) {
        actions.push_back({{"toolName", action.tool_name},
                           {"parameters", action.parameters},
                           {"timestamp", FormatTimestamp(action.timestamp)}});
    }
    return MakeOkResult({
        {"id", s.id},
        {"startedAt", FormatTimestamp(s.started_at)},
        {"options", OptionsToJson(s.options)},
        {"actionCount", s.actions.size()},
        {"actions", actions},
    });
}

// clear_codegen_session
ToolResult HandleClear(const nlohmann::json& args, CodegenRecorder& recorder) {
    auto parsed = ParseCodegenSessionArgs(args);
    if (parsed.IsErr()) return ToolResult::Err(parsed.Error());

    auto cleared = recorder.Clear(parsed.Value().session_id);
    if (cleared.IsErr()) return ToolResult::Err(cleared.Error());
    return ToolResult::Ok(
        BuildSuccess("Cleared codegen session " + parsed.Value().session_id));
}

nlohmann::json SessionIdSchema() {
    return MakeSchema({{"sessionId", StringProp("ID of the codegen session")}},
                      nlohmann::json::array({"sessionId"}));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterCodegenTools
// ---------------------------------------------------------------------------
Result<void, Error> RegisterCodegenTools(ToolRegistry& registry, CodegenRecorder& recorder) {
    auto status = Result<void, Error>::Ok();
    auto add = [&registry, &status](std::string name, std::string description,
                                    nlohmann::json schema, ToolHandler handler) {
        if (status.IsErr()) return;
        status = registry.Register(
            ToolDescriptor{std::move(name), std::move(description), std::move(schema),
                           ToolCategory::Codegen, false},
            std::move(handler));
    };

    add("start_codegen_session",
        "Start recording browser actions for Playwright test generation.",
        MakeSchema(
            {{"options", ObjectProp(
                             "Code generation options",
                             {{"outputPath", StringProp("Directory for the generated test")},
                              {"testNamePrefix", StringProp("Test name prefix (default: "
                                                            "GeneratedTest)")},
                              {"includeComments", BoolProp("Add a comment per action "
                                                           "(default: true)")}},
                             nlohmann::json::array({"outputPath"}))}},
            nlohmann::json::array({"options"})),
        [&recorder](const nlohmann::json& args, ExecutionContext&) {
            return HandleStart(args, recorder);
        });

    add("end_codegen_session",
        "Stop recording and write the generated Playwright test file.",
        SessionIdSchema(),
        [&recorder](const nlohmann::json& args, ExecutionContext&) {
            return HandleEnd(args, recorder);
        });

    add("get_codegen_session",
        "Show the actions recorded in a codegen session.",
        SessionIdSchema(),
        [&recorder](const nlohmann::json& args, ExecutionContext&) {
            return HandleGet(args, recorder);
        });

    add("clear_codegen_session",
        "Discard a codegen session without generating a test.",
        SessionIdSchema(),
        [&recorder](const nlohmann::json& args, ExecutionContext&) {
            return HandleClear(args, recorder);
        });

    return status;
}

} // namespace browser_mcp
