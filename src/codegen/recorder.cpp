#include <browser_mcp/codegen/recorder.hpp>

#include <browser_mcp/core/log.hpp>

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace browser_mcp {

namespace {

constexpr const char* kComponent = "codegen";

// Proxy passwords never reach a recorded session.
nlohmann::json RedactSecrets(const nlohmann::json& parameters) {
    auto copy = parameters;
    if (copy.is_object() && copy.contains("proxy") && copy["proxy"].is_object() &&
        copy["proxy"].contains("password")) {
        copy["proxy"]["password"] = "***";
    }
    return copy;
}

// Random RFC 4122 version 4 identifier.
std::string NewSessionId() {
    static std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(engine);
    uint64_t lo = dist(engine);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

Error MakeSessionNotFound(const std::string& operation, const std::string& id) {
    return Error{operation, id, std::nullopt,
                 "Codegen session not found: " + id, ErrorCategory::ValidationFailure};
}

} // anonymous namespace

Result<std::string, Error> CodegenRecorder::Start(CodegenOptions options) {
    if (options.output_path.empty()) {
        return Result<std::string, Error>::Err(Error{
            "StartCodegen", "", std::nullopt, "outputPath must not be empty",
            ErrorCategory::ValidationFailure});
    }
    CodegenSession session;
    session.id = NewSessionId();
    session.options = std::move(options);
    session.started_at = std::chrono::system_clock::now();

    auto id = session.id;
    sessions_.emplace(id, std::move(session));
    active_ = id;
    LogInfo(kComponent, "Started codegen session " + id);
    return Result<std::string, Error>::Ok(id);
}

Result<const CodegenSession*, Error> CodegenRecorder::Get(const std::string& id) const {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Result<const CodegenSession*, Error>::Err(MakeSessionNotFound("GetCodegen", id));
    }
    return Result<const CodegenSession*, Error>::Ok(&it->second);
}

Result<CodegenSession, Error> CodegenRecorder::End(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Result<CodegenSession, Error>::Err(MakeSessionNotFound("EndCodegen", id));
    }
    auto session = std::move(it->second);
    sessions_.erase(it);
    if (active_ == id) {
        active_.reset();
    }
    LogInfo(kComponent, "Ended codegen session " + id + " with " +
                            std::to_string(session.actions.size()) + " actions");
    return Result<CodegenSession, Error>::Ok(std::move(session));
}

Result<void, Error> CodegenRecorder::Clear(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Result<void, Error>::Err(MakeSessionNotFound("ClearCodegen", id));
    }
    sessions_.erase(it);
    if (active_ == id) {
        active_.reset();
    }
    return Result<void, Error>::Ok();
}

void CodegenRecorder::Record(const std::string& tool_name, const nlohmann::json& parameters) {
    if (!active_.has_value()) {
        return;
    }
    auto it = sessions_.find(*active_);
    if (it == sessions_.end()) {
        return;
    }
    it->second.actions.push_back(
        RecordedAction{tool_name, RedactSecrets(parameters), std::chrono::system_clock::now()});
    LogDebug(kComponent, "Recorded " + tool_name);
}

} // namespace browser_mcp
