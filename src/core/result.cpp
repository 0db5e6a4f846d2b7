#include <browser_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace browser_mcp {

namespace {

struct WebDriverFailure {
    std::string code;
    std::string message;
};

// Extract {"value":{"error":..,"message":..}} from a W3C WebDriver error
// body. Drivers append multi-line diagnostics (session info, stack traces)
// to the message; only the first line is kept.
std::optional<WebDriverFailure> ParseWebDriverFailure(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    if (!doc.contains("value") || !doc["value"].is_object()) return std::nullopt;

    const auto& value = doc["value"];
    if (!value.contains("error") || !value["error"].is_string()) return std::nullopt;

    WebDriverFailure failure;
    failure.code = value["error"].get<std::string>();
    if (value.contains("message") && value["message"].is_string()) {
        failure.message = value["message"].get<std::string>();
        auto newline = failure.message.find('\n');
        if (newline != std::string::npos) {
            failure.message.resize(newline);
        }
    }
    return failure;
}

ErrorCategory CategoryFromWebDriverCode(const std::string& code) {
    if (code == "timeout" || code == "script timeout") {
        return ErrorCategory::Timeout;
    }
    if (code == "session not created") {
        return ErrorCategory::LaunchFailure;
    }
    return ErrorCategory::UpstreamFailure;
}

} // anonymous namespace

Error Error::FromWebDriver(const std::string& operation,
                           const std::string& target,
                           int status_code,
                           const std::string& response_body) {
    auto failure = ParseWebDriverFailure(response_body);
    if (!failure.has_value()) {
        std::string message = "Unexpected WebDriver response";
        if (!response_body.empty()) {
            constexpr size_t kMaxBodyInMessage = 500;
            message += ": " + response_body.substr(0, kMaxBodyInMessage);
        }
        return Error{operation, target, status_code, message,
                     status_code == 408 ? ErrorCategory::Timeout
                                        : ErrorCategory::UpstreamFailure};
    }

    std::string message = failure->code;
    if (!failure->message.empty()) {
        message += ": " + failure->message;
    }
    return Error{operation, target, status_code, message,
                 CategoryFromWebDriverCode(failure->code)};
}

} // namespace browser_mcp
