#include <browser_mcp/mcp/tool_handlers.hpp>

#include <browser_mcp/core/log.hpp>
#include <browser_mcp/core/text.hpp>
#include <browser_mcp/http/api_client.hpp>
#include <browser_mcp/mcp/tool_arguments.hpp>
#include <browser_mcp/session/execution_context.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace browser_mcp {

namespace {

using ToolResult = Result<ToolResponse, Error>;

constexpr const char* kComponent = "http";

// Builds the request for one api_* call. The bearer token and the JSON
// content type are added only when the caller did not set them.
HttpRequest BuildRequest(HttpMethod method, const ApiRequestArgs& args) {
    HttpRequest request;
    request.method = method;
    request.url = args.url;
    request.headers = args.headers;

    if (args.token.has_value() && !args.token->empty() &&
        request.headers.count("Authorization") == 0) {
        request.headers["Authorization"] = "Bearer " + *args.token;
    }
    if (args.value.has_value()) {
        request.body = *args.value;
        request.content_type = LooksLikeJson(request.body) ? "application/json" : "text/plain";
    }
    return request;
}

std::string FormatResult(HttpMethod method, const std::string& url,
                         const HttpResponse& response) {
    std::string head = "Performed " + std::string(MethodName(method)) + " Operation " + url +
                       "\nResponse body: ";
    std::string tail = "\nResponse code " + std::to_string(response.status_code);

    // The status line must survive truncation of a large body.
    auto reserved = Utf8Length(head) + Utf8Length(tail) + Utf8Length(kTruncationMarker);
    auto budget = kAbsoluteMaxLength > reserved ? kAbsoluteMaxLength - reserved : 0;
    return head + TruncateText(response.body, static_cast<long long>(budget)) + tail;
}

ToolResult HandleApiCall(HttpMethod method, bool requires_body,
                         const nlohmann::json& args, ExecutionContext& context) {
    auto parsed = ParseApiRequestArgs(args, requires_body);
    if (parsed.IsErr()) return ToolResult::Err(parsed.Error());

    auto request = BuildRequest(method, parsed.Value());
    if (GlobalLogger().Enabled(LogLevel::Debug)) {
        std::string headers;
        for (const auto& [name, value] : RedactHeaders(request.headers)) {
            headers += " " + name + "=" + value;
        }
        LogDebug(kComponent, std::string(MethodName(method)) + " " + request.url +
                                 (headers.empty() ? "" : " headers:" + headers));
    }

    auto response = context.EnsureApiClient().Send(request);
    if (response.IsErr()) return ToolResult::Err(response.Error());
    return ToolResult::Ok(BuildSuccess(FormatResult(method, request.url, response.Value())));
}

nlohmann::json HeadersProp() {
    return {{"type", "object"},
            {"description", "Additional request headers"},
            {"additionalProperties", {{"type", "string"}}}};
}

nlohmann::json BodySchema(const std::string& verb) {
    return MakeSchema(
        {{"url", StringProp("URL to send the " + verb + " request to")},
         {"value", StringProp("Request body; JSON is sent as application/json")},
         {"token", StringProp("Bearer token for the Authorization header")},
         {"headers", HeadersProp()}},
        nlohmann::json::array({"url", "value"}));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterApiTools
// ---------------------------------------------------------------------------
Result<void, Error> RegisterApiTools(ToolRegistry& registry) {
    auto status = Result<void, Error>::Ok();
    auto add = [&registry, &status](std::string name, std::string description,
                                    nlohmann::json schema, HttpMethod method,
                                    bool requires_body) {
        if (status.IsErr()) return;
        status = registry.Register(
            ToolDescriptor{std::move(name), std::move(description), std::move(schema),
                           ToolCategory::Http, false},
            [method, requires_body](const nlohmann::json& args, ExecutionContext& context) {
                return HandleApiCall(method, requires_body, args, context);
            });
    };

    add("api_get", "Perform an HTTP GET request.",
        MakeSchema({{"url", StringProp("URL to send the GET request to")},
                    {"token", StringProp("Bearer token for the Authorization header")},
                    {"headers", HeadersProp()}},
                   nlohmann::json::array({"url"})),
        HttpMethod::Get, false);
    add("api_post", "Perform an HTTP POST request.", BodySchema("POST"),
        HttpMethod::Post, true);
    add("api_put", "Perform an HTTP PUT request.", BodySchema("PUT"),
        HttpMethod::Put, true);
    add("api_patch", "Perform an HTTP PATCH request.", BodySchema("PATCH"),
        HttpMethod::Patch, true);
    add("api_delete", "Perform an HTTP DELETE request.",
        MakeSchema({{"url", StringProp("URL to send the DELETE request to")},
                    {"token", StringProp("Bearer token for the Authorization header")},
                    {"headers", HeadersProp()}},
                   nlohmann::json::array({"url"})),
        HttpMethod::Delete, false);

    return status;
}

Result<void, Error> RegisterAllTools(ToolRegistry& registry, CodegenRecorder& recorder) {
    auto browser = RegisterBrowserTools(registry);
    if (browser.IsErr()) return browser;
    auto api = RegisterApiTools(registry);
    if (api.IsErr()) return api;
    return RegisterCodegenTools(registry, recorder);
}

} // namespace browser_mcp
