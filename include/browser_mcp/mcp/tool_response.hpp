#pragma once

#include <browser_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace browser_mcp {

// Hard cap on retained text per response, in code points.
inline constexpr size_t kAbsoluteMaxLength = 20000;

// Room long-text tools leave for their own prefixes.
inline constexpr size_t kPrefixHeadroom = 100;

inline constexpr const char* kTruncationMarker =
    "\n[Output truncated due to size limits - exceeded 20000 characters]";

// ---------------------------------------------------------------------------
// ContentBlock: one MCP content item.
// ---------------------------------------------------------------------------
struct ContentBlock {
    enum class Type {
        Text,
        Image,
    };

    Type type = Type::Text;
    std::string text;        // Text
    std::string data;        // Image: base64
    std::string mime_type;   // Image

    [[nodiscard]] nlohmann::json ToJson() const;
};

class ToolResponse;

ToolResponse BuildSuccess(std::string_view text,
                          std::optional<long long> requested_max = std::nullopt);
ToolResponse BuildSuccess(const std::vector<std::string>& texts,
                          std::optional<long long> requested_max = std::nullopt);
ToolResponse BuildImage(std::string_view text, std::string base64_png);
ToolResponse BuildError(const Error& error);
ToolResponse BuildError(ErrorCategory category, std::string_view message);

// ---------------------------------------------------------------------------
// ToolResponse: the result of one tool call. Only the Build* functions
// create one, so every response is size-bounded.
// ---------------------------------------------------------------------------
class ToolResponse {
public:
    [[nodiscard]] const std::vector<ContentBlock>& Content() const noexcept {
        return content_;
    }
    [[nodiscard]] bool IsError() const noexcept { return is_error_; }

    // All text blocks joined with '\n'.
    [[nodiscard]] std::string Text() const;

    // {"content":[...], "isError": bool}
    [[nodiscard]] nlohmann::json ToJson() const;

private:
    ToolResponse() = default;

    friend ToolResponse BuildSuccess(std::string_view, std::optional<long long>);
    friend ToolResponse BuildSuccess(const std::vector<std::string>&, std::optional<long long>);
    friend ToolResponse BuildImage(std::string_view, std::string);
    friend ToolResponse BuildError(ErrorCategory, std::string_view);

    std::vector<ContentBlock> content_;
    bool is_error_ = false;
};

// min(requested, 20000); absent means 20000, negative means 0.
size_t EffectiveMaxLength(std::optional<long long> requested_max);

// Sanitize to valid UTF-8 and keep at most EffectiveMaxLength code points,
// appending kTruncationMarker when anything was cut.
std::string TruncateText(std::string_view text,
                         std::optional<long long> requested_max = std::nullopt);

} // namespace browser_mcp
