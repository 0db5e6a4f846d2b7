#include <browser_mcp/mcp/tool_response.hpp>

#include <browser_mcp/core/text.hpp>

#include <algorithm>

namespace browser_mcp {

nlohmann::json ContentBlock::ToJson() const {
    if (type == Type::Image) {
        return {{"type", "image"}, {"data", data}, {"mimeType", mime_type}};
    }
    return {{"type", "text"}, {"text", text}};
}

std::string ToolResponse::Text() const {
    std::string joined;
    bool first = true;
    for (const auto& block : content_) {
        if (block.type != ContentBlock::Type::Text) continue;
        if (!first) joined += '\n';
        joined += block.text;
        first = false;
    }
    return joined;
}

nlohmann::json ToolResponse::ToJson() const {
    nlohmann::json content = nlohmann::json::array();
    for (const auto& block : content_) {
        content.push_back(block.ToJson());
    }
    return {{"content", content}, {"isError", is_error_}};
}

size_t EffectiveMaxLength(std::optional<long long> requested_max) {
    if (!requested_max.has_value()) {
        return kAbsoluteMaxLength;
    }
    if (*requested_max <= 0) {
        return 0;
    }
    return std::min(static_cast<size_t>(*requested_max), kAbsoluteMaxLength);
}

std::string TruncateText(std::string_view text, std::optional<long long> requested_max) {
    auto clean = SanitizeUtf8(text);
    auto limit = EffectiveMaxLength(requested_max);
    auto kept = Utf8Prefix(clean, limit);
    if (kept.size() == clean.size()) {
        return clean;
    }
    return std::string(kept) + kTruncationMarker;
}

ToolResponse BuildSuccess(std::string_view text, std::optional<long long> requested_max) {
    ToolResponse response;
    ContentBlock block;
    block.text = TruncateText(text, requested_max);
    response.content_.push_back(std::move(block));
    return response;
}

ToolResponse BuildSuccess(const std::vector<std::string>& texts,
                          std::optional<long long> requested_max) {
    std::string joined;
    for (size_t i = 0; i < texts.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += texts[i];
    }
    return BuildSuccess(std::string_view(joined), requested_max);
}

ToolResponse BuildImage(std::string_view text, std::string base64_png) {
    ToolResponse response;
    ContentBlock caption;
    caption.text = TruncateText(text);
    response.content_.push_back(std::move(caption));

    ContentBlock image;
    image.type = ContentBlock::Type::Image;
    image.data = std::move(base64_png);
    image.mime_type = "image/png";
    response.content_.push_back(std::move(image));
    return response;
}

ToolResponse BuildError(ErrorCategory category, std::string_view message) {
    Error tagged;
    tagged.category = category;

    ToolResponse response;
    response.is_error_ = true;
    ContentBlock block;
    block.text = TruncateText(tagged.CategoryName() + ": " + std::string(message));
    response.content_.push_back(std::move(block));
    return response;
}

ToolResponse BuildError(const Error& error) {
    if (error.operation.empty()) {
        return BuildError(error.category, error.message);
    }
    return BuildError(error.category, error.ToString());
}

} // namespace browser_mcp
