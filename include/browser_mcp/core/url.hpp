#pragma once

#include <browser_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace browser_mcp {

// Absolute http(s) URL split into the parts cpp-httplib wants: the
// scheme://host:port origin for the client and the path+query for the call.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string path;     // always starts with '/', includes the query

    [[nodiscard]] std::string Origin() const;
};

Result<UrlParts, std::string> ParseUrl(std::string_view url);

// Playwright-style URL glob: '*' matches within a path segment, '**' matches
// across segments, '?' matches one character. A pattern without wildcards
// matches as a substring of the URL.
bool UrlMatchesGlob(std::string_view url, std::string_view pattern);

} // namespace browser_mcp
