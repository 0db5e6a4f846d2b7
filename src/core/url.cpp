#include <browser_mcp/core/url.hpp>

#include <algorithm>
#include <cctype>

namespace browser_mcp {

std::string UrlParts::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Result<UrlParts, std::string> ParseUrl(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<UrlParts, std::string>::Err(
            "URL must be absolute (scheme://host/...): " + std::string(url));
    }

    UrlParts parts;
    parts.scheme = std::string(url.substr(0, scheme_end));
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        return Result<UrlParts, std::string>::Err(
            "Unsupported URL scheme: " + parts.scheme);
    }

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?#");
    auto authority = rest.substr(0, path_start);
    if (path_start == std::string_view::npos) {
        parts.path = "/";
    } else {
        parts.path = std::string(rest.substr(path_start));
        auto fragment = parts.path.find('#');
        if (fragment != std::string::npos) {
            parts.path.resize(fragment);
        }
        if (parts.path.empty() || parts.path[0] != '/') {
            parts.path.insert(parts.path.begin(), '/');
        }
    }

    // Userinfo is not supported; credentials go through headers.
    if (authority.find('@') != std::string_view::npos) {
        return Result<UrlParts, std::string>::Err(
            "URL credentials are not supported; use the headers argument");
    }

    parts.port = parts.scheme == "https" ? 443 : 80;
    auto colon = authority.rfind(':');
    bool bracketed = !authority.empty() && authority.front() == '[';
    if (colon != std::string_view::npos &&
        (!bracketed || colon > authority.find(']'))) {
        auto port_text = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port_text.empty() || port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Result<UrlParts, std::string>::Err(
                "Invalid port in URL: " + std::string(port_text));
        }
        auto port = std::stoi(std::string(port_text));
        if (port <= 0 || port > 65535) {
            return Result<UrlParts, std::string>::Err(
                "Invalid port in URL: " + std::string(port_text));
        }
        parts.port = static_cast<uint16_t>(port);
    }
    if (authority.empty()) {
        return Result<UrlParts, std::string>::Err(
            "URL has no host: " + std::string(url));
    }
    parts.host = std::string(authority);
    return Result<UrlParts, std::string>::Ok(std::move(parts));
}

namespace {

bool GlobMatchAt(std::string_view text, std::string_view pattern) {
    if (pattern.empty()) return text.empty();

    if (pattern.substr(0, 2) == "**") {
        auto rest = pattern.substr(2);
        for (size_t i = 0; i <= text.size(); ++i) {
            if (GlobMatchAt(text.substr(i), rest)) return true;
        }
        return false;
    }
    if (pattern[0] == '*') {
        auto rest = pattern.substr(1);
        for (size_t i = 0; i <= text.size(); ++i) {
            if (GlobMatchAt(text.substr(i), rest)) return true;
            if (i < text.size() && text[i] == '/') break;
        }
        return false;
    }
    if (text.empty()) return false;
    if (pattern[0] == '?' || pattern[0] == text[0]) {
        return GlobMatchAt(text.substr(1), pattern.substr(1));
    }
    return false;
}

} // anonymous namespace

bool UrlMatchesGlob(std::string_view url, std::string_view pattern) {
    if (pattern.find_first_of("*?") == std::string_view::npos) {
        return url.find(pattern) != std::string_view::npos;
    }
    return GlobMatchAt(url, pattern);
}

} // namespace browser_mcp
