#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace browser_mcp {

// Replace invalid UTF-8 sequences (stray continuation bytes, truncated or
// malformed multibyte sequences) with U+FFFD.
std::string SanitizeUtf8(std::string_view text);

// Number of code points in valid UTF-8 text.
size_t Utf8Length(std::string_view text);

// The first `count` code points of valid UTF-8 text (whole text if shorter).
std::string_view Utf8Prefix(std::string_view text, size_t count);

} // namespace browser_mcp
