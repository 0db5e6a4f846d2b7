#pragma once

#include <browser_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace browser_mcp {

// Decode standard base64 (RFC 4648 alphabet). Line breaks are skipped;
// any other character outside the alphabet is an error.
Result<std::string, std::string> Base64Decode(std::string_view encoded);

} // namespace browser_mcp
