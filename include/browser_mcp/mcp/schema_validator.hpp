#pragma once

#include <browser_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace browser_mcp {

// Check `args` against the subset of JSON Schema the tool catalog uses:
// object type, required properties, property types (string, integer,
// number, boolean, object, array), enum values and nested object schemas.
// Unknown properties are allowed. Failures are ValidationFailure errors
// naming the offending property path.
Result<void, Error> ValidateArguments(const nlohmann::json& schema,
                                      const nlohmann::json& args,
                                      std::string_view tool_name = "");

} // namespace browser_mcp
