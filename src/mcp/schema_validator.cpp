#include <browser_mcp/mcp/schema_validator.hpp>

#include <cmath>
#include <string>

namespace browser_mcp {

namespace {

Error MakeValidationError(std::string_view tool_name, const std::string& message) {
    return Error{"ValidateArguments", std::string(tool_name), std::nullopt, message,
                 ErrorCategory::ValidationFailure};
}

bool MatchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        // 30000.0 is still an integer in JSON Schema.
        if (value.is_number_float()) {
            auto d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    if (type == "null") return value.is_null();
    return true;
}

std::string JoinPath(const std::string& prefix, const std::string& key) {
    return prefix.empty() ? key : prefix + "." + key;
}

Result<void, Error> ValidateValue(const nlohmann::json& schema,
                                  const nlohmann::json& value,
                                  const std::string& path,
                                  std::string_view tool_name);

Result<void, Error> ValidateObject(const nlohmann::json& schema,
                                   const nlohmann::json& value,
                                   const std::string& path,
                                   std::string_view tool_name) {
    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& key : schema["required"]) {
            if (!key.is_string()) continue;
            auto name = key.get<std::string>();
            if (!value.contains(name) || value[name].is_null()) {
                return Result<void, Error>::Err(MakeValidationError(
                    tool_name, "Missing required parameter: " + JoinPath(path, name)));
            }
        }
    }

    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return Result<void, Error>::Ok();
    }
    for (const auto& [name, prop_schema] : schema["properties"].items()) {
        if (!value.contains(name) || value[name].is_null()) continue;
        auto checked = ValidateValue(prop_schema, value[name], JoinPath(path, name), tool_name);
        if (checked.IsErr()) return checked;
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ValidateValue(const nlohmann::json& schema,
                                  const nlohmann::json& value,
                                  const std::string& path,
                                  std::string_view tool_name) {
    if (!schema.is_object()) {
        return Result<void, Error>::Ok();
    }

    if (schema.contains("type") && schema["type"].is_string()) {
        auto type = schema["type"].get<std::string>();
        if (!MatchesType(value, type)) {
            return Result<void, Error>::Err(MakeValidationError(
                tool_name, "Parameter '" + path + "' must be of type " + type +
                               ", got " + std::string(value.type_name())));
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& allowed : schema["enum"]) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return Result<void, Error>::Err(MakeValidationError(
                tool_name, "Parameter '" + path + "' must be one of " +
                               schema["enum"].dump() + ", got " + value.dump()));
        }
    }

    if (value.is_object()) {
        return ValidateObject(schema, value, path, tool_name);
    }
    if (value.is_array() && schema.contains("items")) {
        for (size_t i = 0; i < value.size(); ++i) {
            auto checked = ValidateValue(schema["items"], value[i],
                                         path + "[" + std::to_string(i) + "]", tool_name);
            if (checked.IsErr()) return checked;
        }
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

Result<void, Error> ValidateArguments(const nlohmann::json& schema,
                                      const nlohmann::json& args,
                                      std::string_view tool_name) {
    if (!args.is_object()) {
        return Result<void, Error>::Err(MakeValidationError(
            tool_name, "Arguments must be a JSON object, got " +
                           std::string(args.type_name())));
    }
    return ValidateObject(schema, args, "", tool_name);
}

} // namespace browser_mcp
