#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace strata_mcp {

using json = nlohmann::json;

/**
 * @brief Checks tool arguments against the JSON Schema subset used by tool descriptors
 *
 * Supported keywords: type, properties, required, enum, minLength,
 * minimum, items. A property schema without "type" accepts any value.
 * Null for an optional property counts as absent. Unknown arguments
 * are ignored.
 *
 * Failures throw ToolError with kind InvalidArgument naming the field.
 */
class SchemaValidator {
public:
    static void validate(const json& schema, const json& args);

private:
    static void validate_value(const std::string& field, const json& schema, const json& value);
    static bool matches_type(const std::string& type, const json& value);
    static std::string describe_type(const json& value);
};

} // namespace strata_mcp
