#include "SchemaValidator.hpp"
#include "ToolError.hpp"
#include <algorithm>

namespace strata_mcp {

void SchemaValidator::validate(const json& schema, const json& args) {
    if (!args.is_object()) {
        throw ToolError::invalid_argument("arguments", "expected object, got " + describe_type(args));
    }

    if (schema.contains("required")) {
        for (const auto& name : schema["required"]) {
            const auto& field = name.get_ref<const std::string&>();
            if (!args.contains(field)) {
                throw ToolError::missing_argument(field);
            }
        }
    }

    if (!schema.contains("properties")) {
        return;
    }

    const json& required = schema.value("required", json::array());
    for (const auto& [field, property] : schema["properties"].items()) {
        auto it = args.find(field);
        if (it == args.end()) {
            continue;
        }
        bool is_required = std::find(required.begin(), required.end(), field) != required.end();
        if (it->is_null() && !is_required) {
            continue;
        }
        validate_value(field, property, *it);
    }
}

void SchemaValidator::validate_value(const std::string& field, const json& schema, const json& value) {
    if (schema.contains("type")) {
        const auto& type = schema["type"].get_ref<const std::string&>();
        if (!matches_type(type, value)) {
            throw ToolError::invalid_argument(field, "expected " + type + ", got " + describe_type(value));
        }
    }

    if (schema.contains("enum")) {
        const json& allowed = schema["enum"];
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
            throw ToolError::invalid_argument(field, "must be one of " + allowed.dump());
        }
    }

    if (schema.contains("minLength") && value.is_string()) {
        auto min_length = schema["minLength"].get<std::size_t>();
        if (value.get_ref<const std::string&>().size() < min_length) {
            throw ToolError::invalid_argument(field, min_length == 1
                ? std::string("must not be empty")
                : "must be at least " + std::to_string(min_length) + " characters");
        }
    }

    if (schema.contains("minimum") && value.is_number()) {
        if (value.get<double>() < schema["minimum"].get<double>()) {
            throw ToolError::invalid_argument(field, "must be >= " + schema["minimum"].dump());
        }
    }

    if (schema.contains("items") && value.is_array()) {
        for (const auto& item : value) {
            validate_value(field, schema["items"], item);
        }
    }
}

bool SchemaValidator::matches_type(const std::string& type, const json& value) {
    if (type == "string") {
        return value.is_string();
    }
    if (type == "integer") {
        return value.is_number_integer();
    }
    if (type == "number") {
        return value.is_number();
    }
    if (type == "boolean") {
        return value.is_boolean();
    }
    if (type == "array") {
        return value.is_array();
    }
    if (type == "object") {
        return value.is_object();
    }
    if (type == "null") {
        return value.is_null();
    }
    return false;
}

std::string SchemaValidator::describe_type(const json& value) {
    if (value.is_number_integer()) {
        return "integer";
    }
    return value.type_name();
}

} // namespace strata_mcp
