#pragma once

#include "core/StorageEngine.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata_mcp {

using json = nlohmann::json;

/**
 * @brief Accessors for arguments that already passed schema validation
 */
namespace args {

/**
 * @brief Required string argument
 * @throws ToolError (InvalidArgument) when absent or not a string
 */
std::string required_string(const json& args, const std::string& name);

/**
 * @brief Optional string; null counts as absent
 */
std::optional<std::string> optional_string(const json& args, const std::string& name);

std::optional<uint64_t> optional_u64(const json& args, const std::string& name);

std::vector<std::string> string_list(const json& args, const std::string& name);

/**
 * @brief Reject an as_of timestamp outside the branch's recorded range
 * @throws ToolError (InvalidArgument, field "as_of")
 */
void require_in_time_range(StorageEngine& engine, const std::string& branch, uint64_t as_of);

/**
 * @brief Nested field addressed by a JSONPath such as "$.settings.theme"
 */
struct JsonPath {
    std::string text = "$";
    std::vector<std::string> fields;  // empty for the whole document

    bool is_root() const { return fields.empty(); }
    json::json_pointer pointer() const;
};

/**
 * @brief Parse an optional JSONPath argument; absent means the whole document
 *
 * Only "$" and dotted member paths ("$.a.b") are supported.
 * @throws ToolError (InvalidArgument, field @p name) for any other syntax
 */
JsonPath json_path(const json& args, const std::string& name);

} // namespace args

} // namespace strata_mcp
