#include "ToolArgs.hpp"
#include "mcp/ToolError.hpp"

namespace strata_mcp::args {

std::string required_string(const json& args, const std::string& name) {
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        throw ToolError::missing_argument(name);
    }
    if (!it->is_string()) {
        throw ToolError::invalid_argument(name, "expected string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& args, const std::string& name) {
    auto it = args.find(name);
    if (it == args.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<uint64_t> optional_u64(const json& args, const std::string& name) {
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        return static_cast<uint64_t>(it->get<int64_t>());
    }
    throw ToolError::invalid_argument(name, "expected non-negative integer");
}

std::vector<std::string> string_list(const json& args, const std::string& name) {
    auto it = args.find(name);
    if (it == args.end() || !it->is_array()) {
        return {};
    }
    return it->get<std::vector<std::string>>();
}

void require_in_time_range(StorageEngine& engine, const std::string& branch, uint64_t as_of) {
    TimeRange range = engine.time_range(branch);
    if (range.empty()) {
        throw ToolError::invalid_argument("as_of", "branch '" + branch + "' has no recorded history");
    }
    if (!range.contains(as_of)) {
        throw ToolError::invalid_argument("as_of",
            "timestamp " + std::to_string(as_of) + " is outside the recorded range [" +
            std::to_string(*range.oldest) + ", " + std::to_string(*range.latest) +
            "] of branch '" + branch + "'; see strata_history");
    }
}

json::json_pointer JsonPath::pointer() const {
    json::json_pointer result;
    for (const auto& field : fields) {
        result /= field;
    }
    return result;
}

JsonPath json_path(const json& args, const std::string& name) {
    JsonPath path;
    auto text = optional_string(args, name);
    if (!text || *text == "$") {
        return path;
    }
    path.text = *text;

    if (text->size() < 3 || text->compare(0, 2, "$.") != 0) {
        throw ToolError::invalid_argument(name, "unsupported path '" + *text + "', expected '$' or '$.field.field'");
    }

    std::size_t pos = 2;
    while (pos <= text->size()) {
        std::size_t end = text->find('.', pos);
        if (end == std::string::npos) {
            end = text->size();
        }
        std::string field = text->substr(pos, end - pos);
        if (field.empty() || field.find_first_of("[]*?@()'\" ") != std::string::npos) {
            throw ToolError::invalid_argument(name, "unsupported path '" + *text + "', expected '$' or '$.field.field'");
        }
        path.fields.push_back(std::move(field));
        pos = end + 1;
    }
    return path;
}

} // namespace strata_mcp::args
