#include "RecallTool.hpp"
#include "ToolArgs.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

RecallTool::RecallTool(std::shared_ptr<StorageEngine> engine)
    : engine_(std::move(engine)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
}

ToolInfo RecallTool::get_info() {
    return ToolInfo{
        .name = "strata_recall",
        .description = "Retrieve a document by key. Returns the stored value with version metadata, or "
                       "{ found: false } if the key does not exist. Pass 'as_of' (microsecond timestamp) to "
                       "read what this key contained at any past point in time; call strata_history without "
                       "a key to discover the valid range. Use 'path' with JSONPath syntax (e.g. "
                       "'$.settings.theme') to read a nested field; omit it to get the entire document. "
                       "Returns { key, found, value, version, timestamp }.",
        .input_schema = {
            {"type", "object"},
            {"properties", {
                {"key", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Document key"}
                }},
                {"namespace", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Namespace for this call only (default: session namespace)"}
                }},
                {"path", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "JSONPath of the member to read, e.g. '$.settings.theme' (default '$')"}
                }},
                {"as_of", {
                    {"type", "integer"},
                    {"minimum", 0},
                    {"description", "Microsecond timestamp to read at"}
                }}
            }},
            {"required", json::array({"key"})}
        },
        .annotations = {.read_only = true, .destructive = false, .idempotent = true}
    };
}

json RecallTool::execute(const json& args, const CallContext& ctx) {
    std::string key = args::required_string(args, "key");
    args::JsonPath path = args::json_path(args, "path");
    auto as_of = args::optional_u64(args, "as_of");

    if (as_of) {
        args::require_in_time_range(*engine_, ctx.branch, *as_of);
    }

    spdlog::debug("RecallTool: {}/{} {} on branch {}", ctx.ns, key, path.text, ctx.branch);
    auto found = engine_->get(ctx.branch, ctx.ns, key, as_of);

    json value;
    bool present = found.has_value();
    if (found) {
        if (path.is_root()) {
            value = found->value;
        } else {
            json::json_pointer pointer = path.pointer();
            present = found->value.contains(pointer);
            if (present) {
                value = found->value.at(pointer);
            }
        }
    }

    json result = {
        {"key", key},
        {"found", present},
        {"value", value}
    };
    if (!path.is_root()) {
        result["path"] = path.text;
    }
    if (!present) {
        return result;
    }

    result["version"] = found->version;
    result["timestamp"] = found->timestamp;
    if (!found->tags.empty()) {
        result["tags"] = found->tags;
    }
    return result;
}

} // namespace strata_mcp
