#include "HistoryTool.hpp"
#include "ToolArgs.hpp"
#include "mcp/ToolError.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

HistoryTool::HistoryTool(std::shared_ptr<StorageEngine> engine)
    : engine_(std::move(engine)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
}

ToolInfo HistoryTool::get_info() {
    return ToolInfo{
        .name = "strata_history",
        .description = "View the complete version history of a key, or discover the time range available "
                       "for time-travel. With 'key': returns every historical version with values, version "
                       "numbers, and timestamps, oldest first (useful for undo, audit, or understanding how "
                       "data evolved); 'as_of' limits it to versions at or before that timestamp. Without "
                       "'key': returns the oldest and latest timestamps on the current branch, the full "
                       "range available for 'as_of' queries in strata_recall.",
        .input_schema = {
            {"type", "object"},
            {"properties", {
                {"key", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Document key; omit for the branch time range"}
                }},
                {"namespace", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Namespace for this call only (default: session namespace)"}
                }},
                {"as_of", {
                    {"type", "integer"},
                    {"minimum", 0},
                    {"description", "Only versions at or before this microsecond timestamp"}
                }}
            }},
            {"required", json::array()}
        },
        .annotations = {.read_only = true, .destructive = false, .idempotent = true}
    };
}

json HistoryTool::execute(const json& args, const CallContext& ctx) {
    auto key = args::optional_string(args, "key");
    auto as_of = args::optional_u64(args, "as_of");

    if (key) {
        return key_history(*key, as_of, ctx);
    }
    if (as_of) {
        throw ToolError::invalid_argument("as_of", "only valid together with 'key'");
    }
    return branch_range(ctx);
}

json HistoryTool::key_history(const std::string& key, std::optional<uint64_t> as_of, const CallContext& ctx) {
    if (as_of) {
        args::require_in_time_range(*engine_, ctx.branch, *as_of);
    }

    auto versions = engine_->history(ctx.branch, ctx.ns, key);
    spdlog::debug("HistoryTool: {}/{} has {} versions", ctx.ns, key, versions.size());

    json entries = json::array();
    for (const auto& v : versions) {
        if (as_of && v.timestamp > *as_of) {
            break;
        }
        json entry = {
            {"value", v.value},
            {"version", v.version},
            {"timestamp", v.timestamp}
        };
        if (!v.tags.empty()) {
            entry["tags"] = v.tags;
        }
        entries.push_back(std::move(entry));
    }

    return {
        {"key", key},
        {"namespace", ctx.ns},
        {"branch", ctx.branch},
        {"versions", entries}
    };
}

json HistoryTool::branch_range(const CallContext& ctx) {
    TimeRange range = engine_->time_range(ctx.branch);
    return {
        {"branch", ctx.branch},
        {"oldest", range.oldest ? json(*range.oldest) : json()},
        {"latest", range.latest ? json(*range.latest) : json()}
    };
}

} // namespace strata_mcp
