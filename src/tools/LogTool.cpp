#include "LogTool.hpp"
#include "ToolArgs.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

LogTool::LogTool(std::shared_ptr<StorageEngine> engine)
    : engine_(std::move(engine)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
}

ToolInfo LogTool::get_info() {
    return ToolInfo{
        .name = "strata_log",
        .description = "Append an immutable event to the log. Use this for recording actions, decisions, "
                       "observations, errors, or any sequential data that should never be modified after the "
                       "fact. Unlike strata_store, events cannot be overwritten or deleted: they form a "
                       "permanent, ordered, timestamped record. 'event' is the type tag (e.g. \"user_action\", "
                       "\"error\", \"decision\") and 'data' is any JSON payload. "
                       "Returns { sequence, timestamp, logged: true }.",
        .input_schema = {
            {"type", "object"},
            {"properties", {
                {"event", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Event type tag"}
                }},
                {"data", {
                    {"description", "Any JSON payload"}
                }}
            }},
            {"required", json::array({"event", "data"})}
        },
        .annotations = {.read_only = false, .destructive = false, .idempotent = false}
    };
}

json LogTool::execute(const json& args, const CallContext& ctx) {
    std::string event = args::required_string(args, "event");

    EventReceipt receipt = engine_->append_event(ctx.branch, event, args.at("data"));
    spdlog::debug("LogTool: {} #{} on branch {}", event, receipt.sequence, ctx.branch);

    return {
        {"event", event},
        {"sequence", receipt.sequence},
        {"timestamp", receipt.timestamp},
        {"logged", true}
    };
}

} // namespace strata_mcp
