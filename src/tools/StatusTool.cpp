#include "StatusTool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

StatusTool::StatusTool(std::shared_ptr<StorageEngine> engine, std::shared_ptr<IndexingQueue> indexer)
    : engine_(std::move(engine)), indexer_(std::move(indexer)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
}

ToolInfo StatusTool::get_info() {
    return ToolInfo{
        .name = "strata_status",
        .description = "Get current database status: the active branch and namespace, whether auto-embed "
                       "and read-only mode are on, how many branches, keys and events exist, server uptime, "
                       "and background indexing health. Use this to orient yourself before other operations.",
        .input_schema = {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        },
        .annotations = {.read_only = true, .destructive = false, .idempotent = true}
    };
}

json StatusTool::execute(const json&, const CallContext& ctx) {
    EngineInfo info = engine_->introspect();
    spdlog::debug("StatusTool: {} branches, {} keys, {} events",
                  info.branch_count, info.total_keys, info.total_events);

    return {
        {"version", info.version},
        {"branch", ctx.branch},
        {"namespace", ctx.ns},
        {"auto_embed", ctx.auto_embed},
        {"read_only", ctx.read_only},
        {"branches", info.branch_count},
        {"keys", info.total_keys},
        {"events", info.total_events},
        {"uptime_secs", info.uptime_secs},
        {"indexing", indexing_status()}
    };
}

json StatusTool::indexing_status() const {
    if (!indexer_) {
        return {{"enabled", false}};
    }

    IndexingStats stats = indexer_->stats();
    json result = {
        {"enabled", true},
        {"queued", stats.queued},
        {"indexed", stats.indexed},
        {"failed", stats.failed},
        {"pending", stats.pending}
    };
    if (stats.last_error) {
        result["last_error"] = *stats.last_error;
    }
    return result;
}

} // namespace strata_mcp
