#include "ForgetTool.hpp"
#include "ToolArgs.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

ForgetTool::ForgetTool(std::shared_ptr<StorageEngine> engine)
    : engine_(std::move(engine)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
}

ToolInfo ForgetTool::get_info() {
    return ToolInfo{
        .name = "strata_forget",
        .description = "Delete a document by key. Returns { deleted: true } if the key existed, "
                       "{ deleted: false } otherwise. The deletion itself is versioned: the document's "
                       "history stays visible through strata_history, and strata_recall with 'as_of' still "
                       "returns the value as it existed before deletion.",
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
                }}
            }},
            {"required", json::array({"key"})}
        },
        .annotations = {.read_only = false, .destructive = true, .idempotent = true}
    };
}

json ForgetTool::execute(const json& args, const CallContext& ctx) {
    std::string key = args::required_string(args, "key");

    bool deleted = engine_->remove(ctx.branch, ctx.ns, key);
    spdlog::debug("ForgetTool: {}/{} deleted={}", ctx.ns, key, deleted);

    return {
        {"key", key},
        {"deleted", deleted}
    };
}

} // namespace strata_mcp
