#include "ToolDispatcher.hpp"
#include "SchemaValidator.hpp"
#include "ToolError.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry, std::shared_ptr<SessionContext> session,
                               ToolSurface surface)
    : registry_(registry), session_(std::move(session)), surface_(surface) {
    if (!session_) {
        throw std::invalid_argument("Session cannot be null");
    }
}

json ToolDispatcher::call(const std::string& name, const json& arguments) const {
    const ToolRegistry::Entry* entry = registry_.find(name, surface_);
    if (!entry) {
        throw ToolError(ErrorKind::ToolNotFound, "Unknown tool: " + name);
    }

    SchemaValidator::validate(entry->info.input_schema, arguments);

    CallContext ctx = resolve_context(arguments);
    if (ctx.read_only && !entry->info.annotations.read_only) {
        spdlog::warn("Rejected {} in read-only mode", name);
        throw ToolError(ErrorKind::AccessDenied,
                        "access denied: " + name + " rejected, server is read-only");
    }

    spdlog::debug("Calling tool: {} (branch={}, namespace={}) with args: {}",
                  name, ctx.branch, ctx.ns, arguments.dump());
    return entry->handler(arguments, ctx);
}

CallContext ToolDispatcher::resolve_context(const json& arguments) const {
    SessionSnapshot snapshot = session_->snapshot();

    CallContext ctx{snapshot.branch, snapshot.ns, snapshot.read_only, snapshot.auto_embed};
    auto ns = arguments.find("namespace");
    if (ns != arguments.end() && ns->is_string()) {
        ctx.ns = ns->get<std::string>();
    }
    return ctx;
}

} // namespace strata_mcp
