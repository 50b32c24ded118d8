#pragma once

#include "ToolRegistry.hpp"
#include "core/SessionContext.hpp"
#include <memory>
#include <string>

namespace strata_mcp {

/**
 * @brief Resolves and guards tools/call invocations
 *
 * Order of checks: tool lookup, argument validation, read-only policy.
 * All three run before the handler, so a rejected call has no side
 * effect on the storage engine.
 */
class ToolDispatcher {
public:
    ToolDispatcher(const ToolRegistry& registry, std::shared_ptr<SessionContext> session,
                   ToolSurface surface = ToolSurface::Agent);

    /**
     * @brief Validate and run a tool
     * @throws ToolError for unknown tools, invalid arguments or denied access;
     *         handler failures propagate unchanged
     */
    json call(const std::string& name, const json& arguments) const;

private:
    CallContext resolve_context(const json& arguments) const;

    const ToolRegistry& registry_;
    std::shared_ptr<SessionContext> session_;
    ToolSurface surface_;
};

} // namespace strata_mcp
