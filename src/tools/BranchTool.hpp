#pragma once

#include "core/SessionContext.hpp"
#include "core/StorageEngine.hpp"
#include "mcp/ToolRegistry.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace strata_mcp {

/**
 * @brief MCP tool grouping every branch operation behind an 'action' field
 *
 * Each action is a separate sub-handler with its own argument rules:
 * - create: name optional
 * - switch, fork, delete: name required
 * - merge: source required, merged into the current branch
 * - diff: compare required, compared against the current branch
 * - list: no arguments
 *
 * Only 'switch' changes the session. Referencing a branch that does not
 * exist is reported as an invalid argument naming the offending field.
 *
 * Actions are serialized. Each reads the session branch after taking the
 * lock, not from the caller's snapshot.
 */
class BranchTool {
public:
    BranchTool(std::shared_ptr<StorageEngine> engine, std::shared_ptr<SessionContext> session);

    static ToolInfo get_info();

    json execute(const json& args, const CallContext& ctx);

private:
    using Action = json (BranchTool::*)(const json& args, const CallContext& ctx);

    json create(const json& args, const CallContext& ctx);
    json switch_to(const json& args, const CallContext& ctx);
    json list(const json& args, const CallContext& ctx);
    json fork(const json& args, const CallContext& ctx);
    json merge(const json& args, const CallContext& ctx);
    json diff(const json& args, const CallContext& ctx);
    json remove(const json& args, const CallContext& ctx);

    /**
     * @brief Read a required branch name and check that it exists
     * @throws ToolError (InvalidArgument naming @p field)
     */
    std::string existing_branch(const json& args, const std::string& field, const std::string& action);

    static const std::map<std::string, Action>& actions();

    std::shared_ptr<StorageEngine> engine_;
    std::shared_ptr<SessionContext> session_;
    std::mutex mutex_;
};

} // namespace strata_mcp
