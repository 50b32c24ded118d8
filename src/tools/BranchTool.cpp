#include "BranchTool.hpp"
#include "ToolArgs.hpp"
#include "mcp/ToolError.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

namespace {

std::string required_for(const json& args, const std::string& field, const std::string& action) {
    auto value = args::optional_string(args, field);
    if (!value) {
        throw ToolError::invalid_argument(field, "required for action '" + action + "'");
    }
    return *value;
}

} // namespace

BranchTool::BranchTool(std::shared_ptr<StorageEngine> engine, std::shared_ptr<SessionContext> session)
    : engine_(std::move(engine)), session_(std::move(session)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
    if (!session_) {
        throw std::invalid_argument("Session cannot be null");
    }
}

ToolInfo BranchTool::get_info() {
    json action_names = json::array();
    for (const auto& [name, _] : actions()) {
        action_names.push_back(name);
    }

    return ToolInfo{
        .name = "strata_branch",
        .description = "Manage isolated data branches, similar to git branches for your data. Branches let "
                       "you experiment safely without affecting the main data. Actions: 'create' makes an "
                       "empty branch (optional 'name'); 'switch' changes the current branch ('name'); 'list' "
                       "shows all branches; 'fork' copies the current branch's data into a new branch "
                       "('name'); 'merge' applies another branch's changes to the current one ('source', "
                       "last writer wins, conflicting keys are reported); 'diff' compares the current branch "
                       "with another ('compare'); 'delete' removes a branch ('name', not the current or "
                       "default branch).",
        .input_schema = {
            {"type", "object"},
            {"properties", {
                {"action", {
                    {"type", "string"},
                    {"enum", action_names},
                    {"description", "Branch operation"}
                }},
                {"name", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Branch name (create, switch, fork, delete)"}
                }},
                {"source", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Branch to merge into the current branch (merge)"}
                }},
                {"compare", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Branch to compare with the current branch (diff)"}
                }}
            }},
            {"required", json::array({"action"})}
        },
        .annotations = {.read_only = false, .destructive = true, .idempotent = false}
    };
}

const std::map<std::string, BranchTool::Action>& BranchTool::actions() {
    static const std::map<std::string, Action> table = {
        {"create", &BranchTool::create},
        {"switch", &BranchTool::switch_to},
        {"list", &BranchTool::list},
        {"fork", &BranchTool::fork},
        {"merge", &BranchTool::merge},
        {"diff", &BranchTool::diff},
        {"delete", &BranchTool::remove},
    };
    return table;
}

json BranchTool::execute(const json& args, const CallContext& ctx) {
    std::string action = args::required_string(args, "action");

    auto it = actions().find(action);
    if (it == actions().end()) {
        throw ToolError::invalid_argument("action", "unknown action '" + action + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    CallContext current = ctx;
    current.branch = session_->branch();

    spdlog::debug("BranchTool: {} (current branch {})", action, current.branch);
    return (this->*(it->second))(args, current);
}

std::string BranchTool::existing_branch(const json& args, const std::string& field, const std::string& action) {
    std::string name = required_for(args, field, action);
    if (!engine_->branch_exists(name)) {
        throw ToolError::invalid_argument(field, "branch '" + name + "' does not exist");
    }
    return name;
}

json BranchTool::create(const json& args, const CallContext&) {
    auto name = args::optional_string(args, "name");
    if (name && engine_->branch_exists(*name)) {
        throw ToolError::invalid_argument("name", "branch '" + *name + "' already exists");
    }

    BranchInfo info = engine_->branch_create(name);
    spdlog::info("Created branch {}", info.name);
    return {
        {"created", true},
        {"branch", info.name}
    };
}

json BranchTool::switch_to(const json& args, const CallContext&) {
    std::string name = existing_branch(args, "name", "switch");
    session_->switch_branch(name);
    return {
        {"switched", true},
        {"branch", name}
    };
}

json BranchTool::list(const json&, const CallContext& ctx) {
    json branches = json::array();
    for (const auto& info : engine_->branch_list()) {
        json entry = {
            {"name", info.name},
            {"created_at", info.created_at},
            {"keys", info.keys}
        };
        if (info.parent) {
            entry["parent"] = *info.parent;
        }
        branches.push_back(std::move(entry));
    }

    return {
        {"current", ctx.branch},
        {"branches", branches}
    };
}

json BranchTool::fork(const json& args, const CallContext& ctx) {
    std::string destination = required_for(args, "name", "fork");
    if (engine_->branch_exists(destination)) {
        throw ToolError::invalid_argument("name", "branch '" + destination + "' already exists");
    }

    ForkResult result = engine_->branch_fork(ctx.branch, destination);
    spdlog::info("Forked {} into {} ({} keys)", result.source, result.destination, result.keys_copied);
    return {
        {"forked", true},
        {"source", result.source},
        {"destination", result.destination},
        {"keys_copied", result.keys_copied}
    };
}

json BranchTool::merge(const json& args, const CallContext& ctx) {
    std::string source = existing_branch(args, "source", "merge");
    if (source == ctx.branch) {
        throw ToolError::invalid_argument("source", "cannot merge branch '" + source + "' into itself");
    }

    MergeResult result = engine_->branch_merge(source, ctx.branch);

    json conflicts = json::array();
    for (const auto& conflict : result.conflicts) {
        conflicts.push_back({
            {"key", conflict.key},
            {"namespace", conflict.ns}
        });
    }

    spdlog::info("Merged {} into {} ({} keys, {} conflicts)",
                 source, ctx.branch, result.keys_applied, result.conflicts.size());
    return {
        {"merged", true},
        {"source", source},
        {"target", ctx.branch},
        {"keys_applied", result.keys_applied},
        {"namespaces_merged", result.namespaces_merged},
        {"conflicts", conflicts}
    };
}

json BranchTool::diff(const json& args, const CallContext& ctx) {
    std::string compare = existing_branch(args, "compare", "diff");

    DiffResult result = engine_->branch_diff(ctx.branch, compare);
    return {
        {"current_branch", result.branch_a},
        {"compare_branch", result.branch_b},
        {"added", result.added.size()},
        {"removed", result.removed.size()},
        {"modified", result.modified.size()},
        {"keys", {
            {"added", json(result.added)},
            {"removed", json(result.removed)},
            {"modified", json(result.modified)}
        }}
    };
}

json BranchTool::remove(const json& args, const CallContext& ctx) {
    std::string name = existing_branch(args, "name", "delete");
    if (name == ctx.branch) {
        throw ToolError::invalid_argument("name", "cannot delete the current branch '" + name + "'");
    }
    if (name == SessionContext::kDefaultBranch) {
        throw ToolError::invalid_argument("name", "the default branch cannot be deleted");
    }

    engine_->branch_delete(name);
    spdlog::info("Deleted branch {}", name);
    return {
        {"deleted", true},
        {"branch", name}
    };
}

} // namespace strata_mcp
