#include "AgentTools.hpp"
#include "BranchTool.hpp"
#include "ForgetTool.hpp"
#include "HistoryTool.hpp"
#include "LogTool.hpp"
#include "RecallTool.hpp"
#include "SearchTool.hpp"
#include "StatusTool.hpp"
#include "StoreTool.hpp"
#include <spdlog/spdlog.h>

namespace strata_mcp {

namespace {

template <typename Tool>
void add_tool(MCPServer& server, std::shared_ptr<Tool> tool) {
    server.register_tool(
        Tool::get_info(),
        [tool](const json& args, const CallContext& ctx) {
            return tool->execute(args, ctx);
        }
    );
}

} // namespace

void register_agent_tools(MCPServer& server,
                          std::shared_ptr<StorageEngine> engine,
                          std::shared_ptr<SessionContext> session,
                          std::shared_ptr<IndexingQueue> indexer,
                          const ServerConfig& config) {
    add_tool(server, std::make_shared<StoreTool>(engine, indexer));
    add_tool(server, std::make_shared<RecallTool>(engine));
    add_tool(server, std::make_shared<SearchTool>(engine, config.max_search_results, config.default_search_k));
    add_tool(server, std::make_shared<ForgetTool>(engine));
    add_tool(server, std::make_shared<LogTool>(engine));
    add_tool(server, std::make_shared<BranchTool>(engine, session));
    add_tool(server, std::make_shared<HistoryTool>(engine));
    add_tool(server, std::make_shared<StatusTool>(engine, indexer));

    spdlog::info("Registered agent tools");
}

} // namespace strata_mcp
