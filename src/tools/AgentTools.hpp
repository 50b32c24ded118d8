#pragma once

#include "core/IndexingQueue.hpp"
#include "core/ServerConfig.hpp"
#include "core/SessionContext.hpp"
#include "core/StorageEngine.hpp"
#include "mcp/MCPServer.hpp"
#include <memory>

namespace strata_mcp {

/**
 * @brief Register the eight strata_* tools on a server
 * @param indexer Background indexer; null disables auto-embed indexing
 */
void register_agent_tools(MCPServer& server,
                          std::shared_ptr<StorageEngine> engine,
                          std::shared_ptr<SessionContext> session,
                          std::shared_ptr<IndexingQueue> indexer,
                          const ServerConfig& config);

} // namespace strata_mcp
