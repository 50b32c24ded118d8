#pragma once

#include "core/IndexingQueue.hpp"
#include "core/StorageEngine.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace strata_mcp {

/**
 * @brief MCP tool reporting session state, engine counters and indexing health
 */
class StatusTool {
public:
    /**
     * @param indexer May be null when auto-embed is disabled
     */
    StatusTool(std::shared_ptr<StorageEngine> engine, std::shared_ptr<IndexingQueue> indexer);

    static ToolInfo get_info();

    json execute(const json& args, const CallContext& ctx);

private:
    json indexing_status() const;

    std::shared_ptr<StorageEngine> engine_;
    std::shared_ptr<IndexingQueue> indexer_;
};

} // namespace strata_mcp
