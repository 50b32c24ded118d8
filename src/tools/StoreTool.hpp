#pragma once

#include "core/IndexingQueue.hpp"
#include "core/StorageEngine.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>
#include <mutex>

namespace strata_mcp {

/**
 * @brief MCP tool that writes a JSON value under a key
 *
 * Every call creates a new version. A 'path' such as "$.settings.theme"
 * replaces one nested member of the latest document instead of the whole
 * value. With auto-embed on, the text content of the stored document is
 * queued for semantic indexing; indexing failures are reported by
 * strata_status, never by this tool.
 */
class StoreTool {
public:
    /**
     * @brief Construct tool with engine and indexer
     * @param engine Storage engine
     * @param indexer Background indexer used when auto-embed is on
     */
    StoreTool(std::shared_ptr<StorageEngine> engine, std::shared_ptr<IndexingQueue> indexer);

    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "key", "value" and optional "path", "tags", "namespace"
     * @param ctx Session defaults for this call
     * @return {key, version, timestamp, stored}
     */
    json execute(const json& args, const CallContext& ctx);

private:
    std::shared_ptr<StorageEngine> engine_;
    std::shared_ptr<IndexingQueue> indexer_;
    std::mutex update_mutex_;  // read-modify-write of path updates
};

} // namespace strata_mcp
