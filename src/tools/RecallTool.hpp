#pragma once

#include "core/StorageEngine.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace strata_mcp {

/**
 * @brief MCP tool that reads a key, optionally as of a past timestamp
 *
 * A missing key is a normal result ({found: false}), not an error.
 */
class RecallTool {
public:
    explicit RecallTool(std::shared_ptr<StorageEngine> engine);

    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "key" and optional "path", "namespace", "as_of"
     * @param ctx Session defaults for this call
     * @return {key, found, value, path?, version?, timestamp?}
     */
    json execute(const json& args, const CallContext& ctx);

private:
    std::shared_ptr<StorageEngine> engine_;
};

} // namespace strata_mcp
