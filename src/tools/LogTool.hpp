#pragma once

#include "core/StorageEngine.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace strata_mcp {

/**
 * @brief MCP tool that appends to the branch's immutable event log
 */
class LogTool {
public:
    explicit LogTool(std::shared_ptr<StorageEngine> engine);

    static ToolInfo get_info();

    /**
     * @return {event, sequence, timestamp, logged}
     */
    json execute(const json& args, const CallContext& ctx);

private:
    std::shared_ptr<StorageEngine> engine_;
};

} // namespace strata_mcp
