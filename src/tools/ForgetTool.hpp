#pragma once

#include "core/StorageEngine.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace strata_mcp {

/**
 * @brief MCP tool that deletes the live value of a key
 *
 * The version history survives the deletion.
 */
class ForgetTool {
public:
    explicit ForgetTool(std::shared_ptr<StorageEngine> engine);

    static ToolInfo get_info();

    /**
     * @return {key, deleted}; deleted is false when the key did not exist
     */
    json execute(const json& args, const CallContext& ctx);

private:
    std::shared_ptr<StorageEngine> engine_;
};

} // namespace strata_mcp
