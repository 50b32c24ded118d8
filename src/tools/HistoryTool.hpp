#pragma once

#include "core/StorageEngine.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace strata_mcp {

/**
 * @brief MCP tool for version history and time-travel bounds
 *
 * With a key: every recorded version, oldest first. Without a key: the
 * oldest and latest timestamps of the current branch, which bound the
 * 'as_of' values accepted by strata_recall.
 */
class HistoryTool {
public:
    explicit HistoryTool(std::shared_ptr<StorageEngine> engine);

    static ToolInfo get_info();

    json execute(const json& args, const CallContext& ctx);

private:
    json key_history(const std::string& key, std::optional<uint64_t> as_of, const CallContext& ctx);
    json branch_range(const CallContext& ctx);

    std::shared_ptr<StorageEngine> engine_;
};

} // namespace strata_mcp
