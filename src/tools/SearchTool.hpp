#pragma once

#include "core/StorageEngine.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace strata_mcp {

/**
 * @brief MCP tool for ranked keyword + semantic search
 *
 * Ranking belongs to the engine. This tool clamps k to the configured
 * maximum and shapes hits as {key, value, score, snippet}.
 */
class SearchTool {
public:
    /**
     * @brief Construct tool
     * @param engine Storage engine
     * @param max_results Upper bound for k (at least 1)
     * @param default_k k used when the caller gives none
     */
    SearchTool(std::shared_ptr<StorageEngine> engine, std::size_t max_results, std::size_t default_k);

    static ToolInfo get_info();

    json execute(const json& args, const CallContext& ctx);

    std::size_t max_results() const { return max_results_; }

private:
    std::shared_ptr<StorageEngine> engine_;
    std::size_t max_results_;
    std::size_t default_k_;
};

} // namespace strata_mcp
