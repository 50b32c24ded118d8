#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace strata_mcp {

/**
 * @brief Startup configuration, parsed once from the command line
 */
struct ServerConfig {
    std::optional<std::string> data_dir;
    bool in_memory = false;
    bool read_only = false;
    bool auto_embed = false;
    std::string default_namespace = "default";
    std::size_t max_search_results = 50;
    std::size_t default_search_k = 10;
    std::size_t workers = 0;
};

} // namespace strata_mcp
