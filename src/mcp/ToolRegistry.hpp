#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata_mcp {

using json = nlohmann::json;

/**
 * @brief Safety hints attached to a tool
 *
 * read_only is also enforced: in read-only mode only tools carrying
 * the hint may run.
 */
struct ToolAnnotations {
    bool read_only = false;
    bool destructive = false;
    bool idempotent = false;
};

/**
 * @brief Which catalog the server exposes, chosen at startup
 */
enum class ToolSurface {
    Agent,
    Developer
};

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
    ToolAnnotations annotations;
    bool developer_only = false;
};

/**
 * @brief Per-call view of the session handed to a tool handler
 *
 * ns already reflects an explicit "namespace" argument; the session
 * itself is never changed by such an override.
 */
struct CallContext {
    std::string branch;
    std::string ns;
    bool read_only = false;
    bool auto_embed = false;
};

/**
 * @brief Function signature for tool execution
 * @param args Validated JSON object with tool arguments
 * @param ctx Session defaults resolved for this call
 * @return JSON result; failures are thrown
 */
using ToolHandler = std::function<json(const json& args, const CallContext& ctx)>;

/**
 * @brief Catalog of registered tools
 *
 * Filled during startup, then sealed; lookups after seal() never
 * observe a changing catalog.
 */
class ToolRegistry {
public:
    struct Entry {
        ToolInfo info;
        ToolHandler handler;
    };

    /**
     * @brief Register a tool
     * @throws std::invalid_argument on empty name, null handler or duplicate
     * @throws std::logic_error once the registry is sealed
     */
    void add(const ToolInfo& info, ToolHandler handler);

    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }

    /**
     * @brief Find a tool visible on the given surface
     * @return Entry or nullptr
     */
    const Entry* find(const std::string& name, ToolSurface surface) const;

    /**
     * @brief Descriptors visible on the surface, in registration order
     */
    std::vector<const ToolInfo*> list(ToolSurface surface) const;

    /**
     * @brief tools/list representation of a descriptor
     */
    static json describe(const ToolInfo& info);

private:
    static bool visible(const ToolInfo& info, ToolSurface surface);

    std::vector<Entry> entries_;
    std::map<std::string, std::size_t> by_name_;
    bool sealed_ = false;
};

} // namespace strata_mcp
