#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

void ToolRegistry::add(const ToolInfo& info, ToolHandler handler) {
    if (sealed_) {
        throw std::logic_error("Tool registry is sealed, cannot register: " + info.name);
    }
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (by_name_.count(info.name)) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    by_name_[info.name] = entries_.size();
    entries_.push_back({info, std::move(handler)});
    spdlog::info("Registered tool: {}", info.name);
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name, ToolSurface surface) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return nullptr;
    }
    const Entry& entry = entries_[it->second];
    return visible(entry.info, surface) ? &entry : nullptr;
}

std::vector<const ToolInfo*> ToolRegistry::list(ToolSurface surface) const {
    std::vector<const ToolInfo*> infos;
    for (const auto& entry : entries_) {
        if (visible(entry.info, surface)) {
            infos.push_back(&entry.info);
        }
    }
    return infos;
}

json ToolRegistry::describe(const ToolInfo& info) {
    return {
        {"name", info.name},
        {"description", info.description},
        {"inputSchema", info.input_schema},
        {"annotations", {
            {"readOnlyHint", info.annotations.read_only},
            {"destructiveHint", info.annotations.destructive},
            {"idempotentHint", info.annotations.idempotent}
        }}
    };
}

bool ToolRegistry::visible(const ToolInfo& info, ToolSurface surface) {
    return surface == ToolSurface::Developer || !info.developer_only;
}

} // namespace strata_mcp
