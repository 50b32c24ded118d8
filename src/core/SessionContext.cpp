#include "SessionContext.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

SessionContext::SessionContext(bool read_only, bool auto_embed, std::string ns)
    : branch_(kDefaultBranch),
      namespace_(std::move(ns)),
      read_only_(read_only),
      auto_embed_(auto_embed) {
    if (namespace_.empty()) {
        throw std::invalid_argument("Namespace cannot be empty");
    }
    spdlog::debug("Session created (namespace={}, read_only={}, auto_embed={})",
                  namespace_, read_only_, auto_embed_);
}

SessionSnapshot SessionContext::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {branch_, namespace_, read_only_, auto_embed_};
}

std::string SessionContext::branch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return branch_;
}

void SessionContext::switch_branch(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Branch name cannot be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::info("Switching branch: {} -> {}", branch_, name);
    branch_ = name;
}

} // namespace strata_mcp
