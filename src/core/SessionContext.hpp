#pragma once

#include <mutex>
#include <string>

namespace strata_mcp {

/**
 * @brief Consistent copy of the session fields taken under one lock
 */
struct SessionSnapshot {
    std::string branch;
    std::string ns;
    bool read_only = false;
    bool auto_embed = false;
};

/**
 * @brief Process-lifetime session state shared by every tool handler
 *
 * The branch is the only field that changes after startup, and only
 * through switch_branch(). Readers take a snapshot so a concurrent
 * switch never produces a torn read.
 */
class SessionContext {
public:
    static constexpr const char* kDefaultBranch = "default";
    static constexpr const char* kDefaultNamespace = "default";

    SessionContext(bool read_only, bool auto_embed,
                   std::string ns = kDefaultNamespace);

    SessionContext(const SessionContext&) = delete;
    SessionContext& operator=(const SessionContext&) = delete;

    SessionSnapshot snapshot() const;

    std::string branch() const;
    const std::string& ns() const { return namespace_; }
    bool read_only() const { return read_only_; }
    bool auto_embed() const { return auto_embed_; }

    /**
     * @brief Make another branch current. Callers verify the branch exists.
     */
    void switch_branch(const std::string& name);

private:
    mutable std::mutex mutex_;
    std::string branch_;
    const std::string namespace_;
    const bool read_only_;
    const bool auto_embed_;
};

} // namespace strata_mcp
