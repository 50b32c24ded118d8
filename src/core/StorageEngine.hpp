#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata_mcp {

using json = nlohmann::json;

/**
 * @brief Failure categories reported by a storage engine
 */
enum class EngineErrc {
    BranchNotFound,
    BranchExists,
    KeyNotFound,
    InvalidInput,
    ReadOnly,
    Io,
    Unavailable,
    Internal
};

/**
 * @brief Exception raised by StorageEngine implementations
 */
class EngineError : public std::runtime_error {
public:
    EngineError(EngineErrc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    EngineErrc code() const noexcept { return code_; }

private:
    EngineErrc code_;
};

struct WriteReceipt {
    uint64_t version = 0;
    uint64_t timestamp = 0;
};

struct VersionedValue {
    json value;
    std::vector<std::string> tags;
    uint64_t version = 0;
    uint64_t timestamp = 0;
};

struct EventReceipt {
    uint64_t sequence = 0;
    uint64_t timestamp = 0;
};

struct SearchHit {
    std::string key;
    json value;
    double score = 0.0;
    std::string snippet;
};

struct BranchInfo {
    std::string name;
    std::optional<std::string> parent;
    uint64_t created_at = 0;
    std::size_t keys = 0;
};

struct ForkResult {
    std::string source;
    std::string destination;
    std::size_t keys_copied = 0;
};

struct MergeConflict {
    std::string key;
    std::string ns;
};

struct MergeResult {
    std::size_t keys_applied = 0;
    std::size_t namespaces_merged = 0;
    std::vector<MergeConflict> conflicts;
};

struct DiffResult {
    std::string branch_a;
    std::string branch_b;
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> modified;
};

struct TimeRange {
    std::optional<uint64_t> oldest;
    std::optional<uint64_t> latest;

    bool empty() const { return !oldest.has_value(); }
    bool contains(uint64_t ts) const { return oldest && latest && ts >= *oldest && ts <= *latest; }
};

struct EngineInfo {
    std::string version;
    std::size_t branch_count = 0;
    std::size_t total_keys = 0;
    std::size_t total_events = 0;
    uint64_t uptime_secs = 0;
};

/**
 * @brief Capability interface of the versioned, branchable data store
 *
 * Every call may fail with EngineError. Callers must not assume success;
 * failures are reclassified before they reach the wire.
 */
class StorageEngine {
public:
    virtual ~StorageEngine() = default;

    /**
     * @brief Write a new version of a key
     * @return Version number and commit timestamp (microseconds)
     */
    virtual WriteReceipt put(const std::string& branch, const std::string& ns,
                             const std::string& key, const json& value,
                             const std::vector<std::string>& tags) = 0;

    /**
     * @brief Read a key, optionally as of a past timestamp
     * @return Value or std::nullopt when absent (or deleted) at that point
     */
    virtual std::optional<VersionedValue> get(const std::string& branch, const std::string& ns,
                                              const std::string& key,
                                              std::optional<uint64_t> as_of) = 0;

    /**
     * @brief Delete the live value of a key; history is preserved
     * @return true if the key was live
     */
    virtual bool remove(const std::string& branch, const std::string& ns,
                        const std::string& key) = 0;

    virtual EventReceipt append_event(const std::string& branch, const std::string& event_type,
                                      const json& payload) = 0;

    /**
     * @brief Ranked keyword + semantic search over live values of a namespace
     */
    virtual std::vector<SearchHit> search(const std::string& branch, const std::string& ns,
                                          const std::string& query, std::size_t k,
                                          const std::vector<std::string>& tags) = 0;

    /**
     * @brief Register text for semantic search. Best effort from the caller's side.
     */
    virtual void index_for_search(const std::string& branch, const std::string& ns,
                                  const std::string& key, const std::string& text) = 0;

    virtual BranchInfo branch_create(const std::optional<std::string>& name) = 0;
    virtual bool branch_exists(const std::string& name) = 0;
    virtual ForkResult branch_fork(const std::string& source, const std::string& destination) = 0;
    virtual MergeResult branch_merge(const std::string& source, const std::string& target) = 0;
    virtual DiffResult branch_diff(const std::string& branch_a, const std::string& branch_b) = 0;
    virtual void branch_delete(const std::string& name) = 0;
    virtual std::vector<BranchInfo> branch_list() = 0;

    /**
     * @brief All live-or-overwritten versions of a key, oldest first (tombstones excluded)
     */
    virtual std::vector<VersionedValue> history(const std::string& branch, const std::string& ns,
                                                const std::string& key) = 0;

    virtual TimeRange time_range(const std::string& branch) = 0;

    virtual EngineInfo introspect() = 0;
};

} // namespace strata_mcp
