#pragma once

#include "StorageEngine.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strata_mcp {

/**
 * @brief Options for opening a LocalEngine
 */
struct EngineOptions {
    std::optional<std::filesystem::path> data_dir;  // nullopt = memory only
    bool read_only = false;
};

/**
 * @brief In-process implementation of the StorageEngine capability interface
 *
 * Keeps every branch as a set of namespaced version chains plus an event log.
 * When a data directory is configured the full state is loaded from
 * `<data_dir>/strata.json` on open and rewritten after every mutation.
 *
 * All public methods are thread-safe.
 */
class LocalEngine : public StorageEngine {
public:
    static constexpr const char* kDefaultBranch = "default";
    static constexpr const char* kSnapshotFile = "strata.json";

    explicit LocalEngine(EngineOptions options = {});

    WriteReceipt put(const std::string& branch, const std::string& ns,
                     const std::string& key, const json& value,
                     const std::vector<std::string>& tags) override;
    std::optional<VersionedValue> get(const std::string& branch, const std::string& ns,
                                      const std::string& key,
                                      std::optional<uint64_t> as_of) override;
    bool remove(const std::string& branch, const std::string& ns,
                const std::string& key) override;
    EventReceipt append_event(const std::string& branch, const std::string& event_type,
                              const json& payload) override;
    std::vector<SearchHit> search(const std::string& branch, const std::string& ns,
                                  const std::string& query, std::size_t k,
                                  const std::vector<std::string>& tags) override;
    void index_for_search(const std::string& branch, const std::string& ns,
                          const std::string& key, const std::string& text) override;

    BranchInfo branch_create(const std::optional<std::string>& name) override;
    bool branch_exists(const std::string& name) override;
    ForkResult branch_fork(const std::string& source, const std::string& destination) override;
    MergeResult branch_merge(const std::string& source, const std::string& target) override;
    DiffResult branch_diff(const std::string& branch_a, const std::string& branch_b) override;
    void branch_delete(const std::string& name) override;
    std::vector<BranchInfo> branch_list() override;

    std::vector<VersionedValue> history(const std::string& branch, const std::string& ns,
                                        const std::string& key) override;
    TimeRange time_range(const std::string& branch) override;
    EngineInfo introspect() override;

private:
    struct Version {
        json value;
        std::vector<std::string> tags;
        uint64_t version = 0;
        uint64_t timestamp = 0;
        bool deleted = false;
    };

    struct Event {
        uint64_t sequence = 0;
        uint64_t timestamp = 0;
        std::string type;
        json payload;
    };

    using Chain = std::vector<Version>;
    using Space = std::map<std::string, Chain>;

    struct Branch {
        std::optional<std::string> parent;
        uint64_t created_at = 0;
        uint64_t forked_at = 0;  // 0 when not created by fork
        std::map<std::string, Space> spaces;
        std::vector<Event> events;
        std::map<std::string, std::map<std::string, std::string>> indexed;  // ns -> key -> text
    };

    Branch& branch_ref(const std::string& name);
    void require_writable(const char* operation) const;
    uint64_t next_timestamp();
    static bool is_live(const Chain& chain);
    static std::size_t live_key_count(const Branch& branch);
    static std::optional<std::string> take_index(Branch& branch, const std::string& ns,
                                                 const std::string& key);
    static void restore_index(Branch& branch, const std::string& ns, const std::string& key,
                              std::optional<std::string> text);
    static void drop_last_version(Branch& branch, const std::string& ns, const std::string& key);
    std::map<std::pair<std::string, std::string>, json> live_values(const Branch& branch) const;

    void load();
    void persist();

    /**
     * @brief Persist the state, undoing the in-memory mutation if the write fails
     */
    void commit(const std::function<void()>& rollback);
    json snapshot() const;
    void restore(const json& state);

    EngineOptions options_;
    std::map<std::string, Branch> branches_;
    uint64_t version_counter_ = 0;
    uint64_t last_timestamp_ = 0;
    uint64_t branch_counter_ = 0;
    std::chrono::steady_clock::time_point opened_at_;
    mutable std::mutex mutex_;
};

} // namespace strata_mcp
