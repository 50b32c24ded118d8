#pragma once

#include "StorageEngine.hpp"
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

namespace strata_mcp {

/**
 * @brief Counters describing background indexing health
 */
struct IndexingStats {
    uint64_t queued = 0;
    uint64_t indexed = 0;
    uint64_t failed = 0;
    std::size_t pending = 0;
    std::optional<std::string> last_error;
};

/**
 * @brief Fire-and-forget indexing of stored text for semantic search
 *
 * Jobs run on a single worker thread. A failing job is counted and
 * logged; it never reaches the caller that enqueued it.
 */
class IndexingQueue {
public:
    explicit IndexingQueue(std::shared_ptr<StorageEngine> engine);
    ~IndexingQueue();

    IndexingQueue(const IndexingQueue&) = delete;
    IndexingQueue& operator=(const IndexingQueue&) = delete;

    void enqueue(std::string branch, std::string ns, std::string key, std::string text);

    /**
     * @brief Block until every queued job has finished
     */
    void wait_idle();

    IndexingStats stats() const;

private:
    struct Job {
        std::string branch;
        std::string ns;
        std::string key;
        std::string text;
    };

    void worker_loop();

    std::shared_ptr<StorageEngine> engine_;
    std::queue<Job> jobs_;
    bool busy_ = false;
    bool stopping_ = false;
    IndexingStats stats_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::thread worker_;
};

} // namespace strata_mcp
