#include "IndexingQueue.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

IndexingQueue::IndexingQueue(std::shared_ptr<StorageEngine> engine)
    : engine_(std::move(engine)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
    worker_ = std::thread(&IndexingQueue::worker_loop, this);
}

IndexingQueue::~IndexingQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void IndexingQueue::enqueue(std::string branch, std::string ns, std::string key, std::string text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push({std::move(branch), std::move(ns), std::move(key), std::move(text)});
        stats_.queued++;
    }
    work_cv_.notify_one();
}

void IndexingQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && !busy_; });
}

IndexingStats IndexingQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexingStats copy = stats_;
    copy.pending = jobs_.size() + (busy_ ? 1 : 0);
    return copy;
}

void IndexingQueue::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            // Drain remaining jobs before honouring a stop request
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
            busy_ = true;
        }

        std::optional<std::string> failure;
        try {
            engine_->index_for_search(job.branch, job.ns, job.key, job.text);
            spdlog::debug("Indexed {}/{} on branch {}", job.ns, job.key, job.branch);
        } catch (const std::exception& e) {
            failure = e.what();
            spdlog::warn("Indexing {}/{} failed: {}", job.ns, job.key, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failure) {
                stats_.failed++;
                stats_.last_error = std::move(failure);
            } else {
                stats_.indexed++;
            }
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

} // namespace strata_mcp
