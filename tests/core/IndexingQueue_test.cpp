#include "core/IndexingQueue.hpp"
#include "CountingEngine.hpp"
#include <gtest/gtest.h>

using namespace strata_mcp;

class IndexingQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<CountingEngine>();
        queue = std::make_unique<IndexingQueue>(engine);
    }

    std::shared_ptr<CountingEngine> engine;
    std::unique_ptr<IndexingQueue> queue;
};

TEST_F(IndexingQueueTest, NullEngineRejected) {
    EXPECT_THROW(IndexingQueue(nullptr), std::invalid_argument);
}

TEST_F(IndexingQueueTest, IndexesQueuedText) {
    engine->put("default", "ns", "note", "quarterly budgeting", {});

    queue->enqueue("default", "ns", "note", "quarterly budgeting");
    queue->wait_idle();

    IndexingStats stats = queue->stats();
    EXPECT_EQ(stats.queued, 1);
    EXPECT_EQ(stats.indexed, 1);
    EXPECT_EQ(stats.failed, 0);
    EXPECT_EQ(stats.pending, 0);
    EXPECT_FALSE(stats.last_error.has_value());

    EXPECT_FALSE(engine->search("default", "ns", "budget", 5, {}).empty());
}

TEST_F(IndexingQueueTest, FailuresAreCountedNotThrown) {
    engine->fail_indexing = true;
    engine->put("default", "ns", "k", "text", {});

    queue->enqueue("default", "ns", "k", "text");
    queue->enqueue("default", "ns", "k", "text");
    queue->wait_idle();

    IndexingStats stats = queue->stats();
    EXPECT_EQ(stats.failed, 2);
    EXPECT_EQ(stats.indexed, 0);
    ASSERT_TRUE(stats.last_error.has_value());
    EXPECT_NE(stats.last_error->find("embedding"), std::string::npos);
}

TEST_F(IndexingQueueTest, MissingKeyIsAFailure) {
    queue->enqueue("default", "ns", "absent", "text");
    queue->wait_idle();
    EXPECT_EQ(queue->stats().failed, 1);
}

TEST_F(IndexingQueueTest, DestructionDrainsQueue) {
    for (int i = 0; i < 20; ++i) {
        std::string key = "k" + std::to_string(i);
        engine->put("default", "ns", key, "text", {});
        queue->enqueue("default", "ns", key, "text");
    }
    int before = engine->mutations.load();
    queue.reset();

    // 20 index_for_search calls happened after the puts
    EXPECT_EQ(engine->mutations.load(), 40);
    EXPECT_GE(before, 20);
}
