#include "tools/ForgetTool.hpp"
#include "tools/HistoryTool.hpp"
#include "tools/LogTool.hpp"
#include "tools/RecallTool.hpp"
#include "tools/SearchTool.hpp"
#include "tools/StatusTool.hpp"
#include "tools/StoreTool.hpp"
#include "core/CountingEngine.hpp"
#include "mcp/ToolError.hpp"
#include <gtest/gtest.h>

using namespace strata_mcp;
using json = nlohmann::json;

namespace {

std::string invalid_field(const std::function<void()>& action) {
    try {
        action();
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
        return e.field();
    }
    ADD_FAILURE() << "expected InvalidArgument";
    return {};
}

} // namespace

class ToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<CountingEngine>();
        indexer = std::make_shared<IndexingQueue>(engine);
        ctx = CallContext{"default", "default", false, false};
    }

    std::shared_ptr<CountingEngine> engine;
    std::shared_ptr<IndexingQueue> indexer;
    CallContext ctx;
};

TEST_F(ToolsTest, NullEngineRejected) {
    EXPECT_THROW(StoreTool(nullptr, nullptr), std::invalid_argument);
    EXPECT_THROW(RecallTool(nullptr), std::invalid_argument);
    EXPECT_THROW(SearchTool(nullptr, 10, 5), std::invalid_argument);
    EXPECT_THROW(SearchTool(engine, 0, 5), std::invalid_argument);
}

TEST_F(ToolsTest, DescriptorsCarryExpectedAnnotations) {
    EXPECT_EQ(StoreTool::get_info().name, "strata_store");
    EXPECT_FALSE(StoreTool::get_info().annotations.read_only);
    EXPECT_TRUE(RecallTool::get_info().annotations.read_only);
    EXPECT_TRUE(SearchTool::get_info().annotations.read_only);
    EXPECT_TRUE(ForgetTool::get_info().annotations.destructive);
    EXPECT_FALSE(LogTool::get_info().annotations.idempotent);
    EXPECT_TRUE(HistoryTool::get_info().annotations.read_only);
    EXPECT_TRUE(StatusTool::get_info().annotations.read_only);
}

TEST_F(ToolsTest, StoreThenRecall) {
    StoreTool store(engine, indexer);
    RecallTool recall(engine);

    json stored = store.execute({{"key", "k"}, {"value", {{"a", 1}}}, {"tags", {"x"}}}, ctx);
    EXPECT_EQ(stored["key"], "k");
    EXPECT_EQ(stored["stored"], true);
    EXPECT_TRUE(stored["version"].is_number_unsigned());
    EXPECT_TRUE(stored["timestamp"].is_number_unsigned());

    json recalled = recall.execute({{"key", "k"}}, ctx);
    EXPECT_EQ(recalled["found"], true);
    EXPECT_EQ(recalled["value"], json({{"a", 1}}));
    EXPECT_EQ(recalled["version"], stored["version"]);
    EXPECT_EQ(recalled["timestamp"], stored["timestamp"]);
    EXPECT_EQ(recalled["tags"], json::array({"x"}));
}

TEST_F(ToolsTest, RecallMissingKeyIsNotAnError) {
    RecallTool recall(engine);

    json result = recall.execute({{"key", "nothing"}}, ctx);
    EXPECT_EQ(result["found"], false);
    EXPECT_TRUE(result["value"].is_null());
}

TEST_F(ToolsTest, StorePathUpdatesNestedField) {
    StoreTool store(engine, nullptr);
    RecallTool recall(engine);

    store.execute({{"key", "profile"}, {"value", {{"name", "ada"}, {"settings", {{"theme", "light"}}}}},
                   {"tags", {"user"}}}, ctx);
    store.execute({{"key", "profile"}, {"path", "$.settings.theme"}, {"value", "dark"}}, ctx);
    store.execute({{"key", "profile"}, {"path", "$.settings.font.size"}, {"value", 14}}, ctx);

    json recalled = recall.execute({{"key", "profile"}}, ctx);
    EXPECT_EQ(recalled["value"]["name"], "ada");
    EXPECT_EQ(recalled["value"]["settings"]["theme"], "dark");
    EXPECT_EQ(recalled["value"]["settings"]["font"]["size"], 14);
    EXPECT_EQ(recalled["tags"], json::array({"user"}));

    EXPECT_EQ(engine->history("default", "default", "profile").size(), 3);
}

TEST_F(ToolsTest, StorePathOnMissingKeyCreatesDocument) {
    StoreTool store(engine, nullptr);
    RecallTool recall(engine);

    store.execute({{"key", "fresh"}, {"path", "$.a.b"}, {"value", true}}, ctx);
    EXPECT_EQ(recall.execute({{"key", "fresh"}}, ctx)["value"], json({{"a", {{"b", true}}}}));

    store.execute({{"key", "whole"}, {"path", "$"}, {"value", 5}}, ctx);
    EXPECT_EQ(recall.execute({{"key", "whole"}}, ctx)["value"], 5);
}

TEST_F(ToolsTest, StorePathThroughScalarIsInvalidArgument) {
    StoreTool store(engine, nullptr);

    store.execute({{"key", "k"}, {"value", {{"count", 3}}}}, ctx);
    int writes = engine->mutations.load();

    EXPECT_EQ(invalid_field([&] { store.execute({{"key", "k"}, {"path", "$.count.inner"}, {"value", 1}}, ctx); }), "path");
    EXPECT_EQ(engine->mutations.load(), writes);
}

TEST_F(ToolsTest, UnsupportedPathSyntaxIsInvalidArgument) {
    StoreTool store(engine, nullptr);
    RecallTool recall(engine);

    for (const char* path : {"settings.theme", "$..theme", "$.items[0]", "$.a.", "$.*", "$['a']", "$x"}) {
        EXPECT_EQ(invalid_field([&] { store.execute({{"key", "k"}, {"path", path}, {"value", 1}}, ctx); }), "path") << path;
        EXPECT_EQ(invalid_field([&] { recall.execute({{"key", "k"}, {"path", path}}, ctx); }), "path") << path;
    }
    EXPECT_EQ(engine->mutations.load(), 0);
}

TEST_F(ToolsTest, RecallPathReadsNestedField) {
    StoreTool store(engine, nullptr);
    RecallTool recall(engine);

    json stored = store.execute({{"key", "profile"}, {"value", {{"settings", {{"theme", "light"}}}}}}, ctx);

    json theme = recall.execute({{"key", "profile"}, {"path", "$.settings.theme"}}, ctx);
    EXPECT_EQ(theme["found"], true);
    EXPECT_EQ(theme["value"], "light");
    EXPECT_EQ(theme["path"], "$.settings.theme");
    EXPECT_EQ(theme["version"], stored["version"]);

    json missing = recall.execute({{"key", "profile"}, {"path", "$.settings.font"}}, ctx);
    EXPECT_EQ(missing["found"], false);
    EXPECT_TRUE(missing["value"].is_null());
    EXPECT_FALSE(missing.contains("version"));

    json whole = recall.execute({{"key", "profile"}, {"path", "$"}}, ctx);
    EXPECT_EQ(whole["value"]["settings"]["theme"], "light");
    EXPECT_FALSE(whole.contains("path"));
}

TEST_F(ToolsTest, RecallPathAsOfReadsPastField) {
    StoreTool store(engine, nullptr);
    RecallTool recall(engine);

    json first = store.execute({{"key", "cfg"}, {"value", {{"mode", "a"}}}}, ctx);
    store.execute({{"key", "cfg"}, {"path", "$.mode"}, {"value", "b"}}, ctx);

    json past = recall.execute({{"key", "cfg"}, {"path", "$.mode"}, {"as_of", first["timestamp"]}}, ctx);
    EXPECT_EQ(past["value"], "a");
    EXPECT_EQ(recall.execute({{"key", "cfg"}, {"path", "$.mode"}}, ctx)["value"], "b");
}

TEST_F(ToolsTest, RecallAsOfReturnsPastValue) {
    StoreTool store(engine, nullptr);
    RecallTool recall(engine);

    json first = store.execute({{"key", "k"}, {"value", "v1"}}, ctx);
    store.execute({{"key", "k"}, {"value", "v2"}}, ctx);

    json past = recall.execute({{"key", "k"}, {"as_of", first["timestamp"]}}, ctx);
    EXPECT_EQ(past["value"], "v1");
}

TEST_F(ToolsTest, RecallAsOfOutsideRangeIsInvalidArgument) {
    StoreTool store(engine, nullptr);
    RecallTool recall(engine);

    // empty branch
    EXPECT_EQ(invalid_field([&] { recall.execute({{"key", "k"}, {"as_of", 5}}, ctx); }), "as_of");

    json stored = store.execute({{"key", "k"}, {"value", 1}}, ctx);
    uint64_t ts = stored["timestamp"];

    EXPECT_EQ(invalid_field([&] { recall.execute({{"key", "k"}, {"as_of", ts + 1000000}}, ctx); }), "as_of");
    EXPECT_EQ(invalid_field([&] { recall.execute({{"key", "k"}, {"as_of", ts - 1}}, ctx); }), "as_of");
    EXPECT_NO_THROW(recall.execute({{"key", "k"}, {"as_of", ts}}, ctx));
}

TEST_F(ToolsTest, StoreWithAutoEmbedIndexesInBackground) {
    StoreTool store(engine, indexer);
    SearchTool search(engine, 50, 10);
    ctx.auto_embed = true;

    store.execute({{"key", "note"}, {"value", {{"body", "meeting about budgeting"}}}}, ctx);
    indexer->wait_idle();

    EXPECT_EQ(indexer->stats().indexed, 1);
    json result = search.execute({{"query", "budget"}}, ctx);
    ASSERT_EQ(result["results"].size(), 1);
    EXPECT_EQ(result["results"][0]["key"], "note");
}

TEST_F(ToolsTest, StoreSkipsIndexingWithoutText) {
    StoreTool store(engine, indexer);
    ctx.auto_embed = true;

    store.execute({{"key", "n"}, {"value", 42}}, ctx);
    indexer->wait_idle();
    EXPECT_EQ(indexer->stats().queued, 0);
}

TEST_F(ToolsTest, IndexingFailureDoesNotFailStore) {
    StoreTool store(engine, indexer);
    StatusTool status(engine, indexer);
    RecallTool recall(engine);
    engine->fail_indexing = true;
    ctx.auto_embed = true;

    json stored = store.execute({{"key", "k"}, {"value", "some text"}}, ctx);
    EXPECT_EQ(stored["stored"], true);
    indexer->wait_idle();

    EXPECT_EQ(recall.execute({{"key", "k"}}, ctx)["found"], true);

    json report = status.execute(json::object(), ctx);
    EXPECT_EQ(report["indexing"]["failed"], 1);
    EXPECT_TRUE(report["indexing"].contains("last_error"));
}

TEST_F(ToolsTest, SearchClampsK) {
    StoreTool store(engine, nullptr);
    SearchTool search(engine, 3, 2);

    for (int i = 0; i < 10; ++i) {
        store.execute({{"key", "doc" + std::to_string(i)}, {"value", "common term"}}, ctx);
    }

    json clamped = search.execute({{"query", "common"}, {"k", 1000}}, ctx);
    EXPECT_EQ(clamped["k"], 3);
    EXPECT_EQ(clamped["results"].size(), 3);

    json defaulted = search.execute({{"query", "common"}}, ctx);
    EXPECT_EQ(defaulted["results"].size(), 2);

    for (const auto& hit : clamped["results"]) {
        EXPECT_TRUE(hit.contains("key"));
        EXPECT_TRUE(hit.contains("value"));
        EXPECT_TRUE(hit.contains("score"));
        EXPECT_TRUE(hit.contains("snippet"));
    }
}

TEST_F(ToolsTest, SearchUsesCallNamespace) {
    StoreTool store(engine, nullptr);
    SearchTool search(engine, 10, 10);

    CallContext other = ctx;
    other.ns = "other";
    store.execute({{"key", "k"}, {"value", "findable words"}}, other);

    EXPECT_TRUE(search.execute({{"query", "findable"}}, ctx)["results"].empty());
    EXPECT_EQ(search.execute({{"query", "findable"}}, other)["results"].size(), 1);
}

TEST_F(ToolsTest, ForgetPreservesHistory) {
    StoreTool store(engine, nullptr);
    RecallTool recall(engine);
    ForgetTool forget(engine);
    HistoryTool history(engine);

    store.execute({{"key", "k"}, {"value", 1}}, ctx);
    store.execute({{"key", "k"}, {"value", 2}}, ctx);

    EXPECT_EQ(forget.execute({{"key", "k"}}, ctx)["deleted"], true);
    EXPECT_EQ(recall.execute({{"key", "k"}}, ctx)["found"], false);
    EXPECT_EQ(history.execute({{"key", "k"}}, ctx)["versions"].size(), 2);

    EXPECT_EQ(forget.execute({{"key", "k"}}, ctx)["deleted"], false);
    EXPECT_EQ(forget.execute({{"key", "never-stored"}}, ctx)["deleted"], false);
}

TEST_F(ToolsTest, LogSequencesIncrease) {
    LogTool log(engine);

    json first = log.execute({{"event", "decision"}, {"data", {{"choice", "a"}}}}, ctx);
    json second = log.execute({{"event", "decision"}, {"data", nullptr}}, ctx);

    EXPECT_EQ(first["logged"], true);
    EXPECT_LT(first["sequence"].get<uint64_t>(), second["sequence"].get<uint64_t>());
    EXPECT_LT(first["timestamp"].get<uint64_t>(), second["timestamp"].get<uint64_t>());
}

TEST_F(ToolsTest, HistoryListsVersionsOldestFirst) {
    StoreTool store(engine, nullptr);
    HistoryTool history(engine);

    constexpr int kWrites = 4;
    for (int i = 0; i < kWrites; ++i) {
        store.execute({{"key", "k"}, {"value", i}}, ctx);
    }

    json result = history.execute({{"key", "k"}}, ctx);
    const json& versions = result["versions"];
    ASSERT_EQ(versions.size(), kWrites);
    for (int i = 0; i < kWrites; ++i) {
        EXPECT_EQ(versions[i]["value"], i);
        if (i > 0) {
            EXPECT_LT(versions[i - 1]["timestamp"].get<uint64_t>(), versions[i]["timestamp"].get<uint64_t>());
        }
    }
}

TEST_F(ToolsTest, HistoryAsOfFiltersVersions) {
    StoreTool store(engine, nullptr);
    HistoryTool history(engine);

    json first = store.execute({{"key", "k"}, {"value", "a"}}, ctx);
    store.execute({{"key", "k"}, {"value", "b"}}, ctx);

    json result = history.execute({{"key", "k"}, {"as_of", first["timestamp"]}}, ctx);
    ASSERT_EQ(result["versions"].size(), 1);
    EXPECT_EQ(result["versions"][0]["value"], "a");

    EXPECT_EQ(invalid_field([&] { history.execute({{"as_of", first["timestamp"]}}, ctx); }), "as_of");
}

TEST_F(ToolsTest, HistoryWithoutKeyReturnsTimeRange) {
    StoreTool store(engine, nullptr);
    LogTool log(engine);
    HistoryTool history(engine);

    json empty = history.execute(json::object(), ctx);
    EXPECT_EQ(empty["branch"], "default");
    EXPECT_TRUE(empty["oldest"].is_null());
    EXPECT_TRUE(empty["latest"].is_null());

    json stored = store.execute({{"key", "k"}, {"value", 1}}, ctx);
    json logged = log.execute({{"event", "e"}, {"data", 1}}, ctx);

    json range = history.execute(json::object(), ctx);
    EXPECT_EQ(range["oldest"], stored["timestamp"]);
    EXPECT_EQ(range["latest"], logged["timestamp"]);
}

TEST_F(ToolsTest, StatusReportsSessionAndCounts) {
    StoreTool store(engine, nullptr);
    StatusTool status(engine, nullptr);

    store.execute({{"key", "a"}, {"value", 1}}, ctx);
    store.execute({{"key", "b"}, {"value", 2}}, ctx);

    CallContext read_only_ctx{"default", "notes", true, false};
    json report = status.execute(json::object(), read_only_ctx);

    EXPECT_FALSE(report["version"].get<std::string>().empty());
    EXPECT_EQ(report["branch"], "default");
    EXPECT_EQ(report["namespace"], "notes");
    EXPECT_EQ(report["read_only"], true);
    EXPECT_EQ(report["auto_embed"], false);
    EXPECT_EQ(report["branches"], 1);
    EXPECT_EQ(report["keys"], 2);
    EXPECT_EQ(report["events"], 0);
    EXPECT_EQ(report["indexing"]["enabled"], false);
}

TEST_F(ToolsTest, EngineFailuresPropagateAsEngineErrors) {
    RecallTool recall(engine);
    engine->fail_everything = EngineErrc::Unavailable;

    try {
        recall.execute({{"key", "k"}}, ctx);
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), EngineErrc::Unavailable);
    }
}
