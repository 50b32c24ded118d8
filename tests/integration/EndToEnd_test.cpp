#include "core/CountingEngine.hpp"
#include "core/IndexingQueue.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/AgentTools.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <sstream>

using namespace strata_mcp;
using json = nlohmann::json;

/**
 * @brief Drives a fully wired server through newline-delimited stdio frames
 */
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<CountingEngine>();
    }

    void SendRequest(const json& request) {
        input_ << request.dump() << "\n";
    }

    void SendRaw(const std::string& line) {
        input_ << line << "\n";
    }

    int Call(const std::string& tool, const json& arguments = json::object()) {
        int id = next_id_++;
        SendRequest({
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", "tools/call"},
            {"params", {{"name", tool}, {"arguments", arguments}}}
        });
        return id;
    }

    /**
     * @brief Run the server over everything sent so far and collect responses by id
     */
    void Run(bool read_only = false, std::size_t max_results = 50, std::size_t workers = 0) {
        config.read_only = read_only;
        config.max_search_results = max_results;
        config.workers = workers;

        session = std::make_shared<SessionContext>(read_only, config.auto_embed, config.default_namespace);
        std::shared_ptr<IndexingQueue> indexer;
        if (config.auto_embed) {
            indexer = std::make_shared<IndexingQueue>(engine);
        }

        std::istringstream in(input_.str());
        std::ostringstream out;
        {
            MCPServer server(std::make_unique<StdioTransport>(in, out), session, ToolSurface::Agent, workers);
            register_agent_tools(server, engine, session, indexer, config);
            server.run();
        }
        if (indexer) {
            indexer->wait_idle();
        }

        std::istringstream lines(out.str());
        std::string line;
        while (std::getline(lines, line)) {
            if (line.empty()) {
                continue;
            }
            json response = json::parse(line);
            line_count_++;
            responses_[response["id"].dump()] = response;
        }
    }

    json Response(int id) const {
        auto it = responses_.find(json(id).dump());
        if (it == responses_.end()) {
            ADD_FAILURE() << "no response for id " << id;
            return json();
        }
        return it->second;
    }

    json Result(int id) const {
        json response = Response(id);
        EXPECT_TRUE(response.contains("result")) << response.dump();
        return json::parse(response["result"]["content"][0]["text"].get<std::string>());
    }

    json Error(int id) const {
        json response = Response(id);
        EXPECT_TRUE(response.contains("error")) << response.dump();
        return response["error"];
    }

    std::shared_ptr<CountingEngine> engine;
    std::shared_ptr<SessionContext> session;
    ServerConfig config;
    std::size_t line_count_ = 0;

private:
    std::ostringstream input_;
    std::map<std::string, json> responses_;
    int next_id_ = 100;
};

TEST_F(EndToEndTest, HandshakeAndToolCatalog) {
    SendRequest({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                 {"params", {{"protocolVersion", "2025-06-18"}}}});
    SendRequest({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    SendRequest({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});

    Run();

    EXPECT_EQ(Response(1)["result"]["protocolVersion"], "2025-06-18");
    EXPECT_EQ(line_count_, 2);

    json listed = Response(2);
    const json& tools = listed["result"]["tools"];
    std::vector<std::string> names;
    for (const auto& tool : tools) {
        names.push_back(tool["name"].get<std::string>());
        EXPECT_TRUE(tool.contains("inputSchema"));
        EXPECT_TRUE(tool["annotations"].contains("readOnlyHint"));
    }
    std::vector<std::string> expected{
        "strata_store", "strata_recall", "strata_search", "strata_forget",
        "strata_log", "strata_branch", "strata_history", "strata_status"
    };
    EXPECT_EQ(names, expected);
}

TEST_F(EndToEndTest, ResponseIdsMatchRequestIds) {
    SendRequest({{"jsonrpc", "2.0"}, {"id", "alpha"}, {"method", "ping"}});
    int status = Call("strata_status");
    int missing = Call("strata_nope");

    Run();

    EXPECT_EQ(Response(status)["id"], status);
    EXPECT_EQ(Response(missing)["id"], missing);
    EXPECT_EQ(Error(missing)["data"]["kind"], "ToolNotFound");
    EXPECT_EQ(line_count_, 3);
}

TEST_F(EndToEndTest, StoreThenRecall) {
    int stored = Call("strata_store", {{"key", "k"}, {"value", "v"}});
    int recalled = Call("strata_recall", {{"key", "k"}});

    Run();

    json store_result = Result(stored);
    json recall_result = Result(recalled);
    EXPECT_EQ(recall_result["value"], "v");
    EXPECT_GE(recall_result["version"].get<uint64_t>(), store_result["version"].get<uint64_t>());
}

TEST_F(EndToEndTest, HistoryAfterSequentialStores) {
    constexpr int kStores = 5;
    for (int i = 0; i < kStores; ++i) {
        Call("strata_store", {{"key", "k"}, {"value", i}});
    }
    int history = Call("strata_history", {{"key", "k"}});

    Run();

    const json versions = Result(history)["versions"];
    ASSERT_EQ(versions.size(), kStores);
    for (int i = 1; i < kStores; ++i) {
        EXPECT_LT(versions[i - 1]["timestamp"].get<uint64_t>(), versions[i]["timestamp"].get<uint64_t>());
        EXPECT_EQ(versions[i]["value"], i);
    }
}

TEST_F(EndToEndTest, ForgetKeepsHistory) {
    Call("strata_store", {{"key", "k"}, {"value", 1}});
    Call("strata_store", {{"key", "k"}, {"value", 2}});
    int forget = Call("strata_forget", {{"key", "k"}});
    int recall = Call("strata_recall", {{"key", "k"}});
    int history = Call("strata_history", {{"key", "k"}});

    Run();

    EXPECT_EQ(Result(forget)["deleted"], true);
    EXPECT_EQ(Result(recall)["found"], false);
    EXPECT_EQ(Result(history)["versions"].size(), 2);
}

TEST_F(EndToEndTest, BranchIsolation) {
    Call("strata_store", {{"key", "k"}, {"value", 1}});
    Call("strata_branch", {{"action", "fork"}, {"name", "x"}});
    Call("strata_branch", {{"action", "switch"}, {"name", "x"}});
    Call("strata_store", {{"key", "k"}, {"value", 2}});
    Call("strata_branch", {{"action", "switch"}, {"name", "default"}});
    int recall = Call("strata_recall", {{"key", "k"}});

    Run();

    EXPECT_EQ(Result(recall)["value"], 1);
    EXPECT_EQ(session->branch(), "default");
}

TEST_F(EndToEndTest, MergeNonexistentBranch) {
    int merge = Call("strata_branch", {{"action", "merge"}, {"source", "nonexistent"}});
    int status = Call("strata_status");

    Run();

    json error = Error(merge);
    EXPECT_EQ(error["code"], -32602);
    EXPECT_EQ(error["data"]["kind"], "InvalidArgument");
    EXPECT_EQ(error["data"]["field"], "source");
    EXPECT_EQ(Result(status)["branch"], "default");
    EXPECT_EQ(session->branch(), "default");
}

TEST_F(EndToEndTest, SearchIsClampedToConfiguredMaximum) {
    for (int i = 0; i < 12; ++i) {
        Call("strata_store", {{"key", "doc" + std::to_string(i)}, {"value", "matching text"}});
    }
    int search = Call("strata_search", {{"query", "matching"}, {"k", 1000}});

    Run(false, 5);

    EXPECT_EQ(Result(search)["results"].size(), 5);
}

TEST_F(EndToEndTest, MalformedInputDoesNotStopServer) {
    SendRaw("this is not json");
    SendRaw("{\"jsonrpc\": \"2.0\", \"id\": 7, \"method\": ");
    SendRaw("\xc3\x28\xa0\xa1");
    int status = Call("strata_status");

    Run();

    EXPECT_EQ(Error(7)["code"], -32700);
    EXPECT_EQ(Result(status)["branch"], "default");
    EXPECT_EQ(line_count_, 2);
}

TEST_F(EndToEndTest, ReadOnlyRejectsWritesWithoutTouchingEngine) {
    int store = Call("strata_store", {{"key", "k"}, {"value", 1}});
    int forget = Call("strata_forget", {{"key", "k"}});
    int logged = Call("strata_log", {{"event", "e"}, {"data", 1}});
    int branch = Call("strata_branch", {{"action", "list"}});
    int create = Call("strata_branch", {{"action", "create"}, {"name", "b"}});

    Run(true);

    for (int id : {store, forget, logged, branch, create}) {
        json error = Error(id);
        EXPECT_EQ(error["code"], -32002);
        EXPECT_EQ(error["data"]["kind"], "AccessDenied");
    }
    EXPECT_EQ(engine->calls.load(), 0);
    EXPECT_EQ(engine->mutations.load(), 0);
}

TEST_F(EndToEndTest, ReadOnlyStillServesReads) {
    int recall = Call("strata_recall", {{"key", "k"}});
    int status = Call("strata_status");
    int history = Call("strata_history");

    Run(true);

    EXPECT_EQ(Result(recall)["found"], false);
    EXPECT_EQ(Result(status)["read_only"], true);
    EXPECT_TRUE(Result(history)["oldest"].is_null());
    EXPECT_EQ(engine->mutations.load(), 0);
}

TEST_F(EndToEndTest, NamespaceOverrideDoesNotPersist) {
    Call("strata_store", {{"key", "k"}, {"value", "scoped"}, {"namespace", "scratch"}});
    int in_default = Call("strata_recall", {{"key", "k"}});
    int in_scratch = Call("strata_recall", {{"key", "k"}, {"namespace", "scratch"}});
    int status = Call("strata_status");

    Run();

    EXPECT_EQ(Result(in_default)["found"], false);
    EXPECT_EQ(Result(in_scratch)["value"], "scoped");
    EXPECT_EQ(Result(status)["namespace"], "default");
}

TEST_F(EndToEndTest, AsOfOutsideRangeIsInvalidArgument) {
    int empty = Call("strata_recall", {{"key", "k"}, {"as_of", 1}});
    Call("strata_store", {{"key", "k"}, {"value", 1}});
    int future = Call("strata_recall", {{"key", "k"}, {"as_of", std::numeric_limits<int64_t>::max()}});
    int negative = Call("strata_recall", {{"key", "k"}, {"as_of", -5}});

    Run();

    EXPECT_EQ(Error(empty)["data"]["field"], "as_of");
    EXPECT_EQ(Error(future)["data"]["field"], "as_of");
    EXPECT_EQ(Error(negative)["data"]["field"], "as_of");
}

TEST_F(EndToEndTest, AutoEmbedFailureDoesNotFailStore) {
    config.auto_embed = true;
    engine->fail_indexing = true;
    int store = Call("strata_store", {{"key", "k"}, {"value", "text to index"}});
    int status = Call("strata_status");

    Run();

    EXPECT_EQ(Result(store)["stored"], true);

    json indexing = Result(status)["indexing"];
    EXPECT_EQ(indexing["enabled"], true);
    EXPECT_EQ(indexing["queued"], 1);
    EXPECT_EQ(Result(status)["keys"], 1);
}

TEST_F(EndToEndTest, WorkersAnswerEveryRequest) {
    constexpr int kCalls = 40;
    std::vector<int> ids;
    for (int i = 0; i < kCalls; ++i) {
        ids.push_back(Call("strata_store", {{"key", "k" + std::to_string(i)}, {"value", i}}));
    }

    Run(false, 50, 4);

    EXPECT_EQ(line_count_, static_cast<std::size_t>(kCalls));
    for (int id : ids) {
        EXPECT_EQ(Result(id)["stored"], true);
    }
    EXPECT_EQ(engine->introspect().total_keys, static_cast<std::size_t>(kCalls));
}
