#include "SearchTool.hpp"
#include "ToolArgs.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace strata_mcp {

SearchTool::SearchTool(std::shared_ptr<StorageEngine> engine, std::size_t max_results, std::size_t default_k)
    : engine_(std::move(engine)),
      max_results_(max_results),
      default_k_(std::min(default_k, max_results)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
    if (max_results_ == 0) {
        throw std::invalid_argument("Maximum search results must be at least 1");
    }
}

ToolInfo SearchTool::get_info() {
    return ToolInfo{
        .name = "strata_search",
        .description = "Find relevant data across everything stored using natural language. Use this when "
                       "you don't know the exact key: describe what you're looking for and get ranked "
                       "results. Uses keyword matching, plus semantic similarity for documents indexed while "
                       "auto-embed is enabled. Optional 'tags' keep only documents carrying every listed tag. "
                       "Returns { results: [ { key, value, score, snippet } ] }, most relevant first. "
                       "'k' controls how many results to return (default 10, capped by the server).",
        .input_schema = {
            {"type", "object"},
            {"properties", {
                {"query", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Natural-language query"}
                }},
                {"k", {
                    {"type", "integer"},
                    {"minimum", 1},
                    {"description", "Maximum number of results"}
                }},
                {"tags", {
                    {"type", "array"},
                    {"items", {{"type", "string"}}},
                    {"description", "Only documents carrying all of these tags"}
                }},
                {"namespace", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Namespace for this call only (default: session namespace)"}
                }}
            }},
            {"required", json::array({"query"})}
        },
        .annotations = {.read_only = true, .destructive = false, .idempotent = true}
    };
}

json SearchTool::execute(const json& args, const CallContext& ctx) {
    std::string query = args::required_string(args, "query");
    auto tags = args::string_list(args, "tags");

    std::size_t k = default_k_;
    if (auto requested = args::optional_u64(args, "k")) {
        k = static_cast<std::size_t>(std::min<uint64_t>(*requested, max_results_));
    }

    spdlog::debug("SearchTool: '{}' in {} (k={})", query, ctx.ns, k);
    auto hits = engine_->search(ctx.branch, ctx.ns, query, k, tags);

    // Engines may report more than k hits
    if (hits.size() > k) {
        hits.resize(k);
    }

    json results = json::array();
    for (const auto& hit : hits) {
        results.push_back({
            {"key", hit.key},
            {"value", hit.value},
            {"score", hit.score},
            {"snippet", hit.snippet}
        });
    }

    return {
        {"query", query},
        {"k", k},
        {"results", results}
    };
}

} // namespace strata_mcp
