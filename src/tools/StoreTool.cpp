#include "StoreTool.hpp"
#include "ToolArgs.hpp"
#include "core/TextExtractor.hpp"
#include "mcp/ToolError.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace strata_mcp {

StoreTool::StoreTool(std::shared_ptr<StorageEngine> engine, std::shared_ptr<IndexingQueue> indexer)
    : engine_(std::move(engine)), indexer_(std::move(indexer)) {
    if (!engine_) {
        throw std::invalid_argument("Engine cannot be null");
    }
}

ToolInfo StoreTool::get_info() {
    return ToolInfo{
        .name = "strata_store",
        .description = "Store a JSON document by key. Use this whenever you need to persist structured data: "
                       "configuration, user profiles, conversation state, analysis results, or anything you "
                       "will need later. The value can be any JSON type. Every write is versioned, so nothing "
                       "is ever lost; earlier versions stay reachable through strata_history and 'as_of'. "
                       "Use the optional 'path' with JSONPath syntax (e.g. '$.settings.theme') to update a "
                       "nested field without overwriting the whole document; omit it to store the entire value. "
                       "Optional 'tags' label the document for filtered search. When auto-embed is enabled, "
                       "text content is indexed for semantic search via strata_search. "
                       "Returns { key, version, timestamp, stored: true }.",
        .input_schema = {
            {"type", "object"},
            {"properties", {
                {"key", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Document key"}
                }},
                {"value", {
                    {"description", "Any JSON value to store"}
                }},
                {"path", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "JSONPath of the member to update, e.g. '$.settings.theme' (default '$')"}
                }},
                {"tags", {
                    {"type", "array"},
                    {"items", {{"type", "string"}}},
                    {"description", "Labels for filtering in strata_search"}
                }},
                {"namespace", {
                    {"type", "string"},
                    {"minLength", 1},
                    {"description", "Namespace for this call only (default: session namespace)"}
                }}
            }},
            {"required", json::array({"key", "value"})}
        },
        .annotations = {.read_only = false, .destructive = false, .idempotent = true}
    };
}

json StoreTool::execute(const json& args, const CallContext& ctx) {
    std::string key = args::required_string(args, "key");
    args::JsonPath path = args::json_path(args, "path");
    auto tags = args::string_list(args, "tags");

    json document = args.at("value");
    WriteReceipt receipt;
    if (path.is_root()) {
        spdlog::debug("StoreTool: {}/{} on branch {}", ctx.ns, key, ctx.branch);
        receipt = engine_->put(ctx.branch, ctx.ns, key, document, tags);
    } else {
        spdlog::debug("StoreTool: {}/{} {} on branch {}", ctx.ns, key, path.text, ctx.branch);
        std::lock_guard<std::mutex> lock(update_mutex_);

        auto current = engine_->get(ctx.branch, ctx.ns, key, std::nullopt);
        document = current ? current->value : json::object();
        if (current && !args.contains("tags")) {
            tags = current->tags;
        }

        json* node = &document;
        for (const auto& field : path.fields) {
            if (node->is_null()) {
                *node = json::object();
            }
            if (!node->is_object()) {
                throw ToolError::invalid_argument("path",
                    "cannot set '" + path.text + "': parent of '" + field + "' is not an object");
            }
            node = &(*node)[field];
        }
        *node = args.at("value");

        receipt = engine_->put(ctx.branch, ctx.ns, key, document, tags);
    }

    if (ctx.auto_embed && indexer_) {
        std::string text = TextExtractor::extract(document);
        if (!text.empty()) {
            indexer_->enqueue(ctx.branch, ctx.ns, key, std::move(text));
        }
    }

    return {
        {"key", key},
        {"version", receipt.version},
        {"timestamp", receipt.timestamp},
        {"stored", true}
    };
}

} // namespace strata_mcp
