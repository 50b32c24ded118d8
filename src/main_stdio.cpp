#include "core/IndexingQueue.hpp"
#include "core/LocalEngine.hpp"
#include "core/ServerConfig.hpp"
#include "core/SessionContext.hpp"
#include "core/Version.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/AgentTools.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

namespace {
    std::atomic<bool> shutdown_requested{false};
    strata_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    // stdout carries the protocol, so every log line goes to stderr
    void setup_logging() {
        auto logger = spdlog::stderr_color_mt("strata");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    }

    spdlog::level::level_enum level_for_verbosity(int verbosity) {
        switch (verbosity) {
            case 0: return spdlog::level::warn;
            case 1: return spdlog::level::info;
            case 2: return spdlog::level::debug;
            default: return spdlog::level::trace;
        }
    }
}

int main(int argc, char** argv) {
    CLI::App app{"strata-mcp - MCP server for a versioned, branchable document store"};

    strata_mcp::ServerConfig config;

    std::string data_dir;
    app.add_option("--db", data_dir, "Data directory; state is loaded from and saved to it");

    app.add_flag("--cache", config.in_memory, "Keep everything in memory (ignores --db)");
    app.add_flag("--read-only", config.read_only, "Reject every tool that writes");
    app.add_flag("--auto-embed", config.auto_embed, "Index text of stored values for semantic search");

    app.add_option("--namespace", config.default_namespace, "Default namespace of the session")
        ->default_val("default");
    app.add_option("--max-results", config.max_search_results, "Upper bound for search results")
        ->default_val(50)
        ->check(CLI::PositiveNumber);
    app.add_option("--workers", config.workers, "Request worker threads (0 = sequential)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    int verbosity = 0;
    app.add_flag("-v,--verbose", verbosity, "Increase log verbosity (-v info, -vv debug, -vvv trace)");

    std::string log_level;
    app.add_option("--log-level", log_level,
                   "Log level (trace, debug, info, warn, error, critical, off); overrides -v");

    bool version = false;
    app.add_flag("--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << strata_mcp::kServerName << " version " << strata_mcp::kServerVersion << std::endl;
        return 0;
    }

    setup_logging();

    if (log_level.empty()) {
        spdlog::set_level(level_for_verbosity(verbosity));
    } else {
        auto level = spdlog::level::from_str(log_level);
        // from_str maps unknown names to off
        if (level == spdlog::level::off && log_level != "off") {
            std::cerr << "Invalid log level: " << log_level << std::endl;
            return 1;
        }
        spdlog::set_level(level);
    }

    if (!data_dir.empty() && !config.in_memory) {
        config.data_dir = data_dir;
    }

    spdlog::info("Starting {} {}", strata_mcp::kServerName, strata_mcp::kServerVersion);
    spdlog::info("Storage: {}", config.data_dir ? *config.data_dir : std::string("in-memory"));

    try {
        setup_signal_handlers();

        strata_mcp::EngineOptions engine_options;
        if (config.data_dir) {
            engine_options.data_dir = *config.data_dir;
        }
        engine_options.read_only = config.read_only;

        auto engine = std::make_shared<strata_mcp::LocalEngine>(engine_options);
        auto session = std::make_shared<strata_mcp::SessionContext>(
            config.read_only, config.auto_embed, config.default_namespace);

        std::shared_ptr<strata_mcp::IndexingQueue> indexer;
        if (config.auto_embed) {
            indexer = std::make_shared<strata_mcp::IndexingQueue>(engine);
        }

        auto transport = std::make_unique<strata_mcp::StdioTransport>();
        auto server = std::make_unique<strata_mcp::MCPServer>(
            std::move(transport), session, strata_mcp::ToolSurface::Agent, config.workers);

        global_server = server.get();

        strata_mcp::register_agent_tools(*server, engine, session, indexer, config);

        spdlog::info("All tools registered, starting server");

        // Run server (blocks until stopped or stdin closes)
        server->run();

        global_server = nullptr;
        if (indexer) {
            indexer->wait_idle();
        }
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        global_server = nullptr;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
