#pragma once

#include "Envelope.hpp"
#include "ITransport.hpp"
#include "ToolDispatcher.hpp"
#include "ToolRegistry.hpp"
#include "core/SessionContext.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata_mcp {

using json = nlohmann::json;

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Handles tool registration and request routing.
 * Supports methods: initialize, ping, tools/list, tools/call
 * and notifications/*.
 *
 * With workers == 0 requests are handled on the reading thread in
 * arrival order. Otherwise they are handed to a worker pool and
 * responses may be written out of order; each carries its request id.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param session Session shared with the tool handlers
     * @param surface Tool catalog exposed to clients
     * @param workers Number of request worker threads (0 = sequential)
     */
    MCPServer(std::unique_ptr<ITransport> transport,
              std::shared_ptr<SessionContext> session,
              ToolSurface surface = ToolSurface::Agent,
              std::size_t workers = 0);
    ~MCPServer();

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Start server main loop
     *
     * Seals the tool registry, then blocks until stop() is called or the
     * transport reaches EOF. In-flight requests finish before returning.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     */
    void stop();

private:
    /**
     * @brief Decode one frame, handle it and write the response if any
     *
     * Never throws. Frames without a recoverable id that fail to decode
     * are logged and dropped.
     */
    void process_frame(const std::string& frame);

    /**
     * @brief Route a decoded request
     * @return Response, or std::nullopt for notifications
     */
    std::optional<ResponseEnvelope> handle_request(const RequestEnvelope& request);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info
     * @return Server capabilities and info
     */
    json handle_initialize(const json& params);

    /**
     * @brief Handle tools/list method
     * @return JSON array of available tools with schemas
     */
    json handle_tools_list() const;

    /**
     * @brief Handle tools/call method
     * @param params Request parameters with tool name and arguments
     * @return Tool execution result wrapped as MCP content
     */
    json handle_tools_call(const json& params);

    void handle_notification(const std::string& method);

    void send(const ResponseEnvelope& response);

    void start_workers();
    void stop_workers();
    void worker_loop();

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<SessionContext> session_;
    ToolRegistry registry_;
    ToolDispatcher dispatcher_;
    ToolSurface surface_;
    std::size_t worker_count_;
    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};

    std::mutex write_mutex_;

    std::vector<std::thread> workers_;
    std::queue<std::string> pending_frames_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool workers_stopping_ = false;
};

} // namespace strata_mcp
