#include "MCPServer.hpp"
#include "ErrorClassifier.hpp"
#include "ToolError.hpp"
#include "core/Version.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <stdexcept>

namespace strata_mcp {

namespace {

constexpr std::array<const char*, 3> kSupportedProtocolVersions = {
    "2024-11-05", "2025-03-26", "2025-06-18"
};

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     std::shared_ptr<SessionContext> session,
                     ToolSurface surface,
                     std::size_t workers)
    : transport_(std::move(transport)),
      session_(std::move(session)),
      dispatcher_(registry_, session_, surface),
      surface_(surface),
      worker_count_(workers) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized ({} surface, {} workers)",
                 surface_ == ToolSurface::Agent ? "agent" : "developer", worker_count_);
}

MCPServer::~MCPServer() {
    stop_workers();
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    registry_.add(info, std::move(handler));
}

void MCPServer::run() {
    registry_.seal();
    running_ = true;
    start_workers();
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        std::optional<std::string> frame;
        try {
            frame = transport_->read_message();
        } catch (const std::exception& e) {
            spdlog::error("Error reading from transport: {}", e.what());
            break;
        }

        if (!frame) {
            spdlog::info("Transport closed, stopping server");
            break;
        }
        if (frame->empty()) {
            continue;
        }

        if (workers_.empty()) {
            process_frame(*frame);
        } else {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                pending_frames_.push(std::move(*frame));
            }
            queue_cv_.notify_one();
        }
    }

    stop_workers();
    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

void MCPServer::process_frame(const std::string& frame) {
    try {
        RequestEnvelope request = EnvelopeCodec::decode(frame);
        auto response = handle_request(request);
        if (response) {
            send(*response);
        }
    } catch (const DecodeError& e) {
        if (e.id()) {
            spdlog::warn("Malformed request {}: {}", e.id()->dump(), e.what());
            send(ResponseEnvelope::failure(*e.id(), ErrorClassifier::classify(std::current_exception())));
        } else {
            spdlog::warn("Dropping malformed frame without recoverable id: {}", e.what());
        }
    } catch (const std::exception& e) {
        spdlog::error("Error processing frame: {}", e.what());
    }
}

std::optional<ResponseEnvelope> MCPServer::handle_request(const RequestEnvelope& request) {
    const std::string& method = request.method;
    spdlog::debug("Handling request: method={}, id={}", method,
                  request.id ? request.id->dump() : std::string("none"));

    try {
        json result;
        if (method == "initialize") {
            result = handle_initialize(request.params);
        } else if (method == "ping") {
            result = json::object();
        } else if (method == "tools/list") {
            result = handle_tools_list();
        } else if (method == "tools/call") {
            result = handle_tools_call(request.params);
        } else if (method.rfind("notifications/", 0) == 0) {
            handle_notification(method);
            result = json::object();
        } else {
            throw ToolError(ErrorKind::MethodNotFound, "Method not found: " + method);
        }

        if (request.is_notification()) {
            return std::nullopt;
        }
        return ResponseEnvelope::success(*request.id, std::move(result));
    } catch (...) {
        ClassifiedError error = ErrorClassifier::classify(std::current_exception());
        if (error.kind == ErrorKind::Internal) {
            spdlog::error("Error handling method {}: {}", method, error.message);
        } else {
            spdlog::warn("{} in method {}: {}", ErrorClassifier::to_string(error.kind), method, error.message);
        }

        if (request.is_notification()) {
            return std::nullopt;
        }
        return ResponseEnvelope::failure(*request.id, std::move(error));
    }
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    // Extract client info if provided
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        std::string client_name = params["clientInfo"].value("name", "unknown");
        std::string client_version = params["clientInfo"].value("version", "unknown");
        spdlog::info("Client: {} version {}", client_name, client_version);
    }

    std::string protocol_version = kSupportedProtocolVersions.front();
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        const auto& requested = params["protocolVersion"].get_ref<const std::string&>();
        auto it = std::find(kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(), requested);
        if (it != kSupportedProtocolVersions.end()) {
            protocol_version = *it;
        }
    }

    initialized_ = true;

    return {
        {"protocolVersion", protocol_version},
        {"capabilities", {
            {"tools", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", kServerName},
            {"version", kServerVersion}
        }}
    };
}

json MCPServer::handle_tools_list() const {
    json tools_array = json::array();

    for (const ToolInfo* info : registry_.list(surface_)) {
        tools_array.push_back(ToolRegistry::describe(*info));
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params) {
    if (!params.contains("name")) {
        throw ToolError::missing_argument("name");
    }
    if (!params["name"].is_string()) {
        throw ToolError::invalid_argument("name", "expected string");
    }

    std::string tool_name = params["name"];
    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    json result = dispatcher_.call(tool_name, arguments);

    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.dump(-1, ' ', false, json::error_handler_t::replace)}
            }
        })}
    };
}

void MCPServer::handle_notification(const std::string& method) {
    if (method == "notifications/initialized") {
        spdlog::info("Client sent initialized notification, server is ready");
    } else {
        spdlog::debug("Ignoring notification: {}", method);
    }
}

void MCPServer::send(const ResponseEnvelope& response) {
    std::string frame = EnvelopeCodec::encode(response);
    std::lock_guard<std::mutex> lock(write_mutex_);
    transport_->write_message(frame);
}

void MCPServer::start_workers() {
    if (worker_count_ == 0 || !workers_.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        workers_stopping_ = false;
    }
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&MCPServer::worker_loop, this);
    }
}

void MCPServer::stop_workers() {
    if (workers_.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        workers_stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void MCPServer::worker_loop() {
    while (true) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return workers_stopping_ || !pending_frames_.empty(); });
            // Pending frames are still answered after a stop request
            if (pending_frames_.empty()) {
                return;
            }
            frame = std::move(pending_frames_.front());
            pending_frames_.pop();
        }
        process_frame(frame);
    }
}

} // namespace strata_mcp
