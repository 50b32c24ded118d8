#pragma once

#include "ErrorClassifier.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace strata_mcp {

using json = nlohmann::json;

/**
 * @brief Decoded JSON-RPC 2.0 request or notification
 */
struct RequestEnvelope {
    std::optional<json> id;  // absent for notifications
    std::string method;
    json params = json::object();

    bool is_notification() const { return !id.has_value(); }
};

/**
 * @brief Response correlated to a request id; exactly one of result/error is set
 */
struct ResponseEnvelope {
    json id;
    std::optional<json> result;
    std::optional<ClassifiedError> error;

    static ResponseEnvelope success(json id, json result);
    static ResponseEnvelope failure(json id, ClassifiedError error);
};

/**
 * @brief Malformed frame. Carries the request id when it could be recovered.
 */
class DecodeError : public ToolError {
public:
    DecodeError(const std::string& message, std::optional<json> id)
        : ToolError(ErrorKind::ParseError, message), id_(std::move(id)) {}

    const std::optional<json>& id() const noexcept { return id_; }

private:
    std::optional<json> id_;
};

/**
 * @brief Codec between wire frames (one JSON document per line) and envelopes
 */
class EnvelopeCodec {
public:
    static constexpr const char* kJsonRpcVersion = "2.0";

    /**
     * @brief Parse and validate one frame
     * @throws DecodeError on invalid JSON or invalid envelope shape
     */
    static RequestEnvelope decode(const std::string& frame);

    /**
     * @brief Serialize a response; never fails for a well-formed envelope
     */
    static std::string encode(const ResponseEnvelope& response);

    /**
     * @brief Recover the top-level "id" that precedes the parse error in unparseable text
     */
    static std::optional<json> recover_id(const std::string& frame);

    static bool is_valid_id(const json& id);
};

} // namespace strata_mcp
