#include "Envelope.hpp"
#include <spdlog/spdlog.h>

namespace strata_mcp {

namespace {

/**
 * @brief SAX consumer that remembers the top-level "id" seen before a parse error
 *
 * Only keys of the outermost object count, so ids nested in params are ignored.
 */
class IdRecoveryHandler : public nlohmann::json_sax<json> {
public:
    std::optional<json> id;
    std::size_t error_position = 0;

    bool null() override { return scalar(json()); }
    bool boolean(bool value) override { return scalar(value); }
    bool number_integer(number_integer_t value) override { return scalar(value); }
    bool number_unsigned(number_unsigned_t value) override { return scalar(value); }
    bool number_float(number_float_t value, const string_t&) override { return scalar(value); }
    bool string(string_t& value) override { return scalar(value); }
    bool binary(binary_t&) override { return scalar(json()); }

    bool start_object(std::size_t) override { return open(); }
    bool end_object() override { return close(); }
    bool start_array(std::size_t) override { return open(); }
    bool end_array() override { return close(); }

    bool key(string_t& name) override {
        expecting_id_ = depth_ == 1 && name == "id";
        return true;
    }

    bool parse_error(std::size_t position, const std::string&, const json::exception&) override {
        error_position = position;
        return false;
    }

private:
    bool scalar(json value) {
        if (expecting_id_ && depth_ == 1) {
            id = std::move(value);
        }
        expecting_id_ = false;
        return true;
    }

    bool open() {
        expecting_id_ = false;
        depth_++;
        return true;
    }

    bool close() {
        depth_--;
        return true;
    }

    std::size_t depth_ = 0;
    bool expecting_id_ = false;
};

} // namespace

ResponseEnvelope ResponseEnvelope::success(json id, json result) {
    ResponseEnvelope response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

ResponseEnvelope ResponseEnvelope::failure(json id, ClassifiedError error) {
    ResponseEnvelope response;
    response.id = std::move(id);
    response.error = std::move(error);
    return response;
}

RequestEnvelope EnvelopeCodec::decode(const std::string& frame) {
    json message;
    try {
        message = json::parse(frame);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("Parse error: ") + e.what(), recover_id(frame));
    }

    if (!message.is_object()) {
        throw DecodeError("Invalid Request: expected a JSON object", std::nullopt);
    }

    RequestEnvelope request;
    if (message.contains("id")) {
        if (!is_valid_id(message["id"])) {
            throw DecodeError("Invalid Request: id must be a string or an integer", std::nullopt);
        }
        request.id = message["id"];
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != kJsonRpcVersion) {
        throw DecodeError("Invalid Request: missing or unsupported jsonrpc version", request.id);
    }

    if (!message.contains("method") || !message["method"].is_string() ||
        message["method"].get_ref<const std::string&>().empty()) {
        throw DecodeError("Invalid Request: method must be a non-empty string", request.id);
    }
    request.method = message["method"].get<std::string>();

    if (message.contains("params") && !message["params"].is_null()) {
        if (!message["params"].is_object()) {
            throw DecodeError("Invalid Request: params must be an object", request.id);
        }
        request.params = message["params"];
    }

    return request;
}

std::string EnvelopeCodec::encode(const ResponseEnvelope& response) {
    json message = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", response.id}
    };

    if (response.error) {
        message["error"] = response.error->to_json();
    } else {
        message["result"] = response.result.value_or(json::object());
    }

    // Invalid UTF-8 from stored values is replaced rather than thrown
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<json> EnvelopeCodec::recover_id(const std::string& frame) {
    IdRecoveryHandler handler;
    json::sax_parse(frame, &handler);

    if (!handler.id || !is_valid_id(*handler.id)) {
        spdlog::debug("No request id before parse error at byte {}", handler.error_position);
        return std::nullopt;
    }
    return handler.id;
}

bool EnvelopeCodec::is_valid_id(const json& id) {
    return id.is_string() || id.is_number_integer();
}

} // namespace strata_mcp
