#pragma once

#include "ToolError.hpp"
#include "core/StorageEngine.hpp"
#include <exception>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace strata_mcp {

using json = nlohmann::json;

/**
 * @brief Error in its wire-ready form
 */
struct ClassifiedError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::string field;  // empty unless an argument is at fault

    /**
     * @brief JSON-RPC error object: {code, message, data: {kind, field?}}
     */
    json to_json() const;
};

/**
 * @brief Single conversion point from internal failures to ClassifiedError
 */
class ErrorClassifier {
public:
    /**
     * @brief Classify any exception. Total: unknown types become Internal.
     */
    static ClassifiedError classify(std::exception_ptr error);

    static ErrorKind kind_for(EngineErrc code);

    /**
     * @brief Stable JSON-RPC error code for a kind
     */
    static int code_for(ErrorKind kind);

    static std::string_view to_string(ErrorKind kind);
};

} // namespace strata_mcp
