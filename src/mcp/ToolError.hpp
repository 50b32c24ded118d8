#pragma once

#include <stdexcept>
#include <string>

namespace strata_mcp {

/**
 * @brief Closed set of error kinds visible to MCP clients
 */
enum class ErrorKind {
    ParseError,
    MethodNotFound,
    ToolNotFound,
    InvalidArgument,
    AccessDenied,
    NotFound,
    EngineError,
    Internal
};

/**
 * @brief Failure raised by the dispatcher or a tool handler
 *
 * Carries the kind it should be reported as and, for argument
 * failures, the name of the offending field.
 */
class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message, std::string field = {})
        : std::runtime_error(message), kind_(kind), field_(std::move(field)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& field() const noexcept { return field_; }

    static ToolError invalid_argument(const std::string& field, const std::string& reason) {
        return ToolError(ErrorKind::InvalidArgument, "Invalid argument '" + field + "': " + reason, field);
    }

    static ToolError missing_argument(const std::string& field) {
        return ToolError(ErrorKind::InvalidArgument, "Missing required argument: " + field, field);
    }

private:
    ErrorKind kind_;
    std::string field_;
};

} // namespace strata_mcp
