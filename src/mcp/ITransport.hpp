#pragma once

#include <optional>
#include <string>

namespace strata_mcp {

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations move raw JSON-RPC frames; parsing and validation
 * belong to EnvelopeCodec so that malformed input can still be answered.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next frame from transport
     * @return Frame text (possibly empty) or std::nullopt on EOF/error
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * @brief Write one frame to transport
     * @param frame Serialized JSON-RPC message without trailing newline
     */
    virtual void write_message(const std::string& frame) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace strata_mcp
