#pragma once

#include "ITransport.hpp"
#include <iostream>
#include <mutex>

namespace strata_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads newline-delimited frames from stdin.
 * Writes one frame per line to stdout with flush; writes are serialized
 * so concurrent workers never interleave partial lines.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<std::string> read_message() override;
    void write_message(const std::string& frame) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
};

} // namespace strata_mcp
