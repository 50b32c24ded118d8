#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata_mcp {

using json = nlohmann::json;

/**
 * @brief Helpers for turning stored JSON values into searchable text
 */
class TextExtractor {
public:
    /**
     * @brief Collect every string leaf of a JSON value, joined by spaces
     *
     * Object keys are not included. Numbers and booleans are ignored.
     * @return Extracted text (empty when the value holds no strings)
     */
    static std::string extract(const json& value);

    /**
     * @brief Split text into lowercase alphanumeric terms
     */
    static std::vector<std::string> tokenize(const std::string& text);

    /**
     * @brief Short excerpt of text around the first occurrence of any term
     * @param text Source text
     * @param terms Lowercase search terms
     * @param width Maximum excerpt length in characters
     */
    static std::string snippet(const std::string& text, const std::vector<std::string>& terms,
                               std::size_t width = 120);

private:
    static void collect(const json& value, std::string& out);
};

} // namespace strata_mcp
