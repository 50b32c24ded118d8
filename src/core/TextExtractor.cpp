#include "TextExtractor.hpp"
#include <algorithm>
#include <cctype>

namespace strata_mcp {

std::string TextExtractor::extract(const json& value) {
    std::string out;
    collect(value, out);
    return out;
}

void TextExtractor::collect(const json& value, std::string& out) {
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.empty()) {
            return;
        }
        if (!out.empty()) {
            out += ' ';
        }
        out += s;
    } else if (value.is_array()) {
        for (const auto& item : value) {
            collect(item, out);
        }
    } else if (value.is_object()) {
        for (const auto& [key, item] : value.items()) {
            collect(item, out);
        }
    }
}

std::vector<std::string> TextExtractor::tokenize(const std::string& text) {
    std::vector<std::string> terms;
    std::string current;

    for (unsigned char c : text) {
        // Bytes of multi-byte UTF-8 sequences belong to the word
        if (c >= 0x80) {
            current += static_cast<char>(c);
        } else if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            terms.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        terms.push_back(std::move(current));
    }
    return terms;
}

std::string TextExtractor::snippet(const std::string& text, const std::vector<std::string>& terms,
                                   std::size_t width) {
    if (text.size() <= width) {
        return text;
    }

    std::string lowered(text.size(), '\0');
    std::transform(text.begin(), text.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    std::size_t hit = std::string::npos;
    for (const auto& term : terms) {
        auto pos = lowered.find(term);
        if (pos != std::string::npos && (hit == std::string::npos || pos < hit)) {
            hit = pos;
        }
    }

    std::size_t start = 0;
    if (hit != std::string::npos && hit > width / 4) {
        start = std::min(hit - width / 4, text.size() - width);
    }

    std::string excerpt = text.substr(start, width);
    if (start > 0) {
        excerpt = "..." + excerpt;
    }
    if (start + width < text.size()) {
        excerpt += "...";
    }
    return excerpt;
}

} // namespace strata_mcp
