#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace parley {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string (modified in place)
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase ASCII letters; multi-byte UTF-8 sequences pass through unchanged
 */
inline std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Split text into lowercase word tokens
 *
 * ASCII letters and digits form words; every other ASCII byte separates them.
 * Bytes >= 0x80 are kept inside words so non-Latin text still tokenizes.
 */
inline std::vector<std::string> tokenize_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80 || c == '\'') {
            if (c != '\'') {
                current += static_cast<char>(std::tolower(c));
            }
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

/**
 * @brief Cut a string to at most max_bytes without splitting a UTF-8 sequence
 */
inline std::string truncate_utf8(const std::string& str, size_t max_bytes) {
    if (str.size() <= max_bytes) return str;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

} // namespace utils

} // namespace parley
