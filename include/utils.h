#pragma once

#include <string>
#include <algorithm>
#include <cctype>

namespace duplex_voice {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
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
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Shorten text for log lines, appending "..." when cut
 */
inline std::string truncate_for_log(const std::string& str, size_t max_chars = 80) {
    if (str.size() <= max_chars) return str;
    return str.substr(0, max_chars) + "...";
}

/**
 * @brief Case-insensitive prefix test ("WSS://" matches "wss://")
 */
inline bool starts_with_nocase(const std::string& str, const std::string& prefix) {
    if (str.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), str.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

} // namespace utils

} // namespace duplex_voice
