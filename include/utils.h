#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace livetalk {

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

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Check if transcript text is blank (empty/whitespace or equals blank sentinel)
 * @param text Raw transcript text
 * @param blank_sentinel String to treat as blank (e.g. "[BLANK_AUDIO]"); compared after trim
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    if (!blank_sentinel.empty() && t == blank_sentinel) return true;
    return false;
}

/**
 * @brief Remove <think>...</think> reasoning blocks from model output
 *
 * An opening tag without a matching close drops everything after it.
 * The result is trimmed.
 */
std::string strip_think_tags(const std::string& text);

/**
 * @brief Number of Unicode code points in a UTF-8 string
 *
 * Continuation bytes (10xxxxxx) are not counted, so malformed input
 * still yields a sensible length.
 */
size_t utf8_length(const std::string& text);

/// At most max_code_points code points of text, never splitting a sequence
std::string utf8_truncate(const std::string& text, size_t max_code_points);

/// Standard base64 (RFC 4648, with padding)
std::string base64_encode(const std::string& data);

/**
 * @brief Decode standard base64; whitespace is ignored
 * @return Decoded bytes, or nullopt on an invalid character or length
 */
std::optional<std::string> base64_decode(const std::string& encoded);

} // namespace utils

} // namespace livetalk
