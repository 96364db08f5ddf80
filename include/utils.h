#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace voxlink {

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
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Lowercase ASCII letters and UTF-8 Cyrillic capitals (U+0400..U+042F).
 *
 * Byte length is preserved, so offsets found in the lowered copy are valid
 * offsets into the original string.
 */
inline std::string to_lower_utf8(const std::string& str) {
    std::string out = str;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (c < 0x80) {
            out[i] = static_cast<char>(std::tolower(c));
            continue;
        }
        if (c == 0xD0 && i + 1 < out.size()) {
            unsigned char n = static_cast<unsigned char>(out[i + 1]);
            if (n >= 0x90 && n <= 0x9F) {          // А..П -> а..п
                out[i + 1] = static_cast<char>(n + 0x20);
            } else if (n >= 0xA0 && n <= 0xAF) {   // Р..Я -> р..я
                out[i] = static_cast<char>(0xD1);
                out[i + 1] = static_cast<char>(n - 0x20);
            } else if (n >= 0x80 && n <= 0x8F) {   // Ѐ..Џ -> ѐ..џ
                out[i] = static_cast<char>(0xD1);
                out[i + 1] = static_cast<char>(n + 0x10);
            }
            ++i;
        }
    }
    return out;
}

/**
 * @brief Case-insensitive substring search
 * @return Byte offset of the first match in haystack, or std::string::npos
 */
inline size_t find_case_insensitive(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return std::string::npos;
    return to_lower_utf8(haystack).find(to_lower_utf8(needle));
}

inline bool contains_case_insensitive(const std::string& haystack, const std::string& needle) {
    return find_case_insensitive(haystack, needle) != std::string::npos;
}

/**
 * @brief Join items with a separator
 */
inline std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += separator;
        out += items[i];
    }
    return out;
}

/**
 * @brief Append a transcript segment to an accumulator, separated by one space.
 * Whitespace-only segments are ignored.
 */
inline void append_segment(std::string& accumulator, const std::string& segment) {
    std::string t = trim_copy(segment);
    if (t.empty()) return;
    if (!accumulator.empty()) accumulator += ' ';
    accumulator += t;
}

/**
 * @brief First `max_chars` bytes of text, with "..." appended when truncated
 */
inline std::string preview(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "...";
}

} // namespace utils

} // namespace voxlink
