/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 * 
 * @date 2025
 */

#include "capsule/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace capsule {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// ============================================================================
// SANITIZATION AND TRUNCATION
// ============================================================================
// Preparing untrusted strings for the host log

std::string StringUtils::Sanitize(const std::string& str) {
    std::string result;
    result.reserve(str.length());

    for (char c : str) {
        if (std::isprint(static_cast<unsigned char>(c))) {
            result += c;
        } else {
            result += '.';
        }
    }

    return result;
}

std::string StringUtils::Truncate(const std::string& str,
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return suffix.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

std::string StringUtils::Preview(const std::string& str, std::size_t max_length) {
    std::string folded;
    folded.reserve(std::min(str.size(), max_length * 2));

    bool last_space = false;
    for (char c : str) {
        bool space = (c == '\n' || c == '\r' || c == '\t' || c == ' ');
        if (space) {
            if (!last_space && !folded.empty()) {
                folded += ' ';
            }
        } else {
            folded += c;
        }
        last_space = space;
        if (folded.size() > max_length) {
            break;
        }
    }

    return Truncate(Sanitize(Trim(folded)), max_length);
}

} // namespace utils
} // namespace capsule
