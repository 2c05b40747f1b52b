/**
 * @file string_utils.hpp
 * @brief String helpers shared by the engine, the capability layer and the CLI
 * 
 * Small, allocation-friendly helpers for trimming identifiers, joining output
 * lines and producing log-safe previews of untrusted program text.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace capsule {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 * 
 * All methods are static - no instantiation required.
 * 
 * **Usage Example**:
 * @code
 * std::string id = StringUtils::Trim("  4f1c...  ");
 * std::string text = StringUtils::Join({"a", "b"}, "\n");
 * spdlog::debug("Program: {}", StringUtils::Preview(program, 80));
 * @endcode
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Join strings with a delimiter
     * @param strings Parts to join
     * @param delimiter Separator placed between parts
     * @return Joined string (empty when @p strings is empty)
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    /**
     * @brief Replace non-printable characters with '.'
     * 
     * Used before writing untrusted text to the host log.
     */
    static std::string Sanitize(const std::string& str);

    /**
     * @brief Truncate string to a maximum length
     * @param str Input string
     * @param max_length Maximum length including the suffix
     * @param suffix Appended when truncation happens
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");

    /**
     * @brief Single-line, sanitized, truncated preview of program text
     * 
     * Newlines and tabs are folded to spaces before sanitizing.
     */
    static std::string Preview(const std::string& str, std::size_t max_length);
};

} // namespace utils
} // namespace capsule
