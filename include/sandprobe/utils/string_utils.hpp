/**
 * @file string_utils.hpp
 * @brief String helpers for probe output handling and shell command assembly
 *
 * Provides the small set of text operations the harness needs: whitespace
 * trimming, case folding, truncation for display, line tailing, placeholder
 * substitution and POSIX shell quoting.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <map>

namespace sandprobe {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * **Usage Example**:
 * @code
 * std::string shown = StringUtils::Truncate(StringUtils::Trim(output), 200);
 * std::string cmd = "cat " + StringUtils::ShellQuote(path);
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase (ASCII)
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Replace all occurrences of a substring
     */
    static std::string ReplaceAll(const std::string& str,
                                  const std::string& from,
                                  const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Case-insensitive substring test
     * @param haystack Text to search
     * @param needle Substring to look for
     * @return true if needle occurs in haystack ignoring ASCII case
     */
    static bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

    /***************************************************************************
     * Display Helpers
     ***************************************************************************/

    /**
     * @brief Truncate text to a maximum length, appending a marker when cut
     *
     * @param str Input string
     * @param limit Maximum number of characters kept from the input
     * @param marker Appended after the kept prefix when truncation happened
     * @return str unchanged when it fits, otherwise prefix + marker
     *
     * **Example**:
     * @code
     * Truncate("abcdef", 3);   // "abc..."
     * Truncate("abc", 3);      // "abc"
     * @endcode
     */
    static std::string Truncate(const std::string& str,
                                std::size_t limit,
                                const std::string& marker = "...");

    /***************************************************************************
     * Command Assembly
     ***************************************************************************/

    /**
     * @brief Quote a string for a POSIX shell using single quotes
     *
     * Embedded single quotes are written as '\''.
     */
    static std::string ShellQuote(const std::string& str);

    /**
     * @brief Substitute {name} placeholders
     * @param templ Template text
     * @param values Placeholder name to value map
     * @return Template with every known placeholder replaced
     */
    static std::string Substitute(const std::string& templ,
                                  const std::map<std::string, std::string>& values);
};

} // namespace utils
} // namespace sandprobe
