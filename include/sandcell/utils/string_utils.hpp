/**
 * @file string_utils.hpp
 * @brief String helpers for engine output parsing and log formatting
 *
 * Small, allocation-friendly helpers used when reading container engine
 * output (container IDs, probe results, CLI error text) and when rendering
 * command lines and captured output into log messages.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace sandcell {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation utilities
 *
 * **Usage Example**:
 * @code
 * auto id = StringUtils::Trim(result.stdout_output);
 * auto lines = StringUtils::Split(probe_output, '\n');
 * spdlog::debug("Executing: {}", StringUtils::Join(argv, " "));
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
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty tokens are skipped, so trailing newlines in engine output do
     * not produce empty entries.
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of non-empty substrings
     *
     * **Example**:
     * @code
     * auto parts = StringUtils::Split("a\nb\n", '\n');
     * // parts = ["a", "b"]
     * @endcode
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     *
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief First non-empty line of a multi-line string, trimmed
     * @param str Input string
     * @return First line, or empty string
     */
    static std::string FirstLine(const std::string& str);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    /**
     * @brief Check if string starts with prefix
     * @param str String to check
     * @param prefix Prefix to test
     * @return true if str starts with prefix
     */
    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Check if string contains substring
     * @param str String to search in
     * @param substring Substring to find
     * @return true if substring found
     */
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Check if string contains any of the given substrings
     * @param str String to search in
     * @param needles Candidate substrings
     * @return true if at least one needle is found
     */
    static bool ContainsAny(const std::string& str, const std::vector<std::string>& needles);

    /**
     * @brief Truncate string to maximum length
     *
     * @param str Input string
     * @param max_length Maximum allowed length
     * @param suffix Suffix to append if truncated (default: "...")
     * @return Truncated string
     *
     * **Example**:
     * @code
     * auto short_str = StringUtils::Truncate("print('hello world')", 10);
     * // short_str = "print(..."
     * @endcode
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace sandcell
