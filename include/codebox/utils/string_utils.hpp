/**
 * @file string_utils.hpp
 * @brief String helpers for command composition and output handling
 *
 * Provides trimming, splitting, joining and POSIX shell quoting used when
 * composing container command lines and formatting captured output.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace codebox {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * std::vector<std::string> packages{"requests", "numpy==1.26"};
 * std::string quoted = StringUtils::ShellJoin(packages);
 * // 'requests' 'numpy==1.26'
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     **************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Join strings with delimiter
     * @param strings Parts to join
     * @param delimiter Separator placed between parts
     * @return Joined string (empty for empty input)
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace every occurrence of @p from with @p to
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Shell Composition
     **************************************************************************/

    /**
     * @brief Quote a single word for POSIX sh
     *
     * Words made only of safe characters are returned unchanged; anything
     * else is wrapped in single quotes with embedded quotes escaped as '\''.
     */
    static std::string ShellQuote(const std::string& word);

    /**
     * @brief Quote each word and join with single spaces
     */
    static std::string ShellJoin(const std::vector<std::string>& words);

    /***************************************************************************
     * Output Formatting
     **************************************************************************/

    /**
     * @brief Truncate string to maximum length
     * @param str Input string
     * @param max_length Maximum length including suffix
     * @param suffix Suffix appended when truncated
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace codebox
