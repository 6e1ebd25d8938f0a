/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "codebox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace codebox {
namespace utils {

// ============================================================================
// BASIC MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

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

std::string StringUtils::ReplaceAll(const std::string& str,
                                    const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// SHELL COMPOSITION
// ============================================================================
// Dependency names come straight from callers and end up inside `sh -c`

std::string StringUtils::ShellQuote(const std::string& word) {
    if (word.empty()) {
        return "''";
    }

    bool safe = std::all_of(word.begin(), word.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
               c == '/' || c == '=' || c == ':' || c == '@' || c == '+' ||
               c == ',';
    });
    if (safe) {
        return word;
    }

    return "'" + ReplaceAll(word, "'", "'\\''") + "'";
}

std::string StringUtils::ShellJoin(const std::vector<std::string>& words) {
    std::vector<std::string> quoted;
    quoted.reserve(words.size());

    for (const auto& word : words) {
        quoted.push_back(ShellQuote(word));
    }

    return Join(quoted, " ");
}

// ============================================================================
// OUTPUT FORMATTING
// ============================================================================

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

} // namespace utils
} // namespace codebox
