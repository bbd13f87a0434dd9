/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used by the validation library: case folding,
 * ordinal comparison, display-name splitting and template substitution.
 * All case operations are ASCII-only.
 */

#pragma once

#include <string>
#include <vector>

namespace fluentval {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII)
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase (ASCII)
 */
std::string toUpper(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts ("" yields [""], trailing delimiter yields a trailing "")
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Join strings with delimiter
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

bool startsWith(const std::string& str, const std::string& prefix);

bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief Replace all occurrences of substring
 *
 * @param str Input string
 * @param from Substring to replace (empty: str returned unchanged)
 * @param to Replacement string
 */
std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

/**
 * @brief Split a PascalCase identifier into space separated words
 *
 * "NullableInt" -> "Nullable Int", "HTTPServer" -> "HTTP Server",
 * "Forename" -> "Forename". Existing spaces are kept as they are.
 */
std::string splitPascalCase(const std::string& str);

/**
 * @brief Byte-wise comparison
 * @return negative, zero or positive like std::string::compare
 */
int compareOrdinal(const std::string& a, const std::string& b);

/**
 * @brief Byte-wise comparison after ASCII upper-casing both sides
 */
int compareOrdinalIgnoreCase(const std::string& a, const std::string& b);

bool equalsIgnoreCase(const std::string& a, const std::string& b);

} // namespace utils
} // namespace fluentval
