/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * ASCII-only helpers used by asset validation and request parsing.
 */

#pragma once

#include <string>

namespace registry {
namespace utils {

/**
 * @brief Convert string to lowercase
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase
 */
std::string toUpper(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 */
std::string trim(const std::string& str);

/**
 * @brief True if any character is whitespace
 */
bool containsWhitespace(const std::string& str);

} // namespace utils
} // namespace registry
