/**
 * @file string_utils.cpp
 * @brief String utility functions implementation
 */

#include "registry/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace registry {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool containsWhitespace(const std::string& str) {
    return std::any_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace utils
} // namespace registry
