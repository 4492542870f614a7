//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef KDA_STRING_UTILS_HPP
#define KDA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers used by the report and DOT writers.
 */

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace kda::string_utils {

    /**
     * Joins strings with a delimiter.
     */
    inline std::string join(const std::vector<std::string>& parts, const std::string_view delimiter) {
        std::string result;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                result += delimiter;
            }
            result += parts[i];
        }
        return result;
    }

    /**
     * Escapes a string for use inside a double-quoted DOT identifier.
     */
    inline std::string escape_dot(const std::string_view s) {
        std::string result;
        result.reserve(s.size());
        for (const char c : s) {
            if (c == '"' || c == '\\') {
                result += '\\';
            }
            if (c == '\n') {
                result += "\\n";
                continue;
            }
            result += c;
        }
        return result;
    }

    /**
     * Converts ASCII letters to lower case.
     */
    inline std::string to_lower(std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

}  // namespace kda::string_utils

#endif //KDA_STRING_UTILS_HPP
