#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed string to lower case by out paramter.
     *
     * @param input The string to convert.
     */
    inline void toLowerCaseInplace(std::string& input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
    }

    /**
     * @brief Converts the passed string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string input)
    {
        toLowerCaseInplace(input);
        return input;
    }

    /**
     * @brief ASCII case insensitive comparison.
     */
    inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
    {
        return lhs.size() == rhs.size() &&
            std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char l, unsigned char r) {
                   return std::tolower(l) == std::tolower(r);
               });
    }
}
