#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed string to upper case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in upper case.
     */
    inline std::string toUpperCase(std::string const& input)
    {
        std::string result(input.size(), '\0');
        std::transform(input.begin(), input.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        return result;
    }

    /**
     * @brief Converts the passed string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string const& input)
    {
        std::string result(input.size(), '\0');
        std::transform(input.begin(), input.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }
}
