#pragma once

#include <string_view>

namespace Utility::Algorithm
{
    constexpr std::string_view whitespaceCharacters = " \t\r\n\f\v";

    /**
     * @brief Removes leading characters contained in the given set.
     */
    inline std::string_view trimLeft(std::string_view input, std::string_view characters = whitespaceCharacters)
    {
        const auto first = input.find_first_not_of(characters);
        if (first == std::string_view::npos)
            return {};
        return input.substr(first);
    }

    /**
     * @brief Removes trailing characters contained in the given set.
     */
    inline std::string_view trimRight(std::string_view input, std::string_view characters = whitespaceCharacters)
    {
        const auto last = input.find_last_not_of(characters);
        if (last == std::string_view::npos)
            return {};
        return input.substr(0, last + 1);
    }

    inline std::string_view trim(std::string_view input, std::string_view characters = whitespaceCharacters)
    {
        return trimRight(trimLeft(input, characters), characters);
    }
}
