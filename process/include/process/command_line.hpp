#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief An executable together with its arguments. Arguments are passed as they are, no shell is involved.
 */
struct CommandLine
{
    std::filesystem::path executable{};
    std::vector<std::string> arguments{};

    /**
     * @brief Renders the command line for log output. Arguments containing spaces are quoted.
     */
    std::string toString() const;

    /**
     * @brief Returns the value of the first argument of the form "<option>=<value>", or an empty string.
     */
    std::string optionValue(std::string const& option) const;
};
