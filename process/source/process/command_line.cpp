#include <process/command_line.hpp>

std::string CommandLine::toString() const
{
    const auto quoteIfNeeded = [](std::string const& str) {
        if (str.empty() || str.find_first_of(" \t\"") != std::string::npos)
            return '"' + str + '"';
        return str;
    };

    std::string result = quoteIfNeeded(executable.string());
    for (auto const& argument : arguments)
    {
        result += ' ';
        result += quoteIfNeeded(argument);
    }
    return result;
}

std::string CommandLine::optionValue(std::string const& option) const
{
    const auto prefix = option + "=";
    for (auto const& argument : arguments)
    {
        if (argument.starts_with(prefix))
            return argument.substr(prefix.size());
    }
    return {};
}
