#include <backend/command_line_options.hpp>

#include <fmt/format.h>

#include <string_view>

namespace
{
    // Number of arguments each command takes, -1 for one or more.
    int expectedArgumentCount(std::string const& command)
    {
        if (command == "connect" || command == "list")
            return 0;
        if (command == "put" || command == "get")
            return 2;
        if (command == "delete" || command == "query")
            return -1;
        return -2;
    }
}

std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char const* const* argv)
{
    CommandLineOptions options{};
    std::vector<std::string> positional{};

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view argument{argv[i]};

        const auto takeValue = [&](std::string_view option) -> std::expected<std::string, std::string> {
            if (i + 1 >= argc)
                return std::unexpected(fmt::format("Option '{}' requires a value", option));
            return std::string{argv[++i]};
        };

        if (!positional.empty())
        {
            // Everything after the command belongs to the command.
            positional.emplace_back(argument);
            continue;
        }

        if (argument == "--help" || argument == "-h")
        {
            options.help = true;
            return options;
        }
        else if (argument == "--json")
        {
            options.json = true;
        }
        else if (argument == "--config" || argument == "--log-level" || argument == "--log-file")
        {
            auto value = takeValue(argument);
            if (!value)
                return std::unexpected(value.error());
            if (argument == "--config")
                options.configFile = *value;
            else if (argument == "--log-level")
                options.logLevel = *value;
            else
                options.logFile = *value;
        }
        else if (argument.starts_with("--"))
        {
            return std::unexpected(fmt::format("Unknown option '{}'", argument));
        }
        else if (options.remoteUrl.empty())
        {
            options.remoteUrl = std::string{argument};
        }
        else
        {
            positional.emplace_back(argument);
        }
    }

    if (options.remoteUrl.empty())
        return std::unexpected(std::string{"Missing remote url"});
    if (positional.empty())
        return std::unexpected(std::string{"Missing command"});

    options.command = positional.front();
    options.arguments.assign(positional.begin() + 1, positional.end());

    const auto expected = expectedArgumentCount(options.command);
    if (expected == -2)
        return std::unexpected(fmt::format("Unknown command '{}'", options.command));
    if (expected == -1 && options.arguments.empty())
        return std::unexpected(fmt::format("Command '{}' needs at least one name", options.command));
    if (expected >= 0 && static_cast<int>(options.arguments.size()) != expected)
    {
        return std::unexpected(fmt::format(
            "Command '{}' takes {} argument(s), {} given", options.command, expected, options.arguments.size()));
    }
    return options;
}

std::string usage(std::string const& programName)
{
    return fmt::format(
        "Usage: {} [options] <remote-url> <command> [args...]\n"
        "\n"
        "Commands:\n"
        "  connect                          Validate the account and resolve the server\n"
        "  put <local-file> <remote-name>   Upload a file\n"
        "  get <remote-name> <local-file>   Download a file\n"
        "  list                             List the files below the remote url\n"
        "  delete <name>...                 Delete files\n"
        "  query <name>...                  Print the sizes of files, -1 if unknown\n"
        "\n"
        "Options:\n"
        "  --config <file>      JSON settings file, default $IDRIVE_STORE_CONFIG\n"
        "  --log-level <level>  trace, debug, info, warning, error, critical or off\n"
        "  --log-file <file>    Also write the log to this file\n"
        "  --json               Print list results as JSON\n"
        "\n"
        "Environment: IDEVSPATH, IDRIVEID, IDPWDFILE, IDKEYFILE, IDRIVE_STORE_LOG_LEVEL, IDRIVE_STORE_TMPDIR\n",
        programName);
}
