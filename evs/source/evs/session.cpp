#include <evs/session.hpp>

#include <fmt/format.h>

namespace Evs
{
    CommandLine Credentials::command(std::vector<std::string> const& operationArguments) const
    {
        CommandLine commandLine{.executable = executable, .arguments = authArguments};
        commandLine.arguments.insert(
            commandLine.arguments.end(), operationArguments.begin(), operationArguments.end());
        return commandLine;
    }

    CommandLine Session::command(std::vector<std::string> const& operationArguments) const
    {
        return credentials.command(operationArguments);
    }

    std::string Session::remoteLocation(std::string_view path) const
    {
        return fmt::format("{}@{}::home/{}", credentials.accountId, serverAddress, path);
    }
}
