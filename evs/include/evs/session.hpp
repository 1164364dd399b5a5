#pragma once

#include <process/command_line.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Evs
{
    constexpr char const* transferToolName = "idevsutil";

    /**
     * @brief What is needed to run the transfer tool on behalf of an account.
     */
    struct Credentials
    {
        std::filesystem::path executable{};
        std::string accountId{};
        // --password-file and, for privately encrypted accounts, --pvt-key.
        std::vector<std::string> authArguments{};

        /**
         * @brief Builds "<executable> <auth arguments> <operation arguments>".
         */
        CommandLine command(std::vector<std::string> const& operationArguments) const;
    };

    /**
     * @brief An established session: validated credentials and the server to talk to.
     */
    struct Session
    {
        Credentials credentials{};
        std::string serverAddress{};

        CommandLine command(std::vector<std::string> const& operationArguments) const;

        /**
         * @brief Returns the remote location argument "<account>@<server>::home/<path>".
         */
        std::string remoteLocation(std::string_view path = {}) const;
    };
}
