#pragma once

#include <evs/session.hpp>
#include <persistence/state/settings.hpp>
#include <process/command_runner.hpp>
#include <shared_data/file_operations/operation_error.hpp>

#include <expected>

namespace Evs
{
    /**
     * @brief Resolves executable, account and password file from the settings.
     *
     * A missing value is reported with a ConfigError naming the setting. A hint on how to provide it is logged.
     */
    std::expected<Credentials, SharedData::OperationError> resolveCredentials(Persistence::Settings const& settings);

    /**
     * @brief Runs the handshake: validate the account, add the private key if the account needs one and ask for
     * the server address.
     *
     * @param settings Credentials and paths.
     * @param runner Runs the transfer tool.
     * @return The established session, or a ConfigError, AuthError or ProtocolError.
     */
    std::expected<Session, SharedData::OperationError>
    establishSession(Persistence::Settings const& settings, CommandRunner& runner);
}
