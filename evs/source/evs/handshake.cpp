#include <evs/handshake.hpp>
#include <evs/commands.hpp>
#include <evs/response_parser.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <string>

namespace Evs
{
    namespace
    {
        constexpr std::string_view separator =
            "------------------------------------------------------------------------";

        SharedData::OperationError configError(std::string message)
        {
            return SharedData::OperationError{
                .type = SharedData::OperationErrorType::ConfigError,
                .extraInfo = std::move(message),
            };
        }

        SharedData::OperationError protocolError(std::string message, SharedData::CommandResult result)
        {
            return SharedData::OperationError{
                .type = SharedData::OperationErrorType::ProtocolError,
                .commandResult = std::move(result),
                .extraInfo = std::move(message),
            };
        }

        SharedData::OperationError authError(std::string message, SharedData::CommandResult result)
        {
            return SharedData::OperationError{
                .type = SharedData::OperationErrorType::AuthError,
                .commandResult = std::move(result),
                .extraInfo = std::move(message),
            };
        }

        std::expected<SharedData::CommandResult, SharedData::OperationError>
        runHandshakeCommand(CommandRunner& runner, CommandLine const& commandLine)
        {
            Log::debug("Handshake: {}", commandLine.toString());
            auto result = runner.run(commandLine);
            if (!result)
            {
                Log::error("Handshake: cannot run '{}': {}", commandLine.executable.string(), result.error());
                return std::unexpected(SharedData::OperationError{
                    .type = SharedData::OperationErrorType::ProtocolError,
                    .extraInfo = "Cannot run transfer tool: " + result.error(),
                });
            }
            Log::debug("Handshake: response (exit {}): {}", result->exitStatus.value_or(-1), result->combinedOutput());
            return std::move(*result);
        }

        std::expected<StatusElement, SharedData::OperationError> statusTreeElement(SharedData::CommandResult const& result)
        {
            const auto tree = parseStatusTree(result.combinedOutput());
            if (!tree)
                return std::unexpected(protocolError("No status found in transfer tool response", result));
            auto element = tree->find("tree");
            if (!element)
                return std::unexpected(protocolError("Transfer tool response has no 'tree' element", result));
            return std::move(*element);
        }
    }

    std::expected<Credentials, SharedData::OperationError> resolveCredentials(Persistence::Settings const& settings)
    {
        if (!settings.transferToolDirectory)
        {
            Log::warn("{}", separator);
            Log::warn("WARNING: No path to '{}' has been set. Download it from", transferToolName);
            Log::warn("   https://www.idrivedownloads.com/downloads/linux/download-options/IDrive_linux_64bit.zip");
            Log::warn("or");
            Log::warn("   https://www.idrivedownloads.com/downloads/linux/download-options/IDrive_linux_32bit.zip");
            Log::warn("and place it anywhere with execute rights. Then set IDEVSPATH to the containing directory.");
            Log::warn("{}", separator);
            return std::unexpected(configError("IDEVSPATH is not set. It must name the directory of idevsutil."));
        }

        if (!settings.accountId)
        {
            Log::warn("{}", separator);
            Log::warn("WARNING: IDrive logon ID missing");
            Log::warn("Set the environment variable IDRIVEID to your IDrive logon ID");
            Log::warn("{}", separator);
            return std::unexpected(configError("IDRIVEID is not set."));
        }

        if (!settings.passwordFile)
        {
            Log::warn("{}", separator);
            Log::warn("WARNING: IDrive password file missing");
            Log::warn("Create a file containing your IDrive logon password,");
            Log::warn("then set the environment variable IDPWDFILE to its path");
            Log::warn("{}", separator);
            return std::unexpected(configError("IDPWDFILE is not set."));
        }

        return Credentials{
            .executable = *settings.transferToolDirectory / transferToolName,
            .accountId = *settings.accountId,
            .authArguments = {"--password-file=" + settings.passwordFile->string()},
        };
    }

    std::expected<Session, SharedData::OperationError>
    establishSession(Persistence::Settings const& settings, CommandRunner& runner)
    {
        auto credentials = resolveCredentials(settings);
        if (!credentials)
            return std::unexpected(std::move(credentials).error());

        const auto validation = runHandshakeCommand(runner, Commands::validateAccount(*credentials));
        if (!validation)
            return std::unexpected(validation.error());

        const auto status = statusTreeElement(*validation);
        if (!status)
            return std::unexpected(status.error());

        const auto description = status->attribute("desc").value_or("");
        if (status->attribute("message") != "SUCCESS")
        {
            Log::error("Handshake: account validation failed: {}", description);
            return std::unexpected(authError(fmt::format("Account validation failed: {}", description), *validation));
        }
        if (description != "VALID ACCOUNT")
        {
            Log::error("Handshake: account is not valid: {}", description);
            return std::unexpected(authError(fmt::format("Account is not valid: {}", description), *validation));
        }
        if (status->attribute("configstatus") != "SET")
        {
            Log::error("Handshake: account is not configured");
            return std::unexpected(authError("Account is not configured", *validation));
        }

        if (status->attribute("configtype") == "PRIVATE")
        {
            if (!settings.privateKeyFile)
            {
                Log::warn("{}", separator);
                Log::warn("WARNING: IDrive encryption key file missing");
                Log::warn("Create a file containing your IDrive encryption key,");
                Log::warn("then set the environment variable IDKEYFILE to its path");
                Log::warn("{}", separator);
                return std::unexpected(configError("IDKEYFILE is not set, but the account uses a private key."));
            }
            credentials->authArguments.push_back("--pvt-key=" + settings.privateKeyFile->string());
        }

        const auto addressReply = runHandshakeCommand(runner, Commands::getServerAddress(*credentials));
        if (!addressReply)
            return std::unexpected(addressReply.error());

        const auto addressStatus = statusTreeElement(*addressReply);
        if (!addressStatus)
            return std::unexpected(addressStatus.error());

        auto serverAddress = addressStatus->attribute("cmdUtilityServer");
        if (!serverAddress || serverAddress->empty())
            return std::unexpected(protocolError("Transfer tool did not report a server address", *addressReply));

        Log::info("Connected account '{}' to server '{}'", credentials->accountId, *serverAddress);
        return Session{
            .credentials = std::move(*credentials),
            .serverAddress = std::move(*serverAddress),
        };
    }
}
