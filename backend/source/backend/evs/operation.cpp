#include <backend/evs/operation.hpp>
#include <utility/temporary_file_list.hpp>

#include <exception>

std::expected<void, Operation::Error> Operation::start()
{
    if (state_ != OperationState::NotStarted)
    {
        Log::error("Operation {}: Cannot perform an operation twice.", id_.value());
        // Do not enter error state here, it would overwrite the result of the first run.
        return std::unexpected(
            Error{.type = ErrorType::ImplementationError, .extraInfo = "Operation was already performed"});
    }
    state_ = OperationState::Running;
    return {};
}

std::expected<SharedData::CommandResult, std::string> Operation::invoke(CommandLine const& commandLine)
{
    Log::debug("Operation {}: {}", id_.value(), commandLine.toString());
    auto result = runner_->run(commandLine);
    if (!result)
    {
        Log::error("Operation {}: Cannot run '{}': {}", id_.value(), commandLine.executable.string(), result.error());
        return result;
    }
    Log::debug(
        "Operation {}: response (exit {}): {}",
        id_.value(),
        result->exitStatus ? std::to_string(*result->exitStatus) : std::string{"none"},
        result->combinedOutput());
    return result;
}

Operation::Invocation Operation::invokeWithFileList(
    std::vector<std::string> const& lines,
    std::function<CommandLine(std::filesystem::path const&)> const& makeCommand)
{
    Invocation invocation{};
    try
    {
        Utility::TemporaryFileList fileList{lines, temporaryDirectory_};
        invocation.commandLine = makeCommand(fileList.path());
        invocation.result = invoke(*invocation.commandLine);
    }
    catch (std::exception const& exc)
    {
        Log::error("Operation {}: Cannot create file list: {}", id_.value(), exc.what());
        invocation.result = std::unexpected(std::string{"Cannot create file list: "} + exc.what());
    }
    return invocation;
}
