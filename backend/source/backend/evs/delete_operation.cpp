#include <backend/evs/delete_operation.hpp>
#include <evs/commands.hpp>
#include <utility/algorithm/trim.hpp>

#include <log/log.hpp>

DeleteOperation::DeleteOperation(Evs::Session const& session, CommandRunner& runner, DeleteOperationOptions options)
    : Operation{session, runner}
    , names_{}
    , remoteDirectory_{std::move(options.remoteDirectory)}
{
    temporaryDirectory_ = std::move(options.temporaryDirectory);

    names_.reserve(options.names.size());
    for (auto const& name : options.names)
        names_.emplace_back(Utility::Algorithm::trimLeft(name, "/"));
}

std::expected<void, DeleteOperation::Error> DeleteOperation::perform()
{
    if (auto started = start(); !started)
        return started;

    Log::info("DeleteOperation: Deleting {} file(s) from '{}'", names_.size(), remoteDirectory_);

    auto invocation = invokeWithFileList(names_, [this](std::filesystem::path const& list) {
        return Evs::Commands::deleteItems(*session_, list, remoteDirectory_);
    });
    if (!invocation.result)
        return enterErrorState(Error{.type = ErrorType::TransferError, .extraInfo = invocation.result.error()});

    if (!invocation.result->succeeded())
    {
        // Deleting a file that does not exist is reported the same way as other failures.
        Log::warn(
            "DeleteOperation: Transfer tool reported a failure, ignored: {}", invocation.result->combinedOutput());
    }

    enterState(OperationState::Completed);
    return {};
}
