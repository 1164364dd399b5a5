#include <backend/evs/directory_lister.hpp>
#include <evs/commands.hpp>
#include <evs/response_parser.hpp>

#include <log/log.hpp>

#include <tuple>

DirectoryLister::DirectoryLister(Evs::Session const& session, CommandRunner& runner, std::string remoteDirectory)
    : Operation{session, runner}
    , remoteDirectory_{std::move(remoteDirectory)}
{}

std::vector<SharedData::RemoteEntry> DirectoryLister::perform()
{
    if (auto started = start(); !started)
        return {};

    const auto result = invoke(Evs::Commands::list(*session_, remoteDirectory_));
    if (!result)
    {
        Log::debug("DirectoryLister: Listing failed, treated as empty: {}", result.error());
        std::ignore = enterErrorState(Error{.type = ErrorType::ProtocolError, .extraInfo = result.error()});
        return {};
    }
    if (!result->succeeded())
    {
        Log::debug("DirectoryLister: Listing failed, treated as empty: {}", result->combinedOutput());
        std::ignore = enterErrorState(Error{.type = ErrorType::ProtocolError, .commandResult = *result});
        return {};
    }

    auto entries = Evs::parseListing(result->standardOutput);
    Log::debug("DirectoryLister: {} entries in '{}'", entries.size(), remoteDirectory_);
    enterState(OperationState::Completed);
    return entries;
}
