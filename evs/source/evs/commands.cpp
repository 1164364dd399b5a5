#include <evs/commands.hpp>

#include <string>

namespace Evs::Commands
{
    namespace
    {
        std::string filesFrom(std::filesystem::path const& fileList)
        {
            return "--files-from=" + fileList.string();
        }
    }

    CommandLine validateAccount(Credentials const& credentials)
    {
        return credentials.command({"--validate", "--user=" + credentials.accountId});
    }

    CommandLine getServerAddress(Credentials const& credentials)
    {
        return credentials.command({"--getServerAddress", credentials.accountId});
    }

    CommandLine list(Session const& session, std::string_view remotePath)
    {
        return session.command({"--auth-list", session.remoteLocation(remotePath)});
    }

    CommandLine upload(Session const& session, std::filesystem::path const& fileList, std::string_view remoteDirectory)
    {
        return session.command({filesFrom(fileList), "/", session.remoteLocation(remoteDirectory)});
    }

    CommandLine
    copyWithin(Session const& session, std::filesystem::path const& fileList, std::string_view remoteDirectory)
    {
        return session.command({"--copy-within", filesFrom(fileList), session.remoteLocation(remoteDirectory)});
    }

    CommandLine
    deleteItems(Session const& session, std::filesystem::path const& fileList, std::string_view remoteDirectory)
    {
        return session.command({"--delete-items", filesFrom(fileList), session.remoteLocation(remoteDirectory)});
    }

    CommandLine
    purgeTrash(Session const& session, std::filesystem::path const& fileList, std::string_view remoteDirectory)
    {
        return session.command({"--deletefrom-trash", filesFrom(fileList), session.remoteLocation(remoteDirectory)});
    }

    CommandLine
    download(Session const& session, std::filesystem::path const& fileList, std::filesystem::path const& target)
    {
        return session.command({filesFrom(fileList), session.remoteLocation(), target.string()});
    }
}
