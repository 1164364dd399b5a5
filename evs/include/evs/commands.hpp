#pragma once

#include <evs/session.hpp>
#include <process/command_line.hpp>

#include <filesystem>
#include <string_view>

/**
 * Command lines of all transfer tool invocations.
 */
namespace Evs::Commands
{
    CommandLine validateAccount(Credentials const& credentials);
    CommandLine getServerAddress(Credentials const& credentials);

    CommandLine list(Session const& session, std::string_view remotePath);

    /**
     * @brief Uploads the local files named in the list below the remote directory. Each file keeps its local path.
     */
    CommandLine upload(Session const& session, std::filesystem::path const& fileList, std::string_view remoteDirectory);

    /**
     * @brief Server side copy of the remote files named in the list into the remote directory.
     */
    CommandLine
    copyWithin(Session const& session, std::filesystem::path const& fileList, std::string_view remoteDirectory);

    CommandLine
    deleteItems(Session const& session, std::filesystem::path const& fileList, std::string_view remoteDirectory);

    CommandLine
    purgeTrash(Session const& session, std::filesystem::path const& fileList, std::string_view remoteDirectory);

    /**
     * @brief Downloads the remote files named in the list. Each file is placed at its full remote path below the
     * target directory.
     */
    CommandLine
    download(Session const& session, std::filesystem::path const& fileList, std::filesystem::path const& target);
}
