#include <backend/idrive_backend.hpp>
#include <backend/evs/delete_operation.hpp>
#include <backend/evs/directory_lister.hpp>
#include <backend/evs/download_operation.hpp>
#include <backend/evs/upload_operation.hpp>
#include <evs/handshake.hpp>
#include <evs/remote_path.hpp>

#include <log/log.hpp>

#include <system_error>

namespace
{
    constexpr char const* defaultEvsTempDirectory = "evs_temp";
}

IDriveBackend::IDriveBackend(IDriveBackendOptions options, CommandRunner& runner)
    : settings_{std::move(options.settings)}
    , remoteRoot_{Evs::remoteRootFromUrl(options.remoteUrl)}
    , stagingPrefix_{std::move(options.stagingPrefix)}
    , runner_{&runner}
    , session_{std::nullopt}
{
    Log::debug("IDriveBackend: Remote root is '{}'", remoteRoot_);
}

std::filesystem::path IDriveBackend::temporaryDirectory() const
{
    if (settings_.temporaryDirectory)
        return *settings_.temporaryDirectory;
    return std::filesystem::temp_directory_path();
}

std::expected<void, IDriveBackend::Error> IDriveBackend::connect()
{
    if (session_)
        return {};

    auto session = Evs::establishSession(settings_, *runner_);
    if (!session)
    {
        Log::error("IDriveBackend: Cannot connect: {}", session.error().toString());
        return std::unexpected(std::move(session).error());
    }
    session_ = std::move(*session);
    Log::debug("IDriveBackend: User fully connected");
    return {};
}

std::expected<Evs::Session const*, IDriveBackend::Error> IDriveBackend::session()
{
    if (auto result = connect(); !result)
        return std::unexpected(std::move(result).error());
    return &*session_;
}

std::expected<void, IDriveBackend::Error>
IDriveBackend::put(std::filesystem::path const& sourceFile, std::string const& remoteName)
{
    const auto session = this->session();
    if (!session)
        return std::unexpected(session.error());

    UploadOperation operation{
        **session,
        *runner_,
        {
            .localPath = sourceFile,
            .remoteName = remoteName,
            .remoteDirectory = remoteRoot_,
            .temporaryDirectory = temporaryDirectory(),
            .stagingPrefix = stagingPrefix_,
        },
    };
    return operation.perform();
}

std::expected<void, IDriveBackend::Error>
IDriveBackend::get(std::string const& remoteName, std::filesystem::path const& localFile)
{
    const auto session = this->session();
    if (!session)
        return std::unexpected(session.error());

    DownloadOperation operation{
        **session,
        *runner_,
        {
            .remotePath = Evs::joinRemotePath(remoteRoot_, remoteName),
            .localPath = localFile,
            .temporaryDirectory = temporaryDirectory(),
        },
    };
    return operation.perform();
}

std::expected<std::vector<SharedData::RemoteEntry>, IDriveBackend::Error> IDriveBackend::listEntries()
{
    const auto session = this->session();
    if (!session)
        return std::unexpected(session.error());

    DirectoryLister lister{**session, *runner_, remoteRoot_};
    return lister.perform();
}

std::expected<std::vector<std::string>, IDriveBackend::Error> IDriveBackend::list()
{
    const auto entries = listEntries();
    if (!entries)
        return std::unexpected(entries.error());

    std::vector<std::string> names;
    names.reserve(entries->size());
    for (auto const& entry : *entries)
        names.push_back(entry.name);
    return names;
}

std::expected<void, IDriveBackend::Error> IDriveBackend::remove(std::string const& remoteName)
{
    return removeMany({remoteName});
}

std::expected<void, IDriveBackend::Error> IDriveBackend::removeMany(std::vector<std::string> const& remoteNames)
{
    if (remoteNames.empty())
        return {};

    const auto session = this->session();
    if (!session)
        return std::unexpected(session.error());

    DeleteOperation operation{
        **session,
        *runner_,
        {
            .names = remoteNames,
            .remoteDirectory = remoteRoot_,
            .temporaryDirectory = temporaryDirectory(),
        },
    };
    return operation.perform();
}

std::expected<SharedData::QueryResult, IDriveBackend::Error> IDriveBackend::query(std::string const& remoteName)
{
    auto results = queryMany({remoteName});
    if (!results)
        return std::unexpected(std::move(results).error());
    return results->at(remoteName);
}

std::expected<std::map<std::string, SharedData::QueryResult>, IDriveBackend::Error>
IDriveBackend::queryMany(std::vector<std::string> const& remoteNames)
{
    const auto entries = listEntries();
    if (!entries)
        return std::unexpected(entries.error());

    std::map<std::string, SharedData::QueryResult> results;
    for (auto const& name : remoteNames)
    {
        auto& result = results[name];
        for (auto const& entry : *entries)
        {
            if (entry.name == name)
            {
                result.size = static_cast<std::int64_t>(entry.size);
                break;
            }
        }
    }
    return results;
}

void IDriveBackend::close()
{
    const std::filesystem::path evsTemp =
        settings_.evsTempDirectory ? *settings_.evsTempDirectory : std::filesystem::path{defaultEvsTempDirectory};

    Log::debug("IDriveBackend: Removing transfer tool folder '{}'", evsTemp.string());
    std::error_code ec;
    std::filesystem::remove_all(evsTemp, ec);
    if (ec)
        Log::debug("IDriveBackend: Cannot remove '{}': {}", evsTemp.string(), ec.message());
}
