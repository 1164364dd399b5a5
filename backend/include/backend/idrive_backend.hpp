#pragma once

#include <evs/session.hpp>
#include <persistence/state/settings.hpp>
#include <process/command_runner.hpp>
#include <shared_data/file_operations/operation_error.hpp>
#include <shared_data/query_result.hpp>
#include <shared_data/remote_entry.hpp>

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Object store on top of the IDrive transfer tool: put, get, list, delete and query files below a remote
 * root directory.
 *
 * The session is established on first use and kept for the lifetime of the object.
 */
class IDriveBackend
{
  public:
    using Error = SharedData::OperationError;

    struct IDriveBackendOptions
    {
        Persistence::Settings settings{};
        // For instance "idrive:///backups/host1".
        std::string remoteUrl{};
        // Staging directory name for uploads, random if not given.
        std::optional<std::string> stagingPrefix{std::nullopt};
    };

    IDriveBackend(IDriveBackendOptions options, CommandRunner& runner);
    ~IDriveBackend() = default;
    IDriveBackend(IDriveBackend const&) = delete;
    IDriveBackend& operator=(IDriveBackend const&) = delete;
    IDriveBackend(IDriveBackend&&) = delete;
    IDriveBackend& operator=(IDriveBackend&&) = delete;

    /**
     * @brief Runs the handshake unless a session is already established.
     */
    std::expected<void, Error> connect();

    bool connected() const
    {
        return session_.has_value();
    }

    std::expected<void, Error> put(std::filesystem::path const& sourceFile, std::string const& remoteName);
    std::expected<void, Error> get(std::string const& remoteName, std::filesystem::path const& localFile);

    /**
     * @brief Names of all files below the remote root.
     */
    std::expected<std::vector<std::string>, Error> list();
    std::expected<std::vector<SharedData::RemoteEntry>, Error> listEntries();

    std::expected<void, Error> remove(std::string const& remoteName);
    std::expected<void, Error> removeMany(std::vector<std::string> const& remoteNames);

    /**
     * @brief Size of a remote file, QueryResult::unknownSize if it is not listed.
     */
    std::expected<SharedData::QueryResult, Error> query(std::string const& remoteName);
    std::expected<std::map<std::string, SharedData::QueryResult>, Error>
    queryMany(std::vector<std::string> const& remoteNames);

    /**
     * @brief Removes the local working folder the transfer tool leaves behind.
     */
    void close();

    std::string const& remoteRoot() const
    {
        return remoteRoot_;
    }

    std::filesystem::path temporaryDirectory() const;

  private:
    std::expected<Evs::Session const*, Error> session();

  private:
    Persistence::Settings settings_;
    std::string remoteRoot_;
    std::optional<std::string> stagingPrefix_;
    CommandRunner* runner_;
    std::optional<Evs::Session> session_;
};
