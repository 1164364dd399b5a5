#pragma once

#include <backend/evs/operation.hpp>

#include <filesystem>
#include <string>

/**
 * @brief Fetches one remote file into a local file.
 *
 * The transfer tool recreates the full remote path below its target directory, so the file is downloaded into a
 * scratch directory and moved to the local path from there. The scratch directory is removed in every case.
 */
class DownloadOperation : public Operation
{
  public:
    struct DownloadOperationOptions
    {
        std::string remotePath{};
        std::filesystem::path localPath{};
        std::filesystem::path temporaryDirectory{std::filesystem::temp_directory_path()};
    };

    DownloadOperation(Evs::Session const& session, CommandRunner& runner, DownloadOperationOptions options);
    ~DownloadOperation() override = default;
    DownloadOperation(DownloadOperation const&) = delete;
    DownloadOperation(DownloadOperation&&) = delete;
    DownloadOperation& operator=(DownloadOperation const&) = delete;
    DownloadOperation& operator=(DownloadOperation&&) = delete;

    SharedData::OperationType type() const override
    {
        return SharedData::OperationType::Download;
    }

    /**
     * @return TransferError if the tool could not be run or failed, NotFoundError if it did not produce the file.
     */
    std::expected<void, Error> perform();

    std::string const& remotePath() const
    {
        return remotePath_;
    }

    std::filesystem::path localPath() const
    {
        return localPath_;
    }

  private:
    std::expected<void, Error> moveToDestination(std::filesystem::path const& downloaded);

  private:
    std::string remotePath_;
    std::filesystem::path localPath_;
};
