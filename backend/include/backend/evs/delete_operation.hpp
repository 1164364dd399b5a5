#pragma once

#include <backend/evs/operation.hpp>

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Deletes remote files below a remote directory. Missing files are not an error.
 */
class DeleteOperation : public Operation
{
  public:
    struct DeleteOperationOptions
    {
        std::vector<std::string> names{};
        std::string remoteDirectory{};
        std::filesystem::path temporaryDirectory{std::filesystem::temp_directory_path()};
    };

    DeleteOperation(Evs::Session const& session, CommandRunner& runner, DeleteOperationOptions options);
    ~DeleteOperation() override = default;
    DeleteOperation(DeleteOperation const&) = delete;
    DeleteOperation(DeleteOperation&&) = delete;
    DeleteOperation& operator=(DeleteOperation const&) = delete;
    DeleteOperation& operator=(DeleteOperation&&) = delete;

    SharedData::OperationType type() const override
    {
        return SharedData::OperationType::Delete;
    }

    /**
     * @return TransferError only if the transfer tool could not be run.
     */
    std::expected<void, Error> perform();

  private:
    std::vector<std::string> names_;
    std::string remoteDirectory_;
};
