#pragma once

#include <backend/evs/operation.hpp>
#include <shared_data/file_operations/upload_step.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief What happened in one step of an upload.
 */
struct UploadStepResult
{
    SharedData::UploadStep step;
    // Empty for steps that do not run the transfer tool.
    std::optional<CommandLine> commandLine{std::nullopt};
    std::optional<SharedData::CommandResult> commandResult{std::nullopt};
    bool succeeded{false};
};

/**
 * @brief Puts a local file at a chosen remote path.
 *
 * The transfer tool keeps the local path of every uploaded file. So the file is renamed to its remote name,
 * uploaded below a staging directory, copied on the server into the remote directory and the staging directory
 * is deleted and purged from the trash afterwards. Nothing is rolled back when a step fails.
 */
class UploadOperation : public Operation
{
  public:
    struct UploadOperationOptions
    {
        std::filesystem::path localPath{};
        std::string remoteName{};
        std::string remoteDirectory{};
        std::filesystem::path temporaryDirectory{std::filesystem::temp_directory_path()};
        // Generated from the local directory and a random part if not given.
        std::optional<std::string> stagingPrefix{std::nullopt};
    };

    UploadOperation(Evs::Session const& session, CommandRunner& runner, UploadOperationOptions options);
    ~UploadOperation() override = default;
    UploadOperation(UploadOperation const&) = delete;
    UploadOperation(UploadOperation&&) = delete;
    UploadOperation& operator=(UploadOperation const&) = delete;
    UploadOperation& operator=(UploadOperation&&) = delete;

    SharedData::OperationType type() const override
    {
        return SharedData::OperationType::Upload;
    }

    /**
     * @brief Runs all steps in order and stops at the first failing one.
     *
     * @return TransferError naming the failed step.
     */
    std::expected<void, Error> perform();

    /**
     * @brief The steps executed so far, in order.
     */
    std::vector<UploadStepResult> const& steps() const
    {
        return steps_;
    }

    std::filesystem::path localPath() const
    {
        return localPath_;
    }

    std::string const& stagingPrefix() const
    {
        return stagingPrefix_;
    }

    /**
     * @brief Builds a staging directory name from a piece of the local directory and a random part.
     */
    static std::string makeStagingPrefix(std::filesystem::path const& localDirectory);

  private:
    std::expected<std::filesystem::path, Error> stageLocally();
    std::expected<void, Error> uploadToStaging(std::filesystem::path const& stagedPath);
    std::expected<void, Error> runStep(
        SharedData::UploadStep step,
        std::vector<std::string> const& fileListLines,
        std::function<CommandLine(std::filesystem::path const&)> const& makeCommand);

    Error stepError(SharedData::UploadStep step, std::optional<SharedData::CommandResult> result, std::string info);

  private:
    std::filesystem::path localPath_;
    std::string remoteName_;
    std::string remoteDirectory_;
    // Canonical path of the local file, known after staging.
    std::filesystem::path sourcePath_;
    std::string stagingPrefix_;
    std::vector<UploadStepResult> steps_;
};
