#include <backend/evs/upload_operation.hpp>
#include <evs/commands.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/format_bytes.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <cctype>
#include <system_error>

namespace
{
    /**
     * Gives the staged file its original name back when leaving scope.
     */
    class StagedFileRestorer
    {
      public:
        StagedFileRestorer(std::filesystem::path original, std::filesystem::path staged)
            : original_{std::move(original)}
            , staged_{std::move(staged)}
        {}
        ~StagedFileRestorer()
        {
            if (original_ == staged_)
                return;

            std::error_code ec;
            std::filesystem::rename(staged_, original_, ec);
            if (ec)
                Log::error(
                    "UploadOperation: Failed to rename '{}' back to '{}': {}",
                    staged_.string(),
                    original_.string(),
                    ec.message());
        }
        StagedFileRestorer(StagedFileRestorer const&) = delete;
        StagedFileRestorer& operator=(StagedFileRestorer const&) = delete;
        StagedFileRestorer(StagedFileRestorer&&) = delete;
        StagedFileRestorer& operator=(StagedFileRestorer&&) = delete;

      private:
        std::filesystem::path original_;
        std::filesystem::path staged_;
    };
}

UploadOperation::UploadOperation(Evs::Session const& session, CommandRunner& runner, UploadOperationOptions options)
    : Operation{session, runner}
    , localPath_{std::move(options.localPath)}
    , remoteName_{std::move(options.remoteName)}
    , remoteDirectory_{std::move(options.remoteDirectory)}
    , sourcePath_{}
    , stagingPrefix_{}
    , steps_{}
{
    temporaryDirectory_ = std::move(options.temporaryDirectory);

    if (options.stagingPrefix && !options.stagingPrefix->empty())
        stagingPrefix_ = std::move(*options.stagingPrefix);
    else
    {
        // Same directory stageLocally resolves to, as long as the source exists.
        std::error_code ec;
        auto resolved = std::filesystem::weakly_canonical(localPath_, ec);
        if (ec)
            resolved = std::filesystem::absolute(localPath_, ec);
        stagingPrefix_ = makeStagingPrefix(resolved.parent_path());
    }
}

std::string UploadOperation::makeStagingPrefix(std::filesystem::path const& localDirectory)
{
    const auto directory = localDirectory.string();
    std::string prefix{};
    if (directory.size() > 15)
    {
        for (auto c : directory.substr(15, 8))
        {
            if (std::isalnum(static_cast<unsigned char>(c)))
                prefix.push_back(c);
        }
    }
    if (!prefix.empty())
        prefix.push_back('-');
    return prefix + Ids::generateId().prefix(8);
}

UploadOperation::Error UploadOperation::stepError(
    SharedData::UploadStep step,
    std::optional<SharedData::CommandResult> result,
    std::string info)
{
    Log::error(
        "UploadOperation: Step {} ({}) failed: {}",
        SharedData::stepNumber(step),
        Utility::enumToString(step),
        info);
    return Error{
        .type = ErrorType::TransferError,
        .step = step,
        .commandResult = std::move(result),
        .extraInfo = std::move(info),
    };
}

std::expected<void, UploadOperation::Error> UploadOperation::runStep(
    SharedData::UploadStep step,
    std::vector<std::string> const& fileListLines,
    std::function<CommandLine(std::filesystem::path const&)> const& makeCommand)
{
    auto invocation = invokeWithFileList(fileListLines, makeCommand);

    UploadStepResult stepResult{.step = step, .commandLine = invocation.commandLine};
    if (!invocation.result)
    {
        steps_.push_back(std::move(stepResult));
        return enterErrorState(stepError(step, std::nullopt, invocation.result.error()));
    }

    stepResult.commandResult = *invocation.result;
    stepResult.succeeded = invocation.result->succeeded();
    steps_.push_back(stepResult);

    if (!stepResult.succeeded)
    {
        auto info = fmt::format("Transfer tool exited with status {}", invocation.result->exitStatus.value_or(-1));
        return enterErrorState(stepError(step, std::move(*invocation.result), std::move(info)));
    }
    return {};
}

std::expected<std::filesystem::path, UploadOperation::Error> UploadOperation::stageLocally()
{
    using enum SharedData::UploadStep;

    std::error_code ec;
    sourcePath_ = std::filesystem::canonical(localPath_, ec);
    if (ec)
    {
        steps_.push_back({.step = StageLocally});
        return enterErrorState<std::filesystem::path>(stepError(
            StageLocally, std::nullopt, fmt::format("Cannot access '{}': {}", localPath_.string(), ec.message())));
    }

    const auto stagedPath = sourcePath_.parent_path() / remoteName_;
    if (stagedPath != sourcePath_)
    {
        if (std::filesystem::exists(stagedPath, ec) || ec)
        {
            steps_.push_back({.step = StageLocally});
            return enterErrorState<std::filesystem::path>(stepError(
                StageLocally,
                std::nullopt,
                ec ? fmt::format("Cannot check '{}': {}", stagedPath.string(), ec.message())
                   : fmt::format(
                         "Cannot stage '{}' as '{}': a file with that name already exists",
                         sourcePath_.string(),
                         stagedPath.string())));
        }

        std::filesystem::rename(sourcePath_, stagedPath, ec);
        if (ec)
        {
            steps_.push_back({.step = StageLocally});
            return enterErrorState<std::filesystem::path>(stepError(
                StageLocally,
                std::nullopt,
                fmt::format("Cannot rename '{}' to '{}': {}", sourcePath_.string(), stagedPath.string(), ec.message())));
        }
    }
    steps_.push_back({.step = StageLocally, .succeeded = true});
    const auto size = std::filesystem::file_size(stagedPath, ec);
    Log::debug(
        "UploadOperation: Staged '{}' ({}) as '{}'",
        sourcePath_.string(),
        ec ? std::string{"unknown size"} : Utility::formatBytes(size),
        stagedPath.string());
    return stagedPath;
}

std::expected<void, UploadOperation::Error> UploadOperation::uploadToStaging(std::filesystem::path const& stagedPath)
{
    StagedFileRestorer restorer{sourcePath_, stagedPath};

    return runStep(
        SharedData::UploadStep::UploadToStaging, {stagedPath.string()}, [this](std::filesystem::path const& list) {
            return Evs::Commands::upload(*session_, list, stagingPrefix_);
        });
}

std::expected<void, UploadOperation::Error> UploadOperation::perform()
{
    using enum SharedData::UploadStep;

    if (auto started = start(); !started)
        return started;

    Log::info(
        "UploadOperation: Uploading '{}' to '{}' in '{}'", localPath_.string(), remoteName_, remoteDirectory_);

    const auto stagedPath = stageLocally();
    if (!stagedPath)
        return std::unexpected(stagedPath.error());

    if (auto result = uploadToStaging(*stagedPath); !result)
        return result;

    if (auto result =
            runStep(CreateRemoteDirectory, {}, [this](std::filesystem::path const& list) {
                return Evs::Commands::upload(*session_, list, remoteDirectory_);
            });
        !result)
        return result;

    // The staged file lives at its full local path below the staging directory.
    const auto stagedRemotePath = "/" + stagingPrefix_ + stagedPath->generic_string();
    if (auto result =
            runStep(CopyWithin, {stagedRemotePath}, [this](std::filesystem::path const& list) {
                return Evs::Commands::copyWithin(*session_, list, remoteDirectory_);
            });
        !result)
        return result;

    const auto stagingDirectory = "/" + stagingPrefix_;
    if (auto result =
            runStep(DeleteStaging, {stagingDirectory}, [this](std::filesystem::path const& list) {
                return Evs::Commands::deleteItems(*session_, list, "");
            });
        !result)
        return result;

    if (auto result =
            runStep(PurgeTrash, {stagingDirectory}, [this](std::filesystem::path const& list) {
                return Evs::Commands::purgeTrash(*session_, list, "");
            });
        !result)
        return result;

    enterState(OperationState::Completed);
    Log::info("UploadOperation: Operation completed successfully.");
    return {};
}
