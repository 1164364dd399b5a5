#include <backend/evs/download_operation.hpp>
#include <evs/commands.hpp>
#include <utility/algorithm/trim.hpp>
#include <utility/temporary_directory.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <exception>
#include <memory>
#include <system_error>

DownloadOperation::DownloadOperation(
    Evs::Session const& session,
    CommandRunner& runner,
    DownloadOperationOptions options)
    : Operation{session, runner}
    , remotePath_{Utility::Algorithm::trimRight(options.remotePath)}
    , localPath_{std::move(options.localPath)}
{
    temporaryDirectory_ = std::move(options.temporaryDirectory);
}

std::expected<void, DownloadOperation::Error> DownloadOperation::perform()
{
    if (auto started = start(); !started)
        return started;

    Log::info("DownloadOperation: Downloading '{}' to '{}'", remotePath_, localPath_.string());

    std::unique_ptr<Utility::TemporaryDirectory> scratch;
    try
    {
        scratch = std::make_unique<Utility::TemporaryDirectory>(temporaryDirectory_);
    }
    catch (std::exception const& exc)
    {
        Log::error("DownloadOperation: Cannot create scratch directory: {}", exc.what());
        return enterErrorState(Error{
            .type = ErrorType::TransferError,
            .extraInfo = fmt::format("Cannot create scratch directory: {}", exc.what()),
        });
    }
    Log::debug("DownloadOperation: Created scratch directory '{}'", scratch->path().string());

    auto invocation = invokeWithFileList({remotePath_}, [this, &scratch](std::filesystem::path const& list) {
        return Evs::Commands::download(*session_, list, scratch->path());
    });
    if (!invocation.result)
        return enterErrorState(Error{.type = ErrorType::TransferError, .extraInfo = invocation.result.error()});

    const auto downloaded = scratch->path() / std::string{Utility::Algorithm::trim(remotePath_, "/")};
    if (!std::filesystem::exists(downloaded))
    {
        Log::error("DownloadOperation: '{}' was not downloaded", remotePath_);
        return enterErrorState(Error{
            .type = ErrorType::NotFoundError,
            .commandResult = std::move(*invocation.result),
            .extraInfo = fmt::format("'{}' not found after download", remotePath_),
        });
    }

    if (!invocation.result->succeeded())
    {
        Log::error("DownloadOperation: Transfer tool failed: {}", invocation.result->combinedOutput());
        return enterErrorState(Error{
            .type = ErrorType::TransferError,
            .commandResult = std::move(*invocation.result),
            .extraInfo = fmt::format("Download of '{}' failed", remotePath_),
        });
    }

    if (auto moved = moveToDestination(downloaded); !moved)
        return moved;

    enterState(OperationState::Completed);
    Log::info("DownloadOperation: Operation completed successfully.");
    return {};
}

std::expected<void, DownloadOperation::Error>
DownloadOperation::moveToDestination(std::filesystem::path const& downloaded)
{
    Log::debug("DownloadOperation: Moving '{}' to '{}'", downloaded.string(), localPath_.string());

    std::error_code ec;
    std::filesystem::rename(downloaded, localPath_, ec);
    if (ec == std::errc::cross_device_link)
    {
        ec.clear();
        std::filesystem::copy_file(downloaded, localPath_, std::filesystem::copy_options::overwrite_existing, ec);
    }
    if (ec)
    {
        Log::error("DownloadOperation: Cannot move file to '{}': {}", localPath_.string(), ec.message());
        return enterErrorState(Error{
            .type = ErrorType::TransferError,
            .extraInfo = fmt::format("Cannot move downloaded file to '{}': {}", localPath_.string(), ec.message()),
        });
    }
    return {};
}
