#pragma once

#include <evs/session.hpp>
#include <process/command_runner.hpp>
#include <shared_data/file_operations/operation_type.hpp>
#include <shared_data/file_operations/operation_error_type.hpp>
#include <shared_data/file_operations/operation_error.hpp>
#include <shared_data/file_operations/operation_state.hpp>
#include <log/log.hpp>

#include <ids/ids.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Base of all operations run against the transfer tool. An operation is performed once.
 */
class Operation
{
  public:
    Operation(Evs::Session const& session, CommandRunner& runner)
        : session_{&session}
        , runner_{&runner}
        , id_{Ids::generateOperationId()}
    {}
    Operation(Operation const&) = delete;
    Operation& operator=(Operation const&) = delete;
    Operation(Operation&&) = delete;
    Operation& operator=(Operation&&) = delete;

    virtual ~Operation() = default;

    using ErrorType = SharedData::OperationErrorType;
    using Error = SharedData::OperationError;

    virtual SharedData::OperationType type() const = 0;

    Ids::OperationId id() const
    {
        return id_;
    }

    using OperationState = SharedData::OperationState;

    OperationState state() const
    {
        return state_;
    }

    std::optional<Error> const& error() const
    {
        return error_;
    }

    template <typename T = void>
    std::expected<T, Error> enterErrorState(Error error)
    {
        state_ = OperationState::Failed;
        error_ = std::move(error);
        return std::unexpected(error_.value());
    }

  protected:
    void enterState(OperationState newState)
    {
        state_ = newState;
    }

    /**
     * @brief Moves the operation to Running. Fails if it was performed before.
     */
    std::expected<void, Error> start();

    /**
     * @brief Runs one transfer tool command. The command line and the response are logged.
     */
    std::expected<SharedData::CommandResult, std::string> invoke(CommandLine const& commandLine);

    struct Invocation
    {
        // Empty if the file list could not be created.
        std::optional<CommandLine> commandLine{std::nullopt};
        std::expected<SharedData::CommandResult, std::string> result{std::unexpect, std::string{}};
    };

    /**
     * @brief Writes the lines into a temporary file list and runs the command built for it.
     * The file list is removed before this returns.
     *
     * @param lines Content of the file list.
     * @param makeCommand Builds the command line from the path of the file list.
     */
    Invocation invokeWithFileList(
        std::vector<std::string> const& lines,
        std::function<CommandLine(std::filesystem::path const&)> const& makeCommand);

  protected:
    Evs::Session const* session_;
    CommandRunner* runner_;
    std::filesystem::path temporaryDirectory_{std::filesystem::temp_directory_path()};
    OperationState state_{OperationState::NotStarted};
    std::optional<Error> error_{std::nullopt};

  private:
    Ids::OperationId id_;
};
