#pragma once

#include <process/command_line.hpp>
#include <shared_data/command_result.hpp>

#include <expected>
#include <string>

/**
 * @brief Runs a command to completion and captures what it printed.
 */
class CommandRunner
{
  public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs the command and blocks until the process has exited and both output streams are drained.
     *
     * @return The captured output, also when the process exited with a non-zero status.
     *         An error string if the process could not be started at all.
     */
    virtual std::expected<SharedData::CommandResult, std::string> run(CommandLine const& commandLine) = 0;
};
