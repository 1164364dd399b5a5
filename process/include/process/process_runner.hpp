#pragma once

#include <process/command_runner.hpp>
#include <process/environment.hpp>

#include <optional>

/**
 * @brief Runs commands as child processes using Boost.Process.
 *
 * stdin of the child is connected to the null device. stdout and stderr are read concurrently until both are closed.
 */
class ProcessRunner : public CommandRunner
{
  public:
    /**
     * @param environment The environment of started processes. The current environment when not given.
     */
    explicit ProcessRunner(std::optional<Environment> environment = std::nullopt);

    std::expected<SharedData::CommandResult, std::string> run(CommandLine const& commandLine) override;

  private:
    Environment environment_;
};
