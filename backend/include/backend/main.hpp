#pragma once

#include <backend/command_line_options.hpp>
#include <backend/idrive_backend.hpp>

#include <ostream>

namespace ExitCode
{
    constexpr int success = 0;
    constexpr int operationFailed = 1;
    constexpr int usageError = 2;
}

/**
 * @brief Runs one command of the idrive-store program against the backend.
 */
class Main
{
  public:
    Main(CommandLineOptions options, Persistence::Settings settings, CommandRunner& runner, std::ostream& output);
    ~Main() = default;

    Main(Main const&) = delete;
    Main& operator=(Main const&) = delete;
    Main(Main&&) = delete;
    Main& operator=(Main&&) = delete;

    /**
     * @return The exit code of the program.
     */
    int run();

  private:
    std::expected<void, IDriveBackend::Error> runCommand();
    std::expected<void, IDriveBackend::Error> list();
    std::expected<void, IDriveBackend::Error> query();

  private:
    CommandLineOptions options_;
    IDriveBackend backend_;
    std::ostream* output_;
};
