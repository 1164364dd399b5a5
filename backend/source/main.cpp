#include <backend/main.hpp>
#include <persistence/settings_loader.hpp>
#include <process/environment.hpp>
#include <process/process_runner.hpp>

#include <log/log.hpp>

#include <filesystem>
#include <iostream>

int main(int argc, char** argv)
{
    const std::string programName = argc > 0 ? std::filesystem::path{argv[0]}.filename().string() : "idrive-store";

    auto options = parseCommandLine(argc, argv);
    if (!options)
    {
        std::cerr << options.error() << "\n\n" << usage(programName);
        return ExitCode::usageError;
    }
    if (options->help)
    {
        std::cout << usage(programName);
        return ExitCode::success;
    }

    auto settings = Persistence::loadSettings(Environment::current(), options->configFile);
    if (!settings)
    {
        std::cerr << settings.error() << "\n";
        return ExitCode::usageError;
    }

    const auto logFile = options->logFile ? options->logFile : settings->logFile;
    try
    {
        Log::setupLogger("idrive-store", logFile);
    }
    catch (spdlog::spdlog_ex const& exc)
    {
        std::cerr << "Cannot set up logging: " << exc.what() << "\n";
        return ExitCode::usageError;
    }

    const auto levelName = options->logLevel ? options->logLevel : settings->logLevel;
    if (levelName)
    {
        const auto level = Log::levelFromString(*levelName);
        if (!level)
        {
            std::cerr << "Unknown log level '" << *levelName << "'\n";
            return ExitCode::usageError;
        }
        Log::setLevel(*level);
    }
    else
    {
        Log::setLevel(Log::Level::Warning);
    }

    ProcessRunner runner{};
    Main program{std::move(*options), std::move(*settings), runner, std::cout};
    return program.run();
}
