#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Parsed arguments of the idrive-store program.
 *
 * idrive-store [--config <file>] [--log-level <level>] [--log-file <file>] [--json] <remote-url> <command> [args...]
 */
struct CommandLineOptions
{
    std::optional<std::filesystem::path> configFile{std::nullopt};
    std::optional<std::string> logLevel{std::nullopt};
    std::optional<std::filesystem::path> logFile{std::nullopt};
    bool json{false};
    bool help{false};
    std::string remoteUrl{};
    std::string command{};
    std::vector<std::string> arguments{};
};

/**
 * @return The options or a message describing the usage error.
 */
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char const* const* argv);

std::string usage(std::string const& programName);
