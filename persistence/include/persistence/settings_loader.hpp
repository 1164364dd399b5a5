#pragma once

#include <persistence/state/settings.hpp>
#include <process/environment.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    namespace EnvironmentKeys
    {
        constexpr char const* transferToolDirectory = "IDEVSPATH";
        constexpr char const* accountId = "IDRIVEID";
        constexpr char const* passwordFile = "IDPWDFILE";
        constexpr char const* privateKeyFile = "IDKEYFILE";
        constexpr char const* configFile = "IDRIVE_STORE_CONFIG";
        constexpr char const* logLevel = "IDRIVE_STORE_LOG_LEVEL";
        constexpr char const* temporaryDirectory = "IDRIVE_STORE_TMPDIR";
    }

    /**
     * @brief Picks up all settings that are set in the environment.
     */
    Settings settingsFromEnvironment(Environment const& environment);

    /**
     * @brief Reads a JSON settings file.
     *
     * @return The settings or a message describing why the file could not be used.
     */
    std::expected<Settings, std::string> loadSettingsFile(std::filesystem::path const& path);

    /**
     * @brief Combines the settings file and the environment. Values from the environment take precedence.
     *
     * @param environment The environment to read from.
     * @param configFile Settings file to read. When not given, the file named by IDRIVE_STORE_CONFIG is used if set.
     */
    std::expected<Settings, std::string>
    loadSettings(Environment const& environment, std::optional<std::filesystem::path> const& configFile = std::nullopt);
}
