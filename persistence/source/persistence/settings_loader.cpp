#include <persistence/settings_loader.hpp>

#include <log/log.hpp>

#include <fstream>

namespace Persistence
{
    Settings settingsFromEnvironment(Environment const& environment)
    {
        Settings settings{};

        const auto pathFrom = [&environment](char const* key) -> std::optional<std::filesystem::path> {
            if (auto value = environment.get(key); value)
                return std::filesystem::path{*value};
            return std::nullopt;
        };

        settings.transferToolDirectory = pathFrom(EnvironmentKeys::transferToolDirectory);
        settings.accountId = environment.get(EnvironmentKeys::accountId);
        settings.passwordFile = pathFrom(EnvironmentKeys::passwordFile);
        settings.privateKeyFile = pathFrom(EnvironmentKeys::privateKeyFile);
        settings.logLevel = environment.get(EnvironmentKeys::logLevel);
        settings.temporaryDirectory = pathFrom(EnvironmentKeys::temporaryDirectory);
        return settings;
    }

    std::expected<Settings, std::string> loadSettingsFile(std::filesystem::path const& path)
    {
        std::ifstream file{path, std::ios_base::binary};
        if (!file.is_open())
            return std::unexpected("Cannot open settings file '" + path.generic_string() + "'");

        try
        {
            const auto json = nlohmann::json::parse(file);
            if (!json.is_object())
                return std::unexpected("Settings file '" + path.generic_string() + "' does not contain an object");
            return json.get<Settings>();
        }
        catch (nlohmann::json::exception const& exc)
        {
            return std::unexpected("Invalid settings file '" + path.generic_string() + "': " + exc.what());
        }
    }

    std::expected<Settings, std::string>
    loadSettings(Environment const& environment, std::optional<std::filesystem::path> const& configFile)
    {
        auto settings = settingsFromEnvironment(environment);

        auto file = configFile;
        if (!file)
        {
            if (auto fromEnv = environment.get(EnvironmentKeys::configFile); fromEnv)
                file = std::filesystem::path{*fromEnv};
        }
        if (!file)
            return settings;

        Log::debug("Loading settings from '{}'", file->generic_string());
        auto fileSettings = loadSettingsFile(*file);
        if (!fileSettings)
            return std::unexpected(std::move(fileSettings).error());

        settings.useDefaultsFrom(*fileSettings);
        return settings;
    }
}
